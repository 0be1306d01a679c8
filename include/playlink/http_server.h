#pragma once

#include "playlink/transfer.h"
#include "playlink/types.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace playlink {

/**
 * Parsed request head.
 */
struct HttpRequest {
  std::string method;
  /// Request target as sent, including any query string.
  std::string target;
  /// Percent-decoded path without the query string.
  std::string path;
  /// Header names are lower-cased.
  std::map<std::string, std::string> headers;

  /// Header value, or "" if absent. `name` must be lower-case.
  std::string Header(const std::string& name) const;
};

/**
 * Parse a request line and headers (everything before the blank line).
 */
bool ParseHttpRequest(const std::string& head, HttpRequest* out,
                      std::string* error = nullptr);

/// Content-Type for a media filename, by extension.
const char* MimeTypeForFilename(const std::string& filename);

struct HttpServerConfig {
  std::string bind_address = "0.0.0.0";
  /// 0 binds an ephemeral port; see HttpServer::port().
  uint16_t port = kDefaultHttpPort;
  /// Bound on receiving a complete request head.
  std::chrono::milliseconds request_timeout{10000};
  size_t max_header_bytes = 16 * 1024;
  LogCallback log_callback;

  bool Validate(std::string* error = nullptr) const;
};

/**
 * Byte-stream endpoint that serves transfers over HTTP/1.1.
 *
 * `GET /download/<id>/<filename>` streams the transfer, honoring a single
 * `Range`. `GET /files` lists active transfers. Extra read-only JSON
 * endpoints are added with AddJsonRoute(). Every response closes the
 * connection; each request runs on its own thread.
 */
class HttpServer {
 public:
  using JsonHandler = std::function<nlohmann::json()>;

  HttpServer(HttpServerConfig config, TransferCoordinator& coordinator);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  /// Register `GET <path>` returning the handler's JSON. Call before Start().
  void AddJsonRoute(const std::string& path, JsonHandler handler);

  bool Start(std::string* error = nullptr);
  /// Stops accepting, aborts in-flight responses and joins their threads.
  void Stop();
  bool running() const { return running_.load(); }

  /// Bound port, valid after Start().
  uint16_t port() const;

 private:
  struct Worker;

  void AcceptLoop();
  void HandleConnection(int fd, const std::string& peer);
  void ServeDownload(int fd, const HttpRequest& request);
  void ReapWorkers(bool all);

  HttpServerConfig config_;
  TransferCoordinator& coordinator_;
  std::map<std::string, JsonHandler> routes_;

  std::atomic<bool> running_{false};
  struct ListenerState;
  std::unique_ptr<ListenerState> listener_;
  std::thread accept_thread_;
  std::mutex workers_mutex_;
  std::vector<std::unique_ptr<Worker>> workers_;
};

}  // namespace playlink
