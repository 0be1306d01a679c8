#include "playlink/http_server.h"

#include "log.h"
#include "net_util.h"
#include "url.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <sstream>
#include <utility>

#include <arpa/inet.h>
#include <sys/socket.h>

namespace playlink {
namespace {

constexpr std::chrono::milliseconds kAcceptPoll{200};

struct Response {
  int status = 200;
  std::string reason = "OK";
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
};

std::string ToLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::string TrimSpace(const std::string& text) {
  size_t begin = text.find_first_not_of(" \t");
  if (begin == std::string::npos) {
    return {};
  }
  size_t end = text.find_last_not_of(" \t\r");
  return text.substr(begin, end - begin + 1);
}

bool WriteHead(int fd, int status, const std::string& reason,
               const std::vector<std::pair<std::string, std::string>>& headers,
               std::string* error) {
  std::ostringstream oss;
  oss << "HTTP/1.1 " << status << " " << reason << "\r\n";
  for (const auto& header : headers) {
    oss << header.first << ": " << header.second << "\r\n";
  }
  oss << "Connection: close\r\n\r\n";
  const std::string head = oss.str();
  return internal::SendAll(fd, head.data(), head.size(), error);
}

bool WriteResponse(int fd, const Response& response, std::string* error) {
  auto headers = response.headers;
  headers.emplace_back("Content-Length", std::to_string(response.body.size()));
  if (!WriteHead(fd, response.status, response.reason, headers, error)) {
    return false;
  }
  return internal::SendAll(fd, response.body.data(), response.body.size(), error);
}

Response JsonResponse(int status, const std::string& reason,
                      const nlohmann::json& body) {
  Response response;
  response.status = status;
  response.reason = reason;
  response.headers.emplace_back("Content-Type", "application/json");
  response.body = body.dump();
  return response;
}

Response ErrorResponse(int status, const std::string& reason,
                       const std::string& message) {
  nlohmann::json body = nlohmann::json::object();
  body["error"] = message;
  return JsonResponse(status, reason, body);
}

nlohmann::json TransferToJson(const Transfer& transfer) {
  nlohmann::json entry = nlohmann::json::object();
  entry["transferId"] = transfer.id;
  entry["filename"] = transfer.filename;
  entry["deviceId"] = transfer.target_device_id;
  entry["state"] = ToString(transfer.state);
  entry["totalBytes"] = transfer.total_bytes;
  entry["bytesTransferred"] = transfer.bytes_transferred;
  entry["startTime"] = transfer.start_time_ms;
  return entry;
}

}  // namespace

std::string HttpRequest::Header(const std::string& name) const {
  auto it = headers.find(name);
  return it == headers.end() ? std::string() : it->second;
}

bool ParseHttpRequest(const std::string& head, HttpRequest* out, std::string* error) {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (!out) {
    return fail("no output request");
  }
  std::istringstream stream(head);
  std::string line;
  if (!std::getline(stream, line)) {
    return fail("empty request");
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  HttpRequest request;
  std::istringstream request_line(line);
  std::string version;
  if (!(request_line >> request.method >> request.target >> version) ||
      version.compare(0, 5, "HTTP/") != 0) {
    return fail("malformed request line");
  }
  const std::string raw_path = request.target.substr(0, request.target.find('?'));
  if (raw_path.empty() || raw_path[0] != '/') {
    return fail("request target must be an absolute path");
  }
  if (!internal::PercentDecode(raw_path, &request.path)) {
    return fail("malformed percent-encoding in path");
  }
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      break;
    }
    const size_t colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
      return fail("malformed header line");
    }
    request.headers[ToLower(TrimSpace(line.substr(0, colon)))] =
        TrimSpace(line.substr(colon + 1));
  }
  *out = std::move(request);
  return true;
}

const char* MimeTypeForFilename(const std::string& filename) {
  const size_t dot = filename.rfind('.');
  if (dot == std::string::npos) {
    return "application/octet-stream";
  }
  const std::string ext = ToLower(filename.substr(dot + 1));
  if (ext == "mp4") {
    return "video/mp4";
  }
  if (ext == "mov") {
    return "video/quicktime";
  }
  if (ext == "m4v") {
    return "video/x-m4v";
  }
  if (ext == "mkv") {
    return "video/x-matroska";
  }
  if (ext == "webm") {
    return "video/webm";
  }
  if (ext == "avi") {
    return "video/x-msvideo";
  }
  return "application/octet-stream";
}

bool HttpServerConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (!bind_address.empty() && bind_address != "0.0.0.0") {
    in_addr parsed{};
    if (inet_pton(AF_INET, bind_address.c_str(), &parsed) != 1) {
      return fail("bind_address must be a valid IPv4 address");
    }
  }
  if (request_timeout.count() <= 0) {
    return fail("request_timeout must be positive");
  }
  if (max_header_bytes < 256) {
    return fail("max_header_bytes must be at least 256");
  }
  return true;
}

struct HttpServer::ListenerState {
  internal::TcpListener listener;
};

struct HttpServer::Worker {
  std::thread thread;
  std::atomic<bool> done{false};
  int fd = -1;
};

HttpServer::HttpServer(HttpServerConfig config, TransferCoordinator& coordinator)
    : config_(std::move(config)),
      coordinator_(coordinator),
      listener_(new ListenerState()) {}

HttpServer::~HttpServer() { Stop(); }

void HttpServer::AddJsonRoute(const std::string& path, JsonHandler handler) {
  routes_[path] = std::move(handler);
}

bool HttpServer::Start(std::string* error) {
  if (running_.exchange(true)) {
    return true;
  }
  std::string message;
  if (!config_.Validate(&message)) {
    internal::Log(config_.log_callback, message);
    if (error) {
      *error = message;
    }
    running_ = false;
    return false;
  }
  if (!listener_->listener.Open(config_.bind_address, config_.port)) {
    message = listener_->listener.last_error();
    internal::Log(config_.log_callback, message);
    if (error) {
      *error = message;
    }
    running_ = false;
    return false;
  }
  try {
    accept_thread_ = std::thread([this]() { AcceptLoop(); });
  } catch (const std::exception& ex) {
    message = std::string("thread start failed: ") + ex.what();
    internal::Log(config_.log_callback, message);
    if (error) {
      *error = message;
    }
    listener_->listener.Close();
    running_ = false;
    return false;
  }
  return true;
}

void HttpServer::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  listener_->listener.Close();
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto& worker : workers_) {
      if (!worker->done.load()) {
        ::shutdown(worker->fd, SHUT_RDWR);
      }
    }
  }
  ReapWorkers(true);
}

uint16_t HttpServer::port() const { return listener_->listener.port(); }

void HttpServer::AcceptLoop() {
  while (running_) {
    std::string peer;
    const int fd = listener_->listener.Accept(kAcceptPoll, &peer);
    ReapWorkers(false);
    if (fd < 0) {
      continue;
    }
    auto worker = std::make_unique<Worker>();
    worker->fd = fd;
    Worker* raw = worker.get();
    try {
      raw->thread = std::thread([this, raw, peer]() {
        HandleConnection(raw->fd, peer);
        raw->done.store(true);
      });
    } catch (const std::exception& ex) {
      internal::Log(config_.log_callback,
                    std::string("request thread start failed: ") + ex.what());
      internal::CloseFd(fd);
      continue;
    }
    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers_.push_back(std::move(worker));
  }
}

void HttpServer::ReapWorkers(bool all) {
  std::vector<std::unique_ptr<Worker>> finished;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    auto it = workers_.begin();
    while (it != workers_.end()) {
      if (all || (*it)->done.load()) {
        finished.push_back(std::move(*it));
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& worker : finished) {
    if (worker->thread.joinable()) {
      worker->thread.join();
    }
    // Closed only after the thread is joined so the descriptor is never reused
    // while a worker or Stop() still refers to it.
    internal::CloseFd(worker->fd);
  }
}

void HttpServer::HandleConnection(int fd, const std::string& peer) {
  std::string head;
  std::array<char, 4096> buffer{};
  const auto deadline = std::chrono::steady_clock::now() + config_.request_timeout;
  size_t end_of_head = std::string::npos;
  while (end_of_head == std::string::npos) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline || head.size() > config_.max_header_bytes) {
      std::string error;
      if (!WriteResponse(fd, ErrorResponse(400, "Bad Request", "incomplete request"),
                         &error)) {
        internal::Log(config_.log_callback, "response to " + peer + " failed: " + error);
      }
      ::shutdown(fd, SHUT_RDWR);
      return;
    }
    const int ready = internal::WaitReadable(
        fd, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
    if (ready < 0) {
      return;
    }
    if (ready == 0) {
      continue;
    }
    const ssize_t bytes = ::recv(fd, buffer.data(), buffer.size(), 0);
    if (bytes <= 0) {
      if (bytes < 0 && errno == EINTR) {
        continue;
      }
      return;
    }
    head.append(buffer.data(), static_cast<size_t>(bytes));
    end_of_head = head.find("\r\n\r\n");
  }
  head.resize(end_of_head + 2);

  HttpRequest request;
  std::string error;
  Response response;
  bool handled = false;
  if (!ParseHttpRequest(head, &request, &error)) {
    response = ErrorResponse(400, "Bad Request", error);
  } else if (request.method != "GET") {
    response = ErrorResponse(405, "Method Not Allowed", "only GET is supported");
    response.headers.emplace_back("Allow", "GET");
  } else if (request.path.compare(0, 10, "/download/") == 0) {
    ServeDownload(fd, request);
    handled = true;
  } else if (request.path == "/files") {
    nlohmann::json files = nlohmann::json::array();
    for (const auto& transfer : coordinator_.Active()) {
      files.push_back(TransferToJson(transfer));
    }
    nlohmann::json body = nlohmann::json::object();
    body["files"] = std::move(files);
    response = JsonResponse(200, "OK", body);
  } else {
    auto route = routes_.find(request.path);
    if (route == routes_.end() || !route->second) {
      response = ErrorResponse(404, "Not Found", "not found");
    } else {
      try {
        response = JsonResponse(200, "OK", route->second());
      } catch (const std::exception& ex) {
        internal::Log(config_.log_callback,
                      "handler for " + request.path + " threw: " + ex.what());
        response = ErrorResponse(500, "Internal Server Error", "handler failed");
      }
    }
  }
  if (!handled && !WriteResponse(fd, response, &error)) {
    internal::Log(config_.log_callback, "response to " + peer + " failed: " + error);
  }
  ::shutdown(fd, SHUT_RDWR);
}

void HttpServer::ServeDownload(int fd, const HttpRequest& request) {
  std::string error;
  // /download/<id>/<filename>
  const std::string rest = request.path.substr(10);
  const size_t slash = rest.find('/');
  const std::string transfer_id = rest.substr(0, slash);
  const std::string filename =
      slash == std::string::npos ? std::string() : rest.substr(slash + 1);

  std::optional<Transfer> transfer = coordinator_.Find(transfer_id);
  if (!transfer || transfer->finished() ||
      (!filename.empty() && filename != transfer->filename)) {
    if (!WriteResponse(fd, ErrorResponse(404, "Not Found", "transfer not found"),
                       &error)) {
      internal::Log(config_.log_callback, "download response failed: " + error);
    }
    return;
  }

  std::optional<ByteRange> range;
  const std::string range_header = request.Header("range");
  if (!range_header.empty()) {
    ByteRange parsed;
    if (!ParseRangeHeader(range_header, transfer->total_bytes, &parsed, &error)) {
      Response response = ErrorResponse(416, "Range Not Satisfiable", error);
      response.headers.emplace_back("Content-Range",
                                    "bytes */" + std::to_string(transfer->total_bytes));
      if (!WriteResponse(fd, response, &error)) {
        internal::Log(config_.log_callback, "download response failed: " + error);
      }
      return;
    }
    range = parsed;
  }

  std::vector<std::pair<std::string, std::string>> headers;
  headers.emplace_back("Content-Type", MimeTypeForFilename(transfer->filename));
  headers.emplace_back("Accept-Ranges", "bytes");
  uint64_t length = transfer->total_bytes;
  if (range) {
    length = range->length();
    headers.emplace_back("Content-Range",
                         FormatContentRange(*range, transfer->total_bytes));
  }
  headers.emplace_back("Content-Length", std::to_string(length));
  if (!WriteHead(fd, range ? 206 : 200, range ? "Partial Content" : "OK", headers,
                 &error)) {
    internal::Log(config_.log_callback, "download response failed: " + error);
    coordinator_.Cancel(transfer_id, "receiver disconnected");
    return;
  }

  StreamResult result = coordinator_.Stream(
      transfer_id, range, [fd](const char* data, size_t size) {
        return internal::SendAll(fd, data, size, nullptr);
      });
  if (!result.ok) {
    internal::Log(config_.log_callback,
                  "download of " + transfer_id + " ended early: " + result.error);
  }
}

}  // namespace playlink
