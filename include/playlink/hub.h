#pragma once

#include "playlink/message.h"
#include "playlink/transport.h"
#include "playlink/types.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace playlink {

class Hub;
class DeviceRegistry;
class TransferCoordinator;

#ifdef PLAYLINK_TESTING
namespace test {
std::vector<std::string> TickHeartbeat(Hub& hub);
DeviceRegistry& GetRegistry(Hub& hub);
TransferCoordinator& GetCoordinator(Hub& hub);
}  // namespace test
#endif

/**
 * Hub configuration for listeners, transfers and liveness checks.
 */
struct HubConfig {
  /// Local bind address for both listeners.
  std::string bind_address = "0.0.0.0";
  /// Control-plane port; 0 binds an ephemeral port.
  uint16_t port = kDefaultHubPort;
  /// Accept control-plane TCP connections. When false, sessions are only
  /// added through Hub::AddConnection().
  bool enable_tcp = true;

  /// Byte-stream (HTTP) port; 0 binds an ephemeral port.
  uint16_t http_port = kDefaultHttpPort;
  /// Serve transfers. Download commands fail while disabled.
  bool enable_http = true;
  /// Host name players use in download URLs. Defaults to the bind address,
  /// or 127.0.0.1 when bound to all interfaces.
  std::string advertised_host;

  /// Broadcast a HubAnnouncement so participants can discover the hub.
  /// Only active while the control-plane listener is enabled.
  bool enable_announce = true;
  std::string announce_address = "255.255.255.255";
  uint16_t announce_port = kDefaultAnnouncePort;
  std::chrono::milliseconds announce_interval{2000};

  /// Directory download commands may offer files from.
  std::string media_root = ".";
  size_t chunk_size = kDefaultChunkSize;
  size_t transfer_history_limit = 32;

  /// Ping interval; a session silent for a full interval is evicted.
  std::chrono::milliseconds heartbeat_interval{30000};
  /// Poll period of each connection's receive loop.
  std::chrono::milliseconds receive_poll{200};
  /// Largest accepted control-plane frame.
  size_t max_frame_bytes = kMaxFrameBytes;
  /// Reported in `welcome`.
  std::string server_version = kServerVersion;

  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;
};

/**
 * Counters for message flow and error reporting.
 */
struct HubMetrics {
  uint64_t messages_received = 0;
  uint64_t messages_sent = 0;
  uint64_t protocol_errors = 0;
  uint64_t send_errors = 0;
  uint64_t callback_exceptions = 0;
  uint64_t evictions = 0;
};

/**
 * Health summary served at `/health`.
 */
struct HealthInfo {
  size_t device_count = 0;
  size_t controller_count = 0;
  int64_t uptime_seconds = 0;
  std::string server_version;
  std::vector<DeviceSummary> devices;
};

nlohmann::json ToJson(const HealthInfo& health);

/**
 * Relay hub: accepts controller and player sessions, tracks devices, routes
 * commands to players, relays player reports to controllers and serves bulk
 * transfers.
 */
class Hub {
 public:
  explicit Hub(HubConfig config);
  /// Stop background threads and close every session.
  ~Hub();

  Hub(const Hub&) = delete;
  Hub& operator=(const Hub&) = delete;

  /// Open listeners and start background threads.
  bool Start();
  /// Stop listeners, close sessions and join every thread.
  void Stop();
  bool running() const;

  /**
   * Serve an already-connected transport, e.g. one end of an in-memory pair.
   *
   * @return The new session id, or "" if the hub is not running.
   */
  std::string AddConnection(std::shared_ptr<Transport> transport);

  HealthInfo GetHealth() const;
  /// Return the last Start() error message, if any.
  std::string GetLastError() const;
  /// Return metrics for messages, errors, and callbacks.
  HubMetrics GetMetrics() const;

  /// Bound control-plane port, valid after Start().
  uint16_t port() const;
  /// Bound byte-stream port, valid after Start().
  uint16_t http_port() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef PLAYLINK_TESTING
  friend std::vector<std::string> test::TickHeartbeat(Hub& hub);
  friend DeviceRegistry& test::GetRegistry(Hub& hub);
  friend TransferCoordinator& test::GetCoordinator(Hub& hub);
#endif
};

}  // namespace playlink
