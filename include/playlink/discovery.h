#pragma once

#include "playlink/types.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace playlink {

/**
 * What a hub broadcasts so participants can find it without a configured
 * address.
 */
struct HubAnnouncement {
  /// Advertised host. Empty on the wire means "the sender's address";
  /// DiscoverHub() fills it in from the datagram source.
  std::string host;
  uint16_t port = kDefaultHubPort;
  /// 0 when the hub serves no transfers.
  uint16_t http_port = kDefaultHttpPort;
  std::string server_version = kServerVersion;
};

/// JSON datagram: {"type":"hubAnnounce","serverVersion","port","httpPort"[,"host"]}.
std::string EncodeAnnouncement(const HubAnnouncement& announcement);
bool ParseAnnouncement(const std::string& payload, HubAnnouncement* out,
                       std::string* error = nullptr);

struct AnnouncerConfig {
  /// Local address the sending socket binds to.
  std::string bind_address = "0.0.0.0";
  /// Destination; the limited broadcast address reaches the local segment.
  std::string announce_address = "255.255.255.255";
  uint16_t announce_port = kDefaultAnnouncePort;
  std::chrono::milliseconds interval{2000};
  LogCallback log_callback;

  bool Validate(std::string* error = nullptr) const;
};

/**
 * Periodically broadcasts a HubAnnouncement over UDP.
 *
 * Send failures are counted and logged once until a send succeeds again;
 * they never stop the loop.
 */
class HubAnnouncer {
 public:
  HubAnnouncer(AnnouncerConfig config, HubAnnouncement announcement);
  ~HubAnnouncer();

  HubAnnouncer(const HubAnnouncer&) = delete;
  HubAnnouncer& operator=(const HubAnnouncer&) = delete;

  bool Start(std::string* error = nullptr);
  void Stop();
  bool running() const { return running_.load(); }

  /// Send one announcement now. Requires Start().
  bool AnnounceOnce(std::string* error = nullptr);

  uint64_t announcements_sent() const { return sent_.load(); }
  uint64_t send_errors() const { return send_errors_.load(); }

 private:
  struct SocketState;

  void Loop();

  AnnouncerConfig config_;
  std::string payload_;
  std::unique_ptr<SocketState> socket_;

  std::atomic<bool> running_{false};
  std::atomic<uint64_t> sent_{0};
  std::atomic<uint64_t> send_errors_{0};
  bool failing_ = false;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::thread thread_;
};

struct DiscoveryConfig {
  std::string bind_address = "0.0.0.0";
  uint16_t announce_port = kDefaultAnnouncePort;
  /// Overall bound on the wait for an announcement.
  std::chrono::milliseconds timeout{5000};
  LogCallback log_callback;

  bool Validate(std::string* error = nullptr) const;
};

/**
 * Listen for the first valid hub announcement.
 *
 * Malformed datagrams are skipped. Returns false with `error` set on socket
 * failure or when nothing arrives within `config.timeout`.
 */
bool DiscoverHub(const DiscoveryConfig& config, HubAnnouncement* out,
                 std::string* error = nullptr);

}  // namespace playlink
