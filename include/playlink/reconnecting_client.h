#pragma once

#include "playlink/message.h"
#include "playlink/observer.h"
#include "playlink/transport.h"
#include "playlink/types.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace playlink {

enum class ClientState {
  kDisconnected,
  kConnecting,
  kConnected,
  kReconnecting,
};

const char* ToString(ClientState state);

/**
 * Configuration for a participant's connection to the hub.
 */
struct ClientConfig {
  std::string host = "127.0.0.1";
  uint16_t port = kDefaultHubPort;
  /// Find the hub from its UDP announcements before every connection
  /// attempt instead of using `host` and `port`.
  bool discover_hub = false;
  uint16_t announce_port = kDefaultAnnouncePort;
  /// Bound on the wait for an announcement; expiry counts as a failed attempt.
  std::chrono::milliseconds discovery_timeout{5000};
  std::chrono::milliseconds connect_timeout{5000};
  /// Bound on the wait for `registered` after sending `register`.
  std::chrono::milliseconds ack_timeout{10000};
  int max_reconnect_attempts = 10;
  std::chrono::milliseconds backoff_unit{1000};
  std::chrono::milliseconds backoff_cap{30000};
  std::chrono::milliseconds receive_poll{200};
  size_t max_frame_bytes = kMaxFrameBytes;
  LogCallback log_callback;

  bool Validate(std::string* error = nullptr) const;
};

/// Opens a fresh transport to the hub, or returns nullptr and fills `error`.
using Connector = std::function<std::shared_ptr<Transport>(std::string* error)>;

/**
 * Delay before reconnect attempt `attempt` (1-based):
 * min(2^(attempt-1) * unit, cap).
 */
std::chrono::milliseconds ReconnectDelay(int attempt, std::chrono::milliseconds unit,
                                         std::chrono::milliseconds cap);

struct ClientStateChange {
  ClientState state = ClientState::kDisconnected;
  /// Reconnect attempt number; 0 while connected or before the first retry.
  int attempt = 0;
  /// Set on the final kDisconnected after max_reconnect_attempts failures.
  bool gave_up = false;
  std::string reason;
};

/**
 * Long-lived connection to the hub that survives drops.
 *
 * The client only reports kConnected after the hub acknowledged its
 * registration. Lost connections are retried with exponential backoff until
 * the attempt budget is spent; Disconnect() cancels any pending retry and
 * suppresses reconnection until the next Connect(). Hub `ping`s are answered
 * internally; every other inbound message is published to messages().
 */
class ReconnectingClient {
 public:
  ReconnectingClient(ClientConfig config, RegisterMessage identity,
                     Connector connector = nullptr);
  ~ReconnectingClient();

  ReconnectingClient(const ReconnectingClient&) = delete;
  ReconnectingClient& operator=(const ReconnectingClient&) = delete;

  /**
   * Begin connecting. No-op while connecting or connected; while waiting out
   * a backoff, retries immediately.
   */
  void Connect();
  void Disconnect();

  /// Fails unless the client is connected.
  bool Send(const Message& message, std::string* error = nullptr);

  ClientState state() const;
  int attempt() const;
  bool WaitForState(ClientState state, std::chrono::milliseconds timeout) const;

  ObserverList<Message>& messages();
  ObserverList<ClientStateChange>& state_changes();

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace playlink
