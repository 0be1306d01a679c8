#pragma once

#include "playlink/message.h"
#include "playlink/types.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace playlink {

enum class ReceiveStatus {
  kFrame,
  kTimeout,
  kClosed,
};

/**
 * Bidirectional, message-framed connection.
 *
 * Send() may be called from any thread; frames from concurrent senders are
 * never interleaved. Receive() is meant for a single reader thread.
 */
class Transport {
 public:
  virtual ~Transport() = default;

  virtual bool Send(const std::string& frame, std::string* error = nullptr) = 0;

  /**
   * Wait up to `timeout` for the next frame.
   *
   * @return kFrame with `frame` filled, kTimeout, or kClosed once the
   *         connection is gone and no buffered frames remain.
   */
  virtual ReceiveStatus Receive(std::string* frame,
                                std::chrono::milliseconds timeout) = 0;

  /// Idempotent. Wakes a blocked Receive().
  virtual void Close() = 0;
  virtual bool IsOpen() const = 0;
  /// Human-readable remote address, for logs.
  virtual std::string Peer() const = 0;
};

/**
 * TCP transport. Each frame is a 4-byte big-endian length followed by one
 * UTF-8 JSON document.
 */
class TcpTransport : public Transport {
 public:
  /// Takes ownership of a connected socket.
  explicit TcpTransport(int fd, std::string peer = {},
                        size_t max_frame_bytes = kMaxFrameBytes);
  ~TcpTransport() override;

  TcpTransport(const TcpTransport&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;

  /**
   * Connect to `host:port`.
   *
   * @return nullptr on failure, with `error` filled.
   */
  static std::shared_ptr<TcpTransport> Connect(
      const std::string& host, uint16_t port, std::chrono::milliseconds timeout,
      std::string* error = nullptr, size_t max_frame_bytes = kMaxFrameBytes);

  bool Send(const std::string& frame, std::string* error = nullptr) override;
  ReceiveStatus Receive(std::string* frame,
                        std::chrono::milliseconds timeout) override;
  void Close() override;
  bool IsOpen() const override { return open_.load(); }
  std::string Peer() const override { return peer_; }

  /// Why the transport closed itself (oversized frame, read error), if it did.
  std::string close_reason() const;

 private:
  bool ExtractFrame(std::string* frame);
  void CloseWithReason(const std::string& reason);

  const int fd_;
  const std::string peer_;
  const size_t max_frame_bytes_;
  std::atomic<bool> open_{true};
  std::mutex write_mutex_;
  std::mutex read_mutex_;
  std::string read_buffer_;
  mutable std::mutex reason_mutex_;
  std::string close_reason_;
};

/**
 * Create two connected in-process transports. Closing either end closes
 * both; frames already queued are still delivered before kClosed.
 */
std::pair<std::shared_ptr<Transport>, std::shared_ptr<Transport>>
MakeMemoryTransportPair(const std::string& first_peer = "memory-a",
                        const std::string& second_peer = "memory-b");

/**
 * One live connection as the hub sees it: a transport plus identity and
 * liveness bookkeeping.
 */
class Session {
 public:
  using CloseListener = std::function<void(const std::string& session_id)>;

  Session(std::string id, std::shared_ptr<Transport> transport,
          LogCallback log_callback = nullptr);
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  const std::string& id() const { return id_; }

  bool Send(const Message& message, std::string* error = nullptr);
  /// Send an already-encoded frame.
  bool SendFrame(const std::string& frame, std::string* error = nullptr);
  ReceiveStatus Receive(std::string* frame, std::chrono::milliseconds timeout);

  /**
   * Close the connection. Idempotent; every close listener runs exactly once,
   * on the thread that performed the first Close().
   */
  void Close();
  bool IsClosed() const { return closed_.load(); }

  /// Runs immediately if the session is already closed.
  void AddCloseListener(CloseListener listener);

  bool is_alive() const { return alive_.load(); }
  void set_alive(bool alive) { alive_.store(alive); }
  /// Record a heartbeat reply: marks the session alive.
  void MarkPong();
  std::chrono::steady_clock::time_point last_pong_at() const;

  /// Bind the session to a registered device.
  void SetIdentity(const std::string& device_id, Role role);
  bool registered() const;
  std::string device_id() const;
  Role role() const;

  std::string Peer() const;

 private:
  const std::string id_;
  std::shared_ptr<Transport> transport_;
  LogCallback log_callback_;
  std::atomic<bool> closed_{false};
  std::atomic<bool> alive_{true};

  mutable std::mutex mutex_;
  std::vector<CloseListener> close_listeners_;
  std::chrono::steady_clock::time_point last_pong_at_;
  bool registered_ = false;
  std::string device_id_;
  Role role_ = Role::kPlayer;
};

}  // namespace playlink
