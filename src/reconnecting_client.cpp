#include "playlink/reconnecting_client.h"

#include "playlink/discovery.h"

#include "log.h"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <sstream>
#include <thread>
#include <utility>

namespace playlink {

const char* ToString(ClientState state) {
  switch (state) {
    case ClientState::kDisconnected:
      return "disconnected";
    case ClientState::kConnecting:
      return "connecting";
    case ClientState::kConnected:
      return "connected";
    case ClientState::kReconnecting:
      return "reconnecting";
  }
  return "disconnected";
}

bool ClientConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (discover_hub) {
    if (announce_port == 0) {
      return fail("announce_port must be non-zero");
    }
    if (discovery_timeout.count() <= 0) {
      return fail("discovery_timeout must be positive");
    }
  } else {
    if (host.empty()) {
      return fail("host must not be empty");
    }
    if (port == 0) {
      return fail("port must be non-zero");
    }
  }
  if (connect_timeout.count() <= 0 || ack_timeout.count() <= 0 ||
      receive_poll.count() <= 0) {
    return fail("timeouts must be positive");
  }
  if (max_reconnect_attempts < 0) {
    return fail("max_reconnect_attempts must not be negative");
  }
  if (backoff_unit.count() <= 0 || backoff_cap.count() <= 0) {
    return fail("backoff_unit and backoff_cap must be positive");
  }
  if (backoff_cap < backoff_unit) {
    return fail("backoff_cap must be >= backoff_unit");
  }
  if (max_frame_bytes == 0) {
    return fail("max_frame_bytes must be positive");
  }
  return true;
}

std::chrono::milliseconds ReconnectDelay(int attempt, std::chrono::milliseconds unit,
                                         std::chrono::milliseconds cap) {
  if (attempt < 1) {
    attempt = 1;
  }
  // Past 2^20 units every sane cap has long been reached.
  const int exponent = std::min(attempt - 1, 20);
  const auto delay = unit * (int64_t{1} << exponent);
  return std::min(delay, cap);
}

struct ReconnectingClient::Impl {
  Impl(ClientConfig config, RegisterMessage identity, Connector connector)
      : config_(std::move(config)),
        identity_(std::move(identity)),
        connector_(std::move(connector)) {
    if (!connector_) {
      const ClientConfig& cfg = config_;
      connector_ = [cfg](std::string* error) -> std::shared_ptr<Transport> {
        std::string host = cfg.host;
        uint16_t port = cfg.port;
        if (cfg.discover_hub) {
          DiscoveryConfig discovery;
          discovery.announce_port = cfg.announce_port;
          discovery.timeout = cfg.discovery_timeout;
          discovery.log_callback = cfg.log_callback;
          HubAnnouncement found;
          if (!DiscoverHub(discovery, &found, error)) {
            return nullptr;
          }
          host = found.host;
          port = found.port;
          internal::Log(cfg.log_callback, "discovered hub at " + host + ":" +
                                              std::to_string(port));
        }
        return TcpTransport::Connect(host, port, cfg.connect_timeout, error,
                                     cfg.max_frame_bytes);
      };
    }
  }

  ~Impl() {
    Disconnect();
    if (worker_.joinable()) {
      if (worker_.get_id() == std::this_thread::get_id()) {
        worker_.detach();
      } else {
        worker_.join();
      }
    }
  }

  void Connect() {
    std::thread previous;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (state_ == ClientState::kConnecting || state_ == ClientState::kConnected) {
        return;
      }
      // Only the backoff wait can be cut short; a retry in flight is left alone.
      if (state_ == ClientState::kReconnecting) {
        retry_now_ = true;
        cv_.notify_all();
        return;
      }
      std::string error;
      if (!config_.Validate(&error)) {
        internal::Log(config_.log_callback, error);
        return;
      }
      if (worker_.joinable() && worker_.get_id() == std::this_thread::get_id()) {
        internal::Log(config_.log_callback,
                      "Connect() from a message callback is not supported after "
                      "Disconnect()");
        return;
      }
      // Claim the state before releasing the lock so a concurrent Connect()
      // returns early.
      state_ = ClientState::kConnecting;
      previous = std::move(worker_);
    }
    if (previous.joinable()) {
      previous.join();
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stop_ = false;
      retry_now_ = false;
      attempt_ = 0;
      try {
        worker_ = std::thread([this]() { Run(); });
      } catch (const std::exception& ex) {
        internal::Log(config_.log_callback,
                      std::string("client thread start failed: ") + ex.what());
        state_ = ClientState::kDisconnected;
        return;
      }
    }
    PublishState({ClientState::kConnecting, 0, false, {}});
  }

  void Disconnect() {
    std::shared_ptr<Transport> transport;
    std::thread worker;
    bool was_active = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stop_ = true;
      transport = transport_;
      was_active = state_ != ClientState::kDisconnected;
      if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker = std::move(worker_);
      }
    }
    cv_.notify_all();
    if (transport) {
      transport->Close();
    }
    if (worker.joinable()) {
      worker.join();
    }
    if (was_active) {
      SetState(ClientState::kDisconnected, 0, false, "disconnected by request");
    }
  }

  bool Send(const Message& message, std::string* error) {
    std::shared_ptr<Transport> transport;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (state_ == ClientState::kConnected) {
        transport = transport_;
      }
    }
    if (!transport) {
      if (error) {
        *error = "not connected";
      }
      return false;
    }
    return transport->Send(EncodeMessage(message), error);
  }

  ClientState state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
  }

  int attempt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempt_;
  }

  bool WaitForState(ClientState state, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&]() { return state_ == state; });
  }

  ObserverList<Message> messages_;
  ObserverList<ClientStateChange> state_changes_;

 private:
  enum class HandshakeResult {
    kRegistered,
    kFailed,
    kStopped,
  };

  bool stopping() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_;
  }

  void Run() {
    while (true) {
      std::string reason;
      RunConnection(&reason);
      int attempt = 0;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        transport_.reset();
        if (stop_) {
          return;
        }
        attempt = ++attempt_;
      }
      if (!reason.empty()) {
        internal::Log(config_.log_callback, reason);
      }
      if (attempt > config_.max_reconnect_attempts) {
        std::ostringstream oss;
        oss << "giving up after " << config_.max_reconnect_attempts
            << " reconnect attempts";
        internal::Log(config_.log_callback, oss.str());
        SetState(ClientState::kDisconnected, attempt - 1, true, oss.str());
        return;
      }
      SetState(ClientState::kReconnecting, attempt, false, reason);
      const auto delay =
          ReconnectDelay(attempt, config_.backoff_unit, config_.backoff_cap);
      {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, delay, [this]() { return stop_ || retry_now_; });
        retry_now_ = false;
        if (stop_) {
          return;
        }
        // Leave kReconnecting under the same lock so a late Connect() cannot
        // leave retry_now_ set for the next backoff.
        state_ = ClientState::kConnecting;
      }
      cv_.notify_all();
      PublishState({ClientState::kConnecting, attempt, false, {}});
    }
  }

  // One connection lifetime: connect, register, then read until the link drops.
  void RunConnection(std::string* reason) {
    std::string error;
    std::shared_ptr<Transport> transport = connector_(&error);
    if (!transport) {
      *reason = "connect failed: " + error;
      return;
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stop_) {
        transport->Close();
        return;
      }
      transport_ = transport;
    }

    if (!transport->Send(EncodeMessage(ToMessage(identity_)), &error)) {
      transport->Close();
      *reason = "register send failed: " + error;
      return;
    }
    const HandshakeResult handshake = AwaitRegistered(*transport, reason);
    if (handshake != HandshakeResult::kRegistered) {
      transport->Close();
      return;
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      attempt_ = 0;
    }
    SetState(ClientState::kConnected, 0, false, {});

    std::string frame;
    while (!stopping()) {
      const ReceiveStatus status = transport->Receive(&frame, config_.receive_poll);
      if (status == ReceiveStatus::kTimeout) {
        continue;
      }
      if (status == ReceiveStatus::kClosed) {
        break;
      }
      HandleFrame(*transport, frame);
    }
    transport->Close();
    *reason = "connection to hub lost";
  }

  HandshakeResult AwaitRegistered(Transport& transport, std::string* reason) {
    const auto deadline = std::chrono::steady_clock::now() + config_.ack_timeout;
    std::string frame;
    while (std::chrono::steady_clock::now() < deadline) {
      if (stopping()) {
        return HandshakeResult::kStopped;
      }
      const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      const auto wait = std::max(std::chrono::milliseconds(1),
                                 std::min(remaining, config_.receive_poll));
      const ReceiveStatus status = transport.Receive(&frame, wait);
      if (status == ReceiveStatus::kTimeout) {
        continue;
      }
      if (status == ReceiveStatus::kClosed) {
        *reason = "connection closed during registration";
        return HandshakeResult::kFailed;
      }
      Message message;
      std::string error;
      if (!DecodeMessage(frame, &message, &error)) {
        internal::Log(config_.log_callback, "dropping malformed frame: " + error);
        continue;
      }
      if (message.type == MessageType::kError) {
        ErrorMessage rejected;
        if (!ParseError(message, &rejected)) {
          rejected.message = "no reason given";
        }
        *reason = "registration rejected: " + rejected.message;
        return HandshakeResult::kFailed;
      }
      const bool registered = message.type == MessageType::kRegistered;
      HandleMessage(transport, message);
      if (registered) {
        return HandshakeResult::kRegistered;
      }
    }
    *reason = "no registration ack within timeout";
    return HandshakeResult::kFailed;
  }

  void HandleFrame(Transport& transport, const std::string& frame) {
    Message message;
    std::string error;
    if (!DecodeMessage(frame, &message, &error)) {
      internal::Log(config_.log_callback, "dropping malformed frame: " + error);
      return;
    }
    HandleMessage(transport, message);
  }

  void HandleMessage(Transport& transport, const Message& message) {
    if (message.type == MessageType::kPing) {
      std::string error;
      if (!transport.Send(EncodeMessage(MakeHeartbeat(MessageType::kPong, NowMillis())),
                          &error)) {
        internal::Log(config_.log_callback, "pong send failed: " + error);
      }
      return;
    }
    const size_t failures = messages_.Publish(message);
    internal::LogCallbackError(config_.log_callback, "MessageCallback", failures);
  }

  void SetState(ClientState state, int attempt, bool gave_up,
                const std::string& reason) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (state_ == state && !gave_up && state != ClientState::kReconnecting) {
        return;
      }
      // After Disconnect() only the final kDisconnected may be reported.
      if (stop_ && state != ClientState::kDisconnected) {
        return;
      }
      state_ = state;
    }
    cv_.notify_all();
    PublishState({state, attempt, gave_up, reason});
  }

  void PublishState(const ClientStateChange& change) {
    const size_t failures = state_changes_.Publish(change);
    internal::LogCallbackError(config_.log_callback, "StateCallback", failures);
  }

  ClientConfig config_;
  RegisterMessage identity_;
  Connector connector_;

  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  ClientState state_ = ClientState::kDisconnected;
  int attempt_ = 0;
  bool stop_ = false;
  bool retry_now_ = false;
  std::shared_ptr<Transport> transport_;
  std::thread worker_;
};

ReconnectingClient::ReconnectingClient(ClientConfig config, RegisterMessage identity,
                                       Connector connector)
    : impl_(new Impl(std::move(config), std::move(identity), std::move(connector))) {}

ReconnectingClient::~ReconnectingClient() = default;

void ReconnectingClient::Connect() { impl_->Connect(); }
void ReconnectingClient::Disconnect() { impl_->Disconnect(); }

bool ReconnectingClient::Send(const Message& message, std::string* error) {
  return impl_->Send(message, error);
}

ClientState ReconnectingClient::state() const { return impl_->state(); }
int ReconnectingClient::attempt() const { return impl_->attempt(); }

bool ReconnectingClient::WaitForState(ClientState state,
                                      std::chrono::milliseconds timeout) const {
  return impl_->WaitForState(state, timeout);
}

ObserverList<Message>& ReconnectingClient::messages() { return impl_->messages_; }

ObserverList<ClientStateChange>& ReconnectingClient::state_changes() {
  return impl_->state_changes_;
}

}  // namespace playlink
