#include "playlink/hub.h"

#include "playlink/command_router.h"
#include "playlink/device_registry.h"
#include "playlink/discovery.h"
#include "playlink/heartbeat.h"
#include "playlink/http_server.h"
#include "playlink/test_hooks.h"
#include "playlink/transfer.h"

#include "log.h"
#include "net_util.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <sstream>
#include <thread>
#include <utility>

#include <arpa/inet.h>

namespace playlink {
namespace {

DeviceSummary Summarize(const DeviceRecord& record) {
  DeviceSummary summary;
  summary.device_id = record.device_id;
  summary.device_name = record.device_name;
  summary.role = record.role;
  summary.playback = record.playback;
  return summary;
}

AnnouncerConfig MakeAnnouncerConfig(const HubConfig& config) {
  AnnouncerConfig announcer;
  announcer.bind_address = config.bind_address;
  announcer.announce_address = config.announce_address;
  announcer.announce_port = config.announce_port;
  announcer.interval = config.announce_interval;
  announcer.log_callback = config.log_callback;
  return announcer;
}

}  // namespace

bool HubConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  in_addr addr{};
  if (::inet_pton(AF_INET, bind_address.c_str(), &addr) != 1) {
    return fail("bind_address must be a valid IPv4 address");
  }
  if (enable_tcp && enable_http && port != 0 && port == http_port) {
    return fail("port and http_port must differ");
  }
  if (media_root.empty()) {
    return fail("media_root must not be empty");
  }
  if (chunk_size == 0) {
    return fail("chunk_size must be positive");
  }
  if (transfer_history_limit == 0) {
    return fail("transfer_history_limit must be positive");
  }
  if (heartbeat_interval.count() <= 0) {
    return fail("heartbeat_interval must be positive");
  }
  if (receive_poll.count() <= 0) {
    return fail("receive_poll must be positive");
  }
  if (max_frame_bytes < 1024) {
    return fail("max_frame_bytes must be at least 1024");
  }
  if (server_version.empty()) {
    return fail("server_version must not be empty");
  }
  if (enable_tcp && enable_announce) {
    std::string announce_error;
    if (!MakeAnnouncerConfig(*this).Validate(&announce_error)) {
      return fail(announce_error);
    }
  }
  return true;
}

nlohmann::json ToJson(const HealthInfo& health) {
  nlohmann::json devices = nlohmann::json::array();
  for (const auto& device : health.devices) {
    devices.push_back(ToJson(device));
  }
  return {
      {"status", "healthy"},
      {"connectedDevices", health.device_count},
      {"connectedControllers", health.controller_count},
      {"uptime", health.uptime_seconds},
      {"serverVersion", health.server_version},
      {"devices", devices},
  };
}

struct Hub::Impl {
#ifdef PLAYLINK_TESTING
  friend std::vector<std::string> test::TickHeartbeat(Hub& hub);
  friend DeviceRegistry& test::GetRegistry(Hub& hub);
  friend TransferCoordinator& test::GetCoordinator(Hub& hub);
#endif

  // One served session and the thread running its receive loop.
  struct Connection {
    std::shared_ptr<Session> session;
    std::thread thread;
    std::atomic<bool> finished{false};
  };

  explicit Impl(HubConfig config)
      : config_(std::move(config)),
        registry_(config_.log_callback),
        router_(registry_, config_.log_callback),
        coordinator_(MakeTransferConfig(config_), &registry_),
        heartbeat_(config_.heartbeat_interval, config_.log_callback) {
    HttpServerConfig http_config;
    http_config.bind_address = config_.bind_address;
    http_config.port = config_.http_port;
    http_config.log_callback = config_.log_callback;
    http_ = std::make_unique<HttpServer>(http_config, coordinator_);
    http_->AddJsonRoute("/health", [this]() { return ToJson(GetHealth()); });
    http_->AddJsonRoute("/devices", [this]() {
      nlohmann::json list = nlohmann::json::array();
      for (const auto& record : registry_.List(Role::kPlayer)) {
        list.push_back(ToJson(Summarize(record)));
      }
      return list;
    });

    heartbeat_.evictions().Subscribe([this](const HeartbeatEviction&) {
      metrics_.evictions.fetch_add(1, std::memory_order_relaxed);
    });
    coordinator_.events().Subscribe([this](const TransferEvent& event) {
      OnTransferEvent(event);
    });
  }

  ~Impl() { Stop(); }

  static TransferConfig MakeTransferConfig(const HubConfig& config) {
    TransferConfig transfer;
    transfer.media_root = config.media_root;
    transfer.chunk_size = config.chunk_size;
    transfer.history_limit = config.transfer_history_limit;
    transfer.log_callback = config.log_callback;
    return transfer;
  }

  bool Start() {
    if (running_.exchange(true)) {
      return true;
    }
    {
      std::lock_guard<std::mutex> lock(error_mutex_);
      start_error_.clear();
    }
    std::string error;
    if (!config_.Validate(&error)) {
      return FailStart(error);
    }
    if (config_.enable_tcp && !listener_.Open(config_.bind_address, config_.port)) {
      return FailStart(listener_.last_error());
    }
    if (config_.enable_http && !http_->Start(&error)) {
      listener_.Close();
      return FailStart(error);
    }
    if (config_.enable_tcp && config_.enable_announce) {
      HubAnnouncement announcement;
      announcement.host = config_.advertised_host;
      announcement.port = listener_.port();
      announcement.http_port = config_.enable_http ? http_->port() : 0;
      announcement.server_version = config_.server_version;
      announcer_ = std::make_unique<HubAnnouncer>(MakeAnnouncerConfig(config_),
                                                  announcement);
      if (!announcer_->Start(&error)) {
        announcer_.reset();
        http_->Stop();
        listener_.Close();
        return FailStart(error);
      }
    }
    started_at_ = std::chrono::steady_clock::now();
    heartbeat_.Start();
    if (config_.enable_tcp) {
      try {
        accept_thread_ = std::thread([this]() { AcceptLoop(); });
      } catch (const std::exception& ex) {
        heartbeat_.Stop();
        announcer_.reset();
        http_->Stop();
        listener_.Close();
        return FailStart(std::string("thread start failed: ") + ex.what());
      }
    }

    std::ostringstream oss;
    oss << "hub started";
    if (config_.enable_tcp) {
      oss << ", control on " << config_.bind_address << ":" << listener_.port();
    }
    if (config_.enable_http) {
      oss << ", transfers on " << config_.bind_address << ":" << http_->port();
    }
    if (announcer_) {
      oss << ", announcing to " << config_.announce_address << ":"
          << config_.announce_port;
    }
    Log(oss.str());
    return true;
  }

  bool FailStart(const std::string& error) {
    {
      std::lock_guard<std::mutex> lock(error_mutex_);
      start_error_ = error;
    }
    Log(error);
    running_ = false;
    return false;
  }

  void Stop() {
    if (!running_.exchange(false)) {
      return;
    }
    listener_.Close();
    if (accept_thread_.joinable()) {
      accept_thread_.join();
    }
    announcer_.reset();
    heartbeat_.Stop();
    http_->Stop();

    std::vector<std::unique_ptr<Connection>> connections;
    {
      std::lock_guard<std::mutex> lock(connections_mutex_);
      connections.swap(connections_);
    }
    for (auto& connection : connections) {
      connection->session->Close();
    }
    for (auto& connection : connections) {
      if (connection->thread.joinable()) {
        connection->thread.join();
      }
    }
    Log("hub stopped");
  }

  std::string AddConnection(std::shared_ptr<Transport> transport) {
    if (!transport) {
      return {};
    }
    if (!running_.load()) {
      transport->Close();
      return {};
    }
    ReapConnections();

    const std::string session_id = "s" + std::to_string(++next_session_);
    auto session = std::make_shared<Session>(session_id, transport, config_.log_callback);
    // Listeners run on the closing thread while the session is still alive.
    Session* raw = session.get();
    session->AddCloseListener([this, raw](const std::string&) { OnSessionClosed(*raw); });
    heartbeat_.Track(session);

    auto connection = std::make_unique<Connection>();
    connection->session = session;
    Connection* handle = connection.get();
    {
      std::lock_guard<std::mutex> lock(connections_mutex_);
      if (!running_.load()) {
        session->Close();
        return {};
      }
      try {
        connection->thread = std::thread([this, handle]() {
          ConnectionLoop(handle->session);
          handle->finished.store(true);
        });
      } catch (const std::exception& ex) {
        Log(std::string("connection thread start failed: ") + ex.what());
        session->Close();
        return {};
      }
      connections_.push_back(std::move(connection));
    }
    Log("session " + session_id + " connected from " + session->Peer());
    return session_id;
  }

  void ReapConnections() {
    std::vector<std::unique_ptr<Connection>> finished;
    {
      std::lock_guard<std::mutex> lock(connections_mutex_);
      for (auto it = connections_.begin(); it != connections_.end();) {
        if ((*it)->finished.load()) {
          finished.push_back(std::move(*it));
          it = connections_.erase(it);
        } else {
          ++it;
        }
      }
    }
    for (auto& connection : finished) {
      if (connection->thread.joinable()) {
        connection->thread.join();
      }
    }
  }

  void AcceptLoop() {
    while (running_) {
      std::string peer;
      const int fd = listener_.Accept(std::chrono::milliseconds(200), &peer);
      if (fd < 0) {
        continue;
      }
      AddConnection(std::make_shared<TcpTransport>(fd, peer, config_.max_frame_bytes));
    }
  }

  void ConnectionLoop(const std::shared_ptr<Session>& session) {
    WelcomeMessage welcome;
    welcome.message = "Connected to playlink hub";
    welcome.server_version = config_.server_version;
    SendToSession(*session, ToMessage(welcome));

    std::string frame;
    while (!session->IsClosed()) {
      const ReceiveStatus status = session->Receive(&frame, config_.receive_poll);
      if (status == ReceiveStatus::kTimeout) {
        continue;
      }
      if (status == ReceiveStatus::kClosed) {
        break;
      }
      metrics_.messages_received.fetch_add(1, std::memory_order_relaxed);
      try {
        HandleFrame(session, frame);
      } catch (const std::exception& ex) {
        metrics_.callback_exceptions.fetch_add(1, std::memory_order_relaxed);
        ReportError(*session, std::string("internal error: ") + ex.what());
      }
    }
    session->Close();
  }

  void HandleFrame(const std::shared_ptr<Session>& session, const std::string& frame) {
    Message message;
    std::string error;
    if (!DecodeMessage(frame, &message, &error)) {
      ReportError(*session, error);
      return;
    }
    switch (message.type) {
      case MessageType::kRegister:
        HandleRegister(session, message);
        break;
      case MessageType::kCommand:
        HandleCommand(*session, message);
        break;
      case MessageType::kStatus:
      case MessageType::kTransferProgress:
      case MessageType::kDeleteMediaResult:
      case MessageType::kLocalMedia:
        HandlePlayerReport(*session, message);
        break;
      case MessageType::kPing:
        SendToSession(*session, MakeHeartbeat(MessageType::kPong, NowMillis()));
        break;
      case MessageType::kPong:
        heartbeat_.RecordPong(session->id());
        break;
      default:
        ReportError(*session, std::string("unexpected message type: ") +
                                  ToString(message.type));
        break;
    }
  }

  void HandleRegister(const std::shared_ptr<Session>& session, const Message& message) {
    RegisterMessage request;
    std::string error;
    if (!ParseRegister(message, &request, &error)) {
      ReportError(*session, error);
      return;
    }
    if (session->registered() && session->device_id() != request.device_id) {
      ReleaseDevice(*session);
    }
    session->SetIdentity(request.device_id, request.role);
    const RegisterResult result =
        registry_.Register(request.device_id, request.device_name, request.role, session);
    if (!result.accepted) {
      ReportError(*session, result.error);
      return;
    }
    auto record = registry_.Find(request.device_id);
    const std::string name = record ? record->device_name : request.device_id;

    RegisteredMessage reply;
    reply.device_id = request.device_id;
    reply.message = std::string("Registered as ") + ToString(request.role);
    if (request.role == Role::kController) {
      for (const auto& player : registry_.List(Role::kPlayer)) {
        reply.devices.push_back(Summarize(player));
      }
    }
    SendToSession(*session, ToMessage(reply));

    std::ostringstream oss;
    oss << ToString(request.role) << " registered: " << request.device_id << " ("
        << name << ")" << (result.replaced_existing ? ", replaced previous session" : "");
    Log(oss.str());

    if (request.role == Role::kPlayer) {
      Broadcast(MakeDeviceNotice(MessageType::kDeviceConnected, {request.device_id, name}));
    }
  }

  void HandleCommand(Session& session, const Message& message) {
    if (!session.registered() || session.role() != Role::kController) {
      ReportError(session, "only registered controllers may send commands");
      return;
    }
    Command command;
    std::string error;
    if (!ParseCommand(message, &command, &error)) {
      ReportError(session, error);
      return;
    }
    if (command.timestamp_ms == 0) {
      command.timestamp_ms = NowMillis();
    }

    DispatchReport report;
    switch (command.action) {
      case CommandAction::kDownload:
        if (!config_.enable_http) {
          ReportError(session, "file transfers are disabled on this hub");
          return;
        }
        report = OfferDownloads(command);
        break;
      case CommandAction::kDeleteMedia: {
        DeleteMediaMessage request;
        request.filename = command.media_ref;
        report = router_.DispatchMessage(command.target, ToMessage(request));
        CountDispatch(report);
        break;
      }
      default:
        report = router_.Dispatch(command);
        CountDispatch(report);
        break;
    }

    std::ostringstream oss;
    oss << "command " << ToString(command.action) << " from " << session.device_id()
        << " reached " << report.delivered << "/" << report.targeted << " device(s)";
    Log(oss.str());

    CommandAckMessage ack;
    ack.action = command.action;
    ack.target_count = report.targeted;
    ack.delivered_count = report.delivered;
    ack.timestamp_ms = NowMillis();
    SendToSession(session, ToMessage(ack));
  }

  DispatchReport OfferDownloads(const Command& command) {
    DispatchReport report;
    for (const auto& device_id : router_.ResolveTargets(command.target)) {
      ++report.targeted;
      TargetResult result;
      result.device_id = device_id;
      const OfferResult offer = coordinator_.Offer(command.media_ref, {}, device_id);
      if (!offer.ok) {
        result.error = offer.error;
        Log("cannot offer " + command.media_ref + " to " + device_id + ": " + offer.error);
        report.results.push_back(std::move(result));
        continue;
      }
      auto transfer = coordinator_.Find(offer.transfer_id);
      DownloadMessage download;
      download.transfer_id = offer.transfer_id;
      download.download_url = DownloadUrl(offer.download_path);
      download.filename = transfer ? transfer->filename : std::string();
      download.file_size = offer.file_size;
      if (router_.SendTo(device_id, ToMessage(download), &result.error)) {
        result.delivered = true;
        ++report.delivered;
        metrics_.messages_sent.fetch_add(1, std::memory_order_relaxed);
      } else {
        metrics_.send_errors.fetch_add(1, std::memory_order_relaxed);
        coordinator_.Cancel(offer.transfer_id, "receiver unreachable");
      }
      report.results.push_back(std::move(result));
    }
    return report;
  }

  std::string DownloadUrl(const std::string& path) const {
    std::string host = config_.advertised_host;
    if (host.empty()) {
      host = config_.bind_address == "0.0.0.0" ? "127.0.0.1" : config_.bind_address;
    }
    std::ostringstream oss;
    oss << "http://" << host << ":" << http_->port() << path;
    return oss.str();
  }

  void HandlePlayerReport(Session& session, const Message& message) {
    if (!session.registered() || session.role() != Role::kPlayer) {
      ReportError(session, std::string("only registered players may send ") +
                               ToString(message.type));
      return;
    }
    const std::string device_id = session.device_id();
    std::string error;
    switch (message.type) {
      case MessageType::kStatus: {
        StatusMessage status;
        if (!ParseStatus(message, &status, &error)) {
          ReportError(session, error);
          return;
        }
        registry_.UpdateStatus(device_id, status.playback);
        auto record = registry_.Find(device_id);
        if (!record) {
          return;
        }
        status.device_id = device_id;
        status.device_name = record->device_name;
        status.playback = record->playback;
        Broadcast(ToMessage(status));
        break;
      }
      case MessageType::kTransferProgress: {
        TransferProgressMessage report;
        if (!ParseTransferProgress(message, &report, &error)) {
          ReportError(session, error);
          return;
        }
        report.device_id = device_id;
        if (!coordinator_.ApplyReceiverProgress(device_id, report)) {
          Log("progress from " + device_id + " matches no transfer: " + report.filename);
        }
        Broadcast(ToMessage(report));
        break;
      }
      case MessageType::kDeleteMediaResult: {
        DeleteMediaResultMessage result;
        if (!ParseDeleteMediaResult(message, &result, &error)) {
          ReportError(session, error);
          return;
        }
        result.device_id = device_id;
        Broadcast(ToMessage(result));
        break;
      }
      case MessageType::kLocalMedia: {
        LocalMediaMessage media;
        if (!ParseLocalMedia(message, &media, &error)) {
          ReportError(session, error);
          return;
        }
        media.device_id = device_id;
        registry_.UpdateLocalMedia(device_id, media.items);
        Broadcast(ToMessage(media));
        break;
      }
      default:
        break;
    }
  }

  // Broadcast a sender-side transfer failure; receivers report the rest.
  void OnTransferEvent(const TransferEvent& event) {
    if (event.type != TransferEventType::kFailed || !running_.load()) {
      return;
    }
    const Transfer& transfer = event.transfer;
    TransferProgressMessage report;
    report.device_id = transfer.target_device_id;
    report.transfer_id = transfer.id;
    report.filename = transfer.filename;
    report.status = TransferStatus::kFailed;
    report.bytes_transferred = transfer.bytes_transferred;
    report.total_bytes = transfer.total_bytes;
    report.progress = transfer.total_bytes == 0
                          ? 0.0
                          : static_cast<double>(transfer.bytes_transferred) /
                                static_cast<double>(transfer.total_bytes);
    report.error = transfer.error;
    Broadcast(ToMessage(report));
  }

  void OnSessionClosed(Session& session) {
    if (session.registered()) {
      ReleaseDevice(session);
    }
    Log("session " + session.id() + " closed");
  }

  // Drop the session's registration, if it still owns it.
  void ReleaseDevice(Session& session) {
    const std::string device_id = session.device_id();
    auto record = registry_.Find(device_id);
    if (!registry_.UnregisterSession(device_id, session.id())) {
      return;
    }
    Log(std::string(ToString(session.role())) + " disconnected: " + device_id);
    if (session.role() != Role::kPlayer) {
      return;
    }
    coordinator_.CancelForDevice(device_id, "device disconnected");
    if (running_.load()) {
      Broadcast(MakeDeviceNotice(MessageType::kDeviceDisconnected,
                                 {device_id, record ? record->device_name : device_id}));
    }
  }

  void Broadcast(const Message& message) {
    CountDispatch(router_.BroadcastToControllers(message));
  }

  void CountDispatch(const DispatchReport& report) {
    metrics_.messages_sent.fetch_add(static_cast<uint64_t>(report.delivered),
                                     std::memory_order_relaxed);
    metrics_.send_errors.fetch_add(static_cast<uint64_t>(report.targeted - report.delivered),
                                   std::memory_order_relaxed);
  }

  bool SendToSession(Session& session, const Message& message) {
    std::string error;
    if (!session.Send(message, &error)) {
      metrics_.send_errors.fetch_add(1, std::memory_order_relaxed);
      Log("send to " + session.id() + " failed: " + error);
      return false;
    }
    metrics_.messages_sent.fetch_add(1, std::memory_order_relaxed);
    return true;
  }

  void ReportError(Session& session, const std::string& error) {
    metrics_.protocol_errors.fetch_add(1, std::memory_order_relaxed);
    Log("protocol error from " + session.id() + ": " + error);
    ErrorMessage reply;
    reply.message = error;
    reply.timestamp_ms = NowMillis();
    SendToSession(session, ToMessage(reply));
  }

  HealthInfo GetHealth() const {
    HealthInfo health;
    for (const auto& record : registry_.List(Role::kPlayer)) {
      health.devices.push_back(Summarize(record));
    }
    health.device_count = health.devices.size();
    health.controller_count = registry_.Count(Role::kController);
    health.server_version = config_.server_version;
    if (running_.load()) {
      health.uptime_seconds = std::chrono::duration_cast<std::chrono::seconds>(
                                  std::chrono::steady_clock::now() - started_at_)
                                  .count();
    }
    return health;
  }

  std::string GetLastError() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return start_error_;
  }

  HubMetrics GetMetrics() const {
    HubMetrics snapshot;
    snapshot.messages_received = metrics_.messages_received.load(std::memory_order_relaxed);
    snapshot.messages_sent = metrics_.messages_sent.load(std::memory_order_relaxed);
    snapshot.protocol_errors = metrics_.protocol_errors.load(std::memory_order_relaxed);
    snapshot.send_errors = metrics_.send_errors.load(std::memory_order_relaxed);
    snapshot.callback_exceptions =
        metrics_.callback_exceptions.load(std::memory_order_relaxed);
    snapshot.evictions = metrics_.evictions.load(std::memory_order_relaxed);
    return snapshot;
  }

  void Log(const std::string& message) const {
    internal::Log(config_.log_callback, message);
  }

  struct AtomicMetrics {
    std::atomic<uint64_t> messages_received{0};
    std::atomic<uint64_t> messages_sent{0};
    std::atomic<uint64_t> protocol_errors{0};
    std::atomic<uint64_t> send_errors{0};
    std::atomic<uint64_t> callback_exceptions{0};
    std::atomic<uint64_t> evictions{0};
  };

  HubConfig config_;
  DeviceRegistry registry_;
  CommandRouter router_;
  TransferCoordinator coordinator_;
  HeartbeatMonitor heartbeat_;
  std::unique_ptr<HttpServer> http_;
  internal::TcpListener listener_;
  std::unique_ptr<HubAnnouncer> announcer_;

  std::atomic<bool> running_{false};
  std::thread accept_thread_;
  std::chrono::steady_clock::time_point started_at_;
  std::atomic<uint64_t> next_session_{0};

  std::mutex connections_mutex_;
  std::vector<std::unique_ptr<Connection>> connections_;

  mutable std::mutex error_mutex_;
  std::string start_error_;
  AtomicMetrics metrics_;
};

Hub::Hub(HubConfig config) : impl_(new Hub::Impl(std::move(config))) {}

Hub::~Hub() = default;

bool Hub::Start() { return impl_->Start(); }
void Hub::Stop() { impl_->Stop(); }
bool Hub::running() const { return impl_->running_.load(); }

std::string Hub::AddConnection(std::shared_ptr<Transport> transport) {
  return impl_->AddConnection(std::move(transport));
}

HealthInfo Hub::GetHealth() const { return impl_->GetHealth(); }

std::string Hub::GetLastError() const { return impl_->GetLastError(); }

HubMetrics Hub::GetMetrics() const { return impl_->GetMetrics(); }

uint16_t Hub::port() const { return impl_->listener_.port(); }

uint16_t Hub::http_port() const { return impl_->http_->port(); }

#ifdef PLAYLINK_TESTING
namespace test {

std::vector<std::string> TickHeartbeat(Hub& hub) { return hub.impl_->heartbeat_.Tick(); }

DeviceRegistry& GetRegistry(Hub& hub) { return hub.impl_->registry_; }

TransferCoordinator& GetCoordinator(Hub& hub) { return hub.impl_->coordinator_; }

PeerTester::PeerTester(std::shared_ptr<Transport> transport)
    : transport_(std::move(transport)) {}

PeerTester::~PeerTester() { Close(); }

bool PeerTester::Send(const Message& message) { return SendRaw(EncodeMessage(message)); }

bool PeerTester::SendRaw(const std::string& frame) { return transport_->Send(frame); }

bool PeerTester::Register(const std::string& device_id, Role role,
                          const std::string& device_name) {
  RegisterMessage request;
  request.device_id = device_id;
  request.device_name = device_name;
  request.role = role;
  return Send(ToMessage(request)) && WaitFor(MessageType::kRegistered).has_value();
}

std::optional<Message> PeerTester::WaitFor(MessageType type,
                                           std::chrono::milliseconds timeout) {
  for (auto it = backlog_.begin(); it != backlog_.end(); ++it) {
    if (it->type == type) {
      Message found = std::move(*it);
      backlog_.erase(it);
      return found;
    }
  }
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::string frame;
  while (std::chrono::steady_clock::now() < deadline) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    const ReceiveStatus status =
        transport_->Receive(&frame, std::max(remaining, std::chrono::milliseconds(1)));
    if (status == ReceiveStatus::kClosed) {
      return std::nullopt;
    }
    if (status == ReceiveStatus::kTimeout) {
      continue;
    }
    Message message;
    if (!DecodeMessage(frame, &message)) {
      continue;
    }
    if (message.type == type) {
      return message;
    }
    backlog_.push_back(std::move(message));
  }
  return std::nullopt;
}

std::vector<Message> PeerTester::Drain(std::chrono::milliseconds quiet) {
  std::vector<Message> messages(backlog_.begin(), backlog_.end());
  backlog_.clear();
  std::string frame;
  while (transport_->Receive(&frame, quiet) == ReceiveStatus::kFrame) {
    Message message;
    if (DecodeMessage(frame, &message)) {
      messages.push_back(std::move(message));
    }
  }
  return messages;
}

void PeerTester::Close() { transport_->Close(); }

bool PeerTester::IsOpen() const { return transport_->IsOpen(); }

std::unique_ptr<PeerTester> ConnectPeer(Hub& hub, const std::string& peer_name) {
  auto pair = MakeMemoryTransportPair(peer_name, "hub");
  hub.AddConnection(pair.second);
  return std::make_unique<PeerTester>(pair.first);
}

}  // namespace test
#endif

}  // namespace playlink
