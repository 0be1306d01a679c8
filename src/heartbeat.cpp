#include "playlink/heartbeat.h"

#include "log.h"

#include <sstream>
#include <unordered_map>
#include <utility>

namespace playlink {

struct HeartbeatMonitor::State {
  mutable std::mutex mutex;
  std::unordered_map<std::string, std::shared_ptr<Session>> sessions;
};

HeartbeatMonitor::HeartbeatMonitor(std::chrono::milliseconds interval,
                                   LogCallback log_callback)
    : interval_(interval),
      log_callback_(std::move(log_callback)),
      state_(std::make_shared<State>()) {}

HeartbeatMonitor::~HeartbeatMonitor() { Stop(); }

void HeartbeatMonitor::Track(const std::shared_ptr<Session>& session) {
  if (!session) {
    return;
  }
  session->set_alive(true);
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->sessions[session->id()] = session;
  }
  // The monitor may be gone by the time the session closes.
  std::weak_ptr<State> weak_state = state_;
  session->AddCloseListener([weak_state](const std::string& session_id) {
    if (auto state = weak_state.lock()) {
      std::lock_guard<std::mutex> lock(state->mutex);
      state->sessions.erase(session_id);
    }
  });
}

void HeartbeatMonitor::Untrack(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  state_->sessions.erase(session_id);
}

bool HeartbeatMonitor::RecordPong(const std::string& session_id) {
  std::shared_ptr<Session> session;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->sessions.find(session_id);
    if (it == state_->sessions.end()) {
      return false;
    }
    session = it->second;
  }
  session->MarkPong();
  return true;
}

std::vector<std::string> HeartbeatMonitor::Tick() {
  std::vector<std::shared_ptr<Session>> dead;
  std::vector<std::shared_ptr<Session>> live;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    for (auto it = state_->sessions.begin(); it != state_->sessions.end();) {
      if (!it->second->is_alive()) {
        dead.push_back(it->second);
        it = state_->sessions.erase(it);
      } else {
        it->second->set_alive(false);
        live.push_back(it->second);
        ++it;
      }
    }
  }

  std::vector<std::string> evicted;
  evicted.reserve(dead.size());
  for (const auto& session : dead) {
    std::ostringstream oss;
    oss << "heartbeat timeout, closing session " << session->id();
    const std::string device_id = session->device_id();
    if (!device_id.empty()) {
      oss << " (device " << device_id << ")";
    }
    internal::Log(log_callback_, oss.str());
    session->Close();
    evicted.push_back(session->id());
    const size_t failures = evictions_.Publish({session->id(), device_id});
    internal::LogCallbackError(log_callback_, "HeartbeatEviction", failures);
  }

  const Message ping = MakeHeartbeat(MessageType::kPing, NowMillis());
  for (const auto& session : live) {
    std::string error;
    if (!session->Send(ping, &error)) {
      internal::Log(log_callback_,
                    "ping to session " + session->id() + " failed: " + error);
    }
  }
  return evicted;
}

bool HeartbeatMonitor::Start() {
  if (running_.exchange(true)) {
    return true;
  }
  try {
    thread_ = std::thread([this]() { Loop(); });
  } catch (const std::exception& ex) {
    internal::Log(log_callback_,
                  std::string("heartbeat thread start failed: ") + ex.what());
    running_ = false;
    return false;
  }
  return true;
}

void HeartbeatMonitor::Stop() {
  {
    std::lock_guard<std::mutex> lock(loop_mutex_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  loop_cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

size_t HeartbeatMonitor::tracked_count() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->sessions.size();
}

void HeartbeatMonitor::Loop() {
  while (running_) {
    {
      std::unique_lock<std::mutex> lock(loop_mutex_);
      loop_cv_.wait_for(lock, interval_, [this]() { return !running_.load(); });
    }
    if (!running_) {
      return;
    }
    Tick();
  }
}

}  // namespace playlink
