#include "playlink/device_registry.h"

#include "log.h"

#include <algorithm>
#include <sstream>
#include <utility>

namespace playlink {

DeviceRegistry::DeviceRegistry(LogCallback log_callback)
    : log_callback_(std::move(log_callback)) {}

RegisterResult DeviceRegistry::Register(const std::string& device_id,
                                        const std::string& device_name, Role role,
                                        std::shared_ptr<Session> session) {
  RegisterResult result;
  if (device_id.empty()) {
    result.error = "device_id must not be empty";
    return result;
  }
  if (!session) {
    result.error = "session must not be null";
    return result;
  }

  std::shared_ptr<Session> superseded;
  DeviceRecord snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(device_id);
    if (it == devices_.end()) {
      DeviceRecord record;
      record.device_id = device_id;
      record.device_name = device_name.empty() ? device_id : device_name;
      record.role = role;
      record.session = session;
      record.registered_at = std::chrono::steady_clock::now();
      record.playback.last_update_ms = NowMillis();
      it = devices_.emplace(device_id, std::move(record)).first;
    } else {
      DeviceRecord& record = it->second;
      if (record.session != session) {
        superseded = record.session;
        result.replaced_existing = true;
      }
      if (!device_name.empty()) {
        record.device_name = device_name;
      }
      record.role = role;
      record.session = session;
      record.playback = PlaybackSnapshot{};
      record.playback.last_update_ms = NowMillis();
      record.local_media.clear();
      record.registered_at = std::chrono::steady_clock::now();
    }
    snapshot = it->second;
  }
  result.accepted = true;

  if (superseded) {
    std::ostringstream oss;
    oss << "device " << device_id << " re-registered, closing session "
        << superseded->id();
    internal::Log(log_callback_, oss.str());
    superseded->Close();
  }
  Publish({DeviceEventType::kRegistered, std::move(snapshot),
           result.replaced_existing});
  return result;
}

bool DeviceRegistry::UpdateStatus(const std::string& device_id,
                                  const PlaybackSnapshot& snapshot) {
  DeviceRecord copy;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(device_id);
    if (it == devices_.end()) {
      return false;
    }
    it->second.playback = snapshot;
    it->second.playback.last_update_ms = NowMillis();
    copy = it->second;
  }
  Publish({DeviceEventType::kStatusChanged, std::move(copy), false});
  return true;
}

bool DeviceRegistry::UpdateLocalMedia(const std::string& device_id,
                                      std::vector<MediaItem> items) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(device_id);
  if (it == devices_.end()) {
    return false;
  }
  it->second.local_media = std::move(items);
  return true;
}

bool DeviceRegistry::Unregister(const std::string& device_id) {
  DeviceRecord removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(device_id);
    if (it == devices_.end()) {
      return false;
    }
    removed = std::move(it->second);
    devices_.erase(it);
  }
  Publish({DeviceEventType::kRemoved, std::move(removed), false});
  return true;
}

bool DeviceRegistry::UnregisterSession(const std::string& device_id,
                                       const std::string& session_id) {
  DeviceRecord removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(device_id);
    if (it == devices_.end() || !it->second.session ||
        it->second.session->id() != session_id) {
      return false;
    }
    removed = std::move(it->second);
    devices_.erase(it);
  }
  Publish({DeviceEventType::kRemoved, std::move(removed), false});
  return true;
}

std::vector<DeviceRecord> DeviceRegistry::List() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DeviceRecord> result;
  result.reserve(devices_.size());
  for (const auto& entry : devices_) {
    result.push_back(entry.second);
  }
  std::sort(result.begin(), result.end(),
            [](const DeviceRecord& a, const DeviceRecord& b) {
              return a.device_id < b.device_id;
            });
  return result;
}

std::vector<DeviceRecord> DeviceRegistry::List(Role role) const {
  std::vector<DeviceRecord> result = List();
  result.erase(std::remove_if(result.begin(), result.end(),
                              [role](const DeviceRecord& record) {
                                return record.role != role;
                              }),
               result.end());
  return result;
}

std::optional<DeviceRecord> DeviceRegistry::Find(const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(device_id);
  if (it == devices_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::shared_ptr<Session>> DeviceRegistry::SessionsForRole(Role role) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<Session>> result;
  for (const auto& entry : devices_) {
    if (entry.second.role == role && entry.second.session) {
      result.push_back(entry.second.session);
    }
  }
  return result;
}

std::shared_ptr<Session> DeviceRegistry::SessionFor(const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(device_id);
  if (it == devices_.end()) {
    return nullptr;
  }
  return it->second.session;
}

size_t DeviceRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_.size();
}

size_t DeviceRegistry::Count(Role role) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(
      std::count_if(devices_.begin(), devices_.end(),
                    [role](const auto& entry) { return entry.second.role == role; }));
}

void DeviceRegistry::Publish(const DeviceEvent& event) {
  const size_t failures = events_.Publish(event);
  internal::LogCallbackError(log_callback_, "DeviceEvent", failures);
}

}  // namespace playlink
