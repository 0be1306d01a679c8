#pragma once

#include "playlink/observer.h"
#include "playlink/transport.h"
#include "playlink/types.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace playlink {

/**
 * Registered participant and its last-known state.
 */
struct DeviceRecord {
  std::string device_id;
  std::string device_name;
  Role role = Role::kPlayer;
  /// Live session; never null while the record is in the registry.
  std::shared_ptr<Session> session;
  PlaybackSnapshot playback;
  /// Media files the player last reported via `localMedia`.
  std::vector<MediaItem> local_media;
  std::chrono::steady_clock::time_point registered_at;
};

enum class DeviceEventType {
  kRegistered,
  kStatusChanged,
  kRemoved,
};

struct DeviceEvent {
  DeviceEventType type = DeviceEventType::kRegistered;
  DeviceRecord device;
  /// For kRegistered: an earlier session for the same id was replaced.
  bool replaced = false;
};

struct RegisterResult {
  bool accepted = false;
  std::string error;
  bool replaced_existing = false;
};

/**
 * Authoritative map of device_id to DeviceRecord.
 *
 * At most one live session exists per device_id: re-registering closes the
 * previous session. Records are dropped as soon as their session goes away.
 * Sessions returned by the snapshot accessors are used by callers after the
 * registry lock is released; no send or close happens under the lock.
 */
class DeviceRegistry {
 public:
  explicit DeviceRegistry(LogCallback log_callback = nullptr);

  DeviceRegistry(const DeviceRegistry&) = delete;
  DeviceRegistry& operator=(const DeviceRegistry&) = delete;

  /**
   * Add or replace the record for `device_id`.
   *
   * An empty `device_name` keeps the previous name on re-registration.
   * Playback state is reset to idle.
   */
  RegisterResult Register(const std::string& device_id,
                          const std::string& device_name, Role role,
                          std::shared_ptr<Session> session);

  /// Replace the device's playback snapshot. False if the id is unknown.
  bool UpdateStatus(const std::string& device_id, const PlaybackSnapshot& snapshot);
  bool UpdateLocalMedia(const std::string& device_id, std::vector<MediaItem> items);

  bool Unregister(const std::string& device_id);
  /// Remove the record only if `session_id` is still its current session.
  bool UnregisterSession(const std::string& device_id, const std::string& session_id);

  std::vector<DeviceRecord> List() const;
  std::vector<DeviceRecord> List(Role role) const;
  std::optional<DeviceRecord> Find(const std::string& device_id) const;

  std::vector<std::shared_ptr<Session>> SessionsForRole(Role role) const;
  std::shared_ptr<Session> SessionFor(const std::string& device_id) const;

  size_t size() const;
  size_t Count(Role role) const;

  ObserverList<DeviceEvent>& events() { return events_; }

 private:
  void Publish(const DeviceEvent& event);

  LogCallback log_callback_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, DeviceRecord> devices_;
  ObserverList<DeviceEvent> events_;
};

}  // namespace playlink
