#include "playlink/command_router.h"

#include "log.h"

#include <algorithm>
#include <sstream>
#include <utility>

namespace playlink {

CommandRouter::CommandRouter(DeviceRegistry& registry, LogCallback log_callback)
    : registry_(registry), log_callback_(std::move(log_callback)) {}

std::vector<std::string> CommandRouter::ResolveTargets(const TargetSpec& target) const {
  std::vector<std::string> resolved;
  if (target.kind == TargetSpec::Kind::kAll) {
    for (const auto& record : registry_.List(Role::kPlayer)) {
      resolved.push_back(record.device_id);
    }
    return resolved;
  }
  for (const auto& id : target.ids) {
    if (std::find(resolved.begin(), resolved.end(), id) != resolved.end()) {
      continue;
    }
    auto record = registry_.Find(id);
    if (record && record->role == Role::kPlayer) {
      resolved.push_back(id);
    }
    if (target.kind == TargetSpec::Kind::kSingle) {
      break;
    }
  }
  return resolved;
}

DispatchReport CommandRouter::Dispatch(const Command& command) {
  return DispatchMessage(command.target, ToMessage(command));
}

DispatchReport CommandRouter::DispatchMessage(const TargetSpec& target,
                                              const Message& message) {
  return Deliver(ResolveTargets(target), message);
}

DispatchReport CommandRouter::BroadcastToControllers(const Message& message) {
  std::vector<std::string> ids;
  for (const auto& record : registry_.List(Role::kController)) {
    ids.push_back(record.device_id);
  }
  return Deliver(ids, message);
}

bool CommandRouter::SendTo(const std::string& device_id, const Message& message,
                           std::string* error) {
  std::shared_ptr<Session> session = registry_.SessionFor(device_id);
  if (!session) {
    if (error) {
      *error = "unknown device: " + device_id;
    }
    return false;
  }
  return session->Send(message, error);
}

DispatchReport CommandRouter::Deliver(const std::vector<std::string>& device_ids,
                                      const Message& message) {
  DispatchReport report;
  report.targeted = static_cast<int>(device_ids.size());
  // Encode once; every target gets the identical frame.
  const std::string frame = EncodeMessage(message);
  for (const auto& device_id : device_ids) {
    TargetResult result;
    result.device_id = device_id;
    std::shared_ptr<Session> session = registry_.SessionFor(device_id);
    if (!session || session->IsClosed()) {
      result.error = "device disconnected";
    } else {
      result.delivered = session->SendFrame(frame, &result.error);
    }
    if (result.delivered) {
      ++report.delivered;
    } else {
      std::ostringstream oss;
      oss << "failed to deliver " << ToString(message.type) << " to " << device_id
          << ": " << result.error;
      internal::Log(log_callback_, oss.str());
    }
    report.results.push_back(std::move(result));
  }
  return report;
}

}  // namespace playlink
