#pragma once

#include "playlink/device_registry.h"
#include "playlink/message.h"
#include "playlink/types.h"

#include <string>
#include <vector>

namespace playlink {

/// Delivery outcome for one resolved target.
struct TargetResult {
  std::string device_id;
  bool delivered = false;
  std::string error;
};

/**
 * Outcome of a fan-out. The issuer only sees the two counts; `results`
 * carries per-target detail for logs and tests.
 */
struct DispatchReport {
  int targeted = 0;
  int delivered = 0;
  std::vector<TargetResult> results;
};

/**
 * Resolves command targets against the registry and fans messages out.
 *
 * Delivery is best-effort and at-most-once per live session; a failed send
 * to one target never aborts the others. Controllers are never targets of a
 * command.
 */
class CommandRouter {
 public:
  explicit CommandRouter(DeviceRegistry& registry, LogCallback log_callback = nullptr);

  /**
   * Resolve `target` to registered player ids.
   *
   * kAll yields every player; kList and kSingle keep only ids that name a
   * registered player. Duplicates are dropped, order is preserved.
   */
  std::vector<std::string> ResolveTargets(const TargetSpec& target) const;

  /// Forward `command` unchanged to every resolved player.
  DispatchReport Dispatch(const Command& command);
  /// Send an arbitrary message to the players `target` resolves to.
  DispatchReport DispatchMessage(const TargetSpec& target, const Message& message);

  DispatchReport BroadcastToControllers(const Message& message);
  bool SendTo(const std::string& device_id, const Message& message,
              std::string* error = nullptr);

 private:
  DispatchReport Deliver(const std::vector<std::string>& device_ids,
                         const Message& message);

  DeviceRegistry& registry_;
  LogCallback log_callback_;
};

}  // namespace playlink
