#pragma once

#include "playlink/types.h"

#include <string>

namespace playlink {
namespace internal {

// Route a diagnostic line to `log_callback`, or stderr when it is unset.
void Log(const LogCallback& log_callback, const std::string& message);

// Report an observer or user callback that threw.
void LogCallbackError(const LogCallback& log_callback, const char* name,
                      size_t failures);

}  // namespace internal
}  // namespace playlink
