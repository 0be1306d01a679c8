#include "log.h"

#include <exception>
#include <iostream>
#include <sstream>

namespace playlink {
namespace internal {

void Log(const LogCallback& log_callback, const std::string& message) {
  if (log_callback) {
    try {
      log_callback(message);
      return;
    } catch (const std::exception& ex) {
      std::cerr << "[playlink] log callback threw: " << ex.what() << std::endl;
    }
  }
  std::cerr << "[playlink] " << message << std::endl;
}

void LogCallbackError(const LogCallback& log_callback, const char* name,
                      size_t failures) {
  if (failures == 0) {
    return;
  }
  std::ostringstream oss;
  oss << "callback threw exception: " << name;
  if (failures > 1) {
    oss << " (" << failures << " callbacks)";
  }
  Log(log_callback, oss.str());
}

}  // namespace internal
}  // namespace playlink
