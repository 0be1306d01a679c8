#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace playlink {

/**
 * Thread-safe list of callbacks for one event type.
 *
 * Callbacks are copied under the lock and invoked after it is released, so a
 * callback may subscribe, unsubscribe, or publish without deadlocking.
 * An exception thrown by one callback does not prevent the others from
 * running.
 */
template <typename Event>
class ObserverList {
 public:
  using Callback = std::function<void(const Event&)>;
  using Token = uint64_t;

  /// Returns a token for Unsubscribe(); 0 is never issued.
  Token Subscribe(Callback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    const Token token = ++next_token_;
    entries_.emplace_back(token, std::move(cb));
    return token;
  }

  bool Unsubscribe(Token token) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
      if (it->first == token) {
        entries_.erase(it);
        return true;
      }
    }
    return false;
  }

  /**
   * Deliver `event` to every subscriber.
   *
   * @return Number of callbacks that threw.
   */
  size_t Publish(const Event& event) const {
    std::vector<std::pair<Token, Callback>> copy;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      copy = entries_;
    }
    size_t failures = 0;
    for (const auto& entry : copy) {
      if (!entry.second) {
        continue;
      }
      try {
        entry.second(event);
      } catch (...) {
        ++failures;
      }
    }
    return failures;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::vector<std::pair<Token, Callback>> entries_;
  Token next_token_ = 0;
};

}  // namespace playlink
