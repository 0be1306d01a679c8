#pragma once

#include "playlink/observer.h"
#include "playlink/transport.h"
#include "playlink/types.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace playlink {

/**
 * Published when a session missed a full heartbeat interval and was closed.
 */
struct HeartbeatEviction {
  std::string session_id;
  /// Empty if the session never registered.
  std::string device_id;
};

/**
 * Detects dead sessions with a single ticking loop.
 *
 * Each tick closes every tracked session whose alive flag is still clear from
 * the previous tick, then clears the flag on the survivors and sends them a
 * `ping`. A `pong` (RecordPong) sets the flag again. A dead peer is therefore
 * evicted after at most two intervals.
 */
class HeartbeatMonitor {
 public:
  explicit HeartbeatMonitor(std::chrono::milliseconds interval,
                            LogCallback log_callback = nullptr);
  ~HeartbeatMonitor();

  HeartbeatMonitor(const HeartbeatMonitor&) = delete;
  HeartbeatMonitor& operator=(const HeartbeatMonitor&) = delete;

  /// Start tracking; the entry is dropped automatically when the session closes.
  void Track(const std::shared_ptr<Session>& session);
  void Untrack(const std::string& session_id);
  /// Returns false if the session is not tracked.
  bool RecordPong(const std::string& session_id);

  /**
   * Run one heartbeat round now.
   *
   * @return Ids of the sessions evicted by this round.
   */
  std::vector<std::string> Tick();

  /// Start the background loop. Returns true if already running.
  bool Start();
  /// Stop the loop; cancels the pending wait immediately.
  void Stop();
  bool running() const { return running_.load(); }

  size_t tracked_count() const;
  std::chrono::milliseconds interval() const { return interval_; }

  ObserverList<HeartbeatEviction>& evictions() { return evictions_; }

 private:
  struct State;

  void Loop();

  const std::chrono::milliseconds interval_;
  LogCallback log_callback_;
  std::shared_ptr<State> state_;
  ObserverList<HeartbeatEviction> evictions_;

  std::atomic<bool> running_{false};
  std::mutex loop_mutex_;
  std::condition_variable loop_cv_;
  std::thread thread_;
};

}  // namespace playlink
