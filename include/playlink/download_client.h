#pragma once

#include "playlink/observer.h"
#include "playlink/types.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace playlink {

struct DownloadConfig {
  /// Directory completed files are stored in; created on demand.
  std::string directory = "downloads";
  /// Bound on connecting and on each wait for response bytes.
  std::chrono::milliseconds readiness_timeout{30000};
  size_t chunk_size = 64 * 1024;
  size_t history_limit = 32;
  LogCallback log_callback;

  bool Validate(std::string* error = nullptr) const;
};

/**
 * One download as the receiver tracks it.
 */
struct DownloadRecord {
  std::string transfer_id;
  std::string filename;
  std::string url;
  TransferStatus status = TransferStatus::kStarted;
  uint64_t bytes_downloaded = 0;
  uint64_t total_bytes = 0;
  /// Final location, set once completed.
  std::string saved_path;
  std::string error;
  int64_t start_time_ms = 0;
  int64_t end_time_ms = 0;

  double progress() const {
    return total_bytes == 0 ? 0.0
                            : static_cast<double>(bytes_downloaded) /
                                  static_cast<double>(total_bytes);
  }
};

/**
 * Receiver side of a bulk transfer.
 *
 * Fetches one URL at a time on a worker thread; starting a new download
 * cancels the one in flight (last request wins). Bytes land in
 * `<directory>/<filename>.part`; an existing partial file is resumed with a
 * Range request. Only a complete file is renamed into place, as
 * `<filename>` or, if taken, `<name>_1.<ext>`, `<name>_2.<ext>`, ...
 */
class DownloadClient {
 public:
  explicit DownloadClient(DownloadConfig config);
  ~DownloadClient();

  DownloadClient(const DownloadClient&) = delete;
  DownloadClient& operator=(const DownloadClient&) = delete;

  /**
   * Begin downloading `url` as `filename`.
   *
   * @param expected_size Size announced by the sender; 0 if unknown.
   * @param transfer_id Echoed in progress reports.
   * @return false if the arguments are invalid; download failures are
   *         reported through progress() instead.
   */
  bool Start(const std::string& url, const std::string& filename,
             uint64_t expected_size, const std::string& transfer_id = {},
             std::string* error = nullptr);

  /// Cancel the download in flight, keeping its partial file for resumption.
  void Cancel();

  bool IsDownloading() const;
  std::optional<DownloadRecord> Current() const;
  /// Finished downloads, oldest first.
  std::vector<DownloadRecord> History() const;

  /// Started, whole-percent progress, completed and failed updates.
  ObserverList<DownloadRecord>& progress() { return progress_; }

 private:
  struct Job;

  void Run(std::shared_ptr<Job> job);
  bool Fetch(Job& job, std::string* error);
  void Report(Job& job);
  void Finish(Job& job, TransferStatus status, const std::string& error);
  void StopWorker();

  DownloadConfig config_;
  ObserverList<DownloadRecord> progress_;

  mutable std::mutex mutex_;
  std::shared_ptr<Job> current_;
  std::deque<DownloadRecord> history_;
  std::thread worker_;
  // Workers that cancelled themselves from a progress callback.
  std::vector<std::thread> retired_workers_;
};

/// Replace path separators and control characters so `filename` stays a
/// single path component.
std::string SanitizeFilename(const std::string& filename);

/// First of `dir/name.ext`, `dir/name_1.ext`, `dir/name_2.ext`, ... that
/// does not exist.
std::string UniqueDestinationPath(const std::string& directory,
                                  const std::string& filename);

}  // namespace playlink
