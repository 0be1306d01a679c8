#pragma once

#include "playlink/device_registry.h"
#include "playlink/message.h"
#include "playlink/observer.h"
#include "playlink/types.h"

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace playlink {

enum class TransferState {
  kPending,
  kDownloading,
  kCompleted,
  kFailed,
};

const char* ToString(TransferState state);

/**
 * One bulk payload offered to one player.
 */
struct Transfer {
  std::string id;
  std::string filename;
  std::string target_device_id;
  /// Resolved path of the file on the hub host.
  std::string source_path;
  uint64_t total_bytes = 0;
  /// Highest file offset confirmed delivered.
  uint64_t bytes_transferred = 0;
  TransferState state = TransferState::kPending;
  /// Failure cause; "cancelled" when superseded or cancelled.
  std::string error;
  int64_t start_time_ms = 0;
  int64_t end_time_ms = 0;

  bool finished() const {
    return state == TransferState::kCompleted || state == TransferState::kFailed;
  }
};

/// Inclusive byte range within a file.
struct ByteRange {
  uint64_t start = 0;
  uint64_t end = 0;

  uint64_t length() const { return end - start + 1; }
};

/**
 * Parse an HTTP Range header value against a file of `file_size` bytes.
 *
 * Accepts `bytes=a-b`, `bytes=a-` and `bytes=-n`. An end past EOF is clamped
 * to the last byte. Multiple ranges are not supported.
 *
 * @return false if the header is malformed or unsatisfiable.
 */
bool ParseRangeHeader(const std::string& value, uint64_t file_size, ByteRange* out,
                      std::string* error = nullptr);

/// `bytes a-b/size`, the Content-Range value for a partial response.
std::string FormatContentRange(const ByteRange& range, uint64_t file_size);

struct TransferConfig {
  /// Directory offered files must live under.
  std::string media_root = ".";
  size_t chunk_size = kDefaultChunkSize;
  /// Finished transfers kept for History(); oldest dropped first.
  size_t history_limit = 32;
  LogCallback log_callback;

  bool Validate(std::string* error = nullptr) const;
};

struct OfferResult {
  bool ok = false;
  std::string error;
  std::string transfer_id;
  /// `/download/<id>/<filename>` relative to the byte-stream endpoint.
  std::string download_path;
  uint64_t file_size = 0;
  /// Set when an active transfer to the same device was cancelled.
  std::string cancelled_transfer_id;
};

/// Receives file bytes in order; returns false once the receiver is gone.
using ChunkSink = std::function<bool(const char* data, size_t length)>;

struct StreamResult {
  bool ok = false;
  std::string error;
  uint64_t bytes_sent = 0;
};

enum class TransferEventType {
  kStarted,
  kProgress,
  kCompleted,
  kFailed,
};

struct TransferEvent {
  TransferEventType type = TransferEventType::kStarted;
  Transfer transfer;
};

/**
 * Owns the transfer table: offers, streams, cancels and archives transfers.
 *
 * At most one transfer per device is active; a newer offer to the same device
 * cancels the older one first. Streaming reads the source file in
 * `chunk_size` pieces and only counts a chunk once the sink has accepted it.
 * Progress events fire at whole-percent steps.
 */
class TransferCoordinator {
 public:
  /// `registry` is optional; when set, offers must target a registered player.
  explicit TransferCoordinator(TransferConfig config,
                               const DeviceRegistry* registry = nullptr);

  TransferCoordinator(const TransferCoordinator&) = delete;
  TransferCoordinator& operator=(const TransferCoordinator&) = delete;

  /**
   * Create a pending transfer of `source_path` to `target_device_id`.
   *
   * @param source_path File to send; relative paths resolve against media_root.
   * @param filename Name the receiver should store the file as; defaults to
   *        the source's basename when empty.
   */
  OfferResult Offer(const std::string& source_path, const std::string& filename,
                    const std::string& target_device_id);

  /**
   * Stream the transfer's bytes, or `range` of them, into `sink`.
   *
   * Marks the transfer failed if the sink rejects a chunk, the file cannot be
   * read, or the transfer is cancelled mid-stream. Delivering the file's last
   * byte marks it completed.
   */
  StreamResult Stream(const std::string& transfer_id,
                      const std::optional<ByteRange>& range, const ChunkSink& sink);

  /**
   * Apply a player's own transferProgress report. Terminal statuses finish the
   * transfer. Does not publish events; the caller relays the report.
   *
   * @return false if no transfer of `device_id` matches the report.
   */
  bool ApplyReceiverProgress(const std::string& device_id,
                             const TransferProgressMessage& report);

  bool Cancel(const std::string& transfer_id, const std::string& reason = "cancelled");
  /// Cancel the device's active transfer, if any. Returns its id or "".
  std::string CancelForDevice(const std::string& device_id,
                              const std::string& reason = "cancelled");

  /// Active or archived transfer by id.
  std::optional<Transfer> Find(const std::string& transfer_id) const;
  std::optional<Transfer> ActiveFor(const std::string& device_id) const;
  std::vector<Transfer> Active() const;
  /// Finished transfers, oldest first.
  std::vector<Transfer> History() const;

  const TransferConfig& config() const { return config_; }
  ObserverList<TransferEvent>& events() { return events_; }

 private:
  struct Entry {
    Transfer transfer;
    std::shared_ptr<std::atomic<bool>> cancelled;
    int last_percent = -1;
  };

  std::string NextId();
  bool ResolveSource(const std::string& source_path, std::string* resolved,
                     uint64_t* size, std::string* error) const;
  // Moves an active transfer to history. Caller holds mutex_.
  Transfer ArchiveLocked(std::unordered_map<std::string, Entry>::iterator it,
                         TransferState state, const std::string& error);
  void Finish(const std::string& transfer_id, TransferState state,
              const std::string& error, bool publish);
  void RecordDelivered(const std::string& transfer_id, uint64_t offset);
  void Publish(const TransferEvent& event);

  TransferConfig config_;
  const DeviceRegistry* registry_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> active_;
  std::deque<Transfer> history_;
  uint64_t next_sequence_ = 0;
  ObserverList<TransferEvent> events_;
};

}  // namespace playlink
