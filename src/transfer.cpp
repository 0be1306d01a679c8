#include "playlink/transfer.h"

#include "log.h"
#include "url.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <utility>

namespace playlink {
namespace {

namespace fs = std::filesystem;

bool Fail(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
  return false;
}

bool ParseDecimal(const std::string& text, uint64_t* out) {
  if (text.empty() || text.size() > 19) {
    return false;
  }
  uint64_t value = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    value = value * 10 + static_cast<uint64_t>(c - '0');
  }
  *out = value;
  return true;
}

std::string Trim(const std::string& text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(begin, end - begin);
}

// True if `candidate` equals `root` or lies beneath it. Both canonical.
bool IsWithin(const fs::path& root, const fs::path& candidate) {
  auto c = candidate.begin();
  for (auto r = root.begin(); r != root.end(); ++r, ++c) {
    if (r->empty()) {
      continue;
    }
    if (c == candidate.end() || *r != *c) {
      return false;
    }
  }
  return true;
}

bool IsValidFilename(const std::string& filename) {
  if (filename.empty() || filename == "." || filename == "..") {
    return false;
  }
  for (unsigned char c : filename) {
    if (c == '/' || c == '\\' || c < 0x20) {
      return false;
    }
  }
  return true;
}

}  // namespace

const char* ToString(TransferState state) {
  switch (state) {
    case TransferState::kPending:
      return "pending";
    case TransferState::kDownloading:
      return "downloading";
    case TransferState::kCompleted:
      return "completed";
    case TransferState::kFailed:
      return "failed";
  }
  return "failed";
}

bool ParseRangeHeader(const std::string& value, uint64_t file_size, ByteRange* out,
                      std::string* error) {
  if (!out) {
    return Fail(error, "no output range");
  }
  const std::string text = Trim(value);
  const std::string prefix = "bytes=";
  if (text.compare(0, prefix.size(), prefix) != 0) {
    return Fail(error, "unsupported range unit");
  }
  const std::string spec = Trim(text.substr(prefix.size()));
  if (spec.find(',') != std::string::npos) {
    return Fail(error, "multiple ranges are not supported");
  }
  const size_t dash = spec.find('-');
  if (dash == std::string::npos) {
    return Fail(error, "malformed range: " + value);
  }
  const std::string first = Trim(spec.substr(0, dash));
  const std::string last = Trim(spec.substr(dash + 1));

  ByteRange range;
  if (first.empty()) {
    uint64_t suffix = 0;
    if (!ParseDecimal(last, &suffix)) {
      return Fail(error, "malformed range: " + value);
    }
    if (suffix == 0 || file_size == 0) {
      return Fail(error, "range not satisfiable");
    }
    range.start = suffix >= file_size ? 0 : file_size - suffix;
    range.end = file_size - 1;
  } else {
    if (!ParseDecimal(first, &range.start)) {
      return Fail(error, "malformed range: " + value);
    }
    if (range.start >= file_size) {
      return Fail(error, "range not satisfiable");
    }
    if (last.empty()) {
      range.end = file_size - 1;
    } else {
      if (!ParseDecimal(last, &range.end)) {
        return Fail(error, "malformed range: " + value);
      }
      if (range.end < range.start) {
        return Fail(error, "range end precedes start");
      }
      range.end = std::min(range.end, file_size - 1);
    }
  }
  *out = range;
  return true;
}

std::string FormatContentRange(const ByteRange& range, uint64_t file_size) {
  std::ostringstream oss;
  oss << "bytes " << range.start << "-" << range.end << "/" << file_size;
  return oss.str();
}

bool TransferConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (media_root.empty()) {
    return fail("media_root must not be empty");
  }
  if (chunk_size == 0) {
    return fail("chunk_size must be positive");
  }
  if (history_limit == 0) {
    return fail("history_limit must be positive");
  }
  return true;
}

TransferCoordinator::TransferCoordinator(TransferConfig config,
                                         const DeviceRegistry* registry)
    : config_(std::move(config)), registry_(registry) {}

std::string TransferCoordinator::NextId() {
  static thread_local std::mt19937 generator{std::random_device{}()};
  std::uniform_int_distribution<uint32_t> distribution;
  std::ostringstream oss;
  oss << "t" << std::hex << distribution(generator) << "-" << std::dec
      << ++next_sequence_;
  return oss.str();
}

bool TransferCoordinator::ResolveSource(const std::string& source_path,
                                        std::string* resolved, uint64_t* size,
                                        std::string* error) const {
  std::error_code ec;
  const fs::path root = fs::weakly_canonical(fs::path(config_.media_root), ec);
  if (ec) {
    return Fail(error, "media root unavailable: " + config_.media_root);
  }
  fs::path candidate(source_path);
  if (candidate.is_relative()) {
    candidate = root / candidate;
  }
  candidate = fs::weakly_canonical(candidate, ec);
  if (ec || !IsWithin(root, candidate)) {
    return Fail(error, "source path escapes media root: " + source_path);
  }
  if (!fs::is_regular_file(candidate, ec)) {
    return Fail(error, "source is not a regular file: " + source_path);
  }
  const uintmax_t file_size = fs::file_size(candidate, ec);
  if (ec) {
    return Fail(error, "cannot stat source: " + source_path);
  }
  std::ifstream readable(candidate, std::ios::binary);
  if (!readable) {
    return Fail(error, "source is not readable: " + source_path);
  }
  *resolved = candidate.string();
  *size = static_cast<uint64_t>(file_size);
  return true;
}

OfferResult TransferCoordinator::Offer(const std::string& source_path,
                                       const std::string& filename,
                                       const std::string& target_device_id) {
  OfferResult result;
  if (target_device_id.empty()) {
    result.error = "target device must not be empty";
    return result;
  }
  if (registry_) {
    auto record = registry_->Find(target_device_id);
    if (!record || record->role != Role::kPlayer) {
      result.error = "unknown player: " + target_device_id;
      return result;
    }
  }
  std::string resolved;
  uint64_t size = 0;
  if (!ResolveSource(source_path, &resolved, &size, &result.error)) {
    return result;
  }
  const std::string name =
      filename.empty() ? fs::path(resolved).filename().string() : filename;
  if (!IsValidFilename(name)) {
    result.error = "invalid filename: " + name;
    return result;
  }

  std::vector<TransferEvent> events;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = active_.begin(); it != active_.end(); ++it) {
      if (it->second.transfer.target_device_id == target_device_id) {
        result.cancelled_transfer_id = it->first;
        events.push_back({TransferEventType::kFailed,
                          ArchiveLocked(it, TransferState::kFailed, "cancelled")});
        break;
      }
    }
    Entry entry;
    entry.transfer.id = NextId();
    entry.transfer.filename = name;
    entry.transfer.target_device_id = target_device_id;
    entry.transfer.source_path = resolved;
    entry.transfer.total_bytes = size;
    entry.transfer.start_time_ms = NowMillis();
    entry.cancelled = std::make_shared<std::atomic<bool>>(false);
    result.transfer_id = entry.transfer.id;
    events.push_back({TransferEventType::kStarted, entry.transfer});
    active_.emplace(entry.transfer.id, std::move(entry));
  }

  result.ok = true;
  result.file_size = size;
  result.download_path =
      "/download/" + result.transfer_id + "/" + internal::PercentEncode(name);
  if (!result.cancelled_transfer_id.empty()) {
    internal::Log(config_.log_callback,
                  "transfer " + result.cancelled_transfer_id + " to " +
                      target_device_id + " superseded by " + result.transfer_id);
  }
  for (const auto& event : events) {
    Publish(event);
  }
  return result;
}

StreamResult TransferCoordinator::Stream(const std::string& transfer_id,
                                         const std::optional<ByteRange>& range,
                                         const ChunkSink& sink) {
  StreamResult result;
  std::string source_path;
  uint64_t total = 0;
  std::shared_ptr<std::atomic<bool>> cancelled;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(transfer_id);
    if (it == active_.end()) {
      result.error = "unknown or finished transfer: " + transfer_id;
      return result;
    }
    Transfer& transfer = it->second.transfer;
    transfer.state = TransferState::kDownloading;
    source_path = transfer.source_path;
    total = transfer.total_bytes;
    cancelled = it->second.cancelled;
  }

  if (total == 0) {
    Finish(transfer_id, TransferState::kCompleted, {}, true);
    result.ok = true;
    return result;
  }

  ByteRange span{0, total - 1};
  if (range) {
    if (range->start > range->end || range->end >= total) {
      result.error = "range outside file";
      return result;
    }
    span = *range;
  }

  std::ifstream file(source_path, std::ios::binary);
  if (!file) {
    result.error = "cannot open source file: " + source_path;
    Finish(transfer_id, TransferState::kFailed, result.error, true);
    return result;
  }
  file.seekg(static_cast<std::streamoff>(span.start));
  if (!file) {
    result.error = "seek failed in source file";
    Finish(transfer_id, TransferState::kFailed, result.error, true);
    return result;
  }

  std::vector<char> buffer(config_.chunk_size);
  uint64_t offset = span.start;
  uint64_t remaining = span.length();
  while (remaining > 0) {
    if (cancelled->load()) {
      result.error = "cancelled";
      return result;
    }
    const size_t want =
        static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
    file.read(buffer.data(), static_cast<std::streamsize>(want));
    const size_t got = static_cast<size_t>(file.gcount());
    if (got == 0) {
      result.error = "unexpected end of source file";
      Finish(transfer_id, TransferState::kFailed, result.error, true);
      return result;
    }
    if (!sink(buffer.data(), got)) {
      result.error = "receiver disconnected";
      Finish(transfer_id, TransferState::kFailed, result.error, true);
      return result;
    }
    offset += got;
    remaining -= got;
    result.bytes_sent += got;
    RecordDelivered(transfer_id, offset);
  }

  if (span.end == total - 1) {
    Finish(transfer_id, TransferState::kCompleted, {}, true);
  }
  result.ok = true;
  return result;
}

bool TransferCoordinator::ApplyReceiverProgress(const std::string& device_id,
                                                const TransferProgressMessage& report) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto match = active_.end();
  for (auto it = active_.begin(); it != active_.end(); ++it) {
    const Transfer& transfer = it->second.transfer;
    if (transfer.target_device_id != device_id) {
      continue;
    }
    if (!report.transfer_id.empty() ? transfer.id == report.transfer_id
                                    : transfer.filename == report.filename) {
      match = it;
      break;
    }
  }
  if (match == active_.end()) {
    // Late reports for transfers the sender already finished still match.
    return std::any_of(history_.begin(), history_.end(), [&](const Transfer& t) {
      return t.target_device_id == device_id &&
             (!report.transfer_id.empty() ? t.id == report.transfer_id
                                          : t.filename == report.filename);
    });
  }
  switch (report.status) {
    case TransferStatus::kStarted:
    case TransferStatus::kDownloading:
      match->second.transfer.state = TransferState::kDownloading;
      match->second.transfer.bytes_transferred = std::max(
          match->second.transfer.bytes_transferred,
          std::min(report.bytes_transferred, match->second.transfer.total_bytes));
      break;
    case TransferStatus::kCompleted:
      ArchiveLocked(match, TransferState::kCompleted, {});
      break;
    case TransferStatus::kFailed:
      ArchiveLocked(match, TransferState::kFailed,
                    report.error.empty() ? "failed on receiver" : report.error);
      break;
  }
  return true;
}

bool TransferCoordinator::Cancel(const std::string& transfer_id,
                                 const std::string& reason) {
  Transfer cancelled;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(transfer_id);
    if (it == active_.end()) {
      return false;
    }
    cancelled = ArchiveLocked(it, TransferState::kFailed, reason);
  }
  Publish({TransferEventType::kFailed, std::move(cancelled)});
  return true;
}

std::string TransferCoordinator::CancelForDevice(const std::string& device_id,
                                                 const std::string& reason) {
  std::string transfer_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : active_) {
      if (entry.second.transfer.target_device_id == device_id) {
        transfer_id = entry.first;
        break;
      }
    }
  }
  if (transfer_id.empty() || !Cancel(transfer_id, reason)) {
    return {};
  }
  return transfer_id;
}

std::optional<Transfer> TransferCoordinator::Find(const std::string& transfer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = active_.find(transfer_id);
  if (it != active_.end()) {
    return it->second.transfer;
  }
  for (auto h = history_.rbegin(); h != history_.rend(); ++h) {
    if (h->id == transfer_id) {
      return *h;
    }
  }
  return std::nullopt;
}

std::optional<Transfer> TransferCoordinator::ActiveFor(const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& entry : active_) {
    if (entry.second.transfer.target_device_id == device_id) {
      return entry.second.transfer;
    }
  }
  return std::nullopt;
}

std::vector<Transfer> TransferCoordinator::Active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Transfer> result;
  result.reserve(active_.size());
  for (const auto& entry : active_) {
    result.push_back(entry.second.transfer);
  }
  std::sort(result.begin(), result.end(), [](const Transfer& a, const Transfer& b) {
    return a.start_time_ms < b.start_time_ms;
  });
  return result;
}

std::vector<Transfer> TransferCoordinator::History() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<Transfer>(history_.begin(), history_.end());
}

Transfer TransferCoordinator::ArchiveLocked(
    std::unordered_map<std::string, Entry>::iterator it, TransferState state,
    const std::string& error) {
  Entry entry = std::move(it->second);
  active_.erase(it);
  entry.cancelled->store(true);
  entry.transfer.state = state;
  entry.transfer.error = error;
  entry.transfer.end_time_ms = NowMillis();
  if (state == TransferState::kCompleted) {
    entry.transfer.bytes_transferred = entry.transfer.total_bytes;
  }
  history_.push_back(entry.transfer);
  while (history_.size() > config_.history_limit) {
    history_.pop_front();
  }
  return entry.transfer;
}

void TransferCoordinator::Finish(const std::string& transfer_id, TransferState state,
                                 const std::string& error, bool publish) {
  Transfer finished;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(transfer_id);
    if (it == active_.end()) {
      return;
    }
    finished = ArchiveLocked(it, state, error);
  }
  if (state == TransferState::kFailed) {
    internal::Log(config_.log_callback,
                  "transfer " + transfer_id + " failed: " + error);
  }
  if (publish) {
    Publish({state == TransferState::kCompleted ? TransferEventType::kCompleted
                                                : TransferEventType::kFailed,
             std::move(finished)});
  }
}

void TransferCoordinator::RecordDelivered(const std::string& transfer_id,
                                          uint64_t offset) {
  std::optional<Transfer> progress;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(transfer_id);
    if (it == active_.end()) {
      return;
    }
    Transfer& transfer = it->second.transfer;
    transfer.bytes_transferred = std::max(transfer.bytes_transferred, offset);
    const int percent =
        transfer.total_bytes == 0
            ? 100
            : static_cast<int>(transfer.bytes_transferred * 100 / transfer.total_bytes);
    if (percent != it->second.last_percent) {
      it->second.last_percent = percent;
      progress = transfer;
    }
  }
  if (progress) {
    Publish({TransferEventType::kProgress, std::move(*progress)});
  }
}

void TransferCoordinator::Publish(const TransferEvent& event) {
  const size_t failures = events_.Publish(event);
  internal::LogCallbackError(config_.log_callback, "TransferEvent", failures);
}

}  // namespace playlink
