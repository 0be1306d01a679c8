#include "playlink/download_client.h"

#include "log.h"
#include "net_util.h"
#include "url.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <utility>

#include <sys/socket.h>

namespace playlink {
namespace {

namespace fs = std::filesystem;

constexpr std::chrono::milliseconds kCancelPoll{200};

// Closes a socket descriptor on scope exit.
class ScopedFd {
 public:
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd() { internal::CloseFd(fd_); }
  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;
  int get() const { return fd_; }

 private:
  int fd_;
};

struct ResponseHead {
  int status = 0;
  std::map<std::string, std::string> headers;
};

bool ParseResponseHead(const std::string& head, ResponseHead* out) {
  std::istringstream stream(head);
  std::string line;
  if (!std::getline(stream, line)) {
    return false;
  }
  std::istringstream status_line(line);
  std::string version;
  if (!(status_line >> version >> out->status) ||
      version.compare(0, 5, "HTTP/") != 0) {
    return false;
  }
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      break;
    }
    const size_t colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    std::string name = line.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::string value = line.substr(colon + 1);
    value.erase(0, value.find_first_not_of(" \t"));
    out->headers[name] = value;
  }
  return true;
}

// Parses "bytes a-b/total" into its start and total.
bool ParseContentRange(const std::string& value, uint64_t* start, uint64_t* total) {
  unsigned long long a = 0;
  unsigned long long b = 0;
  unsigned long long size = 0;
  if (std::sscanf(value.c_str(), "bytes %llu-%llu/%llu", &a, &b, &size) != 3) {
    return false;
  }
  *start = a;
  *total = size;
  return true;
}

}  // namespace

struct DownloadClient::Job {
  DownloadRecord record;
  uint64_t expected_size = 0;
  std::atomic<bool> cancelled{false};
  int last_percent = -1;
};

bool DownloadConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (directory.empty()) {
    return fail("directory must not be empty");
  }
  if (readiness_timeout.count() <= 0) {
    return fail("readiness_timeout must be positive");
  }
  if (chunk_size == 0) {
    return fail("chunk_size must be positive");
  }
  if (history_limit == 0) {
    return fail("history_limit must be positive");
  }
  return true;
}

std::string SanitizeFilename(const std::string& filename) {
  std::string result;
  result.reserve(filename.size());
  for (unsigned char c : filename) {
    result.push_back(c == '/' || c == '\\' || c < 0x20 ? '_' : static_cast<char>(c));
  }
  if (result == "." || result == "..") {
    result.clear();
  }
  return result;
}

std::string UniqueDestinationPath(const std::string& directory,
                                  const std::string& filename) {
  const fs::path dir(directory);
  fs::path candidate = dir / filename;
  std::error_code ec;
  if (!fs::exists(candidate, ec)) {
    return candidate.string();
  }
  const fs::path name(filename);
  const std::string stem = name.stem().string();
  const std::string ext = name.extension().string();
  for (int counter = 1;; ++counter) {
    candidate = dir / (stem + "_" + std::to_string(counter) + ext);
    if (!fs::exists(candidate, ec)) {
      return candidate.string();
    }
  }
}

DownloadClient::DownloadClient(DownloadConfig config) : config_(std::move(config)) {}

DownloadClient::~DownloadClient() {
  StopWorker();
  // Left only when a progress callback destroys its own client.
  for (auto& worker : retired_workers_) {
    worker.detach();
  }
}

bool DownloadClient::Start(const std::string& url, const std::string& filename,
                           uint64_t expected_size, const std::string& transfer_id,
                           std::string* error) {
  auto fail = [&](const std::string& message) {
    internal::Log(config_.log_callback, message);
    if (error) {
      *error = message;
    }
    return false;
  };
  std::string message;
  if (!config_.Validate(&message)) {
    return fail(message);
  }
  internal::HttpUrl parsed;
  if (!internal::ParseHttpUrl(url, &parsed, &message)) {
    return fail(message);
  }
  const std::string name = SanitizeFilename(filename);
  if (name.empty()) {
    return fail("invalid filename: " + filename);
  }

  if (IsDownloading()) {
    internal::Log(config_.log_callback,
                  "cancelling previous download to start " + name);
  }
  StopWorker();

  auto job = std::make_shared<Job>();
  job->record.transfer_id = transfer_id;
  job->record.filename = name;
  job->record.url = url;
  job->record.total_bytes = expected_size;
  job->record.start_time_ms = NowMillis();
  job->expected_size = expected_size;

  std::lock_guard<std::mutex> lock(mutex_);
  current_ = job;
  try {
    worker_ = std::thread([this, job]() { Run(job); });
  } catch (const std::exception& ex) {
    current_.reset();
    return fail(std::string("download thread start failed: ") + ex.what());
  }
  return true;
}

void DownloadClient::Cancel() { StopWorker(); }

bool DownloadClient::IsDownloading() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_ != nullptr;
}

std::optional<DownloadRecord> DownloadClient::Current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!current_) {
    return std::nullopt;
  }
  return current_->record;
}

std::vector<DownloadRecord> DownloadClient::History() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<DownloadRecord>(history_.begin(), history_.end());
}

void DownloadClient::StopWorker() {
  std::thread worker;
  std::vector<std::thread> finished;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_) {
      current_->cancelled.store(true);
    }
    worker = std::move(worker_);
    if (worker.joinable() && worker.get_id() == std::this_thread::get_id()) {
      // Called from a progress callback; joined by a later StopWorker().
      retired_workers_.push_back(std::move(worker));
    }
    for (auto it = retired_workers_.begin(); it != retired_workers_.end();) {
      if (it->get_id() == std::this_thread::get_id()) {
        ++it;
        continue;
      }
      finished.push_back(std::move(*it));
      it = retired_workers_.erase(it);
    }
  }
  if (worker.joinable()) {
    worker.join();
  }
  for (auto& retired : finished) {
    retired.join();
  }
}

void DownloadClient::Run(std::shared_ptr<Job> job) {
  Report(*job);
  std::string error;
  if (Fetch(*job, &error)) {
    Finish(*job, TransferStatus::kCompleted, {});
  } else {
    Finish(*job, TransferStatus::kFailed, error);
  }
}

bool DownloadClient::Fetch(Job& job, std::string* error) {
  auto fail = [&](const std::string& message) {
    *error = message;
    return false;
  };
  internal::HttpUrl url;
  if (!internal::ParseHttpUrl(job.record.url, &url, error)) {
    return false;
  }

  std::error_code ec;
  const fs::path dir(config_.directory);
  fs::create_directories(dir, ec);
  if (ec) {
    return fail("cannot create " + config_.directory + ": " + ec.message());
  }
  const fs::path part = dir / (job.record.filename + ".part");
  uint64_t resume_from = 0;
  if (fs::is_regular_file(part, ec)) {
    resume_from = static_cast<uint64_t>(fs::file_size(part, ec));
    if (ec || (job.expected_size > 0 && resume_from >= job.expected_size)) {
      fs::remove(part, ec);
      resume_from = 0;
    }
  }

  std::string connect_error;
  const int raw_fd =
      internal::ConnectTcp(url.host, url.port, config_.readiness_timeout, &connect_error);
  if (raw_fd < 0) {
    return fail(connect_error);
  }
  ScopedFd fd(raw_fd);

  std::ostringstream request;
  request << "GET " << url.path << " HTTP/1.1\r\n"
          << "Host: " << url.host << ":" << url.port << "\r\n";
  if (resume_from > 0) {
    request << "Range: bytes=" << resume_from << "-\r\n";
  }
  request << "Connection: close\r\n\r\n";
  const std::string request_text = request.str();
  if (!internal::SendAll(fd.get(), request_text.data(), request_text.size(), error)) {
    return false;
  }

  // Reads into `buffer`, waiting at most readiness_timeout. 0 means EOF.
  std::vector<char> buffer(config_.chunk_size);
  auto read_some = [&](ssize_t* bytes) -> bool {
    const auto deadline = std::chrono::steady_clock::now() + config_.readiness_timeout;
    while (!job.cancelled.load()) {
      if (std::chrono::steady_clock::now() >= deadline) {
        *error = "timed out waiting for data";
        return false;
      }
      const int ready = internal::WaitReadable(fd.get(), kCancelPoll);
      if (ready < 0) {
        *error = internal::ErrnoString("select()");
        return false;
      }
      if (ready == 0) {
        continue;
      }
      *bytes = ::recv(fd.get(), buffer.data(), buffer.size(), 0);
      if (*bytes < 0) {
        if (errno == EINTR) {
          continue;
        }
        *error = internal::ErrnoString("recv()");
        return false;
      }
      return true;
    }
    *error = "cancelled";
    return false;
  };

  std::string head;
  size_t end_of_head = std::string::npos;
  while (end_of_head == std::string::npos) {
    ssize_t bytes = 0;
    if (!read_some(&bytes)) {
      return false;
    }
    if (bytes == 0) {
      return fail("connection closed before response headers");
    }
    head.append(buffer.data(), static_cast<size_t>(bytes));
    end_of_head = head.find("\r\n\r\n");
    if (end_of_head == std::string::npos && head.size() > 64 * 1024) {
      return fail("response headers too large");
    }
  }
  std::string body = head.substr(end_of_head + 4);
  head.resize(end_of_head + 2);

  ResponseHead response;
  if (!ParseResponseHead(head, &response)) {
    return fail("malformed HTTP response");
  }
  if (response.status == 416 && resume_from > 0) {
    // The partial file no longer matches the source.
    fs::remove(part, ec);
    return fail("HTTP Error: 416");
  }
  if (response.status != 200 && response.status != 206) {
    return fail("HTTP Error: " + std::to_string(response.status));
  }

  bool append = false;
  uint64_t total = job.expected_size;
  if (response.status == 206) {
    uint64_t start = 0;
    uint64_t range_total = 0;
    if (!ParseContentRange(response.headers["content-range"], &start, &range_total) ||
        start != resume_from) {
      return fail("unexpected Content-Range in partial response");
    }
    append = true;
    total = range_total;
  }
  bool has_length = false;
  uint64_t body_length = 0;
  auto length_it = response.headers.find("content-length");
  if (length_it != response.headers.end()) {
    char* end = nullptr;
    body_length = std::strtoull(length_it->second.c_str(), &end, 10);
    has_length = end != length_it->second.c_str();
  }
  const uint64_t base = append ? resume_from : 0;
  if (response.status == 200 && has_length) {
    total = body_length;
  }

  std::ofstream out(part, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
  if (!out) {
    return fail("cannot open " + part.string());
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    job.record.total_bytes = total;
    job.record.bytes_downloaded = base;
  }

  uint64_t received = 0;
  auto write_chunk = [&](const char* data, size_t size) -> bool {
    if (has_length) {
      size = static_cast<size_t>(std::min<uint64_t>(size, body_length - received));
    }
    out.write(data, static_cast<std::streamsize>(size));
    if (!out) {
      *error = "write failed: " + part.string();
      return false;
    }
    received += size;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      job.record.status = TransferStatus::kDownloading;
      job.record.bytes_downloaded = base + received;
    }
    Report(job);
    return true;
  };

  if (!body.empty() && !write_chunk(body.data(), body.size())) {
    return false;
  }
  while (!has_length || received < body_length) {
    ssize_t bytes = 0;
    if (!read_some(&bytes)) {
      return false;
    }
    if (bytes == 0) {
      if (has_length) {
        return fail("connection closed before end of file");
      }
      break;
    }
    if (!write_chunk(buffer.data(), static_cast<size_t>(bytes))) {
      return false;
    }
  }
  out.close();
  if (!out) {
    return fail("failed to flush " + part.string());
  }

  const std::string destination =
      UniqueDestinationPath(config_.directory, job.record.filename);
  fs::rename(part, destination, ec);
  if (ec) {
    return fail("failed to move file into place: " + ec.message());
  }
  std::lock_guard<std::mutex> lock(mutex_);
  job.record.saved_path = destination;
  if (!has_length) {
    job.record.total_bytes = base + received;
  }
  return true;
}

void DownloadClient::Report(Job& job) {
  DownloadRecord copy;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const int percent = static_cast<int>(job.record.progress() * 100.0);
    if (job.last_percent >= 0 && percent == job.last_percent) {
      return;
    }
    job.last_percent = percent;
    copy = job.record;
  }
  const size_t failures = progress_.Publish(copy);
  internal::LogCallbackError(config_.log_callback, "DownloadProgress", failures);
}

void DownloadClient::Finish(Job& job, TransferStatus status, const std::string& error) {
  DownloadRecord copy;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    job.record.status = status;
    job.record.error = error;
    job.record.end_time_ms = NowMillis();
    if (status == TransferStatus::kCompleted) {
      job.record.bytes_downloaded = job.record.total_bytes;
    }
    history_.push_back(job.record);
    while (history_.size() > config_.history_limit) {
      history_.pop_front();
    }
    if (current_.get() == &job) {
      current_.reset();
    }
    copy = job.record;
  }
  if (status == TransferStatus::kFailed) {
    internal::Log(config_.log_callback,
                  "download of " + copy.filename + " failed: " + error);
  } else {
    internal::Log(config_.log_callback,
                  "download of " + copy.filename + " saved to " + copy.saved_path);
  }
  const size_t failures = progress_.Publish(copy);
  internal::LogCallbackError(config_.log_callback, "DownloadProgress", failures);
}

}  // namespace playlink
