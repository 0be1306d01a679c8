#include "playlink/transport.h"

#include "log.h"
#include "net_util.h"

#include <array>
#include <cerrno>
#include <condition_variable>
#include <deque>
#include <sstream>

#include <sys/socket.h>

namespace playlink {
namespace {

constexpr size_t kLengthPrefixBytes = 4;
constexpr size_t kReadChunkBytes = 64 * 1024;

// Shared state of an in-process transport pair. Queue i holds frames
// waiting to be received by end i.
struct MemoryChannel {
  std::mutex mutex;
  std::condition_variable cv;
  std::deque<std::string> queues[2];
  bool closed = false;
};

class MemoryTransport : public Transport {
 public:
  MemoryTransport(std::shared_ptr<MemoryChannel> channel, int index,
                  std::string peer)
      : channel_(std::move(channel)), index_(index), peer_(std::move(peer)) {}

  ~MemoryTransport() override { Close(); }

  bool Send(const std::string& frame, std::string* error) override {
    {
      std::lock_guard<std::mutex> lock(channel_->mutex);
      if (channel_->closed) {
        if (error) {
          *error = "transport closed";
        }
        return false;
      }
      channel_->queues[1 - index_].push_back(frame);
    }
    channel_->cv.notify_all();
    return true;
  }

  ReceiveStatus Receive(std::string* frame,
                        std::chrono::milliseconds timeout) override {
    std::unique_lock<std::mutex> lock(channel_->mutex);
    auto& queue = channel_->queues[index_];
    channel_->cv.wait_for(lock, timeout,
                          [&]() { return !queue.empty() || channel_->closed; });
    if (!queue.empty()) {
      if (frame) {
        *frame = std::move(queue.front());
      }
      queue.pop_front();
      return ReceiveStatus::kFrame;
    }
    return channel_->closed ? ReceiveStatus::kClosed : ReceiveStatus::kTimeout;
  }

  void Close() override {
    {
      std::lock_guard<std::mutex> lock(channel_->mutex);
      if (channel_->closed) {
        return;
      }
      channel_->closed = true;
    }
    channel_->cv.notify_all();
  }

  bool IsOpen() const override {
    std::lock_guard<std::mutex> lock(channel_->mutex);
    return !channel_->closed;
  }

  std::string Peer() const override { return peer_; }

 private:
  std::shared_ptr<MemoryChannel> channel_;
  const int index_;
  const std::string peer_;
};

uint32_t ReadBe32(const char* data) {
  const auto* bytes = reinterpret_cast<const unsigned char*>(data);
  return (static_cast<uint32_t>(bytes[0]) << 24) |
         (static_cast<uint32_t>(bytes[1]) << 16) |
         (static_cast<uint32_t>(bytes[2]) << 8) | static_cast<uint32_t>(bytes[3]);
}

void WriteBe32(char* data, uint32_t value) {
  data[0] = static_cast<char>((value >> 24) & 0xff);
  data[1] = static_cast<char>((value >> 16) & 0xff);
  data[2] = static_cast<char>((value >> 8) & 0xff);
  data[3] = static_cast<char>(value & 0xff);
}

}  // namespace

TcpTransport::TcpTransport(int fd, std::string peer, size_t max_frame_bytes)
    : fd_(fd), peer_(std::move(peer)), max_frame_bytes_(max_frame_bytes) {
  open_.store(fd_ >= 0);
}

TcpTransport::~TcpTransport() {
  Close();
  internal::CloseFd(fd_);
}

std::shared_ptr<TcpTransport> TcpTransport::Connect(
    const std::string& host, uint16_t port, std::chrono::milliseconds timeout,
    std::string* error, size_t max_frame_bytes) {
  const int fd = internal::ConnectTcp(host, port, timeout, error);
  if (fd < 0) {
    return nullptr;
  }
  std::ostringstream peer;
  peer << host << ":" << port;
  return std::make_shared<TcpTransport>(fd, peer.str(), max_frame_bytes);
}

bool TcpTransport::Send(const std::string& frame, std::string* error) {
  if (!open_.load()) {
    if (error) {
      *error = "transport closed";
    }
    return false;
  }
  if (frame.size() > max_frame_bytes_) {
    if (error) {
      *error = "frame exceeds maximum size";
    }
    return false;
  }
  std::array<char, kLengthPrefixBytes> prefix{};
  WriteBe32(prefix.data(), static_cast<uint32_t>(frame.size()));
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (!internal::SendAll(fd_, prefix.data(), prefix.size(), error) ||
      !internal::SendAll(fd_, frame.data(), frame.size(), error)) {
    // A partial frame leaves the stream unusable.
    CloseWithReason(error ? *error : "send failed");
    return false;
  }
  return true;
}

bool TcpTransport::ExtractFrame(std::string* frame) {
  if (read_buffer_.size() < kLengthPrefixBytes) {
    return false;
  }
  const size_t length = ReadBe32(read_buffer_.data());
  if (read_buffer_.size() < kLengthPrefixBytes + length) {
    return false;
  }
  if (frame) {
    frame->assign(read_buffer_, kLengthPrefixBytes, length);
  }
  read_buffer_.erase(0, kLengthPrefixBytes + length);
  return true;
}

ReceiveStatus TcpTransport::Receive(std::string* frame,
                                    std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lock(read_mutex_);
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::array<char, kReadChunkBytes> chunk{};
  while (true) {
    if (read_buffer_.size() >= kLengthPrefixBytes &&
        ReadBe32(read_buffer_.data()) > max_frame_bytes_) {
      std::ostringstream oss;
      oss << "frame of " << ReadBe32(read_buffer_.data())
          << " bytes exceeds limit of " << max_frame_bytes_;
      CloseWithReason(oss.str());
      read_buffer_.clear();
      return ReceiveStatus::kClosed;
    }
    if (ExtractFrame(frame)) {
      return ReceiveStatus::kFrame;
    }
    if (!open_.load()) {
      return ReceiveStatus::kClosed;
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return ReceiveStatus::kTimeout;
    }
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    const int ready = internal::WaitReadable(fd_, remaining);
    if (ready == 0) {
      continue;
    }
    if (ready < 0) {
      CloseWithReason(internal::ErrnoString("select()"));
      return ReceiveStatus::kClosed;
    }
    const ssize_t bytes = ::recv(fd_, chunk.data(), chunk.size(), 0);
    if (bytes == 0) {
      CloseWithReason("connection closed by peer");
      return ReceiveStatus::kClosed;
    }
    if (bytes < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue;
      }
      CloseWithReason(internal::ErrnoString("recv()"));
      return ReceiveStatus::kClosed;
    }
    read_buffer_.append(chunk.data(), static_cast<size_t>(bytes));
  }
}

void TcpTransport::Close() {
  if (!open_.exchange(false)) {
    return;
  }
  // The descriptor stays valid until destruction so a concurrent reader never
  // touches a reused fd; shutdown() wakes it.
  ::shutdown(fd_, SHUT_RDWR);
}

void TcpTransport::CloseWithReason(const std::string& reason) {
  {
    std::lock_guard<std::mutex> lock(reason_mutex_);
    if (close_reason_.empty() && open_.load()) {
      close_reason_ = reason;
    }
  }
  Close();
}

std::string TcpTransport::close_reason() const {
  std::lock_guard<std::mutex> lock(reason_mutex_);
  return close_reason_;
}

std::pair<std::shared_ptr<Transport>, std::shared_ptr<Transport>>
MakeMemoryTransportPair(const std::string& first_peer,
                        const std::string& second_peer) {
  auto channel = std::make_shared<MemoryChannel>();
  // Each end reports the other end's name as its peer.
  std::shared_ptr<Transport> first =
      std::make_shared<MemoryTransport>(channel, 0, second_peer);
  std::shared_ptr<Transport> second =
      std::make_shared<MemoryTransport>(channel, 1, first_peer);
  return {first, second};
}

Session::Session(std::string id, std::shared_ptr<Transport> transport,
                 LogCallback log_callback)
    : id_(std::move(id)),
      transport_(std::move(transport)),
      log_callback_(std::move(log_callback)),
      last_pong_at_(std::chrono::steady_clock::now()) {}

Session::~Session() {
  if (transport_) {
    transport_->Close();
  }
}

bool Session::Send(const Message& message, std::string* error) {
  return SendFrame(EncodeMessage(message), error);
}

bool Session::SendFrame(const std::string& frame, std::string* error) {
  if (closed_.load() || !transport_) {
    if (error) {
      *error = "session closed";
    }
    return false;
  }
  return transport_->Send(frame, error);
}

ReceiveStatus Session::Receive(std::string* frame,
                               std::chrono::milliseconds timeout) {
  if (!transport_) {
    return ReceiveStatus::kClosed;
  }
  return transport_->Receive(frame, timeout);
}

void Session::Close() {
  if (closed_.exchange(true)) {
    return;
  }
  if (transport_) {
    transport_->Close();
  }
  std::vector<CloseListener> listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners.swap(close_listeners_);
  }
  for (const auto& listener : listeners) {
    try {
      listener(id_);
    } catch (const std::exception& ex) {
      internal::Log(log_callback_,
                    std::string("close listener threw: ") + ex.what());
    }
  }
}

void Session::AddCloseListener(CloseListener listener) {
  if (!listener) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_.load()) {
      close_listeners_.push_back(std::move(listener));
      return;
    }
  }
  try {
    listener(id_);
  } catch (const std::exception& ex) {
    internal::Log(log_callback_, std::string("close listener threw: ") + ex.what());
  }
}

void Session::MarkPong() {
  std::lock_guard<std::mutex> lock(mutex_);
  last_pong_at_ = std::chrono::steady_clock::now();
  alive_.store(true);
}

std::chrono::steady_clock::time_point Session::last_pong_at() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_pong_at_;
}

void Session::SetIdentity(const std::string& device_id, Role role) {
  std::lock_guard<std::mutex> lock(mutex_);
  device_id_ = device_id;
  role_ = role;
  registered_ = true;
}

bool Session::registered() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return registered_;
}

std::string Session::device_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return device_id_;
}

Role Session::role() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return role_;
}

std::string Session::Peer() const {
  return transport_ ? transport_->Peer() : std::string();
}

}  // namespace playlink
