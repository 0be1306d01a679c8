#include "playlink/discovery.h"

#include "log.h"
#include "net_util.h"

#include <exception>
#include <sstream>
#include <utility>

#include <arpa/inet.h>
#include <nlohmann/json.hpp>

namespace playlink {
namespace {

constexpr const char* kAnnounceType = "hubAnnounce";

bool IsIPv4(const std::string& address) {
  in_addr parsed{};
  return inet_pton(AF_INET, address.c_str(), &parsed) == 1;
}

std::string SourceHost(const sockaddr_in& from) {
  char buffer[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &from.sin_addr, buffer, sizeof(buffer)) == nullptr) {
    return {};
  }
  return buffer;
}

}  // namespace

std::string EncodeAnnouncement(const HubAnnouncement& announcement) {
  nlohmann::json body = {
      {"type", kAnnounceType},
      {"serverVersion", announcement.server_version},
      {"port", announcement.port},
      {"httpPort", announcement.http_port},
  };
  if (!announcement.host.empty()) {
    body["host"] = announcement.host;
  }
  return body.dump();
}

bool ParseAnnouncement(const std::string& payload, HubAnnouncement* out,
                       std::string* error) {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  nlohmann::json body;
  try {
    body = nlohmann::json::parse(payload);
  } catch (const nlohmann::json::parse_error& ex) {
    return fail(std::string("malformed announcement: ") + ex.what());
  }
  if (!body.is_object() || body.value("type", std::string()) != kAnnounceType) {
    return fail("not a hub announcement");
  }
  auto port_field = [&](const char* key, bool allow_zero, uint16_t* port) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_number_unsigned()) {
      return false;
    }
    const uint64_t value = it->get<uint64_t>();
    if ((value == 0 && !allow_zero) || value > 65535) {
      return false;
    }
    *port = static_cast<uint16_t>(value);
    return true;
  };
  HubAnnouncement parsed;
  if (!port_field("port", false, &parsed.port)) {
    return fail("announcement missing valid port");
  }
  if (!port_field("httpPort", true, &parsed.http_port)) {
    return fail("announcement missing valid httpPort");
  }
  auto version = body.find("serverVersion");
  if (version == body.end() || !version->is_string()) {
    return fail("announcement missing serverVersion");
  }
  parsed.server_version = version->get<std::string>();
  auto host = body.find("host");
  if (host != body.end()) {
    if (!host->is_string()) {
      return fail("announcement host must be a string");
    }
    parsed.host = host->get<std::string>();
  }
  if (out) {
    *out = std::move(parsed);
  }
  return true;
}

bool AnnouncerConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (!IsIPv4(bind_address)) {
    return fail("announce bind_address must be a valid IPv4 address");
  }
  if (!IsIPv4(announce_address)) {
    return fail("announce_address must be a valid IPv4 address");
  }
  if (announce_port == 0) {
    return fail("announce_port must be non-zero");
  }
  if (interval.count() <= 0) {
    return fail("announce interval must be positive");
  }
  return true;
}

bool DiscoveryConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (!IsIPv4(bind_address)) {
    return fail("discovery bind_address must be a valid IPv4 address");
  }
  if (announce_port == 0) {
    return fail("announce_port must be non-zero");
  }
  if (timeout.count() <= 0) {
    return fail("discovery timeout must be positive");
  }
  return true;
}

struct HubAnnouncer::SocketState {
  internal::UdpSocket socket;
  sockaddr_in destination{};
};

HubAnnouncer::HubAnnouncer(AnnouncerConfig config, HubAnnouncement announcement)
    : config_(std::move(config)),
      payload_(EncodeAnnouncement(announcement)),
      socket_(new SocketState()) {}

HubAnnouncer::~HubAnnouncer() { Stop(); }

bool HubAnnouncer::Start(std::string* error) {
  auto fail = [&](const std::string& message) {
    internal::Log(config_.log_callback, message);
    if (error) {
      *error = message;
    }
    return false;
  };
  if (running_.exchange(true)) {
    return true;
  }
  std::string message;
  if (!config_.Validate(&message)) {
    running_ = false;
    return fail(message);
  }
  if (!socket_->socket.Open(config_.bind_address, 0, true)) {
    running_ = false;
    return fail(socket_->socket.last_error());
  }
  socket_->destination =
      internal::MakeSockaddr(config_.announce_address, config_.announce_port);
  try {
    thread_ = std::thread([this]() { Loop(); });
  } catch (const std::exception& ex) {
    socket_->socket.Close();
    running_ = false;
    return fail(std::string("announce thread start failed: ") + ex.what());
  }
  return true;
}

void HubAnnouncer::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  socket_->socket.Close();
}

bool HubAnnouncer::AnnounceOnce(std::string* error) {
  if (!running_.load()) {
    if (error) {
      *error = "announcer not running";
    }
    return false;
  }
  std::string message;
  if (!socket_->socket.SendTo(payload_, socket_->destination, &message)) {
    send_errors_.fetch_add(1, std::memory_order_relaxed);
    if (error) {
      *error = message;
    }
    return false;
  }
  sent_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

void HubAnnouncer::Loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (running_.load()) {
    lock.unlock();
    std::string error;
    const bool ok = AnnounceOnce(&error);
    if (!ok && !failing_) {
      internal::Log(config_.log_callback, "hub announce failed: " + error);
    } else if (ok && failing_) {
      internal::Log(config_.log_callback, "hub announce recovered");
    }
    failing_ = !ok;
    lock.lock();
    cv_.wait_for(lock, config_.interval, [this]() { return !running_.load(); });
  }
}

bool DiscoverHub(const DiscoveryConfig& config, HubAnnouncement* out,
                 std::string* error) {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  std::string message;
  if (!config.Validate(&message)) {
    return fail(message);
  }
  internal::UdpSocket socket;
  if (!socket.Open(config.bind_address, config.announce_port, false)) {
    return fail(socket.last_error());
  }

  const auto deadline = std::chrono::steady_clock::now() + config.timeout;
  while (true) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      break;
    }
    std::string payload;
    sockaddr_in from{};
    const int received = socket.ReceiveFrom(&payload, &from, remaining);
    if (received < 0) {
      return fail(socket.last_error());
    }
    if (received == 0) {
      continue;
    }
    HubAnnouncement announcement;
    if (!ParseAnnouncement(payload, &announcement, &message)) {
      internal::Log(config.log_callback, "ignoring datagram: " + message);
      continue;
    }
    if (announcement.host.empty()) {
      announcement.host = SourceHost(from);
    }
    if (out) {
      *out = std::move(announcement);
    }
    return true;
  }
  std::ostringstream oss;
  oss << "no hub announcement on UDP port " << config.announce_port << " within "
      << config.timeout.count() << " ms";
  return fail(oss.str());
}

}  // namespace playlink
