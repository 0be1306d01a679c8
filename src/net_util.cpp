#include "net_util.h"

#include <cerrno>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace playlink {
namespace internal {

sockaddr_in MakeSockaddr(const std::string& address, uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (address.empty() || address == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else {
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
      addr.sin_addr.s_addr = htonl(INADDR_ANY);
    }
  }
  return addr;
}

std::string AddrToString(const sockaddr_in& addr) {
  char buffer[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer)) == nullptr) {
    return {};
  }
  std::ostringstream oss;
  oss << buffer << ":" << ntohs(addr.sin_port);
  return oss.str();
}

std::string ErrnoString(const char* call) {
  return std::string(call) + " failed: " + std::strerror(errno);
}

int WaitReadable(int fd, std::chrono::milliseconds timeout) {
  if (fd < 0 || fd >= FD_SETSIZE) {
    return -1;
  }
  fd_set readfds;
  FD_ZERO(&readfds);
  FD_SET(fd, &readfds);
  timeval tv{};
  tv.tv_sec = static_cast<long>(timeout.count() / 1000);
  tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);
  const int ready = ::select(fd + 1, &readfds, nullptr, nullptr, &tv);
  if (ready < 0) {
    return errno == EINTR ? 0 : -1;
  }
  return ready > 0 ? 1 : 0;
}

bool SendAll(int fd, const char* data, size_t length, std::string* error) {
  size_t sent = 0;
  while (sent < length) {
    const ssize_t result = ::send(fd, data + sent, length - sent, MSG_NOSIGNAL);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (error) {
        *error = ErrnoString("send()");
      }
      return false;
    }
    if (result == 0) {
      if (error) {
        *error = "send() made no progress";
      }
      return false;
    }
    sent += static_cast<size_t>(result);
  }
  return true;
}

int ConnectTcp(const std::string& host, uint16_t port,
               std::chrono::milliseconds timeout, std::string* error) {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return -1;
  };
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* result = nullptr;
  const std::string service = std::to_string(port);
  const int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
  if (rc != 0 || result == nullptr) {
    return fail("cannot resolve " + host + ": " + ::gai_strerror(rc));
  }
  sockaddr_in addr{};
  std::memcpy(&addr, result->ai_addr, sizeof(addr));
  ::freeaddrinfo(result);

  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return fail(ErrnoString("socket()"));
  }
  const int flags = ::fcntl(fd, F_GETFL, 0);
  ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 &&
      errno != EINPROGRESS) {
    std::string message = ErrnoString("connect()");
    ::close(fd);
    return fail(message);
  }
  if (fd >= FD_SETSIZE) {
    ::close(fd);
    return fail("socket descriptor out of range");
  }
  fd_set writefds;
  FD_ZERO(&writefds);
  FD_SET(fd, &writefds);
  timeval tv{};
  tv.tv_sec = static_cast<long>(timeout.count() / 1000);
  tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);
  const int ready = ::select(fd + 1, nullptr, &writefds, nullptr, &tv);
  if (ready <= 0) {
    ::close(fd);
    std::ostringstream oss;
    oss << "connect(" << host << ":" << port << ") timed out";
    return fail(ready == 0 ? oss.str() : ErrnoString("select()"));
  }
  int so_error = 0;
  socklen_t len = sizeof(so_error);
  ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
  if (so_error != 0) {
    ::close(fd);
    std::ostringstream oss;
    oss << "connect(" << host << ":" << port << ") failed: "
        << std::strerror(so_error);
    return fail(oss.str());
  }
  ::fcntl(fd, F_SETFL, flags);
  return fd;
}

void CloseFd(int fd) {
  if (fd >= 0) {
    ::close(fd);
  }
}

bool TcpListener::Open(const std::string& bind_address, uint16_t port,
                       int backlog) {
  if (fd_ >= 0) {
    return true;
  }
  fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd_ < 0) {
    last_error_ = ErrnoString("socket()");
    return false;
  }
  int reuse = 1;
  if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
    last_error_ = ErrnoString("setsockopt(SO_REUSEADDR)");
    Close();
    return false;
  }
  sockaddr_in addr = MakeSockaddr(bind_address, port);
  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::ostringstream oss;
    oss << "bind(" << bind_address << ":" << port << ") failed: "
        << std::strerror(errno);
    last_error_ = oss.str();
    Close();
    return false;
  }
  if (::listen(fd_, backlog) < 0) {
    last_error_ = ErrnoString("listen()");
    Close();
    return false;
  }
  sockaddr_in bound{};
  socklen_t bound_len = sizeof(bound);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
    port_ = ntohs(bound.sin_port);
  } else {
    port_ = port;
  }
  return true;
}

void TcpListener::Close() {
  if (fd_ >= 0) {
    ::shutdown(fd_, SHUT_RDWR);
    ::close(fd_);
    fd_ = -1;
  }
}

int TcpListener::Accept(std::chrono::milliseconds timeout, std::string* peer) {
  if (WaitReadable(fd_, timeout) <= 0) {
    return -1;
  }
  sockaddr_in addr{};
  socklen_t addr_len = sizeof(addr);
  const int client = ::accept(fd_, reinterpret_cast<sockaddr*>(&addr), &addr_len);
  if (client < 0) {
    return -1;
  }
  if (peer) {
    *peer = AddrToString(addr);
  }
  return client;
}

bool UdpSocket::Open(const std::string& bind_address, uint16_t port,
                     bool allow_broadcast) {
  if (fd_ >= 0) {
    return true;
  }
  fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd_ < 0) {
    last_error_ = ErrnoString("socket()");
    return false;
  }
  int reuse = 1;
  if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
    last_error_ = ErrnoString("setsockopt(SO_REUSEADDR)");
    Close();
    return false;
  }
  if (allow_broadcast) {
    int broadcast = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &broadcast, sizeof(broadcast)) < 0) {
      last_error_ = ErrnoString("setsockopt(SO_BROADCAST)");
      Close();
      return false;
    }
  }
  sockaddr_in addr = MakeSockaddr(bind_address, port);
  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::ostringstream oss;
    oss << "bind(" << bind_address << ":" << port << ") failed: "
        << std::strerror(errno);
    last_error_ = oss.str();
    Close();
    return false;
  }
  sockaddr_in bound{};
  socklen_t bound_len = sizeof(bound);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
    port_ = ntohs(bound.sin_port);
  } else {
    port_ = port;
  }
  return true;
}

void UdpSocket::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool UdpSocket::SendTo(const std::string& payload, const sockaddr_in& addr,
                       std::string* error) {
  const ssize_t result =
      ::sendto(fd_, payload.data(), payload.size(), 0,
               reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
  if (result < 0) {
    if (error) {
      *error = ErrnoString("sendto()");
    }
    return false;
  }
  if (static_cast<size_t>(result) != payload.size()) {
    if (error) {
      std::ostringstream oss;
      oss << "sendto() sent " << result << " of " << payload.size() << " bytes";
      *error = oss.str();
    }
    return false;
  }
  return true;
}

int UdpSocket::ReceiveFrom(std::string* payload, sockaddr_in* from,
                           std::chrono::milliseconds timeout) {
  const int ready = WaitReadable(fd_, timeout);
  if (ready <= 0) {
    return ready;
  }
  char buffer[2048];
  socklen_t from_len = sizeof(*from);
  const ssize_t received = ::recvfrom(fd_, buffer, sizeof(buffer), 0,
                                      reinterpret_cast<sockaddr*>(from), &from_len);
  if (received < 0) {
    if (errno == EINTR || errno == EAGAIN) {
      return 0;
    }
    last_error_ = ErrnoString("recvfrom()");
    return -1;
  }
  payload->assign(buffer, static_cast<size_t>(received));
  return 1;
}

}  // namespace internal
}  // namespace playlink
