#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include <netinet/in.h>

namespace playlink {
namespace internal {

sockaddr_in MakeSockaddr(const std::string& address, uint16_t port);
std::string AddrToString(const sockaddr_in& addr);
std::string ErrnoString(const char* call);

// Wait until `fd` is readable. Returns 1 when ready, 0 on timeout, -1 on error.
int WaitReadable(int fd, std::chrono::milliseconds timeout);

// Write all of `data`, retrying short writes. Never raises SIGPIPE.
bool SendAll(int fd, const char* data, size_t length, std::string* error);

// Resolve `host` and connect with a bounded wait. Returns the fd or -1.
int ConnectTcp(const std::string& host, uint16_t port,
               std::chrono::milliseconds timeout, std::string* error);

void CloseFd(int fd);

// Listening TCP socket. Port 0 binds an ephemeral port; port() reports it.
class TcpListener {
 public:
  TcpListener() = default;
  ~TcpListener() { Close(); }

  TcpListener(const TcpListener&) = delete;
  TcpListener& operator=(const TcpListener&) = delete;

  bool Open(const std::string& bind_address, uint16_t port, int backlog = 16);
  void Close();

  // Accept one connection, waiting at most `timeout`. Returns -1 when none.
  int Accept(std::chrono::milliseconds timeout, std::string* peer);

  int fd() const { return fd_; }
  uint16_t port() const { return port_; }
  const std::string& last_error() const { return last_error_; }

 private:
  int fd_ = -1;
  uint16_t port_ = 0;
  std::string last_error_;
};

// UDP socket for hub announcements, with optional broadcast.
class UdpSocket {
 public:
  UdpSocket() = default;
  ~UdpSocket() { Close(); }

  UdpSocket(const UdpSocket&) = delete;
  UdpSocket& operator=(const UdpSocket&) = delete;

  bool Open(const std::string& bind_address, uint16_t port, bool allow_broadcast);
  void Close();

  bool SendTo(const std::string& payload, const sockaddr_in& addr, std::string* error);
  // Receive one datagram, waiting at most `timeout`. Returns 1 when a
  // datagram was read, 0 on timeout, -1 on error.
  int ReceiveFrom(std::string* payload, sockaddr_in* from,
                  std::chrono::milliseconds timeout);

  int fd() const { return fd_; }
  uint16_t port() const { return port_; }
  const std::string& last_error() const { return last_error_; }

 private:
  int fd_ = -1;
  uint16_t port_ = 0;
  std::string last_error_;
};

}  // namespace internal
}  // namespace playlink
