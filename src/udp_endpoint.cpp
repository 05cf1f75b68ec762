// udp_endpoint.cpp — AF_INET SOCK_DGRAM implementation.

#include "udp_endpoint.h"

#include <netinet/in.h>
#include <unistd.h>

#include <cerrno>
#include <string>

#include "relay_error.h"

namespace relay {

// ── Helpers ───────────────────────────────────────────────────────────────────

static int make_socket(const SocketAddressV4& local, const UdpEndpoint::Options& opts) {
  int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0) throw sys_error("socket()");

  int on = 1;
  if (opts.reuse_address && ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) < 0) {
    int err = errno;
    ::close(fd);
    throw sys_error("setsockopt(SO_REUSEADDR)", err);
  }
  if (opts.broadcast && ::setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) < 0) {
    int err = errno;
    ::close(fd);
    throw sys_error("setsockopt(SO_BROADCAST)", err);
  }

  sockaddr_in addr = local.to_sockaddr();
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    int err = errno;
    ::close(fd);
    throw sys_error("bind(" + local.to_string() + ")", err);
  }
  return fd;
}

static SocketAddressV4 bound_address(int fd) {
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
    int err = errno;
    ::close(fd);
    throw sys_error("getsockname()", err);
  }
  return SocketAddressV4::from_sockaddr(addr);
}

// ── UdpEndpoint ───────────────────────────────────────────────────────────────

UdpEndpoint::UdpEndpoint(const SocketAddressV4& local, Options opts)
    : fd_(make_socket(local, opts)), local_(bound_address(fd_)) {
}

UdpEndpoint::~UdpEndpoint() {
  if (fd_ >= 0) ::close(fd_);
}

UdpEndpoint::UdpEndpoint(UdpEndpoint&& o) noexcept : fd_(o.fd_), local_(o.local_) {
  o.fd_ = -1;
}

UdpEndpoint& UdpEndpoint::operator=(UdpEndpoint&& o) noexcept {
  if (this != &o) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = o.fd_;
    o.fd_ = -1;
    local_ = o.local_;
  }
  return *this;
}

RecvResult UdpEndpoint::recv_from(std::span<uint8_t> buf) {
  RecvResult r;
  sockaddr_storage from{};

  while (true) {
    socklen_t flen = sizeof(from);
    // MSG_TRUNC makes Linux report the real datagram length.
    ssize_t n = ::recvfrom(fd_, buf.data(), buf.size(), MSG_TRUNC,
                           reinterpret_cast<sockaddr*>(&from), &flen);
    if (n < 0) {
      if (errno == EINTR) continue;
      r.error = errno;
      return r;
    }
    r.truncated = static_cast<size_t>(n) > buf.size();
    r.size = r.truncated ? buf.size() : static_cast<size_t>(n);
    break;
  }

  r.family = from.ss_family;
  if (r.family == AF_INET) {
    r.source = SocketAddressV4::from_sockaddr(*reinterpret_cast<const sockaddr_in*>(&from));
  }
  return r;
}

SendResult UdpEndpoint::send_to(std::span<const uint8_t> data, const SocketAddressV4& dest) {
  SendResult r;
  sockaddr_in peer = dest.to_sockaddr();

  while (true) {
    ssize_t n = ::sendto(fd_, data.data(), data.size(), 0, reinterpret_cast<sockaddr*>(&peer),
                         sizeof(peer));
    if (n < 0) {
      if (errno == EINTR) continue;
      r.error = errno;
      return r;
    }
    r.sent = static_cast<size_t>(n);
    return r;
  }
}

std::optional<Ipv4Address> route_source_address(const SocketAddressV4& dest) {
  int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0) return std::nullopt;

  // Broadcast destinations need SO_BROADCAST even to connect.
  int on = 1;
  sockaddr_in peer = dest.to_sockaddr();
  sockaddr_in local{};
  socklen_t len = sizeof(local);
  bool ok = ::setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) == 0 &&
            ::connect(fd, reinterpret_cast<sockaddr*>(&peer), sizeof(peer)) == 0 &&
            ::getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) == 0;
  ::close(fd);

  if (!ok) return std::nullopt;
  return Ipv4Address::from_in_addr(local.sin_addr);
}

}  // namespace relay
