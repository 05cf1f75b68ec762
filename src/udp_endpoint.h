#pragma once
// udp_endpoint.h — RAII wrapper over one bound IPv4 SOCK_DGRAM descriptor.
//
// Construction binds or throws; steady-state I/O never throws and reports
// errno in the result instead, so callers decide what is fatal.
//
//   UdpEndpoint rx(SocketAddressV4(Ipv4Address(10, 0, 0, 1), 9000));
//   UdpEndpoint tx(SocketAddressV4{}, {.broadcast = true});  // ephemeral port

#include <sys/socket.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "net_address.h"

namespace relay {

struct RecvResult {
  int error{0};            // errno of a failed read, otherwise 0
  size_t size{0};          // bytes stored in the caller's buffer
  bool truncated{false};   // datagram was larger than the buffer
  sa_family_t family{AF_UNSPEC};
  SocketAddressV4 source;  // meaningful only when family == AF_INET
};

struct SendResult {
  int error{0};
  size_t sent{0};
};

class UdpEndpoint {
 public:
  struct Options {
    bool reuse_address = true;
    bool broadcast = false;
  };

  explicit UdpEndpoint(const SocketAddressV4& local) : UdpEndpoint(local, Options{}) {
  }
  UdpEndpoint(const SocketAddressV4& local, Options opts);
  ~UdpEndpoint();

  // Non-copyable, movable.
  UdpEndpoint(const UdpEndpoint&) = delete;
  UdpEndpoint& operator=(const UdpEndpoint&) = delete;
  UdpEndpoint(UdpEndpoint&&) noexcept;
  UdpEndpoint& operator=(UdpEndpoint&&) noexcept;

  // Blocking read of one datagram. EINTR is retried internally.
  RecvResult recv_from(std::span<uint8_t> buf);

  SendResult send_to(std::span<const uint8_t> data, const SocketAddressV4& dest);

  // Actual bound address (resolves port 0 to the kernel-chosen port).
  SocketAddressV4 local_address() const {
    return local_;
  }

  int fd() const {
    return fd_;
  }

 private:
  int fd_;
  SocketAddressV4 local_;
};

// Source address the kernel would pick for a datagram to `dest`, found by
// connecting a throwaway socket. std::nullopt when there is no route.
std::optional<Ipv4Address> route_source_address(const SocketAddressV4& dest);

}  // namespace relay
