#pragma once
// net_address.h — IPv4 address, socket address and CIDR network value types.

#include <netinet/in.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace relay {

// IPv4 address held in host byte order.
class Ipv4Address {
 public:
  constexpr Ipv4Address() = default;
  constexpr explicit Ipv4Address(uint32_t host_order) : value_(host_order) {
  }
  constexpr Ipv4Address(uint8_t a, uint8_t b, uint8_t c, uint8_t d)
      : value_((uint32_t{a} << 24) | (uint32_t{b} << 16) | (uint32_t{c} << 8) | uint32_t{d}) {
  }

  // Throws relay::ConfigError on anything but a dotted quad.
  static Ipv4Address parse(std::string_view text);

  static Ipv4Address from_in_addr(in_addr a);
  in_addr to_in_addr() const;

  constexpr uint32_t value() const {
    return value_;
  }

  std::string to_string() const;

  constexpr bool operator==(const Ipv4Address&) const = default;

 private:
  uint32_t value_{0};
};

// IPv4 address + UDP port.
class SocketAddressV4 {
 public:
  constexpr SocketAddressV4() = default;
  constexpr SocketAddressV4(Ipv4Address ip, uint16_t port) : ip_(ip), port_(port) {
  }

  // Accepts "a.b.c.d:port".
  static SocketAddressV4 parse(std::string_view text);

  static SocketAddressV4 from_sockaddr(const sockaddr_in& sa);
  sockaddr_in to_sockaddr() const;

  constexpr Ipv4Address ip() const {
    return ip_;
  }
  constexpr uint16_t port() const {
    return port_;
  }

  std::string to_string() const;

  constexpr bool operator==(const SocketAddressV4&) const = default;

 private:
  Ipv4Address ip_;
  uint16_t port_{0};
};

// CIDR block. The base is normalised to the network address on construction.
class Ipv4Network {
 public:
  Ipv4Network(Ipv4Address base, uint8_t prefix_len);

  // Accepts "a.b.c.d/len" or a bare address (treated as /32).
  static Ipv4Network parse(std::string_view text);

  Ipv4Address network() const {
    return base_;
  }
  uint8_t prefix_len() const {
    return prefix_len_;
  }
  uint32_t netmask() const;

  bool contains(Ipv4Address ip) const;

  std::string to_string() const;

  bool operator==(const Ipv4Network&) const = default;

 private:
  Ipv4Address base_;
  uint8_t prefix_len_;
};

}  // namespace relay

template <>
struct std::hash<relay::SocketAddressV4> {
  size_t operator()(const relay::SocketAddressV4& a) const noexcept {
    return std::hash<uint64_t>{}((uint64_t{a.ip().value()} << 16) | a.port());
  }
};
