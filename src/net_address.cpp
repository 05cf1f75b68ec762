// net_address.cpp

#include "net_address.h"

#include <arpa/inet.h>

#include <charconv>
#include <cstring>

#include "relay_error.h"

namespace relay {

namespace {

template <typename T>
bool parse_decimal(std::string_view text, T max, T& out) {
  if (text.empty()) return false;
  unsigned long v = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
  if (ec != std::errc{} || ptr != text.data() + text.size()) return false;
  if (v > max) return false;
  out = static_cast<T>(v);
  return true;
}

}  // namespace

// ── Ipv4Address ───────────────────────────────────────────────────────────────

Ipv4Address Ipv4Address::parse(std::string_view text) {
  // inet_pton needs a NUL-terminated string; 15 chars is the longest quad.
  char buf[INET_ADDRSTRLEN]{};
  if (text.empty() || text.size() >= sizeof(buf)) {
    throw ConfigError("invalid IPv4 address: '" + std::string(text) + "'");
  }
  std::memcpy(buf, text.data(), text.size());

  in_addr a{};
  if (::inet_pton(AF_INET, buf, &a) != 1) {
    throw ConfigError("invalid IPv4 address: '" + std::string(text) + "'");
  }
  return from_in_addr(a);
}

Ipv4Address Ipv4Address::from_in_addr(in_addr a) {
  return Ipv4Address(ntohl(a.s_addr));
}

in_addr Ipv4Address::to_in_addr() const {
  in_addr a{};
  a.s_addr = htonl(value_);
  return a;
}

std::string Ipv4Address::to_string() const {
  char buf[INET_ADDRSTRLEN]{};
  in_addr a = to_in_addr();
  ::inet_ntop(AF_INET, &a, buf, sizeof(buf));
  return buf;
}

// ── SocketAddressV4 ───────────────────────────────────────────────────────────

SocketAddressV4 SocketAddressV4::parse(std::string_view text) {
  auto colon = text.rfind(':');
  if (colon == std::string_view::npos) {
    throw ConfigError("invalid socket address (expected a.b.c.d:port): '" + std::string(text) +
                      "'");
  }
  uint16_t port = 0;
  if (!parse_decimal<uint16_t>(text.substr(colon + 1), 65535, port)) {
    throw ConfigError("invalid port in socket address: '" + std::string(text) + "'");
  }
  return SocketAddressV4(Ipv4Address::parse(text.substr(0, colon)), port);
}

SocketAddressV4 SocketAddressV4::from_sockaddr(const sockaddr_in& sa) {
  return SocketAddressV4(Ipv4Address::from_in_addr(sa.sin_addr), ntohs(sa.sin_port));
}

sockaddr_in SocketAddressV4::to_sockaddr() const {
  sockaddr_in sa{};
  sa.sin_family = AF_INET;
  sa.sin_port = htons(port_);
  sa.sin_addr = ip_.to_in_addr();
  return sa;
}

std::string SocketAddressV4::to_string() const {
  return ip_.to_string() + ":" + std::to_string(port_);
}

// ── Ipv4Network ───────────────────────────────────────────────────────────────

static uint32_t mask_for(uint8_t prefix_len) {
  // Shifting a 32-bit value by 32 is undefined.
  return prefix_len == 0 ? 0u : ~uint32_t{0} << (32 - prefix_len);
}

static uint8_t checked_prefix(uint8_t prefix_len) {
  if (prefix_len > 32) {
    throw ConfigError("invalid prefix length /" + std::to_string(prefix_len));
  }
  return prefix_len;
}

Ipv4Network::Ipv4Network(Ipv4Address base, uint8_t prefix_len)
    : base_(base.value() & mask_for(checked_prefix(prefix_len))), prefix_len_(prefix_len) {
}

Ipv4Network Ipv4Network::parse(std::string_view text) {
  auto slash = text.find('/');
  if (slash == std::string_view::npos) return Ipv4Network(Ipv4Address::parse(text), 32);

  uint8_t len = 0;
  if (!parse_decimal<uint8_t>(text.substr(slash + 1), 32, len)) {
    throw ConfigError("invalid prefix length in network: '" + std::string(text) + "'");
  }
  return Ipv4Network(Ipv4Address::parse(text.substr(0, slash)), len);
}

uint32_t Ipv4Network::netmask() const {
  return mask_for(prefix_len_);
}

bool Ipv4Network::contains(Ipv4Address ip) const {
  return (ip.value() & netmask()) == base_.value();
}

std::string Ipv4Network::to_string() const {
  return base_.to_string() + "/" + std::to_string(prefix_len_);
}

}  // namespace relay
