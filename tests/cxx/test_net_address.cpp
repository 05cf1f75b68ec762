// Parsing and containment checks for the IPv4 value types.

#include <gtest/gtest.h>

#include <unordered_set>

#include "net_address.h"
#include "relay_error.h"

using namespace relay;

// ── Ipv4Address ──────────────────────────────────────────────────────────────

TEST(Ipv4Address, ParsesDottedQuad) {
  auto a = Ipv4Address::parse("192.168.1.10");
  EXPECT_EQ(a, Ipv4Address(192, 168, 1, 10));
  EXPECT_EQ(a.value(), 0xC0A8010Au);
  EXPECT_EQ(a.to_string(), "192.168.1.10");
}

TEST(Ipv4Address, RejectsMalformedText) {
  EXPECT_THROW(Ipv4Address::parse(""), ConfigError);
  EXPECT_THROW(Ipv4Address::parse("256.0.0.1"), ConfigError);
  EXPECT_THROW(Ipv4Address::parse("10.0.0"), ConfigError);
  EXPECT_THROW(Ipv4Address::parse("eth0"), ConfigError);
  EXPECT_THROW(Ipv4Address::parse("10.0.0.1.5.6.7.8.9"), ConfigError);
}

// ── SocketAddressV4 ──────────────────────────────────────────────────────────

TEST(SocketAddressV4, ParsesAddressAndPort) {
  auto s = SocketAddressV4::parse("10.0.0.2:9000");
  EXPECT_EQ(s.ip(), Ipv4Address(10, 0, 0, 2));
  EXPECT_EQ(s.port(), 9000);
  EXPECT_EQ(s.to_string(), "10.0.0.2:9000");
}

TEST(SocketAddressV4, RejectsMissingOrBadPort) {
  EXPECT_THROW(SocketAddressV4::parse("10.0.0.2"), ConfigError);
  EXPECT_THROW(SocketAddressV4::parse("10.0.0.2:"), ConfigError);
  EXPECT_THROW(SocketAddressV4::parse("10.0.0.2:65536"), ConfigError);
  EXPECT_THROW(SocketAddressV4::parse("10.0.0.2:80x"), ConfigError);
}

TEST(SocketAddressV4, SockaddrConversionKeepsNetworkOrder) {
  SocketAddressV4 s(Ipv4Address(127, 0, 0, 1), 4000);
  sockaddr_in sa = s.to_sockaddr();
  EXPECT_EQ(sa.sin_family, AF_INET);
  EXPECT_EQ(sa.sin_port, htons(4000));
  EXPECT_EQ(sa.sin_addr.s_addr, htonl(0x7F000001u));
  EXPECT_EQ(SocketAddressV4::from_sockaddr(sa), s);
}

TEST(SocketAddressV4, EqualityAndHashIncludePort) {
  std::unordered_set<SocketAddressV4> set{SocketAddressV4::parse("10.0.0.2:9000")};
  EXPECT_EQ(set.count(SocketAddressV4::parse("10.0.0.2:9000")), 1u);
  EXPECT_EQ(set.count(SocketAddressV4::parse("10.0.0.2:9001")), 0u);
  EXPECT_EQ(set.count(SocketAddressV4::parse("10.0.0.3:9000")), 0u);
}

// ── Ipv4Network ──────────────────────────────────────────────────────────────

TEST(Ipv4Network, NormalisesBaseToNetworkAddress) {
  auto n = Ipv4Network::parse("192.168.1.77/24");
  EXPECT_EQ(n.network(), Ipv4Address(192, 168, 1, 0));
  EXPECT_EQ(n.prefix_len(), 24);
  EXPECT_EQ(n.netmask(), 0xFFFFFF00u);
  EXPECT_EQ(n.to_string(), "192.168.1.0/24");
}

TEST(Ipv4Network, BareAddressIsHostRoute) {
  auto n = Ipv4Network::parse("10.1.2.3");
  EXPECT_EQ(n.prefix_len(), 32);
  EXPECT_TRUE(n.contains(Ipv4Address(10, 1, 2, 3)));
  EXPECT_FALSE(n.contains(Ipv4Address(10, 1, 2, 4)));
}

TEST(Ipv4Network, ContainsRespectsPrefixBoundaries) {
  auto n = Ipv4Network::parse("192.168.0.0/16");
  EXPECT_TRUE(n.contains(Ipv4Address(192, 168, 0, 0)));
  EXPECT_TRUE(n.contains(Ipv4Address(192, 168, 255, 255)));
  EXPECT_FALSE(n.contains(Ipv4Address(192, 169, 0, 0)));
  EXPECT_FALSE(n.contains(Ipv4Address(192, 167, 255, 255)));
}

TEST(Ipv4Network, ZeroPrefixContainsEverything) {
  auto n = Ipv4Network::parse("0.0.0.0/0");
  EXPECT_EQ(n.netmask(), 0u);
  EXPECT_TRUE(n.contains(Ipv4Address(1, 2, 3, 4)));
  EXPECT_TRUE(n.contains(Ipv4Address(255, 255, 255, 255)));
}

TEST(Ipv4Network, RejectsBadPrefix) {
  EXPECT_THROW(Ipv4Network::parse("10.0.0.0/33"), ConfigError);
  EXPECT_THROW(Ipv4Network::parse("10.0.0.0/"), ConfigError);
  EXPECT_THROW(Ipv4Network::parse("10.0.0.0/-1"), ConfigError);
  EXPECT_THROW(Ipv4Network::parse("10.0.0/8"), ConfigError);
  EXPECT_THROW(Ipv4Network(Ipv4Address(10, 0, 0, 0), 40), ConfigError);
}
