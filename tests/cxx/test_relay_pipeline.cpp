// End-to-end relay checks over loopback: Receivers, bus fan-out, Transmitters
// and the storm guard wired together by RelayCoordinator.

#include <gtest/gtest.h>

#include <sys/socket.h>
#include <sys/time.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include "address_filter.h"
#include "packet_bus.h"
#include "receiver.h"
#include "relay_coordinator.h"
#include "transmitter.h"
#include "udp_endpoint.h"

using namespace relay;
using namespace std::chrono_literals;

namespace {

const SocketAddressV4 kLoopbackAny(Ipv4Address(127, 0, 0, 1), 0);

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = 2s) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

// A loopback socket standing in for a relay destination.
class Sink {
 public:
  explicit Sink(int timeout_ms = 300) : ep_(kLoopbackAny) {
    timeval tv{};
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    EXPECT_EQ(::setsockopt(ep_.fd(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)), 0);
  }

  SocketAddressV4 address() const {
    return ep_.local_address();
  }

  UdpEndpoint& endpoint() {
    return ep_;
  }

  // Next datagram, or nullopt once the timeout expires.
  std::optional<std::vector<uint8_t>> next() {
    std::vector<uint8_t> buf(65536);
    RecvResult r = ep_.recv_from(buf);
    if (r.error != 0) return std::nullopt;
    buf.resize(r.size);
    return buf;
  }

 private:
  UdpEndpoint ep_;
};

std::vector<uint8_t> bytes(const char* s) {
  return std::vector<uint8_t>(s, s + std::strlen(s));
}

}  // namespace

// ── Test: one inbound packet reaches every destination exactly once ─────────

TEST(RelayPipeline, OnePacketFansOutToEveryDestination) {
  Sink d1, d2, d3;

  RelayPlan plan;
  plan.listen = {kLoopbackAny, kLoopbackAny};
  plan.targets = {{kLoopbackAny, d1.address()},
                  {kLoopbackAny, d2.address()},
                  {kLoopbackAny, d3.address()}};

  RelayCoordinator relay(plan);
  ASSERT_EQ(relay.receivers().size(), 2u);
  ASSERT_EQ(relay.transmitters().size(), 3u);
  relay.start();

  UdpEndpoint client(kLoopbackAny);
  const auto payload = bytes("discovery-ping");
  ASSERT_EQ(client.send_to(payload, relay.receivers()[0]->local_address()).error, 0);

  for (Sink* d : {&d1, &d2, &d3}) {
    auto got = d->next();
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(*got, payload);
    EXPECT_FALSE(d->next().has_value());
  }

  for (const auto& t : relay.transmitters()) {
    EXPECT_TRUE(wait_until([&] { return t->stats().sent == 1; }));
    EXPECT_EQ(t->stats().bytes_sent, payload.size());
    EXPECT_EQ(t->stats().send_errors, 0u);
  }
  EXPECT_EQ(relay.receivers()[0]->stats().published, 1u);
  EXPECT_EQ(relay.receivers()[1]->stats().received, 0u);
}

// ── Test: packets from either listening address are relayed ─────────────────

TEST(RelayPipeline, EveryReceiverFeedsTheBus) {
  Sink d;
  RelayPlan plan;
  plan.listen = {kLoopbackAny, kLoopbackAny};
  plan.targets = {{kLoopbackAny, d.address()}};

  RelayCoordinator relay(plan);
  relay.start();

  UdpEndpoint client(kLoopbackAny);
  ASSERT_EQ(client.send_to(bytes("x"), relay.receivers()[0]->local_address()).error, 0);
  auto first = d.next();
  ASSERT_EQ(client.send_to(bytes("y"), relay.receivers()[1]->local_address()).error, 0);
  auto second = d.next();

  ASSERT_TRUE(first && second);
  EXPECT_EQ(*first, bytes("x"));
  EXPECT_EQ(*second, bytes("y"));
}

// ── Test: a packet from a configured destination is not re-relayed ──────────

TEST(RelayPipeline, PacketFromDestinationIsFiltered) {
  Sink d1, d2;
  RelayPlan plan;
  plan.listen = {kLoopbackAny};
  plan.targets = {{kLoopbackAny, d1.address()}, {kLoopbackAny, d2.address()}};

  RelayCoordinator relay(plan);
  relay.start();
  const auto& rx = *relay.receivers()[0];

  // d1 talks back to the relay: that is exactly the loop the guard prevents.
  ASSERT_EQ(d1.endpoint().send_to(bytes("echo"), rx.local_address()).error, 0);
  ASSERT_TRUE(wait_until([&] { return rx.stats().filtered == 1; }));
  EXPECT_EQ(rx.stats().published, 0u);
  EXPECT_FALSE(d1.next().has_value());
  EXPECT_FALSE(d2.next().has_value());

  // Anyone else still gets through.
  UdpEndpoint client(kLoopbackAny);
  ASSERT_EQ(client.send_to(bytes("hello"), rx.local_address()).error, 0);
  EXPECT_TRUE(d1.next().has_value());
  EXPECT_TRUE(d2.next().has_value());
}

TEST(RelayPipeline, TransmitterSocketsJoinTheStormGuard) {
  Sink d;
  RelayPlan plan;
  plan.listen = {kLoopbackAny};
  plan.targets = {{kLoopbackAny, d.address()}};

  RelayCoordinator relay(plan);
  const auto& guard = relay.filter().transmit_addresses();
  EXPECT_EQ(guard.count(d.address()), 1u);
  for (const auto& t : relay.transmitters()) {
    EXPECT_NE(t->local_address().port(), 0);
    EXPECT_EQ(guard.count(t->local_address()), 1u);
    EXPECT_FALSE(relay.filter().should_transmit(t->local_address()));
  }
}

// ── Test: a wildcard-bound transmitter cannot feed itself ───────────────────

TEST(RelayPipeline, WildcardTransmitterToOwnListenAddressDoesNotLoop) {
  // Reserve a port for the second listening address, then release it.
  uint16_t port = UdpEndpoint(kLoopbackAny).local_address().port();
  const SocketAddressV4 own(Ipv4Address(127, 0, 0, 1), port);

  RelayPlan plan;
  plan.listen = {kLoopbackAny, own};
  plan.targets = {{SocketAddressV4{}, own}};

  RelayCoordinator relay(plan);
  ASSERT_EQ(relay.transmitters().size(), 1u);
  const auto& tx = *relay.transmitters()[0];
  EXPECT_EQ(tx.local_address().ip(), Ipv4Address{});
  const SocketAddressV4 egress(Ipv4Address(127, 0, 0, 1), tx.local_address().port());
  EXPECT_EQ(relay.filter().transmit_addresses().count(egress), 1u);

  relay.start();
  UdpEndpoint client(kLoopbackAny);
  ASSERT_EQ(client.send_to(bytes("once"), relay.receivers()[0]->local_address()).error, 0);

  const auto& looped = *relay.receivers()[1];
  ASSERT_TRUE(wait_until([&] { return looped.stats().filtered == 1; }));
  std::this_thread::sleep_for(100ms);
  EXPECT_EQ(looped.stats().published, 0u);
  EXPECT_EQ(tx.stats().sent, 1u);
  relay.stop();
}

// ── Test: block list with allow override ────────────────────────────────────

TEST(RelayPipeline, BlockedSourceIsDropped) {
  Sink d;
  RelayPlan plan;
  plan.listen = {kLoopbackAny};
  plan.targets = {{kLoopbackAny, d.address()}};
  plan.block_nets = {Ipv4Network::parse("127.0.0.0/8")};

  RelayCoordinator relay(plan);
  relay.start();
  const auto& rx = *relay.receivers()[0];

  UdpEndpoint client(kLoopbackAny);
  ASSERT_EQ(client.send_to(bytes("blocked"), rx.local_address()).error, 0);
  ASSERT_TRUE(wait_until([&] { return rx.stats().filtered == 1; }));
  EXPECT_FALSE(d.next().has_value());
}

TEST(RelayPipeline, AllowListOverridesBlockList) {
  Sink d;
  RelayPlan plan;
  plan.listen = {kLoopbackAny};
  plan.targets = {{kLoopbackAny, d.address()}};
  plan.block_nets = {Ipv4Network::parse("127.0.0.0/8")};
  plan.allow_nets = {Ipv4Network::parse("127.0.0.1/32")};

  RelayCoordinator relay(plan);
  relay.start();

  UdpEndpoint client(kLoopbackAny);
  ASSERT_EQ(client.send_to(bytes("allowed"), relay.receivers()[0]->local_address()).error, 0);
  auto got = d.next();
  ASSERT_TRUE(got.has_value());
  EXPECT_EQ(*got, bytes("allowed"));
}

// ── Test: stop() ends every worker ──────────────────────────────────────────

TEST(RelayPipeline, StopJoinsAllWorkers) {
  Sink d;
  RelayPlan plan;
  plan.listen = {kLoopbackAny, kLoopbackAny};
  plan.targets = {{kLoopbackAny, d.address()}};

  RelayCoordinator relay(plan);
  relay.start();
  for (const auto& r : relay.receivers()) EXPECT_TRUE(r->is_running());

  relay.stop();
  for (const auto& r : relay.receivers()) EXPECT_FALSE(r->is_running());
  for (const auto& t : relay.transmitters()) EXPECT_FALSE(t->is_running());
  EXPECT_TRUE(relay.bus().is_closed());
  relay.stop();
}

// ── Receiver in isolation ────────────────────────────────────────────────────

TEST(Receiver, PublishFailureIsNotFatal) {
  PacketBus bus(4);
  AddressFilter filter({}, {}, {});
  Receiver rx(UdpEndpoint(kLoopbackAny), filter, bus);
  rx.start();

  UdpEndpoint client(kLoopbackAny);
  ASSERT_EQ(client.send_to(bytes("nobody"), rx.local_address()).error, 0);
  ASSERT_TRUE(wait_until([&] { return rx.stats().publish_failures == 1; }));
  EXPECT_TRUE(rx.is_running());

  auto sub = bus.subscribe();
  ASSERT_EQ(client.send_to(bytes("somebody"), rx.local_address()).error, 0);
  auto r = sub.receive();
  ASSERT_EQ(r.status, ReceiveResult::Status::Packet);
  EXPECT_EQ(r.packet->payload, bytes("somebody"));
  EXPECT_EQ(r.packet->source, client.local_address());
}

TEST(Receiver, OversizedDatagramIsRelayedTruncated) {
  PacketBus bus(4);
  AddressFilter filter({}, {}, {});
  Receiver rx(UdpEndpoint(kLoopbackAny), filter, bus, Receiver::kMinBufferSize);
  auto sub = bus.subscribe();
  rx.start();

  UdpEndpoint client(kLoopbackAny);
  std::vector<uint8_t> big(Receiver::kMinBufferSize + 1000, 0x5A);
  ASSERT_EQ(client.send_to(big, rx.local_address()).error, 0);

  auto r = sub.receive();
  ASSERT_EQ(r.status, ReceiveResult::Status::Packet);
  EXPECT_EQ(r.packet->payload.size(), Receiver::kMinBufferSize);
  EXPECT_EQ(rx.stats().truncated, 1u);
}

TEST(Receiver, BufferBelowMinimumIsRaised) {
  PacketBus bus(4);
  AddressFilter filter({}, {}, {});
  Receiver rx(UdpEndpoint(kLoopbackAny), filter, bus, 16);
  auto sub = bus.subscribe();
  rx.start();

  UdpEndpoint client(kLoopbackAny);
  std::vector<uint8_t> msg(1500, 0x11);
  ASSERT_EQ(client.send_to(msg, rx.local_address()).error, 0);

  auto r = sub.receive();
  ASSERT_EQ(r.status, ReceiveResult::Status::Packet);
  EXPECT_EQ(r.packet->payload.size(), msg.size());
}

TEST(Receiver, FatalSocketErrorsAreClassified) {
  EXPECT_TRUE(is_fatal_socket_error(EBADF));
  EXPECT_TRUE(is_fatal_socket_error(ENOTSOCK));
  EXPECT_FALSE(is_fatal_socket_error(ECONNREFUSED));
  EXPECT_FALSE(is_fatal_socket_error(ENOBUFS));
}

// ── Transmitter in isolation ─────────────────────────────────────────────────

TEST(Transmitter, ForwardsOnlyPacketsPublishedAfterConstruction) {
  PacketBus bus(4);
  auto keepalive = bus.subscribe();
  Sink d;

  auto early = std::make_shared<const RelayedPacket>(RelayedPacket{bytes("early"), {}});
  ASSERT_EQ(bus.publish(early), PublishStatus::Ok);

  Transmitter tx(UdpEndpoint(kLoopbackAny), d.address(), bus);
  tx.start();
  auto late = std::make_shared<const RelayedPacket>(RelayedPacket{bytes("late"), {}});
  ASSERT_EQ(bus.publish(late), PublishStatus::Ok);

  auto got = d.next();
  ASSERT_TRUE(got.has_value());
  EXPECT_EQ(*got, bytes("late"));
  EXPECT_FALSE(d.next().has_value());

  tx.stop();
  EXPECT_FALSE(tx.is_running());
}

TEST(Transmitter, SendFailureIsNotFatal) {
  PacketBus bus(4);
  Sink d;

  // Without SO_BROADCAST the kernel refuses the limited broadcast address.
  const SocketAddressV4 broadcast(Ipv4Address(255, 255, 255, 255), d.address().port());
  Transmitter failing(UdpEndpoint(kLoopbackAny), broadcast, bus);
  Transmitter good(UdpEndpoint(kLoopbackAny), d.address(), bus);
  failing.start();
  good.start();

  for (const char* msg : {"one", "two"}) {
    auto p = std::make_shared<const RelayedPacket>(RelayedPacket{bytes(msg), {}});
    ASSERT_EQ(bus.publish(p), PublishStatus::Ok);
  }

  ASSERT_TRUE(wait_until([&] { return failing.stats().send_errors == 2; }));
  EXPECT_EQ(failing.stats().sent, 0u);
  EXPECT_TRUE(failing.is_running());

  auto first = d.next();
  auto second = d.next();
  ASSERT_TRUE(first && second);
  EXPECT_EQ(*first, bytes("one"));
  EXPECT_EQ(*second, bytes("two"));
  EXPECT_EQ(good.stats().send_errors, 0u);
}

TEST(Transmitter, LagIsCountedAndForwardingContinues) {
  PacketBus bus(2);
  Sink d;
  Transmitter tx(UdpEndpoint(kLoopbackAny), d.address(), bus);

  // Five packets into a ring of two before the loop runs: three are lost.
  for (const char* msg : {"p1", "p2", "p3", "p4", "p5"}) {
    auto p = std::make_shared<const RelayedPacket>(RelayedPacket{bytes(msg), {}});
    ASSERT_EQ(bus.publish(p), PublishStatus::Ok);
  }
  tx.start();

  auto a = d.next();
  auto b = d.next();
  ASSERT_TRUE(a && b);
  EXPECT_EQ(*a, bytes("p4"));
  EXPECT_EQ(*b, bytes("p5"));
  EXPECT_EQ(tx.stats().lag_events, 1u);
  EXPECT_EQ(tx.stats().lagged_packets, 3u);

  auto after = std::make_shared<const RelayedPacket>(RelayedPacket{bytes("p6"), {}});
  ASSERT_EQ(bus.publish(after), PublishStatus::Ok);
  auto c = d.next();
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(*c, bytes("p6"));
  EXPECT_TRUE(tx.is_running());
  EXPECT_EQ(tx.stats().lag_events, 1u);
}
