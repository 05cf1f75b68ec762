#pragma once
// packet_bus.h — Bounded broadcast channel from Receivers to Transmitters.
//
// Every subscription sees every packet published after it was created, in
// publish order, exactly once. The channel keeps the last `capacity` packets;
// a subscription that falls further behind than that loses the oldest ones
// and is told how many via a Lagged result. Publishing never waits for
// subscribers.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "net_address.h"

namespace relay {

struct RelayedPacket {
  std::vector<uint8_t> payload;
  SocketAddressV4 source;
};

using PacketPtr = std::shared_ptr<const RelayedPacket>;

enum class PublishStatus : uint8_t { Ok, NoSubscribers, Closed };

const char* to_string(PublishStatus s);

struct ReceiveResult {
  enum class Status : uint8_t { Packet, Lagged, Empty, Closed };

  Status status;
  PacketPtr packet;    // set for Packet
  uint64_t missed{0};  // set for Lagged
};

class PacketBus {
 public:
  class Subscription;

  static constexpr size_t kDefaultCapacity = 32;

  explicit PacketBus(size_t capacity = kDefaultCapacity);
  ~PacketBus();

  PacketBus(const PacketBus&) = delete;
  PacketBus& operator=(const PacketBus&) = delete;

  PublishStatus publish(PacketPtr packet);

  // The new cursor starts after everything already published.
  Subscription subscribe();

  // Wakes every blocked receive(). Subscriptions drain what is still buffered
  // and then report Closed; further publishes fail.
  void close();

  bool is_closed() const;
  size_t subscriber_count() const;
  size_t capacity() const;

 private:
  struct State;
  std::shared_ptr<State> state_;
};

class PacketBus::Subscription {
 public:
  ~Subscription();

  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;
  Subscription(Subscription&& o) noexcept;
  Subscription& operator=(Subscription&& o) noexcept;

  // Blocks until a packet, a lag notice, or close.
  ReceiveResult receive();

  // Like receive() but returns Empty instead of blocking.
  ReceiveResult try_receive();

  // Makes this cursor report Closed from now on and wakes a blocked
  // receive(). Safe to call from another thread; other subscriptions are
  // unaffected.
  void cancel();

 private:
  friend class PacketBus;

  Subscription(std::shared_ptr<State> state, uint64_t next);

  std::shared_ptr<State> state_;
  uint64_t next_;          // sequence number of the next packet to hand out
  bool cancelled_{false};  // guarded by State::mu

  ReceiveResult next_locked();
  void release();
};

}  // namespace relay
