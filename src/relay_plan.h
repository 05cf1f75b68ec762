#pragma once
// relay_plan.h — Fully resolved startup configuration handed to the coordinator.

#include <cstddef>
#include <vector>

#include "net_address.h"
#include "packet_bus.h"
#include "receiver.h"

namespace relay {

// One Transmitter: bind `local`, send every relayed payload to `destination`.
struct TransmitTarget {
  SocketAddressV4 local;
  SocketAddressV4 destination;

  bool operator==(const TransmitTarget&) const = default;
};

struct RelayPlan {
  std::vector<SocketAddressV4> listen;
  std::vector<TransmitTarget> targets;
  std::vector<Ipv4Network> block_nets;
  std::vector<Ipv4Network> allow_nets;
  size_t bus_capacity = PacketBus::kDefaultCapacity;
  size_t buffer_size = Receiver::kDefaultBufferSize;
};

}  // namespace relay
