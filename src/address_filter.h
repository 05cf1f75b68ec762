#pragma once
// address_filter.h — Admission policy for received datagrams.
//
// A datagram may be relayed iff its source is not one of our own transmit
// endpoints (storm guard) and its IP is either outside every block-list
// network or inside some allow-list network:
//
//   !storm && (!blocked || allowed)
//
// The allow list overrides the block list only; it never overrides the storm
// guard.

#include <unordered_set>
#include <vector>

#include "component_logger.h"
#include "net_address.h"

namespace relay {

using TransmitAddressSet = std::unordered_set<SocketAddressV4>;

class AddressFilter {
 public:
  AddressFilter(TransmitAddressSet transmit_addresses, std::vector<Ipv4Network> block_nets,
                std::vector<Ipv4Network> allow_nets);

  // Pure apart from a trace log on rejection; safe to call from any thread.
  bool should_transmit(const SocketAddressV4& candidate) const;

  const TransmitAddressSet& transmit_addresses() const {
    return transmit_addresses_;
  }

 private:
  const TransmitAddressSet transmit_addresses_;
  const std::vector<Ipv4Network> block_nets_;
  const std::vector<Ipv4Network> allow_nets_;
  ComponentLogger log_{"filter"};

  static bool any_contains(const std::vector<Ipv4Network>& nets, Ipv4Address ip);
};

}  // namespace relay
