// address_filter.cpp

#include "address_filter.h"

#include <algorithm>
#include <utility>

namespace relay {

AddressFilter::AddressFilter(TransmitAddressSet transmit_addresses,
                             std::vector<Ipv4Network> block_nets,
                             std::vector<Ipv4Network> allow_nets)
    : transmit_addresses_(std::move(transmit_addresses)),
      block_nets_(std::move(block_nets)),
      allow_nets_(std::move(allow_nets)) {
  log_.debug("suppressing %zu transmit addresses", transmit_addresses_.size());
  if (!block_nets_.empty()) log_.debug("blocking packets from %zu subnets", block_nets_.size());
  if (!allow_nets_.empty()) log_.debug("allowing packets from %zu subnets", allow_nets_.size());
}

bool AddressFilter::any_contains(const std::vector<Ipv4Network>& nets, Ipv4Address ip) {
  return std::any_of(nets.begin(), nets.end(),
                     [ip](const Ipv4Network& net) { return net.contains(ip); });
}

bool AddressFilter::should_transmit(const SocketAddressV4& candidate) const {
  const bool storm = transmit_addresses_.count(candidate) != 0;
  const bool blocked = any_contains(block_nets_, candidate.ip());
  const bool allowed = any_contains(allow_nets_, candidate.ip());

  const bool pass = !storm && (!blocked || allowed);

  if (!pass && log_.enabled(Severity::Trace)) {
    log_.trace("not transmitting packet from %s (%s)", candidate.to_string().c_str(),
               storm ? "own transmit address" : "blocked network");
  }
  return pass;
}

}  // namespace relay
