// relay_coordinator.cpp

#include "relay_coordinator.h"

#include <utility>

namespace relay {

RelayCoordinator::RelayCoordinator(const RelayPlan& plan) : bus_(plan.bus_capacity) {
  // ── Transmit endpoints ────────────────────────────────────────────────────
  std::vector<UdpEndpoint> tx_endpoints;
  tx_endpoints.reserve(plan.targets.size());
  for (const auto& t : plan.targets) {
    tx_endpoints.emplace_back(t.local, UdpEndpoint::Options{.reuse_address = true,
                                                            .broadcast = true});
  }

  // ── Storm guard: destinations plus the addresses we actually send from ───
  TransmitAddressSet transmit_addresses;
  for (size_t i = 0; i < plan.targets.size(); ++i) {
    const auto& dest = plan.targets[i].destination;
    const auto local = tx_endpoints[i].local_address();
    transmit_addresses.insert(dest);
    transmit_addresses.insert(local);

    // A wildcard-bound socket sends from whatever address routes to dest.
    if (local.ip() == Ipv4Address{}) {
      if (auto src = route_source_address(dest)) {
        transmit_addresses.insert(SocketAddressV4(*src, local.port()));
      } else {
        log_.warn("no route to %s; its replies cannot be recognised as our own",
                  dest.to_string().c_str());
      }
    }
  }
  filter_ = std::make_unique<AddressFilter>(std::move(transmit_addresses), plan.block_nets,
                                            plan.allow_nets);

  // ── Workers ───────────────────────────────────────────────────────────────
  for (size_t i = 0; i < plan.targets.size(); ++i) {
    transmitters_.push_back(std::make_unique<Transmitter>(std::move(tx_endpoints[i]),
                                                          plan.targets[i].destination, bus_));
  }
  for (const auto& addr : plan.listen) {
    receivers_.push_back(
        std::make_unique<Receiver>(UdpEndpoint(addr), *filter_, bus_, plan.buffer_size));
  }

  log_.debug("%zu receivers, %zu transmitters, bus capacity %zu", receivers_.size(),
             transmitters_.size(), bus_.capacity());
}

RelayCoordinator::~RelayCoordinator() {
  stop();
}

void RelayCoordinator::start() {
  for (auto& t : transmitters_) t->start();
  for (auto& r : receivers_) r->start();
  log_.info("relaying from %zu listening addresses to %zu destinations", receivers_.size(),
            transmitters_.size());
}

void RelayCoordinator::stop() {
  if (stopped_) return;
  stopped_ = true;

  for (auto& r : receivers_) r->stop();
  bus_.close();
  for (auto& t : transmitters_) t->stop();

  log_stats();
}

void RelayCoordinator::log_stats() const {
  for (const auto& r : receivers_) {
    auto s = r->stats();
    log_.info("receiver %s: received=%llu published=%llu filtered=%llu non_ipv4=%llu "
              "truncated=%llu publish_failures=%llu read_errors=%llu",
              r->local_address().to_string().c_str(), static_cast<unsigned long long>(s.received),
              static_cast<unsigned long long>(s.published),
              static_cast<unsigned long long>(s.filtered),
              static_cast<unsigned long long>(s.non_ipv4),
              static_cast<unsigned long long>(s.truncated),
              static_cast<unsigned long long>(s.publish_failures),
              static_cast<unsigned long long>(s.read_errors));
  }
  for (const auto& t : transmitters_) {
    auto s = t->stats();
    log_.info("transmitter %s: sent=%llu bytes=%llu send_errors=%llu lag_events=%llu lost=%llu",
              t->destination().to_string().c_str(), static_cast<unsigned long long>(s.sent),
              static_cast<unsigned long long>(s.bytes_sent),
              static_cast<unsigned long long>(s.send_errors),
              static_cast<unsigned long long>(s.lag_events),
              static_cast<unsigned long long>(s.lagged_packets));
  }
}

}  // namespace relay
