#pragma once
// relay_coordinator.h — Owns and wires the relay pipeline.
//
//   Receiver ─┐                         ┌─> Transmitter ─> destination
//   Receiver ─┼─> AddressFilter ─> Bus ─┼─> Transmitter ─> destination
//   Receiver ─┘                         └─> Transmitter ─> destination
//
// Transmitter sockets are bound first so that their real local addresses can
// join the storm guard; every Transmitter subscribes before any Receiver
// starts. Bind failures throw out of the constructor.

#include <memory>
#include <vector>

#include "address_filter.h"
#include "component_logger.h"
#include "packet_bus.h"
#include "receiver.h"
#include "relay_plan.h"
#include "transmitter.h"

namespace relay {

class RelayCoordinator {
 public:
  explicit RelayCoordinator(const RelayPlan& plan);
  ~RelayCoordinator();

  RelayCoordinator(const RelayCoordinator&) = delete;
  RelayCoordinator& operator=(const RelayCoordinator&) = delete;

  void start();

  // Stops Receivers, closes the bus, joins Transmitters and logs counters.
  // Idempotent; also run by the destructor.
  void stop();

  const AddressFilter& filter() const {
    return *filter_;
  }
  PacketBus& bus() {
    return bus_;
  }
  const std::vector<std::unique_ptr<Receiver>>& receivers() const {
    return receivers_;
  }
  const std::vector<std::unique_ptr<Transmitter>>& transmitters() const {
    return transmitters_;
  }

 private:
  PacketBus bus_;
  std::unique_ptr<AddressFilter> filter_;
  std::vector<std::unique_ptr<Transmitter>> transmitters_;
  std::vector<std::unique_ptr<Receiver>> receivers_;
  bool stopped_{false};
  ComponentLogger log_{"coordinator"};

  void log_stats() const;
};

}  // namespace relay
