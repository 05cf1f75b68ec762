#pragma once
// transmitter.h — Forwards every bus packet to one destination.
//
// The subscription is taken in the constructor, so a Transmitter sees every
// packet published after it exists even before start() is called. Send
// failures and bus lag are logged; the loop only ends on stop() or when the
// bus is closed.

#include <atomic>
#include <cstdint>
#include <thread>

#include "component_logger.h"
#include "packet_bus.h"
#include "udp_endpoint.h"

namespace relay {

class Transmitter {
 public:
  struct Stats {
    uint64_t sent;
    uint64_t bytes_sent;
    uint64_t send_errors;
    uint64_t lag_events;
    uint64_t lagged_packets;
  };

  Transmitter(UdpEndpoint endpoint, const SocketAddressV4& destination, PacketBus& bus);
  ~Transmitter();

  Transmitter(const Transmitter&) = delete;
  Transmitter& operator=(const Transmitter&) = delete;

  void start();

  // Cancels the subscription and joins the loop. Idempotent.
  void stop();

  bool is_running() const {
    return running_.load(std::memory_order_acquire);
  }

  SocketAddressV4 local_address() const {
    return endpoint_.local_address();
  }
  SocketAddressV4 destination() const {
    return destination_;
  }

  Stats stats() const;

 private:
  UdpEndpoint endpoint_;
  const SocketAddressV4 destination_;
  PacketBus::Subscription sub_;
  std::thread tx_thread_;
  std::atomic<bool> running_{false};
  ComponentLogger log_{"transmitter"};

  std::atomic<uint64_t> sent_{0};
  std::atomic<uint64_t> bytes_sent_{0};
  std::atomic<uint64_t> send_errors_{0};
  std::atomic<uint64_t> lag_events_{0};
  std::atomic<uint64_t> lagged_packets_{0};

  void tx_loop();
  void forward(const RelayedPacket& packet);
};

}  // namespace relay
