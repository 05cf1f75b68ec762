#pragma once
// receiver.h — One listening endpoint feeding the PacketBus.
//
// A dedicated thread reads datagrams, drops non-IPv4 sources and anything the
// AddressFilter rejects, and publishes the rest. Transient read errors and
// publish failures are logged and the loop keeps going; only an unusable
// socket ends it.

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <thread>
#include <vector>

#include "address_filter.h"
#include "component_logger.h"
#include "packet_bus.h"
#include "udp_endpoint.h"

namespace relay {

class Receiver {
 public:
  // 65535 covers the largest UDP payload over IPv4; smaller buffers truncate.
  static constexpr size_t kDefaultBufferSize = 65535;
  static constexpr size_t kMinBufferSize = 4096;

  struct Stats {
    uint64_t received;
    uint64_t filtered;
    uint64_t non_ipv4;
    uint64_t truncated;
    uint64_t published;
    uint64_t publish_failures;
    uint64_t read_errors;
  };

  Receiver(UdpEndpoint endpoint, const AddressFilter& filter, PacketBus& bus,
           size_t buffer_size = kDefaultBufferSize);
  ~Receiver();

  Receiver(const Receiver&) = delete;
  Receiver& operator=(const Receiver&) = delete;

  void start();

  // Wakes the receive loop and joins it. Idempotent.
  void stop();

  // False once the loop has exited (stop() or an unrecoverable socket error).
  bool is_running() const {
    return running_.load(std::memory_order_acquire);
  }

  SocketAddressV4 local_address() const {
    return endpoint_.local_address();
  }

  Stats stats() const;

 private:
  UdpEndpoint endpoint_;
  const AddressFilter& filter_;
  PacketBus& bus_;
  std::vector<uint8_t> buf_;
  int wake_[2];
  std::thread rx_thread_;
  std::atomic<bool> running_{false};
  ComponentLogger log_{"receiver"};

  std::atomic<uint64_t> received_{0};
  std::atomic<uint64_t> filtered_{0};
  std::atomic<uint64_t> non_ipv4_{0};
  std::atomic<uint64_t> truncated_{0};
  std::atomic<uint64_t> published_{0};
  std::atomic<uint64_t> publish_failures_{0};
  std::atomic<uint64_t> read_errors_{0};

  void rx_loop();
  void handle_datagram(const RecvResult& r);
};

// Socket errors after which reading again cannot succeed.
bool is_fatal_socket_error(int err);

}  // namespace relay
