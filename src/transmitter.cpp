// transmitter.cpp

#include "transmitter.h"

#include <cstring>
#include <string>
#include <utility>

namespace relay {

Transmitter::Transmitter(UdpEndpoint endpoint, const SocketAddressV4& destination, PacketBus& bus)
    : endpoint_(std::move(endpoint)), destination_(destination), sub_(bus.subscribe()) {
}

Transmitter::~Transmitter() {
  stop();
}

void Transmitter::start() {
  if (tx_thread_.joinable()) return;
  running_.store(true, std::memory_order_release);
  tx_thread_ = std::thread(&Transmitter::tx_loop, this);
  log_.info("forwarding to %s from %s", destination_.to_string().c_str(),
            local_address().to_string().c_str());
}

void Transmitter::stop() {
  sub_.cancel();
  if (tx_thread_.joinable()) tx_thread_.join();
}

Transmitter::Stats Transmitter::stats() const {
  return Stats{sent_.load(), bytes_sent_.load(), send_errors_.load(), lag_events_.load(),
               lagged_packets_.load()};
}

void Transmitter::tx_loop() {
  bool open = true;
  while (open) {
    ReceiveResult r = sub_.receive();
    switch (r.status) {
      case ReceiveResult::Status::Packet:
        forward(*r.packet);
        break;
      case ReceiveResult::Status::Lagged:
        lag_events_.fetch_add(1, std::memory_order_relaxed);
        lagged_packets_.fetch_add(r.missed, std::memory_order_relaxed);
        log_.warn("%s: fell behind, %llu packets dropped", destination_.to_string().c_str(),
                  static_cast<unsigned long long>(r.missed));
        break;
      case ReceiveResult::Status::Empty:
        break;
      case ReceiveResult::Status::Closed:
        open = false;
        break;
    }
  }

  running_.store(false, std::memory_order_release);
  log_.debug("%s: transmit loop exited", destination_.to_string().c_str());
}

void Transmitter::forward(const RelayedPacket& packet) {
  SendResult r = endpoint_.send_to(packet.payload, destination_);
  if (r.error != 0) {
    send_errors_.fetch_add(1, std::memory_order_relaxed);
    log_.warn("send of %zu bytes to %s failed: %s", packet.payload.size(),
              destination_.to_string().c_str(), std::strerror(r.error));
    return;
  }

  sent_.fetch_add(1, std::memory_order_relaxed);
  bytes_sent_.fetch_add(r.sent, std::memory_order_relaxed);
  if (log_.enabled(Severity::Trace)) {
    log_.trace("sent %zu bytes from %s to %s", r.sent, packet.source.to_string().c_str(),
               destination_.to_string().c_str());
  }
}

}  // namespace relay
