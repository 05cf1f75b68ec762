// receiver.cpp

#include "receiver.h"

#include <sys/select.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

#include "relay_error.h"

namespace relay {

bool is_fatal_socket_error(int err) {
  switch (err) {
    case EBADF:
    case ENOTSOCK:
    case EFAULT:
    case EINVAL:
      return true;
    default:
      return false;
  }
}

Receiver::Receiver(UdpEndpoint endpoint, const AddressFilter& filter, PacketBus& bus,
                   size_t buffer_size)
    : endpoint_(std::move(endpoint)),
      filter_(filter),
      bus_(bus),
      buf_(std::max(buffer_size, kMinBufferSize)) {
  if (::pipe(wake_) < 0) throw sys_error("Receiver: pipe()");
}

Receiver::~Receiver() {
  stop();
  ::close(wake_[0]);
  ::close(wake_[1]);
}

void Receiver::start() {
  if (rx_thread_.joinable()) return;
  running_.store(true, std::memory_order_release);
  rx_thread_ = std::thread(&Receiver::rx_loop, this);
  log_.info("listening on %s (buffer %zu bytes)", local_address().to_string().c_str(),
            buf_.size());
}

void Receiver::stop() {
  if (!rx_thread_.joinable()) return;
  char b = 0;
  if (::write(wake_[1], &b, 1) < 0) {
    log_.error("%s: wake pipe write failed: %s", local_address().to_string().c_str(),
               std::strerror(errno));
  }
  rx_thread_.join();
}

Receiver::Stats Receiver::stats() const {
  return Stats{received_.load(),  filtered_.load(),         non_ipv4_.load(),
               truncated_.load(), published_.load(),        publish_failures_.load(),
               read_errors_.load()};
}

void Receiver::rx_loop() {
  const int sock = endpoint_.fd();
  const int pip = wake_[0];
  const int maxfd = std::max(sock, pip) + 1;
  const std::string name = local_address().to_string();

  while (true) {
    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(sock, &fds);
    FD_SET(pip, &fds);

    if (::select(maxfd, &fds, nullptr, nullptr, nullptr) < 0) {
      if (errno == EINTR) continue;
      log_.error("%s: select() failed: %s", name.c_str(), std::strerror(errno));
      break;
    }
    if (FD_ISSET(pip, &fds)) break;
    if (!FD_ISSET(sock, &fds)) continue;

    RecvResult r = endpoint_.recv_from(buf_);
    if (r.error == EAGAIN || r.error == EWOULDBLOCK) continue;
    if (r.error != 0) {
      read_errors_.fetch_add(1, std::memory_order_relaxed);
      if (is_fatal_socket_error(r.error)) {
        log_.error("%s: unrecoverable read error, receiver stopped: %s", name.c_str(),
                   std::strerror(r.error));
        break;
      }
      log_.warn("%s: read error: %s", name.c_str(), std::strerror(r.error));
      continue;
    }

    handle_datagram(r);
  }

  running_.store(false, std::memory_order_release);
  log_.debug("%s: receive loop exited", name.c_str());
}

void Receiver::handle_datagram(const RecvResult& r) {
  received_.fetch_add(1, std::memory_order_relaxed);

  if (r.family != AF_INET) {
    non_ipv4_.fetch_add(1, std::memory_order_relaxed);
    log_.trace("dropping %zu byte datagram from non-IPv4 source (family %d)", r.size,
               static_cast<int>(r.family));
    return;
  }

  if (r.truncated) {
    truncated_.fetch_add(1, std::memory_order_relaxed);
    log_.debug("datagram from %s truncated to %zu bytes", r.source.to_string().c_str(), r.size);
  }

  if (!filter_.should_transmit(r.source)) {
    filtered_.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  auto packet = std::make_shared<const RelayedPacket>(
      RelayedPacket{std::vector<uint8_t>(buf_.data(), buf_.data() + r.size), r.source});

  PublishStatus st = bus_.publish(std::move(packet));
  if (st != PublishStatus::Ok) {
    publish_failures_.fetch_add(1, std::memory_order_relaxed);
    log_.warn("could not relay %zu bytes from %s: %s", r.size, r.source.to_string().c_str(),
              to_string(st));
    return;
  }

  published_.fetch_add(1, std::memory_order_relaxed);
  if (log_.enabled(Severity::Trace)) {
    log_.trace("relaying %zu bytes from %s", r.size, r.source.to_string().c_str());
  }
}

}  // namespace relay
