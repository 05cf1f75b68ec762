// packet_bus.cpp

#include "packet_bus.h"

#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace relay {

const char* to_string(PublishStatus s) {
  switch (s) {
    case PublishStatus::Ok:
      return "ok";
    case PublishStatus::NoSubscribers:
      return "no active subscribers";
    case PublishStatus::Closed:
      return "bus closed";
  }
  return "?";
}

// Ring of the last `capacity` packets indexed by sequence number. `tail` is
// the sequence number the next publish will get.
struct PacketBus::State {
  explicit State(size_t cap) : ring(cap) {
  }

  mutable std::mutex mu;
  std::condition_variable cv;
  std::vector<PacketPtr> ring;
  uint64_t tail{0};
  size_t subscribers{0};
  bool closed{false};
};

// ── PacketBus ─────────────────────────────────────────────────────────────────

PacketBus::PacketBus(size_t capacity) {
  if (capacity == 0) throw std::invalid_argument("PacketBus: capacity must be at least 1");
  state_ = std::make_shared<State>(capacity);
}

PacketBus::~PacketBus() {
  close();
}

PublishStatus PacketBus::publish(PacketPtr packet) {
  {
    std::lock_guard lk(state_->mu);
    if (state_->closed) return PublishStatus::Closed;
    if (state_->subscribers == 0) return PublishStatus::NoSubscribers;

    auto& ring = state_->ring;
    ring[state_->tail % ring.size()] = std::move(packet);
    ++state_->tail;
  }
  state_->cv.notify_all();
  return PublishStatus::Ok;
}

PacketBus::Subscription PacketBus::subscribe() {
  std::lock_guard lk(state_->mu);
  ++state_->subscribers;
  return Subscription(state_, state_->tail);
}

void PacketBus::close() {
  {
    std::lock_guard lk(state_->mu);
    state_->closed = true;
  }
  state_->cv.notify_all();
}

bool PacketBus::is_closed() const {
  std::lock_guard lk(state_->mu);
  return state_->closed;
}

size_t PacketBus::subscriber_count() const {
  std::lock_guard lk(state_->mu);
  return state_->subscribers;
}

size_t PacketBus::capacity() const {
  return state_->ring.size();
}

// ── Subscription ──────────────────────────────────────────────────────────────

PacketBus::Subscription::Subscription(std::shared_ptr<State> state, uint64_t next)
    : state_(std::move(state)), next_(next) {
}

PacketBus::Subscription::~Subscription() {
  release();
}

PacketBus::Subscription::Subscription(Subscription&& o) noexcept
    : state_(std::move(o.state_)), next_(o.next_), cancelled_(o.cancelled_) {
}

PacketBus::Subscription& PacketBus::Subscription::operator=(Subscription&& o) noexcept {
  if (this != &o) {
    release();
    state_ = std::move(o.state_);
    next_ = o.next_;
    cancelled_ = o.cancelled_;
  }
  return *this;
}

void PacketBus::Subscription::release() {
  if (!state_) return;
  {
    std::lock_guard lk(state_->mu);
    --state_->subscribers;
  }
  state_.reset();
}

ReceiveResult PacketBus::Subscription::next_locked() {
  if (cancelled_) return ReceiveResult{ReceiveResult::Status::Closed, nullptr};

  const auto& ring = state_->ring;
  const uint64_t tail = state_->tail;
  const uint64_t oldest = tail > ring.size() ? tail - ring.size() : 0;

  if (next_ < oldest) {
    ReceiveResult r{ReceiveResult::Status::Lagged, nullptr, oldest - next_};
    next_ = oldest;
    return r;
  }
  if (next_ < tail) {
    return ReceiveResult{ReceiveResult::Status::Packet, ring[next_++ % ring.size()]};
  }
  if (state_->closed) return ReceiveResult{ReceiveResult::Status::Closed, nullptr};
  return ReceiveResult{ReceiveResult::Status::Empty, nullptr};
}

ReceiveResult PacketBus::Subscription::receive() {
  if (!state_) return ReceiveResult{ReceiveResult::Status::Closed, nullptr};

  std::unique_lock lk(state_->mu);
  state_->cv.wait(lk, [this] { return next_ < state_->tail || state_->closed || cancelled_; });
  return next_locked();
}

ReceiveResult PacketBus::Subscription::try_receive() {
  if (!state_) return ReceiveResult{ReceiveResult::Status::Closed, nullptr};

  std::lock_guard lk(state_->mu);
  return next_locked();
}

void PacketBus::Subscription::cancel() {
  if (!state_) return;
  {
    std::lock_guard lk(state_->mu);
    cancelled_ = true;
  }
  state_->cv.notify_all();
}

}  // namespace relay
