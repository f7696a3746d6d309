#include "toolsmith/gateway/inbox.hpp"

namespace toolsmith::gateway {

PeerInbox::PeerInbox(const std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void PeerInbox::push(InboundMessage message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.size() >= capacity_) {
    queue_.pop_front();
    ++dropped_;
  }
  queue_.push_back(std::move(message));
  cv_.notify_one();
}

std::optional<InboundMessage> PeerInbox::pop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.empty()) {
    return std::nullopt;
  }
  auto value = std::move(queue_.front());
  queue_.pop_front();
  return value;
}

std::optional<InboundMessage> PeerInbox::wait_pop(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!cv_.wait_for(lock, timeout, [this]() { return !queue_.empty(); })) {
    return std::nullopt;
  }
  auto value = std::move(queue_.front());
  queue_.pop_front();
  return value;
}

std::vector<InboundMessage> PeerInbox::drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<InboundMessage> out;
  out.reserve(queue_.size());
  while (!queue_.empty()) {
    out.push_back(std::move(queue_.front()));
    queue_.pop_front();
  }
  return out;
}

bool PeerInbox::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.empty();
}

std::size_t PeerInbox::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

std::size_t PeerInbox::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

} // namespace toolsmith::gateway
