#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolsmith::gateway {

struct InboundMessage {
  std::string sender;
  std::string content;
  std::chrono::system_clock::time_point received_at;
};

/// Generic peer messages waiting for the caller. Bounded: once full the oldest
/// message is dropped.
class PeerInbox {
public:
  static constexpr std::size_t kDefaultCapacity = 1024;

  explicit PeerInbox(std::size_t capacity = kDefaultCapacity);

  void push(InboundMessage message);
  [[nodiscard]] std::optional<InboundMessage> pop();
  [[nodiscard]] std::optional<InboundMessage> wait_pop(std::chrono::milliseconds timeout);
  [[nodiscard]] std::vector<InboundMessage> drain();
  [[nodiscard]] bool empty() const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t dropped() const;

private:
  std::size_t capacity_;
  std::size_t dropped_ = 0;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<InboundMessage> queue_;
};

} // namespace toolsmith::gateway
