#pragma once

#include "toolsmith/common/result.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

namespace toolsmith::common {

/// Upper bound on background workers still running after their caller gave up.
inline constexpr std::size_t kMaxAbandonedWorkers = 8;

namespace detail {

std::atomic<std::size_t> &in_flight_workers();

template <typename T> struct DeadlineState {
  std::mutex mutex;
  std::condition_variable cv;
  std::optional<Result<T>> result;
};

} // namespace detail

/// Run a blocking task on a worker thread and wait at most `timeout` for it.
/// On expiry the caller gets Timeout and the worker finishes in the background;
/// its result is discarded. At most kMaxAbandonedWorkers may be outstanding.
template <typename T>
Result<T> run_with_deadline(std::function<Result<T>()> task, const std::chrono::milliseconds timeout,
                            const std::string &label) {
  auto &in_flight = detail::in_flight_workers();
  if (in_flight.load() >= kMaxAbandonedWorkers) {
    return Result<T>::failure(ErrorCode::Timeout,
                              label + ": too many stalled background operations");
  }

  auto state = std::make_shared<detail::DeadlineState<T>>();
  in_flight.fetch_add(1);
  try {
    std::thread([state, task = std::move(task)]() {
      auto outcome = task();
      {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->result.emplace(std::move(outcome));
      }
      state->cv.notify_all();
      detail::in_flight_workers().fetch_sub(1);
    }).detach();
  } catch (const std::system_error &ex) {
    in_flight.fetch_sub(1);
    return Result<T>::failure(ErrorCode::IOError,
                              label + ": failed to start worker: " + std::string(ex.what()));
  }

  std::unique_lock<std::mutex> lock(state->mutex);
  if (!state->cv.wait_for(lock, timeout, [&state] { return state->result.has_value(); })) {
    return Result<T>::failure(ErrorCode::Timeout,
                              label + " timed out after " + std::to_string(timeout.count()) +
                                  "ms");
  }
  return std::move(*state->result);
}

} // namespace toolsmith::common
