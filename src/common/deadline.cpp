#include "toolsmith/common/deadline.hpp"

namespace toolsmith::common::detail {

std::atomic<std::size_t> &in_flight_workers() {
  static std::atomic<std::size_t> count{0};
  return count;
}

} // namespace toolsmith::common::detail
