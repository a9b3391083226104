#pragma once

#include <chrono>
#include <limits>

namespace dumpconform::internal {

using Clock = std::chrono::steady_clock;

// Milliseconds left until @p deadline as a poll() timeout, in [0, INT_MAX]. A negative value
// would mean "wait forever" to poll().
inline int RemainingMs(Clock::time_point deadline, Clock::time_point now = Clock::now()) {
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
  if (left <= 0) {
    return 0;
  }
  if (left > static_cast<long long>(std::numeric_limits<int>::max())) {
    return std::numeric_limits<int>::max();
  }
  return static_cast<int>(left);
}

} // namespace dumpconform::internal
