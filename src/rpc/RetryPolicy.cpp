#include "rpc/RetryPolicy.hpp"

#include <algorithm>
#include <cmath>

namespace Pancake {

std::chrono::milliseconds RetryPolicy::BackoffFor(uint32_t retry) const {
  if (retry == 0) {
    return std::chrono::milliseconds{0};
  }
  double delay = static_cast<double>(initial_backoff_.count()) *
                 std::pow(backoff_multiplier_, static_cast<double>(retry - 1));
  double cap = static_cast<double>(max_backoff_.count());
  return std::chrono::milliseconds{
      static_cast<int64_t>(std::min(delay, cap))};
}
} // namespace Pancake
