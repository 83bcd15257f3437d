#pragma once

#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "common/Status.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string_view>
#include <thread>

namespace Pancake {

// Bounded retry with exponential backoff for transient transport failures.
struct RetryPolicy {
  uint32_t max_retries_{DEFAULT_MAX_RETRIES};
  std::chrono::milliseconds initial_backoff_{DEFAULT_INITIAL_BACKOFF};
  double backoff_multiplier_{DEFAULT_BACKOFF_MULTIPLIER};
  std::chrono::milliseconds max_backoff_{DEFAULT_MAX_BACKOFF};

  // Delay before retry number `retry` (1 based).
  std::chrono::milliseconds BackoffFor(uint32_t retry) const;

  static RetryPolicy NoRetry() {
    RetryPolicy policy;
    policy.max_retries_ = 0;
    return policy;
  }
};

// Invokes call() until it succeeds, fails with a non transient error or the
// retry budget of policy is spent. Only safe for idempotent calls. A raised
// cancelled flag stops further attempts.
template <typename Call>
Status CallWithRetry(const RetryPolicy &policy, std::string_view what,
                     const std::atomic<bool> *cancelled, Call &&call) {
  for (uint32_t attempt = 0;; attempt++) {
    if (cancelled != nullptr && cancelled->load()) {
      return Status::Error(ErrorCode::Cancelled,
                           fmt::format("{} cancelled", what));
    }
    auto status = call();
    if (status.ok() || !status.IsTransient()) {
      return status;
    }
    if (attempt >= policy.max_retries_) {
      LOG_ERROR("{} failed after {} attempts: {}", what, attempt + 1,
                status.GetMessage());
      return Status::Error(ErrorCode::TransportError,
                           fmt::format("{} failed after {} attempts: {}", what,
                                       attempt + 1, status.GetMessage()));
    }
    auto backoff = policy.BackoffFor(attempt + 1);
    LOG_WARN("{} hit a transient failure ({}), retry {}/{} in {}ms", what,
             status.GetMessage(), attempt + 1, policy.max_retries_,
             backoff.count());
    std::this_thread::sleep_for(backoff);
  }
}
} // namespace Pancake
