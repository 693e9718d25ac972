#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>

#include "mpcrec/common/errors.hpp"
#include "mpcrec/common/logging.hpp"

namespace mpcrec {

struct RetryPolicy {
  uint32_t max_attempts = 3;
  std::chrono::milliseconds initial_backoff{100};
  std::chrono::milliseconds max_backoff{2000};
  uint32_t multiplier = 2;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline void ValidateRetryPolicy(const RetryPolicy& policy) {
  if (policy.max_attempts == 0) {
    throw std::invalid_argument("retry max_attempts must be > 0");
  }
  if (policy.initial_backoff.count() < 0 || policy.max_backoff < policy.initial_backoff) {
    throw std::invalid_argument("retry backoff bounds are inconsistent");
  }
  if (policy.multiplier == 0) {
    throw std::invalid_argument("retry multiplier must be > 0");
  }
}

// Backoff to wait after the given failed attempt (1-based).
inline std::chrono::milliseconds BackoffForAttempt(const RetryPolicy& policy, uint32_t attempt) {
  std::chrono::milliseconds backoff = policy.initial_backoff;
  for (uint32_t i = 1; i < attempt && backoff < policy.max_backoff; ++i) {
    backoff *= policy.multiplier;
  }
  return std::min(backoff, policy.max_backoff);
}

inline Sleeper ThreadSleeper() {
  return [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
}

// Retries fn while it throws a retryable RecoveryError. Anything else, and the
// last retryable failure, propagates unchanged.
template <typename Fn>
auto RetryWithBackoff(const RetryPolicy& policy,
                      std::string_view what,
                      Fn&& fn,
                      const Sleeper& sleeper = ThreadSleeper()) -> std::invoke_result_t<Fn&> {
  ValidateRetryPolicy(policy);
  for (uint32_t attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const RecoveryError& ex) {
      if (!ex.retryable() || attempt >= policy.max_attempts) {
        throw;
      }
      const std::chrono::milliseconds backoff = BackoffForAttempt(policy, attempt);
      Log()->warn("{} failed (attempt {}/{}): {}; retrying in {} ms",
                  what, attempt, policy.max_attempts, ex.what(), backoff.count());
      sleeper(backoff);
    }
  }
}

}  // namespace mpcrec
