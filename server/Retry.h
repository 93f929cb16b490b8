#pragma once

#include "ErrorCodes.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>

namespace pl {

/** Bounded exponential backoff for idempotent gateway reads. */
struct RetryPolicy {
  int maxAttempts{ 3 };
  int64_t initialBackoffMs{ 200 };
  int64_t maxBackoffMs{ 2000 };
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline void sleepFor(std::chrono::milliseconds duration) {
  std::this_thread::sleep_for(duration);
}

/**
 * Call fn until it succeeds, fails with a non-transient error, or the
 * attempts run out. fn returns a ResultOrError; the last result is returned.
 */
template <typename Fn>
auto retryTransient(const RetryPolicy &policy, const Sleeper &sleep, Fn fn) -> decltype(fn()) {
  int64_t backoffMs = policy.initialBackoffMs;
  int attempts = std::max(policy.maxAttempts, 1);
  for (int attempt = 1;; ++attempt) {
    auto result = fn();
    if (result || attempt >= attempts || !err::isTransientGatewayError(result.error().code)) {
      return result;
    }
    sleep(std::chrono::milliseconds(backoffMs));
    backoffMs = std::min(backoffMs * 2, policy.maxBackoffMs);
  }
}

} // namespace pl
