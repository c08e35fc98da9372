#pragma once

// ============================================================================
// retry.h - Retry envelope for remote calls
// ============================================================================
//
// Attempt n (0-based) that fails with a retryable error sleeps
// base_delay * 2^n before the next attempt. No sleep follows the last attempt.
// The sleep wakes immediately on cancellation and the cancellation error is
// returned in place of the operation's error.

#include <chrono>
#include <cstdint>
#include <functional>

#include "common/cancel_token.h"
#include "common/logging.h"
#include "drift/provider/api_error.h"

namespace Drift::Provider {

[[nodiscard]] auto defaultRetryable(const ApiError& error) noexcept -> bool;

struct RetryPolicy {
  uint32_t max_attempts{3};
  std::chrono::milliseconds base_delay{1000};
  std::function<bool(const ApiError&)> is_retryable{defaultRetryable};

  [[nodiscard]] auto delayFor(uint32_t attempt) const noexcept -> std::chrono::milliseconds {
    return base_delay * (int64_t{1} << (attempt > 30 ? 30 : attempt));
  }
};

[[nodiscard]] auto cancelledError(const Common::CancelToken& cancel) -> ApiError;

/// `op` is any callable returning ApiError; it is invoked at most
/// policy.max_attempts times.
template<typename Op>
auto executeWithRetry(const RetryPolicy& policy, const Common::CancelToken& cancel,
                      const char* op_name, Op&& op) -> ApiError {
  const uint32_t attempts = policy.max_attempts == 0 ? 1 : policy.max_attempts;
  ApiError last;

  for (uint32_t attempt = 0; attempt < attempts; ++attempt) {
    if (cancel.isCancelled()) {
      return cancelledError(cancel);
    }

    last = op();
    if (last.ok() || last.cancelled()) {
      return last;
    }

    const bool retryable = policy.is_retryable ? policy.is_retryable(last) : false;
    if (!retryable) {
      last.kind = ErrorKind::PERMANENT;
      return last;
    }

    if (attempt + 1 < attempts) {
      auto delay = policy.delayFor(attempt);
      LOG_DEBUG("%s: transient error (%s), retry %u/%u in %lldms",
                op_name, last.describe().c_str(), attempt + 1, attempts - 1,
                static_cast<long long>(delay.count()));
      if (!cancel.waitFor(delay)) {
        return cancelledError(cancel);
      }
    }
  }

  LOG_WARN("%s: giving up after %u attempts: %s", op_name, attempts, last.describe().c_str());
  last.kind = ErrorKind::TRANSIENT;
  last.message = "max retries exceeded: " + last.describe();
  return last;
}

} // namespace Drift::Provider
