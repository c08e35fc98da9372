#pragma once

// ============================================================================
// cancel_token.h - Shared cancellation signal with optional deadline
// ============================================================================
//
// Copies share one state. cancel() wakes every sleeper in waitFor(). A token
// built with a deadline reports cancelled once the deadline has passed.

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace Common {

class CancelToken {
public:
  using Clock = std::chrono::steady_clock;

  CancelToken() : state_(std::make_shared<State>()) {}

  [[nodiscard]] static auto withTimeout(std::chrono::milliseconds timeout) -> CancelToken {
    CancelToken token;
    if (timeout.count() > 0) {
      token.state_->has_deadline = true;
      token.state_->deadline = Clock::now() + timeout;
    }
    return token;
  }

  auto cancel() const noexcept -> void {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->cancelled = true;
    }
    state_->cv.notify_all();
  }

  [[nodiscard]] auto isCancelled() const noexcept -> bool {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return cancelledLocked();
  }

  [[nodiscard]] auto hasDeadline() const noexcept -> bool {
    return state_->has_deadline;
  }

  /// Time left before the deadline; max() when there is none.
  [[nodiscard]] auto remaining() const noexcept -> std::chrono::milliseconds {
    if (!state_->has_deadline) {
      return std::chrono::milliseconds::max();
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(state_->deadline - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
  }

  /// Sleep for `duration` unless cancelled first.
  /// Returns false when the sleep was cut short by cancellation.
  auto waitFor(std::chrono::milliseconds duration) const noexcept -> bool {
    std::unique_lock<std::mutex> lock(state_->mutex);
    auto until = Clock::now() + duration;
    if (state_->has_deadline && state_->deadline < until) {
      state_->cv.wait_until(lock, state_->deadline, [this] { return state_->cancelled; });
      return false;
    }
    state_->cv.wait_until(lock, until, [this] { return state_->cancelled; });
    return !state_->cancelled;
  }

  /// Cause text for error messages.
  [[nodiscard]] auto reason() const noexcept -> const char* {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->cancelled && state_->has_deadline && Clock::now() >= state_->deadline) {
      return "context deadline exceeded";
    }
    return "context canceled";
  }

private:
  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled{false};
    bool has_deadline{false};
    Clock::time_point deadline{};
  };

  auto cancelledLocked() const noexcept -> bool {
    return state_->cancelled || (state_->has_deadline && Clock::now() >= state_->deadline);
  }

  std::shared_ptr<State> state_;
};

} // namespace Common
