/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation for long-running driver loops
 *
 * A CancellationSource hands out tokens to the loop it controls. Cancelling
 * wakes any task blocked in CancellationToken::wait_for() immediately,
 * so a sampling loop stops within one I/O exchange instead of one full
 * settle period.
 *
 * @code
 *   core::CancellationSource source;
 *   auto token = source.token();
 *   while (!token.cancelled()) {
 *     sample();
 *     if (token.wait_for(std::chrono::milliseconds(67))) break;
 *   }
 *   // elsewhere: source.cancel();
 * @endcode
 */

#pragma once

#include "semaphore.hpp"

#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

#include <atomic>
#include <chrono>
#include <memory>

namespace core {

namespace detail {
struct CancellationState {
  std::atomic<bool> cancelled{false};
  BinarySemaphore signal;
};
} // namespace detail

/// Observer side, cheap to copy
class CancellationToken {
public:
  CancellationToken() = default;

  [[nodiscard]] bool cancelled() const {
    return state_ != nullptr && state_->cancelled.load();
  }

  /// Sleep for up to @p duration, returns true if cancelled
  template <typename Rep, typename Period>
  [[nodiscard]] bool wait_for(std::chrono::duration<Rep, Period> duration) const {
    if (state_ == nullptr) {
      vTaskDelay(to_ticks(duration));
      return false;
    }
    if (state_->cancelled.load()) {
      return true;
    }
    if (state_->signal.take_for(duration)) {
      // Pass the wake-up on to any other waiter
      state_->signal.give();
      return true;
    }
    return state_->cancelled.load();
  }

private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::CancellationState> state_;
};

/// Owner side
class CancellationSource {
public:
  CancellationSource() : state_(std::make_shared<detail::CancellationState>()) {}

  CancellationSource(const CancellationSource &) = delete;
  CancellationSource &operator=(const CancellationSource &) = delete;
  CancellationSource(CancellationSource &&) = default;
  CancellationSource &operator=(CancellationSource &&) = default;

  [[nodiscard]] CancellationToken token() const {
    return CancellationToken(state_);
  }

  /// Request cancellation; idempotent
  void cancel() {
    if (!state_->cancelled.exchange(true)) {
      state_->signal.give();
    }
  }

  [[nodiscard]] bool cancelled() const { return state_->cancelled.load(); }

  /// Start a fresh cancellation scope. Tokens handed out earlier stay
  /// cancelled.
  void reset() { state_ = std::make_shared<detail::CancellationState>(); }

private:
  std::shared_ptr<detail::CancellationState> state_;
};

} // namespace core
