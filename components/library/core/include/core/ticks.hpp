/**
 * @file ticks.hpp
 * @brief std::chrono to FreeRTOS tick conversion
 */

#pragma once

#include <freertos/FreeRTOS.h>

#include <chrono>

namespace core {

/// Convert a duration to scheduler ticks, rounding sub-tick waits up to one
/// tick so a short non-zero timeout never turns into a poll
template <typename Rep, typename Period>
[[nodiscard]] TickType_t to_ticks(std::chrono::duration<Rep, Period> d) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
  if (ms <= 0) {
    return 0;
  }
  TickType_t ticks = pdMS_TO_TICKS(ms);
  return ticks > 0 ? ticks : 1;
}

} // namespace core
