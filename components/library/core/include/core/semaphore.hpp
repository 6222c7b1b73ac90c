/**
 * @file semaphore.hpp
 * @brief Binary FreeRTOS semaphore used for one-shot wake-ups
 */

#pragma once

#include "ticks.hpp"

#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>

#include <cassert>
#include <chrono>

namespace core {

/// Starts empty. give() from one task releases one take_for() in another.
class BinarySemaphore {
public:
  BinarySemaphore() : handle_(xSemaphoreCreateBinary()) {
    assert(handle_ != nullptr && "out of heap for binary semaphore");
  }
  ~BinarySemaphore() { vSemaphoreDelete(handle_); }

  BinarySemaphore(const BinarySemaphore &) = delete;
  BinarySemaphore &operator=(const BinarySemaphore &) = delete;

  /// Block up to @p timeout; false when nobody gave in time
  template <typename Rep, typename Period>
  [[nodiscard]] bool take_for(std::chrono::duration<Rep, Period> timeout) {
    return xSemaphoreTake(handle_, to_ticks(timeout)) == pdTRUE;
  }

  void give() { xSemaphoreGive(handle_); }

private:
  SemaphoreHandle_t handle_;
};

} // namespace core
