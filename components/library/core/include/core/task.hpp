/**
 * @file task.hpp
 * @brief Owning FreeRTOS task
 */

#pragma once

#include "ticks.hpp"

#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

#include <cassert>
#include <chrono>
#include <cstdint>
#include <functional>
#include <utility>

namespace core {

struct TaskConfig {
  const char *name = "worker";
  uint32_t stack_size = 4096;
  UBaseType_t priority = 5;
};

/// Runs @p body once on its own FreeRTOS task.
///
/// When the body returns the task parks itself, so destroying the Task is
/// the only place the handle is deleted. Bodies that loop must be stopped
/// through a CancellationToken before the Task goes away.
class Task {
public:
  explicit Task(std::function<void()> body, const TaskConfig &config = {})
      : body_(std::move(body)) {
    [[maybe_unused]] BaseType_t created =
        xTaskCreate(&Task::entry, config.name, config.stack_size, this,
                    config.priority, &handle_);
    assert(created == pdPASS && "task creation failed");
  }

  ~Task() {
    if (handle_ != nullptr) {
      vTaskDelete(handle_);
    }
  }

  Task(const Task &) = delete;
  Task &operator=(const Task &) = delete;

  /// Sleep the calling task; zero or negative yields
  template <typename Rep, typename Period>
  static void delay(std::chrono::duration<Rep, Period> d) {
    TickType_t ticks = to_ticks(d);
    if (ticks == 0) {
      taskYIELD();
    } else {
      vTaskDelay(ticks);
    }
  }

private:
  static void entry(void *arg) {
    auto *self = static_cast<Task *>(arg);
    if (self->body_) {
      self->body_();
    }
    vTaskSuspend(nullptr);
  }

  std::function<void()> body_;
  TaskHandle_t handle_ = nullptr;
};

} // namespace core
