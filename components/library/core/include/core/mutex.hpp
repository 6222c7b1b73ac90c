/**
 * @file mutex.hpp
 * @brief Recursive FreeRTOS mutex and scoped lock
 */

#pragma once

#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>

#include <cassert>

namespace core {

/// Re-entrant for the owning task.
///
/// Bus drivers build public operations from other public operations
/// (a register write is start + write + stop) and hold one lock across the
/// whole exchange.
class RecursiveMutex {
public:
  RecursiveMutex() : handle_(xSemaphoreCreateRecursiveMutex()) {
    assert(handle_ != nullptr && "out of heap for recursive mutex");
  }
  ~RecursiveMutex() { vSemaphoreDelete(handle_); }

  RecursiveMutex(const RecursiveMutex &) = delete;
  RecursiveMutex &operator=(const RecursiveMutex &) = delete;

  void lock() { xSemaphoreTakeRecursive(handle_, portMAX_DELAY); }
  void unlock() { xSemaphoreGiveRecursive(handle_); }

private:
  SemaphoreHandle_t handle_;
};

/// Holds @p Mutex for the enclosing scope
template <typename Mutex> class LockGuard {
public:
  explicit LockGuard(Mutex &m) : mutex_(m) { mutex_.lock(); }
  ~LockGuard() { mutex_.unlock(); }

  LockGuard(const LockGuard &) = delete;
  LockGuard &operator=(const LockGuard &) = delete;

private:
  Mutex &mutex_;
};

} // namespace core
