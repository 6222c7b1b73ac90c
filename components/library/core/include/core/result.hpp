/**
 * @file result.hpp
 * @brief Result type wrapping esp_err_t
 */

#pragma once

#include <esp_err.h>

#include <type_traits>
#include <utility>

namespace core {

/// Error marker produced by Err(), converts to any Result<T>
///
/// Needed where T itself is esp_err_t's underlying type (int32_t on the
/// linux target), so a bare error code would read as a value.
struct Error {
  esp_err_t code;
};

/// Result type for failable operations
///
/// Holds either a value or an esp_err_t. Constructing from ESP_OK is treated
/// as a failure (ESP_FAIL), since a successful result must carry a value.
template <typename T> class Result {
public:
  Result(const T &value) : value_(value), error_(ESP_OK) {}
  Result(T &&value) : value_(std::move(value)), error_(ESP_OK) {}

  Result(esp_err_t err)
    requires(!std::is_same_v<T, esp_err_t>)
      : value_{}, error_(err == ESP_OK ? ESP_FAIL : err) {}

  Result(Error err)
      : value_{}, error_(err.code == ESP_OK ? ESP_FAIL : err.code) {}

  [[nodiscard]] bool ok() const noexcept { return error_ == ESP_OK; }
  [[nodiscard]] explicit operator bool() const noexcept { return ok(); }
  [[nodiscard]] esp_err_t error() const noexcept { return error_; }

  [[nodiscard]] T &value() & noexcept { return value_; }
  [[nodiscard]] const T &value() const & noexcept { return value_; }
  [[nodiscard]] T &&value() && noexcept { return std::move(value_); }

  [[nodiscard]] T *operator->() noexcept { return &value_; }
  [[nodiscard]] const T *operator->() const noexcept { return &value_; }
  [[nodiscard]] T &operator*() & noexcept { return value_; }
  [[nodiscard]] const T &operator*() const & noexcept { return value_; }
  [[nodiscard]] T &&operator*() && noexcept { return std::move(value_); }

  template <typename U> [[nodiscard]] T value_or(U &&default_val) const & {
    return ok() ? value_ : static_cast<T>(std::forward<U>(default_val));
  }

private:
  T value_;
  esp_err_t error_;
};

/// Specialization for void
template <> class Result<void> {
public:
  Result() : error_(ESP_OK) {}
  Result(esp_err_t err) : error_(err) {}
  Result(Error err) : error_(err.code) {}

  [[nodiscard]] bool ok() const noexcept { return error_ == ESP_OK; }
  [[nodiscard]] explicit operator bool() const noexcept { return ok(); }
  [[nodiscard]] esp_err_t error() const noexcept { return error_; }

private:
  esp_err_t error_;
};

using Status = Result<void>;

/// Successful status
[[nodiscard]] inline Status Ok() { return {}; }

/// Failed result carrying @p err
[[nodiscard]] constexpr Error Err(esp_err_t err) noexcept { return {err}; }

} // namespace core
