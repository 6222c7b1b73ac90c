/**
 * @file interface.hpp
 * @brief Abstract byte transport for dependency injection and testing
 */

#pragma once

#include "types.hpp"

#include <core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace driver::serial {

/**
 * @brief Abstract byte-stream transport
 *
 * Owns one session on a physical port. Incoming bytes accumulate in a
 * receive buffer until a read drains them. Operations on a closed
 * transport return ESP_ERR_INVALID_STATE.
 */
class ITransport {
public:
  virtual ~ITransport() = default;

  ITransport(const ITransport &) = delete;
  ITransport &operator=(const ITransport &) = delete;
  ITransport(ITransport &&) = default;
  ITransport &operator=(ITransport &&) = default;

  /// Open the port with the configured baud rate
  [[nodiscard]] virtual core::Status open() = 0;

  /// Close the port, idempotent
  [[nodiscard]] virtual core::Status close() = 0;

  [[nodiscard]] virtual bool is_open() const = 0;

  /// Human-readable port identifier
  [[nodiscard]] virtual std::string_view port_name() const = 0;

  /// Write all bytes; returns once they have left the transmitter
  [[nodiscard]] virtual core::Status write(std::span<const uint8_t> data) = 0;

  /// Wait max(timeout, RESPONSE_WINDOW) and return whatever accumulated
  [[nodiscard]] virtual core::Result<std::vector<uint8_t>>
  read(Timeout timeout = RESPONSE_WINDOW) = 0;

  /// Return exactly @p count bytes or fail with ESP_ERR_TIMEOUT
  [[nodiscard]] virtual core::Result<std::vector<uint8_t>>
  read(size_t count, Timeout timeout = DEFAULT_READ_TIMEOUT) = 0;

  /// Discard unread input
  [[nodiscard]] virtual core::Status flush() = 0;

  /// Write a single byte
  [[nodiscard]] core::Status write(uint8_t byte) {
    return write(std::span<const uint8_t>(&byte, 1));
  }

protected:
  ITransport() = default;
};

} // namespace driver::serial
