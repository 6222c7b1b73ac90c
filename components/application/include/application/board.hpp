/**
 * @file board.hpp
 * @brief Board hardware abstraction
 *
 * Owns the serial link to the I2C adapter and the tunnel running over it.
 * This is application-specific (not a reusable library component).
 */

#pragma once

#include <serial/uart.hpp>
#include <tunnel/tunnel.hpp>

#include <memory>

namespace application {

/// Board hardware configuration
struct BoardConfig {
  uart_port_t uart_port = UART_NUM_1;
  int uart_tx = UART_PIN_NO_CHANGE;
  int uart_rx = UART_PIN_NO_CHANGE;
  uint32_t baud_rate = driver::serial::DEFAULT_BAUD_RATE;
  driver::serial::Timeout read_timeout = driver::serial::DEFAULT_READ_TIMEOUT;
};

/// Board hardware abstraction - owns all peripherals
class Board {
public:
  /// Construct board with configuration
  explicit Board(const BoardConfig &config);

  ~Board() = default;

  Board(const Board &) = delete;
  Board &operator=(const Board &) = delete;
  Board(Board &&) = default;
  Board &operator=(Board &&) = default;

  /// I2C bus behind the adapter (for device drivers)
  [[nodiscard]] driver::tunnel::Tunnel &tunnel() { return *tunnel_; }
  [[nodiscard]] const driver::tunnel::Tunnel &tunnel() const {
    return *tunnel_;
  }

private:
  std::unique_ptr<driver::tunnel::Tunnel> tunnel_;
};

} // namespace application
