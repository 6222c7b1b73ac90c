/**
 * @file uart.hpp
 * @brief RAII UART transport implementing ITransport
 */

#pragma once

#include "interface.hpp"
#include "types.hpp"

#include <driver/uart.h>

#include <array>
#include <cstdint>

namespace driver::serial {

/// UART port configuration
struct Config {
  uart_port_t port = UART_NUM_1;
  int tx_pin = UART_PIN_NO_CHANGE;
  int rx_pin = UART_PIN_NO_CHANGE;
  uint32_t baud_rate = DEFAULT_BAUD_RATE;
  int rx_buffer_size = 1024;
};

/**
 * @brief Byte transport over the ESP-IDF UART driver
 *
 * The driver's RX ring buffer is the receive accumulator. Deinstalls the
 * driver when destroyed.
 */
class UartTransport final : public ITransport {
public:
  explicit UartTransport(const Config &config);
  ~UartTransport() override;

  UartTransport(const UartTransport &) = delete;
  UartTransport &operator=(const UartTransport &) = delete;
  UartTransport(UartTransport &&) = delete;
  UartTransport &operator=(UartTransport &&) = delete;

  [[nodiscard]] core::Status open() override;
  [[nodiscard]] core::Status close() override;
  [[nodiscard]] bool is_open() const override { return open_; }
  [[nodiscard]] std::string_view port_name() const override {
    return name_.data();
  }

  [[nodiscard]] core::Status write(std::span<const uint8_t> data) override;
  using ITransport::write;

  [[nodiscard]] core::Result<std::vector<uint8_t>>
  read(Timeout timeout) override;
  [[nodiscard]] core::Result<std::vector<uint8_t>>
  read(size_t count, Timeout timeout) override;

  [[nodiscard]] core::Status flush() override;

private:
  [[nodiscard]] size_t buffered() const;

  Config config_;
  std::array<char, 8> name_{};
  bool open_ = false;
};

} // namespace driver::serial
