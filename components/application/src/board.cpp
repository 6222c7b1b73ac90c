/**
 * @file board.cpp
 * @brief Board hardware initialization
 */

#include <application/board.hpp>

#include <esp_log.h>

namespace application {

namespace {
constexpr const char *TAG = "board";
} // namespace

Board::Board(const BoardConfig &config) {
  driver::serial::Config uart_config{
      .port = config.uart_port,
      .tx_pin = config.uart_tx,
      .rx_pin = config.uart_rx,
      .baud_rate = config.baud_rate,
  };

  // The port is opened by Tunnel::connect()
  tunnel_ = std::make_unique<driver::tunnel::Tunnel>(
      std::make_unique<driver::serial::UartTransport>(uart_config),
      driver::tunnel::Config{.read_timeout = config.read_timeout});

  ESP_LOGI(TAG, "Adapter on UART%d (TX=%d, RX=%d, %lu baud)",
           static_cast<int>(config.uart_port), config.uart_tx, config.uart_rx,
           static_cast<unsigned long>(config.baud_rate));
}

} // namespace application
