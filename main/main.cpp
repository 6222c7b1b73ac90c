/**
 * @file main.cpp
 * @brief Application entry point
 *
 * Creates and wires up all dependencies, then starts the application.
 */

#include "app_config.hpp"

#include <application/app.hpp>
#include <application/board.hpp>

#include <esp_log.h>

#include <memory>

namespace {
constexpr const char *TAG = "main";
} // namespace

extern "C" void app_main() {
  application::BoardConfig board_config{
      .uart_port = app::config::ADAPTER_UART,
      .uart_tx = app::config::ADAPTER_TX_PIN,
      .uart_rx = app::config::ADAPTER_RX_PIN,
      .baud_rate = app::config::ADAPTER_BAUD,
      .read_timeout = app::config::ADAPTER_READ_TIMEOUT,
  };

  application::Board board(board_config);

  // Application holds the display framebuffer - allocate on heap
  auto app = std::make_unique<application::Bridge>(board);

  if (auto err = app->start(); !err) {
    ESP_LOGE(TAG, "App failed: %s", esp_err_to_name(err.error()));
  }
}
