/**
 * @file uart.cpp
 * @brief UART transport implementation
 */

#include "serial/uart.hpp"

#include <core/task.hpp>

#include <esp_log.h>

#include <algorithm>
#include <cstdio>

namespace driver::serial {

namespace {
constexpr const char *TAG = "uart";

[[nodiscard]] TickType_t to_ticks(Timeout timeout) {
  return pdMS_TO_TICKS(timeout.count());
}
} // namespace

UartTransport::UartTransport(const Config &config) : config_(config) {
  std::snprintf(name_.data(), name_.size(), "UART%d",
                static_cast<int>(config.port));
}

UartTransport::~UartTransport() {
  if (open_) {
    [[maybe_unused]] auto status = close();
  }
}

core::Status UartTransport::open() {
  if (open_) {
    return core::Ok();
  }

  uart_config_t uart_config = {
      .baud_rate = static_cast<int>(config_.baud_rate),
      .data_bits = UART_DATA_8_BITS,
      .parity = UART_PARITY_DISABLE,
      .stop_bits = UART_STOP_BITS_1,
      .flow_ctrl = UART_HW_FLOWCTRL_DISABLE,
      .rx_flow_ctrl_thresh = 0,
      .source_clk = UART_SCLK_DEFAULT,
  };

  if (auto err = uart_driver_install(config_.port, config_.rx_buffer_size, 0,
                                     0, nullptr, 0);
      err != ESP_OK) {
    ESP_LOGE(TAG, "%s: driver install failed: %s", name_.data(),
             esp_err_to_name(err));
    return core::Err(ERR_PORT);
  }

  esp_err_t err = uart_param_config(config_.port, &uart_config);
  if (err == ESP_OK) {
    err = uart_set_pin(config_.port, config_.tx_pin, config_.rx_pin,
                       UART_PIN_NO_CHANGE, UART_PIN_NO_CHANGE);
  }
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "%s: configuration failed: %s", name_.data(),
             esp_err_to_name(err));
    uart_driver_delete(config_.port);
    return core::Err(ERR_PORT);
  }

  open_ = true;
  ESP_LOGI(TAG, "%s open at %lu baud", name_.data(),
           static_cast<unsigned long>(config_.baud_rate));
  return core::Ok();
}

core::Status UartTransport::close() {
  if (!open_) {
    return core::Ok();
  }
  open_ = false;
  if (auto err = uart_driver_delete(config_.port); err != ESP_OK) {
    ESP_LOGW(TAG, "%s: driver delete failed: %s", name_.data(),
             esp_err_to_name(err));
    return core::Err(ERR_PORT);
  }
  return core::Ok();
}

core::Status UartTransport::write(std::span<const uint8_t> data) {
  if (!open_) {
    return core::Err(ESP_ERR_INVALID_STATE);
  }
  if (data.empty()) {
    return core::Ok();
  }

  int written = uart_write_bytes(config_.port, data.data(), data.size());
  if (written < 0 || static_cast<size_t>(written) != data.size()) {
    ESP_LOGE(TAG, "%s: short write (%d of %u)", name_.data(), written,
             static_cast<unsigned>(data.size()));
    return core::Err(ERR_PORT);
  }

  if (auto err = uart_wait_tx_done(config_.port, portMAX_DELAY);
      err != ESP_OK) {
    return core::Err(ERR_PORT);
  }
  ESP_LOGD(TAG, "tx %u bytes", static_cast<unsigned>(data.size()));
  return core::Ok();
}

core::Result<std::vector<uint8_t>> UartTransport::read(Timeout timeout) {
  if (!open_) {
    return core::Err(ESP_ERR_INVALID_STATE);
  }

  core::Task::delay(std::max(timeout, RESPONSE_WINDOW));

  std::vector<uint8_t> data(buffered());
  if (data.empty()) {
    return data;
  }
  int got = uart_read_bytes(config_.port, data.data(), data.size(), 0);
  if (got < 0) {
    return core::Err(ERR_PORT);
  }
  data.resize(static_cast<size_t>(got));
  ESP_LOGD(TAG, "rx %d bytes", got);
  return data;
}

core::Result<std::vector<uint8_t>> UartTransport::read(size_t count,
                                                       Timeout timeout) {
  if (!open_) {
    return core::Err(ESP_ERR_INVALID_STATE);
  }

  Timeout waited{0};
  while (buffered() < count) {
    if (waited >= timeout) {
      ESP_LOGD(TAG, "%s: timeout waiting for %u bytes (have %u)",
               name_.data(), static_cast<unsigned>(count),
               static_cast<unsigned>(buffered()));
      return core::Err(ESP_ERR_TIMEOUT);
    }
    core::Task::delay(POLL_INTERVAL);
    waited += POLL_INTERVAL;
  }

  std::vector<uint8_t> data(count);
  int got = uart_read_bytes(config_.port, data.data(), count, to_ticks(timeout));
  if (got < 0 || static_cast<size_t>(got) != count) {
    return core::Err(ESP_ERR_TIMEOUT);
  }
  ESP_LOGD(TAG, "rx %d bytes", got);
  return data;
}

core::Status UartTransport::flush() {
  if (!open_) {
    return core::Err(ESP_ERR_INVALID_STATE);
  }
  if (auto err = uart_flush_input(config_.port); err != ESP_OK) {
    return core::Err(ERR_PORT);
  }
  return core::Ok();
}

size_t UartTransport::buffered() const {
  size_t len = 0;
  if (uart_get_buffered_data_len(config_.port, &len) != ESP_OK) {
    return 0;
  }
  return len;
}

} // namespace driver::serial
