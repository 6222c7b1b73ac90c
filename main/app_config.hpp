/**
 * @file app_config.hpp
 * @brief Bridge application configuration
 */

#pragma once

#include <driver/uart.h>

#include <chrono>
#include <cstdint>

namespace app::config {

using namespace std::chrono_literals;

// Serial link to the I2C adapter
inline constexpr uart_port_t ADAPTER_UART = UART_NUM_1;
inline constexpr int ADAPTER_TX_PIN = 17;
inline constexpr int ADAPTER_RX_PIN = 18;
inline constexpr uint32_t ADAPTER_BAUD = 1'000'000;
inline constexpr auto ADAPTER_READ_TIMEOUT = 1000ms;

// I2C bus behind the adapter
inline constexpr bool BUS_RESET_ON_CONNECT = true;
inline constexpr uint32_t BUS_SPEED_KHZ = 400;
inline constexpr int ADAPTER_PULLUPS = 0b010010;

// Compass
inline constexpr float DECLINATION_DEG = 0.0F;
inline constexpr bool CALIBRATE_WHEN_MISSING = true;
inline constexpr auto CALIBRATION_DURATION = 30s;

// Display refresh while the compass runs
inline constexpr auto RENDER_INTERVAL = 250ms;

inline constexpr const char *STORAGE_NAMESPACE = "bridge";

} // namespace app::config
