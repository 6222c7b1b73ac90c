/**
 * @file types.hpp
 * @brief Common serial transport types and constants
 */

#pragma once

#include <esp_err.h>

#include <chrono>
#include <cstdint>

namespace driver::serial {

/// Timeout duration for serial operations
using Timeout = std::chrono::milliseconds;

/// Minimum time a read waits for the peer to answer
inline constexpr Timeout RESPONSE_WINDOW{20};

/// Interval at which a sized read polls the receive buffer
inline constexpr Timeout POLL_INTERVAL{20};

/// Default timeout for sized reads
inline constexpr Timeout DEFAULT_READ_TIMEOUT{1000};

/// Default baud rate of USB/serial I2C adapters
inline constexpr uint32_t DEFAULT_BAUD_RATE = 1'000'000;

/// Transport-level failure (cannot open, write or flush the port)
inline constexpr esp_err_t ERR_PORT = 0x7101;

} // namespace driver::serial
