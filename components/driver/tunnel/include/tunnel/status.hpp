/**
 * @file status.hpp
 * @brief Adapter status snapshot
 */

#pragma once

#include <core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace driver::tunnel {

/// Adapter status as reported by the '?' command
///
/// The adapter answers with one bracketed line:
/// `[model serial uptime voltage current temperature mode sda scl speed
/// pullups crc]`
struct Status {
  std::string port;         ///< Transport the adapter is attached to
  std::string model;        ///< Adapter model identifier
  std::string serial;       ///< Adapter serial number
  uint32_t uptime = 0;      ///< Seconds since adapter boot
  float voltage = 0.0F;     ///< USB supply voltage (V)
  float current = 0.0F;     ///< Supply current (mA)
  float temperature = 0.0F; ///< Adapter temperature (degC)
  std::string mode;         ///< Adapter mode letter ("I" = I2C master)
  uint8_t sda = 0;          ///< SDA line level
  uint8_t scl = 0;          ///< SCL line level
  uint16_t speed = 0;       ///< Bus speed (kHz)
  uint8_t pullups = 0;      ///< Pullup control mask
  uint16_t ccitt_crc = 0;   ///< CRC reported by the adapter
  uint16_t e_ccitt_crc = 0; ///< CRC computed locally over payload traffic

  /// Both bus lines released
  [[nodiscard]] bool bus_idle() const { return sda == 1 && scl == 1; }
};

/// Parse a status line, ERR_PARSE if any field is missing or malformed
[[nodiscard]] core::Result<Status> parse_status(std::string_view line,
                                                std::string_view port);

} // namespace driver::tunnel
