/**
 * @file error.hpp
 * @brief Tunnel error codes
 *
 * Protocol failures get their own esp_err_t block so callers can tell a
 * broken handshake from a NACK or a timeout. ESP_ERR_TIMEOUT and
 * ESP_ERR_INVALID_STATE keep their ESP-IDF meaning.
 */

#pragma once

#include <serial/types.hpp>

#include <esp_err.h>

namespace driver::tunnel {

inline constexpr esp_err_t ERR_TUNNEL_BASE = 0x7100;

/// Port cannot be opened or the transport failed
inline constexpr esp_err_t ERR_PORT = serial::ERR_PORT;
/// Handshake echo did not match
inline constexpr esp_err_t ERR_ECHO_MISMATCH = ERR_TUNNEL_BASE + 2;
/// Status line malformed
inline constexpr esp_err_t ERR_PARSE = ERR_TUNNEL_BASE + 3;
/// Argument outside its numeric range
inline constexpr esp_err_t ERR_OUT_OF_RANGE = ERR_TUNNEL_BASE + 4;
/// Argument not one of the permitted values
inline constexpr esp_err_t ERR_UNSUPPORTED_VALUE = ERR_TUNNEL_BASE + 5;
/// Bus reset rejected, a line is held low
inline constexpr esp_err_t ERR_BUS_BUSY = ERR_TUNNEL_BASE + 6;
/// Target did not acknowledge
inline constexpr esp_err_t ERR_ACK_FAILURE = ERR_TUNNEL_BASE + 7;

static_assert(ERR_PORT == ERR_TUNNEL_BASE + 1);

/// Name for tunnel codes, falls back to esp_err_to_name()
[[nodiscard]] const char *error_name(esp_err_t err);

} // namespace driver::tunnel
