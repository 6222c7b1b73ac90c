/**
 * @file protocol.hpp
 * @brief Wire protocol of the serial I2C adapter
 *
 * Every command is a single ASCII (or control) byte, optionally followed by
 * a fixed payload. Responses, where there are any, are raw bytes read back
 * from the same serial stream.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace driver::tunnel {

/// Command opcodes
enum class Command : uint8_t {
  Sync = 0x40,      ///< '@' no-op, pads out a pending partial command
  Echo = 0x65,      ///< 'e' + char, answers with the char
  Status = 0x3F,    ///< '?' answers with a bracketed status line
  Reboot = 0x5F,    ///< '_' adapter restart
  BusReset = 0x78,  ///< 'x' answers '3' when both lines are released
  Restore = 0x69,   ///< 'i' back to I2C master mode
  Pullups = 0x75,   ///< 'u' + mask
  Speed100 = 0x31,  ///< '1' 100 kHz
  Speed400 = 0x34,  ///< '4' 400 kHz
  Scan = 0x64,      ///< 'd' answers one byte per address 8..119
  Start = 0x73,     ///< 's' + (addr << 1 | dir), answers ack
  Stop = 0x70,      ///< 'p'
  RegRead = 0x72,   ///< 'r' + addr + reg + count, answers count bytes
  WriteChunk = 0xC0, ///< | (len - 1), + payload, answers ack
  ReadChunk = 0x80,  ///< | (len - 1), answers len bytes
};

[[nodiscard]] constexpr uint8_t to_byte(Command cmd) noexcept {
  return static_cast<uint8_t>(cmd);
}

/// Transfer direction encoded in bit 0 of the start byte
enum class Direction : uint8_t {
  Write = 0,
  Read = 1,
};

/// Largest payload of one read or write frame
inline constexpr size_t MAX_CHUNK = 64;

/// Number of sync bytes sent to flush a partial command on the adapter
inline constexpr size_t SYNC_FLUSH_COUNT = 64;

/// Handshake characters, each must echo back unchanged
inline constexpr std::array<uint8_t, 4> ECHO_PATTERN = {'A', 0x0D, 0x0A, 'Z'};

/// Scan covers 7-bit addresses 8..119
inline constexpr uint8_t FIRST_SCAN_ADDRESS = 8;
inline constexpr uint8_t LAST_SCAN_ADDRESS = 119;
inline constexpr size_t SCAN_RESPONSE_SIZE =
    LAST_SCAN_ADDRESS - FIRST_SCAN_ADDRESS + 1;

/// Scan response byte for a device that acknowledged
inline constexpr uint8_t SCAN_PRESENT = '1';

/// Bus reset response when SDA and SCL are both high
inline constexpr uint8_t BUS_RESET_OK = '3';

/// Highest pullup control mask (6 bits)
inline constexpr int MAX_PULLUP_MASK = 63;

/// Frame control byte for a write chunk of @p len bytes (1..64)
[[nodiscard]] constexpr uint8_t write_chunk_header(size_t len) noexcept {
  return static_cast<uint8_t>(to_byte(Command::WriteChunk) | (len - 1));
}

/// Frame control byte for a read chunk of @p len bytes (1..64)
[[nodiscard]] constexpr uint8_t read_chunk_header(size_t len) noexcept {
  return static_cast<uint8_t>(to_byte(Command::ReadChunk) | (len - 1));
}

/// Start byte: 7-bit address and direction
[[nodiscard]] constexpr uint8_t start_byte(uint8_t address,
                                           Direction dir) noexcept {
  return static_cast<uint8_t>((address << 1) | static_cast<uint8_t>(dir));
}

/// Speed selector for a bus speed in kHz, nullopt if unsupported
[[nodiscard]] constexpr std::optional<Command>
speed_command(uint32_t khz) noexcept {
  switch (khz) {
  case 100:
    return Command::Speed100;
  case 400:
    return Command::Speed400;
  default:
    return std::nullopt;
  }
}

} // namespace driver::tunnel
