/**
 * @file crc.hpp
 * @brief Modern C++ wrapper for ESP ROM CRC16 functions
 *
 * CRC-16/CCITT-FALSE (poly 0x1021, init 0xFFFF, no reflection, no final
 * xor), the checksum serial I2C adapters report over their traffic.
 *
 * Usage:
 *   Crc16 crc;
 *   crc.update(data);
 *   uint16_t checksum = crc.value();
 */

#pragma once

#include <esp_rom_crc.h>

#include <cstdint>
#include <span>

namespace core {

class Crc16 {
public:
  static constexpr uint16_t DEFAULT_SEED = 0xFFFF;

  constexpr Crc16() = default;
  constexpr explicit Crc16(uint16_t seed) : state_(seed) {}

  /// Update CRC with raw bytes
  void update(std::span<const uint8_t> data) {
    if (data.empty()) {
      return;
    }
    // ROM routines invert on entry and exit
    state_ = static_cast<uint16_t>(
        ~esp_rom_crc16_be(static_cast<uint16_t>(~state_), data.data(),
                          static_cast<uint32_t>(data.size())));
  }

  void update(uint8_t byte) { update(std::span<const uint8_t>(&byte, 1)); }

  [[nodiscard]] constexpr uint16_t value() const { return state_; }

  constexpr void reset() { state_ = DEFAULT_SEED; }

  /// Compute CRC of raw bytes (single-shot)
  [[nodiscard]] static uint16_t compute(std::span<const uint8_t> data) {
    Crc16 crc;
    crc.update(data);
    return crc.value();
  }

private:
  uint16_t state_{DEFAULT_SEED};
};

} // namespace core
