/**
 * @file commands.hpp
 * @brief SSD1306 command set and parameter constants
 */

#pragma once

#include <cstdint>

namespace driver::ssd1306 {

/// Default 7-bit I2C address (SA0 low)
inline constexpr uint8_t I2C_ADDR = 0x3C;

/// Control byte preceding a transfer (Co = 0)
namespace control {
inline constexpr uint8_t COMMAND = 0x00;
inline constexpr uint8_t DATA = 0x40;
} // namespace control

/// Controller opcodes; some take parameter bytes, some carry a value in
/// their low bits
enum class Command : uint8_t {
  LowerColStart = 0x00,  ///< | column low nibble (page mode)
  HigherColStart = 0x10, ///< | column high nibble (page mode)
  MemoryMode = 0x20,
  ColumnAddress = 0x21, ///< [start, end]
  PageAddress = 0x22,   ///< [start, end]
  RightHorizontalScroll = 0x26,
  LeftHorizontalScroll = 0x27,
  VerticalRightHorizontalScroll = 0x29,
  VerticalLeftHorizontalScroll = 0x2A,
  DeactivateScroll = 0x2E,
  ActivateScroll = 0x2F,
  StartLine = 0x40, ///< | line 0..63
  Contrast = 0x81,
  ChargePump = 0x8D,
  SegmentRemap = 0xA0,        ///< Column 0 mapped to SEG0
  SegmentRemapReverse = 0xA1, ///< Column 127 mapped to SEG0
  VerticalScrollArea = 0xA3,
  DisplayAllOnResume = 0xA4,
  DisplayAllOn = 0xA5,
  NormalDisplay = 0xA6,
  InvertDisplay = 0xA7,
  MultiplexRatio = 0xA8,
  DisplayOff = 0xAE,
  DisplayOn = 0xAF,
  PageStart = 0xB0, ///< | page 0..7
  ComScanInc = 0xC0,
  ComScanDec = 0xC8,
  DisplayOffset = 0xD3,
  ClockDiv = 0xD5,
  PrechargePeriod = 0xD9,
  ComPins = 0xDA,
  VcomhDeselect = 0xDB,
  Noop = 0xE3,
};

[[nodiscard]] constexpr uint8_t to_byte(Command cmd) {
  return static_cast<uint8_t>(cmd);
}

/// Addressing mode for GDDRAM writes
enum class MemoryMode : uint8_t {
  Horizontal = 0x00,
  Vertical = 0x01,
  Page = 0x02,
};

/// COM pins hardware configuration
enum class ComPins : uint8_t {
  Sequential = 0x02,
  SequentialLeftRight = 0x22,
  Alternating = 0x12,
  AlternatingLeftRight = 0x32,
};

inline constexpr uint8_t CHARGE_PUMP_DISABLE = 0x10;
inline constexpr uint8_t CHARGE_PUMP_ENABLE = 0x14;

inline constexpr uint8_t VCOMH_DESELECT_065 = 0x00;
inline constexpr uint8_t VCOMH_DESELECT_077 = 0x20;
inline constexpr uint8_t VCOMH_DESELECT_083 = 0x30;

inline constexpr uint8_t DUMMY_00 = 0x00;
inline constexpr uint8_t DUMMY_FF = 0xFF;

} // namespace driver::ssd1306
