/**
 * @file default_font.hpp
 * @brief Built-in 5x8 text font
 *
 * Each glyph is 5 column bytes, LSB at the top row. Only printable ASCII
 * has a bitmap; other codes draw as blank cells.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace driver::ssd1306::default_font {

inline constexpr size_t COLUMNS = 5;
inline constexpr size_t ROWS = 8;
inline constexpr uint8_t FIRST = 32;
inline constexpr uint8_t LAST = 126;

/// Column bytes for @p code, all zero outside FIRST..LAST
[[nodiscard]] std::span<const uint8_t, COLUMNS> glyph(uint8_t code);

} // namespace driver::ssd1306::default_font
