/**
 * @file gfx_font.hpp
 * @brief Decoded bitmap font (Adafruit GFX layout)
 *
 * Glyph bitmaps are packed MSB first, row-major, with no padding between
 * rows. A glyph's box is placed relative to the text cursor by its x/y
 * offsets; y_offset is usually negative (cursor sits on the baseline).
 */

#pragma once

#include <cstdint>
#include <span>

namespace glyph {

/// One character of a GfxFont
struct GfxGlyph {
  uint16_t bitmap_offset = 0; ///< First byte in GfxFont::bitmap
  uint8_t width = 0;          ///< Bitmap width (px)
  uint8_t height = 0;         ///< Bitmap height (px)
  uint8_t x_advance = 0;      ///< Cursor advance after drawing
  int8_t x_offset = 0;        ///< Cursor to box left
  int8_t y_offset = 0;        ///< Cursor to box top
};

/// Read-only glyph table covering the codes first..last
struct GfxFont {
  std::span<const uint8_t> bitmap;
  std::span<const GfxGlyph> glyphs;
  uint16_t first = 0;
  uint16_t last = 0;
  uint8_t y_advance = 0; ///< Line height

  /// Glyph for a character code, nullptr if the font does not cover it
  [[nodiscard]] const GfxGlyph *glyph(uint32_t code) const {
    if (code < first || code > last) {
      return nullptr;
    }
    size_t index = code - first;
    if (index >= glyphs.size()) {
      return nullptr;
    }
    return &glyphs[index];
  }

  /// Whether pixel (x, y) of glyph @p g is set
  [[nodiscard]] bool pixel(const GfxGlyph &g, uint8_t x, uint8_t y) const {
    size_t bit = static_cast<size_t>(y) * g.width + x;
    size_t byte = g.bitmap_offset + bit / 8;
    if (byte >= bitmap.size()) {
      return false;
    }
    return (bitmap[byte] & (0x80U >> (bit % 8))) != 0;
  }
};

} // namespace glyph
