/**
 * @file framebuffer.hpp
 * @brief Monochrome page-organized framebuffer with drawing primitives
 */

#pragma once

#include <glyph/gfx_font.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace driver::ssd1306 {

/**
 * @brief In-memory image in SSD1306 GDDRAM layout
 *
 * One byte holds 8 vertically stacked pixels of a page: pixel (x, y) is
 * bit (y & 7) of byte x + (y / 8) * width. Drawing never touches the bus;
 * coordinates outside the buffer are clipped.
 */
class Framebuffer {
public:
  Framebuffer(uint16_t width, uint16_t height);

  [[nodiscard]] uint16_t width() const { return width_; }
  [[nodiscard]] uint16_t height() const { return height_; }
  [[nodiscard]] uint16_t pages() const { return pages_; }

  [[nodiscard]] std::span<const uint8_t> data() const { return buffer_; }
  [[nodiscard]] std::span<uint8_t> data() { return buffer_; }

  /// All pixels off
  void clear();

  /// false if (x, y) is outside the buffer
  bool set_pixel(int x, int y, bool on = true);
  [[nodiscard]] bool get_pixel(int x, int y) const;

  void line(int x0, int y0, int x1, int y1);
  void rectangle(int x, int y, int width, int height, bool fill = false);

  /// Arc in 1 degree steps; 0 degrees points down (+y), angles grow
  /// towards +x
  void arc(int x, int y, int radius, int start_deg, int end_deg);
  void circle(int x, int y, int radius);

  /// Text in the built-in 5x8 font, one blank column between glyphs
  void text(int x, int y, std::string_view str);

  /// Text in a GFX font; y is the baseline, wraps at the right edge
  void text(int x, int y, std::string_view str, const glyph::GfxFont &font);

private:
  uint16_t width_;
  uint16_t height_;
  uint16_t pages_;
  std::vector<uint8_t> buffer_;
};

} // namespace driver::ssd1306
