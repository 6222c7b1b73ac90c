/**
 * @file framebuffer.cpp
 * @brief Framebuffer drawing primitives
 */

#include "ssd1306/framebuffer.hpp"
#include "ssd1306/default_font.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <numbers>
#include <utility>

namespace driver::ssd1306 {

namespace {
/// Nearest integer, halves round up
[[nodiscard]] int round_half_up(double value) {
  return static_cast<int>(std::floor(value + 0.5));
}

[[nodiscard]] double to_radians(int degrees) {
  return degrees * std::numbers::pi / 180.0;
}
} // namespace

Framebuffer::Framebuffer(uint16_t width, uint16_t height)
    : width_(width), height_(height),
      pages_(static_cast<uint16_t>((height + 7) / 8)),
      buffer_(static_cast<size_t>(width) * pages_, 0x00) {}

void Framebuffer::clear() { std::fill(buffer_.begin(), buffer_.end(), 0x00); }

bool Framebuffer::set_pixel(int x, int y, bool on) {
  if (x < 0 || x >= width_ || y < 0 || y >= height_) {
    return false;
  }
  auto &cell = buffer_[static_cast<size_t>(x) +
                       static_cast<size_t>(y >> 3) * width_];
  auto mask = static_cast<uint8_t>(1U << (y & 7));
  if (on) {
    cell |= mask;
  } else {
    cell &= static_cast<uint8_t>(~mask);
  }
  return true;
}

bool Framebuffer::get_pixel(int x, int y) const {
  if (x < 0 || x >= width_ || y < 0 || y >= height_) {
    return false;
  }
  auto cell = buffer_[static_cast<size_t>(x) +
                      static_cast<size_t>(y >> 3) * width_];
  return (cell & (1U << (y & 7))) != 0;
}

void Framebuffer::line(int x0, int y0, int x1, int y1) {
  int dx = x1 - x0;
  int dy = y1 - y0;

  if (dx == 0 && dy == 0) {
    set_pixel(x0, y0);
    return;
  }
  if (dx == 0) {
    for (int y = std::min(y0, y1); y <= std::max(y0, y1); ++y) {
      set_pixel(x0, y);
    }
    return;
  }
  if (dy == 0) {
    for (int x = std::min(x0, x1); x <= std::max(x0, x1); ++x) {
      set_pixel(x, y0);
    }
    return;
  }

  // Step along the major axis, always in the positive direction
  if (std::abs(dx) >= std::abs(dy)) {
    if (dx < 0) {
      std::swap(x0, x1);
      std::swap(y0, y1);
      dx = -dx;
      dy = -dy;
    }
    double slope = static_cast<double>(dy) / dx;
    for (int x = 0; x <= dx; ++x) {
      set_pixel(x0 + x, y0 + round_half_up(x * slope));
    }
  } else {
    if (dy < 0) {
      std::swap(x0, x1);
      std::swap(y0, y1);
      dx = -dx;
      dy = -dy;
    }
    double slope = static_cast<double>(dx) / dy;
    for (int y = 0; y <= dy; ++y) {
      set_pixel(x0 + round_half_up(y * slope), y0 + y);
    }
  }
}

void Framebuffer::rectangle(int x, int y, int width, int height, bool fill) {
  if (fill) {
    for (int i = 0; i < width; ++i) {
      for (int j = 0; j < height; ++j) {
        set_pixel(x + i, y + j);
      }
    }
    return;
  }
  if (width > 0 && height > 0) {
    int right = x + width - 1;
    int bottom = y + height - 1;
    line(x, y, x, bottom);
    line(x, bottom, right, bottom);
    line(right, bottom, right, y);
    line(right, y, x, y);
  }
}

void Framebuffer::arc(int x, int y, int radius, int start_deg, int end_deg) {
  for (int deg = start_deg; deg <= end_deg; ++deg) {
    double theta = to_radians(deg);
    set_pixel(x + round_half_up(radius * std::sin(theta)),
              y + round_half_up(radius * std::cos(theta)));
  }
}

void Framebuffer::circle(int x, int y, int radius) {
  arc(x, y, radius, 0, 360);
}

void Framebuffer::text(int x, int y, std::string_view str) {
  for (char c : str) {
    auto columns = default_font::glyph(static_cast<uint8_t>(c));
    for (uint8_t bits : columns) {
      for (size_t row = 0; row < default_font::ROWS; ++row) {
        set_pixel(x, y + static_cast<int>(row), (bits & 0x01) != 0);
        bits >>= 1;
      }
      ++x;
    }
    ++x;
  }
}

void Framebuffer::text(int x, int y, std::string_view str,
                       const glyph::GfxFont &font) {
  for (char c : str) {
    const auto *g = font.glyph(static_cast<uint8_t>(c));
    if (g == nullptr) {
      continue;
    }
    if (g->width > 0 && g->height > 0) {
      if (x + g->x_offset + g->width > width_) {
        x = 0;
        y += font.y_advance;
      }
      for (uint8_t yy = 0; yy < g->height; ++yy) {
        for (uint8_t xx = 0; xx < g->width; ++xx) {
          if (font.pixel(*g, xx, yy)) {
            set_pixel(x + g->x_offset + xx, y + g->y_offset + yy);
          }
        }
      }
    }
    x += g->x_advance;
  }
}

} // namespace driver::ssd1306
