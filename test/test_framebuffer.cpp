/**
 * @file test_framebuffer.cpp
 * @brief Framebuffer layout, drawing and text rendering
 */

#include <ssd1306/default_font.hpp>
#include <ssd1306/framebuffer.hpp>

#include <gtest/gtest.h>

#include <array>
#include <utility>
#include <vector>

namespace {

using driver::ssd1306::Framebuffer;
using Points = std::vector<std::pair<int, int>>;

int count_pixels(const Framebuffer &fb) {
  int count = 0;
  for (int y = 0; y < fb.height(); ++y) {
    for (int x = 0; x < fb.width(); ++x) {
      count += fb.get_pixel(x, y) ? 1 : 0;
    }
  }
  return count;
}

Points lit(const Framebuffer &fb) {
  Points points;
  for (int x = 0; x < fb.width(); ++x) {
    for (int y = 0; y < fb.height(); ++y) {
      if (fb.get_pixel(x, y)) {
        points.emplace_back(x, y);
      }
    }
  }
  return points;
}

TEST(Framebuffer, PageLayout) {
  Framebuffer fb(128, 64);
  EXPECT_EQ(fb.pages(), 8);
  ASSERT_EQ(fb.data().size(), 1024U);

  EXPECT_TRUE(fb.set_pixel(3, 10));
  EXPECT_EQ(fb.data()[3 + 128], 0x04);
  EXPECT_TRUE(fb.get_pixel(3, 10));

  EXPECT_TRUE(fb.set_pixel(3, 10, false));
  EXPECT_EQ(fb.data()[3 + 128], 0x00);

  Framebuffer odd(16, 20);
  EXPECT_EQ(odd.pages(), 3);
  EXPECT_EQ(odd.data().size(), 48U);
}

TEST(Framebuffer, ClipsOutside) {
  Framebuffer fb(128, 64);
  EXPECT_FALSE(fb.set_pixel(128, 0));
  EXPECT_FALSE(fb.set_pixel(-1, 0));
  EXPECT_FALSE(fb.set_pixel(0, 64));
  EXPECT_FALSE(fb.get_pixel(0, -1));
  EXPECT_EQ(count_pixels(fb), 0);

  fb.line(-10, 5, 10, 5);
  EXPECT_EQ(count_pixels(fb), 11);
}

TEST(Framebuffer, Clear) {
  Framebuffer fb(32, 16);
  fb.rectangle(0, 0, 32, 16, true);
  EXPECT_EQ(count_pixels(fb), 512);
  fb.clear();
  EXPECT_EQ(count_pixels(fb), 0);
}

TEST(Framebuffer, StraightLines) {
  Framebuffer fb(32, 32);
  fb.line(9, 0, 0, 0);
  EXPECT_EQ(count_pixels(fb), 10);

  fb.clear();
  fb.line(4, 20, 4, 10);
  EXPECT_EQ(count_pixels(fb), 11);
  EXPECT_TRUE(fb.get_pixel(4, 10));
  EXPECT_TRUE(fb.get_pixel(4, 20));

  fb.clear();
  fb.line(5, 5, 5, 5);
  EXPECT_EQ(lit(fb), (Points{{5, 5}}));
}

TEST(Framebuffer, SlopedLinesRoundHalfUp) {
  Framebuffer fb(32, 32);
  fb.line(0, 0, 4, 2);
  const Points expected = {{0, 0}, {1, 1}, {2, 1}, {3, 2}, {4, 2}};
  EXPECT_EQ(lit(fb), expected);

  // Same pixels whichever end the line starts from
  fb.clear();
  fb.line(4, 2, 0, 0);
  EXPECT_EQ(lit(fb), expected);

  fb.clear();
  fb.line(0, 0, 2, 4);
  EXPECT_EQ(lit(fb), (Points{{0, 0}, {1, 1}, {1, 2}, {2, 3}, {2, 4}}));
}

TEST(Framebuffer, Rectangles) {
  Framebuffer fb(32, 32);
  fb.rectangle(1, 1, 4, 3);
  EXPECT_EQ(count_pixels(fb), 10);
  EXPECT_TRUE(fb.get_pixel(1, 1));
  EXPECT_TRUE(fb.get_pixel(4, 3));
  EXPECT_FALSE(fb.get_pixel(2, 2));

  fb.clear();
  fb.rectangle(1, 1, 4, 3, true);
  EXPECT_EQ(count_pixels(fb), 12);
  EXPECT_TRUE(fb.get_pixel(2, 2));

  fb.clear();
  fb.rectangle(1, 1, 0, 3);
  EXPECT_EQ(count_pixels(fb), 0);
}

TEST(Framebuffer, CircleAndArc) {
  Framebuffer fb(64, 64);
  fb.circle(20, 20, 5);
  EXPECT_TRUE(fb.get_pixel(20, 25));
  EXPECT_TRUE(fb.get_pixel(25, 20));
  EXPECT_TRUE(fb.get_pixel(20, 15));
  EXPECT_TRUE(fb.get_pixel(15, 20));
  EXPECT_FALSE(fb.get_pixel(20, 20));

  fb.clear();
  fb.arc(20, 20, 10, 0, 90);
  EXPECT_TRUE(fb.get_pixel(20, 30));
  EXPECT_TRUE(fb.get_pixel(30, 20));
  EXPECT_FALSE(fb.get_pixel(10, 20));
  EXPECT_FALSE(fb.get_pixel(20, 10));
}

TEST(Framebuffer, DefaultFontText) {
  Framebuffer fb(128, 64);
  fb.text(0, 0, "AA");
  const std::array<uint8_t, 12> expected = {0x7E, 0x11, 0x11, 0x11, 0x7E, 0x00,
                                            0x7E, 0x11, 0x11, 0x11, 0x7E, 0x00};
  for (size_t i = 0; i < expected.size(); ++i) {
    EXPECT_EQ(fb.data()[i], expected[i]) << "column " << i;
  }
}

TEST(Framebuffer, DefaultFontOverwritesCell) {
  Framebuffer fb(128, 64);
  fb.rectangle(0, 0, 6, 8, true);
  fb.text(0, 0, " ");
  for (int x = 0; x < 5; ++x) {
    EXPECT_EQ(fb.data()[x], 0x00);
  }
  // Gap column is not part of the glyph
  EXPECT_EQ(fb.data()[5], 0xFF);
}

TEST(Framebuffer, DefaultFontUnalignedRow) {
  Framebuffer fb(128, 64);
  fb.text(0, 4, "1");
  // '1' column 2 is 0x7F: rows 4..10
  for (int y = 4; y <= 10; ++y) {
    EXPECT_TRUE(fb.get_pixel(2, y)) << "row " << y;
  }
  EXPECT_FALSE(fb.get_pixel(2, 11));
}

TEST(DefaultFont, NonPrintableIsBlank) {
  namespace font = driver::ssd1306::default_font;
  for (uint8_t code : {uint8_t{0}, uint8_t{31}, uint8_t{127}, uint8_t{200}}) {
    for (uint8_t column : font::glyph(code)) {
      EXPECT_EQ(column, 0);
    }
  }
  EXPECT_EQ(font::glyph('A')[0], 0x7E);
  EXPECT_EQ(font::glyph('~')[2], 0x2A);
}

class GfxText : public ::testing::Test {
protected:
  // 'a': 3x2 box, rows 111 / 101
  static constexpr std::array<uint8_t, 1> BITMAP = {0xF4};
  static constexpr std::array<glyph::GfxGlyph, 2> GLYPHS = {{
      {.bitmap_offset = 0, .width = 3, .height = 2, .x_advance = 4,
       .x_offset = 0, .y_offset = -2},
      {.bitmap_offset = 0, .width = 0, .height = 0, .x_advance = 2},
  }};

  glyph::GfxFont font{.bitmap = BITMAP, .glyphs = GLYPHS, .first = 'a',
                      .last = 'b', .y_advance = 10};
};

TEST_F(GfxText, DrawsSetBitsAboveBaseline) {
  Framebuffer fb(64, 32);
  fb.text(0, 10, "a", font);
  EXPECT_EQ(lit(fb), (Points{{0, 8}, {0, 9}, {1, 8}, {2, 8}, {2, 9}}));
}

TEST_F(GfxText, LeavesUnsetBitsAlone) {
  Framebuffer fb(64, 32);
  fb.set_pixel(1, 9);
  fb.text(0, 10, "a", font);
  EXPECT_TRUE(fb.get_pixel(1, 9));
}

TEST_F(GfxText, SkipsMissingAndAdvancesOverEmpty) {
  Framebuffer fb(64, 32);
  fb.text(0, 10, "zba", font);
  // 'z' is not covered, 'b' only advances
  EXPECT_FALSE(fb.get_pixel(0, 8));
  EXPECT_TRUE(fb.get_pixel(2, 8));
  EXPECT_TRUE(fb.get_pixel(4, 8));
}

TEST_F(GfxText, WrapsAtRightEdge) {
  Framebuffer fb(8, 32);
  fb.text(0, 10, "aaa", font);
  EXPECT_TRUE(fb.get_pixel(4, 8));
  EXPECT_TRUE(fb.get_pixel(6, 9));
  EXPECT_TRUE(fb.get_pixel(0, 18));
  EXPECT_TRUE(fb.get_pixel(2, 19));
}

} // namespace
