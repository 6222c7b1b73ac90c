/**
 * @file driver.hpp
 * @brief SSD1306 OLED controller over the I2C tunnel
 */

#pragma once

#include "commands.hpp"
#include "framebuffer.hpp"

#include <core/result.hpp>
#include <tunnel/tunnel.hpp>

#include <cstdint>
#include <initializer_list>
#include <span>

namespace driver::ssd1306 {

/// Panel geometry and address
struct Config {
  uint8_t address = I2C_ADDR;
  uint16_t width = 128;
  uint16_t height = 64;
};

/**
 * @brief SSD1306 display driver
 *
 * Every command goes out as one register write with the command control
 * byte as the register, the framebuffer as one write with the data
 * control byte. Setters clamp out-of-range values and remember what was
 * last sent.
 */
class SSD1306 {
public:
  explicit SSD1306(tunnel::Tunnel &bus, const Config &config = {});

  SSD1306(const SSD1306 &) = delete;
  SSD1306 &operator=(const SSD1306 &) = delete;
  SSD1306(SSD1306 &&) = delete;
  SSD1306 &operator=(SSD1306 &&) = delete;

  /// Power-on sequence, ends with a cleared panel
  [[nodiscard]] core::Status startup(bool external_vcc = false);

  /// Blank the panel and return every setting to its reset state
  [[nodiscard]] core::Status shutdown();

  /// Send the framebuffer to the panel
  [[nodiscard]] core::Status display();

  /// Clear the framebuffer only
  void clear() { framebuffer_.clear(); }

  /// Clear the framebuffer and the panel
  [[nodiscard]] core::Status clear_display();

  [[nodiscard]] core::Status set_display_on(bool on);
  [[nodiscard]] core::Status set_inverted(bool inverted);
  [[nodiscard]] core::Status set_h_flipped(bool flipped);
  [[nodiscard]] core::Status set_v_flipped(bool flipped);
  [[nodiscard]] core::Status set_contrast(int contrast);
  [[nodiscard]] core::Status set_offset(int offset);
  [[nodiscard]] core::Status set_start_line(int line);
  [[nodiscard]] core::Status set_lower_col_start(int column);
  [[nodiscard]] core::Status set_higher_col_start(int column);
  [[nodiscard]] core::Status set_start_page(int page);
  [[nodiscard]] core::Status set_memory_mode(MemoryMode mode);
  [[nodiscard]] core::Status set_com_pins(ComPins pins);

  /// Continuous horizontal scroll of pages start..end; left if @p left
  [[nodiscard]] core::Status scroll_horizontally(bool left, uint8_t start,
                                                 uint8_t end, uint8_t speed);

  /// Horizontal scroll combined with a vertical shift of @p step rows per
  /// frame inside the area of @p rows rows from @p offset
  [[nodiscard]] core::Status scroll_diagonally(bool left, uint8_t start,
                                               uint8_t end, uint8_t offset,
                                               uint8_t rows, uint8_t speed,
                                               uint8_t step);
  [[nodiscard]] core::Status start_scroll();
  [[nodiscard]] core::Status stop_scroll();
  [[nodiscard]] core::Status no_op();

  [[nodiscard]] bool display_on() const { return display_on_; }
  [[nodiscard]] bool inverted() const { return inverted_; }
  [[nodiscard]] bool h_flipped() const { return h_flipped_; }
  [[nodiscard]] bool v_flipped() const { return v_flipped_; }
  [[nodiscard]] bool scrolling() const { return scrolling_; }
  [[nodiscard]] uint8_t contrast() const { return contrast_; }
  [[nodiscard]] uint8_t offset() const { return offset_; }
  [[nodiscard]] uint8_t start_line() const { return start_line_; }
  [[nodiscard]] uint8_t lower_col_start() const { return lower_col_start_; }
  [[nodiscard]] uint8_t higher_col_start() const { return higher_col_start_; }
  [[nodiscard]] uint8_t start_page() const { return start_page_; }
  [[nodiscard]] MemoryMode memory_mode() const { return memory_mode_; }
  [[nodiscard]] ComPins com_pins() const { return com_pins_; }

  [[nodiscard]] Framebuffer &framebuffer() { return framebuffer_; }
  [[nodiscard]] const Framebuffer &framebuffer() const { return framebuffer_; }
  [[nodiscard]] const Config &config() const { return config_; }

private:
  [[nodiscard]] core::Status command(Command cmd,
                                     std::initializer_list<uint8_t> params = {});
  [[nodiscard]] core::Status command(uint8_t opcode,
                                     std::initializer_list<uint8_t> params = {});
  [[nodiscard]] core::Status data(std::span<const uint8_t> bytes);
  [[nodiscard]] core::Status write(uint8_t control,
                                   std::span<const uint8_t> bytes);

  tunnel::Tunnel &bus_;
  Config config_;
  Framebuffer framebuffer_;

  bool display_on_ = false;
  bool inverted_ = false;
  bool h_flipped_ = false;
  bool v_flipped_ = false;
  bool scrolling_ = false;
  uint8_t contrast_ = 0;
  uint8_t offset_ = 0;
  uint8_t start_line_ = 0;
  uint8_t lower_col_start_ = 0;
  uint8_t higher_col_start_ = 0;
  uint8_t start_page_ = 0;
  MemoryMode memory_mode_ = MemoryMode::Horizontal;
  ComPins com_pins_ = ComPins::Alternating;
};

} // namespace driver::ssd1306
