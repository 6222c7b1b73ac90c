/**
 * @file driver.cpp
 * @brief SSD1306 command sequences
 */

#include "ssd1306/driver.hpp"

#include <tunnel/error.hpp>

#include <esp_log.h>

#include <algorithm>
#include <array>
#include <vector>

namespace driver::ssd1306 {

namespace {
constexpr const char *TAG = "ssd1306";
constexpr size_t MAX_PARAMS = 6;

[[nodiscard]] uint8_t clamp(int value, int low, int high) {
  return static_cast<uint8_t>(std::clamp(value, low, high));
}
} // namespace

SSD1306::SSD1306(tunnel::Tunnel &bus, const Config &config)
    : bus_(bus), config_(config),
      framebuffer_(config.width, config.height) {}

core::Status SSD1306::startup(bool external_vcc) {
  const auto width = static_cast<uint8_t>(config_.width);
  const auto mux = static_cast<uint8_t>(config_.height - 1);
  const uint8_t pump = external_vcc ? CHARGE_PUMP_DISABLE : CHARGE_PUMP_ENABLE;
  const uint8_t precharge = external_vcc ? 0x22 : 0xF1;
  const ComPins pins =
      config_.height == 64 ? ComPins::Alternating : ComPins::Sequential;

  auto status = [&]() -> core::Status {
    if (auto step = set_display_on(false); !step.ok()) {
      return step;
    }
    if (auto step = command(Command::ClockDiv, {width}); !step.ok()) {
      return step;
    }
    if (auto step = command(Command::MultiplexRatio, {mux}); !step.ok()) {
      return step;
    }
    if (auto step = set_offset(0); !step.ok()) {
      return step;
    }
    if (auto step = set_start_line(0); !step.ok()) {
      return step;
    }
    if (auto step = command(Command::ChargePump, {pump}); !step.ok()) {
      return step;
    }
    if (auto step = set_memory_mode(MemoryMode::Horizontal); !step.ok()) {
      return step;
    }
    if (auto step = set_h_flipped(false); !step.ok()) {
      return step;
    }
    if (auto step = set_v_flipped(false); !step.ok()) {
      return step;
    }
    if (auto step = set_com_pins(pins); !step.ok()) {
      return step;
    }
    if (auto step = set_contrast(external_vcc ? 0x9F : 0xCF); !step.ok()) {
      return step;
    }
    if (auto step = command(Command::PrechargePeriod, {precharge});
        !step.ok()) {
      return step;
    }
    if (auto step = command(Command::VcomhDeselect, {VCOMH_DESELECT_065});
        !step.ok()) {
      return step;
    }
    if (auto step = command(Command::DisplayAllOnResume); !step.ok()) {
      return step;
    }
    if (auto step = set_inverted(false); !step.ok()) {
      return step;
    }
    if (auto step = set_display_on(true); !step.ok()) {
      return step;
    }
    return clear_display();
  }();

  if (!status) {
    ESP_LOGE(TAG, "Startup failed: %s", tunnel::error_name(status.error()));
    return status;
  }
  ESP_LOGI(TAG, "Display %ux%u at 0x%02x started", config_.width,
           config_.height, config_.address);
  return status;
}

core::Status SSD1306::shutdown() {
  auto status = [&]() -> core::Status {
    if (auto step = clear_display(); !step.ok()) {
      return step;
    }
    if (auto step = set_display_on(false); !step.ok()) {
      return step;
    }
    if (auto step = set_inverted(false); !step.ok()) {
      return step;
    }
    if (auto step = set_h_flipped(false); !step.ok()) {
      return step;
    }
    if (auto step = set_v_flipped(false); !step.ok()) {
      return step;
    }
    if (auto step = stop_scroll(); !step.ok()) {
      return step;
    }
    if (auto step = set_contrast(0); !step.ok()) {
      return step;
    }
    return set_offset(0);
  }();

  if (!status) {
    ESP_LOGE(TAG, "Shutdown failed: %s", tunnel::error_name(status.error()));
  }
  return status;
}

core::Status SSD1306::display() {
  const auto last_column = static_cast<uint8_t>(config_.width - 1);
  const auto last_page = static_cast<uint8_t>(framebuffer_.pages() - 1);
  if (auto step = command(Command::ColumnAddress, {0, last_column});
      !step.ok()) {
    return step;
  }
  if (auto step = command(Command::PageAddress, {0, last_page}); !step.ok()) {
    return step;
  }
  if (auto step = data(framebuffer_.data()); !step.ok()) {
    return step;
  }
  if (scrolling_) {
    return no_op();
  }
  return core::Ok();
}

core::Status SSD1306::clear_display() {
  framebuffer_.clear();
  return display();
}

core::Status SSD1306::set_display_on(bool on) {
  display_on_ = on;
  return command(on ? Command::DisplayOn : Command::DisplayOff);
}

core::Status SSD1306::set_inverted(bool inverted) {
  inverted_ = inverted;
  return command(inverted ? Command::InvertDisplay : Command::NormalDisplay);
}

core::Status SSD1306::set_h_flipped(bool flipped) {
  h_flipped_ = flipped;
  auto remap = flipped ? Command::SegmentRemap : Command::SegmentRemapReverse;
  if (auto step = command(remap); !step.ok()) {
    return step;
  }
  // Remap only applies to data written afterwards
  return display();
}

core::Status SSD1306::set_v_flipped(bool flipped) {
  v_flipped_ = flipped;
  return command(flipped ? Command::ComScanInc : Command::ComScanDec);
}

core::Status SSD1306::set_contrast(int contrast) {
  contrast_ = clamp(contrast, 0, 255);
  return command(Command::Contrast, {contrast_});
}

core::Status SSD1306::set_offset(int offset) {
  offset_ = clamp(offset, 0, config_.height - 1);
  return command(Command::DisplayOffset, {offset_});
}

core::Status SSD1306::set_start_line(int line) {
  start_line_ = clamp(line, 0, config_.height - 1);
  return command(
      static_cast<uint8_t>(to_byte(Command::StartLine) | start_line_));
}

core::Status SSD1306::set_lower_col_start(int column) {
  lower_col_start_ = clamp(column, 0, 15);
  return command(
      static_cast<uint8_t>(to_byte(Command::LowerColStart) | lower_col_start_));
}

core::Status SSD1306::set_higher_col_start(int column) {
  higher_col_start_ = clamp(column, 0, 15);
  return command(
      static_cast<uint8_t>(to_byte(Command::HigherColStart) | higher_col_start_));
}

core::Status SSD1306::set_start_page(int page) {
  start_page_ = clamp(page, 0, 7);
  return command(
      static_cast<uint8_t>(to_byte(Command::PageStart) | start_page_));
}

core::Status SSD1306::set_memory_mode(MemoryMode mode) {
  memory_mode_ = mode;
  return command(Command::MemoryMode, {static_cast<uint8_t>(mode)});
}

core::Status SSD1306::set_com_pins(ComPins pins) {
  com_pins_ = pins;
  return command(Command::ComPins, {static_cast<uint8_t>(pins)});
}

core::Status SSD1306::scroll_horizontally(bool left, uint8_t start,
                                          uint8_t end, uint8_t speed) {
  return command(left ? Command::LeftHorizontalScroll
                      : Command::RightHorizontalScroll,
                 {DUMMY_00, start, speed, end, DUMMY_00, DUMMY_FF});
}

core::Status SSD1306::scroll_diagonally(bool left, uint8_t start, uint8_t end,
                                        uint8_t offset, uint8_t rows,
                                        uint8_t speed, uint8_t step) {
  if (auto step = command(Command::VerticalScrollArea, {offset, rows});
      !step.ok()) {
    return step;
  }
  return command(left ? Command::VerticalLeftHorizontalScroll
                      : Command::VerticalRightHorizontalScroll,
                 {DUMMY_00, start, speed, end, step});
}

core::Status SSD1306::start_scroll() {
  scrolling_ = true;
  return command(Command::ActivateScroll);
}

core::Status SSD1306::stop_scroll() {
  scrolling_ = false;
  return command(Command::DeactivateScroll);
}

core::Status SSD1306::no_op() { return command(Command::Noop); }

core::Status SSD1306::command(Command cmd,
                              std::initializer_list<uint8_t> params) {
  return command(to_byte(cmd), params);
}

core::Status SSD1306::command(uint8_t opcode,
                              std::initializer_list<uint8_t> params) {
  std::array<uint8_t, MAX_PARAMS + 1> frame{};
  size_t len = std::min(params.size(), MAX_PARAMS);
  frame[0] = opcode;
  std::copy_n(params.begin(), len, frame.begin() + 1);
  ESP_LOGD(TAG, "cmd 0x%02x (+%u)", opcode, static_cast<unsigned>(len));
  return write(control::COMMAND, std::span(frame).first(len + 1));
}

core::Status SSD1306::data(std::span<const uint8_t> bytes) {
  return write(control::DATA, bytes);
}

core::Status SSD1306::write(uint8_t control, std::span<const uint8_t> bytes) {
  auto acked = bus_.reg_write(config_.address, control, bytes);
  if (!acked) {
    return core::Err(acked.error());
  }
  if (!*acked) {
    ESP_LOGW(TAG, "No ack from 0x%02x", config_.address);
    return core::Err(tunnel::ERR_ACK_FAILURE);
  }
  return core::Ok();
}

} // namespace driver::ssd1306
