/**
 * @file app.cpp
 * @brief I2C bridge application implementation
 */

#include <application/app.hpp>

#include "app_config.hpp"

#include <tunnel/error.hpp>

#include <esp_log.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <numbers>

namespace application {

namespace {
using Lock = core::LockGuard<core::RecursiveMutex>;

constexpr int DIAL_X = 96;
constexpr int DIAL_Y = 32;
constexpr int DIAL_RADIUS = 28;
constexpr int NEEDLE_LENGTH = 24;

[[nodiscard]] bool contains(std::span<const uint8_t> addresses,
                            uint8_t address) {
  return std::find(addresses.begin(), addresses.end(), address) !=
         addresses.end();
}
} // namespace

Bridge::Bridge(Board &board)
    : core::Application(app::config::STORAGE_NAMESPACE), board_(board) {}

Bridge::~Bridge() {
  if (compass_) {
    compass_->stop_continuous_reader();
    // The reader task must leave the driver before it is deleted
    while (compass_->state() != driver::hmc5883l::DriverState::Idle) {
      core::Task::delay(app::config::RENDER_INTERVAL);
    }
  }
}

void Bridge::run() {
  tunnel_event_sub_ = events().subscribe(TUNNEL_EVENTS, ESP_EVENT_ANY_ID,
                                         tunnel_event_handler, this);

  if (auto status = connect(); !status) {
    ESP_LOGE(TAG, "Adapter not available: %s",
             driver::tunnel::error_name(status.error()));
    return;
  }

  auto devices = board_.tunnel().scan(true);
  if (!devices) {
    ESP_LOGE(TAG, "Bus scan failed: %s",
             driver::tunnel::error_name(devices.error()));
    return;
  }
  ESP_LOGI(TAG, "%u device(s) on the bus",
           static_cast<unsigned>(devices->size()));

  if (contains(*devices, driver::ssd1306::I2C_ADDR)) {
    init_display();
  }
  if (contains(*devices, driver::hmc5883l::I2C_ADDR)) {
    init_compass();
  }

  if (!compass_) {
    ESP_LOGW(TAG, "No compass found, nothing to do");
    show_message("No compass");
    return;
  }
  run_compass();
}

core::Status Bridge::connect() {
  auto &tunnel = board_.tunnel();

  auto status = tunnel.connect(app::config::BUS_RESET_ON_CONNECT);
  if (!status) {
    return core::Err(status.error());
  }
  ESP_LOGI(TAG, "%s %s on %s: %.2f V, %.1f C, up %lu s", status->model.c_str(),
           status->serial.c_str(), status->port.c_str(), status->voltage,
           status->temperature, static_cast<unsigned long>(status->uptime));

  if (auto err = tunnel.set_pullups(app::config::ADAPTER_PULLUPS); !err) {
    return err;
  }
  return tunnel.set_speed(app::config::BUS_SPEED_KHZ);
}

void Bridge::init_display() {
  display_.emplace(board_.tunnel());
  if (auto err = display_->startup(); !err) {
    ESP_LOGE(TAG, "Display startup failed: %s",
             driver::tunnel::error_name(err.error()));
    display_.reset();
    return;
  }
  show_message("I2C bridge", "starting");
}

void Bridge::init_compass() {
  driver::hmc5883l::Config config{
      .declination_deg = app::config::DECLINATION_DEG,
      .calibration_duration = app::config::CALIBRATION_DURATION,
  };
  compass_.emplace(board_.tunnel(), config);

  if (auto err = compass_->init(); !err) {
    ESP_LOGE(TAG, "Compass init failed: %s",
             driver::tunnel::error_name(err.error()));
    compass_.reset();
    return;
  }

  auto *nvs = storage();
  if (nvs == nullptr) {
    return;
  }

  driver::hmc5883l::CalibrationStore store(*nvs);
  if (auto saved = store.load(); saved) {
    compass_->set_calibration(*saved);
    ESP_LOGI(TAG, "Compass calibration restored");
  } else if (saved.error() == ESP_ERR_NOT_FOUND &&
             app::config::CALIBRATE_WHEN_MISSING) {
    calibrate_compass();
  } else {
    ESP_LOGW(TAG, "Stored calibration unusable: %s",
             esp_err_to_name(saved.error()));
  }
}

void Bridge::calibrate_compass() {
  show_message("Calibrating", "rotate device");

  auto result = compass_->start_calibration(
      [](const driver::hmc5883l::Axes &min, const driver::hmc5883l::Axes &max) {
        ESP_LOGD(TAG, "range x[%.0f %.0f] y[%.0f %.0f] z[%.0f %.0f]", min.x,
                 max.x, min.y, max.y, min.z, max.z);
      });
  if (!result) {
    ESP_LOGE(TAG, "Calibration failed: %s",
             driver::tunnel::error_name(result.error()));
    return;
  }

  auto *nvs = storage();
  if (nvs == nullptr) {
    return;
  }
  driver::hmc5883l::CalibrationStore store(*nvs);
  if (auto err = store.save(*result); !err) {
    ESP_LOGW(TAG, "Failed to save calibration: %s",
             esp_err_to_name(err.error()));
  }
}

void Bridge::run_compass() {
  reader_task_ = std::make_unique<core::Task>(
      [this]() {
        auto status = compass_->start_continuous_reader(
            [this](const driver::hmc5883l::Axes &axes) {
              Lock lock(reading_mutex_);
              latest_ = axes;
              fresh_ = true;
            });
        if (!status) {
          ESP_LOGE(TAG, "Compass reader stopped: %s",
                   driver::tunnel::error_name(status.error()));
        }
        reader_done_.give();
      },
      core::TaskConfig{.name = "compass", .stack_size = 4096, .priority = 5});

  // Render until the reader task returns, however early that is
  while (!reader_done_.take_for(app::config::RENDER_INTERVAL)) {
    driver::hmc5883l::Axes axes;
    {
      Lock lock(reading_mutex_);
      if (!fresh_) {
        continue;
      }
      axes = latest_;
      fresh_ = false;
    }

    float heading =
        driver::hmc5883l::compass_heading(axes, compass_->declination());
    if (std::isnan(heading)) {
      ESP_LOGW(TAG, "Field out of range");
      continue;
    }
    ESP_LOGI(TAG, "Heading %.1f deg (x=%.1f y=%.1f z=%.1f mG)",
             heading * 180.0F / std::numbers::pi_v<float>, axes.x, axes.y,
             axes.z);
    render(heading);
  }
  show_message("Compass", "stopped");
}

void Bridge::render(float heading) {
  if (!display_) {
    return;
  }
  auto &fb = display_->framebuffer();
  fb.clear();

  std::array<char, 16> text{};
  std::snprintf(text.data(), text.size(), "%5.1f",
                heading * 180.0F / std::numbers::pi_v<float>);
  fb.text(0, 0, "Heading");
  fb.text(0, 16, text.data());
  fb.text(DIAL_X - 2, DIAL_Y - DIAL_RADIUS - 9, "N");
  fb.circle(DIAL_X, DIAL_Y, DIAL_RADIUS);

  // North up: screen y grows downwards
  auto dx = static_cast<int>(std::lround(NEEDLE_LENGTH * std::sin(heading)));
  auto dy = static_cast<int>(std::lround(NEEDLE_LENGTH * std::cos(heading)));
  fb.line(DIAL_X, DIAL_Y, DIAL_X + dx, DIAL_Y - dy);

  if (auto err = display_->display(); !err) {
    ESP_LOGW(TAG, "Display update failed: %s",
             driver::tunnel::error_name(err.error()));
  }
}

void Bridge::show_message(const char *line1, const char *line2) {
  if (!display_) {
    return;
  }
  auto &fb = display_->framebuffer();
  fb.clear();
  fb.text(0, 0, line1);
  if (line2 != nullptr) {
    fb.text(0, 16, line2);
  }
  if (auto err = display_->display(); !err) {
    ESP_LOGW(TAG, "Display update failed: %s",
             driver::tunnel::error_name(err.error()));
  }
}

void Bridge::tunnel_event_handler(void *arg, esp_event_base_t base,
                                  int32_t event_id, void *event_data) {
  (void)arg;
  (void)base;

  switch (static_cast<driver::tunnel::TunnelEvent>(event_id)) {
  case driver::tunnel::TunnelEvent::Connected:
    ESP_LOGI(TAG, "Adapter connected");
    break;
  case driver::tunnel::TunnelEvent::Disconnected:
    ESP_LOGW(TAG, "Adapter disconnected");
    break;
  case driver::tunnel::TunnelEvent::Fault: {
    const auto *fault =
        static_cast<const driver::tunnel::TunnelFaultEvent *>(event_data);
    ESP_LOGE(TAG, "Adapter fault: %s",
             fault != nullptr ? driver::tunnel::error_name(fault->error)
                              : "unknown");
    break;
  }
  }
}

} // namespace application
