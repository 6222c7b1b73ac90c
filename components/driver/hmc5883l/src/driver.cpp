/**
 * @file driver.cpp
 * @brief HMC5883L register access, sampling and continuous reader
 */

#include "hmc5883l/driver.hpp"

#include <tunnel/error.hpp>

#include <esp_log.h>

#include <cmath>
#include <limits>
#include <numbers>

namespace driver::hmc5883l {

namespace {
constexpr const char *TAG = "hmc5883l";

using Lock = core::LockGuard<core::RecursiveMutex>;

[[nodiscard]] float to_radians(float degrees) {
  return degrees / 180.0F * std::numbers::pi_v<float>;
}

[[nodiscard]] float convert(uint8_t msb, uint8_t lsb, float resolution) {
  auto raw = static_cast<int16_t>(static_cast<uint16_t>((msb << 8) | lsb));
  if (raw == SATURATED) {
    return std::numeric_limits<float>::quiet_NaN();
  }
  return static_cast<float>(raw) * resolution;
}
} // namespace

Axes decode(std::span<const uint8_t> block, float resolution) {
  if (block.size() < DATA_BLOCK_SIZE) {
    constexpr float nan = std::numeric_limits<float>::quiet_NaN();
    return {nan, nan, nan};
  }
  return {
      .x = convert(block[0], block[1], resolution),
      .y = convert(block[4], block[5], resolution),
      .z = convert(block[2], block[3], resolution),
  };
}

float compass_heading(const Axes &axes, float declination) {
  if (std::isnan(axes.x) || std::isnan(axes.y)) {
    return std::numeric_limits<float>::quiet_NaN();
  }
  constexpr float two_pi = 2.0F * std::numbers::pi_v<float>;
  float angle = std::fmod(std::atan2(axes.y, axes.x) + declination, two_pi);
  if (angle < 0.0F) {
    angle += two_pi;
  }
  return angle < two_pi ? angle : 0.0F;
}

HMC5883L::HMC5883L(tunnel::Tunnel &bus, const Config &config)
    : bus_(bus), config_(config), gain_(gain_setting(config.gain)),
      declination_(to_radians(config.declination_deg)) {}

core::Status HMC5883L::init() {
  if (auto status = write_register(
          reg::CONFIG_A, config_a(config_.averaging, config_.rate));
      !status) {
    ESP_LOGE(TAG, "Failed to write configuration A: %s",
             tunnel::error_name(status.error()));
    return status;
  }
  if (auto status = write_register(reg::CONFIG_B, config_b(config_.gain));
      !status) {
    ESP_LOGE(TAG, "Failed to write configuration B: %s",
             tunnel::error_name(status.error()));
    return status;
  }
  if (auto status =
          write_register(reg::MODE, static_cast<uint8_t>(config_.mode));
      !status) {
    ESP_LOGE(TAG, "Failed to set mode: %s",
             tunnel::error_name(status.error()));
    return status;
  }

  ESP_LOGI(TAG, "Initialized: %.2f mG/LSB, mode %u", gain_.resolution,
           static_cast<unsigned>(config_.mode));
  return core::Ok();
}

void HMC5883L::set_declination(float degrees) {
  Lock lock(mutex_);
  declination_ = to_radians(degrees);
}

float HMC5883L::declination() const {
  Lock lock(mutex_);
  return declination_;
}

core::Result<Axes> HMC5883L::read_raw() {
  auto block = bus_.reg_read(I2C_ADDR, reg::DATA_X_MSB, DATA_BLOCK_SIZE);
  if (!block) {
    ESP_LOGW(TAG, "Data read failed: %s", tunnel::error_name(block.error()));
    return core::Err(block.error());
  }
  Axes axes = decode(*block, gain_.resolution);
  if (std::isnan(axes.x) || std::isnan(axes.y) || std::isnan(axes.z)) {
    ESP_LOGD(TAG, "Saturated axis in reading");
  }

  // Next sample is not ready before one output period has passed
  [[maybe_unused]] bool cancelled = token().wait_for(config_.settle);
  return axes;
}

core::Result<Axes> HMC5883L::read_calibrated() {
  auto raw = read_raw();
  if (!raw) {
    return raw;
  }
  auto cal = calibration();
  return Axes{
      .x = raw->x * cal.gain.x + cal.offset.x,
      .y = raw->y * cal.gain.y + cal.offset.y,
      .z = raw->z * cal.gain.z + cal.offset.z,
  };
}

core::Result<float> HMC5883L::heading() {
  auto axes = read_calibrated();
  if (!axes) {
    return core::Err(axes.error());
  }
  float angle = compass_heading(*axes, declination());
  if (std::isnan(angle)) {
    return core::Err(ESP_ERR_INVALID_RESPONSE);
  }
  return angle;
}

core::Status HMC5883L::start_continuous_reader(ReadingCallback cb) {
  if (!begin(DriverState::Sampling)) {
    ESP_LOGD(TAG, "Already busy, reader not started");
    return core::Ok();
  }

  auto stop = token();
  ESP_LOGI(TAG, "Continuous reader started");
  core::Status status;
  while (!stop.cancelled()) {
    auto axes = read_calibrated();
    if (!axes) {
      status = core::Err(axes.error());
      break;
    }
    if (cb) {
      cb(*axes);
    }
  }
  finish();
  ESP_LOGI(TAG, "Continuous reader stopped");
  return status;
}

void HMC5883L::stop_continuous_reader() {
  Lock lock(mutex_);
  if (state_ == DriverState::Sampling) {
    cancel_.cancel();
  }
}

Calibration HMC5883L::calibration() const {
  Lock lock(mutex_);
  return config_.calibration;
}

void HMC5883L::set_calibration(const Calibration &calibration) {
  Lock lock(mutex_);
  config_.calibration = calibration;
}

DriverState HMC5883L::state() const {
  Lock lock(mutex_);
  return state_;
}

core::Status HMC5883L::write_register(uint8_t reg, uint8_t value) {
  auto acked = bus_.reg_write(I2C_ADDR, reg, value);
  if (!acked) {
    return core::Err(acked.error());
  }
  if (!*acked) {
    return core::Err(tunnel::ERR_ACK_FAILURE);
  }
  return core::Ok();
}

core::Status HMC5883L::set_bias(Bias bias) {
  return write_register(reg::CONFIG_A,
                        config_a(config_.averaging, config_.rate, bias));
}

bool HMC5883L::begin(DriverState state) {
  Lock lock(mutex_);
  if (state_ != DriverState::Idle) {
    return false;
  }
  state_ = state;
  cancel_.reset();
  token_ = cancel_.token();
  return true;
}

void HMC5883L::finish() {
  Lock lock(mutex_);
  state_ = DriverState::Idle;
  token_ = {};
}

core::CancellationToken HMC5883L::token() const {
  Lock lock(mutex_);
  return token_;
}

} // namespace driver::hmc5883l
