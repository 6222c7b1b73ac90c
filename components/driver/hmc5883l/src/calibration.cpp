/**
 * @file calibration.cpp
 * @brief HMC5883L gain and hard-iron calibration
 *
 * Gain comes from the chip's self-test: with the bias current applied,
 * each axis sees a known excitation field, so gain = excitation / reading,
 * averaged over positive and negative bias. The offset comes from rotating
 * the device through all orientations while tracking the min/max of the
 * gain-corrected readings.
 */

#include "hmc5883l/driver.hpp"

#include <tunnel/error.hpp>

#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <esp_log.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace driver::hmc5883l {

namespace {
constexpr const char *TAG = "hmc5883l";

using Lock = core::LockGuard<core::RecursiveMutex>;

[[nodiscard]] bool has_nan(const Axes &a) {
  return std::isnan(a.x) || std::isnan(a.y) || std::isnan(a.z);
}

[[nodiscard]] bool past_threshold(const Axes &a, Bias bias) {
  if (bias == Bias::Negative) {
    return a.x < -SELF_TEST_THRESHOLD && a.y < -SELF_TEST_THRESHOLD &&
           a.z < -SELF_TEST_THRESHOLD;
  }
  return a.x > SELF_TEST_THRESHOLD && a.y > SELF_TEST_THRESHOLD &&
         a.z > SELF_TEST_THRESHOLD;
}

[[nodiscard]] Axes excitation_gain(const Axes &reading) {
  return {
      .x = SELF_TEST_XY / std::fabs(reading.x),
      .y = SELF_TEST_XY / std::fabs(reading.y),
      .z = SELF_TEST_Z / std::fabs(reading.z),
  };
}
} // namespace

Axes centre_offset(const Axes &min, const Axes &max) {
  return {
      .x = (max.x - min.x) / 2.0F - max.x,
      .y = (max.y - min.y) / 2.0F - max.y,
      .z = (max.z - min.z) / 2.0F - max.z,
  };
}

core::Result<Calibration> HMC5883L::start_calibration(CalibrationCallback cb) {
  if (!begin(DriverState::Calibrating)) {
    ESP_LOGD(TAG, "Already busy, calibration not started");
    return calibration();
  }
  {
    Lock lock(mutex_);
    progress_ = Calibration{};
  }

  ESP_LOGI(TAG, "Calibration started");
  bool tracked = false;
  auto result = run_calibration(cb, tracked);

  // Leave the chip measuring normally whatever happened
  if (auto status = set_bias(Bias::Normal); !status) {
    ESP_LOGW(TAG, "Failed to clear bias: %s",
             tunnel::error_name(status.error()));
    if (result) {
      result = core::Err(status.error());
    }
  }

  if (result && !tracked) {
    ESP_LOGW(TAG, "Calibration aborted before offset tracking, not applied");
  } else if (result) {
    set_calibration(*result);
    ESP_LOGI(TAG,
             "Calibration done: gain (%.3f %.3f %.3f) offset (%.1f %.1f %.1f)",
             result->gain.x, result->gain.y, result->gain.z,
             result->offset.x, result->offset.y, result->offset.z);
  } else {
    ESP_LOGE(TAG, "Calibration failed: %s",
             tunnel::error_name(result.error()));
  }
  finish();
  return result;
}

Calibration HMC5883L::abort_calibration() {
  Lock lock(mutex_);
  if (state_ == DriverState::Calibrating) {
    cancel_.cancel();
  }
  return progress_;
}

core::Result<bool> HMC5883L::self_test(Bias bias, Axes &gain) {
  if (auto status = set_bias(bias); !status) {
    return core::Err(status.error());
  }
  // Data registers still hold the pre-bias measurement until one output
  // period has passed
  auto stop = token();
  if (stop.wait_for(config_.settle)) {
    return false;
  }
  while (!stop.cancelled()) {
    auto reading = read_raw();
    if (!reading) {
      return core::Err(reading.error());
    }
    if (past_threshold(*reading, bias)) {
      gain = excitation_gain(*reading);
      return true;
    }
    ESP_LOGD(TAG, "Self-test reading below threshold (%.1f %.1f %.1f)",
             reading->x, reading->y, reading->z);
  }
  return false;
}

core::Result<Calibration>
HMC5883L::run_calibration(const CalibrationCallback &cb, bool &tracked) {
  auto stop = token();
  Calibration cal{};

  // Gain from positive then negative self-test excitation
  Axes positive{};
  auto done = self_test(Bias::Positive, positive);
  if (!done) {
    return core::Err(done.error());
  }
  if (!*done) {
    return cal;
  }
  cal.gain = positive;
  {
    Lock lock(mutex_);
    progress_ = cal;
  }

  Axes negative{};
  done = self_test(Bias::Negative, negative);
  if (!done) {
    return core::Err(done.error());
  }
  if (!*done) {
    return cal;
  }
  cal.gain = {
      .x = (positive.x + negative.x) / 2.0F,
      .y = (positive.y + negative.y) / 2.0F,
      .z = (positive.z + negative.z) / 2.0F,
  };
  {
    Lock lock(mutex_);
    progress_ = cal;
  }
  ESP_LOGI(TAG, "Gain: %.3f %.3f %.3f, rotate the device now", cal.gain.x,
           cal.gain.y, cal.gain.z);

  if (auto status = set_bias(Bias::Normal); !status) {
    return core::Err(status.error());
  }
  if (stop.wait_for(config_.settle)) {
    return cal;
  }

  // Hard-iron offset from the range seen while the device is turned around
  constexpr float inf = std::numeric_limits<float>::infinity();
  Axes min{inf, inf, inf};
  Axes max{-inf, -inf, -inf};
  bool sampled = false;
  tracked = true;

  const TickType_t begin = xTaskGetTickCount();
  const TickType_t duration = pdMS_TO_TICKS(config_.calibration_duration.count());
  while (!stop.cancelled() && xTaskGetTickCount() - begin < duration) {
    auto raw = read_raw();
    if (!raw) {
      return core::Err(raw.error());
    }
    if (has_nan(*raw)) {
      continue;
    }

    Axes scaled{raw->x * cal.gain.x, raw->y * cal.gain.y, raw->z * cal.gain.z};
    min = {std::min(min.x, scaled.x), std::min(min.y, scaled.y),
           std::min(min.z, scaled.z)};
    max = {std::max(max.x, scaled.x), std::max(max.y, scaled.y),
           std::max(max.z, scaled.z)};
    sampled = true;

    cal.offset = centre_offset(min, max);
    {
      Lock lock(mutex_);
      progress_ = cal;
    }
    if (cb) {
      cb(min, max);
    }
  }

  if (!sampled) {
    ESP_LOGW(TAG, "No samples collected, offset left at zero");
  }
  return cal;
}

} // namespace driver::hmc5883l
