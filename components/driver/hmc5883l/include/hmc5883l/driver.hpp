/**
 * @file driver.hpp
 * @brief HMC5883L three-axis magnetometer over the I2C tunnel
 */

#pragma once

#include "types.hpp"

#include <core/cancellation.hpp>
#include <core/mutex.hpp>
#include <core/result.hpp>
#include <tunnel/tunnel.hpp>

#include <cstdint>
#include <functional>
#include <span>

namespace driver::hmc5883l {

/// What the driver's task is busy with
enum class DriverState : uint8_t {
  Idle,
  Sampling,
  Calibrating,
};

using ReadingCallback = std::function<void(const Axes &)>;
using CalibrationCallback =
    std::function<void(const Axes &min, const Axes &max)>;

/// Decode the 6-byte data block (X, Z, Y) into scaled axes
[[nodiscard]] Axes decode(std::span<const uint8_t> block, float resolution);

/// Heading in radians [0, 2pi) of the horizontal field, NaN if x or y is
[[nodiscard]] float compass_heading(const Axes &axes, float declination);

/// Hard-iron offset that centres the observed range on zero
[[nodiscard]] Axes centre_offset(const Axes &min, const Axes &max);

/**
 * @brief HMC5883L driver
 *
 * Long-running operations (continuous reader, calibration) block the
 * calling task; another task stops them through stop_continuous_reader()
 * or abort_calibration(). Only one of them runs at a time.
 */
class HMC5883L {
public:
  explicit HMC5883L(tunnel::Tunnel &bus, const Config &config = {});

  HMC5883L(const HMC5883L &) = delete;
  HMC5883L &operator=(const HMC5883L &) = delete;
  HMC5883L(HMC5883L &&) = delete;
  HMC5883L &operator=(HMC5883L &&) = delete;

  /// Write configuration A, B and mode registers
  [[nodiscard]] core::Status init();

  void set_declination(float degrees);
  /// Declination in radians
  [[nodiscard]] float declination() const;

  /// Scaled reading without calibration, then waits the settle delay
  [[nodiscard]] core::Result<Axes> read_raw();

  /// Reading with the installed calibration applied
  [[nodiscard]] core::Result<Axes> read_calibrated();

  /// Compass heading in radians [0, 2pi), declination applied
  [[nodiscard]] core::Result<float> heading();

  /// Deliver calibrated readings to @p cb until stopped
  ///
  /// Returns immediately with ESP_OK if the driver is already busy.
  [[nodiscard]] core::Status start_continuous_reader(ReadingCallback cb);
  void stop_continuous_reader();

  /// Self-test gain estimate then min/max tracking for hard-iron offset
  ///
  /// Runs for Config::calibration_duration or until abort_calibration().
  /// The result is installed on the driver unless aborted before offset
  /// tracking began. Returns the current calibration unchanged if the
  /// driver is already busy.
  [[nodiscard]] core::Result<Calibration>
  start_calibration(CalibrationCallback cb = {});

  /// Cancel a running calibration, returns what it has gathered so far
  Calibration abort_calibration();

  [[nodiscard]] Calibration calibration() const;
  void set_calibration(const Calibration &calibration);

  [[nodiscard]] DriverState state() const;
  [[nodiscard]] const Config &config() const { return config_; }

private:
  [[nodiscard]] core::Status write_register(uint8_t reg, uint8_t value);
  [[nodiscard]] core::Status set_bias(Bias bias);
  [[nodiscard]] bool begin(DriverState state);
  void finish();
  [[nodiscard]] core::CancellationToken token() const;

  /// Read until every axis is past the self-test threshold in the bias
  /// direction; false if cancelled first
  [[nodiscard]] core::Result<bool> self_test(Bias bias, Axes &gain);
  [[nodiscard]] core::Result<Calibration>
  run_calibration(const CalibrationCallback &cb, bool &tracked);

  tunnel::Tunnel &bus_;
  Config config_;
  GainSetting gain_;
  float declination_;

  mutable core::RecursiveMutex mutex_;
  DriverState state_ = DriverState::Idle;
  core::CancellationSource cancel_;
  core::CancellationToken token_;
  Calibration progress_{};
};

} // namespace driver::hmc5883l
