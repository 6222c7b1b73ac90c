/**
 * @file types.hpp
 * @brief HMC5883L registers, settings and reading types
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace driver::hmc5883l {

using namespace std::chrono_literals;

/// Fixed 7-bit I2C address
inline constexpr uint8_t I2C_ADDR = 0x1E;

/// Register map
namespace reg {
inline constexpr uint8_t CONFIG_A = 0x00;
inline constexpr uint8_t CONFIG_B = 0x01;
inline constexpr uint8_t MODE = 0x02;
inline constexpr uint8_t DATA_X_MSB = 0x03; ///< X, Z, Y, each big-endian
} // namespace reg

/// Size of the output data block
inline constexpr size_t DATA_BLOCK_SIZE = 6;

/// Raw value the chip reports for an overflowed axis
inline constexpr int16_t SATURATED = -4096;

/// Samples averaged per measurement (CRA bits 6:5)
enum class Averaging : uint8_t {
  One = 0,
  Two = 1,
  Four = 2,
  Eight = 3,
};

/// Output rate in continuous mode (CRA bits 4:2)
enum class DataRate : uint8_t {
  Hz0_75 = 0,
  Hz1_5 = 1,
  Hz3 = 2,
  Hz7_5 = 3,
  Hz15 = 4,
  Hz30 = 5,
  Hz75 = 6,
};

/// Measurement bias (CRA bits 1:0), self-test excitation
enum class Bias : uint8_t {
  Normal = 0,
  Positive = 1,
  Negative = 2,
};

/// Field range in gauss (CRB bits 7:5)
enum class Gain : uint8_t {
  Ga0_88,
  Ga1_3,
  Ga1_9,
  Ga2_5,
  Ga4_0,
  Ga4_7,
  Ga5_6,
  Ga8_1,
};

/// Operating mode (MODE bits 1:0)
enum class Mode : uint8_t {
  Continuous = 0,
  Single = 1,
  Idle = 2,
  Sleep = 3,
};

/// Register code and resolution (mG/LSB) of a gain setting
struct GainSetting {
  uint8_t code;
  float resolution;
};

[[nodiscard]] constexpr GainSetting gain_setting(Gain gain) {
  switch (gain) {
  case Gain::Ga0_88:
    return {0, 0.73F};
  case Gain::Ga1_3:
    return {1, 0.92F};
  case Gain::Ga1_9:
    return {2, 1.22F};
  case Gain::Ga2_5:
    return {3, 1.52F};
  case Gain::Ga4_0:
    return {4, 2.27F};
  case Gain::Ga4_7:
    return {5, 2.56F};
  case Gain::Ga5_6:
    return {6, 3.03F};
  case Gain::Ga8_1:
    return {7, 4.35F};
  }
  return {0, 0.73F};
}

/// Configuration register A value
[[nodiscard]] constexpr uint8_t config_a(Averaging avg, DataRate rate,
                                         Bias bias = Bias::Normal) {
  return static_cast<uint8_t>((static_cast<uint8_t>(avg) << 5) |
                              (static_cast<uint8_t>(rate) << 2) |
                              static_cast<uint8_t>(bias));
}

/// Configuration register B value
[[nodiscard]] constexpr uint8_t config_b(Gain gain) {
  return static_cast<uint8_t>(gain_setting(gain).code << 5);
}

static_assert(config_a(Averaging::Eight, DataRate::Hz15) == 0x70);
static_assert(config_a(Averaging::Eight, DataRate::Hz15, Bias::Positive) ==
              0x71);
static_assert(config_b(Gain::Ga1_3) == 0x20);

/// Field strength per axis (mG); NaN marks a saturated axis
struct Axes {
  float x = 0.0F;
  float y = 0.0F;
  float z = 0.0F;
};

/// Per-axis correction: calibrated = raw * gain + offset
struct Calibration {
  Axes offset{0.0F, 0.0F, 0.0F};
  Axes gain{1.0F, 1.0F, 1.0F};
};

/// Self-test excitation applied by the bias current (mG)
inline constexpr float SELF_TEST_XY = 1160.0F;
inline constexpr float SELF_TEST_Z = 1080.0F;

/// A biased reading counts once every axis exceeds this magnitude (mG)
inline constexpr float SELF_TEST_THRESHOLD = 200.0F;

/// Driver configuration
struct Config {
  Averaging averaging = Averaging::Eight;
  DataRate rate = DataRate::Hz15;
  Gain gain = Gain::Ga0_88;
  Mode mode = Mode::Continuous;
  float declination_deg = 0.0F;
  Calibration calibration{};
  std::chrono::milliseconds calibration_duration = 60s;
  std::chrono::milliseconds settle = 67ms; ///< Wait after each read
};

} // namespace driver::hmc5883l
