/**
 * @file calibration_store.hpp
 * @brief Persist magnetometer calibration across reboots
 */

#pragma once

#include "types.hpp"

#include <core/result.hpp>
#include <core/storage.hpp>

#include <cstdint>

namespace driver::hmc5883l {

/// Saves a Calibration as a versioned blob in a storage namespace
class CalibrationStore {
public:
  static constexpr uint8_t VERSION = 1;

  explicit CalibrationStore(core::IStorage &storage) : storage_(storage) {}

  /// ESP_ERR_NOT_FOUND if nothing saved, ESP_ERR_INVALID_VERSION if the
  /// saved layout is different
  [[nodiscard]] core::Result<Calibration> load();

  [[nodiscard]] core::Status save(const Calibration &calibration);

  [[nodiscard]] core::Status clear();

private:
  core::IStorage &storage_;
};

} // namespace driver::hmc5883l
