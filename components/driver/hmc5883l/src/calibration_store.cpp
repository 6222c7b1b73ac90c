/**
 * @file calibration_store.cpp
 * @brief Calibration blob load/save
 */

#include "hmc5883l/calibration_store.hpp"

#include <esp_log.h>

#include <array>
#include <cstring>
#include <span>

namespace driver::hmc5883l {

namespace {
constexpr const char *TAG = "hmc5883l";
constexpr const char *VERSION_KEY = "cal_ver";
constexpr const char *DATA_KEY = "cal";

// offset x, y, z then gain x, y, z
constexpr size_t BLOB_SIZE = 6 * sizeof(float);
using Blob = std::array<uint8_t, BLOB_SIZE>;

[[nodiscard]] Blob pack(const Calibration &cal) {
  const std::array<float, 6> values = {cal.offset.x, cal.offset.y,
                                       cal.offset.z, cal.gain.x,
                                       cal.gain.y,   cal.gain.z};
  Blob blob{};
  std::memcpy(blob.data(), values.data(), BLOB_SIZE);
  return blob;
}

[[nodiscard]] Calibration unpack(const Blob &blob) {
  std::array<float, 6> v{};
  std::memcpy(v.data(), blob.data(), BLOB_SIZE);
  return {.offset = {v[0], v[1], v[2]}, .gain = {v[3], v[4], v[5]}};
}
} // namespace

core::Result<Calibration> CalibrationStore::load() {
  if (!storage_.is_ready()) {
    return ESP_ERR_INVALID_STATE;
  }

  auto version = storage_.get_u8(VERSION_KEY);
  if (!version.ok()) {
    ESP_LOGI(TAG, "No saved calibration");
    return ESP_ERR_NOT_FOUND;
  }
  if (*version != VERSION) {
    ESP_LOGW(TAG, "Saved calibration version %u, expected %u", *version,
             VERSION);
    return ESP_ERR_INVALID_VERSION;
  }

  auto size = storage_.blob_size(DATA_KEY);
  if (!size.ok()) {
    return size.error();
  }
  if (*size != BLOB_SIZE) {
    ESP_LOGW(TAG, "Saved calibration has %zu bytes", *size);
    return ESP_ERR_INVALID_SIZE;
  }

  Blob blob{};
  if (auto status = storage_.get_blob(DATA_KEY, blob); !status.ok()) {
    return status.error();
  }
  return unpack(blob);
}

core::Status CalibrationStore::save(const Calibration &calibration) {
  if (!storage_.is_ready()) {
    return ESP_ERR_INVALID_STATE;
  }

  auto blob = pack(calibration);
  if (auto status = storage_.set_blob(DATA_KEY, blob); !status.ok()) {
    return status;
  }
  if (auto status = storage_.set_u8(VERSION_KEY, VERSION); !status.ok()) {
    return status;
  }

  auto status = storage_.commit();
  if (status.ok()) {
    ESP_LOGI(TAG, "Saved calibration");
  }
  return status;
}

core::Status CalibrationStore::clear() {
  if (!storage_.is_ready()) {
    return ESP_ERR_INVALID_STATE;
  }
  if (storage_.contains(DATA_KEY)) {
    if (auto status = storage_.erase(DATA_KEY); !status.ok()) {
      return status;
    }
  }
  if (storage_.contains(VERSION_KEY)) {
    if (auto status = storage_.erase(VERSION_KEY); !status.ok()) {
      return status;
    }
  }
  return storage_.commit();
}

} // namespace driver::hmc5883l
