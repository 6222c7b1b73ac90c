/**
 * @file nvs_storage.hpp
 * @brief IStorage on one NVS namespace
 *
 * @warning Flash wears out after ~100k erase cycles per sector. Save on
 *          user action (a finished calibration), never per sample.
 */

#pragma once

#include "storage.hpp"

#include <esp_log.h>
#include <nvs.h>
#include <nvs_flash.h>

#include <algorithm>
#include <array>
#include <cstring>

namespace core {

namespace detail {
/// NVS names are NUL-terminated and at most 15 characters
using NvsName = std::array<char, NVS_KEY_NAME_MAX_SIZE>;

inline NvsName nvs_name(std::string_view name) {
  NvsName buf{};
  std::memcpy(buf.data(), name.data(), std::min(name.size(), buf.size() - 1));
  return buf;
}
} // namespace detail

class NvsStorage final : public IStorage {
public:
  explicit NvsStorage(nvs_handle_t handle) : handle_(handle) {}
  ~NvsStorage() override { nvs_close(handle_); }

  [[nodiscard]] bool is_ready() const override { return true; }

  [[nodiscard]] Result<uint8_t> get_u8(std::string_view key) override {
    uint8_t value = 0;
    if (auto err = nvs_get_u8(handle_, detail::nvs_name(key).data(), &value);
        err != ESP_OK) {
      return Err(err);
    }
    return value;
  }

  [[nodiscard]] Status set_u8(std::string_view key, uint8_t value) override {
    return nvs_set_u8(handle_, detail::nvs_name(key).data(), value);
  }

  [[nodiscard]] Result<size_t> blob_size(std::string_view key) override {
    size_t size = 0;
    if (auto err =
            nvs_get_blob(handle_, detail::nvs_name(key).data(), nullptr, &size);
        err != ESP_OK) {
      return Err(err);
    }
    return size;
  }

  [[nodiscard]] Status get_blob(std::string_view key,
                                std::span<uint8_t> out) override {
    size_t size = out.size();
    return nvs_get_blob(handle_, detail::nvs_name(key).data(), out.data(),
                        &size);
  }

  [[nodiscard]] Status set_blob(std::string_view key,
                                std::span<const uint8_t> data) override {
    return nvs_set_blob(handle_, detail::nvs_name(key).data(), data.data(),
                        data.size());
  }

  [[nodiscard]] bool contains(std::string_view key) override {
    nvs_type_t type{};
    return nvs_find_key(handle_, detail::nvs_name(key).data(), &type) == ESP_OK;
  }

  [[nodiscard]] Status erase(std::string_view key) override {
    return nvs_erase_key(handle_, detail::nvs_name(key).data());
  }

  [[nodiscard]] Status commit() override { return nvs_commit(handle_); }

private:
  nvs_handle_t handle_;
};

/// Bring up the default NVS partition, erasing it when the layout is stale
[[nodiscard]] inline Status init_nvs_flash() {
  esp_err_t err = nvs_flash_init();
  if (err == ESP_ERR_NVS_NO_FREE_PAGES ||
      err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
    ESP_LOGW("nvs", "Partition needs erase (%s)", esp_err_to_name(err));
    if (err = nvs_flash_erase(); err != ESP_OK) {
      return err;
    }
    err = nvs_flash_init();
  }
  return err;
}

/// nullptr when the namespace cannot be opened
[[nodiscard]] inline StoragePtr open_nvs(std::string_view ns) {
  auto name = detail::nvs_name(ns);
  nvs_handle_t handle = 0;
  if (auto err = nvs_open(name.data(), NVS_READWRITE, &handle); err != ESP_OK) {
    ESP_LOGE("nvs", "open '%s' failed: %s", name.data(), esp_err_to_name(err));
    return nullptr;
  }
  return std::make_unique<NvsStorage>(handle);
}

} // namespace core
