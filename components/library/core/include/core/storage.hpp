/**
 * @file storage.hpp
 * @brief Persistent key-value store interface
 *
 * Holds small settings that must survive a reboot, such as a calibration
 * blob and its layout version. Keys follow NVS rules: at most 15
 * characters, longer keys are truncated.
 */

#pragma once

#include "result.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

namespace core {

class IStorage {
public:
  virtual ~IStorage() = default;

  IStorage(const IStorage &) = delete;
  IStorage &operator=(const IStorage &) = delete;

  [[nodiscard]] virtual bool is_ready() const = 0;

  /// ESP_ERR_NVS_NOT_FOUND (or ESP_ERR_NOT_FOUND) when absent
  [[nodiscard]] virtual Result<uint8_t> get_u8(std::string_view key) = 0;
  [[nodiscard]] virtual Status set_u8(std::string_view key, uint8_t value) = 0;

  [[nodiscard]] virtual Result<size_t> blob_size(std::string_view key) = 0;
  /// @p out must be at least blob_size() bytes
  [[nodiscard]] virtual Status get_blob(std::string_view key,
                                        std::span<uint8_t> out) = 0;
  [[nodiscard]] virtual Status set_blob(std::string_view key,
                                        std::span<const uint8_t> data) = 0;

  [[nodiscard]] virtual bool contains(std::string_view key) = 0;
  [[nodiscard]] virtual Status erase(std::string_view key) = 0;

  /// Writes are not durable until committed
  [[nodiscard]] virtual Status commit() = 0;

protected:
  IStorage() = default;
};

using StoragePtr = std::unique_ptr<IStorage>;

} // namespace core
