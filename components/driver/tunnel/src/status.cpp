/**
 * @file status.cpp
 * @brief Adapter status line parser
 */

#include "tunnel/status.hpp"
#include "tunnel/error.hpp"

#include <esp_log.h>

#include <array>
#include <cstdio>

namespace driver::tunnel {

namespace {
constexpr const char *TAG = "tunnel";
constexpr int STATUS_FIELDS = 12;
constexpr size_t MAX_LINE = 128;
} // namespace

core::Result<Status> parse_status(std::string_view line,
                                  std::string_view port) {
  auto open = line.find('[');
  auto close = line.find(']', open == std::string_view::npos ? 0 : open);
  if (open == std::string_view::npos || close == std::string_view::npos ||
      close - open + 1 >= MAX_LINE) {
    ESP_LOGW(TAG, "status line not bracketed (%u bytes)",
             static_cast<unsigned>(line.size()));
    return core::Err(ERR_PARSE);
  }

  // sscanf needs a terminated copy of the bracketed part
  std::array<char, MAX_LINE> buf{};
  line.copy(buf.data(), close - open + 1, open);

  std::array<char, 32> model{};
  std::array<char, 32> serial{};
  std::array<char, 8> mode{};
  int uptime = 0;
  float voltage = 0;
  float current = 0;
  float temperature = 0;
  int sda = 0;
  int scl = 0;
  int speed = 0;
  int pullups = 0;
  unsigned int crc = 0;

  int fields = std::sscanf(buf.data(), "[%31s %31s %d %f %f %f %7s %d %d %d %d %x]",
                           model.data(), serial.data(), &uptime, &voltage,
                           &current, &temperature, mode.data(), &sda, &scl,
                           &speed, &pullups, &crc);
  if (fields != STATUS_FIELDS) {
    ESP_LOGW(TAG, "status line malformed, %d of %d fields: %s", fields,
             STATUS_FIELDS, buf.data());
    return core::Err(ERR_PARSE);
  }

  return Status{
      .port = std::string(port),
      .model = model.data(),
      .serial = serial.data(),
      .uptime = static_cast<uint32_t>(uptime),
      .voltage = voltage,
      .current = current,
      .temperature = temperature,
      .mode = mode.data(),
      .sda = static_cast<uint8_t>(sda),
      .scl = static_cast<uint8_t>(scl),
      .speed = static_cast<uint16_t>(speed),
      .pullups = static_cast<uint8_t>(pullups),
      .ccitt_crc = static_cast<uint16_t>(crc),
  };
}

} // namespace driver::tunnel
