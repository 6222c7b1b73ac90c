/**
 * @file tunnel.cpp
 * @brief Serial I2C adapter protocol
 */

#include "tunnel/tunnel.hpp"

#include <core/task.hpp>

#include <esp_log.h>

#include <algorithm>
#include <array>
#include <cassert>
#include <cstdio>
#include <string>
#include <string_view>

CORE_EVENT_DEFINE_BASE(TUNNEL_EVENTS);

namespace driver::tunnel {

namespace {
constexpr const char *TAG = "tunnel";
constexpr size_t MAX_REG_READ = 255;
constexpr size_t SCAN_ROW = 8;

using Lock = core::LockGuard<core::RecursiveMutex>;

void log_scan_table(std::span<const uint8_t> response) {
  std::string row;
  int line = 0;
  for (size_t i = 0; i < response.size(); ++i) {
    auto address = static_cast<unsigned>(i + FIRST_SCAN_ADDRESS);
    std::array<char, 4> cell{};
    if (response[i] == SCAN_PRESENT) {
      std::snprintf(cell.data(), cell.size(), "%02X", address);
    } else {
      std::snprintf(cell.data(), cell.size(), "--");
    }
    if (!row.empty()) {
      row += ' ';
    }
    row += cell.data();
    if (address % SCAN_ROW == SCAN_ROW - 1) {
      ESP_LOGI(TAG, "%02d) %s", ++line, row.c_str());
      row.clear();
    }
  }
}
} // namespace

Tunnel::Tunnel(std::unique_ptr<serial::ITransport> transport,
               const Config &config)
    : transport_(std::move(transport)), config_(config) {
  assert(transport_ != nullptr && "Tunnel requires a transport");
}

Tunnel::~Tunnel() {
  if (transport_->is_open()) {
    [[maybe_unused]] auto status = transport_->close();
  }
}

core::Result<Status> Tunnel::connect(bool reset) {
  Lock lock(mutex_);

  // A new connection always starts a new session
  if (transport_->is_open()) {
    if (auto status = transport_->close(); !status) {
      fault(status.error());
      return core::Err(status.error());
    }
  }

  set_state(ConnectionState::Connecting);
  auto port = transport_->port_name();
  ESP_LOGI(TAG, "Connecting on %.*s", static_cast<int>(port.size()),
           port.data());

  if (auto status = transport_->open(); !status) {
    ESP_LOGE(TAG, "Failed to open %.*s: %s", static_cast<int>(port.size()),
             port.data(), error_name(status.error()));
    fault(status.error());
    return core::Err(status.error());
  }
  crc_.reset();

  Status status;
  if (auto result = handshake(reset, status); !result) {
    ESP_LOGE(TAG, "Handshake failed: %s", error_name(result.error()));
    [[maybe_unused]] auto closed = transport_->close();
    fault(result.error());
    return core::Err(result.error());
  }

  set_state(ConnectionState::Connected);
  ESP_LOGI(TAG, "Connected: %s %s, %u kHz, sda=%u scl=%u",
           status.model.c_str(), status.serial.c_str(), status.speed,
           status.sda, status.scl);
  return status;
}

core::Status Tunnel::handshake(bool reset, Status &status) {
  // Pad out any partial command the adapter may still be waiting on
  if (auto result = send(Command::Sync); !result) {
    return result;
  }
  core::Task::delay(config_.sync_settle);

  std::array<uint8_t, SYNC_FLUSH_COUNT> sync{};
  sync.fill(to_byte(Command::Sync));
  if (auto result = send(sync); !result) {
    return result;
  }
  if (auto result = transport_->flush(); !result) {
    return result;
  }

  for (uint8_t expected : ECHO_PATTERN) {
    auto reply = echo(expected);
    if (!reply) {
      return core::Err(reply.error());
    }
    if (*reply != expected) {
      ESP_LOGW(TAG, "Echo mismatch: sent 0x%02x, got 0x%02x", expected, *reply);
      return core::Err(ERR_ECHO_MISMATCH);
    }
  }

  auto current = get_status();
  if (!current) {
    return core::Err(current.error());
  }

  if (reset || !current->bus_idle()) {
    if (!reset) {
      ESP_LOGW(TAG, "Bus stuck (sda=%u scl=%u), resetting", current->sda,
               current->scl);
    }
    if (auto result = bus_reset(); !result) {
      return result;
    }
    current = get_status();
    if (!current) {
      return core::Err(current.error());
    }
  }

  status = std::move(*current);
  return core::Ok();
}

core::Status Tunnel::disconnect() {
  Lock lock(mutex_);
  if (state() == ConnectionState::Disconnected && !transport_->is_open()) {
    return core::Ok();
  }
  auto status = transport_->close();
  set_state(ConnectionState::Disconnected);
  if (!status) {
    ESP_LOGW(TAG, "Close failed: %s", error_name(status.error()));
  }
  return status;
}

core::Result<uint8_t> Tunnel::echo(uint8_t c) {
  Lock lock(mutex_);
  const std::array<uint8_t, 2> frame = {to_byte(Command::Echo), c};
  if (auto status = send(frame); !status) {
    return core::Err(status.error());
  }
  auto reply = transport_->read();
  if (!reply) {
    return core::Err(reply.error());
  }
  if (reply->size() != 1) {
    ESP_LOGW(TAG, "Echo of 0x%02x returned %u bytes", c,
             static_cast<unsigned>(reply->size()));
    return core::Err(ERR_ECHO_MISMATCH);
  }
  return reply->front();
}

core::Result<Status> Tunnel::get_status() {
  Lock lock(mutex_);
  if (auto status = send(Command::Status); !status) {
    return core::Err(status.error());
  }
  auto line = read_line();
  if (!line) {
    return core::Err(line.error());
  }
  std::string_view text(reinterpret_cast<const char *>(line->data()),
                        line->size());
  auto status = parse_status(text, transport_->port_name());
  if (status) {
    status->e_ccitt_crc = crc_.value();
  }
  return status;
}

core::Status Tunnel::reboot() {
  Lock lock(mutex_);
  if (auto status = send(Command::Reboot); !status) {
    return status;
  }
  ESP_LOGI(TAG, "Adapter reboot");
  core::Task::delay(config_.reboot_settle);
  return core::Ok();
}

core::Status Tunnel::set_pullups(int mask) {
  if (mask < 0 || mask > MAX_PULLUP_MASK) {
    ESP_LOGE(TAG, "Pullup mask %d out of range [0, %d]", mask,
             MAX_PULLUP_MASK);
    return core::Err(ERR_OUT_OF_RANGE);
  }
  Lock lock(mutex_);
  const std::array<uint8_t, 2> frame = {to_byte(Command::Pullups),
                                        static_cast<uint8_t>(mask)};
  return send(frame);
}

core::Status Tunnel::set_speed(uint32_t khz) {
  auto cmd = speed_command(khz);
  if (!cmd) {
    ESP_LOGE(TAG, "Unsupported bus speed %lu kHz",
             static_cast<unsigned long>(khz));
    return core::Err(ERR_UNSUPPORTED_VALUE);
  }
  Lock lock(mutex_);
  return send(*cmd);
}

core::Status Tunnel::bus_reset() {
  Lock lock(mutex_);
  if (auto status = send(Command::BusReset); !status) {
    return status;
  }
  auto reply = transport_->read(1, config_.read_timeout);
  if (!reply) {
    return core::Err(reply.error());
  }
  if (reply->front() != BUS_RESET_OK) {
    ESP_LOGE(TAG, "Bus reset failed, line state 0x%02x", reply->front());
    return core::Err(ERR_BUS_BUSY);
  }
  if (auto status = set_speed(100); !status) {
    return status;
  }
  ESP_LOGI(TAG, "I2C bus reset");
  return core::Ok();
}

core::Status Tunnel::restore() {
  Lock lock(mutex_);
  return send(Command::Restore);
}

core::Result<std::vector<uint8_t>> Tunnel::scan(bool verbose) {
  Lock lock(mutex_);
  if (auto status = send(Command::Scan); !status) {
    return core::Err(status.error());
  }
  auto response = transport_->read(SCAN_RESPONSE_SIZE, config_.read_timeout);
  if (!response) {
    return core::Err(response.error());
  }

  std::vector<uint8_t> found;
  for (size_t i = 0; i < response->size(); ++i) {
    if ((*response)[i] == SCAN_PRESENT) {
      found.push_back(static_cast<uint8_t>(i + FIRST_SCAN_ADDRESS));
    }
  }
  if (verbose) {
    log_scan_table(*response);
  }
  ESP_LOGD(TAG, "Scan found %u devices", static_cast<unsigned>(found.size()));
  return found;
}

core::Result<bool> Tunnel::start(uint8_t address, Direction dir) {
  Lock lock(mutex_);
  const std::array<uint8_t, 2> frame = {to_byte(Command::Start),
                                        start_byte(address, dir)};
  if (auto status = send(frame); !status) {
    return core::Err(status.error());
  }
  return ack();
}

core::Status Tunnel::stop() {
  Lock lock(mutex_);
  return send(Command::Stop);
}

core::Result<bool> Tunnel::write_bytes(std::span<const uint8_t> data) {
  Lock lock(mutex_);
  std::array<uint8_t, MAX_CHUNK + 1> frame{};

  while (!data.empty()) {
    auto chunk = data.first(std::min(data.size(), MAX_CHUNK));
    frame[0] = write_chunk_header(chunk.size());
    std::copy(chunk.begin(), chunk.end(), frame.begin() + 1);

    if (auto status = send(std::span(frame).first(chunk.size() + 1));
        !status) {
      return core::Err(status.error());
    }
    crc_.update(chunk);

    auto acked = ack();
    if (!acked) {
      return acked;
    }
    if (!*acked) {
      ESP_LOGD(TAG, "Write NACK, %u bytes left unsent",
               static_cast<unsigned>(data.size() - chunk.size()));
      return false;
    }
    data = data.subspan(chunk.size());
  }
  return true;
}

core::Result<std::vector<uint8_t>> Tunnel::read_bytes(size_t count) {
  Lock lock(mutex_);
  std::vector<uint8_t> data;
  data.reserve(count);

  while (data.size() < count) {
    size_t len = std::min(count - data.size(), MAX_CHUNK);
    if (auto status = transport_->write(read_chunk_header(len)); !status) {
      return core::Err(status.error());
    }
    auto chunk = transport_->read(len, config_.read_timeout);
    if (!chunk) {
      return core::Err(chunk.error());
    }
    crc_.update(*chunk);
    data.insert(data.end(), chunk->begin(), chunk->end());
  }
  return data;
}

core::Result<bool> Tunnel::ack() {
  Lock lock(mutex_);
  auto reply = transport_->read();
  if (!reply) {
    return core::Err(reply.error());
  }
  if (reply->size() != 1) {
    ESP_LOGW(TAG, "Expected 1 ack byte, got %u",
             static_cast<unsigned>(reply->size()));
    return core::Err(ESP_ERR_TIMEOUT);
  }
  bool acked = (reply->front() & 0x01) != 0;
  return acked;
}

core::Result<bool> Tunnel::reg_write(uint8_t address, uint8_t reg,
                                     std::span<const uint8_t> data) {
  Lock lock(mutex_);
  auto acked = start(address, Direction::Write);
  if (!acked) {
    return acked;
  }

  if (*acked) {
    acked = write_bytes(std::span(&reg, 1));
  }
  if (acked && *acked) {
    acked = write_bytes(data);
  }

  // The start condition went out, so the bus must be released either way
  if (auto status = stop(); !status) {
    return core::Err(acked ? status.error() : acked.error());
  }
  if (acked && !*acked) {
    ESP_LOGD(TAG, "No ack from 0x%02x writing reg 0x%02x", address, reg);
  }
  return acked;
}

core::Result<bool> Tunnel::reg_write(uint8_t address, uint8_t reg,
                                     uint8_t value) {
  return reg_write(address, reg, std::span<const uint8_t>(&value, 1));
}

core::Result<std::vector<uint8_t>> Tunnel::reg_read(uint8_t address,
                                                    uint8_t reg,
                                                    size_t count) {
  if (count == 0 || count > MAX_REG_READ) {
    ESP_LOGE(TAG, "Register read of %u bytes out of range [1, %u]",
             static_cast<unsigned>(count),
             static_cast<unsigned>(MAX_REG_READ));
    return core::Err(ERR_OUT_OF_RANGE);
  }

  Lock lock(mutex_);
  const std::array<uint8_t, 4> frame = {to_byte(Command::RegRead), address,
                                        reg, static_cast<uint8_t>(count)};
  if (auto status = send(frame); !status) {
    return core::Err(status.error());
  }
  auto data = transport_->read(count, config_.read_timeout);
  if (!data) {
    return data;
  }
  crc_.update(*data);
  return data;
}

uint16_t Tunnel::traffic_crc() const {
  Lock lock(mutex_);
  return crc_.value();
}

core::Status Tunnel::send(Command cmd) {
  return transport_->write(to_byte(cmd));
}

core::Status Tunnel::send(std::span<const uint8_t> frame) {
  ESP_LOGD(TAG, "tx %02x (+%u)", frame.front(),
           static_cast<unsigned>(frame.size() - 1));
  return transport_->write(frame);
}

core::Result<std::vector<uint8_t>> Tunnel::read_line() {
  std::vector<uint8_t> line;
  serial::Timeout waited{0};

  while (true) {
    auto chunk = transport_->read();
    if (!chunk) {
      return chunk;
    }
    line.insert(line.end(), chunk->begin(), chunk->end());
    if (std::find(line.begin(), line.end(), ']') != line.end()) {
      return line;
    }
    waited += serial::RESPONSE_WINDOW;
    if (waited >= config_.read_timeout) {
      ESP_LOGW(TAG, "Status line incomplete after %u bytes",
               static_cast<unsigned>(line.size()));
      return core::Err(ESP_ERR_TIMEOUT);
    }
  }
}

void Tunnel::set_state(ConnectionState state) {
  if (state_.exchange(state) == state) {
    return;
  }
  ESP_LOGD(TAG, "State: %s", to_string(state));

  if (state == ConnectionState::Connected) {
    core::events().publish(TUNNEL_EVENTS, TunnelEvent::Connected);
  } else if (state == ConnectionState::Disconnected) {
    core::events().publish(TUNNEL_EVENTS, TunnelEvent::Disconnected);
  }
}

void Tunnel::fault(esp_err_t err) {
  set_state(ConnectionState::Disconnected);
  TunnelFaultEvent event{.error = err};
  core::events().publish(TUNNEL_EVENTS, TunnelEvent::Fault, &event);
}

} // namespace driver::tunnel
