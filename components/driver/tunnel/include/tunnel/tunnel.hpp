/**
 * @file tunnel.hpp
 * @brief I2C master driven through a serial bus adapter
 */

#pragma once

#include "error.hpp"
#include "events.hpp"
#include "protocol.hpp"
#include "status.hpp"

#include <core/crc.hpp>
#include <core/mutex.hpp>
#include <core/result.hpp>
#include <serial/interface.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace driver::tunnel {

using namespace std::chrono_literals;

/// Tunnel timing
struct Config {
  serial::Timeout read_timeout = serial::DEFAULT_READ_TIMEOUT;
  serial::Timeout sync_settle = 50ms;   ///< After the first sync byte
  serial::Timeout reboot_settle = 500ms; ///< After an adapter reboot
};

/**
 * @brief I2C master over a serial adapter
 *
 * Owns the transport session. Every public operation holds a recursive
 * mutex for its whole request/response exchange, so one Tunnel can be
 * shared by several tasks. Composite operations (reg_write) reuse the
 * primitives under the same lock.
 *
 * Primitives work whenever the transport is open; connect() performs the
 * handshake that makes the adapter's state known.
 */
class Tunnel {
public:
  explicit Tunnel(std::unique_ptr<serial::ITransport> transport,
                  const Config &config = {});
  ~Tunnel();

  Tunnel(const Tunnel &) = delete;
  Tunnel &operator=(const Tunnel &) = delete;
  Tunnel(Tunnel &&) = delete;
  Tunnel &operator=(Tunnel &&) = delete;

  /// Open the port, resynchronize and verify the adapter
  ///
  /// Issues a bus reset when @p reset is set or a bus line is held low.
  [[nodiscard]] core::Result<Status> connect(bool reset = true);

  /// Close the port (idempotent)
  [[nodiscard]] core::Status disconnect();

  /// Readable from any task without waiting for an exchange in progress
  [[nodiscard]] ConnectionState state() const { return state_.load(); }
  [[nodiscard]] bool is_connected() const {
    return state() == ConnectionState::Connected;
  }

  // -- Adapter commands --------------------------------------------------

  /// Echo one byte, ERR_ECHO_MISMATCH unless exactly one byte comes back
  [[nodiscard]] core::Result<uint8_t> echo(uint8_t c);

  /// Query and parse the status line
  [[nodiscard]] core::Result<Status> get_status();

  /// Restart the adapter and wait for it to settle
  [[nodiscard]] core::Status reboot();

  /// Set the pullup mask (0..63)
  [[nodiscard]] core::Status set_pullups(int mask);

  /// Set bus speed, 100 or 400 kHz
  [[nodiscard]] core::Status set_speed(uint32_t khz);

  /// Release a stuck bus, ERR_BUS_BUSY if a line stays low
  [[nodiscard]] core::Status bus_reset();

  /// Return the adapter to I2C master mode
  [[nodiscard]] core::Status restore();

  /// Addresses (8..119) that acknowledged, ascending
  [[nodiscard]] core::Result<std::vector<uint8_t>> scan(bool verbose = false);

  // -- Bus primitives ----------------------------------------------------

  /// Start condition + address, true if acknowledged
  [[nodiscard]] core::Result<bool> start(uint8_t address, Direction dir);

  /// Stop condition
  [[nodiscard]] core::Status stop();

  /// Write in 64-byte frames, stops at the first NACK
  [[nodiscard]] core::Result<bool> write_bytes(std::span<const uint8_t> data);

  /// Read @p count bytes in 64-byte frames
  [[nodiscard]] core::Result<std::vector<uint8_t>> read_bytes(size_t count);

  /// Acknowledge byte of the last start or write frame
  [[nodiscard]] core::Result<bool> ack();

  // -- Register access ---------------------------------------------------

  /// start, register, data, stop; true if every step was acknowledged
  [[nodiscard]] core::Result<bool> reg_write(uint8_t address, uint8_t reg,
                                             std::span<const uint8_t> data);
  [[nodiscard]] core::Result<bool> reg_write(uint8_t address, uint8_t reg,
                                             uint8_t value);

  /// Read @p count (1..255) bytes starting at @p reg
  [[nodiscard]] core::Result<std::vector<uint8_t>>
  reg_read(uint8_t address, uint8_t reg, size_t count);

  /// CRC-16/CCITT-FALSE over payload bytes since connect
  [[nodiscard]] uint16_t traffic_crc() const;

  [[nodiscard]] serial::ITransport &transport() { return *transport_; }

private:
  [[nodiscard]] core::Status send(Command cmd);
  [[nodiscard]] core::Status send(std::span<const uint8_t> frame);
  [[nodiscard]] core::Result<std::vector<uint8_t>> read_line();
  [[nodiscard]] core::Status handshake(bool reset, Status &status);
  void set_state(ConnectionState state);
  void fault(esp_err_t err);

  std::unique_ptr<serial::ITransport> transport_;
  Config config_;
  mutable core::RecursiveMutex mutex_;
  core::Crc16 crc_;
  std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
};

} // namespace driver::tunnel
