/**
 * @file events.hpp
 * @brief Tunnel connection events
 */

#pragma once

#include <core/event_loop.hpp>

#include <esp_err.h>

#include <cstdint>

/// Tunnel events base
CORE_EVENT_DECLARE_BASE(TUNNEL_EVENTS);

namespace driver::tunnel {

/// Connection lifecycle
enum class ConnectionState : uint8_t {
  Disconnected,
  Connecting,
  Connected,
};

/// Tunnel events (use with TUNNEL_EVENTS base)
enum class TunnelEvent : uint8_t {
  Connected,    ///< Handshake complete, bus ready
  Disconnected, ///< Transport closed
  Fault,        ///< Connect failed, carries TunnelFaultEvent
};

/// Payload for TunnelEvent::Fault
struct TunnelFaultEvent {
  esp_err_t error;
};

[[nodiscard]] constexpr const char *to_string(ConnectionState state) {
  switch (state) {
  case ConnectionState::Disconnected:
    return "disconnected";
  case ConnectionState::Connecting:
    return "connecting";
  case ConnectionState::Connected:
    return "connected";
  }
  return "unknown";
}

} // namespace driver::tunnel
