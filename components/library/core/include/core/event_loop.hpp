/**
 * @file event_loop.hpp
 * @brief Typed publish/subscribe over the ESP-IDF default event loop
 *
 * Drivers post state changes (adapter connected, link fault) and the
 * application reacts on the event task instead of polling.
 */

#pragma once

#include <esp_event.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>

namespace core {

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define CORE_EVENT_DEFINE_BASE(name) ESP_EVENT_DEFINE_BASE(name)
#define CORE_EVENT_DECLARE_BASE(name) ESP_EVENT_DECLARE_BASE(name)
// NOLINTEND(cppcoreguidelines-macro-usage)

template <typename T>
concept EventId = std::is_enum_v<T> || std::is_integral_v<T>;

/// Registered handler, unregistered on destruction
class EventSubscription {
public:
  EventSubscription() = default;
  EventSubscription(esp_event_base_t base, int32_t id,
                    esp_event_handler_instance_t instance)
      : base_(base), id_(id), instance_(instance) {}
  ~EventSubscription() { reset(); }

  EventSubscription(const EventSubscription &) = delete;
  EventSubscription &operator=(const EventSubscription &) = delete;

  EventSubscription(EventSubscription &&other) noexcept { swap(other); }
  EventSubscription &operator=(EventSubscription &&other) noexcept {
    EventSubscription old(std::move(*this));
    swap(other);
    return *this;
  }

  void reset() {
    if (instance_ != nullptr) {
      esp_event_handler_instance_unregister(base_, id_, instance_);
      instance_ = nullptr;
    }
  }

  [[nodiscard]] bool active() const { return instance_ != nullptr; }

private:
  void swap(EventSubscription &other) noexcept {
    std::swap(base_, other.base_);
    std::swap(id_, other.id_);
    std::swap(instance_, other.instance_);
  }

  esp_event_base_t base_ = nullptr;
  int32_t id_ = 0;
  esp_event_handler_instance_t instance_ = nullptr;
};

/// Process-wide bus. Posting before initialize() drops the event.
class EventBus {
public:
  /// Create the default loop; ESP_ERR_INVALID_STATE on a second call
  static esp_err_t initialize() {
    auto &bus = get();
    if (bus.ready_.load()) {
      return ESP_ERR_INVALID_STATE;
    }
    esp_err_t err = esp_event_loop_create_default();
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
      return err;
    }
    bus.ready_.store(true);
    return ESP_OK;
  }

  static EventBus &get() {
    static EventBus bus;
    return bus;
  }

  EventBus(const EventBus &) = delete;
  EventBus &operator=(const EventBus &) = delete;

  /// Inactive subscription if registration fails
  template <EventId Id>
  [[nodiscard]] EventSubscription subscribe(esp_event_base_t base, Id id,
                                            esp_event_handler_t handler,
                                            void *arg = nullptr) {
    esp_event_handler_instance_t instance = nullptr;
    if (esp_event_handler_instance_register(base, static_cast<int32_t>(id),
                                            handler, arg,
                                            &instance) != ESP_OK) {
      return {};
    }
    return {base, static_cast<int32_t>(id), instance};
  }

  /// Copy @p payload (if any) onto the loop queue without blocking
  template <EventId Id, typename Payload = std::nullptr_t>
    requires std::is_pointer_v<Payload> || std::is_null_pointer_v<Payload>
  esp_err_t publish(esp_event_base_t base, Id id, Payload payload = nullptr) {
    if (!ready_.load()) {
      return ESP_ERR_INVALID_STATE;
    }
    size_t size = 0;
    if constexpr (!std::is_null_pointer_v<Payload>) {
      size = sizeof(*payload);
    }
    return esp_event_post(base, static_cast<int32_t>(id), payload, size, 0);
  }

private:
  EventBus() = default;

  std::atomic<bool> ready_{false};
};

inline EventBus &events() { return EventBus::get(); }

} // namespace core
