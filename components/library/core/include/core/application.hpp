/**
 * @file application.hpp
 * @brief Base for firmware entry objects
 *
 * start() brings up the event loop and the application's NVS namespace,
 * then hands control to run(). A missing or corrupt NVS partition is not
 * fatal: storage() is then nullptr and settings are simply not persisted.
 */

#pragma once

#include "event_loop.hpp"
#include "nvs_storage.hpp"

#include <esp_log.h>

#include <string_view>

namespace core {

class Application {
public:
  virtual ~Application() = default;

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  /// Fails only if the event loop cannot be created
  [[nodiscard]] Status start() {
    if (esp_err_t err = EventBus::initialize(); err != ESP_OK) {
      return err;
    }
    open_storage();
    run();
    return Ok();
  }

  [[nodiscard]] IStorage *storage() { return storage_.get(); }
  [[nodiscard]] static EventBus &events() { return EventBus::get(); }

protected:
  explicit Application(std::string_view storage_namespace)
      : storage_namespace_(storage_namespace) {}

  virtual void run() = 0;

private:
  void open_storage() {
    if (auto status = init_nvs_flash(); !status) {
      ESP_LOGW("app", "NVS unavailable: %s", esp_err_to_name(status.error()));
      return;
    }
    storage_ = open_nvs(storage_namespace_);
  }

  std::string_view storage_namespace_;
  StoragePtr storage_;
};

} // namespace core
