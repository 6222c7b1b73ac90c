/**
 * @file app.hpp
 * @brief I2C bridge application
 *
 * Brings up the adapter, discovers the compass and display on the bus and
 * shows a live heading. Receives the Board via constructor - does not
 * create it.
 */

#pragma once

#include "board.hpp"

#include <core/application.hpp>
#include <core/event_loop.hpp>
#include <core/mutex.hpp>
#include <core/semaphore.hpp>
#include <core/task.hpp>
#include <hmc5883l/calibration_store.hpp>
#include <hmc5883l/driver.hpp>
#include <ssd1306/driver.hpp>

#include <memory>
#include <optional>
#include <span>

namespace application {

/// Compass-and-display demo over the serial I2C bridge
class Bridge final : public core::Application {
public:
  /// Construct with dependencies (does not take ownership)
  explicit Bridge(Board &board);
  ~Bridge() override;

protected:
  void run() override;

private:
  static constexpr const char *TAG = "bridge";

  [[nodiscard]] core::Status connect();
  void init_display();
  void init_compass();
  void calibrate_compass();
  void run_compass();
  void render(float heading);
  void show_message(const char *line1, const char *line2 = nullptr);

  /// Static tunnel event handler (bridges ESP-IDF callback to member)
  static void tunnel_event_handler(void *arg, esp_event_base_t base,
                                   int32_t event_id, void *event_data);

  Board &board_;
  std::optional<driver::ssd1306::SSD1306> display_;
  std::optional<driver::hmc5883l::HMC5883L> compass_;

  core::EventSubscription tunnel_event_sub_;

  /// Latest reading, written by the reader task
  core::RecursiveMutex reading_mutex_;
  driver::hmc5883l::Axes latest_{};
  bool fresh_ = false;

  /// Given by the reader task when it leaves the driver
  core::BinarySemaphore reader_done_;
  std::unique_ptr<core::Task> reader_task_;
};

} // namespace application
