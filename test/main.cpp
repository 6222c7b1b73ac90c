/**
 * @file main.cpp
 * @brief Test runner entry point
 *
 * Built for the ESP-IDF linux target: the FreeRTOS POSIX port owns main()
 * and calls app_main() from its first task, so the tests run with a live
 * scheduler.
 */

#include <gtest/gtest.h>

#include <cstdlib>

extern "C" void app_main() {
  int argc = 1;
  char name[] = "bridge_tests";
  char *argv[] = {name, nullptr};
  ::testing::InitGoogleTest(&argc, argv);
  std::exit(RUN_ALL_TESTS());
}
