/**
 * @file test_core.cpp
 * @brief Result, CRC and cancellation primitives
 */

#include <core/cancellation.hpp>
#include <core/crc.hpp>
#include <core/result.hpp>
#include <core/semaphore.hpp>
#include <core/task.hpp>

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <string_view>

namespace {

using namespace std::chrono_literals;

std::span<const uint8_t> bytes(std::string_view s) {
  return {reinterpret_cast<const uint8_t *>(s.data()), s.size()};
}

core::Result<int32_t> parse_digit(char c) {
  if (c < '0' || c > '9') {
    return core::Err(ESP_ERR_INVALID_ARG);
  }
  return static_cast<int32_t>(c - '0');
}

TEST(Result, ErrorMarkerWorksForIntegerValues) {
  auto digit = parse_digit('7');
  ASSERT_TRUE(digit.ok());
  EXPECT_EQ(*digit, 7);

  auto bad = parse_digit('x');
  EXPECT_FALSE(bad.ok());
  EXPECT_EQ(bad.error(), ESP_ERR_INVALID_ARG);
  EXPECT_EQ(bad.value_or(-1), -1);
}

TEST(Result, OkIsNotAnError) {
  core::Result<bool> flag = core::Err(ESP_OK);
  EXPECT_EQ(flag.error(), ESP_FAIL);

  core::Result<bool> value = false;
  EXPECT_TRUE(value.ok());
  EXPECT_FALSE(*value);

  EXPECT_TRUE(core::Ok().ok());
  core::Status status = core::Err(ESP_ERR_TIMEOUT);
  EXPECT_EQ(status.error(), ESP_ERR_TIMEOUT);
}

TEST(Crc16, CcittFalseCheckValue) {
  EXPECT_EQ(core::Crc16::compute(bytes("123456789")), 0x29B1);
  EXPECT_EQ(core::Crc16::compute({}), 0xFFFF);
}

TEST(Crc16, IncrementalMatchesSingleShot) {
  core::Crc16 crc;
  crc.update(bytes("1234"));
  crc.update(uint8_t{'5'});
  crc.update(bytes("6789"));
  EXPECT_EQ(crc.value(), 0x29B1);

  crc.reset();
  EXPECT_EQ(crc.value(), core::Crc16::DEFAULT_SEED);
}

TEST(Cancellation, DefaultTokenNeverCancels) {
  core::CancellationToken token;
  EXPECT_FALSE(token.cancelled());
  EXPECT_FALSE(token.wait_for(1ms));
}

TEST(Cancellation, CancelWakesWaiter) {
  core::CancellationSource source;
  auto token = source.token();
  EXPECT_FALSE(token.wait_for(0ms));

  source.cancel();
  source.cancel();
  EXPECT_TRUE(source.cancelled());
  EXPECT_TRUE(token.cancelled());

  auto before = xTaskGetTickCount();
  EXPECT_TRUE(token.wait_for(10s));
  EXPECT_LT(xTaskGetTickCount() - before, pdMS_TO_TICKS(1000));

  // Every copy sees the same cancellation
  auto copy = token;
  EXPECT_TRUE(copy.wait_for(10s));
}

TEST(Cancellation, ResetStartsNewScope) {
  core::CancellationSource source;
  auto old_token = source.token();
  source.cancel();
  source.reset();

  auto token = source.token();
  EXPECT_FALSE(token.cancelled());
  EXPECT_FALSE(source.cancelled());
  EXPECT_TRUE(old_token.cancelled());
}

TEST(Task, CompletionSignalOutlivesShortBody) {
  // Body finishes before anyone waits; the signal must not be lost
  core::BinarySemaphore done;
  core::Task worker([&done]() { done.give(); },
                    core::TaskConfig{.name = "short", .priority = 6});
  core::Task::delay(50ms);
  EXPECT_TRUE(done.take_for(1s));
  EXPECT_FALSE(done.take_for(10ms));
}

TEST(Task, WaiterKeepsPollingUntilBodyReturns) {
  core::BinarySemaphore done;
  int polls = 0;
  core::Task worker(
      [&done]() {
        core::Task::delay(60ms);
        done.give();
      },
      core::TaskConfig{.name = "slow"});
  while (!done.take_for(10ms)) {
    ++polls;
  }
  EXPECT_GT(polls, 0);
}

} // namespace
