/**
 * @file test_tunnel.cpp
 * @brief Tunnel protocol tests against the adapter model
 */

#include "adapter_sim.hpp"
#include "fake_transport.hpp"

#include <core/semaphore.hpp>
#include <core/task.hpp>
#include <tunnel/tunnel.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <numeric>
#include <string_view>
#include <vector>

namespace {

using namespace driver::tunnel;
using namespace std::chrono_literals;
using Frames = std::vector<std::vector<uint8_t>>;

class TunnelTest : public ::testing::Test {
protected:
  TunnelTest() {
    auto transport = std::make_unique<test::FakeTransport>(
        [this](std::span<const uint8_t> frame) { return sim(frame); });
    fake = transport.get();
    tunnel = std::make_unique<Tunnel>(
        std::move(transport),
        Config{.read_timeout = 100ms, .sync_settle = 0ms, .reboot_settle = 0ms});
  }

  void connect(bool reset = false) {
    ASSERT_TRUE(tunnel->connect(reset).ok());
    fake->clear_frames();
  }

  test::AdapterSim sim;
  test::FakeTransport *fake = nullptr;
  std::unique_ptr<Tunnel> tunnel;
};

TEST_F(TunnelTest, ConnectHandshakeSequence) {
  auto status = tunnel->connect(false);
  ASSERT_TRUE(status.ok());

  const auto &frames = fake->frames();
  ASSERT_EQ(frames.size(), 7U);
  EXPECT_EQ(frames[0], std::vector<uint8_t>{'@'});
  EXPECT_EQ(frames[1], std::vector<uint8_t>(SYNC_FLUSH_COUNT, '@'));
  EXPECT_EQ(frames[2], (std::vector<uint8_t>{'e', 'A'}));
  EXPECT_EQ(frames[3], (std::vector<uint8_t>{'e', 0x0D}));
  EXPECT_EQ(frames[4], (std::vector<uint8_t>{'e', 0x0A}));
  EXPECT_EQ(frames[5], (std::vector<uint8_t>{'e', 'Z'}));
  EXPECT_EQ(frames[6], std::vector<uint8_t>{'?'});

  EXPECT_EQ(status->port, "FAKE0");
  EXPECT_EQ(status->model, "i2cdriver1");
  EXPECT_EQ(status->serial, "DO01JV8Z");
  EXPECT_EQ(status->uptime, 61U);
  EXPECT_FLOAT_EQ(status->voltage, 5.002F);
  EXPECT_EQ(status->mode, "I");
  EXPECT_EQ(status->speed, 100);
  EXPECT_EQ(sim.bus_resets, 0);
  EXPECT_TRUE(tunnel->is_connected());
}

TEST_F(TunnelTest, ConnectWithResetReinitializesBus) {
  sim.speed = 400;
  auto status = tunnel->connect(true);
  ASSERT_TRUE(status.ok());

  EXPECT_EQ(sim.bus_resets, 1);
  EXPECT_EQ(status->speed, 100);

  auto tail = fake->frames_from('x');
  ASSERT_EQ(tail.size(), 3U);
  EXPECT_EQ(tail[1], std::vector<uint8_t>{'1'});
  EXPECT_EQ(tail[2], std::vector<uint8_t>{'?'});
}

TEST_F(TunnelTest, StuckBusIsResetOnConnect) {
  sim.sda = 0;
  auto status = tunnel->connect(false);
  ASSERT_TRUE(status.ok());
  EXPECT_EQ(sim.bus_resets, 1);
  EXPECT_TRUE(status->bus_idle());
}

TEST_F(TunnelTest, RejectedBusResetFailsConnect) {
  sim.scl = 0;
  sim.bus_reset_reply = '1';
  auto status = tunnel->connect(false);
  EXPECT_EQ(status.error(), ERR_BUS_BUSY);
  EXPECT_EQ(tunnel->state(), ConnectionState::Disconnected);
  EXPECT_FALSE(fake->is_open());
}

TEST_F(TunnelTest, EchoMismatchFailsConnect) {
  sim.echo_override = true;
  sim.echo_reply = {'B'};
  EXPECT_EQ(tunnel->connect(false).error(), ERR_ECHO_MISMATCH);
  EXPECT_FALSE(tunnel->is_connected());
}

TEST_F(TunnelTest, EchoMismatchSkipsStatusQuery) {
  sim.echo_override = true;
  sim.echo_target = 0x0A;
  sim.echo_reply = {0x0D};
  EXPECT_EQ(tunnel->connect(false).error(), ERR_ECHO_MISMATCH);

  EXPECT_FALSE(fake->sent('?'));
  // Characters after the failing one are not sent either
  EXPECT_EQ(fake->frames().back(), (std::vector<uint8_t>{'e', 0x0A}));
  EXPECT_EQ(tunnel->state(), ConnectionState::Disconnected);
}

TEST_F(TunnelTest, EchoWithExtraBytesIsMismatch) {
  sim.echo_override = true;
  sim.echo_target = 'Z';
  sim.echo_reply = {'Z', 'Z'};
  EXPECT_EQ(tunnel->connect(false).error(), ERR_ECHO_MISMATCH);
}

TEST_F(TunnelTest, StateReadableDuringExchange) {
  core::BinarySemaphore observed;
  std::atomic<ConnectionState> seen{ConnectionState::Disconnected};
  std::unique_ptr<core::Task> observer;
  Tunnel *shared = nullptr;

  // While the status query is in flight, ask another task for the state
  auto transport = std::make_unique<test::FakeTransport>(
      [&](std::span<const uint8_t> frame) {
        if (frame.size() == 1 && frame[0] == '?' && !observer) {
          observer = std::make_unique<core::Task>(
              [&]() {
                seen = shared->state();
                observed.give();
              },
              core::TaskConfig{.name = "observer"});
          EXPECT_TRUE(observed.take_for(1s));
        }
        return sim(frame);
      });
  Tunnel tunnel(std::move(transport), Config{.read_timeout = 100ms,
                                             .sync_settle = 0ms});
  shared = &tunnel;

  ASSERT_TRUE(tunnel.connect(false).ok());
  ASSERT_NE(observer, nullptr);
  EXPECT_EQ(seen.load(), ConnectionState::Connecting);
  EXPECT_TRUE(tunnel.is_connected());
}

TEST_F(TunnelTest, OpenFailureReportsPortError) {
  fake->fail_open(true);
  EXPECT_EQ(tunnel->connect().error(), ERR_PORT);
  EXPECT_EQ(tunnel->state(), ConnectionState::Disconnected);
}

TEST_F(TunnelTest, ReconnectOpensNewSession) {
  ASSERT_TRUE(tunnel->connect(false).ok());
  ASSERT_TRUE(tunnel->connect(false).ok());
  EXPECT_EQ(fake->opens(), 2);
  EXPECT_TRUE(tunnel->is_connected());
}

TEST_F(TunnelTest, DisconnectIsIdempotent) {
  connect();
  EXPECT_TRUE(tunnel->disconnect().ok());
  EXPECT_FALSE(fake->is_open());
  EXPECT_EQ(tunnel->state(), ConnectionState::Disconnected);
  EXPECT_TRUE(tunnel->disconnect().ok());
}

TEST_F(TunnelTest, CommandsOnClosedPortFail) {
  EXPECT_EQ(tunnel->get_status().error(), ESP_ERR_INVALID_STATE);
  EXPECT_EQ(tunnel->scan().error(), ESP_ERR_INVALID_STATE);
  EXPECT_EQ(tunnel->stop().error(), ESP_ERR_INVALID_STATE);
}

TEST_F(TunnelTest, PullupMaskRange) {
  connect();
  EXPECT_EQ(tunnel->set_pullups(64).error(), ERR_OUT_OF_RANGE);
  EXPECT_EQ(tunnel->set_pullups(-1).error(), ERR_OUT_OF_RANGE);
  EXPECT_TRUE(fake->frames().empty());

  ASSERT_TRUE(tunnel->set_pullups(0b010010).ok());
  EXPECT_EQ(fake->frames().back(), (std::vector<uint8_t>{'u', 0x12}));
  EXPECT_EQ(sim.pullups, 0x12);
}

TEST_F(TunnelTest, SpeedSelection) {
  connect();
  ASSERT_TRUE(tunnel->set_speed(400).ok());
  EXPECT_EQ(fake->frames().back(), std::vector<uint8_t>{'4'});
  EXPECT_EQ(sim.speed, 400);

  EXPECT_EQ(tunnel->set_speed(200).error(), ERR_UNSUPPORTED_VALUE);
  EXPECT_EQ(fake->frames().size(), 1U);
}

TEST_F(TunnelTest, RebootSendsCommand) {
  connect();
  ASSERT_TRUE(tunnel->reboot().ok());
  EXPECT_EQ(fake->frames().back(), std::vector<uint8_t>{'_'});
}

TEST_F(TunnelTest, RestoreReturnsToMasterMode) {
  connect();
  ASSERT_TRUE(tunnel->restore().ok());
  EXPECT_EQ(fake->frames().back(), std::vector<uint8_t>{'i'});
}

TEST_F(TunnelTest, ScanReportsAckedAddresses) {
  sim.add_device(0x3C);
  sim.add_device(0x1E);
  sim.add_device(0x05);
  connect();

  auto found = tunnel->scan(true);
  ASSERT_TRUE(found.ok());
  EXPECT_EQ(*found, (std::vector<uint8_t>{0x1E, 0x3C}));
  EXPECT_EQ(fake->frames().back(), std::vector<uint8_t>{'d'});
}

TEST_F(TunnelTest, StartReportsAck) {
  sim.add_device(0x50);
  connect();

  auto acked = tunnel->start(0x50, Direction::Read);
  ASSERT_TRUE(acked.ok());
  EXPECT_TRUE(*acked);
  EXPECT_EQ(fake->frames().back(), (std::vector<uint8_t>{'s', 0xA1}));

  acked = tunnel->start(0x51, Direction::Write);
  ASSERT_TRUE(acked.ok());
  EXPECT_FALSE(*acked);
}

TEST_F(TunnelTest, WriteSplitsIntoChunks) {
  sim.add_device(0x50);
  connect();
  ASSERT_TRUE(*tunnel->start(0x50, Direction::Write));

  std::vector<uint8_t> payload(130);
  std::iota(payload.begin(), payload.end(), 0);
  auto acked = tunnel->write_bytes(payload);
  ASSERT_TRUE(acked.ok());
  EXPECT_TRUE(*acked);

  auto chunks = fake->frames_from(0xFF);
  ASSERT_EQ(chunks.size(), 3U);
  EXPECT_EQ(chunks[0].size(), 65U);
  EXPECT_EQ(chunks[1].front(), 0xFF);
  EXPECT_EQ(chunks[1].size(), 65U);
  EXPECT_EQ(chunks[2], (std::vector<uint8_t>{0xC1, 128, 129}));
}

TEST_F(TunnelTest, WriteOfExactlyOneChunk) {
  sim.add_device(0x50);
  connect();
  ASSERT_TRUE(*tunnel->start(0x50, Direction::Write));

  std::vector<uint8_t> payload(MAX_CHUNK, 0x5A);
  auto acked = tunnel->write_bytes(payload);
  ASSERT_TRUE(acked.ok());
  EXPECT_TRUE(*acked);

  auto chunks = fake->frames_from(0xFF);
  ASSERT_EQ(chunks.size(), 1U);
  EXPECT_EQ(chunks[0].size(), MAX_CHUNK + 1);
}

TEST_F(TunnelTest, EmptyWriteSendsNothing) {
  connect();
  auto acked = tunnel->write_bytes({});
  ASSERT_TRUE(acked.ok());
  EXPECT_TRUE(*acked);
  EXPECT_TRUE(fake->frames().empty());
}

TEST_F(TunnelTest, WriteStopsAtFirstNack) {
  sim.add_device(0x50).nack_data = true;
  connect();
  ASSERT_TRUE(*tunnel->start(0x50, Direction::Write));

  std::vector<uint8_t> payload(130, 0xAA);
  auto acked = tunnel->write_bytes(payload);
  ASSERT_TRUE(acked.ok());
  EXPECT_FALSE(*acked);
  EXPECT_EQ(fake->frames_from(0xFF).size(), 1U);
}

TEST_F(TunnelTest, ReadCollectsChunks) {
  auto &dev = sim.add_device(0x50);
  std::iota(dev.regs.begin(), dev.regs.end(), 0);
  connect();
  ASSERT_TRUE(*tunnel->start(0x50, Direction::Read));

  auto data = tunnel->read_bytes(100);
  ASSERT_TRUE(data.ok());
  ASSERT_EQ(data->size(), 100U);
  EXPECT_EQ((*data)[0], 0);
  EXPECT_EQ((*data)[99], 99);

  auto chunks = fake->frames_from(0xBF);
  ASSERT_EQ(chunks.size(), 2U);
  EXPECT_EQ(chunks[0], std::vector<uint8_t>{0xBF});
  EXPECT_EQ(chunks[1], std::vector<uint8_t>{0xA3});
}

TEST_F(TunnelTest, ReadOfExactlyOneChunk) {
  auto &dev = sim.add_device(0x50);
  std::iota(dev.regs.begin(), dev.regs.end(), 0);
  connect();
  ASSERT_TRUE(*tunnel->start(0x50, Direction::Read));
  fake->clear_frames();

  auto data = tunnel->read_bytes(MAX_CHUNK);
  ASSERT_TRUE(data.ok());
  ASSERT_EQ(data->size(), MAX_CHUNK);
  EXPECT_EQ(data->back(), MAX_CHUNK - 1);
  EXPECT_EQ(fake->frames(), (Frames{{0xBF}}));

  data = tunnel->read_bytes(0);
  ASSERT_TRUE(data.ok());
  EXPECT_TRUE(data->empty());
  EXPECT_EQ(fake->frames().size(), 1U);
}

TEST_F(TunnelTest, AckNeedsExactlyOneByte) {
  connect();
  fake->queue({0x01});
  auto acked = tunnel->ack();
  ASSERT_TRUE(acked.ok());
  EXPECT_TRUE(*acked);

  fake->queue({0x02});
  acked = tunnel->ack();
  ASSERT_TRUE(acked.ok());
  EXPECT_FALSE(*acked);

  fake->queue({0x01, 0x01});
  EXPECT_EQ(tunnel->ack().error(), ESP_ERR_TIMEOUT);
  EXPECT_EQ(tunnel->ack().error(), ESP_ERR_TIMEOUT);
}

TEST_F(TunnelTest, RegisterWriteFrames) {
  auto &dev = sim.add_device(0x1E);
  connect();

  auto acked = tunnel->reg_write(0x1E, 0x02, uint8_t{0x00});
  ASSERT_TRUE(acked.ok());
  EXPECT_TRUE(*acked);

  const Frames expected = {{'s', 0x3C}, {0xC0, 0x02}, {0xC0, 0x00}, {'p'}};
  EXPECT_EQ(fake->frames(), expected);
  ASSERT_EQ(dev.writes.size(), 1U);
  EXPECT_EQ(dev.writes[0], (std::vector<uint8_t>{0x02, 0x00}));
}

TEST_F(TunnelTest, RegisterWriteToMissingDeviceStillStops) {
  connect();
  auto acked = tunnel->reg_write(0x20, 0x01, uint8_t{0x02});
  ASSERT_TRUE(acked.ok());
  EXPECT_FALSE(*acked);

  const Frames expected = {{'s', 0x40}, {'p'}};
  EXPECT_EQ(fake->frames(), expected);
}

TEST_F(TunnelTest, RegisterWriteDataNackStops) {
  sim.add_device(0x1E).nack_data = true;
  connect();
  const std::vector<uint8_t> data = {1, 2, 3};
  auto acked = tunnel->reg_write(0x1E, 0x00, data);
  ASSERT_TRUE(acked.ok());
  EXPECT_FALSE(*acked);
  EXPECT_EQ(fake->frames().size(), 3U);
  EXPECT_EQ(fake->frames().back(), std::vector<uint8_t>{'p'});
}

TEST_F(TunnelTest, RegisterRead) {
  auto &dev = sim.add_device(0x1E);
  std::iota(dev.regs.begin(), dev.regs.end(), 0);
  connect();

  auto data = tunnel->reg_read(0x1E, 0x03, 6);
  ASSERT_TRUE(data.ok());
  EXPECT_EQ(*data, (std::vector<uint8_t>{3, 4, 5, 6, 7, 8}));
  EXPECT_EQ(fake->frames().back(), (std::vector<uint8_t>{'r', 0x1E, 3, 6}));
}

TEST_F(TunnelTest, RegisterReadCountRange) {
  connect();
  EXPECT_EQ(tunnel->reg_read(0x1E, 0, 0).error(), ERR_OUT_OF_RANGE);
  EXPECT_EQ(tunnel->reg_read(0x1E, 0, 256).error(), ERR_OUT_OF_RANGE);
  EXPECT_TRUE(fake->frames().empty());
}

TEST_F(TunnelTest, TrafficCrcCoversPayloadOnly) {
  sim.add_device(0x50);
  connect();
  EXPECT_EQ(tunnel->traffic_crc(), 0xFFFF);

  constexpr std::string_view check = "123456789";
  ASSERT_TRUE(*tunnel->start(0x50, Direction::Write));
  ASSERT_TRUE(*tunnel->write_bytes(std::span(
      reinterpret_cast<const uint8_t *>(check.data()), check.size())));
  ASSERT_TRUE(tunnel->stop().ok());
  EXPECT_EQ(tunnel->traffic_crc(), 0x29B1);

  auto status = tunnel->get_status();
  ASSERT_TRUE(status.ok());
  EXPECT_EQ(status->e_ccitt_crc, 0x29B1);
  EXPECT_EQ(status->ccitt_crc, 0xFFFF);

  // New session, new checksum
  connect();
  EXPECT_EQ(tunnel->traffic_crc(), 0xFFFF);
}

TEST_F(TunnelTest, FailedConnectPublishesFault) {
  auto err = core::EventBus::initialize();
  ASSERT_TRUE(err == ESP_OK || err == ESP_ERR_INVALID_STATE);

  struct Capture {
    core::BinarySemaphore done;
    esp_err_t error = ESP_OK;
  } capture;

  auto subscription = core::events().subscribe(
      TUNNEL_EVENTS, TunnelEvent::Fault,
      [](void *arg, esp_event_base_t, int32_t, void *data) {
        auto *c = static_cast<Capture *>(arg);
        c->error = static_cast<TunnelFaultEvent *>(data)->error;
        c->done.give();
      },
      &capture);
  ASSERT_TRUE(subscription.active());

  fake->fail_open(true);
  EXPECT_FALSE(tunnel->connect().ok());
  ASSERT_TRUE(capture.done.take_for(1s));
  EXPECT_EQ(capture.error, ERR_PORT);
}

TEST(StatusParse, ParsesAllFields) {
  auto status = parse_status(
      "[i2cdriver1 DO01JV8Z 000000061 5.002 012 24.5 I 1 0 400 18 29b1]",
      "ttyUSB0");
  ASSERT_TRUE(status.ok());
  EXPECT_EQ(status->port, "ttyUSB0");
  EXPECT_FLOAT_EQ(status->current, 12.0F);
  EXPECT_FLOAT_EQ(status->temperature, 24.5F);
  EXPECT_EQ(status->sda, 1);
  EXPECT_EQ(status->scl, 0);
  EXPECT_FALSE(status->bus_idle());
  EXPECT_EQ(status->speed, 400);
  EXPECT_EQ(status->pullups, 18);
  EXPECT_EQ(status->ccitt_crc, 0x29B1);
}

TEST(StatusParse, IgnoresNoiseAroundBrackets) {
  auto status = parse_status("\x01\xFF[i2cdriver1 X 1 5.0 0 20 I 1 1 100 0 0]\r\n",
                             "p");
  ASSERT_TRUE(status.ok());
  EXPECT_EQ(status->serial, "X");
}

TEST(StatusParse, RejectsMalformedLines) {
  EXPECT_EQ(parse_status("[i2cdriver1 X 1 5.0 0 20 I 1 1 100 0]", "p").error(),
            ERR_PARSE);
  EXPECT_EQ(parse_status("i2cdriver1 X 1 5.0 0 20 I 1 1 100 0 0", "p").error(),
            ERR_PARSE);
  EXPECT_EQ(parse_status("[i2cdriver1 X up 5.0 0 20 I 1 1 100 0 0]", "p").error(),
            ERR_PARSE);
  EXPECT_EQ(parse_status("", "p").error(), ERR_PARSE);
}

TEST(Protocol, FrameBytes) {
  EXPECT_EQ(write_chunk_header(1), 0xC0);
  EXPECT_EQ(write_chunk_header(64), 0xFF);
  EXPECT_EQ(read_chunk_header(1), 0x80);
  EXPECT_EQ(read_chunk_header(64), 0xBF);
  EXPECT_EQ(start_byte(0x1E, Direction::Write), 0x3C);
  EXPECT_EQ(start_byte(0x1E, Direction::Read), 0x3D);
  EXPECT_EQ(speed_command(100), Command::Speed100);
  EXPECT_FALSE(speed_command(1000).has_value());
  EXPECT_EQ(SCAN_RESPONSE_SIZE, 112U);
}

TEST(Protocol, ErrorNames) {
  EXPECT_STREQ(error_name(ERR_ECHO_MISMATCH), "ERR_ECHO_MISMATCH");
  EXPECT_STREQ(error_name(ERR_BUS_BUSY), "ERR_BUS_BUSY");
  EXPECT_STREQ(error_name(ESP_ERR_TIMEOUT), "ESP_ERR_TIMEOUT");
}

} // namespace
