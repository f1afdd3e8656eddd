#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "CommandSerializer.h"
#include "FakeTransport.h"

namespace {
DeviceIdentity cooker() {
  DeviceIdentity id;
  DeviceIdentity::fromAddress("01:02:03:04:05:06", "Kitchen", id);
  return id;
}
} // namespace

class CommandSerializerTest : public ::testing::Test {
protected:
  void SetUp() override {
    conn.setDelayHook([](uint32_t) {});
    conn.setOnNotification([this](const uint8_t* d, size_t n) { accumulator.onNotification(d, n); });
    conn.setOnDisconnected([this] { accumulator.abort(); });
  }

  FakeTransport       transport;
  AnovaConfig         config = fastConfig();
  ResponseAccumulator accumulator;
  ConnectionManager   conn{transport, cooker(), config};
  CommandSerializer   serializer{conn, accumulator, config};
};

TEST_F(CommandSerializerTest, JoinsFragmentsOfOneReply) {
  transport.replies["read temp\r"] = {"5", "4.9\r"};
  ASSERT_TRUE(conn.connect(1, 1000));

  EXPECT_EQ(serializer.execute("read temp\r", CommandClass::Status), std::optional<std::string>("54.9"));
  EXPECT_FALSE(accumulator.active());
}

TEST_F(CommandSerializerTest, DuplicateNotificationsCountOnce) {
  transport.replies["status\r"] = {"running"};
  transport.duplicateFragments  = true;
  ASSERT_TRUE(conn.connect(1, 1000));

  EXPECT_EQ(serializer.execute("status\r", CommandClass::Status), std::optional<std::string>("running"));
}

TEST_F(CommandSerializerTest, ReconnectsBeforeSending) {
  transport.replies["start\r"] = {"start"};
  EXPECT_EQ(serializer.execute("start\r", CommandClass::Acknowledge), std::optional<std::string>("start"));
  EXPECT_TRUE(conn.isConnected());
  EXPECT_EQ(transport.connectTimeouts.size(), 1u);
}

TEST_F(CommandSerializerTest, UnreachableDeviceSendsNothing) {
  transport.failConnects = 1;
  EXPECT_EQ(serializer.execute("start\r", CommandClass::Acknowledge), std::nullopt);
  EXPECT_TRUE(transport.writes().empty());
}

TEST_F(CommandSerializerTest, ReadsDirectlyWhenNothingWasNotified) {
  transport.readValue = "c\r";
  ASSERT_TRUE(conn.connect(1, 1000));

  EXPECT_EQ(serializer.execute("read unit\r", CommandClass::Status), std::optional<std::string>("c"));
  EXPECT_EQ(transport.reads, 1);
}

TEST_F(CommandSerializerTest, SilenceAndEmptyReadIsNoReply) {
  ASSERT_TRUE(conn.connect(1, 1000));
  EXPECT_EQ(serializer.execute("stop\r", CommandClass::Acknowledge), std::nullopt);
}

TEST_F(CommandSerializerTest, WithoutNotificationsOnlyTheMinimumWaitIsSpent) {
  transport.subscribeOk = false;
  transport.readValue   = "f";
  ASSERT_TRUE(conn.connect(1, 1000));

  const auto t0 = std::chrono::steady_clock::now();
  EXPECT_EQ(serializer.execute("read unit\r", CommandClass::Status, 5000), std::optional<std::string>("f"));
  EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::milliseconds(2000));
}

TEST_F(CommandSerializerTest, LinkLossDiscardsPartialReply) {
  transport.dropOnCommand       = "read temp\r";
  transport.fragmentsBeforeDrop = {"54"};
  ASSERT_TRUE(conn.connect(1, 1000));

  EXPECT_EQ(serializer.execute("read temp\r", CommandClass::Status), std::nullopt);
  EXPECT_FALSE(conn.isConnected());
  EXPECT_FALSE(accumulator.active());
}

TEST_F(CommandSerializerTest, ReplyArrivingAfterTheLinkDropsIsDiscarded) {
  ASSERT_TRUE(conn.connect(1, 1000));
  std::thread link;
  transport.onWrite = [this, &link](const std::string&) {
    link = std::thread([this] {
      transport.notify("runn");
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      transport.dropLink();
    });
  };

  EXPECT_EQ(serializer.execute("status\r", CommandClass::Status), std::nullopt);
  link.join();
  EXPECT_FALSE(conn.isConnected());
}

TEST_F(CommandSerializerTest, CallersAreServedInArrivalOrder) {
  transport.replies["b\r"] = {"b"};
  transport.replies["c\r"] = {"c"};
  ASSERT_TRUE(conn.connect(1, 1000));

  // "a" gets no reply and holds the gate for its whole timeout
  std::thread a([this] { serializer.execute("a\r", CommandClass::Acknowledge, 1000); });
  while (!accumulator.active()) std::this_thread::sleep_for(std::chrono::milliseconds(1));

  std::thread b([this] { serializer.execute("b\r", CommandClass::Acknowledge); });
  while (serializer.queued() < 1) std::this_thread::sleep_for(std::chrono::milliseconds(1));
  std::thread c([this] { serializer.execute("c\r", CommandClass::Acknowledge); });
  while (serializer.queued() < 2) std::this_thread::sleep_for(std::chrono::milliseconds(1));

  a.join();
  b.join();
  c.join();

  EXPECT_EQ(transport.writes(), (std::vector<std::string>{"a\r", "b\r", "c\r"}));
  EXPECT_EQ(serializer.queued(), 0u);
}
