#include <gtest/gtest.h>

#include "StatusProtocol.h"

using namespace StatusProtocol;

TEST(StatusProtocol, SetTemperatureIsConvertedForFahrenheitDevices) {
  EXPECT_EQ(encodeSetTemperature(60.0f, TemperatureUnit::Fahrenheit), "set temp 140.0\r");
  EXPECT_EQ(encodeSetTemperature(56.5f, TemperatureUnit::Celsius), "set temp 56.5\r");
  // unit not known yet, sent as Celsius
  EXPECT_EQ(encodeSetTemperature(56.5f, std::nullopt), "set temp 56.5\r");
}

TEST(StatusProtocol, WriteCommands) {
  EXPECT_EQ(encodeSetTimer(90), "set timer 90\r");
  EXPECT_EQ(encodeSetUnit(TemperatureUnit::Celsius), "set units C\r");
  EXPECT_EQ(encodeSetUnit(TemperatureUnit::Fahrenheit), "set units F\r");
}

TEST(StatusProtocol, RunState) {
  EXPECT_EQ(decodeRunState("running"), std::optional<bool>(true));
  EXPECT_EQ(decodeRunState("Stopped"), std::optional<bool>(false));
  EXPECT_EQ(decodeRunState("low water"), std::nullopt);
}

TEST(StatusProtocol, Unit) {
  EXPECT_EQ(decodeUnit("f"), TemperatureUnit::Fahrenheit);
  EXPECT_EQ(decodeUnit("F"), TemperatureUnit::Fahrenheit);
  EXPECT_EQ(decodeUnit("c"), TemperatureUnit::Celsius);
  EXPECT_EQ(decodeUnit(""), TemperatureUnit::Celsius);
}

TEST(StatusProtocol, Temperature) {
  EXPECT_FLOAT_EQ(*decodeTemperature("54.9", TemperatureUnit::Celsius), 54.9f);
  EXPECT_FLOAT_EQ(*decodeTemperature(" 54.9 C", std::nullopt), 54.9f);
  EXPECT_NEAR(*decodeTemperature("22.5", TemperatureUnit::Fahrenheit), -5.28f, 0.01f);
  EXPECT_NEAR(*decodeTemperature("131.0", TemperatureUnit::Fahrenheit), 55.0f, 0.001f);
}

TEST(StatusProtocol, TemperatureRejectsGarbage) {
  EXPECT_EQ(decodeTemperature("", std::nullopt), std::nullopt);
  EXPECT_EQ(decodeTemperature("err", std::nullopt), std::nullopt);
  EXPECT_EQ(decodeTemperature("1.2.3", std::nullopt), std::nullopt);
  EXPECT_EQ(decodeTemperature("-", std::nullopt), std::nullopt);
}

TEST(StatusProtocol, Timer) {
  EXPECT_EQ(decodeTimer("running timer 15"), std::optional<int>(15));
  EXPECT_EQ(decodeTimer("Timer: 120"), std::optional<int>(120));
  EXPECT_EQ(decodeTimer("running"), std::nullopt);
  EXPECT_EQ(decodeTimer("timer off"), std::nullopt);
}

TEST(StatusProtocol, ApplyWritesOnlyWhatTheReplyCarries) {
  DeviceStatus s;
  EXPECT_EQ(apply(StatusQuery::Unit, "f", s), CommandOutcome::Acknowledged);
  EXPECT_EQ(apply(StatusQuery::TargetTemperature, "131.0", s), CommandOutcome::Acknowledged);
  EXPECT_EQ(apply(StatusQuery::CurrentTemperature, "garbled", s), CommandOutcome::Malformed);
  EXPECT_EQ(apply(StatusQuery::RunState, "stopped timer 30", s), CommandOutcome::Acknowledged);

  EXPECT_EQ(s.unit, TemperatureUnit::Fahrenheit);
  EXPECT_NEAR(*s.targetTemperature, 55.0f, 0.001f);
  EXPECT_FALSE(s.currentTemperature.has_value());
  EXPECT_EQ(s.running, std::optional<bool>(false));
  EXPECT_EQ(s.timerMinutes, std::optional<int>(30));
}

TEST(StatusProtocol, Acknowledgement) {
  EXPECT_EQ(classifyAcknowledgement(std::nullopt), CommandOutcome::NoReply);
  EXPECT_EQ(classifyAcknowledgement(std::string()), CommandOutcome::NoReply);
  EXPECT_EQ(classifyAcknowledgement(std::string("start")), CommandOutcome::Acknowledged);
  EXPECT_EQ(classifyAcknowledgement(std::string("\r\n\x01")), CommandOutcome::Malformed);
}

TEST(StatusProtocol, RefreshAsksForTheUnitFirst) {
  EXPECT_EQ(REFRESH_SEQUENCE[0], StatusQuery::Unit);
  EXPECT_STREQ(queryCommand(StatusQuery::Unit), "read unit\r");
  EXPECT_STREQ(queryCommand(StatusQuery::RunState), "status\r");
  EXPECT_STREQ(queryCommand(StatusQuery::TargetTemperature), "read set temp\r");
  EXPECT_STREQ(queryCommand(StatusQuery::CurrentTemperature), "read temp\r");
}
