#include <gtest/gtest.h>

#include "AnovaConfig.h"

TEST(AnovaConfig, DefaultResponseThresholds) {
  const AnovaConfig cfg;
  EXPECT_EQ(cfg.statusPolicy.silenceWindowMs, 3000u);
  EXPECT_EQ(cfg.statusPolicy.minimumWaitMs, 1500u);
  EXPECT_EQ(cfg.ackPolicy.silenceWindowMs, 1000u);
  EXPECT_EQ(cfg.ackPolicy.minimumWaitMs, 500u);

  EXPECT_EQ(&cfg.policyFor(CommandClass::Status), &cfg.statusPolicy);
  EXPECT_EQ(&cfg.policyFor(CommandClass::Acknowledge), &cfg.ackPolicy);
}

TEST(AnovaConfig, DefaultConnectionTiming) {
  const AnovaConfig cfg;
  EXPECT_EQ(cfg.connectAttempts, 3);
  EXPECT_EQ(cfg.connectTimeoutMs, 10000u);
  EXPECT_EQ(cfg.connectTimeoutFloorMs, 10000u);
  EXPECT_EQ(cfg.connectBackoffMs, 2000u);
  EXPECT_EQ(cfg.lookupTimeoutMs, 2000u);
  EXPECT_EQ(cfg.fallbackScanTimeoutMs, 5000u);
  EXPECT_EQ(cfg.reconnectTimeoutMs, 5000u);
}

TEST(AnovaConfig, DefaultCommandTiming) {
  const AnovaConfig cfg;
  EXPECT_EQ(cfg.commandTimeoutMs, 5000u);
  EXPECT_EQ(cfg.directReadTimeoutMs, 2000u);
  EXPECT_EQ(cfg.interCommandDelayMs, 250u);
  EXPECT_EQ(cfg.discoveryTimeoutMs, 15000u);
}
