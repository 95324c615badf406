#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>

#include "relay/config.hpp"
#include "relay/origin_policy.hpp"

namespace {

class ConfigEnvFixture : public ::testing::Test {
 protected:
  void SetUp() override { Clear(); }
  void TearDown() override { Clear(); }

  static void Clear() {
    for (const char* key : {"RELAY_ENV", "SERVER_PORT", "HEARTBEAT_INTERVAL_SECONDS", "SPAM_MESSAGES_PER_SECOND",
                            "ALLOWED_ORIGIN_PATTERN", "LOG_LEVEL", "METRICS_ENABLED"}) {
      unsetenv(key);
    }
  }
};

}  // namespace

TEST_F(ConfigEnvFixture, ProductionDefaults) {
  auto cfg = relay::LoadConfigFromEnv();
  EXPECT_FALSE(cfg.development);
  EXPECT_EQ(cfg.port, 8080);
  EXPECT_EQ(cfg.heartbeat_interval_seconds, 30u);
  EXPECT_EQ(cfg.spam_messages_per_second, 5u);
  EXPECT_EQ(cfg.allowed_origin_pattern, relay::kDefaultOriginPattern);
  EXPECT_EQ(cfg.log_level, "info");
  EXPECT_TRUE(cfg.metrics_enabled);
}

TEST_F(ConfigEnvFixture, DevelopmentSwitchesPortAndMetrics) {
  setenv("RELAY_ENV", "development", 1);
  auto cfg = relay::LoadConfigFromEnv();
  EXPECT_TRUE(cfg.development);
  EXPECT_EQ(cfg.port, 8081);
  EXPECT_FALSE(cfg.metrics_enabled);
}

TEST_F(ConfigEnvFixture, ExplicitValuesWin) {
  setenv("RELAY_ENV", "development", 1);
  setenv("SERVER_PORT", "9000", 1);
  setenv("HEARTBEAT_INTERVAL_SECONDS", "10", 1);
  setenv("METRICS_ENABLED", "true", 1);
  auto cfg = relay::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 9000);
  EXPECT_EQ(cfg.heartbeat_interval_seconds, 10u);
  EXPECT_TRUE(cfg.metrics_enabled);
}

TEST_F(ConfigEnvFixture, ZeroIntervalOrRateIsRejected) {
  setenv("HEARTBEAT_INTERVAL_SECONDS", "0", 1);
  EXPECT_THROW(relay::LoadConfigFromEnv(), std::invalid_argument);

  unsetenv("HEARTBEAT_INTERVAL_SECONDS");
  setenv("SPAM_MESSAGES_PER_SECOND", "0", 1);
  EXPECT_THROW(relay::LoadConfigFromEnv(), std::invalid_argument);
}
