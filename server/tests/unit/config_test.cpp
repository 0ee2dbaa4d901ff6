#include <cstdlib>
#include <stdexcept>

#include <gtest/gtest.h>

#include "icc/config.hpp"

namespace {

const char* const kConfigKeys[] = {
    "ICC_PORT", "ICC_REDIS_HOST", "ICC_REDIS_PORT", "ICC_BACKEND", "ICC_APPLAUSE_INTERVAL_SECONDS",
    "ICC_APPLAUSE_RETENTION_SECONDS", "ICC_APPLAUSE_TICK_MS", "ICC_PRUNE_TICK_SECONDS",
    "ICC_APPLAUSE_REFRESH_TICKS", "AUTH", "AUTH_TOKEN_KEY", "ICC_DEVELOPMENT", "ICC_SETTINGS", "DB_HOST",
    "DB_PORT", "DB_USER", "DB_PASSWORD", "DB_NAME", "LOG_LEVEL",
};

class ConfigFixture : public ::testing::Test {
 protected:
  void SetUp() override { ClearEnv(); }
  void TearDown() override { ClearEnv(); }

  static void ClearEnv() {
    for (const char* key : kConfigKeys) {
      unsetenv(key);
    }
  }
};

}  // namespace

TEST_F(ConfigFixture, DefaultsApplyWithoutEnvironment) {
  auto cfg = icc::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 9007);
  EXPECT_EQ(cfg.backend, icc::BackendKind::kRedis);
  EXPECT_EQ(cfg.redis_host, "localhost");
  EXPECT_EQ(cfg.redis_port, 6379);
  EXPECT_EQ(cfg.applause_interval_seconds, 5u);
  EXPECT_EQ(cfg.applause_retention_seconds, 300u);
  EXPECT_EQ(cfg.applause_tick_ms, 1000u);
  EXPECT_EQ(cfg.prune_tick_seconds, 60u);
  EXPECT_EQ(cfg.applause_refresh_ticks, 60u);
  EXPECT_EQ(cfg.auth, icc::AuthMode::kFake);
  EXPECT_EQ(cfg.settings, icc::SettingsMode::kStatic);
  EXPECT_FALSE(cfg.development);
  EXPECT_EQ(cfg.log_level, "info");
}

TEST_F(ConfigFixture, ReadsOverrides) {
  setenv("ICC_PORT", "19007", 1);
  setenv("ICC_BACKEND", "memory", 1);
  setenv("ICC_APPLAUSE_INTERVAL_SECONDS", "10", 1);
  setenv("ICC_SETTINGS", "mariadb", 1);
  setenv("DB_PORT", "3307", 1);
  auto cfg = icc::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 19007);
  EXPECT_EQ(cfg.backend, icc::BackendKind::kMemory);
  EXPECT_EQ(cfg.applause_interval_seconds, 10u);
  EXPECT_EQ(cfg.settings, icc::SettingsMode::kMariaDb);
  EXPECT_EQ(cfg.db_port, 3307);
}

TEST_F(ConfigFixture, RetentionIsClampedToInterval) {
  setenv("ICC_APPLAUSE_INTERVAL_SECONDS", "120", 1);
  setenv("ICC_APPLAUSE_RETENTION_SECONDS", "30", 1);
  auto cfg = icc::LoadConfigFromEnv();
  EXPECT_EQ(cfg.applause_retention_seconds, 120u);
}

TEST_F(ConfigFixture, InvalidValuesAreRejected) {
  setenv("ICC_PORT", "abc", 1);
  EXPECT_THROW(icc::LoadConfigFromEnv(), std::invalid_argument);
  setenv("ICC_PORT", "70000", 1);
  EXPECT_THROW(icc::LoadConfigFromEnv(), std::invalid_argument);
  unsetenv("ICC_PORT");

  setenv("ICC_APPLAUSE_TICK_MS", "0", 1);
  EXPECT_THROW(icc::LoadConfigFromEnv(), std::invalid_argument);
  unsetenv("ICC_APPLAUSE_TICK_MS");

  setenv("ICC_BACKEND", "etcd", 1);
  EXPECT_THROW(icc::LoadConfigFromEnv(), std::invalid_argument);
  unsetenv("ICC_BACKEND");

  setenv("LOG_LEVEL", "verbose", 1);
  EXPECT_THROW(icc::LoadConfigFromEnv(), std::invalid_argument);
}

TEST_F(ConfigFixture, TicketAuthNeedsKeyOutsideDevelopment) {
  setenv("AUTH", "ticket", 1);
  EXPECT_THROW(icc::LoadConfigFromEnv(), std::invalid_argument);

  setenv("ICC_DEVELOPMENT", "true", 1);
  auto dev = icc::LoadConfigFromEnv();
  EXPECT_EQ(dev.auth, icc::AuthMode::kTicket);
  EXPECT_EQ(dev.auth_token_key, icc::kDevelopmentTokenKey);

  setenv("ICC_DEVELOPMENT", "false", 1);
  setenv("AUTH_TOKEN_KEY", "prod-key", 1);
  EXPECT_EQ(icc::LoadConfigFromEnv().auth_token_key, "prod-key");
}
