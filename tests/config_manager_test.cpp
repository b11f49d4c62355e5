#include "common/config_manager.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>

class ConfigManagerTest : public ::testing::Test {
protected:
  std::string path_;
  void SetUp() override {
    path_ = ::testing::TempDir() + "stx_bulk_config_test.env";
    std::ofstream f(path_);
    f << "# comment\n"
      << "LOG_LEVEL=debug\n"
      << "export EXPLORER_URL=\"https://explorer.example\"\n"
      << "  HTTP_TIMEOUT_MS = 2500  \n"
      << "BAD_INT=abc\n"
      << "NEGATIVE_TIMEOUT=-5\n"
      << "ZERO_TIMEOUT=0\n"
      << "EMPTY=\n"
      << "not a pair\n";
  }
  void TearDown() override {
    std::remove(path_.c_str());
    ConfigManager::Initialize("/nonexistent/.env");
  }
};

TEST_F(ConfigManagerTest, ReadsEnvFile) {
  ConfigManager::Initialize(path_);
  EXPECT_EQ(ConfigManager::GetOr("LOG_LEVEL", "info"), "debug");
  EXPECT_EQ(ConfigManager::GetOr("EXPLORER_URL", ""), "https://explorer.example");
  EXPECT_EQ(ConfigManager::GetIntOr("HTTP_TIMEOUT_MS", 10000), 2500);
  EXPECT_FALSE(ConfigManager::Get("not a pair").has_value());
}

TEST_F(ConfigManagerTest, FallsBackToDefaults) {
  ConfigManager::Initialize(path_);
  EXPECT_EQ(ConfigManager::GetIntOr("BAD_INT", 7), 7);
  EXPECT_EQ(ConfigManager::GetOr("EMPTY", "fallback"), "fallback");
  EXPECT_EQ(ConfigManager::GetIntOr("STX_BULK_TEST_MISSING", 42), 42);
  EXPECT_FALSE(ConfigManager::Get("STX_BULK_TEST_MISSING").has_value());
}

TEST_F(ConfigManagerTest, TimeoutsMustBePositive) {
  ConfigManager::Initialize(path_);
  EXPECT_EQ(ConfigManager::GetIntOr("NEGATIVE_TIMEOUT", 10000), -5);
  EXPECT_EQ(ConfigManager::GetPositiveIntOr("NEGATIVE_TIMEOUT", 10000), 10000);
  EXPECT_EQ(ConfigManager::GetPositiveIntOr("ZERO_TIMEOUT", 10000), 10000);
  EXPECT_EQ(ConfigManager::GetPositiveIntOr("BAD_INT", 10000), 10000);
  EXPECT_EQ(ConfigManager::GetPositiveIntOr("HTTP_TIMEOUT_MS", 10000), 2500);
}

TEST_F(ConfigManagerTest, ProcessEnvironmentIsFallback) {
  ::setenv("STX_BULK_TEST_FROM_ENV", "from-env", 1);
  ::setenv("LOG_LEVEL", "error", 1);
  ConfigManager::Initialize(path_);
  EXPECT_EQ(ConfigManager::GetOr("STX_BULK_TEST_FROM_ENV", ""), "from-env");
  // the file wins over the environment
  EXPECT_EQ(ConfigManager::GetOr("LOG_LEVEL", "info"), "debug");
  ::unsetenv("STX_BULK_TEST_FROM_ENV");
  ::unsetenv("LOG_LEVEL");
}

TEST(ConfigManagerMissingFile, UsesEnvironmentOnly) {
  ConfigManager::Initialize("/nonexistent/.env");
  EXPECT_FALSE(ConfigManager::Get("STX_BULK_TEST_MISSING").has_value());
}
