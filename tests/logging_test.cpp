#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <vector>

namespace {
std::vector<std::string> ReadLines(const std::string& path) {
  std::ifstream in(path);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) lines.push_back(line);
  return lines;
}
}

TEST(LoggerTest, ParsesLevelNames) {
  EXPECT_EQ(ParseLogLevel("DEBUG"), LogLevel::DEBUG);
  EXPECT_EQ(ParseLogLevel("warn"), LogLevel::WARNING);
  EXPECT_EQ(ParseLogLevel("Critical"), LogLevel::CRITICAL);
  EXPECT_EQ(ParseLogLevel("verbose", LogLevel::ERROR), LogLevel::ERROR);
}

TEST(LoggerTest, DropsEntriesUntilInitialized) {
  EXPECT_FALSE(Logger::IsEnabled(LogLevel::CRITICAL));
  Logger::Critical("nobody hears this");
}

TEST(LoggerTest, WritesAtOrAboveMinimumLevel) {
  const std::string path = ::testing::TempDir() + "stx_bulk_logger_test.log";
  std::remove(path.c_str());
  Logger::Initialize(path, LogLevel::WARNING);
  EXPECT_TRUE(Logger::IsEnabled(LogLevel::ERROR));
  EXPECT_FALSE(Logger::IsEnabled(LogLevel::INFO));
  Logger::Info("filtered");
  Logger::Warning("kept warning", __FILE__, __LINE__);
  Logger::Error("kept error");
  Logger::Shutdown();

  auto lines = ReadLines(path);
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_NE(lines[0].find("[WARN] logging_test.cpp:"), std::string::npos);
  EXPECT_NE(lines[0].find(" - kept warning"), std::string::npos);
  EXPECT_NE(lines[1].find("[ERROR] logger.hpp:"), std::string::npos);
  std::remove(path.c_str());
}

TEST(StructuredLoggerTest, WritesJsonLines) {
  const std::string path = ::testing::TempDir() + "stx_bulk_events_test.jsonl";
  std::remove(path.c_str());
  auto& events = StructuredLogger::Instance();
  events.Event("before_init", {{"x", 1}});
  events.Initialize(path);
  events.Event("fee_quote", {{"rate_per_byte", 1}, {"fee", 302}});
  events.Event("broadcast", {{"accepted", false}});
  events.Shutdown();

  auto lines = ReadLines(path);
  ASSERT_EQ(lines.size(), 2u);
  auto first = nlohmann::json::parse(lines[0]);
  EXPECT_EQ(first["event"], "fee_quote");
  EXPECT_EQ(first["fee"], 302);
  EXPECT_TRUE(first.contains("ts_ms"));
  EXPECT_EQ(nlohmann::json::parse(lines[1])["accepted"], false);
  std::remove(path.c_str());
}

TEST(StructuredLoggerTest, ReplacesInvalidUtf8) {
  const std::string path = ::testing::TempDir() + "stx_bulk_events_utf8_test.jsonl";
  std::remove(path.c_str());
  auto& events = StructuredLogger::Instance();
  events.Initialize(path);
  EXPECT_NO_THROW(events.Event("broadcast", {{"reason", std::string("bad \xff byte")}}));
  events.Shutdown();

  auto lines = ReadLines(path);
  ASSERT_EQ(lines.size(), 1u);
  auto parsed = nlohmann::json::parse(lines[0]);
  EXPECT_EQ(parsed["reason"], "bad \xef\xbf\xbd byte");
  std::remove(path.c_str());
}
