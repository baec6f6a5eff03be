/**
 * @file test_logger.cpp
 * @brief Unit tests for log level names and level filtering
 */

#include <catch2/catch_test_macros.hpp>

#include "EvflEditor/core/logger.hpp"
#include <string>
#include <utility>
#include <vector>

using namespace EvflEditor::core;

TEST_CASE("Logger: level names", "[unit][core][logger]") {
  CHECK(logLevelFromString("debug") == LogLevel::Debug);
  CHECK(logLevelFromString("WARN") == LogLevel::Warning);
  CHECK(logLevelFromString("Warning") == LogLevel::Warning);
  CHECK(logLevelFromString("off") == LogLevel::Off);
  CHECK_FALSE(logLevelFromString("verbose").has_value());

  CHECK(std::string(logLevelToString(LogLevel::Error)) == "ERROR");
  CHECK(logLevelFromString(logLevelToString(LogLevel::Warning)) == LogLevel::Warning);
}

TEST_CASE("Logger: messages below the level are dropped", "[unit][core][logger]") {
  auto& logger = Logger::instance();
  const LogLevel previous = logger.getLevel();

  std::vector<std::pair<LogLevel, std::string>> received;
  logger.setConsoleOutput(false);
  logger.addLogCallback(
      [&received](LogLevel level, const std::string& message) { received.emplace_back(level, message); });

  logger.setLevel(LogLevel::Warning);
  EVFLEDITOR_LOG_INFO("hidden {}", 1);
  EVFLEDITOR_LOG_WARN("shown {}", 2);
  EVFLEDITOR_LOG_ERROR("also shown");

  logger.setLevel(LogLevel::Off);
  EVFLEDITOR_LOG_FATAL("nothing gets through");

  logger.clearLogCallbacks();
  logger.setConsoleOutput(true);
  logger.setLevel(previous);

  REQUIRE(received.size() == 2);
  CHECK(received[0] == std::make_pair(LogLevel::Warning, std::string("shown 2")));
  CHECK(received[1].second == "also shown");
}
