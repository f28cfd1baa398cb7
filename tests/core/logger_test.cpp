#include "core/logging/logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

using agentcore::core::logging::LogLevel;
using agentcore::core::logging::Logger;

TEST_CASE("Logger writes key=value lines with agent id and quoted fields", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kDebug, out);
  logger.SetAgentId("window-1");
  logger.Info("decision made", {{"percept", "sunny"}, {"note", "two\nlines"}});

  const std::string line = out.str();
  REQUIRE(line.rfind("ts_utc=", 0) == 0U);
  REQUIRE(line.find(" level=INFO agent_id=\"window-1\" msg=\"decision made\"") !=
          std::string::npos);
  REQUIRE(line.find(" percept=\"sunny\"") != std::string::npos);
  REQUIRE(line.find(" note=\"two\\nlines\"") != std::string::npos);
  REQUIRE(line.back() == '\n');
}

TEST_CASE("Logger drops lines below the minimum level", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kWarn, out);
  logger.Debug("hidden");
  logger.Info("hidden");
  REQUIRE(out.str().empty());

  logger.Warn("shown");
  REQUIRE(out.str().find("level=WARN") != std::string::npos);
  REQUIRE(out.str().find("agent_id=\"-\"") != std::string::npos);
}

TEST_CASE("Log levels parse case-insensitively", "[core][logging]") {
  LogLevel level = LogLevel::kInfo;
  std::string error;

  REQUIRE(agentcore::core::logging::ParseLogLevel("DEBUG", level, error));
  REQUIRE(level == LogLevel::kDebug);
  REQUIRE(agentcore::core::logging::ParseLogLevel("warning", level, error));
  REQUIRE(level == LogLevel::kWarn);

  REQUIRE_FALSE(agentcore::core::logging::ParseLogLevel("loud", level, error));
  REQUIRE(error.find("expected debug|info|warn|error") != std::string::npos);
  REQUIRE_FALSE(agentcore::core::logging::ParseLogLevel("", level, error));
}

TEST_CASE("Logger carries bound strategy and step until cleared", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kDebug, out);
  logger.SetAgentId("window-1");
  logger.SetStrategy("table");
  logger.Info("agent started");
  REQUIRE(out.str().find(" agent_id=\"window-1\" strategy=\"table\" msg=\"agent started\"") !=
          std::string::npos);
  REQUIRE(out.str().find(" step=") == std::string::npos);

  out.str("");
  logger.SetStep(3);
  REQUIRE(logger.Step() == 3U);
  logger.Warn("decision failed", {{"error_code", "NO_MATCHING_HISTORY"}});
  REQUIRE(out.str().find(" strategy=\"table\" step=3 msg=\"decision failed\" "
                         "error_code=\"NO_MATCHING_HISTORY\"") != std::string::npos);

  out.str("");
  logger.ClearStep();
  logger.Info("agent stopped");
  REQUIRE(out.str().find(" step=") == std::string::npos);
  REQUIRE(out.str().find("msg=\"agent stopped\"") != std::string::npos);
}
