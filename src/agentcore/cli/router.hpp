#pragma once

#include "core/logging/logger.hpp"
#include "envs/weather.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace agentcore::cli {

enum class Strategy {
  kTable,
  kReflex,
};

// Options for `agentcore run`. Also usable by in-process callers that want
// the same driver behavior without going through argv.
struct RunOptions {
  Strategy strategy = Strategy::kReflex;
  std::filesystem::path table_path;
  std::optional<envs::weather::Window> fallback;
  std::filesystem::path trace_dir;
  std::string agent_id = "agent-1";
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
  std::vector<std::string> percepts;
};

// Per-run tallies for callers that need more than the exit code.
struct RunSummary {
  std::uint64_t steps = 0;
  std::uint64_t decided = 0;
  std::uint64_t failed = 0;
  std::filesystem::path trace_path;
};

// Builds the configured agent and feeds it every percept in order. Decision
// failures are reported as maintenance lines and do not stop the run.
//
// Returns the process exit code; `summary` may be null.
int ExecuteRun(const RunOptions& options, RunSummary* summary);

// Routes `agentcore` subcommands. Exit codes:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error
//   10 => table config invalid
//   40 => at least one percept produced no decision
int Dispatch(int argc, char** argv);

} // namespace agentcore::cli
