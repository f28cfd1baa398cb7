#pragma once

namespace agentcore::core::errors {

// Process-exit contract for the `agentcore` CLI.
//
// 0/1/2 keep their conventional meanings (success, generic failure, usage).
// Higher values let wrappers tell a broken table file apart from an agent that
// ran cleanly but could not decide on one or more percepts.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kTableConfigInvalid = 10,
  kDecisionFailed = 40,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace agentcore::core::errors
