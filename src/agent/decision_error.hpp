#pragma once

#include <string>
#include <string_view>

namespace agentcore::agent {

// The two ways a resolver can decline to act. Both are recoverable: the core
// hands them back to the driver and never turns them into a default action.
enum class DecisionErrorCode {
  // Table strategy: the exact accumulated percept sequence is not a key.
  kNoMatchingHistory,
  // Reflex strategy: the rule step refused the interpreted state.
  kNoApplicableRule,
};

// Grep-friendly identifier, e.g. "NO_MATCHING_HISTORY".
std::string_view ToStableErrorCode(DecisionErrorCode code);

// Operator-facing guidance for adapters that surface failures as a
// maintenance signal. The decision core itself never calls this.
std::string_view DescribeDecisionError(DecisionErrorCode code);

// Single-line contract text:
//   "<STABLE_CODE>: <description> percept: <percept>"
// The percept suffix is omitted when `percept` is empty.
std::string FormatDecisionError(DecisionErrorCode code, std::string_view percept);

} // namespace agentcore::agent
