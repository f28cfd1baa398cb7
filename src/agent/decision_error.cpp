#include "agent/decision_error.hpp"

namespace agentcore::agent {

std::string_view ToStableErrorCode(DecisionErrorCode code) {
  switch (code) {
  case DecisionErrorCode::kNoMatchingHistory:
    return "NO_MATCHING_HISTORY";
  case DecisionErrorCode::kNoApplicableRule:
    return "NO_APPLICABLE_RULE";
  }
  return "UNKNOWN";
}

std::string_view DescribeDecisionError(DecisionErrorCode code) {
  switch (code) {
  case DecisionErrorCode::kNoMatchingHistory:
    return "decision table has no entry for the percept history; extend the table horizon or "
           "switch to a reflex strategy";
  case DecisionErrorCode::kNoApplicableRule:
    return "no rule applies to the interpreted state; inspect the sensor or configure an "
           "explicit fallback action";
  }
  return "unclassified decision failure";
}

std::string FormatDecisionError(DecisionErrorCode code, std::string_view percept) {
  std::string text(ToStableErrorCode(code));
  text += ": ";
  text += DescribeDecisionError(code);
  if (!percept.empty()) {
    text += " percept: ";
    text += percept;
  }
  return text;
}

} // namespace agentcore::agent
