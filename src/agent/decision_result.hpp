#pragma once

#include "agent/decision_error.hpp"

#include <optional>
#include <utility>

namespace agentcore::agent {

// Outcome of one resolution: exactly one of an action or an error code.
//
// Built only through Success()/Failure() so a result can never carry both or
// neither.
template <typename Action>
class DecisionResult {
public:
  static DecisionResult Success(Action action) {
    DecisionResult result;
    result.action_ = std::move(action);
    return result;
  }

  static DecisionResult Failure(DecisionErrorCode code) {
    DecisionResult result;
    result.error_ = code;
    return result;
  }

  bool Ok() const {
    return action_.has_value();
  }

  // Precondition: Ok().
  const Action& GetAction() const {
    return *action_;
  }

  // Precondition: !Ok().
  DecisionErrorCode Error() const {
    return *error_;
  }

  bool operator==(const DecisionResult& other) const = default;

private:
  DecisionResult() = default;

  std::optional<Action> action_;
  std::optional<DecisionErrorCode> error_;
};

} // namespace agentcore::agent
