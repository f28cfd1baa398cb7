#pragma once

#include "agent/decision_result.hpp"

#include <string_view>

namespace agentcore::agent {

// Invocation contract shared by every decision strategy.
//
// Contract:
// - Advance is called once per percept, in receipt order, by one driver.
// - Percepts are never skipped, reordered or replayed.
// - Calls on one instance are strictly sequential; no internal locking.
// - Failures come back as a DecisionResult; implementations never abort,
//   log, or invent a default action.
template <typename Percept, typename Action>
class IDecisionCore {
public:
  virtual ~IDecisionCore() = default;

  virtual DecisionResult<Action> Advance(const Percept& percept) = 0;

  // True when the strategy keeps the percept history between calls.
  virtual bool RetainsHistory() const = 0;

  // Short label used in logs and traces ("table", "reflex").
  virtual std::string_view StrategyName() const = 0;
};

} // namespace agentcore::agent
