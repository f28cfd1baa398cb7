#pragma once

#include "agent/decision_core.hpp"

#include <functional>
#include <string_view>
#include <utility>

namespace agentcore::agent {

// Percept -> State. Must be total: inputs it cannot classify map to an
// explicit "unrecognized" state rather than failing.
template <typename Percept, typename State>
using InterpretFn = std::function<State(const Percept&)>;

// State -> action or kNoApplicableRule.
template <typename State, typename Action>
using RuleMatchFn = std::function<DecisionResult<Action>(const State&)>;

// Interpretation for domains where the percept already is the state.
template <typename T>
T Identity(const T& value) {
  return value;
}

// Composes interpret and match_rule for one percept. No history involved.
template <typename Percept, typename State, typename Action>
DecisionResult<Action> ResolveReflex(const Percept& percept,
                                     const InterpretFn<Percept, State>& interpret,
                                     const RuleMatchFn<State, Action>& match_rule) {
  const State state = interpret(percept);
  return match_rule(state);
}

// Wraps `match_rule` so that kNoApplicableRule becomes `fallback`.
//
// This is the only sanctioned way to turn an indeterminate state into an
// action, and it is the caller who opts in. Successful matches pass through
// unchanged.
template <typename State, typename Action>
RuleMatchFn<State, Action> WithFallbackAction(RuleMatchFn<State, Action> match_rule,
                                              Action fallback) {
  return [match_rule = std::move(match_rule),
          fallback = std::move(fallback)](const State& state) -> DecisionResult<Action> {
    DecisionResult<Action> result = match_rule(state);
    if (!result.Ok() && result.Error() == DecisionErrorCode::kNoApplicableRule) {
      return DecisionResult<Action>::Success(fallback);
    }
    return result;
  };
}

// Stateless agent: each Advance depends only on the percept passed in, so the
// same percept always yields the same result and memory never grows.
template <typename Percept, typename State, typename Action>
class SimpleReflexAgent final : public IDecisionCore<Percept, Action> {
public:
  SimpleReflexAgent(InterpretFn<Percept, State> interpret,
                    RuleMatchFn<State, Action> match_rule)
      : interpret_(std::move(interpret)), match_rule_(std::move(match_rule)) {}

  DecisionResult<Action> Advance(const Percept& percept) override {
    return ResolveReflex<Percept, State, Action>(percept, interpret_, match_rule_);
  }

  bool RetainsHistory() const override {
    return false;
  }

  std::string_view StrategyName() const override {
    return "reflex";
  }

private:
  InterpretFn<Percept, State> interpret_;
  RuleMatchFn<State, Action> match_rule_;
};

} // namespace agentcore::agent
