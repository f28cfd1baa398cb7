#pragma once

#include "agent/decision_core.hpp"
#include "agent/decision_table.hpp"
#include "agent/percept_log.hpp"

#include <memory>
#include <string_view>
#include <utility>

namespace agentcore::agent {

// Appends `percept` to `log` and looks up the full resulting sequence.
//
// The lookup is exact: a history that is not a key fails with
// kNoMatchingHistory even if a shorter prefix or a similar sequence is
// present. The table is never written.
template <typename Percept, typename Action>
DecisionResult<Action> ResolveFromTable(PerceptLog<Percept>& log,
                                        const DecisionTable<Percept, Action>& table,
                                        const Percept& percept) {
  log.Append(percept);
  const Action* action = table.Find(log.AsSequence());
  if (action == nullptr) {
    return DecisionResult<Action>::Failure(DecisionErrorCode::kNoMatchingHistory);
  }
  return DecisionResult<Action>::Success(*action);
}

// History-keyed agent: every Advance grows the log by one and resolves the
// whole history against a pre-built table.
//
// A table populated only with length-1 keys can answer the first call and
// nothing after it. Covering T steps over percept alphabet P needs
// sum_{t=1..T} |P|^t entries; see horizon_table.hpp.
template <typename Percept, typename Action>
class TableDrivenAgent final : public IDecisionCore<Percept, Action> {
public:
  using Table = DecisionTable<Percept, Action>;

  explicit TableDrivenAgent(std::shared_ptr<const Table> table) : table_(std::move(table)) {}

  DecisionResult<Action> Advance(const Percept& percept) override {
    if (table_ == nullptr) {
      // No table means no key can match; record the percept all the same so
      // the log stays faithful to what was observed.
      log_.Append(percept);
      return DecisionResult<Action>::Failure(DecisionErrorCode::kNoMatchingHistory);
    }
    return ResolveFromTable(log_, *table_, percept);
  }

  bool RetainsHistory() const override {
    return true;
  }

  std::string_view StrategyName() const override {
    return "table";
  }

  const PerceptLog<Percept>& Log() const {
    return log_;
  }

private:
  std::shared_ptr<const Table> table_;
  PerceptLog<Percept> log_;
};

} // namespace agentcore::agent
