#pragma once

#include "agent/percept_log.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>

namespace agentcore::agent {

// Order-sensitive hash over a whole percept sequence. Percept only needs a
// std::hash specialization and operator==.
template <typename Percept>
struct PerceptSequenceHash {
  std::size_t operator()(const PerceptSequence<Percept>& sequence) const {
    std::size_t seed = sequence.size();
    const std::hash<Percept> element_hash;
    for (const auto& percept : sequence) {
      seed ^= element_hash(percept) + 0x9e3779b97f4a7c15ULL + (seed << 6U) + (seed >> 2U);
    }
    return seed;
  }
};

// Exact percept-sequence -> action mapping.
//
// Insert is an administrative operation done while the table is being built.
// Once handed to an agent the table is only reachable through a
// shared_ptr<const DecisionTable>, so the decision path can only Find.
template <typename Percept, typename Action>
class DecisionTable {
public:
  using Sequence = PerceptSequence<Percept>;
  using Map = std::unordered_map<Sequence, Action, PerceptSequenceHash<Percept>>;

  // Contract:
  // - true: entry added, `error` cleared.
  // - false: `sequence` was empty or already present; table unchanged.
  bool Insert(Sequence sequence, Action action, std::string& error) {
    error.clear();
    if (sequence.empty()) {
      error = "decision table keys must contain at least one percept";
      return false;
    }
    const auto [it, inserted] = entries_.emplace(std::move(sequence), std::move(action));
    if (!inserted) {
      error = "duplicate percept sequence of length " + std::to_string(it->first.size());
      return false;
    }
    return true;
  }

  // Returns nullptr when no entry matches `sequence` exactly.
  const Action* Find(const Sequence& sequence) const {
    const auto it = entries_.find(sequence);
    if (it == entries_.end()) {
      return nullptr;
    }
    return &it->second;
  }

  bool Contains(const Sequence& sequence) const {
    return entries_.find(sequence) != entries_.end();
  }

  std::size_t Size() const {
    return entries_.size();
  }

  bool Empty() const {
    return entries_.empty();
  }

  // Length of the longest key; 0 for an empty table. A table agent cannot
  // succeed after more than this many calls.
  std::size_t Horizon() const {
    std::size_t horizon = 0;
    for (const auto& entry : entries_) {
      if (entry.first.size() > horizon) {
        horizon = entry.first.size();
      }
    }
    return horizon;
  }

  const Map& Entries() const {
    return entries_;
  }

private:
  Map entries_;
};

} // namespace agentcore::agent
