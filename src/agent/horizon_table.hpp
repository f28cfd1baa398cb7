#pragma once

#include "agent/decision_table.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace agentcore::agent {

// Number of keys a table needs to answer every history of length 1..horizon
// over an alphabet of `alphabet_size` percepts: sum_{t=1..T} |P|^t.
//
// Contract:
// - true: `size` holds the exact count, `error` is cleared.
// - false: the count does not fit in 64 bits; `size` is untouched.
bool TableSizeForHorizon(std::uint64_t alphabet_size,
                         std::uint64_t horizon,
                         std::uint64_t& size,
                         std::string& error);

template <typename Percept, typename Action>
using HorizonPolicy = std::function<Action(const PerceptSequence<Percept>&)>;

// Enumerates every percept sequence of length 1..horizon over `alphabet`
// (shorter sequences first, alphabet order within one length) and stores
// `policy(sequence)` for each.
//
// The full size is computed and checked against `max_entries` before any key
// is built, so an unaffordable horizon fails fast instead of exhausting
// memory. `table` is replaced only on success.
template <typename Percept, typename Action>
bool BuildHorizonTable(const std::vector<Percept>& alphabet,
                       std::size_t horizon,
                       std::uint64_t max_entries,
                       const HorizonPolicy<Percept, Action>& policy,
                       DecisionTable<Percept, Action>& table,
                       std::string& error) {
  error.clear();
  if (alphabet.empty()) {
    error = "percept alphabet cannot be empty";
    return false;
  }
  if (horizon == 0U) {
    error = "horizon must be at least 1";
    return false;
  }
  if (!policy) {
    error = "horizon policy is not set";
    return false;
  }

  std::uint64_t required = 0;
  if (!TableSizeForHorizon(alphabet.size(), horizon, required, error)) {
    return false;
  }
  if (required > max_entries) {
    error = "horizon " + std::to_string(horizon) + " over " + std::to_string(alphabet.size()) +
            " percepts needs " + std::to_string(required) + " entries (budget " +
            std::to_string(max_entries) + ")";
    return false;
  }

  DecisionTable<Percept, Action> built;
  std::vector<PerceptSequence<Percept>> frontier(1);
  for (std::size_t length = 1; length <= horizon; ++length) {
    std::vector<PerceptSequence<Percept>> next;
    next.reserve(frontier.size() * alphabet.size());
    for (const auto& prefix : frontier) {
      for (const auto& percept : alphabet) {
        PerceptSequence<Percept> sequence = prefix;
        sequence.push_back(percept);
        if (!built.Insert(sequence, policy(sequence), error)) {
          error = "alphabet must not repeat percepts: " + error;
          return false;
        }
        next.push_back(std::move(sequence));
      }
    }
    frontier = std::move(next);
  }

  table = std::move(built);
  return true;
}

} // namespace agentcore::agent
