#pragma once

#include <cstddef>
#include <utility>
#include <vector>

namespace agentcore::agent {

template <typename Percept>
using PerceptSequence = std::vector<Percept>;

// Append-only arrival-order record of what one agent instance has perceived.
// There is no truncation or reordering; memory grows by one element per call.
template <typename Percept>
class PerceptLog {
public:
  void Append(Percept percept) {
    percepts_.push_back(std::move(percept));
  }

  const PerceptSequence<Percept>& AsSequence() const {
    return percepts_;
  }

  std::size_t Size() const {
    return percepts_.size();
  }

  bool Empty() const {
    return percepts_.empty();
  }

private:
  PerceptSequence<Percept> percepts_;
};

} // namespace agentcore::agent
