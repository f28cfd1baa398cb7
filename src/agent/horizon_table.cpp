#include "agent/horizon_table.hpp"

#include <limits>

namespace agentcore::agent {

bool TableSizeForHorizon(std::uint64_t alphabet_size, std::uint64_t horizon,
                         std::uint64_t& size, std::string& error) {
  error.clear();
  constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();

  // Closed forms; the loop below would otherwise run `horizon` times.
  if (alphabet_size == 0U) {
    size = 0;
    return true;
  }
  if (alphabet_size == 1U) {
    size = horizon;
    return true;
  }

  std::uint64_t total = 0;
  std::uint64_t term = 1;
  for (std::uint64_t t = 1; t <= horizon; ++t) {
    if (term > kMax / alphabet_size) {
      error = "table size for alphabet " + std::to_string(alphabet_size) + " and horizon " +
              std::to_string(horizon) + " overflows 64 bits";
      return false;
    }
    term *= alphabet_size;
    if (total > kMax - term) {
      error = "table size for alphabet " + std::to_string(alphabet_size) + " and horizon " +
              std::to_string(horizon) + " overflows 64 bits";
      return false;
    }
    total += term;
  }

  size = total;
  return true;
}

} // namespace agentcore::agent
