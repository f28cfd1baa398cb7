#include "agent/horizon_table.hpp"
#include "agent/table_agent.hpp"
#include "envs/weather.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace {

using agentcore::agent::BuildHorizonTable;
using agentcore::agent::HorizonPolicy;
using agentcore::agent::TableSizeForHorizon;
using agentcore::envs::weather::Weather;
using agentcore::envs::weather::Window;
using WindowTable = agentcore::envs::weather::WindowTable;

const HorizonPolicy<Weather, Window> kLatestPercept =
    agentcore::envs::weather::LatestPerceptPolicy;

} // namespace

TEST_CASE("Table size follows the geometric sum over the horizon", "[agent][horizon]") {
  std::uint64_t size = 0;
  std::string error;

  REQUIRE(TableSizeForHorizon(2, 1, size, error));
  REQUIRE(size == 2U);
  REQUIRE(TableSizeForHorizon(2, 3, size, error));
  REQUIRE(size == 14U);
  REQUIRE(TableSizeForHorizon(5, 4, size, error));
  REQUIRE(size == 5U + 25U + 125U + 625U);
  REQUIRE(TableSizeForHorizon(1, 1'000'000'000'000ULL, size, error));
  REQUIRE(size == 1'000'000'000'000ULL);
  REQUIRE(TableSizeForHorizon(7, 0, size, error));
  REQUIRE(size == 0U);
  REQUIRE(error.empty());
}

TEST_CASE("Table size reports overflow instead of wrapping", "[agent][horizon]") {
  std::uint64_t size = 42;
  std::string error;

  REQUIRE_FALSE(TableSizeForHorizon(2, 64, size, error));
  REQUIRE(error.find("overflows") != std::string::npos);
  REQUIRE(size == 42U);

  // 2^1 + ... + 2^63 = 2^64 - 2 still fits.
  REQUIRE(TableSizeForHorizon(2, 63, size, error));
  REQUIRE(size == std::numeric_limits<std::uint64_t>::max() - 1U);
}

TEST_CASE("Horizon builder enumerates every sequence up to the horizon", "[agent][horizon]") {
  const std::vector<Weather> alphabet = {Weather::kSunny, Weather::kRainy};
  WindowTable table;
  std::string error;

  REQUIRE(BuildHorizonTable(alphabet, 3, 100, kLatestPercept, table, error));
  REQUIRE(error.empty());
  REQUIRE(table.Size() == 14U);
  REQUIRE(table.Horizon() == 3U);

  for (const auto& [sequence, action] : table.Entries()) {
    REQUIRE(sequence.size() >= 1U);
    REQUIRE(sequence.size() <= 3U);
    const Window expected = sequence.back() == Weather::kSunny ? Window::kOpen : Window::kClose;
    REQUIRE(action == expected);
  }
}

TEST_CASE("A horizon table lets a table agent act for exactly that many steps",
          "[agent][horizon]") {
  const std::vector<Weather> alphabet = {Weather::kSunny, Weather::kRainy};
  auto table = std::make_shared<WindowTable>();
  std::string error;
  REQUIRE(BuildHorizonTable(alphabet, 4, 1'000, kLatestPercept, *table, error));

  agentcore::agent::TableDrivenAgent<Weather, Window> agent(table);
  const std::vector<Weather> stream = {Weather::kSunny, Weather::kRainy, Weather::kRainy,
                                       Weather::kSunny, Weather::kSunny};
  for (std::size_t i = 0; i < 4; ++i) {
    const auto result = agent.Advance(stream[i]);
    REQUIRE(result.Ok());
  }
  const auto beyond = agent.Advance(stream[4]);
  REQUIRE_FALSE(beyond.Ok());
  REQUIRE(beyond.Error() == agentcore::agent::DecisionErrorCode::kNoMatchingHistory);
}

TEST_CASE("Horizon builder refuses budgets it cannot meet", "[agent][horizon]") {
  const std::vector<Weather> alphabet(agentcore::envs::weather::kAllWeather.begin(),
                                      agentcore::envs::weather::kAllWeather.end());
  WindowTable table;
  std::string error;
  REQUIRE(table.Insert({Weather::kCloudy}, Window::kClose, error));

  // 5 + 25 + 125 = 155 entries.
  REQUIRE_FALSE(BuildHorizonTable(alphabet, 3, 154, kLatestPercept, table, error));
  REQUIRE(error.find("needs 155 entries") != std::string::npos);
  REQUIRE(table.Size() == 1U);

  REQUIRE(BuildHorizonTable(alphabet, 3, 155, kLatestPercept, table, error));
  REQUIRE(table.Size() == 155U);
}

TEST_CASE("Horizon builder validates its inputs", "[agent][horizon]") {
  WindowTable table;
  std::string error;

  REQUIRE_FALSE(BuildHorizonTable<Weather, Window>({}, 2, 100, kLatestPercept, table, error));
  REQUIRE(error.find("alphabet cannot be empty") != std::string::npos);

  REQUIRE_FALSE(
      BuildHorizonTable<Weather, Window>({Weather::kSunny}, 0, 100, kLatestPercept, table, error));
  REQUIRE(error.find("horizon must be at least 1") != std::string::npos);

  REQUIRE_FALSE(BuildHorizonTable<Weather, Window>({Weather::kSunny, Weather::kSunny}, 1, 100,
                                                   kLatestPercept, table, error));
  REQUIRE(error.find("must not repeat") != std::string::npos);

  REQUIRE_FALSE(BuildHorizonTable<Weather, Window>({Weather::kSunny}, 1, 100, nullptr, table,
                                                   error));
  REQUIRE(error.find("policy is not set") != std::string::npos);
  REQUIRE(table.Empty());
}
