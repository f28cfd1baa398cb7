#pragma once

#include "agent/decision_core.hpp"
#include "agent/decision_table.hpp"

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace agentcore::envs::weather {

// Percepts reported by the outdoor weather sensor.
enum class Weather {
  kSunny,
  kPartlyCloudy,
  kCloudy,
  kRainy,
  kThunderstorm,
};

// Actions the window actuator accepts.
enum class Window {
  kOpen,
  kClose,
};

// Every Weather value, in declaration order.
inline constexpr std::array<Weather, 5> kAllWeather = {
    Weather::kSunny,
    Weather::kPartlyCloudy,
    Weather::kCloudy,
    Weather::kRainy,
    Weather::kThunderstorm,
};

// Coarse state for the reflex strategy. `unrecognized` is set only for
// kUnknown and keeps the percept that could not be classified, so two
// unknown states are equal exactly when they carry the same percept.
struct WeatherState {
  enum class Kind {
    kGood,
    kBad,
    kUnknown,
  };

  Kind kind = Kind::kUnknown;
  std::optional<Weather> unrecognized;

  static WeatherState Good() {
    return {Kind::kGood, std::nullopt};
  }
  static WeatherState Bad() {
    return {Kind::kBad, std::nullopt};
  }
  static WeatherState Unknown(Weather percept) {
    return {Kind::kUnknown, percept};
  }

  bool operator==(const WeatherState& other) const = default;
};

using WindowTable = agent::DecisionTable<Weather, Window>;
using WindowAgent = agent::IDecisionCore<Weather, Window>;

const char* ToString(Weather weather);
const char* ToString(Window window);
// "good", "bad", or "unknown(<percept>)".
std::string ToString(const WeatherState& state);

// Accepts canonical names case-insensitively, with ' ', '-' and '_' treated
// alike ("Partly Cloudy" == "partly_cloudy").
bool ParseWeather(std::string_view raw, Weather& weather, std::string& error);
bool ParseWindow(std::string_view raw, Window& window, std::string& error);

// Sunny/PartlyCloudy -> Good, Rainy/Thunderstorm -> Bad, Cloudy -> Unknown.
WeatherState InterpretWeather(const Weather& weather);

// Good -> Open, Bad -> Close, Unknown -> kNoApplicableRule.
agent::DecisionResult<Window> MatchWindowRule(const WeatherState& state);

// {[Sunny] -> Open, [Rainy] -> Close}: answers only the very first percept.
WindowTable BuildSingleStepWindowTable();

// Horizon policy that reacts to the most recent percept with the reflex
// rule, closing the window whenever the rule declines.
Window LatestPerceptPolicy(const agent::PerceptSequence<Weather>& sequence);

std::unique_ptr<WindowAgent> MakeTableWindowAgent(std::shared_ptr<const WindowTable> table);

// `fallback` is applied to kNoApplicableRule only when the caller supplies it.
std::unique_ptr<WindowAgent> MakeReflexWindowAgent(std::optional<Window> fallback);

} // namespace agentcore::envs::weather
