#include "envs/weather.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <optional>
#include <string>

using agentcore::envs::weather::InterpretWeather;
using agentcore::envs::weather::MatchWindowRule;
using agentcore::envs::weather::Weather;
using agentcore::envs::weather::WeatherState;
using agentcore::envs::weather::Window;

TEST_CASE("Weather interpretation is total over the percept domain", "[envs][weather]") {
  for (const Weather weather : agentcore::envs::weather::kAllWeather) {
    const WeatherState state = InterpretWeather(weather);
    switch (state.kind) {
    case WeatherState::Kind::kGood:
    case WeatherState::Kind::kBad:
      REQUIRE_FALSE(state.unrecognized.has_value());
      break;
    case WeatherState::Kind::kUnknown:
      REQUIRE(state.unrecognized == weather);
      break;
    }
  }
}

TEST_CASE("Weather interpretation classifies the reference percepts", "[envs][weather]") {
  REQUIRE(InterpretWeather(Weather::kSunny) == WeatherState::Good());
  REQUIRE(InterpretWeather(Weather::kPartlyCloudy) == WeatherState::Good());
  REQUIRE(InterpretWeather(Weather::kRainy) == WeatherState::Bad());
  REQUIRE(InterpretWeather(Weather::kThunderstorm) == WeatherState::Bad());
  REQUIRE(InterpretWeather(Weather::kCloudy) == WeatherState::Unknown(Weather::kCloudy));
}

TEST_CASE("Unknown states compare by carried percept", "[envs][weather]") {
  REQUIRE(WeatherState::Unknown(Weather::kCloudy) == WeatherState::Unknown(Weather::kCloudy));
  REQUIRE_FALSE(WeatherState::Unknown(Weather::kCloudy) ==
                WeatherState::Unknown(Weather::kSunny));
  REQUIRE_FALSE(WeatherState::Unknown(Weather::kCloudy) == WeatherState::Good());
}

TEST_CASE("Window rules refuse unknown states", "[envs][weather]") {
  REQUIRE(MatchWindowRule(WeatherState::Good()).GetAction() == Window::kOpen);
  REQUIRE(MatchWindowRule(WeatherState::Bad()).GetAction() == Window::kClose);

  const auto unknown = MatchWindowRule(WeatherState::Unknown(Weather::kCloudy));
  REQUIRE_FALSE(unknown.Ok());
  REQUIRE(unknown.Error() == agentcore::agent::DecisionErrorCode::kNoApplicableRule);
}

TEST_CASE("Weather names parse leniently and print canonically", "[envs][weather]") {
  Weather weather = Weather::kSunny;
  std::string error;

  REQUIRE(agentcore::envs::weather::ParseWeather("Partly Cloudy", weather, error));
  REQUIRE(weather == Weather::kPartlyCloudy);
  REQUIRE_FALSE(agentcore::envs::weather::ParseWeather("  THUNDER-storm", weather, error));
  REQUIRE(error.find("unknown weather percept") != std::string::npos);
  REQUIRE(agentcore::envs::weather::ParseWeather("partly--cloudy", weather, error));
  REQUIRE(weather == Weather::kPartlyCloudy);
  REQUIRE_FALSE(agentcore::envs::weather::ParseWeather(" ", weather, error));
  REQUIRE(error == "weather percept cannot be empty");

  for (const Weather candidate : agentcore::envs::weather::kAllWeather) {
    Weather round_trip = Weather::kSunny;
    REQUIRE(agentcore::envs::weather::ParseWeather(agentcore::envs::weather::ToString(candidate),
                                                   round_trip, error));
    REQUIRE(round_trip == candidate);
  }

  Window window = Window::kOpen;
  REQUIRE(agentcore::envs::weather::ParseWindow("Closed", window, error));
  REQUIRE(window == Window::kClose);
  REQUIRE_FALSE(agentcore::envs::weather::ParseWindow("ajar", window, error));
  REQUIRE(error.find("expected open|close") != std::string::npos);
}

TEST_CASE("WeatherState prints its carried percept", "[envs][weather]") {
  REQUIRE(agentcore::envs::weather::ToString(WeatherState::Good()) == "good");
  REQUIRE(agentcore::envs::weather::ToString(WeatherState::Unknown(Weather::kCloudy)) ==
          "unknown(cloudy)");
}

TEST_CASE("Window agent factories honor the strategy and fallback", "[envs][weather]") {
  auto table_agent = agentcore::envs::weather::MakeTableWindowAgent(
      std::make_shared<const agentcore::envs::weather::WindowTable>(
          agentcore::envs::weather::BuildSingleStepWindowTable()));
  REQUIRE(table_agent->StrategyName() == "table");
  REQUIRE(table_agent->Advance(Weather::kRainy).GetAction() == Window::kClose);

  auto strict = agentcore::envs::weather::MakeReflexWindowAgent(std::nullopt);
  REQUIRE_FALSE(strict->Advance(Weather::kCloudy).Ok());

  auto lenient = agentcore::envs::weather::MakeReflexWindowAgent(Window::kOpen);
  REQUIRE(lenient->Advance(Weather::kCloudy).GetAction() == Window::kOpen);
  REQUIRE(lenient->Advance(Weather::kRainy).GetAction() == Window::kClose);
}
