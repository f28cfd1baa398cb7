#include "envs/weather.hpp"

#include "agent/reflex_agent.hpp"
#include "agent/table_agent.hpp"

#include <cctype>
#include <utility>

namespace agentcore::envs::weather {

namespace {

// Lowercase, collapse runs of ' ', '-' and '_' into one '_', trim edges.
std::string NormalizeName(std::string_view raw) {
  std::string normalized;
  normalized.reserve(raw.size());

  bool pending_separator = false;
  for (const char c : raw) {
    const auto as_unsigned = static_cast<unsigned char>(c);
    if (c == ' ' || c == '-' || c == '_') {
      pending_separator = !normalized.empty();
      continue;
    }
    if (pending_separator) {
      normalized.push_back('_');
      pending_separator = false;
    }
    normalized.push_back(static_cast<char>(std::tolower(as_unsigned)));
  }

  return normalized;
}

} // namespace

const char* ToString(Weather weather) {
  switch (weather) {
  case Weather::kSunny:
    return "sunny";
  case Weather::kPartlyCloudy:
    return "partly_cloudy";
  case Weather::kCloudy:
    return "cloudy";
  case Weather::kRainy:
    return "rainy";
  case Weather::kThunderstorm:
    return "thunderstorm";
  }
  return "unknown";
}

const char* ToString(Window window) {
  switch (window) {
  case Window::kOpen:
    return "open";
  case Window::kClose:
    return "close";
  }
  return "unknown";
}

std::string ToString(const WeatherState& state) {
  switch (state.kind) {
  case WeatherState::Kind::kGood:
    return "good";
  case WeatherState::Kind::kBad:
    return "bad";
  case WeatherState::Kind::kUnknown:
    break;
  }
  if (!state.unrecognized.has_value()) {
    return "unknown";
  }
  return std::string("unknown(") + ToString(*state.unrecognized) + ")";
}

bool ParseWeather(std::string_view raw, Weather& weather, std::string& error) {
  error.clear();
  const std::string normalized = NormalizeName(raw);
  if (normalized.empty()) {
    error = "weather percept cannot be empty";
    return false;
  }

  for (const Weather candidate : kAllWeather) {
    if (normalized == ToString(candidate)) {
      weather = candidate;
      return true;
    }
  }

  error = "unknown weather percept '" + std::string(raw) +
          "' (expected sunny|partly_cloudy|cloudy|rainy|thunderstorm)";
  return false;
}

bool ParseWindow(std::string_view raw, Window& window, std::string& error) {
  error.clear();
  const std::string normalized = NormalizeName(raw);
  if (normalized == "open") {
    window = Window::kOpen;
    return true;
  }
  if (normalized == "close" || normalized == "closed") {
    window = Window::kClose;
    return true;
  }

  error = "unknown window action '" + std::string(raw) + "' (expected open|close)";
  return false;
}

WeatherState InterpretWeather(const Weather& weather) {
  switch (weather) {
  case Weather::kSunny:
  case Weather::kPartlyCloudy:
    return WeatherState::Good();
  case Weather::kRainy:
  case Weather::kThunderstorm:
    return WeatherState::Bad();
  case Weather::kCloudy:
    break;
  }
  // Cloudy, and any value outside the enumerators, is not classified.
  return WeatherState::Unknown(weather);
}

agent::DecisionResult<Window> MatchWindowRule(const WeatherState& state) {
  switch (state.kind) {
  case WeatherState::Kind::kGood:
    return agent::DecisionResult<Window>::Success(Window::kOpen);
  case WeatherState::Kind::kBad:
    return agent::DecisionResult<Window>::Success(Window::kClose);
  case WeatherState::Kind::kUnknown:
    break;
  }
  return agent::DecisionResult<Window>::Failure(agent::DecisionErrorCode::kNoApplicableRule);
}

WindowTable BuildSingleStepWindowTable() {
  WindowTable table;
  std::string error;
  // Both keys are distinct and non-empty, so neither insert can fail.
  (void)table.Insert({Weather::kSunny}, Window::kOpen, error);
  (void)table.Insert({Weather::kRainy}, Window::kClose, error);
  return table;
}

Window LatestPerceptPolicy(const agent::PerceptSequence<Weather>& sequence) {
  if (sequence.empty()) {
    return Window::kClose;
  }
  const agent::DecisionResult<Window> result = MatchWindowRule(InterpretWeather(sequence.back()));
  return result.Ok() ? result.GetAction() : Window::kClose;
}

std::unique_ptr<WindowAgent> MakeTableWindowAgent(std::shared_ptr<const WindowTable> table) {
  return std::make_unique<agent::TableDrivenAgent<Weather, Window>>(std::move(table));
}

std::unique_ptr<WindowAgent> MakeReflexWindowAgent(std::optional<Window> fallback) {
  agent::RuleMatchFn<WeatherState, Window> match_rule = MatchWindowRule;
  if (fallback.has_value()) {
    match_rule = agent::WithFallbackAction(std::move(match_rule), *fallback);
  }
  return std::make_unique<agent::SimpleReflexAgent<Weather, WeatherState, Window>>(
      InterpretWeather, std::move(match_rule));
}

} // namespace agentcore::envs::weather
