#pragma once

#include <chrono>
#include <map>
#include <string>

namespace agentcore::events {

// Timeline categories written by the decision trace.
enum class EventType {
  kAgentStarted,
  kDecisionMade,
  kDecisionFailed,
  kAgentStopped,
};

// One trace line.
//
// - `ts`: UTC time the event was recorded.
// - `type`: category above.
// - `payload`: flat string attributes; std::map keeps key order stable.
struct Event {
  std::chrono::system_clock::time_point ts{};
  EventType type = EventType::kDecisionMade;
  std::map<std::string, std::string> payload;
};

std::string ToJson(EventType event_type);
std::string ToJson(const Event& event);

} // namespace agentcore::events
