#include "events/event_model.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

using agentcore::events::EventType;

TEST_CASE("EventType maps to stable string values", "[core][events][json]") {
  REQUIRE(agentcore::events::ToJson(EventType::kAgentStarted) == "AGENT_STARTED");
  REQUIRE(agentcore::events::ToJson(EventType::kDecisionMade) == "DECISION_MADE");
  REQUIRE(agentcore::events::ToJson(EventType::kDecisionFailed) == "DECISION_FAILED");
  REQUIRE(agentcore::events::ToJson(EventType::kAgentStopped) == "AGENT_STOPPED");
}

TEST_CASE("Event JSON serialization includes timestamp type and payload", "[core][events][json]") {
  agentcore::events::Event event;
  event.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(2'000));
  event.type = EventType::kDecisionMade;
  event.payload = {
      {"percept", "sunny"},
      {"action", "open"},
  };

  const std::string json = agentcore::events::ToJson(event);
  REQUIRE(
      json ==
      R"({"ts_utc":"1970-01-01T00:00:02.000Z","type":"DECISION_MADE","payload":{"action":"open","percept":"sunny"}})");
}

TEST_CASE("Event JSON escapes payload strings", "[core][events][json]") {
  agentcore::events::Event event;
  event.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(1'234));
  event.type = EventType::kDecisionFailed;
  event.payload = {
      {"guidance", "say \"hi\"\nnow"},
  };

  const std::string json = agentcore::events::ToJson(event);
  REQUIRE(json.find(R"("ts_utc":"1970-01-01T00:00:01.234Z")") != std::string::npos);
  REQUIRE(json.find(R"("guidance":"say \"hi\"\nnow")") != std::string::npos);
}
