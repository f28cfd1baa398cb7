#pragma once

#include "agent/decision_error.hpp"
#include "events/event_model.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace agentcore::events {

// Typed facade over the JSONL writer so every driver records the same payload
// keys for the same event. One trace instance belongs to one agent.
class DecisionTrace {
public:
  struct AgentStartedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string agent_id;
    std::string strategy;
    bool retains_history = false;
    std::uint64_t table_entries = 0;
  };

  struct DecisionEvent {
    std::chrono::system_clock::time_point ts{};
    std::string agent_id;
    std::uint64_t step = 0;
    std::string percept;
    std::string action;
  };

  struct FailureEvent {
    std::chrono::system_clock::time_point ts{};
    std::string agent_id;
    std::uint64_t step = 0;
    std::string percept;
    agent::DecisionErrorCode code = agent::DecisionErrorCode::kNoMatchingHistory;
  };

  struct AgentStoppedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string agent_id;
    std::uint64_t steps = 0;
    std::uint64_t failures = 0;
  };

  explicit DecisionTrace(std::filesystem::path output_dir);

  bool EmitAgentStarted(const AgentStartedEvent& event, std::string& error);
  bool EmitDecision(const DecisionEvent& event, std::string& error);
  bool EmitFailure(const FailureEvent& event, std::string& error);
  bool EmitAgentStopped(const AgentStoppedEvent& event, std::string& error);

  // Empty until the first successful emit.
  const std::filesystem::path& TracePath() const {
    return trace_path_;
  }

private:
  bool Emit(EventType type, std::chrono::system_clock::time_point ts,
            std::map<std::string, std::string> payload, std::string& error);

  std::filesystem::path output_dir_;
  std::filesystem::path trace_path_;
};

} // namespace agentcore::events
