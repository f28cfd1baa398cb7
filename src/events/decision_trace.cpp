#include "events/decision_trace.hpp"

#include "events/jsonl_writer.hpp"

#include <utility>

namespace agentcore::events {

DecisionTrace::DecisionTrace(std::filesystem::path output_dir)
    : output_dir_(std::move(output_dir)) {}

bool DecisionTrace::Emit(EventType type, std::chrono::system_clock::time_point ts,
                         std::map<std::string, std::string> payload, std::string& error) {
  Event event;
  event.ts = ts;
  event.type = type;
  event.payload = std::move(payload);

  std::filesystem::path written_path;
  if (!AppendEventJsonl(event, output_dir_, written_path, error)) {
    return false;
  }
  trace_path_ = std::move(written_path);
  return true;
}

bool DecisionTrace::EmitAgentStarted(const AgentStartedEvent& event, std::string& error) {
  return Emit(EventType::kAgentStarted, event.ts,
              {
                  {"agent_id", event.agent_id},
                  {"strategy", event.strategy},
                  {"retains_history", event.retains_history ? "true" : "false"},
                  {"table_entries", std::to_string(event.table_entries)},
              },
              error);
}

bool DecisionTrace::EmitDecision(const DecisionEvent& event, std::string& error) {
  return Emit(EventType::kDecisionMade, event.ts,
              {
                  {"agent_id", event.agent_id},
                  {"step", std::to_string(event.step)},
                  {"percept", event.percept},
                  {"action", event.action},
              },
              error);
}

bool DecisionTrace::EmitFailure(const FailureEvent& event, std::string& error) {
  return Emit(EventType::kDecisionFailed, event.ts,
              {
                  {"agent_id", event.agent_id},
                  {"step", std::to_string(event.step)},
                  {"percept", event.percept},
                  {"error_code", std::string(agent::ToStableErrorCode(event.code))},
                  {"guidance", std::string(agent::DescribeDecisionError(event.code))},
              },
              error);
}

bool DecisionTrace::EmitAgentStopped(const AgentStoppedEvent& event, std::string& error) {
  return Emit(EventType::kAgentStopped, event.ts,
              {
                  {"agent_id", event.agent_id},
                  {"steps", std::to_string(event.steps)},
                  {"failures", std::to_string(event.failures)},
              },
              error);
}

} // namespace agentcore::events
