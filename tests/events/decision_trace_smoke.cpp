#include "events/decision_trace.hpp"
#include "events/jsonl_writer.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace {

void Fail(std::string_view message) {
  std::cerr << message << '\n';
  std::abort();
}

void AssertContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) == std::string_view::npos) {
    std::cerr << "expected to find: " << needle << '\n';
    std::cerr << "actual text: " << text << '\n';
    std::abort();
  }
}

std::vector<std::string> ReadNonEmptyLines(const fs::path& path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    Fail("failed to open trace output");
  }

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(input, line)) {
    if (!line.empty()) {
      lines.push_back(line);
    }
  }
  return lines;
}

} // namespace

int main() {
  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  const fs::path out_dir =
      fs::temp_directory_path() / ("agentcore-trace-smoke-" + std::to_string(now_ms));

  std::error_code cleanup_ec;
  fs::remove_all(out_dir, cleanup_ec);

  agentcore::events::DecisionTrace trace(out_dir);
  if (!trace.TracePath().empty()) {
    Fail("trace path should stay empty before the first emit");
  }

  const auto ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(5'000));
  std::string error;

  agentcore::events::DecisionTrace::AgentStartedEvent started;
  started.ts = ts;
  started.agent_id = "window-1";
  started.strategy = "table";
  started.retains_history = true;
  started.table_entries = 2;
  if (!trace.EmitAgentStarted(started, error)) {
    Fail("EmitAgentStarted failed: " + error);
  }

  agentcore::events::DecisionTrace::DecisionEvent decided;
  decided.ts = ts;
  decided.agent_id = "window-1";
  decided.step = 1;
  decided.percept = "sunny";
  decided.action = "open";
  if (!trace.EmitDecision(decided, error)) {
    Fail("EmitDecision failed: " + error);
  }

  agentcore::events::DecisionTrace::FailureEvent failed;
  failed.ts = ts;
  failed.agent_id = "window-1";
  failed.step = 2;
  failed.percept = "rainy";
  failed.code = agentcore::agent::DecisionErrorCode::kNoMatchingHistory;
  if (!trace.EmitFailure(failed, error)) {
    Fail("EmitFailure failed: " + error);
  }

  agentcore::events::DecisionTrace::AgentStoppedEvent stopped;
  stopped.ts = ts;
  stopped.agent_id = "window-1";
  stopped.steps = 2;
  stopped.failures = 1;
  if (!trace.EmitAgentStopped(stopped, error)) {
    Fail("EmitAgentStopped failed: " + error);
  }

  if (trace.TracePath() != out_dir / agentcore::events::kDecisionTraceFileName) {
    Fail("unexpected trace path: " + trace.TracePath().string());
  }

  const std::vector<std::string> lines = ReadNonEmptyLines(trace.TracePath());
  if (lines.size() != 4U) {
    Fail("expected exactly four trace lines");
  }

  AssertContains(lines[0], "\"type\":\"AGENT_STARTED\"");
  AssertContains(lines[0], "\"retains_history\":\"true\"");
  AssertContains(lines[0], "\"strategy\":\"table\"");
  AssertContains(lines[0], "\"table_entries\":\"2\"");

  AssertContains(lines[1], "\"type\":\"DECISION_MADE\"");
  AssertContains(lines[1], "\"action\":\"open\"");
  AssertContains(lines[1], "\"step\":\"1\"");

  AssertContains(lines[2], "\"type\":\"DECISION_FAILED\"");
  AssertContains(lines[2], "\"error_code\":\"NO_MATCHING_HISTORY\"");
  AssertContains(lines[2], "\"guidance\":\"");
  AssertContains(lines[2], "\"percept\":\"rainy\"");

  AssertContains(lines[3], "\"type\":\"AGENT_STOPPED\"");
  AssertContains(lines[3], "\"failures\":\"1\"");
  AssertContains(lines[3], "\"ts_utc\":\"1970-01-01T00:00:05.000Z\"");

  // A path that is a regular file cannot hold the trace.
  const fs::path blocker = out_dir / "blocker";
  {
    std::ofstream out(blocker, std::ios::binary);
    out << "x";
  }
  agentcore::events::DecisionTrace blocked(blocker);
  if (blocked.EmitAgentStarted(started, error)) {
    Fail("expected EmitAgentStarted to fail when output dir is a file");
  }
  if (error.empty()) {
    Fail("expected an error message for unwritable trace dir");
  }

  fs::remove_all(out_dir, cleanup_ec);
  std::cout << "decision_trace_smoke: ok\n";
  return 0;
}
