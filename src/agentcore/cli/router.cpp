#include "agentcore/cli/router.hpp"

#include "agent/decision_error.hpp"
#include "agent/horizon_table.hpp"
#include "core/errors/exit_codes.hpp"
#include "envs/table_config.hpp"
#include "events/decision_trace.hpp"

#include <charconv>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace agentcore::cli {

namespace {

using envs::weather::Weather;
using envs::weather::Window;

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitTableConfigInvalid =
    core::errors::ToInt(core::errors::ExitCode::kTableConfigInvalid);
constexpr int kExitDecisionFailed = core::errors::ToInt(core::errors::ExitCode::kDecisionFailed);

constexpr std::string_view kVersion = "agentcore 0.1.0";

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  agentcore run --strategy <table|reflex> [--table <table.json>] "
         "[--fallback <open|close>] [--trace-dir <dir>] [--agent-id <id>] "
         "[--log-level <debug|info|warn|error>] <percept> [<percept>...]\n"
      << "  agentcore validate-table <table.json>\n"
      << "  agentcore table-size --alphabet <n> --horizon <t>\n"
      << "  agentcore version\n"
      << "\n"
      << "percepts: sunny|partly_cloudy|cloudy|rainy|thunderstorm\n";
}

const char* ToString(Strategy strategy) {
  return strategy == Strategy::kTable ? "table" : "reflex";
}

bool ParseStrategy(std::string_view raw, Strategy& strategy, std::string& error) {
  if (raw == "table") {
    strategy = Strategy::kTable;
    return true;
  }
  if (raw == "reflex") {
    strategy = Strategy::kReflex;
    return true;
  }
  error = "invalid --strategy '" + std::string(raw) + "' (expected table|reflex)";
  return false;
}

bool ParseU64(std::string_view raw, std::string_view flag, std::uint64_t& value,
              std::string& error) {
  const char* begin = raw.data();
  const char* end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (raw.empty() || ec != std::errc() || ptr != end) {
    error = "invalid value for " + std::string(flag) + ": '" + std::string(raw) +
            "' (expected non-negative integer)";
    return false;
  }
  return true;
}

// Reads the value that follows a flag at `args[i]`, advancing `i`.
bool TakeFlagValue(const std::vector<std::string_view>& args, std::size_t& i,
                   std::string_view& value, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(args[i]);
    return false;
  }
  value = args[++i];
  return true;
}

// Contract:
// - `--strategy` is required.
// - `--fallback` is only meaningful for the reflex strategy.
// - `--table` is only meaningful for the table strategy.
// - At least one positional percept.
bool ParseRunOptions(const std::vector<std::string_view>& args, RunOptions& options,
                     std::string& error) {
  bool has_strategy = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;

    if (token == "--strategy") {
      if (!TakeFlagValue(args, i, value, error) || !ParseStrategy(value, options.strategy, error)) {
        return false;
      }
      has_strategy = true;
      continue;
    }
    if (token == "--table") {
      if (!TakeFlagValue(args, i, value, error)) {
        return false;
      }
      if (value.empty()) {
        error = "--table cannot be empty";
        return false;
      }
      options.table_path = fs::path(value);
      continue;
    }
    if (token == "--fallback") {
      if (!TakeFlagValue(args, i, value, error)) {
        return false;
      }
      Window window = Window::kClose;
      if (!envs::weather::ParseWindow(value, window, error)) {
        return false;
      }
      options.fallback = window;
      continue;
    }
    if (token == "--trace-dir") {
      if (!TakeFlagValue(args, i, value, error)) {
        return false;
      }
      if (value.empty()) {
        error = "--trace-dir cannot be empty";
        return false;
      }
      options.trace_dir = fs::path(value);
      continue;
    }
    if (token == "--agent-id") {
      if (!TakeFlagValue(args, i, value, error)) {
        return false;
      }
      if (value.empty()) {
        error = "--agent-id cannot be empty";
        return false;
      }
      options.agent_id = std::string(value);
      continue;
    }
    if (token == "--log-level") {
      if (!TakeFlagValue(args, i, value, error) ||
          !core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    options.percepts.emplace_back(token);
  }

  if (!has_strategy) {
    error = "run requires --strategy <table|reflex>";
    return false;
  }
  if (options.fallback.has_value() && options.strategy != Strategy::kReflex) {
    error = "--fallback is only valid with --strategy reflex";
    return false;
  }
  if (!options.table_path.empty() && options.strategy != Strategy::kTable) {
    error = "--table is only valid with --strategy table";
    return false;
  }
  if (options.percepts.empty()) {
    error = "run requires at least one percept";
    return false;
  }
  return true;
}

void PrintTableIssues(const fs::path& path, const envs::weather::TableConfigReport& report) {
  std::cerr << "invalid table: " << path.string() << '\n';
  for (const auto& issue : report.issues) {
    std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
  }
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << kVersion << '\n';
  return kExitSuccess;
}

int CommandValidateTable(const std::vector<std::string_view>& args) {
  if (args.size() != 1U) {
    std::cerr << "error: validate-table requires exactly 1 argument: <table.json>\n";
    return kExitUsage;
  }

  const fs::path path(args.front());
  envs::weather::WindowTable table;
  envs::weather::TableConfigReport report;
  std::string error;
  if (!envs::weather::LoadWindowTableFile(path, table, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (!report.valid) {
    PrintTableIssues(path, report);
    return kExitTableConfigInvalid;
  }

  std::cout << "valid: " << path.string() << '\n';
  std::cout << "entries: " << table.Size() << '\n';
  std::cout << "horizon: " << table.Horizon() << '\n';
  return kExitSuccess;
}

int CommandTableSize(const std::vector<std::string_view>& args) {
  std::uint64_t alphabet = 0;
  std::uint64_t horizon = 0;
  bool has_alphabet = false;
  bool has_horizon = false;
  std::string error;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--alphabet" || token == "--horizon") {
      if (!TakeFlagValue(args, i, value, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      const bool is_alphabet = token == "--alphabet";
      if (!ParseU64(value, token, is_alphabet ? alphabet : horizon, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      (is_alphabet ? has_alphabet : has_horizon) = true;
      continue;
    }
    std::cerr << "error: unknown option: " << token << '\n';
    return kExitUsage;
  }

  if (!has_alphabet || !has_horizon) {
    std::cerr << "error: table-size requires --alphabet <n> and --horizon <t>\n";
    return kExitUsage;
  }

  std::uint64_t size = 0;
  if (!agent::TableSizeForHorizon(alphabet, horizon, size, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  std::cout << "entries: " << size << '\n';
  return kExitSuccess;
}

int CommandRun(const std::vector<std::string_view>& args) {
  RunOptions options;
  std::string error;
  if (!ParseRunOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  return ExecuteRun(options, nullptr);
}

} // namespace

int ExecuteRun(const RunOptions& options, RunSummary* summary) {
  core::logging::Logger logger(options.log_level);
  logger.SetAgentId(options.agent_id);
  logger.SetStrategy(ToString(options.strategy));
  std::string error;

  // Convert every raw percept before the first Advance: the agent must see
  // the whole stream or none of it.
  std::vector<Weather> percepts;
  percepts.reserve(options.percepts.size());
  for (const auto& raw : options.percepts) {
    Weather weather = Weather::kSunny;
    if (!envs::weather::ParseWeather(raw, weather, error)) {
      logger.Error("percept conversion failed", {{"raw", raw}, {"error", error}});
      std::cerr << "error: " << error << '\n';
      return kExitUsage;
    }
    percepts.push_back(weather);
  }

  std::shared_ptr<const envs::weather::WindowTable> table;
  std::unique_ptr<envs::weather::WindowAgent> agent;
  if (options.strategy == Strategy::kTable) {
    if (options.table_path.empty()) {
      table = std::make_shared<const envs::weather::WindowTable>(
          envs::weather::BuildSingleStepWindowTable());
      logger.Debug("using built-in single-step table");
    } else {
      envs::weather::WindowTable loaded;
      envs::weather::TableConfigReport report;
      if (!envs::weather::LoadWindowTableFile(options.table_path, loaded, report, error)) {
        logger.Error("table load failed", {{"path", options.table_path.string()}, {"error", error}});
        std::cerr << "error: " << error << '\n';
        return kExitFailure;
      }
      if (!report.valid) {
        logger.Error("table config invalid",
                     {{"path", options.table_path.string()},
                      {"issue_count", std::to_string(report.issues.size())}});
        PrintTableIssues(options.table_path, report);
        return kExitTableConfigInvalid;
      }
      table = std::make_shared<const envs::weather::WindowTable>(std::move(loaded));
    }
    agent = envs::weather::MakeTableWindowAgent(table);
  } else {
    agent = envs::weather::MakeReflexWindowAgent(options.fallback);
  }

  const std::uint64_t table_entries = table != nullptr ? table->Size() : 0U;
  logger.Info("agent started",
              {{"percept_count", std::to_string(percepts.size())},
               {"table_entries", std::to_string(table_entries)},
               {"fallback",
                options.fallback.has_value() ? envs::weather::ToString(*options.fallback) : "none"}});
  if (table != nullptr && percepts.size() > table->Horizon()) {
    logger.Warn("percept stream is longer than the table horizon",
                {{"horizon", std::to_string(table->Horizon())},
                 {"percept_count", std::to_string(percepts.size())}});
  }

  std::unique_ptr<events::DecisionTrace> trace;
  if (!options.trace_dir.empty()) {
    trace = std::make_unique<events::DecisionTrace>(options.trace_dir);
    events::DecisionTrace::AgentStartedEvent started;
    started.ts = std::chrono::system_clock::now();
    started.agent_id = options.agent_id;
    started.strategy = std::string(agent->StrategyName());
    started.retains_history = agent->RetainsHistory();
    started.table_entries = table_entries;
    if (!trace->EmitAgentStarted(started, error)) {
      logger.Error("failed to write decision trace", {{"error", error}});
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
  }

  RunSummary local;
  for (const Weather weather : percepts) {
    ++local.steps;
    logger.SetStep(local.steps);
    const std::string step = std::to_string(local.steps);
    const std::string percept_name = envs::weather::ToString(weather);
    const agent::DecisionResult<Window> result = agent->Advance(weather);

    if (result.Ok()) {
      ++local.decided;
      const char* action_name = envs::weather::ToString(result.GetAction());
      logger.Debug("decision made",
                   {{"percept", percept_name}, {"action", action_name}});
      std::cout << "step=" << step << " percept=" << percept_name << " action=" << action_name
                << '\n';
      if (trace != nullptr) {
        events::DecisionTrace::DecisionEvent event;
        event.ts = std::chrono::system_clock::now();
        event.agent_id = options.agent_id;
        event.step = local.steps;
        event.percept = percept_name;
        event.action = action_name;
        if (!trace->EmitDecision(event, error)) {
          logger.Error("failed to write decision trace", {{"error", error}});
          std::cerr << "error: " << error << '\n';
          return kExitFailure;
        }
      }
      continue;
    }

    ++local.failed;
    const agent::DecisionErrorCode code = result.Error();
    logger.Warn("decision failed",
                {{"percept", percept_name},
                 {"error_code", agent::ToStableErrorCode(code)}});
    std::cout << "step=" << step << " percept=" << percept_name
              << " maintenance=" << agent::FormatDecisionError(code, "") << '\n';
    if (trace != nullptr) {
      events::DecisionTrace::FailureEvent event;
      event.ts = std::chrono::system_clock::now();
      event.agent_id = options.agent_id;
      event.step = local.steps;
      event.percept = percept_name;
      event.code = code;
      if (!trace->EmitFailure(event, error)) {
        logger.Error("failed to write decision trace", {{"error", error}});
        std::cerr << "error: " << error << '\n';
        return kExitFailure;
      }
    }
  }

  logger.ClearStep();

  if (trace != nullptr) {
    events::DecisionTrace::AgentStoppedEvent stopped;
    stopped.ts = std::chrono::system_clock::now();
    stopped.agent_id = options.agent_id;
    stopped.steps = local.steps;
    stopped.failures = local.failed;
    if (!trace->EmitAgentStopped(stopped, error)) {
      logger.Error("failed to write decision trace", {{"error", error}});
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    local.trace_path = trace->TracePath();
    std::cout << "trace: " << local.trace_path.string() << '\n';
  }

  std::cout << "decisions: total=" << local.steps << " ok=" << local.decided
            << " failed=" << local.failed << '\n';
  logger.Info("agent stopped",
              {{"steps", std::to_string(local.steps)},
               {"decided", std::to_string(local.decided)},
               {"failed", std::to_string(local.failed)}});

  if (summary != nullptr) {
    *summary = local;
  }
  return local.failed == 0U ? kExitSuccess : kExitDecisionFailed;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "run") {
    return CommandRun(args);
  }
  if (command == "validate-table") {
    return CommandValidateTable(args);
  }
  if (command == "table-size") {
    return CommandTableSize(args);
  }
  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace agentcore::cli
