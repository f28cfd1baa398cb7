#include "envs/table_config.hpp"

#include "core/json_dom.hpp"

#include <fstream>
#include <iterator>
#include <set>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace agentcore::envs::weather {

namespace {

using JsonValue = core::json::Value;

void AddIssue(TableConfigReport& report, std::string path, std::string message) {
  report.issues.push_back({std::move(path), std::move(message)});
}

void CheckKnownKeys(const JsonValue& object, const std::set<std::string_view>& allowed,
                    const std::string& path_prefix, TableConfigReport& report) {
  for (const auto& [key, value] : object.object_value) {
    (void)value;
    if (allowed.count(key) == 0U) {
      AddIssue(report, path_prefix + key, "unknown field");
    }
  }
}

// Validates one entry and, when it is well formed, inserts it into `built`.
// Issues land in `report` in file order, duplicates included.
void ParseEntry(const JsonValue& entry, std::size_t index, WindowTable& built,
                TableConfigReport& report) {
  const std::string entry_path = "entries[" + std::to_string(index) + "]";
  if (!entry.IsObject()) {
    AddIssue(report, entry_path, "must be an object");
    return;
  }
  CheckKnownKeys(entry, {"percepts", "action"}, entry_path + ".", report);

  bool entry_ok = true;
  std::string error;

  agent::PerceptSequence<Weather> sequence;
  const JsonValue* percepts = core::json::FindMember(entry, "percepts");
  if (percepts == nullptr) {
    AddIssue(report, entry_path + ".percepts", "is required");
    entry_ok = false;
  } else if (!percepts->IsArray()) {
    AddIssue(report, entry_path + ".percepts", "must be an array of weather names");
    entry_ok = false;
  } else if (percepts->array_value.empty()) {
    AddIssue(report, entry_path + ".percepts", "must contain at least one percept");
    entry_ok = false;
  } else {
    for (std::size_t i = 0; i < percepts->array_value.size(); ++i) {
      const JsonValue& item = percepts->array_value[i];
      const std::string item_path = entry_path + ".percepts[" + std::to_string(i) + "]";
      Weather weather = Weather::kSunny;
      if (!item.IsString()) {
        AddIssue(report, item_path, std::string("must be a string, got ") +
                                        core::json::ToString(item.type));
        entry_ok = false;
      } else if (!ParseWeather(item.string_value, weather, error)) {
        AddIssue(report, item_path, error);
        entry_ok = false;
      } else {
        sequence.push_back(weather);
      }
    }
  }

  Window window = Window::kClose;
  const JsonValue* action = core::json::FindMember(entry, "action");
  if (action == nullptr) {
    AddIssue(report, entry_path + ".action", "is required");
    entry_ok = false;
  } else if (!action->IsString()) {
    AddIssue(report, entry_path + ".action", "must be a string");
    entry_ok = false;
  } else if (!ParseWindow(action->string_value, window, error)) {
    AddIssue(report, entry_path + ".action", error);
    entry_ok = false;
  }

  if (entry_ok && !built.Insert(std::move(sequence), window, error)) {
    AddIssue(report, entry_path + ".percepts", error);
  }
}

} // namespace

bool ParseWindowTableJson(std::string_view json_text, WindowTable& table,
                          TableConfigReport& report, std::string& error) {
  report = TableConfigReport{};
  error.clear();

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(report, "$", parse_error);
    return true;
  }
  if (!root.IsObject()) {
    AddIssue(report, "$", "table document must be a JSON object");
    return true;
  }
  CheckKnownKeys(root, {"schema_version", "entries"}, "", report);

  const JsonValue* version = core::json::FindMember(root, "schema_version");
  if (version != nullptr &&
      (!version->IsString() || version->string_value != kTableSchemaVersion)) {
    AddIssue(report, "schema_version",
             "unsupported schema version (expected \"" + std::string(kTableSchemaVersion) + "\")");
  }

  WindowTable built;
  const JsonValue* entries = core::json::FindMember(root, "entries");
  if (entries == nullptr) {
    AddIssue(report, "entries", "is required");
  } else if (!entries->IsArray()) {
    AddIssue(report, "entries", "must be an array");
  } else if (entries->array_value.empty()) {
    AddIssue(report, "entries", "must contain at least one entry");
  } else {
    for (std::size_t i = 0; i < entries->array_value.size(); ++i) {
      ParseEntry(entries->array_value[i], i, built, report);
    }
  }

  report.valid = report.issues.empty();
  if (report.valid) {
    table = std::move(built);
  }
  return true;
}

bool LoadWindowTableFile(const fs::path& path, WindowTable& table, TableConfigReport& report,
                         std::string& error) {
  report = TableConfigReport{};
  error.clear();

  if (path.empty()) {
    error = "table path cannot be empty";
    return false;
  }

  std::error_code ec;
  if (!fs::exists(path, ec) || ec) {
    error = "table file not found: " + path.string();
    return false;
  }
  if (!fs::is_regular_file(path, ec) || ec) {
    error = "table path must point to a regular file: " + path.string();
    return false;
  }

  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to open table file: " + path.string();
    return false;
  }
  const std::string text((std::istreambuf_iterator<char>(input)),
                         std::istreambuf_iterator<char>());
  if (input.bad()) {
    error = "failed while reading table file: " + path.string();
    return false;
  }

  return ParseWindowTableJson(text, table, report, error);
}

} // namespace agentcore::envs::weather
