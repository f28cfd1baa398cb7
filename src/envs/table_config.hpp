#pragma once

#include "envs/weather.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace agentcore::envs::weather {

inline constexpr std::string_view kTableSchemaVersion = "1.0";

struct TableConfigIssue {
  std::string path;
  std::string message;
};

struct TableConfigReport {
  bool valid = false;
  std::vector<TableConfigIssue> issues;
};

// Parses a window decision table document:
//
//   {
//     "schema_version": "1.0",
//     "entries": [
//       {"percepts": ["sunny"], "action": "open"},
//       {"percepts": ["sunny", "rainy"], "action": "close"}
//     ]
//   }
//
// Contract:
// - Returns true when the document was examined; `report.valid` says whether
//   it is usable. Every problem found is listed, not just the first.
// - `table` is replaced only when `report.valid` is true.
// - Returns false only for failures outside validation; `error` says why.
bool ParseWindowTableJson(std::string_view json_text, WindowTable& table,
                          TableConfigReport& report, std::string& error);

// Reads `path` and forwards to ParseWindowTableJson. Returns false with
// `error` set when the file is missing, not a regular file, or unreadable.
bool LoadWindowTableFile(const std::filesystem::path& path, WindowTable& table,
                         TableConfigReport& report, std::string& error);

} // namespace agentcore::envs::weather
