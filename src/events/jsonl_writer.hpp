#pragma once

#include "events/event_model.hpp"

#include <filesystem>
#include <string>

namespace agentcore::events {

inline constexpr const char* kDecisionTraceFileName = "decisions.jsonl";

// Appends one JSON-serialized event as a single line to
// `<output_dir>/decisions.jsonl`.
//
// Contract:
// - Creates `output_dir` if needed.
// - Writes exactly one line per call, in append mode.
// - Returns false with `error` populated on failure.
bool AppendEventJsonl(const Event& event, const std::filesystem::path& output_dir,
                      std::filesystem::path& written_path, std::string& error);

} // namespace agentcore::events
