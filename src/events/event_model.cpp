#include "events/event_model.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace agentcore::events {

namespace {

void AppendEscaped(std::ostringstream& out, std::string_view input) {
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
    }
  }
}

std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
#if defined(_WIN32)
  if (gmtime_s(&utc_time, &epoch_seconds) != 0) {
    return "";
  }
#else
  if (gmtime_r(&epoch_seconds, &utc_time) == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

} // namespace

std::string ToJson(EventType event_type) {
  switch (event_type) {
  case EventType::kAgentStarted:
    return "AGENT_STARTED";
  case EventType::kDecisionMade:
    return "DECISION_MADE";
  case EventType::kDecisionFailed:
    return "DECISION_FAILED";
  case EventType::kAgentStopped:
    return "AGENT_STOPPED";
  }

  return "unknown";
}

std::string ToJson(const Event& event) {
  std::ostringstream out;
  out << "{\"ts_utc\":\"" << FormatUtcTimestamp(event.ts) << "\",\"type\":\""
      << ToJson(event.type) << "\",\"payload\":{";

  bool first = true;
  for (const auto& [key, value] : event.payload) {
    if (!first) {
      out << ',';
    }
    out << '"';
    AppendEscaped(out, key);
    out << "\":\"";
    AppendEscaped(out, value);
    out << '"';
    first = false;
  }

  out << "}}";
  return out.str();
}

} // namespace agentcore::events
