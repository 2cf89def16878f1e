#pragma once

// trialbox/observability.hpp - Harness logging and counters.
//
// DESIGN:
//   Every log line goes to stderr as "[component] LEVEL: message". When
//   TRIALBOX_EVENT_LOG is set, each entry is also appended to that file as one
//   JSON object per line (fopen "a"; O_APPEND keeps short lines whole).
//   TRIALBOX_LOG_LEVEL (debug|info|warn|error|critical, default info) sets the
//   minimum level. Both are read once, on first use.
//
// INVARIANT:
//   Logging never throws. A failed sink write is dropped, never reported to
//   the caller, because a log fault must not abort the attempt being logged.

#include <atomic>
#include <cstdint>
#include <string>

namespace trialbox {

enum class LogLevel { debug, info, warn, error, critical };

std::string to_string(LogLevel level);

// Parses a level name. Unknown names fall back to info.
LogLevel parse_log_level(const std::string& name);

void log_message(LogLevel level, const std::string& component, const std::string& message);

inline void log_debug(const std::string& component, const std::string& message) {
  log_message(LogLevel::debug, component, message);
}
inline void log_info(const std::string& component, const std::string& message) {
  log_message(LogLevel::info, component, message);
}
inline void log_warn(const std::string& component, const std::string& message) {
  log_message(LogLevel::warn, component, message);
}
inline void log_error(const std::string& component, const std::string& message) {
  log_message(LogLevel::error, component, message);
}
inline void log_critical(const std::string& component, const std::string& message) {
  log_message(LogLevel::critical, component, message);
}

// Overrides the environment-derived minimum level (tests, --verbose).
void set_min_log_level(LogLevel level);

// ---------------------------------------------------------------------------
// HarnessStats - process-wide counters, exposed by `trialbox health`.
// ---------------------------------------------------------------------------
class HarnessStats {
 public:
  std::string to_json() const;

  alignas(64) std::atomic<uint64_t> attempts_recorded{0};
  alignas(64) std::atomic<uint64_t> append_failures{0};
  alignas(64) std::atomic<uint64_t> tool_calls{0};
  alignas(64) std::atomic<uint64_t> tool_errors{0};
  alignas(64) std::atomic<uint64_t> sandbox_runs{0};
  alignas(64) std::atomic<uint64_t> sandbox_timeouts{0};
};

HarnessStats& global_harness_stats();

}  // namespace trialbox
