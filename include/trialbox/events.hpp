#pragma once

// trialbox/events.hpp - Per-run event stream (events.jsonl).
//
// Each event is one line:
//   {"event_type", "timestamp", "run_id", "step_id", "payload"}
// step_id counts from 1 and increases by one per event of the run. Lines are
// written through append_record(), so a failed write is logged and dropped;
// it never interrupts the run being described.

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "trialbox/jsonlite.hpp"
#include "trialbox/types.hpp"

namespace trialbox {

enum class EventType {
  tool_call_started,
  tool_call_finished,
  agent_turn_started,
  agent_turn_finished,
  patch_applied,
  tests_started,
  tests_finished,
  task_started,
  task_finished,
};

std::string to_string(EventType type);

class EventLogger {
 public:
  EventLogger(std::string run_id, std::filesystem::path events_file);

  // Returns the step id assigned to the event.
  int log(EventType type, jsonlite::Object payload);

  int log_tool_started(const std::string& request_id, ToolName tool, jsonlite::Object params);
  int log_tool_finished(const ToolResult& result);
  int log_agent_turn_started();
  int log_agent_turn_finished(const std::string& stopped_reason);
  int log_patch_applied(int step_id, const std::vector<std::string>& changed_files,
                        const std::string& patch_artifact_path);
  int log_tests_started(const std::string& command);
  int log_tests_finished(int exit_code, bool passed,
                         const std::optional<std::string>& stdout_path = std::nullopt,
                         const std::optional<std::string>& stderr_path = std::nullopt);
  int log_task_started(const std::string& task_id);
  int log_task_finished(const std::string& task_id, bool passed);

  const std::string& run_id() const { return run_id_; }
  const std::filesystem::path& events_file() const { return events_file_; }
  int last_step_id() const { return step_counter_; }

 private:
  std::string run_id_;
  std::filesystem::path events_file_;
  int step_counter_{0};
};

}  // namespace trialbox
