#include "trialbox/events.hpp"

#include "trialbox/jsonl.hpp"
#include "trialbox/observability.hpp"

namespace fs = std::filesystem;

namespace trialbox {

namespace {

jsonlite::Value opt_path(const std::optional<std::string>& p) {
  return p ? jsonlite::Value(*p) : jsonlite::Value(nullptr);
}

}  // namespace

std::string to_string(EventType type) {
  switch (type) {
    case EventType::tool_call_started: return "tool_call_started";
    case EventType::tool_call_finished: return "tool_call_finished";
    case EventType::agent_turn_started: return "agent_turn_started";
    case EventType::agent_turn_finished: return "agent_turn_finished";
    case EventType::patch_applied: return "patch_applied";
    case EventType::tests_started: return "tests_started";
    case EventType::tests_finished: return "tests_finished";
    case EventType::task_started: return "task_started";
    case EventType::task_finished: return "task_finished";
  }
  return "";
}

EventLogger::EventLogger(std::string run_id, fs::path events_file)
    : run_id_(std::move(run_id)), events_file_(std::move(events_file)) {
  log_debug("events", "logger for run " + run_id_ + " writing to " + events_file_.string());
}

int EventLogger::log(EventType type, jsonlite::Object payload) {
  const int step = ++step_counter_;
  const jsonlite::Object event{
      {"event_type", to_string(type)},
      {"timestamp", format_utc(WallClock::now())},
      {"run_id", run_id_},
      {"step_id", step},
      {"payload", std::move(payload)},
  };
  if (!append_record(events_file_, event)) {
    log_error("events", "dropped " + to_string(type) + " (step " + std::to_string(step) + ")");
  }
  return step;
}

int EventLogger::log_tool_started(const std::string& request_id, ToolName tool,
                                  jsonlite::Object params) {
  return log(EventType::tool_call_started, jsonlite::Object{
                                               {"request_id", request_id},
                                               {"tool", to_string(tool)},
                                               {"params", std::move(params)},
                                           });
}

int EventLogger::log_tool_finished(const ToolResult& result) {
  jsonlite::Object payload{
      {"request_id", result.request_id},
      {"tool", to_string(result.tool)},
      {"status", to_string(result.status)},
      {"duration_sec", result.duration_sec},
  };
  if (result.error) payload["error"] = result.error->to_json();
  return log(EventType::tool_call_finished, std::move(payload));
}

int EventLogger::log_agent_turn_started() {
  return log(EventType::agent_turn_started, jsonlite::Object{});
}

int EventLogger::log_agent_turn_finished(const std::string& stopped_reason) {
  return log(EventType::agent_turn_finished, jsonlite::Object{{"stopped_reason", stopped_reason}});
}

int EventLogger::log_patch_applied(int step_id, const std::vector<std::string>& changed_files,
                                   const std::string& patch_artifact_path) {
  jsonlite::Array files;
  for (const auto& f : changed_files) files.emplace_back(f);
  return log(EventType::patch_applied, jsonlite::Object{
                                           {"step_id", step_id},
                                           {"changed_files", std::move(files)},
                                           {"patch_artifact_path", patch_artifact_path},
                                       });
}

int EventLogger::log_tests_started(const std::string& command) {
  return log(EventType::tests_started, jsonlite::Object{{"command", command}});
}

int EventLogger::log_tests_finished(int exit_code, bool passed,
                                    const std::optional<std::string>& stdout_path,
                                    const std::optional<std::string>& stderr_path) {
  return log(EventType::tests_finished, jsonlite::Object{
                                            {"exit_code", exit_code},
                                            {"passed", passed},
                                            {"stdout_path", opt_path(stdout_path)},
                                            {"stderr_path", opt_path(stderr_path)},
                                        });
}

int EventLogger::log_task_started(const std::string& task_id) {
  return log(EventType::task_started, jsonlite::Object{{"task_id", task_id}});
}

int EventLogger::log_task_finished(const std::string& task_id, bool passed) {
  return log(EventType::task_finished, jsonlite::Object{{"task_id", task_id}, {"passed", passed}});
}

}  // namespace trialbox
