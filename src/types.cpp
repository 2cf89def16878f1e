#include "trialbox/types.hpp"

#include <cstdio>
#include <ctime>

namespace trialbox {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::path_escape: return "path_escape";
    case ErrorCode::symlink_blocked: return "symlink_blocked";
    case ErrorCode::file_not_found: return "file_not_found";
    case ErrorCode::binary_file: return "binary_file";
    case ErrorCode::patch_hunk_fail: return "patch_hunk_fail";
    case ErrorCode::patch_parse_error: return "patch_parse_error";
    case ErrorCode::sandbox_error: return "sandbox_error";
    case ErrorCode::invalid_network: return "invalid_network";
    case ErrorCode::workspace_missing: return "workspace_missing";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::timeout: return "timeout";
    case ErrorCode::io_error: return "io_error";
    case ErrorCode::invalid_task: return "invalid_task";
    case ErrorCode::suite_not_found: return "suite_not_found";
    case ErrorCode::config_error: return "config_error";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::interrupted: return "interrupted";
    case ErrorCode::stage_failed: return "stage_failed";
  }
  return "";
}

Error::Error(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

std::string to_string(ToolName tool) {
  switch (tool) {
    case ToolName::list_files: return "list_files";
    case ToolName::read_file: return "read_file";
    case ToolName::search: return "search";
    case ToolName::apply_patch: return "apply_patch";
    case ToolName::run: return "run";
  }
  return "";
}

ToolName tool_from_string(const std::string& name) {
  for (const ToolName t : {ToolName::list_files, ToolName::read_file, ToolName::search,
                           ToolName::apply_patch, ToolName::run}) {
    if (to_string(t) == name) return t;
  }
  throw Error(ErrorCode::config_error, "Unknown tool: '" + name + "'");
}

std::string to_string(ToolStatus status) {
  return status == ToolStatus::success ? "success" : "error";
}

jsonlite::Object ValidationResult::to_json() const {
  jsonlite::Object o;
  o["task_id"] = task_id;
  o["valid"] = valid;
  o["exit_code"] = exit_code;
  o["stdout_path"] = stdout_path;
  o["stderr_path"] = stderr_path;
  o["error_reason"] = error_reason ? jsonlite::Value{*error_reason} : jsonlite::Value{nullptr};
  o["duration_sec"] = duration_sec;
  return o;
}

jsonlite::Object ToolError::to_json() const {
  jsonlite::Object o;
  o["error_type"] = error_type;
  o["message"] = message;
  o["details"] = details;
  return o;
}

jsonlite::Object ToolResult::to_json() const {
  auto opt_str = [](const std::optional<std::string>& s) {
    return s ? jsonlite::Value{*s} : jsonlite::Value{nullptr};
  };
  jsonlite::Object o;
  o["request_id"] = request_id;
  o["tool"] = to_string(tool);
  o["status"] = to_string(status);
  o["started_at"] = started_at;
  o["ended_at"] = ended_at;
  o["duration_sec"] = duration_sec;
  o["data"] = data ? jsonlite::Value{*data} : jsonlite::Value{nullptr};
  o["error"] = error ? jsonlite::Value{error->to_json()} : jsonlite::Value{nullptr};
  o["exit_code"] = exit_code ? jsonlite::Value{*exit_code} : jsonlite::Value{nullptr};
  o["stdout_path"] = opt_str(stdout_path);
  o["stderr_path"] = opt_str(stderr_path);
  return o;
}

std::string format_utc(WallClock::time_point tp) {
  const auto since_epoch = tp.time_since_epoch();
  const auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
  const auto micros =
      std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - secs).count();
  const std::time_t t = static_cast<std::time_t>(secs.count());
  std::tm tm{};
  gmtime_r(&t, &tm);
  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);
  char out[48];
  std::snprintf(out, sizeof(out), "%s.%06lldZ", date, static_cast<long long>(micros));
  return out;
}

std::string format_run_timestamp(WallClock::time_point tp) {
  const std::time_t t = WallClock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d_%H-%M-%S", &tm);
  return buf;
}

double seconds_between(WallClock::time_point start, WallClock::time_point end) {
  return std::chrono::duration<double>(end - start).count();
}

}  // namespace trialbox
