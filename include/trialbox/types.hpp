#pragma once

// trialbox/types.hpp - Core data structures shared by every harness module.
//
// ERROR REPORTING:
//   - Leaf modules (path_guard, patch, run_process) never throw. They return
//     result structs carrying an ErrorCode whose to_string() is the stable
//     discriminator written to disk.
//   - Orchestration boundaries throw trialbox::Error. The only component that
//     turns a fault into a recorded outcome is AttemptLedger, and it rethrows.
//
// MEMORY OWNERSHIP:
//   - All members are value-owned. TaskSpec is loaded once and passed by
//     const reference; nothing mutates it after load.

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "trialbox/jsonlite.hpp"

namespace trialbox {

enum class ErrorCode {
  none,
  path_escape,
  symlink_blocked,
  file_not_found,
  binary_file,
  patch_hunk_fail,
  patch_parse_error,
  sandbox_error,
  invalid_network,
  workspace_missing,
  spawn_failed,
  timeout,
  io_error,
  invalid_task,
  suite_not_found,
  config_error,
  json_parse_error,
  interrupted,
  stage_failed,
};

std::string to_string(ErrorCode code);

// The exception type raised at orchestration boundaries.
class Error : public std::runtime_error {
 public:
  Error(ErrorCode code, const std::string& message);

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

// Raised when the user interrupts the process (SIGINT/SIGTERM observed).
class InterruptedError : public Error {
 public:
  explicit InterruptedError(const std::string& message = "interrupted by user")
      : Error(ErrorCode::interrupted, message) {}
};

// ---------------------------------------------------------------------------
// TaskSpec - one benchmark task, as declared in task.yaml.
// ---------------------------------------------------------------------------
struct RepoSpec {
  std::string url;
  std::string commit;
};

struct EnvironmentSpec {
  std::string docker_image;
  std::string workdir{"/workspace"};
  int timeout_sec{600};
};

// Optional `agent:` section. `script` is read by the scripted agent and is
// relative to the directory holding task.yaml.
struct AgentSpec {
  std::string entrypoint{"scripted"};
  int max_steps{20};
  std::string script;
};

struct TaskSpec {
  std::string id;
  std::string suite;
  RepoSpec repo;
  EnvironmentSpec environment;
  std::vector<std::string> setup_commands;  // run in order, joined with " && "
  std::string run_command;
  std::string source_path;                  // task.yaml this spec was loaded from
  std::optional<AgentSpec> agent;
};

// ---------------------------------------------------------------------------
// ValidationResult - outcome of one baseline validation.
// ---------------------------------------------------------------------------
// valid is true iff the pre-fix run fails as expected. error_reason is the
// lower-snake reason ("baseline_passed", "setup_failed", ...) or empty.
struct ValidationResult {
  std::string task_id;
  bool valid{false};
  int exit_code{-1};
  std::string stdout_path;
  std::string stderr_path;
  std::optional<std::string> error_reason;
  double duration_sec{0.0};

  jsonlite::Object to_json() const;
};

// ---------------------------------------------------------------------------
// Tool contract
// ---------------------------------------------------------------------------
enum class ToolName { list_files, read_file, search, apply_patch, run };
std::string to_string(ToolName tool);
// Throws Error(config_error) for an unknown tool name.
ToolName tool_from_string(const std::string& name);

enum class ToolStatus { success, error };
std::string to_string(ToolStatus status);

struct ToolError {
  std::string error_type;  // to_string(ErrorCode) or "abnormal_exit"
  std::string message;
  jsonlite::Object details;

  jsonlite::Object to_json() const;
};

struct ToolResult {
  std::string request_id;
  ToolName tool{ToolName::run};
  ToolStatus status{ToolStatus::success};
  std::string started_at;
  std::string ended_at;
  double duration_sec{0.0};
  std::optional<jsonlite::Object> data;
  std::optional<ToolError> error;
  std::optional<int> exit_code;
  std::optional<std::string> stdout_path;
  std::optional<std::string> stderr_path;

  bool ok() const { return status == ToolStatus::success; }
  jsonlite::Object to_json() const;
};

// ---------------------------------------------------------------------------
// Time helpers
// ---------------------------------------------------------------------------
using WallClock = std::chrono::system_clock;

// ISO-8601 UTC with microseconds, e.g. "2026-01-02T03:04:05.000006Z".
std::string format_utc(WallClock::time_point tp);

// Directory-friendly local timestamp, "%Y-%m-%d_%H-%M-%S".
std::string format_run_timestamp(WallClock::time_point tp);

double seconds_between(WallClock::time_point start, WallClock::time_point end);

}  // namespace trialbox
