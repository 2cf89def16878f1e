#pragma once

// trialbox/suite.hpp - Single-task and whole-suite baseline runs.
//
// LAYOUT:
//   run_task:  <out>/runs/<timestamp>__<run_id>/
//                task/<task.yaml>  logs/  workspace/repo/  run.json
//                attempts.jsonl
//   run_suite: <out>/runs/<timestamp>__<suite>__baseline/
//                <task_id>/        (logs)   <task_id>/workspace/repo/
//                attempts.jsonl    run.json
//
// FAULT POLICY:
//   run_task propagates everything. A git or setup stage failure is raised as
//   Error(stage_failed) once run.json is on disk.
//   run_suite never lets one task abort the suite. A fault is recorded as an
//   invalid task (sandbox errors as "sandbox_error", the rest as "unknown")
//   and the loop continues. An interrupt finalizes the in-flight attempt,
//   stops the loop and marks the summary interrupted; the tasks never started
//   are reported as not_attempted.

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "trialbox/taxonomy.hpp"
#include "trialbox/types.hpp"
#include "trialbox/validator.hpp"

namespace trialbox {

// Directory name for a task id: '/', '\' and '%' are written as %2F, %5C
// and %25, and "", "." and ".." get escaped forms, so distinct ids never
// share a directory and none leaves the run dir.
std::string task_dir_name(const std::string& id);

std::filesystem::path run_task(const std::filesystem::path& task_yaml,
                               const std::filesystem::path& out_dir,
                               StageExecutor& executor);

struct SuiteSummary {
  std::string run_id;
  std::string suite;
  std::filesystem::path run_dir;
  std::string started_at;
  std::string ended_at;
  size_t task_count{0};
  size_t valid_count{0};
  size_t invalid_count{0};
  size_t not_attempted{0};
  bool interrupted{false};
  std::vector<ValidationResult> results;
  std::map<std::string, size_t> failure_counts;  // wire name -> tasks
  std::optional<FailureReason> dominant_failure;
  // task id -> log file name -> BLAKE3 hex
  std::map<std::string, std::map<std::string, std::string>> artifact_digests;

  jsonlite::Object to_json() const;
};

// std::nullopt when the suite has no loadable tasks. Throws
// Error(suite_not_found) when <tasks_root>/<suite> does not exist.
std::optional<SuiteSummary> run_suite(const std::string& suite,
                                      const std::filesystem::path& tasks_root,
                                      const std::filesystem::path& out_dir,
                                      StageExecutor& executor);

}  // namespace trialbox
