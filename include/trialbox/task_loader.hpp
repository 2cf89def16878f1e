#pragma once

// trialbox/task_loader.hpp - task.yaml loading and suite discovery (yaml-cpp).
//
// Structure (keys mandatory unless noted):
//   id: str, suite: str
//   repo:        { url: str, commit: str }
//   environment: { docker_image: str, workdir: str, timeout_sec: int }
//   setup:       { commands: [str, ...] }
//   run:         { command: str }
//   agent:       { entrypoint: str, max_steps: int, script: str }  (optional
//                section; script optional within it)
//
// Errors name the file and the dotted key path:
//   Error(invalid_task)     "Invalid task YAML <path>: Missing key: repo.url"
//   Error(suite_not_found)  "Suite directory not found: <dir>"

#include <filesystem>
#include <string>
#include <vector>

#include "trialbox/types.hpp"

namespace trialbox {

TaskSpec load_task(const std::filesystem::path& yaml_path);

// Sorted <suite_dir>/*/task.yaml.
std::vector<std::filesystem::path> discover_tasks(const std::filesystem::path& suite_dir);

// Loads every task of <tasks_root>/<suite>. Invalid tasks are skipped with a
// warning; other faults propagate.
std::vector<TaskSpec> load_suite(const std::filesystem::path& tasks_root, const std::string& suite);

}  // namespace trialbox
