#pragma once

// trialbox/validator.hpp - Baseline validation of one task.
//
// STAGES:
//   git_clone -> git_checkout -> setup -> run -> done
//   Each stage's exit code goes to the open AttemptLedger and through
//   classify(). The first failing stage sets the reason, marks the attempt
//   invalid and stops the pipeline; later stages are never attempted.
//
//   At `run` the meaning flips: exit 0 means the tests already pass before
//   any fix, so the task is invalid (baseline_passed). A nonzero exit other
//   than a timeout (124/137) or "no tests collected" (5) is a valid baseline.
//
// NETWORK:
//   setup runs on `bridge` (dependency installs), run on `none`.
//
// SEAM:
//   StageExecutor is the only place stages touch the outside world.
//   LocalStageExecutor uses host git and ContainerSandbox; tests script it.

#include <filesystem>
#include <string>

#include "trialbox/git.hpp"
#include "trialbox/sandbox.hpp"
#include "trialbox/types.hpp"

namespace trialbox {

class StageExecutor {
 public:
  virtual ~StageExecutor() = default;

  virtual CommandResult clone(const std::string& url, const std::filesystem::path& dest,
                              const std::filesystem::path& logs_dir) = 0;

  virtual CommandResult checkout(const std::filesystem::path& repo_dir, const std::string& commit,
                                 const std::filesystem::path& logs_dir) = 0;

  virtual SandboxRunResult run_sandboxed(const TaskSpec& task,
                                         const std::filesystem::path& workspace,
                                         const std::string& command, NetworkMode network,
                                         const std::filesystem::path& stdout_path,
                                         const std::filesystem::path& stderr_path) = 0;
};

class LocalStageExecutor : public StageExecutor {
 public:
  explicit LocalStageExecutor(SandboxConfig config = SandboxConfig::from_env())
      : config_(std::move(config)) {}

  CommandResult clone(const std::string& url, const std::filesystem::path& dest,
                      const std::filesystem::path& logs_dir) override;

  CommandResult checkout(const std::filesystem::path& repo_dir, const std::string& commit,
                         const std::filesystem::path& logs_dir) override;

  SandboxRunResult run_sandboxed(const TaskSpec& task, const std::filesystem::path& workspace,
                                 const std::string& command, NetworkMode network,
                                 const std::filesystem::path& stdout_path,
                                 const std::filesystem::path& stderr_path) override;

 private:
  SandboxConfig config_;
};

// "cd repo && <cmd1> && <cmd2> ..." ("cd repo" alone when there are none).
std::string build_setup_command(const TaskSpec& task);
std::string build_run_command(const TaskSpec& task);

// Runs the stage pipeline under one AttemptLedger rooted at logs_dir, so the
// attempt is appended to <logs_dir>/../attempts.jsonl. Faults (sandbox
// errors, interrupts) propagate after the ledger has recorded them.
ValidationResult validate_baseline(const TaskSpec& task,
                                   const std::filesystem::path& workspace_dir,
                                   const std::filesystem::path& logs_dir,
                                   StageExecutor& executor,
                                   const std::string& variant = "baseline");

}  // namespace trialbox
