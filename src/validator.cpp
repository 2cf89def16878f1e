#include "trialbox/validator.hpp"

#include <system_error>

#include "trialbox/attempt.hpp"
#include "trialbox/interrupt.hpp"
#include "trialbox/observability.hpp"
#include "trialbox/taxonomy.hpp"

namespace fs = std::filesystem;

namespace trialbox {

namespace {

constexpr int kNoTestsCollectedExit = 5;

void check_interrupt(Stage next) {
  if (interrupt_requested()) {
    throw InterruptedError("interrupted before " + to_string(next));
  }
}

struct StageOutput {
  std::string stdout_path;
  std::string stderr_path;
};

// Records a finished stage. Returns false when the pipeline must stop.
bool record_stage(AttemptLedger& ledger, Stage stage, int exit_code) {
  ledger.set_exit_code(exit_code);
  auto reason = classify(stage, exit_code);
  if (stage == Stage::baseline_run && !reason && exit_code == kNoTestsCollectedExit) {
    reason = FailureReason::no_tests_collected;
  }
  if (!reason) return true;
  ledger.set_failure_reason(*reason);
  ledger.set_outcome(false);
  log_info("validator", to_string(stage) + " -> " + to_string(*reason) + " (exit " +
                            std::to_string(exit_code) + ")");
  return false;
}

void run_stages(const TaskSpec& task, const fs::path& workspace_dir, const fs::path& logs_dir,
                StageExecutor& executor, AttemptLedger& ledger, StageOutput& last) {
  std::error_code ec;
  const fs::path repo_dir = workspace_dir / "repo";
  fs::create_directories(repo_dir, ec);
  fs::create_directories(logs_dir, ec);
  if (ec) {
    throw Error(ErrorCode::io_error, "cannot create " + logs_dir.string() + ": " + ec.message());
  }

  check_interrupt(Stage::git_clone);
  ledger.mark_stage(Stage::git_clone);
  const CommandResult cloned = executor.clone(task.repo.url, repo_dir, logs_dir);
  ledger.add_artifact("clone_stdout", cloned.stdout_path);
  ledger.add_artifact("clone_stderr", cloned.stderr_path);
  last = {cloned.stdout_path, cloned.stderr_path};
  if (!record_stage(ledger, Stage::git_clone, cloned.exit_code)) return;

  check_interrupt(Stage::git_checkout);
  ledger.mark_stage(Stage::git_checkout);
  const CommandResult checked = executor.checkout(repo_dir, task.repo.commit, logs_dir);
  ledger.add_artifact("checkout_stdout", checked.stdout_path);
  ledger.add_artifact("checkout_stderr", checked.stderr_path);
  last = {checked.stdout_path, checked.stderr_path};
  if (!record_stage(ledger, Stage::git_checkout, checked.exit_code)) return;

  check_interrupt(Stage::setup);
  ledger.mark_stage(Stage::setup);
  const SandboxRunResult setup = executor.run_sandboxed(
      task, workspace_dir, build_setup_command(task), NetworkMode::bridge,
      logs_dir / "setup_stdout.txt", logs_dir / "setup_stderr.txt");
  ledger.add_artifact("setup_stdout", setup.stdout_path);
  ledger.add_artifact("setup_stderr", setup.stderr_path);
  last = {setup.stdout_path, setup.stderr_path};
  if (!record_stage(ledger, Stage::setup, setup.exit_code)) return;

  check_interrupt(Stage::baseline_run);
  ledger.mark_stage(Stage::baseline_run);
  const SandboxRunResult run = executor.run_sandboxed(
      task, workspace_dir, build_run_command(task), NetworkMode::none,
      logs_dir / "run_stdout.txt", logs_dir / "run_stderr.txt");
  ledger.add_artifact("run_stdout", run.stdout_path);
  ledger.add_artifact("run_stderr", run.stderr_path);
  last = {run.stdout_path, run.stderr_path};
  if (!record_stage(ledger, Stage::baseline_run, run.exit_code)) return;

  ledger.set_outcome(true);
}

}  // namespace

CommandResult LocalStageExecutor::clone(const std::string& url, const fs::path& dest,
                                        const fs::path& logs_dir) {
  return clone_repo(url, dest, logs_dir);
}

CommandResult LocalStageExecutor::checkout(const fs::path& repo_dir, const std::string& commit,
                                           const fs::path& logs_dir) {
  return checkout_commit(repo_dir, commit, logs_dir);
}

SandboxRunResult LocalStageExecutor::run_sandboxed(const TaskSpec& task, const fs::path& workspace,
                                                   const std::string& command, NetworkMode network,
                                                   const fs::path& stdout_path,
                                                   const fs::path& stderr_path) {
  const ContainerSandbox sandbox(task.environment.docker_image, task.environment.workdir, config_);
  return sandbox.run(workspace, command, network, task.environment.timeout_sec, stdout_path,
                     stderr_path);
}

std::string build_setup_command(const TaskSpec& task) {
  std::string cmd = "cd repo";
  for (const auto& c : task.setup_commands) cmd += " && " + c;
  return cmd;
}

std::string build_run_command(const TaskSpec& task) { return "cd repo && " + task.run_command; }

ValidationResult validate_baseline(const TaskSpec& task, const fs::path& workspace_dir,
                                   const fs::path& logs_dir, StageExecutor& executor,
                                   const std::string& variant) {
  log_info("validator", "validating " + task.id + " (" + task.repo.url + "@" + task.repo.commit + ")");

  AttemptLedger ledger(task, logs_dir, variant);
  StageOutput last;
  run_attempt(ledger, [&] {
    try {
      run_stages(task, workspace_dir, logs_dir, executor, ledger, last);
    } catch (const Error& e) {
      // Infrastructure faults get a specific reason; the ledger still rethrows.
      if (e.code() == ErrorCode::sandbox_error || e.code() == ErrorCode::workspace_missing) {
        ledger.classify_failure(FailureReason::sandbox_error);
      }
      throw;
    }
  });

  ValidationResult result;
  result.task_id = task.id;
  result.valid = ledger.passed();
  result.exit_code = ledger.exit_code().value_or(-1);
  result.stdout_path = last.stdout_path;
  result.stderr_path = last.stderr_path;
  if (auto reason = ledger.failure_reason()) result.error_reason = validation_reason(*reason);
  result.duration_sec = ledger.duration_sec();

  log_info("validator", task.id + ": " + (result.valid ? "VALID" : "INVALID") +
                            (result.error_reason ? " (" + *result.error_reason + ")" : ""));
  return result;
}

}  // namespace trialbox
