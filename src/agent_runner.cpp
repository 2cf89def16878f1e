#include "trialbox/agent_runner.hpp"

#include <system_error>

#include "trialbox/events.hpp"
#include "trialbox/fs_util.hpp"
#include "trialbox/interrupt.hpp"
#include "trialbox/observability.hpp"
#include "trialbox/task_loader.hpp"
#include "trialbox/taxonomy.hpp"
#include "trialbox/tools.hpp"
#include "trialbox/version.hpp"

namespace fs = std::filesystem;

namespace trialbox {

namespace {

fs::path make_dir(const fs::path& p) {
  std::error_code ec;
  fs::create_directories(p, ec);
  if (ec) throw Error(ErrorCode::io_error, "cannot create " + p.string() + ": " + ec.message());
  return p;
}

std::string failing_output_of(const ValidationResult& baseline) {
  if (baseline.stderr_path.empty()) return {};
  const auto bytes = read_file_bytes(baseline.stderr_path);
  if (!bytes) return {};
  return truncate_output(*bytes).first;
}

std::optional<FailureReason> final_reason(int exit_code, const AgentResult& agent) {
  auto reason = classify(Stage::final_test, exit_code);
  if (reason != FailureReason::tests_failed) return reason;
  if (agent.stopped_reason == "tool_error") return FailureReason::tool_error;
  if (agent.stopped_reason == "max_steps" || agent.stopped_reason == "script_exhausted") {
    return FailureReason::agent_gave_up;
  }
  return reason;
}

std::string join(const std::vector<std::string>& items, const char* sep) {
  std::string out;
  for (const auto& s : items) {
    if (!out.empty()) out += sep;
    out += s;
  }
  return out;
}

}  // namespace

jsonlite::Object AgentAttempt::to_json() const {
  return jsonlite::Object{
      {"run_id", record.run_id},
      {"task_id", record.task_id},
      {"variant", record.variant},
      {"passed", record.result.passed},
      {"failure_reason", record.result.failure_reason
                             ? jsonlite::Value(to_string(*record.result.failure_reason))
                             : jsonlite::Value(nullptr)},
      {"baseline", baseline.to_json()},
      {"agent", agent_ran ? jsonlite::Value(agent.to_json()) : jsonlite::Value(nullptr)},
      {"artifacts_dir", artifacts_dir.string()},
      {"events_file", events_file.string()},
      {"attempt", record.to_json()},
      {"harness_version", version::HARNESS_SEMVER},
  };
}

AgentAttempt run_agent_attempt(const TaskSpec& task, const fs::path& workspace_dir,
                               const fs::path& artifacts_dir, StageExecutor& executor,
                               Agent& agent, SandboxConfig config) {
  const fs::path logs_dir = make_dir(artifacts_dir / "logs");
  AgentAttempt out;
  out.artifacts_dir = artifacts_dir;
  out.events_file = artifacts_dir / "events.jsonl";

  AttemptLedger ledger(task, logs_dir, agent.name());
  ledger.set_baseline(BaselineValidation{});
  log_info("agent_runner", "agent attempt " + ledger.run_id() + " for " + task.id + " (" +
                               agent.name() + ")");

  run_attempt(ledger, [&] {
    try {
      out.baseline = validate_baseline(task, workspace_dir, artifacts_dir / "baseline", executor);
    } catch (const Error& e) {
      if (e.code() == ErrorCode::sandbox_error || e.code() == ErrorCode::workspace_missing) {
        ledger.classify_failure(FailureReason::sandbox_error);
      }
      throw;
    }
    ledger.set_baseline(BaselineValidation{true, out.baseline.valid, out.baseline.exit_code});
    if (!out.baseline.valid) {
      ledger.set_exit_code(out.baseline.exit_code);
      const auto reason = out.baseline.error_reason
                              ? reason_from_validation(*out.baseline.error_reason)
                              : std::nullopt;
      ledger.set_failure_reason(reason.value_or(FailureReason::unknown));
      ledger.set_outcome(false);
      log_warn("agent_runner", task.id + ": baseline invalid, agent not started");
      return;
    }

    if (interrupt_requested()) throw InterruptedError("interrupted before agent_run");
    ledger.mark_stage(Stage::agent_run);
    EventLogger events(ledger.run_id(), out.events_file);
    ledger.add_artifact("events", out.events_file.string());
    events.log_task_started(task.id);

    const ContainerSandbox sandbox(task.environment.docker_image, task.environment.workdir, config);
    const AgentContext ctx{task, sandbox, workspace_dir / "repo", artifacts_dir,
                           failing_output_of(out.baseline), events};
    out.agent = agent.run(ctx);
    out.agent_ran = true;
    ledger.add_artifact("patch_files", join(out.agent.patch_files, ","));

    if (interrupt_requested()) throw InterruptedError("interrupted before final_test");
    ledger.mark_stage(Stage::final_test);
    const std::string command = build_run_command(task);
    events.log_tests_started(command);
    const SandboxRunResult final_run =
        executor.run_sandboxed(task, workspace_dir, command, NetworkMode::none,
                               logs_dir / "final_test_stdout.txt", logs_dir / "final_test_stderr.txt");
    ledger.add_artifact("final_test_stdout", final_run.stdout_path);
    ledger.add_artifact("final_test_stderr", final_run.stderr_path);
    ledger.set_exit_code(final_run.exit_code);

    const auto reason = final_reason(final_run.exit_code, out.agent);
    if (reason) ledger.set_failure_reason(*reason);
    ledger.set_outcome(!reason);
    events.log_tests_finished(final_run.exit_code, !reason, final_run.stdout_path,
                              final_run.stderr_path);
    events.log_task_finished(task.id, !reason);
  });

  out.record = ledger.record();
  log_info("agent_runner", task.id + ": " + (out.passed() ? "PASSED" : "FAILED") +
                               (out.record.result.failure_reason
                                    ? " (" + to_string(*out.record.result.failure_reason) + ")"
                                    : ""));
  return out;
}

AgentAttempt run_agent_task(const fs::path& task_yaml, const fs::path& out_dir,
                            StageExecutor& executor, const std::string& variant,
                            SandboxConfig config) {
  log_info("agent_runner", "Loading task from " + task_yaml.string());
  const TaskSpec task = load_task(task_yaml);
  const std::unique_ptr<Agent> agent = make_agent(task, variant);

  const fs::path run_dir = make_dir(out_dir / "agent_runs" /
                                    (format_run_timestamp(WallClock::now()) + "__" + new_run_id()));
  const fs::path task_dir = make_dir(run_dir / "task");
  const fs::path workspace_dir = make_dir(run_dir / "workspace");

  std::error_code ec;
  fs::copy_file(task_yaml, task_dir / task_yaml.filename(), fs::copy_options::overwrite_existing, ec);
  if (ec) {
    throw Error(ErrorCode::io_error, "cannot copy " + task_yaml.string() + ": " + ec.message());
  }

  AgentAttempt attempt =
      run_agent_attempt(task, workspace_dir, run_dir, executor, *agent, std::move(config));

  std::string err;
  const fs::path summary = run_dir / "agent_run.json";
  if (!write_file_atomic(summary, jsonlite::to_json(attempt.to_json()) + "\n", &err)) {
    throw Error(ErrorCode::io_error, "cannot write " + summary.string() + ": " + err);
  }
  log_info("agent_runner", "Artifacts saved to " + run_dir.string());
  return attempt;
}

}  // namespace trialbox
