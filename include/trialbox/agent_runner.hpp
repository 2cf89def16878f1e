#pragma once

// trialbox/agent_runner.hpp - One agent attempt: baseline, agent, final test.
//
// FLOW (one AttemptLedger, variant = agent name):
//   1. validate_baseline() into <artifacts>/baseline/. It appends its own
//      "baseline" record; this attempt records it as baseline_validation.
//      An invalid baseline ends the attempt with the baseline's reason and
//      the agent never runs.
//   2. agent_run: the agent works on <workspace>/repo. Events stream to
//      <artifacts>/events.jsonl.
//   3. final_test: the task's run command on network none, whatever the
//      agent reported. The exit code goes through classify(final_test).
//      When the tests still fail, the agent's stop reason refines
//      TESTS_FAILED: tool_error -> TOOL_ERROR, max_steps or
//      script_exhausted -> AGENT_GAVE_UP.
//
// Both records land in <artifacts>/attempts.jsonl.
//
// LAYOUT (run_agent_task):
//   <out>/agent_runs/<timestamp>__<run_id>/
//     task/<task.yaml>  baseline/  logs/  diffs/  workspace/repo/
//     events.jsonl  attempts.jsonl  agent_run.json

#include <filesystem>
#include <string>

#include "trialbox/agent.hpp"
#include "trialbox/attempt.hpp"
#include "trialbox/sandbox.hpp"
#include "trialbox/types.hpp"
#include "trialbox/validator.hpp"

namespace trialbox {

struct AgentAttempt {
  AttemptRecord record;
  ValidationResult baseline;
  AgentResult agent;           // default (steps_taken 0) when the agent never ran
  bool agent_ran{false};
  std::filesystem::path artifacts_dir;
  std::filesystem::path events_file;

  bool passed() const { return record.result.passed; }
  jsonlite::Object to_json() const;
};

// Faults (sandbox errors, interrupts) propagate after the ledger has
// recorded them.
AgentAttempt run_agent_attempt(const TaskSpec& task,
                               const std::filesystem::path& workspace_dir,
                               const std::filesystem::path& artifacts_dir,
                               StageExecutor& executor,
                               Agent& agent,
                               SandboxConfig config = SandboxConfig::from_env());

// Loads the task, builds the agent for `variant` and runs one attempt in a
// fresh run directory. Writes agent_run.json before returning.
AgentAttempt run_agent_task(const std::filesystem::path& task_yaml,
                            const std::filesystem::path& out_dir,
                            StageExecutor& executor,
                            const std::string& variant = "scripted",
                            SandboxConfig config = SandboxConfig::from_env());

}  // namespace trialbox
