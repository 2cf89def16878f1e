#pragma once

// trialbox/agent.hpp - The agent seam and the scripted agent.
//
// An Agent drives the tool contract against one prepared workspace. It owns
// no attempt bookkeeping: run_agent_attempt() opens the ledger, runs the
// final test and classifies. The agent only reports what it did.
//
// EVENTS:
//   Each step is one agent turn:
//     agent_turn_started, tool_call_started, tool_call_finished,
//     [patch_applied | tests_started + tests_finished], agent_turn_finished
//   Request ids are "<run_id>-NNN" with NNN counting steps from 001.
//
// SCRIPT FORMAT (JSON Lines, blank lines ignored):
//   {"tool": "read_file",   "params": {"path": "calc.py"}}
//   {"tool": "apply_patch", "params": {"diff": "--- a/calc.py\n..."}}
//   {"tool": "run",         "params": {"command": "pytest -q", "timeout_sec": 60}}
//   list_files takes root/glob, search takes query/glob/max_results/context_lines.
//
// STOP REASONS:
//   tool_error       a non-run tool failed, or a run step timed out or hit a
//                    sandbox fault (a nonzero test exit is expected mid-fix)
//   success          the last run step exited 0
//   tests_failed     the last run step exited nonzero
//   script_exhausted the script ended without a run step
//   max_steps        the step budget ran out first

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "trialbox/events.hpp"
#include "trialbox/jsonlite.hpp"
#include "trialbox/sandbox.hpp"
#include "trialbox/types.hpp"

namespace trialbox {

struct AgentResult {
  bool success{false};
  int steps_taken{0};
  std::vector<std::string> patch_files;  // workspace-relative, first-touch order
  double duration_sec{0.0};
  std::string stopped_reason;
  std::optional<int> exit_code;          // last run step, if any

  jsonlite::Object to_json() const;
};

struct AgentContext {
  const TaskSpec& task;
  const ContainerSandbox& sandbox;
  std::filesystem::path workspace_root;  // the checked-out repository
  std::filesystem::path artifacts_dir;
  std::string failing_output;            // baseline stderr, truncated
  EventLogger& events;
};

class Agent {
 public:
  virtual ~Agent() = default;

  virtual std::string name() const = 0;

  // Never throws for tool failures; those end the run with a stop reason.
  // InterruptedError propagates.
  virtual AgentResult run(const AgentContext& ctx) = 0;
};

struct ScriptedStep {
  ToolName tool{ToolName::list_files};
  jsonlite::Object params;
};

// Throws Error(config_error) naming the file and line on a missing file, a
// malformed line, or an unknown tool.
std::vector<ScriptedStep> load_agent_script(const std::filesystem::path& path);

class ScriptedAgent : public Agent {
 public:
  ScriptedAgent(std::vector<ScriptedStep> steps, int max_steps);

  std::string name() const override { return "scripted"; }
  AgentResult run(const AgentContext& ctx) override;

 private:
  ToolResult execute(const ScriptedStep& step, int step_id, const std::string& request_id,
                     const AgentContext& ctx) const;

  std::vector<ScriptedStep> steps_;
  int max_steps_;
};

// Builds the agent named by `variant` for `task`. Only "scripted" exists; it
// reads task.agent->script relative to the directory of task.source_path.
// Throws Error(config_error) for an unknown variant or a missing script.
std::unique_ptr<Agent> make_agent(const TaskSpec& task, const std::string& variant);

}  // namespace trialbox
