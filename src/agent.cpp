#include "trialbox/agent.hpp"

#include <algorithm>
#include <cstdio>
#include <sstream>

#include "trialbox/fs_util.hpp"
#include "trialbox/interrupt.hpp"
#include "trialbox/observability.hpp"
#include "trialbox/tools.hpp"

namespace fs = std::filesystem;

namespace trialbox {

namespace {

std::string request_id_for(const std::string& run_id, int step_id) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "-%03d", step_id);
  return run_id + buf;
}

int get_int(const jsonlite::Object& params, const std::string& key, int def) {
  return static_cast<int>(jsonlite::get_i64(params, key, def));
}

}  // namespace

jsonlite::Object AgentResult::to_json() const {
  jsonlite::Array files;
  for (const auto& f : patch_files) files.emplace_back(f);
  return jsonlite::Object{
      {"success", success},
      {"steps_taken", steps_taken},
      {"patch_files", std::move(files)},
      {"duration_sec", duration_sec},
      {"stopped_reason", stopped_reason},
      {"exit_code", exit_code ? jsonlite::Value{*exit_code} : jsonlite::Value{nullptr}},
  };
}

std::vector<ScriptedStep> load_agent_script(const fs::path& path) {
  const auto bytes = read_file_bytes(path);
  if (!bytes) {
    throw Error(ErrorCode::config_error, "Agent script not found: " + path.string());
  }
  std::vector<ScriptedStep> steps;
  std::istringstream in(*bytes);
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
    const std::string where = path.string() + ":" + std::to_string(line_no);

    std::optional<jsonlite::JsonError> err;
    const jsonlite::Object obj = jsonlite::parse(line, &err);
    if (err) throw Error(ErrorCode::config_error, where + ": " + err->message);

    const std::string tool = jsonlite::get_string(obj, "tool");
    if (tool.empty()) throw Error(ErrorCode::config_error, where + ": missing 'tool'");
    ScriptedStep step;
    try {
      step.tool = tool_from_string(tool);
    } catch (const Error& e) {
      throw Error(ErrorCode::config_error, where + ": " + e.what());
    }
    if (const auto* params = jsonlite::get_object(obj, "params")) step.params = *params;
    steps.push_back(std::move(step));
  }
  return steps;
}

ScriptedAgent::ScriptedAgent(std::vector<ScriptedStep> steps, int max_steps)
    : steps_(std::move(steps)), max_steps_(max_steps) {}

ToolResult ScriptedAgent::execute(const ScriptedStep& step, int step_id,
                                  const std::string& request_id, const AgentContext& ctx) const {
  const auto& p = step.params;
  ToolResult r;
  switch (step.tool) {
    case ToolName::list_files:
      return list_files(request_id, ctx.workspace_root,
                        ListFilesParams{jsonlite::get_string(p, "root", "."),
                                        jsonlite::get_string(p, "glob", "*")});
    case ToolName::read_file:
      return read_file(request_id, ctx.workspace_root,
                       ReadFileParams{jsonlite::get_string(p, "path")});
    case ToolName::search:
      return search(request_id, ctx.workspace_root,
                    SearchParams{jsonlite::get_string(p, "query"), jsonlite::get_string(p, "glob"),
                                 get_int(p, "max_results", 50), get_int(p, "context_lines", 0)});
    case ToolName::apply_patch:
      r = apply_patch_tool(ctx.workspace_root, jsonlite::get_string(p, "diff"), step_id,
                           ctx.artifacts_dir);
      break;
    case ToolName::run:
      r = run_tool(ctx.workspace_root,
                   RunParams{jsonlite::get_string(p, "command", ctx.task.run_command),
                             get_int(p, "timeout_sec", 0)},
                   ctx.sandbox, step_id, ctx.artifacts_dir);
      break;
  }
  r.request_id = request_id;
  return r;
}

AgentResult ScriptedAgent::run(const AgentContext& ctx) {
  const auto started = WallClock::now();
  AgentResult result;
  EventLogger& events = ctx.events;
  log_info("agent", "scripted agent: " + std::to_string(steps_.size()) + " step(s), budget " +
                        std::to_string(max_steps_) + " for " + ctx.task.id);
  if (!ctx.failing_output.empty()) {
    log_debug("agent", "baseline failure output:\n" + ctx.failing_output);
  }

  bool ran_tests = false;
  for (const ScriptedStep& step : steps_) {
    if (result.steps_taken >= max_steps_) {
      result.stopped_reason = "max_steps";
      break;
    }
    if (interrupt_requested()) throw InterruptedError("interrupted during agent run");

    const int step_id = ++result.steps_taken;
    const std::string request_id = request_id_for(events.run_id(), step_id);
    events.log_agent_turn_started();
    events.log_tool_started(request_id, step.tool, step.params);
    const ToolResult r = execute(step, step_id, request_id, ctx);
    events.log_tool_finished(r);

    if (step.tool == ToolName::apply_patch && r.ok() && r.data) {
      const auto changed = jsonlite::get_string_array(*r.data, "changed_files");
      for (const auto& f : changed) {
        if (std::find(result.patch_files.begin(), result.patch_files.end(), f) ==
            result.patch_files.end()) {
          result.patch_files.push_back(f);
        }
      }
      events.log_patch_applied(step_id, changed,
                               jsonlite::get_string(*r.data, "patch_artifact_path"));
    }

    if (step.tool == ToolName::run) {
      const bool abnormal = r.error && r.error->error_type == "abnormal_exit";
      if (!r.ok() && !abnormal) {
        events.log_agent_turn_finished("tool_error");
        result.stopped_reason = "tool_error";
        break;
      }
      ran_tests = true;
      result.exit_code = r.exit_code;
      events.log_tests_started(jsonlite::get_string(step.params, "command", ctx.task.run_command));
      events.log_tests_finished(r.exit_code.value_or(-1), r.ok(), r.stdout_path, r.stderr_path);
      result.success = r.ok();
    } else if (!r.ok()) {
      log_warn("agent", to_string(step.tool) + " failed at step " + std::to_string(step_id) +
                            ": " + r.error->message);
      events.log_agent_turn_finished("tool_error");
      result.stopped_reason = "tool_error";
      break;
    }
    events.log_agent_turn_finished("continue");
  }

  if (result.stopped_reason.empty()) {
    if (!ran_tests) {
      result.stopped_reason = "script_exhausted";
    } else {
      result.stopped_reason = result.success ? "success" : "tests_failed";
    }
  }
  if (result.stopped_reason == "tool_error" || result.stopped_reason == "max_steps") {
    result.success = false;
  }
  result.duration_sec = seconds_between(started, WallClock::now());
  log_info("agent", "scripted agent stopped: " + result.stopped_reason + " after " +
                        std::to_string(result.steps_taken) + " step(s)");
  return result;
}

std::unique_ptr<Agent> make_agent(const TaskSpec& task, const std::string& variant) {
  if (variant != "scripted") {
    throw Error(ErrorCode::config_error, "Unknown agent variant: '" + variant + "'");
  }
  if (!task.agent || task.agent->script.empty()) {
    throw Error(ErrorCode::config_error,
                "Task " + task.id + " declares no agent.script for the scripted agent");
  }
  fs::path script = task.agent->script;
  if (script.is_relative()) script = fs::path(task.source_path).parent_path() / script;
  return std::make_unique<ScriptedAgent>(load_agent_script(script), task.agent->max_steps);
}

}  // namespace trialbox
