#include "trialbox/task_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <system_error>

#include "trialbox/observability.hpp"

namespace fs = std::filesystem;

namespace trialbox {

namespace {

enum class Kind { integer, list, mapping };

std::string kind_name(Kind k) {
  switch (k) {
    case Kind::integer: return "int";
    case Kind::list: return "list";
    case Kind::mapping: return "dict";
  }
  return "";
}

bool is_integer_scalar(const YAML::Node& node) {
  if (!node.IsScalar()) return false;
  const std::string& s = node.Scalar();
  if (s.empty()) return false;
  size_t i = (s[0] == '-' || s[0] == '+') ? 1 : 0;
  if (i == s.size()) return false;
  return std::all_of(s.begin() + static_cast<std::ptrdiff_t>(i), s.end(),
                     [](char c) { return c >= '0' && c <= '9'; });
}

std::string type_of(const YAML::Node& node) {
  if (node.IsMap()) return "dict";
  if (node.IsSequence()) return "list";
  if (node.IsNull()) return "NoneType";
  if (is_integer_scalar(node)) return "int";
  return "str";
}

bool has_kind(const YAML::Node& node, Kind k) {
  switch (k) {
    case Kind::integer: return is_integer_scalar(node);
    case Kind::list: return node.IsSequence();
    case Kind::mapping: return node.IsMap();
  }
  return false;
}

[[noreturn]] void invalid(const fs::path& yaml_path, const std::string& what) {
  log_error("task_loader", "Task validation failed for " + yaml_path.string() + ": " + what);
  throw Error(ErrorCode::invalid_task, "Invalid task YAML " + yaml_path.string() + ": " + what);
}

YAML::Node require_mapping(const fs::path& yaml_path, const YAML::Node& node,
                           const std::string& path) {
  if (!node.IsMap()) invalid(yaml_path, (path.empty() ? std::string("root") : path) + " must be a mapping");
  return node;
}

YAML::Node require_key(const fs::path& yaml_path, const YAML::Node& parent, const std::string& prefix,
                       const std::string& key, Kind kind) {
  const YAML::Node value = parent[key];
  if (!value) invalid(yaml_path, "Missing key: " + prefix + key);
  if (kind == Kind::mapping) return require_mapping(yaml_path, value, prefix + key);
  if (!has_kind(value, kind)) {
    invalid(yaml_path, "Key '" + prefix + key + "' must be of type " + kind_name(kind) + ", got " +
                           type_of(value));
  }
  return value;
}

// Strings that happen to look like integers (a commit such as 1234567) are
// still strings here.
std::string as_text(const YAML::Node& node) { return node.Scalar(); }

std::string require_text(const fs::path& yaml_path, const YAML::Node& parent, const std::string& prefix,
                         const std::string& key) {
  const YAML::Node value = parent[key];
  if (!value) invalid(yaml_path, "Missing key: " + prefix + key);
  if (!value.IsScalar()) {
    invalid(yaml_path, "Key '" + prefix + key + "' must be of type str, got " + type_of(value));
  }
  return as_text(value);
}

}  // namespace

TaskSpec load_task(const fs::path& yaml_path) {
  YAML::Node doc;
  try {
    doc = YAML::LoadFile(yaml_path.string());
  } catch (const YAML::BadFile&) {
    throw Error(ErrorCode::invalid_task,
                "Invalid task YAML " + yaml_path.string() + ": cannot open file");
  } catch (const YAML::Exception& e) {
    invalid(yaml_path, e.what());
  }

  require_mapping(yaml_path, doc, "");

  TaskSpec task;
  task.id = require_text(yaml_path, doc, "", "id");
  task.suite = require_text(yaml_path, doc, "", "suite");

  const YAML::Node repo = require_key(yaml_path, doc, "", "repo", Kind::mapping);
  task.repo.url = require_text(yaml_path, repo, "repo.", "url");
  task.repo.commit = require_text(yaml_path, repo, "repo.", "commit");

  const YAML::Node env = require_key(yaml_path, doc, "", "environment", Kind::mapping);
  task.environment.docker_image = require_text(yaml_path, env, "environment.", "docker_image");
  task.environment.workdir = require_text(yaml_path, env, "environment.", "workdir");
  const YAML::Node timeout = require_key(yaml_path, env, "environment.", "timeout_sec", Kind::integer);
  try {
    task.environment.timeout_sec = timeout.as<int>();
  } catch (const YAML::Exception&) {
    invalid(yaml_path, "Key 'environment.timeout_sec' is out of range: " + timeout.Scalar());
  }

  const YAML::Node setup = require_key(yaml_path, doc, "", "setup", Kind::mapping);
  const YAML::Node commands = require_key(yaml_path, setup, "setup.", "commands", Kind::list);
  for (size_t i = 0; i < commands.size(); ++i) {
    const YAML::Node c = commands[i];
    if (!c.IsScalar()) {
      invalid(yaml_path, "Key 'setup.commands[" + std::to_string(i) + "]' must be of type str, got " +
                             type_of(c));
    }
    task.setup_commands.push_back(as_text(c));
  }

  const YAML::Node run = require_key(yaml_path, doc, "", "run", Kind::mapping);
  task.run_command = require_text(yaml_path, run, "run.", "command");

  if (const YAML::Node agent = doc["agent"]) {
    require_mapping(yaml_path, agent, "agent");
    AgentSpec spec;
    spec.entrypoint = require_text(yaml_path, agent, "agent.", "entrypoint");
    const YAML::Node steps = require_key(yaml_path, agent, "agent.", "max_steps", Kind::integer);
    try {
      spec.max_steps = steps.as<int>();
    } catch (const YAML::Exception&) {
      invalid(yaml_path, "Key 'agent.max_steps' is out of range: " + steps.Scalar());
    }
    if (spec.max_steps <= 0) invalid(yaml_path, "Key 'agent.max_steps' must be positive");
    if (agent["script"]) spec.script = require_text(yaml_path, agent, "agent.", "script");
    task.agent = std::move(spec);
  }

  task.source_path = yaml_path.string();
  log_debug("task_loader", "Task loaded successfully: " + task.id);
  return task;
}

std::vector<fs::path> discover_tasks(const fs::path& suite_dir) {
  std::error_code ec;
  if (!fs::is_directory(suite_dir, ec)) {
    log_error("task_loader", "Suite directory does not exist: " + suite_dir.string());
    throw Error(ErrorCode::suite_not_found, "Suite directory not found: " + suite_dir.string());
  }

  std::vector<fs::path> out;
  for (fs::directory_iterator it(suite_dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code sec;
    if (!it->is_directory(sec)) continue;
    const fs::path candidate = it->path() / "task.yaml";
    if (fs::is_regular_file(candidate, sec)) out.push_back(candidate);
  }
  if (ec) {
    throw Error(ErrorCode::io_error, "cannot list " + suite_dir.string() + ": " + ec.message());
  }
  std::sort(out.begin(), out.end());
  log_debug("task_loader", "Discovered " + std::to_string(out.size()) + " tasks in " + suite_dir.string());
  return out;
}

std::vector<TaskSpec> load_suite(const fs::path& tasks_root, const std::string& suite) {
  std::vector<TaskSpec> tasks;
  for (const auto& yaml_path : discover_tasks(tasks_root / suite)) {
    try {
      tasks.push_back(load_task(yaml_path));
    } catch (const Error& e) {
      if (e.code() != ErrorCode::invalid_task) throw;
      log_warn("task_loader", "Invalid task " + yaml_path.string() + ": " + e.what());
    }
  }
  return tasks;
}

}  // namespace trialbox
