#include "trialbox/suite.hpp"

#include <system_error>

#include "trialbox/attempt.hpp"
#include "trialbox/fs_util.hpp"
#include "trialbox/hash.hpp"
#include "trialbox/interrupt.hpp"
#include "trialbox/observability.hpp"
#include "trialbox/task_loader.hpp"
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

void write_json(const fs::path& path, const jsonlite::Object& obj) {
  std::string err;
  if (!write_file_atomic(path, jsonlite::to_json(obj) + "\n", &err)) {
    throw Error(ErrorCode::io_error, "cannot write " + path.string() + ": " + err);
  }
}

// BLAKE3 of every regular file directly inside `dir`, keyed by file name.
std::map<std::string, std::string> digest_logs(const fs::path& dir) {
  std::map<std::string, std::string> out;
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code sec;
    if (!it->is_regular_file(sec)) continue;
    if (auto hex = hash_file_blake3_hex(it->path().string())) {
      out[it->path().filename().string()] = *hex;
    }
  }
  return out;
}

jsonlite::Object to_object(const std::map<std::string, std::string>& m) {
  jsonlite::Object o;
  for (const auto& [k, v] : m) o[k] = v;
  return o;
}

bool is_stage_failure(const std::optional<std::string>& error_reason) {
  if (!error_reason) return false;
  const auto reason = reason_from_validation(*error_reason);
  if (!reason) return false;
  switch (*reason) {
    case FailureReason::git_clone_failed:
    case FailureReason::git_checkout_failed:
    case FailureReason::setup_failed:
    case FailureReason::setup_timeout:
      return true;
    default:
      return false;
  }
}

ValidationResult fault_result(const TaskSpec& task, FailureReason reason) {
  ValidationResult r;
  r.task_id = task.id;
  r.valid = false;
  r.error_reason = validation_reason(reason);
  return r;
}

}  // namespace

std::string task_dir_name(const std::string& id) {
  static constexpr char digits[] = "0123456789ABCDEF";
  if (id.empty()) return "%";
  if (id == "." || id == "..") return id == "." ? "%2E" : "%2E%2E";
  std::string out;
  out.reserve(id.size());
  for (const char c : id) {
    if (c != '/' && c != '\\' && c != '%') {
      out.push_back(c);
      continue;
    }
    const auto b = static_cast<unsigned char>(c);
    out.push_back('%');
    out.push_back(digits[b >> 4]);
    out.push_back(digits[b & 0x0f]);
  }
  return out;
}

fs::path run_task(const fs::path& task_yaml, const fs::path& out_dir, StageExecutor& executor) {
  log_info("suite", "Loading task from " + task_yaml.string());
  const TaskSpec task = load_task(task_yaml);

  const std::string run_id = new_run_id();
  const fs::path run_dir =
      make_dir(out_dir / "runs" / (format_run_timestamp(WallClock::now()) + "__" + run_id));
  const fs::path task_dir = make_dir(run_dir / "task");
  const fs::path logs_dir = make_dir(run_dir / "logs");
  const fs::path workspace_dir = make_dir(run_dir / "workspace");
  log_info("suite", "Starting run " + run_id + " for task " + task.id);

  std::error_code ec;
  fs::copy_file(task_yaml, task_dir / task_yaml.filename(), fs::copy_options::overwrite_existing, ec);
  if (ec) {
    throw Error(ErrorCode::io_error, "cannot copy " + task_yaml.string() + ": " + ec.message());
  }

  const ValidationResult result = validate_baseline(task, workspace_dir, logs_dir, executor);

  jsonlite::Array setup_cmds;
  for (const auto& c : task.setup_commands) setup_cmds.emplace_back(c);

  jsonlite::Object run_json{
      {"run_id", run_id},
      {"task_id", task.id},
      {"suite", task.suite},
      {"repo_url", task.repo.url},
      {"repo_commit", task.repo.commit},
      {"docker_image", task.environment.docker_image},
      {"workdir", task.environment.workdir},
      {"network_settings", jsonlite::Object{{"setup", "bridge"}, {"run", "none"}}},
      {"commands_executed",
       jsonlite::Object{{"setup", std::move(setup_cmds)}, {"run", task.run_command}}},
      {"validation", result.to_json()},
      {"paths_to_logs", logs_dir.string()},
      {"artifact_digests", to_object(digest_logs(logs_dir))},
      {"harness_version", version::HARNESS_SEMVER},
  };
  write_json(run_dir / "run.json", run_json);

  log_info("suite", "Run completed (exit code: " + std::to_string(result.exit_code) +
                        "). Artifacts saved to " + run_dir.string());

  if (is_stage_failure(result.error_reason)) {
    throw Error(ErrorCode::stage_failed,
                "Task " + task.id + " failed before its tests ran: " + *result.error_reason +
                    " (logs in " + logs_dir.string() + ")");
  }
  return run_dir;
}

jsonlite::Object SuiteSummary::to_json() const {
  jsonlite::Array tasks;
  for (const auto& r : results) {
    jsonlite::Object t = r.to_json();
    auto it = artifact_digests.find(r.task_id);
    t["artifact_digests"] =
        it == artifact_digests.end() ? jsonlite::Object{} : to_object(it->second);
    tasks.emplace_back(std::move(t));
  }
  jsonlite::Object counts;
  for (const auto& [name, n] : failure_counts) counts[name] = n;

  return jsonlite::Object{
      {"run_id", run_id},
      {"suite", suite},
      {"run_dir", run_dir.string()},
      {"started_at", started_at},
      {"ended_at", ended_at.empty() ? jsonlite::Value(nullptr) : jsonlite::Value(ended_at)},
      {"task_count", task_count},
      {"valid_count", valid_count},
      {"invalid_count", invalid_count},
      {"not_attempted_count", not_attempted},
      {"interrupted", interrupted},
      {"failure_counts", std::move(counts)},
      {"dominant_failure_reason",
       dominant_failure ? jsonlite::Value(to_string(*dominant_failure)) : jsonlite::Value(nullptr)},
      {"tasks", std::move(tasks)},
      {"harness_version", version::HARNESS_SEMVER},
  };
}

std::optional<SuiteSummary> run_suite(const std::string& suite, const fs::path& tasks_root,
                                      const fs::path& out_dir, StageExecutor& executor) {
  const std::vector<TaskSpec> tasks = load_suite(tasks_root, suite);
  if (tasks.empty()) {
    log_warn("suite", "No valid tasks found in suite " + suite);
    return std::nullopt;
  }

  SuiteSummary summary;
  summary.run_id = new_run_id();
  summary.suite = suite;
  summary.started_at = format_utc(WallClock::now());
  summary.task_count = tasks.size();
  summary.run_dir = make_dir(out_dir / "runs" /
                             (format_run_timestamp(WallClock::now()) + "__" + suite + "__baseline"));
  write_json(summary.run_dir / "run.json", summary.to_json());

  std::vector<FailureReason> reasons;
  size_t attempted = 0;
  for (size_t i = 0; i < tasks.size(); ++i) {
    if (interrupt_requested()) {
      summary.interrupted = true;
      break;
    }
    const TaskSpec& task = tasks[i];
    const fs::path task_dir = summary.run_dir / task_dir_name(task.id);
    ++attempted;

    ValidationResult result;
    try {
      result = validate_baseline(task, task_dir / "workspace", task_dir, executor);
    } catch (const InterruptedError& e) {
      log_warn("suite", "Task " + task.id + " interrupted: " + e.what());
      result = fault_result(task, FailureReason::interrupted);
      summary.interrupted = true;
    } catch (const Error& e) {
      const bool infra =
          e.code() == ErrorCode::sandbox_error || e.code() == ErrorCode::workspace_missing;
      log_error("suite", "Task " + task.id + " errored (" + to_string(e.code()) + "): " + e.what());
      result = fault_result(task, infra ? FailureReason::sandbox_error : FailureReason::unknown);
    } catch (const std::exception& e) {
      log_error("suite", "Task " + task.id + " errored: " + e.what());
      result = fault_result(task, FailureReason::unknown);
    }

    if (result.valid) {
      ++summary.valid_count;
    } else {
      ++summary.invalid_count;
      if (result.error_reason) {
        if (auto reason = reason_from_validation(*result.error_reason)) {
          reasons.push_back(*reason);
          ++summary.failure_counts[to_string(*reason)];
        }
      }
    }
    summary.artifact_digests[task.id] = digest_logs(task_dir);
    log_info("suite", "Task " + std::to_string(i + 1) + "/" + std::to_string(tasks.size()) + ": " +
                          task.id + "... " + (result.valid ? "VALID" : "INVALID") +
                          (result.error_reason ? " (" + *result.error_reason + ")" : ""));
    summary.results.push_back(std::move(result));

    if (summary.interrupted) break;
  }

  summary.not_attempted = tasks.size() - attempted;
  summary.dominant_failure = dominant(reasons);
  summary.ended_at = format_utc(WallClock::now());
  write_json(summary.run_dir / "run.json", summary.to_json());

  if (summary.interrupted) {
    log_warn("suite", "Suite interrupted; " + std::to_string(summary.not_attempted) +
                          " task(s) not attempted");
  }
  return summary;
}

}  // namespace trialbox
