#include "trialbox/attempt.hpp"

#include <array>
#include <cstdint>
#include <random>

#include "trialbox/interrupt.hpp"
#include "trialbox/jsonl.hpp"
#include "trialbox/observability.hpp"
#include "trialbox/version.hpp"

namespace fs = std::filesystem;

namespace trialbox {

namespace {

constexpr char kCrockford[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

jsonlite::Value opt_int(const std::optional<int>& v) {
  return v ? jsonlite::Value(*v) : jsonlite::Value(nullptr);
}
jsonlite::Value opt_double(const std::optional<double>& v) {
  return v ? jsonlite::Value(*v) : jsonlite::Value(nullptr);
}
jsonlite::Value opt_string(const std::optional<std::string>& v) {
  return v ? jsonlite::Value(*v) : jsonlite::Value(nullptr);
}

[[noreturn]] void bad_field(const std::string& key, const std::string& want) {
  throw Error(ErrorCode::json_parse_error, "attempt record field '" + key + "' must be " + want);
}

const jsonlite::Value& require(const jsonlite::Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    throw Error(ErrorCode::json_parse_error, "attempt record is missing '" + key + "'");
  }
  return it->second;
}

std::string req_string(const jsonlite::Object& obj, const std::string& key) {
  const auto& v = require(obj, key);
  if (const auto* s = std::get_if<std::string>(&v.v)) return *s;
  bad_field(key, "a string");
}

bool req_bool(const jsonlite::Object& obj, const std::string& key) {
  const auto& v = require(obj, key);
  if (const auto* b = std::get_if<bool>(&v.v)) return *b;
  bad_field(key, "a boolean");
}

std::optional<double> number_of(const jsonlite::Value& v) {
  if (const auto* d = std::get_if<double>(&v.v)) return *d;
  if (const auto* i = std::get_if<std::int64_t>(&v.v)) return static_cast<double>(*i);
  if (const auto* u = std::get_if<std::uint64_t>(&v.v)) return static_cast<double>(*u);
  return std::nullopt;
}

int req_int(const jsonlite::Object& obj, const std::string& key) {
  const auto& v = require(obj, key);
  if (const auto* i = std::get_if<std::int64_t>(&v.v)) return static_cast<int>(*i);
  if (const auto* u = std::get_if<std::uint64_t>(&v.v)) return static_cast<int>(*u);
  bad_field(key, "an integer");
}

double req_double(const jsonlite::Object& obj, const std::string& key) {
  if (auto d = number_of(require(obj, key))) return *d;
  bad_field(key, "a number");
}

const jsonlite::Object& req_object(const jsonlite::Object& obj, const std::string& key) {
  const auto& v = require(obj, key);
  if (const auto* o = std::get_if<jsonlite::Object>(&v.v)) return *o;
  bad_field(key, "an object");
}

std::optional<int> opt_int_field(const jsonlite::Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->second.is_null()) return std::nullopt;
  if (const auto* i = std::get_if<std::int64_t>(&it->second.v)) return static_cast<int>(*i);
  if (const auto* u = std::get_if<std::uint64_t>(&it->second.v)) return static_cast<int>(*u);
  return std::nullopt;
}

std::optional<double> opt_double_field(const jsonlite::Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return std::nullopt;
  return number_of(it->second);
}

std::optional<std::string> opt_string_field(const jsonlite::Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return std::nullopt;
  if (const auto* s = std::get_if<std::string>(&it->second.v)) return *s;
  return std::nullopt;
}

}  // namespace

jsonlite::Object AttemptRecord::to_json() const {
  jsonlite::Object artifacts;
  for (const auto& [k, v] : artifact_paths) artifacts[k] = v;

  jsonlite::Value model_json(nullptr);
  if (model) {
    model_json = jsonlite::Object{
        {"provider", opt_string(model->provider)},
        {"name", opt_string(model->name)},
        {"temperature", opt_double(model->temperature)},
        {"top_p", opt_double(model->top_p)},
        {"max_tokens", opt_int(model->max_tokens)},
        {"prompt_version", opt_string(model->prompt_version)},
    };
  }

  return jsonlite::Object{
      {"run_id", run_id},
      {"task_id", task_id},
      {"suite", suite},
      {"timestamps",
       jsonlite::Object{{"started_at", timestamps.started_at}, {"ended_at", timestamps.ended_at}}},
      {"duration_sec", duration_sec},
      {"baseline_validation",
       jsonlite::Object{{"attempted", baseline_validation.attempted},
                        {"failure_as_expected", baseline_validation.failure_as_expected},
                        {"exit_code", baseline_validation.exit_code}}},
      {"result",
       jsonlite::Object{{"passed", result.passed},
                        {"exit_code", result.exit_code},
                        {"failure_reason", result.failure_reason
                                               ? jsonlite::Value(to_string(*result.failure_reason))
                                               : jsonlite::Value(nullptr)}}},
      {"artifact_paths", std::move(artifacts)},
      {"variant", variant},
      {"model", std::move(model_json)},
      {"limits",
       jsonlite::Object{{"timeout_sec", limits.timeout_sec},
                        {"tool_timeout_sec", opt_int(limits.tool_timeout_sec)}}},
      {"schema_version", schema_version},
  };
}

AttemptRecord AttemptRecord::from_json(const jsonlite::Object& obj) {
  AttemptRecord r;
  r.run_id = req_string(obj, "run_id");
  r.task_id = req_string(obj, "task_id");
  r.suite = req_string(obj, "suite");
  r.schema_version = req_string(obj, "schema_version");
  r.variant = req_string(obj, "variant");
  r.duration_sec = req_double(obj, "duration_sec");

  const auto& ts = req_object(obj, "timestamps");
  r.timestamps.started_at = req_string(ts, "started_at");
  r.timestamps.ended_at = req_string(ts, "ended_at");

  const auto& bv = req_object(obj, "baseline_validation");
  r.baseline_validation.attempted = req_bool(bv, "attempted");
  r.baseline_validation.failure_as_expected = req_bool(bv, "failure_as_expected");
  r.baseline_validation.exit_code = req_int(bv, "exit_code");

  const auto& res = req_object(obj, "result");
  r.result.passed = req_bool(res, "passed");
  r.result.exit_code = req_int(res, "exit_code");
  if (auto name = opt_string_field(res, "failure_reason")) {
    // A reason added by a newer writer reads as UNKNOWN rather than failing.
    r.result.failure_reason = reason_from_string(*name).value_or(FailureReason::unknown);
  }

  for (const auto& [k, v] : jsonlite::get_string_map(obj, "artifact_paths")) r.artifact_paths[k] = v;

  if (const auto* m = jsonlite::get_object(obj, "model")) {
    ModelConfig mc;
    mc.provider = opt_string_field(*m, "provider");
    mc.name = opt_string_field(*m, "name");
    mc.temperature = opt_double_field(*m, "temperature");
    mc.top_p = opt_double_field(*m, "top_p");
    mc.max_tokens = opt_int_field(*m, "max_tokens");
    mc.prompt_version = opt_string_field(*m, "prompt_version");
    r.model = mc;
  }

  const auto& lim = req_object(obj, "limits");
  r.limits.timeout_sec = req_int(lim, "timeout_sec");
  r.limits.tool_timeout_sec = opt_int_field(lim, "tool_timeout_sec");
  return r;
}

std::string new_run_id() {
  static thread_local std::mt19937_64 rng(std::random_device{}());

  const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                       WallClock::now().time_since_epoch())
                       .count();
  uint64_t ts = static_cast<uint64_t>(now) & ((uint64_t{1} << 48) - 1);

  // 10 chars of timestamp (50 bits, top 2 zero) + 16 chars of randomness.
  std::array<char, 26> out{};
  for (int i = 9; i >= 0; --i) {
    out[static_cast<size_t>(i)] = kCrockford[ts & 31];
    ts >>= 5;
  }
  uint64_t hi = rng() & ((uint64_t{1} << 40) - 1);
  uint64_t lo = rng() & ((uint64_t{1} << 40) - 1);
  for (int i = 17; i >= 10; --i) {
    out[static_cast<size_t>(i)] = kCrockford[hi & 31];
    hi >>= 5;
  }
  for (int i = 25; i >= 18; --i) {
    out[static_cast<size_t>(i)] = kCrockford[lo & 31];
    lo >>= 5;
  }
  return std::string(out.begin(), out.end());
}

fs::path attempts_log_path(const fs::path& logs_dir) {
  fs::path dir = logs_dir.lexically_normal();
  if (!dir.has_filename()) dir = dir.parent_path();
  return dir.parent_path() / "attempts.jsonl";
}

AttemptLedger::AttemptLedger(const TaskSpec& task, fs::path logs_dir, std::string variant)
    : task_(task),
      logs_dir_(std::move(logs_dir)),
      variant_(std::move(variant)),
      run_id_(new_run_id()),
      started_at_(WallClock::now()),
      uncaught_at_entry_(std::uncaught_exceptions()) {
  log_debug("attempt", "opened " + run_id_ + " task=" + task_.id + " variant=" + variant_);
}

AttemptLedger::~AttemptLedger() {
  if (finalized_) return;
  Fault fault = Fault::none;
  if (std::uncaught_exceptions() > uncaught_at_entry_) {
    fault = interrupt_requested() ? Fault::interrupt : Fault::other;
  }
  try {
    finalize(fault);
  } catch (const std::exception& e) {
    log_critical("attempt", "could not finalize " + run_id_ + ": " + e.what());
  }
}

void AttemptLedger::mark_stage(Stage stage) { stage_ = stage; }

void AttemptLedger::set_exit_code(int code) { exit_code_ = code; }

void AttemptLedger::set_failure_reason(FailureReason reason) {
  if (reason_explicit_) return;
  reason_ = reason;
  reason_explicit_ = true;
}

void AttemptLedger::classify_failure(FailureReason reason) {
  if (!reason_) reason_ = reason;
}

void AttemptLedger::add_artifact(const std::string& name, const std::string& path) {
  artifacts_[name] = path;
}

void AttemptLedger::set_outcome(bool passed) { passed_ = passed; }

void AttemptLedger::set_model(ModelConfig model) { model_ = std::move(model); }

void AttemptLedger::set_tool_timeout(int seconds) { tool_timeout_sec_ = seconds; }

void AttemptLedger::set_baseline(BaselineValidation baseline) { baseline_ = baseline; }

bool AttemptLedger::finalize(Fault fault) {
  if (finalized_) return appended_;
  finalized_ = true;

  const auto ended_at = WallClock::now();
  if (fault != Fault::none && !reason_) {
    reason_ = fault == Fault::interrupt ? FailureReason::interrupted : FailureReason::unknown;
  }

  const int code = exit_code_.value_or(-1);
  record_.run_id = run_id_;
  record_.task_id = task_.id;
  record_.suite = task_.suite;
  record_.timestamps.started_at = format_utc(started_at_);
  record_.timestamps.ended_at = format_utc(ended_at);
  record_.duration_sec = seconds_between(started_at_, ended_at);
  record_.baseline_validation = baseline_.value_or(BaselineValidation{true, passed_, code});
  record_.result.passed = passed_;
  record_.result.exit_code = code;
  record_.result.failure_reason = reason_;
  record_.artifact_paths = artifacts_;
  record_.variant = variant_;
  record_.model = model_;
  record_.limits.timeout_sec = task_.environment.timeout_sec;
  record_.limits.tool_timeout_sec = tool_timeout_sec_;
  record_.schema_version = version::ATTEMPT_SCHEMA_VERSION;

  const fs::path log_path = attempts_path();
  appended_ = append_record(log_path, record_.to_json());
  if (appended_) {
    global_harness_stats().attempts_recorded.fetch_add(1, std::memory_order_relaxed);
  }

  std::string summary = "closed " + run_id_ + " task=" + task_.id +
                        " passed=" + (passed_ ? "true" : "false") +
                        " exit=" + std::to_string(code);
  if (reason_) summary += " reason=" + to_string(*reason_);
  if (stage_) summary += " stage=" + to_string(*stage_);
  if (fault != Fault::none) {
    log_warn("attempt", summary + " (scope failed)");
  } else {
    log_info("attempt", summary);
  }
  return appended_;
}

}  // namespace trialbox
