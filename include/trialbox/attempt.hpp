#pragma once

// trialbox/attempt.hpp - AttemptRecord schema and the AttemptLedger scope.
//
// LIFECYCLE:
//   Constructing an AttemptLedger opens the attempt: a fresh ULID run id, the
//   start time, attempted=true. Orchestration code records progress through
//   the mutators. finalize() then, exactly once:
//     1. stamps the end time and duration,
//     2. when the scope is failing and no reason is set, records the fault
//        (interrupt -> INTERRUPTED, anything else -> UNKNOWN),
//     3. builds the AttemptRecord (-1 for an exit code never observed),
//     4. appends it to <logs_dir>/../attempts.jsonl via append_record().
//
//   The ledger keeps its own copy of the TaskSpec, so the caller's spec may
//   go out of scope before finalize().
//
//   The destructor calls finalize() if nobody did, so every exit path
//   (return, exception, interrupt) leaves exactly one line in the log.
//   run_attempt() is the precise form: it classifies the exception type and
//   rethrows it unchanged. The append itself never throws, so a log fault
//   can never mask the original fault.
//
// FAILURE REASON:
//   set_failure_reason() is explicit and the first call wins.
//   classify_failure() is implicit and only fills an empty slot.
//
// SCHEMA:
//   schema_version "0.1.0". Adding fields bumps MINOR; removing or retyping
//   fields bumps MAJOR. from_json() ignores fields it does not know.

#include <chrono>
#include <exception>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include "trialbox/jsonlite.hpp"
#include "trialbox/taxonomy.hpp"
#include "trialbox/types.hpp"

namespace trialbox {

struct TimestampInfo {
  std::string started_at;  // format_utc()
  std::string ended_at;
};

struct BaselineValidation {
  bool attempted{false};
  bool failure_as_expected{false};
  int exit_code{-1};
};

struct TaskOutcome {
  bool passed{false};
  int exit_code{-1};
  std::optional<FailureReason> failure_reason;
};

// Snapshot of the model configuration. Every field is optional; scripted
// agents leave all of them empty.
struct ModelConfig {
  std::optional<std::string> provider;
  std::optional<std::string> name;
  std::optional<double> temperature;
  std::optional<double> top_p;
  std::optional<int> max_tokens;
  std::optional<std::string> prompt_version;
};

struct LimitsConfig {
  int timeout_sec{0};
  std::optional<int> tool_timeout_sec;
};

struct AttemptRecord {
  std::string run_id;
  std::string task_id;
  std::string suite;
  TimestampInfo timestamps;
  double duration_sec{0.0};
  BaselineValidation baseline_validation;
  TaskOutcome result;
  std::map<std::string, std::string> artifact_paths;
  std::string variant;
  std::optional<ModelConfig> model;
  LimitsConfig limits;
  std::string schema_version;

  jsonlite::Object to_json() const;

  // Throws Error(json_parse_error) when a required field is missing or has
  // the wrong type. Unknown fields are ignored.
  static AttemptRecord from_json(const jsonlite::Object& obj);
};

// 26-character Crockford base32 ULID: 48-bit millisecond timestamp followed by
// 80 random bits. Lexicographic order follows creation time.
std::string new_run_id();

// <logs_dir>/../attempts.jsonl
std::filesystem::path attempts_log_path(const std::filesystem::path& logs_dir);

class AttemptLedger {
 public:
  AttemptLedger(const TaskSpec& task, std::filesystem::path logs_dir, std::string variant);
  ~AttemptLedger();

  AttemptLedger(const AttemptLedger&) = delete;
  AttemptLedger& operator=(const AttemptLedger&) = delete;

  void mark_stage(Stage stage);
  void set_exit_code(int code);
  void set_failure_reason(FailureReason reason);
  void classify_failure(FailureReason reason);
  void add_artifact(const std::string& name, const std::string& path);
  void set_outcome(bool passed);
  void set_model(ModelConfig model);
  void set_tool_timeout(int seconds);
  // Records a baseline run other than this attempt's own (agent attempts).
  // Without it, finalize() derives the baseline from the outcome.
  void set_baseline(BaselineValidation baseline);

  // Idempotent. Returns whether the record reached the log; a second call
  // returns the first call's answer and appends nothing.
  bool finalize(Fault fault = Fault::none);

  bool finalized() const { return finalized_; }
  const std::string& run_id() const { return run_id_; }
  std::optional<Stage> current_stage() const { return stage_; }
  std::optional<int> exit_code() const { return exit_code_; }
  std::optional<FailureReason> failure_reason() const { return reason_; }
  bool passed() const { return passed_; }
  double duration_sec() const { return record_.duration_sec; }
  const std::map<std::string, std::string>& artifacts() const { return artifacts_; }
  std::filesystem::path attempts_path() const { return attempts_log_path(logs_dir_); }

  // The record as written; only meaningful after finalize().
  const AttemptRecord& record() const { return record_; }

 private:
  TaskSpec task_;
  std::filesystem::path logs_dir_;
  std::string variant_;
  std::string run_id_;
  WallClock::time_point started_at_;
  int uncaught_at_entry_;

  std::optional<Stage> stage_;
  std::optional<int> exit_code_;
  std::optional<FailureReason> reason_;
  bool reason_explicit_{false};
  bool passed_{false};
  std::map<std::string, std::string> artifacts_;
  std::optional<ModelConfig> model_;
  std::optional<int> tool_timeout_sec_;
  std::optional<BaselineValidation> baseline_;

  bool finalized_{false};
  bool appended_{false};
  AttemptRecord record_;
};

// Runs `fn` inside the ledger scope. InterruptedError finalizes as an
// interrupt, any other exception as a generic fault; either is rethrown
// unchanged. A normal return finalizes without a fault.
template <typename Fn>
auto run_attempt(AttemptLedger& ledger, Fn&& fn) -> decltype(fn()) {
  try {
    if constexpr (std::is_void_v<decltype(fn())>) {
      fn();
      ledger.finalize(Fault::none);
    } else {
      auto out = fn();
      ledger.finalize(Fault::none);
      return out;
    }
  } catch (const InterruptedError&) {
    ledger.finalize(Fault::interrupt);
    throw;
  } catch (...) {
    ledger.finalize(Fault::other);
    throw;
  }
}

}  // namespace trialbox
