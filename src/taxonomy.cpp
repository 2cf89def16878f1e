#include "trialbox/taxonomy.hpp"

#include <algorithm>
#include <array>

#include "trialbox/types.hpp"

namespace trialbox {

namespace {

constexpr std::array<FailureReason, 15> kAllReasons = {
    FailureReason::git_clone_failed,   FailureReason::git_checkout_failed,
    FailureReason::setup_timeout,      FailureReason::setup_failed,
    FailureReason::baseline_not_failing, FailureReason::sandbox_error,
    FailureReason::llm_error,          FailureReason::tool_error,
    FailureReason::timeout,            FailureReason::agent_gave_up,
    FailureReason::tests_failed,       FailureReason::no_tests_collected,
    FailureReason::internal_error,     FailureReason::interrupted,
    FailureReason::unknown,
};

std::optional<FailureReason> fail_if(bool failed, FailureReason reason) {
  if (failed) return reason;
  return std::nullopt;
}

}  // namespace

std::string to_string(FailureReason reason) {
  switch (reason) {
    case FailureReason::git_clone_failed: return "GIT_CLONE_FAILED";
    case FailureReason::git_checkout_failed: return "GIT_CHECKOUT_FAILED";
    case FailureReason::setup_timeout: return "SETUP_TIMEOUT";
    case FailureReason::setup_failed: return "SETUP_FAILED";
    case FailureReason::baseline_not_failing: return "BASELINE_NOT_FAILING";
    case FailureReason::sandbox_error: return "SANDBOX_ERROR";
    case FailureReason::llm_error: return "LLM_ERROR";
    case FailureReason::tool_error: return "TOOL_ERROR";
    case FailureReason::timeout: return "TIMEOUT";
    case FailureReason::agent_gave_up: return "AGENT_GAVE_UP";
    case FailureReason::tests_failed: return "TESTS_FAILED";
    case FailureReason::no_tests_collected: return "NO_TESTS_COLLECTED";
    case FailureReason::internal_error: return "INTERNAL_ERROR";
    case FailureReason::interrupted: return "INTERRUPTED";
    case FailureReason::unknown: return "UNKNOWN";
  }
  return "UNKNOWN";
}

std::optional<FailureReason> reason_from_string(const std::string& name) {
  for (auto r : kAllReasons) {
    if (to_string(r) == name) return r;
  }
  return std::nullopt;
}

std::string to_string(Stage stage) {
  switch (stage) {
    case Stage::git_clone: return "git_clone";
    case Stage::git_checkout: return "git_checkout";
    case Stage::setup: return "setup";
    case Stage::baseline_run: return "baseline_run";
    case Stage::agent_run: return "agent_run";
    case Stage::final_test: return "final_test";
  }
  return "";
}

Stage stage_from_string(const std::string& name) {
  if (name == "git_clone") return Stage::git_clone;
  if (name == "git_checkout") return Stage::git_checkout;
  if (name == "setup") return Stage::setup;
  if (name == "baseline_run") return Stage::baseline_run;
  if (name == "agent_run") return Stage::agent_run;
  if (name == "final_test") return Stage::final_test;
  throw Error(ErrorCode::config_error, "Unknown stage: '" + name + "'");
}

bool is_timeout_exit_code(int exit_code) { return exit_code == 124 || exit_code == 137; }

std::optional<FailureReason> from_test_exit_code(int exit_code) {
  switch (exit_code) {
    case 0: return std::nullopt;
    case 1: return FailureReason::tests_failed;
    case 2: return FailureReason::interrupted;
    case 3:
    case 4: return FailureReason::internal_error;
    case 5: return FailureReason::no_tests_collected;
    case 124:
    case 137: return FailureReason::timeout;
    default: return FailureReason::unknown;
  }
}

std::optional<FailureReason> classify(Stage stage, int exit_code, Fault fault) {
  switch (fault) {
    case Fault::interrupt: return FailureReason::interrupted;
    case Fault::other: return FailureReason::unknown;
    case Fault::none: break;
  }

  if (is_timeout_exit_code(exit_code)) {
    return stage == Stage::setup ? FailureReason::setup_timeout : FailureReason::timeout;
  }

  switch (stage) {
    case Stage::git_clone: return fail_if(exit_code != 0, FailureReason::git_clone_failed);
    case Stage::git_checkout: return fail_if(exit_code != 0, FailureReason::git_checkout_failed);
    case Stage::setup: return fail_if(exit_code != 0, FailureReason::setup_failed);
    case Stage::baseline_run: return fail_if(exit_code == 0, FailureReason::baseline_not_failing);
    case Stage::agent_run:
    case Stage::final_test: return from_test_exit_code(exit_code);
  }
  throw Error(ErrorCode::config_error, "Unhandled stage value");
}

int precedence(FailureReason reason) {
  switch (reason) {
    case FailureReason::git_clone_failed: return 1;
    case FailureReason::git_checkout_failed: return 2;
    case FailureReason::setup_timeout: return 3;
    case FailureReason::setup_failed: return 4;
    case FailureReason::baseline_not_failing: return 5;
    case FailureReason::sandbox_error: return 6;
    case FailureReason::llm_error: return 7;
    case FailureReason::tool_error: return 8;
    case FailureReason::timeout: return 9;
    case FailureReason::agent_gave_up: return 10;
    case FailureReason::tests_failed: return 11;
    case FailureReason::no_tests_collected: return 12;
    case FailureReason::internal_error: return 13;
    case FailureReason::interrupted: return 14;
    case FailureReason::unknown: return 15;
  }
  return 15;
}

std::optional<FailureReason> dominant(const std::vector<FailureReason>& reasons) {
  if (reasons.empty()) return std::nullopt;
  return *std::min_element(reasons.begin(), reasons.end(),
                           [](FailureReason a, FailureReason b) { return precedence(a) < precedence(b); });
}

std::string validation_reason(FailureReason reason) {
  if (reason == FailureReason::baseline_not_failing) return "baseline_passed";
  std::string out = to_string(reason);
  for (auto& c : out) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return out;
}

std::optional<FailureReason> reason_from_validation(const std::string& error_reason) {
  if (error_reason == "baseline_passed") return FailureReason::baseline_not_failing;
  std::string wire = error_reason;
  for (auto& c : wire) {
    if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
  }
  return reason_from_string(wire);
}

}  // namespace trialbox
