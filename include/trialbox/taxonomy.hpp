#pragma once

// trialbox/taxonomy.hpp - Failure classification.
//
// Success is std::nullopt, never an enum value. FailureReason only names
// failures.
//
// RULE ORDER (classify):
//   1. A fault wins: interrupt -> INTERRUPTED, anything else -> UNKNOWN.
//   2. Exit 124 or 137 -> SETUP_TIMEOUT at the setup stage, TIMEOUT elsewhere.
//      Timeout dominates every stage-specific rule.
//   3. Stage rules. baseline_run fails when the command PASSES (exit 0).
//      agent_run and final_test use the test-runner exit-code table.
//
// PRECEDENCE:
//   A fixed total order, 1 (GIT_CLONE_FAILED) to 15 (UNKNOWN). The lowest value
//   is the primary cause when several reasons apply. Earlier pipeline stages
//   come first. Changing the order changes every aggregated report.

#include <optional>
#include <string>
#include <vector>

namespace trialbox {

enum class FailureReason {
  git_clone_failed,
  git_checkout_failed,
  setup_timeout,
  setup_failed,
  baseline_not_failing,
  sandbox_error,
  llm_error,
  tool_error,
  timeout,
  agent_gave_up,
  tests_failed,
  no_tests_collected,
  internal_error,
  interrupted,
  unknown,
};

// Wire name, upper-snake: "GIT_CLONE_FAILED".
std::string to_string(FailureReason reason);

// Inverse of to_string(FailureReason). nullopt for unknown names.
std::optional<FailureReason> reason_from_string(const std::string& name);

enum class Stage {
  git_clone,
  git_checkout,
  setup,
  baseline_run,
  agent_run,
  final_test,
};

std::string to_string(Stage stage);

// Throws Error(config_error) for an unknown stage name. A bad stage string is
// a programming error and is fatal at the point of parsing.
Stage stage_from_string(const std::string& name);

enum class Fault { none, interrupt, other };

// Test-runner exit-code table:
//   0 -> success, 1 -> TESTS_FAILED, 2 -> INTERRUPTED, 3|4 -> INTERNAL_ERROR,
//   5 -> NO_TESTS_COLLECTED, 124|137 -> TIMEOUT, other -> UNKNOWN.
std::optional<FailureReason> from_test_exit_code(int exit_code);

std::optional<FailureReason> classify(Stage stage, int exit_code, Fault fault = Fault::none);

bool is_timeout_exit_code(int exit_code);

int precedence(FailureReason reason);

// The reason with the lowest precedence value; nullopt for an empty input.
std::optional<FailureReason> dominant(const std::vector<FailureReason>& reasons);

// Lower-snake reason used in ValidationResult::error_reason. The only name
// that differs from the lowered wire name is BASELINE_NOT_FAILING, reported
// as "baseline_passed".
std::string validation_reason(FailureReason reason);

// Inverse of validation_reason(). nullopt for an unknown string.
std::optional<FailureReason> reason_from_validation(const std::string& error_reason);

}  // namespace trialbox
