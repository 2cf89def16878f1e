#include <fcntl.h>
#include <sys/stat.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "trialbox/agent.hpp"
#include "trialbox/agent_runner.hpp"
#include "trialbox/attempt.hpp"
#include "trialbox/cli_args.hpp"
#include "trialbox/deadline.hpp"
#include "trialbox/events.hpp"
#include "trialbox/fs_util.hpp"
#include "trialbox/hash.hpp"
#include "trialbox/interrupt.hpp"
#include "trialbox/jsonl.hpp"
#include "trialbox/jsonlite.hpp"
#include "trialbox/observability.hpp"
#include "trialbox/patch.hpp"
#include "trialbox/path_guard.hpp"
#include "trialbox/sandbox.hpp"
#include "trialbox/suite.hpp"
#include "trialbox/task_loader.hpp"
#include "trialbox/taxonomy.hpp"
#include "trialbox/tools.hpp"
#include "trialbox/validator.hpp"

namespace fs = std::filesystem;
namespace jsonlite = trialbox::jsonlite;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// Empty scratch directory under the system temp dir.
fs::path fresh_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / "trialbox_test" / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void write_text(const fs::path& p, const std::string& content) {
  if (p.has_parent_path())
    fs::create_directories(p.parent_path());
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  ofs << content;
}

std::string read_text(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  std::stringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

const jsonlite::Value& field(const jsonlite::Object& o, const std::string& key) {
  auto it = o.find(key);
  expect(it != o.end(), "missing field " + key);
  return it->second;
}

const jsonlite::Array& as_array(const jsonlite::Value& v) {
  const auto* a = std::get_if<jsonlite::Array>(&v.v);
  expect(a != nullptr, "value is not an array");
  return *a;
}

const jsonlite::Object& as_object(const jsonlite::Value& v) {
  const auto* o = std::get_if<jsonlite::Object>(&v.v);
  expect(o != nullptr, "value is not an object");
  return *o;
}

std::string as_string(const jsonlite::Value& v) {
  const auto* s = std::get_if<std::string>(&v.v);
  expect(s != nullptr, "value is not a string");
  return *s;
}

trialbox::TaskSpec sample_task(const std::string& id = "demo-1") {
  trialbox::TaskSpec t;
  t.id = id;
  t.suite = "demo";
  t.repo.url = "https://example.invalid/" + id + ".git";
  t.repo.commit = "abc123";
  t.environment.docker_image = "python:3.11";
  t.environment.workdir = "/workspace";
  t.environment.timeout_sec = 30;
  t.setup_commands = {"pip install -e .", "pip install pytest"};
  t.run_command = "pytest -q";
  return t;
}

std::string task_yaml(const std::string& id, const std::string& url) {
  return "id: " + id +
         "\n"
         "suite: demo\n"
         "repo:\n"
         "  url: " +
         url +
         "\n"
         "  commit: 1234567\n"
         "environment:\n"
         "  docker_image: python:3.11\n"
         "  workdir: /workspace\n"
         "  timeout_sec: 300\n"
         "setup:\n"
         "  commands:\n"
         "    - pip install -e .\n"
         "run:\n"
         "  command: pytest -q\n";
}

// Plays back fixed exit codes instead of touching git or a container. Stage
// logs are written like the real helpers write them.
class ScriptedExecutor : public trialbox::StageExecutor {
public:
  int clone_exit = 0;
  int checkout_exit = 0;
  int setup_exit = 0;
  int run_exit = 1;
  bool setup_throws_sandbox_error = false;
  bool interrupt_during_setup = false;
  // Per-repo override of run_exit, keyed by repo URL.
  std::map<std::string, int> run_exit_by_url;
  // Exit codes for successive test runs (baseline, then final); run_exit
  // applies once they are used up.
  std::vector<int> run_exit_sequence;
  std::vector<std::string> calls;

  trialbox::CommandResult clone(const std::string& url, const fs::path& dest,
                                const fs::path& logs_dir) override {
    calls.push_back("clone");
    last_url_ = url;
    fs::create_directories(dest);
    return stage_logs(logs_dir, "git_clone", clone_exit);
  }

  trialbox::CommandResult checkout(const fs::path&, const std::string&,
                                   const fs::path& logs_dir) override {
    calls.push_back("checkout");
    return stage_logs(logs_dir, "git_checkout", checkout_exit);
  }

  trialbox::SandboxRunResult
  run_sandboxed(const trialbox::TaskSpec&, const fs::path&,
                const std::string& command, trialbox::NetworkMode network,
                const fs::path& stdout_path,
                const fs::path& stderr_path) override {
    const bool is_setup = network == trialbox::NetworkMode::bridge;
    calls.push_back(is_setup ? "setup" : "run");
    commands.push_back(command);
    if (is_setup && setup_throws_sandbox_error)
      throw trialbox::Error(trialbox::ErrorCode::sandbox_error,
                            "Sandbox I/O error: runtime missing");
    if (is_setup && interrupt_during_setup)
      trialbox::request_interrupt();
    write_text(stdout_path, command + "\n");
    write_text(stderr_path, "");
    trialbox::SandboxRunResult r;
    r.stdout_path = stdout_path.string();
    r.stderr_path = stderr_path.string();
    if (is_setup) {
      r.exit_code = setup_exit;
    } else if (runs_ < run_exit_sequence.size()) {
      r.exit_code = run_exit_sequence[runs_++];
    } else {
      auto it = run_exit_by_url.find(last_url_);
      r.exit_code = it == run_exit_by_url.end() ? run_exit : it->second;
    }
    r.timed_out = r.exit_code == 124;
    return r;
  }

  std::vector<std::string> commands;

private:
  trialbox::CommandResult stage_logs(const fs::path& logs_dir,
                                     const std::string& name, int code) {
    trialbox::CommandResult r;
    r.exit_code = code;
    r.stdout_path = (logs_dir / (name + "_stdout.txt")).string();
    r.stderr_path = (logs_dir / (name + "_stderr.txt")).string();
    write_text(r.stdout_path, name + " ok\n");
    write_text(r.stderr_path, code == 0 ? "" : "fatal: scripted failure\n");
    return r;
  }

  std::string last_url_;
  size_t runs_ = 0;
};

// A stand-in container runtime: ignores the docker flags and runs the last
// argument (the command) with /bin/sh.
fs::path fake_runtime(const fs::path& dir) {
  const fs::path script = dir / "fake-runtime";
  write_text(script, "#!/bin/sh\n"
                     "for last; do :; done\n"
                     "exec /bin/sh -c \"$last\"\n");
  ::chmod(script.c_str(), 0755);
  return script;
}

// ============================================================================
// Phase 1: Failure taxonomy
// ============================================================================

void test_classify_table() {
  using trialbox::FailureReason;
  using trialbox::Stage;
  expect(!trialbox::classify(Stage::git_clone, 0), "clone success");
  expect(trialbox::classify(Stage::git_clone, 128) ==
             FailureReason::git_clone_failed,
         "clone failure");
  expect(trialbox::classify(Stage::git_checkout, 1) ==
             FailureReason::git_checkout_failed,
         "checkout failure");
  expect(trialbox::classify(Stage::setup, 2) == FailureReason::setup_failed,
         "setup failure");
  expect(trialbox::classify(Stage::baseline_run, 0) ==
             FailureReason::baseline_not_failing,
         "baseline passing is a failure");
  expect(!trialbox::classify(Stage::baseline_run, 1),
         "baseline failing is the expected outcome");
  expect(!trialbox::classify(Stage::final_test, 0), "final tests pass");
  expect(trialbox::classify(Stage::final_test, 1) ==
             FailureReason::tests_failed,
         "final tests fail");
  expect(trialbox::classify(Stage::agent_run, 5) ==
             FailureReason::no_tests_collected,
         "no tests collected");
  expect(trialbox::classify(Stage::final_test, 3) ==
             FailureReason::internal_error,
         "runner internal error");
  expect(trialbox::classify(Stage::final_test, 42) == FailureReason::unknown,
         "unmapped exit code");
}

void test_timeout_dominates() {
  using trialbox::FailureReason;
  using trialbox::Stage;
  expect(trialbox::classify(Stage::setup, 124) == FailureReason::setup_timeout,
         "setup 124");
  expect(trialbox::classify(Stage::setup, 137) == FailureReason::setup_timeout,
         "setup 137");
  expect(trialbox::classify(Stage::git_clone, 124) == FailureReason::timeout,
         "clone 124");
  expect(trialbox::classify(Stage::baseline_run, 137) ==
             FailureReason::timeout,
         "baseline 137");
  expect(trialbox::classify(Stage::final_test, 124) == FailureReason::timeout,
         "final 124");
}

void test_faults_override_exit_codes() {
  using trialbox::Fault;
  using trialbox::FailureReason;
  using trialbox::Stage;
  expect(trialbox::classify(Stage::final_test, 0, Fault::interrupt) ==
             FailureReason::interrupted,
         "interrupt beats success");
  expect(trialbox::classify(Stage::setup, 124, Fault::other) ==
             FailureReason::unknown,
         "fault beats timeout");
}

void test_precedence_total_order() {
  std::set<int> seen;
  const std::vector<std::string> names = {
      "GIT_CLONE_FAILED", "GIT_CHECKOUT_FAILED", "SETUP_TIMEOUT",
      "SETUP_FAILED",     "BASELINE_NOT_FAILING", "SANDBOX_ERROR",
      "LLM_ERROR",        "TOOL_ERROR",           "TIMEOUT",
      "AGENT_GAVE_UP",    "TESTS_FAILED",         "NO_TESTS_COLLECTED",
      "INTERNAL_ERROR",   "INTERRUPTED",          "UNKNOWN"};
  for (size_t i = 0; i < names.size(); ++i) {
    const auto r = trialbox::reason_from_string(names[i]);
    expect(r.has_value(), "wire name parses: " + names[i]);
    expect(trialbox::to_string(*r) == names[i], "wire name round-trips");
    expect(trialbox::precedence(*r) == static_cast<int>(i) + 1,
           "precedence of " + names[i]);
    seen.insert(trialbox::precedence(*r));
  }
  expect(seen.size() == 15, "precedence is injective");
  expect(!trialbox::reason_from_string("NOT_A_REASON"), "unknown wire name");

  using trialbox::FailureReason;
  expect(trialbox::dominant({FailureReason::tests_failed,
                             FailureReason::setup_failed,
                             FailureReason::unknown}) ==
             FailureReason::setup_failed,
         "dominant picks earliest stage");
  expect(!trialbox::dominant({}), "dominant of nothing");
}

void test_validation_reason_names() {
  using trialbox::FailureReason;
  expect(trialbox::validation_reason(FailureReason::baseline_not_failing) ==
             "baseline_passed",
         "baseline_passed alias");
  expect(trialbox::validation_reason(FailureReason::setup_timeout) ==
             "setup_timeout",
         "lowered name");
  expect(trialbox::reason_from_validation("baseline_passed") ==
             FailureReason::baseline_not_failing,
         "alias inverse");
  expect(trialbox::reason_from_validation("git_clone_failed") ==
             FailureReason::git_clone_failed,
         "lowered inverse");
}

void test_test_runner_exit_codes() {
  using trialbox::FailureReason;
  expect(!trialbox::from_test_exit_code(0), "exit 0 is success");
  expect(trialbox::from_test_exit_code(1) == FailureReason::tests_failed,
         "exit 1");
  expect(trialbox::from_test_exit_code(2) == FailureReason::interrupted,
         "exit 2");
  expect(trialbox::from_test_exit_code(3) == FailureReason::internal_error &&
             trialbox::from_test_exit_code(4) == FailureReason::internal_error,
         "exit 3 and 4");
  expect(trialbox::from_test_exit_code(5) == FailureReason::no_tests_collected,
         "exit 5");
  expect(trialbox::from_test_exit_code(137) == FailureReason::timeout,
         "exit 137");
  expect(trialbox::from_test_exit_code(-1) == FailureReason::unknown,
         "unmapped code");
}

void test_stage_parsing() {
  expect(trialbox::stage_from_string("baseline_run") ==
             trialbox::Stage::baseline_run,
         "stage parse");
  bool threw = false;
  try {
    trialbox::stage_from_string("deploy");
  } catch (const trialbox::Error& e) {
    threw = e.code() == trialbox::ErrorCode::config_error;
  }
  expect(threw, "unknown stage raises config_error");
}

// ============================================================================
// Phase 2: Workspace confinement
// ============================================================================

void test_path_guard_basic() {
  const fs::path ws = fresh_dir("guard_ws");
  write_text(ws / "sub" / "a.txt", "a\n");
  const fs::path root = fs::canonical(ws);

  auto ok = trialbox::resolve_safe_path(ws, "sub/a.txt");
  expect(ok.ok() && ok.path == root / "sub" / "a.txt", "plain relative path");

  auto dotted = trialbox::resolve_safe_path(ws, "./sub/");
  expect(dotted.ok() && dotted.path == root / "sub",
         "./ prefix and trailing slash normalize");

  auto self = trialbox::resolve_safe_path(ws, ".");
  expect(self.ok() && self.path == root, "root itself is allowed");

  auto abs = trialbox::resolve_safe_path(ws, "/sub/a.txt");
  expect(abs.ok() && abs.path == root / "sub" / "a.txt",
         "leading slash is workspace-relative");

  auto missing = trialbox::resolve_safe_path(ws, "sub/new.txt");
  expect(missing.ok(), "non-existent target inside root resolves");
}

void test_path_guard_escape() {
  const fs::path ws = fresh_dir("guard_escape");
  auto up = trialbox::resolve_safe_path(ws, "../outside.txt");
  expect(up.error == trialbox::ErrorCode::path_escape, "../ escapes");
  auto deep = trialbox::resolve_safe_path(ws, "a/b/../../../x");
  expect(deep.error == trialbox::ErrorCode::path_escape, "nested ../ escapes");
  expect(trialbox::to_string(up.error) == "path_escape", "error name");
}

void test_path_guard_symlinks() {
  const fs::path base = fresh_dir("guard_links");
  const fs::path ws = base / "ws";
  const fs::path outside = base / "outside";
  fs::create_directories(ws);
  write_text(outside / "secret.txt", "secret\n");
  fs::create_directory_symlink(outside, ws / "link");
  write_text(ws / "real" / "x.txt", "x\n");
  fs::create_directory_symlink(ws / "real", ws / "inner");

  auto through = trialbox::resolve_safe_path(ws, "link/secret.txt");
  expect(through.error == trialbox::ErrorCode::symlink_blocked,
         "intermediate symlink blocked");
  auto inner = trialbox::resolve_safe_path(ws, "inner/x.txt");
  expect(inner.error == trialbox::ErrorCode::symlink_blocked,
         "in-tree symlink still blocked by default");

  auto allowed = trialbox::resolve_safe_path(ws, "inner/x.txt", true);
  expect(allowed.ok(), "in-tree symlink allowed when requested");
  auto escaped = trialbox::resolve_safe_path(ws, "link/secret.txt", true);
  expect(escaped.error == trialbox::ErrorCode::path_escape,
         "symlink leaving the root escapes even when allowed");
}

void test_glob() {
  expect(trialbox::glob_match("*.py", "a.py"), "star");
  expect(!trialbox::glob_match("*.py", "src/a.py"), "star stays in segment");
  expect(trialbox::glob_match("**/*.py", "src/pkg/a.py"), "double star");
  expect(trialbox::glob_match("**/*.py", "a.py"), "double star zero dirs");
  expect(trialbox::glob_match("src/?.py", "src/a.py"), "question mark");

  const fs::path ws = fresh_dir("glob_ws");
  write_text(ws / "a.py", "");
  write_text(ws / "src" / "b.py", "");
  write_text(ws / ".git" / "c.py", "");
  const auto hits = trialbox::safe_glob(ws, "**/*.py");
  expect(hits.size() == 2, "glob skips .git");
  expect(hits[0].filename() == "a.py" && hits[1].filename() == "b.py",
         "glob output sorted");
}

// ============================================================================
// Phase 3: Patch application
// ============================================================================

std::string numbered_lines(int n) {
  std::string out;
  for (int i = 1; i <= n; ++i)
    out += "l" + std::to_string(i) + "\n";
  return out;
}

std::string hunk_at(int declared_start) {
  const std::string s = std::to_string(declared_start);
  return "--- a/f.txt\n+++ b/f.txt\n@@ -" + s + ",3 +" + s +
         ",3 @@\n l5\n-l6\n+L6\n l7\n";
}

void test_diff_parsing() {
  const std::string diff = "diff --git a/x.txt b/x.txt\n"
                           "index 1111111..2222222 100644\n"
                           "--- a/x.txt\n+++ b/x.txt\n"
                           "@@ -1,2 +1,2 @@\n keep\n---old\n+new\n"
                           "--- /dev/null\n+++ b/y.txt\n@@ -0,0 +1 @@\n+y\n";
  std::optional<std::string> error;
  const auto patches = trialbox::parse_unified_diff(diff, &error);
  expect(!error, "well-formed diff parses");
  expect(patches.size() == 2, "one FilePatch per file");
  expect(*patches[0].old_path == "x.txt" && *patches[0].new_path == "x.txt",
         "a/ and b/ prefixes stripped");
  expect(patches[0].hunks.size() == 1 && patches[0].hunks[0].lines.size() == 3,
         "hunk body collected");
  expect(patches[0].hunks[0].lines[1] == "---old",
         "deleted line starting with -- stays in the hunk");
  expect(patches[1].is_creation() && !patches[1].is_deletion(),
         "/dev/null source is a creation");
  expect(*patches[1].old_path == trialbox::kDevNull, "/dev/null kept verbatim");

  trialbox::parse_unified_diff("--- a/x\n+++ b/x\n@@ bogus @@\n", &error);
  expect(error.has_value(), "malformed hunk header reported");
}

void test_patch_validation_messages() {
  const fs::path ws = fresh_dir("patch_validate");
  write_text(ws / "f.txt", numbered_lines(10));

  expect(trialbox::validate_patch(ws, trialbox::parse_unified_diff(hunk_at(5))).empty(),
         "matching hunk has no problems");

  const auto far = trialbox::validate_patch(ws, trialbox::parse_unified_diff(hunk_at(50)));
  expect(far.size() == 1 && far[0].find("outside file bounds") != std::string::npos,
         "hunk past end of file");

  write_text(ws / "f.txt", "something else\n");
  const auto mismatch = trialbox::validate_patch(ws, trialbox::parse_unified_diff(hunk_at(1)));
  expect(mismatch.size() == 1 && mismatch[0].find("does not match") != std::string::npos,
         "context mismatch");

  fs::remove(ws / "f.txt");
  const auto missing = trialbox::validate_patch(ws, trialbox::parse_unified_diff(hunk_at(5)));
  expect(missing.size() == 1 && missing[0] == "f.txt does not exist", "missing file");
}

void test_patch_differing_names_patch_in_place() {
  const fs::path ws = fresh_dir("patch_names");
  const fs::path artifacts = fresh_dir("patch_names_artifacts");
  write_text(ws / "calc.py.orig", "a\nb\nc\n");
  write_text(ws / "calc.py", "a\nb\nc\n");
  const std::string diff = "--- calc.py.orig\n+++ calc.py\n@@ -1,3 +1,3 @@\n a\n-b\n+B\n c\n";
  const auto r = trialbox::apply_patch(ws, diff, 1, artifacts);
  expect(r.ok(), "diff -u style patch applies");
  expect(read_text(ws / "calc.py") == "a\nB\nc\n", "existing new name is patched");
  expect(fs::exists(ws / "calc.py.orig") && read_text(ws / "calc.py.orig") == "a\nb\nc\n",
         "old name is left alone");
  const auto& changed = as_array(field(*r.data, "changed_files"));
  expect(changed.size() == 1 && as_string(changed[0]) == "calc.py",
         "only the patched file is reported");

  write_text(ws / "only_old.txt", "a\nb\nc\n");
  const std::string to_missing =
      "--- only_old.txt\n+++ renamed.txt\n@@ -1,3 +1,3 @@\n a\n-b\n+B\n c\n";
  expect(trialbox::apply_patch(ws, to_missing, 2, artifacts).ok(),
         "falls back to the old name");
  expect(read_text(ws / "only_old.txt") == "a\nB\nc\n", "old name patched in place");
  expect(!fs::exists(ws / "renamed.txt"), "no new file without rename headers");
}

void test_patch_git_rename() {
  const fs::path ws = fresh_dir("patch_rename");
  const fs::path artifacts = fresh_dir("patch_rename_artifacts");
  write_text(ws / "old.py", "a\nb\nc\n");
  const std::string diff = "diff --git a/old.py b/new.py\n"
                           "similarity index 80%\n"
                           "rename from old.py\n"
                           "rename to new.py\n"
                           "--- a/old.py\n+++ b/new.py\n"
                           "@@ -1,3 +1,3 @@\n a\n-b\n+B\n c\n";
  const auto patches = trialbox::parse_unified_diff(diff);
  expect(patches.size() == 1 && patches[0].rename, "rename headers recorded");
  const auto r = trialbox::apply_patch(ws, diff, 1, artifacts);
  expect(r.ok(), "rename with edits applies");
  expect(!fs::exists(ws / "old.py"), "renamed source removed");
  expect(read_text(ws / "new.py") == "a\nB\nc\n", "renamed target written");
  const auto& changed = as_array(field(*r.data, "changed_files"));
  expect(changed.size() == 2 && as_string(changed[0]) == "old.py" &&
             as_string(changed[1]) == "new.py",
         "both rename sides reported");

  write_text(ws / "plain.txt", "x\n");
  const std::string bare = "diff --git a/plain.txt b/moved.txt\n"
                           "similarity index 100%\n"
                           "rename from plain.txt\n"
                           "rename to moved.txt\n";
  expect(trialbox::apply_patch(ws, bare, 2, artifacts).ok(), "pure rename applies");
  expect(!fs::exists(ws / "plain.txt") && read_text(ws / "moved.txt") == "x\n",
         "pure rename moves the file");
}

void test_patch_counted_hunk_body() {
  const fs::path ws = fresh_dir("patch_counted");
  const fs::path artifacts = fresh_dir("patch_counted_artifacts");
  write_text(ws / "loop.c", "x = 1;\n--i;\nreturn;\n");
  const std::string diff = "--- a/loop.c\n+++ b/loop.c\n"
                           "@@ -1,3 +1,3 @@\n x = 1;\n---i;\n+++i;\n return;\n";
  std::optional<std::string> error;
  const auto patches = trialbox::parse_unified_diff(diff, &error);
  expect(!error && patches.size() == 1, "--/++ body lines do not start a file");
  expect(patches[0].hunks.size() == 1 && patches[0].hunks[0].lines.size() == 4,
         "hunk body kept whole");
  const auto r = trialbox::apply_patch(ws, diff, 1, artifacts);
  expect(r.ok(), "decrement to increment applies");
  expect(read_text(ws / "loop.c") == "x = 1;\n++i;\nreturn;\n", "line swapped");

  trialbox::parse_unified_diff("--- a/loop.c\n+++ b/loop.c\n@@ -1,3 +1,3 @@\n x = 1;\n", &error);
  expect(error.has_value(), "hunk shorter than its header is rejected");
}

void test_patch_modify() {
  const fs::path ws = fresh_dir("patch_modify");
  const fs::path artifacts = fresh_dir("patch_modify_artifacts");
  write_text(ws / "f.txt", numbered_lines(10));

  const auto r = trialbox::apply_patch(ws, hunk_at(5), 1, artifacts);
  expect(r.ok(), "exact hunk applies");
  expect(read_text(ws / "f.txt").find("\nL6\n") != std::string::npos,
         "line replaced");
  const auto& data = *r.data;
  const auto& changed = as_array(field(data, "changed_files"));
  expect(changed.size() == 1 && as_string(changed[0]) == "f.txt",
         "changed_files");
  expect(fs::exists(artifacts / "step_0001.patch"), "patch artifact kept");
  expect(as_string(field(data, "patch_digest")) ==
             trialbox::patch_digest(hunk_at(5)),
         "patch digest");
}

void test_patch_fuzz_window() {
  const fs::path ws = fresh_dir("patch_fuzz");
  const fs::path artifacts = fresh_dir("patch_fuzz_artifacts");
  write_text(ws / "f.txt", numbered_lines(20));
  const auto within = trialbox::apply_patch(ws, hunk_at(8), 1, artifacts);
  expect(within.ok(), "offset of 3 lines is accepted");

  write_text(ws / "f.txt", numbered_lines(20));
  const auto beyond = trialbox::apply_patch(ws, hunk_at(9), 2, artifacts);
  expect(!beyond.ok(), "offset of 4 lines is rejected");
  expect(beyond.error->error_type == "patch_hunk_fail", "hunk fail type");
  expect(read_text(ws / "f.txt") == numbered_lines(20),
         "rejected patch leaves file untouched");
}

void test_patch_create_delete() {
  const fs::path ws = fresh_dir("patch_create");
  const fs::path artifacts = fresh_dir("patch_create_artifacts");
  const std::string create = "--- /dev/null\n+++ b/pkg/new.txt\n@@ -0,0 +1,2 @@\n+a\n+b\n";
  const auto c = trialbox::apply_patch(ws, create, 1, artifacts);
  expect(c.ok(), "creation applies");
  expect(read_text(ws / "pkg" / "new.txt") == "a\nb\n", "created content");

  const std::string remove = "--- a/pkg/new.txt\n+++ /dev/null\n@@ -1,2 +0,0 @@\n-a\n-b\n";
  const auto d = trialbox::apply_patch(ws, remove, 2, artifacts);
  expect(d.ok(), "deletion applies");
  expect(!fs::exists(ws / "pkg" / "new.txt"), "file removed");
  const auto& changed = as_array(field(*d.data, "changed_files"));
  expect(as_string(changed[0]) == "pkg/new.txt", "deleted path reported");

  const auto again = trialbox::apply_patch(ws, create, 3, artifacts);
  expect(again.ok(), "re-creation after delete");
  const auto dup = trialbox::apply_patch(ws, create, 4, artifacts);
  expect(!dup.ok(), "creating an existing file fails");
}

void test_patch_atomic_multi_file() {
  const fs::path ws = fresh_dir("patch_atomic");
  const fs::path artifacts = fresh_dir("patch_atomic_artifacts");
  write_text(ws / "a.txt", "one\ntwo\nthree\n");
  write_text(ws / "b.txt", "alpha\nbeta\n");
  const std::string diff = "--- a/a.txt\n+++ b/a.txt\n@@ -1,3 +1,3 @@\n one\n-two\n+TWO\n three\n"
                           "--- a/b.txt\n+++ b/b.txt\n@@ -1,2 +1,2 @@\n alpha\n-gamma\n+GAMMA\n";
  const auto r = trialbox::apply_patch(ws, diff, 1, artifacts);
  expect(!r.ok(), "second file mismatch fails the patch");
  expect(read_text(ws / "a.txt") == "one\ntwo\nthree\n",
         "first file untouched after failed patch");
  expect(!fs::exists(artifacts / "step_0001.patch"),
         "no artifact for a rejected patch");
}

void test_patch_rejects_escape() {
  const fs::path ws = fresh_dir("patch_escape");
  const fs::path artifacts = fresh_dir("patch_escape_artifacts");
  const std::string diff = "--- /dev/null\n+++ b/../evil.txt\n@@ -0,0 +1 @@\n+x\n";
  const auto r = trialbox::apply_patch(ws, diff, 1, artifacts);
  expect(!r.ok(), "escaping patch rejected");
  expect(!fs::exists(ws.parent_path() / "evil.txt"), "nothing written outside");

  const auto garbage = trialbox::apply_patch(ws, "not a diff\n", 2, artifacts);
  expect(!garbage.ok() && garbage.error->error_type == "patch_parse_error",
         "headerless input is a parse error");
}

// ============================================================================
// Phase 4: JSONL log
// ============================================================================

void test_jsonl_append_and_read() {
  const fs::path dir = fresh_dir("jsonl_rw");
  const fs::path log = dir / "nested" / "log.jsonl";
  expect(trialbox::append_record(log, jsonlite::Object{{"n", 1}}), "append 1");
  expect(trialbox::append_record(log, jsonlite::Object{{"n", 2}}), "append 2");
  const auto records = trialbox::read_records(log);
  expect(records.size() == 2, "two records");
  expect(jsonlite::get_u64(records[1], "n") == 2, "order kept");

  trialbox::JsonlReader reader(log);
  size_t first = 0;
  for (const auto& r : reader) {
    (void)r;
    ++first;
  }
  trialbox::append_record(log, jsonlite::Object{{"n", 3}});
  size_t second = 0;
  for (const auto& r : reader) {
    (void)r;
    ++second;
  }
  expect(first == 2 && second == 3, "reader is restartable");
  expect(trialbox::read_records(dir / "missing.jsonl").empty(),
         "missing file reads as empty");
}

void test_jsonl_skips_malformed() {
  const fs::path dir = fresh_dir("jsonl_bad");
  const fs::path log = dir / "log.jsonl";
  write_text(log, "{\"n\":1}\n\n{bad json\n[1,2]\n{\"n\":2}\n");
  const auto records = trialbox::read_records(log);
  expect(records.size() == 2, "malformed and blank lines skipped");
  expect(jsonlite::get_u64(records[0], "n") == 1 &&
             jsonlite::get_u64(records[1], "n") == 2,
         "valid records kept");
}

void test_jsonl_lock_serializes_writers() {
  const fs::path dir = fresh_dir("jsonl_lock");
  const fs::path log = dir / "attempts.jsonl";
  std::atomic<bool> held{false};
  std::thread holder([&] {
    trialbox::FileLock lock(log);
    expect(lock.locked(), "holder acquired lock: " + lock.error());
    held = true;
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
  });
  while (!held)
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  const auto t0 = std::chrono::steady_clock::now();
  const bool ok = trialbox::append_record(log, jsonlite::Object{{"writer", "second"}});
  const auto waited = std::chrono::steady_clock::now() - t0;
  holder.join();
  expect(ok, "blocked writer eventually appends");
  expect(waited >= std::chrono::milliseconds(200),
         "second writer waited for the lock");
  expect(trialbox::read_records(log).size() == 1, "exactly one record");
}

void test_jsonl_concurrent_appends() {
  const fs::path dir = fresh_dir("jsonl_concurrent");
  const fs::path log = dir / "attempts.jsonl";
  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&log, t] {
      for (int i = 0; i < 10; ++i)
        trialbox::append_record(log, jsonlite::Object{{"t", t}, {"i", i}});
    });
  }
  for (auto& w : writers)
    w.join();
  expect(trialbox::read_records(log).size() == 40, "no lost or torn lines");
}

void test_atomic_write_errors() {
  const fs::path dir = fresh_dir("atomic_write");
  std::string err;
  expect(!trialbox::write_file_atomic(dir / "missing" / "f.txt", "x", &err),
         "missing directory fails");
  expect(err.rfind("mkstemp ", 0) == 0 && err.find(std::strerror(ENOENT)) != std::string::npos,
         "mkstemp failure names ENOENT");

  fs::create_directories(dir / "occupied" / "child");
  err.clear();
  expect(!trialbox::write_file_atomic(dir / "occupied", "x", &err),
         "a directory cannot be replaced");
  expect(err.rfind("rename ", 0) == 0, "rename step reported");
  expect(err.find(std::strerror(EISDIR)) != std::string::npos,
         "rename errno survives the temp-file cleanup, got: " + err);
  for (const auto& e : fs::directory_iterator(dir))
    expect(e.path().filename().string().rfind(".occupied.tmp-", 0) != 0,
           "temp file removed");

  expect(trialbox::write_file_atomic(dir / "ok.txt", "hello", &err), "plain write");
  expect(read_text(dir / "ok.txt") == "hello", "content written");
}

// ============================================================================
// Phase 5: Attempt ledger
// ============================================================================

void test_run_id_format() {
  const std::string a = trialbox::new_run_id();
  std::this_thread::sleep_for(std::chrono::milliseconds(3));
  const std::string b = trialbox::new_run_id();
  expect(a.size() == 26 && b.size() == 26, "26 chars");
  expect(a != b, "unique");
  expect(a.substr(0, 10) < b.substr(0, 10), "time-ordered prefix");
  expect(a.find_first_not_of("0123456789ABCDEFGHJKMNPQRSTVWXYZ") ==
             std::string::npos,
         "crockford alphabet");
}

void test_ledger_records_success() {
  const fs::path base = fresh_dir("ledger_ok");
  const trialbox::TaskSpec task = sample_task();
  trialbox::AttemptLedger ledger(task, base / "logs", "baseline");
  ledger.mark_stage(trialbox::Stage::baseline_run);
  ledger.set_exit_code(1);
  ledger.set_outcome(true);
  expect(ledger.finalize(), "appended");
  expect(ledger.finalize(), "finalize idempotent");

  const auto records = trialbox::read_records(base / "attempts.jsonl");
  expect(records.size() == 1, "exactly one line after double finalize");
  const auto rec = trialbox::AttemptRecord::from_json(records[0]);
  expect(rec.run_id == ledger.run_id(), "run id");
  expect(rec.result.passed && rec.result.exit_code == 1, "outcome");
  expect(!rec.result.failure_reason, "no reason on success");
  expect(rec.baseline_validation.attempted, "attempted");
  expect(rec.limits.timeout_sec == 30, "limits from task");
  expect(rec.schema_version == "0.1.0", "schema version");
  expect(rec.variant == "baseline", "variant");
}

void test_ledger_crash_safety() {
  const fs::path base = fresh_dir("ledger_crash");
  const trialbox::TaskSpec task = sample_task();
  bool rethrown = false;
  try {
    trialbox::AttemptLedger ledger(task, base / "logs", "baseline");
    trialbox::run_attempt(ledger, [&] {
      ledger.mark_stage(trialbox::Stage::git_clone);
      ledger.add_artifact("clone_stdout", (base / "logs" / "git_clone_stdout.txt").string());
      throw std::runtime_error("boom");
    });
  } catch (const std::runtime_error& e) {
    rethrown = std::string(e.what()) == "boom";
  }
  expect(rethrown, "original exception propagates unchanged");

  const auto records = trialbox::read_records(base / "attempts.jsonl");
  expect(records.size() == 1, "one record after crash");
  const auto rec = trialbox::AttemptRecord::from_json(records[0]);
  expect(rec.result.failure_reason == trialbox::FailureReason::unknown,
         "generic fault is UNKNOWN");
  expect(rec.result.exit_code == -1, "unobserved exit code is -1");
  expect(!rec.result.passed, "not passed");
  expect(rec.artifact_paths.size() == 1 &&
             rec.artifact_paths.count("clone_stdout") == 1,
         "only the artifacts produced so far");
}

void test_ledger_destructor_finalizes() {
  const fs::path base = fresh_dir("ledger_dtor");
  const trialbox::TaskSpec task = sample_task();
  try {
    trialbox::AttemptLedger ledger(task, base / "logs", "baseline");
    ledger.set_exit_code(2);
    throw std::logic_error("unwind");
  } catch (const std::logic_error&) {
  }
  const auto records = trialbox::read_records(base / "attempts.jsonl");
  expect(records.size() == 1, "destructor wrote the record");
  const auto rec = trialbox::AttemptRecord::from_json(records[0]);
  expect(rec.result.failure_reason == trialbox::FailureReason::unknown,
         "unwinding scope recorded as UNKNOWN");
}

void test_ledger_interrupt() {
  const fs::path base = fresh_dir("ledger_interrupt");
  const trialbox::TaskSpec task = sample_task();
  bool caught = false;
  try {
    trialbox::AttemptLedger ledger(task, base / "logs", "baseline");
    trialbox::run_attempt(ledger, [] { throw trialbox::InterruptedError(); });
  } catch (const trialbox::InterruptedError&) {
    caught = true;
  }
  expect(caught, "interrupt rethrown");
  const auto rec = trialbox::AttemptRecord::from_json(
      trialbox::read_records(base / "attempts.jsonl").at(0));
  expect(rec.result.failure_reason == trialbox::FailureReason::interrupted,
         "INTERRUPTED recorded");
}

void test_ledger_explicit_reason_wins() {
  const fs::path base = fresh_dir("ledger_reason");
  const trialbox::TaskSpec task = sample_task();
  try {
    trialbox::AttemptLedger ledger(task, base / "logs", "baseline");
    trialbox::run_attempt(ledger, [&] {
      ledger.set_failure_reason(trialbox::FailureReason::setup_failed);
      ledger.set_failure_reason(trialbox::FailureReason::tests_failed);
      ledger.classify_failure(trialbox::FailureReason::sandbox_error);
      throw trialbox::InterruptedError();
    });
  } catch (const trialbox::InterruptedError&) {
  }
  const auto rec = trialbox::AttemptRecord::from_json(
      trialbox::read_records(base / "attempts.jsonl").at(0));
  expect(rec.result.failure_reason == trialbox::FailureReason::setup_failed,
         "first explicit reason survives later faults");
}

std::unique_ptr<trialbox::AttemptLedger> ledger_for(const std::string& id,
                                                     const fs::path& logs) {
  const trialbox::TaskSpec task = sample_task(id);
  return std::make_unique<trialbox::AttemptLedger>(task, logs, "baseline");
}

void test_ledger_outlives_task() {
  const fs::path base = fresh_dir("ledger_outlives_task");
  auto ledger = ledger_for("short-lived", base / "logs");
  ledger->set_exit_code(1);
  ledger->set_outcome(true);
  expect(ledger->finalize(), "appended");
  const auto rec = trialbox::AttemptRecord::from_json(
      trialbox::read_records(base / "attempts.jsonl").at(0));
  expect(rec.task_id == "short-lived" && rec.suite == "demo",
         "task fields come from the ledger's own copy");
  expect(rec.limits.timeout_sec == 30, "limits from the copied task");

  trialbox::AttemptLedger direct(sample_task("temporary"), base / "logs", "baseline");
  direct.finalize();
  expect(direct.record().task_id == "temporary", "temporary task argument");
}

void test_ledger_external_baseline() {
  const fs::path base = fresh_dir("ledger_baseline");
  const trialbox::TaskSpec task = sample_task();
  trialbox::AttemptLedger ledger(task, base / "logs", "scripted");
  ledger.set_baseline(trialbox::BaselineValidation{true, true, 1});
  ledger.mark_stage(trialbox::Stage::final_test);
  ledger.set_exit_code(0);
  ledger.set_outcome(true);
  ledger.finalize();
  const auto& rec = ledger.record();
  expect(rec.baseline_validation.attempted && rec.baseline_validation.failure_as_expected,
         "baseline recorded as given");
  expect(rec.baseline_validation.exit_code == 1, "baseline exit code kept");
  expect(rec.result.passed && rec.result.exit_code == 0, "final outcome separate");
}

void test_attempt_record_parsing() {
  trialbox::AttemptRecord r;
  r.run_id = "01ARZ3NDEKTSV4RRFFQ69G5FAV";
  r.task_id = "t";
  r.suite = "s";
  r.variant = "baseline";
  r.schema_version = "0.1.0";
  r.result.failure_reason = trialbox::FailureReason::tests_failed;
  jsonlite::Object obj = r.to_json();
  obj["added_by_newer_writer"] = "ignored";
  const auto back = trialbox::AttemptRecord::from_json(obj);
  expect(back.result.failure_reason == trialbox::FailureReason::tests_failed,
         "reason parsed");
  expect(back.result.exit_code == -1, "-1 survives JSON");

  jsonlite::Object renamed = r.to_json();
  std::get<jsonlite::Object>(renamed["result"].v)["failure_reason"] =
      "FROM_THE_FUTURE";
  expect(trialbox::AttemptRecord::from_json(renamed).result.failure_reason ==
             trialbox::FailureReason::unknown,
         "unknown reason reads as UNKNOWN");

  jsonlite::Object broken = r.to_json();
  broken.erase("task_id");
  bool threw = false;
  try {
    trialbox::AttemptRecord::from_json(broken);
  } catch (const trialbox::Error& e) {
    threw = e.code() == trialbox::ErrorCode::json_parse_error;
  }
  expect(threw, "missing required field raises json_parse_error");
}

// ============================================================================
// Phase 6: Process sandbox
// ============================================================================

void test_run_process_exit_and_logs() {
  const fs::path dir = fresh_dir("proc_basic");
  trialbox::ProcessSpec spec;
  spec.argv = {"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"};
  spec.timeout_sec = 10;
  spec.stdout_path = (dir / "out.txt").string();
  spec.stderr_path = (dir / "err.txt").string();
  const auto r = trialbox::run_process(spec);
  expect(r.ok(), "spawned");
  expect(r.exit_code == 3 && !r.timed_out, "exit code passed through");
  expect(read_text(dir / "out.txt") == "out\n", "stdout captured");
  expect(read_text(dir / "err.txt") == "err\n", "stderr captured");
}

void test_run_process_timeout() {
  const fs::path dir = fresh_dir("proc_timeout");
  trialbox::ProcessSpec spec;
  spec.argv = {"/bin/sh", "-c", "echo started; sleep 30"};
  spec.timeout_sec = 1;
  spec.stdout_path = (dir / "out.txt").string();
  spec.stderr_path = (dir / "err.txt").string();
  const auto t0 = std::chrono::steady_clock::now();
  const auto r = trialbox::run_process(spec);
  expect(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(10),
         "killed promptly");
  expect(r.timed_out && r.exit_code == 124, "timeout forces 124");
  expect(read_text(dir / "out.txt") == "started\n", "partial output kept");
  expect(read_text(dir / "err.txt").find("Execution timed out after 1 seconds") !=
             std::string::npos,
         "timeout marker appended");
}

void test_run_process_spawn_failure() {
  const fs::path dir = fresh_dir("proc_spawn");
  trialbox::ProcessSpec spec;
  spec.argv = {"/nonexistent/trialbox-no-such-binary"};
  spec.stdout_path = (dir / "out.txt").string();
  spec.stderr_path = (dir / "err.txt").string();
  const auto r = trialbox::run_process(spec);
  expect(!r.ok() && r.error_code == trialbox::ErrorCode::spawn_failed,
         "spawn failure is reported, not an exit code");
}

// /dev/null descriptors >= 3 that a child of this process would inherit.
size_t inheritable_devnull_fds() {
  size_t n = 0;
  std::error_code ec;
  for (fs::directory_iterator it("/proc/self/fd", ec), end; !ec && it != end; it.increment(ec)) {
    int fd = -1;
    try {
      fd = std::stoi(it->path().filename().string());
    } catch (const std::exception&) {
      continue;
    }
    std::error_code lec;
    if (fd < 3 || fs::read_symlink(it->path(), lec) != "/dev/null")
      continue;
    const int flags = ::fcntl(fd, F_GETFD);
    if (flags >= 0 && (flags & FD_CLOEXEC) == 0)
      ++n;
  }
  return n;
}

void test_run_process_descriptors() {
  const fs::path dir = fresh_dir("proc_fds");
  trialbox::ProcessSpec spec;
  spec.argv = {"/bin/sh", "-c", "ls -l /proc/$$/fd | grep -c -- ' -> /dev/null$'"};
  spec.timeout_sec = 10;
  spec.stdout_path = (dir / "out.txt").string();
  spec.stderr_path = (dir / "err.txt").string();
  const size_t expected = 1 + inheritable_devnull_fds();
  const auto r = trialbox::run_process(spec);
  expect(r.ok() && r.exit_code == 0, "listing ran");
  expect(read_text(dir / "out.txt") == std::to_string(expected) + "\n",
         "only stdin refers to /dev/null in the child, got: " + read_text(dir / "out.txt"));
}

void test_container_argv() {
  const auto argv = trialbox::build_container_argv(
      "docker", "python:3.11", "/workspace", "/tmp/ws",
      trialbox::NetworkMode::none, "cd repo && pytest");
  const std::vector<std::string> want = {
      "docker", "run", "--rm", "--network", "none", "-v", "/tmp/ws:/workspace",
      "-w", "/workspace", "python:3.11", "bash", "-lc", "cd repo && pytest"};
  expect(argv == want, "container argv layout");
  expect(trialbox::parse_network_mode("bridge") == trialbox::NetworkMode::bridge,
         "bridge parses");
  bool threw = false;
  try {
    trialbox::parse_network_mode("host");
  } catch (const trialbox::Error& e) {
    threw = e.code() == trialbox::ErrorCode::invalid_network;
  }
  expect(threw, "host network rejected");
}

void test_container_missing_workspace() {
  const fs::path dir = fresh_dir("container_missing");
  trialbox::SandboxConfig cfg;
  cfg.runtime = fake_runtime(dir).string();
  const trialbox::ContainerSandbox sandbox("img", "/workspace", cfg);
  bool threw = false;
  try {
    sandbox.run(dir / "nope", "true", trialbox::NetworkMode::none, 5,
                dir / "o.txt", dir / "e.txt");
  } catch (const trialbox::Error& e) {
    threw = e.code() == trialbox::ErrorCode::workspace_missing;
  }
  expect(threw, "missing workspace raises workspace_missing");
}

// ============================================================================
// Phase 7: Task loading
// ============================================================================

void test_load_task() {
  const fs::path dir = fresh_dir("loader_ok");
  write_text(dir / "task.yaml", task_yaml("t1", "https://example.invalid/r.git"));
  const auto t = trialbox::load_task(dir / "task.yaml");
  expect(t.id == "t1" && t.suite == "demo", "ids");
  expect(t.repo.commit == "1234567", "numeric commit kept as text");
  expect(t.environment.timeout_sec == 300, "timeout");
  expect(t.setup_commands.size() == 1, "setup commands");
  expect(t.run_command == "pytest -q", "run command");
}

void expect_invalid(const fs::path& p, const std::string& needle) {
  bool threw = false;
  try {
    trialbox::load_task(p);
  } catch (const trialbox::Error& e) {
    threw = e.code() == trialbox::ErrorCode::invalid_task &&
            std::string(e.what()).find(needle) != std::string::npos;
    if (!threw)
      std::cerr << "\n    got: " << e.what() << "\n";
  }
  expect(threw, "expected invalid_task mentioning '" + needle + "'");
}

void test_load_task_errors() {
  const fs::path dir = fresh_dir("loader_bad");
  std::string no_url = task_yaml("t", "x");
  no_url.replace(no_url.find("  url: x\n"), 9, "");
  write_text(dir / "a.yaml", no_url);
  expect_invalid(dir / "a.yaml", "Missing key: repo.url");

  std::string bad_timeout = task_yaml("t", "x");
  bad_timeout.replace(bad_timeout.find("300"), 3, "soon");
  write_text(dir / "b.yaml", bad_timeout);
  expect_invalid(dir / "b.yaml", "must be of type int");

  write_text(dir / "c.yaml", "- just\n- a list\n");
  expect_invalid(dir / "c.yaml", "root must be a mapping");

  expect_invalid(dir / "missing.yaml", "cannot open file");
}

void test_load_task_agent_section() {
  const fs::path dir = fresh_dir("loader_agent");
  const std::string agent = "agent:\n"
                            "  entrypoint: scripted\n"
                            "  max_steps: 7\n"
                            "  script: steps.jsonl\n";
  write_text(dir / "task.yaml", task_yaml("t1", "u") + agent);
  const auto t = trialbox::load_task(dir / "task.yaml");
  expect(t.agent.has_value(), "agent section parsed");
  expect(t.agent->entrypoint == "scripted" && t.agent->max_steps == 7, "agent fields");
  expect(t.agent->script == "steps.jsonl", "script path kept verbatim");

  write_text(dir / "plain.yaml", task_yaml("t2", "u"));
  expect(!trialbox::load_task(dir / "plain.yaml").agent, "agent section optional");

  std::string zero = task_yaml("t3", "u") + agent;
  zero.replace(zero.find("max_steps: 7"), 12, "max_steps: 0");
  write_text(dir / "zero.yaml", zero);
  expect_invalid(dir / "zero.yaml", "agent.max_steps' must be positive");
}

void test_discover_suite() {
  const fs::path root = fresh_dir("loader_suite");
  write_text(root / "demo" / "b" / "task.yaml", task_yaml("b", "u"));
  write_text(root / "demo" / "a" / "task.yaml", task_yaml("a", "u"));
  write_text(root / "demo" / "broken" / "task.yaml", "id: broken\n");
  fs::create_directories(root / "demo" / "empty");

  const auto found = trialbox::discover_tasks(root / "demo");
  expect(found.size() == 3, "three task.yaml files");
  expect(found[0].parent_path().filename() == "a", "sorted");

  const auto tasks = trialbox::load_suite(root, "demo");
  expect(tasks.size() == 2, "invalid task skipped");

  bool threw = false;
  try {
    trialbox::discover_tasks(root / "nope");
  } catch (const trialbox::Error& e) {
    threw = e.code() == trialbox::ErrorCode::suite_not_found;
  }
  expect(threw, "missing suite raises suite_not_found");
}

// ============================================================================
// Phase 8: Baseline validation
// ============================================================================

trialbox::AttemptRecord only_attempt(const fs::path& attempts) {
  const auto records = trialbox::read_records(attempts);
  expect(records.size() == 1, "exactly one attempt line");
  return trialbox::AttemptRecord::from_json(records[0]);
}

void test_validator_valid_baseline() {
  const fs::path base = fresh_dir("validator_valid");
  const auto task = sample_task();
  ScriptedExecutor exec;
  exec.run_exit = 1;
  const auto r = trialbox::validate_baseline(task, base / "ws", base / "logs", exec);
  expect(r.valid && !r.error_reason, "failing baseline is valid");
  expect(r.exit_code == 1, "run exit code");
  expect(exec.calls.size() == 4, "all four stages ran");
  expect(exec.commands[0] == "cd repo && pip install -e . && pip install pytest",
         "setup command joined");
  expect(exec.commands[1] == "cd repo && pytest -q", "run command");
  const auto rec = only_attempt(base / "attempts.jsonl");
  expect(rec.result.passed && !rec.result.failure_reason, "record valid");
  expect(rec.artifact_paths.size() == 8, "stdout/stderr for every stage");
}

void test_validator_baseline_passed() {
  const fs::path base = fresh_dir("validator_passed");
  ScriptedExecutor exec;
  exec.run_exit = 0;
  const auto r = trialbox::validate_baseline(sample_task(), base / "ws", base / "logs", exec);
  expect(!r.valid && r.error_reason == std::string("baseline_passed"),
         "passing baseline is invalid");
  expect(only_attempt(base / "attempts.jsonl").result.failure_reason ==
             trialbox::FailureReason::baseline_not_failing,
         "wire reason");
}

void test_validator_setup_timeout_stops() {
  const fs::path base = fresh_dir("validator_setup_timeout");
  ScriptedExecutor exec;
  exec.setup_exit = 124;
  const auto r = trialbox::validate_baseline(sample_task(), base / "ws", base / "logs", exec);
  expect(!r.valid && r.error_reason == std::string("setup_timeout"),
         "setup timeout");
  expect(exec.calls.back() == "setup", "run stage never attempted");
  const auto rec = only_attempt(base / "attempts.jsonl");
  expect(rec.artifact_paths.count("run_stdout") == 0, "no run artifacts");
}

void test_validator_clone_failure() {
  const fs::path base = fresh_dir("validator_clone");
  ScriptedExecutor exec;
  exec.clone_exit = 128;
  const auto r = trialbox::validate_baseline(sample_task(), base / "ws", base / "logs", exec);
  expect(r.error_reason == std::string("git_clone_failed"), "clone reason");
  expect(exec.calls.size() == 1, "pipeline stopped after clone");
  expect(r.stderr_path == (base / "logs" / "git_clone_stderr.txt").string(),
         "last stage logs reported");
}

void test_validator_no_tests_collected() {
  const fs::path base = fresh_dir("validator_no_tests");
  ScriptedExecutor exec;
  exec.run_exit = 5;
  const auto r = trialbox::validate_baseline(sample_task(), base / "ws", base / "logs", exec);
  expect(!r.valid && r.error_reason == std::string("no_tests_collected"),
         "exit 5 is not a valid baseline");
}

void test_validator_sandbox_fault() {
  const fs::path base = fresh_dir("validator_sandbox");
  ScriptedExecutor exec;
  exec.setup_throws_sandbox_error = true;
  bool threw = false;
  try {
    trialbox::validate_baseline(sample_task(), base / "ws", base / "logs", exec);
  } catch (const trialbox::Error& e) {
    threw = e.code() == trialbox::ErrorCode::sandbox_error;
  }
  expect(threw, "sandbox fault propagates");
  expect(only_attempt(base / "attempts.jsonl").result.failure_reason ==
             trialbox::FailureReason::sandbox_error,
         "sandbox fault recorded before rethrow");
}

void test_validator_interrupt() {
  const fs::path base = fresh_dir("validator_interrupt");
  ScriptedExecutor exec;
  exec.interrupt_during_setup = true;
  bool threw = false;
  try {
    trialbox::validate_baseline(sample_task(), base / "ws", base / "logs", exec);
  } catch (const trialbox::InterruptedError&) {
    threw = true;
  }
  trialbox::clear_interrupt();
  expect(threw, "interrupt propagates");
  expect(exec.calls.back() == "setup", "stopped before the run stage");
  expect(only_attempt(base / "attempts.jsonl").result.failure_reason ==
             trialbox::FailureReason::interrupted,
         "INTERRUPTED recorded");
}

// ============================================================================
// Phase 9: Task and suite runs
// ============================================================================

void test_run_task_writes_run_json() {
  const fs::path base = fresh_dir("run_task");
  write_text(base / "task.yaml", task_yaml("t1", "https://example.invalid/r.git"));
  ScriptedExecutor exec;
  const fs::path run_dir = trialbox::run_task(base / "task.yaml", base / "out", exec);
  expect(fs::exists(run_dir / "task" / "task.yaml"), "task copied");
  expect(fs::exists(run_dir / "attempts.jsonl"), "attempt logged at run level");

  std::optional<jsonlite::JsonError> err;
  const auto run = jsonlite::parse(read_text(run_dir / "run.json"), &err);
  expect(!err, "run.json parses");
  expect(as_string(field(run, "task_id")) == "t1", "task id");
  expect(as_string(field(run, "repo_commit")) == "1234567", "commit");
  const auto& validation = as_object(field(run, "validation"));
  expect(jsonlite::get_bool(validation, "valid"), "valid baseline");
  const auto& digests = as_object(field(run, "artifact_digests"));
  expect(digests.count("run_stdout.txt") == 1, "log digests recorded");
  expect(as_string(digests.at("run_stdout.txt")) ==
             *trialbox::hash_file_blake3_hex((run_dir / "logs" / "run_stdout.txt").string()),
         "digest matches file");
}

void test_run_task_stage_failure() {
  const fs::path base = fresh_dir("run_task_fail");
  write_text(base / "task.yaml", task_yaml("t1", "u"));
  ScriptedExecutor exec;
  exec.setup_exit = 1;
  bool threw = false;
  try {
    trialbox::run_task(base / "task.yaml", base / "out", exec);
  } catch (const trialbox::Error& e) {
    threw = e.code() == trialbox::ErrorCode::stage_failed;
  }
  expect(threw, "setup failure raises stage_failed");
  size_t run_json = 0;
  for (const auto& e : fs::recursive_directory_iterator(base / "out"))
    if (e.path().filename() == "run.json")
      ++run_json;
  expect(run_json == 1, "run.json written before raising");
}

void test_run_suite_counts() {
  const fs::path root = fresh_dir("suite_counts");
  write_text(root / "tasks" / "demo" / "a" / "task.yaml", task_yaml("a", "url-a"));
  write_text(root / "tasks" / "demo" / "b" / "task.yaml", task_yaml("b", "url-b"));
  write_text(root / "tasks" / "demo" / "c" / "task.yaml", task_yaml("c", "url-c"));
  ScriptedExecutor exec;
  exec.run_exit_by_url = {{"url-a", 1}, {"url-b", 0}, {"url-c", 124}};

  const auto summary = trialbox::run_suite("demo", root / "tasks", root / "out", exec);
  expect(summary.has_value(), "summary returned");
  expect(summary->task_count == 3, "task count");
  expect(summary->valid_count == 1 && summary->invalid_count == 2, "valid/invalid");
  expect(summary->not_attempted == 0 && !summary->interrupted, "all attempted");
  expect(summary->failure_counts.at("BASELINE_NOT_FAILING") == 1 &&
             summary->failure_counts.at("TIMEOUT") == 1,
         "failure counts");
  expect(summary->dominant_failure == trialbox::FailureReason::baseline_not_failing,
         "dominant reason by precedence");
  expect(trialbox::read_records(summary->run_dir / "attempts.jsonl").size() == 3,
         "one attempt per task in the suite log");
  expect(fs::exists(summary->run_dir / "run.json"), "suite run.json");
  expect(fs::exists(summary->run_dir / "a" / "run_stdout.txt"), "per-task logs");
}

void test_run_suite_interrupt() {
  const fs::path root = fresh_dir("suite_interrupt");
  for (const char* id : {"a", "b", "c"})
    write_text(root / "tasks" / "demo" / id / "task.yaml", task_yaml(id, std::string("url-") + id));
  ScriptedExecutor exec;
  exec.interrupt_during_setup = true;
  const auto summary = trialbox::run_suite("demo", root / "tasks", root / "out", exec);
  trialbox::clear_interrupt();
  expect(summary.has_value() && summary->interrupted, "suite interrupted");
  expect(summary->results.size() == 1, "only the first task ran");
  expect(summary->not_attempted == 2, "remaining tasks not attempted");
  expect(summary->results[0].error_reason == std::string("interrupted"),
         "in-flight task recorded as interrupted");
  const auto rec = only_attempt(summary->run_dir / "attempts.jsonl");
  expect(rec.result.failure_reason == trialbox::FailureReason::interrupted,
         "in-flight attempt finalized");
}

void test_run_suite_fault_continues() {
  const fs::path root = fresh_dir("suite_fault");
  write_text(root / "tasks" / "demo" / "a" / "task.yaml", task_yaml("a", "url-a"));
  write_text(root / "tasks" / "demo" / "b" / "task.yaml", task_yaml("b", "url-b"));
  ScriptedExecutor exec;
  exec.setup_throws_sandbox_error = true;
  const auto summary = trialbox::run_suite("demo", root / "tasks", root / "out", exec);
  expect(summary->results.size() == 2, "suite continued after a fault");
  expect(summary->failure_counts.at("SANDBOX_ERROR") == 2, "faults counted");

  const fs::path empty = fresh_dir("suite_empty");
  fs::create_directories(empty / "tasks" / "none");
  expect(!trialbox::run_suite("none", empty / "tasks", empty / "out", exec),
         "empty suite yields no summary");
}

void test_task_dir_names_distinct() {
  expect(trialbox::task_dir_name("plain-id") == "plain-id", "plain ids unchanged");
  expect(trialbox::task_dir_name("a/b_c") == "a%2Fb_c", "slash escaped");
  expect(trialbox::task_dir_name("a/b_c") != trialbox::task_dir_name("a_b/c"),
         "separator and underscore stay distinct");
  expect(trialbox::task_dir_name("a%2Fb_c") == "a%252Fb_c", "escape character escaped");
  expect(trialbox::task_dir_name("a\\b") == "a%5Cb", "backslash escaped");
  std::set<std::string> names;
  for (const char* id : {"", ".", "..", "%", "%2E"})
    names.insert(trialbox::task_dir_name(id));
  expect(names.size() == 5, "special ids get distinct names");
  expect(names.count(".") == 0 && names.count("..") == 0 && names.count("") == 0,
         "no name leaves the run directory");

  const fs::path root = fresh_dir("suite_dir_names");
  write_text(root / "tasks" / "demo" / "x" / "task.yaml", task_yaml("a/b_c", "url-x"));
  write_text(root / "tasks" / "demo" / "y" / "task.yaml", task_yaml("a_b/c", "url-y"));
  ScriptedExecutor exec;
  const auto summary = trialbox::run_suite("demo", root / "tasks", root / "out", exec);
  expect(summary && summary->valid_count == 2, "both tasks ran");
  expect(fs::exists(summary->run_dir / "a%2Fb_c" / "run_stdout.txt") &&
             fs::exists(summary->run_dir / "a_b%2Fc" / "run_stdout.txt"),
         "each task keeps its own log directory");
}

// ============================================================================
// Phase 10: Agent tools
// ============================================================================

void test_deadline() {
  const trialbox::Deadline spent(std::chrono::milliseconds(0));
  expect(spent.expired(), "zero budget is already expired");

  trialbox::Deadline budget(trialbox::Deadline::seconds(60));
  expect(!budget.expired() && budget.budget_sec() == 60, "fresh deadline");
  budget.check("list_files");
  budget.cancel();
  expect(budget.expired(), "cancel expires the deadline");
  bool threw = false;
  try {
    budget.check("list_files");
  } catch (const trialbox::Error& e) {
    threw = e.code() == trialbox::ErrorCode::timeout &&
            std::string(e.what()).find("timed out after 60 seconds") != std::string::npos;
  }
  expect(threw, "check raises timeout naming the budget");
}

fs::path tool_workspace() {
  const fs::path ws = fresh_dir("tools_ws");
  write_text(ws / "README.md", "Hello world\n");
  write_text(ws / "src" / "app.py", "import os\n\ndef hello():\n    return 'HELLO'\n");
  write_text(ws / "src" / "util.py", "# nothing here\n");
  write_text(ws / ".git" / "HEAD", "ref: refs/heads/main\n");
  write_text(ws / "blob.bin", std::string("\x00\x01\x02", 3));
  return ws;
}

void test_tool_list_files() {
  const fs::path ws = tool_workspace();
  trialbox::ListFilesParams p;
  p.glob = "src/*.py";
  const auto r = trialbox::list_files("req_1", ws, p);
  expect(r.ok(), "list ok");
  const auto& files = as_array(field(*r.data, "files"));
  expect(files.size() == 2 && as_string(files[0]) == "src/app.py",
         "workspace-relative sorted files");

  trialbox::ListFilesParams escape;
  escape.root = "..";
  const auto e = trialbox::list_files("req_2", ws, escape);
  expect(!e.ok() && e.error->error_type == "path_escape", "root escape");
}

void test_tool_read_file() {
  const fs::path ws = tool_workspace();
  const auto r = trialbox::read_file("req_1", ws, {"src/app.py"});
  expect(r.ok(), "read ok");
  expect(as_string(field(*r.data, "content")).find("def hello") != std::string::npos,
         "content");
  expect(!jsonlite::get_bool(*r.data, "truncated"), "not truncated");

  const auto missing = trialbox::read_file("req_2", ws, {"nope.txt"});
  expect(!missing.ok() && missing.error->error_type == "file_not_found", "missing");
  const auto binary = trialbox::read_file("req_3", ws, {"blob.bin"});
  expect(!binary.ok() && binary.error->error_type == "binary_file", "binary");
  const auto escape = trialbox::read_file("req_4", ws, {"../../etc/passwd"});
  expect(!escape.ok() && escape.error->error_type == "path_escape", "escape");
}

void test_tool_read_file_truncation() {
  const fs::path ws = fresh_dir("tools_big");
  std::string big;
  for (int i = 1; i <= 12000; ++i)
    big += "line " + std::to_string(i) + "\n";
  write_text(ws / "big.txt", big);
  const auto r = trialbox::read_file("req", ws, {"big.txt"});
  expect(r.ok(), "big read ok");
  expect(jsonlite::get_bool(*r.data, "truncated"), "truncated");
  expect(jsonlite::get_u64(*r.data, "total_lines") == 12000, "total lines");
  expect(as_string(field(*r.data, "lines_included")) == "1-5000, 7001-12000",
         "kept ranges");
  const std::string content = as_string(field(*r.data, "content"));
  expect(content.find("... [truncated] ...") != std::string::npos, "marker");
  expect(content.find("line 6000\n") == std::string::npos, "middle dropped");
}

void test_tool_search() {
  const fs::path ws = tool_workspace();
  trialbox::SearchParams p;
  p.query = "hello";
  p.glob = "*.py";
  p.context_lines = 1;
  const auto r = trialbox::search("req", ws, p);
  expect(r.ok(), "search ok");
  const auto& matches = as_array(field(*r.data, "matches"));
  expect(matches.size() == 2, "case-insensitive matches in python files only");
  const auto& first = as_object(matches[0]);
  expect(as_string(field(first, "file")) == "src/app.py", "file");
  expect(jsonlite::get_u64(first, "line") == 3, "line number");
  expect(as_array(field(first, "context_before")).size() == 1, "context before");

  p.max_results = 1;
  const auto capped = trialbox::search("req", ws, p);
  expect(jsonlite::get_bool(*capped.data, "truncated"), "truncated at cap");
  expect(jsonlite::get_u64(*capped.data, "total_matches") == 1, "total capped");

  p.query.clear();
  expect(!trialbox::search("req", ws, p).ok(), "empty query rejected");
}

void test_tool_run() {
  const fs::path base = fresh_dir("tools_run");
  const fs::path ws = base / "ws";
  fs::create_directories(ws);
  trialbox::SandboxConfig cfg;
  cfg.runtime = fake_runtime(base).string();
  const trialbox::ContainerSandbox sandbox("img", "/workspace", cfg);

  trialbox::RunParams ok_params;
  ok_params.command = "echo hello";
  const auto ok = trialbox::run_tool(ws, ok_params, sandbox, 7, base / "artifacts");
  expect(ok.ok(), "command succeeded");
  expect(ok.request_id == "tool_step_0007", "request id");
  expect(read_text(base / "artifacts" / "logs" / "tool_step_0007_stdout.txt") == "hello\n",
         "stdout artifact");

  trialbox::RunParams fail_params;
  fail_params.command = "exit 1";
  const auto failed = trialbox::run_tool(ws, fail_params, sandbox, 8, base / "artifacts");
  expect(!failed.ok() && failed.error->error_type == "abnormal_exit", "abnormal exit");
  expect(failed.exit_code == 1, "exit code kept");

  trialbox::RunParams slow;
  slow.command = "sleep 30";
  slow.timeout_sec = 1;
  const auto timed = trialbox::run_tool(ws, slow, sandbox, 9, base / "artifacts");
  expect(!timed.ok() && timed.error->error_type == "timeout", "timeout");
  expect(jsonlite::get_i64(timed.error->details, "timeout_sec") == 1, "timeout details");

  const auto missing = trialbox::run_tool(base / "gone", ok_params, sandbox, 10, base / "artifacts");
  expect(!missing.ok() && missing.error->error_type == "workspace_missing",
         "missing workspace reported as a tool error");
}

void test_tool_apply_patch() {
  const fs::path ws = tool_workspace();
  const fs::path artifacts = fresh_dir("tools_patch_artifacts");
  const std::string diff =
      "--- a/src/util.py\n+++ b/src/util.py\n@@ -1 +1 @@\n-# nothing here\n+# something here\n";
  const auto r = trialbox::apply_patch_tool(ws, diff, 3, artifacts);
  expect(r.ok(), "patch tool ok");
  expect(fs::exists(artifacts / "diffs" / "step_0003.patch"), "diff kept under diffs/");
}

void test_truncate_output() {
  const auto small = trialbox::truncate_output("short\n");
  expect(!small.second && small.first == "short\n", "small output untouched");

  std::string big;
  for (int i = 0; i < 3000; ++i)
    big += "output line " + std::to_string(i) + " padded with some extra text.\n";
  const auto cut = trialbox::truncate_output(big);
  expect(cut.second, "large output truncated");
  expect(cut.first.find("... [1000 lines truncated] ...") != std::string::npos,
         "marker counts dropped lines");
  expect(cut.first.rfind("output line 0 ", 0) == 0, "head kept");
  expect(cut.first.find("output line 2999 ") != std::string::npos, "tail kept");
}

// ============================================================================
// Phase 11: Event log and observability
// ============================================================================

void test_event_logger() {
  const fs::path dir = fresh_dir("events");
  trialbox::EventLogger events("RUN1", dir / "events.jsonl");
  expect(events.log_task_started("t1") == 1, "first step id");
  expect(events.log_tests_started("pytest") == 2, "second step id");
  expect(events.log_tests_finished(1, false) == 3, "third step id");
  const auto records = trialbox::read_records(dir / "events.jsonl");
  expect(records.size() == 3, "three events");
  expect(jsonlite::get_string(records[0], "event_type") == "task_started", "type");
  expect(jsonlite::get_string(records[2], "run_id") == "RUN1", "run id");
  expect(jsonlite::get_u64(records[2], "step_id") == 3, "step id persisted");
  const auto* payload = jsonlite::get_object(records[2], "payload");
  expect(payload && field(*payload, "stdout_path").is_null(), "optional paths null");
}

void test_stats_json() {
  const std::string json = trialbox::global_harness_stats().to_json();
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(json, &err);
  expect(!err, "stats JSON parses");
  expect(obj.count("attempts_recorded") == 1, "attempt counter exposed");
  expect(jsonlite::get_u64(obj, "attempts_recorded") > 0, "attempts were counted");
}

void test_blake3_vectors() {
  expect(trialbox::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(trialbox::patch_digest("x") != trialbox::blake3_hex("x"),
         "patch digest is domain separated");
}

// ============================================================================
// Phase 12: Agent runs and command line
// ============================================================================

const char* const kCalcFix = "--- a/calc.py\n"
                             "+++ b/calc.py\n"
                             "@@ -1,2 +1,2 @@\n"
                             " def add(a, b):\n"
                             "-    return a - b\n"
                             "+    return a + b\n";

const char* const kNewFile = "--- /dev/null\n"
                             "+++ b/fix.txt\n"
                             "@@ -0,0 +1,1 @@\n"
                             "+fixed\n";

std::string script_line(const std::string& tool, jsonlite::Object params) {
  return jsonlite::to_json(jsonlite::Object{{"tool", tool}, {"params", std::move(params)}}) + "\n";
}

trialbox::SandboxConfig fake_config(const fs::path& dir) {
  trialbox::SandboxConfig cfg;
  cfg.runtime = fake_runtime(dir).string();
  return cfg;
}

std::vector<std::string> event_types(const fs::path& events_file) {
  std::vector<std::string> out;
  for (const auto& r : trialbox::read_records(events_file))
    out.push_back(jsonlite::get_string(r, "event_type"));
  return out;
}

size_t count_of(const std::vector<std::string>& items, const std::string& item) {
  return static_cast<size_t>(std::count(items.begin(), items.end(), item));
}

void test_agent_script_loading() {
  const fs::path dir = fresh_dir("agent_script");
  write_text(dir / "ok.jsonl", script_line("read_file", {{"path", "calc.py"}}) + "\n" +
                                   script_line("run", {{"command", "pytest -q"}, {"timeout_sec", 30}}));
  const auto steps = trialbox::load_agent_script(dir / "ok.jsonl");
  expect(steps.size() == 2, "blank line skipped");
  expect(steps[0].tool == trialbox::ToolName::read_file, "tool parsed");
  expect(jsonlite::get_string(steps[0].params, "path") == "calc.py", "params kept");
  expect(jsonlite::get_i64(steps[1].params, "timeout_sec") == 30, "numeric params kept");

  auto expect_config_error = [](const fs::path& p, const std::string& needle) {
    bool threw = false;
    try {
      trialbox::load_agent_script(p);
    } catch (const trialbox::Error& e) {
      threw = e.code() == trialbox::ErrorCode::config_error &&
              std::string(e.what()).find(needle) != std::string::npos;
    }
    expect(threw, "expected config_error mentioning '" + needle + "'");
  };
  write_text(dir / "unknown.jsonl", script_line("list_files", {}) + script_line("browse", {}));
  expect_config_error(dir / "unknown.jsonl", "unknown.jsonl:2: Unknown tool: 'browse'");
  write_text(dir / "broken.jsonl", "{\"tool\": \n");
  expect_config_error(dir / "broken.jsonl", "broken.jsonl:1");
  write_text(dir / "untyped.jsonl", "{\"params\": {}}\n");
  expect_config_error(dir / "untyped.jsonl", "missing 'tool'");
  expect_config_error(dir / "absent.jsonl", "Agent script not found");
}

void test_scripted_agent_fixes_workspace() {
  const fs::path base = fresh_dir("agent_fix");
  const fs::path repo = base / "workspace" / "repo";
  write_text(repo / "calc.py", "def add(a, b):\n    return a - b\n");
  write_text(base / "steps.jsonl",
             script_line("list_files", {{"glob", "*.py"}}) +
                 script_line("read_file", {{"path", "calc.py"}}) +
                 script_line("search", {{"query", "return"}}) +
                 script_line("apply_patch", {{"diff", kCalcFix}}) +
                 script_line("run", {{"command", "true"}}));

  const auto task = sample_task();
  const trialbox::ContainerSandbox sandbox("img", "/workspace", fake_config(base));
  trialbox::EventLogger events("RUN7", base / "artifacts" / "events.jsonl");
  const trialbox::AgentContext ctx{task, sandbox, repo, base / "artifacts", "", events};
  trialbox::ScriptedAgent agent(trialbox::load_agent_script(base / "steps.jsonl"), 20);
  const auto result = agent.run(ctx);

  expect(result.success && result.stopped_reason == "success", "tests pass after the fix");
  expect(result.steps_taken == 5, "every step taken");
  expect(result.patch_files == std::vector<std::string>{"calc.py"}, "patched files");
  expect(result.exit_code == 0, "last run exit code");
  expect(read_text(repo / "calc.py") == "def add(a, b):\n    return a + b\n", "workspace patched");

  const auto types = event_types(base / "artifacts" / "events.jsonl");
  expect(count_of(types, "agent_turn_started") == 5 && count_of(types, "agent_turn_finished") == 5,
         "one turn per step");
  expect(count_of(types, "patch_applied") == 1, "patch event");
  expect(count_of(types, "tests_finished") == 1, "tests event");
  const auto records = trialbox::read_records(base / "artifacts" / "events.jsonl");
  const auto* started = jsonlite::get_object(records[1], "payload");
  expect(started && jsonlite::get_string(*started, "request_id") == "RUN7-001",
         "request id numbers steps");
}

void test_scripted_agent_stop_reasons() {
  const fs::path base = fresh_dir("agent_stops");
  const fs::path repo = base / "repo";
  fs::create_directories(repo);
  const auto task = sample_task();
  const trialbox::ContainerSandbox sandbox("img", "/workspace", fake_config(base));
  trialbox::EventLogger events("RUN8", base / "events.jsonl");
  const trialbox::AgentContext ctx{task, sandbox, repo, base / "artifacts", "", events};

  trialbox::ScriptedAgent missing({{trialbox::ToolName::read_file, {{"path", "nope.py"}}},
                                   {trialbox::ToolName::run, {{"command", "true"}}}},
                                  20);
  const auto tool_error = missing.run(ctx);
  expect(!tool_error.success && tool_error.stopped_reason == "tool_error", "tool error stops");
  expect(tool_error.steps_taken == 1, "no step after the failure");

  trialbox::ScriptedAgent failing({{trialbox::ToolName::run, {{"command", "exit 1"}}},
                                   {trialbox::ToolName::list_files, {}}},
                                  20);
  const auto tests_failed = failing.run(ctx);
  expect(tests_failed.stopped_reason == "tests_failed", "failing run does not stop the script");
  expect(tests_failed.steps_taken == 2 && tests_failed.exit_code == 1, "run exit code kept");

  trialbox::ScriptedAgent capped({{trialbox::ToolName::list_files, {}},
                                  {trialbox::ToolName::list_files, {}},
                                  {trialbox::ToolName::run, {{"command", "true"}}}},
                                 2);
  const auto max_steps = capped.run(ctx);
  expect(max_steps.stopped_reason == "max_steps" && max_steps.steps_taken == 2, "step budget");

  trialbox::ScriptedAgent quiet({{trialbox::ToolName::list_files, {}}}, 20);
  expect(quiet.run(ctx).stopped_reason == "script_exhausted", "no run step");
}

void test_agent_attempt_passes() {
  const fs::path base = fresh_dir("agent_attempt_pass");
  const auto task = sample_task();
  ScriptedExecutor exec;
  exec.run_exit_sequence = {1, 0};
  trialbox::ScriptedAgent agent({{trialbox::ToolName::apply_patch, {{"diff", kNewFile}}},
                                 {trialbox::ToolName::run, {{"command", "true"}}}},
                                20);
  const auto attempt = trialbox::run_agent_attempt(task, base / "ws", base / "art", exec, agent,
                                                   fake_config(base));
  expect(attempt.passed() && !attempt.record.result.failure_reason, "final tests pass");
  expect(attempt.baseline.valid && attempt.agent_ran, "baseline valid, agent ran");
  expect(read_text(base / "ws" / "repo" / "fix.txt") == "fixed\n", "agent edited the workspace");
  expect(exec.calls == std::vector<std::string>{"clone", "checkout", "setup", "run", "run"},
         "final test after the baseline run");
  expect(exec.commands.back() == "cd repo && pytest -q", "final test uses the task command");

  const auto records = trialbox::read_records(base / "art" / "attempts.jsonl");
  expect(records.size() == 2, "baseline and agent attempts share the log");
  const auto rec = trialbox::AttemptRecord::from_json(records[1]);
  expect(rec.variant == "scripted", "agent variant");
  expect(rec.baseline_validation.attempted && rec.baseline_validation.failure_as_expected &&
             rec.baseline_validation.exit_code == 1,
         "baseline recorded on the agent attempt");
  expect(rec.result.passed && rec.result.exit_code == 0, "final exit code");
  expect(rec.artifact_paths.at("patch_files") == "fix.txt", "patched files listed");
  expect(rec.artifact_paths.count("final_test_stdout") == 1, "final test logs");

  const auto types = event_types(base / "art" / "events.jsonl");
  expect(types.front() == "task_started" && types.back() == "task_finished", "task events wrap");
  expect(count_of(types, "tests_finished") == 2, "agent run and final test");
}

trialbox::FailureReason failed_reason(const std::string& name, std::vector<int> runs,
                                      std::vector<trialbox::ScriptedStep> steps) {
  const fs::path base = fresh_dir(name);
  ScriptedExecutor exec;
  exec.run_exit_sequence = std::move(runs);
  trialbox::ScriptedAgent agent(std::move(steps), 20);
  const auto attempt = trialbox::run_agent_attempt(sample_task(), base / "ws", base / "art", exec,
                                                   agent, fake_config(base));
  expect(!attempt.passed() && attempt.record.result.failure_reason, name + ": failed");
  return *attempt.record.result.failure_reason;
}

void test_agent_attempt_classification() {
  using trialbox::FailureReason;
  using trialbox::ToolName;
  expect(failed_reason("agent_tests_failed", {1, 1}, {{ToolName::run, {{"command", "exit 1"}}}}) ==
             FailureReason::tests_failed,
         "final failure after a run step");
  expect(failed_reason("agent_gave_up", {1, 1}, {{ToolName::list_files, {}}}) ==
             FailureReason::agent_gave_up,
         "script ended without running tests");
  expect(failed_reason("agent_tool_error", {1, 1}, {{ToolName::read_file, {{"path", "nope"}}}}) ==
             FailureReason::tool_error,
         "tool failure refines the final failure");
  expect(failed_reason("agent_final_timeout", {1, 124}, {{ToolName::list_files, {}}}) ==
             FailureReason::timeout,
         "timeout dominates the agent's stop reason");
  expect(failed_reason("agent_final_no_tests", {1, 5}, {{ToolName::list_files, {}}}) ==
             FailureReason::no_tests_collected,
         "runner exit-code table applies");
}

void test_agent_attempt_invalid_baseline() {
  const fs::path base = fresh_dir("agent_attempt_invalid");
  ScriptedExecutor exec;
  exec.run_exit_sequence = {0};
  trialbox::ScriptedAgent agent({{trialbox::ToolName::run, {{"command", "true"}}}}, 20);
  const auto attempt = trialbox::run_agent_attempt(sample_task(), base / "ws", base / "art", exec,
                                                   agent, fake_config(base));
  expect(!attempt.passed() && !attempt.agent_ran, "agent skipped");
  expect(attempt.record.result.failure_reason == trialbox::FailureReason::baseline_not_failing,
         "baseline reason carried over");
  expect(!attempt.record.baseline_validation.failure_as_expected, "baseline not failing");
  expect(count_of(exec.calls, "run") == 1, "no final test");
  expect(!fs::exists(base / "art" / "events.jsonl"), "no agent events");
}

void test_run_agent_task_layout() {
  const fs::path base = fresh_dir("run_agent_task");
  write_text(base / "task" / "task.yaml", task_yaml("t1", "u") +
                                              "agent:\n"
                                              "  entrypoint: scripted\n"
                                              "  max_steps: 5\n"
                                              "  script: steps.jsonl\n");
  write_text(base / "task" / "steps.jsonl", script_line("run", {{"command", "true"}}));
  ScriptedExecutor exec;
  exec.run_exit_sequence = {1, 0};
  const auto attempt = trialbox::run_agent_task(base / "task" / "task.yaml", base / "out", exec,
                                                "scripted", fake_config(base));
  expect(attempt.passed(), "attempt passed");
  const fs::path run_dir = attempt.artifacts_dir;
  expect(run_dir.parent_path().filename() == "agent_runs", "agent_runs layout");
  expect(fs::exists(run_dir / "task" / "task.yaml"), "task copied");
  expect(fs::exists(run_dir / "events.jsonl"), "events stream");
  expect(trialbox::read_records(run_dir / "attempts.jsonl").size() == 2, "two attempt lines");

  std::optional<jsonlite::JsonError> err;
  const auto summary = jsonlite::parse(read_text(run_dir / "agent_run.json"), &err);
  expect(!err, "agent_run.json parses");
  expect(jsonlite::get_bool(summary, "passed"), "summary outcome");
  const auto* agent = jsonlite::get_object(summary, "agent");
  expect(agent && jsonlite::get_string(*agent, "stopped_reason") == "success", "agent summary");

  bool unknown = false;
  try {
    trialbox::run_agent_task(base / "task" / "task.yaml", base / "out", exec, "llm",
                             fake_config(base));
  } catch (const trialbox::Error& e) {
    unknown = e.code() == trialbox::ErrorCode::config_error;
  }
  expect(unknown, "unknown variant is a config error");

  write_text(base / "plain" / "task.yaml", task_yaml("t2", "u"));
  bool no_script = false;
  try {
    trialbox::make_agent(trialbox::load_task(base / "plain" / "task.yaml"), "scripted");
  } catch (const trialbox::Error& e) {
    no_script = e.code() == trialbox::ErrorCode::config_error;
  }
  expect(no_script, "scripted agent needs agent.script");
}

trialbox::CommandLine scan(std::vector<const char*> args) {
  args.insert(args.begin(), "trialbox");
  return trialbox::parse_command_line(static_cast<int>(args.size()), args.data());
}

void test_command_line_scan() {
  const auto before = scan({"--out", "x", "validate", "t.yaml"});
  expect(before.command == "validate", "flag value is not the command");
  expect(before.positional(0) == "t.yaml" && before.positionals.size() == 1, "positional");
  expect(before.option("--out", "out") == "x", "flag before the command applies");

  const auto after = scan({"run-suite", "--tasks-root", "demo", "mine", "--verbose"});
  expect(after.command == "run-suite" && after.positional(0) == "mine", "value skipped");
  expect(after.option("--tasks-root", "tasks") == "demo" && after.verbose, "options and switch");
  expect(after.option("--out", "out") == "out", "default applies");

  const auto negative = scan({"classify", "--stage", "final_test", "--exit-code", "-1"});
  expect(negative.option("--exit-code", "") == "-1", "negative value kept");

  const auto dangling = scan({"validate", "--out"});
  expect(dangling.option("--out") == std::string(), "trailing flag has an empty value");
  expect(scan({"--verbose"}).command.empty(), "no command");
}

} // namespace

int main() {
  trialbox::set_min_log_level(trialbox::LogLevel::critical);
  std::cout << "=== trialbox Test Suite ===\n";

  std::cout << "\n[Phase 1] Failure taxonomy\n";
  run_test("classify table", test_classify_table);
  run_test("timeout dominates stage rules", test_timeout_dominates);
  run_test("faults override exit codes", test_faults_override_exit_codes);
  run_test("precedence total order", test_precedence_total_order);
  run_test("validation reason names", test_validation_reason_names);
  run_test("test runner exit codes", test_test_runner_exit_codes);
  run_test("stage parsing", test_stage_parsing);

  std::cout << "\n[Phase 2] Workspace confinement\n";
  run_test("resolve inside workspace", test_path_guard_basic);
  run_test("reject ../ escapes", test_path_guard_escape);
  run_test("symlink policy", test_path_guard_symlinks);
  run_test("glob matching", test_glob);

  std::cout << "\n[Phase 3] Patch application\n";
  run_test("diff parsing", test_diff_parsing);
  run_test("validation messages", test_patch_validation_messages);
  run_test("differing names patch in place", test_patch_differing_names_patch_in_place);
  run_test("git rename", test_patch_git_rename);
  run_test("counted hunk body", test_patch_counted_hunk_body);
  run_test("modify with exact hunk", test_patch_modify);
  run_test("fuzz window +/-3", test_patch_fuzz_window);
  run_test("create and delete files", test_patch_create_delete);
  run_test("multi-file patch is atomic", test_patch_atomic_multi_file);
  run_test("escape and parse errors", test_patch_rejects_escape);

  std::cout << "\n[Phase 4] JSONL log\n";
  run_test("append and restartable read", test_jsonl_append_and_read);
  run_test("malformed lines skipped", test_jsonl_skips_malformed);
  run_test("lock serializes writers", test_jsonl_lock_serializes_writers);
  run_test("concurrent appends", test_jsonl_concurrent_appends);
  run_test("atomic write errors", test_atomic_write_errors);

  std::cout << "\n[Phase 5] Attempt ledger\n";
  run_test("run id format", test_run_id_format);
  run_test("success record", test_ledger_records_success);
  run_test("crash safety", test_ledger_crash_safety);
  run_test("destructor finalizes", test_ledger_destructor_finalizes);
  run_test("interrupt recorded", test_ledger_interrupt);
  run_test("explicit reason wins", test_ledger_explicit_reason_wins);
  run_test("ledger outlives its task", test_ledger_outlives_task);
  run_test("external baseline", test_ledger_external_baseline);
  run_test("record parsing", test_attempt_record_parsing);

  std::cout << "\n[Phase 6] Process sandbox\n";
  run_test("exit code and logs", test_run_process_exit_and_logs);
  run_test("timeout kill", test_run_process_timeout);
  run_test("spawn failure", test_run_process_spawn_failure);
  run_test("no leaked descriptors", test_run_process_descriptors);
  run_test("container argv", test_container_argv);
  run_test("missing workspace", test_container_missing_workspace);

  std::cout << "\n[Phase 7] Task loading\n";
  run_test("load task.yaml", test_load_task);
  run_test("task validation errors", test_load_task_errors);
  run_test("agent section", test_load_task_agent_section);
  run_test("suite discovery", test_discover_suite);

  std::cout << "\n[Phase 8] Baseline validation\n";
  run_test("failing baseline is valid", test_validator_valid_baseline);
  run_test("passing baseline is invalid", test_validator_baseline_passed);
  run_test("setup timeout stops pipeline", test_validator_setup_timeout_stops);
  run_test("clone failure", test_validator_clone_failure);
  run_test("no tests collected", test_validator_no_tests_collected);
  run_test("sandbox fault recorded", test_validator_sandbox_fault);
  run_test("interrupt between stages", test_validator_interrupt);

  std::cout << "\n[Phase 9] Task and suite runs\n";
  run_test("run_task writes run.json", test_run_task_writes_run_json);
  run_test("run_task stage failure", test_run_task_stage_failure);
  run_test("suite counts and dominant reason", test_run_suite_counts);
  run_test("suite interrupt", test_run_suite_interrupt);
  run_test("suite continues after faults", test_run_suite_fault_continues);
  run_test("task directory names", test_task_dir_names_distinct);

  std::cout << "\n[Phase 10] Agent tools\n";
  run_test("deadline", test_deadline);
  run_test("list_files", test_tool_list_files);
  run_test("read_file", test_tool_read_file);
  run_test("read_file truncation", test_tool_read_file_truncation);
  run_test("search", test_tool_search);
  run_test("run", test_tool_run);
  run_test("apply_patch", test_tool_apply_patch);
  run_test("truncate_output", test_truncate_output);

  std::cout << "\n[Phase 11] Event log and observability\n";
  run_test("event step ids", test_event_logger);
  run_test("stats JSON", test_stats_json);
  run_test("BLAKE3 vectors", test_blake3_vectors);

  std::cout << "\n[Phase 12] Agent runs and command line\n";
  run_test("agent script loading", test_agent_script_loading);
  run_test("scripted agent fixes the workspace", test_scripted_agent_fixes_workspace);
  run_test("scripted agent stop reasons", test_scripted_agent_stop_reasons);
  run_test("agent attempt passes", test_agent_attempt_passes);
  run_test("agent attempt classification", test_agent_attempt_classification);
  run_test("invalid baseline skips the agent", test_agent_attempt_invalid_baseline);
  run_test("run_agent_task layout", test_run_agent_task_layout);
  run_test("command line scan", test_command_line_scan);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
