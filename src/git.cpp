#include "trialbox/git.hpp"

#include <cstdlib>
#include <system_error>
#include <vector>

#include "trialbox/observability.hpp"
#include "trialbox/sandbox.hpp"
#include "trialbox/types.hpp"

namespace fs = std::filesystem;

namespace trialbox {

namespace {

constexpr int kDefaultGitTimeoutSec = 120;

CommandResult run_git(const std::string& name, std::vector<std::string> argv, const std::string& cwd,
                      const fs::path& logs_dir, int timeout_sec) {
  std::error_code ec;
  fs::create_directories(logs_dir, ec);

  ProcessSpec spec;
  spec.argv = std::move(argv);
  spec.cwd = cwd;
  spec.timeout_sec = timeout_sec > 0 ? timeout_sec : git_timeout_from_env();
  spec.stdout_path = (logs_dir / (name + "_stdout.txt")).string();
  spec.stderr_path = (logs_dir / (name + "_stderr.txt")).string();
  // Never block on a credential prompt.
  spec.env["GIT_TERMINAL_PROMPT"] = "0";

  const ProcessResult pr = run_process(spec);
  if (!pr.ok()) {
    log_error("git", name + " could not run: " + pr.error_message);
    throw Error(ErrorCode::sandbox_error, name + " could not run: " + pr.error_message);
  }
  if (pr.interrupted) throw InterruptedError("interrupted during " + name);

  if (pr.exit_code != 0) {
    log_warn("git", name + " exited with " + std::to_string(pr.exit_code));
  }
  return CommandResult{pr.exit_code, spec.stdout_path, spec.stderr_path};
}

}  // namespace

int git_timeout_from_env() {
  const char* raw = std::getenv("TRIALBOX_GIT_TIMEOUT_SEC");
  if (!raw || !raw[0]) return kDefaultGitTimeoutSec;
  char* end = nullptr;
  const long v = std::strtol(raw, &end, 10);
  if (end == raw || *end != '\0' || v <= 0 || v > 86400) {
    log_warn("git", std::string("ignoring TRIALBOX_GIT_TIMEOUT_SEC=") + raw);
    return kDefaultGitTimeoutSec;
  }
  return static_cast<int>(v);
}

CommandResult clone_repo(const std::string& url, const fs::path& dest, const fs::path& logs_dir,
                         int timeout_sec) {
  log_info("git", "cloning " + url + " into " + dest.string());
  return run_git("git_clone", {"git", "clone", url, dest.string()}, "", logs_dir, timeout_sec);
}

CommandResult checkout_commit(const fs::path& repo_dir, const std::string& commit,
                              const fs::path& logs_dir, int timeout_sec) {
  log_info("git", "checking out " + commit);
  return run_git("git_checkout", {"git", "checkout", commit}, repo_dir.string(), logs_dir,
                 timeout_sec);
}

}  // namespace trialbox
