#pragma once

// trialbox/git.hpp - Host-side git clone/checkout.
//
// Only the exit-code contract matters to callers: a nonzero exit is a result,
// not an exception. Output goes to <logs_dir>/git_clone_{stdout,stderr}.txt and
// git_checkout_{stdout,stderr}.txt. TRIALBOX_GIT_TIMEOUT_SEC overrides the
// default budget when the caller passes none.
//
// THROWS:
//   Error(sandbox_error)  git could not be spawned or its logs opened
//   InterruptedError      the user interrupted while git was running

#include <filesystem>
#include <string>

namespace trialbox {

struct CommandResult {
  int exit_code{-1};
  std::string stdout_path;
  std::string stderr_path;
};

// Default git budget: TRIALBOX_GIT_TIMEOUT_SEC, or 120 seconds.
int git_timeout_from_env();

CommandResult clone_repo(const std::string& url, const std::filesystem::path& dest,
                         const std::filesystem::path& logs_dir, int timeout_sec = 0);

CommandResult checkout_commit(const std::filesystem::path& repo_dir, const std::string& commit,
                              const std::filesystem::path& logs_dir, int timeout_sec = 0);

}  // namespace trialbox
