#pragma once

// trialbox/path_guard.hpp - Workspace confinement for agent-supplied paths.
//
// INVARIANTS:
//   1. A successful resolve_safe_path() result is the root itself or a
//      descendant of the canonical workspace root.
//   2. With allow_symlinks == false, no component between the root and the
//      target (the target included) is a symlink. The walk is done on the
//      lexically-normalized path, before symlinks are resolved, because an
//      intermediate link can redirect outside the root while the final
//      canonical path still looks safe.
//   3. safe_glob() never returns symlinks or anything under a .git directory,
//      and its output is sorted.

#include <filesystem>
#include <string>
#include <vector>

#include "trialbox/types.hpp"

namespace trialbox {

class Deadline;

struct PathResolution {
  std::filesystem::path path;
  ErrorCode error{ErrorCode::none};  // path_escape, symlink_blocked or io_error
  std::string message;

  bool ok() const { return error == ErrorCode::none; }
};

// Resolves `relative` against `workspace_root`. Leading '/' characters are
// stripped so absolute-looking input is still treated as workspace-relative.
// Never throws.
PathResolution resolve_safe_path(const std::filesystem::path& workspace_root,
                                 const std::string& relative,
                                 bool allow_symlinks = false);

// Glob over the workspace. Supported syntax: '*' and '?' within a path
// segment, bracket classes, and '**' for any number of directories. Matching
// is done on the root-relative generic path. Throws Error(timeout) only when
// `deadline` is given and expires mid-walk.
std::vector<std::filesystem::path> safe_glob(const std::filesystem::path& workspace_root,
                                             const std::string& pattern,
                                             const Deadline* deadline = nullptr);

bool glob_match(const std::string& pattern, const std::string& relative_path);

// True when `p` equals `base` or lies beneath it (component-wise).
bool is_within(const std::filesystem::path& base, const std::filesystem::path& p);

}  // namespace trialbox
