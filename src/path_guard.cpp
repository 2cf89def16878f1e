#include "trialbox/path_guard.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <system_error>

#include "trialbox/deadline.hpp"

namespace fs = std::filesystem;

namespace trialbox {

namespace {

// Drops a trailing empty filename ("dir/" -> "dir") left by lexically_normal.
fs::path strip_trailing_separator(fs::path p) {
  while (!p.has_filename() && p.has_relative_path()) {
    p = p.parent_path();
  }
  return p;
}

std::vector<std::string> split_segments(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == '/') {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
    } else {
      cur += c;
    }
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

bool match_segments(const std::vector<std::string>& pat, size_t pi,
                    const std::vector<std::string>& path, size_t si) {
  while (pi < pat.size()) {
    if (pat[pi] == "**") {
      // '**' absorbs zero or more whole segments.
      for (size_t k = si; k <= path.size(); ++k) {
        if (match_segments(pat, pi + 1, path, k)) return true;
      }
      return false;
    }
    if (si >= path.size()) return false;
    if (::fnmatch(pat[pi].c_str(), path[si].c_str(), 0) != 0) return false;
    ++pi;
    ++si;
  }
  return si == path.size();
}

bool has_git_component(const fs::path& rel) {
  for (const auto& part : rel) {
    if (part == ".git") return true;
  }
  return false;
}

}  // namespace

bool is_within(const fs::path& base, const fs::path& p) {
  auto b = base.begin();
  auto q = p.begin();
  for (; b != base.end(); ++b, ++q) {
    if (q == p.end() || *b != *q) return false;
  }
  return true;
}

PathResolution resolve_safe_path(const fs::path& workspace_root, const std::string& relative,
                                 bool allow_symlinks) {
  PathResolution res;
  std::error_code ec;
  const fs::path root = fs::weakly_canonical(workspace_root, ec);
  if (ec) {
    res.error = ErrorCode::io_error;
    res.message = "Cannot canonicalize workspace root " + workspace_root.string() + ": " + ec.message();
    return res;
  }

  std::string rel = relative;
  rel.erase(0, rel.find_first_not_of('/'));

  const fs::path lexical = strip_trailing_separator((root / rel).lexically_normal());
  if (!is_within(root, lexical)) {
    res.error = ErrorCode::path_escape;
    res.message = "Candidate " + lexical.string() + " is not relative to workspace: " + root.string();
    return res;
  }

  if (!allow_symlinks) {
    fs::path so_far = root;
    for (const auto& part : lexical.lexically_relative(root)) {
      if (part.empty() || part == ".") continue;
      so_far /= part;
      if (fs::is_symlink(fs::symlink_status(so_far, ec))) {
        res.error = ErrorCode::symlink_blocked;
        res.message = "Path contains symlink: " + so_far.string();
        return res;
      }
    }
  }

  const fs::path candidate = strip_trailing_separator(fs::weakly_canonical(lexical, ec));
  if (ec) {
    res.error = ErrorCode::io_error;
    res.message = "Cannot canonicalize " + lexical.string() + ": " + ec.message();
    return res;
  }
  if (!is_within(root, candidate)) {
    res.error = ErrorCode::path_escape;
    res.message = "Candidate " + candidate.string() + " is not relative to workspace: " + root.string();
    return res;
  }
  res.path = candidate;
  return res;
}

bool glob_match(const std::string& pattern, const std::string& relative_path) {
  return match_segments(split_segments(pattern), 0, split_segments(relative_path), 0);
}

std::vector<fs::path> safe_glob(const fs::path& workspace_root, const std::string& pattern,
                                const Deadline* deadline) {
  std::vector<fs::path> out;
  std::error_code ec;
  const fs::path root = fs::weakly_canonical(workspace_root, ec);
  if (ec || !fs::is_directory(root, ec)) return out;

  const auto pat = split_segments(pattern);
  const bool recursive = std::find(pat.begin(), pat.end(), "**") != pat.end();
  const int max_depth = static_cast<int>(pat.size());

  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  const fs::recursive_directory_iterator end;
  for (; !ec && it != end; it.increment(ec)) {
    if (deadline) deadline->check("list_files");

    const fs::path& p = it->path();
    const fs::path rel = p.lexically_relative(root);
    std::error_code entry_ec;
    if (it->is_symlink(entry_ec) || has_git_component(rel)) {
      // Never descend through links or into metadata.
      it.disable_recursion_pending();
      continue;
    }
    if (!recursive && it.depth() + 1 >= max_depth) {
      it.disable_recursion_pending();
    }
    if (glob_match(pattern, rel.generic_string())) {
      out.push_back(p);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace trialbox
