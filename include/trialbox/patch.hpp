#pragma once

// trialbox/patch.hpp - Unified-diff parsing, validation and transactional apply.
//
// DESIGN:
//   apply_patch() never shells out. It computes the new image of every
//   touched file in memory (the dry run) and only when every hunk of every
//   file matched does it write anything. Writes go through a temp file in the
//   target directory followed by rename(2), so a reader never sees a
//   half-written file.
//
// FUZZ:
//   A hunk's expected lines (context ' ' and deletions '-') must match the
//   file at the declared start or at an offset within +/-kFuzzLimit; the first
//   matching offset, scanning from -kFuzzLimit upward, wins. Validation and
//   apply share this window.

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "trialbox/types.hpp"

namespace trialbox {

class Deadline;

constexpr int kFuzzLimit = 3;
constexpr const char* kDevNull = "/dev/null";

struct PatchHunk {
  int old_start{0};
  int old_count{0};
  int new_start{0};
  int new_count{0};
  std::vector<std::string> lines;  // literal body lines, prefix included
};

struct FilePatch {
  std::optional<std::string> old_path;  // "/dev/null" preserved verbatim
  std::optional<std::string> new_path;
  std::vector<PatchHunk> hunks;
  bool rename{false};  // git "rename from"/"rename to" headers were present

  bool is_creation() const { return !old_path || *old_path == kDevNull; }
  bool is_deletion() const { return !new_path || *new_path == kDevNull; }
};

// Splits on '---' / '+++' / '@@' headers. Each '---' outside a hunk starts a
// new FilePatch; inside a hunk the body is consumed by the line counts of its
// "@@ -a,b +c,d @@" header, so "---x" and "+++x" body lines stay body lines.
// A single leading "a/" or "b/" is stripped from paths other than /dev/null.
// A rename is recorded only from git's "rename from"/"rename to" headers;
// differing "---"/"+++" names alone patch one file in place. Hunk bounds are
// stored as non-negative magnitudes. On a malformed hunk header or a hunk
// whose body disagrees with its counts, returns what was parsed so far and
// sets *error.
std::vector<FilePatch> parse_unified_diff(const std::string& text,
                                          std::optional<std::string>* error = nullptr);

// Returns human-readable problems; empty means the patch set applies.
std::vector<std::string> validate_patch(const std::filesystem::path& workspace_root,
                                        const std::vector<FilePatch>& patches);

// Transactional apply. Only deletions ("+++ /dev/null") and git renames
// remove a path from the workspace. Success data: changed_files, patch_size_bytes,
// patch_artifact_path, patch_digest. Failure leaves the workspace untouched
// and reports error_type patch_hunk_fail (or patch_parse_error). An expired
// `deadline` is honored up to the commit point and reported as timeout.
ToolResult apply_patch(const std::filesystem::path& workspace_root,
                       const std::string& unified_diff,
                       int step_id,
                       const std::filesystem::path& artifacts_dir,
                       const Deadline* deadline = nullptr);

bool is_valid_utf8(const std::string& bytes);

}  // namespace trialbox
