#include "trialbox/patch.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <system_error>

#include "trialbox/deadline.hpp"
#include "trialbox/fs_util.hpp"
#include "trialbox/hash.hpp"
#include "trialbox/observability.hpp"
#include "trialbox/path_guard.hpp"

namespace fs = std::filesystem;

namespace trialbox {

namespace {

struct FileImage {
  std::vector<std::string> lines;
  bool trailing_newline{true};
};

FileImage split_lines(const std::string& text) {
  FileImage img;
  if (text.empty()) return img;
  size_t start = 0;
  while (start < text.size()) {
    const size_t nl = text.find('\n', start);
    if (nl == std::string::npos) {
      img.lines.push_back(text.substr(start));
      img.trailing_newline = false;
      break;
    }
    img.lines.push_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  return img;
}

std::string join_lines(const FileImage& img) {
  std::string out;
  for (size_t i = 0; i < img.lines.size(); ++i) {
    out += img.lines[i];
    if (i + 1 < img.lines.size() || img.trailing_newline) out += '\n';
  }
  return out;
}

// "--- a/src/x.py\t2024-01-01" -> "src/x.py"
std::string header_path(const std::string& line) {
  std::string raw = line.size() > 4 ? line.substr(4) : std::string();
  const size_t tab = raw.find('\t');
  if (tab != std::string::npos) raw.erase(tab);
  while (!raw.empty() && (raw.back() == ' ' || raw.back() == '\r')) raw.pop_back();
  if (raw == kDevNull) return raw;
  if (raw.rfind("a/", 0) == 0 || raw.rfind("b/", 0) == 0) raw.erase(0, 2);
  return raw;
}

// "-12,5" -> start=12 count=5. A missing count means 1.
bool parse_range(const std::string& tok, int& start, int& count) {
  if (tok.size() < 2 || (tok[0] != '-' && tok[0] != '+')) return false;
  const std::string body = tok.substr(1);
  const size_t comma = body.find(',');
  char* end = nullptr;
  const long s = std::strtol(body.c_str(), &end, 10);
  if (end == body.c_str()) return false;
  long c = 1;
  if (comma != std::string::npos) {
    const char* cstart = body.c_str() + comma + 1;
    c = std::strtol(cstart, &end, 10);
    if (end == cstart) return false;
  }
  start = static_cast<int>(std::labs(s));
  count = static_cast<int>(std::labs(c));
  return true;
}

bool parse_hunk_header(const std::string& line, PatchHunk& h) {
  // "@@ -a,b +c,d @@ optional section"
  const size_t close = line.find("@@", 2);
  const std::string inner = line.substr(2, close == std::string::npos ? std::string::npos : close - 2);
  std::string old_tok, new_tok;
  size_t i = 0;
  auto next_token = [&]() {
    while (i < inner.size() && inner[i] == ' ') ++i;
    const size_t b = i;
    while (i < inner.size() && inner[i] != ' ') ++i;
    return inner.substr(b, i - b);
  };
  old_tok = next_token();
  new_tok = next_token();
  return parse_range(old_tok, h.old_start, h.old_count) &&
         parse_range(new_tok, h.new_start, h.new_count);
}

std::vector<std::string> expected_lines(const PatchHunk& h) {
  std::vector<std::string> out;
  for (const auto& l : h.lines) {
    if (!l.empty() && (l[0] == ' ' || l[0] == '-')) out.push_back(l.substr(1));
  }
  return out;
}

bool slice_equals(const std::vector<std::string>& file, size_t at,
                  const std::vector<std::string>& expected) {
  if (at + expected.size() > file.size()) return false;
  for (size_t k = 0; k < expected.size(); ++k) {
    if (file[at + k] != expected[k]) return false;
  }
  return true;
}

bool in_bounds(const PatchHunk& h, size_t file_lines) {
  const long hunk_start = static_cast<long>(h.old_start) - 1;
  if (expected_lines(h).empty()) {
    // Pure insertion: old_start is the line after which text is inserted.
    const long anchor = h.old_count == 0 ? h.old_start : hunk_start;
    return anchor >= 0 && anchor <= static_cast<long>(file_lines);
  }
  return hunk_start >= 0 && hunk_start <= static_cast<long>(file_lines) + kFuzzLimit;
}

// Index where the hunk's expected lines start, scanning offsets
// -kFuzzLimit..+kFuzzLimit. Positions below `min_pos` are not considered.
std::optional<size_t> locate_hunk(const std::vector<std::string>& file, const PatchHunk& h,
                                  size_t min_pos) {
  if (!in_bounds(h, file.size())) return std::nullopt;
  const auto expected = expected_lines(h);
  const long hunk_start = static_cast<long>(h.old_start) - 1;
  if (expected.empty()) {
    const long anchor = h.old_count == 0 ? h.old_start : hunk_start;
    if (anchor < static_cast<long>(min_pos)) return std::nullopt;
    return static_cast<size_t>(anchor);
  }
  for (int offset = -kFuzzLimit; offset <= kFuzzLimit; ++offset) {
    const long adjusted = hunk_start + offset;
    if (adjusted < 0 || adjusted < static_cast<long>(min_pos)) continue;
    if (slice_equals(file, static_cast<size_t>(adjusted), expected)) {
      return static_cast<size_t>(adjusted);
    }
  }
  return std::nullopt;
}

// Applies all hunks of one file patch to `img`, in order.
bool apply_hunks(FileImage& img, const FilePatch& fp, const std::string& name, std::string& error) {
  FileImage out;
  out.trailing_newline = img.trailing_newline;
  size_t cursor = 0;
  for (const auto& h : fp.hunks) {
    const auto pos = locate_hunk(img.lines, h, cursor);
    if (!pos) {
      error = name + ": hunk at line " + std::to_string(h.old_start) +
              " does not apply";
      return false;
    }
    out.lines.insert(out.lines.end(), img.lines.begin() + static_cast<long>(cursor),
                     img.lines.begin() + static_cast<long>(*pos));
    cursor = *pos;
    char prev = 0;
    for (const auto& l : h.lines) {
      if (l.empty()) continue;
      switch (l[0]) {
        case ' ':
          out.lines.push_back(img.lines[cursor++]);
          break;
        case '-':
          ++cursor;
          break;
        case '+':
          out.lines.push_back(l.substr(1));
          break;
        case '\\':
          // "\ No newline at end of file" refers to the preceding line.
          if (prev == '+' || prev == ' ') out.trailing_newline = false;
          else if (prev == '-') out.trailing_newline = true;
          break;
        default:
          break;
      }
      prev = l[0];
    }
  }
  out.lines.insert(out.lines.end(), img.lines.begin() + static_cast<long>(cursor), img.lines.end());
  img = std::move(out);
  return true;
}

FileImage creation_image(const FilePatch& fp) {
  FileImage img;
  char prev = 0;
  for (const auto& h : fp.hunks) {
    for (const auto& l : h.lines) {
      if (l.empty()) continue;
      if (l[0] == '+') img.lines.push_back(l.substr(1));
      if (l[0] == '\\' && prev == '+') img.trailing_newline = false;
      prev = l[0];
    }
  }
  return img;
}

// Which workspace file a FilePatch reads and which it writes. A git rename
// reads the old name and writes the new one. Otherwise both headers name one
// file: the new name when it exists (patch(1) picks "x" for
// "diff -u x.orig x"), else the old name. Deletions have no write side and
// creations no read side.
struct PatchTarget {
  std::string read_name;
  std::string write_name;
};

PatchTarget target_of(const fs::path& workspace_root, const FilePatch& fp) {
  if (fp.is_creation()) return {"", *fp.new_path};
  if (fp.is_deletion()) return {*fp.old_path, ""};
  if (fp.rename || *fp.old_path == *fp.new_path) return {*fp.old_path, *fp.new_path};
  const auto resolved = resolve_safe_path(workspace_root, *fp.new_path);
  std::error_code ec;
  if (resolved.ok() && fs::exists(resolved.path, ec)) return {*fp.new_path, *fp.new_path};
  return {*fp.old_path, *fp.old_path};
}

ToolResult make_result(const std::string& request_id, WallClock::time_point started) {
  ToolResult r;
  r.request_id = request_id;
  r.tool = ToolName::apply_patch;
  r.started_at = format_utc(started);
  return r;
}

void finish(ToolResult& r, WallClock::time_point started) {
  const auto ended = WallClock::now();
  r.ended_at = format_utc(ended);
  r.duration_sec = seconds_between(started, ended);
}

ToolResult fail(ToolResult r, WallClock::time_point started, ErrorCode code,
                const std::string& message, jsonlite::Object details = {}) {
  r.status = ToolStatus::error;
  r.error = ToolError{to_string(code), message, std::move(details)};
  finish(r, started);
  return r;
}

}  // namespace

bool is_valid_utf8(const std::string& bytes) {
  size_t i = 0;
  const size_t n = bytes.size();
  while (i < n) {
    const auto c = static_cast<unsigned char>(bytes[i]);
    size_t len = 0;
    unsigned cp = 0;
    if (c < 0x80) { ++i; continue; }
    if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
    else return false;
    if (i + len > n) return false;
    for (size_t k = 1; k < len; ++k) {
      const auto cc = static_cast<unsigned char>(bytes[i + k]);
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    // Overlong forms, surrogates and out-of-range code points.
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
    i += len;
  }
  return true;
}

std::vector<FilePatch> parse_unified_diff(const std::string& text, std::optional<std::string>* error) {
  std::vector<FilePatch> out;
  std::optional<FilePatch> current;
  // git extended headers seen since the last "diff --git" line.
  std::optional<std::string> rename_from;
  std::optional<std::string> rename_to;
  // Body lines still owed to the open hunk, per side.
  int old_left = 0;
  int new_left = 0;

  auto close_file = [&]() {
    if (current) out.push_back(std::move(*current));
    current.reset();
  };
  // A git rename without content changes carries no "---"/"+++" pair.
  auto close_bare_rename = [&]() {
    if (rename_from && rename_to) {
      FilePatch fp;
      fp.old_path = *rename_from;
      fp.new_path = *rename_to;
      fp.rename = true;
      out.push_back(std::move(fp));
    }
    rename_from.reset();
    rename_to.reset();
  };
  auto fail_with = [&](const std::string& message) {
    if (error) *error = message;
    close_file();
    return out;
  };

  for (const std::string& line : split_lines(text).lines) {
    if (old_left > 0 || new_left > 0) {
      const char tag = line.empty() ? ' ' : line[0];
      if (tag == ' ') {
        --old_left;
        --new_left;
      } else if (tag == '-') {
        --old_left;
      } else if (tag == '+') {
        --new_left;
      } else if (tag != '\\') {
        return fail_with("hunk ends early before: " + line);
      }
      if (old_left < 0 || new_left < 0) return fail_with("hunk body longer than its header: " + line);
      current->hunks.back().lines.push_back(line);
      continue;
    }

    if (line.rfind("diff --git ", 0) == 0) {
      close_file();
      close_bare_rename();
    } else if (line.rfind("rename from ", 0) == 0) {
      rename_from = line.substr(12);
    } else if (line.rfind("rename to ", 0) == 0) {
      rename_to = line.substr(10);
    } else if (line.rfind("---", 0) == 0) {
      close_file();
      current = FilePatch{};
      current->old_path = header_path(line);
      current->rename = rename_from && rename_to;
      rename_from.reset();
      rename_to.reset();
    } else if (line.rfind("+++", 0) == 0 && current && current->hunks.empty()) {
      current->new_path = header_path(line);
    } else if (line.rfind("@@", 0) == 0 && current) {
      PatchHunk h;
      if (!parse_hunk_header(line, h)) return fail_with("malformed hunk header: " + line);
      old_left = h.old_count;
      new_left = h.new_count;
      current->hunks.push_back(std::move(h));
    } else if (line.rfind("\\", 0) == 0 && current && !current->hunks.empty()) {
      // "\ No newline at end of file" trailing the last line of a hunk.
      current->hunks.back().lines.push_back(line);
    }
    // Anything else between files ("index ...", "similarity index ...") is
    // header noise.
  }
  if (old_left > 0 || new_left > 0) return fail_with("truncated hunk at end of patch");
  close_file();
  close_bare_rename();
  if (error) *error = std::nullopt;
  return out;
}

std::vector<std::string> validate_patch(const fs::path& workspace_root,
                                        const std::vector<FilePatch>& patches) {
  std::vector<std::string> errors;

  for (const auto& patch : patches) {
    bool path_ok = true;
    for (const auto* p : {&patch.old_path, &patch.new_path}) {
      if (!*p || **p == kDevNull) continue;
      const auto res = resolve_safe_path(workspace_root, **p);
      if (res.error == ErrorCode::path_escape) {
        errors.push_back(**p + " escapes workspace root");
        path_ok = false;
        break;
      }
      if (res.error == ErrorCode::symlink_blocked) {
        errors.push_back(**p + " traverses a symlink");
        path_ok = false;
        break;
      }
    }
    if (!path_ok || patch.is_creation()) continue;

    const std::string old_path = target_of(workspace_root, patch).read_name;
    const fs::path old_full = resolve_safe_path(workspace_root, old_path).path;
    std::error_code ec;
    if (!fs::exists(old_full, ec)) {
      errors.push_back(old_path + " does not exist");
      continue;
    }
    const auto bytes = read_file_bytes(old_full);
    if (!bytes) {
      errors.push_back(old_path + " does not exist");
      continue;
    }
    if (!is_valid_utf8(*bytes)) {
      errors.push_back(old_path + " contains invalid UTF-8 encoding");
      continue;
    }
    const auto file_lines = split_lines(*bytes).lines;

    for (const auto& hunk : patch.hunks) {
      if (!in_bounds(hunk, file_lines.size())) {
        errors.push_back(old_path + ": hunk at line " + std::to_string(hunk.old_start) +
                         " is outside file bounds (fuzz limit " + std::to_string(kFuzzLimit) + ")");
        continue;
      }
      if (!locate_hunk(file_lines, hunk, 0)) {
        errors.push_back(old_path + ": context at line " + std::to_string(hunk.old_start) +
                         " does not match file content");
      }
    }
  }
  return errors;
}

ToolResult apply_patch(const fs::path& workspace_root, const std::string& unified_diff, int step_id,
                       const fs::path& artifacts_dir, const Deadline* deadline) {
  const auto started = WallClock::now();
  ToolResult result = make_result("patch_" + std::to_string(step_id), started);

  std::optional<std::string> parse_error;
  const auto patches = parse_unified_diff(unified_diff, &parse_error);
  if (parse_error) {
    return fail(std::move(result), started, ErrorCode::patch_parse_error, *parse_error);
  }
  if (patches.empty()) {
    return fail(std::move(result), started, ErrorCode::patch_parse_error,
                "Patch contains no file headers");
  }

  auto reject = [&](const std::vector<std::string>& errors) {
    jsonlite::Array arr;
    for (const auto& e : errors) arr.emplace_back(e);
    jsonlite::Object details;
    details["errors"] = std::move(arr);
    log_warn("patch", "step " + std::to_string(step_id) + " rejected: " + errors.front());
    return fail(std::move(result), started, ErrorCode::patch_hunk_fail,
                "Patch does not apply cleanly", std::move(details));
  };

  const auto problems = validate_patch(workspace_root, patches);
  if (!problems.empty()) return reject(problems);

  // Dry run: compute every resulting file image in memory. nullopt = delete.
  std::map<fs::path, std::optional<FileImage>> staged;
  std::vector<std::string> changed_names;
  std::vector<std::string> dry_run_errors;
  auto will_exist = [&staged](const fs::path& p) {
    std::error_code ec;
    const auto it = staged.find(p);
    return it != staged.end() ? it->second.has_value() : fs::exists(p, ec);
  };
  auto note_changed = [&changed_names](const std::string& name) {
    if (std::find(changed_names.begin(), changed_names.end(), name) == changed_names.end()) {
      changed_names.push_back(name);
    }
  };

  for (const auto& fp : patches) {
    if (fp.is_creation() && fp.is_deletion()) {
      dry_run_errors.push_back("patch has /dev/null on both sides");
      continue;
    }
    const PatchTarget names = target_of(workspace_root, fp);
    if (fp.is_creation()) {
      const fs::path target = resolve_safe_path(workspace_root, names.write_name).path;
      if (will_exist(target)) {
        dry_run_errors.push_back(names.write_name + " already exists");
        continue;
      }
      staged[target] = creation_image(fp);
      note_changed(names.write_name);
      continue;
    }

    const fs::path source = resolve_safe_path(workspace_root, names.read_name).path;
    FileImage img;
    if (auto it = staged.find(source); it != staged.end()) {
      if (!it->second) {
        dry_run_errors.push_back(names.read_name + " was deleted earlier in this patch");
        continue;
      }
      img = *it->second;
    } else {
      const auto bytes = read_file_bytes(source);
      if (!bytes) {
        dry_run_errors.push_back(names.read_name + " does not exist");
        continue;
      }
      img = split_lines(*bytes);
    }

    std::string err;
    if (!apply_hunks(img, fp, names.read_name, err)) {
      dry_run_errors.push_back(err);
      continue;
    }
    note_changed(names.read_name);
    if (fp.is_deletion()) {
      staged[source] = std::nullopt;
      continue;
    }
    const fs::path target = resolve_safe_path(workspace_root, names.write_name).path;
    if (target != source) {
      // Only a git rename writes somewhere other than it read.
      if (will_exist(target)) {
        dry_run_errors.push_back("rename target " + names.write_name + " already exists");
        continue;
      }
      staged[source] = std::nullopt;
      note_changed(names.write_name);
    }
    staged[target] = std::move(img);
  }
  if (!dry_run_errors.empty()) return reject(dry_run_errors);
  if (deadline && deadline->expired()) {
    return fail(std::move(result), started, ErrorCode::timeout,
                "apply_patch timed out after " + std::to_string(deadline->budget_sec()) + " seconds",
                jsonlite::Object{{"timeout_sec", deadline->budget_sec()}});
  }

  // Persist the raw diff before touching the workspace.
  std::error_code ec;
  fs::create_directories(artifacts_dir, ec);
  char name[32];
  std::snprintf(name, sizeof(name), "step_%04d.patch", step_id);
  const fs::path artifact = artifacts_dir / name;
  if (ec || !write_file(artifact, unified_diff)) {
    return fail(std::move(result), started, ErrorCode::io_error,
                "Cannot write patch artifact " + artifact.string());
  }

  for (const auto& [path, image] : staged) {
    if (!image) {
      fs::remove(path, ec);
      if (ec) {
        return fail(std::move(result), started, ErrorCode::io_error,
                    "Cannot remove " + path.string() + ": " + ec.message());
      }
      continue;
    }
    fs::create_directories(path.parent_path(), ec);
    std::string err;
    if (ec || !write_file_atomic(path, join_lines(*image), &err)) {
      log_critical("patch", "partial apply at step " + std::to_string(step_id) + ": " + err);
      return fail(std::move(result), started, ErrorCode::io_error, "Cannot write " + path.string() + ": " + err);
    }
  }

  jsonlite::Array changed;
  for (const auto& name : changed_names) changed.emplace_back(name);
  jsonlite::Object data;
  data["changed_files"] = std::move(changed);
  data["patch_size_bytes"] = static_cast<std::uint64_t>(unified_diff.size());
  data["patch_artifact_path"] = artifact.string();
  data["patch_digest"] = patch_digest(unified_diff);
  result.data = std::move(data);
  result.status = ToolStatus::success;
  finish(result, started);
  log_debug("patch", "step " + std::to_string(step_id) + " applied to " +
                         std::to_string(staged.size()) + " file(s)");
  return result;
}

}  // namespace trialbox
