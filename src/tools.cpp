#include "trialbox/tools.hpp"

#include <algorithm>
#include <cstdio>
#include <string_view>
#include <system_error>
#include <vector>

#include "trialbox/fs_util.hpp"
#include "trialbox/observability.hpp"
#include "trialbox/patch.hpp"
#include "trialbox/path_guard.hpp"
#include "trialbox/taxonomy.hpp"

namespace fs = std::filesystem;

namespace trialbox {

namespace {

// One in-flight tool invocation: stamps start/end and keeps the counters.
class ToolCall {
 public:
  ToolCall(std::string request_id, ToolName tool) : started_(WallClock::now()) {
    result_.request_id = std::move(request_id);
    result_.tool = tool;
    result_.started_at = format_utc(started_);
    global_harness_stats().tool_calls.fetch_add(1, std::memory_order_relaxed);
  }

  ToolResult& result() { return result_; }

  ToolResult ok(jsonlite::Object data) {
    result_.status = ToolStatus::success;
    result_.data = std::move(data);
    return finish();
  }

  ToolResult error(const std::string& type, const std::string& message,
                   jsonlite::Object details = {}) {
    result_.status = ToolStatus::error;
    result_.error = ToolError{type, message, std::move(details)};
    global_harness_stats().tool_errors.fetch_add(1, std::memory_order_relaxed);
    log_debug("tools", to_string(result_.tool) + " " + result_.request_id + " -> " + type + ": " +
                           message);
    return finish();
  }

  ToolResult error(ErrorCode code, const std::string& message, jsonlite::Object details = {}) {
    return error(to_string(code), message, std::move(details));
  }

 private:
  ToolResult finish() {
    const auto ended = WallClock::now();
    result_.ended_at = format_utc(ended);
    result_.duration_sec = seconds_between(started_, ended);
    return std::move(result_);
  }

  WallClock::time_point started_;
  ToolResult result_;
};

std::string to_lower_ascii(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

// Lines without terminators. A trailing newline does not start a new line and
// a "\r\n" terminator is treated as "\n".
std::vector<std::string> split_text_lines(const std::string& text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start < text.size()) {
    size_t nl = text.find('\n', start);
    if (nl == std::string::npos) nl = text.size();
    std::string line = text.substr(start, nl - start);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(std::move(line));
    start = nl + 1;
  }
  return lines;
}

bool looks_binary(const std::string& bytes) {
  return bytes.find('\0') != std::string::npos || !is_valid_utf8(bytes);
}

std::string join(const std::vector<std::string>& lines, size_t from, size_t to) {
  std::string out;
  for (size_t i = from; i < to; ++i) {
    if (i > from) out += '\n';
    out += lines[i];
  }
  return out;
}

jsonlite::Value lines_or_null(const std::vector<std::string>& lines, size_t from, size_t to) {
  if (from >= to) return jsonlite::Value(nullptr);
  jsonlite::Array arr;
  for (size_t i = from; i < to; ++i) arr.emplace_back(lines[i]);
  return arr;
}

fs::path canonical_root(const fs::path& workspace_root) {
  std::error_code ec;
  fs::path root = fs::weakly_canonical(workspace_root, ec);
  return ec ? workspace_root : root;
}

std::string step_name(const char* fmt, int step_id) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), fmt, step_id);
  return buf;
}

}  // namespace

int default_tool_timeout(ToolName tool) {
  switch (tool) {
    case ToolName::list_files: return kListFilesTimeoutSec;
    case ToolName::read_file: return kReadFileTimeoutSec;
    case ToolName::search: return kSearchTimeoutSec;
    case ToolName::apply_patch: return kApplyPatchTimeoutSec;
    case ToolName::run: return kRunDefaultTimeoutSec;
  }
  return kRunDefaultTimeoutSec;
}

ToolResult list_files(const std::string& request_id, const fs::path& workspace_root,
                      const ListFilesParams& params, const Deadline* deadline) {
  ToolCall call(request_id, ToolName::list_files);
  const Deadline local(Deadline::seconds(kListFilesTimeoutSec));
  const Deadline& dl = deadline ? *deadline : local;

  const PathResolution where = resolve_safe_path(workspace_root, params.root);
  if (!where.ok()) return call.error(where.error, where.message);

  std::error_code ec;
  if (!fs::is_directory(where.path, ec)) {
    return call.error(ErrorCode::file_not_found, "Directory does not exist: " + params.root,
                      jsonlite::Object{{"path", params.root}});
  }

  std::vector<fs::path> files;
  try {
    files = safe_glob(where.path, params.glob.empty() ? std::string("*") : params.glob, &dl);
  } catch (const Error& e) {
    if (e.code() == ErrorCode::timeout) {
      return call.error(ErrorCode::timeout, e.what(), jsonlite::Object{{"timeout_sec", dl.budget_sec()}});
    }
    return call.error(e.code(), e.what());
  }

  const fs::path root = canonical_root(workspace_root);
  jsonlite::Array out;
  for (const auto& f : files) out.emplace_back(f.lexically_relative(root).generic_string());
  log_debug("tools", "list_files found " + std::to_string(files.size()) + " files in " + params.root);
  return call.ok(jsonlite::Object{{"files", std::move(out)}});
}

ToolResult read_file(const std::string& request_id, const fs::path& workspace_root,
                     const ReadFileParams& params, const Deadline* deadline) {
  ToolCall call(request_id, ToolName::read_file);
  const Deadline local(Deadline::seconds(kReadFileTimeoutSec));
  const Deadline& dl = deadline ? *deadline : local;
  const jsonlite::Object path_details{{"path", params.path}};

  const PathResolution where = resolve_safe_path(workspace_root, params.path);
  if (!where.ok()) return call.error(where.error, where.message, path_details);

  std::error_code ec;
  if (!fs::exists(where.path, ec)) {
    return call.error(ErrorCode::file_not_found, "File does not exist: " + params.path, path_details);
  }
  if (!fs::is_regular_file(where.path, ec)) {
    return call.error(ErrorCode::io_error, "Not a regular file: " + params.path, path_details);
  }
  if (dl.expired()) {
    return call.error(ErrorCode::timeout, "read_file timed out after " + std::to_string(dl.budget_sec()) + " seconds",
                      jsonlite::Object{{"timeout_sec", dl.budget_sec()}});
  }

  const auto bytes = read_file_bytes(where.path);
  if (!bytes) {
    return call.error(ErrorCode::io_error, "Cannot read " + params.path, path_details);
  }
  if (looks_binary(*bytes)) {
    return call.error(ErrorCode::binary_file, "Cannot read binary file", path_details);
  }

  const auto lines = split_text_lines(*bytes);
  const size_t total = lines.size();
  jsonlite::Object data;
  if (total <= kReadFileMaxLines) {
    data["content"] = join(lines, 0, total);
    data["truncated"] = false;
    data["end_line"] = total;
    data["lines_included"] = nullptr;
  } else {
    data["content"] = join(lines, 0, kReadFileEdgeLines) + "\n\n... [truncated] ...\n\n" +
                      join(lines, total - kReadFileEdgeLines, total);
    data["truncated"] = true;
    data["end_line"] = nullptr;
    data["lines_included"] = "1-" + std::to_string(kReadFileEdgeLines) + ", " +
                             std::to_string(total - kReadFileEdgeLines + 1) + "-" +
                             std::to_string(total);
  }
  data["total_lines"] = total;
  data["start_line"] = 1;
  return call.ok(std::move(data));
}

ToolResult search(const std::string& request_id, const fs::path& workspace_root,
                  const SearchParams& params, const Deadline* deadline) {
  ToolCall call(request_id, ToolName::search);
  const Deadline local(Deadline::seconds(kSearchTimeoutSec));
  const Deadline& dl = deadline ? *deadline : local;

  if (params.query.empty()) return call.error(ErrorCode::config_error, "query must not be empty");
  const size_t max_results = static_cast<size_t>(std::max(params.max_results, 1));
  const size_t context = static_cast<size_t>(std::max(params.context_lines, 0));

  // A bare glob like "*.py" matches at any depth, as ripgrep's --glob does.
  std::string pattern = "**";
  if (!params.glob.empty()) {
    pattern = params.glob.find('/') == std::string::npos ? "**/" + params.glob : params.glob;
  }

  const fs::path root = canonical_root(workspace_root);
  const std::string needle = to_lower_ascii(params.query);
  jsonlite::Array matches;
  size_t match_count = 0;
  bool truncated = false;

  try {
    for (const auto& file : safe_glob(root, pattern, &dl)) {
      std::error_code ec;
      if (!fs::is_regular_file(file, ec)) continue;
      dl.check("search");
      const auto bytes = read_file_bytes(file);
      if (!bytes || looks_binary(*bytes)) continue;

      const auto lines = split_text_lines(*bytes);
      const std::string rel = file.lexically_relative(root).generic_string();
      for (size_t i = 0; i < lines.size(); ++i) {
        if (to_lower_ascii(lines[i]).find(needle) == std::string::npos) continue;
        if (++match_count > max_results) {
          truncated = true;
          break;
        }
        const size_t before = i >= context ? i - context : 0;
        const size_t after = std::min(lines.size(), i + 1 + context);
        matches.emplace_back(jsonlite::Object{
            {"file", rel},
            {"line", i + 1},
            {"content", lines[i]},
            {"context_before", lines_or_null(lines, before, i)},
            {"context_after", lines_or_null(lines, i + 1, after)},
        });
      }
      if (truncated) break;
    }
  } catch (const Error& e) {
    if (e.code() == ErrorCode::timeout) {
      return call.error(ErrorCode::timeout,
                        "Search timed out after " + std::to_string(dl.budget_sec()) + " seconds",
                        jsonlite::Object{{"timeout_sec", dl.budget_sec()}});
    }
    return call.error(e.code(), e.what());
  }

  const size_t reported = std::min(match_count, max_results);
  log_debug("tools", "search found " + std::to_string(reported) + " matches");
  return call.ok(jsonlite::Object{
      {"matches", std::move(matches)},
      {"truncated", truncated},
      {"total_matches", reported},
  });
}

ToolResult apply_patch_tool(const fs::path& workspace_root, const std::string& unified_diff,
                            int step_id, const fs::path& artifacts_dir, const Deadline* deadline) {
  const Deadline local(Deadline::seconds(kApplyPatchTimeoutSec));
  global_harness_stats().tool_calls.fetch_add(1, std::memory_order_relaxed);
  ToolResult r = apply_patch(workspace_root, unified_diff, step_id, artifacts_dir / "diffs",
                             deadline ? deadline : &local);
  if (!r.ok()) global_harness_stats().tool_errors.fetch_add(1, std::memory_order_relaxed);
  return r;
}

ToolResult run_tool(const fs::path& workspace_root, const RunParams& params,
                    const ContainerSandbox& sandbox, int step_id, const fs::path& artifacts_dir) {
  ToolCall call(step_name("tool_step_%04d", step_id), ToolName::run);
  const int timeout_sec = params.timeout_sec > 0 ? params.timeout_sec : kRunDefaultTimeoutSec;
  const fs::path logs = artifacts_dir / "logs";
  const fs::path stdout_path = logs / step_name("tool_step_%04d_stdout.txt", step_id);
  const fs::path stderr_path = logs / step_name("tool_step_%04d_stderr.txt", step_id);
  log_debug("tools", "Executing command in sandbox: " + params.command);

  SandboxRunResult run;
  try {
    run = sandbox.run(workspace_root, params.command, NetworkMode::none, timeout_sec, stdout_path,
                      stderr_path);
  } catch (const InterruptedError&) {
    throw;
  } catch (const Error& e) {
    log_error("tools", std::string("Sandbox execution failed: ") + e.what());
    return call.error(e.code(), e.what());
  }

  ToolResult& r = call.result();
  r.exit_code = run.exit_code;
  r.stdout_path = run.stdout_path;
  r.stderr_path = run.stderr_path;

  if (run.timed_out) {
    return call.error(ErrorCode::timeout,
                      "Command timed out after " + std::to_string(timeout_sec) + " seconds",
                      jsonlite::Object{{"timeout_sec", timeout_sec}, {"exit_code", run.exit_code}});
  }
  if (const auto reason = from_test_exit_code(run.exit_code)) {
    return call.error("abnormal_exit",
                      "Command exited with code " + std::to_string(run.exit_code) + " (" +
                          to_string(*reason) + ")",
                      jsonlite::Object{{"exit_code", run.exit_code}});
  }
  return call.ok(jsonlite::Object{
      {"exit_code", run.exit_code},
      {"stdout_path", run.stdout_path},
      {"stderr_path", run.stderr_path},
  });
}

std::pair<std::string, bool> truncate_output(const std::string& content) {
  if (content.size() <= kMaxOutputBytes) return {content, false};

  // Lines keep their terminators so the kept halves reassemble verbatim.
  std::vector<std::string_view> lines;
  const std::string_view view(content);
  size_t start = 0;
  while (start < view.size()) {
    size_t nl = view.find('\n', start);
    const size_t end = nl == std::string_view::npos ? view.size() : nl + 1;
    lines.push_back(view.substr(start, end - start));
    start = end;
  }
  if (lines.size() <= kMaxOutputLines) return {content, false};

  const size_t half = kMaxOutputLines / 2;
  std::string out;
  for (size_t i = 0; i < half; ++i) out.append(lines[i]);
  out += "\n\n... [" + std::to_string(lines.size() - kMaxOutputLines) + " lines truncated] ...\n\n";
  for (size_t i = lines.size() - half; i < lines.size(); ++i) out.append(lines[i]);
  return {out, true};
}

}  // namespace trialbox
