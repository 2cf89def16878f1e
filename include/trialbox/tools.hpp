#pragma once

// trialbox/tools.hpp - The agent tool contract.
//
// Every tool returns exactly one ToolResult and never throws: path escapes,
// symlinks, missing files, timeouts and sandbox faults come back as a
// ToolError whose error_type is a stable string (to_string(ErrorCode), or
// "abnormal_exit" for a command that ran and failed).
//
// DEADLINES:
//   Each call owns a Deadline. A caller may pass its own; otherwise the
//   default budget below applies. The walk loops poll it, so a listing or
//   search over a huge tree stops with error_type "timeout".
//
//   list_files 30 s   read_file 10 s   search 60 s   apply_patch 10 s
//   run: params.timeout_sec, else 60 s, enforced by the sandbox.

#include <filesystem>
#include <string>
#include <utility>

#include "trialbox/deadline.hpp"
#include "trialbox/sandbox.hpp"
#include "trialbox/types.hpp"

namespace trialbox {

constexpr int kListFilesTimeoutSec = 30;
constexpr int kReadFileTimeoutSec = 10;
constexpr int kSearchTimeoutSec = 60;
constexpr int kApplyPatchTimeoutSec = 10;
constexpr int kRunDefaultTimeoutSec = 60;

// Default budget for a tool, in seconds.
int default_tool_timeout(ToolName tool);

// read_file keeps the first and last kReadFileEdgeLines lines of files longer
// than kReadFileMaxLines.
constexpr size_t kReadFileMaxLines = 10000;
constexpr size_t kReadFileEdgeLines = 5000;

constexpr size_t kMaxOutputBytes = 100000;
constexpr size_t kMaxOutputLines = 2000;

struct ListFilesParams {
  std::string root{"."};
  std::string glob{"*"};
};

struct ReadFileParams {
  std::string path;
};

struct SearchParams {
  std::string query;
  std::string glob;        // empty = every file
  int max_results{50};
  int context_lines{0};
};

struct RunParams {
  std::string command;
  int timeout_sec{0};      // 0 = kRunDefaultTimeoutSec
};

// data: { files: [workspace-relative paths, sorted] }
ToolResult list_files(const std::string& request_id, const std::filesystem::path& workspace_root,
                      const ListFilesParams& params, const Deadline* deadline = nullptr);

// data: { content, truncated, total_lines, start_line, end_line, lines_included }
ToolResult read_file(const std::string& request_id, const std::filesystem::path& workspace_root,
                     const ReadFileParams& params, const Deadline* deadline = nullptr);

// Case-insensitive fixed-string search.
// data: { matches: [{file, line, content, context_before, context_after}],
//         truncated, total_matches }
ToolResult search(const std::string& request_id, const std::filesystem::path& workspace_root,
                  const SearchParams& params, const Deadline* deadline = nullptr);

// apply_patch with the raw diff kept under <artifacts_dir>/diffs/.
ToolResult apply_patch_tool(const std::filesystem::path& workspace_root, const std::string& unified_diff,
                            int step_id, const std::filesystem::path& artifacts_dir,
                            const Deadline* deadline = nullptr);

// Runs params.command in the sandbox with network none. Output goes to
// <artifacts_dir>/logs/tool_step_%04d_{stdout,stderr}.txt.
ToolResult run_tool(const std::filesystem::path& workspace_root, const RunParams& params,
                    const ContainerSandbox& sandbox, int step_id,
                    const std::filesystem::path& artifacts_dir);

// Keeps the first and last kMaxOutputLines/2 lines of content that exceeds
// both kMaxOutputBytes and kMaxOutputLines, with a
// "... [N lines truncated] ..." marker between them.
std::pair<std::string, bool> truncate_output(const std::string& content);

}  // namespace trialbox
