#pragma once

// trialbox/fs_util.hpp - Small file helpers shared by patch, jsonl and suite.

#include <filesystem>
#include <optional>
#include <string>

namespace trialbox {

// Whole-file binary read. nullopt if the file cannot be opened.
std::optional<std::string> read_file_bytes(const std::filesystem::path& path);

// Replaces `path` with `content` via mkstemp in the same directory, fsync and
// rename(2). Existing permissions are carried over. On failure the temp file
// is removed, *error is set (when non-null) and `path` is untouched.
bool write_file_atomic(const std::filesystem::path& path, const std::string& content,
                       std::string* error = nullptr);

// Plain truncating write, for artifacts nobody reads concurrently.
bool write_file(const std::filesystem::path& path, const std::string& content);

}  // namespace trialbox
