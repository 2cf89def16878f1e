#pragma once

// trialbox/jsonl.hpp - Crash-safe append-only JSON Lines log.
//
// APPEND CONTRACT (append_record):
//   1. flock(LOCK_EX) on "<path>.lock", so concurrent harness processes that
//      share one log serialize their writes.
//   2. Under the lock: copy the current file into a temp file in the same
//      directory, append the record as one line, fsync, rename over <path>.
//   3. Any fault is logged at critical, the temp file is removed, and the
//      call returns false. It never throws: a logging fault must not abort the
//      attempt it is recording.
//
//   Readers therefore see either the old file or the new one, never a torn
//   last line.
//
// READER:
//   JsonlReader is a lazy input range. Every begin() reopens the file, so the
//   same reader can be iterated again after more records were appended. Blank
//   lines are skipped; a line that does not parse is logged at warn and
//   skipped.

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "trialbox/jsonlite.hpp"

namespace trialbox {

// Exclusive advisory lock on "<path>.lock", held for the object's lifetime.
class FileLock {
 public:
  explicit FileLock(const std::filesystem::path& target);
  ~FileLock();

  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;

  bool locked() const { return fd_ >= 0; }
  const std::string& error() const { return error_; }

 private:
  int fd_{-1};
  std::string error_;
};

std::filesystem::path lock_path_for(const std::filesystem::path& target);

bool append_record(const std::filesystem::path& path, const std::string& json_line);
bool append_record(const std::filesystem::path& path, const jsonlite::Object& record);

class JsonlReader {
 public:
  class iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = jsonlite::Object;
    using difference_type = std::ptrdiff_t;
    using pointer = const jsonlite::Object*;
    using reference = const jsonlite::Object&;

    iterator() = default;

    reference operator*() const { return current_; }
    pointer operator->() const { return &current_; }
    iterator& operator++() {
      advance();
      return *this;
    }
    bool operator==(const iterator& other) const { return in_ == other.in_; }
    bool operator!=(const iterator& other) const { return !(*this == other); }

   private:
    friend class JsonlReader;
    iterator(std::shared_ptr<std::ifstream> in, std::string source);
    void advance();

    std::shared_ptr<std::ifstream> in_;
    std::string source_;
    size_t line_no_{0};
    jsonlite::Object current_;
  };

  explicit JsonlReader(std::filesystem::path path) : path_(std::move(path)) {}

  // A missing file reads as empty.
  iterator begin() const;
  iterator end() const { return iterator(); }

 private:
  std::filesystem::path path_;
};

std::vector<jsonlite::Object> read_records(const std::filesystem::path& path);

}  // namespace trialbox
