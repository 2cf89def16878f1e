#include "trialbox/jsonl.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include "trialbox/observability.hpp"

namespace fs = std::filesystem;

namespace trialbox {

fs::path lock_path_for(const fs::path& target) {
  fs::path p = target;
  p += ".lock";
  return p;
}

FileLock::FileLock(const fs::path& target) {
  const fs::path lp = lock_path_for(target);
  fd_ = ::open(lp.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ < 0) {
    const int err = errno;
    error_ = "open " + lp.string() + ": " + std::strerror(err);
    return;
  }
  int rc;
  do {
    rc = ::flock(fd_, LOCK_EX);
  } while (rc != 0 && errno == EINTR);
  if (rc != 0) {
    const int err = errno;
    error_ = "flock " + lp.string() + ": " + std::strerror(err);
    ::close(fd_);
    fd_ = -1;
  }
}

FileLock::~FileLock() {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
}

namespace {

bool write_all(int fd, const char* data, size_t len) {
  size_t off = 0;
  while (off < len) {
    const ssize_t n = ::write(fd, data + off, len - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    off += static_cast<size_t>(n);
  }
  return true;
}

bool append_failed(const fs::path& path, const std::string& what, const std::string& tmp_path) {
  log_critical("jsonl", "Failed to write JSONL record to " + path.string() + ": " + what);
  if (!tmp_path.empty()) ::unlink(tmp_path.c_str());
  global_harness_stats().append_failures.fetch_add(1, std::memory_order_relaxed);
  return false;
}

}  // namespace

bool append_record(const fs::path& path, const std::string& json_line) {
  std::error_code ec;
  const fs::path dir = path.has_parent_path() ? path.parent_path() : fs::path(".");
  fs::create_directories(dir, ec);
  if (ec) return append_failed(path, "create_directories: " + ec.message(), "");

  FileLock lock(path);
  if (!lock.locked()) return append_failed(path, lock.error(), "");

  std::string tmpl = (dir / ("." + path.filename().string() + ".tmp-XXXXXX")).string();
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  const int tmp_fd = ::mkstemp(buf.data());
  if (tmp_fd < 0) {
    const int err = errno;
    return append_failed(path, std::string("mkstemp: ") + std::strerror(err), "");
  }
  const std::string tmp_path(buf.data());

  const int src_fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (src_fd >= 0) {
    char chunk[65536];
    while (true) {
      const ssize_t n = ::read(src_fd, chunk, sizeof(chunk));
      if (n == 0) break;
      if (n < 0) {
        const int err = errno;
        if (err == EINTR) continue;
        const std::string msg = std::string("read: ") + std::strerror(err);
        ::close(src_fd);
        ::close(tmp_fd);
        return append_failed(path, msg, tmp_path);
      }
      if (!write_all(tmp_fd, chunk, static_cast<size_t>(n))) {
        const int err = errno;
        const std::string msg = std::string("copy: ") + std::strerror(err);
        ::close(src_fd);
        ::close(tmp_fd);
        return append_failed(path, msg, tmp_path);
      }
    }
    ::close(src_fd);
  } else if (const int err = errno; err != ENOENT) {
    const std::string msg = std::string("open: ") + std::strerror(err);
    ::close(tmp_fd);
    return append_failed(path, msg, tmp_path);
  }

  std::string line = json_line;
  line.push_back('\n');
  if (!write_all(tmp_fd, line.data(), line.size())) {
    const int err = errno;
    const std::string msg = std::string("write: ") + std::strerror(err);
    ::close(tmp_fd);
    return append_failed(path, msg, tmp_path);
  }
  if (::fsync(tmp_fd) != 0) {
    const int err = errno;
    const std::string msg = std::string("fsync: ") + std::strerror(err);
    ::close(tmp_fd);
    return append_failed(path, msg, tmp_path);
  }
  ::fchmod(tmp_fd, 0644);
  ::close(tmp_fd);

  if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
    const int err = errno;
    return append_failed(path, std::string("rename: ") + std::strerror(err), tmp_path);
  }
  return true;
}

bool append_record(const fs::path& path, const jsonlite::Object& record) {
  return append_record(path, jsonlite::to_json(record));
}

JsonlReader::iterator::iterator(std::shared_ptr<std::ifstream> in, std::string source)
    : in_(std::move(in)), source_(std::move(source)) {
  advance();
}

void JsonlReader::iterator::advance() {
  std::string line;
  while (in_ && std::getline(*in_, line)) {
    ++line_no_;
    const size_t first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos) continue;
    std::optional<jsonlite::JsonError> err;
    jsonlite::Object obj = jsonlite::parse(line, &err);
    if (err) {
      log_warn("jsonl", source_ + ":" + std::to_string(line_no_) +
                            " could not be read: " + err->message);
      continue;
    }
    current_ = std::move(obj);
    return;
  }
  in_.reset();
  current_.clear();
}

JsonlReader::iterator JsonlReader::begin() const {
  auto in = std::make_shared<std::ifstream>(path_, std::ios::binary);
  if (!*in) return iterator();
  return iterator(std::move(in), path_.string());
}

std::vector<jsonlite::Object> read_records(const fs::path& path) {
  std::vector<jsonlite::Object> out;
  JsonlReader reader(path);
  for (const auto& rec : reader) out.push_back(rec);
  return out;
}

}  // namespace trialbox
