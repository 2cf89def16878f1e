#include "trialbox/fs_util.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace trialbox {

std::optional<std::string> read_file_bytes(const fs::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

bool write_file(const fs::path& path, const std::string& content) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) return false;
  ofs << content;
  return static_cast<bool>(ofs);
}

bool write_file_atomic(const fs::path& path, const std::string& content, std::string* error) {
  // `err` is errno as saved right after the failing call; cleanup clobbers it.
  auto fail = [&](const std::string& what, int err) {
    if (error) *error = what + ": " + std::strerror(err);
    return false;
  };

  const fs::path dir = path.has_parent_path() ? path.parent_path() : fs::path(".");
  std::string tmpl = (dir / ("." + path.filename().string() + ".tmp-XXXXXX")).string();
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');

  const int fd = ::mkstemp(buf.data());
  if (fd < 0) return fail("mkstemp " + tmpl, errno);
  const std::string tmp_path(buf.data());

  size_t off = 0;
  while (off < content.size()) {
    const ssize_t n = ::write(fd, content.data() + off, content.size() - off);
    if (n < 0) {
      const int err = errno;
      if (err == EINTR) continue;
      ::close(fd);
      ::unlink(tmp_path.c_str());
      return fail("write " + tmp_path, err);
    }
    off += static_cast<size_t>(n);
  }
  if (::fsync(fd) != 0) {
    const int err = errno;
    ::close(fd);
    ::unlink(tmp_path.c_str());
    return fail("fsync " + tmp_path, err);
  }
  ::close(fd);

  std::error_code ec;
  const auto st = fs::status(path, ec);
  if (!ec && fs::exists(st)) {
    fs::permissions(tmp_path, st.permissions(), ec);
  } else {
    // mkstemp creates 0600; new files get the usual 0644.
    fs::permissions(tmp_path,
                    fs::perms::owner_read | fs::perms::owner_write |
                        fs::perms::group_read | fs::perms::others_read,
                    ec);
  }

  if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
    const int err = errno;
    ::unlink(tmp_path.c_str());
    return fail("rename " + tmp_path + " -> " + path.string(), err);
  }
  return true;
}

}  // namespace trialbox
