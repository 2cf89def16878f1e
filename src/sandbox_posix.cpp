#include "trialbox/sandbox.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <chrono>
#include <cstring>
#include <thread>

#include "trialbox/interrupt.hpp"
#include "trialbox/observability.hpp"

extern char** environ;

namespace trialbox {

namespace {

// PATH lookup done in the parent so the child only calls async-signal-safe
// functions between fork() and execve().
std::string find_executable(const std::string& name) {
  if (name.find('/') != std::string::npos) {
    return ::access(name.c_str(), X_OK) == 0 ? name : std::string();
  }
  const char* path_env = std::getenv("PATH");
  const std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find(':', start);
    if (end == std::string::npos) end = path.size();
    std::string dir = path.substr(start, end - start);
    if (dir.empty()) dir = ".";
    const std::string candidate = dir + "/" + name;
    if (::access(candidate.c_str(), X_OK) == 0) return candidate;
    start = end + 1;
  }
  return {};
}

std::vector<std::string> build_env(const std::map<std::string, std::string>& overrides) {
  std::map<std::string, std::string> merged;
  for (char** e = environ; e && *e; ++e) {
    const std::string kv(*e);
    const size_t eq = kv.find('=');
    if (eq == std::string::npos) continue;
    merged[kv.substr(0, eq)] = kv.substr(eq + 1);
  }
  for (const auto& [k, v] : overrides) merged[k] = v;
  std::vector<std::string> out;
  out.reserve(merged.size());
  for (const auto& [k, v] : merged) out.push_back(k + "=" + v);
  return out;
}

int open_output(const std::string& path) {
  if (path.empty()) return ::open("/dev/null", O_WRONLY | O_CLOEXEC);
  return ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
}

void kill_group(pid_t pid) {
  ::kill(-pid, SIGKILL);
  ::kill(pid, SIGKILL);
}

// Blocking wait that retries EINTR. ECHILD (already reaped) is not an error.
void reap(pid_t pid, int* status) {
  while (::waitpid(pid, status, 0) < 0 && errno == EINTR) {
  }
}

}  // namespace

std::string to_string(NetworkMode mode) {
  return mode == NetworkMode::none ? "none" : "bridge";
}

NetworkMode parse_network_mode(const std::string& name) {
  if (name == "none") return NetworkMode::none;
  if (name == "bridge") return NetworkMode::bridge;
  throw Error(ErrorCode::invalid_network,
              "Invalid network mode '" + name + "': must be 'none' or 'bridge'");
}

void append_timeout_marker(const std::string& stderr_path, int timeout_sec) {
  if (stderr_path.empty()) return;
  const int fd = ::open(stderr_path.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (fd < 0) {
    const int err = errno;
    log_error("sandbox", "cannot append timeout marker to " + stderr_path + ": " + std::strerror(err));
    return;
  }
  std::string marker;
  struct stat st {};
  if (::fstat(fd, &st) == 0 && st.st_size > 0) {
    char last = 0;
    if (::pread(fd, &last, 1, st.st_size - 1) == 1 && last != '\n') marker += '\n';
  }
  marker += "Execution timed out after " + std::to_string(timeout_sec) + " seconds\n";
  if (::write(fd, marker.data(), marker.size()) < 0) {
    log_error("sandbox", "short write of timeout marker to " + stderr_path);
  }
  ::close(fd);
}

ProcessResult run_process(const ProcessSpec& spec) {
  ProcessResult result;
  const auto started = std::chrono::steady_clock::now();

  if (spec.argv.empty()) {
    result.error_code = ErrorCode::spawn_failed;
    result.error_message = "empty argv";
    return result;
  }
  const std::string exe = find_executable(spec.argv[0]);
  if (exe.empty()) {
    result.error_code = ErrorCode::spawn_failed;
    result.error_message = "executable not found: " + spec.argv[0];
    return result;
  }

  const int out_fd = open_output(spec.stdout_path);
  if (out_fd < 0) {
    const int err = errno;
    result.error_code = ErrorCode::io_error;
    result.error_message = "cannot open " + spec.stdout_path + ": " + std::strerror(err);
    return result;
  }
  const int err_fd = open_output(spec.stderr_path);
  if (err_fd < 0) {
    const int err = errno;
    result.error_code = ErrorCode::io_error;
    result.error_message = "cannot open " + spec.stderr_path + ": " + std::strerror(err);
    ::close(out_fd);
    return result;
  }

  // exec failures are reported through a close-on-exec pipe: EOF means the
  // exec succeeded, an int means it did not.
  int exec_pipe[2];
  if (::pipe2(exec_pipe, O_CLOEXEC) != 0) {
    const int err = errno;
    result.error_code = ErrorCode::spawn_failed;
    result.error_message = std::string("pipe: ") + std::strerror(err);
    ::close(out_fd);
    ::close(err_fd);
    return result;
  }

  std::vector<std::string> args = spec.argv;
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto& s : args) argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs = build_env(spec.env);
  std::vector<char*> envp;
  envp.reserve(envs.size() + 1);
  for (auto& e : envs) envp.push_back(e.data());
  envp.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int err = errno;
    result.error_code = ErrorCode::spawn_failed;
    result.error_message = std::string("fork: ") + std::strerror(err);
    ::close(out_fd);
    ::close(err_fd);
    ::close(exec_pipe[0]);
    ::close(exec_pipe[1]);
    return result;
  }

  if (pid == 0) {
    ::setsid();
    const int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    ::dup2(out_fd, STDOUT_FILENO);
    ::dup2(err_fd, STDERR_FILENO);
    int child_errno = 0;
    if (!spec.cwd.empty() && ::chdir(spec.cwd.c_str()) != 0) {
      child_errno = errno;
    } else {
      ::execve(exe.c_str(), argv.data(), envp.data());
      child_errno = errno;
    }
    ssize_t ignored = ::write(exec_pipe[1], &child_errno, sizeof(child_errno));
    (void)ignored;
    ::_exit(127);
  }

  ::close(out_fd);
  ::close(err_fd);
  ::close(exec_pipe[1]);

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  ::close(exec_pipe[0]);
  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    reap(pid, &status);
    result.error_code = ErrorCode::spawn_failed;
    result.error_message = "cannot exec " + exe + ": " + std::strerror(child_errno);
    return result;
  }

  global_harness_stats().sandbox_runs.fetch_add(1, std::memory_order_relaxed);

  const auto deadline = started + std::chrono::seconds(spec.timeout_sec);
  int status = 0;
  while (true) {
    const pid_t w = ::waitpid(pid, &status, WNOHANG);
    if (w == pid) break;
    if (w < 0 && errno != EINTR) {
      const int err = errno;
      kill_group(pid);
      reap(pid, &status);
      result.error_code = ErrorCode::io_error;
      result.error_message = std::string("waitpid: ") + std::strerror(err);
      return result;
    }
    if (interrupt_requested()) {
      kill_group(pid);
      reap(pid, &status);
      result.interrupted = true;
      break;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      kill_group(pid);
      reap(pid, &status);
      result.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  result.duration_sec =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

  if (result.timed_out) {
    result.exit_code = 124;
    append_timeout_marker(spec.stderr_path, spec.timeout_sec);
    global_harness_stats().sandbox_timeouts.fetch_add(1, std::memory_order_relaxed);
  } else if (result.interrupted) {
    result.exit_code = 128 + SIGINT;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

}  // namespace trialbox
