#pragma once

// trialbox/sandbox.hpp - Process execution and the container sandbox.
//
// TIMEOUTS:
//   The container runtime is never trusted to enforce the wall clock. The
//   parent polls a steady-clock deadline; on expiry it SIGKILLs the child's
//   whole process group (the child calls setsid()), forces exit code 124 and
//   appends "Execution timed out after N seconds" to the stderr artifact.
//   Partial output stays on disk.
//
// ERRORS:
//   run_process() never throws. A spawn or file fault sets error_code
//   (spawn_failed / io_error) instead of inventing an exit code.
//   ContainerSandbox::run() is an orchestration boundary and throws:
//     Error(workspace_missing)  workspace is not an existing directory
//     Error(sandbox_error)      the runtime could not be spawned or logged
//     InterruptedError          the user interrupted while the command ran
//
// NETWORK:
//   Exactly two modes. `none` runs the task's tests (no test-time network
//   cheating). `bridge` is only for setup and dependency installs.

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "trialbox/types.hpp"

namespace trialbox {

enum class NetworkMode { none, bridge };

std::string to_string(NetworkMode mode);

// Throws Error(invalid_network) for anything but "none" or "bridge".
NetworkMode parse_network_mode(const std::string& name);

struct ProcessSpec {
  std::vector<std::string> argv;                // argv[0] is looked up on PATH
  std::string cwd;
  std::map<std::string, std::string> env;       // overrides on top of the parent env
  int timeout_sec{60};
  std::string stdout_path;                      // truncated, created if missing
  std::string stderr_path;
};

struct ProcessResult {
  int exit_code{-1};
  bool timed_out{false};
  bool interrupted{false};
  ErrorCode error_code{ErrorCode::none};
  std::string error_message;
  double duration_sec{0.0};

  bool ok() const { return error_code == ErrorCode::none; }
};

ProcessResult run_process(const ProcessSpec& spec);

// Appends the forced-termination marker to a stderr artifact.
void append_timeout_marker(const std::string& stderr_path, int timeout_sec);

// ---------------------------------------------------------------------------
// SandboxConfig
// ---------------------------------------------------------------------------
/// Reads TRIALBOX_CONTAINER_RUNTIME (default "docker"). Any CLI that speaks
/// docker's `run` flags (podman, nerdctl) works.
struct SandboxConfig {
  std::string runtime{"docker"};

  static SandboxConfig from_env();
};

struct SandboxRunResult {
  int exit_code{-1};
  std::string stdout_path;
  std::string stderr_path;
  bool timed_out{false};
};

/// <runtime> run --rm --network <mode> -v <ws>:<workdir> -w <workdir>
///           <image> bash -lc <command>
std::vector<std::string> build_container_argv(const std::string& runtime,
                                              const std::string& image,
                                              const std::string& workdir,
                                              const std::string& workspace_host_path,
                                              NetworkMode network,
                                              const std::string& command);

class ContainerSandbox {
 public:
  explicit ContainerSandbox(std::string image, std::string workdir = "/workspace",
                            SandboxConfig config = SandboxConfig::from_env());

  SandboxRunResult run(const std::filesystem::path& workspace_host_path,
                       const std::string& command,
                       NetworkMode network,
                       int timeout_sec,
                       const std::filesystem::path& stdout_path,
                       const std::filesystem::path& stderr_path) const;

  const std::string& image() const { return image_; }
  const std::string& workdir() const { return workdir_; }

 private:
  std::string image_;
  std::string workdir_;
  SandboxConfig config_;
};

}  // namespace trialbox
