#include "trialbox/sandbox.hpp"

#include <cstdlib>
#include <system_error>

#include "trialbox/observability.hpp"

namespace fs = std::filesystem;

namespace trialbox {

SandboxConfig SandboxConfig::from_env() {
  SandboxConfig cfg;
  if (const char* rt = std::getenv("TRIALBOX_CONTAINER_RUNTIME"); rt && rt[0]) {
    cfg.runtime = rt;
  }
  return cfg;
}

std::vector<std::string> build_container_argv(const std::string& runtime, const std::string& image,
                                              const std::string& workdir,
                                              const std::string& workspace_host_path,
                                              NetworkMode network, const std::string& command) {
  return {
      runtime,
      "run",
      "--rm",
      "--network",
      to_string(network),
      "-v",
      workspace_host_path + ":" + workdir,
      "-w",
      workdir,
      image,
      "bash",
      "-lc",
      command,
  };
}

ContainerSandbox::ContainerSandbox(std::string image, std::string workdir, SandboxConfig config)
    : image_(std::move(image)), workdir_(std::move(workdir)), config_(std::move(config)) {}

SandboxRunResult ContainerSandbox::run(const fs::path& workspace_host_path, const std::string& command,
                                       NetworkMode network, int timeout_sec,
                                       const fs::path& stdout_path,
                                       const fs::path& stderr_path) const {
  std::error_code ec;
  if (!fs::is_directory(workspace_host_path, ec)) {
    throw Error(ErrorCode::workspace_missing,
                "Workspace path is not an existing directory: " + workspace_host_path.string());
  }
  const fs::path workspace = fs::absolute(workspace_host_path, ec);
  if (stdout_path.has_parent_path()) fs::create_directories(stdout_path.parent_path(), ec);
  if (stderr_path.has_parent_path()) fs::create_directories(stderr_path.parent_path(), ec);

  ProcessSpec spec;
  spec.argv = build_container_argv(config_.runtime, image_, workdir_, workspace.string(), network, command);
  spec.timeout_sec = timeout_sec;
  spec.stdout_path = stdout_path.string();
  spec.stderr_path = stderr_path.string();

  log_debug("sandbox", "run network=" + to_string(network) + " timeout=" + std::to_string(timeout_sec) +
                           "s image=" + image_ + " cmd=" + command);

  const ProcessResult pr = run_process(spec);
  if (!pr.ok()) {
    log_error("sandbox", "container runtime fault: " + pr.error_message);
    throw Error(ErrorCode::sandbox_error, "Sandbox I/O error: " + pr.error_message);
  }
  if (pr.interrupted) {
    throw InterruptedError("interrupted while running: " + command);
  }
  if (pr.timed_out) {
    log_warn("sandbox", "command timed out after " + std::to_string(timeout_sec) + "s: " + command);
  }

  SandboxRunResult out;
  out.exit_code = pr.exit_code;
  out.stdout_path = spec.stdout_path;
  out.stderr_path = spec.stderr_path;
  out.timed_out = pr.timed_out;
  return out;
}

}  // namespace trialbox
