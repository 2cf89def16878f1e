#include <cstdint>
#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "trialbox/agent_runner.hpp"
#include "trialbox/attempt.hpp"
#include "trialbox/cli_args.hpp"
#include "trialbox/hash.hpp"
#include "trialbox/interrupt.hpp"
#include "trialbox/jsonl.hpp"
#include "trialbox/jsonlite.hpp"
#include "trialbox/observability.hpp"
#include "trialbox/suite.hpp"
#include "trialbox/taxonomy.hpp"
#include "trialbox/types.hpp"
#include "trialbox/validator.hpp"
#include "trialbox/version.hpp"

namespace fs = std::filesystem;

namespace {

constexpr int kExitInterrupted = 130;

void usage() {
  std::cerr << "usage: trialbox <command> [options]\n"
               "  health\n"
               "  validate <task.yaml> [--out <dir>]\n"
               "  run-suite <suite> [--tasks-root <dir>] [--out <dir>]\n"
               "  run-agent --task <task.yaml> [--variant scripted] [--out <dir>]\n"
               "  attempts <attempts.jsonl>\n"
               "  classify --stage <stage> --exit-code <n>\n"
               "global: --verbose\n";
}

bool parse_int(const std::string& s, int* out) {
  try {
    size_t pos = 0;
    const int v = std::stoi(s, &pos);
    if (pos != s.size())
      return false;
    *out = v;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

int cmd_attempts(const fs::path& path) {
  if (!fs::exists(path)) {
    std::cerr << "[trialbox] error: attempts log not found: " << path.string()
              << "\n";
    return 2;
  }
  size_t total = 0, passed = 0, skipped = 0;
  std::map<std::string, size_t> by_reason;
  std::vector<trialbox::FailureReason> reasons;
  for (const auto& obj : trialbox::JsonlReader(path)) {
    trialbox::AttemptRecord rec;
    try {
      rec = trialbox::AttemptRecord::from_json(obj);
    } catch (const trialbox::Error& e) {
      trialbox::log_warn("cli", std::string("skipping record: ") + e.what());
      ++skipped;
      continue;
    }
    ++total;
    if (rec.result.passed)
      ++passed;
    if (rec.result.failure_reason) {
      ++by_reason[trialbox::to_string(*rec.result.failure_reason)];
      reasons.push_back(*rec.result.failure_reason);
    }
  }
  trialbox::jsonlite::Object counts;
  for (const auto& [name, n] : by_reason)
    counts[name] = static_cast<std::uint64_t>(n);
  const auto dom = trialbox::dominant(reasons);
  const trialbox::jsonlite::Object out{
      {"attempts", static_cast<std::uint64_t>(total)},
      {"passed", static_cast<std::uint64_t>(passed)},
      {"skipped_records", static_cast<std::uint64_t>(skipped)},
      {"failure_counts", std::move(counts)},
      {"dominant_failure_reason",
       dom ? trialbox::jsonlite::Value(trialbox::to_string(*dom))
           : trialbox::jsonlite::Value(nullptr)},
  };
  std::cout << trialbox::jsonlite::to_json(out) << "\n";
  return 0;
}

int dispatch(const trialbox::CommandLine& cl) {
  const std::string& cmd = cl.command;
  if (cmd == "health") {
    const auto h = trialbox::hash_runtime_info();
    std::cout << "{\"hash_primitive\":\"" << h.primitive
              << "\",\"hash_version\":\"" << h.version << "\""
              << ",\"version\":"
              << trialbox::version::manifest_to_json(
                     trialbox::version::current_manifest())
              << ",\"container_runtime\":\""
              << trialbox::jsonlite::escape(
                     trialbox::SandboxConfig::from_env().runtime)
              << "\",\"stats\":" << trialbox::global_harness_stats().to_json()
              << "}\n";
    return 0;
  }

  if (cmd == "validate") {
    const std::string task_yaml = cl.positional(0);
    const std::string out = cl.option("--out", "out");
    if (task_yaml.empty()) {
      usage();
      return 2;
    }
    trialbox::LocalStageExecutor executor;
    const fs::path run_dir = trialbox::run_task(task_yaml, out, executor);
    std::cout << "{\"run_dir\":\"" << trialbox::jsonlite::escape(run_dir.string())
              << "\"}\n";
    return 0;
  }

  if (cmd == "run-suite") {
    const std::string suite = cl.positional(0);
    const std::string tasks_root = cl.option("--tasks-root", "tasks");
    const std::string out = cl.option("--out", "out");
    if (suite.empty()) {
      usage();
      return 2;
    }
    trialbox::LocalStageExecutor executor;
    const auto summary = trialbox::run_suite(suite, tasks_root, out, executor);
    if (!summary) {
      std::cerr << "[trialbox] no valid tasks in suite " << suite << "\n";
      return 1;
    }
    std::cout << trialbox::jsonlite::to_json(summary->to_json()) << "\n";
    return summary->interrupted ? kExitInterrupted : 0;
  }

  if (cmd == "run-agent") {
    const std::string task_yaml = cl.option("--task", cl.positional(0));
    const std::string variant = cl.option("--variant", "scripted");
    const std::string out = cl.option("--out", "artifacts");
    if (task_yaml.empty()) {
      usage();
      return 2;
    }
    trialbox::LocalStageExecutor executor;
    const auto attempt =
        trialbox::run_agent_task(task_yaml, out, executor, variant);
    std::cout << trialbox::jsonlite::to_json(attempt.to_json()) << "\n";
    return attempt.passed() ? 0 : 1;
  }

  if (cmd == "attempts") {
    const std::string path = cl.positional(0);
    if (path.empty()) {
      usage();
      return 2;
    }
    return cmd_attempts(path);
  }

  if (cmd == "classify") {
    const std::string stage_name = cl.option("--stage", "");
    const std::string exit_str = cl.option("--exit-code", "");
    const std::string fault_name = cl.option("--fault", "none");
    int exit_code = 0;
    if (stage_name.empty() || !parse_int(exit_str, &exit_code)) {
      usage();
      return 2;
    }
    trialbox::Fault fault = trialbox::Fault::none;
    if (fault_name == "interrupt")
      fault = trialbox::Fault::interrupt;
    else if (fault_name == "other")
      fault = trialbox::Fault::other;
    else if (fault_name != "none")
      throw trialbox::Error(trialbox::ErrorCode::config_error,
                            "unknown fault: " + fault_name);
    const auto stage = trialbox::stage_from_string(stage_name);
    const auto reason = trialbox::classify(stage, exit_code, fault);
    std::cout << "{\"stage\":\"" << trialbox::to_string(stage)
              << "\",\"exit_code\":" << exit_code << ",\"failure_reason\":";
    if (reason)
      std::cout << "\"" << trialbox::to_string(*reason)
                << "\",\"precedence\":" << trialbox::precedence(*reason);
    else
      std::cout << "null";
    std::cout << "}\n";
    return 0;
  }

  usage();
  return 1;
}

} // namespace

int main(int argc, char** argv) {
  const trialbox::CommandLine cl = trialbox::parse_command_line(argc, argv);
  if (cl.verbose)
    trialbox::set_min_log_level(trialbox::LogLevel::debug);
  if (cl.command.empty()) {
    usage();
    return 1;
  }

  trialbox::install_interrupt_handler();
  try {
    return dispatch(cl);
  } catch (const trialbox::InterruptedError& e) {
    std::cerr << "[trialbox] interrupted: " << e.what() << "\n";
    return kExitInterrupted;
  } catch (const trialbox::Error& e) {
    std::cerr << "[trialbox] error: " << trialbox::to_string(e.code()) << ": "
              << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[trialbox] error: " << e.what() << "\n";
    return 1;
  }
}
