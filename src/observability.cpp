#include "trialbox/observability.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <mutex>

#include "trialbox/jsonlite.hpp"
#include "trialbox/types.hpp"

namespace trialbox {

namespace {

struct LogConfig {
  std::atomic<int> min_level{static_cast<int>(LogLevel::info)};
  std::string event_log_path;
};

LogConfig& log_config() {
  static LogConfig* cfg = [] {
    auto* c = new LogConfig;
    if (const char* lvl = std::getenv("TRIALBOX_LOG_LEVEL"); lvl && lvl[0]) {
      c->min_level.store(static_cast<int>(parse_log_level(lvl)));
    }
    if (const char* path = std::getenv("TRIALBOX_EVENT_LOG"); path && path[0]) {
      c->event_log_path = path;
    }
    return c;
  }();
  return *cfg;
}

std::mutex& stderr_mutex() {
  static std::mutex mu;
  return mu;
}

std::string upper(const std::string& s) {
  std::string out = s;
  for (auto& c : out) {
    if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
  }
  return out;
}

}  // namespace

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info: return "info";
    case LogLevel::warn: return "warn";
    case LogLevel::error: return "error";
    case LogLevel::critical: return "critical";
  }
  return "info";
}

LogLevel parse_log_level(const std::string& name) {
  if (name == "debug") return LogLevel::debug;
  if (name == "warn" || name == "warning") return LogLevel::warn;
  if (name == "error") return LogLevel::error;
  if (name == "critical") return LogLevel::critical;
  return LogLevel::info;
}

void set_min_log_level(LogLevel level) {
  log_config().min_level.store(static_cast<int>(level));
}

void log_message(LogLevel level, const std::string& component, const std::string& message) {
  auto& cfg = log_config();
  if (static_cast<int>(level) < cfg.min_level.load(std::memory_order_relaxed)) return;

  {
    std::lock_guard<std::mutex> lk(stderr_mutex());
    std::cerr << "[" << component << "] " << upper(to_string(level)) << ": " << message << "\n";
  }

  if (cfg.event_log_path.empty()) return;

  jsonlite::Object entry;
  entry["ts"] = format_utc(WallClock::now());
  entry["level"] = to_string(level);
  entry["component"] = component;
  entry["message"] = message;
  const std::string line = jsonlite::to_json(entry) + "\n";

  if (FILE* f = std::fopen(cfg.event_log_path.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

std::string HarnessStats::to_json() const {
  jsonlite::Object o;
  o["attempts_recorded"] = static_cast<std::uint64_t>(attempts_recorded.load(std::memory_order_relaxed));
  o["append_failures"] = static_cast<std::uint64_t>(append_failures.load(std::memory_order_relaxed));
  o["tool_calls"] = static_cast<std::uint64_t>(tool_calls.load(std::memory_order_relaxed));
  o["tool_errors"] = static_cast<std::uint64_t>(tool_errors.load(std::memory_order_relaxed));
  o["sandbox_runs"] = static_cast<std::uint64_t>(sandbox_runs.load(std::memory_order_relaxed));
  o["sandbox_timeouts"] = static_cast<std::uint64_t>(sandbox_timeouts.load(std::memory_order_relaxed));
  return jsonlite::to_json(o);
}

HarnessStats& global_harness_stats() {
  static HarnessStats inst;
  return inst;
}

}  // namespace trialbox
