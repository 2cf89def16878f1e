#include "trialbox/cli_args.hpp"

#include <algorithm>
#include <iterator>

namespace trialbox {

namespace {

bool is_switch(const std::string& a) {
  return std::find(std::begin(kCliSwitches), std::end(kCliSwitches), a) != std::end(kCliSwitches);
}

}  // namespace

std::string CommandLine::option(const std::string& name, const std::string& def) const {
  return option(name).value_or(def);
}

std::optional<std::string> CommandLine::option(const std::string& name) const {
  const auto it = options.find(name);
  if (it == options.end()) return std::nullopt;
  return it->second;
}

std::string CommandLine::positional(size_t index) const {
  return index < positionals.size() ? positionals[index] : std::string();
}

CommandLine parse_command_line(int argc, const char* const* argv) {
  CommandLine cl;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a.rfind("--", 0) == 0) {
      if (is_switch(a)) {
        if (a == "--verbose") cl.verbose = true;
        continue;
      }
      cl.options[a] = i + 1 < argc ? argv[++i] : "";
      continue;
    }
    if (cl.command.empty()) {
      cl.command = a;
    } else {
      cl.positionals.push_back(a);
    }
  }
  return cl;
}

}  // namespace trialbox
