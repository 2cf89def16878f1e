#pragma once

// trialbox/cli_args.hpp - Command-line scan shared by every subcommand.
//
// Every "--name" takes the next token as its value, except the switches in
// kCliSwitches. Flags may appear before or after the command word; the first
// bare token is the command, the rest are positionals. A trailing flag with
// no value is recorded with an empty value.

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace trialbox {

inline constexpr const char* kCliSwitches[] = {"--verbose"};

struct CommandLine {
  std::string command;
  std::vector<std::string> positionals;
  std::map<std::string, std::string> options;  // "--out" -> "dir"; last one wins
  bool verbose{false};

  std::string option(const std::string& name, const std::string& def) const;
  std::optional<std::string> option(const std::string& name) const;
  std::string positional(size_t index) const;
};

CommandLine parse_command_line(int argc, const char* const* argv);

}  // namespace trialbox
