#pragma once

#include <chrono>
#include <map>
#include <string>

namespace sitecheck {

struct CommandResult {
  int exit_code = -1;
  std::string output;
};

// Runs `command` through the shell and captures its standard output.
// Throws std::runtime_error when the process cannot be started.
CommandResult RunCommand(const std::string &command);

// Wraps `command` in timeout(1) so it and its children are killed after
// `limit` (exit status 124). A non-positive limit leaves `command` unchanged.
std::string WithTimeLimit(const std::string &command,
                          std::chrono::milliseconds limit);

// Single-quotes `value` for a POSIX shell.
std::string ShellQuote(const std::string &value);

// Replaces each `{name}` in `command_template` with the shell-quoted value.
// Returns true when at least one placeholder was substituted.
bool ExpandPlaceholders(std::string &command_template,
                        const std::map<std::string, std::string> &values);

} // namespace sitecheck
