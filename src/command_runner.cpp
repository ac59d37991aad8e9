#include <sitecheck/command_runner.h>

#include <array>
#include <cstdio>
#include <stdexcept>
#include <sys/wait.h>

namespace sitecheck {

CommandResult RunCommand(const std::string &command) {
  FILE *pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    throw std::runtime_error("Failed to start command: " + command);
  }

  CommandResult result;
  std::array<char, 4096> buffer{};
  std::size_t read = 0;
  while ((read = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
    result.output.append(buffer.data(), read);
  }

  const auto status = pclose(pipe);
  if (status == -1) {
    throw std::runtime_error("Failed to collect exit status of: " + command);
  }
  result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : 128;
  return result;
}

std::string WithTimeLimit(const std::string &command,
                          std::chrono::milliseconds limit) {
  if (limit.count() <= 0) {
    return command;
  }
  const auto millis = std::to_string(limit.count() % 1000);
  const auto seconds = std::to_string(limit.count() / 1000) + "." +
                       std::string(3 - millis.size(), '0') + millis;
  return "timeout -k 2 " + seconds + " sh -c " + ShellQuote(command);
}

std::string ShellQuote(const std::string &value) {
  std::string quoted = "'";
  for (const auto character : value) {
    if (character == '\'') {
      quoted.append("'\\''");
    } else {
      quoted.push_back(character);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

bool ExpandPlaceholders(std::string &command_template,
                        const std::map<std::string, std::string> &values) {
  bool substituted = false;
  for (const auto &[name, value] : values) {
    const auto placeholder = "{" + name + "}";
    const auto quoted = ShellQuote(value);
    std::size_t position = 0;
    while ((position = command_template.find(placeholder, position)) !=
           std::string::npos) {
      command_template.replace(position, placeholder.size(), quoted);
      position += quoted.size();
      substituted = true;
    }
  }
  return substituted;
}

} // namespace sitecheck
