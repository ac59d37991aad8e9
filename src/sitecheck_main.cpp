#include <sitecheck/cli_exit_codes.h>
#include <sitecheck/sitecheck_cli.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
void PrintGlobalUsage() {
  std::cout
      << "Usage: sitecheck [analyze] <url> [options]\n\n"
      << "Commands:\n"
      << "  analyze   Score a site for phishing risk (default command).\n\n"
      << "Run 'sitecheck analyze --help' for analysis options.\n";
}
} // namespace

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);

    if (!arguments.empty() &&
        (arguments.front() == "--help" || arguments.front() == "-h")) {
      PrintGlobalUsage();
      return 0;
    }

    std::size_t first_argument_index = 0;
    if (!arguments.empty() && arguments.front() == "analyze") {
      first_argument_index = 1;
    }

    const std::vector<std::string> analyze_arguments(
        arguments.begin() + static_cast<std::ptrdiff_t>(first_argument_index),
        arguments.end());
    return sitecheck::RunAnalyze(analyze_arguments);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    PrintGlobalUsage();
    return sitecheck::kExitUsageError;
  }
}
