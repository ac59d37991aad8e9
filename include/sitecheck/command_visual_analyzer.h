#pragma once

#include <sitecheck/interfaces.h>

#include <string>

namespace sitecheck {

// Exit status a classifier uses to report a temporary failure (sysexits
// EX_TEMPFAIL).
inline constexpr int kTransientExitCode = 75;

// Delegates screenshot classification to an external command. The command
// receives the screenshot path through the `{image}` placeholder (appended
// when absent) and prints a YAML mapping with `score`, `confidence` and an
// optional `findings` mapping.
class CommandVisualAnalyzer : public AnalyzerAdapter {
public:
  explicit CommandVisualAnalyzer(std::string classifier_command);

  AnalyzerOutcome Evaluate(const FetchedContent &content,
                           const CancellationToken &cancellation) override;
  std::string Name() const override { return "command-visual"; }

private:
  std::string classifier_command_;
};

// Parses classifier output into an ok outcome for the visual source.
// Throws PermanentAnalyzerError when the output is not a valid verdict.
AnalyzerOutcome ParseClassifierVerdict(const std::string &output);

} // namespace sitecheck
