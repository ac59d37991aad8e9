#include <sitecheck/command_visual_analyzer.h>

#include <sitecheck/command_runner.h>
#include <sitecheck/errors.h>
#include <sitecheck/escaping.h>

#include <filesystem>
#include <stdexcept>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace sitecheck {
namespace {

FindingValue ScalarValue(const YAML::Node &node) {
  const auto &text = node.Scalar();
  // Quoted scalars carry the non-specific tag "!" and stay strings.
  if (node.Tag() != "!") {
    std::int64_t integer = 0;
    if (YAML::convert<std::int64_t>::decode(node, integer)) {
      return integer;
    }
    double real = 0.0;
    if (YAML::convert<double>::decode(node, real)) {
      return real;
    }
    bool flag = false;
    if (YAML::convert<bool>::decode(node, flag)) {
      return flag;
    }
  }
  return text;
}

void CollectFindings(const YAML::Node &node, const std::string &prefix,
                     Findings &findings) {
  for (const auto &entry : node) {
    const auto key = prefix + entry.first.as<std::string>();
    const auto &value = entry.second;
    if (value.IsScalar()) {
      findings[key] = ScalarValue(value);
    } else if (value.IsSequence()) {
      std::vector<std::string> items;
      for (const auto &item : value) {
        if (!item.IsScalar()) {
          throw PermanentAnalyzerError("classifier finding '" + key +
                                       "' must be a list of scalars");
        }
        items.push_back(item.Scalar());
      }
      findings[key] = std::move(items);
    } else if (value.IsMap()) {
      CollectFindings(value, key + ".", findings);
    }
  }
}

double RequireNumber(const YAML::Node &verdict, const char *key) {
  const auto node = verdict[key];
  double value = 0.0;
  if (!node || !node.IsScalar() ||
      !YAML::convert<double>::decode(node, value)) {
    throw PermanentAnalyzerError(std::string("classifier output lacks "
                                             "numeric '") +
                                 key + "'");
  }
  return value;
}

} // namespace

CommandVisualAnalyzer::CommandVisualAnalyzer(std::string classifier_command)
    : classifier_command_(std::move(classifier_command)) {}

AnalyzerOutcome ParseClassifierVerdict(const std::string &output) {
  YAML::Node verdict;
  try {
    verdict = YAML::Load(output);
  } catch (const YAML::Exception &error) {
    throw PermanentAnalyzerError(std::string("malformed classifier output: ") +
                                 error.what());
  }
  if (!verdict.IsMap()) {
    throw PermanentAnalyzerError("classifier output must be a YAML mapping");
  }

  AnalyzerOutcome outcome;
  outcome.source = AnalyzerSource::kVisual;
  outcome.status = OutcomeStatus::kOk;
  outcome.sub_score = RequireNumber(verdict, "score");
  outcome.confidence = RequireNumber(verdict, "confidence");
  if (const auto findings = verdict["findings"]) {
    if (!findings.IsMap()) {
      throw PermanentAnalyzerError("classifier 'findings' must be a mapping");
    }
    CollectFindings(findings, "", outcome.findings);
  }
  return outcome;
}

AnalyzerOutcome
CommandVisualAnalyzer::Evaluate(const FetchedContent &content,
                                const CancellationToken &cancellation) {
  if (Trim(classifier_command_).empty()) {
    throw AnalyzerNotApplicable("no image classifier configured");
  }
  if (!content.screenshot_ref || content.screenshot_ref->empty()) {
    throw AnalyzerNotApplicable("no screenshot was rendered for the page");
  }
  if (!std::filesystem::exists(*content.screenshot_ref)) {
    throw AnalyzerNotApplicable("screenshot file is missing: " +
                                *content.screenshot_ref);
  }

  auto command = classifier_command_;
  if (!ExpandPlaceholders(command, {{"image", *content.screenshot_ref}})) {
    command += " " + ShellQuote(*content.screenshot_ref);
  }

  CommandResult result;
  try {
    result = RunCommand(command);
  } catch (const std::runtime_error &error) {
    throw TransientAnalyzerError(error.what());
  }
  if (cancellation.IsCancelled()) {
    throw TransientAnalyzerError("visual analysis cancelled");
  }
  if (result.exit_code == kTransientExitCode) {
    throw TransientAnalyzerError("image classifier reported a temporary "
                                 "failure");
  }
  if (result.exit_code != 0) {
    throw PermanentAnalyzerError("image classifier exited with status " +
                                 std::to_string(result.exit_code));
  }

  auto outcome = ParseClassifierVerdict(result.output);
  outcome.findings["screenshot"] = *content.screenshot_ref;
  return outcome;
}

} // namespace sitecheck
