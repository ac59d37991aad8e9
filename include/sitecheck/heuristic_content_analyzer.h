#pragma once

#include <sitecheck/interfaces.h>

#include <string>
#include <vector>

namespace sitecheck {

// Rule-based page analysis: transport security, pressure wording, credential
// and payment forms, brand impersonation in the page title.
class HeuristicContentAnalyzer : public AnalyzerAdapter {
public:
  HeuristicContentAnalyzer();
  explicit HeuristicContentAnalyzer(std::vector<std::string> brands);

  AnalyzerOutcome Evaluate(const FetchedContent &content,
                           const CancellationToken &cancellation) override;
  std::string Name() const override { return "heuristic-content"; }

private:
  std::vector<std::string> brands_;
};

const std::vector<std::string> &DefaultBrandNames();
const std::vector<std::string> &SuspiciousKeywords();

} // namespace sitecheck
