#pragma once

#include <sitecheck/interfaces.h>

#include <string>

namespace sitecheck {

// Renders the published JSON schema and a Markdown summary.
class StandardReporter : public Reporter {
public:
  Report Render(const PipelineResult &result,
                const std::vector<std::string> &formats) override;
};

std::string RenderReportJson(const RiskReport &report);
std::string RenderReportMarkdown(const PipelineResult &result);
std::string FindingValueToJson(const FindingValue &value);

} // namespace sitecheck
