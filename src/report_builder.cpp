#include <sitecheck/report_builder.h>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace sitecheck {
namespace {

std::map<AnalyzerSource, std::optional<Findings>> EmptyFindings() {
  std::map<AnalyzerSource, std::optional<Findings>> findings;
  for (const auto source : kAllSources) {
    findings[source] = std::nullopt;
  }
  return findings;
}

} // namespace

RiskReport BuildRiskReport(const std::string &url,
                           std::chrono::system_clock::time_point timestamp,
                           const FusedResult &fused,
                           const std::vector<AnalyzerOutcome> &outcomes) {
  RiskReport report;
  report.url = url;
  report.analysis_timestamp = timestamp;
  report.risk_score = fused.risk_score;
  report.confidence = fused.confidence;
  report.recommendation = fused.recommendation;
  report.findings = EmptyFindings();
  for (const auto &outcome : outcomes) {
    if (outcome.status == OutcomeStatus::kOk) {
      report.findings[outcome.source] = outcome.findings;
    }
  }
  return report;
}

RiskReport BuildUnknownReport(const std::string &url,
                              std::chrono::system_clock::time_point timestamp) {
  RiskReport report;
  report.url = url;
  report.analysis_timestamp = timestamp;
  report.risk_score = 0.0;
  report.confidence = 0.0;
  report.recommendation = Recommendation::kUnknown;
  report.findings = EmptyFindings();
  return report;
}

std::string FormatIsoTimestamp(std::chrono::system_clock::time_point time) {
  const auto seconds = std::chrono::system_clock::to_time_t(time);
  std::tm tm;
#ifdef _WIN32
  gmtime_s(&tm, &seconds);
#else
  gmtime_r(&seconds, &tm);
#endif
  std::ostringstream stream;
  stream << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return stream.str();
}

} // namespace sitecheck
