#include <sitecheck/standard_reporter.h>

#include <sitecheck/escaping.h>
#include <sitecheck/report_builder.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace sitecheck {
namespace {

std::string Quote(const std::string &value) {
  return "\"" + EscapeJsonString(value) + "\"";
}

std::string FixedNumber(double value, int decimals) {
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(decimals) << value;
  return stream.str();
}

template <typename Collection, typename Formatter>
std::string Join(const Collection &items, const std::string &delimiter,
                 Formatter formatter) {
  std::ostringstream output;
  bool first = true;
  std::for_each(items.begin(), items.end(), [&](const auto &item) {
    if (!first) {
      output << delimiter;
    }
    output << formatter(item);
    first = false;
  });
  return output.str();
}

bool ShouldRenderFormat(const std::vector<std::string> &formats,
                        const std::string &format) {
  if (formats.empty()) {
    return format == "json";
  }
  return std::find(formats.begin(), formats.end(), format) != formats.end();
}

std::string FindingsJson(const std::optional<Findings> &findings,
                         const std::string &indent) {
  if (!findings) {
    return "null";
  }
  if (findings->empty()) {
    return "{}";
  }
  std::ostringstream json;
  json << "{\n";
  std::size_t index = 0;
  for (const auto &[key, value] : *findings) {
    json << indent << "  " << Quote(key) << ": " << FindingValueToJson(value);
    json << (++index < findings->size() ? ",\n" : "\n");
  }
  json << indent << "}";
  return json.str();
}

const std::vector<std::string> *StringList(const Findings &findings,
                                           const std::string &key) {
  const auto found = findings.find(key);
  if (found == findings.end()) {
    return nullptr;
  }
  return std::get_if<std::vector<std::string>>(&found->second);
}

std::string FindingValueToText(const FindingValue &value) {
  return std::visit(
      [](const auto &item) -> std::string {
        using T = std::decay_t<decltype(item)>;
        if constexpr (std::is_same_v<T, bool>) {
          return item ? "yes" : "no";
        } else if constexpr (std::is_same_v<T, std::string>) {
          return item;
        } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
          return Join(item, "; ", [](const std::string &entry) {
            return entry;
          });
        } else {
          return FindingValueToJson(item);
        }
      },
      value);
}

std::string BuildSummaryMarkdown(const RiskReport &report) {
  std::ostringstream section;
  section << "## Summary\n\n";
  section << "| Field | Value |\n";
  section << "| --- | --- |\n";
  section << "| URL | " << EscapeMarkdownCell(report.url) << " |\n";
  section << "| Risk Score | " << FixedNumber(report.risk_score, 1)
          << "/10 |\n";
  section << "| Confidence | "
          << static_cast<int>(std::lround(report.confidence * 100.0))
          << "% |\n";
  section << "| Recommendation | "
          << RecommendationLabel(report.recommendation) << " |\n";
  section << "| Analyzed At | "
          << FormatIsoTimestamp(report.analysis_timestamp) << " |\n\n";
  return section.str();
}

std::string BuildAnalyzersMarkdown(const PipelineResult &result) {
  std::ostringstream section;
  section << "## Analyzers\n\n";
  section << "| Analyzer | Status | Sub-score | Confidence | Weight | Attempts "
             "| Detail |\n";
  section << "| --- | --- | --- | --- | --- | --- | --- |\n";
  if (result.outcomes.empty()) {
    section << "| None | - | - | - | - | - | - |\n\n";
    return section.str();
  }

  for (const auto &outcome : result.outcomes) {
    std::string weight = "-";
    if (result.fused) {
      const auto found = result.fused->contributing_weights.find(outcome.source);
      if (found != result.fused->contributing_weights.end()) {
        weight = FixedNumber(found->second, 2);
      }
    }
    section << "| " << SourceName(outcome.source) << " | "
            << StatusName(outcome.status) << " | "
            << (outcome.sub_score ? FixedNumber(*outcome.sub_score, 1) : "-")
            << " | "
            << (outcome.confidence ? FixedNumber(*outcome.confidence, 2) : "-")
            << " | " << weight << " | " << outcome.attempts << " | "
            << EscapeMarkdownCell(outcome.error_detail.value_or("-"))
            << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildBulletSection(const std::string &title,
                               const std::vector<std::string> &items) {
  std::ostringstream section;
  section << "## " << title << "\n\n";
  if (items.empty()) {
    section << "- None\n\n";
    return section.str();
  }
  for (const auto &item : items) {
    section << "- " << item << "\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildFindingsMarkdown(const RiskReport &report) {
  std::vector<std::string> suspicious;
  std::vector<std::string> legitimate;
  std::ostringstream details;
  details << "## Findings\n\n";

  for (const auto &[source, findings] : report.findings) {
    details << "### " << FindingsCategory(source) << "\n\n";
    if (!findings) {
      details << "_not available_\n\n";
      continue;
    }
    if (const auto *items = StringList(*findings, "suspicious_elements")) {
      suspicious.insert(suspicious.end(), items->begin(), items->end());
    }
    if (const auto *items = StringList(*findings, "legitimate_indicators")) {
      legitimate.insert(legitimate.end(), items->begin(), items->end());
    }
    details << "| Key | Value |\n";
    details << "| --- | --- |\n";
    for (const auto &[key, value] : *findings) {
      details << "| " << key << " | "
              << EscapeMarkdownCell(FindingValueToText(value)) << " |\n";
    }
    details << "\n";
  }

  return BuildBulletSection("Suspicious Elements", suspicious) +
         BuildBulletSection("Legitimate Indicators", legitimate) +
         details.str();
}

std::string BuildDiagnosticsMarkdown(const PipelineResult &result) {
  std::ostringstream section;
  section << "## Diagnostics\n\n";
  section << "- Final state: " << StateName(result.state) << "\n";
  section << "- Processing time: " << result.processing_time.count()
          << " ms\n";
  if (result.errors.empty()) {
    section << "- Errors: none\n";
    return section.str();
  }
  section << "- Errors:\n";
  for (const auto &error : result.errors) {
    section << "  - " << error << "\n";
  }
  return section.str();
}

} // namespace

std::string FindingValueToJson(const FindingValue &value) {
  return std::visit(
      [](const auto &item) -> std::string {
        using T = std::decay_t<decltype(item)>;
        if constexpr (std::is_same_v<T, bool>) {
          return item ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return std::to_string(item);
        } else if constexpr (std::is_same_v<T, double>) {
          if (!std::isfinite(item)) {
            return "null";
          }
          std::ostringstream stream;
          stream << std::setprecision(10) << item;
          return stream.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
          return Quote(item);
        } else {
          return "[" + Join(item, ", ", Quote) + "]";
        }
      },
      value);
}

std::string RenderReportJson(const RiskReport &report) {
  std::ostringstream json;
  json << "{\n";
  json << "  \"url\": " << Quote(report.url) << ",\n";
  json << "  \"risk_score\": " << FixedNumber(report.risk_score, 1) << ",\n";
  json << "  \"analysis_timestamp\": "
       << Quote(FormatIsoTimestamp(report.analysis_timestamp)) << ",\n";
  json << "  \"findings\": {\n";
  std::size_t index = 0;
  for (const auto source : kAllSources) {
    std::optional<Findings> findings;
    const auto found = report.findings.find(source);
    if (found != report.findings.end()) {
      findings = found->second;
    }
    json << "    " << Quote(FindingsCategory(source)) << ": "
         << FindingsJson(findings, "    ");
    json << (++index < kAllSources.size() ? ",\n" : "\n");
  }
  json << "  },\n";
  json << "  \"recommendation\": "
       << Quote(RecommendationLabel(report.recommendation)) << ",\n";
  json << "  \"confidence\": " << FixedNumber(report.confidence, 2) << "\n";
  json << "}\n";
  return json.str();
}

std::string RenderReportMarkdown(const PipelineResult &result) {
  std::ostringstream output;
  output << "# Site Risk Report\n\n";
  output << BuildSummaryMarkdown(result.report);
  output << BuildAnalyzersMarkdown(result);
  output << BuildFindingsMarkdown(result.report);
  output << BuildDiagnosticsMarkdown(result);
  return output.str();
}

Report StandardReporter::Render(const PipelineResult &result,
                                const std::vector<std::string> &formats) {
  Report report;
  if (ShouldRenderFormat(formats, "json")) {
    report.json = RenderReportJson(result.report);
  }
  if (ShouldRenderFormat(formats, "markdown")) {
    report.markdown = RenderReportMarkdown(result);
  }
  return report;
}

} // namespace sitecheck
