#include <sitecheck/report_builder.h>

#include <chrono>

#include <gtest/gtest.h>

#include "test_support/stub_components.h"

namespace sitecheck {
namespace {

using test::MissingOutcome;
using test::OkOutcome;

const auto kTimestamp =
    std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));

TEST(ReportBuilderTest, CopiesFusedValuesAndFindingsOfUsableAnalyzers) {
  FusedResult fused;
  fused.risk_score = 1.6;
  fused.confidence = 0.46;
  fused.recommendation = Recommendation::kLow;

  const auto report = BuildRiskReport(
      "https://example.com", kTimestamp, fused,
      {OkOutcome(AnalyzerSource::kContent, 2.0, 0.7,
                 Findings{{"has_https", true}}),
       MissingOutcome(AnalyzerSource::kVisual, OutcomeStatus::kTimeout)});

  EXPECT_EQ(report.url, "https://example.com");
  EXPECT_EQ(report.analysis_timestamp, kTimestamp);
  EXPECT_DOUBLE_EQ(report.risk_score, 1.6);
  EXPECT_DOUBLE_EQ(report.confidence, 0.46);
  EXPECT_EQ(report.recommendation, Recommendation::kLow);
  ASSERT_EQ(report.findings.size(), 3u);
  ASSERT_TRUE(report.findings.at(AnalyzerSource::kContent));
  EXPECT_EQ(report.findings.at(AnalyzerSource::kContent)->size(), 1u);
  EXPECT_FALSE(report.findings.at(AnalyzerSource::kVisual));
  EXPECT_FALSE(report.findings.at(AnalyzerSource::kReputation));
}

TEST(ReportBuilderTest, UsableAnalyzerWithNoFindingsGetsAnEmptyMap) {
  const auto report =
      BuildRiskReport("https://example.com", kTimestamp, FusedResult{},
                      {OkOutcome(AnalyzerSource::kReputation, 0.0, 0.6)});

  ASSERT_TRUE(report.findings.at(AnalyzerSource::kReputation));
  EXPECT_TRUE(report.findings.at(AnalyzerSource::kReputation)->empty());
}

TEST(ReportBuilderTest, UnknownReportHasNoVerdictAndNoFindings) {
  const auto report = BuildUnknownReport("https://down.example", kTimestamp);

  EXPECT_EQ(report.recommendation, Recommendation::kUnknown);
  EXPECT_DOUBLE_EQ(report.confidence, 0.0);
  EXPECT_DOUBLE_EQ(report.risk_score, 0.0);
  ASSERT_EQ(report.findings.size(), 3u);
  for (const auto &[source, findings] : report.findings) {
    EXPECT_FALSE(findings) << SourceName(source);
  }
}

TEST(ReportBuilderTest, FormatsTimestampsAsUtcIso8601) {
  EXPECT_EQ(FormatIsoTimestamp(kTimestamp), "2023-11-14T22:13:20Z");
  EXPECT_EQ(FormatIsoTimestamp(std::chrono::system_clock::time_point{}),
            "1970-01-01T00:00:00Z");
}

} // namespace
} // namespace sitecheck
