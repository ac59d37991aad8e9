#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sitecheck {

enum class AnalyzerSource { kContent = 0, kVisual = 1, kReputation = 2 };

inline constexpr std::array<AnalyzerSource, 3> kAllSources = {
    AnalyzerSource::kContent, AnalyzerSource::kVisual,
    AnalyzerSource::kReputation};

enum class OutcomeStatus { kOk, kTimeout, kError, kSkipped };

enum class Recommendation { kLow, kMedium, kHigh, kUnknown };

enum class PipelineState {
  kPending,
  kFetching,
  kAnalyzing,
  kAggregating,
  kDone,
  kFailed
};

// Values an analyzer may place in its findings. The engine never interprets
// them; reporters only serialize them.
using FindingValue = std::variant<bool, std::int64_t, double, std::string,
                                  std::vector<std::string>>;
using Findings = std::map<std::string, FindingValue>;

// Per-source table of weights; indexed by AnalyzerSource.
struct WeightTable {
  double content = 0.4;
  double visual = 0.3;
  double reputation = 0.3;

  double For(AnalyzerSource source) const;
  double &For(AnalyzerSource source);
};

struct RetryPolicy {
  int max_attempts = 3;
  std::chrono::milliseconds initial_backoff{200};
  double backoff_multiplier = 2.0;
  std::chrono::milliseconds max_backoff{2000};
};

// Per-run overrides carried by an AnalysisRequest.
struct AnalysisOptions {
  std::optional<WeightTable> weights;
  std::optional<std::chrono::milliseconds> analyzer_timeout;
  std::optional<std::chrono::milliseconds> pipeline_deadline;
  std::optional<RetryPolicy> retry;
};

struct AnalysisRequest {
  std::string url;
  std::chrono::system_clock::time_point requested_at;
  AnalysisOptions options;
};

struct DomainMetadata {
  std::string scheme;
  std::string host;
  int port = 0;
  std::string tld;
  std::string registrable_domain;
  std::string final_url;
  long status_code = 0;
  std::int64_t response_time_ms = 0;
  std::string content_type;
  bool is_ip_literal = false;
  bool uses_https = false;
};

struct FetchedContent {
  std::string url;
  std::string html;
  std::optional<std::string> screenshot_ref;
  DomainMetadata domain_metadata;
  std::chrono::system_clock::time_point fetched_at;
};

struct AnalyzerOutcome {
  AnalyzerSource source = AnalyzerSource::kContent;
  OutcomeStatus status = OutcomeStatus::kSkipped;
  std::optional<double> sub_score;
  std::optional<double> confidence;
  Findings findings;
  std::optional<std::string> error_detail;
  int attempts = 0;
  std::chrono::milliseconds elapsed{0};

  bool IsUsable() const {
    return status == OutcomeStatus::kOk && sub_score && confidence;
  }
};

struct FusedResult {
  double risk_score = 0.0;
  double confidence = 0.0;
  Recommendation recommendation = Recommendation::kUnknown;
  std::map<AnalyzerSource, double> contributing_weights;
};

struct RiskReport {
  std::string url;
  double risk_score = 0.0;
  std::chrono::system_clock::time_point analysis_timestamp;
  std::map<AnalyzerSource, std::optional<Findings>> findings;
  Recommendation recommendation = Recommendation::kUnknown;
  double confidence = 0.0;
};

struct Report {
  std::string markdown;
  std::string json;
};

struct PipelineResult {
  RiskReport report;
  Report rendered;
  PipelineState state = PipelineState::kPending;
  std::vector<PipelineState> state_history;
  std::vector<AnalyzerOutcome> outcomes;
  std::optional<FusedResult> fused;
  std::vector<std::string> errors;
  std::chrono::milliseconds processing_time{0};
};

std::string SourceName(AnalyzerSource source);
std::string FindingsCategory(AnalyzerSource source);
std::string StatusName(OutcomeStatus status);
std::string RecommendationLabel(Recommendation recommendation);
std::string StateName(PipelineState state);
AnalyzerSource ParseSource(const std::string &name);

} // namespace sitecheck
