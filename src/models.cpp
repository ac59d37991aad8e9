#include <sitecheck/models.h>

#include <stdexcept>

namespace sitecheck {

double WeightTable::For(AnalyzerSource source) const {
  switch (source) {
  case AnalyzerSource::kContent:
    return content;
  case AnalyzerSource::kVisual:
    return visual;
  case AnalyzerSource::kReputation:
    return reputation;
  }
  throw std::invalid_argument("Unknown analyzer source");
}

double &WeightTable::For(AnalyzerSource source) {
  switch (source) {
  case AnalyzerSource::kContent:
    return content;
  case AnalyzerSource::kVisual:
    return visual;
  case AnalyzerSource::kReputation:
    return reputation;
  }
  throw std::invalid_argument("Unknown analyzer source");
}

std::string SourceName(AnalyzerSource source) {
  switch (source) {
  case AnalyzerSource::kContent:
    return "content";
  case AnalyzerSource::kVisual:
    return "visual";
  case AnalyzerSource::kReputation:
    return "reputation";
  }
  return "unknown";
}

std::string FindingsCategory(AnalyzerSource source) {
  switch (source) {
  case AnalyzerSource::kContent:
    return "content_analysis";
  case AnalyzerSource::kVisual:
    return "visual_analysis";
  case AnalyzerSource::kReputation:
    return "reputation_check";
  }
  return "unknown";
}

std::string StatusName(OutcomeStatus status) {
  switch (status) {
  case OutcomeStatus::kOk:
    return "ok";
  case OutcomeStatus::kTimeout:
    return "timeout";
  case OutcomeStatus::kError:
    return "error";
  case OutcomeStatus::kSkipped:
    return "skipped";
  }
  return "unknown";
}

std::string RecommendationLabel(Recommendation recommendation) {
  switch (recommendation) {
  case Recommendation::kLow:
    return "LOW RISK";
  case Recommendation::kMedium:
    return "MEDIUM RISK";
  case Recommendation::kHigh:
    return "HIGH RISK";
  case Recommendation::kUnknown:
    return "UNKNOWN";
  }
  return "UNKNOWN";
}

std::string StateName(PipelineState state) {
  switch (state) {
  case PipelineState::kPending:
    return "PENDING";
  case PipelineState::kFetching:
    return "FETCHING";
  case PipelineState::kAnalyzing:
    return "ANALYZING";
  case PipelineState::kAggregating:
    return "AGGREGATING";
  case PipelineState::kDone:
    return "DONE";
  case PipelineState::kFailed:
    return "FAILED";
  }
  return "UNKNOWN";
}

AnalyzerSource ParseSource(const std::string &name) {
  if (name == "content") {
    return AnalyzerSource::kContent;
  }
  if (name == "visual") {
    return AnalyzerSource::kVisual;
  }
  if (name == "reputation") {
    return AnalyzerSource::kReputation;
  }
  throw std::invalid_argument("Unknown analyzer source: " + name +
                              ". Expected content, visual or reputation");
}

} // namespace sitecheck
