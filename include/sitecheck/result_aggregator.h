#pragma once

#include <sitecheck/models.h>

#include <vector>

namespace sitecheck {

inline constexpr double kMediumRiskThreshold = 3.0;
inline constexpr double kHighRiskThreshold = 6.0;

// Rounds half away from zero to `decimals` places.
double RoundHalfAwayFromZero(double value, int decimals);

Recommendation RecommendationForScore(double risk_score);

struct AggregationResult {
  FusedResult fused;
  // False when no analyzer produced a usable outcome (or the usable ones
  // carry zero weight); `fused` is then the UNKNOWN result.
  bool has_signal = false;
};

// Weighted fusion of analyzer outcomes. Outcomes are keyed by source, so the
// order in which they are passed does not matter.
class ResultAggregator {
public:
  explicit ResultAggregator(WeightTable weights);

  AggregationResult Aggregate(const std::vector<AnalyzerOutcome> &outcomes) const;

  const WeightTable &weights() const { return weights_; }

private:
  WeightTable weights_;
};

} // namespace sitecheck
