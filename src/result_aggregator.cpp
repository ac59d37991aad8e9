#include <sitecheck/result_aggregator.h>

#include <sitecheck/engine_config.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <map>
#include <stdexcept>

namespace sitecheck {
namespace {

FusedResult UnknownResult() {
  FusedResult result;
  result.risk_score = 0.0;
  result.confidence = 0.0;
  result.recommendation = Recommendation::kUnknown;
  return result;
}

// One outcome per source; a duplicate source is a dispatch bug upstream.
std::map<AnalyzerSource, const AnalyzerOutcome *>
IndexBySource(const std::vector<AnalyzerOutcome> &outcomes) {
  std::map<AnalyzerSource, const AnalyzerOutcome *> indexed;
  for (const auto &outcome : outcomes) {
    if (!indexed.emplace(outcome.source, &outcome).second) {
      throw std::invalid_argument("Duplicate outcome for analyzer " +
                                  SourceName(outcome.source));
    }
  }
  return indexed;
}

} // namespace

double RoundHalfAwayFromZero(double value, int decimals) {
  const auto scale = std::pow(10.0, decimals);
  // Re-read the scaled value at 15 significant digits so a decimal half that
  // binary cannot represent (0.285 * 100 == 28.499999999999996) rounds as
  // the decimal it stands for.
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.*g",
                std::numeric_limits<double>::digits10, value * scale);
  return std::round(std::strtod(buffer, nullptr)) / scale;
}

Recommendation RecommendationForScore(double risk_score) {
  if (risk_score < kMediumRiskThreshold) {
    return Recommendation::kLow;
  }
  if (risk_score < kHighRiskThreshold) {
    return Recommendation::kMedium;
  }
  return Recommendation::kHigh;
}

ResultAggregator::ResultAggregator(WeightTable weights)
    : weights_(weights) {
  ValidateWeights(weights_);
}

AggregationResult
ResultAggregator::Aggregate(const std::vector<AnalyzerOutcome> &outcomes) const {
  const auto indexed = IndexBySource(outcomes);

  double usable_weight = 0.0;
  double missing_fraction = 0.0;
  for (const auto source : kAllSources) {
    const auto found = indexed.find(source);
    const bool usable = found != indexed.end() && found->second->IsUsable();
    if (usable) {
      usable_weight += weights_.For(source);
    } else {
      missing_fraction += weights_.For(source);
    }
  }

  if (usable_weight <= 0.0) {
    return AggregationResult{UnknownResult(), false};
  }

  FusedResult fused;
  double weighted_score = 0.0;
  double base_confidence = 0.0;
  for (const auto source : kAllSources) {
    const auto found = indexed.find(source);
    if (found == indexed.end() || !found->second->IsUsable()) {
      fused.contributing_weights[source] = 0.0;
      continue;
    }
    const auto effective = weights_.For(source) / usable_weight;
    fused.contributing_weights[source] = effective;
    weighted_score += effective * *found->second->sub_score;
    base_confidence += effective * *found->second->confidence;
  }

  fused.risk_score =
      std::clamp(RoundHalfAwayFromZero(weighted_score, 1), 0.0, 10.0);
  const auto penalized =
      std::clamp(base_confidence * (1.0 - missing_fraction), 0.0, 1.0);
  fused.confidence = RoundHalfAwayFromZero(penalized, 2);
  fused.recommendation = RecommendationForScore(fused.risk_score);
  return AggregationResult{fused, true};
}

} // namespace sitecheck
