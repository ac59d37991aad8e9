#pragma once

#include <sitecheck/models.h>

#include <chrono>
#include <set>

namespace sitecheck {

inline constexpr double kWeightSumTolerance = 1e-6;

// Immutable engine settings threaded into the orchestrator at construction.
struct EngineConfig {
  WeightTable weights;
  std::chrono::milliseconds analyzer_timeout{20000};
  std::chrono::milliseconds pipeline_deadline{45000};
  RetryPolicy retry;
  std::set<AnalyzerSource> disabled_sources;
};

// Settings for one run: the engine config with the request's overrides
// applied.
struct RunSettings {
  WeightTable weights;
  std::chrono::milliseconds analyzer_timeout{0};
  std::chrono::milliseconds pipeline_deadline{0};
  RetryPolicy retry;
};

// Throws std::invalid_argument unless every weight is finite and
// non-negative and the weights sum to 1.0.
void ValidateWeights(const WeightTable &weights);
void ValidateRetryPolicy(const RetryPolicy &retry);
void ValidateEngineConfig(const EngineConfig &config);

RunSettings ResolveRunSettings(const EngineConfig &config,
                               const AnalysisOptions &options);

} // namespace sitecheck
