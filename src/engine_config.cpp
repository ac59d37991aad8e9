#include <sitecheck/engine_config.h>

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace sitecheck {
namespace {

void RequirePositive(std::chrono::milliseconds value, const char *name) {
  if (value.count() <= 0) {
    throw std::invalid_argument(std::string(name) + " must be positive");
  }
}

} // namespace

void ValidateWeights(const WeightTable &weights) {
  double sum = 0.0;
  for (const auto source : kAllSources) {
    const auto weight = weights.For(source);
    if (!std::isfinite(weight) || weight < 0.0) {
      throw std::invalid_argument("Weight for " + SourceName(source) +
                                  " must be a non-negative number");
    }
    sum += weight;
  }
  if (std::fabs(sum - 1.0) > kWeightSumTolerance) {
    std::ostringstream message;
    message << "Analyzer weights must sum to 1.0 (got " << sum << ")";
    throw std::invalid_argument(message.str());
  }
}

void ValidateRetryPolicy(const RetryPolicy &retry) {
  if (retry.max_attempts < 1) {
    throw std::invalid_argument("retry.max_attempts must be at least 1");
  }
  if (retry.initial_backoff.count() < 0 || retry.max_backoff.count() < 0) {
    throw std::invalid_argument("retry backoff must not be negative");
  }
  if (!std::isfinite(retry.backoff_multiplier) ||
      retry.backoff_multiplier < 1.0) {
    throw std::invalid_argument("retry.backoff_multiplier must be >= 1.0");
  }
}

void ValidateEngineConfig(const EngineConfig &config) {
  ValidateWeights(config.weights);
  ValidateRetryPolicy(config.retry);
  RequirePositive(config.analyzer_timeout, "analyzer timeout");
  RequirePositive(config.pipeline_deadline, "pipeline deadline");
}

RunSettings ResolveRunSettings(const EngineConfig &config,
                               const AnalysisOptions &options) {
  RunSettings settings;
  settings.weights = options.weights.value_or(config.weights);
  settings.analyzer_timeout =
      options.analyzer_timeout.value_or(config.analyzer_timeout);
  settings.pipeline_deadline =
      options.pipeline_deadline.value_or(config.pipeline_deadline);
  settings.retry = options.retry.value_or(config.retry);

  ValidateWeights(settings.weights);
  ValidateRetryPolicy(settings.retry);
  RequirePositive(settings.analyzer_timeout, "analyzer timeout");
  RequirePositive(settings.pipeline_deadline, "pipeline deadline");
  return settings;
}

} // namespace sitecheck
