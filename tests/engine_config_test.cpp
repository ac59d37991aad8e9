#include <sitecheck/engine_config.h>

#include <chrono>
#include <limits>
#include <stdexcept>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace sitecheck {
namespace {

using ::testing::HasSubstr;
using namespace std::chrono_literals;

TEST(EngineConfigTest, DefaultsAreValid) {
  const EngineConfig config;

  EXPECT_NO_THROW(ValidateEngineConfig(config));
  EXPECT_DOUBLE_EQ(config.weights.content, 0.4);
  EXPECT_DOUBLE_EQ(config.weights.visual, 0.3);
  EXPECT_DOUBLE_EQ(config.weights.reputation, 0.3);
  EXPECT_EQ(config.analyzer_timeout, 20000ms);
  EXPECT_EQ(config.pipeline_deadline, 45000ms);
  EXPECT_EQ(config.retry.max_attempts, 3);
}

TEST(EngineConfigTest, WeightsMustSumToOne) {
  try {
    ValidateWeights(WeightTable{.content = 0.5, .visual = 0.3,
                                .reputation = 0.3});
    FAIL() << "expected std::invalid_argument";
  } catch (const std::invalid_argument &error) {
    EXPECT_THAT(error.what(), HasSubstr("sum to 1.0"));
  }
  EXPECT_NO_THROW(ValidateWeights(
      WeightTable{.content = 1.0, .visual = 0.0, .reputation = 0.0}));
}

TEST(EngineConfigTest, WeightsMustBeFiniteAndNonNegative) {
  EXPECT_THROW(ValidateWeights(WeightTable{.content = 1.2, .visual = -0.2,
                                           .reputation = 0.0}),
               std::invalid_argument);
  EXPECT_THROW(
      ValidateWeights(WeightTable{
          .content = std::numeric_limits<double>::quiet_NaN(),
          .visual = 0.5,
          .reputation = 0.5}),
      std::invalid_argument);
}

TEST(EngineConfigTest, RejectsUnusableRetryPolicies) {
  RetryPolicy retry;
  retry.max_attempts = 0;
  EXPECT_THROW(ValidateRetryPolicy(retry), std::invalid_argument);

  retry = RetryPolicy{};
  retry.backoff_multiplier = 0.5;
  EXPECT_THROW(ValidateRetryPolicy(retry), std::invalid_argument);

  retry = RetryPolicy{};
  retry.initial_backoff = -1ms;
  EXPECT_THROW(ValidateRetryPolicy(retry), std::invalid_argument);
}

TEST(EngineConfigTest, RejectsNonPositiveTimeouts) {
  EngineConfig config;
  config.analyzer_timeout = 0ms;
  EXPECT_THROW(ValidateEngineConfig(config), std::invalid_argument);

  config = EngineConfig{};
  config.pipeline_deadline = -5ms;
  EXPECT_THROW(ValidateEngineConfig(config), std::invalid_argument);
}

TEST(EngineConfigTest, RequestOverridesReplaceConfiguredValues) {
  EngineConfig config;
  AnalysisOptions options;
  options.weights = WeightTable{.content = 0.2, .visual = 0.2,
                                .reputation = 0.6};
  options.analyzer_timeout = 500ms;

  const auto settings = ResolveRunSettings(config, options);

  EXPECT_DOUBLE_EQ(settings.weights.reputation, 0.6);
  EXPECT_EQ(settings.analyzer_timeout, 500ms);
  EXPECT_EQ(settings.pipeline_deadline, config.pipeline_deadline);
  EXPECT_EQ(settings.retry.max_attempts, config.retry.max_attempts);
}

TEST(EngineConfigTest, InvalidOverridesAreRejected) {
  AnalysisOptions options;
  options.pipeline_deadline = 0ms;

  EXPECT_THROW(ResolveRunSettings(EngineConfig{}, options),
               std::invalid_argument);
}

} // namespace
} // namespace sitecheck
