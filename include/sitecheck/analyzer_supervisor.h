#pragma once

#include <sitecheck/cancellation.h>
#include <sitecheck/interfaces.h>
#include <sitecheck/logging.h>
#include <sitecheck/models.h>

#include <chrono>
#include <memory>
#include <string>

namespace sitecheck {

// Delay before retry number `attempt` (1-based: the delay after the first
// failed attempt is BackoffDelay(policy, 1)).
std::chrono::milliseconds BackoffDelay(const RetryPolicy &policy, int attempt);

// Runs one adapter under a deadline and a retry budget. Run() never throws:
// every failure mode becomes an outcome with status timeout, error or
// skipped and error_detail set.
class AnalyzerSupervisor {
public:
  explicit AnalyzerSupervisor(std::shared_ptr<Logger> logger = nullptr);

  AnalyzerOutcome Run(AnalyzerSource source,
                      std::shared_ptr<AnalyzerAdapter> adapter,
                      std::shared_ptr<const FetchedContent> content,
                      std::chrono::milliseconds timeout,
                      const RetryPolicy &retry,
                      const CancellationToken &run_cancellation =
                          CancellationToken()) const;

private:
  std::shared_ptr<Logger> logger_;
};

AnalyzerOutcome MakeFailedOutcome(AnalyzerSource source, OutcomeStatus status,
                                  std::string detail);

} // namespace sitecheck
