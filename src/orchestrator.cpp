#include <sitecheck/orchestrator.h>

#include <sitecheck/errors.h>
#include <sitecheck/report_builder.h>
#include <sitecheck/result_aggregator.h>

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

namespace sitecheck {
namespace {

using Clock = std::chrono::steady_clock;

// Join barrier for the analyzer tasks of one run. Tasks that report after
// the barrier closed are dropped.
struct OutcomeCollector {
  std::mutex mutex;
  std::condition_variable updated;
  std::map<AnalyzerSource, AnalyzerOutcome> outcomes;
  std::size_t expected = 0;
  bool closed = false;
};

void Publish(OutcomeCollector &collector, AnalyzerOutcome outcome) {
  {
    std::lock_guard<std::mutex> lock(collector.mutex);
    if (collector.closed) {
      return;
    }
    collector.outcomes.emplace(outcome.source, std::move(outcome));
  }
  collector.updated.notify_all();
}

std::chrono::milliseconds RemainingUntil(Clock::time_point deadline) {
  const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - Clock::now());
  return std::max(remaining, std::chrono::milliseconds{0});
}

} // namespace

Orchestrator::Orchestrator(PipelineComponents components)
    : fetcher_(std::move(components.fetcher)),
      adapters_(std::move(components.adapters)),
      reporter_(std::move(components.reporter)),
      logger_(EnsureLogger(std::move(components.logger))),
      config_(std::move(components.config)),
      formats_(std::move(components.formats)),
      supervisor_(logger_) {}

std::vector<AnalyzerOutcome>
Orchestrator::Analyze(std::shared_ptr<const FetchedContent> content,
                      const RunSettings &settings,
                      Clock::time_point deadline) {
  auto collector = std::make_shared<OutcomeCollector>();
  CancellationToken run_cancellation;

  std::vector<AnalyzerOutcome> immediate;
  std::vector<std::pair<AnalyzerSource, std::shared_ptr<AnalyzerAdapter>>>
      dispatch;
  for (const auto source : kAllSources) {
    const auto found = adapters_.find(source);
    if (config_.disabled_sources.count(source) != 0 ||
        found == adapters_.end() || !found->second) {
      immediate.push_back(MakeFailedOutcome(source, OutcomeStatus::kSkipped,
                                            "analyzer disabled"));
      continue;
    }
    dispatch.emplace_back(source, found->second);
  }
  collector->expected = dispatch.size();

  const auto timeout =
      std::min(settings.analyzer_timeout, RemainingUntil(deadline));
  for (const auto &[source, adapter] : dispatch) {
    logger_->Log(LogLevel::kDebug, "analyzer.dispatch",
                 {{"source", SourceName(source)},
                  {"adapter", adapter->Name()},
                  {"timeout_ms", std::to_string(timeout.count())}});
    try {
      std::thread([collector, supervisor = supervisor_, source = source,
                   adapter = adapter, content, timeout,
                   retry = settings.retry, run_cancellation]() {
        AnalyzerOutcome outcome;
        try {
          outcome = supervisor.Run(source, adapter, content, timeout, retry,
                                   run_cancellation);
        } catch (const std::exception &error) {
          outcome = MakeFailedOutcome(source, OutcomeStatus::kError,
                                      error.what());
        }
        Publish(*collector, std::move(outcome));
      }).detach();
    } catch (const std::system_error &error) {
      Publish(*collector,
              MakeFailedOutcome(source, OutcomeStatus::kError,
                                std::string("cannot start analyzer task: ") +
                                    error.what()));
    }
  }

  std::map<AnalyzerSource, AnalyzerOutcome> collected;
  {
    std::unique_lock<std::mutex> lock(collector->mutex);
    collector->updated.wait_until(lock, deadline, [&collector] {
      return collector->outcomes.size() >= collector->expected;
    });
    collector->closed = true;
    collected = collector->outcomes;
  }
  run_cancellation.Cancel();

  for (auto &outcome : immediate) {
    collected.emplace(outcome.source, std::move(outcome));
  }
  std::vector<AnalyzerOutcome> outcomes;
  for (const auto source : kAllSources) {
    auto found = collected.find(source);
    if (found == collected.end()) {
      logger_->Log(LogLevel::kWarn, "analyzer.timeout",
                   {{"source", SourceName(source)},
                    {"reason", "pipeline deadline exceeded"}});
      outcomes.push_back(MakeFailedOutcome(source, OutcomeStatus::kTimeout,
                                           "pipeline deadline exceeded"));
      continue;
    }
    outcomes.push_back(std::move(found->second));
  }
  return outcomes;
}

PipelineResult Orchestrator::Run(const AnalysisRequest &request) {
  const auto pipeline_start = Clock::now();
  PipelineResult result;
  result.state_history.push_back(PipelineState::kPending);
  const auto transition = [&](PipelineState next) {
    logger_->Log(LogLevel::kDebug, "pipeline.state",
                 {{"from", StateName(result.state)}, {"to", StateName(next)}});
    result.state = next;
    result.state_history.push_back(next);
  };
  const auto finish = [&]() {
    result.processing_time =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                              pipeline_start);
    result.rendered = reporter_->Render(result, formats_);
    logger_->Log(LogLevel::kInfo, "pipeline.complete",
                 {{"url", request.url},
                  {"state", StateName(result.state)},
                  {"risk_score", std::to_string(result.report.risk_score)},
                  {"recommendation",
                   RecommendationLabel(result.report.recommendation)},
                  {"duration_ms",
                   std::to_string(result.processing_time.count())}});
    return result;
  };

  RunSettings settings;
  try {
    settings = ResolveRunSettings(config_, request.options);
  } catch (const std::invalid_argument &error) {
    logger_->Log(LogLevel::kWarn, "pipeline.options.rejected",
                 {{"url", request.url}, {"error", error.what()}});
    result.errors.push_back(std::string("options: ") + error.what());
    transition(PipelineState::kFailed);
    result.report =
        BuildUnknownReport(request.url, std::chrono::system_clock::now());
    return finish();
  }
  const auto deadline = pipeline_start + settings.pipeline_deadline;

  logger_->Log(LogLevel::kInfo, "pipeline.start",
               {{"url", request.url},
                {"deadline_ms",
                 std::to_string(settings.pipeline_deadline.count())}});

  transition(PipelineState::kFetching);
  const auto timestamp = std::chrono::system_clock::now();
  std::shared_ptr<const FetchedContent> content;
  try {
    content = std::make_shared<const FetchedContent>(fetcher_->Fetch(request.url));
  } catch (const std::exception &error) {
    logger_->Log(LogLevel::kWarn, "pipeline.fetch.failed",
                 {{"url", request.url}, {"error", error.what()}});
    result.errors.push_back(std::string("fetch: ") + error.what());
    transition(PipelineState::kFailed);
    result.report = BuildUnknownReport(request.url, timestamp);
    return finish();
  }

  transition(PipelineState::kAnalyzing);
  result.outcomes = Analyze(content, settings, deadline);
  for (const auto &outcome : result.outcomes) {
    if (outcome.status == OutcomeStatus::kTimeout ||
        outcome.status == OutcomeStatus::kError) {
      result.errors.push_back(SourceName(outcome.source) + ": " +
                              outcome.error_detail.value_or(
                                  StatusName(outcome.status)));
    }
  }

  transition(PipelineState::kAggregating);
  const ResultAggregator aggregator(settings.weights);
  const auto aggregation = aggregator.Aggregate(result.outcomes);
  result.fused = aggregation.fused;
  if (!aggregation.has_signal) {
    result.errors.push_back("no analyzer produced a usable result");
    transition(PipelineState::kFailed);
    result.report = BuildUnknownReport(request.url, timestamp);
    return finish();
  }

  transition(PipelineState::kDone);
  result.report =
      BuildRiskReport(request.url, timestamp, aggregation.fused, result.outcomes);
  return finish();
}

} // namespace sitecheck
