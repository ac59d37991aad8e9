#pragma once

#include <sitecheck/analyzer_supervisor.h>
#include <sitecheck/pipeline_builder.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sitecheck {

// Runs one request through PENDING -> FETCHING -> ANALYZING -> AGGREGATING ->
// DONE (or FAILED). Holds no per-run state, so one instance may serve
// concurrent runs.
class Orchestrator : public AnalysisPipeline {
public:
  explicit Orchestrator(PipelineComponents components);

  // Always yields a well-formed report. Invalid per-run overrides fail the
  // run before fetching.
  PipelineResult Run(const AnalysisRequest &request) override;

  const EngineConfig &config() const { return config_; }

private:
  std::vector<AnalyzerOutcome>
  Analyze(std::shared_ptr<const FetchedContent> content,
          const RunSettings &settings,
          std::chrono::steady_clock::time_point deadline);

  std::unique_ptr<ContentFetcher> fetcher_;
  std::map<AnalyzerSource, std::shared_ptr<AnalyzerAdapter>> adapters_;
  std::unique_ptr<Reporter> reporter_;
  std::shared_ptr<Logger> logger_;
  EngineConfig config_;
  std::vector<std::string> formats_;
  AnalyzerSupervisor supervisor_;
};

} // namespace sitecheck
