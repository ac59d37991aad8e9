#pragma once

#include <sitecheck/cancellation.h>
#include <sitecheck/models.h>

#include <string>
#include <vector>

namespace sitecheck {

class ContentFetcher {
public:
  virtual ~ContentFetcher() = default;
  // Throws FetchError when the page cannot be acquired.
  virtual FetchedContent Fetch(const std::string &url) = 0;
};

// One analysis capability (content, visual or reputation). Returns an outcome
// with status ok, or throws an AnalyzerFailure (any other exception counts as
// a permanent failure). Must not mutate `content`.
class AnalyzerAdapter {
public:
  virtual ~AnalyzerAdapter() = default;
  virtual AnalyzerOutcome Evaluate(const FetchedContent &content,
                                   const CancellationToken &cancellation) = 0;
  virtual std::string Name() const = 0;
};

class Reporter {
public:
  virtual ~Reporter() = default;
  virtual Report Render(const PipelineResult &result,
                        const std::vector<std::string> &formats) = 0;
};

class AnalysisPipeline {
public:
  virtual ~AnalysisPipeline() = default;
  virtual PipelineResult Run(const AnalysisRequest &request) = 0;
};

} // namespace sitecheck
