#pragma once

#include <sitecheck/component_registry.h>
#include <sitecheck/curl_content_fetcher.h>
#include <sitecheck/engine_config.h>
#include <sitecheck/interfaces.h>
#include <sitecheck/logging.h>
#include <sitecheck/screenshot_renderer.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sitecheck {

class Orchestrator;

struct PipelineComponents {
  std::unique_ptr<ContentFetcher> fetcher;
  std::map<AnalyzerSource, std::shared_ptr<AnalyzerAdapter>> adapters;
  std::unique_ptr<Reporter> reporter;
  std::shared_ptr<Logger> logger;
  EngineConfig config;
  std::vector<std::string> formats;
};

class PipelineBuilder {
public:
  explicit PipelineBuilder(
      const ComponentRegistry &registry = GlobalComponentRegistry());

  PipelineBuilder &WithFetcher(std::unique_ptr<ContentFetcher> fetcher);
  PipelineBuilder &WithFetchSettings(FetchSettings settings);
  PipelineBuilder &
  WithScreenshotRenderer(std::shared_ptr<ScreenshotRenderer> renderer);
  PipelineBuilder &WithAdapter(AnalyzerSource source,
                               std::shared_ptr<AnalyzerAdapter> adapter);
  PipelineBuilder &WithAdapterName(AnalyzerSource source, std::string name);
  PipelineBuilder &WithAdapterSettings(AdapterSettings settings);
  PipelineBuilder &WithReporter(std::unique_ptr<Reporter> reporter);
  PipelineBuilder &WithReporterName(std::string name);
  PipelineBuilder &WithLogger(std::shared_ptr<Logger> logger);
  PipelineBuilder &WithEngineConfig(EngineConfig config);
  PipelineBuilder &WithFormats(std::vector<std::string> formats);

  // Throws std::invalid_argument for an invalid engine configuration or an
  // unknown component name.
  Orchestrator Build();

private:
  const ComponentRegistry *registry_;
  struct ComponentSelections {
    std::map<AnalyzerSource, std::string> adapters;
    std::string reporter;
  } selections_;
  AdapterSettings adapter_settings_;
  FetchSettings fetch_settings_;
  std::shared_ptr<ScreenshotRenderer> screenshot_renderer_;
  PipelineComponents components_;
};

} // namespace sitecheck
