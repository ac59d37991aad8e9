#include <sitecheck/pipeline_builder.h>

#include <sitecheck/orchestrator.h>

#include <utility>

namespace sitecheck {

PipelineBuilder::PipelineBuilder(const ComponentRegistry &registry)
    : registry_(&registry) {
  for (const auto source : kAllSources) {
    selections_.adapters[source] = registry_->DefaultAdapterName(source);
  }
  selections_.reporter = registry_->DefaultReporterName();
}

PipelineBuilder &
PipelineBuilder::WithFetcher(std::unique_ptr<ContentFetcher> fetcher) {
  components_.fetcher = std::move(fetcher);
  return *this;
}

PipelineBuilder &PipelineBuilder::WithFetchSettings(FetchSettings settings) {
  fetch_settings_ = std::move(settings);
  return *this;
}

PipelineBuilder &PipelineBuilder::WithScreenshotRenderer(
    std::shared_ptr<ScreenshotRenderer> renderer) {
  screenshot_renderer_ = std::move(renderer);
  return *this;
}

PipelineBuilder &
PipelineBuilder::WithAdapter(AnalyzerSource source,
                             std::shared_ptr<AnalyzerAdapter> adapter) {
  components_.adapters[source] = std::move(adapter);
  return *this;
}

PipelineBuilder &PipelineBuilder::WithAdapterName(AnalyzerSource source,
                                                  std::string name) {
  selections_.adapters[source] = std::move(name);
  return *this;
}

PipelineBuilder &
PipelineBuilder::WithAdapterSettings(AdapterSettings settings) {
  adapter_settings_ = std::move(settings);
  return *this;
}

PipelineBuilder &
PipelineBuilder::WithReporter(std::unique_ptr<Reporter> reporter) {
  components_.reporter = std::move(reporter);
  return *this;
}

PipelineBuilder &PipelineBuilder::WithReporterName(std::string name) {
  selections_.reporter = std::move(name);
  return *this;
}

PipelineBuilder &PipelineBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

PipelineBuilder &PipelineBuilder::WithEngineConfig(EngineConfig config) {
  components_.config = std::move(config);
  return *this;
}

PipelineBuilder &
PipelineBuilder::WithFormats(std::vector<std::string> formats) {
  components_.formats = std::move(formats);
  return *this;
}

Orchestrator PipelineBuilder::Build() {
  ValidateEngineConfig(components_.config);
  components_.logger = EnsureLogger(std::move(components_.logger));
  components_.fetcher =
      components_.fetcher
          ? std::move(components_.fetcher)
          : std::make_unique<CurlContentFetcher>(
                fetch_settings_, screenshot_renderer_, components_.logger);

  for (const auto source : kAllSources) {
    if (components_.config.disabled_sources.count(source) != 0) {
      components_.adapters.erase(source);
      continue;
    }
    auto &adapter = components_.adapters[source];
    if (!adapter) {
      adapter = registry_->CreateAdapter(source, selections_.adapters[source],
                                         adapter_settings_);
    }
  }

  components_.reporter = components_.reporter
                             ? std::move(components_.reporter)
                             : registry_->CreateReporter(selections_.reporter);
  return Orchestrator(std::move(components_));
}

} // namespace sitecheck
