#pragma once

#include <sitecheck/component_registry.h>
#include <sitecheck/curl_content_fetcher.h>
#include <sitecheck/engine_config.h>
#include <sitecheck/logging.h>
#include <sitecheck/models.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace sitecheck {

struct AnalyzeOptions {
  std::optional<std::string> url;
  std::optional<std::filesystem::path> output_directory;
  std::optional<std::filesystem::path> config_file;
  std::vector<std::string> formats;
  std::optional<LogLevel> log_level;

  std::optional<WeightTable> weights;
  std::optional<std::chrono::milliseconds> analyzer_timeout;
  std::optional<std::chrono::milliseconds> pipeline_timeout;
  std::optional<int> max_attempts;
  std::optional<std::chrono::milliseconds> initial_backoff;
  std::optional<double> backoff_multiplier;
  std::optional<std::chrono::milliseconds> max_backoff;

  std::optional<std::string> content_analyzer;
  std::optional<std::string> visual_analyzer;
  std::optional<std::string> reputation_analyzer;
  std::optional<std::string> reporter;
  std::vector<std::string> disabled_analyzers;

  std::optional<std::chrono::milliseconds> fetch_timeout;
  std::optional<std::size_t> max_bytes;
  std::optional<std::string> user_agent;
  std::optional<std::string> screenshot_command;
  std::optional<std::string> classifier_command;
  std::vector<std::string> blocklist;

  bool show_help = false;
};

AnalyzeOptions ParseAnalyzeArguments(const std::vector<std::string> &arguments);
AnalyzeOptions ParseConfigFile(const std::filesystem::path &path);
AnalyzeOptions MergeOptions(const AnalyzeOptions &config_options,
                            const AnalyzeOptions &cli_options);
// Reads the config file named by `cli_options` (if any), merges it under the
// flags and validates the result.
AnalyzeOptions ResolveAnalyzeOptions(const AnalyzeOptions &cli_options);

// Parses "c,v,r" into a weight table (not validated).
WeightTable ParseWeights(const std::string &value);

EngineConfig BuildEngineConfig(const AnalyzeOptions &options);
FetchSettings BuildFetchSettings(const AnalyzeOptions &options);
AdapterSettings BuildAdapterSettings(const AnalyzeOptions &options);

int RunAnalyze(const std::vector<std::string> &arguments);
int RunAnalyze(const std::vector<std::string> &arguments, std::ostream &out);

} // namespace sitecheck
