#include <sitecheck/sitecheck_cli.h>

#include <sitecheck/cli_exit_codes.h>
#include <sitecheck/escaping.h>
#include <sitecheck/orchestrator.h>
#include <sitecheck/pipeline_builder.h>
#include <sitecheck/screenshot_renderer.h>
#include <sitecheck/url.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {

using sitecheck::AnalyzeOptions;
using sitecheck::ToLower;
using sitecheck::Trim;

void PrintAnalyzeUsage(std::ostream &out) {
  out << "Usage: sitecheck [analyze] <url> [options]\n"
      << "Options:\n"
      << "  --url <url>                 Site to analyze (https:// is assumed\n"
      << "                              when no scheme is given)\n"
      << "  --config <file>             Optional YAML config file\n"
      << "  --format <list>             Comma-separated output formats\n"
      << "                              (supported: json,markdown; default "
         "json)\n"
      << "  --out <path>                Directory for site_report.json and\n"
      << "                              site_report.md (default: print to "
         "stdout)\n"
      << "  --weights <c,v,r>           Content, visual and reputation "
         "weights\n"
      << "                              (must sum to 1.0)\n"
      << "  --analyzer-timeout-ms <n>   Deadline for each analyzer\n"
      << "  --pipeline-timeout-ms <n>   Deadline for the whole analysis\n"
      << "  --max-attempts <n>          Attempts per analyzer on transient "
         "errors\n"
      << "  --content-analyzer <name>   Content analyzer plug-in\n"
      << "  --visual-analyzer <name>    Visual analyzer plug-in\n"
      << "  --reputation-analyzer <name> Reputation analyzer plug-in\n"
      << "  --reporter <name>           Reporter plug-in\n"
      << "  --disable <source>          Skip an analyzer (content, visual,\n"
      << "                              reputation); repeatable\n"
      << "  --classifier-command <cmd>  Image classifier for screenshots\n"
      << "                              ({image} is replaced by the path)\n"
      << "  --screenshot-command <cmd>  Screenshot renderer ({url}, "
         "{output})\n"
      << "  --blocklist <list>          Comma-separated known-bad domains\n"
      << "  --log-level <level>         Logging verbosity "
         "(error,warn,info,debug)\n"
      << "  --verbose                   Shortcut for --log-level info\n"
      << "  --debug                     Shortcut for --log-level debug\n"
      << "  --help                      Show this message\n\n"
      << "Exit status: 0 low/medium risk, 2 high risk, 3 unknown, 1 usage "
         "error.\n";
}

std::vector<std::string> SplitList(const std::string &raw_values) {
  std::vector<std::string> values;
  std::string current;
  for (const auto character : raw_values) {
    if (character == ',') {
      if (!current.empty()) {
        values.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(character);
    }
  }
  if (!current.empty()) {
    values.push_back(current);
  }
  return values;
}

void AppendValues(const std::string &raw_values,
                  std::vector<std::string> &target) {
  for (auto value : SplitList(raw_values)) {
    value = Trim(value);
    if (value.empty()) {
      continue;
    }
    if (std::find(target.begin(), target.end(), value) == target.end()) {
      target.push_back(std::move(value));
    }
  }
}

void AppendFormats(const std::string &raw_formats,
                   std::vector<std::string> &target) {
  for (auto format : SplitList(raw_formats)) {
    format = ToLower(Trim(format));
    if (format != "markdown" && format != "json") {
      throw std::invalid_argument("Unsupported format: " + format);
    }
    if (std::find(target.begin(), target.end(), format) == target.end()) {
      target.push_back(std::move(format));
    }
  }
}

void AppendSources(const std::string &raw_sources,
                   std::vector<std::string> &target) {
  for (auto source : SplitList(raw_sources)) {
    source = ToLower(Trim(source));
    sitecheck::ParseSource(source);
    if (std::find(target.begin(), target.end(), source) == target.end()) {
      target.push_back(std::move(source));
    }
  }
}

double ParseNumber(const std::string &raw_value, const std::string &name) {
  const auto value = Trim(raw_value);
  std::size_t consumed = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(value, &consumed);
  } catch (const std::logic_error &) {
    throw std::invalid_argument(name + " expects a number, got '" +
                                raw_value + "'");
  }
  if (consumed != value.size() || !std::isfinite(parsed)) {
    throw std::invalid_argument(name + " expects a number, got '" +
                                raw_value + "'");
  }
  return parsed;
}

long long ToWholeNumber(double value, const std::string &name) {
  if (value < 0.0 || std::floor(value) != value) {
    throw std::invalid_argument(name + " must be a non-negative integer");
  }
  return static_cast<long long>(value);
}

std::chrono::milliseconds ParseMilliseconds(const std::string &raw_value,
                                            const std::string &name) {
  return std::chrono::milliseconds{
      ToWholeNumber(ParseNumber(raw_value, name), name)};
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

void HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level = sitecheck::ParseLogLevel(
        RequireValue(arguments, index, std::string(argument)));
    return;
  }
  if (argument == "--verbose") {
    options.log_level = sitecheck::LogLevel::kInfo;
    return;
  }
  if (argument == "--debug") {
    options.log_level = sitecheck::LogLevel::kDebug;
    return;
  }
}

bool HandleEngineOption(const std::vector<std::string> &arguments,
                        std::size_t &index, AnalyzeOptions &options) {
  const auto argument = arguments[index];
  if (argument == "--weights") {
    options.weights =
        sitecheck::ParseWeights(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--analyzer-timeout-ms") {
    options.analyzer_timeout =
        ParseMilliseconds(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--pipeline-timeout-ms") {
    options.pipeline_timeout =
        ParseMilliseconds(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--max-attempts") {
    options.max_attempts = static_cast<int>(ToWholeNumber(
        ParseNumber(RequireValue(arguments, index, argument), argument),
        argument));
    return true;
  }
  if (argument == "--disable") {
    AppendSources(RequireValue(arguments, index, argument),
                  options.disabled_analyzers);
    return true;
  }
  return false;
}

bool HandlePluginSelection(const std::vector<std::string> &arguments,
                           std::size_t &index, AnalyzeOptions &options) {
  const auto argument = arguments[index];
  if (argument == "--content-analyzer") {
    options.content_analyzer = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--visual-analyzer") {
    options.visual_analyzer = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--reputation-analyzer") {
    options.reputation_analyzer = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--reporter") {
    options.reporter = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--classifier-command") {
    options.classifier_command = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--screenshot-command") {
    options.screenshot_command = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--blocklist") {
    AppendValues(RequireValue(arguments, index, argument), options.blocklist);
    return true;
  }
  return false;
}

bool DispatchAnalyzeOption(const std::vector<std::string> &arguments,
                           std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--url") {
    options.url = RequireValue(arguments, index, "--url");
    return true;
  }
  if (argument == "--out") {
    options.output_directory = RequireValue(arguments, index, "--out");
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, "--config");
    return true;
  }
  if (argument == "--format") {
    AppendFormats(RequireValue(arguments, index, "--format"), options.formats);
    return true;
  }

  HandleLoggingOption(arguments, index, options);
  if (argument == "--log-level" || argument == "--verbose" ||
      argument == "--debug") {
    return true;
  }

  if (HandleEngineOption(arguments, index, options)) {
    return true;
  }
  if (HandlePluginSelection(arguments, index, options)) {
    return true;
  }

  if (!argument.empty() && argument.front() != '-' && !options.url) {
    options.url = argument;
    return true;
  }
  return false;
}

void ValidateAnalyzeOptions(const AnalyzeOptions &options) {
  if (!options.url) {
    throw std::invalid_argument("A URL is required (positional, --url or "
                                "'url' in the config file)");
  }
}

void WriteFileIfContent(const std::filesystem::path &path,
                        const std::string &content) {
  if (content.empty()) {
    return;
  }
  std::ofstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open output file: " + path.string());
  }
  stream << content;
}

void WriteReports(const std::filesystem::path &root,
                  const sitecheck::Report &report) {
  std::filesystem::create_directories(root);
  WriteFileIfContent(root / "site_report.json", report.json);
  WriteFileIfContent(root / "site_report.md", report.markdown);
}

void PrintReports(std::ostream &out, const sitecheck::Report &report) {
  out << report.json;
  if (!report.json.empty() && !report.markdown.empty()) {
    out << "\n";
  }
  out << report.markdown;
}

} // namespace

namespace sitecheck {

WeightTable ParseWeights(const std::string &value) {
  const auto parts = SplitList(value);
  if (parts.size() != 3) {
    throw std::invalid_argument(
        "--weights expects three comma-separated values (content,visual,"
        "reputation), got '" +
        value + "'");
  }
  WeightTable weights;
  weights.content = ParseNumber(parts[0], "content weight");
  weights.visual = ParseNumber(parts[1], "visual weight");
  weights.reputation = ParseNumber(parts[2], "reputation weight");
  return weights;
}

AnalyzeOptions
ParseAnalyzeArguments(const std::vector<std::string> &arguments) {
  AnalyzeOptions options;

  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchAnalyzeOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }

  return options;
}

using ConfigValue = std::variant<std::string, double, std::vector<std::string>>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {
      "url",
      "out",
      "formats",
      "log_level",
      "reporter",
      "weights.content",
      "weights.visual",
      "weights.reputation",
      "timeouts.analyzer_ms",
      "timeouts.pipeline_ms",
      "retry.max_attempts",
      "retry.initial_backoff_ms",
      "retry.backoff_multiplier",
      "retry.max_backoff_ms",
      "analyzers.content",
      "analyzers.visual",
      "analyzers.reputation",
      "analyzers.disabled",
      "fetch.timeout_ms",
      "fetch.max_bytes",
      "fetch.user_agent",
      "fetch.screenshot_command",
      "visual.classifier_command",
      "reputation.blocklist"};
  return keys;
}

bool IsConfigSection(const std::string &key) {
  static const std::vector<std::string> sections = {
      "weights", "timeouts", "retry",     "analyzers",
      "fetch",   "visual",   "reputation"};
  return std::find(sections.begin(), sections.end(), key) != sections.end();
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"output", "out"},
      {"output_directory", "out"},
      {"format", "formats"},
      {"timeout", "timeouts"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

bool IsListKey(const std::string &key) {
  return key == "formats" || key == "analyzers.disabled" ||
         key == "reputation.blocklist";
}

bool IsNumberKey(const std::string &key) {
  return key.rfind("weights.", 0) == 0 || key.rfind("timeouts.", 0) == 0 ||
         key.rfind("retry.", 0) == 0 || key == "fetch.timeout_ms" ||
         key == "fetch.max_bytes";
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a string value");
  }
  return node.as<std::string>();
}

double ExtractNumber(const YAML::Node &node, const std::string &key_name) {
  double value = 0.0;
  if (!node.IsScalar() || !YAML::convert<double>::decode(node, value) ||
      !std::isfinite(value)) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a number");
  }
  return value;
}

using ListAppender = void (*)(const std::string &, std::vector<std::string> &);

std::vector<std::string> ExtractList(const YAML::Node &node,
                                     const std::string &key_name,
                                     ListAppender appender) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw std::invalid_argument("Config key '" + key_name +
                                    "' must be a list of strings");
      }
      appender(child.as<std::string>(), values);
    }
    return values;
  }
  if (node.IsScalar()) {
    appender(node.as<std::string>(), values);
    return values;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or list of strings");
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (key == "formats") {
    return ExtractList(node, key, AppendFormats);
  }
  if (key == "analyzers.disabled") {
    return ExtractList(node, key, AppendSources);
  }
  if (IsListKey(key)) {
    return ExtractList(node, key, AppendValues);
  }
  if (IsNumberKey(key)) {
    return ConfigValue{ExtractNumber(node, key)};
  }
  return ConfigValue{ExtractStringScalar(node, key)};
}

void CollectConfig(const YAML::Node &node, const std::string &prefix,
                   RawConfig &config) {
  const auto &supported = SupportedConfigKeys();
  for (const auto &entry : node) {
    const auto key =
        prefix + NormalizeConfigKey(entry.first.as<std::string>());
    if (prefix.empty() && IsConfigSection(key)) {
      if (!entry.second.IsMap()) {
        throw std::invalid_argument("Config section '" + key +
                                    "' must be a mapping");
      }
      CollectConfig(entry.second, key + ".", config);
      continue;
    }
    if (std::find(supported.begin(), supported.end(), key) ==
        supported.end()) {
      ThrowUnknownKey(key);
    }
    config[key] = ToConfigValue(key, entry.second);
  }
}

RawConfig ParseYamlConfig(const std::filesystem::path &path) {
  const auto root = YAML::LoadFile(path.string());
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  RawConfig config;
  CollectConfig(root, "", config);
  return config;
}

std::chrono::milliseconds ConfigMilliseconds(const ConfigValue &value,
                                             const std::string &key) {
  return std::chrono::milliseconds{ToWholeNumber(std::get<double>(value), key)};
}

void ApplyWeight(const std::string &key, double value,
                 AnalyzeOptions &options) {
  auto weights = options.weights.value_or(WeightTable{});
  weights.For(ParseSource(key.substr(key.find('.') + 1))) = value;
  options.weights = weights;
}

void ApplyConfig(const RawConfig &config, AnalyzeOptions &options) {
  for (const auto &[key, value] : config) {
    if (key == "url") {
      options.url = std::get<std::string>(value);
    } else if (key == "out") {
      options.output_directory = std::get<std::string>(value);
    } else if (key == "formats") {
      options.formats = std::get<std::vector<std::string>>(value);
    } else if (key == "log_level") {
      options.log_level = ParseLogLevel(std::get<std::string>(value));
    } else if (key == "reporter") {
      options.reporter = std::get<std::string>(value);
    } else if (key.rfind("weights.", 0) == 0) {
      ApplyWeight(key, std::get<double>(value), options);
    } else if (key == "timeouts.analyzer_ms") {
      options.analyzer_timeout = ConfigMilliseconds(value, key);
    } else if (key == "timeouts.pipeline_ms") {
      options.pipeline_timeout = ConfigMilliseconds(value, key);
    } else if (key == "retry.max_attempts") {
      options.max_attempts =
          static_cast<int>(ToWholeNumber(std::get<double>(value), key));
    } else if (key == "retry.initial_backoff_ms") {
      options.initial_backoff = ConfigMilliseconds(value, key);
    } else if (key == "retry.backoff_multiplier") {
      options.backoff_multiplier = std::get<double>(value);
    } else if (key == "retry.max_backoff_ms") {
      options.max_backoff = ConfigMilliseconds(value, key);
    } else if (key == "analyzers.content") {
      options.content_analyzer = std::get<std::string>(value);
    } else if (key == "analyzers.visual") {
      options.visual_analyzer = std::get<std::string>(value);
    } else if (key == "analyzers.reputation") {
      options.reputation_analyzer = std::get<std::string>(value);
    } else if (key == "analyzers.disabled") {
      options.disabled_analyzers = std::get<std::vector<std::string>>(value);
    } else if (key == "fetch.timeout_ms") {
      options.fetch_timeout = ConfigMilliseconds(value, key);
    } else if (key == "fetch.max_bytes") {
      options.max_bytes =
          static_cast<std::size_t>(ToWholeNumber(std::get<double>(value), key));
    } else if (key == "fetch.user_agent") {
      options.user_agent = std::get<std::string>(value);
    } else if (key == "fetch.screenshot_command") {
      options.screenshot_command = std::get<std::string>(value);
    } else if (key == "visual.classifier_command") {
      options.classifier_command = std::get<std::string>(value);
    } else if (key == "reputation.blocklist") {
      options.blocklist = std::get<std::vector<std::string>>(value);
    } else {
      ThrowUnknownKey(key);
    }
  }
}

AnalyzeOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  AnalyzeOptions options;
  options.config_file = path;
  ApplyConfig(ParseYamlConfig(path), options);
  return options;
}

AnalyzeOptions MergeOptions(const AnalyzeOptions &config_options,
                            const AnalyzeOptions &cli_options) {
  AnalyzeOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };
  const auto override_list = [](auto &target, const auto &source) {
    if (!source.empty()) {
      target = source;
    }
  };

  override_value(merged.url, cli_options.url);
  override_value(merged.output_directory, cli_options.output_directory);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.log_level, cli_options.log_level);
  override_value(merged.weights, cli_options.weights);
  override_value(merged.analyzer_timeout, cli_options.analyzer_timeout);
  override_value(merged.pipeline_timeout, cli_options.pipeline_timeout);
  override_value(merged.max_attempts, cli_options.max_attempts);
  override_value(merged.initial_backoff, cli_options.initial_backoff);
  override_value(merged.backoff_multiplier, cli_options.backoff_multiplier);
  override_value(merged.max_backoff, cli_options.max_backoff);
  override_value(merged.content_analyzer, cli_options.content_analyzer);
  override_value(merged.visual_analyzer, cli_options.visual_analyzer);
  override_value(merged.reputation_analyzer, cli_options.reputation_analyzer);
  override_value(merged.reporter, cli_options.reporter);
  override_value(merged.fetch_timeout, cli_options.fetch_timeout);
  override_value(merged.max_bytes, cli_options.max_bytes);
  override_value(merged.user_agent, cli_options.user_agent);
  override_value(merged.screenshot_command, cli_options.screenshot_command);
  override_value(merged.classifier_command, cli_options.classifier_command);

  override_list(merged.formats, cli_options.formats);
  override_list(merged.disabled_analyzers, cli_options.disabled_analyzers);
  override_list(merged.blocklist, cli_options.blocklist);
  return merged;
}

AnalyzeOptions ResolveAnalyzeOptions(const AnalyzeOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }

  AnalyzeOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  }

  auto merged = MergeOptions(config_options, cli_options);
  ValidateAnalyzeOptions(merged);
  merged.url = NormalizeUrl(*merged.url);
  ValidateEngineConfig(BuildEngineConfig(merged));
  return merged;
}

EngineConfig BuildEngineConfig(const AnalyzeOptions &options) {
  EngineConfig config;
  config.weights = options.weights.value_or(config.weights);
  config.analyzer_timeout =
      options.analyzer_timeout.value_or(config.analyzer_timeout);
  config.pipeline_deadline =
      options.pipeline_timeout.value_or(config.pipeline_deadline);
  config.retry.max_attempts =
      options.max_attempts.value_or(config.retry.max_attempts);
  config.retry.initial_backoff =
      options.initial_backoff.value_or(config.retry.initial_backoff);
  config.retry.backoff_multiplier =
      options.backoff_multiplier.value_or(config.retry.backoff_multiplier);
  config.retry.max_backoff =
      options.max_backoff.value_or(config.retry.max_backoff);
  for (const auto &source : options.disabled_analyzers) {
    config.disabled_sources.insert(ParseSource(source));
  }
  return config;
}

FetchSettings BuildFetchSettings(const AnalyzeOptions &options) {
  FetchSettings settings;
  settings.timeout = options.fetch_timeout.value_or(settings.timeout);
  settings.max_bytes = options.max_bytes.value_or(settings.max_bytes);
  settings.user_agent = options.user_agent.value_or(settings.user_agent);
  if (settings.max_bytes == 0) {
    throw std::invalid_argument("fetch.max_bytes must be positive");
  }
  return settings;
}

AdapterSettings BuildAdapterSettings(const AnalyzeOptions &options) {
  AdapterSettings settings;
  settings.classifier_command = options.classifier_command.value_or("");
  settings.blocklist = options.blocklist;
  return settings;
}

LoggingConfig BuildLoggingConfig(const AnalyzeOptions &options) {
  LoggingConfig logging;
  logging.level = options.log_level.value_or(LogLevel::kWarn);
  return logging;
}

Orchestrator BuildAnalyzePipeline(const AnalyzeOptions &options,
                                  const std::shared_ptr<Logger> &logger) {
  PipelineBuilder builder;
  builder.WithLogger(logger);
  builder.WithEngineConfig(BuildEngineConfig(options));
  builder.WithFetchSettings(BuildFetchSettings(options));
  builder.WithAdapterSettings(BuildAdapterSettings(options));
  builder.WithFormats(options.formats.empty()
                          ? std::vector<std::string>{"json"}
                          : options.formats);
  if (options.screenshot_command && !Trim(*options.screenshot_command).empty()) {
    const auto directory =
        options.output_directory
            ? *options.output_directory / "screenshots"
            : std::filesystem::temp_directory_path() / "sitecheck-screenshots";
    builder.WithScreenshotRenderer(std::make_shared<CommandScreenshotRenderer>(
        *options.screenshot_command, directory,
        BuildFetchSettings(options).timeout, logger));
  }
  if (options.content_analyzer) {
    builder.WithAdapterName(AnalyzerSource::kContent, *options.content_analyzer);
  }
  if (options.visual_analyzer) {
    builder.WithAdapterName(AnalyzerSource::kVisual, *options.visual_analyzer);
  }
  if (options.reputation_analyzer) {
    builder.WithAdapterName(AnalyzerSource::kReputation,
                            *options.reputation_analyzer);
  }
  if (options.reporter) {
    builder.WithReporterName(*options.reporter);
  }
  return builder.Build();
}

int RunAnalyze(const std::vector<std::string> &arguments, std::ostream &out) {
  const auto cli_options = ParseAnalyzeArguments(arguments);
  if (cli_options.show_help) {
    PrintAnalyzeUsage(out);
    return 0;
  }

  const auto merged = ResolveAnalyzeOptions(cli_options);
  auto logger = MakeLogger(BuildLoggingConfig(merged), std::clog);
  auto pipeline = BuildAnalyzePipeline(merged, logger);

  AnalysisRequest request;
  request.url = *merged.url;
  request.requested_at = std::chrono::system_clock::now();
  const auto result = pipeline.Run(request);

  if (merged.output_directory) {
    WriteReports(*merged.output_directory, result.rendered);
  } else {
    PrintReports(out, result.rendered);
  }
  return RiskExitCode(result.report.recommendation);
}

int RunAnalyze(const std::vector<std::string> &arguments) {
  return RunAnalyze(arguments, std::cout);
}

} // namespace sitecheck
