#include <sitecheck/component_registry.h>

#include <sitecheck/command_visual_analyzer.h>
#include <sitecheck/domain_reputation_analyzer.h>
#include <sitecheck/heuristic_content_analyzer.h>
#include <sitecheck/standard_reporter.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace {

constexpr const char kDefaultContentAdapter[] = "heuristic";
constexpr const char kDefaultVisualAdapter[] = "command";
constexpr const char kDefaultReputationAdapter[] = "heuristic";
constexpr const char kDefaultReporter[] = "standard";

} // namespace

namespace sitecheck {

template <typename Factory>
std::vector<std::string>
ComponentRegistry::RegisteredNames(const ComponentSet<Factory> &set) {
  std::vector<std::string> names;
  names.reserve(set.factories.size());
  for (const auto &entry : set.factories) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

template <typename Factory>
std::string ComponentRegistry::JoinNames(const ComponentSet<Factory> &set) {
  const auto names = RegisteredNames(set);
  std::string message;
  for (std::size_t i = 0; i < names.size(); ++i) {
    message += names[i];
    if (i + 1 < names.size()) {
      message += ", ";
    }
  }
  return message;
}

template <typename Factory>
const Factory &ComponentRegistry::FindFactory(const std::string &name,
                                              const ComponentSet<Factory> &set,
                                              const std::string &kind,
                                              std::string &resolved_name) {
  resolved_name = name.empty() ? set.default_name : name;
  if (resolved_name.empty()) {
    throw std::invalid_argument("No default " + kind + " registered");
  }
  const auto found = set.factories.find(resolved_name);
  if (found == set.factories.end()) {
    throw std::invalid_argument("Unknown " + kind + " '" + resolved_name +
                                "'. Registered: " + JoinNames(set));
  }
  return found->second;
}

template <typename Factory>
void ComponentRegistry::RegisterComponent(const std::string &name,
                                          Factory factory,
                                          bool set_as_default,
                                          ComponentSet<Factory> &set) {
  if (name.empty()) {
    throw std::invalid_argument("Component name cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Factory for '" + name + "' cannot be null");
  }
  if (set.factories.count(name) != 0) {
    throw std::invalid_argument("Component with name '" + name +
                                "' already registered");
  }
  set.factories.emplace(name, std::move(factory));
  if (set_as_default || set.default_name.empty()) {
    set.default_name = name;
  }
}

const ComponentRegistry::ComponentSet<ComponentRegistry::AdapterFactory> &
ComponentRegistry::Adapters(AnalyzerSource source) const {
  switch (source) {
  case AnalyzerSource::kContent:
    return content_adapters_;
  case AnalyzerSource::kVisual:
    return visual_adapters_;
  case AnalyzerSource::kReputation:
    return reputation_adapters_;
  }
  throw std::invalid_argument("Unknown analyzer source");
}

ComponentRegistry::ComponentSet<ComponentRegistry::AdapterFactory> &
ComponentRegistry::Adapters(AnalyzerSource source) {
  const auto &self = *this;
  return const_cast<ComponentSet<AdapterFactory> &>(self.Adapters(source));
}

void ComponentRegistry::RegisterAdapter(AnalyzerSource source,
                                        const std::string &name,
                                        AdapterFactory factory,
                                        bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default,
                    Adapters(source));
}

void ComponentRegistry::RegisterReporter(const std::string &name,
                                         ReporterFactory factory,
                                         bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default, reporters_);
}

std::shared_ptr<AnalyzerAdapter>
ComponentRegistry::CreateAdapter(AnalyzerSource source, const std::string &name,
                                 const AdapterSettings &settings) const {
  const auto kind = SourceName(source) + " analyzer";
  std::string resolved;
  const auto &factory = FindFactory(name, Adapters(source), kind, resolved);
  auto instance = factory(settings);
  if (!instance) {
    throw std::runtime_error("Factory for " + kind + " '" + resolved +
                             "' returned null");
  }
  return instance;
}

std::unique_ptr<Reporter>
ComponentRegistry::CreateReporter(const std::string &name) const {
  std::string resolved;
  const auto &factory = FindFactory(name, reporters_, "reporter", resolved);
  auto instance = factory();
  if (!instance) {
    throw std::runtime_error("Factory for reporter '" + resolved +
                             "' returned null");
  }
  return instance;
}

std::vector<std::string>
ComponentRegistry::AdapterNames(AnalyzerSource source) const {
  return RegisteredNames(Adapters(source));
}

std::vector<std::string> ComponentRegistry::ReporterNames() const {
  return RegisteredNames(reporters_);
}

const std::string &
ComponentRegistry::DefaultAdapterName(AnalyzerSource source) const {
  return Adapters(source).default_name;
}

const std::string &ComponentRegistry::DefaultReporterName() const {
  return reporters_.default_name;
}

ComponentRegistry MakeComponentRegistryWithDefaults() {
  ComponentRegistry registry;
  registry.RegisterAdapter(
      AnalyzerSource::kContent, kDefaultContentAdapter,
      [](const AdapterSettings &settings) -> std::shared_ptr<AnalyzerAdapter> {
        if (settings.brands.empty()) {
          return std::make_shared<HeuristicContentAnalyzer>();
        }
        return std::make_shared<HeuristicContentAnalyzer>(settings.brands);
      },
      true);
  registry.RegisterAdapter(
      AnalyzerSource::kVisual, kDefaultVisualAdapter,
      [](const AdapterSettings &settings) {
        return std::make_shared<CommandVisualAnalyzer>(
            settings.classifier_command);
      },
      true);
  registry.RegisterAdapter(
      AnalyzerSource::kReputation, kDefaultReputationAdapter,
      [](const AdapterSettings &settings) {
        ReputationSettings reputation;
        reputation.blocklist = settings.blocklist;
        reputation.brands = settings.brands;
        return std::make_shared<DomainReputationAnalyzer>(
            std::move(reputation));
      },
      true);
  registry.RegisterReporter(
      kDefaultReporter, []() { return std::make_unique<StandardReporter>(); },
      true);
  return registry;
}

const ComponentRegistry &GlobalComponentRegistry() {
  static const ComponentRegistry registry = MakeComponentRegistryWithDefaults();
  return registry;
}

} // namespace sitecheck
