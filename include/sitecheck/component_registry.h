#pragma once

#include <sitecheck/interfaces.h>
#include <sitecheck/models.h>

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace sitecheck {

// Construction parameters handed to every adapter factory. Each factory takes
// what it needs and ignores the rest.
struct AdapterSettings {
  std::string classifier_command;
  std::vector<std::string> blocklist;
  std::vector<std::string> brands;
};

class ComponentRegistry {
public:
  using AdapterFactory = std::function<std::shared_ptr<AnalyzerAdapter>(
      const AdapterSettings &)>;
  using ReporterFactory = std::function<std::unique_ptr<Reporter>()>;

  void RegisterAdapter(AnalyzerSource source, const std::string &name,
                       AdapterFactory factory, bool set_as_default = false);
  void RegisterReporter(const std::string &name, ReporterFactory factory,
                        bool set_as_default = false);

  std::shared_ptr<AnalyzerAdapter>
  CreateAdapter(AnalyzerSource source, const std::string &name = "",
                const AdapterSettings &settings = {}) const;
  std::unique_ptr<Reporter> CreateReporter(const std::string &name = "") const;

  std::vector<std::string> AdapterNames(AnalyzerSource source) const;
  std::vector<std::string> ReporterNames() const;

  const std::string &DefaultAdapterName(AnalyzerSource source) const;
  const std::string &DefaultReporterName() const;

  template <typename Factory> struct ComponentSet {
    std::unordered_map<std::string, Factory> factories;
    std::string default_name;
  };

private:
  template <typename Factory>
  static std::vector<std::string>
  RegisteredNames(const ComponentSet<Factory> &set);

  template <typename Factory>
  static std::string JoinNames(const ComponentSet<Factory> &set);

  template <typename Factory>
  static const Factory &FindFactory(const std::string &name,
                                    const ComponentSet<Factory> &set,
                                    const std::string &kind,
                                    std::string &resolved_name);

  template <typename Factory>
  static void RegisterComponent(const std::string &name, Factory factory,
                                bool set_as_default,
                                ComponentSet<Factory> &set);

  const ComponentSet<AdapterFactory> &Adapters(AnalyzerSource source) const;
  ComponentSet<AdapterFactory> &Adapters(AnalyzerSource source);

  ComponentSet<AdapterFactory> content_adapters_;
  ComponentSet<AdapterFactory> visual_adapters_;
  ComponentSet<AdapterFactory> reputation_adapters_;
  ComponentSet<ReporterFactory> reporters_;
};

ComponentRegistry MakeComponentRegistryWithDefaults();
const ComponentRegistry &GlobalComponentRegistry();

} // namespace sitecheck
