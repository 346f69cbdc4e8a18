#include <qgate/component_registry.h>

#include <stdexcept>
#include <utility>

namespace qgate {
namespace {

template <typename Factory>
void AddFactory(std::map<std::string, Factory> &factories,
                std::string &default_name, const std::string &name,
                Factory factory, bool set_as_default) {
  if (name.empty()) {
    throw std::invalid_argument("Component name cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Factory for '" + name + "' cannot be null");
  }
  if (!factories.emplace(name, std::move(factory)).second) {
    throw std::invalid_argument("'" + name + "' is already registered");
  }
  if (set_as_default || default_name.empty()) {
    default_name = name;
  }
}

template <typename Factory>
std::vector<std::string> NamesOf(const std::map<std::string, Factory> &factories) {
  std::vector<std::string> names;
  for (const auto &[name, factory] : factories) {
    names.push_back(name);
  }
  return names;
}

template <typename Factory>
auto Instantiate(const std::map<std::string, Factory> &factories,
                 const std::string &default_name, const std::string &name,
                 const std::string &kind) {
  const auto &wanted = name.empty() ? default_name : name;
  const auto found = factories.find(wanted);
  if (found == factories.end()) {
    std::string registered;
    for (const auto &known : NamesOf(factories)) {
      registered += registered.empty() ? known : ", " + known;
    }
    throw std::invalid_argument("Unknown " + kind + " '" + wanted +
                                "'. Registered: " + registered);
  }
  auto instance = found->second();
  if (!instance) {
    throw std::runtime_error("Factory for " + kind + " '" + wanted +
                             "' returned null");
  }
  return instance;
}

} // namespace

void ComponentRegistry::RegisterFormatter(const std::string &name,
                                          FormatterFactory factory,
                                          bool set_as_default) {
  AddFactory(formatters_, default_formatter_, name, std::move(factory),
             set_as_default);
}

void ComponentRegistry::RegisterTemplateService(const std::string &name,
                                                TemplateServiceFactory factory,
                                                bool set_as_default) {
  AddFactory(template_services_, default_template_service_, name,
             std::move(factory), set_as_default);
}

std::unique_ptr<ReportFormatter>
ComponentRegistry::CreateFormatter(const std::string &name) const {
  return Instantiate(formatters_, default_formatter_, name, "format");
}

std::unique_ptr<TemplateService>
ComponentRegistry::CreateTemplateService(const std::string &name) const {
  return Instantiate(template_services_, default_template_service_, name,
                     "template service");
}

std::vector<std::string> ComponentRegistry::FormatterNames() const {
  return NamesOf(formatters_);
}

std::vector<std::string> ComponentRegistry::TemplateServiceNames() const {
  return NamesOf(template_services_);
}

ComponentRegistry MakeComponentRegistryWithDefaults() {
  ComponentRegistry registry;
  registry.RegisterFormatter(
      "summary", []() { return std::make_unique<SummaryFormatter>(); }, true);
  registry.RegisterFormatter(
      "full", []() { return std::make_unique<FullFormatter>(); });
  registry.RegisterFormatter(
      "json", []() { return std::make_unique<JsonFormatter>(); });
  registry.RegisterFormatter(
      "sarif", []() { return std::make_unique<SarifFormatter>(); });
  registry.RegisterFormatter(
      "markdown", []() { return std::make_unique<MarkdownFormatter>(); });
  registry.RegisterFormatter("enforcement-json", []() {
    return std::make_unique<EnforcementJsonFormatter>();
  });
  registry.RegisterTemplateService(
      "unavailable",
      []() { return std::make_unique<UnavailableTemplateService>(); });
  return registry;
}

const ComponentRegistry &GlobalComponentRegistry() {
  static const ComponentRegistry registry = MakeComponentRegistryWithDefaults();
  return registry;
}

} // namespace qgate
