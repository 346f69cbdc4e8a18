#pragma once

#include <qgate/report_formatters.h>
#include <qgate/template_service.h>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace qgate {

// Named factories for the pluggable pieces of the protocol layer. The first
// registration of a kind becomes its default until another one asks to be.
class ComponentRegistry {
public:
  using FormatterFactory = std::function<std::unique_ptr<ReportFormatter>()>;
  using TemplateServiceFactory =
      std::function<std::unique_ptr<TemplateService>()>;

  // Throws std::invalid_argument for an empty or taken name and a null
  // factory.
  void RegisterFormatter(const std::string &name, FormatterFactory factory,
                         bool set_as_default = false);
  void RegisterTemplateService(const std::string &name,
                               TemplateServiceFactory factory,
                               bool set_as_default = false);

  // An empty name picks the default. Unknown names throw
  // std::invalid_argument listing what is registered.
  std::unique_ptr<ReportFormatter>
  CreateFormatter(const std::string &name = "") const;
  std::unique_ptr<TemplateService>
  CreateTemplateService(const std::string &name = "") const;

  std::vector<std::string> FormatterNames() const;
  std::vector<std::string> TemplateServiceNames() const;

  const std::string &DefaultFormatterName() const { return default_formatter_; }
  const std::string &DefaultTemplateServiceName() const {
    return default_template_service_;
  }

private:
  std::map<std::string, FormatterFactory> formatters_;
  std::map<std::string, TemplateServiceFactory> template_services_;
  std::string default_formatter_;
  std::string default_template_service_;
};

// Formatters: summary (default), full, json, sarif, markdown,
// enforcement-json. Template services: unavailable (default).
ComponentRegistry MakeComponentRegistryWithDefaults();
const ComponentRegistry &GlobalComponentRegistry();

} // namespace qgate
