#include <qgate/template_service.h>

namespace qgate {
namespace {

[[noreturn]] void ThrowUnavailable(const std::string &operation) {
  throw NotImplementedError("Template " + operation +
                            " is not available in this build");
}

} // namespace

nlohmann::json UnavailableTemplateService::List(const nlohmann::json &) {
  ThrowUnavailable("listing");
}

nlohmann::json UnavailableTemplateService::Search(const nlohmann::json &) {
  ThrowUnavailable("search");
}

nlohmann::json UnavailableTemplateService::Generate(const nlohmann::json &) {
  ThrowUnavailable("generation");
}

nlohmann::json UnavailableTemplateService::Scaffold(const nlohmann::json &) {
  ThrowUnavailable("scaffolding");
}

nlohmann::json UnavailableTemplateService::Validate(const nlohmann::json &) {
  ThrowUnavailable("validation");
}

} // namespace qgate
