#include <qgate/protocol_handlers.h>

#include <qgate/builtin_rewriter.h>
#include <qgate/measurement_pipeline.h>
#include <qgate/protocol_adapters.h>
#include <qgate/source_discovery.h>
#include <qgate/strings.h>
#include <qgate/template_service.h>

#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace qgate {
namespace {

std::optional<std::string> OptionalString(const nlohmann::json &body,
                                          const char *key) {
  const auto found = body.find(key);
  if (found == body.end() || found->is_null()) {
    return std::nullopt;
  }
  if (!found->is_string()) {
    throw std::invalid_argument(std::string("Field '") + key +
                                "' must be a string");
  }
  return found->get<std::string>();
}

bool OptionalBool(const nlohmann::json &body, const char *key) {
  const auto found = body.find(key);
  if (found == body.end() || found->is_null()) {
    return false;
  }
  if (!found->is_boolean()) {
    throw std::invalid_argument(std::string("Field '") + key +
                                "' must be a boolean");
  }
  return found->get<bool>();
}

template <typename T>
void ReadNumber(const nlohmann::json &body, const char *key, T &target) {
  const auto found = body.find(key);
  if (found == body.end() || found->is_null()) {
    return;
  }
  if (!found->is_number() ||
      (std::is_unsigned_v<T> && found->get<double>() < 0)) {
    throw std::invalid_argument(std::string("Field '") + key +
                                "' must be a non-negative number");
  }
  target = found->get<T>();
}

std::filesystem::path Resolve(const ExecutionContext &base,
                              const std::filesystem::path &path) {
  return path.is_relative() && !base.cwd.empty() ? base.cwd / path : path;
}

RefactorMode ParseMode(const nlohmann::json &body) {
  const auto file = OptionalString(body, "file");
  const bool single = OptionalBool(body, "single_file_mode");
  const auto test_file = OptionalString(body, "test_file");
  const auto issue = OptionalString(body, "github_issue_url");
  const auto bug = OptionalString(body, "bug_report_path");

  const int selected = ((single || file) ? 1 : 0) + (test_file ? 1 : 0) +
                       (issue ? 1 : 0) + (bug ? 1 : 0);
  if (selected > 1) {
    throw std::invalid_argument(
        "Only one of --file, --test-file, --github-issue-url and "
        "--bug-report-path may be given");
  }
  if (single && !file) {
    throw std::invalid_argument("--file is required with --single-file-mode");
  }
  if (file) {
    return SingleFileMode{*file};
  }
  if (test_file) {
    return TestDrivenMode{*test_file, OptionalString(body, "test_name")};
  }
  if (OptionalString(body, "test_name")) {
    throw std::invalid_argument("--test-name requires --test-file");
  }
  if (issue) {
    return IssueDrivenMode{*issue};
  }
  if (bug) {
    return BugReportMode{*bug};
  }
  return NormalMode{};
}

std::vector<std::string> StringList(const nlohmann::json &body, const char *key) {
  const auto found = body.find(key);
  if (found == body.end() || found->is_null()) {
    return {};
  }
  if (found->is_string()) {
    return SplitList(found->get<std::string>());
  }
  if (!found->is_array()) {
    throw std::invalid_argument(std::string("Field '") + key +
                                "' must be a list of strings");
  }
  std::vector<std::string> items;
  for (const auto &item : *found) {
    if (!item.is_string()) {
      throw std::invalid_argument(std::string("Field '") + key +
                                  "' must be a list of strings");
    }
    items.push_back(item.get<std::string>());
  }
  return items;
}

nlohmann::json TemplateFilters(const UnifiedRequest &request) {
  auto filters = request.JsonBody();
  const auto query = request.extensions.find("query");
  if (query != request.extensions.end() && query->is_object()) {
    for (const auto &entry : query->items()) {
      filters[entry.key()] = entry.value();
    }
  }
  return filters;
}

nlohmann::json ToolListJson() {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto &tool : McpTools()) {
    tools.push_back({{"name", tool.name},
                     {"description", tool.description},
                     {"inputSchema", {{"type", "object"}}}});
  }
  return {{"tools", std::move(tools)}};
}

UnifiedResponse DispatchTool(const ProtocolHandlerRegistry &registry,
                             const UnifiedRequest &request, const McpTool &tool,
                             const nlohmann::json &arguments) {
  auto inner = request;
  inner.method = tool.route.method;
  inner.path = tool.route.path;
  inner.body = arguments.is_null() ? std::string("{}") : arguments.dump();
  return registry.Handle(inner);
}

} // namespace

RefactorRequest ParseRefactorRequest(const nlohmann::json &body,
                                     const ExecutionContext &base) {
  if (!body.is_object()) {
    throw std::invalid_argument("Refactor request must be a JSON object");
  }
  RefactorRequest request;
  auto &config = request.config;
  config.project_path =
      Resolve(base, OptionalString(body, "project_path").value_or("."));
  config.context = base;
  if (const auto cache = OptionalString(body, "cache_dir")) {
    config.context.cache_dir = Resolve(base, *cache);
  } else {
    config.context.cache_dir = config.project_path / ".qgate_cache";
  }
  ReadNumber(body, "max_iterations", config.max_iterations);
  config.dry_run = OptionalBool(body, "dry_run");
  config.ci_mode = OptionalBool(body, "ci_mode");
  if (body.contains("resume") && !body["resume"].is_null()) {
    config.resume = OptionalBool(body, "resume");
  }

  const auto profile = OptionalString(body, "quality_profile").value_or("extreme");
  if (ToLower(profile) != "extreme") {
    throw std::invalid_argument("Unknown quality profile: " + profile +
                                " (supported: extreme)");
  }
  config.profile = ExtremeQualityProfile();
  ReadNumber(body, "coverage_min", config.profile.coverage_min);
  ReadNumber(body, "complexity_max", config.profile.complexity_max);
  ReadNumber(body, "complexity_target", config.profile.complexity_target);
  ReadNumber(body, "satd_allowed", config.profile.satd_allowed);

  std::optional<std::filesystem::path> ignore_file;
  if (const auto ignore = OptionalString(body, "ignore_file")) {
    ignore_file = Resolve(base, *ignore);
  }
  config.filters = BuildSelectionFilters(StringList(body, "include"),
                                         StringList(body, "exclude"),
                                         ignore_file);
  if (const auto toolchain = OptionalString(body, "toolchain")) {
    config.toolchain = ParseToolchain(*toolchain);
  }
  ReadNumber(body, "parallelism", request.parallelism);
  if (const auto templates = OptionalString(body, "rewrite_templates")) {
    request.rewrite_templates = Resolve(base, *templates);
  }
  request.mode = ParseMode(body);
  return request;
}

RefactorService::RefactorService(ServiceOptions options)
    : options_(std::move(options)) {
  options_.logger = EnsureLogger(std::move(options_.logger));
  if (!options_.runner) {
    options_.runner = std::make_shared<PosixProcessRunner>(options_.logger);
  }
}

OrchestratorComponents
RefactorService::DefaultComponents(const RefactorRequest &request,
                                   std::ostream *output) const {
  OrchestratorComponents components;
  components.runner = options_.runner;
  components.logger = options_.logger;
  components.output = output;

  MeasurementPipelineBuilder builder(options_.runner);
  builder.WithLogger(options_.logger)
      .WithProfile(request.config.profile)
      .WithParallelism(request.parallelism);
  if (options_.self_executable) {
    builder.WithSelfExecutable(*options_.self_executable);
  }
  components.pipeline =
      std::make_unique<QualityMeasurementPipeline>(builder.Build());

  std::vector<RewriteTemplate> templates;
  if (request.rewrite_templates) {
    templates = LoadRewriteTemplates(*request.rewrite_templates);
  }
  components.rewriter = std::make_unique<BuiltinRewriter>(
      options_.runner, std::move(templates), options_.logger);
  components.context_options.parallelism = request.parallelism;
  return components;
}

UnifiedResponse RefactorService::Handle(const UnifiedRequest &request) const {
  const auto parsed = ParseRefactorRequest(request.JsonBody(), options_.context);

  std::ostringstream transcript;
  std::ostream *output =
      options_.live_output != nullptr ? options_.live_output : &transcript;
  auto components = options_.orchestrator_factory
                        ? options_.orchestrator_factory(parsed)
                        : DefaultComponents(parsed, output);
  if (components.output == nullptr) {
    components.output = output;
  }

  RefactorOrchestrator orchestrator(std::move(components));
  const auto outcome = orchestrator.Run(parsed.config, parsed.mode);

  auto body = RefactorOutcomeJson(outcome);
  if (options_.live_output == nullptr) {
    body["transcript"] = transcript.str();
  }
  if (RefactorExitCode(outcome, parsed.config.ci_mode) != 0) {
    nlohmann::json failure = {
        {"error", "Quality gates not met: " + RefactorStatusName(outcome.status) +
                      " (" + outcome.message + ")"},
        {"error_type", "QUALITY_GATE_FAILED"},
        {"outcome", std::move(body)}};
    return JsonResponse(failure, 422);
  }
  return JsonResponse(body);
}

void RegisterQgateRoutes(ProtocolHandlerRegistry &registry,
                         ServiceOptions options) {
  options.logger = EnsureLogger(std::move(options.logger));
  if (!options.runner) {
    options.runner = std::make_shared<PosixProcessRunner>(options.logger);
  }
  const auto *components = options.components != nullptr
                               ? options.components
                               : &GlobalComponentRegistry();

  registry.Register("GET", "/health", [](const UnifiedRequest &) {
    return JsonResponse(
        {{"status", "healthy"}, {"service", "qgate"}, {"version", kQgateVersion}});
  });

  const auto analysis = std::make_shared<AnalysisService>(
      options.runner, options.context, options.logger, components);
  for (const auto &kind : AnalysisKinds()) {
    registry.Register("POST", "/api/v1/analyze/" + kind,
                      [analysis, kind](const UnifiedRequest &request) {
                        return analysis->Handle(kind, request);
                      });
  }

  registry.Register("GET", "/api/v1/templates",
                    [components](const UnifiedRequest &request) {
                      return JsonResponse(components->CreateTemplateService()->List(
                          TemplateFilters(request)));
                    });
  registry.Register("POST", "/api/v1/templates/search",
                    [components](const UnifiedRequest &request) {
                      return JsonResponse(components->CreateTemplateService()->Search(
                          request.JsonBody()));
                    });
  registry.Register("POST", "/api/v1/generate",
                    [components](const UnifiedRequest &request) {
                      return JsonResponse(
                          components->CreateTemplateService()->Generate(
                              request.JsonBody()));
                    });
  registry.Register("POST", "/api/v1/scaffold",
                    [components](const UnifiedRequest &request) {
                      return JsonResponse(
                          components->CreateTemplateService()->Scaffold(
                              request.JsonBody()));
                    });
  registry.Register("POST", "/api/v1/validate",
                    [components](const UnifiedRequest &request) {
                      return JsonResponse(
                          components->CreateTemplateService()->Validate(
                              request.JsonBody()));
                    });

  const auto refactor = std::make_shared<RefactorService>(options);
  registry.Register("POST", "/api/v1/refactor/auto",
                    [refactor](const UnifiedRequest &request) {
                      return refactor->Handle(request);
                    });

  registry.Register("POST", "/mcp/initialize", [](const UnifiedRequest &) {
    return JsonResponse({{"protocolVersion", "2024-11-05"},
                         {"serverInfo",
                          {{"name", "qgate"}, {"version", kQgateVersion}}},
                         {"capabilities", {{"tools", nlohmann::json::object()}}}});
  });
  registry.Register("POST", "/mcp/tools/list", [](const UnifiedRequest &) {
    return JsonResponse(ToolListJson());
  });
  const auto *self = &registry;
  registry.Register("POST", "/mcp/tools/call",
                    [self](const UnifiedRequest &request) {
                      const auto body = request.JsonBody();
                      const auto name = body.value("name", std::string());
                      const auto *tool = FindMcpTool(name);
                      if (tool == nullptr) {
                        return ErrorResponse(404, "Unknown tool: " + name,
                                             "NOT_FOUND");
                      }
                      const auto arguments = body.find("arguments");
                      return DispatchTool(*self, request, *tool,
                                          arguments == body.end()
                                              ? nlohmann::json(nullptr)
                                              : *arguments);
                    });
  for (const auto &tool : McpTools()) {
    registry.Register("POST", "/mcp/" + tool.name,
                      [self, &tool](const UnifiedRequest &request) {
                        return DispatchTool(*self, request, tool,
                                            request.JsonBody());
                      });
  }
}

std::shared_ptr<ProtocolHandlerRegistry> MakeQgateRegistry(ServiceOptions options) {
  auto registry = std::make_shared<ProtocolHandlerRegistry>(options.logger);
  RegisterQgateRoutes(*registry, std::move(options));
  return registry;
}

} // namespace qgate
