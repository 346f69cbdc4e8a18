#include <qgate/analysis_service.h>

#include <qgate/build_error_analyzer.h>
#include <qgate/churn_analyzer.h>
#include <qgate/complexity_analyzer.h>
#include <qgate/coverage.h>
#include <qgate/dead_code_analyzer.h>
#include <qgate/deep_context.h>
#include <qgate/lint_hotspot.h>
#include <qgate/satd_analyzer.h>
#include <qgate/strings.h>
#include <qgate/tdg_analyzer.h>

#include <chrono>
#include <stdexcept>
#include <utility>

namespace qgate {
namespace {

const nlohmann::json *Field(const nlohmann::json &body, const char *key) {
  const auto found = body.find(key);
  if (found == body.end() || found->is_null()) {
    return nullptr;
  }
  return &*found;
}

std::optional<std::string> StringField(const nlohmann::json &body,
                                       const char *key) {
  const auto *value = Field(body, key);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (!value->is_string()) {
    throw std::invalid_argument(std::string("Field '") + key +
                                "' must be a string");
  }
  return value->get<std::string>();
}

std::optional<bool> BoolField(const nlohmann::json &body, const char *key) {
  const auto *value = Field(body, key);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (value->is_boolean()) {
    return value->get<bool>();
  }
  if (value->is_string()) {
    const auto lowered = ToLower(value->get<std::string>());
    if (lowered == "true" || lowered == "1" || lowered == "yes") {
      return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no") {
      return false;
    }
  }
  throw std::invalid_argument(std::string("Field '") + key +
                              "' must be a boolean");
}

std::optional<double> NumberField(const nlohmann::json &body, const char *key) {
  const auto *value = Field(body, key);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (value->is_number()) {
    return value->get<double>();
  }
  if (value->is_string()) {
    try {
      std::size_t consumed = 0;
      const auto text = value->get<std::string>();
      const auto parsed = std::stod(text, &consumed);
      if (consumed == text.size()) {
        return parsed;
      }
    } catch (const std::logic_error &) {
      // reported below
    }
  }
  throw std::invalid_argument(std::string("Field '") + key +
                              "' must be a number");
}

std::optional<unsigned> CountField(const nlohmann::json &body, const char *key) {
  const auto value = NumberField(body, key);
  if (!value) {
    return std::nullopt;
  }
  if (*value < 0 || *value != static_cast<double>(static_cast<unsigned>(*value))) {
    throw std::invalid_argument(std::string("Field '") + key +
                                "' must be a non-negative integer");
  }
  return static_cast<unsigned>(*value);
}

std::vector<std::string> ListField(const nlohmann::json &body, const char *key) {
  const auto *value = Field(body, key);
  if (value == nullptr) {
    return {};
  }
  if (value->is_string()) {
    return SplitList(value->get<std::string>());
  }
  if (!value->is_array()) {
    throw std::invalid_argument(std::string("Field '") + key +
                                "' must be a list of strings");
  }
  std::vector<std::string> items;
  for (const auto &item : *value) {
    if (!item.is_string()) {
      throw std::invalid_argument(std::string("Field '") + key +
                                  "' must be a list of strings");
    }
    items.push_back(item.get<std::string>());
  }
  return items;
}

} // namespace

AnalysisRequest ParseAnalysisRequest(const nlohmann::json &body) {
  if (!body.is_object()) {
    throw std::invalid_argument("Analysis request must be a JSON object");
  }
  AnalysisRequest request;
  if (const auto path = StringField(body, "project_path")) {
    request.project_path = *path;
  }
  request.format = StringField(body, "format");
  if (const auto toolchain = StringField(body, "toolchain")) {
    request.toolchain = ParseToolchain(*toolchain);
  }
  request.include_patterns = ListField(body, "include");
  request.exclude_patterns = ListField(body, "exclude");
  if (const auto ignore = StringField(body, "ignore_file")) {
    request.ignore_file = *ignore;
  }
  if (const auto cache = StringField(body, "cache_dir")) {
    request.cache_dir = *cache;
  }
  if (const auto top = CountField(body, "top_files")) {
    request.top_files = *top;
  }
  if (const auto threshold = CountField(body, "threshold")) {
    request.threshold = *threshold;
  }
  if (const auto days = CountField(body, "period_days")) {
    request.period_days = *days;
  }
  request.strict_only = BoolField(body, "strict").value_or(false);
  request.include_tests = BoolField(body, "include_tests").value_or(false);
  if (const auto lines = CountField(body, "min_dead_lines")) {
    request.min_dead_lines = *lines;
  }
  if (const auto coverage = NumberField(body, "coverage_min")) {
    request.coverage_min = *coverage;
  }
  if (const auto density = NumberField(body, "max_density")) {
    request.max_density = *density;
  }
  if (const auto parallelism = CountField(body, "parallelism")) {
    request.parallelism = *parallelism;
  }
  return request;
}

const std::vector<std::string> &AnalysisKinds() {
  static const std::vector<std::string> kinds = {
      "complexity", "churn",        "dead-code",
      "satd",       "deep-context", "tdg",
      "lint-hotspot", "coverage",   "defect-prediction",
      "comprehensive"};
  return kinds;
}

AnalysisService::AnalysisService(std::shared_ptr<ProcessRunner> runner,
                                 ExecutionContext base_context,
                                 std::shared_ptr<Logger> logger,
                                 const ComponentRegistry *components)
    : runner_(std::move(runner)), base_context_(std::move(base_context)),
      logger_(EnsureLogger(std::move(logger))),
      components_(components != nullptr ? components
                                        : &GlobalComponentRegistry()) {
  if (!runner_) {
    runner_ = std::make_shared<PosixProcessRunner>(logger_);
  }
}

SourceSet AnalysisService::Discover(const AnalysisRequest &request) const {
  auto project_path = request.project_path;
  if (project_path.is_relative() && !base_context_.cwd.empty()) {
    project_path = base_context_.cwd / project_path;
  }
  const auto root = ResolveProjectRoot(project_path);
  const auto filters = BuildSelectionFilters(
      request.include_patterns, request.exclude_patterns, request.ignore_file);
  DiscoveryOptions options;
  options.toolchain = request.toolchain;
  options.include_patterns = filters.include_patterns;
  options.exclude_patterns = filters.exclude_patterns;
  return SourceDiscovery(logger_).Discover(root, options);
}

ExecutionContext AnalysisService::ContextFor(const AnalysisRequest &request,
                                             const SourceSet &sources) const {
  auto context = base_context_;
  if (request.cache_dir) {
    context.cache_dir = request.cache_dir->is_absolute()
                            ? *request.cache_dir
                            : context.cwd / *request.cache_dir;
  } else {
    context.cache_dir = sources.root / ".qgate_cache";
  }
  return context;
}

AnalysisDocument AnalysisService::Analyze(const std::string &kind,
                                          const AnalysisRequest &request) const {
  const auto now = std::chrono::system_clock::now();
  const auto sources = Discover(request);
  const auto context = ContextFor(request, sources);
  logger_->Log(LogLevel::kInfo, "analysis.start",
               {{"kind", kind},
                {"root", sources.root.string()},
                {"files", std::to_string(sources.files.size())}});

  ComplexityOptions complexity_options;
  complexity_options.threshold = request.threshold;
  complexity_options.parallelism = request.parallelism;
  ChurnOptions churn_options;
  churn_options.period_days = request.period_days;
  DeepContextOptions context_options;
  context_options.complexity_threshold = request.threshold;
  context_options.top_files = request.top_files;
  context_options.parallelism = request.parallelism;
  context_options.churn = churn_options;
  EnforcementOptions enforcement;
  enforcement.max_density = request.max_density;

  const auto lint = [&]() {
    LintHotspotAnalyzer analyzer(
        std::make_unique<ClippyLintSource>(runner_, logger_),
        std::make_shared<BuildErrorAnalyzer>(runner_, logger_), logger_);
    return analyzer.Analyze(sources, context);
  };
  const auto deep_context = [&]() {
    return DeepContextBuilder(runner_, context_options, logger_)
        .Build(sources, context);
  };

  if (kind == "complexity") {
    const auto report = ComplexityAnalyzer(complexity_options, logger_).Analyze(sources);
    return ComplexityDocument(report, request.threshold, request.top_files, now);
  }
  if (kind == "churn") {
    return ChurnDocument(
        ChurnAnalyzer(runner_, churn_options, logger_).Analyze(sources, context),
        now);
  }
  if (kind == "dead-code") {
    DeadCodeOptions options;
    options.include_tests = request.include_tests;
    options.min_dead_lines = request.min_dead_lines;
    options.top_files = request.top_files;
    options.parallelism = request.parallelism;
    return DeadCodeDocument(DeadCodeAnalyzer(options, logger_).Analyze(sources),
                            now);
  }
  if (kind == "satd") {
    SatdOptions options;
    options.strict_only = request.strict_only;
    options.parallelism = request.parallelism;
    return SatdDocument(SatdAnalyzer(options, logger_).Analyze(sources), now);
  }
  if (kind == "tdg") {
    const auto complexity =
        ComplexityAnalyzer(complexity_options, logger_).Analyze(sources);
    const auto churn =
        ChurnAnalyzer(runner_, churn_options, logger_).Analyze(sources, context);
    const auto satd = SatdAnalyzer({}, logger_).Analyze(sources);
    auto violations = lint().all_violations;
    for (auto &violation : SatdViolations(satd)) {
      violations.push_back(std::move(violation));
    }
    TdgOptions options;
    options.complexity_threshold = request.threshold;
    return TdgDocument(ComputeTdg(complexity, churn, satd, violations, options),
                       now);
  }
  if (kind == "lint-hotspot") {
    return LintHotspotDocument(lint(), enforcement, now);
  }
  if (kind == "coverage") {
    CoverageSampler sampler(runner_, {}, logger_);
    return CoverageDocument(sampler.MeasureProject(sources, context),
                            request.coverage_min, now);
  }
  if (kind == "deep-context") {
    return DeepContextDocument(deep_context(), request.top_files);
  }
  if (kind == "defect-prediction") {
    return DefectPredictionDocument(deep_context());
  }
  if (kind == "comprehensive") {
    return ComprehensiveDocument(deep_context(), lint(), enforcement,
                                 request.top_files);
  }
  throw std::invalid_argument("Unsupported analysis: " + kind);
}

UnifiedResponse
AnalysisService::Render(const AnalysisDocument &document,
                        const std::optional<std::string> &format) const {
  const auto formatter = components_->CreateFormatter(format.value_or(""));
  return TextResponse(formatter->Render(document), formatter->ContentType());
}

UnifiedResponse AnalysisService::Handle(const std::string &kind,
                                        const UnifiedRequest &request) const {
  const auto parsed = ParseAnalysisRequest(request.JsonBody());
  return Render(Analyze(kind, parsed), parsed.format);
}

} // namespace qgate
