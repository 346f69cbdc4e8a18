#include <qgate/lint_hotspot.h>

#include <qgate/json_codec.h>
#include <qgate/source_scanner.h>
#include <qgate/strings.h>
#include <qgate/toolchain_commands.h>

#include <algorithm>
#include <set>
#include <tuple>

namespace qgate {
namespace {

std::optional<std::string> ProjectRelative(const std::string &file_name,
                                           const std::filesystem::path &root) {
  std::filesystem::path path(file_name);
  if (path.is_absolute()) {
    const auto relative = path.lexically_relative(root);
    if (relative.empty() || StartsWith(relative.generic_string(), "..")) {
      return std::nullopt;
    }
    return relative.generic_string();
  }
  const auto normal = path.lexically_normal().generic_string();
  if (StartsWith(normal, "..")) {
    return std::nullopt;
  }
  return normal;
}

const nlohmann::json *PrimarySpan(const nlohmann::json &spans) {
  if (!spans.is_array() || spans.empty()) {
    return nullptr;
  }
  for (const auto &span : spans) {
    if (span.value("is_primary", false)) {
      return &span;
    }
  }
  return spans.size() == 1 ? &spans.front() : nullptr;
}

void ReadSuggestion(const nlohmann::json &span, ViolationDetail &violation) {
  const auto replacement = span.find("suggested_replacement");
  if (replacement != span.end() && replacement->is_string() &&
      !violation.suggestion) {
    violation.suggestion = replacement->get<std::string>();
  }
  const auto applicability = span.find("suggestion_applicability");
  if (applicability != span.end() && applicability->is_string() &&
      applicability->get<std::string>() == "MachineApplicable") {
    violation.machine_applicable = true;
  }
}

double AutomationConfidence(const std::vector<std::pair<std::string, unsigned>>
                                &top_lints) {
  for (const auto &lint : top_lints) {
    if (Contains(lint.first, "unused") || Contains(lint.first, "redundant")) {
      return 0.9;
    }
  }
  return 0.7;
}

std::vector<std::pair<std::string, unsigned>>
TopLints(const std::vector<ViolationDetail> &violations) {
  std::map<std::string, unsigned> counts;
  for (const auto &violation : violations) {
    ++counts[violation.lint_name];
  }
  std::vector<std::pair<std::string, unsigned>> ranked(counts.begin(),
                                                       counts.end());
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const auto &left, const auto &right) {
                     return left.second > right.second;
                   });
  if (ranked.size() > 10) {
    ranked.resize(10);
  }
  return ranked;
}

std::map<std::string, unsigned>
CountSloc(const std::vector<ViolationDetail> &violations,
          const SourceSet &sources) {
  std::map<std::string, unsigned> sloc;
  for (const auto &violation : violations) {
    if (sloc.count(violation.file) != 0) {
      continue;
    }
    try {
      sloc[violation.file] = CountLogicalLines(
          ReadFile(sources.root / violation.file),
          ToolchainForPath(violation.file).value_or(sources.toolchain));
    } catch (const std::runtime_error &) {
      sloc[violation.file] = 0;
    }
  }
  return sloc;
}

} // namespace

std::vector<ViolationDetail>
ParseClippyMessages(const std::string &output,
                    const std::filesystem::path &root) {
  std::vector<ViolationDetail> violations;
  for (const auto &line : SplitLines(output)) {
    if (Trim(line).empty() || line.front() != '{') {
      continue;
    }
    const auto record = nlohmann::json::parse(line, nullptr, false);
    if (record.is_discarded() || record.value("reason", "") != "compiler-message") {
      continue;
    }
    const auto message = record.find("message");
    if (message == record.end() || !message->is_object()) {
      continue;
    }
    const auto *span = PrimarySpan(message->value("spans", nlohmann::json()));
    if (span == nullptr) {
      continue;
    }
    const auto file = ProjectRelative(span->value("file_name", ""), root);
    if (!file) {
      continue;
    }
    ViolationDetail violation;
    violation.file = *file;
    violation.line = span->value("line_start", 0u);
    violation.column = span->value("column_start", 0u);
    violation.end_line = span->value("line_end", violation.line);
    violation.end_column = span->value("column_end", violation.column);
    violation.message = message->value("message", "");
    const auto level = message->value("level", "warning");
    violation.severity = ParseSeverity(level);
    const auto code = message->find("code");
    if (code != message->end() && code->is_object() &&
        code->value("code", nlohmann::json()).is_string()) {
      violation.lint_name = code->at("code").get<std::string>();
    } else {
      violation.lint_name =
          violation.severity == Severity::kError ? "compilation_error" : "unknown";
    }
    ReadSuggestion(*span, violation);
    const auto children = message->find("children");
    if (children != message->end() && children->is_array()) {
      for (const auto &child : *children) {
        for (const auto &child_span : child.value("spans", nlohmann::json::array())) {
          ReadSuggestion(child_span, violation);
        }
        if (!violation.suggestion && child.value("level", "") == "help") {
          const auto help = child.value("message", "");
          if (!help.empty()) {
            violation.suggestion = help;
          }
        }
      }
    }
    violations.push_back(std::move(violation));
  }
  return violations;
}

LintHotspotResult
AggregateLintViolations(std::vector<ViolationDetail> violations,
                        const std::map<std::string, unsigned> &sloc_by_file) {
  std::sort(violations.begin(), violations.end(),
            [](const ViolationDetail &left, const ViolationDetail &right) {
              return std::tie(left.file, left.line, left.column,
                              left.lint_name) <
                     std::tie(right.file, right.line, right.column,
                              right.lint_name);
            });
  LintHotspotResult result;
  result.total_project_violations = static_cast<unsigned>(violations.size());
  for (const auto &violation : violations) {
    ++result.summary_by_file[violation.file].total_violations;
  }
  for (auto &entry : result.summary_by_file) {
    const auto found = sloc_by_file.find(entry.first);
    const unsigned sloc =
        found == sloc_by_file.end() ? 1 : std::max(1u, found->second);
    entry.second.defect_density =
        static_cast<double>(entry.second.total_violations) / sloc;
    const bool better =
        !result.hotspot ||
        entry.second.defect_density > result.hotspot->defect_density ||
        (entry.second.defect_density == result.hotspot->defect_density &&
         entry.second.total_violations > result.hotspot->total_violations);
    if (better) {
      LintHotspot hotspot;
      hotspot.file = entry.first;
      hotspot.defect_density = entry.second.defect_density;
      hotspot.total_violations = entry.second.total_violations;
      hotspot.sloc = sloc;
      result.hotspot = hotspot;
    }
  }
  if (result.hotspot) {
    for (const auto &violation : violations) {
      if (violation.file == result.hotspot->file) {
        result.hotspot->violations.push_back(violation);
      }
    }
  }
  result.all_violations = std::move(violations);
  return result;
}

nlohmann::json RenderEnforcementJson(const LintHotspotResult &result,
                                     const EnforcementOptions &options) {
  nlohmann::json document = result;
  if (!result.hotspot) {
    document["enforcement"] = nullptr;
    document["quality_gate"] = {{"passed", true},
                                {"blocking", false},
                                {"violations", nlohmann::json::array()}};
    document["refactor_chain"] = nullptr;
    return document;
  }

  const auto &hotspot = *result.hotspot;
  const auto top_lints = TopLints(hotspot.violations);
  // Density per 100 lines drives a 0-10 score.
  const double score = std::min(hotspot.defect_density * 100.0, 10.0);
  const double confidence = AutomationConfidence(top_lints);
  const bool requires_enforcement =
      score >= 7.0 && confidence >= options.min_confidence;
  document["enforcement"] = {
      {"score", score},
      {"requires_enforcement", requires_enforcement},
      {"target_density", options.max_density},
      {"estimated_fix_time", hotspot.total_violations * 300},
      {"automation_confidence", confidence},
      {"priority", std::max(1, static_cast<int>(score))}};

  nlohmann::json gate_violations = nlohmann::json::array();
  if (hotspot.defect_density > options.max_density) {
    gate_violations.push_back({{"rule", "max_defect_density"},
                               {"threshold", options.max_density},
                               {"actual", hotspot.defect_density},
                               {"severity", "blocking"}});
  }
  if (hotspot.total_violations > options.max_single_file_violations) {
    gate_violations.push_back(
        {{"rule", "max_single_file_violations"},
         {"threshold", options.max_single_file_violations},
         {"actual", hotspot.total_violations},
         {"severity", "warning"}});
  }
  bool blocking = false;
  for (const auto &violation : gate_violations) {
    blocking = blocking || violation["severity"] == "blocking";
  }
  document["quality_gate"] = {{"passed", gate_violations.empty()},
                              {"blocking", blocking},
                              {"violations", gate_violations}};

  if (!requires_enforcement) {
    document["refactor_chain"] = nullptr;
    return document;
  }
  nlohmann::json steps = nlohmann::json::array();
  unsigned reduction = 0;
  double confidence_sum = 0.0;
  for (const auto &lint : top_lints) {
    double step_confidence = 0.70;
    std::string description = "Apply clippy suggestion";
    if (Contains(lint.first, "unused")) {
      step_confidence = 0.95;
      description = "Remove unused code";
    } else if (Contains(lint.first, "redundant")) {
      step_confidence = 0.90;
      description = "Remove redundant code";
    } else if (Contains(lint.first, "needless")) {
      step_confidence = 0.85;
      description = "Simplify needless patterns";
    } else if (Contains(lint.first, "too_many_arguments")) {
      step_confidence = 0.80;
      description = "Extract context objects";
    }
    if (step_confidence < options.min_confidence) {
      continue;
    }
    steps.push_back({{"id", "fix-" + lint.first},
                     {"lint", lint.first},
                     {"confidence", step_confidence},
                     {"impact", lint.second},
                     {"description", description}});
    reduction += lint.second;
    confidence_sum += step_confidence;
  }
  document["refactor_chain"] = {
      {"id", "lint-hotspot-" + hotspot.file},
      {"estimated_reduction", reduction},
      {"automation_confidence",
       steps.empty() ? 0.0 : confidence_sum / static_cast<double>(steps.size())},
      {"steps", steps}};
  return document;
}

std::optional<LintHotspotResult> ParseEnforcementJson(const std::string &text) {
  const auto trimmed = Trim(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  // Tolerate log lines ahead of the document.
  const auto start = trimmed.find('{');
  if (start == std::string::npos) {
    return std::nullopt;
  }
  const auto document = nlohmann::json::parse(trimmed.substr(start), nullptr, false);
  if (document.is_discarded() || !document.is_object() ||
      !document.contains("total_project_violations")) {
    return std::nullopt;
  }
  try {
    LintHotspotResult result;
    result.total_project_violations =
        document.at("total_project_violations").get<unsigned>();
    ReadOptionalField(document, "all_violations", result.all_violations);
    const auto summary = document.find("summary_by_file");
    if (summary != document.end() && summary->is_object()) {
      for (const auto &entry : summary->items()) {
        FileSummary file;
        file.defect_density = entry.value().value("defect_density", 0.0);
        file.total_violations = entry.value().value("total_violations", 0u);
        result.summary_by_file[entry.key()] = file;
      }
    }
    const auto hotspot = document.find("hotspot");
    if (hotspot != document.end() && hotspot->is_object()) {
      LintHotspot parsed;
      parsed.file = hotspot->at("file").get<std::string>();
      parsed.defect_density = hotspot->value("defect_density", 0.0);
      parsed.total_violations = hotspot->value("total_violations", 0u);
      parsed.sloc = hotspot->value("sloc", 0u);
      ReadOptionalField(*hotspot, "violations", parsed.violations);
      result.hotspot = std::move(parsed);
    }
    return result;
  } catch (const nlohmann::json::exception &) {
    return std::nullopt;
  }
}

ClippyLintSource::ClippyLintSource(std::shared_ptr<ProcessRunner> runner,
                                   std::shared_ptr<Logger> logger)
    : runner_(std::move(runner)), logger_(EnsureLogger(std::move(logger))) {
  if (!runner_) {
    throw std::invalid_argument("ClippyLintSource requires a process runner");
  }
}

std::optional<LintHotspotResult>
ClippyLintSource::Collect(const SourceSet &sources,
                          const ExecutionContext &context) {
  const auto command = LintCommand(sources.toolchain, sources.root);
  if (!command) {
    logger_->Log(LogLevel::kDebug, "lint.unsupported",
                 {{"toolchain", ToolchainName(sources.toolchain)}});
    return LintHotspotResult{};
  }
  const auto result = runner_->Run(*command, context);
  if (!result.launched || result.cancelled) {
    return std::nullopt;
  }
  auto violations = ParseClippyMessages(result.stdout_text, sources.root);
  if (result.exit_code != 0 && violations.empty()) {
    logger_->Log(LogLevel::kWarn, "lint.failed",
                 {{"exit_code", std::to_string(result.exit_code)}});
    return std::nullopt;
  }
  const auto sloc = CountSloc(violations, sources);
  return AggregateLintViolations(std::move(violations), sloc);
}

SelfInvokingLintSource::SelfInvokingLintSource(
    std::shared_ptr<ProcessRunner> runner, std::filesystem::path executable,
    std::shared_ptr<Logger> logger)
    : runner_(std::move(runner)), executable_(std::move(executable)),
      logger_(EnsureLogger(std::move(logger))) {
  if (!runner_) {
    throw std::invalid_argument(
        "SelfInvokingLintSource requires a process runner");
  }
}

std::optional<LintHotspotResult>
SelfInvokingLintSource::Collect(const SourceSet &sources,
                                const ExecutionContext &context) {
  ProcessRequest request;
  request.program = executable_.string();
  request.arguments = {"analyze",        "lint-hotspot",
                       "--project-path", sources.root.string(),
                       "--toolchain",    ToolchainName(sources.toolchain),
                       "--format",       "enforcement-json"};
  request.working_directory = sources.root;
  const auto result = runner_->Run(request, context);
  if (!result.launched || result.cancelled) {
    return std::nullopt;
  }
  auto parsed = ParseEnforcementJson(result.stdout_text);
  if (!parsed) {
    logger_->Log(LogLevel::kWarn, "lint.self_invocation.unparseable",
                 {{"exit_code", std::to_string(result.exit_code)},
                  {"stderr", Trim(result.stderr_text)}});
  }
  return parsed;
}

LintHotspotAnalyzer::LintHotspotAnalyzer(
    std::unique_ptr<LintSource> source,
    std::shared_ptr<BuildErrorAnalyzer> fallback,
    std::shared_ptr<Logger> logger)
    : source_(std::move(source)), fallback_(std::move(fallback)),
      logger_(EnsureLogger(std::move(logger))) {
  if (!source_) {
    throw std::invalid_argument("LintHotspotAnalyzer requires a lint source");
  }
}

LintHotspotResult LintHotspotAnalyzer::Analyze(const SourceSet &sources,
                                               const ExecutionContext &context) {
  auto collected = source_->Collect(sources, context);
  if (!collected && fallback_) {
    logger_->Log(LogLevel::kWarn, "lint.fallback",
                 {{"reason", "lint output unavailable"},
                  {"fallback", "compiler diagnostics"}});
    collected = BuildErrorsAsHotspot(fallback_->Analyze(sources, context),
                                     sources.root, sources.toolchain);
  }
  if (!collected) {
    return LintHotspotResult{};
  }

  // Only files that survived discovery and filtering count.
  const std::set<std::string> eligible(sources.files.begin(),
                                       sources.files.end());
  std::vector<ViolationDetail> kept;
  for (auto &violation : collected->all_violations) {
    if (eligible.count(violation.file) == 0) {
      continue;
    }
    kept.push_back(std::move(violation));
  }
  const auto sloc = CountSloc(kept, sources);
  auto result = AggregateLintViolations(std::move(kept), sloc);
  logger_->Log(LogLevel::kDebug, "analyzer.complete",
               {{"analyzer", "lint-hotspot"},
                {"violations", std::to_string(result.total_project_violations)},
                {"hotspot", result.hotspot ? result.hotspot->file : ""}});
  return result;
}

} // namespace qgate
