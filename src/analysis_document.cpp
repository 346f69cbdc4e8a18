#include <qgate/analysis_document.h>

#include <qgate/json_codec.h>
#include <qgate/strings.h>

#include <algorithm>

namespace qgate {
namespace {

std::string LevelFor(Severity severity) {
  switch (severity) {
  case Severity::kError:
    return "error";
  case Severity::kWarning:
    return "warning";
  case Severity::kNote:
  case Severity::kInfo:
    return "note";
  }
  return "warning";
}

std::string LevelFor(SatdSeverity severity) {
  switch (severity) {
  case SatdSeverity::kCritical:
  case SatdSeverity::kHigh:
    return "error";
  case SatdSeverity::kMedium:
    return "warning";
  case SatdSeverity::kLow:
    return "note";
  }
  return "note";
}

std::string Fixed(double value) { return FormatFixed(value, 2); }

std::vector<Finding> ComplexityFindings(const ComplexityReport &report,
                                        unsigned threshold) {
  std::vector<Finding> findings;
  for (const auto &file : report.files) {
    for (const auto &function : file.functions) {
      if (function.cyclomatic <= threshold) {
        continue;
      }
      findings.push_back(
          {"high_complexity",
           function.cyclomatic > 2 * threshold ? "error" : "warning",
           "Function '" + function.name + "' has cyclomatic complexity " +
               std::to_string(function.cyclomatic) + " (threshold " +
               std::to_string(threshold) + ")",
           file.path, function.line});
    }
  }
  return findings;
}

std::vector<Finding> SatdFindings(const SatdReport &report) {
  std::vector<Finding> findings;
  for (const auto &item : report.items) {
    findings.push_back({"satd_item", LevelFor(item.severity),
                        item.marker + ": " + item.text, item.file, item.line});
  }
  return findings;
}

std::vector<Finding> DeadCodeFindings(const DeadCodeReport &report) {
  std::vector<Finding> findings;
  for (const auto &file : report.files) {
    for (const auto &item : file.items) {
      findings.push_back(
          {"dead_code." + item.item_type,
           item.confidence == DeadCodeConfidence::kHigh ? "warning" : "note",
           item.reason + (item.name.empty() ? "" : ": " + item.name),
           file.path, item.line});
    }
  }
  return findings;
}

std::vector<Finding> LintFindings(const LintHotspotResult &result) {
  std::vector<Finding> findings;
  for (const auto &violation : result.all_violations) {
    findings.push_back({violation.lint_name, LevelFor(violation.severity),
                        violation.message, violation.file, violation.line});
  }
  return findings;
}

nlohmann::json FileChurnJson(const FileChurn &file) {
  return {{"path", file.path},
          {"commit_count", file.commit_count},
          {"unique_authors", file.unique_authors},
          {"additions", file.additions},
          {"deletions", file.deletions},
          {"last_modified", FormatIsoTimestamp(file.last_modified)},
          {"first_seen", FormatIsoTimestamp(file.first_seen)},
          {"churn_score", file.churn_score}};
}

nlohmann::json FileTdgJson(const FileTdg &file) {
  return {{"path", file.path},
          {"tdg", file.value},
          {"band", TdgBandName(file.band)},
          {"complexity_score", file.complexity_score},
          {"churn_factor", file.churn_factor},
          {"satd_weight", file.satd_weight},
          {"size_normalizer", file.size_normalizer},
          {"primary_factor", file.primary_factor}};
}

nlohmann::json PredictedDefectsJson(const DeepContext &context) {
  nlohmann::json defects = nlohmann::json::array();
  for (const auto &defect : context.predicted_defects) {
    defects.push_back({{"file", defect.file},
                       {"score", defect.score},
                       {"risk", defect.risk},
                       {"factors", defect.factors}});
  }
  return defects;
}

std::vector<Finding> DefectFindings(const DeepContext &context) {
  std::vector<Finding> findings;
  for (const auto &defect : context.predicted_defects) {
    const auto level = defect.risk == "high"     ? "error"
                       : defect.risk == "medium" ? "warning"
                                                 : "note";
    findings.push_back({"predicted_defect", level,
                        "Defect score " + Fixed(defect.score) + " (" +
                            defect.risk + " risk)",
                        defect.file, 1});
  }
  return findings;
}

} // namespace

nlohmann::json ComplexityReportJson(const ComplexityReport &report,
                                    std::size_t top_files) {
  const auto &summary = report.summary;
  nlohmann::json files = nlohmann::json::array();
  for (const auto &file : report.files) {
    files.push_back({{"path", file.path},
                     {"max_cyclomatic", file.max_cyclomatic},
                     {"max_cognitive", file.max_cognitive},
                     {"total_cyclomatic", file.total_cyclomatic},
                     {"logical_lines", file.logical_lines},
                     {"functions", file.functions}});
  }
  nlohmann::json top = nlohmann::json::array();
  for (const auto *file : report.TopFiles(top_files)) {
    top.push_back(file->path);
  }
  return {{"summary",
           {{"total_files", summary.total_files},
            {"total_functions", summary.total_functions},
            {"average_cyclomatic", summary.average_cyclomatic},
            {"max_cyclomatic", summary.max_cyclomatic},
            {"max_cognitive", summary.max_cognitive},
            {"p90_cyclomatic", summary.p90_cyclomatic},
            {"functions_over_threshold", summary.functions_over_threshold}}},
          {"top_files", top},
          {"files", files}};
}

nlohmann::json ChurnReportJson(const ChurnReport &report) {
  const auto &summary = report.summary;
  nlohmann::json files = nlohmann::json::array();
  for (const auto &file : report.files) {
    files.push_back(FileChurnJson(file));
  }
  return {{"summary",
           {{"period_days", summary.period_days},
            {"total_commits", summary.total_commits},
            {"total_files_changed", summary.total_files_changed},
            {"hotspot_files", summary.hotspot_files},
            {"stable_files", summary.stable_files},
            {"author_contributions", summary.author_contributions}}},
          {"files", files}};
}

nlohmann::json SatdReportJson(const SatdReport &report) {
  const auto &summary = report.summary;
  nlohmann::json items = nlohmann::json::array();
  for (const auto &item : report.items) {
    items.push_back({{"file", item.file},
                     {"line", item.line},
                     {"marker", item.marker},
                     {"text", item.text},
                     {"category", DebtCategoryName(item.category)},
                     {"severity", SatdSeverityName(item.severity)},
                     {"strict", item.strict}});
  }
  return {{"summary",
           {{"total_items", summary.total_items},
            {"strict_items", summary.strict_items},
            {"by_severity", summary.by_severity},
            {"by_category", summary.by_category},
            {"files_with_debt", summary.files_with_debt},
            {"critical_items", summary.critical_items}}},
          {"items", items}};
}

nlohmann::json DeadCodeReportJson(const DeadCodeReport &report) {
  const auto &summary = report.summary;
  nlohmann::json files = nlohmann::json::array();
  for (const auto &file : report.files) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto &item : file.items) {
      items.push_back({{"item_type", item.item_type},
                       {"name", item.name},
                       {"line", item.line},
                       {"reason", item.reason},
                       {"confidence", ConfidenceName(item.confidence)}});
    }
    files.push_back({{"path", file.path},
                     {"total_lines", file.total_lines},
                     {"dead_lines", file.dead_lines},
                     {"dead_percentage", file.dead_percentage},
                     {"dead_functions", file.dead_functions},
                     {"dead_classes", file.dead_classes},
                     {"dead_modules", file.dead_modules},
                     {"unreachable_blocks", file.unreachable_blocks},
                     {"confidence", ConfidenceName(file.confidence)},
                     {"items", items}});
  }
  return {{"summary",
           {{"total_files_analyzed", summary.total_files_analyzed},
            {"files_with_dead_code", summary.files_with_dead_code},
            {"total_dead_lines", summary.total_dead_lines},
            {"dead_percentage", summary.dead_percentage},
            {"dead_functions", summary.dead_functions},
            {"dead_classes", summary.dead_classes},
            {"dead_modules", summary.dead_modules},
            {"unreachable_blocks", summary.unreachable_blocks}}},
          {"files", files}};
}

nlohmann::json TdgReportJson(const TdgReport &report) {
  const auto &summary = report.summary;
  nlohmann::json files = nlohmann::json::array();
  for (const auto &file : report.files) {
    files.push_back(FileTdgJson(file));
  }
  nlohmann::json hotspots = nlohmann::json::array();
  for (const auto &file : summary.hotspots) {
    hotspots.push_back(FileTdgJson(file));
  }
  return {{"summary",
           {{"total_files", summary.total_files},
            {"critical_files", summary.critical_files},
            {"warning_files", summary.warning_files},
            {"average_tdg", summary.average_tdg},
            {"p95_tdg", summary.p95_tdg},
            {"estimated_debt_hours", summary.estimated_debt_hours},
            {"hotspots", hotspots}}},
          {"files", files}};
}

nlohmann::json DeepContextJson(const DeepContext &context,
                               std::size_t top_files) {
  nlohmann::json files = nlohmann::json::array();
  for (const auto &file : context.files) {
    files.push_back({{"path", file.path},
                     {"logical_lines", file.logical_lines},
                     {"functions", file.functions},
                     {"imports", file.imports},
                     {"structure_hash", file.structure_hash},
                     {"max_cyclomatic", file.max_cyclomatic},
                     {"max_cognitive", file.max_cognitive},
                     {"satd_items", file.satd_items},
                     {"dead_code_items", file.dead_code_items},
                     {"churn_score", file.churn_score},
                     {"commit_count", file.commit_count},
                     {"tdg", file.tdg},
                     {"defect_score", file.defect_score}});
  }
  nlohmann::json recommendations = nlohmann::json::array();
  for (const auto &recommendation : context.recommendations) {
    recommendations.push_back({{"priority", recommendation.priority},
                               {"title", recommendation.title},
                               {"file", recommendation.file},
                               {"rationale", recommendation.rationale}});
  }
  const auto &scorecard = context.scorecard;
  return {{"project", context.project_name},
          {"toolchain", ToolchainName(context.toolchain)},
          {"scorecard",
           {{"overall_health", scorecard.overall_health},
            {"complexity_score", scorecard.complexity_score},
            {"maintainability_index", scorecard.maintainability_index},
            {"satd_score", scorecard.satd_score},
            {"technical_debt_hours", scorecard.technical_debt_hours}}},
          {"files", files},
          {"complexity", ComplexityReportJson(context.complexity, top_files)},
          {"churn", ChurnReportJson(context.churn)},
          {"satd", SatdReportJson(context.satd)},
          {"dead_code", DeadCodeReportJson(context.dead_code)},
          {"tdg", TdgReportJson(context.tdg)},
          {"predicted_defects", PredictedDefectsJson(context)},
          {"recommendations", recommendations}};
}

AnalysisDocument
ComplexityDocument(const ComplexityReport &report, unsigned threshold,
                   std::size_t top_files,
                   std::chrono::system_clock::time_point generated_at) {
  AnalysisDocument document;
  document.analysis = "complexity";
  document.title = "Complexity";
  document.generated_at = generated_at;
  document.body = ComplexityReportJson(report, top_files);
  document.body["threshold"] = threshold;
  const auto &summary = report.summary;
  document.summary = {
      {"Files", std::to_string(summary.total_files)},
      {"Functions", std::to_string(summary.total_functions)},
      {"Average cyclomatic", Fixed(summary.average_cyclomatic)},
      {"Max cyclomatic", std::to_string(summary.max_cyclomatic)},
      {"Max cognitive", std::to_string(summary.max_cognitive)},
      {"P90 cyclomatic", std::to_string(summary.p90_cyclomatic)},
      {"Functions over threshold",
       std::to_string(summary.functions_over_threshold)}};
  document.findings = ComplexityFindings(report, threshold);
  return document;
}

AnalysisDocument
ChurnDocument(const ChurnReport &report,
              std::chrono::system_clock::time_point generated_at) {
  AnalysisDocument document;
  document.analysis = "churn";
  document.title = "Code Churn";
  document.generated_at = generated_at;
  document.body = ChurnReportJson(report);
  const auto &summary = report.summary;
  document.summary = {
      {"Period (days)", std::to_string(summary.period_days)},
      {"Commits", std::to_string(summary.total_commits)},
      {"Files changed", std::to_string(summary.total_files_changed)},
      {"Hotspot files", std::to_string(summary.hotspot_files.size())},
      {"Stable files", std::to_string(summary.stable_files.size())}};
  for (const auto &path : summary.hotspot_files) {
    const auto *file = report.Find(path);
    document.findings.push_back(
        {"churn_hotspot", "note",
         std::to_string(file != nullptr ? file->commit_count : 0) +
             " commits in " + std::to_string(summary.period_days) + " days",
         path, 1});
  }
  return document;
}

AnalysisDocument
SatdDocument(const SatdReport &report,
             std::chrono::system_clock::time_point generated_at) {
  AnalysisDocument document;
  document.analysis = "satd";
  document.title = "Self-Admitted Technical Debt";
  document.generated_at = generated_at;
  document.body = SatdReportJson(report);
  const auto &summary = report.summary;
  document.summary = {{"Items", std::to_string(summary.total_items)},
                      {"Marker items", std::to_string(summary.strict_items)},
                      {"Files with debt",
                       std::to_string(summary.files_with_debt)},
                      {"Critical items", std::to_string(summary.critical_items)}};
  document.findings = SatdFindings(report);
  return document;
}

AnalysisDocument
DeadCodeDocument(const DeadCodeReport &report,
                 std::chrono::system_clock::time_point generated_at) {
  AnalysisDocument document;
  document.analysis = "dead-code";
  document.title = "Dead Code";
  document.generated_at = generated_at;
  document.body = DeadCodeReportJson(report);
  const auto &summary = report.summary;
  document.summary = {
      {"Files analyzed", std::to_string(summary.total_files_analyzed)},
      {"Files with dead code", std::to_string(summary.files_with_dead_code)},
      {"Dead lines", std::to_string(summary.total_dead_lines)},
      {"Dead percentage", Fixed(summary.dead_percentage) + "%"},
      {"Dead functions", std::to_string(summary.dead_functions)},
      {"Dead classes", std::to_string(summary.dead_classes)},
      {"Dead modules", std::to_string(summary.dead_modules)},
      {"Unreachable blocks", std::to_string(summary.unreachable_blocks)}};
  document.findings = DeadCodeFindings(report);
  return document;
}

AnalysisDocument TdgDocument(const TdgReport &report,
                             std::chrono::system_clock::time_point generated_at) {
  AnalysisDocument document;
  document.analysis = "tdg";
  document.title = "Technical Debt Gradient";
  document.generated_at = generated_at;
  document.body = TdgReportJson(report);
  const auto &summary = report.summary;
  document.summary = {
      {"Files", std::to_string(summary.total_files)},
      {"Critical files", std::to_string(summary.critical_files)},
      {"Warning files", std::to_string(summary.warning_files)},
      {"Average TDG", Fixed(summary.average_tdg)},
      {"P95 TDG", Fixed(summary.p95_tdg)},
      {"Estimated debt (hours)", Fixed(summary.estimated_debt_hours)}};
  for (const auto &file : report.files) {
    if (file.band == TdgBand::kHealthy) {
      continue;
    }
    const auto level = file.band == TdgBand::kCritical   ? "error"
                       : file.band == TdgBand::kRefactor ? "warning"
                                                         : "note";
    document.findings.push_back({"tdg_" + TdgBandName(file.band), level,
                                 "TDG " + Fixed(file.value) + ", driven by " +
                                     file.primary_factor,
                                 file.path, 1});
  }
  return document;
}

AnalysisDocument
LintHotspotDocument(const LintHotspotResult &result,
                    const EnforcementOptions &options,
                    std::chrono::system_clock::time_point generated_at) {
  AnalysisDocument document;
  document.analysis = "lint-hotspot";
  document.title = "Lint Hotspot";
  document.generated_at = generated_at;
  document.body = RenderEnforcementJson(result, options);
  document.summary = {
      {"Total violations", std::to_string(result.total_project_violations)},
      {"Files with violations", std::to_string(result.summary_by_file.size())}};
  if (result.hotspot) {
    document.summary.emplace_back("Hotspot", result.hotspot->file);
    document.summary.emplace_back("Hotspot density",
                                  FormatFixed(result.hotspot->defect_density, 4));
  }
  document.findings = LintFindings(result);
  return document;
}

AnalysisDocument
CoverageDocument(const ProjectCoverage &coverage, double coverage_min,
                 std::chrono::system_clock::time_point generated_at) {
  AnalysisDocument document;
  document.analysis = "coverage";
  document.title = "Coverage";
  document.generated_at = generated_at;
  document.body = {{"coverage_percent", coverage.percent},
                   {"method", coverage.method},
                   {"coverage_min", coverage_min},
                   {"files", coverage.by_file}};
  document.summary = {{"Coverage", Fixed(coverage.percent) + "%"},
                      {"Method", coverage.method},
                      {"Target", Fixed(coverage_min) + "%"}};
  for (const auto &[file, percent] : coverage.by_file) {
    if (percent < coverage_min) {
      document.findings.push_back({"coverage_gap", "warning",
                                   "Coverage " + Fixed(percent) +
                                       "% is below " + Fixed(coverage_min) +
                                       "%",
                                   file, 1});
    }
  }
  return document;
}

AnalysisDocument DeepContextDocument(const DeepContext &context,
                                     std::size_t top_files) {
  AnalysisDocument document;
  document.analysis = "deep-context";
  document.title = "Deep Context";
  document.generated_at = context.generated_at;
  document.body = DeepContextJson(context, top_files);
  document.summary = {
      {"Files", std::to_string(context.files.size())},
      {"Overall health", Fixed(context.scorecard.overall_health)},
      {"Max cyclomatic",
       std::to_string(context.complexity.summary.max_cyclomatic)},
      {"SATD items", std::to_string(context.satd.summary.total_items)},
      {"Dead lines", std::to_string(context.dead_code.summary.total_dead_lines)},
      {"Recommendations", std::to_string(context.recommendations.size())}};
  document.findings =
      ComplexityFindings(context.complexity, context.complexity_threshold);
  const auto satd = SatdFindings(context.satd);
  document.findings.insert(document.findings.end(), satd.begin(), satd.end());
  const auto dead = DeadCodeFindings(context.dead_code);
  document.findings.insert(document.findings.end(), dead.begin(), dead.end());
  document.markdown = RenderDeepContextMarkdown(context, top_files);
  return document;
}

AnalysisDocument DefectPredictionDocument(const DeepContext &context) {
  AnalysisDocument document;
  document.analysis = "defect-prediction";
  document.title = "Defect Prediction";
  document.generated_at = context.generated_at;
  nlohmann::json files = nlohmann::json::array();
  for (const auto &file : context.files) {
    files.push_back({{"path", file.path}, {"defect_score", file.defect_score}});
  }
  document.body = {{"predicted_defects", PredictedDefectsJson(context)},
                   {"files", files}};
  const auto high = std::count_if(
      context.predicted_defects.begin(), context.predicted_defects.end(),
      [](const PredictedDefect &defect) { return defect.risk == "high"; });
  document.summary = {
      {"Files", std::to_string(context.files.size())},
      {"Predicted defects", std::to_string(context.predicted_defects.size())},
      {"High risk", std::to_string(high)}};
  document.findings = DefectFindings(context);
  return document;
}

AnalysisDocument ComprehensiveDocument(const DeepContext &context,
                                       const LintHotspotResult &lint,
                                       const EnforcementOptions &options,
                                       std::size_t top_files) {
  auto document = DeepContextDocument(context, top_files);
  document.analysis = "comprehensive";
  document.title = "Comprehensive Analysis";
  const auto lint_document =
      LintHotspotDocument(lint, options, context.generated_at);
  document.body = {{"deep_context", document.body},
                   {"lint_hotspot", lint_document.body}};
  document.summary.insert(document.summary.end(),
                          lint_document.summary.begin(),
                          lint_document.summary.end());
  document.findings.insert(document.findings.end(),
                           lint_document.findings.begin(),
                           lint_document.findings.end());
  std::string lint_section = "## Lint Hotspot\n\n";
  for (const auto &[label, value] : lint_document.summary) {
    lint_section += "- " + label + ": " + value + "\n";
  }
  document.markdown += lint_section + "\n";
  return document;
}

} // namespace qgate
