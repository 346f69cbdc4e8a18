#include <qgate/json_codec.h>

#include <qgate/strings.h>

namespace qgate {

void to_json(nlohmann::json &json, const ViolationDetail &violation) {
  json = nlohmann::json{{"file", violation.file},
                        {"line", violation.line},
                        {"column", violation.column},
                        {"end_line", violation.end_line},
                        {"end_column", violation.end_column},
                        {"lint_name", violation.lint_name},
                        {"message", violation.message},
                        {"severity", SeverityName(violation.severity)},
                        {"machine_applicable", violation.machine_applicable}};
  json["suggestion"] = violation.suggestion
                           ? nlohmann::json(*violation.suggestion)
                           : nlohmann::json(nullptr);
}

void from_json(const nlohmann::json &json, ViolationDetail &violation) {
  violation.file = json.at("file").get<std::string>();
  violation.line = json.value("line", 0u);
  violation.column = json.value("column", 0u);
  violation.end_line = json.value("end_line", violation.line);
  violation.end_column = json.value("end_column", violation.column);
  violation.lint_name = json.value("lint_name", std::string("unknown"));
  violation.message = json.value("message", std::string());
  violation.severity =
      ParseSeverity(json.value("severity", std::string("warning")));
  violation.suggestion.reset();
  const auto suggestion = json.find("suggestion");
  if (suggestion != json.end() && suggestion->is_string()) {
    violation.suggestion = suggestion->get<std::string>();
  }
  violation.machine_applicable = json.value("machine_applicable", false);
}

void to_json(nlohmann::json &json, const QualityMetrics &metrics) {
  json = nlohmann::json{
      {"total_violations", metrics.total_violations},
      {"files_with_issues", metrics.files_with_issues},
      {"total_files", metrics.total_files},
      {"coverage_percent", metrics.coverage_percent},
      {"max_complexity", metrics.max_complexity},
      {"functions_with_high_complexity",
       metrics.functions_with_high_complexity},
      {"total_functions", metrics.total_functions},
      {"satd_count", metrics.satd_count}};
}

void from_json(const nlohmann::json &json, QualityMetrics &metrics) {
  ReadOptionalField(json, "total_violations", metrics.total_violations);
  ReadOptionalField(json, "files_with_issues", metrics.files_with_issues);
  ReadOptionalField(json, "total_files", metrics.total_files);
  ReadOptionalField(json, "coverage_percent", metrics.coverage_percent);
  ReadOptionalField(json, "max_complexity", metrics.max_complexity);
  ReadOptionalField(json, "functions_with_high_complexity",
                    metrics.functions_with_high_complexity);
  ReadOptionalField(json, "total_functions", metrics.total_functions);
  ReadOptionalField(json, "satd_count", metrics.satd_count);
}

void to_json(nlohmann::json &json, const RefactorProgress &progress) {
  json = nlohmann::json{
      {"lint_percent", progress.lint_percent},
      {"complexity_percent", progress.complexity_percent},
      {"satd_percent", progress.satd_percent},
      {"coverage_percent", progress.coverage_percent},
      {"overall_completion_percent", progress.overall_completion_percent},
      {"quality_gates_passed", progress.quality_gates_passed},
      {"quality_gates_remaining", progress.quality_gates_remaining},
      {"files_completed", progress.files_completed},
      {"files_remaining", progress.files_remaining},
      {"current_phase", PhaseName(progress.current_phase)},
      {"estimated_minutes_remaining", progress.estimated_minutes_remaining}};
}

void from_json(const nlohmann::json &json, RefactorProgress &progress) {
  ReadOptionalField(json, "lint_percent", progress.lint_percent);
  ReadOptionalField(json, "complexity_percent", progress.complexity_percent);
  ReadOptionalField(json, "satd_percent", progress.satd_percent);
  ReadOptionalField(json, "coverage_percent", progress.coverage_percent);
  ReadOptionalField(json, "overall_completion_percent",
                    progress.overall_completion_percent);
  ReadOptionalField(json, "quality_gates_passed",
                    progress.quality_gates_passed);
  ReadOptionalField(json, "quality_gates_remaining",
                    progress.quality_gates_remaining);
  ReadOptionalField(json, "files_completed", progress.files_completed);
  ReadOptionalField(json, "files_remaining", progress.files_remaining);
  ReadOptionalField(json, "estimated_minutes_remaining",
                    progress.estimated_minutes_remaining);
  std::string phase = PhaseName(progress.current_phase);
  ReadOptionalField(json, "current_phase", phase);
  progress.current_phase = ParsePhase(phase);
}

void to_json(nlohmann::json &json, const RefactorState &state) {
  json = nlohmann::json{{"iteration", state.iteration},
                        {"start_time", FormatIsoTimestamp(state.start_time)},
                        {"context_generated", state.context_generated},
                        {"context_path", state.context_path},
                        {"files_completed", state.files_completed},
                        {"quality_metrics", state.quality_metrics},
                        {"progress", state.progress},
                        {"satd_baseline", state.satd_baseline}};
  json["current_file"] = state.current_file
                             ? nlohmann::json(*state.current_file)
                             : nlohmann::json(nullptr);
}

void from_json(const nlohmann::json &json, RefactorState &state) {
  ReadOptionalField(json, "iteration", state.iteration);
  std::string start_time;
  ReadOptionalField(json, "start_time", start_time);
  if (!start_time.empty()) {
    state.start_time = ParseIsoTimestamp(start_time);
  }
  ReadOptionalField(json, "context_generated", state.context_generated);
  ReadOptionalField(json, "context_path", state.context_path);
  state.current_file.reset();
  const auto current = json.find("current_file");
  if (current != json.end() && current->is_string()) {
    state.current_file = current->get<std::string>();
  }
  ReadOptionalField(json, "files_completed", state.files_completed);
  ReadOptionalField(json, "quality_metrics", state.quality_metrics);
  ReadOptionalField(json, "progress", state.progress);
  ReadOptionalField(json, "satd_baseline", state.satd_baseline);
}

void to_json(nlohmann::json &json, const FunctionInfo &function) {
  json = nlohmann::json{{"name", function.name},
                        {"line", function.line},
                        {"end_line", function.end_line},
                        {"cyclomatic", function.cyclomatic},
                        {"cognitive", function.cognitive}};
}

void to_json(nlohmann::json &json, const PlannedViolation &violation) {
  json = nlohmann::json{{"lint_name", violation.lint_name},
                        {"line", violation.line},
                        {"column", violation.column},
                        {"message", violation.message},
                        {"fix_strategy", FixStrategyName(violation.fix_strategy)}};
  if (violation.fix_strategy.kind == FixStrategy::Kind::kApplySuggestion) {
    json["suggestion"] = violation.fix_strategy.suggestion;
  }
}

void to_json(nlohmann::json &json, const FileRewritePlan &plan) {
  json = nlohmann::json{
      {"file_path", plan.file_path},
      {"violations", plan.violations},
      {"ast_metadata",
       {{"functions", plan.ast_metadata.functions},
        {"imports", plan.ast_metadata.imports},
        {"structure_hash", plan.ast_metadata.structure_hash}}},
      {"new_content", plan.new_content}};
}

void to_json(nlohmann::json &json, const LintHotspotResult &result) {
  nlohmann::json summary = nlohmann::json::object();
  for (const auto &entry : result.summary_by_file) {
    summary[entry.first] = {{"defect_density", entry.second.defect_density},
                            {"total_violations", entry.second.total_violations}};
  }
  json = nlohmann::json{{"total_project_violations",
                         result.total_project_violations},
                        {"summary_by_file", summary},
                        {"all_violations", result.all_violations}};
  if (result.hotspot) {
    json["hotspot"] = {{"file", result.hotspot->file},
                       {"defect_density", result.hotspot->defect_density},
                       {"total_violations", result.hotspot->total_violations},
                       {"sloc", result.hotspot->sloc},
                       {"violations", result.hotspot->violations}};
  } else {
    json["hotspot"] = nullptr;
  }
}

} // namespace qgate
