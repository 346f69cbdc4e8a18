#include <qgate/build_error_analyzer.h>

#include <qgate/source_scanner.h>
#include <qgate/strings.h>
#include <qgate/toolchain_commands.h>

#include <regex>

namespace qgate {
namespace {

std::string NormalizeDiagnosticPath(const std::string &path,
                                    const std::filesystem::path &root) {
  std::filesystem::path file(path);
  if (file.is_absolute()) {
    return file.lexically_relative(root).generic_string();
  }
  return file.lexically_normal().generic_string();
}

} // namespace

std::optional<std::string> BuildErrorReport::WorstFile() const {
  std::optional<std::string> worst;
  unsigned most = 0;
  for (const auto &entry : errors_by_file) {
    if (entry.second > most) {
      most = entry.second;
      worst = entry.first;
    }
  }
  return worst;
}

std::vector<ViolationDetail>
ParseShortDiagnostics(const std::string &output,
                      const std::filesystem::path &root) {
  static const std::regex kRustError(
      R"(^(.+?):(\d+):(\d+): error(\[[^\]]*\])?: (.*)$)");
  static const std::regex kGoError(R"(^(.+?\.go):(\d+):(\d+): (.*)$)");
  std::vector<ViolationDetail> errors;
  for (const auto &line : SplitLines(output)) {
    std::smatch match;
    ViolationDetail violation;
    if (std::regex_match(line, match, kRustError)) {
      violation.message = match[5].str();
      if (match[4].matched) {
        const auto code = match[4].str();
        violation.message = code.substr(1, code.size() - 2) + ": " +
                            violation.message;
      }
    } else if (std::regex_match(line, match, kGoError)) {
      violation.message = match[4].str();
    } else {
      continue;
    }
    violation.file = NormalizeDiagnosticPath(match[1].str(), root);
    violation.line = static_cast<unsigned>(std::stoul(match[2].str()));
    violation.column = static_cast<unsigned>(std::stoul(match[3].str()));
    violation.end_line = violation.line;
    violation.end_column = violation.column;
    violation.lint_name = "compilation_error";
    violation.severity = Severity::kError;
    errors.push_back(std::move(violation));
  }
  return errors;
}

LintHotspotResult BuildErrorsAsHotspot(const BuildErrorReport &report,
                                       const std::filesystem::path &root,
                                       Toolchain toolchain) {
  LintHotspotResult result;
  result.all_violations = report.errors;
  result.total_project_violations = static_cast<unsigned>(report.errors.size());
  for (const auto &entry : report.errors_by_file) {
    unsigned sloc = 1;
    try {
      sloc = std::max(1u, CountLogicalLines(ReadFile(root / entry.first),
                                            ToolchainForPath(entry.first)
                                                .value_or(toolchain)));
    } catch (const std::runtime_error &) {
      // Diagnostics may name files outside the project (dependencies).
    }
    FileSummary summary;
    summary.total_violations = entry.second;
    summary.defect_density = static_cast<double>(entry.second) / sloc;
    result.summary_by_file[entry.first] = summary;
    if (!result.hotspot || summary.defect_density > result.hotspot->defect_density) {
      LintHotspot hotspot;
      hotspot.file = entry.first;
      hotspot.defect_density = summary.defect_density;
      hotspot.total_violations = entry.second;
      hotspot.sloc = sloc;
      result.hotspot = hotspot;
    }
  }
  if (result.hotspot) {
    for (const auto &error : report.errors) {
      if (error.file == result.hotspot->file) {
        result.hotspot->violations.push_back(error);
      }
    }
  }
  return result;
}

BuildErrorAnalyzer::BuildErrorAnalyzer(std::shared_ptr<ProcessRunner> runner,
                                       std::shared_ptr<Logger> logger)
    : runner_(std::move(runner)), logger_(EnsureLogger(std::move(logger))) {
  if (!runner_) {
    throw std::invalid_argument("BuildErrorAnalyzer requires a process runner");
  }
}

BuildErrorReport BuildErrorAnalyzer::Analyze(const SourceSet &sources,
                                             const ExecutionContext &context) const {
  BuildErrorReport report;
  const auto command = BuildDiagnosticsCommand(sources.toolchain, sources.root);
  if (!command) {
    return report;
  }
  const auto result = runner_->Run(*command, context);
  if (!result.launched) {
    logger_->Log(LogLevel::kWarn, "build_errors.unavailable",
                 {{"command", DescribeCommand(*command)}});
    return report;
  }
  report.build_succeeded = result.exit_code == 0;
  report.errors = ParseShortDiagnostics(
      result.stderr_text + "\n" + result.stdout_text, sources.root);
  for (const auto &error : report.errors) {
    ++report.errors_by_file[error.file];
  }
  logger_->Log(LogLevel::kDebug, "analyzer.complete",
               {{"analyzer", "build-errors"},
                {"succeeded", report.build_succeeded ? "true" : "false"},
                {"errors", std::to_string(report.errors.size())}});
  return report;
}

} // namespace qgate
