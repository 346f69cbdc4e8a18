#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace qgate {

enum class Severity { kError, kWarning, kNote, kInfo };

std::string SeverityName(Severity severity);
// Unknown levels (e.g. rustc "help") map to kInfo.
Severity ParseSeverity(const std::string &value);

struct QualityProfile {
  double coverage_min = 80.0;
  unsigned complexity_max = 10;
  unsigned complexity_target = 5;
  unsigned satd_allowed = 0;
};

// The only preset the refactor loop ships with.
QualityProfile ExtremeQualityProfile();

struct QualityMetrics {
  unsigned total_violations = 0;
  unsigned files_with_issues = 0;
  unsigned total_files = 0;
  double coverage_percent = 0.0;
  unsigned max_complexity = 0;
  unsigned functions_with_high_complexity = 0;
  unsigned total_functions = 0;
  unsigned satd_count = 0;

  bool operator==(const QualityMetrics &other) const = default;
};

enum class RefactorPhase {
  kInitialization,
  kLintFixes,
  kBuildFixes,
  kComplexityReduction,
  kSatdCleanup,
  kCoverageDriven,
  kQualityValidation,
  kComplete
};

std::string PhaseName(RefactorPhase phase);
RefactorPhase ParsePhase(const std::string &value);

struct RefactorProgress {
  double lint_percent = 0.0;
  double complexity_percent = 0.0;
  double satd_percent = 0.0;
  double coverage_percent = 0.0;
  double overall_completion_percent = 0.0;
  std::vector<std::string> quality_gates_passed;
  std::vector<std::string> quality_gates_remaining;
  std::size_t files_completed = 0;
  std::size_t files_remaining = 0;
  RefactorPhase current_phase = RefactorPhase::kInitialization;
  double estimated_minutes_remaining = 0.0;
};

struct RefactorState {
  unsigned iteration = 0;
  std::chrono::system_clock::time_point start_time;
  bool context_generated = false;
  std::string context_path;
  std::optional<std::string> current_file;
  // Relative paths, each at most once, only after a passing verification.
  std::vector<std::string> files_completed;
  QualityMetrics quality_metrics;
  RefactorProgress progress;
  unsigned satd_baseline = 0;
};

struct ViolationDetail {
  std::string file;
  unsigned line = 0;
  unsigned column = 0;
  unsigned end_line = 0;
  unsigned end_column = 0;
  std::string lint_name;
  std::string message;
  Severity severity = Severity::kWarning;
  std::optional<std::string> suggestion;
  bool machine_applicable = false;
};

struct FixStrategy {
  enum class Kind {
    kExtractFunction,
    kSimplifyCondition,
    kRemoveDeadCode,
    kAddTest,
    kApplySuggestion
  };
  Kind kind = Kind::kApplySuggestion;
  std::string suggestion;
};

std::string FixStrategyName(const FixStrategy &strategy);

struct PlannedViolation {
  std::string lint_name;
  unsigned line = 0;
  unsigned column = 0;
  std::string message;
  FixStrategy fix_strategy;
};

struct FunctionInfo {
  std::string name;
  unsigned line = 0;
  unsigned end_line = 0;
  unsigned cyclomatic = 1;
  unsigned cognitive = 0;
};

struct AstMetadata {
  std::vector<FunctionInfo> functions;
  std::vector<std::string> imports;
  std::string structure_hash;
};

struct FileRewritePlan {
  std::string file_path;
  std::vector<PlannedViolation> violations;
  AstMetadata ast_metadata;
  std::string new_content;
};

struct FileSummary {
  double defect_density = 0.0;
  unsigned total_violations = 0;
};

struct LintHotspot {
  std::string file;
  double defect_density = 0.0;
  unsigned total_violations = 0;
  unsigned sloc = 0;
  std::vector<ViolationDetail> violations;
};

struct LintHotspotResult {
  unsigned total_project_violations = 0;
  std::map<std::string, FileSummary> summary_by_file;
  std::optional<LintHotspot> hotspot;
  std::vector<ViolationDetail> all_violations;
};

struct SelectionFilters {
  std::vector<std::string> include_patterns;
  std::vector<std::string> exclude_patterns;
};

struct NormalMode {};
struct SingleFileMode {
  std::string file;
};
struct TestDrivenMode {
  std::string test_file;
  std::optional<std::string> test_name;
};
struct IssueDrivenMode {
  std::string issue_url;
};
struct BugReportMode {
  std::string markdown_path;
};

using RefactorMode = std::variant<NormalMode, SingleFileMode, TestDrivenMode,
                                  IssueDrivenMode, BugReportMode>;

std::string ModeName(const RefactorMode &mode);

} // namespace qgate
