#pragma once

#include <qgate/build_error_analyzer.h>
#include <qgate/deep_context.h>
#include <qgate/glob_matcher.h>
#include <qgate/logging.h>
#include <qgate/measurement_pipeline.h>
#include <qgate/models.h>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace qgate {

enum class SelectionTier { kLint, kBuildErrors, kCoverage, kExtremeQuality };

std::string SelectionTierName(SelectionTier tier);

struct SelectedTarget {
  std::string file;
  SelectionTier tier = SelectionTier::kLint;
  RefactorPhase phase = RefactorPhase::kLintFixes;
  std::string reason;
  // Lint or build diagnostics attributed to `file`.
  std::vector<ViolationDetail> violations;
};

struct Exhausted {
  std::string reason;
};

using SelectionResult = std::variant<SelectedTarget, Exhausted>;

// Tests, build scripts, module index files, generated sources and the
// bench, fuzz and examples trees.
bool IsNonRefactorable(const std::string &relative_path);

// Category name ("Security", "Complexity", ...) to normalized weight.
using IssueKeywords = std::map<std::string, double>;

// error 100, warning 50, note 10, anything else 5; unsafe, panic, unwrap
// and expect lints count triple, complexity and cognitive lints double.
// Issue keywords boost matching lints by a further x4 (security) or x3.
unsigned SeverityScore(const std::vector<ViolationDetail> &violations,
                       const IssueKeywords &issue_keywords = {});

struct SelectionInputs {
  const SourceSet *sources = nullptr;
  const MeasurementSnapshot *snapshot = nullptr;
  // Absent before the first context refresh; tier 4 then falls back to the
  // snapshot's own complexity report.
  const DeepContext *context = nullptr;
  QualityProfile profile;
  std::vector<std::string> files_completed;
  // Tier 1 tie-break only; a missing entry counts as 100%.
  std::map<std::string, double> cached_coverage;
  IssueKeywords issue_keywords;
  // When set, only these files are candidates.
  std::optional<std::vector<std::string>> explicit_targets;
  // Called at most once, and only when tier 1 is empty.
  std::function<BuildErrorReport()> build_errors;
  // Per-file coverage for tier 3.
  std::function<double(const std::string &)> file_coverage;
  // Largest file with the lowest coverage instead of the lowest coverage.
  bool coverage_driven = false;
};

struct SelectorOptions {
  unsigned min_coverage_driven_lines = 20;
};

class TargetSelector {
public:
  TargetSelector(const SelectionFilters &filters, SelectorOptions options = {},
                 std::shared_ptr<Logger> logger = nullptr);

  SelectionResult Select(const SelectionInputs &inputs) const;

  bool IsEligible(const std::string &file, const SelectionInputs &inputs) const;

private:
  std::optional<SelectedTarget> SelectLintTarget(const SelectionInputs &inputs) const;
  std::optional<SelectedTarget>
  SelectBuildErrorTarget(const SelectionInputs &inputs,
                         bool &coverage_driven) const;
  std::optional<SelectedTarget> SelectCoverageTarget(const SelectionInputs &inputs,
                                                     bool coverage_driven) const;
  std::optional<SelectedTarget>
  SelectExtremeQualityTarget(const SelectionInputs &inputs) const;

  PathFilter filter_;
  SelectorOptions options_;
  std::shared_ptr<Logger> logger_;
};

} // namespace qgate
