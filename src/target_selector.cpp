#include <qgate/target_selector.h>

#include <qgate/strings.h>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

namespace qgate {
namespace {

unsigned BaseScore(Severity severity) {
  switch (severity) {
  case Severity::kError:
    return 100;
  case Severity::kWarning:
    return 50;
  case Severity::kNote:
    return 10;
  case Severity::kInfo:
    break;
  }
  return 5;
}

unsigned LintMultiplier(const std::string &lint_name) {
  if (Contains(lint_name, "unsafe") || Contains(lint_name, "panic") ||
      Contains(lint_name, "unwrap") || Contains(lint_name, "expect")) {
    return 3;
  }
  if (Contains(lint_name, "complexity") || Contains(lint_name, "cognitive")) {
    return 2;
  }
  return 1;
}

unsigned IssueMultiplier(const std::string &lint_name,
                         const IssueKeywords &keywords) {
  if (keywords.empty()) {
    return 1;
  }
  const auto has = [&](const char *category) {
    return keywords.count(category) != 0;
  };
  if (Contains(lint_name, "security") && has("Security")) {
    return 4;
  }
  if ((Contains(lint_name, "complexity") && has("Complexity")) ||
      (Contains(lint_name, "performance") && has("Performance")) ||
      ((Contains(lint_name, "bug") || Contains(lint_name, "correct")) &&
       has("Correctness"))) {
    return 3;
  }
  return 1;
}

std::vector<ViolationDetail>
ViolationsFor(const std::vector<ViolationDetail> &all, const std::string &file) {
  std::vector<ViolationDetail> result;
  for (const auto &violation : all) {
    if (violation.file == file) {
      result.push_back(violation);
    }
  }
  return result;
}

double CachedCoverage(const std::map<std::string, double> &cache,
                      const std::string &file) {
  const auto found = cache.find(file);
  return found == cache.end() ? 100.0 : found->second;
}

} // namespace

std::string SelectionTierName(SelectionTier tier) {
  switch (tier) {
  case SelectionTier::kLint:
    return "lint";
  case SelectionTier::kBuildErrors:
    return "build_errors";
  case SelectionTier::kCoverage:
    return "coverage";
  case SelectionTier::kExtremeQuality:
    return "extreme_quality";
  }
  return "unknown";
}

bool IsNonRefactorable(const std::string &relative_path) {
  const std::string path = "/" + relative_path;
  const auto slash = relative_path.find_last_of('/');
  const std::string file_name = slash == std::string::npos
                                    ? relative_path
                                    : relative_path.substr(slash + 1);
  return StartsWith(file_name, "test_") || EndsWith(file_name, "_test.rs") ||
         EndsWith(file_name, "_test.go") || EndsWith(file_name, "_test.py") ||
         Contains(file_name, ".test.") || Contains(file_name, ".spec.") ||
         file_name == "build.rs" || file_name == "mod.rs" ||
         Contains(path, "/tests/") || Contains(path, "/test/") ||
         Contains(path, "/bench/") || Contains(path, "/benches/") ||
         Contains(path, "/fuzz/") || Contains(path, "/examples/") ||
         Contains(path, "generated");
}

unsigned SeverityScore(const std::vector<ViolationDetail> &violations,
                       const IssueKeywords &issue_keywords) {
  unsigned score = 0;
  for (const auto &violation : violations) {
    score += BaseScore(violation.severity) *
             LintMultiplier(violation.lint_name) *
             IssueMultiplier(violation.lint_name, issue_keywords);
  }
  return score;
}

TargetSelector::TargetSelector(const SelectionFilters &filters,
                               SelectorOptions options,
                               std::shared_ptr<Logger> logger)
    : filter_(filters.include_patterns, filters.exclude_patterns),
      options_(options), logger_(EnsureLogger(std::move(logger))) {}

bool TargetSelector::IsEligible(const std::string &file,
                                const SelectionInputs &inputs) const {
  if (std::find(inputs.files_completed.begin(), inputs.files_completed.end(),
                file) != inputs.files_completed.end()) {
    return false;
  }
  if (inputs.explicit_targets) {
    const auto &targets = *inputs.explicit_targets;
    return std::find(targets.begin(), targets.end(), file) != targets.end();
  }
  return filter_.IsIncluded(file);
}

SelectionResult TargetSelector::Select(const SelectionInputs &inputs) const {
  if (inputs.snapshot == nullptr || inputs.sources == nullptr) {
    throw std::invalid_argument("Target selection requires a measurement");
  }
  if (auto target = SelectLintTarget(inputs)) {
    return *target;
  }
  bool coverage_driven = inputs.coverage_driven;
  if (auto target = SelectBuildErrorTarget(inputs, coverage_driven)) {
    return *target;
  }
  if (auto target = SelectCoverageTarget(inputs, coverage_driven)) {
    return *target;
  }
  if (auto target = SelectExtremeQualityTarget(inputs)) {
    return *target;
  }
  return Exhausted{"no eligible file left in any tier"};
}

std::optional<SelectedTarget>
TargetSelector::SelectLintTarget(const SelectionInputs &inputs) const {
  const auto &all = inputs.snapshot->lint.all_violations;
  std::set<std::string> files;
  for (const auto &violation : all) {
    if (IsEligible(violation.file, inputs)) {
      files.insert(violation.file);
    }
  }
  if (files.empty()) {
    return std::nullopt;
  }

  struct Candidate {
    std::string file;
    std::vector<ViolationDetail> violations;
    unsigned severity = 0;
    double coverage = 100.0;
  };
  std::vector<Candidate> candidates;
  for (const auto &file : files) {
    Candidate candidate;
    candidate.file = file;
    candidate.violations = ViolationsFor(all, file);
    candidate.severity =
        SeverityScore(candidate.violations, inputs.issue_keywords);
    candidate.coverage = CachedCoverage(inputs.cached_coverage, file);
    candidates.push_back(std::move(candidate));
  }
  std::sort(candidates.begin(), candidates.end(),
            [](const Candidate &a, const Candidate &b) {
              if (a.violations.size() != b.violations.size()) {
                return a.violations.size() > b.violations.size();
              }
              if (a.severity != b.severity) {
                return a.severity > b.severity;
              }
              if (a.coverage != b.coverage) {
                return a.coverage < b.coverage;
              }
              return a.file < b.file;
            });

  auto &best = candidates.front();
  SelectedTarget target;
  target.file = best.file;
  target.tier = SelectionTier::kLint;
  target.phase = RefactorPhase::kLintFixes;
  target.reason = std::to_string(best.violations.size()) +
                  " lint violations, severity " +
                  std::to_string(best.severity);
  target.violations = std::move(best.violations);
  return target;
}

std::optional<SelectedTarget>
TargetSelector::SelectBuildErrorTarget(const SelectionInputs &inputs,
                                       bool &coverage_driven) const {
  if (!inputs.build_errors) {
    return std::nullopt;
  }
  const auto report = inputs.build_errors();
  if (report.build_succeeded) {
    return std::nullopt;
  }
  if (report.Unattributed()) {
    logger_->Log(LogLevel::kWarn, "selector.build_errors.unattributed",
                 {{"fallback", "coverage"}});
    coverage_driven = true;
    return std::nullopt;
  }

  std::vector<std::pair<std::string, unsigned>> ranked(
      report.errors_by_file.begin(), report.errors_by_file.end());
  std::sort(ranked.begin(), ranked.end(), [](const auto &a, const auto &b) {
    if (a.second != b.second) {
      return a.second > b.second;
    }
    return a.first < b.first;
  });
  for (const auto &[file, count] : ranked) {
    if (!IsEligible(file, inputs)) {
      continue;
    }
    SelectedTarget target;
    target.file = file;
    target.tier = SelectionTier::kBuildErrors;
    target.phase = RefactorPhase::kBuildFixes;
    target.reason = std::to_string(count) + " compilation errors";
    target.violations = ViolationsFor(report.errors, file);
    return target;
  }
  logger_->Log(LogLevel::kWarn, "selector.build_errors.ineligible",
               {{"files", std::to_string(ranked.size())}});
  coverage_driven = true;
  return std::nullopt;
}

std::optional<SelectedTarget>
TargetSelector::SelectCoverageTarget(const SelectionInputs &inputs,
                                     bool coverage_driven) const {
  if (!inputs.file_coverage) {
    return std::nullopt;
  }
  struct Candidate {
    std::string file;
    double coverage = 0.0;
    unsigned lines = 0;
  };
  std::vector<Candidate> candidates;
  for (const auto &file : inputs.sources->files) {
    if (IsNonRefactorable(file) || !IsEligible(file, inputs)) {
      continue;
    }
    unsigned lines = 0;
    if (const auto *complexity = inputs.snapshot->complexity.Find(file)) {
      lines = complexity->logical_lines;
    }
    if (coverage_driven && lines < options_.min_coverage_driven_lines) {
      continue;
    }
    const double coverage = inputs.file_coverage(file);
    if (coverage < inputs.profile.coverage_min) {
      candidates.push_back({file, coverage, lines});
    }
  }
  if (candidates.empty()) {
    return std::nullopt;
  }
  std::sort(candidates.begin(), candidates.end(),
            [coverage_driven](const Candidate &a, const Candidate &b) {
              if (a.coverage != b.coverage) {
                return a.coverage < b.coverage;
              }
              if (coverage_driven && a.lines != b.lines) {
                return a.lines > b.lines;
              }
              return a.file < b.file;
            });
  const auto &best = candidates.front();
  SelectedTarget target;
  target.file = best.file;
  target.tier = SelectionTier::kCoverage;
  target.phase = RefactorPhase::kCoverageDriven;
  target.reason = "coverage " + FormatFixed(best.coverage, 1) + "% below " +
                  FormatFixed(inputs.profile.coverage_min, 1) + "%";
  if (coverage_driven) {
    target.reason += ", " + std::to_string(best.lines) + " lines";
  }
  return target;
}

std::optional<SelectedTarget>
TargetSelector::SelectExtremeQualityTarget(const SelectionInputs &inputs) const {
  const auto &metrics = inputs.snapshot->metrics;
  const auto &profile = inputs.profile;

  if (metrics.max_complexity > profile.complexity_max) {
    std::vector<std::string> files;
    if (inputs.context != nullptr) {
      files = inputs.context->FilesOverComplexity(profile.complexity_max);
    } else {
      const auto &complexity = inputs.snapshot->complexity;
      for (const auto *file : complexity.TopFiles(complexity.files.size())) {
        if (file->max_cyclomatic > profile.complexity_max) {
          files.push_back(file->path);
        }
      }
    }
    for (const auto &file : files) {
      if (IsNonRefactorable(file) || !IsEligible(file, inputs)) {
        continue;
      }
      SelectedTarget target;
      target.file = file;
      target.tier = SelectionTier::kExtremeQuality;
      target.phase = RefactorPhase::kComplexityReduction;
      target.reason = "function complexity above " +
                      std::to_string(profile.complexity_max);
      return target;
    }
  }

  if (metrics.satd_count > 0) {
    std::map<std::string, unsigned> counts;
    for (const auto &item : inputs.snapshot->satd.items) {
      ++counts[item.file];
    }
    std::vector<std::pair<std::string, unsigned>> ranked(counts.begin(),
                                                         counts.end());
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto &a, const auto &b) {
                       return a.second > b.second;
                     });
    for (const auto &[file, count] : ranked) {
      if (IsNonRefactorable(file) || !IsEligible(file, inputs)) {
        continue;
      }
      SelectedTarget target;
      target.file = file;
      target.tier = SelectionTier::kExtremeQuality;
      target.phase = RefactorPhase::kSatdCleanup;
      target.reason = std::to_string(count) + " SATD items";
      return target;
    }
  }
  return std::nullopt;
}

} // namespace qgate
