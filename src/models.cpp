#include <qgate/models.h>

#include <qgate/strings.h>

#include <stdexcept>

namespace qgate {

std::string SeverityName(Severity severity) {
  switch (severity) {
  case Severity::kError:
    return "error";
  case Severity::kWarning:
    return "warning";
  case Severity::kNote:
    return "note";
  case Severity::kInfo:
    return "info";
  }
  return "info";
}

Severity ParseSeverity(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  if (normalized == "error" || StartsWith(normalized, "error:")) {
    return Severity::kError;
  }
  if (normalized == "warning" || normalized == "warn") {
    return Severity::kWarning;
  }
  if (normalized == "note") {
    return Severity::kNote;
  }
  return Severity::kInfo;
}

QualityProfile ExtremeQualityProfile() { return QualityProfile{}; }

std::string PhaseName(RefactorPhase phase) {
  switch (phase) {
  case RefactorPhase::kInitialization:
    return "Initialization";
  case RefactorPhase::kLintFixes:
    return "LintFixes";
  case RefactorPhase::kBuildFixes:
    return "BuildFixes";
  case RefactorPhase::kComplexityReduction:
    return "ComplexityReduction";
  case RefactorPhase::kSatdCleanup:
    return "SatdCleanup";
  case RefactorPhase::kCoverageDriven:
    return "CoverageDriven";
  case RefactorPhase::kQualityValidation:
    return "QualityValidation";
  case RefactorPhase::kComplete:
    return "Complete";
  }
  return "Initialization";
}

RefactorPhase ParsePhase(const std::string &value) {
  static const RefactorPhase kPhases[] = {
      RefactorPhase::kInitialization,      RefactorPhase::kLintFixes,
      RefactorPhase::kBuildFixes,          RefactorPhase::kComplexityReduction,
      RefactorPhase::kSatdCleanup,         RefactorPhase::kCoverageDriven,
      RefactorPhase::kQualityValidation,   RefactorPhase::kComplete};
  for (const auto phase : kPhases) {
    if (PhaseName(phase) == value) {
      return phase;
    }
  }
  throw std::invalid_argument("Unknown refactor phase: " + value);
}

std::string FixStrategyName(const FixStrategy &strategy) {
  switch (strategy.kind) {
  case FixStrategy::Kind::kExtractFunction:
    return "ExtractFunction";
  case FixStrategy::Kind::kSimplifyCondition:
    return "SimplifyCondition";
  case FixStrategy::Kind::kRemoveDeadCode:
    return "RemoveDeadCode";
  case FixStrategy::Kind::kAddTest:
    return "AddTest";
  case FixStrategy::Kind::kApplySuggestion:
    return "ApplySuggestion";
  }
  return "ApplySuggestion";
}

std::string ModeName(const RefactorMode &mode) {
  struct Visitor {
    std::string operator()(const NormalMode &) const { return "normal"; }
    std::string operator()(const SingleFileMode &) const {
      return "single-file";
    }
    std::string operator()(const TestDrivenMode &) const {
      return "test-driven";
    }
    std::string operator()(const IssueDrivenMode &) const {
      return "issue-driven";
    }
    std::string operator()(const BugReportMode &) const {
      return "bug-report";
    }
  };
  return std::visit(Visitor{}, mode);
}

} // namespace qgate
