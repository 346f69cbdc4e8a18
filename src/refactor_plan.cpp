#include <qgate/refactor_plan.h>

#include <qgate/complexity_analyzer.h>
#include <qgate/satd_analyzer.h>
#include <qgate/source_scanner.h>
#include <qgate/strings.h>

#include <algorithm>
#include <set>
#include <system_error>

namespace qgate {
namespace {

bool IsLineComment(const std::string &trimmed, Toolchain toolchain) {
  if (CommentSyntaxFor(toolchain) == CommentSyntax::kHash) {
    return StartsWith(trimmed, "#");
  }
  return StartsWith(trimmed, "//");
}

bool IsSelfContainedBlockComment(const std::string &trimmed) {
  return StartsWith(trimmed, "/*") && EndsWith(trimmed, "*/");
}

bool TouchesBlockDelimiter(const std::string &trimmed) {
  return Contains(trimmed, "/*") || Contains(trimmed, "*/");
}

std::string RightTrim(std::string value) {
  while (!value.empty() &&
         (value.back() == ' ' || value.back() == '\t' || value.back() == '\r')) {
    value.pop_back();
  }
  return value;
}

} // namespace

FixStrategy DetermineFixStrategy(const ViolationDetail &violation) {
  const auto &name = violation.lint_name;
  FixStrategy strategy;
  if (name == "satd_item" || Contains(name, "unused")) {
    strategy.kind = FixStrategy::Kind::kRemoveDeadCode;
  } else if (name == "high_complexity" || Contains(name, "complexity")) {
    strategy.kind = FixStrategy::Kind::kExtractFunction;
  } else if (Contains(name, "if_same_then_else")) {
    strategy.kind = FixStrategy::Kind::kSimplifyCondition;
  } else {
    strategy.kind = FixStrategy::Kind::kApplySuggestion;
    strategy.suggestion = violation.suggestion.value_or("Apply clippy suggestion");
  }
  return strategy;
}

std::vector<ViolationDetail> DetectSatdViolations(const std::string &file,
                                                  const std::string &content,
                                                  Toolchain toolchain) {
  std::vector<ViolationDetail> violations;
  for (const auto &item : ScanSatd(file, content, toolchain, true)) {
    ViolationDetail violation;
    violation.file = file;
    violation.line = item.line;
    violation.column = 1;
    violation.end_line = item.line;
    violation.end_column = static_cast<unsigned>(item.source_line.size());
    violation.lint_name = "satd_item";
    violation.message =
        "Self-admitted technical debt: " + Trim(item.source_line);
    violation.severity = Severity::kWarning;
    violation.suggestion = "Remove or address technical debt";
    violations.push_back(std::move(violation));
  }
  return violations;
}

std::vector<ViolationDetail>
HighComplexityViolations(const std::string &file, const AstMetadata &metadata,
                         const QualityProfile &profile) {
  std::vector<ViolationDetail> violations;
  for (const auto &function : metadata.functions) {
    if (function.cyclomatic <= profile.complexity_max) {
      continue;
    }
    ViolationDetail violation;
    violation.file = file;
    violation.line = function.line;
    violation.column = 1;
    violation.end_line = function.end_line;
    violation.end_column = 1;
    violation.lint_name = "high_complexity";
    violation.message = "Function '" + function.name + "' has complexity " +
                        std::to_string(function.cyclomatic) +
                        " (max allowed: " +
                        std::to_string(profile.complexity_max) + ")";
    violation.severity = Severity::kError;
    violation.suggestion =
        "Break down this function to achieve target complexity of " +
        std::to_string(profile.complexity_target);
    violations.push_back(std::move(violation));
  }
  return violations;
}

std::string RemoveSatdComments(const std::string &content, Toolchain toolchain) {
  const auto scanned = SourceScanner(toolchain).Scan(content);
  std::set<unsigned> satd_lines;
  for (const auto &item : ScanSatd("", content, toolchain, true)) {
    satd_lines.insert(item.line);
  }
  if (satd_lines.empty()) {
    return content;
  }

  const auto raw_lines = SplitLines(content);
  std::string result;
  for (std::size_t i = 0; i < raw_lines.size(); ++i) {
    const auto &line = raw_lines[i];
    const auto number = static_cast<unsigned>(i + 1);
    if (satd_lines.count(number) == 0 || i >= scanned.size()) {
      result += line;
      result += '\n';
      continue;
    }
    const auto &scan = scanned[i];
    const auto trimmed = Trim(line);
    if (scan.IsCommentOnly()) {
      if (IsLineComment(trimmed, toolchain) ||
          IsSelfContainedBlockComment(trimmed) ||
          !TouchesBlockDelimiter(trimmed)) {
        continue;
      }
      result += line;
      result += '\n';
      continue;
    }
    // Code followed by a line comment: the comment starts where the
    // scanned code ends.
    const auto comment_start = scan.code.size();
    if (comment_start < line.size() &&
        IsLineComment(line.substr(comment_start), toolchain)) {
      result += RightTrim(line.substr(0, comment_start));
    } else {
      result += line;
    }
    result += '\n';
  }
  if (!content.empty() && content.back() != '\n' && !result.empty()) {
    result.pop_back();
  }
  return result;
}

RefactorPlanBuilder::RefactorPlanBuilder(QualityProfile profile,
                                         Toolchain toolchain)
    : profile_(profile), toolchain_(toolchain) {}

RefactorPlan RefactorPlanBuilder::Build(
    const std::filesystem::path &root, const std::string &file,
    const std::vector<ViolationDetail> &file_violations,
    const DeepContext *context, double current_coverage) const {
  RefactorPlan plan;
  plan.current_coverage = current_coverage;
  plan.needs_tests = current_coverage < profile_.coverage_min;

  const auto path = root / file;
  std::error_code error;
  if (std::filesystem::is_regular_file(path, error)) {
    plan.current_content = ReadFile(path);
  }

  std::optional<AstMetadata> metadata;
  if (context != nullptr) {
    metadata = context->MetadataFor(file);
  }
  if (!metadata) {
    AstMetadata scanned;
    const SyntaxTree tree(plan.current_content,
                          SyntaxLanguageFor(file, toolchain_));
    scanned.functions = AnalyzeFunctionComplexity(tree);
    scanned.imports = ExtractImports(tree);
    scanned.structure_hash = StructureHash(scanned.functions, scanned.imports);
    metadata = std::move(scanned);
  }

  plan.violations = file_violations;
  const auto satd = DetectSatdViolations(file, plan.current_content, toolchain_);
  plan.violations.insert(plan.violations.end(), satd.begin(), satd.end());
  const auto complex = HighComplexityViolations(file, *metadata, profile_);
  plan.violations.insert(plan.violations.end(), complex.begin(), complex.end());

  plan.rewrite.file_path = file;
  plan.rewrite.ast_metadata = std::move(*metadata);
  for (const auto &violation : plan.violations) {
    PlannedViolation planned;
    planned.lint_name = violation.lint_name;
    planned.line = violation.line;
    planned.column = violation.column;
    planned.message = violation.message;
    planned.fix_strategy = DetermineFixStrategy(violation);
    plan.rewrite.violations.push_back(std::move(planned));
  }
  plan.rewrite.new_content = satd.empty()
                                 ? plan.current_content
                                 : RemoveSatdComments(plan.current_content,
                                                      toolchain_);
  return plan;
}

} // namespace qgate
