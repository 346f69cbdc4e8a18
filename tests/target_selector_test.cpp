#include <qgate/target_selector.h>

#include <gtest/gtest.h>

namespace qgate {
namespace {

ViolationDetail Lint(const std::string &file, const std::string &lint,
                     Severity severity = Severity::kWarning) {
  ViolationDetail violation;
  violation.file = file;
  violation.lint_name = lint;
  violation.severity = severity;
  return violation;
}

FileComplexity Complexity(const std::string &path, unsigned max_cyclomatic,
                          unsigned logical_lines) {
  FileComplexity file;
  file.path = path;
  FunctionInfo function;
  function.name = "f";
  function.cyclomatic = max_cyclomatic;
  file.functions.push_back(function);
  file.max_cyclomatic = max_cyclomatic;
  file.logical_lines = logical_lines;
  return file;
}

class TargetSelectorTest : public ::testing::Test {
protected:
  void SetUp() override {
    sources_.root = "/work/demo";
    sources_.files = {"src/a.rs", "src/b.rs", "src/c.rs", "tests/it.rs"};
    snapshot_.complexity.files = {Complexity("src/a.rs", 3, 30),
                                  Complexity("src/b.rs", 14, 80),
                                  Complexity("src/c.rs", 2, 10),
                                  Complexity("tests/it.rs", 20, 40)};
    inputs_.sources = &sources_;
    inputs_.snapshot = &snapshot_;
    inputs_.profile = ExtremeQualityProfile();
  }

  SelectedTarget Expect(const SelectionResult &result) {
    EXPECT_TRUE(std::holds_alternative<SelectedTarget>(result));
    return std::holds_alternative<SelectedTarget>(result)
               ? std::get<SelectedTarget>(result)
               : SelectedTarget{};
  }

  SourceSet sources_;
  MeasurementSnapshot snapshot_;
  SelectionInputs inputs_;
  TargetSelector selector_{SelectionFilters{}};
};

TEST_F(TargetSelectorTest, SeverityScoreWeighsLevelsAndLintFamilies) {
  EXPECT_EQ(SeverityScore({Lint("f", "x", Severity::kError)}), 100u);
  EXPECT_EQ(SeverityScore({Lint("f", "clippy::unwrap_used")}), 150u);
  EXPECT_EQ(SeverityScore({Lint("f", "clippy::cognitive_complexity")}), 100u);
  EXPECT_EQ(SeverityScore({Lint("f", "x", Severity::kNote)}), 10u);
  EXPECT_EQ(SeverityScore({Lint("f", "x", Severity::kInfo)}), 5u);
  EXPECT_EQ(SeverityScore({Lint("f", "clippy::cognitive_complexity")},
                          {{"Complexity", 1.0}}),
            300u);
}

TEST_F(TargetSelectorTest, LintTierPrefersMostViolationsThenSeverity) {
  snapshot_.lint.all_violations = {Lint("src/a.rs", "x"), Lint("src/b.rs", "x"),
                                   Lint("src/b.rs", "y"),
                                   Lint("src/c.rs", "unwrap_used"),
                                   Lint("src/c.rs", "z")};

  const auto target = Expect(selector_.Select(inputs_));

  EXPECT_EQ(target.tier, SelectionTier::kLint);
  EXPECT_EQ(target.phase, RefactorPhase::kLintFixes);
  EXPECT_EQ(target.file, "src/c.rs");
  EXPECT_EQ(target.violations.size(), 2u);
}

TEST_F(TargetSelectorTest, LintTiesBreakOnLowerCachedCoverage) {
  snapshot_.lint.all_violations = {Lint("src/a.rs", "x"), Lint("src/b.rs", "x")};
  inputs_.cached_coverage = {{"src/a.rs", 90.0}, {"src/b.rs", 40.0}};

  EXPECT_EQ(Expect(selector_.Select(inputs_)).file, "src/b.rs");
}

TEST_F(TargetSelectorTest, CompletedFilesAreNeverSelectedAgain) {
  snapshot_.lint.all_violations = {Lint("src/a.rs", "x"), Lint("src/a.rs", "y"),
                                   Lint("src/b.rs", "x")};
  inputs_.files_completed = {"src/a.rs"};

  EXPECT_EQ(Expect(selector_.Select(inputs_)).file, "src/b.rs");
}

TEST_F(TargetSelectorTest, BuildErrorsComeSecond) {
  bool called = false;
  inputs_.build_errors = [&called]() {
    called = true;
    BuildErrorReport report;
    report.build_succeeded = false;
    report.errors = {Lint("src/c.rs", "compilation_error", Severity::kError)};
    report.errors_by_file = {{"src/c.rs", 1}};
    return report;
  };

  const auto target = Expect(selector_.Select(inputs_));

  EXPECT_TRUE(called);
  EXPECT_EQ(target.tier, SelectionTier::kBuildErrors);
  EXPECT_EQ(target.phase, RefactorPhase::kBuildFixes);
  EXPECT_EQ(target.file, "src/c.rs");
}

TEST_F(TargetSelectorTest, BuildErrorsAreNotQueriedWhileLintRemains) {
  snapshot_.lint.all_violations = {Lint("src/a.rs", "x")};
  bool called = false;
  inputs_.build_errors = [&called]() {
    called = true;
    return BuildErrorReport{};
  };

  selector_.Select(inputs_);

  EXPECT_FALSE(called);
}

TEST_F(TargetSelectorTest, UnattributedBuildFailureSwitchesToCoverageDriven) {
  inputs_.build_errors = []() {
    BuildErrorReport report;
    report.build_succeeded = false;
    return report;
  };
  inputs_.file_coverage = [](const std::string &) { return 10.0; };

  const auto target = Expect(selector_.Select(inputs_));

  // src/c.rs is below the minimum size for coverage-driven selection and
  // the largest remaining file wins the tie.
  EXPECT_EQ(target.tier, SelectionTier::kCoverage);
  EXPECT_EQ(target.file, "src/b.rs");
}

TEST_F(TargetSelectorTest, CoverageTierPicksLowestCoverageAndSkipsTests) {
  inputs_.file_coverage = [](const std::string &file) {
    if (file == "src/a.rs") {
      return 30.0;
    }
    if (file == "tests/it.rs") {
      return 0.0;
    }
    return file == "src/b.rs" ? 95.0 : 60.0;
  };

  const auto target = Expect(selector_.Select(inputs_));

  EXPECT_EQ(target.tier, SelectionTier::kCoverage);
  EXPECT_EQ(target.phase, RefactorPhase::kCoverageDriven);
  EXPECT_EQ(target.file, "src/a.rs");
}

TEST_F(TargetSelectorTest, ExtremeQualityTargetsComplexityThenSatd) {
  snapshot_.metrics.max_complexity = 14;
  inputs_.profile.complexity_max = 10;

  auto target = Expect(selector_.Select(inputs_));
  EXPECT_EQ(target.tier, SelectionTier::kExtremeQuality);
  EXPECT_EQ(target.phase, RefactorPhase::kComplexityReduction);
  EXPECT_EQ(target.file, "src/b.rs");

  inputs_.files_completed = {"src/b.rs"};
  SatdItem item;
  item.file = "src/c.rs";
  snapshot_.satd.items = {item};
  snapshot_.metrics.satd_count = 1;
  target = Expect(selector_.Select(inputs_));
  EXPECT_EQ(target.phase, RefactorPhase::kSatdCleanup);
  EXPECT_EQ(target.file, "src/c.rs");
}

TEST_F(TargetSelectorTest, ExhaustedWhenNothingIsLeft) {
  const auto result = selector_.Select(inputs_);

  EXPECT_TRUE(std::holds_alternative<Exhausted>(result));
}

TEST_F(TargetSelectorTest, FiltersApplyUnlessTargetsAreExplicit) {
  snapshot_.lint.all_violations = {Lint("src/a.rs", "x"), Lint("src/a.rs", "y"),
                                   Lint("src/b.rs", "x")};
  const TargetSelector filtered(SelectionFilters{{}, {"src/a.rs"}});
  EXPECT_EQ(Expect(filtered.Select(inputs_)).file, "src/b.rs");

  inputs_.explicit_targets = std::vector<std::string>{"src/a.rs"};
  EXPECT_EQ(Expect(filtered.Select(inputs_)).file, "src/a.rs");
}

TEST_F(TargetSelectorTest, SelectionRequiresAMeasurement) {
  inputs_.snapshot = nullptr;
  EXPECT_THROW(selector_.Select(inputs_), std::invalid_argument);
}

TEST(NonRefactorablePathTest, SkipsTestsAndGeneratedCode) {
  EXPECT_TRUE(IsNonRefactorable("tests/api.rs"));
  EXPECT_TRUE(IsNonRefactorable("build.rs"));
  EXPECT_TRUE(IsNonRefactorable("src/parser/mod.rs"));
  EXPECT_TRUE(IsNonRefactorable("benches/speed.rs"));
  EXPECT_TRUE(IsNonRefactorable("src/generated/api.rs"));
  EXPECT_FALSE(IsNonRefactorable("src/main.rs"));
  EXPECT_FALSE(IsNonRefactorable("src/lib.rs"));
}

} // namespace
} // namespace qgate
