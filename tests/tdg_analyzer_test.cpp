#include <qgate/tdg_analyzer.h>

#include <gtest/gtest.h>

namespace qgate {
namespace {

FileComplexity ComplexFile(const std::string &path, unsigned cyclomatic,
                           unsigned logical_lines) {
  FileComplexity file;
  file.path = path;
  FunctionInfo function;
  function.name = "f";
  function.cyclomatic = cyclomatic;
  file.functions.push_back(function);
  file.max_cyclomatic = cyclomatic;
  file.total_cyclomatic = cyclomatic;
  file.logical_lines = logical_lines;
  return file;
}

SatdItem Debt(const std::string &file, SatdSeverity severity) {
  SatdItem item;
  item.file = file;
  item.severity = severity;
  return item;
}

TEST(TdgAnalyzerTest, BandsFollowFixedThresholds) {
  EXPECT_EQ(ClassifyTdg(0.49), TdgBand::kHealthy);
  EXPECT_EQ(ClassifyTdg(0.5), TdgBand::kMonitor);
  EXPECT_EQ(ClassifyTdg(1.0), TdgBand::kRefactor);
  EXPECT_EQ(ClassifyTdg(2.0), TdgBand::kCritical);
  EXPECT_EQ(TdgBandName(TdgBand::kMonitor), "monitor");
}

TEST(TdgAnalyzerTest, SizeNormalizerNeverDropsBelowOne) {
  EXPECT_DOUBLE_EQ(SizeNormalizer(0), 1.0);
  EXPECT_DOUBLE_EQ(SizeNormalizer(100), 1.0);
  EXPECT_DOUBLE_EQ(SizeNormalizer(10000), 2.0);
}

TEST(TdgAnalyzerTest, CombinesComplexityChurnAndDebt) {
  ComplexityReport complexity;
  complexity.files = {ComplexFile("src/a.rs", 50, 10),
                      ComplexFile("src/b.rs", 5, 10000),
                      ComplexFile("src/c.rs", 10, 100)};
  ChurnReport churn;
  FileChurn busy;
  busy.path = "src/b.rs";
  busy.churn_score = 1.0;
  churn.files.push_back(busy);
  SatdReport satd;
  satd.items = {Debt("src/a.rs", SatdSeverity::kHigh),
                Debt("src/c.rs", SatdSeverity::kCritical),
                Debt("src/c.rs", SatdSeverity::kCritical),
                Debt("src/c.rs", SatdSeverity::kCritical)};

  const auto report = ComputeTdg(complexity, churn, satd, {});

  ASSERT_EQ(report.files.size(), 3u);
  EXPECT_EQ(report.files[0].path, "src/a.rs");
  EXPECT_NEAR(report.files[0].value, 2.45, 1e-9);
  EXPECT_EQ(report.files[0].band, TdgBand::kCritical);
  EXPECT_EQ(report.files[0].primary_factor, "complexity");

  EXPECT_EQ(report.files[1].path, "src/c.rs");
  EXPECT_NEAR(report.files[1].value, 1.65, 1e-9);
  EXPECT_EQ(report.files[1].primary_factor, "satd");

  EXPECT_EQ(report.files[2].path, "src/b.rs");
  EXPECT_NEAR(report.files[2].value, 0.2875, 1e-9);
  EXPECT_EQ(report.files[2].primary_factor, "churn");
  EXPECT_EQ(report.files[2].band, TdgBand::kHealthy);

  EXPECT_EQ(report.summary.critical_files, 1u);
  EXPECT_EQ(report.summary.warning_files, 1u);
  ASSERT_EQ(report.summary.hotspots.size(), 2u);
  EXPECT_EQ(report.summary.hotspots[0].path, "src/a.rs");
  EXPECT_NEAR(report.summary.p95_tdg, 2.45, 1e-9);
}

TEST(TdgAnalyzerTest, HotspotsAreCappedAtTheLimit) {
  ComplexityReport complexity;
  for (int i = 0; i < 15; ++i) {
    complexity.files.push_back(
        ComplexFile("src/f" + std::to_string(i) + ".rs", 40, 10));
  }

  const auto report = ComputeTdg(complexity, {}, {}, {});

  EXPECT_EQ(report.summary.hotspots.size(), 10u);
  EXPECT_EQ(report.summary.hotspots[0].path, "src/f0.rs");
}

TEST(TdgAnalyzerTest, DebtHoursCountComplexityOverageAndViolations) {
  ComplexityReport complexity;
  complexity.files = {ComplexFile("src/a.rs", 50, 10),
                      ComplexFile("src/c.rs", 10, 10)};
  ViolationDetail error;
  error.severity = Severity::kError;
  ViolationDetail warning;
  warning.severity = Severity::kWarning;

  EXPECT_DOUBLE_EQ(EstimateDebtHours(complexity, {error, warning}, 10), 20.75);
}

TEST(TdgAnalyzerTest, SatdItemsWeighByTheirSeverity) {
  SatdReport satd;
  satd.items = {Debt("src/a.rs", SatdSeverity::kLow),
                Debt("src/a.rs", SatdSeverity::kCritical)};

  const auto violations = SatdViolations(satd);

  ASSERT_EQ(violations.size(), 2u);
  EXPECT_EQ(violations[0].severity, Severity::kWarning);
  EXPECT_EQ(violations[1].severity, Severity::kError);
  EXPECT_EQ(violations[1].lint_name, "satd_item");
  // 15 minutes for the warning, 30 for the error.
  EXPECT_DOUBLE_EQ(EstimateDebtHours({}, violations, 10), 0.75);
}

} // namespace
} // namespace qgate
