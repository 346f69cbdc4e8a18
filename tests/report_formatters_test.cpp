#include <qgate/analysis_document.h>
#include <qgate/report_formatters.h>
#include <qgate/strings.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace qgate {
namespace {

AnalysisDocument SampleDocument() {
  AnalysisDocument document;
  document.analysis = "satd";
  document.title = "Self-Admitted Technical Debt";
  document.generated_at = ParseIsoTimestamp("2026-03-01T12:00:00Z");
  document.body = {{"summary", {{"total_items", 2}}}};
  document.summary = {{"Items", "2"}, {"Files with debt", "1"}};
  document.findings = {
      {"satd_item", "error", "HACK: bypass | the cache", "src/cache.rs", 4},
      {"satd_item", "note", "TODO: rename", "src/cache.rs", 0}};
  return document;
}

ComplexityReport TangledReport() {
  FileComplexity file;
  file.path = "src/route.rs";
  file.functions = {{"small", 1, 3, 2, 1}, {"tangled", 5, 40, 12, 15},
                    {"hopeless", 42, 90, 25, 30}};
  file.max_cyclomatic = 25;
  ComplexityReport report;
  report.files = {file};
  report.summary = SummarizeComplexity(report.files, 10);
  return report;
}

TEST(ReportFormattersTest, SummaryListsHeadlineMetrics) {
  const auto text = SummaryFormatter{}.Render(SampleDocument());

  EXPECT_EQ(text, "Self-Admitted Technical Debt (satd)\n"
                  "  Items: 2\n"
                  "  Files with debt: 1\n"
                  "  Findings: 2\n");
}

TEST(ReportFormattersTest, FullAppendsEveryFinding) {
  const auto text = FullFormatter{}.Render(SampleDocument());

  EXPECT_THAT(text, ::testing::HasSubstr(
                        "src/cache.rs:4 [error] satd_item: HACK: bypass | the cache\n"));
  EXPECT_THAT(text, ::testing::HasSubstr("src/cache.rs:0 [note] satd_item"));
}

TEST(ReportFormattersTest, JsonAddsAnalysisAndTimestampAtTopLevel) {
  const auto json = nlohmann::json::parse(JsonFormatter{}.Render(SampleDocument()));

  EXPECT_EQ(json["analysis"], "satd");
  EXPECT_EQ(json["generated_at"], "2026-03-01T12:00:00Z");
  EXPECT_EQ(json["summary"]["total_items"], 2);
  EXPECT_FALSE(json["summary"].contains("generated_at"));
}

TEST(ReportFormattersTest, SarifDeclaresEachRuleOnce) {
  const auto sarif = RenderSarif(SampleDocument());

  EXPECT_EQ(sarif["version"], "2.1.0");
  EXPECT_EQ(sarif["$schema"], "https://json.schemastore.org/sarif-2.1.0.json");
  const auto &run = sarif["runs"][0];
  EXPECT_EQ(run["tool"]["driver"]["name"], "qgate");
  ASSERT_EQ(run["tool"]["driver"]["rules"].size(), 1u);
  ASSERT_EQ(run["results"].size(), 2u);
  EXPECT_EQ(run["results"][0]["level"], "error");
  EXPECT_EQ(run["results"][1]["locations"][0]["physicalLocation"]["region"]
               ["startLine"],
            1);
}

TEST(ReportFormattersTest, MarkdownEscapesTableCells) {
  const auto markdown = MarkdownFormatter{}.Render(SampleDocument());

  EXPECT_THAT(markdown,
              ::testing::StartsWith("# Self-Admitted Technical Debt Report\n"));
  EXPECT_THAT(markdown, ::testing::HasSubstr("| Items | 2 |"));
  EXPECT_THAT(markdown, ::testing::HasSubstr("HACK: bypass \\| the cache"));
}

TEST(ReportFormattersTest, MarkdownWithoutFindingsSaysNone) {
  auto document = SampleDocument();
  document.findings.clear();

  EXPECT_THAT(MarkdownFormatter{}.Render(document),
              ::testing::HasSubstr("| None | - | - | - | - |"));

  document.markdown = "# Prepared\n";
  EXPECT_EQ(MarkdownFormatter{}.Render(document), "# Prepared\n");
}

TEST(ReportFormattersTest, EnforcementJsonNeedsALintHotspotBody) {
  auto document = SampleDocument();
  EXPECT_THROW(EnforcementJsonFormatter{}.Render(document),
               std::invalid_argument);

  document.body = {{"enforcement", {{"enforcement_score", 3.0}}}};
  EXPECT_EQ(nlohmann::json::parse(EnforcementJsonFormatter{}.Render(document)),
            document.body);
}

TEST(AnalysisDocumentTest, ComplexityFindingsEscalateAtTwiceTheThreshold) {
  const auto document =
      ComplexityDocument(TangledReport(), 10, 5, ParseIsoTimestamp("2026-03-01T00:00:00Z"));

  ASSERT_EQ(document.findings.size(), 2u);
  EXPECT_EQ(document.findings[0].level, "warning");
  EXPECT_EQ(document.findings[0].message,
            "Function 'tangled' has cyclomatic complexity 12 (threshold 10)");
  EXPECT_EQ(document.findings[1].level, "error");
  EXPECT_EQ(document.findings[1].line, 42u);
  EXPECT_EQ(document.body["threshold"], 10);
  EXPECT_THAT(document.summary,
              ::testing::Contains(std::make_pair(std::string("Max cyclomatic"),
                                                 std::string("25"))));
}

TEST(AnalysisDocumentTest, SatdLevelsFollowSeverity) {
  SatdItem hack;
  hack.file = "src/a.rs";
  hack.line = 3;
  hack.marker = "HACK";
  hack.text = "skip validation";
  hack.severity = SatdSeverity::kHigh;
  SatdItem todo = hack;
  todo.line = 9;
  todo.marker = "TODO";
  todo.text = "later";
  todo.severity = SatdSeverity::kLow;
  SatdReport report;
  report.items = {hack, todo};
  report.summary = SummarizeSatd(report.items);

  const auto document = SatdDocument(report, {});

  ASSERT_EQ(document.findings.size(), 2u);
  EXPECT_EQ(document.findings[0].level, "error");
  EXPECT_EQ(document.findings[0].message, "HACK: skip validation");
  EXPECT_EQ(document.findings[1].level, "note");
}

TEST(AnalysisDocumentTest, CoverageGapsBelowTheMinimum) {
  ProjectCoverage coverage;
  coverage.percent = 72.5;
  coverage.method = "grcov";
  coverage.by_file = {{"src/a.rs", 95.0}, {"src/b.rs", 40.0}};

  const auto document = CoverageDocument(coverage, 80.0, {});

  ASSERT_EQ(document.findings.size(), 1u);
  EXPECT_EQ(document.findings[0].file, "src/b.rs");
  EXPECT_EQ(document.findings[0].message, "Coverage 40.00% is below 80.00%");
  EXPECT_EQ(document.body["method"], "grcov");
}

} // namespace
} // namespace qgate
