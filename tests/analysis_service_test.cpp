#include <qgate/analysis_service.h>

#include "test_support/scripted_process_runner.h"
#include "test_support/temporary_project.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace qgate {
namespace {

const char *const kBranchyLib = R"(pub fn classify(value: i32) -> i32 {
    if value < 0 && value > -10 {
        return -1;
    }
    for i in 0..value {
        if i % 2 == 0 {
            continue;
        }
    }
    match value {
        0 => 0,
        _ => 1,
    }
}

// TODO: split the parser out
fn helper() {}
)";

TEST(ParseAnalysisRequestTest, AppliesDefaultsForAnEmptyBody) {
  const auto request = ParseAnalysisRequest(nlohmann::json::object());

  EXPECT_EQ(request.project_path.generic_string(), ".");
  EXPECT_FALSE(request.format);
  EXPECT_EQ(request.top_files, 10u);
  EXPECT_EQ(request.threshold, 10u);
  EXPECT_EQ(request.period_days, 30u);
  EXPECT_DOUBLE_EQ(request.coverage_min, 80.0);
  EXPECT_DOUBLE_EQ(request.max_density, 0.05);
}

TEST(ParseAnalysisRequestTest, AcceptsCliStyleStrings) {
  const auto request = ParseAnalysisRequest({{"include", "src/**, lib/**"},
                                             {"exclude", {"target/**"}},
                                             {"strict", "true"},
                                             {"threshold", "15"},
                                             {"toolchain", "python"},
                                             {"format", "sarif"}});

  EXPECT_THAT(request.include_patterns,
              ::testing::ElementsAre("src/**", "lib/**"));
  EXPECT_THAT(request.exclude_patterns, ::testing::ElementsAre("target/**"));
  EXPECT_TRUE(request.strict_only);
  EXPECT_EQ(request.threshold, 15u);
  EXPECT_EQ(request.toolchain, Toolchain::kPythonUv);
  EXPECT_EQ(request.format, "sarif");
}

TEST(ParseAnalysisRequestTest, RejectsWrongTypes) {
  EXPECT_THROW(ParseAnalysisRequest(nlohmann::json::array()),
               std::invalid_argument);
  EXPECT_THROW(ParseAnalysisRequest({{"project_path", 3}}),
               std::invalid_argument);
  EXPECT_THROW(ParseAnalysisRequest({{"strict", "maybe"}}),
               std::invalid_argument);
  EXPECT_THROW(ParseAnalysisRequest({{"top_files", -1}}), std::invalid_argument);
  EXPECT_THROW(ParseAnalysisRequest({{"threshold", 2.5}}),
               std::invalid_argument);
  EXPECT_THROW(ParseAnalysisRequest({{"include", {1, 2}}}),
               std::invalid_argument);
}

TEST(AnalysisKindsTest, ListsEveryRoutedAnalysis) {
  EXPECT_EQ(AnalysisKinds().size(), 10u);
  EXPECT_THAT(AnalysisKinds(), ::testing::Contains("defect-prediction"));
}

class AnalysisServiceTest : public ::testing::Test {
protected:
  void SetUp() override {
    project_.AddFile("Cargo.toml", "[package]\nname = \"demo\"\n");
    project_.AddFile("src/lib.rs", kBranchyLib);
    ExecutionContext context;
    context.cwd = project_.root();
    service_ = std::make_unique<AnalysisService>(runner_, context);
  }

  test::TemporaryProject project_;
  std::shared_ptr<test::ScriptedProcessRunner> runner_ =
      std::make_shared<test::ScriptedProcessRunner>();
  std::unique_ptr<AnalysisService> service_;
};

TEST_F(AnalysisServiceTest, ComplexityFindsFunctionsOverTheThreshold) {
  AnalysisRequest request;
  request.threshold = 5;

  const auto document = service_->Analyze("complexity", request);

  EXPECT_EQ(document.analysis, "complexity");
  ASSERT_EQ(document.findings.size(), 1u);
  EXPECT_EQ(document.findings[0].file, "src/lib.rs");
  EXPECT_THAT(document.findings[0].message, ::testing::HasSubstr("'classify'"));
  EXPECT_EQ(document.body["threshold"], 5);
}

TEST_F(AnalysisServiceTest, SatdReportsMarkerComments) {
  const auto document = service_->Analyze("satd", AnalysisRequest{});

  ASSERT_EQ(document.findings.size(), 1u);
  EXPECT_EQ(document.findings[0].rule_id, "satd_item");
  EXPECT_EQ(document.findings[0].line, 16u);
  EXPECT_THAT(document.findings[0].message, ::testing::StartsWith("TODO"));
}

TEST_F(AnalysisServiceTest, TdgDebtHoursIncludeLintAndSatdFindings) {
  AnalysisRequest request;
  request.threshold = 20;
  const auto quiet = service_->Analyze("tdg", request);
  // The TODO alone: one low-severity item at 15 minutes.
  EXPECT_DOUBLE_EQ(quiet.body["summary"]["estimated_debt_hours"].get<double>(),
                   0.25);

  const nlohmann::json record = {
      {"reason", "compiler-message"},
      {"message",
       {{"message", "needless return"},
        {"level", "warning"},
        {"code", {{"code", "clippy::needless_return"}}},
        {"spans", nlohmann::json::array({{{"file_name", "src/lib.rs"},
                                          {"line_start", 3},
                                          {"line_end", 3},
                                          {"column_start", 9},
                                          {"column_end", 19},
                                          {"is_primary", true}}})},
        {"children", nlohmann::json::array()}}}};
  runner_->On("cargo", {"clippy"},
              test::ScriptedProcessRunner::Success(record.dump() + "\n"));

  const auto linted = service_->Analyze("tdg", request);
  EXPECT_DOUBLE_EQ(linted.body["summary"]["estimated_debt_hours"].get<double>(),
                   0.5);
}

TEST_F(AnalysisServiceTest, UnknownAnalysisIsRejected) {
  EXPECT_THROW(service_->Analyze("style", AnalysisRequest{}),
               std::invalid_argument);
}

TEST_F(AnalysisServiceTest, MissingProjectDirectoryIsRejected) {
  AnalysisRequest request;
  request.project_path = project_.root() / "absent";

  EXPECT_THROW(service_->Analyze("complexity", request), std::invalid_argument);
}

TEST_F(AnalysisServiceTest, HandleRendersTheRequestedFormat) {
  auto request = MakeUnifiedRequest("POST", "/api/v1/analyze/satd");
  request.body = R"({"format": "json"})";

  const auto response = service_->Handle("satd", request);

  ASSERT_EQ(response.status, 200);
  EXPECT_EQ(response.ContentType(), "application/json");
  const auto body = nlohmann::json::parse(response.body);
  EXPECT_EQ(body["analysis"], "satd");
  EXPECT_EQ(body["summary"]["total_items"], 1);
}

TEST_F(AnalysisServiceTest, RenderFallsBackToTheSummaryFormat) {
  AnalysisDocument document;
  document.analysis = "tdg";
  document.title = "Technical Debt Gradient";

  const auto response = service_->Render(document, std::nullopt);

  EXPECT_EQ(response.ContentType(), "text/plain");
  EXPECT_THAT(response.body,
              ::testing::StartsWith("Technical Debt Gradient (tdg)\n"));
  EXPECT_THROW(service_->Render(document, std::string("yaml")),
               std::invalid_argument);
}

} // namespace
} // namespace qgate
