#include <qgate/ai_request.h>

#include <gtest/gtest.h>

#include <sstream>

namespace qgate {
namespace {

RefactorPlan SamplePlan() {
  RefactorPlan plan;
  plan.rewrite.file_path = "src/parser.rs";
  plan.current_content = "fn parse() {}\n";
  plan.current_coverage = 42.5;
  plan.needs_tests = true;
  plan.rewrite.ast_metadata.functions = {{"parse", 1, 1, 1, 0}};

  ViolationDetail violation;
  violation.file = "src/parser.rs";
  violation.line = 1;
  violation.column = 4;
  violation.lint_name = "clippy::needless_return";
  violation.message = "unneeded `return` statement";
  violation.severity = Severity::kWarning;
  plan.violations.push_back(violation);
  return plan;
}

TEST(TestFilePathTest, SourcesGetSiblingTests) {
  EXPECT_EQ(TestFilePathFor("src/parser.rs"), "src/parser_test.rs");
  EXPECT_EQ(TestFilePathFor("server/src/api/routes.rs"),
            "server/src/api/routes_test.rs");
  EXPECT_EQ(TestFilePathFor("lib/util.py"), "tests/util_test.py");
}

TEST(AiRewriteRequestTest, CarriesPlanCoverageAndInstructions) {
  AiRequestContext context;
  context.file_context = "## src/parser.rs\n";
  context.issue_context = nlohmann::json{{"title", "Parser crash"}};

  const auto request = BuildAiRewriteRequest(SamplePlan(), context);

  EXPECT_EQ(request["task"], "unified_rewrite");
  EXPECT_EQ(request["file"], "src/parser.rs");
  EXPECT_EQ(request["context"], "## src/parser.rs\n");
  ASSERT_EQ(request["violations"].size(), 1u);
  EXPECT_EQ(request["violations"][0]["lint"], "clippy::needless_return");
  EXPECT_TRUE(request["violations"][0]["suggestion"].is_null());
  EXPECT_DOUBLE_EQ(request["coverage"]["current"].get<double>(), 42.5);
  EXPECT_DOUBLE_EQ(request["coverage"]["target"].get<double>(), 80.0);
  EXPECT_TRUE(request["coverage"]["needs_tests"].get<bool>());
  EXPECT_EQ(request["instructions"].size(), RewriteInstructions().size());
  EXPECT_EQ(request["output_files"][1]["path"], "src/parser_test.rs");
  EXPECT_EQ(request["issue_context"]["title"], "Parser crash");
  EXPECT_FALSE(request.contains("bug_report_context"));
}

TEST(AiRewriteRequestTest, EmittedRequestIsFramedBySentinels) {
  const auto request = BuildAiRewriteRequest(SamplePlan(), {});
  std::ostringstream transcript;
  transcript << "[iter 1] phase=LintFixes\n";
  EmitAiRewriteRequest(request, transcript);
  transcript << "trailing output\n";

  const auto text = transcript.str();
  EXPECT_NE(text.find("\nAI_REWRITE_REQUEST_START\n{"), std::string::npos);
  EXPECT_NE(text.find("}\nAI_REWRITE_REQUEST_END\n"), std::string::npos);

  const auto parsed = ParseAiRewriteRequest(text);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, request);
}

TEST(AiRewriteRequestTest, UnterminatedOrMalformedRequestsAreIgnored) {
  EXPECT_FALSE(ParseAiRewriteRequest("no request here").has_value());
  EXPECT_FALSE(
      ParseAiRewriteRequest("AI_REWRITE_REQUEST_START\n{}\n").has_value());
  EXPECT_FALSE(ParseAiRewriteRequest(
                   "AI_REWRITE_REQUEST_START\n{broken\nAI_REWRITE_REQUEST_END\n")
                   .has_value());
}

} // namespace
} // namespace qgate
