#include <qgate/issue_context.h>

#include "test_support/scripted_process_runner.h"
#include "test_support/temporary_project.h"

#include <gtest/gtest.h>

#include <algorithm>

namespace qgate {
namespace {

constexpr char kIssueJson[] = R"({
  "number": 42,
  "title": "Parser is slow and crashes",
  "body": null,
  "state": "open",
  "html_url": "https://github.com/acme/widgets/issues/42",
  "labels": [{"name": "bug"}, {"name": "performance"}]
})";

bool HasArgument(const ProcessRequest &request, const std::string &argument) {
  return std::find(request.arguments.begin(), request.arguments.end(),
                   argument) != request.arguments.end();
}

TEST(IssueUrlTest, ParsesOwnerRepositoryAndNumber) {
  const auto reference =
      ParseIssueUrl("https://github.com/acme/widgets/issues/42");

  EXPECT_EQ(reference.owner, "acme");
  EXPECT_EQ(reference.repository, "widgets");
  EXPECT_EQ(reference.number, 42u);
  EXPECT_EQ(reference.ApiUrl(),
            "https://api.github.com/repos/acme/widgets/issues/42");
}

TEST(IssueUrlTest, RejectsNonIssueUrls) {
  EXPECT_THROW(ParseIssueUrl("https://github.com/acme/widgets/pull/42"),
               std::invalid_argument);
  EXPECT_THROW(ParseIssueUrl("not a url"), std::invalid_argument);
}

TEST(IssueJsonTest, ToleratesNullBodyAndCollectsLabels) {
  const auto issue = ParseIssueJson(kIssueJson);

  EXPECT_EQ(issue.number, 42u);
  EXPECT_EQ(issue.title, "Parser is slow and crashes");
  EXPECT_TRUE(issue.body.empty());
  EXPECT_EQ(issue.labels, (std::vector<std::string>{"bug", "performance"}));
  EXPECT_THROW(ParseIssueJson("{\"message\": \"Not Found\"}"),
               std::runtime_error);
  EXPECT_THROW(ParseIssueJson("<html>"), std::runtime_error);
}

TEST(IssueParsingTest, ExtractsBacktickedBareAndModulePaths) {
  const auto paths = ExtractIssueFilePaths(
      "Crash in `src/parser.rs` when lexer::token fails");

  EXPECT_EQ(paths, (std::vector<std::string>{"server/src/lexer/token.rs",
                                             "src/lexer/token.rs",
                                             "src/parser.rs"}));
}

TEST(IssueParsingTest, KeywordWeightsAreNormalizedToTheStrongestCategory) {
  const auto keywords =
      ExtractIssueKeywords("The parser is slow and crashes with a panic.");

  ASSERT_EQ(keywords.size(), 2u);
  EXPECT_DOUBLE_EQ(keywords.at("Correctness"), 1.0);
  EXPECT_DOUBLE_EQ(keywords.at("Performance"), 0.5);
}

TEST(IssueParsingTest, SummaryUsesTheFirstParagraph) {
  GitHubIssue issue;
  issue.title = "Refactor lexer";
  issue.body = "The lexer is confusing.\n\nMore detail follows.";

  const auto parsed = ParseIssue(issue);

  EXPECT_EQ(parsed.summary, "Refactor lexer\n\nThe lexer is confusing.");
  EXPECT_EQ(parsed.keywords.count("Complexity"), 1u);

  GitHubIssue long_issue;
  long_issue.title = "Long";
  long_issue.body = std::string(300, 'x');
  EXPECT_EQ(ParseIssue(long_issue).summary,
            "Long\n\n" + std::string(200, 'x') + "...");
}

TEST(IssueParsingTest, ContextJsonNamesPriorityAreas) {
  const auto parsed = ParseIssue(ParseIssueJson(kIssueJson));

  const auto json = IssueContextJson(parsed);

  EXPECT_EQ(json["title"], "Parser is slow and crashes");
  EXPECT_EQ(json["priority_areas"],
            nlohmann::json::array({"Correctness", "Performance"}));
  EXPECT_NE(json["instructions"].get<std::string>().find(
                "Correctness, Performance"),
            std::string::npos);
}

TEST(GitHubIssueClientTest, SendsTokenAndParsesResponse) {
  auto runner = std::make_shared<test::ScriptedProcessRunner>();
  runner->On("curl", {"https://api.github.com/repos/acme/widgets/issues/42"},
             test::ScriptedProcessRunner::Success(kIssueJson));
  ExecutionContext context;
  context.env["GH_TOKEN"] = "secret";

  const auto issue = GitHubIssueClient(runner).Fetch(
      "https://github.com/acme/widgets/issues/42", context);

  EXPECT_EQ(issue.number, 42u);
  ASSERT_EQ(runner->calls().size(), 1u);
  EXPECT_TRUE(HasArgument(runner->calls().front(),
                          "Authorization: Bearer secret"));
}

TEST(GitHubIssueClientTest, FailedRequestIsAnError) {
  auto runner = std::make_shared<test::ScriptedProcessRunner>();
  runner->On("curl", {},
             test::ScriptedProcessRunner::Failure(22, "404 Not Found"));

  const GitHubIssueClient client(runner);

  EXPECT_THROW(client.Fetch("https://github.com/acme/widgets/issues/7", {}),
               std::runtime_error);
  EXPECT_FALSE(HasArgument(runner->calls().front(),
                           "Authorization: Bearer secret"));
}

TEST(BugReportTest, CollectsPathsOutsideCodeFences) {
  const auto files = ExtractBugReportFiles(
      "# Crash\n\n"
      "The failure starts in src/parser.rs, see docs/usage.md.\n"
      "```\n"
      "src/ignored.rs\n"
      "```\n"
      "Visit https://example.com/src/x.rs\n");

  EXPECT_EQ(files, (std::vector<std::string>{"docs/usage.md", "src/parser.rs"}));
}

TEST(BugReportTest, LoadingAMissingReportIsAConfigurationError) {
  test::TemporaryProject project;
  const auto path = project.AddFile("BUG.md", "Broken in src/lib.rs\n");

  const auto report = LoadBugReport(path);

  EXPECT_EQ(report.mentioned_files, (std::vector<std::string>{"src/lib.rs"}));
  EXPECT_EQ(BugReportContextJson(report)["type"], "markdown_bug_report");
  EXPECT_THROW(LoadBugReport(project.root() / "missing.md"),
               std::invalid_argument);
}

TEST(TestDependencyTest, ResolvesUseStatementsAndQuotedFiles) {
  test::TemporaryProject project;
  project.AddFile("src/parser.rs", "pub struct Parser;\n");
  project.AddFile("src/lexer.rs", "pub struct Lexer;\n");
  project.AddFile("tests/parser_test.rs",
                  "use crate::parser::Parser;\n"
                  "use std::fmt;\n"
                  "const FIXTURE: &str = include_str!(\"src/lexer.rs\");\n"
                  "const GONE: &str = \"src/missing.rs\";\n");

  const auto dependencies =
      DiscoverTestDependencies(project.root(), "tests/parser_test.rs");

  EXPECT_EQ(dependencies,
            (std::vector<std::string>{"src/lexer.rs", "src/parser.rs"}));
}

TEST(MentionedFilesTest, ExactPathsWinOverFileNameMatches) {
  test::TemporaryProject project;
  project.AddFile("src/parser.rs");
  project.AddFile("src/a/lexer.rs");
  SourceSet sources;
  sources.root = project.root();
  sources.files = {"src/a/lexer.rs", "src/parser.rs"};

  const auto resolved = ResolveMentionedFiles(
      project.root(), {"src/parser.rs", "lexer.rs", "nowhere.rs"}, sources);

  EXPECT_EQ(resolved,
            (std::vector<std::string>{"src/a/lexer.rs", "src/parser.rs"}));
}

} // namespace
} // namespace qgate
