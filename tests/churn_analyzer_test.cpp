#include <qgate/churn_analyzer.h>
#include <qgate/strings.h>

#include "test_support/scripted_process_runner.h"

#include <algorithm>
#include <iterator>
#include <sstream>

#include <gtest/gtest.h>

namespace qgate {
namespace {

const char *const kGitLog = "commit:aaa111|alice|2026-02-27T10:00:00Z\n"
                            "3\t1\tsrc/hot.rs\n"
                            "10\t0\tsrc/{old => new}/mod.rs\n"
                            "\n"
                            "commit:bbb222|bob|2026-02-26T09:30:00+02:00\n"
                            "1\t1\tsrc/hot.rs\n"
                            "-\t-\tassets/logo.png\n"
                            "commit:broken-line\n";

ChurnCommit Commit(const std::string &author, const std::string &date,
                   const std::vector<std::string> &paths) {
  ChurnCommit commit;
  commit.hash = author + date;
  commit.author = author;
  commit.date = ParseIsoTimestamp(date);
  for (const auto &path : paths) {
    commit.changes.push_back({path, 2, 1});
  }
  return commit;
}

ChurnOptions FixedClock() {
  ChurnOptions options;
  options.now = ParseIsoTimestamp("2026-03-01T00:00:00Z");
  return options;
}

TEST(ChurnAnalyzerTest, ParsesNumstatLogIncludingRenamesAndBinaries) {
  const auto commits = ParseGitLog(kGitLog);

  ASSERT_EQ(commits.size(), 2u);
  EXPECT_EQ(commits[0].hash, "aaa111");
  EXPECT_EQ(commits[0].author, "alice");
  ASSERT_EQ(commits[0].changes.size(), 2u);
  EXPECT_EQ(commits[0].changes[0].additions, 3u);
  EXPECT_EQ(commits[0].changes[0].deletions, 1u);
  EXPECT_EQ(commits[0].changes[1].path, "src/new/mod.rs");
  ASSERT_EQ(commits[1].changes.size(), 2u);
  EXPECT_EQ(commits[1].changes[1].additions, 0u);
  EXPECT_EQ(FormatIsoTimestamp(commits[1].date), "2026-02-26T07:30:00Z");
}

TEST(ChurnAnalyzerTest, ClassifiesHotspotsAndStableFiles) {
  std::vector<ChurnCommit> commits;
  for (int day = 23; day <= 28; ++day) {
    commits.push_back(Commit(day % 2 == 0 ? "alice" : "bob",
                             "2026-02-" + std::to_string(day) + "T12:00:00Z",
                             {"src/hot.rs"}));
  }
  commits.push_back(Commit("carol", "2025-11-01T12:00:00Z", {"src/old.rs"}));
  commits.push_back(Commit("carol", "2026-02-20T12:00:00Z", {"untracked.txt"}));

  const auto report = BuildChurnReport(
      commits, {"src/hot.rs", "src/old.rs"}, FixedClock());

  ASSERT_EQ(report.files.size(), 2u);
  EXPECT_EQ(report.files[0].path, "src/hot.rs");
  EXPECT_DOUBLE_EQ(report.files[0].churn_score, 1.0);
  EXPECT_EQ(report.files[0].commit_count, 6u);
  EXPECT_EQ(report.files[0].additions, 12u);
  EXPECT_EQ(report.files[0].unique_authors,
            (std::vector<std::string>{"alice", "bob"}));
  EXPECT_LT(report.files[1].churn_score, 0.2);

  EXPECT_EQ(report.summary.total_commits, 8u);
  EXPECT_EQ(report.summary.total_files_changed, 2u);
  EXPECT_EQ(report.summary.hotspot_files, std::vector<std::string>{"src/hot.rs"});
  EXPECT_EQ(report.summary.stable_files, std::vector<std::string>{"src/old.rs"});
  EXPECT_EQ(report.summary.author_contributions.at("carol"), 2u);
}

TEST(ChurnAnalyzerTest, RunsGitLogInTheProjectRoot) {
  auto runner = std::make_shared<test::ScriptedProcessRunner>();
  runner->On("git", {"log", "--numstat"},
             test::ScriptedProcessRunner::Success(kGitLog));

  SourceSet sources;
  sources.root = "/work/project";
  sources.files = {"src/hot.rs", "src/new/mod.rs"};
  ExecutionContext context;
  context.cwd = sources.root;

  auto options = FixedClock();
  options.period_days = 90;
  const auto report = ChurnAnalyzer(runner, options).Analyze(sources, context);

  ASSERT_EQ(runner->calls().size(), 1u);
  EXPECT_EQ(runner->calls()[0].working_directory, sources.root);
  EXPECT_TRUE(runner->WasCalled("git", "--since=90 days ago"));
  EXPECT_EQ(report.summary.period_days, 90u);
  ASSERT_NE(report.Find("src/hot.rs"), nullptr);
  EXPECT_EQ(report.Find("src/hot.rs")->commit_count, 2u);
  EXPECT_EQ(report.Find("assets/logo.png"), nullptr);
}

TEST(ChurnAnalyzerTest, NestedProjectSeesOnlyItsOwnPathsRelativeToItsRoot) {
  // Answers like git run from `/repo/services/api`: repository-relative
  // paths and every commit unless the log is scoped to the directory.
  auto runner = std::make_shared<test::ScriptedProcessRunner>();
  runner->OnCall("git", {"log"}, [](const ProcessRequest &request) {
    const auto &args = request.arguments;
    const bool relative =
        std::find(args.begin(), args.end(), "--relative") != args.end();
    const auto separator = std::find(args.begin(), args.end(), "--");
    const bool scoped = separator != args.end() &&
                        std::next(separator) != args.end() &&
                        *std::next(separator) == ".";
    std::string log = "commit:aaa111|alice|2026-02-27T10:00:00Z\n";
    log += relative ? "4\t1\tsrc/lib.rs\n" : "4\t1\tservices/api/src/lib.rs\n";
    if (!scoped) {
      log += "9\t9\tweb/src/lib.rs\n"
             "commit:bbb222|bob|2026-02-26T09:30:00Z\n"
             "2\t2\tweb/src/lib.rs\n";
    }
    return test::ScriptedProcessRunner::Success(log);
  });

  SourceSet sources;
  sources.root = "/repo/services/api";
  sources.files = {"src/lib.rs"};

  const auto report =
      ChurnAnalyzer(runner, FixedClock()).Analyze(sources, ExecutionContext{});

  EXPECT_EQ(runner->calls()[0].working_directory, sources.root);
  ASSERT_NE(report.Find("src/lib.rs"), nullptr);
  EXPECT_EQ(report.Find("src/lib.rs")->commit_count, 1u);
  EXPECT_EQ(report.Find("web/src/lib.rs"), nullptr);
  EXPECT_EQ(report.summary.total_commits, 1u);
}

TEST(ChurnAnalyzerTest, GitFailureYieldsAnEmptyReport) {
  auto runner = std::make_shared<test::ScriptedProcessRunner>();
  runner->On("git", {"log"},
             test::ScriptedProcessRunner::Failure(128, "not a git repository"));
  std::ostringstream log_output;
  auto logger = MakeLogger(LoggingConfig{LogLevel::kWarn}, log_output);

  SourceSet sources;
  sources.root = "/work/project";
  const auto report =
      ChurnAnalyzer(runner, FixedClock(), logger).Analyze(sources, {});

  EXPECT_TRUE(report.files.empty());
  EXPECT_EQ(report.summary.period_days, 30u);
  EXPECT_NE(log_output.str().find("churn.git.failed"), std::string::npos);
}

TEST(ChurnAnalyzerTest, RequiresAProcessRunner) {
  EXPECT_THROW(ChurnAnalyzer(nullptr), std::invalid_argument);
}

} // namespace
} // namespace qgate
