#include <qgate/coverage.h>

#include "test_support/scripted_process_runner.h"
#include "test_support/temporary_project.h"

#include <algorithm>
#include <fstream>
#include <sstream>

#include <gtest/gtest.h>

namespace qgate {
namespace {

const char *const kLlvmReport =
    "Filename     Functions  Missed Functions  Executed  Lines  Missed Lines  Cover\n"
    "----------------------------------------------------------------------------\n"
    "src/lib.rs           4                 1    75.00%     50            10  80.00%\n"
    "src/util.rs          2                 0   100.00%     20             5  75.00%\n"
    "----------------------------------------------------------------------------\n"
    "TOTAL                6                 1    83.33%     70            15  78.57%\n";

using test::ScriptedProcessRunner;

TEST(CoverageParsingTest, LlvmReportReadsTheLineCoverageColumn) {
  EXPECT_EQ(ParseLlvmCovReport(kLlvmReport, "src/util.rs"),
            std::optional<double>(75.0));
  EXPECT_EQ(ParseLlvmCovReport(kLlvmReport, "src/other.rs"),
            std::optional<double>(78.57));
  EXPECT_FALSE(ParseLlvmCovReport("no table here", "src/lib.rs").has_value());

  const auto files = ParseLlvmCovFiles(kLlvmReport);
  ASSERT_EQ(files.size(), 2u);
  EXPECT_DOUBLE_EQ(files.at("src/lib.rs"), 80.0);
}

TEST(CoverageParsingTest, GrcovAndTarpaulinFormats) {
  EXPECT_EQ(ParseGrcovReport("src/a.rs: 10.00%\nsrc/lib.rs: 66.50%\n",
                             "src/lib.rs"),
            std::optional<double>(66.5));
  EXPECT_FALSE(ParseGrcovReport("src/a.rs: 10.00%\n", "src/lib.rs").has_value());

  EXPECT_EQ(ParseTarpaulinSummary("|| src/lib.rs: 8/10 80.00%\n", "src/lib.rs"),
            std::optional<double>(80.0));
  EXPECT_EQ(ParseTarpaulinSummary("73.45% coverage, 40/50 lines covered\n",
                                  "src/lib.rs"),
            std::optional<double>(73.45));
}

class CoverageSamplerTest : public ::testing::Test {
protected:
  void SetUp() override {
    project_.AddFile("Cargo.toml", "[package]\nname = \"demo-app\"\n");
    project_.AddFile("src/lib.rs", "pub fn a() {}\n");
    sources_.root = project_.root();
    sources_.files = {"src/lib.rs"};
    context_.cwd = project_.root();
    context_.cache_dir = project_.root() / ".qgate_cache";
    runner_ = std::make_shared<ScriptedProcessRunner>();
  }

  const ProcessRequest *FindCall(const std::string &program,
                                 const std::string &argument) {
    calls_ = runner_->calls();
    for (const auto &call : calls_) {
      if (call.program == program &&
          std::find(call.arguments.begin(), call.arguments.end(), argument) !=
              call.arguments.end()) {
        return &call;
      }
    }
    return nullptr;
  }

  test::TemporaryProject project_;
  SourceSet sources_;
  ExecutionContext context_;
  std::shared_ptr<ScriptedProcessRunner> runner_;
  std::vector<ProcessRequest> calls_;
};

TEST_F(CoverageSamplerTest, FallsBackToTarpaulinWhenLlvmAndGrcovFail) {
  runner_->On("cargo", {"tarpaulin"},
              ScriptedProcessRunner::Success(
                  "82.50% coverage, 33/40 lines covered\n"));
  runner_->On("cargo", {"build"}, ScriptedProcessRunner::Failure(101));

  CoverageSampler sampler(runner_);
  EXPECT_DOUBLE_EQ(sampler.MeasureFile(sources_, "src/lib.rs", context_), 82.5);

  EXPECT_TRUE(runner_->WasCalled("grcov"));
  const auto *tarpaulin = FindCall("cargo", "tarpaulin");
  ASSERT_NE(tarpaulin, nullptr);
  ASSERT_TRUE(tarpaulin->timeout.has_value());
  EXPECT_EQ(tarpaulin->timeout->count(), 30000);
  EXPECT_NE(std::find(tarpaulin->arguments.begin(), tarpaulin->arguments.end(),
                      "--include-files"),
            tarpaulin->arguments.end());
}

TEST_F(CoverageSamplerTest, UsesGrcovBeforeTarpaulin) {
  runner_->On("grcov", {}, ScriptedProcessRunner::Success("src/lib.rs: 55.00%\n"));

  CoverageSampler sampler(runner_);
  EXPECT_DOUBLE_EQ(sampler.MeasureFile(sources_, "src/lib.rs", context_), 55.0);
  EXPECT_FALSE(runner_->WasCalled("cargo", "tarpaulin"));
  const auto *grcov = FindCall("grcov", "--binary-path");
  ASSERT_NE(grcov, nullptr);
  ASSERT_TRUE(grcov->timeout.has_value());
  EXPECT_EQ(grcov->timeout->count(), 30000);
}

TEST_F(CoverageSamplerTest, EveryToolFailingYieldsZero) {
  CoverageSampler sampler(runner_);

  EXPECT_DOUBLE_EQ(sampler.MeasureFile(sources_, "src/lib.rs", context_), 0.0);
  const auto project = sampler.MeasureProject(sources_, context_);
  EXPECT_DOUBLE_EQ(project.percent, 0.0);
  EXPECT_EQ(project.method, "none");
}

TEST_F(CoverageSamplerTest, NonRustProjectsAreNotMeasuredAndSayWhy) {
  sources_.toolchain = Toolchain::kGo;
  std::ostringstream log_output;
  CoverageSampler sampler(runner_, {},
                          MakeLogger(LoggingConfig{LogLevel::kWarn}, log_output));

  EXPECT_DOUBLE_EQ(sampler.MeasureFile(sources_, "main.go", context_), 0.0);
  EXPECT_TRUE(runner_->calls().empty());
  EXPECT_NE(log_output.str().find("coverage.unsupported"), std::string::npos);
  EXPECT_NE(log_output.str().find("main.go"), std::string::npos);
}

TEST_F(CoverageSamplerTest, MeasuresTheProjectWithLlvmProfiles) {
  project_.AddFile("target/debug/deps/demo_app-1a2b3c", "binary");
  project_.AddFile("target/debug/deps/demo_app-1a2b3c.d", "deps");
  runner_->On("cargo", {"build", "--tests"}, ScriptedProcessRunner::Success());
  runner_->OnCall("cargo", {"test"}, [](const ProcessRequest &request) {
    const std::filesystem::path pattern =
        request.environment.at("LLVM_PROFILE_FILE");
    std::ofstream(pattern.parent_path() / "123-456.profraw") << "raw";
    return ScriptedProcessRunner::Success();
  });
  runner_->On("llvm-profdata", {"merge"}, ScriptedProcessRunner::Success());
  runner_->On("llvm-cov", {"report"}, ScriptedProcessRunner::Success(kLlvmReport));

  CoverageSampler sampler(runner_);
  const auto coverage = sampler.MeasureProject(sources_, context_);

  EXPECT_EQ(coverage.method, "llvm-cov");
  EXPECT_DOUBLE_EQ(coverage.percent, 78.57);
  EXPECT_EQ(coverage.by_file.size(), 2u);
  const auto *report = FindCall("llvm-cov", "report");
  ASSERT_NE(report, nullptr);
  EXPECT_EQ(report->arguments[1],
            (project_.root() / "target/debug/deps/demo_app-1a2b3c").string());
  ASSERT_TRUE(report->timeout.has_value());
  EXPECT_EQ(report->timeout->count(), 30000);
  const auto *merge = FindCall("llvm-profdata", "merge");
  ASSERT_NE(merge, nullptr);
  EXPECT_TRUE(merge->timeout.has_value());
  const auto *build = FindCall("cargo", "build");
  ASSERT_NE(build, nullptr);
  EXPECT_EQ(build->environment.at("RUSTFLAGS"), "-C instrument-coverage");
}

TEST(CoverageCacheTest, PersistsClampedValues) {
  test::TemporaryProject project;
  const auto cache_dir = project.root() / ".qgate_cache";
  {
    CoverageCache cache(cache_dir);
    cache.Put("src/lib.rs", 120.0);
    cache.Put("src/a b.rs", 42.5);
    cache.Save();
  }

  CoverageCache reloaded(cache_dir);
  reloaded.Load();

  EXPECT_EQ(reloaded.path().generic_string(),
            (cache_dir / "coverage" / "file_coverage.tsv").generic_string());
  EXPECT_EQ(reloaded.Get("src/lib.rs"), std::optional<double>(100.0));
  EXPECT_EQ(reloaded.Get("src/a b.rs"), std::optional<double>(42.5));
  EXPECT_FALSE(reloaded.Get("src/missing.rs").has_value());
}

} // namespace
} // namespace qgate
