#include <qgate/dead_code_analyzer.h>

#include "test_support/temporary_project.h"

#include <gtest/gtest.h>

namespace qgate {
namespace {

class DeadCodeAnalyzerTest : public ::testing::Test {
protected:
  void SetUp() override {
    project_.AddFile("src/main.rs", "mod util;\n"
                                    "\n"
                                    "fn main() {\n"
                                    "    println!(\"{}\", util::used() + util::early());\n"
                                    "}\n");
    project_.AddFile("src/util.rs", "pub fn used() -> i32 {\n"
                                    "    1\n"
                                    "}\n"
                                    "\n"
                                    "fn unused_helper() -> i32 {\n"
                                    "    2\n"
                                    "}\n"
                                    "\n"
                                    "pub fn early() -> i32 {\n"
                                    "    return 3;\n"
                                    "    let x = 4;\n"
                                    "}\n");
    project_.AddFile("src/orphan.rs", "pub fn lonely() {}\n");
    project_.AddFile("tests/it.rs", "fn helper_only() {}\n");
    sources_.root = project_.root();
    sources_.files = {"src/main.rs", "src/orphan.rs", "src/util.rs",
                      "tests/it.rs"};
  }

  test::TemporaryProject project_;
  SourceSet sources_;
};

TEST_F(DeadCodeAnalyzerTest, ReportsUnreferencedFunctionsAndUnreachableCode) {
  const auto report = DeadCodeAnalyzer().Analyze(sources_);

  const auto *util = report.Find("src/util.rs");
  ASSERT_NE(util, nullptr);
  ASSERT_EQ(util->items.size(), 2u);
  EXPECT_EQ(util->items[0].item_type, "function");
  EXPECT_EQ(util->items[0].name, "unused_helper");
  EXPECT_EQ(util->items[0].line, 5u);
  EXPECT_EQ(util->items[0].confidence, DeadCodeConfidence::kHigh);
  EXPECT_EQ(util->items[1].item_type, "unreachable");
  EXPECT_EQ(util->items[1].line, 11u);
  EXPECT_EQ(util->dead_functions, 1u);
  EXPECT_EQ(util->unreachable_blocks, 1u);
  EXPECT_EQ(util->dead_lines, 4u);
  EXPECT_EQ(util->total_lines, 10u);
  EXPECT_DOUBLE_EQ(util->dead_percentage, 40.0);
}

TEST_F(DeadCodeAnalyzerTest, FlagsModulesNothingImports) {
  const auto report = DeadCodeAnalyzer().Analyze(sources_);

  const auto *orphan = report.Find("src/orphan.rs");
  ASSERT_NE(orphan, nullptr);
  EXPECT_EQ(orphan->dead_modules, 1u);
  ASSERT_EQ(orphan->items.size(), 1u);
  EXPECT_EQ(orphan->items[0].item_type, "module");
  EXPECT_EQ(orphan->items[0].confidence, DeadCodeConfidence::kMedium);
  EXPECT_EQ(report.Find("src/main.rs"), nullptr);
}

TEST_F(DeadCodeAnalyzerTest, OrdersFilesByDeadLines) {
  const auto report = DeadCodeAnalyzer().Analyze(sources_);

  ASSERT_EQ(report.files.size(), 2u);
  EXPECT_EQ(report.files[0].path, "src/util.rs");
  EXPECT_EQ(report.files[1].path, "src/orphan.rs");
  EXPECT_EQ(report.summary.total_files_analyzed, 4u);
  EXPECT_EQ(report.summary.files_with_dead_code, 2u);
  EXPECT_EQ(report.summary.total_dead_lines, 5u);
}

TEST_F(DeadCodeAnalyzerTest, TestFilesAreSkippedUnlessRequested) {
  EXPECT_EQ(DeadCodeAnalyzer().Analyze(sources_).Find("tests/it.rs"), nullptr);

  DeadCodeOptions options;
  options.include_tests = true;
  const auto report = DeadCodeAnalyzer(options).Analyze(sources_);
  const auto *tests = report.Find("tests/it.rs");
  ASSERT_NE(tests, nullptr);
  EXPECT_EQ(tests->items[0].name, "helper_only");
}

TEST_F(DeadCodeAnalyzerTest, MinimumDeadLinesAndTopFilesTrimTheReport) {
  DeadCodeOptions options;
  options.min_dead_lines = 2;
  EXPECT_EQ(DeadCodeAnalyzer(options).Analyze(sources_).files.size(), 1u);

  options.min_dead_lines = 0;
  options.top_files = 1;
  const auto report = DeadCodeAnalyzer(options).Analyze(sources_);
  ASSERT_EQ(report.files.size(), 1u);
  EXPECT_EQ(report.files[0].path, "src/util.rs");
}

TEST(DeadCodePythonTest, StatementsAfterReturnAreUnreachable) {
  test::TemporaryProject project;
  project.AddFile("main.py", "def run():\n"
                             "    return 1\n"
                             "    print(\"never\")\n");
  SourceSet sources;
  sources.root = project.root();
  sources.toolchain = Toolchain::kPythonUv;
  sources.files = {"main.py"};

  const auto report = DeadCodeAnalyzer().Analyze(sources);

  const auto *file = report.Find("main.py");
  ASSERT_NE(file, nullptr);
  EXPECT_EQ(file->unreachable_blocks, 1u);
  EXPECT_EQ(file->confidence, DeadCodeConfidence::kMedium);
}

TEST(DeadCodePathTest, RecognizesTestSourcePaths) {
  EXPECT_TRUE(IsTestSourcePath("tests/api.rs"));
  EXPECT_TRUE(IsTestSourcePath("pkg/server_test.go"));
  EXPECT_TRUE(IsTestSourcePath("test_app.py"));
  EXPECT_TRUE(IsTestSourcePath("web/button.test.ts"));
  EXPECT_FALSE(IsTestSourcePath("src/testing_utils.rs"));
}

} // namespace
} // namespace qgate
