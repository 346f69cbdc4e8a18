#include <qgate/complexity_analyzer.h>

#include "test_support/temporary_project.h"

#include <gtest/gtest.h>

namespace qgate {
namespace {

const char *const kRustClassify = R"(pub fn classify(value: i32) -> i32 {
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

fn helper() {}
)";

TEST(ComplexityAnalyzerTest, LocatesRustFunctionsWithVisibility) {
  const SyntaxTree tree(kRustClassify, SyntaxLanguage::kRust);
  const auto spans = FindFunctions(tree);

  ASSERT_EQ(spans.size(), 2u);
  EXPECT_EQ(spans[0].name, "classify");
  EXPECT_EQ(spans[0].line, 1u);
  EXPECT_EQ(spans[0].end_line, 14u);
  EXPECT_TRUE(spans[0].is_public);
  EXPECT_EQ(spans[1].name, "helper");
  EXPECT_EQ(spans[1].line, spans[1].end_line);
  EXPECT_FALSE(spans[1].is_public);
}

TEST(ComplexityAnalyzerTest, ScoresRustBranchesBooleansAndMatchArms) {
  const auto functions =
      AnalyzeFunctionComplexity(kRustClassify, Toolchain::kRust);

  ASSERT_EQ(functions.size(), 2u);
  // if, &&, for, nested if and two match arms.
  EXPECT_EQ(functions[0].cyclomatic, 7u);
  // Nested if scores 2, the early return inside a block scores 1.
  EXPECT_EQ(functions[0].cognitive, 7u);
  EXPECT_EQ(functions[1].cyclomatic, 1u);
  EXPECT_EQ(functions[1].cognitive, 0u);
}

TEST(ComplexityAnalyzerTest, ScoresPythonByIndentation) {
  const std::string content = "def check(a, b):\n"
                              "    if a and b:\n"
                              "        return 1\n"
                              "    elif a or b:\n"
                              "        return 2\n"
                              "    return 3\n";

  const auto functions =
      AnalyzeFunctionComplexity(content, Toolchain::kPythonUv);

  ASSERT_EQ(functions.size(), 1u);
  EXPECT_EQ(functions[0].name, "check");
  EXPECT_EQ(functions[0].end_line, 6u);
  EXPECT_EQ(functions[0].cyclomatic, 5u);
  EXPECT_EQ(functions[0].cognitive, 6u);
}

TEST(ComplexityAnalyzerTest, KeywordsInsideStringsAndCommentsAreIgnored) {
  const std::string content = "fn quiet() {\n"
                              "    // if while for\n"
                              "    let s = \"if && ||\";\n"
                              "}\n";

  const auto functions = AnalyzeFunctionComplexity(content, Toolchain::kRust);

  ASSERT_EQ(functions.size(), 1u);
  EXPECT_EQ(functions[0].cyclomatic, 1u);
  EXPECT_EQ(functions[0].cognitive, 0u);
}

TEST(ComplexityAnalyzerTest, ClosureParametersAreNotLogicalOperators) {
  const std::string content = "fn f() -> u32 {\n"
                              "    let g = || 1;\n"
                              "    let h = || 2;\n"
                              "    g() + h()\n"
                              "}\n";

  const auto functions = AnalyzeFunctionComplexity(content, Toolchain::kRust);

  ASSERT_EQ(functions.size(), 1u);
  EXPECT_EQ(functions[0].cyclomatic, 1u);
  EXPECT_EQ(functions[0].cognitive, 0u);
}

TEST(ComplexityAnalyzerTest, BranchesInsideClosuresCountTowardTheirFunction) {
  const std::string content = "fn run(items: &[i32]) -> usize {\n"
                              "    items.iter().filter(|x| if **x > 0 { true } "
                              "else { false }).count()\n"
                              "}\n";

  const auto functions = AnalyzeFunctionComplexity(content, Toolchain::kRust);

  ASSERT_EQ(functions.size(), 1u);
  EXPECT_EQ(functions[0].cyclomatic, 2u);
  // The if sits one level deep inside the closure, plus its else.
  EXPECT_EQ(functions[0].cognitive, 3u);
}

TEST(ComplexityAnalyzerTest, NestedFunctionsAreScoredOnTheirOwn) {
  const std::string content = "fn outer(){ fn inner(x: bool){ if x {} } }\n";

  const auto functions = AnalyzeFunctionComplexity(content, Toolchain::kRust);

  ASSERT_EQ(functions.size(), 2u);
  EXPECT_EQ(functions[0].name, "outer");
  EXPECT_EQ(functions[0].cyclomatic, 1u);
  EXPECT_EQ(functions[0].cognitive, 0u);
  EXPECT_EQ(functions[1].name, "inner");
  EXPECT_EQ(functions[1].cyclomatic, 2u);
  EXPECT_EQ(functions[1].cognitive, 1u);
}

TEST(ComplexityAnalyzerTest, NestedPythonFunctionsAreScoredOnTheirOwn) {
  const std::string content = "def outer(a):\n"
                              "    def inner(b):\n"
                              "        if b:\n"
                              "            return 1\n"
                              "        return 0\n"
                              "    return inner(a)\n";

  const auto functions =
      AnalyzeFunctionComplexity(content, Toolchain::kPythonUv);

  ASSERT_EQ(functions.size(), 2u);
  EXPECT_EQ(functions[0].name, "outer");
  EXPECT_EQ(functions[0].line, 1u);
  EXPECT_EQ(functions[0].end_line, 6u);
  EXPECT_EQ(functions[0].cyclomatic, 1u);
  EXPECT_EQ(functions[1].name, "inner");
  EXPECT_EQ(functions[1].line, 2u);
  EXPECT_EQ(functions[1].end_line, 5u);
  EXPECT_EQ(functions[1].cyclomatic, 2u);
}

TEST(ComplexityAnalyzerTest, ScoresTypeScriptArrowFunctionsAndRepeatedOperators) {
  const std::string content = "export const ok = (a: boolean, b: boolean, c: boolean) => {\n"
                              "  return a && b && c ? 1 : 0;\n"
                              "};\n";

  const auto functions =
      AnalyzeFunctionComplexity(content, Toolchain::kDeno);

  ASSERT_EQ(functions.size(), 1u);
  EXPECT_EQ(functions[0].name, "ok");
  // Ternary plus two `&&`.
  EXPECT_EQ(functions[0].cyclomatic, 4u);
  // Ternary plus one for the `&&` run.
  EXPECT_EQ(functions[0].cognitive, 2u);
}

TEST(ComplexityAnalyzerTest, AddingABranchNeverLowersComplexity) {
  const std::string before = "func Pick(x int) int {\n"
                             "\tif x > 0 {\n"
                             "\t\treturn 1\n"
                             "\t}\n"
                             "\treturn 0\n"
                             "}\n";
  const std::string after = "func Pick(x int) int {\n"
                            "\tif x > 0 {\n"
                            "\t\tif x > 10 {\n"
                            "\t\t\treturn 2\n"
                            "\t\t}\n"
                            "\t\treturn 1\n"
                            "\t}\n"
                            "\treturn 0\n"
                            "}\n";

  const auto base = AnalyzeFunctionComplexity(before, Toolchain::kGo);
  const auto grown = AnalyzeFunctionComplexity(after, Toolchain::kGo);

  ASSERT_EQ(base.size(), 1u);
  ASSERT_EQ(grown.size(), 1u);
  EXPECT_TRUE(base[0].cyclomatic < grown[0].cyclomatic);
  EXPECT_TRUE(base[0].cognitive < grown[0].cognitive);
}

TEST(ComplexityAnalyzerTest, DeclarationsWithoutBodiesAreSkipped) {
  const std::string content = "trait Shape {\n"
                              "    fn area(&self) -> f64;\n"
                              "}\n";

  EXPECT_TRUE(AnalyzeFunctionComplexity(content, Toolchain::kRust).empty());
}

TEST(ComplexityAnalyzerTest, SummaryUsesNearestRankPercentile) {
  std::vector<FileComplexity> files(1);
  files[0].path = "src/lib.rs";
  for (unsigned value = 1; value <= 10; ++value) {
    FunctionInfo info;
    info.cyclomatic = value;
    info.cognitive = value * 2;
    files[0].functions.push_back(info);
  }

  const auto summary = SummarizeComplexity(files, 8);

  EXPECT_EQ(summary.total_files, 1u);
  EXPECT_EQ(summary.total_functions, 10u);
  EXPECT_EQ(summary.p90_cyclomatic, 9u);
  EXPECT_EQ(summary.max_cyclomatic, 10u);
  EXPECT_EQ(summary.max_cognitive, 20u);
  EXPECT_EQ(summary.functions_over_threshold, 2u);
  EXPECT_DOUBLE_EQ(summary.average_cyclomatic, 5.5);
}

TEST(ComplexityAnalyzerTest, AnalyzerIsDeterministicAndSortedByPath) {
  test::TemporaryProject project;
  project.AddFile("src/b.rs", "fn b() { if true {} }\n");
  project.AddFile("src/a.rs", kRustClassify);
  project.AddFile("src/empty.rs", "// nothing here\n");

  SourceSet sources;
  sources.root = project.root();
  sources.files = {"src/a.rs", "src/b.rs", "src/empty.rs"};

  const ComplexityAnalyzer analyzer(ComplexityOptions{10, 4});
  const auto first = analyzer.Analyze(sources);
  const auto second = analyzer.Analyze(sources);

  ASSERT_EQ(first.files.size(), 3u);
  EXPECT_EQ(first.files[0].path, "src/a.rs");
  EXPECT_EQ(first.files[0].max_cyclomatic, 7u);
  EXPECT_EQ(first.files[1].max_cyclomatic, 2u);
  for (std::size_t i = 0; i < first.files.size(); ++i) {
    EXPECT_EQ(first.files[i].total_cyclomatic, second.files[i].total_cyclomatic);
    EXPECT_EQ(first.files[i].max_cognitive, second.files[i].max_cognitive);
  }

  ASSERT_NE(first.Find("src/b.rs"), nullptr);
  EXPECT_EQ(first.Find("src/missing.rs"), nullptr);

  const auto top = first.TopFiles(5);
  ASSERT_EQ(top.size(), 2u);
  EXPECT_EQ(top[0]->path, "src/a.rs");
}

} // namespace
} // namespace qgate
