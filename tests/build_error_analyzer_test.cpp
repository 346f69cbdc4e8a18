#include <qgate/build_error_analyzer.h>
#include <qgate/toolchain_commands.h>

#include "test_support/scripted_process_runner.h"
#include "test_support/temporary_project.h"

#include <gtest/gtest.h>

namespace qgate {
namespace {

const char *const kCargoOutput =
    "   Compiling demo v0.1.0 (/work/demo)\n"
    "src/parser.rs:12:5: error[E0308]: mismatched types\n"
    "src/parser.rs:40:1: error: expected item, found `}`\n"
    "/work/demo/src/lexer.rs:3:9: error[E0425]: cannot find value `x`\n"
    "src/lib.rs:1:1: warning: unused import\n"
    "error: could not compile `demo`\n";

TEST(BuildErrorAnalyzerTest, ParsesShortDiagnosticsAndNormalizesPaths) {
  const auto errors = ParseShortDiagnostics(kCargoOutput, "/work/demo");

  ASSERT_EQ(errors.size(), 3u);
  EXPECT_EQ(errors[0].file, "src/parser.rs");
  EXPECT_EQ(errors[0].line, 12u);
  EXPECT_EQ(errors[0].column, 5u);
  EXPECT_EQ(errors[0].message, "E0308: mismatched types");
  EXPECT_EQ(errors[0].lint_name, "compilation_error");
  EXPECT_EQ(errors[0].severity, Severity::kError);
  EXPECT_EQ(errors[1].message, "expected item, found `}`");
  EXPECT_EQ(errors[2].file, "src/lexer.rs");
}

TEST(BuildErrorAnalyzerTest, ParsesGoCompilerOutput) {
  const auto errors =
      ParseShortDiagnostics("# demo\n./main.go:7:2: undefined: foo\n", "/work");

  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].file, "main.go");
  EXPECT_EQ(errors[0].message, "undefined: foo");
}

TEST(BuildErrorAnalyzerTest, WorstFileHasTheMostErrors) {
  BuildErrorReport report;
  report.build_succeeded = false;
  report.errors = ParseShortDiagnostics(kCargoOutput, "/work/demo");
  for (const auto &error : report.errors) {
    ++report.errors_by_file[error.file];
  }

  EXPECT_FALSE(report.Unattributed());
  EXPECT_EQ(report.WorstFile(), std::optional<std::string>("src/parser.rs"));
}

TEST(BuildErrorAnalyzerTest, FailureWithoutDiagnosticsIsUnattributed) {
  auto runner = std::make_shared<test::ScriptedProcessRunner>();
  runner->On("cargo", {"build", "--message-format=short"},
             test::ScriptedProcessRunner::Failure(101, "error: linker failed\n"));
  SourceSet sources;
  sources.root = "/work/demo";

  const auto report = BuildErrorAnalyzer(runner).Analyze(sources, {});

  EXPECT_FALSE(report.build_succeeded);
  EXPECT_TRUE(report.Unattributed());
  EXPECT_FALSE(report.WorstFile().has_value());
}

TEST(BuildErrorAnalyzerTest, MissingToolchainCountsAsSuccess) {
  auto runner = std::make_shared<test::ScriptedProcessRunner>();
  SourceSet sources;
  sources.root = "/work/demo";

  const auto report = BuildErrorAnalyzer(runner).Analyze(sources, {});

  EXPECT_TRUE(report.build_succeeded);
  EXPECT_TRUE(runner->WasCalled("cargo", "build"));
}

TEST(BuildErrorAnalyzerTest, ToolchainsWithoutShortDiagnosticsAreSkipped) {
  auto runner = std::make_shared<test::ScriptedProcessRunner>();
  SourceSet sources;
  sources.root = "/work/app";
  sources.toolchain = Toolchain::kPythonUv;

  const auto report = BuildErrorAnalyzer(runner).Analyze(sources, {});

  EXPECT_TRUE(report.build_succeeded);
  EXPECT_TRUE(runner->calls().empty());
}

TEST(BuildErrorAnalyzerTest, HotspotUsesErrorDensity) {
  test::TemporaryProject project;
  project.AddFile("src/parser.rs", "fn a() {}\nfn b() {}\nfn c() {}\nfn d() {}\n");
  project.AddFile("src/lexer.rs", "fn lex() {}\n");
  BuildErrorReport report;
  report.build_succeeded = false;
  report.errors = ParseShortDiagnostics(kCargoOutput, project.root());
  report.errors[2].file = "src/lexer.rs";
  for (const auto &error : report.errors) {
    ++report.errors_by_file[error.file];
  }

  const auto hotspot =
      BuildErrorsAsHotspot(report, project.root(), Toolchain::kRust);

  EXPECT_EQ(hotspot.total_project_violations, 3u);
  ASSERT_TRUE(hotspot.hotspot.has_value());
  EXPECT_EQ(hotspot.hotspot->file, "src/lexer.rs");
  EXPECT_DOUBLE_EQ(hotspot.hotspot->defect_density, 1.0);
  EXPECT_DOUBLE_EQ(hotspot.summary_by_file.at("src/parser.rs").defect_density,
                   0.5);
  EXPECT_EQ(hotspot.hotspot->violations.size(), 1u);
}

TEST(ToolchainCommandsTest, BuildsPerToolchainCommands) {
  const auto check = BuildCheckCommand(Toolchain::kDeno, "/p");
  EXPECT_EQ(check.program, "deno");
  EXPECT_EQ(check.arguments, (std::vector<std::string>{"check", "."}));
  EXPECT_EQ(check.working_directory.generic_string(), "/p");

  EXPECT_EQ(BuildCheckCommand(Toolchain::kGo, "/p").arguments,
            (std::vector<std::string>{"build", "./..."}));
  EXPECT_TRUE(LintCommand(Toolchain::kRust, "/p").has_value());
  EXPECT_FALSE(LintCommand(Toolchain::kGo, "/p").has_value());
  EXPECT_FALSE(LintFixCommand(Toolchain::kPythonUv, "/p").has_value());
}

} // namespace
} // namespace qgate
