#include <qgate/cli_options.h>

#include "test_support/temporary_project.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>

namespace qgate {
namespace {

TEST(CliOptionsTest, ParsesAnalyzeFlags) {
  const auto options = ParseAnalyzeArguments(
      {"--project-path", "demo", "--format", "SARIF", "--threshold", "15",
       "--include", "src/**", "lib/**", "--exclude", "target/**,vendor/**",
       "--strict", "--max-density", "0.1", "--debug"});

  EXPECT_EQ(options.project_path.value_or("").generic_string(), "demo");
  EXPECT_EQ(options.format, "sarif");
  EXPECT_EQ(options.threshold, 15u);
  EXPECT_THAT(options.include, ::testing::ElementsAre("src/**", "lib/**"));
  EXPECT_THAT(options.exclude, ::testing::ElementsAre("target/**", "vendor/**"));
  EXPECT_EQ(options.strict, true);
  EXPECT_DOUBLE_EQ(*options.max_density, 0.1);
  EXPECT_EQ(options.log_level, LogLevel::kDebug);
}

TEST(CliOptionsTest, RejectsUnknownAndIncompleteFlags) {
  EXPECT_THROW(ParseAnalyzeArguments({"--colour"}), std::invalid_argument);
  EXPECT_THROW(ParseAnalyzeArguments({"--top-files"}), std::invalid_argument);
  EXPECT_THROW(ParseAnalyzeArguments({"--top-files", "-3"}),
               std::invalid_argument);
  EXPECT_THROW(ParseRefactorArguments({"--max-iterations", "ten"}),
               std::invalid_argument);
  EXPECT_THROW(ParseCacheCleanArguments({"--force"}), std::invalid_argument);
}

TEST(CliOptionsTest, ParsesRefactorModesAndGates) {
  const auto options = ParseRefactorArguments(
      {"--single-file-mode", "--file", "src/lib.rs", "--max-iterations", "3",
       "--ci-mode", "--no-resume", "--complexity-max", "8", "--coverage-min",
       "85.5", "--rewrite-templates", "rules.yaml"});

  EXPECT_EQ(options.single_file_mode, true);
  EXPECT_EQ(options.file.value_or("").generic_string(), "src/lib.rs");
  EXPECT_EQ(options.max_iterations, 3u);
  EXPECT_EQ(options.ci_mode, true);
  EXPECT_EQ(options.resume, false);
  EXPECT_EQ(options.complexity_max, 8u);
  EXPECT_DOUBLE_EQ(*options.coverage_min, 85.5);
  EXPECT_EQ(options.rewrite_templates.value_or("").generic_string(), "rules.yaml");
}

TEST(CliOptionsTest, SingleFileModeNeedsAFile) {
  EXPECT_THROW(ResolveRefactorOptions(ParseRefactorArguments({"--single-file-mode"})),
               std::invalid_argument);
}

TEST(CliOptionsTest, HelpStopsParsing) {
  EXPECT_TRUE(ParseAnalyzeArguments({"--help", "--colour"}).show_help);
  EXPECT_TRUE(ParseRefactorArguments({"-h"}).show_help);
}

TEST(CliOptionsTest, TemplateArgumentsForwardVerbatim) {
  const auto flags = ParseTemplateArguments(
      {"rust-cli", "--name", "demo", "--dry-run", "--output-dir=out"});

  EXPECT_EQ(flags["name"], "demo");
  EXPECT_EQ(flags["dry_run"], true);
  EXPECT_EQ(flags["output_dir"], "out");
  EXPECT_EQ(flags["positional"], nlohmann::json::array({"rust-cli"}));
  EXPECT_THROW(ParseTemplateArguments({"--"}), std::invalid_argument);
}

TEST(CliOptionsTest, NormalizesConfigKeysAndAliases) {
  EXPECT_EQ(NormalizeConfigKey("Max-Iterations"), "max_iterations");
  EXPECT_EQ(NormalizeConfigKey("root"), "project_path");
  EXPECT_EQ(NormalizeConfigKey("jobs"), "parallelism");
  EXPECT_EQ(NormalizeConfigKey("max-cyclomatic"), "threshold");
}

TEST(CliOptionsTest, ReadsYamlConfigFiles) {
  test::TemporaryProject project;
  const auto path = project.AddFile("qgate.yaml", "project-path: demo\n"
                                                   "iterations: 4\n"
                                                   "dry_run: yes\n"
                                                   "exclude:\n"
                                                   "  - target/**\n"
                                                   "  - vendor/**\n"
                                                   "cache_dir:\n"
                                                   "  path: /tmp/qgate\n");

  const auto options = ParseRefactorConfigFile(path);

  EXPECT_EQ(options.project_path.value_or("").generic_string(), "demo");
  EXPECT_EQ(options.max_iterations, 4u);
  EXPECT_EQ(options.dry_run, true);
  EXPECT_THAT(options.exclude, ::testing::ElementsAre("target/**", "vendor/**"));
  EXPECT_EQ(options.cache_directory.value_or("").generic_string(), "/tmp/qgate");
  EXPECT_TRUE(options.config_file == path);
}

TEST(CliOptionsTest, RejectsBadConfigFiles) {
  test::TemporaryProject project;
  const auto unknown = project.AddFile("unknown.yaml", "colour: blue\n");
  const auto list_root = project.AddFile("list.yaml", "- a\n- b\n");
  const auto toml = project.AddFile("qgate.toml", "threshold = 3\n");

  try {
    ParseAnalyzeConfigFile(unknown);
    FAIL() << "expected std::invalid_argument";
  } catch (const std::invalid_argument &error) {
    EXPECT_THAT(error.what(), ::testing::HasSubstr("Unknown config key: colour"));
    EXPECT_THAT(error.what(), ::testing::HasSubstr("threshold"));
  }
  EXPECT_THROW(ParseAnalyzeConfigFile(list_root), std::invalid_argument);
  EXPECT_THROW(ParseAnalyzeConfigFile(toml), std::invalid_argument);
  EXPECT_THROW(ParseAnalyzeConfigFile(project.root() / "missing.yaml"),
               std::runtime_error);
}

TEST(CliOptionsTest, CommandLineWinsOverConfig) {
  test::TemporaryProject project;
  const auto path = project.AddFile("qgate.yml", "format: json\n"
                                                  "threshold: 12\n"
                                                  "include: src/**\n");

  const auto options = ResolveAnalyzeOptions(ParseAnalyzeArguments(
      {"--config", path.string(), "--format", "markdown"}));

  EXPECT_EQ(options.format, "markdown");
  EXPECT_EQ(options.threshold, 12u);
  EXPECT_THAT(options.include, ::testing::ElementsAre("src/**"));
}

TEST(CliOptionsTest, RequestBodyHoldsOnlyWhatWasSet) {
  const auto analyze =
      ToRequestBody(ParseAnalyzeArguments({"--threshold", "7", "--strict"}));
  EXPECT_EQ(analyze, (nlohmann::json{{"threshold", 7}, {"strict", true}}));

  const auto refactor = ToRequestBody(ParseRefactorArguments(
      {"--test-file", "tests/parse.rs", "--test-name", "empty", "--dry-run"}));
  EXPECT_EQ(refactor["test_file"], "tests/parse.rs");
  EXPECT_EQ(refactor["test_name"], "empty");
  EXPECT_EQ(refactor["dry_run"], true);
  EXPECT_FALSE(refactor.contains("max_iterations"));
}

TEST(CliOptionsTest, KnowsWhichAnalysesAreOutOfScope) {
  EXPECT_TRUE(IsUnimplementedAnalysis("duplicates"));
  EXPECT_TRUE(IsUnimplementedAnalysis("big-o"));
  EXPECT_FALSE(IsUnimplementedAnalysis("complexity"));
}

TEST(CliOptionsTest, LoggingDefaultsToWarnings) {
  EXPECT_EQ(BuildLoggingConfig(std::nullopt).level, LogLevel::kWarn);
  EXPECT_EQ(BuildLoggingConfig(LogLevel::kDebug).level, LogLevel::kDebug);

  std::ostringstream usage;
  PrintRefactorUsage(usage);
  EXPECT_THAT(usage.str(), ::testing::HasSubstr("--github-issue-url"));
}

} // namespace
} // namespace qgate
