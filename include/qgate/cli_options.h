#pragma once

#include <qgate/logging.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace qgate {

struct AnalyzeOptions {
  std::optional<std::filesystem::path> project_path;
  std::optional<std::filesystem::path> config_file;
  std::optional<std::filesystem::path> output;
  std::optional<std::filesystem::path> ignore_file;
  std::optional<std::filesystem::path> cache_directory;
  std::optional<std::string> format;
  std::optional<std::string> toolchain;
  std::vector<std::string> include;
  std::vector<std::string> exclude;
  std::optional<unsigned> top_files;
  std::optional<unsigned> threshold;
  std::optional<unsigned> period_days;
  std::optional<unsigned> min_dead_lines;
  std::optional<unsigned> parallelism;
  std::optional<double> coverage_min;
  std::optional<double> max_density;
  std::optional<bool> strict;
  std::optional<bool> include_tests;
  std::optional<LogLevel> log_level;
  bool show_help = false;
};

struct RefactorOptions {
  std::optional<std::filesystem::path> project_path;
  std::optional<std::filesystem::path> config_file;
  std::optional<std::filesystem::path> cache_directory;
  std::optional<std::filesystem::path> ignore_file;
  std::optional<std::filesystem::path> file;
  std::optional<std::filesystem::path> test_file;
  std::optional<std::filesystem::path> bug_report_path;
  std::optional<std::filesystem::path> rewrite_templates;
  std::optional<std::string> test_name;
  std::optional<std::string> github_issue_url;
  std::optional<std::string> toolchain;
  std::optional<std::string> quality_profile;
  std::vector<std::string> include;
  std::vector<std::string> exclude;
  std::optional<unsigned> max_iterations;
  std::optional<unsigned> complexity_max;
  std::optional<unsigned> complexity_target;
  std::optional<unsigned> satd_allowed;
  std::optional<unsigned> parallelism;
  std::optional<double> coverage_min;
  std::optional<bool> dry_run;
  std::optional<bool> ci_mode;
  std::optional<bool> resume;
  std::optional<bool> single_file_mode;
  std::optional<LogLevel> log_level;
  bool show_help = false;
};

struct CacheCleanOptions {
  std::optional<std::filesystem::path> project_path;
  std::optional<std::filesystem::path> cache_directory;
  bool show_help = false;
};

// Throws std::invalid_argument for unknown flags and missing values.
AnalyzeOptions ParseAnalyzeArguments(const std::vector<std::string> &arguments);
RefactorOptions
ParseRefactorArguments(const std::vector<std::string> &arguments);
CacheCleanOptions
ParseCacheCleanArguments(const std::vector<std::string> &arguments);

// Template commands forward `--key value` pairs verbatim; a flag followed
// by another flag (or nothing) is `true`, and bare words collect under
// `positional`.
nlohmann::json ParseTemplateArguments(const std::vector<std::string> &arguments);

// Keys are lower-cased with `-` mapped to `_` before lookup.
std::string NormalizeConfigKey(std::string key);
const std::vector<std::string> &SupportedAnalyzeConfigKeys();
const std::vector<std::string> &SupportedRefactorConfigKeys();

AnalyzeOptions ParseAnalyzeConfigFile(const std::filesystem::path &path);
RefactorOptions ParseRefactorConfigFile(const std::filesystem::path &path);

// Values set on the command line win over the config file.
AnalyzeOptions MergeOptions(const AnalyzeOptions &config_options,
                            const AnalyzeOptions &cli_options);
RefactorOptions MergeOptions(const RefactorOptions &config_options,
                             const RefactorOptions &cli_options);

AnalyzeOptions ResolveAnalyzeOptions(const AnalyzeOptions &cli_options);
RefactorOptions ResolveRefactorOptions(const RefactorOptions &cli_options);

// The JSON body the CLI adapter forwards; only options that were set.
nlohmann::json ToRequestBody(const AnalyzeOptions &options);
nlohmann::json ToRequestBody(const RefactorOptions &options);

LoggingConfig BuildLoggingConfig(const std::optional<LogLevel> &level);

// `analyze` subcommands the CLI knows by name but does not implement.
bool IsUnimplementedAnalysis(const std::string &name);

void PrintAnalyzeUsage(std::ostream &stream);
void PrintRefactorUsage(std::ostream &stream);

} // namespace qgate
