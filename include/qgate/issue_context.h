#pragma once

#include <qgate/execution_context.h>
#include <qgate/logging.h>
#include <qgate/process_runner.h>
#include <qgate/source_discovery.h>
#include <qgate/target_selector.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace qgate {

struct IssueReference {
  std::string owner;
  std::string repository;
  unsigned long number = 0;

  std::string ApiUrl() const;
};

// `github.com/<owner>/<repo>/issues/<n>`; throws std::invalid_argument.
IssueReference ParseIssueUrl(const std::string &url);

struct GitHubIssue {
  unsigned long number = 0;
  std::string title;
  std::string body;
  std::string state;
  std::string html_url;
  std::vector<std::string> labels;
};

GitHubIssue ParseIssueJson(const std::string &text);

struct ParsedIssue {
  GitHubIssue issue;
  std::vector<std::string> file_paths;
  IssueKeywords keywords;
  // Title plus the first paragraph of the body, cut at 200 characters.
  std::string summary;
};

// Backticked paths, bare `dir/file.ext` tokens and `a::b` module paths
// (mapped to `src/a/b.rs` and `server/src/a/b.rs`). Sorted and unique.
std::vector<std::string> ExtractIssueFilePaths(const std::string &text);
// Performance 3, Correctness 3, Complexity 2.5, Security 4, TechnicalDebt 2
// and Maintainability 2, boosted by repetition, then divided by the maximum.
IssueKeywords ExtractIssueKeywords(const std::string &text);
ParsedIssue ParseIssue(GitHubIssue issue);

nlohmann::json IssueContextJson(const ParsedIssue &issue);

// Fetches issues through `curl` so tests can script the response.
class GitHubIssueClient {
public:
  GitHubIssueClient(std::shared_ptr<ProcessRunner> runner,
                    std::shared_ptr<Logger> logger = nullptr);

  // Uses GITHUB_TOKEN, then GH_TOKEN, from the context environment.
  // Throws std::runtime_error when the request fails.
  GitHubIssue Fetch(const std::string &url,
                    const ExecutionContext &context) const;

private:
  std::shared_ptr<ProcessRunner> runner_;
  std::shared_ptr<Logger> logger_;
};

struct BugReport {
  std::filesystem::path path;
  std::string content;
  std::vector<std::string> mentioned_files;
};

// Source and doc paths on lines naming src/, server/ or docs/, outside
// fenced code blocks.
std::vector<std::string> ExtractBugReportFiles(const std::string &markdown);
// Throws std::invalid_argument when the file does not exist.
BugReport LoadBugReport(const std::filesystem::path &path);

nlohmann::json BugReportContextJson(const BugReport &report);

// `use crate::|super::|self::` paths resolved against the test's ancestors
// and quoted `src/...` file references. Relative to `root`, existing only.
std::vector<std::string>
DiscoverTestDependencies(const std::filesystem::path &root,
                         const std::string &test_file);

// Maps mentioned paths onto project files: an exact relative path wins,
// otherwise every source whose file name matches.
std::vector<std::string>
ResolveMentionedFiles(const std::filesystem::path &root,
                      const std::vector<std::string> &mentioned,
                      const SourceSet &sources);

} // namespace qgate
