#pragma once

#include <qgate/execution_context.h>
#include <qgate/logging.h>
#include <qgate/process_runner.h>
#include <qgate/source_discovery.h>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace qgate {

struct FileChurn {
  std::string path;
  unsigned commit_count = 0;
  std::vector<std::string> unique_authors;
  unsigned additions = 0;
  unsigned deletions = 0;
  std::chrono::system_clock::time_point last_modified;
  std::chrono::system_clock::time_point first_seen;
  // Normalized to [0, 1] against the busiest file.
  double churn_score = 0.0;
};

struct ChurnSummary {
  unsigned period_days = 0;
  unsigned total_commits = 0;
  unsigned total_files_changed = 0;
  std::vector<std::string> hotspot_files;
  std::vector<std::string> stable_files;
  std::map<std::string, unsigned> author_contributions;
};

struct ChurnReport {
  // Highest churn_score first, ties by path.
  std::vector<FileChurn> files;
  ChurnSummary summary;

  const FileChurn *Find(const std::string &path) const;
};

struct ChurnCommit {
  std::string hash;
  std::string author;
  std::chrono::system_clock::time_point date;
  struct Change {
    std::string path;
    unsigned additions = 0;
    unsigned deletions = 0;
  };
  std::vector<Change> changes;
};

// Parses `git log --numstat --format=commit:%H|%an|%aI` output.
std::vector<ChurnCommit> ParseGitLog(const std::string &output);

struct ChurnOptions {
  unsigned period_days = 30;
  unsigned hotspot_commits = 5;
  unsigned stable_days = 60;
  // Fixed clock for reproducible scores.
  std::optional<std::chrono::system_clock::time_point> now;
};

ChurnReport BuildChurnReport(const std::vector<ChurnCommit> &commits,
                             const std::vector<std::string> &tracked_files,
                             const ChurnOptions &options);

class ChurnAnalyzer {
public:
  ChurnAnalyzer(std::shared_ptr<ProcessRunner> runner, ChurnOptions options = {},
                std::shared_ptr<Logger> logger = nullptr);

  ChurnReport Analyze(const SourceSet &sources,
                      const ExecutionContext &context) const;

private:
  std::shared_ptr<ProcessRunner> runner_;
  ChurnOptions options_;
  std::shared_ptr<Logger> logger_;
};

} // namespace qgate
