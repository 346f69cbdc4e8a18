#include <qgate/churn_analyzer.h>

#include <qgate/strings.h>

#include <algorithm>
#include <set>
#include <stdexcept>

namespace qgate {
namespace {

constexpr char kCommitPrefix[] = "commit:";

double DaysBetween(std::chrono::system_clock::time_point earlier,
                   std::chrono::system_clock::time_point later) {
  const auto hours =
      std::chrono::duration_cast<std::chrono::hours>(later - earlier).count();
  return std::max(0.0, static_cast<double>(hours) / 24.0);
}

unsigned ParseCount(const std::string &value) {
  if (value == "-") {
    return 0;
  }
  try {
    return static_cast<unsigned>(std::stoul(value));
  } catch (const std::exception &) {
    return 0;
  }
}

// `src/{old => new}/file.rs` and `old.rs => new.rs` rename notation.
std::string ResolveRenamedPath(const std::string &path) {
  const auto arrow = path.find(" => ");
  if (arrow == std::string::npos) {
    return path;
  }
  const auto open = path.rfind('{', arrow);
  const auto close = path.find('}', arrow);
  if (open != std::string::npos && close != std::string::npos) {
    auto renamed = path.substr(0, open) +
                   path.substr(arrow + 4, close - arrow - 4) +
                   path.substr(close + 1);
    std::string collapsed;
    for (const auto c : renamed) {
      if (c == '/' && !collapsed.empty() && collapsed.back() == '/') {
        continue;
      }
      collapsed.push_back(c);
    }
    return collapsed;
  }
  return path.substr(arrow + 4);
}

} // namespace

std::vector<ChurnCommit> ParseGitLog(const std::string &output) {
  std::vector<ChurnCommit> commits;
  for (const auto &line : SplitLines(output)) {
    if (StartsWith(line, kCommitPrefix)) {
      const auto fields = SplitList(line.substr(sizeof(kCommitPrefix) - 1), '|');
      if (fields.size() < 3) {
        continue;
      }
      ChurnCommit commit;
      commit.hash = fields[0];
      commit.author = fields[1];
      try {
        commit.date = ParseIsoTimestamp(fields[2]);
      } catch (const std::invalid_argument &) {
        continue;
      }
      commits.push_back(std::move(commit));
      continue;
    }
    if (commits.empty() || Trim(line).empty()) {
      continue;
    }
    const auto first_tab = line.find('\t');
    const auto second_tab =
        first_tab == std::string::npos ? first_tab : line.find('\t', first_tab + 1);
    if (second_tab == std::string::npos) {
      continue;
    }
    ChurnCommit::Change change;
    change.additions = ParseCount(line.substr(0, first_tab));
    change.deletions =
        ParseCount(line.substr(first_tab + 1, second_tab - first_tab - 1));
    change.path = ResolveRenamedPath(line.substr(second_tab + 1));
    commits.back().changes.push_back(std::move(change));
  }
  return commits;
}

ChurnReport BuildChurnReport(const std::vector<ChurnCommit> &commits,
                             const std::vector<std::string> &tracked_files,
                             const ChurnOptions &options) {
  const auto now = options.now.value_or(std::chrono::system_clock::now());
  const std::set<std::string> tracked(tracked_files.begin(),
                                      tracked_files.end());
  std::map<std::string, FileChurn> by_path;
  std::map<std::string, std::set<std::string>> authors_by_path;

  ChurnReport report;
  report.summary.period_days = options.period_days;
  report.summary.total_commits = static_cast<unsigned>(commits.size());
  for (const auto &commit : commits) {
    ++report.summary.author_contributions[commit.author];
    for (const auto &change : commit.changes) {
      if (!tracked.empty() && tracked.count(change.path) == 0) {
        continue;
      }
      auto found = by_path.find(change.path);
      if (found == by_path.end()) {
        FileChurn fresh;
        fresh.path = change.path;
        fresh.first_seen = commit.date;
        fresh.last_modified = commit.date;
        found = by_path.emplace(change.path, fresh).first;
      }
      auto &file = found->second;
      ++file.commit_count;
      file.additions += change.additions;
      file.deletions += change.deletions;
      file.first_seen = std::min(file.first_seen, commit.date);
      file.last_modified = std::max(file.last_modified, commit.date);
      authors_by_path[change.path].insert(commit.author);
    }
  }

  double max_raw = 0.0;
  std::vector<double> raw_scores;
  for (auto &entry : by_path) {
    auto &file = entry.second;
    const auto &authors = authors_by_path[entry.first];
    file.unique_authors.assign(authors.begin(), authors.end());
    const double raw =
        file.commit_count / (1.0 + DaysBetween(file.first_seen, now)) +
        0.1 * static_cast<double>(file.unique_authors.size());
    raw_scores.push_back(raw);
    max_raw = std::max(max_raw, raw);
    report.files.push_back(file);
  }
  for (std::size_t i = 0; i < report.files.size(); ++i) {
    report.files[i].churn_score = max_raw > 0.0 ? raw_scores[i] / max_raw : 0.0;
    const auto &file = report.files[i];
    if (file.commit_count > options.hotspot_commits) {
      report.summary.hotspot_files.push_back(file.path);
    }
    if (file.commit_count <= 1 &&
        DaysBetween(file.last_modified, now) > options.stable_days) {
      report.summary.stable_files.push_back(file.path);
    }
  }
  report.summary.total_files_changed =
      static_cast<unsigned>(report.files.size());
  std::sort(report.files.begin(), report.files.end(),
            [](const FileChurn &left, const FileChurn &right) {
              if (left.churn_score != right.churn_score) {
                return left.churn_score > right.churn_score;
              }
              return left.path < right.path;
            });
  return report;
}

const FileChurn *ChurnReport::Find(const std::string &path) const {
  for (const auto &file : files) {
    if (file.path == path) {
      return &file;
    }
  }
  return nullptr;
}

ChurnAnalyzer::ChurnAnalyzer(std::shared_ptr<ProcessRunner> runner,
                             ChurnOptions options,
                             std::shared_ptr<Logger> logger)
    : runner_(std::move(runner)), options_(options),
      logger_(EnsureLogger(std::move(logger))) {
  if (!runner_) {
    throw std::invalid_argument("ChurnAnalyzer requires a process runner");
  }
}

ChurnReport ChurnAnalyzer::Analyze(const SourceSet &sources,
                                   const ExecutionContext &context) const {
  ProcessRequest request;
  request.program = "git";
  // Paths relative to the project root, limited to it, even when the
  // project sits below the repository root.
  request.arguments = {"log",
                       "--since=" + std::to_string(options_.period_days) +
                           " days ago",
                       "--numstat",
                       "--relative",
                       "--format=commit:%H|%an|%aI",
                       "--",
                       "."};
  request.working_directory = sources.root;
  const auto result = runner_->Run(request, context);
  if (!result.Succeeded()) {
    logger_->Log(LogLevel::kWarn, "churn.git.failed",
                 {{"root", sources.root.string()},
                  {"exit_code", std::to_string(result.exit_code)},
                  {"stderr", Trim(result.stderr_text)}});
    ChurnReport empty;
    empty.summary.period_days = options_.period_days;
    return empty;
  }
  auto report =
      BuildChurnReport(ParseGitLog(result.stdout_text), sources.files, options_);
  logger_->Log(LogLevel::kDebug, "analyzer.complete",
               {{"analyzer", "churn"},
                {"commits", std::to_string(report.summary.total_commits)},
                {"files", std::to_string(report.summary.total_files_changed)}});
  return report;
}

} // namespace qgate
