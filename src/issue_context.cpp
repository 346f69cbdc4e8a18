#include <qgate/issue_context.h>

#include <qgate/strings.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <regex>
#include <set>
#include <stdexcept>
#include <utility>

namespace qgate {
namespace {

struct KeywordCategory {
  const char *name;
  double weight;
  std::vector<std::string> words;
};

const std::vector<KeywordCategory> &KeywordCategories() {
  static const std::vector<KeywordCategory> categories = {
      {"Performance",
       3.0,
       {"performance", "slow", "optimize", "speed", "latency", "throughput"}},
      {"Correctness",
       3.0,
       {"bug", "error", "fix", "crash", "panic", "broken", "incorrect"}},
      {"Complexity",
       2.5,
       {"unreadable", "confusing", "cleanup", "refactor", "complex",
        "complicated", "simplify"}},
      {"Security",
       4.0,
       {"security", "vulnerability", "exploit", "injection", "unsafe"}},
      {"TechnicalDebt",
       2.0,
       {"debt", "todo", "fixme", "hack", "workaround", "temporary"}},
      {"Maintainability",
       2.0,
       {"maintain", "maintenance", "coupling", "cohesion", "modular"}},
  };
  return categories;
}

std::size_t CountOccurrences(const std::string &text, const std::string &word) {
  std::size_t count = 0;
  for (auto position = text.find(word); position != std::string::npos;
       position = text.find(word, position + word.size())) {
    ++count;
  }
  return count;
}

std::string ReplaceAll(std::string value, const std::string &from,
                       const std::string &to) {
  for (auto position = value.find(from); position != std::string::npos;
       position = value.find(from, position + to.size())) {
    value.replace(position, from.size(), to);
  }
  return value;
}

bool IsPathCharacter(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '/' ||
         c == '.' || c == '_' || c == '-';
}

std::string TrimPathToken(const std::string &word) {
  std::size_t begin = 0;
  std::size_t end = word.size();
  while (begin < end && !IsPathCharacter(word[begin])) {
    ++begin;
  }
  while (end > begin && !IsPathCharacter(word[end - 1])) {
    --end;
  }
  // Sentence punctuation after a path.
  while (end > begin && word[end - 1] == '.') {
    --end;
  }
  return word.substr(begin, end - begin);
}

std::string FileNameOf(const std::string &path) {
  const auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::optional<std::string> ExistingRelative(const std::filesystem::path &root,
                                            const std::filesystem::path &candidate) {
  std::error_code error;
  if (!std::filesystem::is_regular_file(candidate, error)) {
    return std::nullopt;
  }
  const auto canonical_root = std::filesystem::weakly_canonical(root, error);
  const auto canonical = std::filesystem::weakly_canonical(candidate, error);
  const auto relative = RelativePath(canonical_root, canonical);
  if (relative.empty() || StartsWith(relative, "..")) {
    return std::nullopt;
  }
  return relative;
}

std::vector<std::filesystem::path>
ImportCandidates(const std::string &import_path) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (true) {
    const auto separator = import_path.find("::", start);
    auto part = Trim(import_path.substr(
        start, separator == std::string::npos ? std::string::npos
                                              : separator - start));
    if (part.empty() || part.find('{') != std::string::npos ||
        part.find('*') != std::string::npos) {
      break;
    }
    parts.push_back(std::move(part));
    if (separator == std::string::npos) {
      break;
    }
    start = separator + 2;
  }

  std::vector<std::filesystem::path> candidates;
  for (auto length = parts.size(); length > 0; --length) {
    std::filesystem::path module = "src";
    for (std::size_t i = 0; i < length; ++i) {
      module /= parts[i];
    }
    candidates.push_back(std::filesystem::path(module).concat(".rs"));
    candidates.push_back(module / "mod.rs");
  }
  return candidates;
}

} // namespace

std::string IssueReference::ApiUrl() const {
  return "https://api.github.com/repos/" + owner + "/" + repository +
         "/issues/" + std::to_string(number);
}

IssueReference ParseIssueUrl(const std::string &url) {
  static const std::regex pattern(R"(github\.com/([^/]+)/([^/]+)/issues/(\d+))");
  std::smatch match;
  if (!std::regex_search(url, match, pattern)) {
    throw std::invalid_argument("Invalid GitHub issue URL: " + url);
  }
  IssueReference reference;
  reference.owner = match[1].str();
  reference.repository = match[2].str();
  try {
    reference.number = std::stoul(match[3].str());
  } catch (const std::out_of_range &) {
    throw std::invalid_argument("Invalid GitHub issue number in: " + url);
  }
  return reference;
}

GitHubIssue ParseIssueJson(const std::string &text) {
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error &error) {
    throw std::runtime_error(std::string("Malformed GitHub issue response: ") +
                             error.what());
  }
  if (!json.is_object() || !json.contains("title")) {
    throw std::runtime_error("GitHub issue response has no title");
  }
  GitHubIssue issue;
  issue.number = json.value("number", 0ul);
  issue.title = json.value("title", std::string());
  if (json.contains("body") && json["body"].is_string()) {
    issue.body = json["body"].get<std::string>();
  }
  issue.state = json.value("state", std::string("open"));
  issue.html_url = json.value("html_url", std::string());
  if (json.contains("labels") && json["labels"].is_array()) {
    for (const auto &label : json["labels"]) {
      if (label.is_object() && label.contains("name")) {
        issue.labels.push_back(label["name"].get<std::string>());
      }
    }
  }
  return issue;
}

std::vector<std::string> ExtractIssueFilePaths(const std::string &text) {
  static const std::regex backticked(R"(`([a-zA-Z0-9_\-./]+\.[a-zA-Z0-9]+)`)");
  static const std::regex bare(
      R"(\b(?:[a-zA-Z0-9_\-]+/)*[a-zA-Z0-9_\-]+\.[a-zA-Z0-9]+\b)");
  static const std::regex module_path(R"(\b[a-zA-Z0-9_]+(?:::[a-zA-Z0-9_]+)+\b)");

  std::set<std::string> paths;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), backticked);
       it != std::sregex_iterator(); ++it) {
    paths.insert((*it)[1].str());
  }
  for (auto it = std::sregex_iterator(text.begin(), text.end(), bare);
       it != std::sregex_iterator(); ++it) {
    paths.insert(it->str());
  }
  for (auto it = std::sregex_iterator(text.begin(), text.end(), module_path);
       it != std::sregex_iterator(); ++it) {
    const auto file = ReplaceAll(it->str(), "::", "/");
    paths.insert("src/" + file + ".rs");
    paths.insert("server/src/" + file + ".rs");
  }
  return {paths.begin(), paths.end()};
}

IssueKeywords ExtractIssueKeywords(const std::string &text) {
  const auto lower = ToLower(text);
  IssueKeywords keywords;
  for (const auto &category : KeywordCategories()) {
    for (const auto &word : category.words) {
      const auto count = CountOccurrences(lower, word);
      if (count == 0) {
        continue;
      }
      const double boost =
          std::min(1.0 + (static_cast<double>(count) - 1.0) * 0.2, 2.0);
      auto &entry = keywords[category.name];
      entry = std::min(entry + category.weight * boost, category.weight * 2.0);
    }
  }
  double max_weight = 0.0;
  for (const auto &[name, weight] : keywords) {
    max_weight = std::max(max_weight, weight);
  }
  if (max_weight > 0.0) {
    for (auto &[name, weight] : keywords) {
      weight /= max_weight;
    }
  }
  return keywords;
}

ParsedIssue ParseIssue(GitHubIssue issue) {
  ParsedIssue parsed;
  const auto text = issue.title + " " + issue.body;
  parsed.file_paths = ExtractIssueFilePaths(text);
  parsed.keywords = ExtractIssueKeywords(text);

  auto paragraph = issue.body.substr(0, issue.body.find("\n\n"));
  if (paragraph.size() > 200) {
    paragraph = paragraph.substr(0, 200) + "...";
  }
  parsed.summary = paragraph.empty() ? issue.title
                                     : issue.title + "\n\n" + paragraph;
  parsed.issue = std::move(issue);
  return parsed;
}

nlohmann::json IssueContextJson(const ParsedIssue &issue) {
  nlohmann::json keywords = nlohmann::json::object();
  std::vector<std::string> areas;
  for (const auto &[name, weight] : issue.keywords) {
    keywords[name] = weight;
    areas.push_back(name);
  }
  std::string joined;
  for (const auto &area : areas) {
    joined += joined.empty() ? area : ", " + area;
  }
  nlohmann::json json;
  json["title"] = issue.issue.title;
  json["summary"] = issue.summary;
  json["keywords"] = keywords;
  json["priority_areas"] = areas;
  json["instructions"] =
      "PRIORITY: Focus on fixing issues related to: " + joined +
      ". The user has specifically identified these areas as problematic in "
      "the GitHub issue.";
  return json;
}

GitHubIssueClient::GitHubIssueClient(std::shared_ptr<ProcessRunner> runner,
                                     std::shared_ptr<Logger> logger)
    : runner_(std::move(runner)), logger_(EnsureLogger(std::move(logger))) {
  if (!runner_) {
    throw std::invalid_argument("GitHub issue client requires a process runner");
  }
}

GitHubIssue GitHubIssueClient::Fetch(const std::string &url,
                                     const ExecutionContext &context) const {
  const auto reference = ParseIssueUrl(url);
  ProcessRequest request;
  request.program = "curl";
  request.arguments = {"-sS",
                       "-f",
                       "-L",
                       "--max-time",
                       "30",
                       "-H",
                       "Accept: application/vnd.github.v3+json",
                       "-H",
                       "User-Agent: qgate"};
  auto token = context.Env("GITHUB_TOKEN");
  if (!token) {
    token = context.Env("GH_TOKEN");
  }
  if (token && !token->empty()) {
    request.arguments.push_back("-H");
    request.arguments.push_back("Authorization: Bearer " + *token);
  } else {
    logger_->Log(LogLevel::kWarn, "github.token.missing",
                 {{"hint", "set GITHUB_TOKEN to raise API rate limits"}});
  }
  request.arguments.push_back(reference.ApiUrl());
  request.working_directory = context.cwd;
  request.timeout = std::chrono::milliseconds(35000);

  logger_->Log(LogLevel::kInfo, "github.issue.fetch",
               {{"owner", reference.owner},
                {"repository", reference.repository},
                {"number", std::to_string(reference.number)}});
  const auto result = runner_->Run(request, context);
  if (!result.Succeeded()) {
    throw std::runtime_error("GitHub API request failed for " + url + ": " +
                             Trim(result.stderr_text));
  }
  auto issue = ParseIssueJson(result.stdout_text);
  if (issue.state == "closed") {
    logger_->Log(LogLevel::kWarn, "github.issue.closed",
                 {{"number", std::to_string(issue.number)}});
  }
  return issue;
}

std::vector<std::string> ExtractBugReportFiles(const std::string &markdown) {
  static const std::array<const char *, 5> kExtensions = {".rs", ".ts", ".js",
                                                          ".py", ".md"};
  std::set<std::string> files;
  bool in_code_block = false;
  for (const auto &line : SplitLines(markdown)) {
    if (StartsWith(line, "```")) {
      in_code_block = !in_code_block;
      continue;
    }
    if (in_code_block || !(Contains(line, "src/") || Contains(line, "server/") ||
                           Contains(line, "docs/"))) {
      continue;
    }
    for (const auto &word : SplitWhitespace(line)) {
      if (StartsWith(word, "http")) {
        continue;
      }
      const bool has_extension =
          std::any_of(kExtensions.begin(), kExtensions.end(),
                      [&word](const char *extension) {
                        return Contains(word, extension);
                      });
      if (!has_extension) {
        continue;
      }
      auto cleaned = TrimPathToken(word);
      if (!cleaned.empty()) {
        files.insert(std::move(cleaned));
      }
    }
  }
  return {files.begin(), files.end()};
}

BugReport LoadBugReport(const std::filesystem::path &path) {
  std::error_code error;
  if (!std::filesystem::is_regular_file(path, error)) {
    throw std::invalid_argument("Bug report file not found: " + path.string());
  }
  BugReport report;
  report.path = path;
  report.content = ReadFile(path);
  report.mentioned_files = ExtractBugReportFiles(report.content);
  return report;
}

nlohmann::json BugReportContextJson(const BugReport &report) {
  nlohmann::json json;
  json["type"] = "markdown_bug_report";
  json["content"] = report.content;
  json["mentioned_files"] = report.mentioned_files;
  json["instructions"] =
      "This is a bug report that needs to be analyzed. If the bug report "
      "mentions specific files or code issues, prioritize fixing those "
      "referenced problems.";
  json["priority"] = "Fix the issues described in this bug report";
  return json;
}

std::vector<std::string>
DiscoverTestDependencies(const std::filesystem::path &root,
                         const std::string &test_file) {
  static const std::regex use_statement(
      R"(use\s+(crate::|super::|self::)([^;]+);)");
  static const std::regex file_reference(
      R"(["']((?:src/|\.\./)[^\s"']+\.(?:rs|py|ts|js))["'])");

  const auto test_path = root / test_file;
  const auto content = ReadFile(test_path);
  const auto test_dir = test_path.parent_path();
  const std::array<std::filesystem::path, 4> bases = {
      test_dir, test_dir.parent_path(), test_dir.parent_path().parent_path(),
      root};

  std::set<std::string> dependencies;
  for (auto it = std::sregex_iterator(content.begin(), content.end(),
                                      use_statement);
       it != std::sregex_iterator(); ++it) {
    const auto import_path = (*it)[2].str();
    if (import_path.find("::") == std::string::npos) {
      continue;
    }
    bool resolved = false;
    for (const auto &candidate : ImportCandidates(import_path)) {
      for (const auto &base : bases) {
        if (auto relative = ExistingRelative(root, base / candidate)) {
          dependencies.insert(*relative);
          resolved = true;
          break;
        }
      }
      if (resolved) {
        break;
      }
    }
  }
  for (auto it = std::sregex_iterator(content.begin(), content.end(),
                                      file_reference);
       it != std::sregex_iterator(); ++it) {
    const auto reference = (*it)[1].str();
    const auto base = StartsWith(reference, "../") ? test_dir : root;
    if (auto relative = ExistingRelative(root, base / reference)) {
      dependencies.insert(*relative);
    }
  }
  dependencies.erase(test_file);
  return {dependencies.begin(), dependencies.end()};
}

std::vector<std::string>
ResolveMentionedFiles(const std::filesystem::path &root,
                      const std::vector<std::string> &mentioned,
                      const SourceSet &sources) {
  std::set<std::string> resolved;
  for (const auto &path : mentioned) {
    if (auto relative = ExistingRelative(root, root / path)) {
      resolved.insert(*relative);
      continue;
    }
    const auto name = FileNameOf(path);
    for (const auto &file : sources.files) {
      if (FileNameOf(file) == name) {
        resolved.insert(file);
      }
    }
  }
  return {resolved.begin(), resolved.end()};
}

} // namespace qgate
