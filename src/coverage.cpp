#include <qgate/coverage.h>

#include <qgate/escaping.h>
#include <qgate/strings.h>

#include <algorithm>
#include <fstream>
#include <regex>

namespace qgate {
namespace {

constexpr char kCoverageDirectory[] = "coverage";
constexpr char kCacheFile[] = "file_coverage.tsv";

std::optional<double> ParsePercentToken(std::string token) {
  token = Trim(token);
  if (!EndsWith(token, "%")) {
    return std::nullopt;
  }
  token.pop_back();
  try {
    std::size_t consumed = 0;
    const double value = std::stod(token, &consumed);
    if (consumed != token.size()) {
      return std::nullopt;
    }
    return std::clamp(value, 0.0, 100.0);
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

// Second column when it is a percentage; otherwise the line-coverage
// column, which is the second percentage when function coverage precedes
// it.
std::optional<double> LlvmRowPercent(const std::string &line) {
  const auto tokens = SplitWhitespace(line);
  if (tokens.size() > 1) {
    if (const auto second = ParsePercentToken(tokens[1])) {
      return second;
    }
  }
  std::vector<double> percents;
  for (const auto &token : tokens) {
    if (const auto value = ParsePercentToken(token)) {
      percents.push_back(*value);
    }
  }
  if (percents.empty()) {
    return std::nullopt;
  }
  return percents.size() >= 2 ? percents[1] : percents[0];
}

std::string NormalizeReportPath(const std::string &path,
                                const std::filesystem::path &root) {
  const std::filesystem::path file(path);
  if (file.is_absolute()) {
    return file.lexically_relative(root).generic_string();
  }
  return file.lexically_normal().generic_string();
}

std::map<std::string, std::string>
CoverageEnvironment(const std::filesystem::path &coverage_dir) {
  return {{"RUSTFLAGS", "-C instrument-coverage"},
          {"LLVM_PROFILE_FILE", (coverage_dir / "%p-%m.profraw").string()}};
}

std::string CrateName(const std::filesystem::path &root) {
  static const std::regex kName(R"rx(^\s*name\s*=\s*"([^"]+)")rx");
  try {
    bool in_package = false;
    for (const auto &line : SplitLines(ReadFile(root / "Cargo.toml"))) {
      const auto trimmed = Trim(line);
      if (StartsWith(trimmed, "[")) {
        in_package = trimmed == "[package]";
        continue;
      }
      std::smatch match;
      if (in_package && std::regex_search(line, match, kName)) {
        auto name = match[1].str();
        std::replace(name.begin(), name.end(), '-', '_');
        return name;
      }
    }
  } catch (const std::runtime_error &) {
    return std::string();
  }
  return std::string();
}

} // namespace

std::optional<double> ParseLlvmCovReport(const std::string &output,
                                         const std::string &relative_file) {
  const auto lines = SplitLines(output);
  for (const auto &line : lines) {
    if (!relative_file.empty() && Contains(line, relative_file)) {
      if (const auto value = LlvmRowPercent(line)) {
        return value;
      }
    }
  }
  for (const auto &line : lines) {
    if (StartsWith(Trim(line), "TOTAL")) {
      if (const auto value = LlvmRowPercent(line)) {
        return value;
      }
    }
  }
  return std::nullopt;
}

std::map<std::string, double> ParseLlvmCovFiles(const std::string &output) {
  std::map<std::string, double> files;
  for (const auto &line : SplitLines(output)) {
    const auto tokens = SplitWhitespace(line);
    if (tokens.size() < 2 || tokens.front() == "TOTAL" ||
        tokens.front() == "Filename" || StartsWith(tokens.front(), "---")) {
      continue;
    }
    if (const auto value = LlvmRowPercent(line)) {
      files[tokens.front()] = *value;
    }
  }
  return files;
}

std::optional<double> ParseGrcovReport(const std::string &output,
                                       const std::string &relative_file) {
  for (const auto &line : SplitLines(output)) {
    if (!Contains(line, relative_file)) {
      continue;
    }
    const auto colon = line.rfind(':');
    if (colon == std::string::npos) {
      continue;
    }
    if (const auto value = ParsePercentToken(line.substr(colon + 1))) {
      return value;
    }
  }
  return std::nullopt;
}

std::optional<double> ParseTarpaulinSummary(const std::string &output,
                                            const std::string &relative_file) {
  const auto lines = SplitLines(output);
  const auto last_token_percent = [](const std::string &line)
      -> std::optional<double> {
    const auto tokens = SplitWhitespace(line);
    if (tokens.empty()) {
      return std::nullopt;
    }
    return ParsePercentToken(tokens.back());
  };
  if (!relative_file.empty()) {
    for (const auto &line : lines) {
      if (Contains(line, relative_file) && Contains(line, "%")) {
        if (const auto value = last_token_percent(line)) {
          return value;
        }
      }
    }
  }
  // "73.45% coverage, 40/50 lines covered"
  for (const auto &line : lines) {
    if (!Contains(ToLower(line), "coverage") || !Contains(line, "%")) {
      continue;
    }
    if (const auto value = last_token_percent(line)) {
      return value;
    }
    for (const auto &token : SplitWhitespace(line)) {
      auto cleaned = token;
      if (!cleaned.empty() && cleaned.back() == ',') {
        cleaned.pop_back();
      }
      if (const auto value = ParsePercentToken(cleaned)) {
        return value;
      }
    }
  }
  return std::nullopt;
}

CoverageCache::CoverageCache(std::filesystem::path cache_dir)
    : path_(std::move(cache_dir) / kCoverageDirectory / kCacheFile) {}

void CoverageCache::Load() {
  entries_.clear();
  std::ifstream stream(path_);
  if (!stream) {
    return;
  }
  std::string line;
  while (std::getline(stream, line)) {
    const auto fields = SplitEscaped(line);
    if (fields.size() != 2) {
      continue;
    }
    try {
      entries_[fields[0]] = std::stod(fields[1]);
    } catch (const std::exception &) {
      continue;
    }
  }
}

void CoverageCache::Save() const {
  std::string content;
  for (const auto &entry : entries_) {
    content += JoinEscaped({entry.first, FormatFixed(entry.second, 2)});
    content.push_back('\n');
  }
  WriteFileAtomically(path_, content);
}

std::optional<double> CoverageCache::Get(const std::string &file) const {
  const auto found = entries_.find(file);
  if (found == entries_.end()) {
    return std::nullopt;
  }
  return found->second;
}

void CoverageCache::Put(const std::string &file, double percent) {
  entries_[file] = std::clamp(percent, 0.0, 100.0);
}

CoverageSampler::CoverageSampler(std::shared_ptr<ProcessRunner> runner,
                                 CoverageOptions options,
                                 std::shared_ptr<Logger> logger)
    : runner_(std::move(runner)), options_(options),
      logger_(EnsureLogger(std::move(logger))) {
  if (!runner_) {
    throw std::invalid_argument("CoverageSampler requires a process runner");
  }
}

std::optional<CoverageSampler::Profile>
CoverageSampler::PrepareProfile(const SourceSet &sources,
                                const ExecutionContext &context) {
  const auto coverage_dir = context.cache_dir / kCoverageDirectory;
  std::error_code error;
  std::filesystem::create_directories(coverage_dir, error);
  for (const auto &entry :
       std::filesystem::directory_iterator(coverage_dir, error)) {
    if (entry.path().extension() == ".profraw") {
      std::filesystem::remove(entry.path(), error);
    }
  }

  ProcessRequest build;
  build.program = "cargo";
  build.arguments = {"build", "--tests", "--quiet"};
  build.working_directory = sources.root;
  build.environment = CoverageEnvironment(coverage_dir);
  const auto built = runner_->Run(build, context);
  if (!built.Succeeded()) {
    logger_->Log(LogLevel::kWarn, "coverage.llvm.build_failed",
                 {{"exit_code", std::to_string(built.exit_code)}});
    return std::nullopt;
  }

  ProcessRequest test = build;
  test.arguments = {"test", "--quiet", "--lib", "--", "--test-threads=4"};
  const auto tested = runner_->Run(test, context);
  if (tested.cancelled) {
    return std::nullopt;
  }
  if (!tested.Succeeded()) {
    logger_->Log(LogLevel::kWarn, "coverage.tests_failed",
                 {{"exit_code", std::to_string(tested.exit_code)}});
  }

  std::vector<std::string> profiles;
  for (const auto &entry :
       std::filesystem::directory_iterator(coverage_dir, error)) {
    if (entry.path().extension() == ".profraw") {
      profiles.push_back(entry.path().string());
    }
  }
  if (profiles.empty()) {
    logger_->Log(LogLevel::kWarn, "coverage.llvm.no_profiles",
                 {{"directory", coverage_dir.string()}});
    return std::nullopt;
  }
  std::sort(profiles.begin(), profiles.end());

  Profile profile;
  profile.profdata = coverage_dir / "merged.profdata";
  ProcessRequest merge;
  merge.program = "llvm-profdata";
  merge.arguments = {"merge", "-sparse"};
  merge.arguments.insert(merge.arguments.end(), profiles.begin(),
                         profiles.end());
  merge.arguments.push_back("-o");
  merge.arguments.push_back(profile.profdata.string());
  merge.working_directory = sources.root;
  merge.timeout = options_.tool_timeout;
  if (!runner_->Run(merge, context).Succeeded()) {
    logger_->Log(LogLevel::kWarn, "coverage.llvm.merge_failed", {});
    return std::nullopt;
  }

  const auto crate = CrateName(sources.root);
  const auto deps = sources.root / "target" / "debug" / "deps";
  std::vector<std::filesystem::path> candidates;
  for (const auto &entry : std::filesystem::directory_iterator(deps, error)) {
    const auto name = entry.path().filename().string();
    if (!entry.is_regular_file() || entry.path().has_extension()) {
      continue;
    }
    if (crate.empty() || StartsWith(name, crate + "-")) {
      candidates.push_back(entry.path());
    }
  }
  if (candidates.empty()) {
    logger_->Log(LogLevel::kWarn, "coverage.llvm.no_test_binary",
                 {{"directory", deps.string()}});
    return std::nullopt;
  }
  std::sort(candidates.begin(), candidates.end());
  profile.binary = candidates.front();
  return profile;
}

std::optional<std::string>
CoverageSampler::RunLlvmCov(const Profile &profile, const SourceSet &sources,
                            const std::optional<std::string> &file,
                            const ExecutionContext &context) {
  ProcessRequest report;
  report.program = "llvm-cov";
  report.arguments = {"report", profile.binary.string(),
                      "--instr-profile=" + profile.profdata.string(),
                      "--show-region-summary=false"};
  if (file) {
    report.arguments.push_back(*file);
  }
  report.working_directory = sources.root;
  report.timeout = options_.tool_timeout;
  const auto result = runner_->Run(report, context);
  if (!result.Succeeded()) {
    return std::nullopt;
  }
  return result.stdout_text;
}

std::optional<std::string>
CoverageSampler::RunGrcov(const SourceSet &sources,
                          const ExecutionContext &context) {
  ProcessRequest grcov;
  grcov.program = "grcov";
  grcov.arguments = {".",      "--binary-path", "./target/debug/",
                     "--source-dir", ".",       "--output-type",
                     "files",  "--ignore",      "tests/*",
                     "--ignore", "target/*"};
  grcov.working_directory = sources.root;
  grcov.timeout = options_.tool_timeout;
  const auto result = runner_->Run(grcov, context);
  if (!result.Succeeded()) {
    logger_->Log(LogLevel::kWarn, "coverage.fallback",
                 {{"failed", "grcov"}, {"next", "tarpaulin"}});
    return std::nullopt;
  }
  return result.stdout_text;
}

std::optional<std::string>
CoverageSampler::RunTarpaulin(const SourceSet &sources,
                              const std::optional<std::string> &file,
                              const ExecutionContext &context) {
  ProcessRequest tarpaulin;
  tarpaulin.program = "cargo";
  tarpaulin.arguments = {"tarpaulin", "--print-summary", "--skip-clean"};
  if (file) {
    tarpaulin.arguments.push_back("--include-files");
    tarpaulin.arguments.push_back(*file);
  }
  tarpaulin.arguments.push_back("--timeout");
  tarpaulin.arguments.push_back("30");
  tarpaulin.working_directory = sources.root;
  tarpaulin.timeout = options_.tool_timeout;
  const auto result = runner_->Run(tarpaulin, context);
  if (!result.Succeeded()) {
    logger_->Log(LogLevel::kWarn, "coverage.unavailable",
                 {{"file", file.value_or("")},
                  {"timed_out", result.timed_out ? "true" : "false"}});
    return std::nullopt;
  }
  return result.stdout_text;
}

ProjectCoverage CoverageSampler::MeasureProject(const SourceSet &sources,
                                                const ExecutionContext &context) {
  ProjectCoverage coverage;
  if (sources.toolchain != Toolchain::kRust) {
    logger_->Log(LogLevel::kWarn, "coverage.unsupported",
                 {{"toolchain", ToolchainName(sources.toolchain)}});
    return coverage;
  }
  if (const auto profile = PrepareProfile(sources, context)) {
    if (const auto report = RunLlvmCov(*profile, sources, std::nullopt, context)) {
      for (const auto &entry : ParseLlvmCovFiles(*report)) {
        coverage.by_file[NormalizeReportPath(entry.first, sources.root)] =
            entry.second;
      }
      coverage.percent = ParseLlvmCovReport(*report, "").value_or(0.0);
      coverage.method = "llvm-cov";
      return coverage;
    }
  }
  logger_->Log(LogLevel::kWarn, "coverage.fallback",
               {{"failed", "llvm-cov"}, {"next", "grcov"}});
  if (const auto report = RunGrcov(sources, context)) {
    double total = 0.0;
    for (const auto &line : SplitLines(*report)) {
      const auto colon = line.rfind(':');
      if (colon == std::string::npos) {
        continue;
      }
      if (const auto value = ParsePercentToken(line.substr(colon + 1))) {
        coverage.by_file[NormalizeReportPath(Trim(line.substr(0, colon)),
                                             sources.root)] = *value;
        total += *value;
      }
    }
    if (!coverage.by_file.empty()) {
      coverage.percent = total / static_cast<double>(coverage.by_file.size());
      coverage.method = "grcov";
      return coverage;
    }
  }
  if (const auto report = RunTarpaulin(sources, std::nullopt, context)) {
    if (const auto value = ParseTarpaulinSummary(*report, "")) {
      coverage.percent = *value;
      coverage.method = "tarpaulin";
    }
  }
  return coverage;
}

double CoverageSampler::MeasureFile(const SourceSet &sources,
                                    const std::string &file,
                                    const ExecutionContext &context) {
  if (sources.toolchain != Toolchain::kRust) {
    logger_->Log(LogLevel::kWarn, "coverage.unsupported",
                 {{"toolchain", ToolchainName(sources.toolchain)},
                  {"file", file}});
    return 0.0;
  }
  if (const auto profile = PrepareProfile(sources, context)) {
    if (const auto report = RunLlvmCov(*profile, sources, file, context)) {
      if (const auto value = ParseLlvmCovReport(*report, file)) {
        return *value;
      }
    }
  }
  logger_->Log(LogLevel::kWarn, "coverage.fallback",
               {{"file", file}, {"failed", "llvm-cov"}, {"next", "grcov"}});
  if (const auto report = RunGrcov(sources, context)) {
    if (const auto value = ParseGrcovReport(*report, file)) {
      return *value;
    }
  }
  if (const auto report = RunTarpaulin(sources, file, context)) {
    if (const auto value = ParseTarpaulinSummary(*report, file)) {
      return *value;
    }
  }
  logger_->Log(LogLevel::kWarn, "coverage.zero", {{"file", file}});
  return 0.0;
}

} // namespace qgate
