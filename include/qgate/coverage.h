#pragma once

#include <qgate/execution_context.h>
#include <qgate/logging.h>
#include <qgate/process_runner.h>
#include <qgate/source_discovery.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace qgate {

// `llvm-cov report`: the second column of the file's row, or of TOTAL when
// the file has no row.
std::optional<double> ParseLlvmCovReport(const std::string &output,
                                         const std::string &relative_file);
// Every `<file> ... <percent>%` row of an llvm-cov report, keyed by path.
std::map<std::string, double> ParseLlvmCovFiles(const std::string &output);
// `grcov --output-type files`: `path: 80.00%`.
std::optional<double> ParseGrcovReport(const std::string &output,
                                       const std::string &relative_file);
// `cargo tarpaulin --print-summary`: the file's row, otherwise the overall
// coverage line. The value is the last token with `%` stripped.
std::optional<double> ParseTarpaulinSummary(const std::string &output,
                                            const std::string &relative_file);

// `<cache>/coverage/file_coverage.tsv`, one `path<TAB>percent` per line.
class CoverageCache {
public:
  explicit CoverageCache(std::filesystem::path cache_dir);

  void Load();
  void Save() const;

  std::optional<double> Get(const std::string &file) const;
  void Put(const std::string &file, double percent);
  const std::map<std::string, double> &Entries() const { return entries_; }
  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
  std::map<std::string, double> entries_;
};

struct CoverageOptions {
  // Applied to each llvm-profdata, llvm-cov, grcov and tarpaulin run.
  std::chrono::milliseconds tool_timeout{30000};
};

struct ProjectCoverage {
  double percent = 0.0;
  std::map<std::string, double> by_file;
  // "llvm-cov", "grcov", "tarpaulin" or "none".
  std::string method = "none";
};

class CoverageMeasurer {
public:
  virtual ~CoverageMeasurer() = default;
  virtual ProjectCoverage MeasureProject(const SourceSet &sources,
                                         const ExecutionContext &context) = 0;
  virtual double MeasureFile(const SourceSet &sources, const std::string &file,
                             const ExecutionContext &context) = 0;
};

class CoverageSampler : public CoverageMeasurer {
public:
  CoverageSampler(std::shared_ptr<ProcessRunner> runner,
                  CoverageOptions options = {},
                  std::shared_ptr<Logger> logger = nullptr);

  // Project-wide percentage plus every per-file value the tool reported.
  ProjectCoverage MeasureProject(const SourceSet &sources,
                                 const ExecutionContext &context) override;
  // LLVM, then grcov, then tarpaulin; any total failure yields 0.0, as does
  // every toolchain other than Rust (logged as `coverage.unsupported`).
  double MeasureFile(const SourceSet &sources, const std::string &file,
                     const ExecutionContext &context) override;

private:
  struct Profile {
    std::filesystem::path binary;
    std::filesystem::path profdata;
  };

  std::optional<Profile> PrepareProfile(const SourceSet &sources,
                                        const ExecutionContext &context);
  std::optional<std::string> RunLlvmCov(const Profile &profile,
                                        const SourceSet &sources,
                                        const std::optional<std::string> &file,
                                        const ExecutionContext &context);
  std::optional<std::string> RunGrcov(const SourceSet &sources,
                                      const ExecutionContext &context);
  std::optional<std::string> RunTarpaulin(const SourceSet &sources,
                                          const std::optional<std::string> &file,
                                          const ExecutionContext &context);

  std::shared_ptr<ProcessRunner> runner_;
  CoverageOptions options_;
  std::shared_ptr<Logger> logger_;
};

} // namespace qgate
