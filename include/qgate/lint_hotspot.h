#pragma once

#include <qgate/build_error_analyzer.h>
#include <qgate/execution_context.h>
#include <qgate/logging.h>
#include <qgate/models.h>
#include <qgate/process_runner.h>
#include <qgate/source_discovery.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace qgate {

// `cargo clippy --message-format=json` stdout: one JSON record per line,
// only `compiler-message` records are read. Records without a primary
// span inside `root` are dropped.
std::vector<ViolationDetail>
ParseClippyMessages(const std::string &output,
                    const std::filesystem::path &root);

// Groups violations per file; density is violations per logical line and
// the hotspot is the densest file (ties: more violations, then path).
LintHotspotResult
AggregateLintViolations(std::vector<ViolationDetail> violations,
                        const std::map<std::string, unsigned> &sloc_by_file);

struct EnforcementOptions {
  // Violations per logical line.
  double max_density = 0.05;
  double min_confidence = 0.8;
  unsigned max_single_file_violations = 50;
};

nlohmann::json RenderEnforcementJson(const LintHotspotResult &result,
                                     const EnforcementOptions &options = {});
// nullopt for empty or malformed documents.
std::optional<LintHotspotResult> ParseEnforcementJson(const std::string &text);

class LintSource {
public:
  virtual ~LintSource() = default;
  // nullopt means the source could not produce a result at all.
  virtual std::optional<LintHotspotResult>
  Collect(const SourceSet &sources, const ExecutionContext &context) = 0;
};

// Runs the linter directly in this process.
class ClippyLintSource : public LintSource {
public:
  ClippyLintSource(std::shared_ptr<ProcessRunner> runner,
                   std::shared_ptr<Logger> logger = nullptr);

  std::optional<LintHotspotResult>
  Collect(const SourceSet &sources, const ExecutionContext &context) override;

private:
  std::shared_ptr<ProcessRunner> runner_;
  std::shared_ptr<Logger> logger_;
};

// Runs `<executable> analyze lint-hotspot --format enforcement-json` so a
// crashing linter cannot take the refactor loop down with it.
class SelfInvokingLintSource : public LintSource {
public:
  SelfInvokingLintSource(std::shared_ptr<ProcessRunner> runner,
                         std::filesystem::path executable,
                         std::shared_ptr<Logger> logger = nullptr);

  std::optional<LintHotspotResult>
  Collect(const SourceSet &sources, const ExecutionContext &context) override;

private:
  std::shared_ptr<ProcessRunner> runner_;
  std::filesystem::path executable_;
  std::shared_ptr<Logger> logger_;
};

class LintMeasurer {
public:
  virtual ~LintMeasurer() = default;
  virtual LintHotspotResult Analyze(const SourceSet &sources,
                                    const ExecutionContext &context) = 0;
};

// Primary lint source with the compiler-diagnostics fallback.
class LintHotspotAnalyzer : public LintMeasurer {
public:
  LintHotspotAnalyzer(std::unique_ptr<LintSource> source,
                      std::shared_ptr<BuildErrorAnalyzer> fallback,
                      std::shared_ptr<Logger> logger = nullptr);

  LintHotspotResult Analyze(const SourceSet &sources,
                            const ExecutionContext &context) override;

private:
  std::unique_ptr<LintSource> source_;
  std::shared_ptr<BuildErrorAnalyzer> fallback_;
  std::shared_ptr<Logger> logger_;
};

} // namespace qgate
