#pragma once

#include <qgate/execution_context.h>
#include <qgate/logging.h>
#include <qgate/models.h>
#include <qgate/process_runner.h>
#include <qgate/source_discovery.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace qgate {

struct BuildErrorReport {
  bool build_succeeded = true;
  std::vector<ViolationDetail> errors;
  std::map<std::string, unsigned> errors_by_file;

  // Build failed but no diagnostic named a file.
  bool Unattributed() const { return !build_succeeded && errors.empty(); }
  // Most errors first, ties by path; empty when nothing was attributed.
  std::optional<std::string> WorstFile() const;
};

// `<file>:<line>:<col>: error[E0000]: <message>` lines (the `[...]` code is
// optional); other lines are ignored. Paths are made relative to `root`.
std::vector<ViolationDetail>
ParseShortDiagnostics(const std::string &output,
                      const std::filesystem::path &root);

// Density is errors over logical lines per file.
LintHotspotResult BuildErrorsAsHotspot(const BuildErrorReport &report,
                                       const std::filesystem::path &root,
                                       Toolchain toolchain);

class BuildErrorAnalyzer {
public:
  BuildErrorAnalyzer(std::shared_ptr<ProcessRunner> runner,
                     std::shared_ptr<Logger> logger = nullptr);

  BuildErrorReport Analyze(const SourceSet &sources,
                           const ExecutionContext &context) const;

private:
  std::shared_ptr<ProcessRunner> runner_;
  std::shared_ptr<Logger> logger_;
};

} // namespace qgate
