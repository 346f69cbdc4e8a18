#pragma once

#include <qgate/complexity_analyzer.h>
#include <qgate/coverage.h>
#include <qgate/execution_context.h>
#include <qgate/lint_hotspot.h>
#include <qgate/logging.h>
#include <qgate/models.h>
#include <qgate/process_runner.h>
#include <qgate/satd_analyzer.h>
#include <qgate/source_discovery.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace qgate {

struct MeasurementSnapshot {
  QualityMetrics metrics;
  LintHotspotResult lint;
  ProjectCoverage coverage;
  ComplexityReport complexity;
  // Colon-terminated markers only.
  SatdReport satd;
};

// Gate counters derived from the raw analyzer outputs.
QualityMetrics ComputeQualityMetrics(const SourceSet &sources,
                                     const LintHotspotResult &lint,
                                     const ProjectCoverage &coverage,
                                     const ComplexityReport &complexity,
                                     const SatdReport &satd,
                                     const QualityProfile &profile);

struct MeasurementComponents {
  std::unique_ptr<LintMeasurer> lint;
  std::unique_ptr<CoverageMeasurer> coverage;
  std::shared_ptr<Logger> logger;
  QualityProfile profile;
  unsigned parallelism = 0;
};

// Lint hotspot, then coverage, then complexity and SATD.
class QualityMeasurementPipeline {
public:
  explicit QualityMeasurementPipeline(MeasurementComponents components);

  MeasurementSnapshot Measure(const SourceSet &sources,
                              const ExecutionContext &context);
  // Updates the per-file coverage cache under the context's cache dir.
  double MeasureFileCoverage(const SourceSet &sources, const std::string &file,
                             const ExecutionContext &context);

  const QualityProfile &profile() const { return profile_; }

private:
  std::unique_ptr<LintMeasurer> lint_;
  std::unique_ptr<CoverageMeasurer> coverage_;
  std::shared_ptr<Logger> logger_;
  QualityProfile profile_;
  unsigned parallelism_;
};

class MeasurementPipelineBuilder {
public:
  explicit MeasurementPipelineBuilder(
      std::shared_ptr<ProcessRunner> runner = nullptr);

  MeasurementPipelineBuilder &
  WithLintMeasurer(std::unique_ptr<LintMeasurer> lint);
  MeasurementPipelineBuilder &
  WithCoverageMeasurer(std::unique_ptr<CoverageMeasurer> coverage);
  MeasurementPipelineBuilder &WithLogger(std::shared_ptr<Logger> logger);
  MeasurementPipelineBuilder &WithProfile(QualityProfile profile);
  MeasurementPipelineBuilder &WithParallelism(unsigned parallelism);
  // Lint through `<executable> analyze lint-hotspot` instead of in-process.
  MeasurementPipelineBuilder &
  WithSelfExecutable(std::filesystem::path executable);
  MeasurementPipelineBuilder &WithCoverageOptions(CoverageOptions options);

  QualityMeasurementPipeline Build();

private:
  std::shared_ptr<ProcessRunner> runner_;
  std::optional<std::filesystem::path> self_executable_;
  CoverageOptions coverage_options_;
  MeasurementComponents components_;
};

} // namespace qgate
