#include <qgate/measurement_pipeline.h>

#include <qgate/build_error_analyzer.h>

#include <chrono>
#include <stdexcept>
#include <utility>

namespace qgate {

QualityMetrics ComputeQualityMetrics(const SourceSet &sources,
                                     const LintHotspotResult &lint,
                                     const ProjectCoverage &coverage,
                                     const ComplexityReport &complexity,
                                     const SatdReport &satd,
                                     const QualityProfile &profile) {
  QualityMetrics metrics;
  metrics.total_violations = lint.total_project_violations;
  metrics.files_with_issues =
      static_cast<unsigned>(lint.summary_by_file.size());
  metrics.total_files = static_cast<unsigned>(sources.files.size());
  metrics.coverage_percent = coverage.percent;
  metrics.max_complexity = complexity.summary.max_cyclomatic;
  metrics.total_functions = complexity.summary.total_functions;
  for (const auto &file : complexity.files) {
    for (const auto &function : file.functions) {
      if (function.cyclomatic > profile.complexity_max) {
        ++metrics.functions_with_high_complexity;
      }
    }
  }
  metrics.satd_count = static_cast<unsigned>(satd.items.size());
  return metrics;
}

QualityMeasurementPipeline::QualityMeasurementPipeline(
    MeasurementComponents components)
    : lint_(std::move(components.lint)),
      coverage_(std::move(components.coverage)),
      logger_(EnsureLogger(std::move(components.logger))),
      profile_(components.profile), parallelism_(components.parallelism) {
  if (!lint_ || !coverage_) {
    throw std::invalid_argument(
        "Measurement pipeline requires lint and coverage measurers");
  }
}

MeasurementSnapshot
QualityMeasurementPipeline::Measure(const SourceSet &sources,
                                    const ExecutionContext &context) {
  logger_->Log(LogLevel::kInfo, "pipeline.start",
               {{"root", sources.root.string()},
                {"files", std::to_string(sources.files.size())}});
  const auto pipeline_start = std::chrono::steady_clock::now();

  MeasurementSnapshot snapshot;
  snapshot.lint = lint_->Analyze(sources, context);
  logger_->Log(
      LogLevel::kDebug, "pipeline.stage.complete",
      {{"stage", "lint"},
       {"violations", std::to_string(snapshot.lint.total_project_violations)}});

  snapshot.coverage = coverage_->MeasureProject(sources, context);
  if (!snapshot.coverage.by_file.empty() && !context.cache_dir.empty()) {
    CoverageCache cache(context.cache_dir);
    cache.Load();
    for (const auto &[file, percent] : snapshot.coverage.by_file) {
      cache.Put(file, percent);
    }
    try {
      cache.Save();
    } catch (const std::runtime_error &error) {
      logger_->Log(LogLevel::kWarn, "coverage.cache.write_failed",
                   {{"error", error.what()}});
    }
  }
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "coverage"},
                {"method", snapshot.coverage.method},
                {"percent", std::to_string(snapshot.coverage.percent)}});

  ComplexityOptions complexity_options;
  complexity_options.threshold = profile_.complexity_max;
  complexity_options.parallelism = parallelism_;
  snapshot.complexity =
      ComplexityAnalyzer(complexity_options, logger_).Analyze(sources);
  SatdOptions satd_options;
  satd_options.strict_only = true;
  satd_options.parallelism = parallelism_;
  snapshot.satd = SatdAnalyzer(satd_options, logger_).Analyze(sources);
  logger_->Log(
      LogLevel::kDebug, "pipeline.stage.complete",
      {{"stage", "complexity"},
       {"max_cyclomatic",
        std::to_string(snapshot.complexity.summary.max_cyclomatic)},
       {"satd", std::to_string(snapshot.satd.items.size())}});

  snapshot.metrics =
      ComputeQualityMetrics(sources, snapshot.lint, snapshot.coverage,
                            snapshot.complexity, snapshot.satd, profile_);

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - pipeline_start)
          .count();
  logger_->Log(LogLevel::kInfo, "pipeline.complete",
               {{"duration_ms", std::to_string(duration_ms)},
                {"violations",
                 std::to_string(snapshot.metrics.total_violations)}});
  return snapshot;
}

double QualityMeasurementPipeline::MeasureFileCoverage(
    const SourceSet &sources, const std::string &file,
    const ExecutionContext &context) {
  const double percent = coverage_->MeasureFile(sources, file, context);
  if (!context.cache_dir.empty()) {
    CoverageCache cache(context.cache_dir);
    cache.Load();
    cache.Put(file, percent);
    try {
      cache.Save();
    } catch (const std::runtime_error &error) {
      logger_->Log(LogLevel::kWarn, "coverage.cache.write_failed",
                   {{"error", error.what()}});
    }
  }
  return percent;
}

MeasurementPipelineBuilder::MeasurementPipelineBuilder(
    std::shared_ptr<ProcessRunner> runner)
    : runner_(std::move(runner)) {}

MeasurementPipelineBuilder &
MeasurementPipelineBuilder::WithLintMeasurer(std::unique_ptr<LintMeasurer> lint) {
  components_.lint = std::move(lint);
  return *this;
}

MeasurementPipelineBuilder &MeasurementPipelineBuilder::WithCoverageMeasurer(
    std::unique_ptr<CoverageMeasurer> coverage) {
  components_.coverage = std::move(coverage);
  return *this;
}

MeasurementPipelineBuilder &
MeasurementPipelineBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

MeasurementPipelineBuilder &
MeasurementPipelineBuilder::WithProfile(QualityProfile profile) {
  components_.profile = profile;
  return *this;
}

MeasurementPipelineBuilder &
MeasurementPipelineBuilder::WithParallelism(unsigned parallelism) {
  components_.parallelism = parallelism;
  return *this;
}

MeasurementPipelineBuilder &MeasurementPipelineBuilder::WithSelfExecutable(
    std::filesystem::path executable) {
  self_executable_ = std::move(executable);
  return *this;
}

MeasurementPipelineBuilder &
MeasurementPipelineBuilder::WithCoverageOptions(CoverageOptions options) {
  coverage_options_ = options;
  return *this;
}

QualityMeasurementPipeline MeasurementPipelineBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));
  if (!components_.lint || !components_.coverage) {
    if (!runner_) {
      runner_ = std::make_shared<PosixProcessRunner>(components_.logger);
    }
  }
  if (!components_.lint) {
    std::unique_ptr<LintSource> source;
    if (self_executable_) {
      source = std::make_unique<SelfInvokingLintSource>(
          runner_, *self_executable_, components_.logger);
    } else {
      source = std::make_unique<ClippyLintSource>(runner_, components_.logger);
    }
    components_.lint = std::make_unique<LintHotspotAnalyzer>(
        std::move(source),
        std::make_shared<BuildErrorAnalyzer>(runner_, components_.logger),
        components_.logger);
  }
  if (!components_.coverage) {
    components_.coverage = std::make_unique<CoverageSampler>(
        runner_, coverage_options_, components_.logger);
  }
  return QualityMeasurementPipeline(std::move(components_));
}

} // namespace qgate
