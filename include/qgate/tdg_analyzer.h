#pragma once

#include <qgate/churn_analyzer.h>
#include <qgate/complexity_analyzer.h>
#include <qgate/models.h>
#include <qgate/satd_analyzer.h>

#include <string>
#include <vector>

namespace qgate {

enum class TdgBand { kHealthy, kMonitor, kRefactor, kCritical };

std::string TdgBandName(TdgBand band);
// <0.5 healthy, [0.5,1.0) monitor, [1.0,2.0) refactor, >=2.0 critical.
TdgBand ClassifyTdg(double value);

struct TdgWeights {
  double complexity = 0.45;
  double churn = 0.35;
  double satd = 0.20;
};

struct FileTdg {
  std::string path;
  double value = 0.0;
  TdgBand band = TdgBand::kHealthy;
  double complexity_score = 0.0;
  double churn_factor = 0.0;
  double satd_weight = 0.0;
  double size_normalizer = 1.0;
  // Component contributing most to `value`.
  std::string primary_factor;
};

struct TdgSummary {
  unsigned total_files = 0;
  unsigned critical_files = 0;
  unsigned warning_files = 0;
  double average_tdg = 0.0;
  double p95_tdg = 0.0;
  double estimated_debt_hours = 0.0;
  std::vector<FileTdg> hotspots;
};

struct TdgReport {
  // Highest TDG first, ties by path.
  std::vector<FileTdg> files;
  TdgSummary summary;
};

struct TdgOptions {
  TdgWeights weights;
  unsigned complexity_threshold = 10;
  std::size_t hotspot_limit = 10;
};

double SatdWeight(SatdSeverity severity);
double SizeNormalizer(unsigned logical_lines);

// 30 minutes per complexity point above the threshold plus 30 minutes per
// error and 15 per warning, in hours.
double EstimateDebtHours(const ComplexityReport &complexity,
                         const std::vector<ViolationDetail> &violations,
                         unsigned complexity_threshold);

// SATD items as violations for the debt estimate; high and critical items
// weigh as errors, the rest as warnings.
std::vector<ViolationDetail> SatdViolations(const SatdReport &satd);

TdgReport ComputeTdg(const ComplexityReport &complexity,
                     const ChurnReport &churn, const SatdReport &satd,
                     const std::vector<ViolationDetail> &violations,
                     const TdgOptions &options = {});

} // namespace qgate
