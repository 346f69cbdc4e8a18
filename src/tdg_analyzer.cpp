#include <qgate/tdg_analyzer.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

namespace qgate {

std::string TdgBandName(TdgBand band) {
  switch (band) {
  case TdgBand::kHealthy:
    return "healthy";
  case TdgBand::kMonitor:
    return "monitor";
  case TdgBand::kRefactor:
    return "refactor";
  case TdgBand::kCritical:
    return "critical";
  }
  return "healthy";
}

TdgBand ClassifyTdg(double value) {
  if (value >= 2.0) {
    return TdgBand::kCritical;
  }
  if (value >= 1.0) {
    return TdgBand::kRefactor;
  }
  if (value >= 0.5) {
    return TdgBand::kMonitor;
  }
  return TdgBand::kHealthy;
}

double SatdWeight(SatdSeverity severity) {
  switch (severity) {
  case SatdSeverity::kLow:
    return 0.25;
  case SatdSeverity::kMedium:
    return 0.5;
  case SatdSeverity::kHigh:
    return 1.0;
  case SatdSeverity::kCritical:
    return 2.0;
  }
  return 0.25;
}

double SizeNormalizer(unsigned logical_lines) {
  if (logical_lines <= 1) {
    return 1.0;
  }
  return std::max(1.0, std::log10(static_cast<double>(logical_lines)) / 2.0);
}

double EstimateDebtHours(const ComplexityReport &complexity,
                         const std::vector<ViolationDetail> &violations,
                         unsigned complexity_threshold) {
  double minutes = 0.0;
  for (const auto &file : complexity.files) {
    for (const auto &function : file.functions) {
      if (function.cyclomatic > complexity_threshold) {
        minutes += 30.0 * (function.cyclomatic - complexity_threshold);
      }
    }
  }
  for (const auto &violation : violations) {
    if (violation.severity == Severity::kError) {
      minutes += 30.0;
    } else if (violation.severity == Severity::kWarning) {
      minutes += 15.0;
    }
  }
  return minutes / 60.0;
}

std::vector<ViolationDetail> SatdViolations(const SatdReport &satd) {
  std::vector<ViolationDetail> violations;
  for (const auto &item : satd.items) {
    ViolationDetail violation;
    violation.file = item.file;
    violation.line = item.line;
    violation.end_line = item.line;
    violation.lint_name = "satd_item";
    violation.message = item.text;
    violation.severity = item.severity == SatdSeverity::kHigh ||
                                 item.severity == SatdSeverity::kCritical
                             ? Severity::kError
                             : Severity::kWarning;
    violations.push_back(std::move(violation));
  }
  return violations;
}

TdgReport ComputeTdg(const ComplexityReport &complexity,
                     const ChurnReport &churn, const SatdReport &satd,
                     const std::vector<ViolationDetail> &violations,
                     const TdgOptions &options) {
  std::map<std::string, double> satd_by_file;
  for (const auto &item : satd.items) {
    satd_by_file[item.file] += SatdWeight(item.severity);
  }
  const double threshold =
      std::max(1.0, static_cast<double>(options.complexity_threshold));

  TdgReport report;
  for (const auto &file : complexity.files) {
    FileTdg tdg;
    tdg.path = file.path;
    tdg.complexity_score = file.max_cyclomatic / threshold;
    if (const auto *file_churn = churn.Find(file.path)) {
      tdg.churn_factor = file_churn->churn_score;
    }
    tdg.satd_weight = satd_by_file[file.path];
    tdg.size_normalizer = SizeNormalizer(file.logical_lines);

    const double complexity_part =
        options.weights.complexity * tdg.complexity_score;
    const double churn_part = options.weights.churn * tdg.churn_factor;
    const double satd_part = options.weights.satd * tdg.satd_weight;
    tdg.value =
        (complexity_part + churn_part + satd_part) / tdg.size_normalizer;
    tdg.band = ClassifyTdg(tdg.value);
    if (complexity_part >= churn_part && complexity_part >= satd_part) {
      tdg.primary_factor = "complexity";
    } else if (churn_part >= satd_part) {
      tdg.primary_factor = "churn";
    } else {
      tdg.primary_factor = "satd";
    }
    report.files.push_back(std::move(tdg));
  }

  std::sort(report.files.begin(), report.files.end(),
            [](const FileTdg &left, const FileTdg &right) {
              if (left.value != right.value) {
                return left.value > right.value;
              }
              return left.path < right.path;
            });

  auto &summary = report.summary;
  summary.total_files = static_cast<unsigned>(report.files.size());
  std::vector<double> values;
  double total = 0.0;
  for (const auto &file : report.files) {
    values.push_back(file.value);
    total += file.value;
    if (file.band == TdgBand::kCritical) {
      ++summary.critical_files;
    } else if (file.band == TdgBand::kRefactor) {
      ++summary.warning_files;
    }
  }
  if (!values.empty()) {
    summary.average_tdg = total / static_cast<double>(values.size());
    std::sort(values.begin(), values.end());
    const auto rank = static_cast<std::size_t>(
        std::ceil(0.95 * static_cast<double>(values.size())));
    summary.p95_tdg = values[std::max<std::size_t>(rank, 1) - 1];
  }
  summary.estimated_debt_hours =
      EstimateDebtHours(complexity, violations, options.complexity_threshold);
  for (const auto &file : report.files) {
    if (summary.hotspots.size() >= options.hotspot_limit) {
      break;
    }
    if (file.band != TdgBand::kHealthy) {
      summary.hotspots.push_back(file);
    }
  }
  return report;
}

} // namespace qgate
