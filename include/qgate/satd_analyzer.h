#pragma once

#include <qgate/logging.h>
#include <qgate/source_discovery.h>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace qgate {

enum class DebtCategory {
  kDesign,
  kDefect,
  kRequirement,
  kTest,
  kPerformance,
  kSecurity
};
enum class SatdSeverity { kLow, kMedium, kHigh, kCritical };

std::string DebtCategoryName(DebtCategory category);
std::string SatdSeverityName(SatdSeverity severity);

struct SatdItem {
  std::string file;
  unsigned line = 0;
  // Upper-case marker such as "TODO", or the matched vocabulary word.
  std::string marker;
  std::string text;
  std::string source_line;
  DebtCategory category = DebtCategory::kRequirement;
  SatdSeverity severity = SatdSeverity::kLow;
  // Colon-terminated marker (`TODO:`); only these gate the refactor loop.
  bool strict = false;
};

struct SatdClassification {
  DebtCategory category;
  SatdSeverity severity;
  std::string marker;
};

// Marker severities: HACK, XXX and BUG high; FIXME, REFACTOR and KLUDGE
// medium; TODO low.
std::optional<SatdClassification> ClassifyStrictMarker(const std::string &comment);
// Free-text debt vocabulary (hack, fixme, security, workaround, ...).
std::optional<SatdClassification> ClassifyDebtText(const std::string &comment);

// Findings in comments only; at most one per line.
std::vector<SatdItem> ScanSatd(const std::string &path,
                               const std::string &content, Toolchain toolchain,
                               bool strict_only = false);

struct SatdSummary {
  unsigned total_items = 0;
  unsigned strict_items = 0;
  std::map<std::string, unsigned> by_severity;
  std::map<std::string, unsigned> by_category;
  unsigned files_with_debt = 0;
  unsigned critical_items = 0;
};

struct SatdReport {
  // Sorted by file then line.
  std::vector<SatdItem> items;
  SatdSummary summary;

  std::vector<const SatdItem *> ItemsFor(const std::string &file) const;
};

SatdSummary SummarizeSatd(const std::vector<SatdItem> &items);

struct SatdOptions {
  bool strict_only = false;
  unsigned parallelism = 0;
};

class SatdAnalyzer {
public:
  explicit SatdAnalyzer(SatdOptions options = {},
                        std::shared_ptr<Logger> logger = nullptr);

  SatdReport Analyze(const SourceSet &sources) const;

private:
  SatdOptions options_;
  std::shared_ptr<Logger> logger_;
};

} // namespace qgate
