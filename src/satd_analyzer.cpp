#include <qgate/satd_analyzer.h>

#include <qgate/source_scanner.h>
#include <qgate/strings.h>
#include <qgate/work_queue.h>

#include <algorithm>
#include <regex>
#include <set>
#include <tuple>

namespace qgate {
namespace {

struct VocabularyRule {
  std::regex pattern;
  DebtCategory category;
  SatdSeverity severity;
};

const std::vector<VocabularyRule> &VocabularyRules() {
  static const auto flags = std::regex::ECMAScript | std::regex::icase;
  static const std::vector<VocabularyRule> rules = {
      {std::regex(R"(\b(security|vuln\w*|cve)\b)", flags),
       DebtCategory::kSecurity, SatdSeverity::kCritical},
      {std::regex(R"(\b(fixme|broken|bug)\b)", flags), DebtCategory::kDefect,
       SatdSeverity::kHigh},
      {std::regex(R"(\b(hack|kludge|smell)\b)", flags), DebtCategory::kDesign,
       SatdSeverity::kMedium},
      {std::regex(R"(\bperformance\s+issue)", flags),
       DebtCategory::kPerformance, SatdSeverity::kMedium},
      {std::regex(R"(\btest\b.*\bdisabled\b)", flags), DebtCategory::kTest,
       SatdSeverity::kMedium},
      {std::regex(R"(\b(technical\s+debt|code\s+smell)\b)", flags),
       DebtCategory::kDesign, SatdSeverity::kMedium},
      {std::regex(R"(\b(workaround|temp)\b)", flags), DebtCategory::kDesign,
       SatdSeverity::kLow},
      {std::regex(R"(\b(optimize|slow)\b)", flags),
       DebtCategory::kPerformance, SatdSeverity::kLow},
      {std::regex(R"(\btodo\b)", flags), DebtCategory::kRequirement,
       SatdSeverity::kLow},
  };
  return rules;
}

SatdSeverity MaxSeverity(SatdSeverity left, SatdSeverity right) {
  return static_cast<int>(left) >= static_cast<int>(right) ? left : right;
}

} // namespace

std::string DebtCategoryName(DebtCategory category) {
  switch (category) {
  case DebtCategory::kDesign:
    return "Design";
  case DebtCategory::kDefect:
    return "Defect";
  case DebtCategory::kRequirement:
    return "Requirement";
  case DebtCategory::kTest:
    return "Test";
  case DebtCategory::kPerformance:
    return "Performance";
  case DebtCategory::kSecurity:
    return "Security";
  }
  return "Design";
}

std::string SatdSeverityName(SatdSeverity severity) {
  switch (severity) {
  case SatdSeverity::kLow:
    return "Low";
  case SatdSeverity::kMedium:
    return "Medium";
  case SatdSeverity::kHigh:
    return "High";
  case SatdSeverity::kCritical:
    return "Critical";
  }
  return "Low";
}

std::optional<SatdClassification>
ClassifyStrictMarker(const std::string &comment) {
  static const std::regex kMarker(
      R"(\b(TODO|FIXME|HACK|XXX|BUG|KLUDGE|REFACTOR):)");
  std::smatch match;
  if (!std::regex_search(comment, match, kMarker)) {
    return std::nullopt;
  }
  const auto marker = match[1].str();
  if (marker == "HACK" || marker == "XXX") {
    return SatdClassification{DebtCategory::kDesign, SatdSeverity::kHigh,
                              marker};
  }
  if (marker == "BUG") {
    return SatdClassification{DebtCategory::kDefect, SatdSeverity::kHigh,
                              marker};
  }
  if (marker == "FIXME") {
    return SatdClassification{DebtCategory::kDefect, SatdSeverity::kMedium,
                              marker};
  }
  if (marker == "REFACTOR" || marker == "KLUDGE") {
    return SatdClassification{DebtCategory::kDesign, SatdSeverity::kMedium,
                              marker};
  }
  return SatdClassification{DebtCategory::kRequirement, SatdSeverity::kLow,
                            marker};
}

std::optional<SatdClassification> ClassifyDebtText(const std::string &comment) {
  for (const auto &rule : VocabularyRules()) {
    std::smatch match;
    if (std::regex_search(comment, match, rule.pattern)) {
      return SatdClassification{rule.category, rule.severity,
                                ToLower(match[0].str())};
    }
  }
  return std::nullopt;
}

std::vector<SatdItem> ScanSatd(const std::string &path,
                               const std::string &content, Toolchain toolchain,
                               bool strict_only) {
  const auto raw_lines = SplitLines(content);
  std::vector<SatdItem> items;
  for (const auto &line : SourceScanner(toolchain).Scan(content)) {
    if (!line.has_comment) {
      continue;
    }
    const auto strict = ClassifyStrictMarker(line.comment);
    std::optional<SatdClassification> vocabulary;
    if (!strict_only) {
      vocabulary = ClassifyDebtText(line.comment);
    }
    if (!strict && !vocabulary) {
      continue;
    }
    SatdItem item;
    item.file = path;
    item.line = line.number;
    item.text = Trim(line.comment);
    item.source_line = Trim(raw_lines[line.number - 1]);
    item.strict = strict.has_value();
    if (strict) {
      item.marker = strict->marker;
      item.category = strict->category;
      item.severity = strict->severity;
      if (vocabulary && vocabulary->category == DebtCategory::kSecurity) {
        item.category = DebtCategory::kSecurity;
        item.severity = MaxSeverity(item.severity, vocabulary->severity);
      }
    } else {
      item.marker = vocabulary->marker;
      item.category = vocabulary->category;
      item.severity = vocabulary->severity;
    }
    items.push_back(std::move(item));
  }
  return items;
}

std::vector<const SatdItem *>
SatdReport::ItemsFor(const std::string &file) const {
  std::vector<const SatdItem *> matching;
  for (const auto &item : items) {
    if (item.file == file) {
      matching.push_back(&item);
    }
  }
  return matching;
}

SatdSummary SummarizeSatd(const std::vector<SatdItem> &items) {
  SatdSummary summary;
  std::set<std::string> files;
  for (const auto &item : items) {
    ++summary.total_items;
    if (item.strict) {
      ++summary.strict_items;
    }
    ++summary.by_severity[SatdSeverityName(item.severity)];
    ++summary.by_category[DebtCategoryName(item.category)];
    if (item.severity == SatdSeverity::kCritical) {
      ++summary.critical_items;
    }
    files.insert(item.file);
  }
  summary.files_with_debt = static_cast<unsigned>(files.size());
  return summary;
}

SatdAnalyzer::SatdAnalyzer(SatdOptions options, std::shared_ptr<Logger> logger)
    : options_(options), logger_(EnsureLogger(std::move(logger))) {}

SatdReport SatdAnalyzer::Analyze(const SourceSet &sources) const {
  const auto root = sources.root;
  const auto toolchain = sources.toolchain;
  const auto strict_only = options_.strict_only;
  auto logger = logger_;
  const auto per_file = ParallelMap<std::string, std::vector<SatdItem>>(
      sources.files, options_.parallelism,
      [&root, toolchain, strict_only, logger](const std::string &path) {
        try {
          return ScanSatd(path, ReadFile(root / path),
                          ToolchainForPath(path).value_or(toolchain),
                          strict_only);
        } catch (const std::exception &error) {
          logger->Log(LogLevel::kWarn, "satd.file.skipped",
                      {{"file", path}, {"error", error.what()}});
          return std::vector<SatdItem>{};
        }
      });

  SatdReport report;
  for (const auto &items : per_file) {
    report.items.insert(report.items.end(), items.begin(), items.end());
  }
  std::sort(report.items.begin(), report.items.end(),
            [](const SatdItem &left, const SatdItem &right) {
              return std::tie(left.file, left.line) <
                     std::tie(right.file, right.line);
            });
  report.summary = SummarizeSatd(report.items);
  logger_->Log(LogLevel::kDebug, "analyzer.complete",
               {{"analyzer", "satd"},
                {"items", std::to_string(report.summary.total_items)},
                {"strict", std::to_string(report.summary.strict_items)}});
  return report;
}

} // namespace qgate
