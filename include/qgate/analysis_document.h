#pragma once

#include <qgate/churn_analyzer.h>
#include <qgate/complexity_analyzer.h>
#include <qgate/coverage.h>
#include <qgate/dead_code_analyzer.h>
#include <qgate/deep_context.h>
#include <qgate/lint_hotspot.h>
#include <qgate/satd_analyzer.h>
#include <qgate/tdg_analyzer.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace qgate {

struct Finding {
  std::string rule_id;
  // SARIF level: "error", "warning" or "note".
  std::string level = "warning";
  std::string message;
  std::string file;
  unsigned line = 0;
};

// What every output format renders: the data model as JSON, a few headline
// metrics, and located findings. `body` never carries `generated_at`; the
// JSON formatter adds it at the top level only.
struct AnalysisDocument {
  std::string analysis;
  std::string title;
  std::chrono::system_clock::time_point generated_at;
  nlohmann::json body = nlohmann::json::object();
  std::vector<std::pair<std::string, std::string>> summary;
  std::vector<Finding> findings;
  // Used verbatim by the markdown formatter when set.
  std::string markdown;
};

nlohmann::json ComplexityReportJson(const ComplexityReport &report,
                                    std::size_t top_files);
nlohmann::json ChurnReportJson(const ChurnReport &report);
nlohmann::json SatdReportJson(const SatdReport &report);
nlohmann::json DeadCodeReportJson(const DeadCodeReport &report);
nlohmann::json TdgReportJson(const TdgReport &report);
nlohmann::json DeepContextJson(const DeepContext &context,
                               std::size_t top_files);

AnalysisDocument
ComplexityDocument(const ComplexityReport &report, unsigned threshold,
                   std::size_t top_files,
                   std::chrono::system_clock::time_point generated_at);
AnalysisDocument
ChurnDocument(const ChurnReport &report,
              std::chrono::system_clock::time_point generated_at);
AnalysisDocument SatdDocument(const SatdReport &report,
                              std::chrono::system_clock::time_point generated_at);
AnalysisDocument
DeadCodeDocument(const DeadCodeReport &report,
                 std::chrono::system_clock::time_point generated_at);
AnalysisDocument TdgDocument(const TdgReport &report,
                             std::chrono::system_clock::time_point generated_at);
AnalysisDocument
LintHotspotDocument(const LintHotspotResult &result,
                    const EnforcementOptions &options,
                    std::chrono::system_clock::time_point generated_at);
AnalysisDocument
CoverageDocument(const ProjectCoverage &coverage, double coverage_min,
                 std::chrono::system_clock::time_point generated_at);
AnalysisDocument DeepContextDocument(const DeepContext &context,
                                     std::size_t top_files);
AnalysisDocument DefectPredictionDocument(const DeepContext &context);
// Deep context plus the lint hotspot view of the same project.
AnalysisDocument ComprehensiveDocument(const DeepContext &context,
                                       const LintHotspotResult &lint,
                                       const EnforcementOptions &options,
                                       std::size_t top_files);

} // namespace qgate
