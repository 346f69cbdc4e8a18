#pragma once

#include <qgate/analysis_document.h>
#include <qgate/component_registry.h>
#include <qgate/execution_context.h>
#include <qgate/logging.h>
#include <qgate/process_runner.h>
#include <qgate/source_discovery.h>
#include <qgate/unified_protocol.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace qgate {

struct AnalysisRequest {
  std::filesystem::path project_path = ".";
  std::optional<std::string> format;
  std::optional<Toolchain> toolchain;
  std::vector<std::string> include_patterns;
  std::vector<std::string> exclude_patterns;
  std::optional<std::filesystem::path> ignore_file;
  std::optional<std::filesystem::path> cache_dir;
  std::size_t top_files = 10;
  unsigned threshold = 10;
  unsigned period_days = 30;
  bool strict_only = false;
  bool include_tests = false;
  unsigned min_dead_lines = 0;
  double coverage_min = 80.0;
  double max_density = 0.05;
  unsigned parallelism = 0;
};

// Lists accept a JSON array or a comma separated string. Throws
// std::invalid_argument for fields of the wrong type.
AnalysisRequest ParseAnalysisRequest(const nlohmann::json &body);

// complexity, churn, dead-code, satd, deep-context, tdg, lint-hotspot,
// coverage, defect-prediction, comprehensive.
const std::vector<std::string> &AnalysisKinds();

class AnalysisService {
public:
  AnalysisService(std::shared_ptr<ProcessRunner> runner,
                  ExecutionContext base_context,
                  std::shared_ptr<Logger> logger = nullptr,
                  const ComponentRegistry *components = nullptr);

  AnalysisDocument Analyze(const std::string &kind,
                           const AnalysisRequest &request) const;
  UnifiedResponse Render(const AnalysisDocument &document,
                         const std::optional<std::string> &format) const;

  // Body parse, analysis and rendering for one route.
  UnifiedResponse Handle(const std::string &kind,
                         const UnifiedRequest &request) const;

private:
  SourceSet Discover(const AnalysisRequest &request) const;
  ExecutionContext ContextFor(const AnalysisRequest &request,
                              const SourceSet &sources) const;

  std::shared_ptr<ProcessRunner> runner_;
  ExecutionContext base_context_;
  std::shared_ptr<Logger> logger_;
  const ComponentRegistry *components_;
};

} // namespace qgate
