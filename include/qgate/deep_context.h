#pragma once

#include <qgate/churn_analyzer.h>
#include <qgate/complexity_analyzer.h>
#include <qgate/dead_code_analyzer.h>
#include <qgate/execution_context.h>
#include <qgate/logging.h>
#include <qgate/models.h>
#include <qgate/process_runner.h>
#include <qgate/satd_analyzer.h>
#include <qgate/source_discovery.h>
#include <qgate/syntax_tree.h>
#include <qgate/tdg_analyzer.h>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace qgate {

struct DeepContextFile {
  std::string path;
  unsigned logical_lines = 0;
  std::vector<FunctionInfo> functions;
  std::vector<std::string> imports;
  std::string structure_hash;
  unsigned max_cyclomatic = 0;
  unsigned max_cognitive = 0;
  unsigned satd_items = 0;
  unsigned dead_code_items = 0;
  double churn_score = 0.0;
  unsigned commit_count = 0;
  double tdg = 0.0;
  // In [0, 1].
  double defect_score = 0.0;
};

struct QualityScorecard {
  double overall_health = 100.0;
  double complexity_score = 100.0;
  double maintainability_index = 100.0;
  double satd_score = 100.0;
  double technical_debt_hours = 0.0;
};

struct PredictedDefect {
  std::string file;
  double score = 0.0;
  // "high", "medium" or "low".
  std::string risk;
  std::vector<std::string> factors;
};

struct Recommendation {
  unsigned priority = 0;
  std::string title;
  std::string file;
  std::string rationale;
};

// The single authority for per-file structure. The Markdown artifact is a
// rendering of this value.
struct DeepContext {
  std::string project_name;
  std::string root;
  Toolchain toolchain = Toolchain::kRust;
  std::chrono::system_clock::time_point generated_at;
  unsigned complexity_threshold = 10;
  // Sorted by path.
  std::vector<DeepContextFile> files;
  ComplexityReport complexity;
  ChurnReport churn;
  SatdReport satd;
  DeadCodeReport dead_code;
  TdgReport tdg;
  QualityScorecard scorecard;
  std::vector<PredictedDefect> predicted_defects;
  std::vector<Recommendation> recommendations;

  const DeepContextFile *Find(const std::string &path) const;
  std::optional<AstMetadata> MetadataFor(const std::string &path) const;
  // Files holding at least one function above `threshold`, worst first.
  std::vector<std::string> FilesOverComplexity(unsigned threshold) const;
};

// `use`, `import`, `from ... import` and go import specs, in source order.
std::vector<std::string> ExtractImports(const SyntaxTree &tree);
std::vector<std::string> ExtractImports(const std::string &content,
                                        Toolchain toolchain);
// FNV-1a over function names, spans and imports; 16 hex digits.
std::string StructureHash(const std::vector<FunctionInfo> &functions,
                          const std::vector<std::string> &imports);

// 0.4 complexity + 0.3 churn + 0.2 SATD + 0.1 dead code, each normalized.
double DefectScore(unsigned max_cyclomatic, double churn_score,
                   unsigned satd_items, double dead_percentage);

struct DeepContextInputs {
  SourceSet sources;
  ComplexityReport complexity;
  ChurnReport churn;
  SatdReport satd;
  DeadCodeReport dead_code;
  std::map<std::string, std::vector<std::string>> imports_by_file;
  std::chrono::system_clock::time_point generated_at;
};

struct DeepContextOptions {
  unsigned complexity_threshold = 10;
  std::size_t top_files = 10;
  std::size_t max_recommendations = 10;
  unsigned parallelism = 0;
  ChurnOptions churn;
};

DeepContext AssembleDeepContext(DeepContextInputs inputs,
                                const DeepContextOptions &options = {});

class DeepContextBuilder {
public:
  DeepContextBuilder(std::shared_ptr<ProcessRunner> runner,
                     DeepContextOptions options = {},
                     std::shared_ptr<Logger> logger = nullptr);

  DeepContext Build(const SourceSet &sources,
                    const ExecutionContext &context) const;

private:
  std::shared_ptr<ProcessRunner> runner_;
  DeepContextOptions options_;
  std::shared_ptr<Logger> logger_;
};

// Section order: executive summary, quality scorecard, project structure,
// complexity hotspots, churn, SATD, dead code, predicted defects,
// recommendations, then one `## File: <path>` section per file.
std::string RenderDeepContextMarkdown(const DeepContext &context,
                                      std::size_t top_files = 10);

// Every `## ` section whose header names `file` (full relative path, or the
// bare file name when no header carries the full path).
std::string ExtractFileContext(const std::string &markdown,
                               const std::string &file);

} // namespace qgate
