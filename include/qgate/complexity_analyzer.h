#pragma once

#include <qgate/logging.h>
#include <qgate/models.h>
#include <qgate/source_discovery.h>
#include <qgate/source_scanner.h>
#include <qgate/syntax_tree.h>

#include <memory>
#include <string>
#include <vector>

namespace qgate {

inline constexpr unsigned kComplexitySaturation = 255;

// Both scores cover `function` alone: named functions nested inside it are
// scored on their own, closures and lambdas count toward it.
unsigned CyclomaticComplexity(const SyntaxTree &tree, TSNode function);
unsigned CognitiveComplexity(const SyntaxTree &tree, TSNode function);

std::vector<FunctionInfo> AnalyzeFunctionComplexity(const SyntaxTree &tree);
std::vector<FunctionInfo> AnalyzeFunctionComplexity(const std::string &content,
                                                    Toolchain toolchain);

struct FileComplexity {
  std::string path;
  std::vector<FunctionInfo> functions;
  unsigned max_cyclomatic = 0;
  unsigned max_cognitive = 0;
  unsigned total_cyclomatic = 0;
  unsigned logical_lines = 0;
};

struct ComplexitySummary {
  unsigned total_files = 0;
  unsigned total_functions = 0;
  double average_cyclomatic = 0.0;
  unsigned max_cyclomatic = 0;
  unsigned max_cognitive = 0;
  unsigned p90_cyclomatic = 0;
  unsigned functions_over_threshold = 0;
};

struct ComplexityReport {
  // Sorted by path.
  std::vector<FileComplexity> files;
  ComplexitySummary summary;

  const FileComplexity *Find(const std::string &path) const;
  // Highest max_cyclomatic first, ties by path.
  std::vector<const FileComplexity *> TopFiles(std::size_t limit) const;
};

FileComplexity AnalyzeFileComplexity(const std::string &path,
                                     const std::string &content,
                                     Toolchain toolchain);

struct ComplexityOptions {
  unsigned threshold = 10;
  unsigned parallelism = 0;
};

class ComplexityAnalyzer {
public:
  explicit ComplexityAnalyzer(ComplexityOptions options = {},
                              std::shared_ptr<Logger> logger = nullptr);

  ComplexityReport Analyze(const SourceSet &sources) const;

private:
  ComplexityOptions options_;
  std::shared_ptr<Logger> logger_;
};

ComplexitySummary SummarizeComplexity(const std::vector<FileComplexity> &files,
                                      unsigned threshold);

} // namespace qgate
