#pragma once

#include <qgate/logging.h>
#include <qgate/source_discovery.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace qgate {

enum class DeadCodeConfidence { kHigh, kMedium, kLow };

std::string ConfidenceName(DeadCodeConfidence confidence);

struct DeadCodeItem {
  // "function", "class", "module" or "unreachable".
  std::string item_type;
  std::string name;
  unsigned line = 0;
  std::string reason;
  DeadCodeConfidence confidence = DeadCodeConfidence::kHigh;
};

struct FileDeadCode {
  std::string path;
  unsigned total_lines = 0;
  unsigned dead_lines = 0;
  double dead_percentage = 0.0;
  unsigned dead_functions = 0;
  unsigned dead_classes = 0;
  unsigned dead_modules = 0;
  unsigned unreachable_blocks = 0;
  std::vector<DeadCodeItem> items;
  DeadCodeConfidence confidence = DeadCodeConfidence::kHigh;
};

struct DeadCodeSummary {
  unsigned total_files_analyzed = 0;
  unsigned files_with_dead_code = 0;
  unsigned total_dead_lines = 0;
  double dead_percentage = 0.0;
  unsigned dead_functions = 0;
  unsigned dead_classes = 0;
  unsigned dead_modules = 0;
  unsigned unreachable_blocks = 0;
};

struct DeadCodeReport {
  // Most dead lines first, ties by path.
  std::vector<FileDeadCode> files;
  DeadCodeSummary summary;

  const FileDeadCode *Find(const std::string &path) const;
};

struct DeadCodeOptions {
  bool include_tests = false;
  unsigned min_dead_lines = 0;
  std::optional<std::size_t> top_files;
  unsigned parallelism = 0;
};

bool IsTestSourcePath(const std::string &relative_path);

class DeadCodeAnalyzer {
public:
  explicit DeadCodeAnalyzer(DeadCodeOptions options = {},
                            std::shared_ptr<Logger> logger = nullptr);

  DeadCodeReport Analyze(const SourceSet &sources) const;

private:
  DeadCodeOptions options_;
  std::shared_ptr<Logger> logger_;
};

} // namespace qgate
