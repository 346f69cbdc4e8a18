#pragma once

#include <qgate/execution_context.h>
#include <qgate/logging.h>
#include <qgate/process_runner.h>
#include <qgate/refactor_plan.h>
#include <qgate/source_discovery.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace qgate {

// A curated replacement for one function in one file. Matched by file-name
// suffix plus the exact signature text.
struct RewriteTemplate {
  std::string file_suffix;
  std::string function_signature;
  std::string function_name;
  // Relative to the project root; holds the refactored function.
  std::filesystem::path replacement;
};

// YAML list of `{file, signature, function, replacement}` mappings.
// Throws std::invalid_argument for malformed entries.
std::vector<RewriteTemplate>
LoadRewriteTemplates(const std::filesystem::path &path);

// Source text of the Rust function item named `function_name`, visibility
// included.
std::optional<std::string> ExtractFunctionText(const std::string &content,
                                               const std::string &function_name);
// Replaces everything from `signature` to the end of the function item it
// belongs to.
std::optional<std::string> ReplaceFunction(const std::string &content,
                                           const std::string &signature,
                                           const std::string &replacement);

struct RewriteOutcome {
  bool applied = false;
  std::vector<std::string> actions;
};

class BuiltinRewriter {
public:
  BuiltinRewriter(std::shared_ptr<ProcessRunner> runner,
                  std::vector<RewriteTemplate> templates = {},
                  std::shared_ptr<Logger> logger = nullptr);

  // Templates and SATD removal write the file atomically; machine
  // applicable lint fixes run the toolchain's fixer afterwards, and changes
  // it makes to other files in `sources` are rolled back.
  RewriteOutcome Apply(const RefactorPlan &plan, const SourceSet &sources,
                       const ExecutionContext &context) const;

private:
  std::string ApplyTemplates(const std::filesystem::path &root,
                             const std::string &file, std::string content,
                             RewriteOutcome &outcome) const;

  std::shared_ptr<ProcessRunner> runner_;
  std::vector<RewriteTemplate> templates_;
  std::shared_ptr<Logger> logger_;
};

} // namespace qgate
