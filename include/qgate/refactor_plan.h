#pragma once

#include <qgate/deep_context.h>
#include <qgate/models.h>
#include <qgate/source_discovery.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace qgate {

FixStrategy DetermineFixStrategy(const ViolationDetail &violation);

// Colon-terminated markers in comments, one `satd_item` warning per line.
std::vector<ViolationDetail> DetectSatdViolations(const std::string &file,
                                                  const std::string &content,
                                                  Toolchain toolchain);

// One `high_complexity` error per function above `complexity_max`.
std::vector<ViolationDetail>
HighComplexityViolations(const std::string &file, const AstMetadata &metadata,
                         const QualityProfile &profile);

// Deletes comment-only SATD lines and strips trailing SATD line comments.
// Lines inside multi-line block comments are only removed when the whole
// line is comment text.
std::string RemoveSatdComments(const std::string &content, Toolchain toolchain);

struct RefactorPlan {
  FileRewritePlan rewrite;
  // Lint or build diagnostics plus the synthesized ones.
  std::vector<ViolationDetail> violations;
  std::string current_content;
  double current_coverage = 0.0;
  bool needs_tests = false;
};

class RefactorPlanBuilder {
public:
  RefactorPlanBuilder(QualityProfile profile, Toolchain toolchain);

  // Metadata falls back to a fresh scan of the file when the deep context
  // does not know it.
  RefactorPlan Build(const std::filesystem::path &root, const std::string &file,
                     const std::vector<ViolationDetail> &file_violations,
                     const DeepContext *context, double current_coverage) const;

private:
  QualityProfile profile_;
  Toolchain toolchain_;
};

} // namespace qgate
