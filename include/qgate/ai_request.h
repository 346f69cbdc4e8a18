#pragma once

#include <qgate/models.h>
#include <qgate/refactor_plan.h>

#include <nlohmann/json.hpp>

#include <iosfwd>
#include <optional>
#include <string>

namespace qgate {

inline constexpr char kAiRequestStart[] = "AI_REWRITE_REQUEST_START";
inline constexpr char kAiRequestEnd[] = "AI_REWRITE_REQUEST_END";

// The rigid quality checklist every request carries.
const std::vector<std::string> &RewriteInstructions();

// Sources under src/ get a sibling `<stem>_test.<ext>`, anything else goes
// to `tests/`.
std::string TestFilePathFor(const std::string &file);

struct AiRequestContext {
  // `## ` sections of the deep-context Markdown that name the file.
  std::string file_context;
  double target_coverage = 80.0;
  std::optional<nlohmann::json> issue_context;
  std::optional<nlohmann::json> bug_report_context;
};

nlohmann::json BuildAiRewriteRequest(const RefactorPlan &plan,
                                     const AiRequestContext &context);

// Pretty JSON between the start and end sentinels, each on its own line.
void EmitAiRewriteRequest(const nlohmann::json &request, std::ostream &out);

// The JSON between the sentinels of `transcript`; nullopt when absent or
// malformed.
std::optional<nlohmann::json> ParseAiRewriteRequest(const std::string &transcript);

} // namespace qgate
