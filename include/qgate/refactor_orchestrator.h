#pragma once

#include <qgate/ai_request.h>
#include <qgate/build_error_analyzer.h>
#include <qgate/builtin_rewriter.h>
#include <qgate/deep_context.h>
#include <qgate/execution_context.h>
#include <qgate/issue_context.h>
#include <qgate/logging.h>
#include <qgate/measurement_pipeline.h>
#include <qgate/models.h>
#include <qgate/process_runner.h>
#include <qgate/refactor_state.h>
#include <qgate/target_selector.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace qgate {

struct RefactorConfig {
  std::filesystem::path project_path = ".";
  ExecutionContext context;
  unsigned max_iterations = 10;
  QualityProfile profile;
  SelectionFilters filters;
  std::optional<Toolchain> toolchain;
  bool dry_run = false;
  bool ci_mode = false;
  // Continue from `<cache>/refactor-state.json` when present.
  bool resume = true;
};

enum class RefactorStatus {
  kComplete,
  kBudgetExhausted,
  kBuildBroken,
  kNoProgress,
  kCancelled
};

std::string RefactorStatusName(RefactorStatus status);

struct RefactorOutcome {
  RefactorStatus status = RefactorStatus::kBudgetExhausted;
  RefactorState state;
  unsigned iterations = 0;
  std::vector<RefactorPhase> phase_history;
  QualityMetrics final_metrics;
  unsigned ai_requests = 0;
  std::string message;
};

nlohmann::json RefactorOutcomeJson(const RefactorOutcome &outcome);

// Complete and Cancelled exit 0; anything else fails only in CI mode.
int RefactorExitCode(const RefactorOutcome &outcome, bool ci_mode);

// Mode-specific candidate restriction and request context.
struct ModeTargets {
  std::optional<std::vector<std::string>> explicit_targets;
  IssueKeywords issue_keywords;
  std::optional<nlohmann::json> issue_context;
  std::optional<nlohmann::json> bug_report_context;
};

struct OrchestratorComponents {
  std::shared_ptr<ProcessRunner> runner;
  // Built from `runner` when absent.
  std::unique_ptr<QualityMeasurementPipeline> pipeline;
  std::unique_ptr<BuildVerifier> verifier;
  std::unique_ptr<BuiltinRewriter> rewriter;
  std::shared_ptr<BuildErrorAnalyzer> build_errors;
  std::shared_ptr<GitHubIssueClient> issue_client;
  std::shared_ptr<Logger> logger;
  DeepContextOptions context_options;
  SelectorOptions selector_options;
  // Progress lines and AI requests; nothing is printed when null.
  std::ostream *output = nullptr;
};

class RefactorOrchestrator {
public:
  explicit RefactorOrchestrator(OrchestratorComponents components);

  // Throws std::invalid_argument for a missing project, target file or
  // bug report, and std::runtime_error when the cache is locked.
  RefactorOutcome Run(const RefactorConfig &config, const RefactorMode &mode);

  ModeTargets ResolveMode(const RefactorMode &mode, const SourceSet &sources,
                          const ExecutionContext &context) const;

private:
  void Print(const std::string &line) const;
  bool MeetsFileGoals(const SourceSet &sources, const SelectedTarget &target,
                      const RewriteOutcome &rewrite, double coverage,
                      const QualityProfile &profile) const;

  std::shared_ptr<ProcessRunner> runner_;
  std::unique_ptr<QualityMeasurementPipeline> pipeline_;
  std::unique_ptr<BuildVerifier> verifier_;
  std::unique_ptr<BuiltinRewriter> rewriter_;
  std::shared_ptr<BuildErrorAnalyzer> build_errors_;
  std::shared_ptr<GitHubIssueClient> issue_client_;
  std::shared_ptr<Logger> logger_;
  DeepContextOptions context_options_;
  SelectorOptions selector_options_;
  std::ostream *output_;
};

} // namespace qgate
