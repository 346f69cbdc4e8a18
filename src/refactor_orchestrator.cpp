#include <qgate/refactor_orchestrator.h>

#include <qgate/complexity_analyzer.h>
#include <qgate/coverage.h>
#include <qgate/json_codec.h>
#include <qgate/refactor_plan.h>
#include <qgate/strings.h>

#include <algorithm>
#include <chrono>
#include <ostream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace qgate {
namespace {

std::string ResolveExistingFile(const std::filesystem::path &root,
                                const std::string &file, const char *what) {
  std::filesystem::path path(file);
  if (path.is_relative()) {
    path = root / path;
  }
  std::error_code error;
  if (!std::filesystem::is_regular_file(path, error)) {
    throw std::invalid_argument(std::string(what) + " not found: " + file);
  }
  return RelativePath(root, path);
}

std::chrono::seconds Elapsed(const RefactorState &state) {
  return std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now() - state.start_time);
}

void RecordPhase(std::vector<RefactorPhase> &history, RefactorPhase phase) {
  if (history.empty() || history.back() != phase) {
    history.push_back(phase);
  }
}

} // namespace

std::string RefactorStatusName(RefactorStatus status) {
  switch (status) {
  case RefactorStatus::kComplete:
    return "Complete";
  case RefactorStatus::kBudgetExhausted:
    return "BudgetExhausted";
  case RefactorStatus::kBuildBroken:
    return "BuildBroken";
  case RefactorStatus::kNoProgress:
    return "NoProgress";
  case RefactorStatus::kCancelled:
    return "Cancelled";
  }
  return "BudgetExhausted";
}

nlohmann::json RefactorOutcomeJson(const RefactorOutcome &outcome) {
  nlohmann::json phases = nlohmann::json::array();
  for (const auto phase : outcome.phase_history) {
    phases.push_back(PhaseName(phase));
  }
  return nlohmann::json{{"status", RefactorStatusName(outcome.status)},
                        {"iterations", outcome.iterations},
                        {"phase_history", std::move(phases)},
                        {"final_metrics", outcome.final_metrics},
                        {"files_completed", outcome.state.files_completed},
                        {"progress", outcome.state.progress},
                        {"ai_requests", outcome.ai_requests},
                        {"message", outcome.message}};
}

int RefactorExitCode(const RefactorOutcome &outcome, bool ci_mode) {
  switch (outcome.status) {
  case RefactorStatus::kComplete:
  case RefactorStatus::kCancelled:
    return 0;
  case RefactorStatus::kBudgetExhausted:
  case RefactorStatus::kBuildBroken:
  case RefactorStatus::kNoProgress:
    return ci_mode ? 1 : 0;
  }
  return 1;
}

RefactorOrchestrator::RefactorOrchestrator(OrchestratorComponents components)
    : runner_(std::move(components.runner)),
      pipeline_(std::move(components.pipeline)),
      verifier_(std::move(components.verifier)),
      rewriter_(std::move(components.rewriter)),
      build_errors_(std::move(components.build_errors)),
      issue_client_(std::move(components.issue_client)),
      logger_(EnsureLogger(std::move(components.logger))),
      context_options_(components.context_options),
      selector_options_(components.selector_options),
      output_(components.output) {
  if (!runner_) {
    runner_ = std::make_shared<PosixProcessRunner>(logger_);
  }
  if (!pipeline_) {
    pipeline_ = std::make_unique<QualityMeasurementPipeline>(
        MeasurementPipelineBuilder(runner_).WithLogger(logger_).Build());
  }
  if (!verifier_) {
    verifier_ = std::make_unique<BuildVerifier>(runner_);
  }
  if (!rewriter_) {
    rewriter_ = std::make_unique<BuiltinRewriter>(
        runner_, std::vector<RewriteTemplate>{}, logger_);
  }
  if (!build_errors_) {
    build_errors_ = std::make_shared<BuildErrorAnalyzer>(runner_, logger_);
  }
  if (!issue_client_) {
    issue_client_ = std::make_shared<GitHubIssueClient>(runner_, logger_);
  }
}

void RefactorOrchestrator::Print(const std::string &line) const {
  if (output_ != nullptr) {
    *output_ << line << '\n';
    output_->flush();
  }
}

ModeTargets RefactorOrchestrator::ResolveMode(const RefactorMode &mode,
                                              const SourceSet &sources,
                                              const ExecutionContext &context) const {
  ModeTargets targets;
  const auto &root = sources.root;
  if (const auto *single = std::get_if<SingleFileMode>(&mode)) {
    if (single->file.empty()) {
      throw std::invalid_argument("--file is required in single-file mode");
    }
    targets.explicit_targets =
        std::vector<std::string>{ResolveExistingFile(root, single->file, "Target file")};
  } else if (const auto *test = std::get_if<TestDrivenMode>(&mode)) {
    const auto test_file = ResolveExistingFile(root, test->test_file, "Test file");
    std::vector<std::string> files{test_file};
    for (auto &dependency : DiscoverTestDependencies(root, test_file)) {
      files.push_back(std::move(dependency));
    }
    logger_->Log(LogLevel::kInfo, "refactor.mode.test_driven",
                 {{"test_file", test_file},
                  {"test_name", test->test_name.value_or("")},
                  {"targets", std::to_string(files.size())}});
    targets.explicit_targets = std::move(files);
  } else if (const auto *issue = std::get_if<IssueDrivenMode>(&mode)) {
    const auto parsed = ParseIssue(issue_client_->Fetch(issue->issue_url, context));
    targets.issue_keywords = parsed.keywords;
    targets.issue_context = IssueContextJson(parsed);
    auto files = ResolveMentionedFiles(root, parsed.file_paths, sources);
    if (files.empty()) {
      logger_->Log(LogLevel::kWarn, "refactor.mode.issue.no_files",
                   {{"issue", std::to_string(parsed.issue.number)}});
    } else {
      targets.explicit_targets = std::move(files);
    }
  } else if (const auto *bug = std::get_if<BugReportMode>(&mode)) {
    std::filesystem::path path(bug->markdown_path);
    if (path.is_relative() && !std::filesystem::exists(path)) {
      path = root / path;
    }
    const auto report = LoadBugReport(path);
    targets.bug_report_context = BugReportContextJson(report);
    auto files = ResolveMentionedFiles(root, report.mentioned_files, sources);
    if (files.empty()) {
      logger_->Log(LogLevel::kWarn, "refactor.mode.bug_report.no_files",
                   {{"path", path.string()}});
    } else {
      targets.explicit_targets = std::move(files);
    }
  }
  return targets;
}

bool RefactorOrchestrator::MeetsFileGoals(const SourceSet &sources,
                                          const SelectedTarget &target,
                                          const RewriteOutcome &rewrite,
                                          double coverage,
                                          const QualityProfile &profile) const {
  if (coverage < profile.coverage_min) {
    return false;
  }
  // Lint findings are only known to be gone after the fixer ran; build
  // errors are gone once verification passed.
  if (target.tier == SelectionTier::kLint && !target.violations.empty() &&
      std::find(rewrite.actions.begin(), rewrite.actions.end(), "lint_fix") ==
          rewrite.actions.end()) {
    return false;
  }
  const auto path = sources.root / target.file;
  std::error_code error;
  if (!std::filesystem::is_regular_file(path, error)) {
    return true;
  }
  const auto content = ReadFile(path);
  if (!DetectSatdViolations(target.file, content, sources.toolchain).empty()) {
    return false;
  }
  const auto functions = AnalyzeFunctionComplexity(content, sources.toolchain);
  return std::none_of(functions.begin(), functions.end(),
                      [&profile](const FunctionInfo &function) {
                        return function.cyclomatic > profile.complexity_max;
                      });
}

RefactorOutcome RefactorOrchestrator::Run(const RefactorConfig &config,
                                          const RefactorMode &mode) {
  const auto root = ResolveProjectRoot(config.project_path);
  const auto &context = config.context;
  CacheLock lock(context.cache_dir);
  RefactorStateStore store(context.cache_dir);

  RefactorOutcome outcome;
  auto &state = outcome.state;
  if (config.resume) {
    if (auto loaded = store.Load()) {
      state = std::move(*loaded);
      logger_->Log(LogLevel::kInfo, "refactor.state.resumed",
                   {{"iteration", std::to_string(state.iteration)},
                    {"files_completed",
                     std::to_string(state.files_completed.size())}});
    }
  }
  if (state.iteration == 0) {
    state.start_time = std::chrono::system_clock::now();
  }

  // Explicit targets bypass the include/exclude filters, so measure the
  // whole tree for them.
  const bool explicit_mode = !std::holds_alternative<NormalMode>(mode);
  DiscoveryOptions discovery;
  discovery.toolchain = config.toolchain;
  if (!explicit_mode) {
    discovery.include_patterns = config.filters.include_patterns;
    discovery.exclude_patterns = config.filters.exclude_patterns;
  }
  const auto sources = SourceDiscovery(logger_).Discover(root, discovery);
  const auto targets = ResolveMode(mode, sources, context);

  logger_->Log(LogLevel::kInfo, "refactor.start",
               {{"root", root.string()},
                {"mode", ModeName(mode)},
                {"toolchain", ToolchainName(sources.toolchain)},
                {"files", std::to_string(sources.files.size())},
                {"max_iterations", std::to_string(config.max_iterations)},
                {"dry_run", config.dry_run ? "true" : "false"}});

  auto context_options = context_options_;
  context_options.complexity_threshold = config.profile.complexity_max;
  const DeepContextBuilder context_builder(runner_, context_options, logger_);
  const RefactorPlanBuilder plan_builder(config.profile, sources.toolchain);
  const TargetSelector selector(config.filters, selector_options_, logger_);
  const auto context_path = context.cache_dir / kDeepContextFileName;

  std::optional<DeepContext> deep_context;
  std::string context_markdown;
  std::optional<std::pair<QualityMetrics, std::string>> last_signature;
  outcome.phase_history.push_back(RefactorPhase::kInitialization);
  RefactorPhase phase = RefactorPhase::kInitialization;

  const auto persist = [&]() {
    state.progress.current_phase = phase;
    store.Save(state);
  };
  const auto finish = [&](RefactorStatus status, std::string message) {
    outcome.status = status;
    outcome.message = std::move(message);
    logger_->Log(LogLevel::kInfo, "refactor.complete",
                 {{"status", RefactorStatusName(status)},
                  {"iterations", std::to_string(outcome.iterations)},
                  {"message", outcome.message}});
  };

  while (true) {
    if (context.IsCancelled()) {
      persist();
      finish(RefactorStatus::kCancelled, "Cancelled between iterations");
      break;
    }
    if (outcome.iterations >= config.max_iterations) {
      persist();
      finish(RefactorStatus::kBudgetExhausted,
             "Reached the iteration limit of " +
                 std::to_string(config.max_iterations));
      break;
    }
    ++outcome.iterations;
    ++state.iteration;
    logger_->Log(LogLevel::kInfo, "refactor.iteration.start",
                 {{"iteration", std::to_string(state.iteration)}});

    if (!deep_context || state.iteration % 5 == 0) {
      deep_context = context_builder.Build(sources, context);
      context_markdown =
          RenderDeepContextMarkdown(*deep_context, context_options.top_files);
      WriteFileAtomically(context_path, context_markdown);
      state.context_generated = true;
      state.context_path = context_path.string();
      logger_->Log(LogLevel::kDebug, "refactor.context.refreshed",
                   {{"path", state.context_path}});
    }

    auto snapshot = pipeline_->Measure(sources, context);
    snapshot.metrics =
        ComputeQualityMetrics(sources, snapshot.lint, snapshot.coverage,
                              snapshot.complexity, snapshot.satd, config.profile);
    state.quality_metrics = snapshot.metrics;
    state.satd_baseline = std::max(state.satd_baseline, snapshot.metrics.satd_count);
    state.progress = ComputeProgress(
        snapshot.metrics, config.profile, state.satd_baseline,
        state.files_completed.size(), sources.files.size(), phase,
        Elapsed(state));
    Print(FormatProgressLine(state.iteration, state.progress));

    if (MeetsQualityGates(snapshot.metrics, config.profile)) {
      phase = RefactorPhase::kComplete;
      RecordPhase(outcome.phase_history, RefactorPhase::kQualityValidation);
      RecordPhase(outcome.phase_history, RefactorPhase::kComplete);
      state.current_file.reset();
      persist();
      finish(RefactorStatus::kComplete, "All quality gates passed");
      break;
    }

    CoverageCache coverage_cache(context.cache_dir);
    coverage_cache.Load();
    SelectionInputs inputs;
    inputs.sources = &sources;
    inputs.snapshot = &snapshot;
    inputs.context = deep_context ? &*deep_context : nullptr;
    inputs.profile = config.profile;
    inputs.files_completed = state.files_completed;
    inputs.cached_coverage = coverage_cache.Entries();
    inputs.issue_keywords = targets.issue_keywords;
    inputs.explicit_targets = targets.explicit_targets;
    inputs.build_errors = [this, &sources, &context]() {
      return build_errors_->Analyze(sources, context);
    };
    inputs.file_coverage = [&](const std::string &file) {
      const auto measured = snapshot.coverage.by_file.find(file);
      if (measured != snapshot.coverage.by_file.end()) {
        return measured->second;
      }
      if (const auto cached = coverage_cache.Get(file)) {
        return *cached;
      }
      return pipeline_->MeasureFileCoverage(sources, file, context);
    };

    const auto selection = selector.Select(inputs);
    if (const auto *exhausted = std::get_if<Exhausted>(&selection)) {
      phase = RefactorPhase::kComplete;
      RecordPhase(outcome.phase_history, RefactorPhase::kQualityValidation);
      RecordPhase(outcome.phase_history, RefactorPhase::kComplete);
      state.current_file.reset();
      persist();
      finish(RefactorStatus::kComplete, exhausted->reason);
      break;
    }
    const auto &target = std::get<SelectedTarget>(selection);

    std::pair<QualityMetrics, std::string> signature{snapshot.metrics, target.file};
    if (last_signature && *last_signature == signature) {
      persist();
      finish(RefactorStatus::kNoProgress,
             "No change in metrics while targeting " + target.file);
      break;
    }
    last_signature = std::move(signature);

    phase = target.phase;
    RecordPhase(outcome.phase_history, phase);
    state.current_file = target.file;
    state.progress.current_phase = phase;
    logger_->Log(LogLevel::kInfo, "refactor.target.selected",
                 {{"file", target.file},
                  {"tier", SelectionTierName(target.tier)},
                  {"reason", target.reason},
                  {"violations", std::to_string(target.violations.size())}});

    const auto current_coverage = inputs.file_coverage(target.file);
    const auto plan =
        plan_builder.Build(root, target.file, target.violations,
                           inputs.context, current_coverage);

    if (config.dry_run) {
      const nlohmann::json plan_json = plan.rewrite;
      Print("DRY RUN plan for " + target.file + ":");
      Print(plan_json.dump(2));
      persist();
      continue;
    }

    auto backup = FileBackup::Take(root / target.file, logger_);
    const auto rewrite = rewriter_->Apply(plan, sources, context);
    if (!rewrite.applied) {
      AiRequestContext request_context;
      request_context.file_context =
          ExtractFileContext(context_markdown, target.file);
      request_context.target_coverage = config.profile.coverage_min;
      request_context.issue_context = targets.issue_context;
      request_context.bug_report_context = targets.bug_report_context;
      if (output_ != nullptr) {
        EmitAiRewriteRequest(BuildAiRewriteRequest(plan, request_context),
                             *output_);
      }
      ++outcome.ai_requests;
      logger_->Log(LogLevel::kInfo, "refactor.ai_request",
                   {{"file", target.file}});
    }

    if (context.IsCancelled()) {
      backup.Restore();
      logger_->Log(LogLevel::kWarn, "refactor.rollback",
                   {{"file", target.file}, {"reason", "cancelled"}});
      persist();
      finish(RefactorStatus::kCancelled, "Cancelled; restored " + target.file);
      break;
    }

    const auto check = verifier_->Verify(sources, context);
    if (!check.passed) {
      backup.Restore();
      logger_->Log(LogLevel::kWarn, "refactor.rollback",
                   {{"file", target.file},
                    {"reason", "build_failed"},
                    {"command", check.command}});
      persist();
      finish(RefactorStatus::kBuildBroken,
             "Build failed after rewriting " + target.file +
                 "; the file was restored");
      break;
    }
    backup.Discard();

    const auto coverage = pipeline_->MeasureFileCoverage(sources, target.file, context);
    const bool already_done =
        std::find(state.files_completed.begin(), state.files_completed.end(),
                  target.file) != state.files_completed.end();
    if (!already_done &&
        MeetsFileGoals(sources, target, rewrite, coverage, config.profile)) {
      state.files_completed.push_back(target.file);
      logger_->Log(LogLevel::kInfo, "refactor.file.completed",
                   {{"file", target.file},
                    {"coverage", FormatFixed(coverage, 1)}});
    }
    state.progress.files_completed = state.files_completed.size();
    state.progress.files_remaining =
        sources.files.size() > state.files_completed.size()
            ? sources.files.size() - state.files_completed.size()
            : 0;
    persist();
  }

  outcome.final_metrics = state.quality_metrics;
  return outcome;
}

} // namespace qgate
