#include <qgate/refactor_state.h>
#include <qgate/strings.h>

#include "test_support/scripted_process_runner.h"
#include "test_support/temporary_project.h"

#include <gtest/gtest.h>

#include <fcntl.h>
#include <memory>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace qgate {
namespace {

QualityMetrics PassingMetrics() {
  QualityMetrics metrics;
  metrics.coverage_percent = 80.0;
  metrics.max_complexity = 10;
  metrics.satd_count = 0;
  metrics.total_violations = 0;
  return metrics;
}

TEST(QualityGateTest, AllFourGatesMustHold) {
  const auto profile = ExtremeQualityProfile();
  EXPECT_TRUE(MeetsQualityGates(PassingMetrics(), profile));

  auto low_coverage = PassingMetrics();
  low_coverage.coverage_percent = 79.9;
  EXPECT_FALSE(MeetsQualityGates(low_coverage, profile));

  auto complex = PassingMetrics();
  complex.max_complexity = 11;
  EXPECT_FALSE(MeetsQualityGates(complex, profile));

  auto debt = PassingMetrics();
  debt.satd_count = 1;
  EXPECT_FALSE(MeetsQualityGates(debt, profile));

  auto lint = PassingMetrics();
  lint.total_violations = 1;
  EXPECT_FALSE(MeetsQualityGates(lint, profile));

  auto lenient = profile;
  lenient.satd_allowed = 1;
  EXPECT_TRUE(MeetsQualityGates(debt, lenient));
}

TEST(QualityGateTest, EvaluationNamesPassedAndRemainingGates) {
  auto metrics = PassingMetrics();
  metrics.satd_count = 3;
  metrics.coverage_percent = 20.0;

  const auto status = EvaluateQualityGates(metrics, ExtremeQualityProfile());

  EXPECT_EQ(status.passed, (std::vector<std::string>{"lint", "complexity"}));
  EXPECT_EQ(status.remaining, (std::vector<std::string>{"satd", "coverage"}));
}

TEST(RefactorProgressTest, WeighsComponentsAndEstimatesRemainingTime) {
  QualityMetrics metrics;
  metrics.total_violations = 4;
  metrics.files_with_issues = 2;
  metrics.total_files = 10;
  metrics.max_complexity = 14;
  metrics.total_functions = 20;
  metrics.functions_with_high_complexity = 5;
  metrics.satd_count = 2;
  metrics.coverage_percent = 60.0;

  const auto progress = ComputeProgress(
      metrics, ExtremeQualityProfile(), 4, 2, 10, RefactorPhase::kLintFixes,
      std::chrono::seconds(137 * 60));

  EXPECT_DOUBLE_EQ(progress.lint_percent, 80.0);
  EXPECT_DOUBLE_EQ(progress.complexity_percent, 75.0);
  EXPECT_DOUBLE_EQ(progress.satd_percent, 50.0);
  EXPECT_DOUBLE_EQ(progress.coverage_percent, 60.0);
  EXPECT_NEAR(progress.overall_completion_percent, 68.5, 1e-9);
  EXPECT_NEAR(progress.estimated_minutes_remaining, 63.0, 1e-9);
  EXPECT_EQ(progress.files_remaining, 8u);
  EXPECT_EQ(progress.quality_gates_remaining.size(), 4u);
  EXPECT_EQ(FormatProgressLine(3, progress),
            "[iter 3] phase=LintFixes overall=68.5% gates=0/4 files=2/10 "
            "eta=63.0m");
}

TEST(RefactorProgressTest, SatdBaselineNeverBelowCurrentCount) {
  auto metrics = PassingMetrics();
  metrics.satd_count = 5;

  const auto progress =
      ComputeProgress(metrics, ExtremeQualityProfile(), 0, 0, 1,
                      RefactorPhase::kSatdCleanup, std::chrono::seconds(0));

  EXPECT_DOUBLE_EQ(progress.satd_percent, 0.0);
  EXPECT_DOUBLE_EQ(progress.estimated_minutes_remaining, 0.0);
}

TEST(RefactorStateStoreTest, SavesAndLoadsTheWholeState) {
  test::TemporaryProject project;
  const RefactorStateStore store(project.root() / ".qgate_cache");
  EXPECT_FALSE(store.Load().has_value());

  RefactorState state;
  state.iteration = 7;
  state.start_time = ParseIsoTimestamp("2026-03-01T08:00:00Z");
  state.context_generated = true;
  state.context_path = "/tmp/deep_context.md";
  state.current_file = "src/lib.rs";
  state.files_completed = {"src/a.rs", "src/b.rs"};
  state.quality_metrics = PassingMetrics();
  state.progress.current_phase = RefactorPhase::kComplexityReduction;
  state.progress.quality_gates_passed = {"lint"};
  state.satd_baseline = 3;
  store.Save(state);

  const auto loaded = store.Load();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->iteration, 7u);
  EXPECT_EQ(loaded->start_time, state.start_time);
  EXPECT_TRUE(loaded->context_generated);
  EXPECT_EQ(loaded->current_file, state.current_file);
  EXPECT_EQ(loaded->files_completed, state.files_completed);
  EXPECT_EQ(loaded->quality_metrics, state.quality_metrics);
  EXPECT_EQ(loaded->progress.current_phase, RefactorPhase::kComplexityReduction);
  EXPECT_EQ(loaded->progress.quality_gates_passed, state.progress.quality_gates_passed);
  EXPECT_EQ(loaded->satd_baseline, 3u);

  store.Clear();
  EXPECT_FALSE(store.Load().has_value());
}

TEST(RefactorStateStoreTest, MalformedStateIsAnError) {
  test::TemporaryProject project;
  project.AddFile(".qgate_cache/refactor-state.json", "{ not json");

  const RefactorStateStore store(project.root() / ".qgate_cache");

  EXPECT_THROW(store.Load(), std::runtime_error);
}

TEST(CacheLockTest, SecondHolderIsRejectedUntilRelease) {
  test::TemporaryProject project;
  const auto cache = project.root() / ".qgate_cache";
  {
    CacheLock lock(cache);
    EXPECT_TRUE(std::filesystem::exists(lock.path()));
    EXPECT_THROW(CacheLock second(cache), std::runtime_error);
  }
  EXPECT_NO_THROW(CacheLock again(cache));
}

TEST(CacheLockTest, LockFileIsUnlinkedWhileStillHeld) {
  test::TemporaryProject project;
  const auto cache = project.root() / ".qgate_cache";
  auto first = std::make_unique<CacheLock>(cache);
  const auto path = first->path();
  // A contender that opened the file before the holder let go.
  const int contender = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
  ASSERT_GE(contender, 0);

  first.reset();

  EXPECT_FALSE(std::filesystem::exists(path));
  // The contender now owns the unlinked file; it must not block nor share
  // the lock with a fresh acquisition.
  EXPECT_EQ(::flock(contender, LOCK_EX | LOCK_NB), 0);
  {
    CacheLock second(cache);
    struct stat held {};
    struct stat stale {};
    ASSERT_EQ(::stat(path.c_str(), &held), 0);
    ASSERT_EQ(::fstat(contender, &stale), 0);
    EXPECT_NE(held.st_ino, stale.st_ino);
    EXPECT_THROW(CacheLock third(cache), std::runtime_error);
  }
  ::close(contender);
}

TEST(FileBackupTest, RestoreBringsBackTheOriginal) {
  test::TemporaryProject project;
  const auto file = project.AddFile("src/lib.rs", "original\n");

  auto backup = FileBackup::Take(file);
  EXPECT_TRUE(std::filesystem::exists(backup.backup_path()));
  project.AddFile("src/lib.rs", "rewritten\n");
  backup.Restore();

  EXPECT_EQ(project.ReadFile("src/lib.rs"), "original\n");
  EXPECT_FALSE(std::filesystem::exists(backup.backup_path()));
  EXPECT_FALSE(backup.active());
}

TEST(FileBackupTest, DiscardKeepsTheNewContent) {
  test::TemporaryProject project;
  const auto file = project.AddFile("src/lib.rs", "original\n");

  auto backup = FileBackup::Take(file);
  project.AddFile("src/lib.rs", "rewritten\n");
  backup.Discard();

  EXPECT_EQ(project.ReadFile("src/lib.rs"), "rewritten\n");
  EXPECT_FALSE(std::filesystem::exists(backup.backup_path()));
}

TEST(FileBackupTest, RestoringANewFileRemovesIt) {
  test::TemporaryProject project;
  const auto file = project.root() / "src/new.rs";

  auto backup = FileBackup::Take(file);
  project.AddFile("src/new.rs", "created\n");
  backup.Restore();

  EXPECT_FALSE(std::filesystem::exists(file));
}

TEST(FileBackupTest, ActiveBackupIsRestoredWhenDestroyed) {
  test::TemporaryProject project;
  const auto file = project.AddFile("src/lib.rs", "original\n");
  std::filesystem::path backup_path;

  EXPECT_THROW(
      {
        auto backup = FileBackup::Take(file);
        backup_path = backup.backup_path();
        project.AddFile("src/lib.rs", "half written\n");
        throw std::runtime_error("rewriter failed");
      },
      std::runtime_error);

  EXPECT_EQ(project.ReadFile("src/lib.rs"), "original\n");
  EXPECT_FALSE(std::filesystem::exists(backup_path));
}

TEST(FileBackupTest, MovedFromBackupDoesNotRestore) {
  test::TemporaryProject project;
  const auto file = project.AddFile("src/lib.rs", "original\n");

  auto backup = FileBackup::Take(file);
  {
    auto owner = std::move(backup);
    EXPECT_FALSE(backup.active());
    EXPECT_TRUE(owner.active());
    project.AddFile("src/lib.rs", "rewritten\n");
    owner.Discard();
  }

  EXPECT_EQ(project.ReadFile("src/lib.rs"), "rewritten\n");
}

TEST(BuildVerifierTest, ReportsTheCheckCommandAndOutput) {
  auto runner = std::make_shared<test::ScriptedProcessRunner>();
  runner->On("cargo", {"check"},
             test::ScriptedProcessRunner::Failure(101, "error[E0308]\n"));
  SourceSet sources;
  sources.root = "/work/demo";

  const auto check = BuildVerifier(runner).Verify(sources, {});

  EXPECT_FALSE(check.passed);
  EXPECT_EQ(check.command, "cargo check");
  EXPECT_EQ(check.output, "error[E0308]\n");
}

} // namespace
} // namespace qgate
