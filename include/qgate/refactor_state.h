#pragma once

#include <qgate/execution_context.h>
#include <qgate/logging.h>
#include <qgate/models.h>
#include <qgate/process_runner.h>
#include <qgate/source_discovery.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace qgate {

inline constexpr char kStateFileName[] = "refactor-state.json";
inline constexpr char kLockFileName[] = ".lock";
inline constexpr char kDeepContextFileName[] = "deep_context.md";

// `<cache>/refactor-state.json`, always replaced as a whole file.
class RefactorStateStore {
public:
  explicit RefactorStateStore(std::filesystem::path cache_dir);

  // nullopt when no state was persisted yet. Throws std::runtime_error on
  // unreadable or malformed JSON.
  std::optional<RefactorState> Load() const;
  void Save(const RefactorState &state) const;
  void Clear() const;

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

// Exclusive `flock` on `<cache>/.lock`, held for the object's lifetime. The
// owning PID is written into the file, and the file is unlinked before the
// lock is released.
class CacheLock {
public:
  // Throws std::runtime_error when another process holds the lock.
  explicit CacheLock(const std::filesystem::path &cache_dir);
  ~CacheLock();

  CacheLock(const CacheLock &) = delete;
  CacheLock &operator=(const CacheLock &) = delete;

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
  int fd_ = -1;
};

// `<file>.backup` beside the original. Restore and Discard are explicit so
// the caller decides the outcome after verification; a backup still active
// at destruction is restored.
class FileBackup {
public:
  // Copies `file` when it exists; a missing file restores to "absent".
  static FileBackup Take(const std::filesystem::path &file,
                         std::shared_ptr<Logger> logger = nullptr);
  ~FileBackup();

  FileBackup(FileBackup &&other) noexcept;
  FileBackup &operator=(FileBackup &&) = delete;
  FileBackup(const FileBackup &) = delete;
  FileBackup &operator=(const FileBackup &) = delete;

  void Restore();
  void Discard();

  bool active() const { return active_; }
  const std::filesystem::path &backup_path() const { return backup_path_; }

private:
  FileBackup(std::filesystem::path file, std::filesystem::path backup_path,
             bool existed, std::shared_ptr<Logger> logger);

  std::filesystem::path file_;
  std::filesystem::path backup_path_;
  bool existed_ = false;
  bool active_ = false;
  std::shared_ptr<Logger> logger_;
};

struct BuildCheck {
  bool passed = false;
  std::string command;
  std::string output;
};

class BuildVerifier {
public:
  explicit BuildVerifier(std::shared_ptr<ProcessRunner> runner);
  virtual ~BuildVerifier() = default;

  virtual BuildCheck Verify(const SourceSet &sources,
                            const ExecutionContext &context);

private:
  std::shared_ptr<ProcessRunner> runner_;
};

// coverage >= min, max complexity <= max, SATD <= allowed, zero violations.
bool MeetsQualityGates(const QualityMetrics &metrics,
                       const QualityProfile &profile);

struct GateStatus {
  std::vector<std::string> passed;
  std::vector<std::string> remaining;
};

// Gate names: lint, complexity, satd, coverage.
GateStatus EvaluateQualityGates(const QualityMetrics &metrics,
                                const QualityProfile &profile);

// Weighted 0.3 lint, 0.3 complexity, 0.2 SATD, 0.2 coverage. The SATD
// component is measured against `satd_baseline`.
RefactorProgress ComputeProgress(const QualityMetrics &metrics,
                                 const QualityProfile &profile,
                                 unsigned satd_baseline,
                                 std::size_t files_completed,
                                 std::size_t total_files, RefactorPhase phase,
                                 std::chrono::seconds elapsed);

// `[iter 3] phase=LintFixes overall=42.5% gates=1/4 files=2/10 eta=12.0m`
std::string FormatProgressLine(unsigned iteration,
                               const RefactorProgress &progress);

} // namespace qgate
