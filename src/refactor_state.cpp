#include <qgate/refactor_state.h>

#include <qgate/json_codec.h>
#include <qgate/strings.h>
#include <qgate/toolchain_commands.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sstream>
#include <stdexcept>
#include <sys/file.h>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace qgate {
namespace {

double ClampPercent(double value) { return std::clamp(value, 0.0, 100.0); }

double Ratio(unsigned good, unsigned total) {
  if (total == 0) {
    return 100.0;
  }
  return ClampPercent(100.0 * static_cast<double>(good) /
                      static_cast<double>(total));
}

} // namespace

RefactorStateStore::RefactorStateStore(std::filesystem::path cache_dir)
    : path_(std::move(cache_dir) / kStateFileName) {}

std::optional<RefactorState> RefactorStateStore::Load() const {
  std::error_code error;
  if (!std::filesystem::is_regular_file(path_, error)) {
    return std::nullopt;
  }
  const auto parsed = nlohmann::json::parse(ReadFile(path_), nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    throw std::runtime_error("Malformed refactor state: " + path_.string());
  }
  try {
    return parsed.get<RefactorState>();
  } catch (const nlohmann::json::exception &exception) {
    throw std::runtime_error("Malformed refactor state: " + path_.string() +
                             ": " + exception.what());
  }
}

void RefactorStateStore::Save(const RefactorState &state) const {
  const nlohmann::json json = state;
  WriteFileAtomically(path_, json.dump(2) + "\n");
}

void RefactorStateStore::Clear() const {
  std::error_code error;
  std::filesystem::remove(path_, error);
}

CacheLock::CacheLock(const std::filesystem::path &cache_dir)
    : path_(cache_dir / kLockFileName) {
  std::filesystem::create_directories(cache_dir);
  // A holder unlinks the file before unlocking, so a lock won on a file that
  // is no longer at `path_` is stale and the open has to be repeated.
  while (true) {
    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
      throw std::runtime_error("Failed to open lock file " + path_.string() +
                               ": " + std::strerror(errno));
    }
    if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
      ::close(fd_);
      fd_ = -1;
      throw std::runtime_error("Cache directory is in use by another process: " +
                               cache_dir.string());
    }
    struct stat held {};
    struct stat current {};
    if (::fstat(fd_, &held) == 0 && ::stat(path_.c_str(), &current) == 0 &&
        held.st_dev == current.st_dev && held.st_ino == current.st_ino) {
      break;
    }
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
  }
  const auto pid = std::to_string(::getpid()) + "\n";
  if (::ftruncate(fd_, 0) != 0 ||
      ::write(fd_, pid.data(), pid.size()) !=
          static_cast<ssize_t>(pid.size())) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
    throw std::runtime_error("Failed to write lock file " + path_.string());
  }
}

CacheLock::~CacheLock() {
  if (fd_ >= 0) {
    std::error_code error;
    std::filesystem::remove(path_, error);
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
}

FileBackup::FileBackup(std::filesystem::path file,
                       std::filesystem::path backup_path, bool existed,
                       std::shared_ptr<Logger> logger)
    : file_(std::move(file)), backup_path_(std::move(backup_path)),
      existed_(existed), active_(true), logger_(EnsureLogger(std::move(logger))) {}

FileBackup::FileBackup(FileBackup &&other) noexcept
    : file_(std::move(other.file_)),
      backup_path_(std::move(other.backup_path_)), existed_(other.existed_),
      active_(std::exchange(other.active_, false)),
      logger_(std::move(other.logger_)) {}

FileBackup::~FileBackup() {
  if (!active_) {
    return;
  }
  try {
    Restore();
  } catch (const std::exception &error) {
    logger_->Log(LogLevel::kError, "backup.restore.failed",
                 {{"file", file_.string()},
                  {"backup", backup_path_.string()},
                  {"error", error.what()}});
    return;
  }
  logger_->Log(LogLevel::kWarn, "backup.restored_on_unwind",
               {{"file", file_.string()}});
}

FileBackup FileBackup::Take(const std::filesystem::path &file,
                            std::shared_ptr<Logger> logger) {
  auto backup_path = file;
  backup_path += ".backup";
  std::error_code error;
  const bool existed = std::filesystem::is_regular_file(file, error);
  if (existed) {
    std::filesystem::copy_file(
        file, backup_path, std::filesystem::copy_options::overwrite_existing,
        error);
    if (error) {
      throw std::runtime_error("Failed to back up " + file.string() + ": " +
                               error.message());
    }
  }
  return FileBackup(file, std::move(backup_path), existed, std::move(logger));
}

void FileBackup::Restore() {
  if (!active_) {
    return;
  }
  std::error_code error;
  if (existed_) {
    std::filesystem::rename(backup_path_, file_, error);
    if (error) {
      throw std::runtime_error("Failed to restore " + file_.string() + ": " +
                               error.message());
    }
  } else {
    std::filesystem::remove(file_, error);
  }
  active_ = false;
}

void FileBackup::Discard() {
  if (!active_) {
    return;
  }
  std::error_code error;
  std::filesystem::remove(backup_path_, error);
  active_ = false;
}

BuildVerifier::BuildVerifier(std::shared_ptr<ProcessRunner> runner)
    : runner_(std::move(runner)) {
  if (!runner_) {
    throw std::invalid_argument("BuildVerifier requires a process runner");
  }
}

BuildCheck BuildVerifier::Verify(const SourceSet &sources,
                                 const ExecutionContext &context) {
  const auto request = BuildCheckCommand(sources.toolchain, sources.root);
  const auto result = runner_->Run(request, context);
  BuildCheck check;
  check.passed = result.Succeeded();
  check.command = DescribeCommand(request);
  check.output = result.stderr_text.empty() ? result.stdout_text
                                            : result.stderr_text;
  return check;
}

bool MeetsQualityGates(const QualityMetrics &metrics,
                       const QualityProfile &profile) {
  return metrics.coverage_percent >= profile.coverage_min &&
         metrics.max_complexity <= profile.complexity_max &&
         metrics.satd_count <= profile.satd_allowed &&
         metrics.total_violations == 0;
}

GateStatus EvaluateQualityGates(const QualityMetrics &metrics,
                                const QualityProfile &profile) {
  GateStatus status;
  const auto record = [&status](const char *name, bool passed) {
    (passed ? status.passed : status.remaining).emplace_back(name);
  };
  record("lint", metrics.total_violations == 0);
  record("complexity", metrics.max_complexity <= profile.complexity_max);
  record("satd", metrics.satd_count <= profile.satd_allowed);
  record("coverage", metrics.coverage_percent >= profile.coverage_min);
  return status;
}

RefactorProgress ComputeProgress(const QualityMetrics &metrics,
                                 const QualityProfile &profile,
                                 unsigned satd_baseline,
                                 std::size_t files_completed,
                                 std::size_t total_files, RefactorPhase phase,
                                 std::chrono::seconds elapsed) {
  RefactorProgress progress;
  progress.lint_percent =
      metrics.total_violations == 0
          ? 100.0
          : Ratio(metrics.total_files -
                      std::min(metrics.files_with_issues, metrics.total_files),
                  metrics.total_files);
  progress.complexity_percent =
      metrics.max_complexity <= profile.complexity_max
          ? 100.0
          : Ratio(metrics.total_functions -
                      std::min(metrics.functions_with_high_complexity,
                               metrics.total_functions),
                  metrics.total_functions);
  const auto baseline = std::max(satd_baseline, metrics.satd_count);
  progress.satd_percent =
      baseline == 0 ? 100.0
                    : ClampPercent(100.0 *
                                   static_cast<double>(baseline -
                                                       metrics.satd_count) /
                                   static_cast<double>(baseline));
  progress.coverage_percent = ClampPercent(metrics.coverage_percent);
  progress.overall_completion_percent =
      0.3 * progress.lint_percent + 0.3 * progress.complexity_percent +
      0.2 * progress.satd_percent + 0.2 * progress.coverage_percent;

  const auto gates = EvaluateQualityGates(metrics, profile);
  progress.quality_gates_passed = gates.passed;
  progress.quality_gates_remaining = gates.remaining;
  progress.files_completed = files_completed;
  progress.files_remaining =
      total_files > files_completed ? total_files - files_completed : 0;
  progress.current_phase = phase;

  const double overall = progress.overall_completion_percent;
  if (overall > 0.0 && overall < 100.0) {
    const double elapsed_minutes = static_cast<double>(elapsed.count()) / 60.0;
    progress.estimated_minutes_remaining =
        std::max(0.0, elapsed_minutes * (100.0 - overall) / overall);
  }
  return progress;
}

std::string FormatProgressLine(unsigned iteration,
                               const RefactorProgress &progress) {
  const auto gates = progress.quality_gates_passed.size() +
                     progress.quality_gates_remaining.size();
  std::ostringstream line;
  line << "[iter " << iteration << "] phase="
       << PhaseName(progress.current_phase)
       << " overall=" << FormatFixed(progress.overall_completion_percent, 1)
       << "% gates=" << progress.quality_gates_passed.size() << '/' << gates
       << " files=" << progress.files_completed << '/'
       << progress.files_completed + progress.files_remaining
       << " eta=" << FormatFixed(progress.estimated_minutes_remaining, 1)
       << 'm';
  return line.str();
}

} // namespace qgate
