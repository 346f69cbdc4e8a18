#pragma once

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace qgate {

// Shared flag observed between orchestration steps and by running child
// processes. Set from a signal handler, so it only ever flips to true.
class CancellationToken {
public:
  void Cancel() { cancelled_.store(true); }
  bool IsCancelled() const { return cancelled_.load(); }

private:
  std::atomic<bool> cancelled_{false};
};

struct ExecutionContext {
  std::filesystem::path cwd;
  std::map<std::string, std::string> env;
  std::filesystem::path cache_dir;
  std::shared_ptr<CancellationToken> cancellation;

  std::optional<std::string> Env(const std::string &name) const;
  bool IsCancelled() const {
    return cancellation != nullptr && cancellation->IsCancelled();
  }
};

// Snapshot of the current process: cwd, `environ`, cache under
// `<cwd>/.qgate_cache` unless `cache_dir` is given.
ExecutionContext
CaptureExecutionContext(const std::optional<std::filesystem::path> &cache_dir,
                        const std::filesystem::path &project_root);

// Installs SIGINT/SIGTERM handlers that cancel `token`.
void InstallCancellationHandlers(std::shared_ptr<CancellationToken> token);

} // namespace qgate
