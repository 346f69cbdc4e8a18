#include <qgate/execution_context.h>

#include <csignal>

extern char **environ;

namespace qgate {
namespace {

std::shared_ptr<CancellationToken> &SignalToken() {
  static std::shared_ptr<CancellationToken> token;
  return token;
}

void HandleTerminationSignal(int) {
  if (const auto &token = SignalToken()) {
    token->Cancel();
  }
}

} // namespace

std::optional<std::string> ExecutionContext::Env(const std::string &name) const {
  const auto found = env.find(name);
  if (found == env.end()) {
    return std::nullopt;
  }
  return found->second;
}

ExecutionContext
CaptureExecutionContext(const std::optional<std::filesystem::path> &cache_dir,
                        const std::filesystem::path &project_root) {
  ExecutionContext context;
  context.cwd = std::filesystem::current_path();
  for (char **entry = environ; entry != nullptr && *entry != nullptr;
       ++entry) {
    const std::string pair(*entry);
    const auto separator = pair.find('=');
    if (separator == std::string::npos) {
      continue;
    }
    context.env.emplace(pair.substr(0, separator), pair.substr(separator + 1));
  }
  if (cache_dir) {
    context.cache_dir = cache_dir->is_absolute() ? *cache_dir
                                                  : context.cwd / *cache_dir;
  } else {
    context.cache_dir = project_root / ".qgate_cache";
  }
  context.cache_dir = std::filesystem::weakly_canonical(context.cache_dir);
  context.cancellation = std::make_shared<CancellationToken>();
  return context;
}

void InstallCancellationHandlers(std::shared_ptr<CancellationToken> token) {
  SignalToken() = std::move(token);
  std::signal(SIGINT, HandleTerminationSignal);
  std::signal(SIGTERM, HandleTerminationSignal);
}

} // namespace qgate
