#pragma once

#include <qgate/cli_options.h>
#include <qgate/execution_context.h>
#include <qgate/logging.h>
#include <qgate/protocol_adapters.h>
#include <qgate/protocol_handlers.h>
#include <qgate/unified_protocol.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace qgate {

// Routes `invocation` through `registry` and prints the adapter's result.
// With `output_file`, a successful body goes to that file instead of `out`.
int DispatchCliInvocation(const ProtocolHandlerRegistry &registry,
                          const CliInvocation &invocation,
                          const std::optional<std::filesystem::path> &output_file,
                          std::ostream &out, std::ostream &err);

// Config-level checks run before the loop starts: conflicting modes, a
// missing project directory, a single-file target that does not exist.
// Throws std::invalid_argument.
RefactorRequest ValidateRefactorRequest(const nlohmann::json &body,
                                        const ExecutionContext &context);

// `/proc/self/exe`, when readable.
std::optional<std::filesystem::path> SelfExecutablePath();

// Arguments exclude the command word itself.
int RunAnalyze(const std::vector<std::string> &arguments, std::ostream &out,
               std::ostream &err);
int RunContext(const std::vector<std::string> &arguments, std::ostream &out,
               std::ostream &err);
int RunRefactor(const std::vector<std::string> &arguments, std::ostream &out,
                std::ostream &err);
int RunTemplateCommand(const std::string &command,
                       const std::vector<std::string> &arguments,
                       std::ostream &out, std::ostream &err);

// Line-delimited JSON-RPC 2.0 until `in` reaches EOF. Requests without an
// `id` are notifications and get no reply.
void ServeMcp(const ProtocolHandlerRegistry &registry, std::istream &in,
              std::ostream &out, const std::shared_ptr<Logger> &logger);
int RunMcp(const std::vector<std::string> &arguments, std::istream &in,
           std::ostream &out);

// Replaces the process with `qgate-serve` from the same directory.
int RunServe(const std::vector<std::string> &arguments);

std::filesystem::path ResolveCacheDirectory(const CacheCleanOptions &options,
                                            const std::filesystem::path &root);
bool RemoveCacheDirectory(const std::filesystem::path &path);
int RunCacheClean(const std::vector<std::string> &arguments, std::ostream &out);
int RunCacheCommand(const std::vector<std::string> &arguments,
                    std::ostream &out);

} // namespace qgate
