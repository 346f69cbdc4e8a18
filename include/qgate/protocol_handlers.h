#pragma once

#include <qgate/analysis_service.h>
#include <qgate/component_registry.h>
#include <qgate/execution_context.h>
#include <qgate/logging.h>
#include <qgate/process_runner.h>
#include <qgate/refactor_orchestrator.h>
#include <qgate/unified_protocol.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace qgate {

inline constexpr char kQgateVersion[] = "0.1.0";

struct RefactorRequest {
  RefactorConfig config;
  RefactorMode mode;
  std::optional<std::filesystem::path> rewrite_templates;
  unsigned parallelism = 0;
};

// Relative paths resolve against `base.cwd`; the cache defaults to
// `<project>/.qgate_cache`. Throws std::invalid_argument for conflicting
// modes, `single_file_mode` without `file` and unknown quality profiles.
RefactorRequest ParseRefactorRequest(const nlohmann::json &body,
                                     const ExecutionContext &base);

struct ServiceOptions {
  std::shared_ptr<ProcessRunner> runner;
  ExecutionContext context;
  std::shared_ptr<Logger> logger;
  const ComponentRegistry *components = nullptr;
  // Lint measurement re-invokes this binary when set.
  std::optional<std::filesystem::path> self_executable;
  // Refactor progress and AI requests stream here; when null they are
  // buffered into the response's `transcript`.
  std::ostream *live_output = nullptr;
  // Replaces the default orchestrator wiring.
  std::function<OrchestratorComponents(const RefactorRequest &)>
      orchestrator_factory;
};

class RefactorService {
public:
  explicit RefactorService(ServiceOptions options);

  // 200 with the outcome, or 422 `QUALITY_GATE_FAILED` when the outcome
  // fails the run in CI mode.
  UnifiedResponse Handle(const UnifiedRequest &request) const;

private:
  OrchestratorComponents DefaultComponents(const RefactorRequest &request,
                                           std::ostream *output) const;

  ServiceOptions options_;
};

// Health, analysis, template, refactor and MCP routes. MCP dispatch calls
// back into `registry`, which must stay at the same address.
void RegisterQgateRoutes(ProtocolHandlerRegistry &registry,
                         ServiceOptions options);
std::shared_ptr<ProtocolHandlerRegistry> MakeQgateRegistry(ServiceOptions options);

} // namespace qgate
