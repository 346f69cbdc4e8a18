#pragma once

#include <qgate/process_runner.h>
#include <qgate/source_discovery.h>

#include <optional>

namespace qgate {

// `cargo check`, `deno check .`, `python -m compileall -q .`, `go build ./...`.
ProcessRequest BuildCheckCommand(Toolchain toolchain,
                                 const std::filesystem::path &root);
// Short-form compiler diagnostics; only rust and go produce a parseable form.
std::optional<ProcessRequest>
BuildDiagnosticsCommand(Toolchain toolchain, const std::filesystem::path &root);
// `cargo clippy --message-format=json -- -W clippy::all`; rust only.
std::optional<ProcessRequest> LintCommand(Toolchain toolchain,
                                          const std::filesystem::path &root);
// `cargo clippy --fix --allow-dirty -- -W clippy::all`; rust only.
std::optional<ProcessRequest> LintFixCommand(Toolchain toolchain,
                                             const std::filesystem::path &root);

} // namespace qgate
