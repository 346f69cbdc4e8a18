#include <qgate/toolchain_commands.h>

namespace qgate {
namespace {

ProcessRequest Command(std::string program, std::vector<std::string> arguments,
                       const std::filesystem::path &root) {
  ProcessRequest request;
  request.program = std::move(program);
  request.arguments = std::move(arguments);
  request.working_directory = root;
  return request;
}

} // namespace

ProcessRequest BuildCheckCommand(Toolchain toolchain,
                                 const std::filesystem::path &root) {
  switch (toolchain) {
  case Toolchain::kRust:
    return Command("cargo", {"check"}, root);
  case Toolchain::kDeno:
    return Command("deno", {"check", "."}, root);
  case Toolchain::kPythonUv:
    return Command("uv", {"run", "python", "-m", "compileall", "-q", "."},
                   root);
  case Toolchain::kGo:
    return Command("go", {"build", "./..."}, root);
  }
  return Command("cargo", {"check"}, root);
}

std::optional<ProcessRequest>
BuildDiagnosticsCommand(Toolchain toolchain,
                        const std::filesystem::path &root) {
  switch (toolchain) {
  case Toolchain::kRust:
    return Command("cargo", {"build", "--message-format=short"}, root);
  case Toolchain::kGo:
    return Command("go", {"build", "./..."}, root);
  case Toolchain::kDeno:
  case Toolchain::kPythonUv:
    return std::nullopt;
  }
  return std::nullopt;
}

std::optional<ProcessRequest> LintCommand(Toolchain toolchain,
                                          const std::filesystem::path &root) {
  if (toolchain != Toolchain::kRust) {
    return std::nullopt;
  }
  return Command("cargo",
                 {"clippy", "--message-format=json", "--", "-W", "clippy::all"},
                 root);
}

std::optional<ProcessRequest>
LintFixCommand(Toolchain toolchain, const std::filesystem::path &root) {
  if (toolchain != Toolchain::kRust) {
    return std::nullopt;
  }
  return Command("cargo",
                 {"clippy", "--fix", "--allow-dirty", "--", "-W",
                  "clippy::all"},
                 root);
}

} // namespace qgate
