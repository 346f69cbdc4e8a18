#include <qgate/cli_commands.h>

#include <qgate/analysis_service.h>
#include <qgate/process_runner.h>
#include <qgate/strings.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <variant>

#include <unistd.h>

namespace qgate {
namespace {

std::vector<std::string> Prefixed(const std::vector<std::string> &command,
                                  const std::vector<std::string> &arguments) {
  std::vector<std::string> args = command;
  args.insert(args.end(), arguments.begin(), arguments.end());
  return args;
}

ServiceOptions MakeServiceOptions(const std::shared_ptr<Logger> &logger,
                                  ExecutionContext context) {
  ServiceOptions options;
  options.logger = logger;
  options.runner = std::make_shared<PosixProcessRunner>(logger);
  options.context = std::move(context);
  options.self_executable = SelfExecutablePath();
  return options;
}

ExecutionContext CurrentContext() {
  return CaptureExecutionContext(std::nullopt,
                                 std::filesystem::current_path());
}

std::optional<LogLevel>
ParseServerLogging(const std::vector<std::string> &arguments) {
  std::optional<LogLevel> level;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (argument == "--log-level") {
      if (++i >= arguments.size()) {
        throw std::invalid_argument("--log-level requires a value");
      }
      level = ParseLogLevel(arguments[i]);
    } else if (argument == "--verbose" || argument == "-v") {
      level = LogLevel::kInfo;
    } else if (argument == "--debug") {
      level = LogLevel::kDebug;
    } else {
      throw std::invalid_argument("Unknown mcp argument: " + argument);
    }
  }
  return level;
}

void WriteReport(const std::filesystem::path &path, const std::string &body) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  WriteFileAtomically(path, body);
}

} // namespace

int DispatchCliInvocation(const ProtocolHandlerRegistry &registry,
                          const CliInvocation &invocation,
                          const std::optional<std::filesystem::path> &output_file,
                          std::ostream &out, std::ostream &err) {
  const CliAdapter adapter{};
  const auto response = registry.Handle(adapter.Decode(invocation));
  auto result = adapter.Encode(response);
  if (output_file && result.exit_code == 0) {
    WriteReport(*output_file, response.body);
    result.stdout_text.clear();
  }
  out << result.stdout_text << std::flush;
  err << result.stderr_text << std::flush;
  return result.exit_code;
}

RefactorRequest ValidateRefactorRequest(const nlohmann::json &body,
                                        const ExecutionContext &context) {
  auto request = ParseRefactorRequest(body, context);
  const auto &root = request.config.project_path;
  if (!std::filesystem::is_directory(root)) {
    throw std::invalid_argument("Project path does not exist: " +
                                root.string());
  }
  if (const auto *single = std::get_if<SingleFileMode>(&request.mode)) {
    std::filesystem::path file(single->file);
    if (file.is_relative() && !std::filesystem::exists(file)) {
      file = root / file;
    }
    if (!std::filesystem::is_regular_file(file)) {
      throw std::invalid_argument("Target file does not exist: " +
                                  single->file);
    }
  }
  return request;
}

std::optional<std::filesystem::path> SelfExecutablePath() {
  std::error_code error;
  auto path = std::filesystem::read_symlink("/proc/self/exe", error);
  if (error) {
    return std::nullopt;
  }
  return path;
}

int RunAnalyze(const std::vector<std::string> &arguments, std::ostream &out,
               std::ostream &err) {
  if (arguments.empty()) {
    PrintAnalyzeUsage(err);
    return 1;
  }
  const auto &kind = arguments.front();
  if (kind == "--help" || kind == "-h") {
    PrintAnalyzeUsage(out);
    return 0;
  }
  if (IsUnimplementedAnalysis(kind)) {
    err << "Error: analysis '" << kind << "' is not supported by qgate\n";
    PrintAnalyzeUsage(err);
    return 1;
  }
  const auto &kinds = AnalysisKinds();
  if (std::find(kinds.begin(), kinds.end(), kind) == kinds.end()) {
    err << "Error: unknown analysis '" << kind << "'\n";
    PrintAnalyzeUsage(err);
    return 1;
  }

  const std::vector<std::string> rest(arguments.begin() + 1, arguments.end());
  const auto cli_options = ParseAnalyzeArguments(rest);
  if (cli_options.show_help) {
    PrintAnalyzeUsage(out);
    return 0;
  }
  const auto options = ResolveAnalyzeOptions(cli_options);
  auto logger = MakeLogger(BuildLoggingConfig(options.log_level), std::clog);

  CliInvocation invocation;
  invocation.command = {"analyze", kind};
  invocation.flags = ToRequestBody(options);
  invocation.args = Prefixed({"analyze"}, arguments);
  const auto registry =
      MakeQgateRegistry(MakeServiceOptions(logger, CurrentContext()));
  return DispatchCliInvocation(*registry, invocation, options.output, out, err);
}

int RunContext(const std::vector<std::string> &arguments, std::ostream &out,
               std::ostream &err) {
  const auto cli_options = ParseAnalyzeArguments(arguments);
  if (cli_options.show_help) {
    out << "Usage: qgate context [analyze options]\n"
        << "Same as 'qgate analyze deep-context --format markdown'.\n";
    return 0;
  }
  auto options = ResolveAnalyzeOptions(cli_options);
  if (!options.format) {
    options.format = "markdown";
  }
  auto logger = MakeLogger(BuildLoggingConfig(options.log_level), std::clog);

  CliInvocation invocation;
  invocation.command = {"context"};
  invocation.flags = ToRequestBody(options);
  invocation.args = Prefixed({"context"}, arguments);
  const auto registry =
      MakeQgateRegistry(MakeServiceOptions(logger, CurrentContext()));
  return DispatchCliInvocation(*registry, invocation, options.output, out, err);
}

int RunRefactor(const std::vector<std::string> &arguments, std::ostream &out,
                std::ostream &err) {
  if (arguments.empty() || arguments.front() != "auto") {
    if (!arguments.empty() &&
        (arguments.front() == "--help" || arguments.front() == "-h")) {
      PrintRefactorUsage(out);
      return 0;
    }
    err << "Error: refactor supports only the 'auto' subcommand\n";
    PrintRefactorUsage(err);
    return 1;
  }

  const std::vector<std::string> rest(arguments.begin() + 1, arguments.end());
  const auto cli_options = ParseRefactorArguments(rest);
  if (cli_options.show_help) {
    PrintRefactorUsage(out);
    return 0;
  }
  const auto options = ResolveRefactorOptions(cli_options);
  auto logger = MakeLogger(BuildLoggingConfig(options.log_level), std::clog);

  auto context = CurrentContext();
  InstallCancellationHandlers(context.cancellation);
  const auto body = ToRequestBody(options);
  ValidateRefactorRequest(body, context);

  auto service = MakeServiceOptions(logger, std::move(context));
  service.live_output = &out;

  CliInvocation invocation;
  invocation.command = {"refactor", "auto"};
  invocation.flags = body;
  invocation.args = Prefixed({"refactor"}, arguments);
  const auto registry = MakeQgateRegistry(std::move(service));
  return DispatchCliInvocation(*registry, invocation, std::nullopt, out, err);
}

int RunTemplateCommand(const std::string &command,
                       const std::vector<std::string> &arguments,
                       std::ostream &out, std::ostream &err) {
  CliInvocation invocation;
  invocation.command = {command};
  invocation.flags = ParseTemplateArguments(arguments);
  invocation.args = Prefixed({command}, arguments);

  std::optional<std::filesystem::path> output;
  if (const auto found = invocation.flags.find("output");
      found != invocation.flags.end() && found->is_string()) {
    output = found->get<std::string>();
  }
  auto logger = MakeLogger(BuildLoggingConfig(std::nullopt), std::clog);
  const auto registry =
      MakeQgateRegistry(MakeServiceOptions(logger, CurrentContext()));
  return DispatchCliInvocation(*registry, invocation, output, out, err);
}

void ServeMcp(const ProtocolHandlerRegistry &registry, std::istream &in,
              std::ostream &out, const std::shared_ptr<Logger> &logger) {
  const McpAdapter adapter{};
  const auto log = EnsureLogger(logger);
  std::string line;
  while (std::getline(in, line)) {
    if (Trim(line).empty()) {
      continue;
    }
    nlohmann::json id = nullptr;
    try {
      const auto envelope = nlohmann::json::parse(line, nullptr, false);
      if (envelope.is_discarded()) {
        throw McpDecodeError(kJsonRpcParseError,
                             "Invalid JSON-RPC: parse error");
      }
      const bool notification = envelope.is_object() && !envelope.contains("id");
      if (envelope.is_object() && !notification) {
        id = envelope["id"];
      }
      const auto response = registry.Handle(adapter.Decode(envelope));
      if (notification) {
        log->Log(LogLevel::kDebug, "mcp.notification",
                 {{"method", envelope.value("method", std::string())},
                  {"status", std::to_string(response.status)}});
        continue;
      }
      out << adapter.Encode(response, id).dump() << '\n' << std::flush;
    } catch (const McpDecodeError &error) {
      log->Log(LogLevel::kWarn, "mcp.decode_error",
               {{"code", std::to_string(error.code())},
                {"error", error.what()}});
      out << adapter.EncodeError(error.code(), error.what(), id).dump() << '\n'
          << std::flush;
    }
  }
}

int RunMcp(const std::vector<std::string> &arguments, std::istream &in,
           std::ostream &out) {
  const auto level = ParseServerLogging(arguments);
  auto logger = MakeLogger(BuildLoggingConfig(level), std::clog);
  auto context = CurrentContext();
  InstallCancellationHandlers(context.cancellation);
  // stdout carries the protocol, so refactor progress stays in the
  // response transcript.
  const auto registry =
      MakeQgateRegistry(MakeServiceOptions(logger, std::move(context)));
  logger->Log(LogLevel::kInfo, "mcp.start", {});
  ServeMcp(*registry, in, out, logger);
  logger->Log(LogLevel::kInfo, "mcp.stop", {});
  return 0;
}

int RunServe(const std::vector<std::string> &arguments) {
  const auto self = SelfExecutablePath();
  const auto server = self ? self->parent_path() / "qgate-serve"
                           : std::filesystem::path("qgate-serve");
  if (!std::filesystem::exists(server)) {
    throw std::runtime_error("qgate-serve not found next to qgate at " +
                             server.string() +
                             " (the HTTP server needs Drogon at build time)");
  }

  std::vector<std::string> storage = Prefixed({server.string()}, arguments);
  std::vector<char *> argv;
  argv.reserve(storage.size() + 1);
  for (auto &argument : storage) {
    argv.push_back(argument.data());
  }
  argv.push_back(nullptr);
  ::execv(server.c_str(), argv.data());
  throw std::runtime_error("Failed to start " + server.string() + ": " +
                           std::strerror(errno));
}

std::filesystem::path ResolveCacheDirectory(const CacheCleanOptions &options,
                                            const std::filesystem::path &root) {
  if (options.cache_directory) {
    return *options.cache_directory;
  }
  return root / ".qgate_cache";
}

bool RemoveCacheDirectory(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    return false;
  }
  std::filesystem::remove_all(path);
  return true;
}

int RunCacheClean(const std::vector<std::string> &arguments,
                  std::ostream &out) {
  const auto options = ParseCacheCleanArguments(arguments);
  if (options.show_help) {
    out << "Usage: qgate cache clean [--project-path <path>] [--cache-dir "
           "<path>]\n";
    return 0;
  }

  const auto root = std::filesystem::weakly_canonical(
      options.project_path.value_or(std::filesystem::current_path()));
  const auto cache_dir = ResolveCacheDirectory(options, root);
  if (RemoveCacheDirectory(cache_dir)) {
    out << "Removed cache at " << cache_dir << "\n";
  } else {
    out << "No cache directory found at " << cache_dir << "\n";
  }
  return 0;
}

int RunCacheCommand(const std::vector<std::string> &arguments,
                    std::ostream &out) {
  if (arguments.empty()) {
    out << "Cache subcommand requires an action (e.g., clean).\n";
    return 1;
  }
  const std::string &action = arguments.front();
  if (action == "clean") {
    const std::vector<std::string> clean_args(arguments.begin() + 1,
                                              arguments.end());
    return RunCacheClean(clean_args, out);
  }
  out << "Unknown cache subcommand: " << action << "\n";
  return 1;
}

} // namespace qgate
