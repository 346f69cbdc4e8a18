#include <qgate/cli_commands.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
void PrintGlobalUsage(std::ostream &stream) {
  stream
      << "Usage: qgate <command> [options]\n\n"
      << "Commands:\n"
      << "  refactor auto   Run the quality-gate refactor loop.\n"
      << "  analyze <name>  Run one analysis (see 'qgate analyze --help').\n"
      << "  context         Deep context as markdown.\n"
      << "  list, search, generate, scaffold, validate\n"
      << "                  Template commands.\n"
      << "  mcp             Serve JSON-RPC over stdin/stdout.\n"
      << "  serve           Start the HTTP server (qgate-serve).\n"
      << "  cache clean     Remove the cache directory.\n\n"
      << "Run 'qgate refactor auto --help' for refactor options.\n";
}

bool IsTemplateCommand(const std::string &command) {
  return command == "list" || command == "search" || command == "generate" ||
         command == "scaffold" || command == "validate";
}
} // namespace

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);

    if (arguments.empty()) {
      PrintGlobalUsage(std::cerr);
      return 1;
    }
    if (arguments.front() == "--help" || arguments.front() == "-h") {
      PrintGlobalUsage(std::cout);
      return 0;
    }
    if (arguments.front() == "--version") {
      std::cout << "qgate " << qgate::kQgateVersion << "\n";
      return 0;
    }

    const std::string &command = arguments.front();
    const std::vector<std::string> rest(arguments.begin() + 1, arguments.end());

    if (command == "refactor") {
      return qgate::RunRefactor(rest, std::cout, std::cerr);
    }
    if (command == "analyze") {
      return qgate::RunAnalyze(rest, std::cout, std::cerr);
    }
    if (command == "context") {
      return qgate::RunContext(rest, std::cout, std::cerr);
    }
    if (IsTemplateCommand(command)) {
      return qgate::RunTemplateCommand(command, rest, std::cout, std::cerr);
    }
    if (command == "mcp") {
      return qgate::RunMcp(rest, std::cin, std::cout);
    }
    if (command == "serve") {
      return qgate::RunServe(rest);
    }
    if (command == "cache") {
      return qgate::RunCacheCommand(rest, std::cout);
    }

    std::cerr << "Error: Unknown command: " << command << "\n";
    PrintGlobalUsage(std::cerr);
    return 1;
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 2;
  }
}
