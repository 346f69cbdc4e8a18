#include <qgate/dead_code_analyzer.h>

#include <qgate/source_scanner.h>
#include <qgate/strings.h>
#include <qgate/syntax_tree.h>
#include <qgate/work_queue.h>

#include <algorithm>
#include <map>
#include <set>

namespace qgate {
namespace {

struct Definition {
  std::string name;
  std::string kind;
  unsigned line = 0;
  unsigned end_line = 0;
  bool is_public = false;
};

struct FileScan {
  std::string path;
  Toolchain toolchain = Toolchain::kRust;
  bool is_test = false;
  unsigned logical_lines = 0;
  std::vector<Definition> definitions;
  std::vector<DeadCodeItem> unreachable;
  unsigned unreachable_lines = 0;
  std::map<std::string, unsigned> tokens;
  std::set<std::string> module_references;
};

bool IsIdentifier(TSNode node) {
  return ts_node_named_child_count(node) == 0 &&
         EndsWith(NodeType(node), "identifier");
}

void CollectIdentifiers(const SyntaxTree &tree, TSNode node,
                        std::set<std::string> &names) {
  WalkSyntax(node, [&](TSNode child) {
    if (IsIdentifier(child)) {
      names.insert(tree.Text(child));
    }
    return true;
  });
}

void CountTokens(const SyntaxTree &tree, std::map<std::string, unsigned> &tokens) {
  WalkSyntax(tree.Root(), [&](TSNode node) {
    if (IsIdentifier(node)) {
      ++tokens[tree.Text(node)];
    }
    return true;
  });
}

bool IsEntryPoint(const SyntaxDefinition &definition) {
  static const std::set<std::string> kEntryNames = {
      "main", "new", "default", "init", "constructor", "setup", "handler"};
  const auto &name = definition.name;
  if (kEntryNames.count(name) != 0 || StartsWith(name, "test") ||
      (StartsWith(name, "__") && EndsWith(name, "__")) ||
      definition.default_export) {
    return true;
  }
  static const std::vector<std::string> kEntryMarkers = {
      "test", "bench", "main", "route", "no_mangle", "get", "post"};
  for (const auto &annotation : definition.annotations) {
    for (const auto &marker : kEntryMarkers) {
      if (Contains(annotation, marker)) {
        return true;
      }
    }
  }
  return false;
}

bool IsStatementContainer(std::string_view type) {
  return type == "block" || type == "statement_block" ||
         type == "statement_list" || type == "switch_case" ||
         type == "switch_default" || type == "expression_case" ||
         type == "default_case" || type == "type_case" ||
         type == "communication_case";
}

TSNode FirstNamedChild(TSNode node) {
  const auto children = NamedChildren(node);
  return children.empty() ? TSNode{} : children.front();
}

bool IsTerminator(const SyntaxTree &tree, TSNode statement) {
  const auto type = NodeType(statement);
  switch (tree.language()) {
  case SyntaxLanguage::kRust: {
    if (type != "expression_statement") {
      return false;
    }
    const auto expression = FirstNamedChild(statement);
    const auto kind = NodeType(expression);
    if (kind == "return_expression") {
      return true;
    }
    if (kind == "macro_invocation") {
      const auto macro = tree.Text(FieldChild(expression, "macro"));
      return macro == "panic" || macro == "unreachable";
    }
    return kind == "call_expression" &&
           EndsWith(tree.Text(FieldChild(expression, "function")),
                    "process::exit");
  }
  case SyntaxLanguage::kTypeScript:
  case SyntaxLanguage::kTsx:
    return type == "return_statement" || type == "throw_statement";
  case SyntaxLanguage::kPython:
    return type == "return_statement" || type == "raise_statement";
  case SyntaxLanguage::kGo: {
    if (type == "return_statement") {
      return true;
    }
    const auto call = FirstNamedChild(statement);
    return type == "expression_statement" &&
           NodeType(call) == "call_expression" &&
           tree.Text(FieldChild(call, "function")) == "panic";
  }
  }
  return false;
}

// Statements following a return, raise or diverging call in the same block.
void FindUnreachable(const SyntaxTree &tree, const SyntaxDefinition &function,
                     FileScan &scan) {
  const auto reason = tree.language() == SyntaxLanguage::kPython
                          ? "Statement after return or raise"
                          : "Statement after diverging expression";
  WalkSyntax(function.node, [&](TSNode node) {
    if (!ts_node_eq(node, function.node) && IsFunctionNode(tree, node)) {
      return false;
    }
    if (!IsStatementContainer(NodeType(node))) {
      return true;
    }
    bool terminated = false;
    bool reported = false;
    for (const auto statement : NamedChildren(node)) {
      if (terminated) {
        if (!reported) {
          scan.unreachable.push_back({"unreachable", function.name,
                                      StartLine(statement), reason,
                                      DeadCodeConfidence::kHigh});
          reported = true;
        }
        scan.unreachable_lines += EndLine(statement) - StartLine(statement) + 1;
      } else if (IsTerminator(tree, statement)) {
        terminated = true;
      }
    }
    return true;
  });
}

void AddImportSource(const SyntaxTree &tree, TSNode source,
                     std::set<std::string> &references) {
  const std::filesystem::path target(StringLiteralValue(tree, source));
  references.insert(target.stem().string());
  references.insert(target.filename().string());
}

std::set<std::string> ModuleReferences(const SyntaxTree &tree) {
  std::set<std::string> references;
  WalkSyntax(tree.Root(), [&](TSNode node) {
    const auto type = NodeType(node);
    switch (tree.language()) {
    case SyntaxLanguage::kRust:
      if (type == "mod_item" && ts_node_is_null(FieldChild(node, "body"))) {
        references.insert(tree.Text(FieldChild(node, "name")));
      } else if (type == "use_declaration") {
        CollectIdentifiers(tree, node, references);
        return false;
      } else if (type == "scoped_identifier" ||
                 type == "scoped_type_identifier" ||
                 type == "scoped_use_list") {
        CollectIdentifiers(tree, FieldChild(node, "path"), references);
      }
      return true;
    case SyntaxLanguage::kTypeScript:
    case SyntaxLanguage::kTsx:
      if (type == "import_statement" || type == "export_statement") {
        const auto source = FieldChild(node, "source");
        if (!ts_node_is_null(source)) {
          AddImportSource(tree, source, references);
        }
      } else if (type == "call_expression") {
        const auto callee = FieldChild(node, "function");
        const auto argument = FirstNamedChild(FieldChild(node, "arguments"));
        if ((NodeType(callee) == "import" || tree.Text(callee) == "require") &&
            NodeType(argument) == "string") {
          AddImportSource(tree, argument, references);
        }
      }
      return true;
    case SyntaxLanguage::kPython:
      if (type == "import_statement" || type == "import_from_statement") {
        CollectIdentifiers(tree, node, references);
        return false;
      }
      return true;
    case SyntaxLanguage::kGo:
      return false;
    }
    return true;
  });
  return references;
}

bool IsEntryModule(const std::string &path, Toolchain toolchain) {
  const std::filesystem::path file(path);
  const auto name = file.filename().string();
  switch (toolchain) {
  case Toolchain::kRust:
    return name == "lib.rs" || name == "main.rs" || name == "build.rs" ||
           Contains(path, "src/bin/") || Contains(path, "examples/") ||
           Contains(path, "benches/");
  case Toolchain::kDeno:
    return name == "main.ts" || name == "mod.ts" || name == "index.ts" ||
           name == "index.js" || name == "main.js" || name == "deps.ts" ||
           name == "cli.ts";
  case Toolchain::kPythonUv:
    return name == "__init__.py" || name == "__main__.py" ||
           name == "main.py" || name == "setup.py" || name == "conftest.py" ||
           name == "manage.py";
  case Toolchain::kGo:
    return true;
  }
  return true;
}

std::string ModuleName(const std::string &path, Toolchain toolchain) {
  const std::filesystem::path file(path);
  if (toolchain == Toolchain::kRust && file.filename() == "mod.rs") {
    return file.parent_path().filename().string();
  }
  return file.stem().string();
}

FileScan ScanFile(const std::string &path, const std::string &content,
                  Toolchain toolchain) {
  FileScan scan;
  scan.path = path;
  scan.toolchain = toolchain;
  scan.is_test = IsTestSourcePath(path);
  scan.logical_lines = CountLogicalLines(content, toolchain);

  const SyntaxTree tree(content, SyntaxLanguageFor(path, toolchain));
  CountTokens(tree, scan.tokens);
  scan.module_references = ModuleReferences(tree);

  for (const auto &function : FindFunctions(tree)) {
    FindUnreachable(tree, function, scan);
    if (function.reached_implicitly || IsEntryPoint(function)) {
      continue;
    }
    scan.definitions.push_back({function.name, "function", function.line,
                                function.end_line, function.is_public});
  }
  for (const auto &type : FindTypeDefinitions(tree)) {
    if (!type.reached_implicitly && !IsEntryPoint(type)) {
      scan.definitions.push_back(
          {type.name, "class", type.line, type.end_line, type.is_public});
    }
  }
  return scan;
}

DeadCodeConfidence Weaker(DeadCodeConfidence left, DeadCodeConfidence right) {
  return static_cast<int>(left) >= static_cast<int>(right) ? left : right;
}

} // namespace

std::string ConfidenceName(DeadCodeConfidence confidence) {
  switch (confidence) {
  case DeadCodeConfidence::kHigh:
    return "High";
  case DeadCodeConfidence::kMedium:
    return "Medium";
  case DeadCodeConfidence::kLow:
    return "Low";
  }
  return "Low";
}

bool IsTestSourcePath(const std::string &relative_path) {
  const std::filesystem::path file(relative_path);
  const auto name = file.filename().string();
  const auto generic = "/" + relative_path;
  return StartsWith(name, "test_") || Contains(name, "_test.") ||
         Contains(name, ".test.") || Contains(name, "_spec.") ||
         Contains(name, ".spec.") || Contains(generic, "/tests/") ||
         Contains(generic, "/test/") || Contains(generic, "/__tests__/");
}

const FileDeadCode *DeadCodeReport::Find(const std::string &path) const {
  for (const auto &file : files) {
    if (file.path == path) {
      return &file;
    }
  }
  return nullptr;
}

DeadCodeAnalyzer::DeadCodeAnalyzer(DeadCodeOptions options,
                                   std::shared_ptr<Logger> logger)
    : options_(options), logger_(EnsureLogger(std::move(logger))) {}

DeadCodeReport DeadCodeAnalyzer::Analyze(const SourceSet &sources) const {
  const auto root = sources.root;
  const auto toolchain = sources.toolchain;
  auto logger = logger_;
  const auto scans = ParallelMap<std::string, std::optional<FileScan>>(
      sources.files, options_.parallelism,
      [&root, toolchain, logger](const std::string &path)
          -> std::optional<FileScan> {
        try {
          return ScanFile(path, ReadFile(root / path),
                          ToolchainForPath(path).value_or(toolchain));
        } catch (const std::exception &error) {
          logger->Log(LogLevel::kWarn, "dead_code.file.skipped",
                      {{"file", path}, {"error", error.what()}});
          return std::nullopt;
        }
      });

  std::map<std::string, unsigned> project_tokens;
  std::map<std::string, unsigned> definition_counts;
  std::set<std::string> module_references;
  for (const auto &scan : scans) {
    if (!scan) {
      continue;
    }
    for (const auto &entry : scan->tokens) {
      project_tokens[entry.first] += entry.second;
    }
    for (const auto &definition : scan->definitions) {
      ++definition_counts[definition.name];
    }
    module_references.insert(scan->module_references.begin(),
                             scan->module_references.end());
  }

  DeadCodeReport report;
  unsigned total_lines = 0;
  for (const auto &scan : scans) {
    if (!scan) {
      continue;
    }
    ++report.summary.total_files_analyzed;
    total_lines += scan->logical_lines;
    if (scan->is_test && !options_.include_tests) {
      continue;
    }

    FileDeadCode file;
    file.path = scan->path;
    file.total_lines = scan->logical_lines;

    const auto module = ModuleName(scan->path, scan->toolchain);
    if (!IsEntryModule(scan->path, scan->toolchain) && !scan->is_test &&
        module_references.count(module) == 0) {
      file.dead_modules = 1;
      file.dead_lines = scan->logical_lines;
      file.items.push_back({"module", module, 1,
                            "Module is never imported",
                            DeadCodeConfidence::kMedium});
    } else {
      for (const auto &definition : scan->definitions) {
        const auto uses = project_tokens[definition.name];
        if (uses > definition_counts[definition.name]) {
          continue;
        }
        const auto confidence = definition.is_public
                                    ? DeadCodeConfidence::kMedium
                                    : DeadCodeConfidence::kHigh;
        file.items.push_back({definition.kind, definition.name,
                              definition.line,
                              definition.is_public
                                  ? "Public item with no references"
                                  : "Private item with no references",
                              confidence});
        file.dead_lines += definition.end_line - definition.line + 1;
        if (definition.kind == "function") {
          ++file.dead_functions;
        } else {
          ++file.dead_classes;
        }
      }
      for (const auto &item : scan->unreachable) {
        file.items.push_back(item);
        ++file.unreachable_blocks;
      }
      file.dead_lines += scan->unreachable_lines;
    }

    if (file.items.empty()) {
      continue;
    }
    file.dead_lines = std::min(file.dead_lines, std::max(file.total_lines, 1u));
    file.dead_percentage =
        file.total_lines == 0
            ? 0.0
            : 100.0 * file.dead_lines / static_cast<double>(file.total_lines);
    for (const auto &item : file.items) {
      file.confidence = Weaker(file.confidence, item.confidence);
    }
    std::sort(file.items.begin(), file.items.end(),
              [](const DeadCodeItem &left, const DeadCodeItem &right) {
                return left.line < right.line;
              });
    if (file.dead_lines < options_.min_dead_lines) {
      continue;
    }

    report.summary.total_dead_lines += file.dead_lines;
    report.summary.dead_functions += file.dead_functions;
    report.summary.dead_classes += file.dead_classes;
    report.summary.dead_modules += file.dead_modules;
    report.summary.unreachable_blocks += file.unreachable_blocks;
    report.files.push_back(std::move(file));
  }

  report.summary.files_with_dead_code =
      static_cast<unsigned>(report.files.size());
  report.summary.dead_percentage =
      total_lines == 0 ? 0.0
                       : 100.0 * report.summary.total_dead_lines /
                             static_cast<double>(total_lines);
  std::sort(report.files.begin(), report.files.end(),
            [](const FileDeadCode &left, const FileDeadCode &right) {
              if (left.dead_lines != right.dead_lines) {
                return left.dead_lines > right.dead_lines;
              }
              return left.path < right.path;
            });
  if (options_.top_files && report.files.size() > *options_.top_files) {
    report.files.resize(*options_.top_files);
  }
  logger_->Log(LogLevel::kDebug, "analyzer.complete",
               {{"analyzer", "dead-code"},
                {"files", std::to_string(report.summary.files_with_dead_code)},
                {"dead_lines", std::to_string(report.summary.total_dead_lines)}});
  return report;
}

} // namespace qgate
