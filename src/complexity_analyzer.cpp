#include <qgate/complexity_analyzer.h>

#include <qgate/strings.h>
#include <qgate/work_queue.h>

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace qgate {
namespace {

unsigned Saturate(unsigned value) {
  return std::min(value, kComplexitySaturation);
}

// `&&`/`||` in brace languages, `and`/`or` in python; empty otherwise.
std::string_view LogicalOperator(TSNode node) {
  if (ts_node_is_null(node)) {
    return {};
  }
  const auto type = NodeType(node);
  if (type != "binary_expression" && type != "boolean_operator") {
    return {};
  }
  const auto op = NodeType(FieldChild(node, "operator"));
  if (op == "&&" || op == "||" || op == "and" || op == "or") {
    return op;
  }
  return {};
}

bool IsDecisionPoint(SyntaxLanguage language, std::string_view type) {
  switch (language) {
  case SyntaxLanguage::kRust:
    // Every match arm is a path of its own.
    return type == "if_expression" || type == "while_expression" ||
           type == "for_expression" || type == "match_arm";
  case SyntaxLanguage::kTypeScript:
  case SyntaxLanguage::kTsx:
    return type == "if_statement" || type == "for_statement" ||
           type == "for_in_statement" || type == "while_statement" ||
           type == "do_statement" || type == "catch_clause" ||
           type == "switch_case" || type == "ternary_expression";
  case SyntaxLanguage::kPython:
    return type == "if_statement" || type == "elif_clause" ||
           type == "for_statement" || type == "while_statement" ||
           type == "except_clause" || type == "conditional_expression" ||
           type == "for_in_clause" || type == "if_clause" ||
           type == "case_clause";
  case SyntaxLanguage::kGo:
    return type == "if_statement" || type == "for_statement" ||
           type == "expression_case" || type == "type_case" ||
           type == "communication_case";
  }
  return false;
}

bool IsIf(std::string_view type) {
  return type == "if_expression" || type == "if_statement";
}

// Structures that score 1 plus the nesting level and nest what they hold.
bool IsNestingStructure(SyntaxLanguage language, std::string_view type) {
  switch (language) {
  case SyntaxLanguage::kRust:
    return type == "for_expression" || type == "while_expression" ||
           type == "loop_expression" || type == "match_expression";
  case SyntaxLanguage::kTypeScript:
  case SyntaxLanguage::kTsx:
    return type == "for_statement" || type == "for_in_statement" ||
           type == "while_statement" || type == "do_statement" ||
           type == "switch_statement" || type == "catch_clause" ||
           type == "ternary_expression";
  case SyntaxLanguage::kPython:
    return type == "for_statement" || type == "while_statement" ||
           type == "except_clause" || type == "match_statement" ||
           type == "conditional_expression";
  case SyntaxLanguage::kGo:
    return type == "for_statement" || type == "expression_switch_statement" ||
           type == "type_switch_statement" || type == "select_statement";
  }
  return false;
}

bool IsLambda(std::string_view type) {
  return type == "closure_expression" || type == "arrow_function" ||
         type == "function_expression" || type == "function" ||
         type == "func_literal" || type == "lambda";
}

bool IsReturn(std::string_view type) {
  return type == "return_expression" || type == "return_statement";
}

class CognitiveScorer {
public:
  CognitiveScorer(const SyntaxTree &tree, TSNode function)
      : tree_(tree), function_(function) {}

  unsigned Score() {
    VisitChildren(function_, 0);
    return score_;
  }

private:
  void Visit(TSNode node, unsigned nesting) {
    if (IsFunctionNode(tree_, node)) {
      return;
    }
    const auto type = NodeType(node);
    if (IsIf(type)) {
      VisitIf(node, nesting, false);
      return;
    }
    if (IsNestingStructure(tree_.language(), type)) {
      score_ += 1 + nesting;
      VisitChildren(node, nesting + 1);
      return;
    }
    if (IsLambda(type)) {
      VisitChildren(node, nesting + 1);
      return;
    }
    const auto op = LogicalOperator(node);
    if (!op.empty()) {
      // A run of the same operator scores once.
      if (LogicalOperator(ts_node_parent(node)) != op) {
        ++score_;
      }
    } else if (IsReturn(type) && nesting > 0) {
      ++score_;
    }
    VisitChildren(node, nesting);
  }

  void VisitChildren(TSNode node, unsigned nesting) {
    for (const auto child : NamedChildren(node)) {
      Visit(child, nesting);
    }
  }

  // Conditions stay at the if's level, branches nest one deeper. An `else
  // if` is charged to its `else`.
  void VisitIf(TSNode node, unsigned nesting, bool else_if) {
    if (!else_if) {
      score_ += 1 + nesting;
    }
    const auto count = ts_node_child_count(node);
    for (std::uint32_t i = 0; i < count; ++i) {
      const auto child = ts_node_child(node, i);
      if (!ts_node_is_named(child) || ts_node_is_extra(child)) {
        continue;
      }
      const char *raw_field = ts_node_field_name_for_child(node, i);
      const std::string_view field = raw_field == nullptr ? "" : raw_field;
      if (field == "alternative") {
        VisitAlternative(child, nesting);
      } else if (field == "condition" || field == "initializer") {
        Visit(child, nesting);
      } else {
        Visit(child, nesting + 1);
      }
    }
  }

  void VisitAlternative(TSNode node, unsigned nesting) {
    ++score_;
    const auto type = NodeType(node);
    if (IsIf(type)) {
      VisitIf(node, nesting, true);
      return;
    }
    if (type == "elif_clause") {
      VisitIf(node, nesting, true);
      return;
    }
    if (type == "else_clause") {
      for (const auto child : NamedChildren(node)) {
        if (IsIf(NodeType(child))) {
          VisitIf(child, nesting, true);
        } else {
          Visit(child, nesting + 1);
        }
      }
      return;
    }
    Visit(node, nesting + 1);
  }

  const SyntaxTree &tree_;
  TSNode function_;
  unsigned score_ = 0;
};

} // namespace

unsigned CyclomaticComplexity(const SyntaxTree &tree, TSNode function) {
  unsigned complexity = 1;
  WalkSyntax(function, [&](TSNode node) {
    if (!ts_node_eq(node, function) && IsFunctionNode(tree, node)) {
      return false;
    }
    if (IsDecisionPoint(tree.language(), NodeType(node)) ||
        !LogicalOperator(node).empty()) {
      ++complexity;
    }
    return true;
  });
  return Saturate(complexity);
}

unsigned CognitiveComplexity(const SyntaxTree &tree, TSNode function) {
  return Saturate(CognitiveScorer(tree, function).Score());
}

std::vector<FunctionInfo> AnalyzeFunctionComplexity(const SyntaxTree &tree) {
  std::vector<FunctionInfo> functions;
  for (const auto &definition : FindFunctions(tree)) {
    FunctionInfo info;
    info.name = definition.name;
    info.line = definition.line;
    info.end_line = definition.end_line;
    info.cyclomatic = CyclomaticComplexity(tree, definition.node);
    info.cognitive = CognitiveComplexity(tree, definition.node);
    functions.push_back(std::move(info));
  }
  return functions;
}

std::vector<FunctionInfo> AnalyzeFunctionComplexity(const std::string &content,
                                                    Toolchain toolchain) {
  return AnalyzeFunctionComplexity(
      SyntaxTree(content, SyntaxLanguageFor(toolchain)));
}

FileComplexity AnalyzeFileComplexity(const std::string &path,
                                     const std::string &content,
                                     Toolchain toolchain) {
  FileComplexity file;
  file.path = path;
  file.logical_lines = CountLogicalLines(content, toolchain);
  const SyntaxTree tree(content, SyntaxLanguageFor(path, toolchain));
  file.functions = AnalyzeFunctionComplexity(tree);
  for (const auto &info : file.functions) {
    file.max_cyclomatic = std::max(file.max_cyclomatic, info.cyclomatic);
    file.max_cognitive = std::max(file.max_cognitive, info.cognitive);
    file.total_cyclomatic += info.cyclomatic;
  }
  return file;
}

const FileComplexity *ComplexityReport::Find(const std::string &path) const {
  const auto found = std::lower_bound(
      files.begin(), files.end(), path,
      [](const FileComplexity &file, const std::string &key) {
        return file.path < key;
      });
  if (found == files.end() || found->path != path) {
    return nullptr;
  }
  return &*found;
}

std::vector<const FileComplexity *>
ComplexityReport::TopFiles(std::size_t limit) const {
  std::vector<const FileComplexity *> ranked;
  for (const auto &file : files) {
    if (!file.functions.empty()) {
      ranked.push_back(&file);
    }
  }
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const FileComplexity *left, const FileComplexity *right) {
                     return left->max_cyclomatic > right->max_cyclomatic;
                   });
  if (ranked.size() > limit) {
    ranked.resize(limit);
  }
  return ranked;
}

ComplexitySummary SummarizeComplexity(const std::vector<FileComplexity> &files,
                                      unsigned threshold) {
  ComplexitySummary summary;
  summary.total_files = static_cast<unsigned>(files.size());
  std::vector<unsigned> values;
  unsigned long long total = 0;
  for (const auto &file : files) {
    for (const auto &function : file.functions) {
      values.push_back(function.cyclomatic);
      total += function.cyclomatic;
      summary.max_cyclomatic =
          std::max(summary.max_cyclomatic, function.cyclomatic);
      summary.max_cognitive = std::max(summary.max_cognitive, function.cognitive);
      if (function.cyclomatic > threshold) {
        ++summary.functions_over_threshold;
      }
    }
  }
  summary.total_functions = static_cast<unsigned>(values.size());
  if (!values.empty()) {
    summary.average_cyclomatic =
        static_cast<double>(total) / static_cast<double>(values.size());
    std::sort(values.begin(), values.end());
    const auto rank = static_cast<std::size_t>(
        std::ceil(0.9 * static_cast<double>(values.size())));
    summary.p90_cyclomatic = values[std::max<std::size_t>(rank, 1) - 1];
  }
  return summary;
}

ComplexityAnalyzer::ComplexityAnalyzer(ComplexityOptions options,
                                       std::shared_ptr<Logger> logger)
    : options_(options), logger_(EnsureLogger(std::move(logger))) {}

ComplexityReport ComplexityAnalyzer::Analyze(const SourceSet &sources) const {
  const auto root = sources.root;
  const auto toolchain = sources.toolchain;
  auto logger = logger_;
  ComplexityReport report;
  report.files = ParallelMap<std::string, FileComplexity>(
      sources.files, options_.parallelism,
      [&root, toolchain, logger](const std::string &path) {
        const auto file_toolchain =
            ToolchainForPath(path).value_or(toolchain);
        try {
          return AnalyzeFileComplexity(path, ReadFile(root / path),
                                       file_toolchain);
        } catch (const std::exception &error) {
          logger->Log(LogLevel::kWarn, "complexity.file.skipped",
                      {{"file", path}, {"error", error.what()}});
          FileComplexity empty;
          empty.path = path;
          return empty;
        }
      });
  std::sort(report.files.begin(), report.files.end(),
            [](const FileComplexity &left, const FileComplexity &right) {
              return left.path < right.path;
            });
  report.summary = SummarizeComplexity(report.files, options_.threshold);
  logger_->Log(LogLevel::kDebug, "analyzer.complete",
               {{"analyzer", "complexity"},
                {"files", std::to_string(report.summary.total_files)},
                {"functions", std::to_string(report.summary.total_functions)},
                {"max_cyclomatic",
                 std::to_string(report.summary.max_cyclomatic)}});
  return report;
}

} // namespace qgate
