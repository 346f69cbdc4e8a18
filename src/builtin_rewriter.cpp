#include <qgate/builtin_rewriter.h>

#include <qgate/strings.h>
#include <qgate/syntax_tree.h>
#include <qgate/toolchain_commands.h>

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace qgate {
namespace {

std::string RequireScalar(const YAML::Node &entry, const char *key,
                          std::size_t index) {
  const auto node = entry[key];
  if (!node || !node.IsScalar()) {
    throw std::invalid_argument("Rewrite template " + std::to_string(index) +
                                " requires a string '" + key + "'");
  }
  return node.as<std::string>();
}

// Innermost function item spanning `offset`; null when there is none.
TSNode FunctionAt(const SyntaxTree &tree, std::uint32_t offset) {
  TSNode found{};
  WalkSyntax(tree.Root(), [&](TSNode node) {
    if (offset < ts_node_start_byte(node) || offset >= ts_node_end_byte(node)) {
      return false;
    }
    if (NodeType(node) == "function_item") {
      found = node;
    }
    return true;
  });
  return found;
}

// Other project sources as they were before the fixer ran.
std::map<std::string, std::string> SnapshotOthers(const SourceSet &sources,
                                                  const std::string &target) {
  std::map<std::string, std::string> snapshot;
  for (const auto &file : sources.files) {
    if (file != target) {
      snapshot.emplace(file, ReadFile(sources.root / file));
    }
  }
  return snapshot;
}

} // namespace

std::vector<RewriteTemplate>
LoadRewriteTemplates(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::invalid_argument("Rewrite template file not found: " +
                                path.string());
  }
  const auto root = YAML::LoadFile(path.string());
  if (!root.IsSequence()) {
    throw std::invalid_argument(
        "Rewrite template file must contain a list at the root");
  }
  std::vector<RewriteTemplate> templates;
  std::size_t index = 0;
  for (const auto &entry : root) {
    if (!entry.IsMap()) {
      throw std::invalid_argument("Rewrite template " + std::to_string(index) +
                                  " must be a mapping");
    }
    RewriteTemplate rewrite;
    rewrite.file_suffix = RequireScalar(entry, "file", index);
    rewrite.function_signature = RequireScalar(entry, "signature", index);
    rewrite.function_name = RequireScalar(entry, "function", index);
    rewrite.replacement = RequireScalar(entry, "replacement", index);
    templates.push_back(std::move(rewrite));
    ++index;
  }
  return templates;
}

std::optional<std::string> ExtractFunctionText(const std::string &content,
                                               const std::string &function_name) {
  const SyntaxTree tree(content, SyntaxLanguage::kRust);
  for (const auto &function : FindFunctions(tree)) {
    if (function.name == function_name) {
      return tree.Text(function.node);
    }
  }
  return std::nullopt;
}

std::optional<std::string> ReplaceFunction(const std::string &content,
                                           const std::string &signature,
                                           const std::string &replacement) {
  const auto start = content.find(signature);
  if (start == std::string::npos) {
    return std::nullopt;
  }
  const SyntaxTree tree(content, SyntaxLanguage::kRust);
  const auto function = FunctionAt(tree, static_cast<std::uint32_t>(start));
  if (ts_node_is_null(function)) {
    return std::nullopt;
  }
  return content.substr(0, start) + replacement +
         content.substr(ts_node_end_byte(function));
}

BuiltinRewriter::BuiltinRewriter(std::shared_ptr<ProcessRunner> runner,
                                 std::vector<RewriteTemplate> templates,
                                 std::shared_ptr<Logger> logger)
    : runner_(std::move(runner)), templates_(std::move(templates)),
      logger_(EnsureLogger(std::move(logger))) {}

std::string BuiltinRewriter::ApplyTemplates(const std::filesystem::path &root,
                                            const std::string &file,
                                            std::string content,
                                            RewriteOutcome &outcome) const {
  for (const auto &rewrite : templates_) {
    if (!EndsWith(file, rewrite.file_suffix) ||
        !Contains(content, rewrite.function_signature)) {
      continue;
    }
    const auto replacement_path = root / rewrite.replacement;
    std::error_code error;
    if (!std::filesystem::is_regular_file(replacement_path, error)) {
      logger_->Log(LogLevel::kWarn, "rewrite.template.missing",
                   {{"function", rewrite.function_name},
                    {"replacement", replacement_path.string()}});
      continue;
    }
    const auto function =
        ExtractFunctionText(ReadFile(replacement_path), rewrite.function_name);
    if (!function) {
      logger_->Log(LogLevel::kWarn, "rewrite.template.function_missing",
                   {{"function", rewrite.function_name}});
      continue;
    }
    auto replaced =
        ReplaceFunction(content, rewrite.function_signature, *function);
    if (!replaced) {
      continue;
    }
    content = std::move(*replaced);
    outcome.actions.push_back("template:" + rewrite.function_name);
    logger_->Log(LogLevel::kInfo, "rewrite.template.applied",
                 {{"file", file}, {"function", rewrite.function_name}});
  }
  return content;
}

RewriteOutcome BuiltinRewriter::Apply(const RefactorPlan &plan,
                                      const SourceSet &sources,
                                      const ExecutionContext &context) const {
  RewriteOutcome outcome;
  const auto &file = plan.rewrite.file_path;
  const auto path = sources.root / file;

  auto content = ApplyTemplates(sources.root, file, plan.current_content, outcome);
  const bool has_satd = std::any_of(
      plan.violations.begin(), plan.violations.end(),
      [](const ViolationDetail &violation) {
        return violation.lint_name == "satd_item";
      });
  if (has_satd) {
    const auto cleaned = RemoveSatdComments(content, sources.toolchain);
    if (cleaned != content) {
      content = cleaned;
      outcome.actions.push_back("satd_removal");
    }
  }
  if (content != plan.current_content) {
    WriteFileAtomically(path, content);
    outcome.applied = true;
  }

  const auto fixable = std::count_if(
      plan.violations.begin(), plan.violations.end(),
      [](const ViolationDetail &violation) {
        return violation.machine_applicable;
      });
  if (fixable > 0 && runner_) {
    if (auto request = LintFixCommand(sources.toolchain, sources.root)) {
      logger_->Log(LogLevel::kInfo, "rewrite.lint_fix",
                   {{"file", file}, {"fixes", std::to_string(fixable)}});
      // The fixer works crate-wide; only the target file is backed up, so
      // edits to any other source are undone.
      const auto others = SnapshotOthers(sources, file);
      const auto result = runner_->Run(*request, context);
      for (const auto &entry : others) {
        const auto other = sources.root / entry.first;
        if (ReadFile(other) != entry.second) {
          WriteFileAtomically(other, entry.second);
          logger_->Log(LogLevel::kInfo, "rewrite.lint_fix.reverted",
                       {{"file", entry.first}});
        }
      }
      if (result.Succeeded()) {
        outcome.applied = true;
        outcome.actions.push_back("lint_fix");
      } else {
        logger_->Log(LogLevel::kWarn, "rewrite.lint_fix.failed",
                     {{"exit_code", std::to_string(result.exit_code)}});
      }
    }
  }
  return outcome;
}

} // namespace qgate
