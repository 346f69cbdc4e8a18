#include <qgate/deep_context.h>

#include <qgate/escaping.h>
#include <qgate/strings.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <set>
#include <sstream>
#include <stdexcept>

namespace qgate {
namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;
constexpr char kFileSectionPrefix[] = "## File: ";

void HashBytes(std::uint64_t &hash, const std::string &bytes) {
  for (const auto c : bytes) {
    hash ^= static_cast<unsigned char>(c);
    hash *= kFnvPrime;
  }
  hash ^= 0xff;
  hash *= kFnvPrime;
}

std::string ImportSource(const SyntaxTree &tree, TSNode node) {
  const auto type = NodeType(node);
  switch (tree.language()) {
  case SyntaxLanguage::kRust:
    if (type == "use_declaration") {
      return tree.Text(FieldChild(node, "argument"));
    }
    if (type == "extern_crate_declaration") {
      return tree.Text(FieldChild(node, "name"));
    }
    return {};
  case SyntaxLanguage::kTypeScript:
  case SyntaxLanguage::kTsx: {
    if (type == "import_statement" || type == "export_statement") {
      const auto source = FieldChild(node, "source");
      return ts_node_is_null(source) ? std::string()
                                     : StringLiteralValue(tree, source);
    }
    if (type != "call_expression") {
      return {};
    }
    const auto callee = FieldChild(node, "function");
    const auto arguments = NamedChildren(FieldChild(node, "arguments"));
    if ((NodeType(callee) == "import" || tree.Text(callee) == "require") &&
        !arguments.empty() && NodeType(arguments.front()) == "string") {
      return StringLiteralValue(tree, arguments.front());
    }
    return {};
  }
  case SyntaxLanguage::kPython:
    if (type == "import_from_statement") {
      return tree.Text(FieldChild(node, "module_name"));
    }
    return {};
  case SyntaxLanguage::kGo:
    if (type == "import_spec") {
      return StringLiteralValue(tree, FieldChild(node, "path"));
    }
    return {};
  }
  return {};
}

// `import a, b as c` names several modules in one statement.
void PythonImportNames(const SyntaxTree &tree, TSNode statement,
                       std::vector<std::string> &imports) {
  const auto count = ts_node_child_count(statement);
  for (std::uint32_t i = 0; i < count; ++i) {
    const char *field = ts_node_field_name_for_child(statement, i);
    if (field == nullptr || std::string_view(field) != "name") {
      continue;
    }
    auto module = ts_node_child(statement, i);
    if (NodeType(module) == "aliased_import") {
      module = FieldChild(module, "name");
    }
    imports.push_back(tree.Text(module));
  }
}

std::string RiskLabel(double score) {
  if (score >= 0.7) {
    return "high";
  }
  if (score >= 0.4) {
    return "medium";
  }
  return "low";
}

std::string Percent(double value) { return FormatFixed(value, 1) + "%"; }

QualityScorecard BuildScorecard(const DeepContext &context) {
  QualityScorecard scorecard;
  const auto &complexity = context.complexity.summary;
  if (complexity.total_functions > 0) {
    scorecard.complexity_score =
        100.0 *
        static_cast<double>(complexity.total_functions -
                            complexity.functions_over_threshold) /
        static_cast<double>(complexity.total_functions);
  }
  scorecard.satd_score = std::max(
      0.0, 100.0 - 5.0 * static_cast<double>(context.satd.summary.total_items));
  scorecard.maintainability_index =
      std::clamp(100.0 - 25.0 * context.tdg.summary.average_tdg -
                     context.dead_code.summary.dead_percentage / 2.0,
                 0.0, 100.0);
  scorecard.technical_debt_hours = context.tdg.summary.estimated_debt_hours;
  scorecard.overall_health =
      (scorecard.complexity_score + scorecard.maintainability_index +
       scorecard.satd_score) /
      3.0;
  return scorecard;
}

std::vector<PredictedDefect>
PredictDefects(const DeepContext &context, std::size_t limit) {
  std::vector<const DeepContextFile *> ranked;
  for (const auto &file : context.files) {
    if (file.defect_score > 0.0) {
      ranked.push_back(&file);
    }
  }
  std::sort(ranked.begin(), ranked.end(),
            [](const DeepContextFile *left, const DeepContextFile *right) {
              if (left->defect_score != right->defect_score) {
                return left->defect_score > right->defect_score;
              }
              return left->path < right->path;
            });

  std::vector<PredictedDefect> defects;
  for (const auto *file : ranked) {
    if (defects.size() >= limit) {
      break;
    }
    PredictedDefect defect;
    defect.file = file->path;
    defect.score = file->defect_score;
    defect.risk = RiskLabel(file->defect_score);
    if (file->max_cyclomatic > 1) {
      defect.factors.push_back("cyclomatic " +
                               std::to_string(file->max_cyclomatic));
    }
    if (file->churn_score > 0.0) {
      defect.factors.push_back("churn " + FormatFixed(file->churn_score, 2));
    }
    if (file->satd_items > 0) {
      defect.factors.push_back("satd " + std::to_string(file->satd_items));
    }
    if (file->dead_code_items > 0) {
      defect.factors.push_back("dead code " +
                               std::to_string(file->dead_code_items));
    }
    defects.push_back(std::move(defect));
  }
  return defects;
}

std::vector<Recommendation> Recommend(const DeepContext &context,
                                      std::size_t limit) {
  std::vector<Recommendation> recommendations;
  const auto add = [&](std::string title, std::string file,
                       std::string rationale) {
    if (recommendations.size() >= limit) {
      return;
    }
    Recommendation recommendation;
    recommendation.priority =
        static_cast<unsigned>(recommendations.size() + 1);
    recommendation.title = std::move(title);
    recommendation.file = std::move(file);
    recommendation.rationale = std::move(rationale);
    recommendations.push_back(std::move(recommendation));
  };

  for (const auto &path :
       context.FilesOverComplexity(context.complexity_threshold)) {
    const auto *file = context.complexity.Find(path);
    const auto worst = std::max_element(
        file->functions.begin(), file->functions.end(),
        [](const FunctionInfo &left, const FunctionInfo &right) {
          return left.cyclomatic < right.cyclomatic;
        });
    add("Reduce complexity", path,
        worst->name + " has cyclomatic complexity " +
            std::to_string(worst->cyclomatic) + " (threshold " +
            std::to_string(context.complexity_threshold) + ")");
  }

  std::map<std::string, std::vector<const SatdItem *>> severe_debt;
  for (const auto &item : context.satd.items) {
    if (item.severity == SatdSeverity::kHigh ||
        item.severity == SatdSeverity::kCritical) {
      severe_debt[item.file].push_back(&item);
    }
  }
  for (const auto &[file, items] : severe_debt) {
    add("Resolve high-severity technical debt", file,
        std::to_string(items.size()) + " item(s), first " +
            items.front()->marker + " at line " +
            std::to_string(items.front()->line));
  }

  for (const auto &file : context.dead_code.files) {
    if (file.dead_lines == 0 && file.items.empty()) {
      continue;
    }
    add("Remove dead code", file.path,
        std::to_string(file.items.size()) + " dead item(s), " +
            std::to_string(file.dead_lines) + " line(s) (" +
            Percent(file.dead_percentage) + ")");
  }

  for (const auto &path : context.churn.summary.hotspot_files) {
    const auto *churn = context.churn.Find(path);
    add("Stabilize frequently changed file", path,
        std::to_string(churn != nullptr ? churn->commit_count : 0) +
            " commits in the last " +
            std::to_string(context.churn.summary.period_days) + " days");
  }
  return recommendations;
}

struct TreeAggregate {
  double defect_score = 0.0;
  unsigned satd_items = 0;
  unsigned dead_code_items = 0;
};

std::string Annotate(const TreeAggregate &aggregate) {
  return " [defect_score=" + FormatFixed(aggregate.defect_score, 2) +
         ", satd_items=" + std::to_string(aggregate.satd_items) +
         ", dead_code_items=" + std::to_string(aggregate.dead_code_items) +
         "]";
}

std::string BuildExecutiveSummary(const DeepContext &context) {
  std::ostringstream section;
  section << "## Executive Summary\n\n";
  section << "- Toolchain: " << ToolchainName(context.toolchain) << "\n";
  section << "- Files analyzed: " << context.files.size() << "\n";
  section << "- Functions: " << context.complexity.summary.total_functions
          << "\n";
  section << "- Overall health: "
          << FormatFixed(context.scorecard.overall_health, 1) << "/100\n";
  section << "- Functions over complexity threshold: "
          << context.complexity.summary.functions_over_threshold << "\n";
  section << "- SATD items: " << context.satd.summary.total_items << "\n";
  section << "- Dead code lines: "
          << context.dead_code.summary.total_dead_lines << "\n";
  section << "- High-risk files: "
          << std::count_if(context.predicted_defects.begin(),
                           context.predicted_defects.end(),
                           [](const PredictedDefect &defect) {
                             return defect.risk == "high";
                           })
          << "\n\n";
  return section.str();
}

std::string BuildScorecardMarkdown(const QualityScorecard &scorecard) {
  std::ostringstream section;
  section << "## Quality Scorecard\n\n";
  section << "| Metric | Value |\n";
  section << "| --- | --- |\n";
  section << "| Overall Health | " << FormatFixed(scorecard.overall_health, 1)
          << " |\n";
  section << "| Complexity Score | "
          << FormatFixed(scorecard.complexity_score, 1) << " |\n";
  section << "| Maintainability Index | "
          << FormatFixed(scorecard.maintainability_index, 1) << " |\n";
  section << "| SATD Score | " << FormatFixed(scorecard.satd_score, 1)
          << " |\n";
  section << "| Technical Debt Hours | "
          << FormatFixed(scorecard.technical_debt_hours, 1) << " |\n\n";
  return section.str();
}

std::string BuildProjectTree(const DeepContext &context) {
  std::map<std::string, TreeAggregate> directories;
  for (const auto &file : context.files) {
    auto directory = std::filesystem::path(file.path).parent_path();
    while (!directory.empty()) {
      auto &aggregate = directories[directory.generic_string()];
      aggregate.defect_score =
          std::max(aggregate.defect_score, file.defect_score);
      aggregate.satd_items += file.satd_items;
      aggregate.dead_code_items += file.dead_code_items;
      directory = directory.parent_path();
    }
  }

  std::ostringstream section;
  section << "## Project Structure\n\n```\n";
  if (context.files.empty()) {
    section << "(no source files)\n";
  }
  std::vector<std::string> open_directories;
  for (const auto &file : context.files) {
    const auto components = SplitList(file.path, '/');
    std::size_t shared = 0;
    while (shared < open_directories.size() && shared + 1 < components.size() &&
           open_directories[shared] == components[shared]) {
      ++shared;
    }
    open_directories.resize(shared);
    std::string prefix;
    for (std::size_t i = 0; i < shared; ++i) {
      prefix += components[i] + "/";
    }
    for (std::size_t depth = shared; depth + 1 < components.size(); ++depth) {
      prefix += components[depth];
      section << std::string(depth * 2, ' ') << components[depth] << "/"
              << Annotate(directories[prefix]) << "\n";
      prefix += "/";
      open_directories.push_back(components[depth]);
    }
    TreeAggregate leaf{file.defect_score, file.satd_items,
                       file.dead_code_items};
    section << std::string((components.size() - 1) * 2, ' ')
            << components.back() << Annotate(leaf) << "\n";
  }
  section << "```\n\n";
  return section.str();
}

std::string BuildComplexityHotspots(const DeepContext &context,
                                    std::size_t limit) {
  struct Entry {
    const std::string *file;
    const FunctionInfo *function;
  };
  std::vector<Entry> entries;
  for (const auto &file : context.complexity.files) {
    for (const auto &function : file.functions) {
      entries.push_back({&file.path, &function});
    }
  }
  std::sort(entries.begin(), entries.end(),
            [](const Entry &left, const Entry &right) {
              if (left.function->cyclomatic != right.function->cyclomatic) {
                return left.function->cyclomatic > right.function->cyclomatic;
              }
              if (*left.file != *right.file) {
                return *left.file < *right.file;
              }
              return left.function->line < right.function->line;
            });

  std::ostringstream section;
  section << "## Complexity Hotspots\n\n";
  section << "| File | Function | Lines | Cyclomatic | Cognitive |\n";
  section << "| --- | --- | --- | --- | --- |\n";
  if (entries.empty()) {
    section << "| None | - | - | - | - |\n\n";
    return section.str();
  }
  for (std::size_t i = 0; i < entries.size() && i < limit; ++i) {
    const auto &function = *entries[i].function;
    section << "| " << EscapeMarkdownCell(*entries[i].file) << " | "
            << EscapeMarkdownCell(function.name) << " | " << function.line
            << "-" << function.end_line << " | " << function.cyclomatic
            << " | " << function.cognitive << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildChurnMarkdown(const DeepContext &context, std::size_t limit) {
  const auto &summary = context.churn.summary;
  std::ostringstream section;
  section << "## Churn Summary\n\n";
  section << "- Period: " << summary.period_days << " days\n";
  section << "- Commits: " << summary.total_commits << "\n";
  section << "- Files changed: " << summary.total_files_changed << "\n";
  section << "- Hotspot files: " << summary.hotspot_files.size() << "\n";
  section << "- Stable files: " << summary.stable_files.size() << "\n\n";
  section << "| File | Commits | Authors | Additions | Deletions | Score |\n";
  section << "| --- | --- | --- | --- | --- | --- |\n";
  if (context.churn.files.empty()) {
    section << "| None | - | - | - | - | - |\n\n";
    return section.str();
  }
  for (std::size_t i = 0; i < context.churn.files.size() && i < limit; ++i) {
    const auto &file = context.churn.files[i];
    section << "| " << EscapeMarkdownCell(file.path) << " | "
            << file.commit_count << " | " << file.unique_authors.size()
            << " | " << file.additions << " | " << file.deletions << " | "
            << FormatFixed(file.churn_score, 2) << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildSatdMarkdown(const DeepContext &context) {
  const auto &summary = context.satd.summary;
  std::ostringstream section;
  section << "## SATD Summary\n\n";
  section << "- Total items: " << summary.total_items << "\n";
  section << "- Marker items: " << summary.strict_items << "\n";
  section << "- Files with debt: " << summary.files_with_debt << "\n";
  section << "- Critical items: " << summary.critical_items << "\n\n";
  section << "| File | Line | Marker | Severity | Category | Text |\n";
  section << "| --- | --- | --- | --- | --- | --- |\n";
  if (context.satd.items.empty()) {
    section << "| None | - | - | - | - | - |\n\n";
    return section.str();
  }
  for (const auto &item : context.satd.items) {
    section << "| " << EscapeMarkdownCell(item.file) << " | " << item.line
            << " | " << item.marker << " | "
            << SatdSeverityName(item.severity) << " | "
            << DebtCategoryName(item.category) << " | "
            << EscapeMarkdownCell(item.text) << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildDeadCodeMarkdown(const DeepContext &context) {
  const auto &summary = context.dead_code.summary;
  std::ostringstream section;
  section << "## Dead Code Summary\n\n";
  section << "- Files with dead code: " << summary.files_with_dead_code
          << "\n";
  section << "- Dead lines: " << summary.total_dead_lines << " ("
          << Percent(summary.dead_percentage) << ")\n\n";
  section << "| File | Dead Lines | Dead % | Functions | Classes | Modules | "
             "Unreachable | Confidence |\n";
  section << "| --- | --- | --- | --- | --- | --- | --- | --- |\n";
  bool any = false;
  for (const auto &file : context.dead_code.files) {
    if (file.items.empty()) {
      continue;
    }
    any = true;
    section << "| " << EscapeMarkdownCell(file.path) << " | "
            << file.dead_lines << " | " << Percent(file.dead_percentage)
            << " | " << file.dead_functions << " | " << file.dead_classes
            << " | " << file.dead_modules << " | " << file.unreachable_blocks
            << " | " << ConfidenceName(file.confidence) << " |\n";
  }
  if (!any) {
    section << "| None | - | - | - | - | - | - | - |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildPredictedDefects(const DeepContext &context) {
  std::ostringstream section;
  section << "## Predicted Defects\n\n";
  section << "| File | Score | Risk | Factors |\n";
  section << "| --- | --- | --- | --- |\n";
  if (context.predicted_defects.empty()) {
    section << "| None | - | - | - |\n\n";
    return section.str();
  }
  for (const auto &defect : context.predicted_defects) {
    std::string factors;
    for (const auto &factor : defect.factors) {
      factors += factors.empty() ? factor : ", " + factor;
    }
    section << "| " << EscapeMarkdownCell(defect.file) << " | "
            << FormatFixed(defect.score, 2) << " | " << defect.risk << " | "
            << (factors.empty() ? "-" : factors) << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildRecommendations(const DeepContext &context) {
  std::ostringstream section;
  section << "## Recommendations\n\n";
  if (context.recommendations.empty()) {
    section << "- None\n\n";
    return section.str();
  }
  for (const auto &recommendation : context.recommendations) {
    section << recommendation.priority << ". **" << recommendation.title
            << "** `" << recommendation.file << "`: "
            << recommendation.rationale << "\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildFileSection(const DeepContextFile &file) {
  std::ostringstream section;
  section << kFileSectionPrefix << file.path << "\n\n";
  section << "- Logical lines: " << file.logical_lines << "\n";
  section << "- Structure hash: " << file.structure_hash << "\n";
  section << "- TDG: " << FormatFixed(file.tdg, 2) << "\n";
  section << "- Defect score: " << FormatFixed(file.defect_score, 2) << "\n";
  section << "- Imports: ";
  if (file.imports.empty()) {
    section << "None";
  }
  for (std::size_t i = 0; i < file.imports.size(); ++i) {
    section << (i == 0 ? "" : ", ") << "`" << file.imports[i] << "`";
  }
  section << "\n\n";
  section << "| Function | Lines | Cyclomatic | Cognitive |\n";
  section << "| --- | --- | --- | --- |\n";
  if (file.functions.empty()) {
    section << "| None | - | - | - |\n";
  }
  for (const auto &function : file.functions) {
    section << "| " << EscapeMarkdownCell(function.name) << " | "
            << function.line << "-" << function.end_line << " | "
            << function.cyclomatic << " | " << function.cognitive << " |\n";
  }
  section << "\n";
  return section.str();
}

} // namespace

const DeepContextFile *DeepContext::Find(const std::string &path) const {
  const auto found = std::lower_bound(
      files.begin(), files.end(), path,
      [](const DeepContextFile &file, const std::string &value) {
        return file.path < value;
      });
  if (found == files.end() || found->path != path) {
    return nullptr;
  }
  return &*found;
}

std::optional<AstMetadata>
DeepContext::MetadataFor(const std::string &path) const {
  const auto *file = Find(path);
  if (file == nullptr) {
    return std::nullopt;
  }
  return AstMetadata{file->functions, file->imports, file->structure_hash};
}

std::vector<std::string>
DeepContext::FilesOverComplexity(unsigned threshold) const {
  std::vector<std::string> paths;
  for (const auto *file : complexity.TopFiles(complexity.files.size())) {
    if (file->max_cyclomatic > threshold) {
      paths.push_back(file->path);
    }
  }
  return paths;
}

std::vector<std::string> ExtractImports(const SyntaxTree &tree) {
  std::vector<std::string> imports;
  WalkSyntax(tree.Root(), [&](TSNode node) {
    if (tree.language() == SyntaxLanguage::kPython &&
        NodeType(node) == "import_statement") {
      PythonImportNames(tree, node, imports);
      return false;
    }
    auto source = ImportSource(tree, node);
    if (source.empty()) {
      return true;
    }
    imports.push_back(std::move(source));
    return NodeType(node) == "call_expression";
  });
  return imports;
}

std::vector<std::string> ExtractImports(const std::string &content,
                                        Toolchain toolchain) {
  return ExtractImports(SyntaxTree(content, SyntaxLanguageFor(toolchain)));
}

std::string StructureHash(const std::vector<FunctionInfo> &functions,
                          const std::vector<std::string> &imports) {
  std::uint64_t hash = kFnvOffset;
  for (const auto &function : functions) {
    HashBytes(hash, function.name + ":" + std::to_string(function.line) + "-" +
                        std::to_string(function.end_line));
  }
  for (const auto &import : imports) {
    HashBytes(hash, import);
  }
  std::ostringstream hex;
  hex << std::hex << std::setw(16) << std::setfill('0') << hash;
  return hex.str();
}

double DefectScore(unsigned max_cyclomatic, double churn_score,
                   unsigned satd_items, double dead_percentage) {
  const double complexity =
      std::min(1.0, static_cast<double>(max_cyclomatic) / 20.0);
  const double satd = std::min(1.0, static_cast<double>(satd_items) / 5.0);
  const double dead = std::clamp(dead_percentage / 100.0, 0.0, 1.0);
  return 0.4 * complexity + 0.3 * std::clamp(churn_score, 0.0, 1.0) +
         0.2 * satd + 0.1 * dead;
}

DeepContext AssembleDeepContext(DeepContextInputs inputs,
                                const DeepContextOptions &options) {
  DeepContext context;
  context.root = inputs.sources.root.generic_string();
  context.project_name = inputs.sources.root.filename().string();
  context.toolchain = inputs.sources.toolchain;
  context.generated_at = inputs.generated_at;
  context.complexity_threshold = options.complexity_threshold;
  context.complexity = std::move(inputs.complexity);
  context.churn = std::move(inputs.churn);
  context.satd = std::move(inputs.satd);
  context.dead_code = std::move(inputs.dead_code);

  TdgOptions tdg_options;
  tdg_options.complexity_threshold = options.complexity_threshold;
  tdg_options.hotspot_limit = options.top_files;
  context.tdg = ComputeTdg(context.complexity, context.churn, context.satd,
                           SatdViolations(context.satd), tdg_options);
  std::map<std::string, double> tdg_by_file;
  for (const auto &file : context.tdg.files) {
    tdg_by_file[file.path] = file.value;
  }

  for (const auto &path : inputs.sources.files) {
    DeepContextFile file;
    file.path = path;
    if (const auto *complexity = context.complexity.Find(path)) {
      file.logical_lines = complexity->logical_lines;
      file.functions = complexity->functions;
      file.max_cyclomatic = complexity->max_cyclomatic;
      file.max_cognitive = complexity->max_cognitive;
    }
    file.imports = inputs.imports_by_file[path];
    file.structure_hash = StructureHash(file.functions, file.imports);
    file.satd_items =
        static_cast<unsigned>(context.satd.ItemsFor(path).size());
    double dead_percentage = 0.0;
    if (const auto *dead = context.dead_code.Find(path)) {
      file.dead_code_items = static_cast<unsigned>(dead->items.size());
      dead_percentage = dead->dead_percentage;
    }
    if (const auto *churn = context.churn.Find(path)) {
      file.churn_score = churn->churn_score;
      file.commit_count = churn->commit_count;
    }
    file.tdg = tdg_by_file[path];
    file.defect_score = DefectScore(file.max_cyclomatic, file.churn_score,
                                    file.satd_items, dead_percentage);
    context.files.push_back(std::move(file));
  }
  std::sort(context.files.begin(), context.files.end(),
            [](const DeepContextFile &left, const DeepContextFile &right) {
              return left.path < right.path;
            });

  context.scorecard = BuildScorecard(context);
  context.predicted_defects = PredictDefects(context, options.top_files);
  context.recommendations = Recommend(context, options.max_recommendations);
  return context;
}

DeepContextBuilder::DeepContextBuilder(std::shared_ptr<ProcessRunner> runner,
                                       DeepContextOptions options,
                                       std::shared_ptr<Logger> logger)
    : runner_(std::move(runner)), options_(std::move(options)),
      logger_(EnsureLogger(std::move(logger))) {}

DeepContext DeepContextBuilder::Build(const SourceSet &sources,
                                      const ExecutionContext &context) const {
  const auto start = std::chrono::steady_clock::now();
  DeepContextInputs inputs;
  inputs.sources = sources;
  inputs.generated_at = std::chrono::system_clock::now();

  ComplexityOptions complexity_options;
  complexity_options.threshold = options_.complexity_threshold;
  complexity_options.parallelism = options_.parallelism;
  inputs.complexity =
      ComplexityAnalyzer(complexity_options, logger_).Analyze(sources);

  SatdOptions satd_options;
  satd_options.parallelism = options_.parallelism;
  inputs.satd = SatdAnalyzer(satd_options, logger_).Analyze(sources);

  DeadCodeOptions dead_code_options;
  dead_code_options.parallelism = options_.parallelism;
  inputs.dead_code =
      DeadCodeAnalyzer(dead_code_options, logger_).Analyze(sources);

  inputs.churn =
      ChurnAnalyzer(runner_, options_.churn, logger_).Analyze(sources, context);

  for (const auto &file : sources.files) {
    try {
      inputs.imports_by_file[file] =
          ExtractImports(SyntaxTree(ReadFile(sources.root / file),
                                    SyntaxLanguageFor(file, sources.toolchain)));
    } catch (const std::runtime_error &error) {
      logger_->Log(LogLevel::kWarn, "deep_context.file.skipped",
                   {{"file", file}, {"error", error.what()}});
    }
  }

  auto deep_context = AssembleDeepContext(std::move(inputs), options_);
  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start)
          .count();
  logger_->Log(LogLevel::kInfo, "deep_context.complete",
               {{"files", std::to_string(deep_context.files.size())},
                {"recommendations",
                 std::to_string(deep_context.recommendations.size())},
                {"duration_ms", std::to_string(duration_ms)}});
  return deep_context;
}

std::string RenderDeepContextMarkdown(const DeepContext &context,
                                      std::size_t top_files) {
  std::ostringstream output;
  output << "# Deep Context: " << context.project_name << "\n\n";
  output << "Generated: " << FormatIsoTimestamp(context.generated_at) << "\n\n";
  output << BuildExecutiveSummary(context);
  output << BuildScorecardMarkdown(context.scorecard);
  output << BuildProjectTree(context);
  output << BuildComplexityHotspots(context, top_files);
  output << BuildChurnMarkdown(context, top_files);
  output << BuildSatdMarkdown(context);
  output << BuildDeadCodeMarkdown(context);
  output << BuildPredictedDefects(context);
  output << BuildRecommendations(context);
  for (const auto &file : context.files) {
    output << BuildFileSection(file);
  }
  return output.str();
}

std::string ExtractFileContext(const std::string &markdown,
                               const std::string &file) {
  const auto lines = SplitLines(markdown);
  const auto collect = [&](const std::string &needle) {
    std::string extracted;
    bool capturing = false;
    for (const auto &line : lines) {
      if (StartsWith(line, "## ")) {
        capturing = Contains(line, needle);
      }
      if (capturing) {
        extracted += line + "\n";
      }
    }
    return extracted;
  };

  auto extracted = collect(file);
  if (extracted.empty()) {
    const auto name = std::filesystem::path(file).filename().string();
    if (!name.empty() && name != file) {
      extracted = collect(name);
    }
  }
  return extracted;
}

} // namespace qgate
