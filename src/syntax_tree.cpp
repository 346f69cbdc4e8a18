#include <qgate/syntax_tree.h>

#include <qgate/strings.h>

#include <cctype>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <utility>

extern "C" {
const TSLanguage *tree_sitter_rust();
const TSLanguage *tree_sitter_typescript();
const TSLanguage *tree_sitter_tsx();
const TSLanguage *tree_sitter_python();
const TSLanguage *tree_sitter_go();
}

namespace qgate {
namespace {

const TSLanguage *GrammarFor(SyntaxLanguage language) {
  switch (language) {
  case SyntaxLanguage::kRust:
    return tree_sitter_rust();
  case SyntaxLanguage::kTypeScript:
    return tree_sitter_typescript();
  case SyntaxLanguage::kTsx:
    return tree_sitter_tsx();
  case SyntaxLanguage::kPython:
    return tree_sitter_python();
  case SyntaxLanguage::kGo:
    return tree_sitter_go();
  }
  return tree_sitter_rust();
}

bool HasChildOfType(TSNode node, std::string_view type) {
  const auto count = ts_node_child_count(node);
  for (std::uint32_t i = 0; i < count; ++i) {
    if (NodeType(ts_node_child(node, i)) == type) {
      return true;
    }
  }
  return false;
}

bool StartsUpperCase(const std::string &name) {
  return !name.empty() &&
         std::isupper(static_cast<unsigned char>(name.front())) != 0;
}

// Rust attributes are siblings in front of the item they annotate.
std::vector<std::string> PrecedingSiblings(const SyntaxTree &tree, TSNode node,
                                           std::string_view type) {
  std::vector<std::string> texts;
  for (auto sibling = ts_node_prev_named_sibling(node); !ts_node_is_null(sibling);
       sibling = ts_node_prev_named_sibling(sibling)) {
    if (ts_node_is_extra(sibling)) {
      continue;
    }
    if (NodeType(sibling) != type) {
      break;
    }
    texts.insert(texts.begin(), tree.Text(sibling));
  }
  return texts;
}

std::vector<std::string> ChildrenOfType(const SyntaxTree &tree, TSNode node,
                                        std::string_view type) {
  std::vector<std::string> texts;
  for (const auto child : NamedChildren(node)) {
    if (NodeType(child) == type) {
      texts.push_back(tree.Text(child));
    }
  }
  return texts;
}

std::vector<std::string> Annotations(const SyntaxTree &tree, TSNode node) {
  switch (tree.language()) {
  case SyntaxLanguage::kRust:
    return PrecedingSiblings(tree, node, "attribute_item");
  case SyntaxLanguage::kPython: {
    const auto parent = ts_node_parent(node);
    if (!ts_node_is_null(parent) && NodeType(parent) == "decorated_definition") {
      return ChildrenOfType(tree, parent, "decorator");
    }
    return {};
  }
  case SyntaxLanguage::kTypeScript:
  case SyntaxLanguage::kTsx: {
    auto annotations = PrecedingSiblings(tree, node, "decorator");
    for (auto &decorator : ChildrenOfType(tree, node, "decorator")) {
      annotations.push_back(std::move(decorator));
    }
    return annotations;
  }
  case SyntaxLanguage::kGo:
    return {};
  }
  return {};
}

bool RustReachedImplicitly(const SyntaxTree &tree, TSNode node) {
  for (auto ancestor = ts_node_parent(node); !ts_node_is_null(ancestor);
       ancestor = ts_node_parent(ancestor)) {
    const auto type = NodeType(ancestor);
    if (type == "impl_item" && !ts_node_is_null(FieldChild(ancestor, "trait"))) {
      return true;
    }
    if (type == "mod_item") {
      for (const auto &attribute :
           PrecedingSiblings(tree, ancestor, "attribute_item")) {
        if (Contains(attribute, "cfg(test)")) {
          return true;
        }
      }
    }
  }
  return false;
}

// `export` on the declaration itself or on the statement declaring it.
TSNode ExportStatementOf(TSNode node) {
  auto parent = ts_node_parent(node);
  if (!ts_node_is_null(parent) && (NodeType(parent) == "lexical_declaration" ||
                                   NodeType(parent) == "variable_declaration")) {
    parent = ts_node_parent(parent);
  }
  if (!ts_node_is_null(parent) && NodeType(parent) == "export_statement") {
    return parent;
  }
  return TSNode{};
}

void MarkExport(SyntaxDefinition &definition, TSNode node) {
  const auto statement = ExportStatementOf(node);
  if (ts_node_is_null(statement)) {
    return;
  }
  definition.is_public = true;
  definition.default_export = HasChildOfType(statement, "default");
}

SyntaxDefinition Define(const SyntaxTree &tree, TSNode node, TSNode name,
                        TSNode span) {
  SyntaxDefinition definition;
  definition.name = tree.Text(name);
  definition.node = node;
  definition.line = StartLine(span);
  definition.end_line = EndLine(span);
  definition.annotations = Annotations(tree, span);
  return definition;
}

std::optional<SyntaxDefinition> AsFunction(const SyntaxTree &tree, TSNode node) {
  const auto type = NodeType(node);
  switch (tree.language()) {
  case SyntaxLanguage::kRust: {
    if (type != "function_item" || ts_node_is_null(FieldChild(node, "body"))) {
      return std::nullopt;
    }
    auto definition = Define(tree, node, FieldChild(node, "name"), node);
    definition.is_public = HasChildOfType(node, "visibility_modifier");
    definition.reached_implicitly = RustReachedImplicitly(tree, node);
    return definition;
  }
  case SyntaxLanguage::kTypeScript:
  case SyntaxLanguage::kTsx: {
    if (type == "function_declaration" ||
        type == "generator_function_declaration") {
      auto definition = Define(tree, node, FieldChild(node, "name"), node);
      MarkExport(definition, node);
      return definition;
    }
    if (type == "method_definition") {
      auto definition = Define(tree, node, FieldChild(node, "name"), node);
      definition.is_public = !StartsWith(definition.name, "#");
      for (const auto child : NamedChildren(node)) {
        if (NodeType(child) == "accessibility_modifier" &&
            tree.Text(child) == "private") {
          definition.is_public = false;
        }
      }
      return definition;
    }
    if (IsFunctionNode(tree, node)) {
      const auto declarator = ts_node_parent(node);
      auto definition =
          Define(tree, node, FieldChild(declarator, "name"), declarator);
      MarkExport(definition, declarator);
      return definition;
    }
    return std::nullopt;
  }
  case SyntaxLanguage::kPython: {
    if (type != "function_definition") {
      return std::nullopt;
    }
    auto definition = Define(tree, node, FieldChild(node, "name"), node);
    definition.is_public = !StartsWith(definition.name, "_");
    return definition;
  }
  case SyntaxLanguage::kGo: {
    if ((type != "function_declaration" && type != "method_declaration") ||
        ts_node_is_null(FieldChild(node, "body"))) {
      return std::nullopt;
    }
    auto definition = Define(tree, node, FieldChild(node, "name"), node);
    definition.is_public = StartsUpperCase(definition.name);
    return definition;
  }
  }
  return std::nullopt;
}

std::optional<SyntaxDefinition> AsType(const SyntaxTree &tree, TSNode node) {
  const auto type = NodeType(node);
  switch (tree.language()) {
  case SyntaxLanguage::kRust: {
    if (type != "struct_item" && type != "enum_item" && type != "trait_item" &&
        type != "union_item") {
      return std::nullopt;
    }
    auto definition = Define(tree, node, FieldChild(node, "name"), node);
    definition.is_public = HasChildOfType(node, "visibility_modifier");
    return definition;
  }
  case SyntaxLanguage::kTypeScript:
  case SyntaxLanguage::kTsx: {
    if (type != "class_declaration" && type != "abstract_class_declaration" &&
        type != "interface_declaration" && type != "enum_declaration") {
      return std::nullopt;
    }
    auto definition = Define(tree, node, FieldChild(node, "name"), node);
    MarkExport(definition, node);
    return definition;
  }
  case SyntaxLanguage::kPython: {
    if (type != "class_definition") {
      return std::nullopt;
    }
    auto definition = Define(tree, node, FieldChild(node, "name"), node);
    definition.is_public = !StartsWith(definition.name, "_");
    return definition;
  }
  case SyntaxLanguage::kGo: {
    if (type != "type_spec") {
      return std::nullopt;
    }
    const auto kind = NodeType(FieldChild(node, "type"));
    if (kind != "struct_type" && kind != "interface_type") {
      return std::nullopt;
    }
    auto definition = Define(tree, node, FieldChild(node, "name"), node);
    definition.is_public = StartsUpperCase(definition.name);
    return definition;
  }
  }
  return std::nullopt;
}

} // namespace

SyntaxLanguage SyntaxLanguageFor(Toolchain toolchain) {
  switch (toolchain) {
  case Toolchain::kRust:
    return SyntaxLanguage::kRust;
  case Toolchain::kDeno:
    return SyntaxLanguage::kTypeScript;
  case Toolchain::kPythonUv:
    return SyntaxLanguage::kPython;
  case Toolchain::kGo:
    return SyntaxLanguage::kGo;
  }
  return SyntaxLanguage::kRust;
}

SyntaxLanguage SyntaxLanguageFor(const std::string &path, Toolchain fallback) {
  if (EndsWith(path, ".tsx") || EndsWith(path, ".jsx")) {
    return SyntaxLanguage::kTsx;
  }
  return SyntaxLanguageFor(ToolchainForPath(path).value_or(fallback));
}

SyntaxTree::SyntaxTree(std::string content, SyntaxLanguage language)
    : content_(std::move(content)), language_(language) {
  TSParser *parser = ts_parser_new();
  if (!ts_parser_set_language(parser, GrammarFor(language))) {
    ts_parser_delete(parser);
    throw std::runtime_error("tree-sitter grammar version is incompatible");
  }
  tree_ = ts_parser_parse_string(parser, nullptr, content_.c_str(),
                                 static_cast<std::uint32_t>(content_.size()));
  ts_parser_delete(parser);
  if (tree_ == nullptr) {
    throw std::runtime_error("tree-sitter failed to parse source");
  }
}

SyntaxTree::~SyntaxTree() {
  if (tree_ != nullptr) {
    ts_tree_delete(tree_);
  }
}

SyntaxTree::SyntaxTree(SyntaxTree &&other) noexcept
    : content_(std::move(other.content_)), language_(other.language_),
      tree_(std::exchange(other.tree_, nullptr)) {}

SyntaxTree &SyntaxTree::operator=(SyntaxTree &&other) noexcept {
  if (this != &other) {
    if (tree_ != nullptr) {
      ts_tree_delete(tree_);
    }
    content_ = std::move(other.content_);
    language_ = other.language_;
    tree_ = std::exchange(other.tree_, nullptr);
  }
  return *this;
}

TSNode SyntaxTree::Root() const { return ts_tree_root_node(tree_); }

std::string SyntaxTree::Text(TSNode node) const {
  if (ts_node_is_null(node)) {
    return {};
  }
  const auto start = ts_node_start_byte(node);
  const auto end = ts_node_end_byte(node);
  return content_.substr(start, end - start);
}

std::string_view NodeType(TSNode node) {
  if (ts_node_is_null(node)) {
    return {};
  }
  return ts_node_type(node);
}

unsigned StartLine(TSNode node) { return ts_node_start_point(node).row + 1; }

unsigned EndLine(TSNode node) {
  const auto start = ts_node_start_point(node);
  const auto end = ts_node_end_point(node);
  // A node that swallowed the trailing newline ends on the line before.
  if (end.column == 0 && end.row > start.row) {
    return end.row;
  }
  return end.row + 1;
}

TSNode FieldChild(TSNode node, std::string_view field) {
  return ts_node_child_by_field_name(node, field.data(),
                                     static_cast<std::uint32_t>(field.size()));
}

std::vector<TSNode> NamedChildren(TSNode node) {
  std::vector<TSNode> children;
  const auto count = ts_node_named_child_count(node);
  for (std::uint32_t i = 0; i < count; ++i) {
    const auto child = ts_node_named_child(node, i);
    if (!ts_node_is_extra(child)) {
      children.push_back(child);
    }
  }
  return children;
}

void WalkSyntax(TSNode node, const std::function<bool(TSNode)> &visit) {
  if (!visit(node)) {
    return;
  }
  for (const auto child : NamedChildren(node)) {
    WalkSyntax(child, visit);
  }
}

std::string StringLiteralValue(const SyntaxTree &tree, TSNode node) {
  auto text = tree.Text(node);
  if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'' ||
                           text.front() == '`') &&
      text.back() == text.front()) {
    return text.substr(1, text.size() - 2);
  }
  return text;
}

bool IsFunctionNode(const SyntaxTree &tree, TSNode node) {
  const auto type = NodeType(node);
  switch (tree.language()) {
  case SyntaxLanguage::kRust:
    return type == "function_item";
  case SyntaxLanguage::kTypeScript:
  case SyntaxLanguage::kTsx: {
    if (type == "function_declaration" ||
        type == "generator_function_declaration" ||
        type == "method_definition") {
      return true;
    }
    if (type != "arrow_function" && type != "function_expression" &&
        type != "function" && type != "generator_function") {
      return false;
    }
    const auto parent = ts_node_parent(node);
    return !ts_node_is_null(parent) &&
           NodeType(parent) == "variable_declarator" &&
           ts_node_eq(FieldChild(parent, "value"), node);
  }
  case SyntaxLanguage::kPython:
    return type == "function_definition";
  case SyntaxLanguage::kGo:
    return type == "function_declaration" || type == "method_declaration";
  }
  return false;
}

std::vector<SyntaxDefinition> FindFunctions(const SyntaxTree &tree) {
  std::vector<SyntaxDefinition> functions;
  WalkSyntax(tree.Root(), [&](TSNode node) {
    if (auto function = AsFunction(tree, node)) {
      functions.push_back(std::move(*function));
    }
    return true;
  });
  return functions;
}

std::vector<SyntaxDefinition> FindTypeDefinitions(const SyntaxTree &tree) {
  std::vector<SyntaxDefinition> types;
  WalkSyntax(tree.Root(), [&](TSNode node) {
    if (auto type = AsType(tree, node)) {
      types.push_back(std::move(*type));
    }
    return true;
  });
  return types;
}

} // namespace qgate
