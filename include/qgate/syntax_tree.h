#pragma once

#include <qgate/source_discovery.h>

#include <tree_sitter/api.h>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace qgate {

enum class SyntaxLanguage { kRust, kTypeScript, kTsx, kPython, kGo };

SyntaxLanguage SyntaxLanguageFor(Toolchain toolchain);
// `.tsx` and `.jsx` sources need the TSX grammar; everything else follows
// the extension's toolchain, or `fallback` when the extension is unknown.
SyntaxLanguage SyntaxLanguageFor(const std::string &path, Toolchain fallback);

// Owns the parsed tree and the source text its nodes point into.
class SyntaxTree {
public:
  SyntaxTree(std::string content, SyntaxLanguage language);
  ~SyntaxTree();

  SyntaxTree(SyntaxTree &&other) noexcept;
  SyntaxTree &operator=(SyntaxTree &&other) noexcept;
  SyntaxTree(const SyntaxTree &) = delete;
  SyntaxTree &operator=(const SyntaxTree &) = delete;

  TSNode Root() const;
  SyntaxLanguage language() const { return language_; }
  const std::string &content() const { return content_; }
  std::string Text(TSNode node) const;

private:
  std::string content_;
  SyntaxLanguage language_;
  TSTree *tree_ = nullptr;
};

std::string_view NodeType(TSNode node);
// 1-based, inclusive.
unsigned StartLine(TSNode node);
unsigned EndLine(TSNode node);
// Null node when the field is absent.
TSNode FieldChild(TSNode node, std::string_view field);
// Named children in source order, comments excluded.
std::vector<TSNode> NamedChildren(TSNode node);
// Pre-order over named nodes. Returning false from `visit` skips the
// node's children.
void WalkSyntax(TSNode node, const std::function<bool(TSNode)> &visit);

// Text of a string literal node without its quotes.
std::string StringLiteralValue(const SyntaxTree &tree, TSNode node);

struct SyntaxDefinition {
  std::string name;
  // For functions, the node holding parameters and body (the arrow function
  // itself for `const f = () => ...`).
  TSNode node{};
  unsigned line = 0;
  unsigned end_line = 0;
  bool is_public = false;
  bool default_export = false;
  // Trait impl methods and items inside `#[cfg(test)]` modules are reached
  // without being named.
  bool reached_implicitly = false;
  // Attributes and decorators attached to the definition, as written.
  std::vector<std::string> annotations;
};

// Named functions with a body, in source order; nested functions are
// reported on their own.
std::vector<SyntaxDefinition> FindFunctions(const SyntaxTree &tree);
bool IsFunctionNode(const SyntaxTree &tree, TSNode node);

// struct/enum/trait/union, class/interface/enum, class, and Go struct or
// interface types.
std::vector<SyntaxDefinition> FindTypeDefinitions(const SyntaxTree &tree);

} // namespace qgate
