#include <qgate/syntax_tree.h>

#include <gtest/gtest.h>

namespace qgate {
namespace {

TEST(SyntaxTreeTest, PicksTheGrammarFromTheExtension) {
  EXPECT_EQ(SyntaxLanguageFor("web/app.tsx", Toolchain::kDeno),
            SyntaxLanguage::kTsx);
  EXPECT_EQ(SyntaxLanguageFor("src/lib.rs", Toolchain::kDeno),
            SyntaxLanguage::kRust);
  EXPECT_EQ(SyntaxLanguageFor("README", Toolchain::kGo), SyntaxLanguage::kGo);
}

TEST(SyntaxTreeTest, FindsRustFunctionsWithAttributesAndTraitImpls) {
  const SyntaxTree tree("#[test]\n"
                        "fn checks() {}\n"
                        "\n"
                        "impl Display for Point {\n"
                        "    fn fmt(&self) {}\n"
                        "}\n"
                        "\n"
                        "pub(crate) fn visible() {}\n",
                        SyntaxLanguage::kRust);

  const auto functions = FindFunctions(tree);

  ASSERT_EQ(functions.size(), 3u);
  EXPECT_EQ(functions[0].name, "checks");
  EXPECT_EQ(functions[0].line, 2u);
  EXPECT_EQ(functions[0].annotations, (std::vector<std::string>{"#[test]"}));
  EXPECT_EQ(functions[1].name, "fmt");
  EXPECT_TRUE(functions[1].reached_implicitly);
  EXPECT_EQ(functions[2].name, "visible");
  EXPECT_TRUE(functions[2].is_public);
  EXPECT_FALSE(functions[2].reached_implicitly);
}

TEST(SyntaxTreeTest, FindsTypeScriptDeclarationsAndArrowFunctions) {
  const SyntaxTree tree("export default function main() {}\n"
                        "const helper = (x: number) => x + 1;\n"
                        "export class Store {\n"
                        "  private load() {}\n"
                        "}\n",
                        SyntaxLanguage::kTypeScript);

  const auto functions = FindFunctions(tree);

  ASSERT_EQ(functions.size(), 3u);
  EXPECT_EQ(functions[0].name, "main");
  EXPECT_TRUE(functions[0].default_export);
  EXPECT_EQ(functions[1].name, "helper");
  EXPECT_FALSE(functions[1].is_public);
  EXPECT_EQ(functions[2].name, "load");
  EXPECT_FALSE(functions[2].is_public);

  const auto types = FindTypeDefinitions(tree);
  ASSERT_EQ(types.size(), 1u);
  EXPECT_EQ(types[0].name, "Store");
  EXPECT_TRUE(types[0].is_public);
  EXPECT_EQ(types[0].line, 3u);
  EXPECT_EQ(types[0].end_line, 5u);
}

TEST(SyntaxTreeTest, FindsPythonDecoratorsAndGoTypes) {
  const SyntaxTree python("@app.route('/')\n"
                          "def index():\n"
                          "    return 'ok'\n",
                          SyntaxLanguage::kPython);
  const auto functions = FindFunctions(python);
  ASSERT_EQ(functions.size(), 1u);
  EXPECT_EQ(functions[0].annotations,
            (std::vector<std::string>{"@app.route('/')"}));

  const SyntaxTree go("package main\n"
                      "type server struct{}\n"
                      "type Handler interface{ Serve() }\n"
                      "type ID int\n",
                      SyntaxLanguage::kGo);
  const auto types = FindTypeDefinitions(go);
  ASSERT_EQ(types.size(), 2u);
  EXPECT_EQ(types[0].name, "server");
  EXPECT_FALSE(types[0].is_public);
  EXPECT_EQ(types[1].name, "Handler");
  EXPECT_TRUE(types[1].is_public);
}

TEST(SyntaxTreeTest, StringLiteralValueDropsQuotes) {
  const SyntaxTree tree("import x from \"./x.ts\";\n",
                        SyntaxLanguage::kTypeScript);
  const auto statement = NamedChildren(tree.Root()).front();

  EXPECT_EQ(StringLiteralValue(tree, FieldChild(statement, "source")),
            "./x.ts");
}

} // namespace
} // namespace qgate
