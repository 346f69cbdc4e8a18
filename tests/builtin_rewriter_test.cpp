#include <qgate/builtin_rewriter.h>

#include "test_support/scripted_process_runner.h"
#include "test_support/temporary_project.h"

#include <gtest/gtest.h>

namespace qgate {
namespace {

constexpr char kOriginalParser[] = R"(use crate::ast::Ast;

pub fn parse(input: &str) -> Ast {
    if input.is_empty() { return Ast::empty(); }
    Ast::new(input)
}

fn helper() {}
)";

constexpr char kRewrittenParse[] = R"(pub fn parse(input: &str) -> Ast {
    Ast::from(input)
}
)";

constexpr char kTemplates[] = R"(- file: src/parser.rs
  signature: "pub fn parse(input: &str) -> Ast"
  function: parse
  replacement: rewrites/parse.rs
)";

RefactorPlan PlanFor(const std::string &file, const std::string &content) {
  RefactorPlan plan;
  plan.rewrite.file_path = file;
  plan.current_content = content;
  return plan;
}

TEST(RewriteTemplateTest, LoadsMappings) {
  test::TemporaryProject project;
  const auto path = project.AddFile("rewrites.yaml", kTemplates);

  const auto templates = LoadRewriteTemplates(path);

  ASSERT_EQ(templates.size(), 1u);
  EXPECT_EQ(templates[0].file_suffix, "src/parser.rs");
  EXPECT_EQ(templates[0].function_signature, "pub fn parse(input: &str) -> Ast");
  EXPECT_EQ(templates[0].function_name, "parse");
  EXPECT_EQ(templates[0].replacement.generic_string(), "rewrites/parse.rs");
}

TEST(RewriteTemplateTest, RejectsMalformedFiles) {
  test::TemporaryProject project;
  const auto mapping = project.AddFile("map.yaml", "file: src/parser.rs\n");
  const auto incomplete =
      project.AddFile("incomplete.yaml", "- file: src/parser.rs\n");

  EXPECT_THROW(LoadRewriteTemplates(mapping), std::invalid_argument);
  EXPECT_THROW(LoadRewriteTemplates(incomplete), std::invalid_argument);
  EXPECT_THROW(LoadRewriteTemplates(project.root() / "absent.yaml"),
               std::invalid_argument);
}

TEST(FunctionTextTest, ExtractsBraceBalancedFunction) {
  const auto function = ExtractFunctionText(kOriginalParser, "parse");

  ASSERT_TRUE(function.has_value());
  EXPECT_EQ(*function, "pub fn parse(input: &str) -> Ast {\n"
                       "    if input.is_empty() { return Ast::empty(); }\n"
                       "    Ast::new(input)\n"
                       "}");
  EXPECT_FALSE(ExtractFunctionText(kOriginalParser, "missing").has_value());
}

TEST(FunctionTextTest, ReplacesOnlyTheMatchedFunction) {
  const auto replaced = ReplaceFunction(
      kOriginalParser, "pub fn parse(input: &str) -> Ast", "pub fn parse() {}");

  ASSERT_TRUE(replaced.has_value());
  EXPECT_EQ(*replaced,
            "use crate::ast::Ast;\n\npub fn parse() {}\n\nfn helper() {}\n");
  EXPECT_FALSE(ReplaceFunction(kOriginalParser, "fn absent()", "").has_value());
}

TEST(BuiltinRewriterTest, AppliesMatchingTemplate) {
  test::TemporaryProject project;
  project.AddFile("src/parser.rs", kOriginalParser);
  project.AddFile("rewrites/parse.rs", kRewrittenParse);
  const auto templates =
      LoadRewriteTemplates(project.AddFile("rewrites.yaml", kTemplates));
  SourceSet sources;
  sources.root = project.root();

  const BuiltinRewriter rewriter(std::make_shared<test::ScriptedProcessRunner>(),
                                 templates);
  const auto outcome = rewriter.Apply(
      PlanFor("src/parser.rs", kOriginalParser), sources, {});

  EXPECT_TRUE(outcome.applied);
  EXPECT_EQ(outcome.actions, (std::vector<std::string>{"template:parse"}));
  const auto content = project.ReadFile("src/parser.rs");
  EXPECT_NE(content.find("Ast::from(input)"), std::string::npos);
  EXPECT_EQ(content.find("Ast::empty()"), std::string::npos);
  EXPECT_NE(content.find("fn helper() {}"), std::string::npos);
}

TEST(BuiltinRewriterTest, MissingReplacementLeavesFileUntouched) {
  test::TemporaryProject project;
  project.AddFile("src/parser.rs", kOriginalParser);
  const auto templates =
      LoadRewriteTemplates(project.AddFile("rewrites.yaml", kTemplates));
  SourceSet sources;
  sources.root = project.root();

  const auto outcome = BuiltinRewriter(nullptr, templates)
                           .Apply(PlanFor("src/parser.rs", kOriginalParser),
                                  sources, {});

  EXPECT_FALSE(outcome.applied);
  EXPECT_TRUE(outcome.actions.empty());
  EXPECT_EQ(project.ReadFile("src/parser.rs"), kOriginalParser);
}

TEST(BuiltinRewriterTest, RemovesSatdWhenPlanned) {
  test::TemporaryProject project;
  const std::string original = "// TODO: drop\nfn a() {}\n";
  project.AddFile("src/lib.rs", original);
  SourceSet sources;
  sources.root = project.root();
  auto plan = PlanFor("src/lib.rs", original);
  ViolationDetail satd;
  satd.lint_name = "satd_item";
  plan.violations.push_back(satd);

  const auto outcome = BuiltinRewriter(nullptr).Apply(plan, sources, {});

  EXPECT_TRUE(outcome.applied);
  EXPECT_EQ(outcome.actions, (std::vector<std::string>{"satd_removal"}));
  EXPECT_EQ(project.ReadFile("src/lib.rs"), "fn a() {}\n");
}

TEST(BuiltinRewriterTest, RunsFixerForMachineApplicableLints) {
  test::TemporaryProject project;
  project.AddFile("src/lib.rs", "fn a() {}\n");
  SourceSet sources;
  sources.root = project.root();
  auto plan = PlanFor("src/lib.rs", "fn a() {}\n");
  ViolationDetail lint;
  lint.lint_name = "clippy::needless_return";
  lint.machine_applicable = true;
  plan.violations.push_back(lint);

  auto runner = std::make_shared<test::ScriptedProcessRunner>();
  runner->On("cargo", {"clippy", "--fix"}, test::ScriptedProcessRunner::Success());
  const auto outcome = BuiltinRewriter(runner).Apply(plan, sources, {});

  EXPECT_TRUE(outcome.applied);
  EXPECT_EQ(outcome.actions, (std::vector<std::string>{"lint_fix"}));
  EXPECT_TRUE(runner->WasCalled("cargo", "--allow-dirty"));
}

TEST(BuiltinRewriterTest, FixerEditsOutsideTheTargetFileAreRolledBack) {
  test::TemporaryProject project;
  project.AddFile("src/lib.rs", "fn a() { return; }\n");
  project.AddFile("src/other.rs", "fn b() { return; }\n");
  SourceSet sources;
  sources.root = project.root();
  sources.files = {"src/lib.rs", "src/other.rs"};
  auto plan = PlanFor("src/lib.rs", "fn a() { return; }\n");
  ViolationDetail lint;
  lint.lint_name = "clippy::needless_return";
  lint.machine_applicable = true;
  plan.violations.push_back(lint);

  auto runner = std::make_shared<test::ScriptedProcessRunner>();
  runner->OnCall("cargo", {"clippy", "--fix"},
                 [&project](const ProcessRequest &) {
                   project.AddFile("src/lib.rs", "fn a() {}\n");
                   project.AddFile("src/other.rs", "fn b() {}\n");
                   return test::ScriptedProcessRunner::Success();
                 });
  const auto outcome = BuiltinRewriter(runner).Apply(plan, sources, {});

  EXPECT_TRUE(outcome.applied);
  EXPECT_EQ(project.ReadFile("src/lib.rs"), "fn a() {}\n");
  EXPECT_EQ(project.ReadFile("src/other.rs"), "fn b() { return; }\n");
}

TEST(BuiltinRewriterTest, FailedFixerIsNotAnApplication) {
  test::TemporaryProject project;
  SourceSet sources;
  sources.root = project.root();
  auto plan = PlanFor("src/lib.rs", "fn a() {}\n");
  ViolationDetail lint;
  lint.machine_applicable = true;
  plan.violations.push_back(lint);

  auto runner = std::make_shared<test::ScriptedProcessRunner>();
  runner->On("cargo", {"clippy"}, test::ScriptedProcessRunner::Failure(101));

  const auto outcome = BuiltinRewriter(runner).Apply(plan, sources, {});

  EXPECT_FALSE(outcome.applied);
  EXPECT_TRUE(outcome.actions.empty());
}

} // namespace
} // namespace qgate
