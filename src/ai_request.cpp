#include <qgate/ai_request.h>

#include <qgate/json_codec.h>
#include <qgate/strings.h>

#include <filesystem>
#include <ostream>

namespace qgate {

const std::vector<std::string> &RewriteInstructions() {
  static const std::vector<std::string> instructions = {
      "Apply RIGID EXTREME quality standards:",
      "1. Functions with complexity > 10 MUST be refactored (target: 5)",
      "2. Coverage MUST be >=80% with meaningful tests, not placeholders",
      "3. TDG (Technical Debt Gradient) MUST be < 1.0",
      "4. ZERO duplicate code, ZERO SATD comments allowed",
      "5. All algorithms MUST be O(n) or better",
      "6. Achieve >=90% provability score",
      "7. Fix ALL lint violations (pedantic, nursery, restriction)",
      "8. Every public item needs comprehensive documentation",
      "Ensure the fixed code compiles, passes all tests, and meets ALL "
      "metrics"};
  return instructions;
}

std::string TestFilePathFor(const std::string &file) {
  const std::filesystem::path path(file);
  const auto name =
      path.stem().string() + "_test" + path.extension().string();
  if (StartsWith(file, "src/") || Contains(file, "/src/")) {
    return (path.parent_path() / name).generic_string();
  }
  return (std::filesystem::path("tests") / name).generic_string();
}

nlohmann::json BuildAiRewriteRequest(const RefactorPlan &plan,
                                     const AiRequestContext &context) {
  const auto &file = plan.rewrite.file_path;
  nlohmann::json violations = nlohmann::json::array();
  for (const auto &violation : plan.violations) {
    nlohmann::json entry;
    entry["line"] = violation.line;
    entry["column"] = violation.column;
    entry["lint"] = violation.lint_name;
    entry["message"] = violation.message;
    entry["severity"] = SeverityName(violation.severity);
    entry["suggestion"] = violation.suggestion
                              ? nlohmann::json(*violation.suggestion)
                              : nlohmann::json(nullptr);
    violations.push_back(std::move(entry));
  }

  nlohmann::json request;
  request["task"] = "unified_rewrite";
  request["file"] = file;
  request["current_content"] = plan.current_content;
  request["context"] = context.file_context;
  request["violations"] = std::move(violations);
  request["coverage"] = {{"current", plan.current_coverage},
                         {"target", context.target_coverage},
                         {"needs_tests", plan.needs_tests}};
  request["instructions"] = RewriteInstructions();
  request["ast_metadata"] = plan.rewrite.ast_metadata.functions;
  request["output_files"] = nlohmann::json::array(
      {{{"path", file},
        {"description", "Fixed source file with all violations resolved"}},
       {{"path", TestFilePathFor(file)},
        {"description", "Test file with comprehensive tests if needed"}}});
  if (context.issue_context) {
    request["issue_context"] = *context.issue_context;
  }
  if (context.bug_report_context) {
    request["bug_report_context"] = *context.bug_report_context;
  }
  return request;
}

void EmitAiRewriteRequest(const nlohmann::json &request, std::ostream &out) {
  out << kAiRequestStart << '\n' << request.dump(2) << '\n'
      << kAiRequestEnd << '\n';
  out.flush();
}

std::optional<nlohmann::json> ParseAiRewriteRequest(const std::string &transcript) {
  const std::string start = kAiRequestStart;
  const auto begin = transcript.find(start);
  if (begin == std::string::npos) {
    return std::nullopt;
  }
  const auto end = transcript.find(kAiRequestEnd, begin + start.size());
  if (end == std::string::npos) {
    return std::nullopt;
  }
  const auto body =
      transcript.substr(begin + start.size(), end - begin - start.size());
  auto parsed = nlohmann::json::parse(body, nullptr, false);
  if (parsed.is_discarded()) {
    return std::nullopt;
  }
  return parsed;
}

} // namespace qgate
