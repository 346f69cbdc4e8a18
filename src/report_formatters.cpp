#include <qgate/report_formatters.h>

#include <qgate/escaping.h>
#include <qgate/strings.h>

#include <algorithm>
#include <set>
#include <sstream>
#include <stdexcept>

namespace qgate {
namespace {

constexpr char kSarifSchema[] =
    "https://json.schemastore.org/sarif-2.1.0.json";
constexpr char kToolName[] = "qgate";

std::string BuildSummaryLines(const AnalysisDocument &document) {
  std::ostringstream output;
  output << document.title << " (" << document.analysis << ")\n";
  for (const auto &[label, value] : document.summary) {
    output << "  " << label << ": " << value << "\n";
  }
  output << "  Findings: " << document.findings.size() << "\n";
  return output.str();
}

std::string FindingLocation(const Finding &finding) {
  if (finding.file.empty()) {
    return "-";
  }
  return finding.file + ":" + std::to_string(finding.line);
}

} // namespace

std::string SummaryFormatter::Render(const AnalysisDocument &document) const {
  return BuildSummaryLines(document);
}

std::string FullFormatter::Render(const AnalysisDocument &document) const {
  std::ostringstream output;
  output << BuildSummaryLines(document);
  if (!document.findings.empty()) {
    output << "\n";
  }
  for (const auto &finding : document.findings) {
    output << FindingLocation(finding) << " [" << finding.level << "] "
           << finding.rule_id << ": " << finding.message << "\n";
  }
  return output.str();
}

std::string JsonFormatter::Render(const AnalysisDocument &document) const {
  nlohmann::json output = {{"analysis", document.analysis},
                           {"generated_at",
                            FormatIsoTimestamp(document.generated_at)}};
  for (const auto &[key, value] : document.body.items()) {
    output[key] = value;
  }
  return output.dump(2) + "\n";
}

nlohmann::json RenderSarif(const AnalysisDocument &document) {
  nlohmann::json rules = nlohmann::json::array();
  std::set<std::string> seen_rules;
  nlohmann::json results = nlohmann::json::array();
  for (const auto &finding : document.findings) {
    if (seen_rules.insert(finding.rule_id).second) {
      nlohmann::json rule;
      rule["id"] = finding.rule_id;
      rule["name"] = finding.rule_id;
      rule["shortDescription"]["text"] = finding.rule_id;
      rules.push_back(std::move(rule));
    }
    nlohmann::json result;
    result["ruleId"] = finding.rule_id;
    result["level"] = finding.level;
    result["message"]["text"] = finding.message;
    if (!finding.file.empty()) {
      nlohmann::json location;
      location["physicalLocation"]["artifactLocation"]["uri"] = finding.file;
      location["physicalLocation"]["region"]["startLine"] =
          std::max(1u, finding.line);
      result["locations"].push_back(std::move(location));
    }
    results.push_back(std::move(result));
  }

  nlohmann::json run;
  run["tool"]["driver"]["name"] = kToolName;
  run["tool"]["driver"]["rules"] = std::move(rules);
  run["results"] = std::move(results);
  run["properties"]["analysis"] = document.analysis;

  nlohmann::json log;
  log["$schema"] = kSarifSchema;
  log["version"] = "2.1.0";
  log["runs"].push_back(std::move(run));
  return log;
}

std::string SarifFormatter::Render(const AnalysisDocument &document) const {
  return RenderSarif(document).dump(2) + "\n";
}

std::string MarkdownFormatter::Render(const AnalysisDocument &document) const {
  if (!document.markdown.empty()) {
    return document.markdown;
  }
  std::ostringstream output;
  output << "# " << document.title << " Report\n\n";
  output << "Generated: " << FormatIsoTimestamp(document.generated_at)
         << "\n\n";
  output << "## Summary\n\n";
  output << "| Metric | Value |\n";
  output << "| --- | --- |\n";
  for (const auto &[label, value] : document.summary) {
    output << "| " << EscapeMarkdownCell(label) << " | "
           << EscapeMarkdownCell(value) << " |\n";
  }
  output << "\n## Findings\n\n";
  output << "| File | Line | Rule | Level | Message |\n";
  output << "| --- | --- | --- | --- | --- |\n";
  if (document.findings.empty()) {
    output << "| None | - | - | - | - |\n";
  }
  for (const auto &finding : document.findings) {
    output << "| " << EscapeMarkdownCell(finding.file) << " | "
           << finding.line << " | " << EscapeMarkdownCell(finding.rule_id)
           << " | " << finding.level << " | "
           << EscapeMarkdownCell(finding.message) << " |\n";
  }
  return output.str();
}

std::string
EnforcementJsonFormatter::Render(const AnalysisDocument &document) const {
  if (!document.body.contains("enforcement")) {
    throw std::invalid_argument(
        "enforcement-json is only available for lint-hotspot, not " +
        document.analysis);
  }
  return document.body.dump() + "\n";
}

} // namespace qgate
