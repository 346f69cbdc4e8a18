#pragma once

#include <qgate/analysis_document.h>

#include <nlohmann/json.hpp>

#include <string>

namespace qgate {

class ReportFormatter {
public:
  virtual ~ReportFormatter() = default;
  virtual std::string ContentType() const = 0;
  virtual std::string Render(const AnalysisDocument &document) const = 0;
};

// Headline metrics and a finding count.
class SummaryFormatter : public ReportFormatter {
public:
  std::string ContentType() const override { return "text/plain"; }
  std::string Render(const AnalysisDocument &document) const override;
};

// Headline metrics followed by every finding, one per line.
class FullFormatter : public ReportFormatter {
public:
  std::string ContentType() const override { return "text/plain"; }
  std::string Render(const AnalysisDocument &document) const override;
};

class JsonFormatter : public ReportFormatter {
public:
  std::string ContentType() const override { return "application/json"; }
  std::string Render(const AnalysisDocument &document) const override;
};

class SarifFormatter : public ReportFormatter {
public:
  std::string ContentType() const override { return "application/sarif+json"; }
  std::string Render(const AnalysisDocument &document) const override;
};

class MarkdownFormatter : public ReportFormatter {
public:
  std::string ContentType() const override { return "text/markdown"; }
  std::string Render(const AnalysisDocument &document) const override;
};

// The bare lint-hotspot body consumed by the refactor loop.
class EnforcementJsonFormatter : public ReportFormatter {
public:
  std::string ContentType() const override { return "application/json"; }
  std::string Render(const AnalysisDocument &document) const override;
};

// SARIF 2.1.0 log with one run, one rule per distinct rule id.
nlohmann::json RenderSarif(const AnalysisDocument &document);

} // namespace qgate
