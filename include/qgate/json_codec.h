#pragma once

#include <qgate/models.h>

#include <nlohmann/json.hpp>

namespace qgate {

void to_json(nlohmann::json &json, const ViolationDetail &violation);
void from_json(const nlohmann::json &json, ViolationDetail &violation);

void to_json(nlohmann::json &json, const QualityMetrics &metrics);
void from_json(const nlohmann::json &json, QualityMetrics &metrics);

void to_json(nlohmann::json &json, const RefactorProgress &progress);
void from_json(const nlohmann::json &json, RefactorProgress &progress);

void to_json(nlohmann::json &json, const RefactorState &state);
void from_json(const nlohmann::json &json, RefactorState &state);

void to_json(nlohmann::json &json, const FunctionInfo &function);
void to_json(nlohmann::json &json, const PlannedViolation &violation);
void to_json(nlohmann::json &json, const FileRewritePlan &plan);

void to_json(nlohmann::json &json, const LintHotspotResult &result);

// Reads `key` when present and not null, leaving `target` untouched
// otherwise.
template <typename T>
void ReadOptionalField(const nlohmann::json &json, const char *key,
                       T &target) {
  const auto found = json.find(key);
  if (found != json.end() && !found->is_null()) {
    target = found->template get<T>();
  }
}

} // namespace qgate
