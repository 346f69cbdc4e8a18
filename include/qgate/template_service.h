#pragma once

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace qgate {

// Raised by collaborators that exist only as an interface in this build.
// The protocol layer answers it with 501.
class NotImplementedError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class TemplateService {
public:
  virtual ~TemplateService() = default;
  virtual nlohmann::json List(const nlohmann::json &filters) = 0;
  virtual nlohmann::json Search(const nlohmann::json &query) = 0;
  virtual nlohmann::json Generate(const nlohmann::json &request) = 0;
  virtual nlohmann::json Scaffold(const nlohmann::json &request) = 0;
  virtual nlohmann::json Validate(const nlohmann::json &request) = 0;
};

class UnavailableTemplateService : public TemplateService {
public:
  nlohmann::json List(const nlohmann::json &filters) override;
  nlohmann::json Search(const nlohmann::json &query) override;
  nlohmann::json Generate(const nlohmann::json &request) override;
  nlohmann::json Scaffold(const nlohmann::json &request) override;
  nlohmann::json Validate(const nlohmann::json &request) override;
};

} // namespace qgate
