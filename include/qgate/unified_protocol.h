#pragma once

#include <qgate/logging.h>

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace qgate {

enum class Protocol { kCli, kHttp, kMcp };

std::string ProtocolName(Protocol protocol);
Protocol ParseProtocol(const std::string &value);

// 32 random hex digits.
std::string NewTraceId();

struct UnifiedRequest {
  std::string method = "GET";
  std::string path;
  std::map<std::string, std::string> headers;
  std::string body;
  // `protocol`, `cli_context`, `mcp_context`, `query`, `output_format`.
  nlohmann::json extensions = nlohmann::json::object();
  std::string trace_id;

  // An empty body reads as `{}`. Throws std::invalid_argument when the body
  // is not a JSON object.
  nlohmann::json JsonBody() const;
  std::optional<Protocol> protocol() const;
};

UnifiedRequest MakeUnifiedRequest(std::string method, std::string path);

struct UnifiedResponse {
  int status = 200;
  std::map<std::string, std::string> headers;
  std::string body;

  bool IsSuccess() const { return status >= 200 && status < 300; }
  std::string ContentType() const;
};

UnifiedResponse JsonResponse(const nlohmann::json &body, int status = 200);
UnifiedResponse TextResponse(std::string body, std::string content_type,
                             int status = 200);
// `{"error": message, "error_type": type}`.
UnifiedResponse ErrorResponse(int status, const std::string &message,
                              const std::string &type);
// The `error` field of a JSON error body, otherwise the raw body.
std::string ErrorMessage(const UnifiedResponse &response);

using ProtocolHandler = std::function<UnifiedResponse(const UnifiedRequest &)>;

// `(method, path)` to handler. One instance serves every adapter.
class ProtocolHandlerRegistry {
public:
  explicit ProtocolHandlerRegistry(std::shared_ptr<Logger> logger = nullptr);

  void Register(const std::string &method, const std::string &path,
                ProtocolHandler handler);
  bool HasRoute(const std::string &method, const std::string &path) const;
  std::vector<std::pair<std::string, std::string>> Routes() const;

  // Never throws: invalid_argument answers 400, NotImplementedError 501,
  // any other exception 500 and an unknown route 404.
  UnifiedResponse Handle(const UnifiedRequest &request) const;

private:
  std::map<std::pair<std::string, std::string>, ProtocolHandler> handlers_;
  std::shared_ptr<Logger> logger_;
};

} // namespace qgate
