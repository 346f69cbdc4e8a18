#pragma once

#include <qgate/unified_protocol.h>

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace qgate {

struct Route {
  std::string method;
  std::string path;
};

struct McpTool {
  std::string name;
  std::string description;
  Route route;
};

// The MCP tool-name table; `/mcp/<name>` resolves through it as well.
const std::vector<McpTool> &McpTools();
const McpTool *FindMcpTool(const std::string &name);

// `analyze complexity` -> POST /api/v1/analyze/complexity. Throws
// std::invalid_argument for commands without a route.
Route CliRoute(const std::vector<std::string> &command);

struct CliInvocation {
  // e.g. {"analyze", "complexity"} or {"refactor", "auto"}.
  std::vector<std::string> command;
  // Every flag the user passed, keyed by its snake_case name.
  nlohmann::json flags = nlohmann::json::object();
  // The raw argument vector.
  std::vector<std::string> args;
};

struct CliOutput {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
};

class CliAdapter {
public:
  UnifiedRequest Decode(const CliInvocation &invocation) const;
  // < 400 prints the body and exits 0; 4xx exits 1 and 5xx exits 2, both
  // with the error message on stderr.
  CliOutput Encode(const UnifiedResponse &response) const;
};

struct HttpRequestInput {
  std::string method;
  // Path with an optional query string.
  std::string target;
  std::map<std::string, std::string> headers;
  std::string body;
};

struct HttpResponseOutput {
  int status = 200;
  std::map<std::string, std::string> headers;
  std::string body;
};

class HttpAdapter {
public:
  UnifiedRequest Decode(const HttpRequestInput &input) const;
  HttpResponseOutput Encode(const UnifiedResponse &response) const;
  UnifiedResponse DecodeResponse(const HttpResponseOutput &output) const;
};

// Carries the JSON-RPC error code for envelope problems.
class McpDecodeError : public std::invalid_argument {
public:
  McpDecodeError(int code, const std::string &message)
      : std::invalid_argument(message), code_(code) {}

  int code() const { return code_; }

private:
  int code_;
};

inline constexpr int kJsonRpcParseError = -32700;
inline constexpr int kJsonRpcInvalidRequest = -32600;

int JsonRpcErrorCode(int status);

class McpAdapter {
public:
  // Throws McpDecodeError for malformed lines and non-2.0 envelopes.
  UnifiedRequest Decode(const std::string &line) const;
  UnifiedRequest Decode(const nlohmann::json &envelope) const;
  // `{jsonrpc, id, result}` or `{jsonrpc, id, error{code, message}}`; the id
  // comes from the request's `mcp_context`.
  nlohmann::json Encode(const UnifiedResponse &response,
                        const nlohmann::json &id = nullptr) const;
  nlohmann::json EncodeError(int code, const std::string &message,
                             const nlohmann::json &id = nullptr) const;
};

// Split `a=1&b=2` into a JSON object of strings, percent-decoded.
nlohmann::json ParseQueryString(const std::string &query);

} // namespace qgate
