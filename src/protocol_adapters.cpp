#include <qgate/protocol_adapters.h>

#include <qgate/strings.h>

#include <algorithm>
#include <set>

namespace qgate {
namespace {

const std::set<std::string> &SupportedAnalyses() {
  static const std::set<std::string> analyses = {
      "complexity", "churn",    "dead-code",         "satd",
      "deep-context", "tdg",    "lint-hotspot",      "coverage",
      "defect-prediction",      "comprehensive"};
  return analyses;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

std::string PercentDecode(const std::string &value) {
  std::string decoded;
  decoded.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '+') {
      decoded += ' ';
    } else if (value[i] == '%' && i + 2 < value.size() &&
               HexValue(value[i + 1]) >= 0 && HexValue(value[i + 2]) >= 0) {
      decoded += static_cast<char>(HexValue(value[i + 1]) * 16 +
                                   HexValue(value[i + 2]));
      i += 2;
    } else {
      decoded += value[i];
    }
  }
  return decoded;
}

} // namespace

const std::vector<McpTool> &McpTools() {
  static const std::vector<McpTool> tools = {
      {"analyze_complexity", "Cyclomatic and cognitive complexity per function",
       {"POST", "/api/v1/analyze/complexity"}},
      {"analyze_churn", "Git change frequency per file",
       {"POST", "/api/v1/analyze/churn"}},
      {"analyze_dead_code", "Unreferenced and unreachable code",
       {"POST", "/api/v1/analyze/dead-code"}},
      {"analyze_satd", "Self-admitted technical debt comments",
       {"POST", "/api/v1/analyze/satd"}},
      {"analyze_deep_context", "Aggregated project context",
       {"POST", "/api/v1/analyze/deep-context"}},
      {"analyze_tdg", "Technical debt gradient per file",
       {"POST", "/api/v1/analyze/tdg"}},
      {"analyze_lint_hotspot", "File with the highest lint defect density",
       {"POST", "/api/v1/analyze/lint-hotspot"}},
      {"analyze_coverage", "Line coverage per file",
       {"POST", "/api/v1/analyze/coverage"}},
      {"analyze_defect_prediction", "Files most likely to contain defects",
       {"POST", "/api/v1/analyze/defect-prediction"}},
      {"analyze_comprehensive", "Deep context plus lint hotspot",
       {"POST", "/api/v1/analyze/comprehensive"}},
      {"refactor_auto", "Run the quality-gate refactor loop",
       {"POST", "/api/v1/refactor/auto"}},
      {"list_templates", "List project templates", {"GET", "/api/v1/templates"}},
      {"search_templates", "Search project templates",
       {"POST", "/api/v1/templates/search"}},
      {"generate_template", "Render one template", {"POST", "/api/v1/generate"}},
      {"scaffold_project", "Render a set of templates",
       {"POST", "/api/v1/scaffold"}},
      {"validate_template", "Validate template parameters",
       {"POST", "/api/v1/validate"}},
      {"health", "Service health", {"GET", "/health"}}};
  return tools;
}

const McpTool *FindMcpTool(const std::string &name) {
  const auto &tools = McpTools();
  const auto found = std::find_if(tools.begin(), tools.end(),
                                  [&name](const McpTool &tool) {
                                    return tool.name == name;
                                  });
  return found == tools.end() ? nullptr : &*found;
}

Route CliRoute(const std::vector<std::string> &command) {
  if (command.empty()) {
    throw std::invalid_argument("Missing command");
  }
  const auto &head = command.front();
  if (head == "analyze") {
    if (command.size() < 2) {
      throw std::invalid_argument("analyze requires a subcommand");
    }
    if (SupportedAnalyses().count(command[1]) == 0) {
      throw std::invalid_argument("Unsupported analysis: " + command[1]);
    }
    return {"POST", "/api/v1/analyze/" + command[1]};
  }
  if (head == "context") {
    return {"POST", "/api/v1/analyze/deep-context"};
  }
  if (head == "refactor") {
    if (command.size() < 2 || command[1] != "auto") {
      throw std::invalid_argument("refactor supports only the 'auto' subcommand");
    }
    return {"POST", "/api/v1/refactor/auto"};
  }
  if (head == "list") {
    return {"GET", "/api/v1/templates"};
  }
  if (head == "search") {
    return {"POST", "/api/v1/templates/search"};
  }
  if (head == "generate" || head == "scaffold" || head == "validate") {
    return {"POST", "/api/v1/" + head};
  }
  throw std::invalid_argument("Unknown command: " + head);
}

UnifiedRequest CliAdapter::Decode(const CliInvocation &invocation) const {
  const auto route = CliRoute(invocation.command);
  auto request = MakeUnifiedRequest(route.method, route.path);
  request.headers["content-type"] = "application/json";
  request.body = invocation.flags.dump();

  std::string command;
  for (const auto &part : invocation.command) {
    command += command.empty() ? part : " " + part;
  }
  request.extensions["protocol"] = ProtocolName(Protocol::kCli);
  request.extensions["cli_context"] = {{"command", command},
                                       {"args", invocation.args}};
  const auto format = invocation.flags.find("format");
  if (format != invocation.flags.end() && format->is_string()) {
    request.extensions["output_format"] = *format;
  }
  return request;
}

CliOutput CliAdapter::Encode(const UnifiedResponse &response) const {
  CliOutput output;
  if (response.status < 400) {
    output.stdout_text = response.body;
    if (!output.stdout_text.empty() && output.stdout_text.back() != '\n') {
      output.stdout_text += '\n';
    }
    return output;
  }
  output.exit_code = response.status < 500 ? 1 : 2;
  output.stderr_text = "Error: " + ErrorMessage(response) + "\n";
  return output;
}

nlohmann::json ParseQueryString(const std::string &query) {
  nlohmann::json values = nlohmann::json::object();
  for (const auto &pair : SplitList(query, '&')) {
    const auto equals = pair.find('=');
    if (equals == std::string::npos) {
      values[PercentDecode(pair)] = "";
    } else {
      values[PercentDecode(pair.substr(0, equals))] =
          PercentDecode(pair.substr(equals + 1));
    }
  }
  return values;
}

UnifiedRequest HttpAdapter::Decode(const HttpRequestInput &input) const {
  if (input.method.empty() || input.target.empty() || input.target[0] != '/') {
    throw std::invalid_argument("Malformed HTTP request line");
  }
  const auto question = input.target.find('?');
  auto request = MakeUnifiedRequest(
      input.method, input.target.substr(0, question));
  for (const auto &header : input.headers) {
    request.headers[ToLower(header.first)] = header.second;
  }
  request.body = input.body;
  request.extensions["protocol"] = ProtocolName(Protocol::kHttp);
  if (question != std::string::npos) {
    request.extensions["query"] =
        ParseQueryString(input.target.substr(question + 1));
  }
  return request;
}

HttpResponseOutput HttpAdapter::Encode(const UnifiedResponse &response) const {
  HttpResponseOutput output;
  output.status = response.status;
  output.headers = response.headers;
  output.headers["content-type"] = response.ContentType();
  output.body = response.body;
  return output;
}

UnifiedResponse HttpAdapter::DecodeResponse(const HttpResponseOutput &output) const {
  UnifiedResponse response;
  response.status = output.status;
  for (const auto &header : output.headers) {
    response.headers[ToLower(header.first)] = header.second;
  }
  response.body = output.body;
  return response;
}

int JsonRpcErrorCode(int status) {
  switch (status) {
  case 400:
    return -32602;
  case 404:
    return -32601;
  case 500:
    return -32603;
  default:
    return -32000;
  }
}

UnifiedRequest McpAdapter::Decode(const std::string &line) const {
  auto envelope = nlohmann::json::parse(line, nullptr, false);
  if (envelope.is_discarded()) {
    throw McpDecodeError(kJsonRpcParseError, "Invalid JSON-RPC: parse error");
  }
  return Decode(envelope);
}

UnifiedRequest McpAdapter::Decode(const nlohmann::json &envelope) const {
  if (!envelope.is_object()) {
    throw McpDecodeError(kJsonRpcInvalidRequest,
                         "JSON-RPC request must be an object");
  }
  if (envelope.value("jsonrpc", std::string()) != "2.0") {
    throw McpDecodeError(kJsonRpcInvalidRequest,
                         "Invalid JSON-RPC version, expected '2.0'");
  }
  const auto method = envelope.find("method");
  if (method == envelope.end() || !method->is_string()) {
    throw McpDecodeError(kJsonRpcInvalidRequest,
                         "JSON-RPC request requires a method");
  }
  const auto name = method->get<std::string>();
  auto request = MakeUnifiedRequest("POST", "/mcp/" + name);
  request.headers["content-type"] = "application/json";
  const auto params = envelope.find("params");
  request.body = params == envelope.end() || params->is_null()
                     ? std::string("{}")
                     : params->dump();
  request.extensions["protocol"] = ProtocolName(Protocol::kMcp);
  request.extensions["mcp_context"] = {
      {"id", envelope.contains("id") ? envelope["id"] : nlohmann::json(nullptr)},
      {"method", name}};
  return request;
}

nlohmann::json McpAdapter::EncodeError(int code, const std::string &message,
                                       const nlohmann::json &id) const {
  return {{"jsonrpc", "2.0"},
          {"id", id},
          {"error", {{"code", code}, {"message", message}}}};
}

nlohmann::json McpAdapter::Encode(const UnifiedResponse &response,
                                  const nlohmann::json &id) const {
  if (!response.IsSuccess()) {
    auto envelope =
        EncodeError(JsonRpcErrorCode(response.status), ErrorMessage(response), id);
    const auto parsed = nlohmann::json::parse(response.body, nullptr, false);
    nlohmann::json data = {{"status", response.status}};
    if (!parsed.is_discarded() && parsed.is_object() &&
        parsed.contains("error_type")) {
      data["error_type"] = parsed["error_type"];
    }
    envelope["error"]["data"] = std::move(data);
    return envelope;
  }
  nlohmann::json result;
  auto parsed = nlohmann::json::parse(response.body, nullptr, false);
  if (Contains(response.ContentType(), "json") && !parsed.is_discarded()) {
    result = std::move(parsed);
  } else {
    result = {{"content_type", response.ContentType()},
              {"text", response.body}};
  }
  return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

} // namespace qgate
