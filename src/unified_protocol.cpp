#include <qgate/unified_protocol.h>

#include <qgate/strings.h>
#include <qgate/template_service.h>

#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace qgate {

std::string ProtocolName(Protocol protocol) {
  switch (protocol) {
  case Protocol::kCli:
    return "cli";
  case Protocol::kHttp:
    return "http";
  case Protocol::kMcp:
    return "mcp";
  }
  return "cli";
}

Protocol ParseProtocol(const std::string &value) {
  const auto lowered = ToLower(value);
  if (lowered == "cli") {
    return Protocol::kCli;
  }
  if (lowered == "http") {
    return Protocol::kHttp;
  }
  if (lowered == "mcp") {
    return Protocol::kMcp;
  }
  throw std::invalid_argument("Unknown protocol: " + value);
}

std::string NewTraceId() {
  static thread_local std::mt19937_64 generator(std::random_device{}());
  std::ostringstream id;
  id << std::hex << std::setfill('0') << std::setw(16) << generator()
     << std::setw(16) << generator();
  return id.str();
}

nlohmann::json UnifiedRequest::JsonBody() const {
  if (Trim(body).empty()) {
    return nlohmann::json::object();
  }
  auto parsed = nlohmann::json::parse(body, nullptr, false);
  if (parsed.is_discarded()) {
    throw std::invalid_argument("Request body is not valid JSON");
  }
  if (parsed.is_null()) {
    return nlohmann::json::object();
  }
  if (!parsed.is_object()) {
    throw std::invalid_argument("Request body must be a JSON object");
  }
  return parsed;
}

std::optional<Protocol> UnifiedRequest::protocol() const {
  const auto found = extensions.find("protocol");
  if (found == extensions.end() || !found->is_string()) {
    return std::nullopt;
  }
  return ParseProtocol(found->get<std::string>());
}

UnifiedRequest MakeUnifiedRequest(std::string method, std::string path) {
  UnifiedRequest request;
  request.method = std::move(method);
  request.path = std::move(path);
  request.trace_id = NewTraceId();
  return request;
}

std::string UnifiedResponse::ContentType() const {
  const auto found = headers.find("content-type");
  return found == headers.end() ? std::string("application/json")
                                : found->second;
}

UnifiedResponse JsonResponse(const nlohmann::json &body, int status) {
  UnifiedResponse response;
  response.status = status;
  response.headers["content-type"] = "application/json";
  response.body = body.dump(2);
  return response;
}

UnifiedResponse TextResponse(std::string body, std::string content_type,
                             int status) {
  UnifiedResponse response;
  response.status = status;
  response.headers["content-type"] = std::move(content_type);
  response.body = std::move(body);
  return response;
}

UnifiedResponse ErrorResponse(int status, const std::string &message,
                              const std::string &type) {
  return JsonResponse({{"error", message}, {"error_type", type}}, status);
}

std::string ErrorMessage(const UnifiedResponse &response) {
  const auto parsed = nlohmann::json::parse(response.body, nullptr, false);
  if (!parsed.is_discarded() && parsed.is_object()) {
    const auto error = parsed.find("error");
    if (error != parsed.end() && error->is_string()) {
      return error->get<std::string>();
    }
  }
  return response.body;
}

ProtocolHandlerRegistry::ProtocolHandlerRegistry(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

void ProtocolHandlerRegistry::Register(const std::string &method,
                                       const std::string &path,
                                       ProtocolHandler handler) {
  if (!handler) {
    throw std::invalid_argument("Route " + method + " " + path +
                                " requires a handler");
  }
  handlers_[{method, path}] = std::move(handler);
}

bool ProtocolHandlerRegistry::HasRoute(const std::string &method,
                                       const std::string &path) const {
  return handlers_.count({method, path}) > 0;
}

std::vector<std::pair<std::string, std::string>>
ProtocolHandlerRegistry::Routes() const {
  std::vector<std::pair<std::string, std::string>> routes;
  routes.reserve(handlers_.size());
  for (const auto &entry : handlers_) {
    routes.push_back(entry.first);
  }
  return routes;
}

UnifiedResponse
ProtocolHandlerRegistry::Handle(const UnifiedRequest &request) const {
  const auto started = std::chrono::steady_clock::now();
  const auto protocol = request.extensions.value("protocol", std::string("unknown"));
  logger_->Log(LogLevel::kDebug, "protocol.request",
               {{"method", request.method},
                {"path", request.path},
                {"protocol", protocol},
                {"trace_id", request.trace_id}});

  UnifiedResponse response;
  const auto handler = handlers_.find({request.method, request.path});
  if (handler == handlers_.end()) {
    response = ErrorResponse(404, "No route for " + request.method + " " +
                                      request.path,
                             "NOT_FOUND");
  } else {
    try {
      response = handler->second(request);
    } catch (const std::invalid_argument &error) {
      response = ErrorResponse(400, error.what(), "BAD_REQUEST");
    } catch (const NotImplementedError &error) {
      response = ErrorResponse(501, error.what(), "NOT_IMPLEMENTED");
    } catch (const std::exception &error) {
      response = ErrorResponse(500, error.what(), "INTERNAL_ERROR");
    }
  }

  const auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - started)
                               .count();
  logger_->Log(response.status >= 500 ? LogLevel::kError : LogLevel::kDebug,
               "protocol.response",
               {{"path", request.path},
                {"status", std::to_string(response.status)},
                {"duration_ms", std::to_string(duration_ms)},
                {"trace_id", request.trace_id}});
  return response;
}

} // namespace qgate
