#include <qgate/cli_commands.h>
#include <qgate/execution_context.h>
#include <qgate/protocol_adapters.h>
#include <qgate/protocol_handlers.h>

#include <drogon/drogon.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

struct ServerOptions {
  std::string host = "127.0.0.1";
  unsigned short port = 8080;
  std::size_t threads = 0;
  std::optional<qgate::LogLevel> log_level;
};

ServerOptions ParseServerArguments(const std::vector<std::string> &arguments) {
  ServerOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    const auto value = [&]() {
      if (++i >= arguments.size()) {
        throw std::invalid_argument(argument + " requires a value");
      }
      return arguments[i];
    };
    if (argument == "--host") {
      options.host = value();
    } else if (argument == "--port") {
      options.port = static_cast<unsigned short>(std::stoul(value()));
    } else if (argument == "--threads") {
      options.threads = std::stoul(value());
    } else if (argument == "--log-level") {
      options.log_level = qgate::ParseLogLevel(value());
    } else if (argument == "--verbose") {
      options.log_level = qgate::LogLevel::kInfo;
    } else if (argument == "--debug") {
      options.log_level = qgate::LogLevel::kDebug;
    } else {
      throw std::invalid_argument("Unknown qgate-serve argument: " + argument);
    }
  }
  return options;
}

drogon::HttpMethod ToDrogonMethod(const std::string &method) {
  if (method == "GET") {
    return drogon::Get;
  }
  if (method == "POST") {
    return drogon::Post;
  }
  if (method == "PUT") {
    return drogon::Put;
  }
  if (method == "DELETE") {
    return drogon::Delete;
  }
  throw std::invalid_argument("Unsupported HTTP method: " + method);
}

qgate::HttpRequestInput ToAdapterInput(const drogon::HttpRequestPtr &request) {
  qgate::HttpRequestInput input;
  input.method = request->methodString();
  input.target = request->path();
  if (!request->query().empty()) {
    input.target += "?" + request->query();
  }
  for (const auto &[name, value] : request->headers()) {
    input.headers[name] = value;
  }
  input.body = std::string(request->body());
  return input;
}

drogon::HttpResponsePtr ToDrogonResponse(const qgate::HttpResponseOutput &output) {
  auto response = drogon::HttpResponse::newHttpResponse();
  response->setStatusCode(static_cast<drogon::HttpStatusCode>(output.status));
  for (const auto &[name, value] : output.headers) {
    if (name == "content-type") {
      response->setContentTypeString(value);
    } else {
      response->addHeader(name, value);
    }
  }
  response->setBody(output.body);
  return response;
}

} // namespace

int main(int argc, char **argv) {
  try {
    const auto options =
        ParseServerArguments(std::vector<std::string>(argv + 1, argv + argc));
    auto logger = qgate::MakeLogger(qgate::BuildLoggingConfig(options.log_level),
                                    std::clog);

    qgate::ServiceOptions service;
    service.logger = logger;
    service.context = qgate::CaptureExecutionContext(
        std::nullopt, std::filesystem::current_path());
    service.self_executable = qgate::SelfExecutablePath();
    if (service.self_executable) {
      // Lint measurement re-invokes the CLI, not the server.
      service.self_executable =
          service.self_executable->parent_path() / "qgate";
    }
    const auto registry = qgate::MakeQgateRegistry(std::move(service));
    const qgate::HttpAdapter adapter{};

    auto &app = drogon::app();
    for (const auto &[method, path] : registry->Routes()) {
      app.registerHandler(
          path,
          [registry, adapter](
              const drogon::HttpRequestPtr &request,
              std::function<void(const drogon::HttpResponsePtr &)> &&callback) {
            qgate::UnifiedResponse response;
            try {
              response = registry->Handle(adapter.Decode(ToAdapterInput(request)));
            } catch (const std::invalid_argument &error) {
              response = qgate::ErrorResponse(400, error.what(), "BAD_REQUEST");
            }
            callback(ToDrogonResponse(adapter.Encode(response)));
          },
          {ToDrogonMethod(method)});
    }

    auto not_found = drogon::HttpResponse::newHttpResponse();
    not_found->setStatusCode(drogon::k404NotFound);
    not_found->setContentTypeString("application/json");
    not_found->setBody(
        qgate::ErrorResponse(404, "No such route", "NOT_FOUND").body);
    app.setCustom404Page(not_found);

    logger->Log(qgate::LogLevel::kInfo, "server.start",
                {{"host", options.host}, {"port", std::to_string(options.port)}});
    app.addListener(options.host, options.port)
        .setThreadNum(options.threads != 0 ? options.threads
                                           : std::thread::hardware_concurrency())
        .run();
    return 0;
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 2;
  }
}
