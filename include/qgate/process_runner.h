#pragma once

#include <qgate/execution_context.h>
#include <qgate/logging.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace qgate {

struct ProcessRequest {
  std::string program;
  std::vector<std::string> arguments;
  std::filesystem::path working_directory;
  // Merged over the ExecutionContext environment.
  std::map<std::string, std::string> environment;
  std::optional<std::chrono::milliseconds> timeout;
};

struct ProcessResult {
  int exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out = false;
  bool cancelled = false;
  // False when the program could not be executed at all.
  bool launched = true;

  bool Succeeded() const {
    return launched && !timed_out && !cancelled && exit_code == 0;
  }
};

std::string DescribeCommand(const ProcessRequest &request);

class ProcessRunner {
public:
  virtual ~ProcessRunner() = default;
  virtual ProcessResult Run(const ProcessRequest &request,
                            const ExecutionContext &context) = 0;
};

class PosixProcessRunner : public ProcessRunner {
public:
  explicit PosixProcessRunner(std::shared_ptr<Logger> logger = nullptr);

  ProcessResult Run(const ProcessRequest &request,
                    const ExecutionContext &context) override;

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace qgate
