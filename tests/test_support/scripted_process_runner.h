#ifndef QGATE_TEST_SUPPORT_SCRIPTED_PROCESS_RUNNER_H
#define QGATE_TEST_SUPPORT_SCRIPTED_PROCESS_RUNNER_H

#include <qgate/process_runner.h>

#include <algorithm>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace qgate {
namespace test {

// Answers subprocess requests from a script instead of forking. A rule
// matches when the program is equal and every required argument appears
// somewhere in the argument list; the first matching rule wins. Unmatched
// requests behave like a missing program.
class ScriptedProcessRunner : public ProcessRunner {
public:
  using Handler = std::function<ProcessResult(const ProcessRequest &)>;

  ScriptedProcessRunner &On(std::string program,
                            std::vector<std::string> required_arguments,
                            ProcessResult result) {
    return OnCall(std::move(program), std::move(required_arguments),
                  [result](const ProcessRequest &) { return result; });
  }

  ScriptedProcessRunner &OnCall(std::string program,
                                std::vector<std::string> required_arguments,
                                Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    rules_.push_back(
        {std::move(program), std::move(required_arguments), std::move(handler)});
    return *this;
  }

  ProcessResult Run(const ProcessRequest &request,
                    const ExecutionContext &) override {
    Handler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      calls_.push_back(request);
      for (const auto &rule : rules_) {
        if (Matches(rule, request)) {
          handler = rule.handler;
          break;
        }
      }
    }
    return handler ? handler(request) : Missing();
  }

  std::vector<ProcessRequest> calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

  bool WasCalled(const std::string &program,
                 const std::string &argument = "") const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(calls_.begin(), calls_.end(),
                       [&](const ProcessRequest &call) {
                         return call.program == program &&
                                (argument.empty() ||
                                 std::find(call.arguments.begin(),
                                           call.arguments.end(),
                                           argument) != call.arguments.end());
                       });
  }

  static ProcessResult Success(std::string stdout_text = "") {
    ProcessResult result;
    result.exit_code = 0;
    result.stdout_text = std::move(stdout_text);
    return result;
  }

  static ProcessResult Failure(int exit_code, std::string stderr_text = "",
                               std::string stdout_text = "") {
    ProcessResult result;
    result.exit_code = exit_code;
    result.stderr_text = std::move(stderr_text);
    result.stdout_text = std::move(stdout_text);
    return result;
  }

  static ProcessResult Missing() {
    ProcessResult result;
    result.exit_code = 127;
    result.launched = false;
    return result;
  }

private:
  struct Rule {
    std::string program;
    std::vector<std::string> required_arguments;
    Handler handler;
  };

  static bool Matches(const Rule &rule, const ProcessRequest &request) {
    if (rule.program != request.program) {
      return false;
    }
    return std::all_of(rule.required_arguments.begin(),
                       rule.required_arguments.end(),
                       [&](const std::string &required) {
                         return std::find(request.arguments.begin(),
                                          request.arguments.end(),
                                          required) != request.arguments.end();
                       });
  }

  mutable std::mutex mutex_;
  std::vector<Rule> rules_;
  std::vector<ProcessRequest> calls_;
};

} // namespace test
} // namespace qgate

#endif // QGATE_TEST_SUPPORT_SCRIPTED_PROCESS_RUNNER_H
