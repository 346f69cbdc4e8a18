#include <qgate/process_runner.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <chrono>
#include <utility>

namespace qgate {
namespace {

constexpr int kPollIntervalMs = 50;
constexpr auto kTerminateGrace = std::chrono::milliseconds(500);

std::vector<std::string>
BuildEnvironment(const ExecutionContext &context,
                 const std::map<std::string, std::string> &overrides) {
  auto merged = context.env;
  for (const auto &[key, value] : overrides) {
    merged[key] = value;
  }
  std::vector<std::string> entries;
  entries.reserve(merged.size());
  for (const auto &[key, value] : merged) {
    entries.push_back(key + "=" + value);
  }
  return entries;
}

std::vector<char *> PointerArray(std::vector<std::string> &values) {
  std::vector<char *> pointers;
  pointers.reserve(values.size() + 1);
  for (auto &value : values) {
    pointers.push_back(value.data());
  }
  pointers.push_back(nullptr);
  return pointers;
}

bool DrainInto(int fd, std::string &target) {
  std::array<char, 4096> buffer{};
  while (true) {
    const auto count = read(fd, buffer.data(), buffer.size());
    if (count > 0) {
      target.append(buffer.data(), static_cast<std::size_t>(count));
      continue;
    }
    if (count == 0) {
      return false;
    }
    return errno == EAGAIN || errno == EINTR;
  }
}

int DecodeStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

[[noreturn]] void ExecChild(const ProcessRequest &request,
                            const ExecutionContext &context, int stdout_fd,
                            int stderr_fd, int error_fd) {
  setpgid(0, 0);
  dup2(stdout_fd, STDOUT_FILENO);
  dup2(stderr_fd, STDERR_FILENO);
  const int null_fd = open("/dev/null", O_RDONLY);
  if (null_fd >= 0) {
    dup2(null_fd, STDIN_FILENO);
  }

  const auto directory = request.working_directory.empty()
                             ? context.cwd
                             : request.working_directory;
  if (!directory.empty() && chdir(directory.c_str()) != 0) {
    const int error = errno;
    (void)!write(error_fd, &error, sizeof(error));
    _exit(127);
  }

  std::vector<std::string> argv_storage;
  argv_storage.push_back(request.program);
  argv_storage.insert(argv_storage.end(), request.arguments.begin(),
                      request.arguments.end());
  auto env_storage = BuildEnvironment(context, request.environment);
  auto argv = PointerArray(argv_storage);
  auto envp = PointerArray(env_storage);

  execvpe(request.program.c_str(), argv.data(), envp.data());
  const int error = errno;
  (void)!write(error_fd, &error, sizeof(error));
  _exit(127);
}

} // namespace

std::string DescribeCommand(const ProcessRequest &request) {
  std::string command = request.program;
  for (const auto &argument : request.arguments) {
    command.push_back(' ');
    command.append(argument);
  }
  return command;
}

PosixProcessRunner::PosixProcessRunner(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

ProcessResult PosixProcessRunner::Run(const ProcessRequest &request,
                                      const ExecutionContext &context) {
  ProcessResult result;
  logger_->Log(LogLevel::kDebug, "process.spawn",
               {{"command", DescribeCommand(request)}});

  int out_pipe[2];
  int err_pipe[2];
  int exec_pipe[2];
  if (pipe(out_pipe) != 0) {
    result.launched = false;
    return result;
  }
  if (pipe(err_pipe) != 0) {
    close(out_pipe[0]);
    close(out_pipe[1]);
    result.launched = false;
    return result;
  }
  if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
    for (const int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
      close(fd);
    }
    result.launched = false;
    return result;
  }

  const pid_t pid = fork();
  if (pid < 0) {
    for (const int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1],
                         exec_pipe[0], exec_pipe[1]}) {
      close(fd);
    }
    result.launched = false;
    return result;
  }
  if (pid == 0) {
    close(out_pipe[0]);
    close(err_pipe[0]);
    close(exec_pipe[0]);
    ExecChild(request, context, out_pipe[1], err_pipe[1], exec_pipe[1]);
  }

  close(out_pipe[1]);
  close(err_pipe[1]);
  close(exec_pipe[1]);
  fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

  int exec_error = 0;
  const auto exec_bytes = read(exec_pipe[0], &exec_error, sizeof(exec_error));
  close(exec_pipe[0]);
  if (exec_bytes == static_cast<ssize_t>(sizeof(exec_error))) {
    result.launched = false;
    result.stderr_text = std::strerror(exec_error);
  }

  const auto started = std::chrono::steady_clock::now();
  std::optional<std::chrono::steady_clock::time_point> terminate_sent;
  bool stdout_open = true;
  bool stderr_open = true;
  int status = 0;
  bool reaped = false;

  while (!reaped) {
    std::array<pollfd, 2> fds{};
    nfds_t count = 0;
    if (stdout_open) {
      fds[count++] = pollfd{out_pipe[0], POLLIN, 0};
    }
    if (stderr_open) {
      fds[count++] = pollfd{err_pipe[0], POLLIN, 0};
    }
    if (count > 0) {
      poll(fds.data(), count, kPollIntervalMs);
    } else {
      usleep(kPollIntervalMs * 1000);
    }
    if (stdout_open) {
      stdout_open = DrainInto(out_pipe[0], result.stdout_text);
    }
    if (stderr_open) {
      stderr_open = DrainInto(err_pipe[0], result.stderr_text);
    }

    const auto waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      reaped = true;
      break;
    }

    const auto now = std::chrono::steady_clock::now();
    const bool expired = request.timeout && now - started >= *request.timeout;
    const bool cancelled = context.IsCancelled();
    if ((expired || cancelled) && !terminate_sent) {
      result.timed_out = expired;
      result.cancelled = cancelled;
      logger_->Log(LogLevel::kWarn,
                   expired ? "process.timeout" : "process.cancelled",
                   {{"command", DescribeCommand(request)}});
      kill(-pid, SIGTERM);
      terminate_sent = now;
    } else if (terminate_sent && now - *terminate_sent >= kTerminateGrace) {
      kill(-pid, SIGKILL);
    }
  }

  DrainInto(out_pipe[0], result.stdout_text);
  DrainInto(err_pipe[0], result.stderr_text);
  close(out_pipe[0]);
  close(err_pipe[0]);

  result.exit_code = DecodeStatus(status);
  logger_->Log(LogLevel::kDebug, "process.exit",
               {{"command", request.program},
                {"exit_code", std::to_string(result.exit_code)},
                {"launched", result.launched ? "true" : "false"}});
  return result;
}

} // namespace qgate
