#include "sq/platform/process_runner.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "sq/orchestrator/event_bus.h"

namespace sq::platform {
namespace {

constexpr int kExecFailedStatus = 127;

class Pipe { // owns both ends until released
 public:
  Pipe() {
    if (::pipe2(fds_, O_CLOEXEC) != 0) {
      fds_[0] = fds_[1] = -1;
    }
  }
  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;
  ~Pipe() {
    CloseRead();
    CloseWrite();
  }

  [[nodiscard]] bool valid() const noexcept { return fds_[0] >= 0 && fds_[1] >= 0; }
  int read_end() const noexcept { return fds_[0]; }
  int write_end() const noexcept { return fds_[1]; }

  void CloseRead() noexcept {
    if (fds_[0] >= 0) {
      ::close(fds_[0]);
      fds_[0] = -1;
    }
  }
  void CloseWrite() noexcept {
    if (fds_[1] >= 0) {
      ::close(fds_[1]);
      fds_[1] = -1;
    }
  }

 private:
  int fds_[2]{-1, -1};
};

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void ExecChild(const std::vector<std::string>& argv, std::vector<char*>& raw,
                            int stderr_fd) {
  if (::dup2(stderr_fd, STDERR_FILENO) < 0) {
    ::_exit(kExecFailedStatus);
  }
  ::execvp(raw[0], raw.data());
  const int err = errno;
  const char* prefix = "failed to execute ";
  (void)!::write(STDERR_FILENO, prefix, std::strlen(prefix));
  (void)!::write(STDERR_FILENO, argv[0].data(), argv[0].size());
  (void)!::write(STDERR_FILENO, ": ", 2);
  const char* reason = ::strerror(err);
  (void)!::write(STDERR_FILENO, reason, std::strlen(reason));
  (void)!::write(STDERR_FILENO, "\n", 1);
  ::_exit(kExecFailedStatus);
}

std::string DrainFd(int fd) {
  std::string out;
  char buffer[4096];
  for (;;) {
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (n == 0) {
      break;
    }
    out.append(buffer, static_cast<size_t>(n));
  }
  return out;
}

CommandResult SpawnFailure(const std::string& what) {
  CommandResult result;
  result.exit_code = -1;
  result.stderr_output = what + ": " + std::strerror(errno);
  return result;
}

} // namespace

std::string FormatCommandLine(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& arg : argv) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    const bool needs_quotes =
        arg.empty() || arg.find_first_of(" \t\n'\"\\$`") != std::string::npos;
    if (!needs_quotes) {
      out += arg;
      continue;
    }
    out.push_back('\'');
    for (char ch : arg) {
      if (ch == '\'') {
        out += "'\\''";
      } else {
        out.push_back(ch);
      }
    }
    out.push_back('\'');
  }
  return out;
}

CommandResult SubprocessRunner::Run(const std::vector<std::string>& argv) {
  if (argv.empty() || argv.front().empty()) {
    CommandResult result;
    result.stderr_output = "empty command";
    return result;
  }
  std::vector<char*> raw;
  raw.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    raw.push_back(const_cast<char*>(arg.c_str()));
  }
  raw.push_back(nullptr);

  Pipe err_pipe;
  if (!err_pipe.valid()) {
    return SpawnFailure("pipe failed");
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    return SpawnFailure("fork failed");
  }
  if (pid == 0) {
    ExecChild(argv, raw, err_pipe.write_end());
  }

  err_pipe.CloseWrite();
  CommandResult result;
  result.stderr_output = DrainFd(err_pipe.read_end());

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return SpawnFailure("waitpid failed");
    }
  }
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }

  const std::vector<std::string> arguments(argv.begin() + 1, argv.end());
  orchestrator::PublishEvent(orchestrator::EventCategory::kDiagnostics,
                             orchestrator::EventSeverity::kDebug, "command_executed",
                             "External command finished",
                             {orchestrator::EventField("program", argv.front()),
                              orchestrator::EventField("arguments", FormatCommandLine(arguments),
                                                       orchestrator::FieldPrivacy::kHash),
                              orchestrator::EventField("exit_code", std::to_string(result.exit_code),
                                                       orchestrator::FieldPrivacy::kPublic, true)});
  return result;
}

} // namespace sq::platform
