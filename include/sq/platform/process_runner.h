#pragma once

#include <string>
#include <vector>

namespace sq::platform {

struct CommandResult {
  int exit_code{-1};  // 128+signal for signalled children, -1 when nothing ran
  std::string stderr_output;

  [[nodiscard]] bool ok() const noexcept { return exit_code == 0; }
};

// Subprocess seam. The orchestrator only ever talks to this interface.
class CommandRunner {
 public:
  virtual ~CommandRunner() = default;
  virtual CommandResult Run(const std::vector<std::string>& argv) = 0;
};

// fork/execvp runner. stdout is inherited, stderr is captured.
class SubprocessRunner final : public CommandRunner {
 public:
  CommandResult Run(const std::vector<std::string>& argv) override;
};

// Shell-style rendering of argv for messages and events.
std::string FormatCommandLine(const std::vector<std::string>& argv);

} // namespace sq::platform
