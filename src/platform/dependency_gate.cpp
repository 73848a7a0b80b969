#include "sq/platform/dependency_gate.h"

#include <cstdlib>
#include <system_error>

#include <unistd.h>

#include "sq/common.h"
#include "sq/error.h"
#include "sq/errors.h"
#include "sq/orchestrator/event_bus.h"

namespace sq::platform {
namespace {

bool IsExecutableFile(const std::filesystem::path& candidate) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(candidate, ec)) {
    return false;
  }
  return ::access(candidate.c_str(), X_OK) == 0;
}

} // namespace

std::vector<std::filesystem::path> SplitSearchPath(const std::string& value) {
  std::vector<std::filesystem::path> dirs;
  size_t start = 0;
  while (start <= value.size()) {
    size_t end = value.find(':', start);
    if (end == std::string::npos) {
      end = value.size();
    }
    std::string entry = value.substr(start, end - start);
    // POSIX: an empty entry means the current directory.
    dirs.emplace_back(entry.empty() ? "." : entry);
    start = end + 1;
  }
  return dirs;
}

DependencyGate::DependencyGate(std::vector<std::filesystem::path> search_dirs)
    : search_dirs_(std::move(search_dirs)) {}

DependencyGate DependencyGate::FromEnvironment() {
  const char* path = std::getenv("PATH");
  if (!path || *path == '\0') {
    return DependencyGate({"/usr/local/bin", "/usr/bin", "/bin"});
  }
  return DependencyGate(SplitSearchPath(path));
}

std::optional<std::filesystem::path> DependencyGate::Locate(const std::string& tool) const {
  if (tool.empty()) {
    return std::nullopt;
  }
  if (tool.find('/') != std::string::npos) {
    if (IsExecutableFile(tool)) {
      return std::filesystem::path(tool);
    }
    return std::nullopt;
  }
  for (const auto& dir : search_dirs_) {
    auto candidate = dir / tool;
    if (IsExecutableFile(candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

void DependencyGate::Require(const std::vector<std::string>& tools) const {
  for (const auto& tool : tools) {
    if (auto found = Locate(tool)) {
      orchestrator::PublishEvent(orchestrator::EventCategory::kDiagnostics,
                                 orchestrator::EventSeverity::kDebug, "dependency_available",
                                 "Required tool found",
                                 {orchestrator::EventField("tool", tool),
                                  orchestrator::EventField("path", PathToUtf8String(*found))});
      continue;
    }
    orchestrator::PublishEvent(orchestrator::EventCategory::kDiagnostics,
                               orchestrator::EventSeverity::kError, "dependency_missing",
                               "Required tool not found", {orchestrator::EventField("tool", tool)});
    throw Error{ErrorDomain::Dependency, errors::dependency::kToolMissing,
                tool + " " + std::string(errors::msg::kToolMissingSuffix)};
  }
}

} // namespace sq::platform
