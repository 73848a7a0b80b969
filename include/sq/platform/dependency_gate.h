#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sq::platform {

// Checks that external helpers can be executed before anything is mutated.
class DependencyGate {
 public:
  explicit DependencyGate(std::vector<std::filesystem::path> search_dirs);

  // Search directories taken from $PATH.
  static DependencyGate FromEnvironment();

  // Names containing '/' are checked as given; bare names are searched.
  std::optional<std::filesystem::path> Locate(const std::string& tool) const;

  // Throws Dependency/kToolMissing naming the first absent tool.
  void Require(const std::vector<std::string>& tools) const;

  const std::vector<std::filesystem::path>& search_dirs() const noexcept { return search_dirs_; }

 private:
  std::vector<std::filesystem::path> search_dirs_;
};

std::vector<std::filesystem::path> SplitSearchPath(const std::string& value);

} // namespace sq::platform
