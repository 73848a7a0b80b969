#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace sq::orchestrator {

// Mount point chosen for one mount request. Never persisted.
struct ResolvedMountTarget {
  std::filesystem::path mount_point;
  bool auto_created{false};  // derived under mount_base; eligible for cleanup
  bool created_now{false};   // directory did not exist before Prepare
  bool parent_created_now{false};
};

class MountPointResolver {
 public:
  explicit MountPointResolver(std::string mount_base);

  // Picks the target without creating anything. An explicit mount point
  // is normalized; otherwise <working_dir>/<mount_base>/<archive stem>.
  ResolvedMountTarget Plan(const std::filesystem::path& archive,
                           const std::optional<std::filesystem::path>& explicit_mount_point,
                           const std::filesystem::path& working_dir) const;

  // Makes the planned directory usable, creating it when missing. A target that
  // is not a directory or holds unrelated contents is a MountPointError;
  // `owned_by_same_archive` lets the archive's own recorded mount point through.
  void Prepare(ResolvedMountTarget& target, bool owned_by_same_archive) const;

 private:
  std::string mount_base_;
};

} // namespace sq::orchestrator
