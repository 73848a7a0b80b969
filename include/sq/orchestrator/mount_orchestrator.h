#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "sq/core/archive_key.h"
#include "sq/orchestrator/config.h"
#include "sq/orchestrator/mount_point_resolver.h"
#include "sq/platform/dependency_gate.h"
#include "sq/platform/process_runner.h"
#include "sq/storage/mount_record_store.h"

namespace sq::orchestrator {

struct MountResult {
  std::filesystem::path archive_path;
  std::filesystem::path mount_point;
  core::ArchiveKey archive_key;
  bool auto_created{false};
  bool replaced_stale_record{false};
};

struct UnmountResult {
  std::filesystem::path archive_path;
  std::filesystem::path mount_point;
  bool directory_removed{false};
  bool stale{false};  // record cleared without running the unmount helper
};

// Drives mount and unmount across process invocations. All durable state is in
// the record store; a failed operation leaves the state it started from.
class MountOrchestrator {
 public:
  MountOrchestrator(Config config, platform::CommandRunner& runner, platform::DependencyGate gate,
                    storage::MountRecordStore store);

  MountResult Mount(const std::filesystem::path& archive,
                    const std::optional<std::filesystem::path>& mount_point = std::nullopt);

  UnmountResult Unmount(const std::filesystem::path& archive,
                        const std::optional<std::filesystem::path>& mount_point = std::nullopt);

 private:
  MountResult MountImpl(const std::filesystem::path& archive,
                        const std::optional<std::filesystem::path>& mount_point);
  UnmountResult UnmountImpl(const std::filesystem::path& archive,
                            const std::optional<std::filesystem::path>& mount_point);

  // Removes an auto-created directory if empty, and its mount_base parent
  // when that is left empty too. Failures become warning events.
  bool CleanupMountPoint(const std::filesystem::path& mount_point, bool remove_parent);

  Config config_;
  platform::CommandRunner& runner_;
  platform::DependencyGate gate_;
  storage::MountRecordStore store_;
  MountPointResolver resolver_;
};

} // namespace sq::orchestrator
