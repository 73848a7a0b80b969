#pragma once

#include <filesystem>
#include <optional>
#include <vector>

#include "sq/core/archive_key.h"
#include "sq/storage/mount_record.h"

namespace sq::storage {

// One file per archive key under a private directory. Operations on different
// keys touch different files and never contend.
class MountRecordStore {
 public:
  explicit MountRecordStore(std::filesystem::path directory);

  // Never throws. Unreadable, corrupt or mismatched entries read as absent.
  std::optional<MountRecord> Lookup(const core::ArchiveKey& key) const noexcept;

  // Throws State/kMountConflict when another key owns the same mount point and
  // State/kAlreadyMounted when a valid record exists for this key.
  void Insert(const MountRecord& record);

  // Overwrites whatever is stored for the record's key. Used to repair stale
  // entries; the mount point conflict check still applies.
  void Replace(const MountRecord& record);

  // Throws State/kNotMounted when nothing is stored for `key`.
  void Remove(const core::ArchiveKey& key);

  std::vector<MountRecord> List() const;

  // First record (other than `except`) whose mount point equals `mount_point`.
  std::optional<MountRecord> FindByMountPoint(const std::filesystem::path& mount_point,
                                              const core::ArchiveKey& except = {}) const;

  std::filesystem::path RecordPath(const core::ArchiveKey& key) const;
  const std::filesystem::path& directory() const noexcept { return directory_; }

 private:
  void EnsureDirectory();
  void CheckMountPointFree(const MountRecord& record) const;

  std::filesystem::path directory_;
};

} // namespace sq::storage
