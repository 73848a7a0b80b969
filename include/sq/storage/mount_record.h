#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "sq/core/archive_key.h"

namespace sq::storage {

// Durable proof that an archive is mounted at a directory.
struct MountRecord {
  core::ArchiveKey archive_key;
  std::filesystem::path archive_path;
  std::filesystem::path mount_point;
  bool auto_created{false};
  std::chrono::system_clock::time_point created_at{};
};

inline constexpr std::string_view kMountRecordHeader{"squish-mount-record 1"};

std::string SerializeMountRecord(const MountRecord& record);

// Returns nullopt for anything that is not a complete, well-formed record.
std::optional<MountRecord> ParseMountRecord(std::string_view text);

} // namespace sq::storage
