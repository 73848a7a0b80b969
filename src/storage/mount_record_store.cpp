#include "sq/storage/mount_record_store.h"

#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

#include "sq/common.h"
#include "sq/error.h"
#include "sq/errors.h"
#include "sq/orchestrator/event_bus.h"
#include "sq/orchestrator/io_util.h"

namespace sq::storage {
namespace {

constexpr const char* kRecordSuffix = ".mounted";
constexpr size_t kMaxRecordBytes = 64 * 1024;

std::optional<std::string> ReadSmallFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::string content;
  content.reserve(512);
  char buffer[4096];
  while (in.read(buffer, sizeof(buffer)) || in.gcount() > 0) {
    content.append(buffer, static_cast<size_t>(in.gcount()));
    if (content.size() > kMaxRecordBytes) {
      return std::nullopt;
    }
  }
  if (in.bad()) {
    return std::nullopt;
  }
  return content;
}

std::optional<MountRecord> ReadRecordFile(const std::filesystem::path& path) {
  auto content = ReadSmallFile(path);
  if (!content) {
    return std::nullopt;
  }
  return ParseMountRecord(*content);
}

void PublishCorruptRecord(const std::filesystem::path& path) {
  orchestrator::PublishEvent(orchestrator::EventCategory::kDiagnostics,
                             orchestrator::EventSeverity::kWarning, "mount_record_corrupt",
                             "Ignoring unreadable mount record",
                             {orchestrator::EventField("record", PathToUtf8String(path))});
}

} // namespace

MountRecordStore::MountRecordStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path MountRecordStore::RecordPath(const core::ArchiveKey& key) const {
  return directory_ / (key.value + kRecordSuffix);
}

std::optional<MountRecord> MountRecordStore::Lookup(const core::ArchiveKey& key) const noexcept {
  if (!core::IsWellFormedArchiveKey(key.value)) {
    return std::nullopt;
  }
  try {
    const auto path = RecordPath(key);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
      return std::nullopt;
    }
    auto record = ReadRecordFile(path);
    if (!record || record->archive_key != key) {
      PublishCorruptRecord(path);
      return std::nullopt;
    }
    return record;
  } catch (const std::exception&) {
    return std::nullopt; // allocation failure while reading: treat as absent
  }
}

void MountRecordStore::EnsureDirectory() {
  try {
    orchestrator::EnsurePrivateDirectory(directory_);
  } catch (const Error& err) {
    throw Error{ErrorDomain::IO, errors::io::kTrackingWriteFailed,
                std::string(errors::msg::kTrackingDirFailed) + ": " + err.what(), err.native_code};
  }
}

void MountRecordStore::CheckMountPointFree(const MountRecord& record) const {
  if (auto owner = FindByMountPoint(record.mount_point, record.archive_key)) {
    throw Error{ErrorDomain::State, errors::state::kMountConflict,
                std::string(errors::msg::kMountConflict) + ": " +
                    PathToUtf8String(record.mount_point) + " (" +
                    PathToUtf8String(owner->archive_path) + ")"};
  }
}

void MountRecordStore::Insert(const MountRecord& record) {
  CheckMountPointFree(record);
  EnsureDirectory();
  const auto path = RecordPath(record.archive_key);
  const std::string payload = SerializeMountRecord(record);
  if (orchestrator::AtomicCreate(path, AsBytes(payload))) {
    return;
  }
  if (Lookup(record.archive_key)) {
    throw Error{ErrorDomain::State, errors::state::kAlreadyMounted,
                std::string(errors::msg::kAlreadyMounted) + ": " +
                    PathToUtf8String(record.archive_path)};
  }
  // The existing entry is corrupt; it carries no information worth keeping.
  orchestrator::AtomicReplace(path, AsBytes(payload));
}

void MountRecordStore::Replace(const MountRecord& record) {
  CheckMountPointFree(record);
  EnsureDirectory();
  const std::string payload = SerializeMountRecord(record);
  orchestrator::AtomicReplace(RecordPath(record.archive_key), AsBytes(payload));
}

void MountRecordStore::Remove(const core::ArchiveKey& key) {
  const auto path = RecordPath(key);
  std::error_code ec;
  const bool removed = std::filesystem::remove(path, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, errors::io::kTrackingRemoveFailed,
                std::string(errors::msg::kTrackingRemoveFailed) + ": " + PathToUtf8String(path) +
                    ": " + ec.message(),
                ec.value()};
  }
  if (!removed) {
    throw Error{ErrorDomain::State, errors::state::kNotMounted,
                std::string(errors::msg::kNotMounted)};
  }
}

std::vector<MountRecord> MountRecordStore::List() const {
  std::vector<MountRecord> records;
  std::error_code ec;
  std::filesystem::directory_iterator it(directory_, ec);
  if (ec) {
    return records; // no directory yet means nothing is mounted
  }
  for (const auto& entry : it) {
    const auto& path = entry.path();
    if (path.extension() != kRecordSuffix) {
      continue;
    }
    const auto stem = path.stem().string();
    if (!core::IsWellFormedArchiveKey(stem)) {
      continue; // staging files and strays
    }
    auto record = ReadRecordFile(path);
    if (!record || record->archive_key.value != stem) {
      continue;
    }
    records.push_back(std::move(*record));
  }
  return records;
}

std::optional<MountRecord> MountRecordStore::FindByMountPoint(
    const std::filesystem::path& mount_point, const core::ArchiveKey& except) const {
  for (auto& record : List()) {
    if (!except.empty() && record.archive_key == except) {
      continue;
    }
    if (record.mount_point == mount_point) {
      return record;
    }
  }
  return std::nullopt;
}

} // namespace sq::storage
