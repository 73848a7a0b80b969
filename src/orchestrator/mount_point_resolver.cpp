#include "sq/orchestrator/mount_point_resolver.h"

#include <system_error>

#include "sq/common.h"
#include "sq/core/path_normalizer.h"
#include "sq/error.h"
#include "sq/errors.h"
#include "sq/orchestrator/event_bus.h"
#include "sq/platform/mount_table.h"

namespace sq::orchestrator {
namespace {

[[noreturn]] void ThrowMountPointError(std::string_view message, const std::filesystem::path& path,
                                       std::optional<int> native = std::nullopt) {
  throw Error{ErrorDomain::Validation, errors::validation::kMountPointUnusable,
              std::string(message) + ": " + PathToUtf8String(path), native};
}

} // namespace

MountPointResolver::MountPointResolver(std::string mount_base) : mount_base_(std::move(mount_base)) {}

ResolvedMountTarget MountPointResolver::Plan(
    const std::filesystem::path& archive,
    const std::optional<std::filesystem::path>& explicit_mount_point,
    const std::filesystem::path& working_dir) const {
  ResolvedMountTarget target;
  if (explicit_mount_point) {
    target.mount_point = core::NormalizeLenient(*explicit_mount_point);
    target.auto_created = false;
    return target;
  }
  const std::string stem = core::ArchiveStem(archive);
  if (stem.empty()) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidPath,
                std::string(errors::msg::kFailedToNormalizePath) + ": " + PathToUtf8String(archive)};
  }
  target.mount_point = core::NormalizeLenient(working_dir / mount_base_ / stem);
  target.auto_created = true;
  return target;
}

void MountPointResolver::Prepare(ResolvedMountTarget& target, bool owned_by_same_archive) const {
  const auto& mount_point = target.mount_point;
  std::error_code ec;
  const auto status = std::filesystem::status(mount_point, ec);
  if (std::filesystem::exists(status)) {
    if (!std::filesystem::is_directory(status)) {
      ThrowMountPointError(errors::msg::kMountPointNotDirectory, mount_point);
    }
    if (!owned_by_same_archive && !platform::IsEmptyDirectory(mount_point)) {
      ThrowMountPointError(errors::msg::kMountPointNotEmpty, mount_point);
    }
    target.created_now = false;
    return;
  }

  target.parent_created_now = !std::filesystem::exists(mount_point.parent_path(), ec);
  std::filesystem::create_directories(mount_point, ec);
  if (ec) {
    ThrowMountPointError(errors::msg::kMountPointCreateFailed, mount_point, ec.value());
  }
  target.created_now = true;
  PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "mount_point_created",
               "Created mount point directory",
               {EventField("mount_point", PathToUtf8String(mount_point)),
                EventField("auto_created", target.auto_created ? "true" : "false")});
}

} // namespace sq::orchestrator
