#include "sq/orchestrator/mount_orchestrator.h"

#include <chrono>
#include <system_error>

#include "sq/common.h"
#include "sq/core/path_normalizer.h"
#include "sq/error.h"
#include "sq/errors.h"
#include "sq/orchestrator/event_bus.h"
#include "sq/platform/mount_table.h"

namespace sq::orchestrator {
namespace {

EventField PathField(std::string key, const std::filesystem::path& path) {
  return EventField(std::move(key), PathToUtf8String(path));
}

void PublishFailure(const char* event_id, const std::filesystem::path& archive, const Error& err) {
  std::vector<EventField> fields{PathField("archive", archive),
                                 EventField("code", std::to_string(err.code),
                                            FieldPrivacy::kPublic, true),
                                 EventField("error", err.what())};
  if (err.command) {
    fields.emplace_back("command", err.command->command);
    fields.emplace_back("exit_code", std::to_string(err.command->exit_code), FieldPrivacy::kPublic,
                        true);
    fields.emplace_back("stderr", err.command->stderr_output);
  }
  PublishEvent(EventCategory::kLifecycle, EventSeverity::kError, event_id, "Operation failed",
               std::move(fields));
}

Error CommandError(int code, std::string_view message, const std::vector<std::string>& argv,
                   const platform::CommandResult& result) {
  CommandFailure failure;
  failure.command = platform::FormatCommandLine(argv);
  failure.exit_code = result.exit_code;
  failure.stderr_output = result.stderr_output;
  std::string text = std::string(message) + ": " + failure.command + " exited with " +
                     std::to_string(result.exit_code);
  if (!result.stderr_output.empty()) {
    text += ": " + result.stderr_output;
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
      text.pop_back();
    }
  }
  PublishEvent(EventCategory::kDiagnostics, EventSeverity::kWarning, "command_failed",
               "External command failed",
               {EventField("command", failure.command),
                EventField("exit_code", std::to_string(result.exit_code), FieldPrivacy::kPublic,
                           true)});
  return MakeCommandError(code, std::move(text), std::move(failure));
}

} // namespace

MountOrchestrator::MountOrchestrator(Config config, platform::CommandRunner& runner,
                                     platform::DependencyGate gate, storage::MountRecordStore store)
    : config_(std::move(config)),
      runner_(runner),
      gate_(std::move(gate)),
      store_(std::move(store)),
      resolver_(config_.mount_base) {}


MountResult MountOrchestrator::Mount(const std::filesystem::path& archive,
                                     const std::optional<std::filesystem::path>& mount_point) {
  PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "mount_started", "Mount requested",
               {PathField("archive", archive)});
  try {
    auto result = MountImpl(archive, mount_point);
    PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "mount_succeeded",
                 "Archive mounted",
                 {PathField("archive", result.archive_path),
                  PathField("mount_point", result.mount_point),
                  EventField("archive_key", result.archive_key.value)});
    return result;
  } catch (const Error& err) {
    PublishFailure("mount_failed", archive, err);
    throw;
  }
}

MountResult MountOrchestrator::MountImpl(const std::filesystem::path& archive_arg,
                                         const std::optional<std::filesystem::path>& mount_point_arg) {
  const auto archive = core::NormalizeArchive(archive_arg);
  gate_.Require({config_.mount_helper});

  const auto key = core::DeriveArchiveKey(archive);
  const auto existing = store_.Lookup(key);
  if (existing) {
    if (platform::LooksMounted(existing->mount_point)) {
      throw Error{ErrorDomain::State, errors::state::kAlreadyMounted,
                  std::string(errors::msg::kAlreadyMounted) + ": " + PathToUtf8String(archive) +
                      " -> " + PathToUtf8String(existing->mount_point)};
    }
    PublishEvent(EventCategory::kLifecycle, EventSeverity::kWarning, "mount_record_stale",
                 "Existing mount record is stale and will be replaced",
                 {PathField("archive", archive), PathField("mount_point", existing->mount_point)});
  }

  auto target = resolver_.Plan(archive, mount_point_arg, core::CurrentWorkingDirectory());
  if (auto owner = store_.FindByMountPoint(target.mount_point, key)) {
    throw Error{ErrorDomain::State, errors::state::kMountConflict,
                std::string(errors::msg::kMountConflict) + ": " +
                    PathToUtf8String(target.mount_point) + " (" +
                    PathToUtf8String(owner->archive_path) + ")"};
  }
  const bool own_mount_point = existing && existing->mount_point == target.mount_point;
  resolver_.Prepare(target, own_mount_point);

  const std::vector<std::string> argv{config_.mount_helper, "-o", "ro", PathToUtf8String(archive),
                                      PathToUtf8String(target.mount_point)};
  const auto outcome = runner_.Run(argv);
  if (!outcome.ok()) {
    if (target.created_now) {
      CleanupMountPoint(target.mount_point, target.auto_created && target.parent_created_now);
    }
    throw CommandError(errors::io::kMountCommandFailed, errors::msg::kMountFailed, argv, outcome);
  }

  storage::MountRecord record;
  record.archive_key = key;
  record.archive_path = archive;
  record.mount_point = target.mount_point;
  record.auto_created = target.auto_created;
  record.created_at = std::chrono::system_clock::now();
  if (existing) {
    store_.Replace(record);
  } else {
    try {
      store_.Insert(record);
    } catch (const Error& err) {
      if (!IsError(err, errors::state::kAlreadyMounted)) {
        throw;
      }
      // Another invocation recorded this archive first. Its mount stays as is.
      PublishEvent(EventCategory::kLifecycle, EventSeverity::kWarning, "mount_record_race",
                   "Archive was recorded concurrently; keeping the existing record",
                   {PathField("archive", archive), PathField("mount_point", target.mount_point)});
    }
  }

  MountResult result;
  result.archive_path = archive;
  result.mount_point = target.mount_point;
  result.archive_key = key;
  result.auto_created = target.auto_created;
  result.replaced_stale_record = existing.has_value();
  return result;
}

UnmountResult MountOrchestrator::Unmount(const std::filesystem::path& archive,
                                         const std::optional<std::filesystem::path>& mount_point) {
  PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "unmount_started",
               "Unmount requested", {PathField("archive", archive)});
  try {
    auto result = UnmountImpl(archive, mount_point);
    PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "unmount_succeeded",
                 "Archive unmounted",
                 {PathField("archive", result.archive_path),
                  PathField("mount_point", result.mount_point),
                  EventField("stale", result.stale ? "true" : "false"),
                  EventField("directory_removed", result.directory_removed ? "true" : "false")});
    return result;
  } catch (const Error& err) {
    PublishFailure("unmount_failed", archive, err);
    throw;
  }
}

UnmountResult MountOrchestrator::UnmountImpl(
    const std::filesystem::path& archive_arg,
    const std::optional<std::filesystem::path>& mount_point_arg) {
  // The archive file may be gone by now; only its path identifies the mount.
  const auto archive = core::NormalizeLenient(archive_arg);
  const auto key = core::DeriveArchiveKey(archive);
  const auto record = store_.Lookup(key);
  if (!record) {
    throw Error{ErrorDomain::State, errors::state::kNotMounted,
                std::string(errors::msg::kNotMounted) + ": " + PathToUtf8String(archive)};
  }
  gate_.Require({config_.unmount_helper});

  UnmountResult result;
  result.archive_path = archive;
  result.mount_point = mount_point_arg ? core::NormalizeLenient(*mount_point_arg)
                                       : record->mount_point;
  const bool targets_recorded = result.mount_point == record->mount_point;
  const bool may_cleanup = config_.auto_cleanup && record->auto_created && targets_recorded;

  std::error_code ec;
  const bool exists = std::filesystem::exists(result.mount_point, ec);
  if (mount_point_arg) {
    if (!exists) {
      throw Error{ErrorDomain::Validation, errors::validation::kMountPointUnusable,
                  std::string(errors::msg::kMountPointMissing) + ": " +
                      PathToUtf8String(result.mount_point)};
    }
    if (!platform::LooksMounted(result.mount_point)) {
      throw Error{ErrorDomain::Validation, errors::validation::kMountPointUnusable,
                  std::string(errors::msg::kMountPointNothingToUnmount) + ": " +
                      PathToUtf8String(result.mount_point)};
    }
  } else if (!exists || !platform::LooksMounted(result.mount_point)) {
    // Unmounted behind our back: drop the record instead of running the helper.
    store_.Remove(key);
    PublishEvent(EventCategory::kLifecycle, EventSeverity::kWarning,
                 "unmount_stale_record_cleared", "Mount point was already unmounted",
                 {PathField("archive", archive), PathField("mount_point", result.mount_point)});
    result.stale = true;
    if (exists && may_cleanup) {
      result.directory_removed = CleanupMountPoint(result.mount_point, true);
    }
    return result;
  }

  const std::vector<std::string> argv{config_.unmount_helper, "-u",
                                      PathToUtf8String(result.mount_point)};
  const auto outcome = runner_.Run(argv);
  if (!outcome.ok()) {
    throw CommandError(errors::io::kUnmountCommandFailed, errors::msg::kUnmountFailed, argv,
                       outcome);
  }

  store_.Remove(key);
  if (may_cleanup) {
    result.directory_removed = CleanupMountPoint(result.mount_point, true);
  }
  return result;
}

bool MountOrchestrator::CleanupMountPoint(const std::filesystem::path& mount_point,
                                          bool remove_parent) {
  auto remove_empty = [](const std::filesystem::path& dir) {
    if (!platform::IsEmptyDirectory(dir)) {
      return false;
    }
    std::error_code ec;
    std::filesystem::remove(dir, ec);
    if (ec) {
      PublishEvent(EventCategory::kLifecycle, EventSeverity::kWarning,
                   "mount_point_cleanup_failed", "Could not remove mount point directory",
                   {PathField("directory", dir), EventField("error", ec.message()),
                    EventField("errno", std::to_string(ec.value()), FieldPrivacy::kPublic, true)});
      return false;
    }
    PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "mount_point_cleanup",
                 "Removed mount point directory", {PathField("directory", dir)});
    return true;
  };

  if (!remove_empty(mount_point)) {
    return false;
  }
  if (remove_parent) {
    const auto parent = mount_point.parent_path();
    if (parent.filename() == std::filesystem::path(config_.mount_base).filename()) {
      remove_empty(parent);
    }
  }
  return true;
}

} // namespace sq::orchestrator
