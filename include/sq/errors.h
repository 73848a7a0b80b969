#pragma once

#include <string_view>

namespace sq::errors::msg {
// Centralized message catalog
inline constexpr std::string_view kArchiveNotFound{"Archive not found"};
inline constexpr std::string_view kArchiveNotAFile{"Archive is not a regular file"};
inline constexpr std::string_view kPathEmpty{"Path cannot be empty"};
inline constexpr std::string_view kFailedToNormalizePath{"Failed to normalize path"};
inline constexpr std::string_view kUnableToResolveWorkingDirectory{"Unable to resolve working directory"};
inline constexpr std::string_view kAlreadyMounted{"Archive is already mounted"};
inline constexpr std::string_view kNotMounted{"File is not mounted"};
inline constexpr std::string_view kMountConflict{"Mount point is already used by another archive"};
inline constexpr std::string_view kMountPointNotEmpty{"Mount point is not empty"};
inline constexpr std::string_view kMountPointNotDirectory{"Mount point is not a directory"};
inline constexpr std::string_view kMountPointMissing{"Mount point does not exist"};
inline constexpr std::string_view kMountPointNothingToUnmount{"Mount point is empty, nothing to unmount"};
inline constexpr std::string_view kMountPointCreateFailed{"Failed to create mount point"};
inline constexpr std::string_view kMountFailed{"Failed to mount archive"};
inline constexpr std::string_view kUnmountFailed{"Failed to unmount archive"};
inline constexpr std::string_view kTrackingDirFailed{"Failed to prepare tracking directory"};
inline constexpr std::string_view kTrackingWriteFailed{"Could not write mount record"};
inline constexpr std::string_view kTrackingRemoveFailed{"Could not remove mount record"};
inline constexpr std::string_view kToolMissingSuffix{"is not installed or not in PATH"};
inline constexpr std::string_view kTempDirMissing{"temp_dir does not exist"};
inline constexpr std::string_view kTempDirNotDirectory{"temp_dir is not a directory"};
inline constexpr std::string_view kConfigFileUnreadable{"Could not read config file"};
} // namespace sq::errors::msg
