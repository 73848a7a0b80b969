#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace sq::platform {

// Mount points listed in /proc/self/mountinfo, with octal escapes decoded.
// Empty when the table cannot be read.
std::vector<std::filesystem::path> ReadMountPoints(const std::filesystem::path& table =
                                                       "/proc/self/mountinfo");

bool IsListedMountPoint(const std::filesystem::path& path,
                        const std::filesystem::path& table = "/proc/self/mountinfo");

// True for an existing directory with no entries.
bool IsEmptyDirectory(const std::filesystem::path& path);

// A directory "looks mounted" when the kernel lists it or it has contents.
bool LooksMounted(const std::filesystem::path& path);

// Decodes the \NNN escapes the kernel uses for spaces and tabs in paths.
std::string DecodeMountInfoField(const std::string& field);

} // namespace sq::platform
