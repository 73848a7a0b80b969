#pragma once

#include <filesystem>
#include <string>

namespace sq::core {

// Canonical absolute form of an existing path: `.`/`..` segments and symlinks
// resolved. Throws Validation/kInvalidPath when the path is empty or missing.
std::filesystem::path NormalizeExisting(const std::filesystem::path& path);

// Like NormalizeExisting but tolerates a missing tail: the longest existing
// prefix is resolved and the remainder appended lexically.
std::filesystem::path NormalizeLenient(const std::filesystem::path& path);

// Normalizes an archive reference for a mount. The archive must exist and be
// a regular file.
std::filesystem::path NormalizeArchive(const std::filesystem::path& path);

// Filename with its final extension removed ("release-1.2.sqsh" -> "release-1.2").
// Leading dots and a trailing dot do not start an extension.
std::string ArchiveStem(const std::filesystem::path& archive);

std::filesystem::path CurrentWorkingDirectory();

} // namespace sq::core
