#pragma once

#include <filesystem>
#include <string>

namespace sq::core {

// Identifier of an archive for tracking purposes: SHA-256 (hex) of the
// normalized absolute archive path. Distinct files sharing a basename get
// distinct keys.
struct ArchiveKey {
  std::string value;

  [[nodiscard]] bool empty() const noexcept { return value.empty(); }
  friend bool operator==(const ArchiveKey&, const ArchiveKey&) = default;
};

inline constexpr size_t kArchiveKeyLength = 64;

// `normalized_archive` must already be the output of the path normalizer.
ArchiveKey DeriveArchiveKey(const std::filesystem::path& normalized_archive);

// True when `text` has the shape of a derived key (64 lowercase hex chars).
bool IsWellFormedArchiveKey(const std::string& text) noexcept;

} // namespace sq::core
