#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>

#include "sq/error.h"

namespace sq::orchestrator {

struct AtomicReplaceHooks { // test seam for crash simulation
  std::function<void(const std::filesystem::path&, const std::filesystem::path&)> before_rename;
};

// Performs an atomic replace of the target file by writing the payload to a
// temporary file on the same filesystem, syncing it to disk, then renaming it
// into place.
void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks = {});

// Same staging as AtomicReplace but publishes with link(2), so an existing
// target is never clobbered. Returns false (and leaves the target untouched)
// when the target already exists.
[[nodiscard]] bool AtomicCreate(const std::filesystem::path& target,
                                std::span<const uint8_t> payload);

// Creates `dir` (and parents) with owner-only permissions on the leaf.
void EnsurePrivateDirectory(const std::filesystem::path& dir);

} // namespace sq::orchestrator
