#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace sq::crypto {

void SystemRandomBytes(std::span<uint8_t> out);

// Hex token built from `bytes` random bytes.
std::string RandomToken(size_t bytes = 16);

} // namespace sq::crypto
