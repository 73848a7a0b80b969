#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace sq::crypto {
std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data);
std::array<uint8_t, 32> SHA256_Hash(std::string_view text);

// Lowercase hex of the SHA-256 digest of `text`.
std::string SHA256_Hex(std::string_view text);
} // namespace sq::crypto
