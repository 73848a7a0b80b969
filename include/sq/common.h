#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace sq {

inline std::string PathToUtf8String(const std::filesystem::path& path) {
  return path.string();
}

inline std::string HexEncode(std::span<const uint8_t> bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string encoded;
  encoded.reserve(bytes.size() * 2);
  for (auto byte : bytes) {
    encoded.push_back(kHex[(byte >> 4) & 0x0F]);
    encoded.push_back(kHex[byte & 0x0F]);
  }
  return encoded;
}

inline std::span<const uint8_t> AsBytes(std::string_view text) noexcept {
  return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

} // namespace sq
