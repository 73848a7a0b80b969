#include "sq/core/archive_key.h"

#include "sq/common.h"
#include "sq/crypto/sha256.h"

namespace sq::core {

ArchiveKey DeriveArchiveKey(const std::filesystem::path& normalized_archive) {
  return ArchiveKey{sq::crypto::SHA256_Hex(PathToUtf8String(normalized_archive))};
}

bool IsWellFormedArchiveKey(const std::string& text) noexcept {
  if (text.size() != kArchiveKeyLength) {
    return false;
  }
  for (char ch : text) {
    const bool digit = ch >= '0' && ch <= '9';
    const bool lower_hex = ch >= 'a' && ch <= 'f';
    if (!digit && !lower_hex) {
      return false;
    }
  }
  return true;
}

} // namespace sq::core
