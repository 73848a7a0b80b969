#include "sq/crypto/sha256.h"

#include <openssl/err.h>
#include <openssl/evp.h>

#include "sq/common.h"
#include "sq/error.h"

namespace sq::crypto {
namespace {

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

} // namespace

std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data) {
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
    throw Error{ErrorDomain::Crypto, errors::crypto::kDigestFailed,
                BuildOpenSSLErrorMessage("EVP_Digest(EVP_sha256)")};
  }
  if (len != out.size()) {
    throw Error{ErrorDomain::Crypto, errors::crypto::kDigestFailed, "Unexpected SHA-256 length",
                static_cast<int>(len)};
  }
  return out;
}

std::array<uint8_t, 32> SHA256_Hash(std::string_view text) {
  return SHA256_Hash(AsBytes(text));
}

std::string SHA256_Hex(std::string_view text) {
  const auto digest = SHA256_Hash(text);
  return HexEncode(std::span<const uint8_t>(digest.data(), digest.size()));
}

} // namespace sq::crypto
