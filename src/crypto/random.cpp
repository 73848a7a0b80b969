#include "sq/crypto/random.h"

#include <cerrno>
#include <fstream>
#include <vector>

#include <sys/random.h>
#include <unistd.h>

#include "sq/common.h"
#include "sq/error.h"

namespace sq::crypto {

void SystemRandomBytes(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
  size_t offset = 0;
  while (offset < out.size()) {
    ssize_t result = ::getrandom(out.data() + offset, out.size() - offset, GRND_NONBLOCK);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == ENOSYS) {
        break; // fall back to /dev/urandom below
      }
      throw Error(ErrorDomain::Crypto, errors::crypto::kRandomFailed, "getrandom failed", errno);
    }
    offset += static_cast<size_t>(result);
  }
  if (offset == out.size()) {
    return;
  }
  std::ifstream urandom("/dev/urandom", std::ios::binary);
  urandom.read(reinterpret_cast<char*>(out.data() + offset),
               static_cast<std::streamsize>(out.size() - offset));
  if (!urandom || urandom.gcount() != static_cast<std::streamsize>(out.size() - offset)) {
    throw Error(ErrorDomain::Crypto, errors::crypto::kRandomFailed, "/dev/urandom read failed");
  }
}

std::string RandomToken(size_t bytes) {
  std::vector<uint8_t> random(bytes);
  SystemRandomBytes(std::span<uint8_t>(random.data(), random.size()));
  return HexEncode(std::span<const uint8_t>(random.data(), random.size()));
}

} // namespace sq::crypto
