#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sq {
  enum class ErrorDomain : std::uint16_t {
    IO = 0x02,
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    Dependency = 0x06,
    State = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves 0x100 codes so they never collide with errno values.
  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::Dependency:
      return 0x0600;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0;
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    // Helper to construct reserved error codes.
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace io {
      inline constexpr int kMountCommandFailed = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kUnmountCommandFailed = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kTrackingWriteFailed = Make(ErrorDomain::IO, 0x03);
      inline constexpr int kTrackingRemoveFailed = Make(ErrorDomain::IO, 0x04);
      inline constexpr int kSpawnFailed = Make(ErrorDomain::IO, 0x05);
    } // namespace io

    namespace validation {
      inline constexpr int kInvalidPath = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kMountPointUnusable = Make(ErrorDomain::Validation, 0x02);
    } // namespace validation

    namespace dependency {
      inline constexpr int kToolMissing = Make(ErrorDomain::Dependency, 0x01);
    } // namespace dependency

    namespace state {
      inline constexpr int kAlreadyMounted = Make(ErrorDomain::State, 0x01);
      inline constexpr int kNotMounted = Make(ErrorDomain::State, 0x02);
      inline constexpr int kMountConflict = Make(ErrorDomain::State, 0x03);
    } // namespace state

    namespace config {
      inline constexpr int kInvalidValue = Make(ErrorDomain::Config, 0x01);
      inline constexpr int kTempDirMissing = Make(ErrorDomain::Config, 0x02);
      inline constexpr int kFileUnreadable = Make(ErrorDomain::Config, 0x03);
    } // namespace config

    namespace crypto {
      inline constexpr int kDigestFailed = Make(ErrorDomain::Crypto, 0x01);
      inline constexpr int kRandomFailed = Make(ErrorDomain::Crypto, 0x02);
    } // namespace crypto
  } // namespace errors

  // Shared payload of the mount and unmount helper failures.
  struct CommandFailure {
    std::string command;
    int exit_code{-1};
    std::string stderr_output;
  };

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    std::optional<CommandFailure> command;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };

  inline bool IsError(const Error& err, int code) noexcept { return err.code == code; }

  inline Error MakeCommandError(int code, std::string msg, CommandFailure failure) {
    Error err{ErrorDomain::IO, code, std::move(msg)};
    err.command = std::move(failure);
    return err;
  }
} // namespace sq
