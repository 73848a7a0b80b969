#include "sq/orchestrator/io_util.h"

#include "sq/common.h"
#include "sq/crypto/random.h"

#include <cerrno>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace sq::orchestrator {
namespace {

constexpr const char* kAtomicWriteErrorMessage = "Atomic file write failed";

class ErrorContext { // accumulate nested call context
 public:
  void Push(std::string context) { context_stack_.push_back(std::move(context)); }
  void Pop() {
    if (!context_stack_.empty()) {
      context_stack_.pop_back();
    }
  }

  [[nodiscard]] std::vector<std::string> Stack() const { return context_stack_; }

  [[nodiscard]] std::string Format(std::string message) const {
    if (context_stack_.empty()) {
      return message;
    }
    std::ostringstream oss;
    oss << message << " [";
    for (size_t i = 0; i < context_stack_.size(); ++i) {
      if (i != 0) {
        oss << " > ";
      }
      oss << context_stack_[i];
    }
    oss << "]";
    return oss.str();
  }

 private:
  std::vector<std::string> context_stack_;
};

class ScopedErrorContext {
 public:
  ScopedErrorContext(ErrorContext& ctx, std::string description) : ctx_(ctx) {
    ctx_.Push(std::move(description));
  }
  ScopedErrorContext(const ScopedErrorContext&) = delete;
  ScopedErrorContext& operator=(const ScopedErrorContext&) = delete;
  ~ScopedErrorContext() { ctx_.Pop(); }

 private:
  ErrorContext& ctx_;
};

sq::Retryability ClassifyNativeError(int native) {
  if (native == EINTR || native == EAGAIN || native == EBUSY) {
    return sq::Retryability::kTransient;
  }
  if (native == ETIMEDOUT) {
    return sq::Retryability::kRetryable;
  }
  return sq::Retryability::kFatal;
}

[[noreturn]] void ThrowIoError(const ErrorContext& ctx, int native, std::string message) {
  throw Error{ErrorDomain::IO, errors::io::kTrackingWriteFailed, ctx.Format(std::move(message)),
              native, ClassifyNativeError(native), ctx.Stack()};
}

void SyncDirectory(const std::filesystem::path& dir, const ErrorContext& ctx) {
  int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dir_fd < 0) {
    const int saved_errno = errno;
    ThrowIoError(ctx, saved_errno, std::string(kAtomicWriteErrorMessage) + ": open directory failed");
  }
  if (::fsync(dir_fd) != 0) {
    const int err = errno; // snapshot before close
    ::close(dir_fd);
    ThrowIoError(ctx, err, std::string(kAtomicWriteErrorMessage) + ": directory flush failed");
  }
  ::close(dir_fd);
}

void SyncFileWithRetry(int fd, const ErrorContext& ctx) {
  constexpr int kMaxRetries = 4;
  std::chrono::milliseconds backoff{5};
  for (int attempt = 0;; ++attempt) {
    if (::fsync(fd) == 0) {
      return;
    }
    const int saved_errno = errno;
    if (saved_errno == EINTR) {
      continue;
    }
    if (attempt >= kMaxRetries || ClassifyNativeError(saved_errno) == sq::Retryability::kFatal) {
      ThrowIoError(ctx, saved_errno, std::string(kAtomicWriteErrorMessage) + ": fsync failed");
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

void WriteAll(int fd, std::span<const uint8_t> payload, const ErrorContext& ctx) {
  size_t written = 0;
  while (written < payload.size()) {
    auto chunk = ::write(fd, payload.data() + written, payload.size() - written);
    if (chunk < 0) {
      const int saved_errno = errno;
      if (saved_errno == EINTR) {
        continue;
      }
      ThrowIoError(ctx, saved_errno, std::string(kAtomicWriteErrorMessage) + ": write failed");
    }
    if (chunk == 0) {
      ThrowIoError(ctx, 0, std::string(kAtomicWriteErrorMessage) + ": short write");
    }
    written += static_cast<size_t>(chunk);
  }
}

class TempFileGuard { // remove the staging file unless released
 public:
  explicit TempFileGuard(std::filesystem::path path) noexcept : path_(std::move(path)) {}
  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;
  ~TempFileGuard() noexcept {
    if (!path_.empty()) {
      std::error_code ec;
      if (!std::filesystem::remove(path_, ec) && ec) {
        std::cerr << "TempFileGuard cleanup failed for " << path_ << ": " << ec.message() << '\n';
      }
    }
  }

  void Release() noexcept { path_.clear(); }

 private:
  std::filesystem::path path_;
};

std::filesystem::path MakeTempPath(const std::filesystem::path& dir,
                                   const std::filesystem::path& base) {
  std::filesystem::path temp_name = base.filename();
  temp_name += ".tmp.";
  temp_name += sq::crypto::RandomToken();
  return dir / temp_name;
}

std::filesystem::path TargetDirectory(const std::filesystem::path& target, const ErrorContext& ctx) {
  auto dir = target.parent_path();
  if (!dir.empty()) {
    return dir;
  }
  std::error_code ec;
  dir = std::filesystem::current_path(ec);
  if (ec) {
    ThrowIoError(ctx, ec.value(), std::string(kAtomicWriteErrorMessage) + ": no working directory");
  }
  return dir;
}

// Writes `payload` to a fresh owner-only temp file beside `target` and syncs it.
void StagePayload(const std::filesystem::path& temp_path, std::span<const uint8_t> payload,
                  ErrorContext& ctx) {
  ScopedErrorContext scoped(ctx, "staging payload");
  int fd = ::open(temp_path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0600);
  if (fd < 0) {
    const int saved_errno = errno;
    ThrowIoError(ctx, saved_errno, std::string(kAtomicWriteErrorMessage) + ": open failed");
  }
  try {
    WriteAll(fd, payload, ctx);
    SyncFileWithRetry(fd, ctx);
  } catch (const Error&) {
    ::close(fd);
    throw;
  }
  if (::close(fd) != 0) {
    const int saved_errno = errno;
    ThrowIoError(ctx, saved_errno, std::string(kAtomicWriteErrorMessage) + ": close failed");
  }
}

} // namespace

void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks) {
  ErrorContext ctx;
  ScopedErrorContext root(ctx, "atomic replace target=" + PathToUtf8String(target));
  if (target.empty()) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidPath, "Target path required"};
  }

  const auto dir = TargetDirectory(target, ctx);
  const auto temp_path = MakeTempPath(dir, target);
  TempFileGuard cleanup(temp_path);
  StagePayload(temp_path, payload, ctx);

  if (hooks.before_rename) {
    hooks.before_rename(temp_path, target);
  }

  if (::rename(temp_path.c_str(), target.c_str()) != 0) {
    const int err = errno;
    ThrowIoError(ctx, err, std::string(kAtomicWriteErrorMessage) + ": rename failed");
  }
  cleanup.Release();
  SyncDirectory(dir, ctx);
}

bool AtomicCreate(const std::filesystem::path& target, std::span<const uint8_t> payload) {
  ErrorContext ctx;
  ScopedErrorContext root(ctx, "atomic create target=" + PathToUtf8String(target));
  if (target.empty()) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidPath, "Target path required"};
  }

  const auto dir = TargetDirectory(target, ctx);
  const auto temp_path = MakeTempPath(dir, target);
  TempFileGuard cleanup(temp_path);
  StagePayload(temp_path, payload, ctx);

  // link(2) fails with EEXIST instead of replacing, which makes the publish a
  // no-clobber operation; the staging name is removed by the guard either way.
  if (::link(temp_path.c_str(), target.c_str()) != 0) {
    const int err = errno;
    if (err == EEXIST) {
      return false;
    }
    ThrowIoError(ctx, err, std::string(kAtomicWriteErrorMessage) + ": link failed");
  }
  SyncDirectory(dir, ctx);
  return true;
}

void EnsurePrivateDirectory(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, errors::io::kTrackingWriteFailed,
                "Failed to create directory " + PathToUtf8String(dir) + ": " + ec.message(),
                ec.value(), ClassifyNativeError(ec.value())};
  }
  if (!std::filesystem::is_directory(dir, ec)) {
    throw Error{ErrorDomain::IO, errors::io::kTrackingWriteFailed,
                "Not a directory: " + PathToUtf8String(dir)};
  }
  std::filesystem::permissions(dir, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    // Records inside are still created 0600.
    std::cerr << "EnsurePrivateDirectory: chmod failed for " << dir << ": " << ec.message() << '\n';
  }
}

} // namespace sq::orchestrator
