#include "sq/core/path_normalizer.h"

#include <system_error>

#include "sq/common.h"
#include "sq/error.h"
#include "sq/errors.h"

namespace sq::core {
namespace {

[[noreturn]] void ThrowInvalidPath(std::string_view message, const std::filesystem::path& path,
                                   std::optional<int> native = std::nullopt) {
  throw Error{ErrorDomain::Validation, errors::validation::kInvalidPath,
              std::string(message) + ": " + PathToUtf8String(path), native};
}

std::filesystem::path MakeAbsolute(const std::filesystem::path& path) {
  if (path.empty()) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidPath,
                std::string(errors::msg::kPathEmpty)};
  }
  if (path.is_absolute()) {
    return path;
  }
  return CurrentWorkingDirectory() / path;
}

} // namespace

std::filesystem::path CurrentWorkingDirectory() {
  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);
  if (ec) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidPath,
                std::string(errors::msg::kUnableToResolveWorkingDirectory), ec.value()};
  }
  return cwd;
}

std::filesystem::path NormalizeExisting(const std::filesystem::path& path) {
  const auto absolute = MakeAbsolute(path);
  std::error_code ec;
  auto canonical = std::filesystem::canonical(absolute, ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) {
      ThrowInvalidPath(errors::msg::kArchiveNotFound, path, ec.value());
    }
    ThrowInvalidPath(errors::msg::kFailedToNormalizePath, path, ec.value());
  }
  return canonical;
}

std::filesystem::path NormalizeLenient(const std::filesystem::path& path) {
  const auto absolute = MakeAbsolute(path);
  std::error_code ec;
  auto canonical = std::filesystem::weakly_canonical(absolute, ec);
  if (ec) {
    ThrowInvalidPath(errors::msg::kFailedToNormalizePath, path, ec.value());
  }
  // weakly_canonical keeps a trailing separator for "dir/"; drop it so the
  // result compares equal to the canonical form.
  if (!canonical.has_filename() && canonical.has_parent_path() &&
      canonical != canonical.root_path()) {
    canonical = canonical.parent_path();
  }
  return canonical;
}

std::filesystem::path NormalizeArchive(const std::filesystem::path& path) {
  auto canonical = NormalizeExisting(path);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(canonical, ec)) {
    ThrowInvalidPath(errors::msg::kArchiveNotAFile, path, ec ? std::optional<int>(ec.value())
                                                             : std::nullopt);
  }
  return canonical;
}

std::string ArchiveStem(const std::filesystem::path& archive) {
  const std::string name = archive.filename().string();
  const auto last_dot = name.find_last_of('.');
  if (last_dot == std::string::npos || last_dot == 0 || last_dot == name.size() - 1) {
    return name;
  }
  // ".foo" and "...foo" have no extension.
  if (name.find_last_not_of('.', last_dot - 1) == std::string::npos) {
    return name;
  }
  return name.substr(0, last_dot);
}

} // namespace sq::core
