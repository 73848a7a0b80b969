#include "sq/core/archive_key.h"
#include "sq/core/path_normalizer.h"
#include "sq/crypto/sha256.h"
#include "sq/error.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <unistd.h>

namespace {

  class TempDir {
  public:
    TempDir() {
      path_ = std::filesystem::temp_directory_path() /
              ("sq_path_normalizer_" + std::to_string(::getpid()));
      std::filesystem::remove_all(path_);
      std::filesystem::create_directories(path_);
      path_ = std::filesystem::canonical(path_);
    }
    ~TempDir() {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }
    const std::filesystem::path& path() const noexcept { return path_; }

  private:
    std::filesystem::path path_;
  };

  void Touch(const std::filesystem::path& path) {
    std::ofstream out(path);
    out << "sqsh";
  }

  template <typename Fn>
  int ExpectErrorCode(Fn&& fn) {
    try {
      fn();
    } catch (const sq::Error& err) {
      return err.code;
    }
    return 0;
  }

  void TestNormalizeResolvesAliases(const std::filesystem::path& root) {
    std::filesystem::create_directories(root / "work" / "sub");
    Touch(root / "work" / "a.sqsh");
    std::filesystem::create_symlink(root / "work" / "a.sqsh", root / "link.sqsh");

    const auto expected = root / "work" / "a.sqsh";
    assert(sq::core::NormalizeExisting(expected) == expected);
    assert(sq::core::NormalizeExisting(root / "work" / "sub" / ".." / "a.sqsh") == expected);
    assert(sq::core::NormalizeExisting(root / "work" / "." / "a.sqsh") == expected);
    assert(sq::core::NormalizeExisting(root / "link.sqsh") == expected);

    const auto previous = std::filesystem::current_path();
    std::filesystem::current_path(root / "work" / "sub");
    assert(sq::core::NormalizeExisting("../a.sqsh") == expected);
    assert(sq::core::NormalizeArchive("../a.sqsh") == expected);
    std::filesystem::current_path(previous);
  }

  void TestNormalizeRejectsBadInput(const std::filesystem::path& root) {
    assert(ExpectErrorCode([] { sq::core::NormalizeExisting(""); }) ==
           sq::errors::validation::kInvalidPath);
    assert(ExpectErrorCode([&] { sq::core::NormalizeExisting(root / "missing.sqsh"); }) ==
           sq::errors::validation::kInvalidPath);
    // A directory is never an archive.
    assert(ExpectErrorCode([&] { sq::core::NormalizeArchive(root / "work"); }) ==
           sq::errors::validation::kInvalidPath);
  }

  void TestLenientKeepsMissingTail(const std::filesystem::path& root) {
    const auto lenient = sq::core::NormalizeLenient(root / "work" / "sub" / ".." / "gone" / "x");
    assert(lenient == root / "work" / "gone" / "x");
    const auto trailing = sq::core::NormalizeLenient((root / "work").string() + "/");
    assert(trailing == root / "work");
    assert(sq::core::NormalizeLenient(root / "link.sqsh") == root / "work" / "a.sqsh");
  }

  void TestArchiveStem() {
    assert(sq::core::ArchiveStem("/x/a.sqsh") == "a");
    assert(sq::core::ArchiveStem("data.tar.sqsh") == "data.tar");
    assert(sq::core::ArchiveStem("release-1.2.sqsh") == "release-1.2");
    assert(sq::core::ArchiveStem("release-1.3.sqsh") == "release-1.3");
    assert(sq::core::ArchiveStem("image.squashfs") == "image");
    assert(sq::core::ArchiveStem("plain") == "plain");
    assert(sq::core::ArchiveStem(".hidden.sqsh") == ".hidden");
    assert(sq::core::ArchiveStem(".hidden") == ".hidden");
    assert(sq::core::ArchiveStem("...dots") == "...dots");
    assert(sq::core::ArchiveStem("trailing.") == "trailing.");
  }

  void TestArchiveKeys(const std::filesystem::path& root) {
    assert(sq::crypto::SHA256_Hex("abc") ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    std::filesystem::create_directories(root / "one");
    std::filesystem::create_directories(root / "two");
    Touch(root / "one" / "same.sqsh");
    Touch(root / "two" / "same.sqsh");
    const auto first = sq::core::DeriveArchiveKey(sq::core::NormalizeArchive(root / "one" / "same.sqsh"));
    const auto again = sq::core::DeriveArchiveKey(
        sq::core::NormalizeArchive(root / "one" / ".." / "one" / "same.sqsh"));
    const auto second = sq::core::DeriveArchiveKey(sq::core::NormalizeArchive(root / "two" / "same.sqsh"));

    assert(first.value.size() == sq::core::kArchiveKeyLength);
    assert(sq::core::IsWellFormedArchiveKey(first.value));
    assert(first == again);
    assert(!(first == second));

    assert(!sq::core::IsWellFormedArchiveKey(""));
    assert(!sq::core::IsWellFormedArchiveKey(std::string(64, 'g')));
    assert(!sq::core::IsWellFormedArchiveKey(std::string(64, 'A')));
    assert(!sq::core::IsWellFormedArchiveKey(std::string(63, 'a')));
  }

} // namespace

int main() {
  TempDir tmp;
  TestNormalizeResolvesAliases(tmp.path());
  TestNormalizeRejectsBadInput(tmp.path());
  TestLenientKeepsMissingTail(tmp.path());
  TestArchiveStem();
  TestArchiveKeys(tmp.path());
  std::cout << "path normalizer tests ok\n";
  return 0;
}
