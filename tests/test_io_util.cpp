#include "sq/common.h"
#include "sq/orchestrator/io_util.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

namespace {

  std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }

  size_t CountEntries(const std::filesystem::path& dir) {
    size_t count = 0;
    for ([[maybe_unused]] const auto& entry : std::filesystem::directory_iterator(dir)) {
      ++count;
    }
    return count;
  }

} // namespace

int main() {
  using sq::orchestrator::AtomicCreate;
  using sq::orchestrator::AtomicReplace;
  using sq::orchestrator::AtomicReplaceHooks;

  const auto dir = std::filesystem::temp_directory_path() / ("sq_io_util_" + std::to_string(::getpid()));
  std::filesystem::remove_all(dir);
  sq::orchestrator::EnsurePrivateDirectory(dir / "nested");
  struct stat st{};
  assert(::stat((dir / "nested").c_str(), &st) == 0);
  assert((st.st_mode & 0777) == 0700);

  const auto target = dir / "nested" / "record.mounted";
  {
    std::ofstream seed(target, std::ios::binary | std::ios::trunc);
    seed << "baseline";
  }

  AtomicReplaceHooks hooks;
  hooks.before_rename = [](const std::filesystem::path&, const std::filesystem::path&) {
    throw std::runtime_error("simulated crash");
  };
  bool threw = false;
  try {
    AtomicReplace(target, sq::AsBytes("update"), hooks);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "Expected simulated crash before rename");
  assert(ReadFile(target) == "baseline");
  assert(CountEntries(dir / "nested") == 1);  // staging file removed

  AtomicReplace(target, sq::AsBytes("update"));
  assert(ReadFile(target) == "update");

  // AtomicCreate never clobbers.
  assert(!AtomicCreate(target, sq::AsBytes("second")));
  assert(ReadFile(target) == "update");
  assert(CountEntries(dir / "nested") == 1);

  const auto fresh = dir / "nested" / "fresh.mounted";
  assert(AtomicCreate(fresh, sq::AsBytes("first")));
  assert(ReadFile(fresh) == "first");
  assert(::stat(fresh.c_str(), &st) == 0);
  assert((st.st_mode & 0777) == 0600);

  bool missing_dir = false;
  try {
    AtomicReplace(dir / "absent" / "x", sq::AsBytes("x"));
  } catch (const sq::Error& err) {
    missing_dir = err.domain == sq::ErrorDomain::IO && err.native_code.has_value();
  }
  assert(missing_dir);

  std::filesystem::remove_all(dir);
  std::cout << "atomic file tests ok\n";
  return 0;
}
