#include "sq/error.h"
#include "sq/orchestrator/mount_point_resolver.h"
#include "sq/platform/mount_table.h"

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
              ("sq_resolver_" + std::to_string(::getpid()));
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

  template <typename Fn>
  int ExpectErrorCode(Fn&& fn) {
    try {
      fn();
    } catch (const sq::Error& err) {
      return err.code;
    }
    return 0;
  }

  void TestDerivedTarget(const std::filesystem::path& root) {
    sq::orchestrator::MountPointResolver resolver("mounts");
    auto planned = resolver.Plan(root / "a.sqsh", std::nullopt, root);
    assert(planned.mount_point == root / "mounts" / "a");
    assert(planned.auto_created);
    assert(!std::filesystem::exists(planned.mount_point));

    resolver.Prepare(planned, false);
    assert(planned.created_now);
    assert(planned.parent_created_now);
    assert(sq::platform::IsEmptyDirectory(root / "mounts" / "a"));

    // Existing empty directory is reused, not an error.
    auto again = resolver.Plan(root / "a.sqsh", std::nullopt, root);
    resolver.Prepare(again, false);
    assert(again.mount_point == planned.mount_point);
    assert(again.auto_created && !again.created_now);

    // Only the final extension is dropped; mounts/ already exists this time.
    auto multi = resolver.Plan(root / "data.tar.sqsh", std::nullopt, root);
    assert(multi.mount_point == root / "mounts" / "data.tar");
    resolver.Prepare(multi, false);
    assert(multi.created_now && !multi.parent_created_now);
  }

  void TestExplicitTarget(const std::filesystem::path& root) {
    sq::orchestrator::MountPointResolver resolver("mounts");
    std::filesystem::create_directories(root / "custom");
    auto target = resolver.Plan(root / "a.sqsh", root / "custom" / "." / "mnt", root);
    resolver.Prepare(target, false);
    assert(target.mount_point == root / "custom" / "mnt");
    assert(!target.auto_created);
    assert(target.created_now);
    assert(std::filesystem::is_directory(root / "custom" / "mnt"));
  }

  void TestUnusableTargets(const std::filesystem::path& root) {
    sq::orchestrator::MountPointResolver resolver("mounts");
    std::filesystem::create_directories(root / "busy");
    { std::ofstream(root / "busy" / "file.txt") << "x"; }
    { std::ofstream(root / "plain-file") << "x"; }

    auto busy = resolver.Plan(root / "a.sqsh", root / "busy", root);
    assert(ExpectErrorCode([&] { resolver.Prepare(busy, false); }) ==
           sq::errors::validation::kMountPointUnusable);
    auto file = resolver.Plan(root / "a.sqsh", root / "plain-file", root);
    assert(ExpectErrorCode([&] { resolver.Prepare(file, false); }) ==
           sq::errors::validation::kMountPointUnusable);

    // The archive's own recorded mount point may hold content.
    auto owned = resolver.Plan(root / "a.sqsh", root / "busy", root);
    resolver.Prepare(owned, true);
    assert(owned.mount_point == root / "busy" && !owned.created_now);
  }

  void TestMountTableParsing(const std::filesystem::path& root) {
    assert(sq::platform::DecodeMountInfoField("/mnt/with\\040space") == "/mnt/with space");
    assert(sq::platform::DecodeMountInfoField("/plain\\") == "/plain\\");

    const auto table = root / "mountinfo";
    {
      std::ofstream out(table);
      out << "22 1 8:1 / / rw,relatime shared:1 - ext4 /dev/sda1 rw\n";
      out << "40 22 0:35 / /work/mounts/a\\040b ro,nosuid - fuse.squashfuse squashfuse ro\n";
      out << "garbage\n";
    }
    const auto points = sq::platform::ReadMountPoints(table);
    assert(points.size() == 2);
    assert(sq::platform::IsListedMountPoint("/work/mounts/a b", table));
    assert(!sq::platform::IsListedMountPoint("/work/mounts/a", table));
    assert(sq::platform::ReadMountPoints(root / "no-such-table").empty());

    std::filesystem::create_directories(root / "empty");
    assert(sq::platform::IsEmptyDirectory(root / "empty"));
    assert(!sq::platform::LooksMounted(root / "empty"));
    assert(!sq::platform::LooksMounted(root / "missing"));
    assert(sq::platform::LooksMounted(root / "busy"));
  }

} // namespace

int main() {
  TempDir tmp;
  TestDerivedTarget(tmp.path());
  TestExplicitTarget(tmp.path());
  TestUnusableTargets(tmp.path());
  TestMountTableParsing(tmp.path());
  std::cout << "mount point resolver tests ok\n";
  return 0;
}
