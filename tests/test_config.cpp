#include "sq/error.h"
#include "sq/orchestrator/config.h"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <unistd.h>

namespace {

  class TempDir {
  public:
    TempDir() {
      path_ = std::filesystem::temp_directory_path() / ("sq_config_" + std::to_string(::getpid()));
      std::filesystem::remove_all(path_);
      std::filesystem::create_directories(path_);
    }
    ~TempDir() {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }
    const std::filesystem::path& path() const noexcept { return path_; }

  private:
    std::filesystem::path path_;
  };

  void ClearEnvironment() {
    for (const char* name : {"SQUISH_MOUNT_BASE", "SQUISH_TEMP_DIR", "SQUISH_AUTO_CLEANUP",
                             "SQUISH_VERBOSE", "SQUISH_MOUNT_HELPER", "SQUISH_UNMOUNT_HELPER",
                             "SQUISH_LOG_FILE"}) {
      ::unsetenv(name);
    }
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

  void TestParseText() {
    const auto values = sq::orchestrator::ParseConfigText(
        "# squish settings\n"
        "top = \"before any section\"\n"
        "[default]\n"
        "mount_base = \"my mounts\"   # trailing comment\n"
        "temp_dir = '/var/tmp'\n"
        "auto_cleanup = false\n"
        "\n"
        "[build]\n"
        "mount_base = ignored\n");
    assert(values.at("top") == "before any section");
    assert(values.at("mount_base") == "my mounts");
    assert(values.at("temp_dir") == "/var/tmp");
    assert(values.at("auto_cleanup") == "false");

    assert(ExpectErrorCode([] { sq::orchestrator::ParseConfigText("[default\n"); }) ==
           sq::errors::config::kInvalidValue);
    assert(ExpectErrorCode([] { sq::orchestrator::ParseConfigText("just words\n"); }) ==
           sq::errors::config::kInvalidValue);
    assert(ExpectErrorCode([] { sq::orchestrator::ParseConfigText("a = \"open\n"); }) ==
           sq::errors::config::kInvalidValue);

    assert(sq::orchestrator::ParseBool("Yes") == true);
    assert(sq::orchestrator::ParseBool("0") == false);
    assert(!sq::orchestrator::ParseBool("maybe"));
  }

  void TestDefaults(const std::filesystem::path& root) {
    ClearEnvironment();
    ::setenv("XDG_CONFIG_HOME", (root / "no-config").c_str(), 1);
    auto config = sq::orchestrator::LoadConfig({});
    assert(config.mount_base == "mounts");
    assert(config.temp_dir == "/tmp");
    assert(config.auto_cleanup);
    assert(!config.verbose);
    assert(config.mount_helper == "squashfuse");
    assert(config.unmount_helper == "fusermount");
    assert(!config.log_file);
    assert(sq::orchestrator::TrackingDirectory(config) == std::filesystem::path("/tmp/squish-mounts"));
  }

  void TestPrecedence(const std::filesystem::path& root) {
    ClearEnvironment();
    const auto xdg = root / "xdg";
    std::filesystem::create_directories(xdg);
    std::filesystem::create_directories(root / "file-temp");
    std::filesystem::create_directories(root / "env-temp");
    {
      std::ofstream out(xdg / "squish.toml");
      out << "[default]\n"
          << "mount_base = \"from-file\"\n"
          << "temp_dir = \"" << (root / "file-temp").string() << "\"\n"
          << "auto_cleanup = false\n"
          << "verbose = true\n";
    }
    ::setenv("XDG_CONFIG_HOME", xdg.c_str(), 1);

    auto from_file = sq::orchestrator::LoadConfig({});
    assert(from_file.mount_base == "from-file");
    assert(from_file.temp_dir == root / "file-temp");
    assert(!from_file.auto_cleanup);
    assert(from_file.verbose);

    ::setenv("SQUISH_MOUNT_BASE", "from-env", 1);
    ::setenv("SQUISH_TEMP_DIR", (root / "env-temp").c_str(), 1);
    ::setenv("SQUISH_AUTO_CLEANUP", "yes", 1);
    auto from_env = sq::orchestrator::LoadConfig({});
    assert(from_env.mount_base == "from-env");
    assert(from_env.temp_dir == root / "env-temp");
    assert(from_env.auto_cleanup);
    assert(from_env.verbose);  // untouched by env, still from the file

    sq::orchestrator::ConfigOverrides cli;
    cli.mount_base = "from-cli";
    cli.auto_cleanup = false;
    auto from_cli = sq::orchestrator::LoadConfig(cli);
    assert(from_cli.mount_base == "from-cli");
    assert(from_cli.temp_dir == root / "env-temp");
    assert(!from_cli.auto_cleanup);

    ::setenv("SQUISH_VERBOSE", "sometimes", 1);
    assert(ExpectErrorCode([] { sq::orchestrator::LoadConfig({}); }) ==
           sq::errors::config::kInvalidValue);
    ClearEnvironment();
  }

  void TestBadFiles(const std::filesystem::path& root) {
    ClearEnvironment();
    const auto xdg = root / "broken";
    std::filesystem::create_directories(xdg);
    {
      std::ofstream out(xdg / "squish.toml");
      out << "[default]\nmount_base = \"unterminated\n";
    }
    ::setenv("XDG_CONFIG_HOME", xdg.c_str(), 1);
    // A broken default file is skipped with a warning.
    auto config = sq::orchestrator::LoadConfig({});
    assert(config.mount_base == "mounts");

    // The same file passed explicitly is an error, as is a missing one.
    assert(ExpectErrorCode([&] { sq::orchestrator::LoadConfig({}, xdg / "squish.toml"); }) ==
           sq::errors::config::kInvalidValue);
    assert(ExpectErrorCode([&] { sq::orchestrator::LoadConfig({}, root / "nope.toml"); }) ==
           sq::errors::config::kFileUnreadable);
  }

  void TestValidation(const std::filesystem::path& root) {
    ClearEnvironment();
    ::setenv("XDG_CONFIG_HOME", (root / "no-config").c_str(), 1);
    sq::orchestrator::ConfigOverrides missing_temp;
    missing_temp.temp_dir = root / "does-not-exist";
    assert(ExpectErrorCode([&] { sq::orchestrator::LoadConfig(missing_temp); }) ==
           sq::errors::config::kTempDirMissing);

    { std::ofstream(root / "a-file") << "x"; }
    sq::orchestrator::ConfigOverrides file_temp;
    file_temp.temp_dir = root / "a-file";
    assert(ExpectErrorCode([&] { sq::orchestrator::LoadConfig(file_temp); }) ==
           sq::errors::config::kTempDirMissing);

    sq::orchestrator::ConfigOverrides empty_base;
    empty_base.mount_base = "";
    assert(ExpectErrorCode([&] { sq::orchestrator::LoadConfig(empty_base); }) ==
           sq::errors::config::kInvalidValue);
  }

} // namespace

int main() {
  TempDir tmp;
  TestParseText();
  TestDefaults(tmp.path());
  TestPrecedence(tmp.path());
  TestBadFiles(tmp.path());
  TestValidation(tmp.path());
  std::cout << "config tests ok\n";
  return 0;
}
