#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace sq::orchestrator {

struct Config {
  std::string mount_base{"mounts"};
  std::filesystem::path temp_dir{"/tmp"};
  bool auto_cleanup{true};
  bool verbose{false};
  std::string mount_helper{"squashfuse"};
  std::string unmount_helper{"fusermount"};
  std::optional<std::filesystem::path> log_file;
};

// Values given on the command line; unset members fall through to the
// environment, the config file and the defaults, in that order.
struct ConfigOverrides {
  std::optional<std::string> mount_base;
  std::optional<std::filesystem::path> temp_dir;
  std::optional<bool> auto_cleanup;
  std::optional<bool> verbose;
  std::optional<std::string> mount_helper;
  std::optional<std::string> unmount_helper;
  std::optional<std::filesystem::path> log_file;
};

// $XDG_CONFIG_HOME/squish.toml, else $HOME/.config/squish.toml.
std::optional<std::filesystem::path> DefaultConfigFilePath();

// Key/value pairs of the [default] section (and of lines before any section).
// Throws Config/kInvalidValue on a malformed line.
std::map<std::string, std::string> ParseConfigText(std::string_view text);

std::optional<bool> ParseBool(std::string_view value);

// Builds the effective configuration and validates it. A missing
// `explicit_file` is an error; problems with the default file are reported
// as warnings and the file is skipped.
Config LoadConfig(const ConfigOverrides& overrides,
                  const std::optional<std::filesystem::path>& explicit_file = std::nullopt);

// Throws Config errors for empty values or an unusable temp_dir.
void ValidateConfig(const Config& config);

// Where mount records for this configuration are kept.
std::filesystem::path TrackingDirectory(const Config& config);

} // namespace sq::orchestrator
