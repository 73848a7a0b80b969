#include "sq/orchestrator/config.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "sq/common.h"
#include "sq/error.h"
#include "sq/errors.h"
#include "sq/orchestrator/event_bus.h"

namespace sq::orchestrator {
namespace {

constexpr const char* kConfigFileName = "squish.toml";
constexpr const char* kTrackingDirName = "squish-mounts";

std::string Trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r");
  return std::string(text.substr(first, last - first + 1));
}

[[noreturn]] void ThrowInvalid(const std::string& message) {
  throw Error{ErrorDomain::Config, errors::config::kInvalidValue, message};
}

// Strips a trailing comment that is not inside quotes.
std::string StripComment(const std::string& line) {
  char quote = 0;
  for (size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (quote) {
      if (ch == quote) {
        quote = 0;
      }
      continue;
    }
    if (ch == '"' || ch == '\'') {
      quote = ch;
    } else if (ch == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

std::string Unquote(const std::string& value, size_t line_no) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'')) {
    if (value.back() != value.front()) {
      ThrowInvalid("Unterminated string on line " + std::to_string(line_no));
    }
    return value.substr(1, value.size() - 2);
  }
  if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
    ThrowInvalid("Unterminated string on line " + std::to_string(line_no));
  }
  return value;
}

bool RequireBool(std::string_view source, std::string_view key, std::string_view value) {
  auto parsed = ParseBool(value);
  if (!parsed) {
    ThrowInvalid(std::string(source) + ": " + std::string(key) + " expects a boolean, got '" +
                 std::string(value) + "'");
  }
  return *parsed;
}

void ApplyValue(Config& config, std::string_view source, const std::string& key,
                const std::string& value) {
  if (key == "mount_base") {
    config.mount_base = value;
  } else if (key == "temp_dir") {
    config.temp_dir = value;
  } else if (key == "auto_cleanup") {
    config.auto_cleanup = RequireBool(source, key, value);
  } else if (key == "verbose") {
    config.verbose = RequireBool(source, key, value);
  } else if (key == "mount_helper") {
    config.mount_helper = value;
  } else if (key == "unmount_helper") {
    config.unmount_helper = value;
  } else if (key == "log_file") {
    if (value.empty()) {
      config.log_file.reset();
    } else {
      config.log_file = std::filesystem::path(value);
    }
  }
  // Unknown keys belong to other squish commands.
}

std::string ReadConfigFile(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw Error{ErrorDomain::Config, errors::config::kFileUnreadable,
                std::string(errors::msg::kConfigFileUnreadable) + ": " + PathToUtf8String(path)};
  }
  std::ostringstream content;
  content << in.rdbuf();
  return content.str();
}

void ApplyFile(Config& config, const std::filesystem::path& path) {
  const auto values = ParseConfigText(ReadConfigFile(path));
  const std::string source = PathToUtf8String(path);
  Config staged = config;
  for (const auto& [key, value] : values) {
    ApplyValue(staged, source, key, value);
  }
  config = std::move(staged);
}

void ApplyEnvironment(Config& config) {
  static constexpr std::pair<const char*, const char*> kEnvKeys[] = {
      {"SQUISH_MOUNT_BASE", "mount_base"},     {"SQUISH_TEMP_DIR", "temp_dir"},
      {"SQUISH_AUTO_CLEANUP", "auto_cleanup"}, {"SQUISH_VERBOSE", "verbose"},
      {"SQUISH_MOUNT_HELPER", "mount_helper"}, {"SQUISH_UNMOUNT_HELPER", "unmount_helper"},
      {"SQUISH_LOG_FILE", "log_file"},
  };
  for (const auto& [env_name, key] : kEnvKeys) {
    const char* value = std::getenv(env_name);
    if (value == nullptr) {
      continue;
    }
    ApplyValue(config, env_name, key, value);
  }
}

void ApplyOverrides(Config& config, const ConfigOverrides& overrides) {
  if (overrides.mount_base) {
    config.mount_base = *overrides.mount_base;
  }
  if (overrides.temp_dir) {
    config.temp_dir = *overrides.temp_dir;
  }
  if (overrides.auto_cleanup) {
    config.auto_cleanup = *overrides.auto_cleanup;
  }
  if (overrides.verbose) {
    config.verbose = *overrides.verbose;
  }
  if (overrides.mount_helper) {
    config.mount_helper = *overrides.mount_helper;
  }
  if (overrides.unmount_helper) {
    config.unmount_helper = *overrides.unmount_helper;
  }
  if (overrides.log_file) {
    config.log_file = *overrides.log_file;
  }
}

} // namespace

std::optional<bool> ParseBool(std::string_view value) {
  std::string lowered;
  lowered.reserve(value.size());
  for (char ch : value) {
    lowered.push_back(static_cast<char>(ch >= 'A' && ch <= 'Z' ? ch - 'A' + 'a' : ch));
  }
  if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
    return true;
  }
  if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
    return false;
  }
  return std::nullopt;
}

std::optional<std::filesystem::path> DefaultConfigFilePath() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return std::filesystem::path(xdg) / kConfigFileName;
  }
  if (const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".config" / kConfigFileName;
  }
  return std::nullopt;
}

std::map<std::string, std::string> ParseConfigText(std::string_view text) {
  std::map<std::string, std::string> values;
  std::istringstream in{std::string(text)};
  std::string raw;
  std::string section;
  size_t line_no = 0;
  while (std::getline(in, raw)) {
    ++line_no;
    const std::string line = Trim(StripComment(raw));
    if (line.empty()) {
      continue;
    }
    if (line.front() == '[') {
      if (line.back() != ']' || line.size() < 3) {
        ThrowInvalid("Malformed section header on line " + std::to_string(line_no));
      }
      section = Trim(std::string_view(line).substr(1, line.size() - 2));
      continue;
    }
    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      ThrowInvalid("Expected key = value on line " + std::to_string(line_no));
    }
    std::string key = Trim(std::string_view(line).substr(0, eq));
    if (key.empty()) {
      ThrowInvalid("Missing key on line " + std::to_string(line_no));
    }
    std::string value = Unquote(Trim(std::string_view(line).substr(eq + 1)), line_no);
    if (!section.empty() && section != "default") {
      continue;
    }
    values.insert_or_assign(std::move(key), std::move(value));
  }
  return values;
}

Config LoadConfig(const ConfigOverrides& overrides,
                  const std::optional<std::filesystem::path>& explicit_file) {
  Config config;
  if (explicit_file) {
    std::error_code ec;
    if (!std::filesystem::exists(*explicit_file, ec)) {
      throw Error{ErrorDomain::Config, errors::config::kFileUnreadable,
                  std::string(errors::msg::kConfigFileUnreadable) + ": " +
                      PathToUtf8String(*explicit_file)};
    }
    ApplyFile(config, *explicit_file);
  } else if (auto default_file = DefaultConfigFilePath()) {
    std::error_code ec;
    if (std::filesystem::exists(*default_file, ec)) {
      try {
        ApplyFile(config, *default_file);
      } catch (const Error& err) {
        PublishEvent(EventCategory::kDiagnostics, EventSeverity::kWarning, "config_file_ignored",
                     "Ignoring unusable config file",
                     {EventField("path", PathToUtf8String(*default_file)),
                      EventField("reason", err.what())});
      }
    }
  }
  ApplyEnvironment(config);
  ApplyOverrides(config, overrides);
  ValidateConfig(config);
  return config;
}

void ValidateConfig(const Config& config) {
  if (config.mount_base.empty()) {
    ThrowInvalid("mount_base cannot be empty");
  }
  if (config.temp_dir.empty()) {
    ThrowInvalid("temp_dir cannot be empty");
  }
  if (config.mount_helper.empty() || config.unmount_helper.empty()) {
    ThrowInvalid("mount and unmount helpers cannot be empty");
  }
  std::error_code ec;
  if (!std::filesystem::exists(config.temp_dir, ec)) {
    throw Error{ErrorDomain::Config, errors::config::kTempDirMissing,
                std::string(errors::msg::kTempDirMissing) + ": " + PathToUtf8String(config.temp_dir)};
  }
  if (!std::filesystem::is_directory(config.temp_dir, ec)) {
    throw Error{ErrorDomain::Config, errors::config::kTempDirMissing,
                std::string(errors::msg::kTempDirNotDirectory) + ": " +
                    PathToUtf8String(config.temp_dir)};
  }
}

std::filesystem::path TrackingDirectory(const Config& config) {
  return config.temp_dir / kTrackingDirName;
}

} // namespace sq::orchestrator
