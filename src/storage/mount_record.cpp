#include "sq/storage/mount_record.h"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <map>

#include "sq/common.h"

namespace sq::storage {
namespace {

std::string EscapeValue(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (char ch : value) {
    switch (ch) {
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    default:
      out.push_back(ch);
      break;
    }
  }
  return out;
}

std::optional<std::string> UnescapeValue(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    if (value[i] != '\\') {
      out.push_back(value[i]);
      continue;
    }
    if (i + 1 >= value.size()) {
      return std::nullopt; // dangling escape
    }
    switch (value[++i]) {
    case '\\':
      out.push_back('\\');
      break;
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      return std::nullopt;
    }
  }
  return out;
}

std::optional<bool> ParseFlag(const std::string& value) {
  if (value == "1") {
    return true;
  }
  if (value == "0") {
    return false;
  }
  return std::nullopt;
}

std::optional<int64_t> ParseSeconds(const std::string& value) {
  int64_t seconds = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
  if (ec != std::errc() || ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  // Must fit system_clock's duration once scaled from seconds.
  using Clock = std::chrono::system_clock;
  constexpr auto kMaxSeconds =
      std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::max()).count();
  constexpr auto kMinSeconds =
      std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::min()).count();
  if (seconds > kMaxSeconds || seconds < kMinSeconds) {
    return std::nullopt;
  }
  return seconds;
}

} // namespace

std::string SerializeMountRecord(const MountRecord& record) {
  const auto seconds =
      std::chrono::duration_cast<std::chrono::seconds>(record.created_at.time_since_epoch()).count();
  std::string out;
  out.append(kMountRecordHeader).append("\n");
  out.append("archive_key=").append(EscapeValue(record.archive_key.value)).append("\n");
  out.append("archive_path=").append(EscapeValue(PathToUtf8String(record.archive_path))).append("\n");
  out.append("mount_point=").append(EscapeValue(PathToUtf8String(record.mount_point))).append("\n");
  out.append("auto_created=").append(record.auto_created ? "1" : "0").append("\n");
  out.append("created_at=").append(std::to_string(seconds)).append("\n");
  return out;
}

std::optional<MountRecord> ParseMountRecord(std::string_view text) {
  size_t pos = text.find('\n');
  if (pos == std::string_view::npos || text.substr(0, pos) != kMountRecordHeader) {
    return std::nullopt;
  }
  std::map<std::string, std::string, std::less<>> values;
  size_t start = pos + 1;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      return std::nullopt; // truncated: every line is newline terminated
    }
    auto line = text.substr(start, end - start);
    start = end + 1;
    if (line.empty()) {
      continue;
    }
    auto eq = line.find('=');
    if (eq == std::string_view::npos || eq == 0) {
      return std::nullopt;
    }
    auto value = UnescapeValue(line.substr(eq + 1));
    if (!value) {
      return std::nullopt;
    }
    values.insert_or_assign(std::string(line.substr(0, eq)), std::move(*value));
  }

  auto field = [&values](std::string_view key) -> const std::string* {
    auto it = values.find(key);
    return it == values.end() ? nullptr : &it->second;
  };
  const auto* key = field("archive_key");
  const auto* archive = field("archive_path");
  const auto* mount_point = field("mount_point");
  const auto* auto_created = field("auto_created");
  const auto* created_at = field("created_at");
  if (!key || !archive || !mount_point || !auto_created || !created_at) {
    return std::nullopt;
  }
  if (!core::IsWellFormedArchiveKey(*key) || archive->empty() || mount_point->empty()) {
    return std::nullopt;
  }
  auto flag = ParseFlag(*auto_created);
  auto seconds = ParseSeconds(*created_at);
  if (!flag || !seconds) {
    return std::nullopt;
  }

  MountRecord record;
  record.archive_key = core::ArchiveKey{*key};
  record.archive_path = *archive;
  record.mount_point = *mount_point;
  record.auto_created = *flag;
  record.created_at = std::chrono::system_clock::time_point(std::chrono::seconds(*seconds));
  return record;
}

} // namespace sq::storage
