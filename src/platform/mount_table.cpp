#include "sq/platform/mount_table.h"

#include <fstream>
#include <sstream>
#include <system_error>

namespace sq::platform {
namespace {

bool IsOctalDigit(char ch) { return ch >= '0' && ch <= '7'; }

} // namespace

std::string DecodeMountInfoField(const std::string& field) {
  std::string out;
  out.reserve(field.size());
  for (size_t i = 0; i < field.size(); ++i) {
    if (field[i] == '\\' && i + 3 < field.size() && IsOctalDigit(field[i + 1]) &&
        IsOctalDigit(field[i + 2]) && IsOctalDigit(field[i + 3])) {
      const int value = (field[i + 1] - '0') * 64 + (field[i + 2] - '0') * 8 + (field[i + 3] - '0');
      out.push_back(static_cast<char>(value));
      i += 3;
      continue;
    }
    out.push_back(field[i]);
  }
  return out;
}

std::vector<std::filesystem::path> ReadMountPoints(const std::filesystem::path& table) {
  std::vector<std::filesystem::path> points;
  std::ifstream in(table);
  if (!in) {
    return points;
  }
  // mountinfo: id parent major:minor root mount_point options ...
  std::string line;
  while (std::getline(in, line)) {
    std::istringstream fields(line);
    std::string id, parent, devno, root, mount_point;
    if (!(fields >> id >> parent >> devno >> root >> mount_point)) {
      continue;
    }
    points.emplace_back(DecodeMountInfoField(mount_point));
  }
  return points;
}

bool IsListedMountPoint(const std::filesystem::path& path, const std::filesystem::path& table) {
  for (const auto& point : ReadMountPoints(table)) {
    if (point == path) {
      return true;
    }
  }
  return false;
}

bool IsEmptyDirectory(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_directory(path, ec)) {
    return false;
  }
  std::filesystem::directory_iterator it(path, ec);
  if (ec) {
    return false;
  }
  return it == std::filesystem::directory_iterator{};
}

bool LooksMounted(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return false;
  }
  if (IsListedMountPoint(path)) {
    return true;
  }
  return std::filesystem::is_directory(path, ec) && !IsEmptyDirectory(path);
}

} // namespace sq::platform
