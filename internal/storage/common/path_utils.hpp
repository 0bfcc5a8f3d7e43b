#pragma once

#include <filesystem>
#include <string>

namespace aegis::storage::common {

/*
  Location of `path` below `root`, for mirroring a monitored tree under the
  backup and quarantine areas. Falls back to the bare file name when `path`
  is not inside `root`.
*/
inline std::filesystem::path RelativeToRoot(const std::filesystem::path& path, const std::filesystem::path& root) {
  if (!root.empty()) {
    auto rel = path.lexically_normal().lexically_relative(root.lexically_normal());
    if (!rel.empty() && *rel.begin() != "..") {
      return rel;
    }
  }
  return path.filename();
}

// Name of the monitored folder itself; "root" for "/".
inline std::string RootFolderName(const std::filesystem::path& root) {
  auto normal = root.lexically_normal();
  auto name   = normal.filename().string();
  if (name.empty()) {
    name = normal.parent_path().filename().string();
  }
  return name.empty() ? "root" : name;
}

inline bool IsUnder(const std::filesystem::path& path, const std::filesystem::path& root) {
  if (root.empty()) return false;
  auto rel = path.lexically_normal().lexically_relative(root.lexically_normal());
  return !rel.empty() && *rel.begin() != "..";
}

} // namespace aegis::storage::common
