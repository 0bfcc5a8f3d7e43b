#pragma once

#include <filesystem>
#include <memory>

namespace aegis::sanitize {
class CapabilityRegistry;
}

namespace aegis::watch {

/*
  Decides whether a path is a sanitization candidate. Cheap: looks at the
  name only, never opens the file.

  Rejects: extensions without a registered capability (GIF always),
  anything under the backup root, pipeline temp files, "~" swap files.
*/
class PathFilter {
 public:
  PathFilter(std::filesystem::path backup_root, std::shared_ptr<sanitize::CapabilityRegistry> capabilities);

  bool Accepts(const std::filesystem::path& path) const;

  // Directories the scanner and watcher must not descend into.
  bool IsExcludedDirectory(const std::filesystem::path& dir) const;

 private:
  std::filesystem::path                         backup_root_;
  std::shared_ptr<sanitize::CapabilityRegistry> capabilities_;
};

} // namespace aegis::watch
