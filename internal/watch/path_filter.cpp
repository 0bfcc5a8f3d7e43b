#include "internal/watch/path_filter.hpp"

#include "internal/sanitize/capability_registry.hpp"
#include "internal/sanitize/image_format.hpp"
#include "internal/storage/atomic_file.hpp"
#include "internal/storage/common/path_utils.hpp"

namespace aegis::watch {

namespace fs = std::filesystem;

namespace {

fs::path Absolute(const fs::path& path) {
  std::error_code ec;
  auto            abs = fs::absolute(path, ec);
  return ec ? path.lexically_normal() : abs.lexically_normal();
}

} // namespace

PathFilter::PathFilter(fs::path backup_root, std::shared_ptr<sanitize::CapabilityRegistry> capabilities)
    : backup_root_(backup_root.empty() ? backup_root : Absolute(backup_root)), capabilities_(std::move(capabilities)) {
}

bool PathFilter::Accepts(const fs::path& path) const {
  const auto name = path.filename().string();
  if (name.empty() || name.front() == '~' || storage::IsTempPath(path)) {
    return false;
  }

  auto format = sanitize::FormatFromExtension(path);
  if (!format || !capabilities_->IsEnabled(*format)) {
    return false;
  }

  return !storage::common::IsUnder(Absolute(path), backup_root_);
}

bool PathFilter::IsExcludedDirectory(const fs::path& dir) const {
  return storage::common::IsUnder(Absolute(dir), backup_root_);
}

} // namespace aegis::watch
