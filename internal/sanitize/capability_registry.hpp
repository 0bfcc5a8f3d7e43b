#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <set>

#include "internal/sanitize/capability.hpp"

namespace aegis::sanitize {

/*
  Format -> capability lookup used by the orchestrator and the path filter.

  A format is enabled once a metadata stripper is registered for it. Pixel
  cleaners are optional per format; a missing one means the pixel phase is
  Skipped.
*/
class CapabilityRegistry {
 public:
  // Registry with the built-in container stripper for JPEG, PNG, BMP, TIFF and WebP.
  static std::shared_ptr<CapabilityRegistry> WithBuiltins();

  void RegisterStripper(ImageFormat format, std::shared_ptr<MetadataStripper> stripper);
  void RegisterPixelCleaner(ImageFormat format, std::shared_ptr<PixelCleaner> cleaner);

  std::shared_ptr<MetadataStripper> StripperFor(ImageFormat format) const;
  std::shared_ptr<PixelCleaner>     PixelCleanerFor(ImageFormat format) const;

  bool                  IsEnabled(ImageFormat format) const;
  std::set<ImageFormat> EnabledFormats() const;

 private:
  mutable std::mutex                                   mutex_;
  std::map<ImageFormat, std::shared_ptr<MetadataStripper>> strippers_;
  std::map<ImageFormat, std::shared_ptr<PixelCleaner>>     cleaners_;
};

} // namespace aegis::sanitize
