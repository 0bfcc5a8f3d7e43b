#include "internal/sanitize/capability_registry.hpp"

#include "internal/sanitize/container_stripper.hpp"

namespace aegis::sanitize {

std::shared_ptr<CapabilityRegistry> CapabilityRegistry::WithBuiltins() {
  auto registry = std::make_shared<CapabilityRegistry>();
  auto stripper = std::make_shared<ContainerMetadataStripper>();
  for (auto format : {ImageFormat::kJpeg, ImageFormat::kPng, ImageFormat::kBmp, ImageFormat::kTiff, ImageFormat::kWebp}) {
    registry->RegisterStripper(format, stripper);
  }
  return registry;
}

void CapabilityRegistry::RegisterStripper(ImageFormat format, std::shared_ptr<MetadataStripper> stripper) {
  std::lock_guard lock(mutex_);
  strippers_[format] = std::move(stripper);
}

void CapabilityRegistry::RegisterPixelCleaner(ImageFormat format, std::shared_ptr<PixelCleaner> cleaner) {
  std::lock_guard lock(mutex_);
  cleaners_[format] = std::move(cleaner);
}

std::shared_ptr<MetadataStripper> CapabilityRegistry::StripperFor(ImageFormat format) const {
  std::lock_guard lock(mutex_);
  auto            it = strippers_.find(format);
  return it == strippers_.end() ? nullptr : it->second;
}

std::shared_ptr<PixelCleaner> CapabilityRegistry::PixelCleanerFor(ImageFormat format) const {
  std::lock_guard lock(mutex_);
  auto            it = cleaners_.find(format);
  return it == cleaners_.end() ? nullptr : it->second;
}

bool CapabilityRegistry::IsEnabled(ImageFormat format) const {
  std::lock_guard lock(mutex_);
  return strippers_.count(format) > 0;
}

std::set<ImageFormat> CapabilityRegistry::EnabledFormats() const {
  std::lock_guard       lock(mutex_);
  std::set<ImageFormat> formats;
  for (const auto& [format, stripper] : strippers_) {
    formats.insert(format);
  }
  return formats;
}

} // namespace aegis::sanitize
