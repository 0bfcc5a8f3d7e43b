#pragma once

#include <cstdint>
#include <string>

#include "aegis/config/v1/config.pb.h"
#include "internal/sanitize/capability.hpp"

namespace aegis::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. The result has defaults applied and is validated.
  Throws util::InvalidConfig.
*/
class ConfigLoader {
 public:
  static aegis::config::v1::RuntimeConfig LoadFromYaml(const std::string& path);
  static aegis::config::v1::RuntimeConfig LoadFromString(const std::string& yaml);

  static void ApplyDefaults(aegis::config::v1::RuntimeConfig& config);
  static void Validate(const aegis::config::v1::RuntimeConfig& config);
};

// OpenCV-convention HSV: H in [0,179], S and V in [0,255].
struct Hsv {
  std::uint32_t h = 0;
  std::uint32_t s = 0;
  std::uint32_t v = 0;
};

Hsv RgbToHsv(std::uint32_t r, std::uint32_t g, std::uint32_t b);

/*
  Detection window around a picked color:
    hue        [h - tolerance, h + tolerance] clamped to [0,179]
    saturation [max(50, s - 30), 255]
    value      [max(50, v - 30), 255]
*/
void DeriveWindowFromColor(aegis::config::v1::PixelConfig& pixel);

sanitize::PixelParams ToPixelParams(const aegis::config::v1::PixelConfig& pixel);

} // namespace aegis::config
