#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace aegis::sanitize {

enum class ImageFormat : std::uint8_t {
  kJpeg,
  kPng,
  kBmp,
  kTiff,
  kWebp,
  kHeif,
};

std::string_view FormatName(ImageFormat format);

/*
  Outcome of one sanitization phase.

    Applied  bytes replace the working copy
    Skipped  nothing to do for this input (not an error)
    Failed   phase error; the task goes to Failed
*/
struct PhaseResult {
  enum class Kind : std::uint8_t {
    kApplied,
    kSkipped,
    kFailed,
  };

  Kind                           kind = Kind::kSkipped;
  std::shared_ptr<arrow::Buffer> bytes;
  std::string                    reason;
  util::ErrorCode                error = util::ErrorCode::kInternal;

  static PhaseResult Applied(std::shared_ptr<arrow::Buffer> out) {
    PhaseResult r;
    r.kind  = Kind::kApplied;
    r.bytes = std::move(out);
    return r;
  }

  static PhaseResult Skipped(std::string why) {
    PhaseResult r;
    r.kind   = Kind::kSkipped;
    r.reason = std::move(why);
    return r;
  }

  static PhaseResult Failed(util::ErrorCode code, std::string detail) {
    PhaseResult r;
    r.kind   = Kind::kFailed;
    r.error  = code;
    r.reason = std::move(detail);
    return r;
  }

  bool applied() const {
    return kind == Kind::kApplied;
  }
  bool skipped() const {
    return kind == Kind::kSkipped;
  }
  bool failed() const {
    return kind == Kind::kFailed;
  }
};

struct Rgb {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;
};

// Inclusive channel window on OpenCV-style HSV (H in [0,179], S/V in [0,255]).
struct ChannelRange {
  std::uint32_t min = 0;
  std::uint32_t max = 0;
};

struct PixelParams {
  Rgb          target_color{0, 255, 0};
  ChannelRange hue{35, 85};
  ChannelRange saturation{40, 255};
  ChannelRange value{40, 255};
  std::uint32_t median_blur_size  = 5;
  std::uint32_t morph_kernel_size = 3;
  std::uint32_t morph_iterations  = 2;
};

/*
  Removes embedded metadata from encoded image bytes.
  May return Failed or throw DecodeError/UnsupportedFormat.
*/
class MetadataStripper {
 public:
  virtual ~MetadataStripper() = default;

  virtual PhaseResult Strip(const arrow::Buffer& bytes, ImageFormat format) = 0;
};

/*
  Removes tracking marks from encoded image bytes.
  A format it cannot handle is Skipped, never Failed.
*/
class PixelCleaner {
 public:
  virtual ~PixelCleaner() = default;

  virtual PhaseResult Clean(const arrow::Buffer& bytes, ImageFormat format, const PixelParams& params) = 0;
};

} // namespace aegis::sanitize
