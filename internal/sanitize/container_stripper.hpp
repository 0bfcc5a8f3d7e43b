#pragma once

#include <cstdint>
#include <string>

#include "internal/sanitize/capability.hpp"

namespace aegis::sanitize {

/*
  Container-level metadata removal. Works on the encoded bytes directly and
  never decodes pixels, so image data is copied bit for bit.

    JPEG  drop APP1..APP15 (except APP2 ICC_PROFILE and APP14 Adobe), COM,
          anything after EOI
    PNG   drop tEXt zTXt iTXt eXIf tIME
    WebP  drop EXIF and "XMP " chunks, clear VP8X flags, fix RIFF size
    TIFF  unlink Exif/GPS/XMP/IPTC/Photoshop and text tags from IFD0, zero
          the bytes they pointed at
    BMP   Skipped (no metadata container)

  The container is identified by its magic bytes; the extension only matters
  when the signature is unknown. Malformed or truncated input throws
  util::DecodeError, HEIF throws util::UnsupportedFormat.
*/
class ContainerMetadataStripper final : public MetadataStripper {
 public:
  PhaseResult Strip(const arrow::Buffer& bytes, ImageFormat format) override;

  // Each returns the rewritten container, or an empty string when nothing was removed.
  static std::string StripJpeg(const std::uint8_t* data, std::size_t size);
  static std::string StripPng(const std::uint8_t* data, std::size_t size);
  static std::string StripWebp(const std::uint8_t* data, std::size_t size);
  static std::string StripTiff(const std::uint8_t* data, std::size_t size);
};

} // namespace aegis::sanitize
