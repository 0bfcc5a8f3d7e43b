#include "internal/sanitize/image_format.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "internal/storage/common/arrow_utils.hpp"

namespace aegis::sanitize {

std::string_view FormatName(ImageFormat format) {
  switch (format) {
    case ImageFormat::kJpeg:
      return "jpeg";
    case ImageFormat::kPng:
      return "png";
    case ImageFormat::kBmp:
      return "bmp";
    case ImageFormat::kTiff:
      return "tiff";
    case ImageFormat::kWebp:
      return "webp";
    case ImageFormat::kHeif:
      return "heif";
  }
  return "unknown";
}

std::optional<ImageFormat> FormatFromExtension(const std::filesystem::path& path) {
  auto ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (ext == ".jpg" || ext == ".jpeg") return ImageFormat::kJpeg;
  if (ext == ".png") return ImageFormat::kPng;
  if (ext == ".bmp") return ImageFormat::kBmp;
  if (ext == ".tif" || ext == ".tiff") return ImageFormat::kTiff;
  if (ext == ".webp") return ImageFormat::kWebp;
  if (ext == ".heif" || ext == ".heic") return ImageFormat::kHeif;
  return std::nullopt;
}

std::optional<ImageFormat> SniffFormat(const arrow::Buffer& bytes) {
  const auto* d    = bytes.data();
  const auto  size = bytes.size();
  const auto  view = storage::common::AsView(bytes);

  auto starts_with = [&](std::size_t offset, std::string_view magic) {
    return view.size() >= offset && view.substr(offset).starts_with(magic);
  };

  if (size >= 3 && d[0] == 0xFF && d[1] == 0xD8 && d[2] == 0xFF) return ImageFormat::kJpeg;
  if (starts_with(0, "\x89PNG\r\n\x1a\n")) return ImageFormat::kPng;
  if (starts_with(0, "BM")) return ImageFormat::kBmp;
  // 42 classic TIFF, 43 BigTIFF
  if (size >= 4 && ((d[0] == 'I' && d[1] == 'I' && (d[2] == 0x2A || d[2] == 0x2B) && d[3] == 0x00) ||
                    (d[0] == 'M' && d[1] == 'M' && d[2] == 0x00 && (d[3] == 0x2A || d[3] == 0x2B)))) {
    return ImageFormat::kTiff;
  }
  if (starts_with(0, "RIFF") && starts_with(8, "WEBP")) return ImageFormat::kWebp;
  if (starts_with(4, "ftyp") && (starts_with(8, "heic") || starts_with(8, "heix") || starts_with(8, "mif1") || starts_with(8, "msf1"))) {
    return ImageFormat::kHeif;
  }
  return std::nullopt;
}

} // namespace aegis::sanitize
