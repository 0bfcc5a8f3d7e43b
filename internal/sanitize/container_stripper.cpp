#include "internal/sanitize/container_stripper.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <unordered_set>
#include <vector>

#include "internal/sanitize/image_format.hpp"
#include "internal/util/errors.hpp"

namespace aegis::sanitize {

namespace {

std::uint16_t Be16(const std::uint8_t* p) {
  return static_cast<std::uint16_t>((p[0] << 8) | p[1]);
}

std::uint32_t Be32(const std::uint8_t* p) {
  return (std::uint32_t{p[0]} << 24) | (std::uint32_t{p[1]} << 16) | (std::uint32_t{p[2]} << 8) | std::uint32_t{p[3]};
}

std::uint32_t Le32(const std::uint8_t* p) {
  return std::uint32_t{p[0]} | (std::uint32_t{p[1]} << 8) | (std::uint32_t{p[2]} << 16) | (std::uint32_t{p[3]} << 24);
}

void PutLe32(std::string& out, std::size_t offset, std::uint32_t v) {
  out[offset]     = static_cast<char>(v & 0xFF);
  out[offset + 1] = static_cast<char>((v >> 8) & 0xFF);
  out[offset + 2] = static_cast<char>((v >> 16) & 0xFF);
  out[offset + 3] = static_cast<char>((v >> 24) & 0xFF);
}

void Append(std::string& out, const std::uint8_t* p, std::size_t n) {
  out.append(reinterpret_cast<const char*>(p), n);
}

// ------------------------------------------------------------------
// TIFF
// ------------------------------------------------------------------

class TiffView {
 public:
  TiffView(std::uint8_t* data, std::size_t size) : data_(data), size_(size) {
    if (size_ < 8) throw util::DecodeError("tiff: header truncated");
    if (data_[0] == 'I' && data_[1] == 'I') {
      little_ = true;
    } else if (data_[0] == 'M' && data_[1] == 'M') {
      little_ = false;
    } else {
      throw util::DecodeError("tiff: bad byte order mark");
    }
    auto version = U16(2);
    if (version == 43) throw util::UnsupportedFormat("tiff: BigTIFF is not supported");
    if (version != 42) throw util::DecodeError("tiff: bad version");
  }

  bool InBounds(std::size_t offset, std::size_t len) const {
    return offset <= size_ && len <= size_ - offset;
  }

  std::uint16_t U16(std::size_t offset) const {
    Require(offset, 2);
    const auto* p = data_ + offset;
    return little_ ? static_cast<std::uint16_t>(p[0] | (p[1] << 8)) : static_cast<std::uint16_t>((p[0] << 8) | p[1]);
  }

  std::uint32_t U32(std::size_t offset) const {
    Require(offset, 4);
    const auto* p = data_ + offset;
    return little_ ? Le32(p) : Be32(p);
  }

  void PutU16(std::size_t offset, std::uint16_t v) {
    Require(offset, 2);
    if (little_) {
      data_[offset]     = static_cast<std::uint8_t>(v & 0xFF);
      data_[offset + 1] = static_cast<std::uint8_t>(v >> 8);
    } else {
      data_[offset]     = static_cast<std::uint8_t>(v >> 8);
      data_[offset + 1] = static_cast<std::uint8_t>(v & 0xFF);
    }
  }

  void PutU32(std::size_t offset, std::uint32_t v) {
    Require(offset, 4);
    for (int i = 0; i < 4; ++i) {
      int shift = little_ ? 8 * i : 8 * (3 - i);
      data_[offset + static_cast<std::size_t>(i)] = static_cast<std::uint8_t>((v >> shift) & 0xFF);
    }
  }

  // Zeroes the in-bounds part of [offset, offset+len).
  void Zero(std::size_t offset, std::size_t len) {
    if (offset >= size_) return;
    len = std::min(len, size_ - offset);
    std::memset(data_ + offset, 0, len);
  }

  void Require(std::size_t offset, std::size_t len) const {
    if (!InBounds(offset, len)) throw util::DecodeError("tiff: offset out of range");
  }

 private:
  std::uint8_t* data_;
  std::size_t   size_;
  bool          little_ = true;
};

constexpr std::uint16_t kTagExifIfd   = 34665;
constexpr std::uint16_t kTagGpsIfd    = 34853;
constexpr std::uint16_t kTagXmp       = 700;
constexpr std::uint16_t kTagIptc      = 33723;
constexpr std::uint16_t kTagPhotoshop = 34377;

const std::unordered_set<std::uint16_t>& PrivateTiffTags() {
  static const std::unordered_set<std::uint16_t> tags = {
      kTagExifIfd, kTagGpsIfd, kTagXmp, kTagIptc, kTagPhotoshop,
      270,    // ImageDescription
      271,    // Make
      272,    // Model
      305,    // Software
      306,    // DateTime
      315,    // Artist
      316,    // HostComputer
      33432,  // Copyright
  };
  return tags;
}

std::size_t TiffTypeSize(std::uint16_t type) {
  switch (type) {
    case 3:
    case 8:
      return 2;
    case 4:
    case 9:
    case 11:
    case 13:
      return 4;
    case 5:
    case 10:
    case 12:
      return 8;
    default:
      return 1;
  }
}

// Zero the out-of-line value of the entry at `entry` (values <= 4 bytes live in the entry).
void ZeroEntryValue(TiffView& tiff, std::size_t entry) {
  auto type  = tiff.U16(entry + 2);
  auto count = tiff.U32(entry + 4);
  auto bytes = static_cast<std::size_t>(count) * TiffTypeSize(type);
  if (bytes > 4) {
    tiff.Zero(tiff.U32(entry + 8), bytes);
  }
}

// Wipe a sub-IFD (Exif, GPS) and every value it points at.
void ZeroSubIfd(TiffView& tiff, std::size_t ifd) {
  if (!tiff.InBounds(ifd, 2)) return;
  auto n = tiff.U16(ifd);
  if (!tiff.InBounds(ifd + 2, std::size_t{n} * 12 + 4)) {
    tiff.Zero(ifd, 2);
    return;
  }
  for (std::size_t i = 0; i < n; ++i) {
    ZeroEntryValue(tiff, ifd + 2 + i * 12);
  }
  tiff.Zero(ifd, 2 + std::size_t{n} * 12 + 4);
}

} // namespace

PhaseResult ContainerMetadataStripper::Strip(const arrow::Buffer& bytes, ImageFormat format) {
  auto sniffed = SniffFormat(bytes);
  if (sniffed) {
    format = *sniffed;
  } else if (format != ImageFormat::kBmp) {
    throw util::DecodeError(std::string(FormatName(format)) + ": unrecognized file signature");
  }

  const auto* data = bytes.data();
  const auto  size = static_cast<std::size_t>(bytes.size());

  std::string out;
  switch (format) {
    case ImageFormat::kJpeg:
      out = StripJpeg(data, size);
      break;
    case ImageFormat::kPng:
      out = StripPng(data, size);
      break;
    case ImageFormat::kWebp:
      out = StripWebp(data, size);
      break;
    case ImageFormat::kTiff:
      out = StripTiff(data, size);
      break;
    case ImageFormat::kBmp:
      return PhaseResult::Skipped("bmp has no metadata container");
    case ImageFormat::kHeif:
      throw util::UnsupportedFormat("heif: no built-in metadata support");
  }

  if (out.empty()) {
    return PhaseResult::Skipped("no metadata found");
  }
  return PhaseResult::Applied(arrow::Buffer::FromString(std::move(out)));
}

std::string ContainerMetadataStripper::StripJpeg(const std::uint8_t* d, std::size_t size) {
  if (size < 4 || d[0] != 0xFF || d[1] != 0xD8) throw util::DecodeError("jpeg: missing SOI");

  std::string out;
  out.reserve(size);
  Append(out, d, 2);

  bool        changed = false;
  std::size_t pos     = 2;

  while (true) {
    if (pos + 2 > size) throw util::DecodeError("jpeg: truncated before EOI");
    if (d[pos] != 0xFF) throw util::DecodeError("jpeg: expected marker");

    // fill bytes
    while (pos + 1 < size && d[pos + 1] == 0xFF) ++pos;
    if (pos + 2 > size) throw util::DecodeError("jpeg: truncated marker");
    const std::uint8_t marker = d[pos + 1];

    if (marker == 0xD9) {
      Append(out, d + pos, 2);
      if (pos + 2 != size) changed = true;
      break;
    }

    if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) {
      Append(out, d + pos, 2);
      pos += 2;
      continue;
    }

    if (pos + 4 > size) throw util::DecodeError("jpeg: truncated segment header");
    const std::size_t len = Be16(d + pos + 2);
    if (len < 2 || pos + 2 + len > size) throw util::DecodeError("jpeg: segment length out of range");

    const std::uint8_t* payload     = d + pos + 4;
    const std::size_t   payload_len = len - 2;
    const std::size_t   seg_end     = pos + 2 + len;

    bool keep = true;
    if (marker >= 0xE0 && marker <= 0xEF) {
      if (marker == 0xE0 || marker == 0xEE) {
        keep = true;
      } else if (marker == 0xE2) {
        keep = payload_len >= 12 && std::memcmp(payload, "ICC_PROFILE\0", 12) == 0;
      } else {
        keep = false;
      }
    } else if (marker == 0xFE) {
      keep = false;
    }

    if (!keep) {
      changed = true;
      pos     = seg_end;
      continue;
    }

    Append(out, d + pos, seg_end - pos);
    pos = seg_end;

    if (marker == 0xDA) {
      // entropy-coded data runs until the next non-RST marker
      std::size_t scan = pos;
      while (true) {
        if (scan + 1 >= size) throw util::DecodeError("jpeg: truncated scan data");
        if (d[scan] == 0xFF) {
          const std::uint8_t next = d[scan + 1];
          if (next == 0x00 || (next >= 0xD0 && next <= 0xD7)) {
            scan += 2;
            continue;
          }
          if (next == 0xFF) {
            ++scan;
            continue;
          }
          break;
        }
        ++scan;
      }
      Append(out, d + pos, scan - pos);
      pos = scan;
    }
  }

  return changed ? out : std::string{};
}

std::string ContainerMetadataStripper::StripPng(const std::uint8_t* d, std::size_t size) {
  static constexpr std::uint8_t kSignature[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
  if (size < 8 || std::memcmp(d, kSignature, 8) != 0) throw util::DecodeError("png: bad signature");

  std::string out;
  out.reserve(size);
  Append(out, d, 8);

  bool        changed  = false;
  bool        seen_end = false;
  std::size_t pos      = 8;

  while (pos < size) {
    if (pos + 12 > size) throw util::DecodeError("png: truncated chunk header");
    const std::uint32_t len = Be32(d + pos);
    if (len > 0x7FFFFFFFu) throw util::DecodeError("png: chunk length out of range");
    const std::size_t total = std::size_t{len} + 12;
    if (total > size - pos) throw util::DecodeError("png: truncated chunk");

    const std::string type(reinterpret_cast<const char*>(d + pos + 4), 4);
    if (pos == 8 && type != "IHDR") throw util::DecodeError("png: first chunk is not IHDR");

    if (type == "tEXt" || type == "zTXt" || type == "iTXt" || type == "eXIf" || type == "tIME") {
      changed = true;
    } else {
      Append(out, d + pos, total);
    }
    pos += total;

    if (type == "IEND") {
      seen_end = true;
      break;
    }
  }

  if (!seen_end) throw util::DecodeError("png: missing IEND");
  if (pos != size) changed = true;

  return changed ? out : std::string{};
}

std::string ContainerMetadataStripper::StripWebp(const std::uint8_t* d, std::size_t size) {
  if (size < 12 || std::memcmp(d, "RIFF", 4) != 0 || std::memcmp(d + 8, "WEBP", 4) != 0) {
    throw util::DecodeError("webp: bad RIFF header");
  }
  const std::size_t riff_end = std::size_t{Le32(d + 4)} + 8;
  if (riff_end > size || riff_end < 12) throw util::DecodeError("webp: RIFF size out of range");

  std::string out;
  out.reserve(riff_end);
  Append(out, d, 12);

  bool        changed    = riff_end != size;
  std::size_t vp8x_flags = std::string::npos;
  std::size_t pos        = 12;

  while (pos < riff_end) {
    if (pos + 8 > riff_end) throw util::DecodeError("webp: truncated chunk header");
    const std::string   fourcc(reinterpret_cast<const char*>(d + pos), 4);
    const std::uint32_t len    = Le32(d + pos + 4);
    const std::size_t   padded = std::size_t{len} + (len & 1u);
    if (padded > riff_end - pos - 8) throw util::DecodeError("webp: truncated chunk");

    if (fourcc == "EXIF" || fourcc == "XMP ") {
      changed = true;
    } else {
      if (fourcc == "VP8X") {
        if (len < 10) throw util::DecodeError("webp: VP8X chunk too short");
        vp8x_flags = out.size() + 8;
      }
      Append(out, d + pos, 8 + padded);
    }
    pos += 8 + padded;
  }

  if (vp8x_flags != std::string::npos) {
    auto flags = static_cast<std::uint8_t>(out[vp8x_flags]);
    if (flags & 0x0C) {
      out[vp8x_flags] = static_cast<char>(flags & ~0x0C);
      changed         = true;
    }
  }

  if (!changed) return {};

  PutLe32(out, 4, static_cast<std::uint32_t>(out.size() - 8));
  return out;
}

std::string ContainerMetadataStripper::StripTiff(const std::uint8_t* d, std::size_t size) {
  std::vector<std::uint8_t> buf(d, d + size);
  TiffView                  tiff(buf.data(), buf.size());

  const std::size_t ifd = tiff.U32(4);
  const std::size_t n   = tiff.U16(ifd);
  tiff.Require(ifd + 2, n * 12 + 4);
  const std::uint32_t next_ifd = tiff.U32(ifd + 2 + n * 12);

  const auto&                            drop = PrivateTiffTags();
  std::vector<std::array<std::uint8_t, 12>> kept;
  kept.reserve(n);

  for (std::size_t i = 0; i < n; ++i) {
    const std::size_t   entry = ifd + 2 + i * 12;
    const std::uint16_t tag   = tiff.U16(entry);
    if (!drop.count(tag)) {
      std::array<std::uint8_t, 12> raw{};
      std::memcpy(raw.data(), buf.data() + entry, 12);
      kept.push_back(raw);
      continue;
    }

    if (tag == kTagExifIfd || tag == kTagGpsIfd) {
      ZeroSubIfd(tiff, tiff.U32(entry + 8));
    } else {
      ZeroEntryValue(tiff, entry);
    }
  }

  if (kept.size() == n) return {};

  tiff.Zero(ifd, 2 + n * 12 + 4);
  tiff.PutU16(ifd, static_cast<std::uint16_t>(kept.size()));
  for (std::size_t i = 0; i < kept.size(); ++i) {
    std::memcpy(buf.data() + ifd + 2 + i * 12, kept[i].data(), 12);
  }
  tiff.PutU32(ifd + 2 + kept.size() * 12, next_ifd);

  return std::string(reinterpret_cast<const char*>(buf.data()), buf.size());
}

} // namespace aegis::sanitize
