#pragma once

#include <arrow/buffer.h>

#include <filesystem>
#include <optional>

#include "internal/sanitize/capability.hpp"

namespace aegis::sanitize {

// Case-insensitive extension lookup. GIF and unknown extensions -> nullopt.
std::optional<ImageFormat> FormatFromExtension(const std::filesystem::path& path);

// Magic-byte detection.
std::optional<ImageFormat> SniffFormat(const arrow::Buffer& bytes);

} // namespace aegis::sanitize
