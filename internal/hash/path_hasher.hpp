#pragma once

#include <arrow/buffer.h>

#include <filesystem>
#include <string>

namespace aegis::hash {

/*
  Content fingerprint: SHA-256 of the file bytes as 64 lowercase hex chars.

  Path, timestamps and permissions never enter the digest, so byte-identical
  files share a fingerprint wherever they live. No retries: a missing,
  unreadable or vanishing file throws util::IOError and the caller decides.
*/
class PathHasher {
 public:
  static constexpr std::size_t kChunkSize = 1 << 16;

  std::string Hash(const std::filesystem::path& path) const;
  std::string HashBuffer(const arrow::Buffer& bytes) const;
};

} // namespace aegis::hash
