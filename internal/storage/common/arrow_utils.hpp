#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/result.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace aegis::storage::common {

// Arrow failures on image files surface as util::IOError prefixed with `what`.
template <typename T>
T Unwrap(const arrow::Result<T>& result, const std::string& what) {
  if (!result.ok()) throw util::IOError(what + ": " + result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status, const std::string& what) {
  if (!status.ok()) throw util::IOError(what + ": " + status.ToString());
}

inline std::string_view AsView(const arrow::Buffer& buffer) {
  return {reinterpret_cast<const char*>(buffer.data()), static_cast<std::size_t>(buffer.size())};
}

/*
  Streams a file in fixed-size chunks; returns the byte count seen.
  The file is closed before returning.
*/
template <typename Fn>
std::uint64_t ForEachChunk(const std::filesystem::path& path, std::int64_t chunk_size, const std::string& what, Fn&& fn) {
  auto          file  = Unwrap(arrow::io::ReadableFile::Open(path.string()), what);
  std::uint64_t total = 0;
  while (true) {
    auto chunk = Unwrap(file->Read(chunk_size), what);
    if (chunk->size() == 0) break;
    total += static_cast<std::uint64_t>(chunk->size());
    fn(*chunk);
  }
  Unwrap(file->Close(), what);
  return total;
}

// Whole file in one buffer.
inline std::shared_ptr<arrow::Buffer> ReadWhole(const std::filesystem::path& path, const std::string& what) {
  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()), what);
  auto size = Unwrap(file->GetSize(), what);
  auto data = Unwrap(file->Read(size), what);
  Unwrap(file->Close(), what);
  return data;
}

} // namespace aegis::storage::common
