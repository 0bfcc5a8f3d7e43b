#pragma once

#include <arrow/buffer.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <system_error>

namespace aegis::storage {

// Every temp file the pipeline creates carries this marker in its name.
inline constexpr std::string_view kTempMarker = ".aegis-tmp";

bool IsTempPath(const std::filesystem::path& path);

// Hidden sibling of `target`, unique per call.
std::filesystem::path TempPathFor(const std::filesystem::path& target);

/*
  Read entire file into an arrow buffer.
  Throws util::IOError on missing/unreadable files.
*/
std::shared_ptr<arrow::Buffer> ReadFile(const std::filesystem::path& path);

/*
  Atomic write:
      tmp beside target -> write -> fsync -> chmod -> rename -> fsync(dir)

  Readers of `target` see either the previous content or `bytes`, never a
  mix. `perms` defaults to the permissions of the existing target.
  Throws util::IOError up to and including the rename; the temp file is
  removed on failure. Once renamed the write has happened, so a failing
  directory fsync is only logged.
*/
void AtomicWrite(const std::filesystem::path& target, const arrow::Buffer& bytes,
                 std::optional<std::filesystem::perms> perms = std::nullopt);

/*
  Copy `source` to `dest` through AtomicWrite, keeping the source
  permissions. The parent directory is created; an existing `dest` (a
  reserved placeholder) is replaced.
*/
void DurableCopy(const std::filesystem::path& source, const std::filesystem::path& dest);

// fsync on the directory itself so a rename inside it survives a crash.
std::error_code SyncDirectory(const std::filesystem::path& dir) noexcept;

} // namespace aegis::storage
