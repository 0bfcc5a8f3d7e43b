#include "internal/storage/atomic_file.hpp"

#include <arrow/io/file.h>
#include <fcntl.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace aegis::storage {

namespace fs = std::filesystem;
using common::Unwrap;

namespace {

std::atomic<std::uint64_t> g_temp_counter{0};

void RemoveQuietly(const fs::path& path) {
  std::error_code ec;
  fs::remove(path, ec);
}

} // namespace

bool IsTempPath(const fs::path& path) {
  return path.filename().string().find(kTempMarker) != std::string::npos;
}

fs::path TempPathFor(const fs::path& target) {
  auto name = "." + target.filename().string() + "." + std::to_string(::getpid()) + "-" + std::to_string(g_temp_counter.fetch_add(1)) +
              std::string(kTempMarker);
  return target.parent_path() / name;
}

std::shared_ptr<arrow::Buffer> ReadFile(const fs::path& path) {
  return common::ReadWhole(path, "read " + path.string());
}

void AtomicWrite(const fs::path& target, const arrow::Buffer& bytes, std::optional<fs::perms> perms) {
  const auto tmp_path = TempPathFor(target);
  const auto what     = "write " + target.string();

  if (!perms) {
    std::error_code ec;
    auto            status = fs::status(target, ec);
    if (!ec && fs::exists(status)) {
      perms = status.permissions();
    }
  }

  try {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path.string()), what);
    Unwrap(out->Write(bytes.data(), bytes.size()), what);
    Unwrap(out->Flush(), what);
    if (::fsync(out->file_descriptor()) != 0) {
      throw util::IOError(what + ": fsync: " + std::strerror(errno));
    }
    Unwrap(out->Close(), what);

    if (perms) {
      fs::permissions(tmp_path, *perms, fs::perm_options::replace);
    }

    fs::rename(tmp_path, target);
  } catch (const std::system_error& e) {
    RemoveQuietly(tmp_path);
    throw util::IOError(what + ": " + e.what());
  } catch (...) {
    RemoveQuietly(tmp_path);
    throw;
  }

  if (auto ec = SyncDirectory(target.parent_path())) {
    AEGIS_LOG_WARN("directory fsync failed after rename", {observability::PathField("path", target), observability::StringField("error", ec.message())});
  }
}

void DurableCopy(const fs::path& source, const fs::path& dest) {
  std::error_code ec;
  fs::create_directories(dest.parent_path(), ec);
  if (ec) {
    throw util::IOError("create " + dest.parent_path().string() + ": " + ec.message());
  }

  auto perms = fs::status(source, ec).permissions();
  if (ec) {
    throw util::IOError("stat " + source.string() + ": " + ec.message());
  }

  AtomicWrite(dest, *ReadFile(source), perms);
}

std::error_code SyncDirectory(const fs::path& dir) noexcept {
  const char* target = dir.empty() ? "." : dir.c_str();
  int         fd     = ::open(target, O_RDONLY | O_DIRECTORY);
  if (fd < 0) {
    return {errno, std::generic_category()};
  }
  int rc  = ::fsync(fd);
  int err = errno;
  ::close(fd);
  if (rc != 0) {
    return {err, std::generic_category()};
  }
  return {};
}

} // namespace aegis::storage
