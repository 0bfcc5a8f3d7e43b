#include "internal/hash/path_hasher.hpp"

#include <arrow/buffer.h>
#include <openssl/evp.h>

#include <cstdint>
#include <memory>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace aegis::hash {

namespace {

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

DigestContext NewSha256() {
  DigestContext ctx(EVP_MD_CTX_new());
  if (!ctx) throw util::AegisError(util::ErrorCode::kInternal, "EVP_MD_CTX_new failed");
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw util::AegisError(util::ErrorCode::kInternal, "EVP_DigestInit_ex failed");
  }
  return ctx;
}

void Update(EVP_MD_CTX* ctx, const std::uint8_t* data, std::size_t size) {
  if (size == 0) return;
  if (EVP_DigestUpdate(ctx, data, size) != 1) {
    throw util::AegisError(util::ErrorCode::kInternal, "EVP_DigestUpdate failed");
  }
}

std::string FinalHex(EVP_MD_CTX* ctx) {
  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int  out_len = 0;
  if (EVP_DigestFinal_ex(ctx, out, &out_len) != 1) {
    throw util::AegisError(util::ErrorCode::kInternal, "EVP_DigestFinal_ex failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           hex;
  hex.reserve(out_len * 2);
  for (unsigned int i = 0; i < out_len; ++i) {
    hex.push_back(kHex[out[i] >> 4]);
    hex.push_back(kHex[out[i] & 0x0f]);
  }
  return hex;
}

} // namespace

std::string PathHasher::Hash(const std::filesystem::path& path) const {
  auto ctx = NewSha256();
  storage::common::ForEachChunk(path, kChunkSize, "hash " + path.string(), [&](const arrow::Buffer& chunk) {
    Update(ctx.get(), chunk.data(), static_cast<std::size_t>(chunk.size()));
  });
  return FinalHex(ctx.get());
}

std::string PathHasher::HashBuffer(const arrow::Buffer& bytes) const {
  auto ctx = NewSha256();
  Update(ctx.get(), bytes.data(), static_cast<std::size_t>(bytes.size()));
  return FinalHex(ctx.get());
}

} // namespace aegis::hash
