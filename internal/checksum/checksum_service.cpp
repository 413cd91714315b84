#include "checksum_service.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

#include "internal/util/errors.hpp"

namespace deploy::checksum {

namespace fs = std::filesystem;

namespace {

struct DigestDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using DigestPtr = std::unique_ptr<EVP_MD_CTX, DigestDeleter>;

DigestPtr NewDigest() {
  DigestPtr ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("sha256 init failed");
  }
  return ctx;
}

void Update(EVP_MD_CTX* ctx, const void* data, std::size_t size) {
  if (EVP_DigestUpdate(ctx, data, size) != 1) {
    throw std::runtime_error("sha256 update failed");
  }
}

void UpdateFromFile(EVP_MD_CTX* ctx, const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::DeploymentIOError("cannot read " + path.string());
  }

  std::array<char, ChecksumService::kChunkSize> buf{};
  while (in) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const auto n = in.gcount();
    if (n > 0) Update(ctx, buf.data(), static_cast<std::size_t>(n));
  }
  if (in.bad()) {
    throw util::DeploymentIOError("read failed " + path.string());
  }
}

std::string Finish(EVP_MD_CTX* ctx) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
  unsigned int                               len = 0;
  if (EVP_DigestFinal_ex(ctx, md.data(), &len) != 1) {
    throw std::runtime_error("sha256 final failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(len * 2);
  for (unsigned int i = 0; i < len; ++i) {
    out.push_back(kHex[md[i] >> 4]);
    out.push_back(kHex[md[i] & 0x0f]);
  }
  return out;
}

} // namespace

std::string ChecksumService::FileChecksum(const fs::path& path) const {
  auto ctx = NewDigest();
  UpdateFromFile(ctx.get(), path);
  return Finish(ctx.get());
}

std::string ChecksumService::TreeChecksum(const fs::path& root, const std::set<std::string>& excluded) const {
  std::vector<std::string> rel_paths;
  for (const auto& entry : fs::recursive_directory_iterator(root)) {
    if (!entry.is_regular_file()) continue;
    auto rel = fs::relative(entry.path(), root).generic_string();
    if (excluded.contains(rel)) continue;
    rel_paths.push_back(std::move(rel));
  }
  std::sort(rel_paths.begin(), rel_paths.end());

  auto ctx = NewDigest();
  for (const auto& rel : rel_paths) {
    Update(ctx.get(), rel.data(), rel.size());
    UpdateFromFile(ctx.get(), root / rel);
  }
  return Finish(ctx.get());
}

bool ChecksumService::Verify(const fs::path& path, const std::string& expected) const {
  return FileChecksum(path) == expected;
}

} // namespace deploy::checksum
