#include "crypto/hash.hpp"

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/sha.h>
#include <oqs/sha3.h>

namespace sps::crypto {

namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

template <std::size_t N>
std::array<std::uint8_t, N> EvpDigest(const EVP_MD* md, std::span<const std::uint8_t> data) {
  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  std::array<std::uint8_t, N> out{};
  unsigned int len = 0;
  if (!ctx || md == nullptr || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1 || len != N) {
    throw std::runtime_error("EVP digest failed");
  }
  return out;
}

}  // namespace

Sha3_256Hash Sha3_256(std::span<const std::uint8_t> data) {
  Sha3_256Hash out{};
  OQS_SHA3_sha3_256(out.data(), data.data(), data.size());
  return out;
}

Sha256Hash Sha256(std::span<const std::uint8_t> data) {
  Sha256Hash out{};
  SHA256(data.data(), data.size(), out.data());
  return out;
}

Sha256Hash DoubleSha256(std::span<const std::uint8_t> data) {
  const auto first = Sha256(data);
  return Sha256(first);
}

Hash160 ComputeHash160(std::span<const std::uint8_t> data) {
  const auto sha = Sha256(data);
  return EvpDigest<20>(EVP_ripemd160(), sha);
}

}  // namespace sps::crypto
