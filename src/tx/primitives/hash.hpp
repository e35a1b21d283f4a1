#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

namespace sps::primitives {

// Hashes are held in internal (wire) byte order. Block hashes and txids are
// shown to operators byte-reversed, as Bitcoin Core does.
using Hash256 = std::array<std::uint8_t, 32>;

struct Hash256Hasher {
  std::size_t operator()(const Hash256& hash) const noexcept {
    std::size_t out = 0;
    std::memcpy(&out, hash.data(), sizeof(out));
    return out;
  }
};

std::string HashToDisplayHex(const Hash256& hash);
bool ParseDisplayHash(std::string_view hex, Hash256* out);

}  // namespace sps::primitives
