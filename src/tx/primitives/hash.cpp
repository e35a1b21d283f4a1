#include "primitives/hash.hpp"

#include <algorithm>
#include <vector>

#include "util/hex.hpp"

namespace sps::primitives {

std::string HashToDisplayHex(const Hash256& hash) {
  Hash256 reversed = hash;
  std::reverse(reversed.begin(), reversed.end());
  return util::HexEncode(reversed);
}

bool ParseDisplayHash(std::string_view hex, Hash256* out) {
  std::vector<std::uint8_t> bytes;
  if (hex.size() != out->size() * 2 || !util::HexDecode(hex, &bytes)) {
    return false;
  }
  std::reverse_copy(bytes.begin(), bytes.end(), out->begin());
  return true;
}

}  // namespace sps::primitives
