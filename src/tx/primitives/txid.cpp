#include "primitives/txid.hpp"

#include <vector>

#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"

namespace sps::primitives {

Hash256 ComputeTxId(const CTransaction& tx) {
  std::vector<std::uint8_t> buffer;
  serialize::SerializeTransaction(tx, &buffer, /*include_witness=*/false);
  const auto hash = crypto::DoubleSha256(buffer);
  Hash256 result{};
  std::copy(hash.begin(), hash.end(), result.begin());
  return result;
}

}  // namespace sps::primitives
