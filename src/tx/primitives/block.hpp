#pragma once

#include <cstdint>
#include <vector>

#include "primitives/hash.hpp"
#include "primitives/transaction.hpp"

namespace sps::primitives {

// A validated block as delivered by the upstream node. Header fields other
// than linkage are not needed for scanning and are not carried.
struct CBlock {
  std::uint32_t height{0};
  Hash256 hash{};
  Hash256 previous_block_hash{};
  std::vector<CTransaction> transactions{};
};

}  // namespace sps::primitives
