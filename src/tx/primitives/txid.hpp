#pragma once

#include "primitives/transaction.hpp"

namespace sps::primitives {

// Double SHA-256 of the transaction without witness data.
Hash256 ComputeTxId(const CTransaction& tx);

}  // namespace sps::primitives
