#pragma once

#include <cstdint>

#include "crypto/secp256k1_ops.hpp"
#include "primitives/amount.hpp"
#include "primitives/hash.hpp"

namespace sps::scan {

inline constexpr std::uint32_t kNoLabel = 0;

struct DetectedPayment {
  std::uint32_t identity_id{0};
  std::uint32_t label{kNoLabel};
  primitives::Hash256 txid{};
  std::uint32_t vout{0};
  primitives::Amount value{0};
  std::uint32_t height{0};
  // Added to b_spend by the wallet to obtain the output's private key.
  crypto::Scalar tweak{};

  bool operator==(const DetectedPayment& other) const = default;
};

}  // namespace sps::scan
