#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "crypto/secp256k1_ops.hpp"
#include "primitives/transaction.hpp"
#include "scan/detected_payment.hpp"
#include "scan/scan_identity.hpp"

namespace sps::scan {

struct CandidateOutput {
  crypto::XOnlyKey output_key{};
  std::uint32_t taproot_index{0};  // position among the transaction's taproot outputs
  std::uint32_t vout{0};
  primitives::Amount value{0};
  std::uint32_t height{0};
};

std::vector<CandidateOutput> CollectCandidateOutputs(const primitives::CTransaction& tx,
                                                     std::uint32_t height);

// Matches one identity against the candidates. Implements the BIP-352 scan
// loop: for k = 0, 1, ... every unclaimed output is tested against the
// unlabeled key for k and then, through the label reverse map, against each
// registered label; a hit claims the output and advances k, and the first k
// without a hit ends the search.
std::vector<DetectedPayment> MatchIdentity(const ScanIdentity& identity,
                                           const crypto::PubKey& tweak_point,
                                           const primitives::Hash256& txid,
                                           std::span<const CandidateOutput> candidates);

// Every identity is evaluated independently. Results are ordered by vout,
// then identity id, then label.
std::vector<DetectedPayment> DetectPayments(const primitives::CTransaction& tx,
                                            std::uint32_t height,
                                            const crypto::PubKey& tweak_point,
                                            std::span<const ScanIdentity> identities);

}  // namespace sps::scan
