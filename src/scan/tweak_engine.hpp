#pragma once

#include <cstdint>

#include "crypto/secp256k1_ops.hpp"
#include "scan/input_extractor.hpp"
#include "scan/scan_identity.hpp"

namespace sps::scan {

enum class TweakOutcome {
  kOk,
  // Eligible keys sum to the point at infinity; no output can match.
  kIdentitySum,
  // input_hash is not a valid scalar (probability ~2^-128).
  kInvalidInputHash,
};

// input_hash = hash_BIP0352/Inputs(smallest_outpoint || ser(A_sum))
crypto::Scalar ComputeInputHash(const SerializedOutpoint& smallest_outpoint,
                                const crypto::PubKey& input_sum);

// Identity-independent part of the shared secret: input_hash * A_sum. This is
// the per-transaction value stored for light clients.
TweakOutcome ComputeTweakPoint(const EligibleInputSet& inputs, crypto::PubKey* tweak_point);

// b_scan * tweak_point
bool ComputeSharedSecret(const crypto::PubKey& tweak_point, const crypto::Scalar& scan_secret,
                         crypto::PubKey* shared_secret);

// t_k = hash_BIP0352/SharedSecret(ser(shared_secret) || ser32(k))
crypto::Scalar SharedSecretTweak(const crypto::PubKey& shared_secret, std::uint32_t k);

// B_spend + label_m * G + t_k * G, with label 0 meaning no label.
bool CandidateKey(const ScanIdentity& identity, const crypto::Scalar& tweak_k,
                  std::uint32_t label, crypto::PubKey* out);

}  // namespace sps::scan
