#include "scan/tweak_engine.hpp"

#include <vector>

#include "primitives/serialize.hpp"

namespace sps::scan {

namespace {

constexpr char kInputsTag[] = "BIP0352/Inputs";
constexpr char kSharedSecretTag[] = "BIP0352/SharedSecret";

}  // namespace

crypto::Scalar ComputeInputHash(const SerializedOutpoint& smallest_outpoint,
                                const crypto::PubKey& input_sum) {
  std::vector<std::uint8_t> msg;
  msg.reserve(smallest_outpoint.size() + input_sum.size());
  msg.insert(msg.end(), smallest_outpoint.begin(), smallest_outpoint.end());
  msg.insert(msg.end(), input_sum.begin(), input_sum.end());
  return crypto::TaggedHash(kInputsTag, msg);
}

TweakOutcome ComputeTweakPoint(const EligibleInputSet& inputs, crypto::PubKey* tweak_point) {
  crypto::PubKey input_sum{};
  bool is_infinity = false;
  if (!crypto::SumPubKeys(inputs.public_keys, &input_sum, &is_infinity)) {
    // Keys were validated during extraction, so a failed sum is the identity.
    return TweakOutcome::kIdentitySum;
  }
  const auto input_hash = ComputeInputHash(inputs.smallest_outpoint, input_sum);
  if (!crypto::MultiplyPoint(input_sum, input_hash, tweak_point)) {
    return TweakOutcome::kInvalidInputHash;
  }
  return TweakOutcome::kOk;
}

bool ComputeSharedSecret(const crypto::PubKey& tweak_point, const crypto::Scalar& scan_secret,
                         crypto::PubKey* shared_secret) {
  return crypto::MultiplyPoint(tweak_point, scan_secret, shared_secret);
}

crypto::Scalar SharedSecretTweak(const crypto::PubKey& shared_secret, std::uint32_t k) {
  std::vector<std::uint8_t> msg(shared_secret.begin(), shared_secret.end());
  primitives::serialize::WriteUint32BE(&msg, k);
  return crypto::TaggedHash(kSharedSecretTag, msg);
}

bool CandidateKey(const ScanIdentity& identity, const crypto::Scalar& tweak_k,
                  std::uint32_t label, crypto::PubKey* out) {
  crypto::PubKey base = identity.spend_pubkey();
  if (label != 0) {
    const LabelEntry* entry = identity.Label(label);
    if (entry == nullptr || !crypto::AddPoints(base, entry->point, &base)) {
      return false;
    }
  }
  return crypto::AddTweakToPoint(base, tweak_k, out);
}

}  // namespace sps::scan
