#include "scan/detector.hpp"

#include <algorithm>
#include <list>
#include <tuple>

#include "scan/tweak_engine.hpp"
#include "script/script.hpp"

namespace sps::scan {

namespace {

// O - P_k for both parities of O, looked up in the identity's label map.
const LabelEntry* RecoverLabel(const ScanIdentity& identity, const crypto::PubKey& unlabeled_key,
                               const crypto::XOnlyKey& output_key) {
  if (identity.label_count() == 0) {
    return nullptr;
  }
  const crypto::PubKey even = crypto::EvenYFromXOnly(output_key);
  crypto::PubKey odd{};
  if (!crypto::NegatePoint(even, &odd)) {
    return nullptr;
  }
  for (const auto& candidate : {even, odd}) {
    crypto::PubKey label_point{};
    if (!crypto::SubtractPoints(candidate, unlabeled_key, &label_point)) {
      continue;
    }
    if (const LabelEntry* entry = identity.FindLabelByPoint(label_point)) {
      return entry;
    }
  }
  return nullptr;
}

}  // namespace

std::vector<CandidateOutput> CollectCandidateOutputs(const primitives::CTransaction& tx,
                                                     std::uint32_t height) {
  std::vector<CandidateOutput> out;
  std::uint32_t taproot_index = 0;
  for (std::size_t i = 0; i < tx.vout.size(); ++i) {
    const auto key = script::TaprootOutputKey(tx.vout[i].script_pubkey);
    if (!key) {
      continue;
    }
    CandidateOutput candidate;
    candidate.output_key = *key;
    candidate.taproot_index = taproot_index++;
    candidate.vout = static_cast<std::uint32_t>(i);
    candidate.value = tx.vout[i].value;
    candidate.height = height;
    out.push_back(candidate);
  }
  return out;
}

std::vector<DetectedPayment> MatchIdentity(const ScanIdentity& identity,
                                           const crypto::PubKey& tweak_point,
                                           const primitives::Hash256& txid,
                                           std::span<const CandidateOutput> candidates) {
  std::vector<DetectedPayment> found;
  crypto::PubKey shared_secret{};
  if (candidates.empty() ||
      !ComputeSharedSecret(tweak_point, identity.scan_secret(), &shared_secret)) {
    return found;
  }
  std::list<const CandidateOutput*> unclaimed;
  for (const auto& candidate : candidates) {
    unclaimed.push_back(&candidate);
  }

  for (std::uint32_t k = 0; !unclaimed.empty(); ++k) {
    const crypto::Scalar tweak_k = SharedSecretTweak(shared_secret, k);
    crypto::PubKey unlabeled_key{};
    if (!crypto::IsValidScalar(tweak_k) ||
        !CandidateKey(identity, tweak_k, kNoLabel, &unlabeled_key)) {
      break;
    }
    const crypto::XOnlyKey unlabeled_x = crypto::ToXOnly(unlabeled_key);

    bool matched = false;
    for (auto it = unclaimed.begin(); it != unclaimed.end(); ++it) {
      const CandidateOutput& candidate = **it;
      DetectedPayment payment;
      payment.identity_id = identity.id();
      payment.txid = txid;
      payment.vout = candidate.vout;
      payment.value = candidate.value;
      payment.height = candidate.height;
      if (candidate.output_key == unlabeled_x) {
        payment.label = kNoLabel;
        payment.tweak = tweak_k;
      } else if (const LabelEntry* label =
                     RecoverLabel(identity, unlabeled_key, candidate.output_key)) {
        payment.label = label->index;
        if (!crypto::AddScalars(tweak_k, label->tweak, &payment.tweak)) {
          continue;
        }
      } else {
        continue;
      }
      found.push_back(payment);
      unclaimed.erase(it);
      matched = true;
      break;
    }
    if (!matched) {
      break;
    }
  }
  return found;
}

std::vector<DetectedPayment> DetectPayments(const primitives::CTransaction& tx,
                                            std::uint32_t height,
                                            const crypto::PubKey& tweak_point,
                                            std::span<const ScanIdentity> identities) {
  std::vector<DetectedPayment> out;
  const auto candidates = CollectCandidateOutputs(tx, height);
  if (candidates.empty()) {
    return out;
  }
  for (const auto& identity : identities) {
    auto found = MatchIdentity(identity, tweak_point, tx.txid, candidates);
    out.insert(out.end(), found.begin(), found.end());
  }
  std::sort(out.begin(), out.end(), [](const DetectedPayment& a, const DetectedPayment& b) {
    return std::tie(a.vout, a.identity_id, a.label) < std::tie(b.vout, b.identity_id, b.label);
  });
  return out;
}

}  // namespace sps::scan
