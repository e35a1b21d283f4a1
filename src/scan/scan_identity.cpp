#include "scan/scan_identity.hpp"

#include <vector>

#include "primitives/serialize.hpp"

namespace sps::scan {

namespace {

constexpr char kLabelTag[] = "BIP0352/Label";

}  // namespace

crypto::Scalar LabelTweak(const crypto::Scalar& scan_secret, std::uint32_t index) {
  std::vector<std::uint8_t> msg(scan_secret.begin(), scan_secret.end());
  primitives::serialize::WriteUint32BE(&msg, index);
  return crypto::TaggedHash(kLabelTag, msg);
}

bool ScanIdentity::Create(std::uint32_t id, const crypto::Scalar& scan_secret,
                          const crypto::PubKey& spend_pubkey, std::uint32_t label_count,
                          ScanIdentity* out, std::string* error) {
  if (label_count > kMaxLabels) {
    if (error) *error = "label count exceeds " + std::to_string(kMaxLabels);
    return false;
  }
  ScanIdentity identity;
  identity.id_ = id;
  identity.scan_secret_ = scan_secret;
  identity.spend_pubkey_ = spend_pubkey;
  if (!crypto::PubKeyFromScalar(scan_secret, &identity.scan_pubkey_)) {
    if (error) *error = "invalid scan secret key";
    return false;
  }
  if (!crypto::IsValidPubKey(spend_pubkey)) {
    if (error) *error = "invalid spend public key";
    return false;
  }
  identity.labels_.reserve(label_count);
  identity.label_by_point_.reserve(label_count);
  for (std::uint32_t m = 1; m <= label_count; ++m) {
    LabelEntry entry;
    entry.index = m;
    entry.tweak = LabelTweak(scan_secret, m);
    if (!crypto::PubKeyFromScalar(entry.tweak, &entry.point)) {
      if (error) *error = "label " + std::to_string(m) + " yields an invalid tweak";
      return false;
    }
    identity.label_by_point_.emplace(entry.point, identity.labels_.size());
    identity.labels_.push_back(entry);
  }
  *out = std::move(identity);
  return true;
}

const LabelEntry* ScanIdentity::FindLabelByPoint(const crypto::PubKey& point) const {
  const auto it = label_by_point_.find(point);
  if (it == label_by_point_.end()) {
    return nullptr;
  }
  return &labels_[it->second];
}

const LabelEntry* ScanIdentity::Label(std::uint32_t index) const {
  if (index == 0 || index > labels_.size()) {
    return nullptr;
  }
  return &labels_[index - 1];
}

}  // namespace sps::scan
