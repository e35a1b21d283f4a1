#include "node/query.hpp"

#include <algorithm>
#include <limits>

#include "util/hex.hpp"

namespace sps::node {

IndexQueryService::IndexQueryService(const storage::PaymentIndex* index,
                                     const storage::TweakStore* tweaks,
                                     const scan::IdentityRegistry* registry, TipFn tip)
    : index_(index), tweaks_(tweaks), registry_(registry), tip_(std::move(tip)) {}

std::optional<storage::Watermark> IndexQueryService::Tip() const { return tip_(); }

std::vector<scan::IdentityRecord> IndexQueryService::Identities() const {
  return registry_->Records();
}

std::optional<std::uint32_t> IndexQueryService::CapAtTip(std::optional<std::uint32_t> max_height,
                                                         bool* empty) const {
  const auto tip = tip_();
  *empty = !tip.has_value();
  if (!tip) {
    return std::nullopt;
  }
  return max_height ? std::min(*max_height, tip->height) : tip->height;
}

std::vector<scan::DetectedPayment> IndexQueryService::Payments(
    std::uint32_t identity, std::optional<std::uint32_t> min_height,
    std::optional<std::uint32_t> max_height) const {
  bool empty = false;
  const auto cap = CapAtTip(max_height, &empty);
  if (empty) {
    return {};
  }
  return index_->Collect(identity, min_height, cap);
}

storage::PaymentCursor IndexQueryService::PaymentsSince(std::uint32_t identity,
                                                        std::uint32_t height) const {
  bool empty = false;
  auto cap = CapAtTip(std::nullopt, &empty);
  if (empty || height == std::numeric_limits<std::uint32_t>::max()) {
    // Nothing can satisfy min > max.
    return index_->Query(identity, 1, 0);
  }
  return index_->Query(identity, height + 1, cap);
}

bool IndexQueryService::BlockTweaks(std::uint32_t height, storage::BlockTweaks* out,
                                    std::string* error) const {
  const auto tip = tip_();
  if (!tip || height > tip->height) {
    if (error) *error = "height " + std::to_string(height) + " is above the committed tip";
    return false;
  }
  return tweaks_->ReadBlock(height, out, error);
}

nlohmann::json TipToJson(const std::optional<storage::Watermark>& tip) {
  nlohmann::json out;
  if (!tip) {
    out["height"] = nullptr;
    out["hash"] = nullptr;
    return out;
  }
  out["height"] = tip->height;
  out["hash"] = primitives::HashToDisplayHex(tip->hash);
  return out;
}

nlohmann::json PaymentToJson(const scan::DetectedPayment& payment) {
  nlohmann::json out;
  out["identity"] = payment.identity_id;
  if (payment.label == scan::kNoLabel) {
    out["label"] = nullptr;
  } else {
    out["label"] = payment.label;
  }
  out["txid"] = primitives::HashToDisplayHex(payment.txid);
  out["vout"] = payment.vout;
  out["value"] = payment.value;
  out["height"] = payment.height;
  out["tweak"] = util::HexEncode(payment.tweak);
  return out;
}

nlohmann::json IdentityToJson(const scan::IdentityRecord& record) {
  nlohmann::json out;
  out["id"] = record.id;
  crypto::PubKey scan_pubkey{};
  if (crypto::PubKeyFromScalar(record.scan_secret, &scan_pubkey)) {
    out["scan_pubkey"] = util::HexEncode(scan_pubkey);
  } else {
    out["scan_pubkey"] = nullptr;
  }
  out["spend_pubkey"] = util::HexEncode(record.spend_pubkey);
  out["labels"] = record.label_count;
  out["active"] = record.active;
  out["registered_height"] = record.registered_height;
  return out;
}

nlohmann::json BlockTweaksToJson(const storage::BlockTweaks& block) {
  nlohmann::json out;
  out["height"] = block.height;
  out["hash"] = primitives::HashToDisplayHex(block.hash);
  nlohmann::json tweaks = nlohmann::json::array();
  for (const auto& tweak : block.tweaks) {
    tweaks.push_back(util::HexEncode(tweak));
  }
  out["tweaks"] = std::move(tweaks);
  return out;
}

}  // namespace sps::node
