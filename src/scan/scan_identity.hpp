#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <unordered_map>
#include <vector>

#include "crypto/secp256k1_ops.hpp"

namespace sps::scan {

struct PubKeyHasher {
  std::size_t operator()(const crypto::PubKey& key) const noexcept {
    std::size_t out = 0;
    std::memcpy(&out, key.data() + 1, sizeof(out));
    return out ^ key[0];
  }
};

struct LabelEntry {
  std::uint32_t index{0};
  crypto::Scalar tweak{};
  crypto::PubKey point{};  // tweak * G
};

inline constexpr std::uint32_t kMaxLabels = 100'000;

// hash_BIP0352/Label(ser256(b_scan) || ser32(m))
crypto::Scalar LabelTweak(const crypto::Scalar& scan_secret, std::uint32_t index);

// A registered receiver. Immutable once built; the label reverse map from
// label point to label index is derived here and never mutated afterwards.
// Label indices run from 1 to label_count; 0 denotes an unlabeled payment.
class ScanIdentity {
 public:
  static bool Create(std::uint32_t id, const crypto::Scalar& scan_secret,
                     const crypto::PubKey& spend_pubkey, std::uint32_t label_count,
                     ScanIdentity* out, std::string* error);

  std::uint32_t id() const { return id_; }
  const crypto::Scalar& scan_secret() const { return scan_secret_; }
  const crypto::PubKey& scan_pubkey() const { return scan_pubkey_; }
  const crypto::PubKey& spend_pubkey() const { return spend_pubkey_; }
  std::uint32_t label_count() const { return static_cast<std::uint32_t>(labels_.size()); }

  const LabelEntry* FindLabelByPoint(const crypto::PubKey& point) const;
  const LabelEntry* Label(std::uint32_t index) const;

 private:
  std::uint32_t id_{0};
  crypto::Scalar scan_secret_{};
  crypto::PubKey scan_pubkey_{};
  crypto::PubKey spend_pubkey_{};
  std::vector<LabelEntry> labels_;
  std::unordered_map<crypto::PubKey, std::size_t, PubKeyHasher> label_by_point_;
};

}  // namespace sps::scan
