#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>
#include <vector>

#include "primitives/amount.hpp"
#include "primitives/hash.hpp"

namespace sps::primitives {

struct COutPoint {
  Hash256 txid{};
  std::uint32_t index{0};
  bool operator==(const COutPoint& other) const = default;

  [[nodiscard]] bool IsNull() const noexcept {
    return std::all_of(txid.begin(), txid.end(), [](std::uint8_t b) { return b == 0; }) &&
           index == std::numeric_limits<std::uint32_t>::max();
  }

  static COutPoint Null() {
    COutPoint out{};
    out.index = std::numeric_limits<std::uint32_t>::max();
    return out;
  }
};

struct WitnessStackItem {
  std::vector<std::uint8_t> data;
};

struct CTxIn {
  COutPoint prevout{};
  std::vector<std::uint8_t> script_sig{};
  std::vector<WitnessStackItem> witness_stack{};
  std::uint32_t sequence{0xFFFFFFFF};
  // scriptPubKey of the output being spent. Not part of the wire encoding;
  // supplied by the block feed alongside each transaction.
  std::vector<std::uint8_t> prevout_script_pubkey{};
};

struct CTxOut {
  Amount value{0};
  std::vector<std::uint8_t> script_pubkey{};
};

struct CTransaction {
  std::uint32_t version{2};
  std::vector<CTxIn> vin{};
  std::vector<CTxOut> vout{};
  std::uint32_t lock_time{0};
  // Filled in by the feed (or ComputeTxId) before the transaction is scanned.
  Hash256 txid{};

  [[nodiscard]] bool IsCoinbase() const noexcept {
    return vin.size() == 1 && vin.front().prevout.IsNull();
  }
};

}  // namespace sps::primitives
