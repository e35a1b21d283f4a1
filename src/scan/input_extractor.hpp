#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

#include "crypto/secp256k1_ops.hpp"
#include "primitives/transaction.hpp"

namespace sps::scan {

// txid (internal byte order) || vout (little-endian).
using SerializedOutpoint = std::array<std::uint8_t, 36>;

struct EligibleInputSet {
  std::vector<crypto::PubKey> public_keys;
  SerializedOutpoint smallest_outpoint{};
};

SerializedOutpoint SerializeOutpoint(const primitives::COutPoint& outpoint);

// Public key contributed by a single input, or nullopt when the spent script
// type is not one BIP-352 accepts or the key cannot be recovered.
std::optional<crypto::PubKey> ExtractInputPublicKey(const primitives::CTxIn& input);

// Returns nullopt for transactions that cannot carry a silent payment:
// coinbase, no taproot output, any spend of a witness v2+ output, or no
// eligible input. Each input must carry its prevout scriptPubKey.
std::optional<EligibleInputSet> ExtractEligibleInputs(const primitives::CTransaction& tx);

bool HasTaprootOutput(const primitives::CTransaction& tx);

}  // namespace sps::scan
