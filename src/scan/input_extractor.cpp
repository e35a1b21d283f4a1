#include "scan/input_extractor.hpp"

#include <algorithm>

#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"
#include "script/script.hpp"

namespace sps::scan {

namespace {

// BIP-341 provably unspendable internal key H.
constexpr std::array<std::uint8_t, 32> kNumsH = {
    0x50, 0x92, 0x9b, 0x74, 0xc1, 0xa0, 0x49, 0x54, 0xb7, 0x8b, 0x4b, 0x60, 0x35, 0xe9, 0x7a, 0x5e,
    0x07, 0x8a, 0x5a, 0x0f, 0x28, 0xec, 0x96, 0xd5, 0x47, 0xbf, 0xee, 0x9a, 0xce, 0x80, 0x3a, 0xc0};

std::optional<crypto::PubKey> CompressedKey(const std::vector<std::uint8_t>& bytes) {
  if (bytes.size() != 33 || (bytes[0] != 0x02 && bytes[0] != 0x03)) {
    return std::nullopt;
  }
  crypto::PubKey key{};
  std::copy(bytes.begin(), bytes.end(), key.begin());
  if (!crypto::IsValidPubKey(key)) {
    return std::nullopt;
  }
  return key;
}

std::optional<crypto::PubKey> LastWitnessKey(const primitives::CTxIn& input) {
  if (input.witness_stack.empty()) {
    return std::nullopt;
  }
  return CompressedKey(input.witness_stack.back().data);
}

std::optional<crypto::PubKey> FromPayToPubKeyHash(const primitives::CTxIn& input) {
  const auto& script_sig = input.script_sig;
  const auto& spk = input.prevout_script_pubkey;
  const std::span<const std::uint8_t> key_hash(spk.data() + 3, script::kKeyHashSize);
  // The key is normally the final push, but a malleated scriptSig may append
  // data after it; scan every 33-byte window from the end.
  for (std::size_t end = script_sig.size(); end >= 33; --end) {
    const std::span<const std::uint8_t> window(script_sig.data() + end - 33, 33);
    const auto hash = crypto::ComputeHash160(window);
    if (std::equal(hash.begin(), hash.end(), key_hash.begin())) {
      return CompressedKey(std::vector<std::uint8_t>(window.begin(), window.end()));
    }
  }
  return std::nullopt;
}

std::optional<crypto::PubKey> FromNestedWitnessKeyHash(const primitives::CTxIn& input) {
  std::vector<std::vector<std::uint8_t>> pushes;
  if (!script::ParsePushes(input.script_sig, &pushes) || pushes.size() != 1 ||
      !script::IsPayToWitnessKeyHash(pushes.front())) {
    return std::nullopt;
  }
  return LastWitnessKey(input);
}

std::optional<crypto::PubKey> FromTaproot(const primitives::CTxIn& input) {
  std::vector<primitives::WitnessStackItem> stack = input.witness_stack;
  if (stack.size() > 1 && !stack.back().data.empty() &&
      stack.back().data.front() == script::kTaprootAnnexTag) {
    stack.pop_back();
  }
  if (stack.size() > 1) {
    const auto& control_block = stack.back().data;
    if (control_block.size() >= 33 &&
        std::equal(kNumsH.begin(), kNumsH.end(), control_block.begin() + 1)) {
      return std::nullopt;
    }
  }
  const auto output_key = script::TaprootOutputKey(input.prevout_script_pubkey);
  if (!output_key) {
    return std::nullopt;
  }
  const auto key = crypto::EvenYFromXOnly(*output_key);
  if (!crypto::IsValidPubKey(key)) {
    return std::nullopt;
  }
  return key;
}

}  // namespace

SerializedOutpoint SerializeOutpoint(const primitives::COutPoint& outpoint) {
  SerializedOutpoint out{};
  std::copy(outpoint.txid.begin(), outpoint.txid.end(), out.begin());
  std::vector<std::uint8_t> index;
  primitives::serialize::WriteUint32(&index, outpoint.index);
  std::copy(index.begin(), index.end(), out.begin() + 32);
  return out;
}

std::optional<crypto::PubKey> ExtractInputPublicKey(const primitives::CTxIn& input) {
  const auto& spk = input.prevout_script_pubkey;
  if (script::IsPayToPubKeyHash(spk)) {
    return FromPayToPubKeyHash(input);
  }
  if (script::IsPayToScriptHash(spk)) {
    return FromNestedWitnessKeyHash(input);
  }
  if (script::IsPayToWitnessKeyHash(spk)) {
    return LastWitnessKey(input);
  }
  if (script::IsPayToTaproot(spk)) {
    return FromTaproot(input);
  }
  return std::nullopt;
}

bool HasTaprootOutput(const primitives::CTransaction& tx) {
  return std::any_of(tx.vout.begin(), tx.vout.end(), [](const primitives::CTxOut& out) {
    return script::IsPayToTaproot(out.script_pubkey);
  });
}

std::optional<EligibleInputSet> ExtractEligibleInputs(const primitives::CTransaction& tx) {
  if (tx.vin.empty() || tx.IsCoinbase() || !HasTaprootOutput(tx)) {
    return std::nullopt;
  }
  EligibleInputSet result;
  bool have_outpoint = false;
  for (const auto& input : tx.vin) {
    const auto program = script::ExtractWitnessProgram(input.prevout_script_pubkey);
    if (program && program->version > 1) {
      return std::nullopt;
    }
    const auto serialized = SerializeOutpoint(input.prevout);
    if (!have_outpoint || serialized < result.smallest_outpoint) {
      result.smallest_outpoint = serialized;
      have_outpoint = true;
    }
    if (auto key = ExtractInputPublicKey(input)) {
      result.public_keys.push_back(*key);
    }
  }
  if (result.public_keys.empty()) {
    return std::nullopt;
  }
  return result;
}

}  // namespace sps::scan
