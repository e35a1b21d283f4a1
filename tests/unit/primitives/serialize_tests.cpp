#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "primitives/hash.hpp"
#include "primitives/serialize.hpp"
#include "primitives/txid.hpp"
#include "util/hex.hpp"

namespace {

bool ExpectEq(const std::vector<std::uint8_t>& actual, const std::vector<std::uint8_t>& expected,
              const char* label) {
  if (actual != expected) {
    std::cerr << label << ": mismatch (size " << actual.size() << " vs " << expected.size()
              << ")\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  using namespace sps::primitives;
  using namespace sps::primitives::serialize;

  {
    std::vector<std::uint8_t> out;
    WriteVarInt(&out, 0xFC);
    if (!ExpectEq(out, {0xFC}, "encode 0xFC")) return 1;
  }

  {
    std::vector<std::uint8_t> out;
    WriteVarInt(&out, 300);
    if (!ExpectEq(out, {0xFD, 0x2C, 0x01}, "encode 300")) return 1;
  }

  {
    std::vector<std::uint8_t> out;
    WriteUint32BE(&out, 0x01020304);
    if (!ExpectEq(out, {0x01, 0x02, 0x03, 0x04}, "ser32 big-endian")) return 1;
  }

  // Non-canonical encodings should be rejected.
  {
    const std::vector<std::uint8_t> non_canonical = {0xFD, 0xFC, 0x00};  // 0xFC must be 1 byte
    std::size_t offset = 0;
    std::uint64_t value = 0;
    if (ReadVarInt(non_canonical, &offset, &value)) {
      std::cerr << "non-canonical 0xFC accepted\n";
      return 1;
    }
  }

  {
    const std::vector<std::uint8_t> non_canonical = {0xFE, 0xFF, 0xFF, 0x00, 0x00};  // 0xFFFF
    std::size_t offset = 0;
    std::uint64_t value = 0;
    if (ReadVarInt(non_canonical, &offset, &value)) {
      std::cerr << "non-canonical 0xFFFF accepted\n";
      return 1;
    }
  }

  // Legacy transaction: Bitcoin block 170, the first transaction between two people.
  {
    const std::string hex =
        "0100000001c997a5e56e104102fa209c6a852dd90660a20b2d9c352423edce25857fcd3704000000004847"
        "304402204e45e16932b8af514961a1d3a1a25fdf3f4f7732e9d624c6c61548ab5fb8cd410220181522ec8e"
        "ca07de4860a4acdd12909d831cc56cbbac4622082221a8768d1d0901ffffffff0200ca9a3b000000004341"
        "04ae1a62fe09c5f51b13905f07f06b99a2f7159b2225f374cd378d71302fa28414e7aab37397f554a7df5f"
        "142c21c1b7303b8a0626f1baded5c72a704f7e6cd84cac00286bee0000000043410411db93e1dcdb8a016b"
        "49840f8c53bc1eb68a382e97b1482ecad7b148a6909a5cb2e0eaddfb84ccf9744464f82e160bfa9b8b64f9"
        "d4c03f999b8643f656b412a3ac00000000";
    std::vector<std::uint8_t> raw;
    CTransaction tx;
    std::size_t offset = 0;
    if (!sps::util::HexDecode(hex, &raw) || !DeserializeTransaction(raw, &offset, &tx) ||
        offset != raw.size() || tx.vin.size() != 1 || tx.vout.size() != 2) {
      std::cerr << "legacy transaction did not decode\n";
      return 1;
    }
    if (HashToDisplayHex(ComputeTxId(tx)) !=
        "f4184fc596403b9d638783cf57adfe4c75c605f6356fbc91338530e9831e9e16") {
      std::cerr << "legacy txid mismatch\n";
      return 1;
    }
    std::vector<std::uint8_t> reencoded;
    SerializeTransaction(tx, &reencoded);
    if (!ExpectEq(reencoded, raw, "legacy re-encode")) return 1;
  }

  // Witness data is carried but excluded from the txid.
  {
    CTransaction tx;
    tx.vin.resize(1);
    tx.vin[0].prevout.txid.fill(0x11);
    tx.vin[0].prevout.index = 3;
    tx.vin[0].witness_stack = {WitnessStackItem{std::vector<std::uint8_t>(64, 0x22)}};
    tx.vout.resize(1);
    tx.vout[0].value = 1000;
    tx.vout[0].script_pubkey = {0x51, 0x20};
    tx.vout[0].script_pubkey.resize(34, 0x33);

    std::vector<std::uint8_t> with_witness;
    SerializeTransaction(tx, &with_witness);
    CTransaction decoded;
    std::size_t offset = 0;
    if (!DeserializeTransaction(with_witness, &offset, &decoded) ||
        decoded.vin.size() != 1 || decoded.vin[0].witness_stack.size() != 1 ||
        decoded.vin[0].witness_stack[0].data != tx.vin[0].witness_stack[0].data) {
      std::cerr << "witness transaction did not round trip\n";
      return 1;
    }
    const auto txid = ComputeTxId(tx);
    tx.vin[0].witness_stack[0].data[0] ^= 0xFF;
    if (ComputeTxId(tx) != txid) {
      std::cerr << "txid depends on witness data\n";
      return 1;
    }
  }

  // Output scripts have no size limit; scriptSigs do.
  {
    CTransaction tx;
    tx.vin.resize(1);
    tx.vin[0].prevout.txid.fill(0x44);
    tx.vout.resize(1);
    tx.vout[0].value = 1;
    tx.vout[0].script_pubkey.assign(10'001, 0x6a);

    std::vector<std::uint8_t> raw;
    SerializeTransaction(tx, &raw);
    CTransaction decoded;
    std::size_t offset = 0;
    if (!DeserializeTransaction(raw, &offset, &decoded) || offset != raw.size() ||
        decoded.vout.size() != 1 || decoded.vout[0].script_pubkey != tx.vout[0].script_pubkey) {
      std::cerr << "10001-byte output script rejected\n";
      return 1;
    }

    // Declared length past the end of the buffer.
    std::vector<std::uint8_t> truncated(raw.begin(), raw.end() - 5'000);
    offset = 0;
    if (DeserializeTransaction(truncated, &offset, &decoded)) {
      std::cerr << "truncated output script accepted\n";
      return 1;
    }

    tx.vin[0].script_sig.assign(10'001, 0x00);
    raw.clear();
    SerializeTransaction(tx, &raw);
    offset = 0;
    if (DeserializeTransaction(raw, &offset, &decoded)) {
      std::cerr << "oversized scriptSig accepted\n";
      return 1;
    }
  }

  return 0;
}
