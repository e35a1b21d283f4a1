#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <vector>

#include "crypto/secp256k1_ops.hpp"
#include "primitives/transaction.hpp"
#include "scan/input_extractor.hpp"
#include "script/script.hpp"
#include "tests/unit/util/sp_sender.hpp"

using namespace sps;

namespace {

primitives::CTxOut AnyTaprootOutput() {
  return test::TaprootOutput(crypto::ToXOnly(test::TestPubKey(test::TestScalar("dest"))), 1000);
}

primitives::COutPoint Outpoint(const char* seed, std::uint32_t index) {
  primitives::COutPoint out;
  out.txid = test::TestHash(seed);
  out.index = index;
  return out;
}

bool RunSingleKeyTypesTest() {
  const test::InputKind kinds[] = {test::InputKind::kP2PKH, test::InputKind::kP2WPKH,
                                   test::InputKind::kP2SHP2WPKH, test::InputKind::kP2TR};
  for (const auto kind : kinds) {
    test::SenderInput input{test::TestScalar("key"), Outpoint("prev", 0), kind};
    const auto pub = test::TestPubKey(input.secret);
    const auto key = scan::ExtractInputPublicKey(test::BuildInput(input));
    if (!key) {
      std::cerr << "input_extractor_tests: kind " << static_cast<int>(kind)
                << " not recognised\n";
      return false;
    }
    if (kind == test::InputKind::kP2TR) {
      if (*key != crypto::EvenYFromXOnly(crypto::ToXOnly(pub))) {
        std::cerr << "input_extractor_tests: taproot key not lifted to even Y\n";
        return false;
      }
    } else if (*key != pub) {
      std::cerr << "input_extractor_tests: wrong key for kind " << static_cast<int>(kind)
                << "\n";
      return false;
    }
  }
  return true;
}

bool RunScriptPathNumsTest() {
  test::SenderInput input{test::TestScalar("nums"), Outpoint("prev", 1), test::InputKind::kP2TR};
  auto txin = test::BuildInput(input);
  // script-path spend whose control block commits to the NUMS internal key
  std::vector<std::uint8_t> control_block = {
      0xc0, 0x50, 0x92, 0x9b, 0x74, 0xc1, 0xa0, 0x49, 0x54, 0xb7, 0x8b, 0x4b,
      0x60, 0x35, 0xe9, 0x7a, 0x5e, 0x07, 0x8a, 0x5a, 0x0f, 0x28, 0xec, 0x96,
      0xd5, 0x47, 0xbf, 0xee, 0x9a, 0xce, 0x80, 0x3a, 0xc0};
  txin.witness_stack = {primitives::WitnessStackItem{{0x51}},
                        primitives::WitnessStackItem{control_block}};
  if (scan::ExtractInputPublicKey(txin)) {
    std::cerr << "input_extractor_tests: NUMS script-path spend accepted\n";
    return false;
  }
  // same shape with a real internal key is fine
  control_block[1] ^= 0x01;
  txin.witness_stack.back().data = control_block;
  if (!scan::ExtractInputPublicKey(txin)) {
    std::cerr << "input_extractor_tests: script-path spend rejected\n";
    return false;
  }
  return true;
}

bool RunIneligibleTransactionsTest() {
  const std::vector<test::SenderInput> inputs = {
      {test::TestScalar("a"), Outpoint("tx-a", 0), test::InputKind::kP2WPKH}};

  auto no_taproot = test::BuildTransaction(inputs, {});
  primitives::CTxOut p2wpkh_out;
  p2wpkh_out.value = 5000;
  p2wpkh_out.script_pubkey = script::BuildPayToWitnessKeyHash(std::vector<std::uint8_t>(20, 0x01));
  no_taproot.vout.push_back(p2wpkh_out);
  if (scan::ExtractEligibleInputs(no_taproot)) {
    std::cerr << "input_extractor_tests: transaction without taproot output accepted\n";
    return false;
  }

  primitives::CTransaction coinbase;
  coinbase.vin.resize(1);
  coinbase.vin[0].prevout = primitives::COutPoint::Null();
  coinbase.vout.push_back(AnyTaprootOutput());
  if (scan::ExtractEligibleInputs(coinbase)) {
    std::cerr << "input_extractor_tests: coinbase accepted\n";
    return false;
  }

  auto future_witness = test::BuildTransaction(inputs, {AnyTaprootOutput()});
  primitives::CTxIn v2;
  v2.prevout = Outpoint("tx-v2", 0);
  v2.prevout_script_pubkey = {0x52, 0x20};
  v2.prevout_script_pubkey.resize(34, 0x07);
  future_witness.vin.push_back(v2);
  if (scan::ExtractEligibleInputs(future_witness)) {
    std::cerr << "input_extractor_tests: witness v2 spend accepted\n";
    return false;
  }

  auto unknown_only = test::BuildTransaction({}, {AnyTaprootOutput()});
  primitives::CTxIn multisig;
  multisig.prevout = Outpoint("tx-ms", 0);
  multisig.prevout_script_pubkey = {0x51, 0x21};
  multisig.prevout_script_pubkey.resize(35, 0x02);
  multisig.prevout_script_pubkey.push_back(0x51);
  multisig.prevout_script_pubkey.push_back(0xae);
  unknown_only.vin.push_back(multisig);
  if (scan::ExtractEligibleInputs(unknown_only)) {
    std::cerr << "input_extractor_tests: transaction without eligible input accepted\n";
    return false;
  }
  return true;
}

bool RunSmallestOutpointTest() {
  const std::vector<test::SenderInput> inputs = {
      {test::TestScalar("a"), Outpoint("tx-a", 3), test::InputKind::kP2WPKH},
      {test::TestScalar("b"), Outpoint("tx-b", 0), test::InputKind::kP2TR}};
  auto tx = test::BuildTransaction(inputs, {AnyTaprootOutput()});
  // An input that contributes no key still counts for the smallest outpoint.
  primitives::CTxIn other;
  other.prevout.txid.fill(0x00);
  other.prevout.index = 9;
  other.prevout_script_pubkey = script::BuildPayToScriptHash(std::vector<std::uint8_t>(20, 0x42));
  tx.vin.push_back(other);

  const auto eligible = scan::ExtractEligibleInputs(tx);
  if (!eligible || eligible->public_keys.size() != 2) {
    std::cerr << "input_extractor_tests: expected two eligible keys\n";
    return false;
  }
  if (eligible->smallest_outpoint != scan::SerializeOutpoint(other.prevout)) {
    std::cerr << "input_extractor_tests: smallest outpoint ignored ineligible input\n";
    return false;
  }

  // Lexicographic over txid then little-endian index: index 256 sorts before 1.
  primitives::COutPoint low;
  low.txid = test::TestHash("same");
  low.index = 256;
  primitives::COutPoint high = low;
  high.index = 1;
  if (!(scan::SerializeOutpoint(low) < scan::SerializeOutpoint(high))) {
    std::cerr << "input_extractor_tests: outpoint ordering is not bytewise\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!RunSingleKeyTypesTest() || !RunScriptPathNumsTest() || !RunIneligibleTransactionsTest() ||
      !RunSmallestOutpointTest()) {
    return EXIT_FAILURE;
  }
  std::cout << "input_extractor_tests: OK\n";
  return EXIT_SUCCESS;
}
