#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include "crypto/secp256k1_ops.hpp"
#include "primitives/block.hpp"
#include "primitives/txid.hpp"
#include "scan/block_scanner.hpp"
#include "scan/detector.hpp"
#include "scan/scan_identity.hpp"
#include "script/script.hpp"
#include "tests/unit/util/sp_sender.hpp"

using namespace sps;

namespace {

bool MakeIdentity(std::uint32_t id, const std::string& seed, std::uint32_t labels,
                  scan::ScanIdentity* out) {
  std::string error;
  if (!scan::ScanIdentity::Create(id, test::TestScalar(seed + "/scan"),
                                  test::TestPubKey(test::TestScalar(seed + "/spend")), labels,
                                  out, &error)) {
    std::cerr << "detector_tests: identity: " << error << "\n";
    return false;
  }
  return true;
}

test::Recipient RecipientOf(const scan::ScanIdentity& identity, std::uint32_t label) {
  return test::Recipient{identity.scan_secret(), identity.spend_pubkey(), label};
}

std::vector<test::SenderInput> Inputs(const std::string& seed) {
  primitives::COutPoint a;
  a.txid = test::TestHash(seed + "/a");
  a.index = 1;
  primitives::COutPoint b;
  b.txid = test::TestHash(seed + "/b");
  b.index = 0;
  return {{test::TestScalar(seed + "/ka"), a, test::InputKind::kP2WPKH},
          {test::TestScalar(seed + "/kb"), b, test::InputKind::kP2TR}};
}

// Builds a transaction paying `recipients` in order, plus one unrelated output.
bool PayTo(const std::string& seed, const std::vector<test::Recipient>& recipients,
           primitives::CTransaction* tx, std::vector<test::SenderOutput>* outputs) {
  const auto inputs = Inputs(seed);
  if (!test::DeriveOutputs(inputs, recipients, outputs)) {
    std::cerr << "detector_tests: sender derivation failed\n";
    return false;
  }
  std::vector<primitives::CTxOut> vout;
  primitives::CTxOut change;
  change.value = 777;
  change.script_pubkey = script::BuildPayToWitnessKeyHash(std::vector<std::uint8_t>(20, 0x09));
  vout.push_back(change);
  for (std::size_t i = 0; i < outputs->size(); ++i) {
    vout.push_back(test::TaprootOutput((*outputs)[i].output_key, 1000 * (i + 1)));
  }
  *tx = test::BuildTransaction(inputs, std::move(vout));
  return true;
}

bool RunLabelRoundTripTest() {
  scan::ScanIdentity identity;
  if (!MakeIdentity(7, "labels", 5, &identity)) return false;
  for (std::uint32_t m = 1; m <= 5; ++m) {
    primitives::CTransaction tx;
    std::vector<test::SenderOutput> outputs;
    if (!PayTo("label-" + std::to_string(m), {RecipientOf(identity, m)}, &tx, &outputs)) {
      return false;
    }
    const auto result = scan::ScanTransaction(tx, 100, std::vector<scan::ScanIdentity>{identity});
    if (result.payments.size() != 1) {
      std::cerr << "detector_tests: label " << m << " produced " << result.payments.size()
                << " payments\n";
      return false;
    }
    const auto& payment = result.payments.front();
    if (payment.label != m || payment.vout != 1 || payment.tweak != outputs[0].tweak) {
      std::cerr << "detector_tests: label " << m << " attributed wrongly\n";
      return false;
    }
    // The recorded tweak spends the output: (b_spend + tweak) * G == P.
    crypto::Scalar spend_key{};
    crypto::PubKey derived{};
    if (!crypto::AddScalars(test::TestScalar("labels/spend"), payment.tweak, &spend_key) ||
        !crypto::PubKeyFromScalar(spend_key, &derived) ||
        crypto::ToXOnly(derived) != outputs[0].output_key) {
      std::cerr << "detector_tests: tweak does not yield the output key\n";
      return false;
    }
  }
  return true;
}

bool RunUnregisteredLabelTest() {
  scan::ScanIdentity identity;
  if (!MakeIdentity(3, "few-labels", 2, &identity)) return false;
  primitives::CTransaction tx;
  std::vector<test::SenderOutput> outputs;
  if (!PayTo("unregistered", {RecipientOf(identity, 3)}, &tx, &outputs)) return false;
  const auto result = scan::ScanTransaction(tx, 100, std::vector<scan::ScanIdentity>{identity});
  if (!result.eligible || !result.payments.empty()) {
    std::cerr << "detector_tests: payment to unregistered label was detected\n";
    return false;
  }
  return true;
}

bool RunTwoIdentitiesTest() {
  scan::ScanIdentity alice;
  scan::ScanIdentity bob;
  scan::ScanIdentity carol;
  if (!MakeIdentity(1, "alice", 0, &alice) || !MakeIdentity(2, "bob", 0, &bob) ||
      !MakeIdentity(3, "carol", 0, &carol)) {
    return false;
  }
  primitives::CTransaction tx;
  std::vector<test::SenderOutput> outputs;
  if (!PayTo("two", {RecipientOf(alice, 0), RecipientOf(bob, 0)}, &tx, &outputs)) return false;

  const std::vector<scan::ScanIdentity> identities = {carol, bob, alice};
  const auto result = scan::ScanTransaction(tx, 5, identities);
  if (result.payments.size() != 2) {
    std::cerr << "detector_tests: expected one payment per identity, got "
              << result.payments.size() << "\n";
    return false;
  }
  const auto& first = result.payments[0];
  const auto& second = result.payments[1];
  if (first.identity_id != 1 || first.vout != 1 || first.tweak != outputs[0].tweak ||
      second.identity_id != 2 || second.vout != 2 || second.tweak != outputs[1].tweak) {
    std::cerr << "detector_tests: payments attributed to the wrong identity\n";
    return false;
  }
  return true;
}

bool RunRepeatedRecipientTest() {
  scan::ScanIdentity identity;
  if (!MakeIdentity(4, "repeat", 1, &identity)) return false;
  primitives::CTransaction tx;
  std::vector<test::SenderOutput> outputs;
  if (!PayTo("repeat",
             {RecipientOf(identity, 0), RecipientOf(identity, 1), RecipientOf(identity, 0)}, &tx,
             &outputs)) {
    return false;
  }
  // Outputs are placed out of derivation order on chain.
  std::swap(tx.vout[1], tx.vout[3]);
  tx.txid = primitives::ComputeTxId(tx);

  const auto result = scan::ScanTransaction(tx, 9, std::vector<scan::ScanIdentity>{identity});
  if (result.payments.size() != 3) {
    std::cerr << "detector_tests: expected three payments, got " << result.payments.size()
              << "\n";
    return false;
  }
  // vout 1 holds k=2, vout 2 holds k=1 (label 1), vout 3 holds k=0.
  const auto& p = result.payments;
  if (p[0].vout != 1 || p[0].tweak != outputs[2].tweak || p[0].label != 0 ||
      p[1].vout != 2 || p[1].tweak != outputs[1].tweak || p[1].label != 1 ||
      p[2].vout != 3 || p[2].tweak != outputs[0].tweak || p[2].label != 0) {
    std::cerr << "detector_tests: repeated recipient matched wrongly\n";
    return false;
  }
  return true;
}

bool RunParallelDeterminismTest() {
  std::vector<scan::ScanIdentity> identities(3);
  if (!MakeIdentity(1, "p1", 2, &identities[0]) || !MakeIdentity(2, "p2", 0, &identities[1]) ||
      !MakeIdentity(3, "p3", 1, &identities[2])) {
    return false;
  }
  primitives::CBlock block;
  block.height = 42;
  block.hash = test::TestHash("block-42");
  primitives::CTransaction coinbase;
  coinbase.vin.resize(1);
  coinbase.vin[0].prevout = primitives::COutPoint::Null();
  coinbase.vout.push_back(test::TaprootOutput(test::TestHash("coinbase-key"), 50));
  coinbase.txid = primitives::ComputeTxId(coinbase);
  block.transactions.push_back(coinbase);
  for (int i = 0; i < 40; ++i) {
    const auto& who = identities[static_cast<std::size_t>(i) % identities.size()];
    const std::uint32_t label = (i % 4 == 0) ? std::min<std::uint32_t>(1, who.label_count()) : 0;
    primitives::CTransaction tx;
    std::vector<test::SenderOutput> outputs;
    if (!PayTo("tx-" + std::to_string(i), {RecipientOf(who, label)}, &tx, &outputs)) {
      return false;
    }
    block.transactions.push_back(tx);
  }

  scan::BlockScanResult serial;
  scan::BlockScanResult parallel;
  if (scan::BlockScanner(1).ScanBlock(block, identities, {}, &serial) !=
          scan::ScanStatus::kCompleted ||
      scan::BlockScanner(4).ScanBlock(block, identities, {}, &parallel) !=
          scan::ScanStatus::kCompleted) {
    std::cerr << "detector_tests: block scan did not complete\n";
    return false;
  }
  if (serial.payments.size() != 40 || serial.eligible_transactions != 40 ||
      serial.tweak_points.size() != 40) {
    std::cerr << "detector_tests: unexpected serial scan totals\n";
    return false;
  }
  if (serial.payments != parallel.payments || serial.tweak_points != parallel.tweak_points ||
      serial.eligible_transactions != parallel.eligible_transactions) {
    std::cerr << "detector_tests: parallel scan differs from serial scan\n";
    return false;
  }
  for (std::size_t i = 0; i < serial.payments.size(); ++i) {
    if (serial.payments[i].txid != block.transactions[i + 1].txid) {
      std::cerr << "detector_tests: payments not in transaction order\n";
      return false;
    }
  }

  std::stop_source stop;
  stop.request_stop();
  scan::BlockScanResult cancelled;
  if (scan::BlockScanner(4).ScanBlock(block, identities, stop.get_token(), &cancelled) !=
          scan::ScanStatus::kCancelled ||
      !cancelled.payments.empty()) {
    std::cerr << "detector_tests: cancelled scan produced results\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!RunLabelRoundTripTest() || !RunUnregisteredLabelTest() || !RunTwoIdentitiesTest() ||
      !RunRepeatedRecipientTest() || !RunParallelDeterminismTest()) {
    return EXIT_FAILURE;
  }
  std::cout << "detector_tests: OK\n";
  return EXIT_SUCCESS;
}
