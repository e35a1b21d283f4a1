#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "crypto/secp256k1_ops.hpp"
#include "scan/block_scanner.hpp"
#include "scan/input_extractor.hpp"
#include "scan/scan_identity.hpp"
#include "scan/tweak_engine.hpp"
#include "tests/unit/util/sp_sender.hpp"

using namespace sps;

namespace {

bool MakeIdentity(std::uint32_t id, const char* seed, std::uint32_t labels,
                  scan::ScanIdentity* out) {
  std::string error;
  const auto scan_secret = test::TestScalar(std::string(seed) + "/scan");
  const auto spend_pubkey = test::TestPubKey(test::TestScalar(std::string(seed) + "/spend"));
  if (!scan::ScanIdentity::Create(id, scan_secret, spend_pubkey, labels, out, &error)) {
    std::cerr << "tweak_engine_tests: identity: " << error << "\n";
    return false;
  }
  return true;
}

// One legacy input, one taproot output paying an unlabeled identity.
bool RunSingleLegacyInputTest() {
  scan::ScanIdentity identity;
  if (!MakeIdentity(1, "alice", 0, &identity)) return false;

  primitives::COutPoint prevout;
  prevout.txid = test::TestHash("funding");
  prevout.index = 0;
  const std::vector<test::SenderInput> inputs = {
      {test::TestScalar("legacy-input"), prevout, test::InputKind::kP2PKH}};
  const std::vector<test::Recipient> recipients = {
      {identity.scan_secret(), identity.spend_pubkey(), 0}};
  std::vector<test::SenderOutput> expected;
  if (!test::DeriveOutputs(inputs, recipients, &expected) || expected.size() != 1) {
    std::cerr << "tweak_engine_tests: sender derivation failed\n";
    return false;
  }
  const auto tx = test::BuildTransaction(inputs, {test::TaprootOutput(expected[0].output_key, 25000)});

  const auto eligible = scan::ExtractEligibleInputs(tx);
  if (!eligible || eligible->public_keys.size() != 1) {
    std::cerr << "tweak_engine_tests: legacy input not eligible\n";
    return false;
  }
  crypto::PubKey tweak_point{};
  if (scan::ComputeTweakPoint(*eligible, &tweak_point) != scan::TweakOutcome::kOk) {
    std::cerr << "tweak_engine_tests: tweak point not computed\n";
    return false;
  }
  crypto::PubKey shared_secret{};
  if (!scan::ComputeSharedSecret(tweak_point, identity.scan_secret(), &shared_secret)) {
    std::cerr << "tweak_engine_tests: shared secret not computed\n";
    return false;
  }
  const auto t0 = scan::SharedSecretTweak(shared_secret, 0);
  if (t0 != expected[0].tweak) {
    std::cerr << "tweak_engine_tests: t_0 differs from sender derivation\n";
    return false;
  }
  crypto::PubKey candidate{};
  if (!scan::CandidateKey(identity, t0, scan::kNoLabel, &candidate) ||
      crypto::ToXOnly(candidate) != expected[0].output_key) {
    std::cerr << "tweak_engine_tests: candidate key differs from sender output\n";
    return false;
  }

  const auto scan_result = scan::ScanTransaction(tx, 800000, std::vector<scan::ScanIdentity>{identity});
  if (!scan_result.eligible || scan_result.payments.size() != 1) {
    std::cerr << "tweak_engine_tests: expected exactly one payment\n";
    return false;
  }
  const auto& payment = scan_result.payments.front();
  if (payment.identity_id != 1 || payment.label != scan::kNoLabel || payment.vout != 0 ||
      payment.value != 25000 || payment.height != 800000 || payment.txid != tx.txid ||
      payment.tweak != expected[0].tweak) {
    std::cerr << "tweak_engine_tests: payment fields wrong\n";
    return false;
  }
  if (scan_result.tweak_point != tweak_point) {
    std::cerr << "tweak_engine_tests: recorded tweak point differs\n";
    return false;
  }
  return true;
}

bool RunIdentitySumTest() {
  scan::ScanIdentity identity;
  if (!MakeIdentity(1, "bob", 0, &identity)) return false;

  const auto a = test::TestScalar("cancel");
  crypto::Scalar neg_a{};
  if (!crypto::NegateScalar(a, &neg_a)) {
    std::cerr << "tweak_engine_tests: negate failed\n";
    return false;
  }
  primitives::COutPoint first;
  first.txid = test::TestHash("p1");
  primitives::COutPoint second;
  second.txid = test::TestHash("p2");
  const std::vector<test::SenderInput> inputs = {
      {a, first, test::InputKind::kP2WPKH},
      {neg_a, second, test::InputKind::kP2WPKH}};
  const auto dest = crypto::ToXOnly(test::TestPubKey(test::TestScalar("anything")));
  const auto tx = test::BuildTransaction(inputs, {test::TaprootOutput(dest, 1)});

  const auto eligible = scan::ExtractEligibleInputs(tx);
  if (!eligible || eligible->public_keys.size() != 2) {
    std::cerr << "tweak_engine_tests: cancelling inputs should still be extracted\n";
    return false;
  }
  crypto::PubKey tweak_point{};
  if (scan::ComputeTweakPoint(*eligible, &tweak_point) != scan::TweakOutcome::kIdentitySum) {
    std::cerr << "tweak_engine_tests: identity sum not reported\n";
    return false;
  }
  const auto result = scan::ScanTransaction(tx, 10, std::vector<scan::ScanIdentity>{identity});
  if (result.eligible || !result.identity_sum || !result.payments.empty()) {
    std::cerr << "tweak_engine_tests: identity-sum transaction was scanned\n";
    return false;
  }
  return true;
}

bool RunInputOrderIndependenceTest() {
  primitives::COutPoint p1;
  p1.txid = test::TestHash("x1");
  p1.index = 4;
  primitives::COutPoint p2;
  p2.txid = test::TestHash("x2");
  p2.index = 1;
  scan::EligibleInputSet forward;
  forward.public_keys = {test::TestPubKey(test::TestScalar("k1")),
                         test::TestPubKey(test::TestScalar("k2"))};
  forward.smallest_outpoint = std::min(scan::SerializeOutpoint(p1), scan::SerializeOutpoint(p2));
  scan::EligibleInputSet reversed = forward;
  std::swap(reversed.public_keys[0], reversed.public_keys[1]);
  crypto::PubKey a{};
  crypto::PubKey b{};
  if (scan::ComputeTweakPoint(forward, &a) != scan::TweakOutcome::kOk ||
      scan::ComputeTweakPoint(reversed, &b) != scan::TweakOutcome::kOk || a != b) {
    std::cerr << "tweak_engine_tests: tweak point depends on input order\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!RunSingleLegacyInputTest() || !RunIdentitySumTest() || !RunInputOrderIndependenceTest()) {
    return EXIT_FAILURE;
  }
  std::cout << "tweak_engine_tests: OK\n";
  return EXIT_SUCCESS;
}
