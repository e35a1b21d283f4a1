#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "scan/detected_payment.hpp"
#include "storage/payment_index.hpp"
#include "tests/unit/util/sp_sender.hpp"

using namespace sps;

namespace {

scan::DetectedPayment Payment(std::uint32_t identity, std::uint32_t height, const char* tx,
                              std::uint32_t vout, std::uint32_t label = 0) {
  scan::DetectedPayment payment;
  payment.identity_id = identity;
  payment.label = label;
  payment.txid = test::TestHash(tx);
  payment.vout = vout;
  payment.value = 1000 + vout;
  payment.height = height;
  payment.tweak = test::TestScalar(std::string(tx) + "/tweak");
  return payment;
}

bool Commit(storage::PaymentIndex* index, std::uint32_t height,
            const std::vector<scan::DetectedPayment>& payments, std::size_t expect_appended) {
  std::size_t appended = 0;
  std::string error;
  if (!index->CommitBlock(height, payments, &appended, &error)) {
    std::cerr << "payment_index_tests: commit at " << height << " failed: " << error << "\n";
    return false;
  }
  if (appended != expect_appended) {
    std::cerr << "payment_index_tests: commit at " << height << " appended " << appended
              << ", expected " << expect_appended << "\n";
    return false;
  }
  return true;
}

bool RunCommitQueryTest(const std::filesystem::path& dir) {
  storage::PaymentIndex index(dir / "payments.dat");
  std::string error;
  if (!index.Open(std::nullopt, &error)) return false;

  if (!Commit(&index, 10, {Payment(1, 10, "a", 2), Payment(2, 10, "a", 0), Payment(1, 10, "a", 1)},
              3) ||
      !Commit(&index, 11, {}, 0) ||
      !Commit(&index, 12, {Payment(1, 12, "b", 0, 4)}, 1)) {
    return false;
  }
  // Re-delivering a block and duplicates inside a batch change nothing.
  if (!Commit(&index, 12, {Payment(1, 12, "b", 0, 4), Payment(1, 12, "b", 0, 4)}, 0)) {
    return false;
  }
  bool inserted = true;
  if (!index.Append(Payment(2, 10, "a", 0), &inserted, &error) || inserted) {
    std::cerr << "payment_index_tests: duplicate Append reported an insert\n";
    return false;
  }
  if (!index.Append(Payment(2, 13, "c", 5), &inserted, &error) || !inserted) {
    std::cerr << "payment_index_tests: Append of a new payment failed: " << error << "\n";
    return false;
  }

  const auto all = index.Collect(1);
  if (all.size() != 3 || all[0].vout != 1 || all[1].vout != 2 || all[2].height != 12 ||
      all[2].label != 4) {
    std::cerr << "payment_index_tests: identity 1 results out of order\n";
    return false;
  }
  if (index.Collect(1, 11).size() != 1 || index.Collect(1, 0, 11).size() != 2 ||
      !index.Collect(3).empty() || index.Collect(2).size() != 2) {
    std::cerr << "payment_index_tests: height range filter wrong\n";
    return false;
  }

  // A cursor resumes from its position across later commits.
  auto cursor = index.Query(1);
  const auto first = cursor.Next();
  if (!first || first->vout != 1) {
    std::cerr << "payment_index_tests: cursor did not start at lowest key\n";
    return false;
  }
  const auto resume = cursor.position();
  if (!Commit(&index, 14, {Payment(1, 14, "d", 0)}, 1)) return false;
  storage::PaymentCursor resumed = index.Query(1);
  resumed.Seek(resume);
  std::size_t remaining = 0;
  while (resumed.Next()) {
    ++remaining;
  }
  if (remaining != 3) {
    std::cerr << "payment_index_tests: resumed cursor saw " << remaining << " payments\n";
    return false;
  }
  cursor.Reset();
  if (!cursor.Next() || cursor.position() != resume) {
    std::cerr << "payment_index_tests: reset cursor did not restart\n";
    return false;
  }

  if (index.CommitBlock(13, std::vector<scan::DetectedPayment>{Payment(1, 13, "late", 0)},
                        nullptr, &error)) {
    std::cerr << "payment_index_tests: commit below indexed height accepted\n";
    return false;
  }
  if (index.CommitBlock(15, std::vector<scan::DetectedPayment>{Payment(1, 16, "x", 0)}, nullptr,
                        &error)) {
    std::cerr << "payment_index_tests: payment at foreign height accepted\n";
    return false;
  }
  const auto stats = index.Stats();
  if (stats.entries != 6 || stats.journal_records != 4 || stats.highest_height != 14u) {
    std::cerr << "payment_index_tests: stats wrong\n";
    return false;
  }
  return true;
}

bool RunRollbackReopenTest(const std::filesystem::path& dir) {
  const auto path = dir / "payments.dat";
  std::string error;
  std::vector<scan::DetectedPayment> before_rollback;
  {
    storage::PaymentIndex index(path);
    if (!index.Open(std::nullopt, &error)) return false;
    for (std::uint32_t h = 100; h < 110; ++h) {
      const std::string tx = "tx" + std::to_string(h);
      if (!Commit(&index, h, {Payment(1, h, tx.c_str(), 0), Payment(2, h, tx.c_str(), 1)}, 2)) {
        return false;
      }
      if (h == 104) {
        before_rollback = index.Snapshot();
      }
    }
    std::size_t removed = 0;
    if (!index.RollbackAbove(104, &removed, &error) || removed != 10) {
      std::cerr << "payment_index_tests: rollback removed " << removed << "\n";
      return false;
    }
    if (index.Snapshot() != before_rollback) {
      std::cerr << "payment_index_tests: rollback did not restore the earlier state\n";
      return false;
    }
    if (!index.RollbackAbove(200, &removed, &error) || removed != 0) {
      return false;
    }
    // The replacement branch may reuse heights that were rolled back.
    if (!Commit(&index, 105, {Payment(1, 105, "alt105", 3)}, 1)) return false;
  }

  {
    storage::PaymentIndex index(path);
    if (!index.Open(105u, &error) || index.Snapshot().size() != before_rollback.size() + 1) {
      std::cerr << "payment_index_tests: reopen lost committed entries: " << error << "\n";
      return false;
    }
  }
  {
    // Watermark at 104: the record for 105 was never committed and is dropped.
    storage::PaymentIndex index(path);
    if (!index.Open(104u, &error) || index.Snapshot() != before_rollback) {
      std::cerr << "payment_index_tests: uncommitted record survived reopen\n";
      return false;
    }
  }
  {
    storage::PaymentIndex index(path);
    if (!index.Open(104u, &error) || index.Stats().highest_height != 104u) {
      return false;
    }
    std::size_t removed = 0;
    if (!index.Clear(&removed, &error) || removed != before_rollback.size() ||
        !index.Snapshot().empty()) {
      std::cerr << "payment_index_tests: clear failed\n";
      return false;
    }
  }
  storage::PaymentIndex index(path);
  if (!index.Open(104u, &error) || !index.Snapshot().empty()) {
    std::cerr << "payment_index_tests: clear not persisted\n";
    return false;
  }
  return true;
}

bool RunTornAndCorruptJournalTest(const std::filesystem::path& dir) {
  const auto path = dir / "payments.dat";
  std::string error;
  {
    storage::PaymentIndex index(path);
    if (!index.Open(std::nullopt, &error) || !Commit(&index, 1, {Payment(1, 1, "t", 0)}, 1) ||
        !Commit(&index, 2, {Payment(1, 2, "u", 0)}, 1)) {
      return false;
    }
  }
  const auto size = std::filesystem::file_size(path);
  {
    std::ofstream out(path, std::ios::binary | std::ios::app);
    out.write("SPPI", 4);
  }
  {
    storage::PaymentIndex index(path);
    if (!index.Open(2u, &error) || index.Snapshot().size() != 2 ||
        std::filesystem::file_size(path) != size) {
      std::cerr << "payment_index_tests: torn tail not discarded: " << error << "\n";
      return false;
    }
  }
  {
    // Flip a payload byte of the first record.
    std::fstream io(path, std::ios::binary | std::ios::in | std::ios::out);
    io.seekp(45);
    io.put('\x7f');
  }
  storage::PaymentIndex index(path);
  error.clear();
  if (index.Open(2u, &error) || error.find("corrupt") == std::string::npos) {
    std::cerr << "payment_index_tests: corrupt journal accepted\n";
    return false;
  }
  return true;
}

bool RunWriteFailureTest(const std::filesystem::path& dir) {
  storage::PaymentIndex index(dir / "payments.dat");
  std::string error;
  if (!index.Open(std::nullopt, &error)) return false;
  index.SetWriteHookForTest([](std::uint32_t height) { return height != 7; });
  if (!Commit(&index, 6, {Payment(1, 6, "ok", 0)}, 1)) return false;
  if (index.CommitBlock(7, std::vector<scan::DetectedPayment>{Payment(1, 7, "fail", 0)}, nullptr,
                        &error)) {
    std::cerr << "payment_index_tests: hook failure not reported\n";
    return false;
  }
  if (index.Snapshot().size() != 1) {
    std::cerr << "payment_index_tests: failed commit left entries behind\n";
    return false;
  }
  index.SetWriteHookForTest(nullptr);
  return Commit(&index, 7, {Payment(1, 7, "fail", 0)}, 1);
}

}  // namespace

int main() {
  const auto root = std::filesystem::temp_directory_path() / "sps_payment_index_tests";
  std::filesystem::remove_all(root);
  for (const char* name : {"query", "rollback", "torn", "failure"}) {
    std::filesystem::create_directories(root / name);
  }
  const bool ok = RunCommitQueryTest(root / "query") && RunRollbackReopenTest(root / "rollback") &&
       RunTornAndCorruptJournalTest(root / "torn") && RunWriteFailureTest(root / "failure");
  std::filesystem::remove_all(root);
  if (!ok) {
    return EXIT_FAILURE;
  }
  std::cout << "payment_index_tests: OK\n";
  return EXIT_SUCCESS;
}
