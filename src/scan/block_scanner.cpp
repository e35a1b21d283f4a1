#include "scan/block_scanner.hpp"

#include <algorithm>
#include <atomic>
#include <thread>

#include "scan/detector.hpp"
#include "scan/input_extractor.hpp"
#include "scan/tweak_engine.hpp"

namespace sps::scan {

namespace {

// Below this many transactions per worker, spawning threads costs more than
// the scan itself.
constexpr std::size_t kMinTransactionsPerWorker = 4;

}  // namespace

TransactionScan ScanTransaction(const primitives::CTransaction& tx, std::uint32_t height,
                                std::span<const ScanIdentity> identities) {
  TransactionScan result;
  const auto inputs = ExtractEligibleInputs(tx);
  if (!inputs) {
    return result;
  }
  const TweakOutcome outcome = ComputeTweakPoint(*inputs, &result.tweak_point);
  if (outcome == TweakOutcome::kIdentitySum) {
    result.identity_sum = true;
    return result;
  }
  if (outcome != TweakOutcome::kOk) {
    return result;
  }
  result.eligible = true;
  result.payments = DetectPayments(tx, height, result.tweak_point, identities);
  return result;
}

BlockScanner::BlockScanner(std::size_t worker_threads)
    : worker_threads_(std::max<std::size_t>(1, worker_threads)) {}

ScanStatus BlockScanner::ScanBlock(const primitives::CBlock& block,
                                   std::span<const ScanIdentity> identities,
                                   std::stop_token stop, BlockScanResult* out) const {
  const auto& txs = block.transactions;
  std::vector<TransactionScan> slots(txs.size());
  std::atomic<std::size_t> next{0};

  auto worker = [&]() {
    while (!stop.stop_requested()) {
      const std::size_t index = next.fetch_add(1, std::memory_order_relaxed);
      if (index >= txs.size()) {
        return;
      }
      slots[index] = ScanTransaction(txs[index], block.height, identities);
    }
  };

  const std::size_t workers =
      std::min(worker_threads_, std::max<std::size_t>(1, txs.size() / kMinTransactionsPerWorker));
  if (workers <= 1) {
    worker();
  } else {
    std::vector<std::jthread> pool;
    pool.reserve(workers - 1);
    for (std::size_t i = 0; i + 1 < workers; ++i) {
      pool.emplace_back(worker);
    }
    worker();
    // jthread joins on destruction; this is the fan-in barrier.
  }
  if (stop.stop_requested()) {
    return ScanStatus::kCancelled;
  }

  BlockScanResult result;
  for (auto& slot : slots) {
    if (slot.identity_sum) {
      ++result.identity_sum_transactions;
    }
    if (!slot.eligible) {
      continue;
    }
    ++result.eligible_transactions;
    result.tweak_points.push_back(slot.tweak_point);
    result.payments.insert(result.payments.end(), slot.payments.begin(), slot.payments.end());
  }
  *out = std::move(result);
  return ScanStatus::kCompleted;
}

}  // namespace sps::scan
