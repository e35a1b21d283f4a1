#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <stop_token>
#include <vector>

#include "crypto/secp256k1_ops.hpp"
#include "primitives/block.hpp"
#include "scan/detected_payment.hpp"
#include "scan/scan_identity.hpp"

namespace sps::scan {

struct TransactionScan {
  bool eligible{false};
  bool identity_sum{false};
  crypto::PubKey tweak_point{};
  std::vector<DetectedPayment> payments;
};

struct BlockScanResult {
  // Detections in transaction order, then vout, identity and label.
  std::vector<DetectedPayment> payments;
  // Tweak points of eligible transactions, in transaction order.
  std::vector<crypto::PubKey> tweak_points;
  std::size_t eligible_transactions{0};
  std::size_t identity_sum_transactions{0};
};

enum class ScanStatus {
  kCompleted,
  kCancelled,
};

// Full pipeline for a single transaction: eligibility, tweak point and
// matching against every identity. Pure; safe to call concurrently.
TransactionScan ScanTransaction(const primitives::CTransaction& tx, std::uint32_t height,
                                std::span<const ScanIdentity> identities);

// Fans the transactions of a block out over a bounded set of worker threads
// and fans the results back in, in transaction order. Work stops early and
// the partial result is discarded once `stop` is requested.
class BlockScanner {
 public:
  explicit BlockScanner(std::size_t worker_threads);

  ScanStatus ScanBlock(const primitives::CBlock& block, std::span<const ScanIdentity> identities,
                       std::stop_token stop, BlockScanResult* out) const;

  std::size_t worker_threads() const { return worker_threads_; }

 private:
  std::size_t worker_threads_;
};

}  // namespace sps::scan
