#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <span>
#include <string>
#include <tuple>
#include <vector>

#include "primitives/hash.hpp"
#include "scan/detected_payment.hpp"

namespace sps::storage {

class PaymentIndex;

// (identity, height, txid, vout, label): range-scan order.
using PaymentKey = std::tuple<std::uint32_t, std::uint32_t, primitives::Hash256, std::uint32_t,
                              std::uint32_t>;

PaymentKey KeyFor(const scan::DetectedPayment& payment);

// Lazy, restartable walk over one identity's payments in (height, txid, vout)
// order. The cursor keeps only its position, so it stays valid across
// commits and rollbacks and observes whole blocks only.
class PaymentCursor {
 public:
  PaymentCursor(const PaymentIndex* index, std::uint32_t identity,
                std::optional<std::uint32_t> min_height, std::optional<std::uint32_t> max_height);

  std::optional<scan::DetectedPayment> Next();
  void Reset();
  // Resume token: the last key returned, if any.
  const std::optional<PaymentKey>& position() const { return position_; }
  void Seek(const std::optional<PaymentKey>& position) { position_ = position; }

 private:
  const PaymentIndex* index_;
  std::uint32_t identity_;
  std::optional<std::uint32_t> min_height_;
  std::optional<std::uint32_t> max_height_;
  std::optional<PaymentKey> position_;
};

struct PaymentIndexStats {
  std::size_t entries{0};
  std::size_t journal_records{0};
  std::optional<std::uint32_t> highest_height;
};

// Persistent index of detected payments. Each committed block is one
// checksummed journal record; a block's entries become visible together.
// Appends are idempotent on (txid, vout, identity, label).
class PaymentIndex {
 public:
  using WriteHookFn = std::function<bool(std::uint32_t height)>;

  explicit PaymentIndex(std::filesystem::path path, bool read_only = false);

  // Replays the journal up to the last committed height (nullopt when no
  // block was ever committed). Records above it, written before a crash that
  // preceded the watermark update, are discarded, as is a torn tail.
  bool Open(std::optional<std::uint32_t> committed_height, std::string* error);

  // Atomically appends every not-yet-indexed payment of one block. Heights
  // must not decrease across calls except for pure duplicates.
  bool CommitBlock(std::uint32_t height, std::span<const scan::DetectedPayment> payments,
                   std::size_t* appended, std::string* error);
  // Single-entry form of CommitBlock; a duplicate is a successful no-op.
  bool Append(const scan::DetectedPayment& payment, bool* inserted, std::string* error);
  // Deletes every entry above `height`; `removed` receives the count.
  bool RollbackAbove(std::uint32_t height, std::size_t* removed, std::string* error);
  // Deletes every entry.
  bool Clear(std::size_t* removed, std::string* error);

  PaymentCursor Query(std::uint32_t identity, std::optional<std::uint32_t> min_height = {},
                      std::optional<std::uint32_t> max_height = {}) const;
  std::vector<scan::DetectedPayment> Collect(std::uint32_t identity,
                                             std::optional<std::uint32_t> min_height = {},
                                             std::optional<std::uint32_t> max_height = {}) const;
  // Every entry in key order; used to compare index states.
  std::vector<scan::DetectedPayment> Snapshot() const;
  PaymentIndexStats Stats() const;

  // Test-only hook consulted before each journal write; returning false
  // simulates an I/O failure.
  void SetWriteHookForTest(WriteHookFn hook);

 private:
  friend class PaymentCursor;

  using DedupeKey = std::tuple<primitives::Hash256, std::uint32_t, std::uint32_t, std::uint32_t>;

  struct JournalRecord {
    std::uint32_t height{0};
    std::uint64_t offset{0};
    std::vector<PaymentKey> keys;
  };

  std::optional<scan::DetectedPayment> NextAfter(std::uint32_t identity,
                                                 const std::optional<PaymentKey>& after,
                                                 std::optional<std::uint32_t> min_height,
                                                 std::optional<std::uint32_t> max_height) const;
  void InsertLocked(const scan::DetectedPayment& payment);
  bool TruncateJournalLocked(std::vector<JournalRecord>::iterator first, std::size_t* removed,
                             std::string* error);

  std::filesystem::path path_;
  bool read_only_{false};
  std::map<PaymentKey, scan::DetectedPayment> entries_;
  std::set<DedupeKey> dedupe_;
  std::vector<JournalRecord> journal_;
  WriteHookFn write_hook_;
  mutable std::shared_mutex mutex_;
};

}  // namespace sps::storage
