#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

#include "node/block_feed.hpp"
#include "primitives/block.hpp"
#include "scan/block_scanner.hpp"
#include "scan/identity_registry.hpp"
#include "storage/payment_index.hpp"
#include "storage/tweak_store.hpp"
#include "storage/watermark.hpp"

namespace sps::node {

enum class TrackerState {
  kSynced,
  kReorging,
};

enum class AdvanceStatus {
  kAdvanced,
  kDuplicate,
  kSkipped,
  kRolledBack,
  kCancelled,
  // Fatal: the tracker latches halted and refuses further events.
  kMalformedBlock,
  kReorgTooDeep,
  kStoreFailure,
};

const char* AdvanceStatusName(AdvanceStatus status);
bool IsFatal(AdvanceStatus status);

struct ChainTrackerOptions {
  // Deepest rollback accepted, in blocks. Zero disables the bound.
  std::uint32_t max_reorg_depth{100};
  // Blocks below this height are ignored until the first block is committed.
  std::uint32_t start_height{0};
  std::size_t scan_threads{1};
  std::uint32_t commit_attempts{5};
  std::chrono::milliseconds commit_backoff{100};
};

struct ChainTelemetry {
  std::uint64_t blocks_connected{0};
  std::uint64_t blocks_disconnected{0};
  std::uint64_t duplicate_blocks{0};
  std::uint64_t skipped_blocks{0};
  std::uint64_t cancelled_scans{0};
  std::uint64_t reorg_events{0};
  std::uint64_t max_reorg_depth{0};
  std::uint64_t commit_retries{0};
  std::uint64_t eligible_transactions{0};
  std::uint64_t identity_sum_transactions{0};
  std::uint64_t payments_detected{0};
};

// Owns the committed chain tip and is the only writer of the tweak store,
// the payment index and the watermark. Blocks are committed in order: tweak
// data, then payments, then the watermark. Rollbacks lower the watermark
// before truncating the stores, so a restart at any point converges on the
// watermark.
class ChainTracker {
 public:
  using ScanHookFn = std::function<void(const primitives::CBlock& block)>;

  ChainTracker(storage::TweakStore* tweaks, storage::PaymentIndex* index,
               const scan::IdentityRegistry* registry, std::filesystem::path watermark_path,
               ChainTrackerOptions options);

  // Opens the stores and discards anything written above the watermark.
  bool Initialize(std::string* error);

  AdvanceStatus Process(const FeedEvent& event, std::stop_token shutdown = {});
  // Called from the feed producer as disconnects arrive; cancels the scan of
  // the named block if it is still in flight.
  void OnDisconnectNotice(const FeedEvent& event);

  std::optional<storage::Watermark> Tip() const;
  TrackerState State() const;
  bool Halted() const;
  std::string LastError() const;
  ChainTelemetry GetTelemetry() const;

  // Test-only hook run after a block's scan is registered as in flight and
  // before its work starts.
  void SetScanHookForTest(ScanHookFn hook);

 private:
  AdvanceStatus HandleConnect(const primitives::CBlock& block, std::stop_token shutdown);
  AdvanceStatus HandleDisconnect(const FeedEvent& event);
  AdvanceStatus ScanAndCommit(const primitives::CBlock& block, std::stop_token shutdown);
  bool CommitOnce(const primitives::CBlock& block, const scan::BlockScanResult& result,
                  std::string* error);
  bool RollbackTo(std::optional<std::uint32_t> height, std::string* error);
  AdvanceStatus Halt(AdvanceStatus status, const std::string& message);

  storage::TweakStore* tweaks_;
  storage::PaymentIndex* index_;
  const scan::IdentityRegistry* registry_;
  std::filesystem::path watermark_path_;
  ChainTrackerOptions options_;
  scan::BlockScanner scanner_;

  mutable std::mutex mutex_;
  std::optional<storage::Watermark> tip_;
  TrackerState state_{TrackerState::kSynced};
  std::uint32_t pending_disconnects_{0};
  bool halted_{false};
  AdvanceStatus halt_status_{AdvanceStatus::kAdvanced};
  std::string last_error_;
  ChainTelemetry telemetry_;

  std::mutex in_flight_mutex_;
  std::optional<primitives::Hash256> in_flight_hash_;
  std::stop_source in_flight_stop_;
  bool in_flight_cancelled_{false};
  std::optional<primitives::Hash256> cancelled_hash_;
  ScanHookFn scan_hook_;
};

}  // namespace sps::node
