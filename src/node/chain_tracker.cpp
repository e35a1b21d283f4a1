#include "node/chain_tracker.hpp"

#include <algorithm>
#include <memory>
#include <thread>
#include <vector>

#include "util/logging.hpp"

namespace sps::node {

namespace {

std::string DescribeBlock(std::uint32_t height, const primitives::Hash256& hash) {
  return std::to_string(height) + " (" + primitives::HashToDisplayHex(hash) + ")";
}

// Sleeps for `delay` unless shutdown is requested first.
void BackoffSleep(std::chrono::milliseconds delay, std::stop_token shutdown) {
  const auto deadline = std::chrono::steady_clock::now() + delay;
  while (!shutdown.stop_requested() && std::chrono::steady_clock::now() < deadline) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    std::this_thread::sleep_for(std::min(remaining, std::chrono::milliseconds(50)));
  }
}

}  // namespace

const char* AdvanceStatusName(AdvanceStatus status) {
  switch (status) {
    case AdvanceStatus::kAdvanced:
      return "advanced";
    case AdvanceStatus::kDuplicate:
      return "duplicate";
    case AdvanceStatus::kSkipped:
      return "skipped";
    case AdvanceStatus::kRolledBack:
      return "rolled-back";
    case AdvanceStatus::kCancelled:
      return "cancelled";
    case AdvanceStatus::kMalformedBlock:
      return "malformed-block";
    case AdvanceStatus::kReorgTooDeep:
      return "reorg-too-deep";
    case AdvanceStatus::kStoreFailure:
      return "store-failure";
  }
  return "unknown";
}

bool IsFatal(AdvanceStatus status) {
  return status == AdvanceStatus::kMalformedBlock || status == AdvanceStatus::kReorgTooDeep ||
         status == AdvanceStatus::kStoreFailure;
}

ChainTracker::ChainTracker(storage::TweakStore* tweaks, storage::PaymentIndex* index,
                           const scan::IdentityRegistry* registry,
                           std::filesystem::path watermark_path, ChainTrackerOptions options)
    : tweaks_(tweaks),
      index_(index),
      registry_(registry),
      watermark_path_(std::move(watermark_path)),
      options_(options),
      scanner_(options.scan_threads) {}

bool ChainTracker::Initialize(std::string* error) {
  std::optional<storage::Watermark> watermark;
  if (!storage::LoadWatermark(watermark_path_, &watermark, error)) {
    return false;
  }
  if (!tweaks_->Open(error)) {
    return false;
  }
  const auto committed =
      watermark ? std::optional<std::uint32_t>(watermark->height) : std::nullopt;
  if (!index_->Open(committed, error)) {
    return false;
  }
  std::size_t removed = 0;
  if (watermark) {
    const auto hash = tweaks_->HashAt(watermark->height);
    if (!hash || *hash != watermark->hash) {
      if (error) {
        *error = "tweak store does not hold committed block " +
                 DescribeBlock(watermark->height, watermark->hash);
      }
      return false;
    }
    if (!tweaks_->RollbackAbove(watermark->height, &removed, error)) {
      return false;
    }
  } else if (!tweaks_->Clear(&removed, error)) {
    return false;
  }
  if (removed > 0) {
    util::LogWarn("chain", "discarded " + std::to_string(removed) +
                               " uncommitted block(s) of tweak data");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  tip_ = watermark;
  if (tip_) {
    util::LogInfo("chain", "resuming from committed block " +
                               DescribeBlock(tip_->height, tip_->hash));
  } else {
    util::LogInfo("chain", "no committed blocks; waiting for height " +
                               std::to_string(options_.start_height));
  }
  return true;
}

AdvanceStatus ChainTracker::Process(const FeedEvent& event, std::stop_token shutdown) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (halted_) {
      return halt_status_;
    }
  }
  switch (event.type) {
    case FeedEventType::kConnect:
      return HandleConnect(event.block, shutdown);
    case FeedEventType::kDisconnect:
      return HandleDisconnect(event);
    case FeedEventType::kMalformed:
      break;
  }
  return Halt(AdvanceStatus::kMalformedBlock, "malformed feed record: " + event.error);
}

AdvanceStatus ChainTracker::HandleConnect(const primitives::CBlock& block,
                                          std::stop_token shutdown) {
  const auto tip = Tip();
  if (!tip) {
    if (block.height < options_.start_height) {
      std::lock_guard<std::mutex> lock(mutex_);
      ++telemetry_.skipped_blocks;
      return AdvanceStatus::kSkipped;
    }
    return ScanAndCommit(block, shutdown);
  }
  if (block.height <= tip->height) {
    const auto existing = tweaks_->HashAt(block.height);
    if (existing && *existing == block.hash) {
      util::LogDebug("chain", "block " + DescribeBlock(block.height, block.hash) +
                                  " already committed");
      std::lock_guard<std::mutex> lock(mutex_);
      ++telemetry_.duplicate_blocks;
      return AdvanceStatus::kDuplicate;
    }
  }
  if (block.height == tip->height + 1 && block.previous_block_hash == tip->hash) {
    return ScanAndCommit(block, shutdown);
  }

  // Replacement chain delivered without explicit disconnects.
  const auto parent = tweaks_->FindHeight(block.previous_block_hash);
  if (!parent || *parent + 1 != block.height) {
    return Halt(AdvanceStatus::kMalformedBlock,
                "block " + DescribeBlock(block.height, block.hash) +
                    " does not connect to the committed chain");
  }
  // Blocks already unwound by explicit disconnects count toward the same reorg.
  std::uint32_t depth = tip->height - *parent;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    depth += pending_disconnects_;
  }
  if (options_.max_reorg_depth != 0 && depth > options_.max_reorg_depth) {
    return Halt(AdvanceStatus::kReorgTooDeep,
                "reorg of " + std::to_string(depth) + " blocks exceeds the limit of " +
                    std::to_string(options_.max_reorg_depth) + "; resync required");
  }
  util::LogWarn("chain", "reorg: rolling back " + std::to_string(tip->height - *parent) +
                             " block(s) to height " + std::to_string(*parent));
  std::string error;
  if (!RollbackTo(*parent, &error)) {
    return Halt(AdvanceStatus::kStoreFailure, "rollback failed: " + error);
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == TrackerState::kSynced) {
      ++telemetry_.reorg_events;
    }
    telemetry_.blocks_disconnected += tip->height - *parent;
    telemetry_.max_reorg_depth = std::max<std::uint64_t>(telemetry_.max_reorg_depth, depth);
    pending_disconnects_ = depth;
    state_ = TrackerState::kReorging;
  }
  return ScanAndCommit(block, shutdown);
}

AdvanceStatus ChainTracker::HandleDisconnect(const FeedEvent& event) {
  {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    if (cancelled_hash_ && *cancelled_hash_ == event.hash) {
      cancelled_hash_.reset();
      util::LogInfo("chain", "block " + DescribeBlock(event.height, event.hash) +
                                 " disconnected before commit");
      return AdvanceStatus::kRolledBack;
    }
  }
  const auto tip = Tip();
  if (!tip && event.height < options_.start_height) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++telemetry_.skipped_blocks;
    return AdvanceStatus::kSkipped;
  }
  if (!tip || tip->hash != event.hash || tip->height != event.height) {
    return Halt(AdvanceStatus::kMalformedBlock,
                "disconnect of " + DescribeBlock(event.height, event.hash) +
                    " does not match the committed tip");
  }
  std::uint32_t depth = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    depth = pending_disconnects_ + 1;
  }
  if (options_.max_reorg_depth != 0 && depth > options_.max_reorg_depth) {
    return Halt(AdvanceStatus::kReorgTooDeep,
                "reorg of " + std::to_string(depth) + " blocks exceeds the limit of " +
                    std::to_string(options_.max_reorg_depth) + "; resync required");
  }
  const auto base = tweaks_->BaseHeight();
  std::optional<std::uint32_t> new_tip;
  if (base && tip->height > *base) {
    new_tip = tip->height - 1;
  }
  std::string error;
  if (!RollbackTo(new_tip, &error)) {
    return Halt(AdvanceStatus::kStoreFailure, "rollback failed: " + error);
  }
  util::LogInfo("chain", "disconnected block " + DescribeBlock(event.height, event.hash));
  std::lock_guard<std::mutex> lock(mutex_);
  pending_disconnects_ = depth;
  ++telemetry_.blocks_disconnected;
  telemetry_.max_reorg_depth = std::max<std::uint64_t>(telemetry_.max_reorg_depth, depth);
  if (state_ == TrackerState::kSynced) {
    ++telemetry_.reorg_events;
    state_ = TrackerState::kReorging;
  }
  return AdvanceStatus::kRolledBack;
}

AdvanceStatus ChainTracker::ScanAndCommit(const primitives::CBlock& block,
                                          std::stop_token shutdown) {
  auto identities = registry_ ? registry_->ActiveIdentities()
                              : std::make_shared<const std::vector<scan::ScanIdentity>>();
  std::stop_source stop;
  {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    in_flight_hash_ = block.hash;
    in_flight_stop_ = stop;
    in_flight_cancelled_ = false;
  }
  std::stop_callback on_shutdown(shutdown, [&stop] { stop.request_stop(); });
  ScanHookFn hook;
  {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    hook = scan_hook_;
  }
  if (hook) {
    hook(block);
  }

  scan::BlockScanResult result;
  const auto status = scanner_.ScanBlock(block, *identities, stop.get_token(), &result);
  {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    in_flight_hash_.reset();
    if (status == scan::ScanStatus::kCancelled && in_flight_cancelled_) {
      cancelled_hash_ = block.hash;
    }
  }
  if (status == scan::ScanStatus::kCancelled) {
    util::LogInfo("chain", "scan of block " + DescribeBlock(block.height, block.hash) +
                               " cancelled; partial results discarded");
    std::lock_guard<std::mutex> lock(mutex_);
    ++telemetry_.cancelled_scans;
    return AdvanceStatus::kCancelled;
  }

  const std::uint32_t attempts = std::max<std::uint32_t>(1, options_.commit_attempts);
  auto delay = options_.commit_backoff;
  for (std::uint32_t attempt = 1;; ++attempt) {
    std::string error;
    if (CommitOnce(block, result, &error)) {
      break;
    }
    util::LogWarn("chain", "commit of block " + std::to_string(block.height) + " failed (attempt " +
                               std::to_string(attempt) + "/" + std::to_string(attempts) +
                               "): " + error);
    if (attempt >= attempts) {
      return Halt(AdvanceStatus::kStoreFailure,
                  "giving up on block " + DescribeBlock(block.height, block.hash) + ": " + error);
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++telemetry_.commit_retries;
    }
    BackoffSleep(delay, shutdown);
    delay *= 2;
  }

  util::LogDebug("chain", "connected block " + DescribeBlock(block.height, block.hash) + ": " +
                              std::to_string(result.eligible_transactions) + " eligible tx, " +
                              std::to_string(result.payments.size()) + " payment(s)");
  for (const auto& payment : result.payments) {
    util::LogInfo("chain", "payment for identity " + std::to_string(payment.identity_id) +
                               " label " + std::to_string(payment.label) + " at " +
                               primitives::HashToDisplayHex(payment.txid) + ":" +
                               std::to_string(payment.vout));
  }
  std::lock_guard<std::mutex> lock(mutex_);
  tip_ = storage::Watermark{block.height, block.hash};
  pending_disconnects_ = 0;
  ++telemetry_.blocks_connected;
  telemetry_.eligible_transactions += result.eligible_transactions;
  telemetry_.identity_sum_transactions += result.identity_sum_transactions;
  telemetry_.payments_detected += result.payments.size();
  // The first committed block of the replacement branch ends the reorg, even
  // when that branch is shorter than the one it replaced.
  if (state_ == TrackerState::kReorging) {
    state_ = TrackerState::kSynced;
    util::LogInfo("chain", "reorg complete at height " + std::to_string(block.height));
  }
  return AdvanceStatus::kAdvanced;
}

bool ChainTracker::CommitOnce(const primitives::CBlock& block,
                              const scan::BlockScanResult& result, std::string* error) {
  // Leftovers of an earlier failed attempt sit above the committed tip.
  const auto tip = Tip();
  std::size_t removed = 0;
  if (tip) {
    if (!tweaks_->RollbackAbove(tip->height, &removed, error) ||
        !index_->RollbackAbove(tip->height, &removed, error)) {
      return false;
    }
  } else if (!tweaks_->Clear(&removed, error) || !index_->Clear(&removed, error)) {
    return false;
  }
  if (!tweaks_->AppendBlock(block.height, block.hash, result.tweak_points, error)) {
    return false;
  }
  std::size_t appended = 0;
  if (!index_->CommitBlock(block.height, result.payments, &appended, error)) {
    return false;
  }
  return storage::SaveWatermark(watermark_path_, storage::Watermark{block.height, block.hash},
                                error);
}

bool ChainTracker::RollbackTo(std::optional<std::uint32_t> height, std::string* error) {
  std::size_t removed = 0;
  if (height) {
    const auto hash = tweaks_->HashAt(*height);
    if (!hash) {
      if (error) *error = "no committed block at height " + std::to_string(*height);
      return false;
    }
    if (!storage::SaveWatermark(watermark_path_, storage::Watermark{*height, *hash}, error)) {
      return false;
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      tip_ = storage::Watermark{*height, *hash};
    }
    std::size_t payments = 0;
    if (!index_->RollbackAbove(*height, &payments, error) ||
        !tweaks_->RollbackAbove(*height, &removed, error)) {
      return false;
    }
    if (payments > 0) {
      util::LogInfo("chain", "removed " + std::to_string(payments) + " payment(s) above height " +
                                 std::to_string(*height));
    }
    return true;
  }
  if (!storage::ClearWatermark(watermark_path_, error)) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    tip_.reset();
  }
  return index_->Clear(&removed, error) && tweaks_->Clear(&removed, error);
}

AdvanceStatus ChainTracker::Halt(AdvanceStatus status, const std::string& message) {
  util::LogError("chain", message);
  std::lock_guard<std::mutex> lock(mutex_);
  halted_ = true;
  halt_status_ = status;
  last_error_ = message;
  return status;
}

void ChainTracker::OnDisconnectNotice(const FeedEvent& event) {
  std::lock_guard<std::mutex> lock(in_flight_mutex_);
  if (in_flight_hash_ && *in_flight_hash_ == event.hash) {
    in_flight_cancelled_ = true;
    in_flight_stop_.request_stop();
  }
}

std::optional<storage::Watermark> ChainTracker::Tip() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tip_;
}

TrackerState ChainTracker::State() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool ChainTracker::Halted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return halted_;
}

std::string ChainTracker::LastError() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_error_;
}

ChainTelemetry ChainTracker::GetTelemetry() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return telemetry_;
}

void ChainTracker::SetScanHookForTest(ScanHookFn hook) {
  std::lock_guard<std::mutex> lock(in_flight_mutex_);
  scan_hook_ = std::move(hook);
}

}  // namespace sps::node
