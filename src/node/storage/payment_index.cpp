#include "storage/payment_index.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <mutex>
#include <system_error>

#include "primitives/serialize.hpp"
#include "storage/record_file.hpp"
#include "util/logging.hpp"

namespace sps::storage {

namespace {

constexpr std::uint32_t kJournalMagic = 0x49505053;  // 'SPPI' (little-endian uint32)
constexpr std::size_t kEntrySize = 4 + 4 + 32 + 4 + 8 + 32;

std::vector<std::uint8_t> EncodeBatch(std::uint32_t height,
                                      const std::vector<scan::DetectedPayment>& payments) {
  std::vector<std::uint8_t> out;
  out.reserve(4 + 9 + payments.size() * kEntrySize);
  primitives::serialize::WriteUint32(&out, height);
  primitives::serialize::WriteVarInt(&out, payments.size());
  for (const auto& payment : payments) {
    primitives::serialize::WriteUint32(&out, payment.identity_id);
    primitives::serialize::WriteUint32(&out, payment.label);
    out.insert(out.end(), payment.txid.begin(), payment.txid.end());
    primitives::serialize::WriteUint32(&out, payment.vout);
    primitives::serialize::WriteUint64(&out, payment.value);
    out.insert(out.end(), payment.tweak.begin(), payment.tweak.end());
  }
  return out;
}

bool DecodeBatch(const std::vector<std::uint8_t>& payload, std::uint32_t* height,
                 std::vector<scan::DetectedPayment>* payments) {
  std::size_t offset = 0;
  std::uint64_t count = 0;
  if (!primitives::serialize::ReadUint32(payload, &offset, height) ||
      !primitives::serialize::ReadVarInt(payload, &offset, &count) ||
      count > (payload.size() - offset) / kEntrySize ||
      payload.size() - offset != count * kEntrySize) {
    return false;
  }
  payments->resize(static_cast<std::size_t>(count));
  for (auto& payment : *payments) {
    primitives::serialize::ReadUint32(payload, &offset, &payment.identity_id);
    primitives::serialize::ReadUint32(payload, &offset, &payment.label);
    std::copy_n(payload.begin() + static_cast<std::ptrdiff_t>(offset), payment.txid.size(),
                payment.txid.begin());
    offset += payment.txid.size();
    primitives::serialize::ReadUint32(payload, &offset, &payment.vout);
    primitives::serialize::ReadUint64(payload, &offset, &payment.value);
    std::copy_n(payload.begin() + static_cast<std::ptrdiff_t>(offset), payment.tweak.size(),
                payment.tweak.begin());
    offset += payment.tweak.size();
    payment.height = *height;
  }
  return true;
}

}  // namespace

PaymentKey KeyFor(const scan::DetectedPayment& payment) {
  return {payment.identity_id, payment.height, payment.txid, payment.vout, payment.label};
}

PaymentCursor::PaymentCursor(const PaymentIndex* index, std::uint32_t identity,
                             std::optional<std::uint32_t> min_height,
                             std::optional<std::uint32_t> max_height)
    : index_(index), identity_(identity), min_height_(min_height), max_height_(max_height) {}

std::optional<scan::DetectedPayment> PaymentCursor::Next() {
  auto next = index_->NextAfter(identity_, position_, min_height_, max_height_);
  if (next) {
    position_ = KeyFor(*next);
  }
  return next;
}

void PaymentCursor::Reset() { position_.reset(); }

PaymentIndex::PaymentIndex(std::filesystem::path path, bool read_only)
    : path_(std::move(path)), read_only_(read_only) {}

bool PaymentIndex::Open(std::optional<std::uint32_t> committed_height, std::string* error) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_.clear();
  dedupe_.clear();
  journal_.clear();
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return true;
  }
  std::ifstream in(path_, std::ios::binary);
  if (!in.is_open()) {
    if (error) *error = "failed to open " + path_.string();
    return false;
  }
  std::uint64_t offset = 0;
  std::optional<std::uint64_t> cut;
  while (true) {
    std::vector<std::uint8_t> payload;
    std::uint64_t record_bytes = 0;
    const auto status = ReadNextRecord(&in, kJournalMagic, &payload, &record_bytes);
    if (status == RecordReadStatus::kEndOfFile) {
      break;
    }
    if (status == RecordReadStatus::kTruncatedTail) {
      util::LogWarn("index", "discarding torn journal record at offset " + std::to_string(offset));
      cut = offset;
      break;
    }
    std::uint32_t height = 0;
    std::vector<scan::DetectedPayment> payments;
    if (status != RecordReadStatus::kOk || !DecodeBatch(payload, &height, &payments)) {
      if (error) *error = path_.string() + ": corrupt journal record at offset " +
                          std::to_string(offset);
      return false;
    }
    if (!committed_height || height > *committed_height) {
      util::LogWarn("index", "discarding uncommitted journal records from height " +
                                 std::to_string(height));
      cut = offset;
      break;
    }
    if (!journal_.empty() && height < journal_.back().height) {
      if (error) *error = path_.string() + ": journal heights out of order";
      return false;
    }
    JournalRecord record;
    record.height = height;
    record.offset = offset;
    for (const auto& payment : payments) {
      record.keys.push_back(KeyFor(payment));
      InsertLocked(payment);
    }
    journal_.push_back(std::move(record));
    offset += record_bytes;
  }
  in.close();
  if (cut && !read_only_) {
    return TruncateFile(path_, *cut, error);
  }
  return true;
}

void PaymentIndex::InsertLocked(const scan::DetectedPayment& payment) {
  entries_.emplace(KeyFor(payment), payment);
  dedupe_.emplace(payment.txid, payment.vout, payment.identity_id, payment.label);
}

bool PaymentIndex::CommitBlock(std::uint32_t height,
                               std::span<const scan::DetectedPayment> payments,
                               std::size_t* appended, std::string* error) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (appended) *appended = 0;
  std::vector<scan::DetectedPayment> fresh;
  std::set<DedupeKey> batch_keys;
  for (const auto& payment : payments) {
    if (payment.height != height) {
      if (error) *error = "payment height does not match committed block";
      return false;
    }
    DedupeKey key{payment.txid, payment.vout, payment.identity_id, payment.label};
    if (dedupe_.count(key) > 0 || !batch_keys.insert(key).second) {
      continue;
    }
    fresh.push_back(payment);
  }
  if (fresh.empty()) {
    return true;
  }
  if (read_only_) {
    if (error) *error = "payment index opened read-only";
    return false;
  }
  if (!journal_.empty() && height < journal_.back().height) {
    if (error) *error = "commit at height " + std::to_string(height) + " below indexed height " +
                        std::to_string(journal_.back().height);
    return false;
  }
  if (write_hook_ && !write_hook_(height)) {
    if (error) *error = "simulated journal write failure";
    return false;
  }
  std::uint64_t offset = 0;
  if (!AppendRecord(path_, kJournalMagic, EncodeBatch(height, fresh), &offset, error)) {
    return false;
  }
  JournalRecord record;
  record.height = height;
  record.offset = offset;
  for (const auto& payment : fresh) {
    record.keys.push_back(KeyFor(payment));
    InsertLocked(payment);
  }
  journal_.push_back(std::move(record));
  if (appended) *appended = fresh.size();
  return true;
}

bool PaymentIndex::Append(const scan::DetectedPayment& payment, bool* inserted,
                          std::string* error) {
  std::size_t appended = 0;
  if (!CommitBlock(payment.height, std::span<const scan::DetectedPayment>(&payment, 1),
                   &appended, error)) {
    return false;
  }
  if (inserted) *inserted = appended == 1;
  return true;
}

bool PaymentIndex::RollbackAbove(std::uint32_t height, std::size_t* removed,
                                 std::string* error) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (removed) *removed = 0;
  if (journal_.empty() || journal_.back().height <= height) {
    return true;
  }
  const auto first = std::find_if(journal_.begin(), journal_.end(),
                                  [height](const JournalRecord& r) { return r.height > height; });
  return TruncateJournalLocked(first, removed, error);
}

bool PaymentIndex::Clear(std::size_t* removed, std::string* error) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (removed) *removed = 0;
  if (journal_.empty()) {
    return true;
  }
  return TruncateJournalLocked(journal_.begin(), removed, error);
}

bool PaymentIndex::TruncateJournalLocked(std::vector<JournalRecord>::iterator first,
                                         std::size_t* removed, std::string* error) {
  if (read_only_) {
    if (error) *error = "payment index opened read-only";
    return false;
  }
  if (!TruncateFile(path_, first->offset, error)) {
    return false;
  }
  std::size_t count = 0;
  for (auto it = first; it != journal_.end(); ++it) {
    for (const auto& key : it->keys) {
      const auto entry = entries_.find(key);
      if (entry == entries_.end()) {
        continue;
      }
      const auto& payment = entry->second;
      dedupe_.erase(DedupeKey{payment.txid, payment.vout, payment.identity_id, payment.label});
      entries_.erase(entry);
      ++count;
    }
  }
  journal_.erase(first, journal_.end());
  if (removed) *removed = count;
  return true;
}

PaymentCursor PaymentIndex::Query(std::uint32_t identity, std::optional<std::uint32_t> min_height,
                                  std::optional<std::uint32_t> max_height) const {
  return PaymentCursor(this, identity, min_height, max_height);
}

std::vector<scan::DetectedPayment> PaymentIndex::Collect(
    std::uint32_t identity, std::optional<std::uint32_t> min_height,
    std::optional<std::uint32_t> max_height) const {
  std::vector<scan::DetectedPayment> out;
  auto cursor = Query(identity, min_height, max_height);
  while (auto payment = cursor.Next()) {
    out.push_back(*payment);
  }
  return out;
}

std::vector<scan::DetectedPayment> PaymentIndex::Snapshot() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<scan::DetectedPayment> out;
  out.reserve(entries_.size());
  for (const auto& [key, payment] : entries_) {
    out.push_back(payment);
  }
  return out;
}

PaymentIndexStats PaymentIndex::Stats() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  PaymentIndexStats stats;
  stats.entries = entries_.size();
  stats.journal_records = journal_.size();
  if (!journal_.empty()) {
    stats.highest_height = journal_.back().height;
  }
  return stats;
}

void PaymentIndex::SetWriteHookForTest(WriteHookFn hook) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  write_hook_ = std::move(hook);
}

std::optional<scan::DetectedPayment> PaymentIndex::NextAfter(
    std::uint32_t identity, const std::optional<PaymentKey>& after,
    std::optional<std::uint32_t> min_height, std::optional<std::uint32_t> max_height) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const PaymentKey floor{identity, min_height.value_or(0), primitives::Hash256{}, 0, 0};
  auto it = entries_.lower_bound(floor);
  if (after && *after >= floor) {
    it = entries_.upper_bound(*after);
  }
  if (it == entries_.end() || std::get<0>(it->first) != identity) {
    return std::nullopt;
  }
  if (max_height && std::get<1>(it->first) > *max_height) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace sps::storage
