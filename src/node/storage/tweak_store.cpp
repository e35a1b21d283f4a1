#include "storage/tweak_store.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <system_error>

#include "primitives/serialize.hpp"
#include "storage/record_file.hpp"
#include "util/atomic_file.hpp"
#include "util/logging.hpp"

namespace sps::storage {

namespace {

constexpr std::array<std::uint8_t, 8> kFileMagic = {'S', 'P', 'S', 'D', 'A', 'T', 'A', '1'};
constexpr std::uint32_t kTweakRecordMagic = 0x57545053;  // 'SPTW' (little-endian uint32)
constexpr std::uint64_t kMaxTweaksPerBlock = 1'000'000;

std::vector<std::uint8_t> EncodeBlock(std::uint32_t height, const primitives::Hash256& hash,
                                      const std::vector<crypto::PubKey>& tweaks) {
  std::vector<std::uint8_t> out;
  out.reserve(4 + hash.size() + 9 + tweaks.size() * 33);
  primitives::serialize::WriteUint32(&out, height);
  out.insert(out.end(), hash.begin(), hash.end());
  primitives::serialize::WriteVarInt(&out, tweaks.size());
  for (const auto& tweak : tweaks) {
    out.insert(out.end(), tweak.begin(), tweak.end());
  }
  return out;
}

bool DecodeBlock(const std::vector<std::uint8_t>& payload, BlockTweaks* out) {
  std::size_t offset = 0;
  if (!primitives::serialize::ReadUint32(payload, &offset, &out->height)) return false;
  if (payload.size() - offset < out->hash.size()) return false;
  std::copy_n(payload.begin() + static_cast<std::ptrdiff_t>(offset), out->hash.size(),
              out->hash.begin());
  offset += out->hash.size();
  std::uint64_t count = 0;
  if (!primitives::serialize::ReadVarInt(payload, &offset, &count) ||
      count > kMaxTweaksPerBlock || (payload.size() - offset) != count * 33) {
    return false;
  }
  out->tweaks.resize(static_cast<std::size_t>(count));
  for (auto& tweak : out->tweaks) {
    std::copy_n(payload.begin() + static_cast<std::ptrdiff_t>(offset), tweak.size(),
                tweak.begin());
    offset += tweak.size();
  }
  return true;
}

}  // namespace

TweakStore::TweakStore(std::filesystem::path dir, bool read_only)
    : dir_(std::move(dir)), read_only_(read_only) {}

std::filesystem::path TweakStore::FilePath(std::uint32_t file) const {
  char name[32];
  std::snprintf(name, sizeof(name), "sps%06u.dat", file);
  return dir_ / name;
}

bool TweakStore::CreateFileLocked(std::uint32_t file, std::string* error) {
  const auto path = FilePath(file);
  {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(kFileMagic.data()),
              static_cast<std::streamsize>(kFileMagic.size()));
    out.flush();
    if (!out.good()) {
      if (error) *error = "failed to create " + path.string();
      return false;
    }
  }
  if (!util::SyncPath(path, error)) {
    return false;
  }
  current_file_ = file;
  util::LogInfo("tweaks", "created block data file " + path.filename().string());
  return true;
}

bool TweakStore::LoadFileLocked(std::uint32_t file, bool* truncated, std::string* error) {
  const auto path = FilePath(file);
  std::ifstream in(path, std::ios::binary);
  std::array<std::uint8_t, 8> magic{};
  in.read(reinterpret_cast<char*>(magic.data()), static_cast<std::streamsize>(magic.size()));
  if (!in.good() || magic != kFileMagic) {
    if (error) *error = path.string() + ": bad file magic";
    return false;
  }
  std::uint64_t offset = kFileMagic.size();
  while (true) {
    std::vector<std::uint8_t> payload;
    std::uint64_t record_bytes = 0;
    const auto status = ReadNextRecord(&in, kTweakRecordMagic, &payload, &record_bytes);
    if (status == RecordReadStatus::kEndOfFile) {
      return true;
    }
    if (status == RecordReadStatus::kTruncatedTail) {
      util::LogWarn("tweaks", path.filename().string() + ": discarding torn record at offset " +
                                  std::to_string(offset));
      *truncated = true;
      if (!read_only_) {
        in.close();
        return TruncateFile(path, offset, error);
      }
      return true;
    }
    BlockTweaks block;
    if (status != RecordReadStatus::kOk || !DecodeBlock(payload, &block)) {
      if (error) *error = path.string() + ": corrupt record at offset " + std::to_string(offset);
      return false;
    }
    if (!locations_.empty() &&
        block.height != base_height_ + static_cast<std::uint32_t>(locations_.size())) {
      if (error) *error = path.string() + ": non-contiguous height " + std::to_string(block.height);
      return false;
    }
    if (locations_.empty()) {
      base_height_ = block.height;
    }
    locations_.push_back(Location{file, offset, block.hash});
    height_by_hash_[block.hash] = block.height;
    offset += record_bytes;
  }
}

bool TweakStore::Open(std::string* error) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  locations_.clear();
  height_by_hash_.clear();
  base_height_ = 0;
  current_file_ = 0;
  std::error_code ec;
  if (!read_only_) {
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
      if (error) *error = "failed to create " + dir_.string() + ": " + ec.message();
      return false;
    }
  }
  if (!std::filesystem::exists(FilePath(0), ec)) {
    if (read_only_) {
      return true;
    }
    return CreateFileLocked(0, error);
  }
  std::uint32_t file = 0;
  while (std::filesystem::exists(FilePath(file), ec)) {
    bool truncated = false;
    if (!LoadFileLocked(file, &truncated, error)) {
      return false;
    }
    current_file_ = file;
    ++file;
    if (truncated) {
      break;
    }
  }
  // Files past a torn record were never reachable by a completed append.
  while (!read_only_ && std::filesystem::exists(FilePath(file), ec)) {
    std::filesystem::remove(FilePath(file), ec);
    ++file;
  }
  if (!locations_.empty()) {
    util::LogInfo("tweaks", "loaded tweak data for heights " + std::to_string(base_height_) +
                                "-" + std::to_string(base_height_ + locations_.size() - 1));
  }
  return true;
}

bool TweakStore::Empty() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return locations_.empty();
}

std::optional<std::uint32_t> TweakStore::TipHeight() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (locations_.empty()) {
    return std::nullopt;
  }
  return base_height_ + static_cast<std::uint32_t>(locations_.size() - 1);
}

std::optional<std::uint32_t> TweakStore::BaseHeight() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (locations_.empty()) {
    return std::nullopt;
  }
  return base_height_;
}

std::optional<primitives::Hash256> TweakStore::HashAt(std::uint32_t height) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (height < base_height_ || height - base_height_ >= locations_.size()) {
    return std::nullopt;
  }
  return locations_[height - base_height_].hash;
}

std::optional<std::uint32_t> TweakStore::FindHeight(const primitives::Hash256& hash) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = height_by_hash_.find(hash);
  if (it == height_by_hash_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool TweakStore::AppendBlock(std::uint32_t height, const primitives::Hash256& hash,
                             const std::vector<crypto::PubKey>& tweaks, std::string* error) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (read_only_) {
    if (error) *error = "tweak store opened read-only";
    return false;
  }
  if (!locations_.empty() &&
      height != base_height_ + static_cast<std::uint32_t>(locations_.size())) {
    if (error) *error = "tweak store append out of order at height " + std::to_string(height);
    return false;
  }
  const auto payload = EncodeBlock(height, hash, tweaks);
  std::error_code ec;
  const auto current_size = std::filesystem::file_size(FilePath(current_file_), ec);
  if (ec) {
    if (error) *error = "failed to stat tweak file: " + ec.message();
    return false;
  }
  if (current_size > kFileMagic.size() &&
      current_size + kRecordHeaderSize + payload.size() >= max_file_size_) {
    if (!CreateFileLocked(current_file_ + 1, error)) {
      return false;
    }
  }
  std::uint64_t offset = 0;
  if (!AppendRecord(FilePath(current_file_), kTweakRecordMagic, payload, &offset, error)) {
    return false;
  }
  if (locations_.empty()) {
    base_height_ = height;
  }
  locations_.push_back(Location{current_file_, offset, hash});
  height_by_hash_[hash] = height;
  return true;
}

bool TweakStore::ReadBlock(std::uint32_t height, BlockTweaks* out, std::string* error) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (height < base_height_ || height - base_height_ >= locations_.size()) {
    if (error) *error = "no tweak data at height " + std::to_string(height);
    return false;
  }
  const Location& location = locations_[height - base_height_];
  std::ifstream in(FilePath(location.file), std::ios::binary);
  in.seekg(static_cast<std::streamoff>(location.offset), std::ios::beg);
  std::vector<std::uint8_t> payload;
  if (!in.good() ||
      ReadNextRecord(&in, kTweakRecordMagic, &payload, nullptr) != RecordReadStatus::kOk ||
      !DecodeBlock(payload, out)) {
    if (error) *error = "failed to read tweak data at height " + std::to_string(height);
    return false;
  }
  return true;
}

bool TweakStore::RollbackAbove(std::uint32_t height, std::size_t* removed, std::string* error) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (removed) *removed = 0;
  if (locations_.empty()) {
    return true;
  }
  const std::uint32_t tip = base_height_ + static_cast<std::uint32_t>(locations_.size() - 1);
  if (height >= tip) {
    return true;
  }
  const std::size_t keep =
      height < base_height_ ? 0 : static_cast<std::size_t>(height - base_height_) + 1;
  return TruncateToLocked(keep, removed, error);
}

bool TweakStore::Clear(std::size_t* removed, std::string* error) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (removed) *removed = 0;
  if (locations_.empty()) {
    return true;
  }
  return TruncateToLocked(0, removed, error);
}

bool TweakStore::TruncateToLocked(std::size_t keep, std::size_t* removed, std::string* error) {
  if (read_only_) {
    if (error) *error = "tweak store opened read-only";
    return false;
  }
  const Location cut = locations_[keep];
  if (!TruncateFile(FilePath(cut.file), cut.offset, error)) {
    return false;
  }
  std::error_code ec;
  for (std::uint32_t file = cut.file + 1; std::filesystem::exists(FilePath(file), ec); ++file) {
    std::filesystem::remove(FilePath(file), ec);
    if (ec) {
      if (error) *error = "failed to remove " + FilePath(file).string() + ": " + ec.message();
      return false;
    }
  }
  for (std::size_t i = keep; i < locations_.size(); ++i) {
    height_by_hash_.erase(locations_[i].hash);
  }
  if (removed) *removed = locations_.size() - keep;
  locations_.resize(keep);
  current_file_ = cut.file;
  if (locations_.empty()) {
    base_height_ = 0;
  }
  return true;
}

void TweakStore::SetMaxFileSizeForTest(std::uint64_t bytes) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  max_file_size_ = bytes;
}

}  // namespace sps::storage
