#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "crypto/secp256k1_ops.hpp"
#include "primitives/hash.hpp"

namespace sps::storage {

struct BlockTweaks {
  std::uint32_t height{0};
  primitives::Hash256 hash{};
  std::vector<crypto::PubKey> tweaks;
};

// Per-block tweak data served to light clients: for every committed block
// its hash and the tweak points of its eligible transactions. Stored in
// flat files sps000000.dat, sps000001.dat, ... each starting with the
// "SPSDATA1" magic and rolling over at 128 MiB. Heights are contiguous from
// the first stored block; the store doubles as the height -> hash record of
// the committed chain.
class TweakStore {
 public:
  static constexpr std::uint64_t kDefaultMaxFileSize = 128ULL * 1024ULL * 1024ULL;

  explicit TweakStore(std::filesystem::path dir, bool read_only = false);

  // Loads the record index. A partially written tail record is discarded
  // (truncated unless read-only); any other damage is an error.
  bool Open(std::string* error);

  bool Empty() const;
  std::optional<std::uint32_t> TipHeight() const;
  std::optional<std::uint32_t> BaseHeight() const;
  std::optional<primitives::Hash256> HashAt(std::uint32_t height) const;
  std::optional<std::uint32_t> FindHeight(const primitives::Hash256& hash) const;

  // Only valid at TipHeight() + 1, or at any height while empty.
  bool AppendBlock(std::uint32_t height, const primitives::Hash256& hash,
                   const std::vector<crypto::PubKey>& tweaks, std::string* error);
  bool ReadBlock(std::uint32_t height, BlockTweaks* out, std::string* error) const;
  bool RollbackAbove(std::uint32_t height, std::size_t* removed, std::string* error);
  // Drops every stored block.
  bool Clear(std::size_t* removed, std::string* error);

  void SetMaxFileSizeForTest(std::uint64_t bytes);

 private:
  struct Location {
    std::uint32_t file{0};
    std::uint64_t offset{0};
    primitives::Hash256 hash{};
  };

  std::filesystem::path FilePath(std::uint32_t file) const;
  bool CreateFileLocked(std::uint32_t file, std::string* error);
  bool TruncateToLocked(std::size_t keep, std::size_t* removed, std::string* error);
  bool LoadFileLocked(std::uint32_t file, bool* truncated, std::string* error);

  std::filesystem::path dir_;
  bool read_only_{false};
  std::uint32_t base_height_{0};
  std::vector<Location> locations_;
  std::unordered_map<primitives::Hash256, std::uint32_t, primitives::Hash256Hasher>
      height_by_hash_;
  std::uint32_t current_file_{0};
  std::uint64_t max_file_size_{kDefaultMaxFileSize};
  mutable std::shared_mutex mutex_;
};

}  // namespace sps::storage
