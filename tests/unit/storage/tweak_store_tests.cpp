#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "crypto/secp256k1_ops.hpp"
#include "storage/tweak_store.hpp"
#include "tests/unit/util/sp_sender.hpp"

using namespace sps;

namespace {

std::vector<crypto::PubKey> TweaksFor(std::uint32_t height) {
  std::vector<crypto::PubKey> out;
  for (std::uint32_t i = 0; i < height % 4; ++i) {
    out.push_back(test::TestPubKey(test::TestScalar("tweak-" + std::to_string(height) + "-" +
                                                    std::to_string(i))));
  }
  return out;
}

primitives::Hash256 HashFor(std::uint32_t height) {
  return test::TestHash("block-" + std::to_string(height));
}

bool AppendRange(storage::TweakStore* store, std::uint32_t from, std::uint32_t to) {
  for (std::uint32_t h = from; h <= to; ++h) {
    std::string error;
    if (!store->AppendBlock(h, HashFor(h), TweaksFor(h), &error)) {
      std::cerr << "tweak_store_tests: append " << h << " failed: " << error << "\n";
      return false;
    }
  }
  return true;
}

bool RunAppendReadReopenTest(const std::filesystem::path& dir) {
  std::string error;
  {
    storage::TweakStore store(dir);
    if (!store.Open(&error) || !store.Empty() || store.TipHeight()) {
      std::cerr << "tweak_store_tests: fresh store not empty: " << error << "\n";
      return false;
    }
    // Small files force a rollover every few blocks.
    store.SetMaxFileSizeForTest(300);
    if (!AppendRange(&store, 500, 520)) return false;
    if (store.AppendBlock(522, HashFor(522), {}, &error)) {
      std::cerr << "tweak_store_tests: gap accepted\n";
      return false;
    }
  }
  if (!std::filesystem::exists(dir / "sps000001.dat")) {
    std::cerr << "tweak_store_tests: no rollover file written\n";
    return false;
  }

  storage::TweakStore reopened(dir);
  if (!reopened.Open(&error)) {
    std::cerr << "tweak_store_tests: reopen failed: " << error << "\n";
    return false;
  }
  if (reopened.BaseHeight() != 500u || reopened.TipHeight() != 520u) {
    std::cerr << "tweak_store_tests: reopened range wrong\n";
    return false;
  }
  for (std::uint32_t h = 500; h <= 520; ++h) {
    storage::BlockTweaks block;
    if (!reopened.ReadBlock(h, &block, &error) || block.height != h ||
        block.hash != HashFor(h) || block.tweaks != TweaksFor(h)) {
      std::cerr << "tweak_store_tests: block " << h << " read back wrong\n";
      return false;
    }
    if (reopened.HashAt(h) != HashFor(h) || reopened.FindHeight(HashFor(h)) != h) {
      std::cerr << "tweak_store_tests: hash lookup wrong at " << h << "\n";
      return false;
    }
  }
  storage::BlockTweaks missing;
  if (reopened.ReadBlock(499, &missing, &error) || reopened.HashAt(521)) {
    std::cerr << "tweak_store_tests: read outside stored range succeeded\n";
    return false;
  }
  return true;
}

bool RunRollbackTest(const std::filesystem::path& dir) {
  std::string error;
  storage::TweakStore store(dir);
  if (!store.Open(&error)) return false;
  store.SetMaxFileSizeForTest(300);
  if (!AppendRange(&store, 0, 30)) return false;

  std::size_t removed = 0;
  if (!store.RollbackAbove(12, &removed, &error) || removed != 18 || store.TipHeight() != 12u) {
    std::cerr << "tweak_store_tests: rollback above 12 wrong: " << error << "\n";
    return false;
  }
  if (store.FindHeight(HashFor(13)) || store.HashAt(13)) {
    std::cerr << "tweak_store_tests: rolled back block still visible\n";
    return false;
  }
  if (!store.RollbackAbove(40, &removed, &error) || removed != 0) {
    std::cerr << "tweak_store_tests: rollback above tip removed data\n";
    return false;
  }
  // A different branch continues from the rollback point.
  const auto alt = test::TestHash("alt-13");
  if (!store.AppendBlock(13, alt, {}, &error) || store.FindHeight(alt) != 13u) {
    std::cerr << "tweak_store_tests: append after rollback failed: " << error << "\n";
    return false;
  }

  storage::TweakStore reopened(dir);
  if (!reopened.Open(&error) || reopened.TipHeight() != 13u || reopened.HashAt(13) != alt) {
    std::cerr << "tweak_store_tests: rollback not persisted\n";
    return false;
  }
  if (!reopened.Clear(&removed, &error) || removed != 14 || !reopened.Empty() ||
      reopened.BaseHeight()) {
    std::cerr << "tweak_store_tests: clear failed\n";
    return false;
  }
  // An empty store accepts any starting height.
  if (!AppendRange(&reopened, 900, 901) || reopened.BaseHeight() != 900u) {
    std::cerr << "tweak_store_tests: restart at new base failed\n";
    return false;
  }
  return true;
}

bool RunTornTailTest(const std::filesystem::path& dir) {
  std::string error;
  {
    storage::TweakStore store(dir);
    if (!store.Open(&error) || !AppendRange(&store, 1, 5)) return false;
  }
  const auto file = dir / "sps000000.dat";
  const auto size = std::filesystem::file_size(file);
  {
    std::ofstream out(file, std::ios::binary | std::ios::app);
    const char partial[] = {0x53, 0x50, 0x54, 0x57, 0x40, 0x00};
    out.write(partial, sizeof(partial));
  }
  {
    storage::TweakStore read_only(dir, /*read_only=*/true);
    if (!read_only.Open(&error) || read_only.TipHeight() != 5u ||
        std::filesystem::file_size(file) == size) {
      std::cerr << "tweak_store_tests: read-only open should tolerate torn tail untouched\n";
      return false;
    }
    if (read_only.AppendBlock(6, HashFor(6), {}, &error)) {
      std::cerr << "tweak_store_tests: read-only store accepted an append\n";
      return false;
    }
  }
  storage::TweakStore store(dir);
  if (!store.Open(&error) || store.TipHeight() != 5u || std::filesystem::file_size(file) != size) {
    std::cerr << "tweak_store_tests: torn tail not truncated: " << error << "\n";
    return false;
  }
  return AppendRange(&store, 6, 6);
}

}  // namespace

int main() {
  const auto root = std::filesystem::temp_directory_path() / "sps_tweak_store_tests";
  std::filesystem::remove_all(root);
  const bool ok = RunAppendReadReopenTest(root / "basic") && RunRollbackTest(root / "rollback") &&
                  RunTornTailTest(root / "torn");
  std::filesystem::remove_all(root);
  if (!ok) {
    return EXIT_FAILURE;
  }
  std::cout << "tweak_store_tests: OK\n";
  return EXIT_SUCCESS;
}
