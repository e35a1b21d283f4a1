#include "storage/watermark.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>
#include <vector>

#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"
#include "util/atomic_file.hpp"

namespace sps::storage {

namespace {

constexpr std::uint32_t kWatermarkMagic = 0x4D575053;  // 'SPWM' (little-endian uint32)
constexpr std::uint32_t kWatermarkVersion = 1;
constexpr std::size_t kBodySize = 4 + 4 + 4 + 32;
constexpr std::size_t kFileSize = kBodySize + 32;

}  // namespace

bool LoadWatermark(const std::filesystem::path& path, std::optional<Watermark>* out,
                   std::string* error) {
  out->reset();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return true;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    if (error) *error = "failed to open " + path.string();
    return false;
  }
  std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(in)),
                                 std::istreambuf_iterator<char>());
  if (data.size() != kFileSize) {
    if (error) *error = path.string() + ": unexpected size";
    return false;
  }
  const auto checksum =
      crypto::Sha3_256(std::span<const std::uint8_t>(data.data(), kBodySize));
  if (!std::equal(checksum.begin(), checksum.end(), data.begin() + kBodySize)) {
    if (error) *error = path.string() + ": checksum mismatch";
    return false;
  }
  std::size_t offset = 0;
  std::uint32_t magic = 0;
  std::uint32_t version = 0;
  Watermark watermark;
  primitives::serialize::ReadUint32(data, &offset, &magic);
  primitives::serialize::ReadUint32(data, &offset, &version);
  primitives::serialize::ReadUint32(data, &offset, &watermark.height);
  if (magic != kWatermarkMagic || version != kWatermarkVersion) {
    if (error) *error = path.string() + ": unsupported watermark format";
    return false;
  }
  std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset), watermark.hash.size(),
              watermark.hash.begin());
  *out = watermark;
  return true;
}

bool SaveWatermark(const std::filesystem::path& path, const Watermark& watermark,
                   std::string* error) {
  std::vector<std::uint8_t> data;
  data.reserve(kFileSize);
  primitives::serialize::WriteUint32(&data, kWatermarkMagic);
  primitives::serialize::WriteUint32(&data, kWatermarkVersion);
  primitives::serialize::WriteUint32(&data, watermark.height);
  data.insert(data.end(), watermark.hash.begin(), watermark.hash.end());
  const auto checksum = crypto::Sha3_256(data);
  data.insert(data.end(), checksum.begin(), checksum.end());
  return util::AtomicWriteFileBytes(path, data, error);
}

bool ClearWatermark(const std::filesystem::path& path, std::string* error) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    if (error) *error = "failed to remove " + path.string() + ": " + ec.message();
    return false;
  }
  return util::SyncPath(path.parent_path().empty() ? "." : path.parent_path(), error);
}

}  // namespace sps::storage
