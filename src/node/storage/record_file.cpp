#include "storage/record_file.hpp"

#include <system_error>

#include "crypto/hash.hpp"
#include "util/atomic_file.hpp"

namespace sps::storage {

namespace {

bool ReadAll(std::ifstream* in, std::uint8_t* data, std::size_t len) {
  if (!in || !in->is_open()) return false;
  in->read(reinterpret_cast<char*>(data), static_cast<std::streamsize>(len));
  return in->good();
}

bool WriteAll(std::ofstream* out, const std::uint8_t* data, std::size_t len) {
  if (!out || !out->is_open()) return false;
  out->write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
  return out->good();
}

std::uint32_t DecodeU32LE(const std::uint8_t* data) {
  return static_cast<std::uint32_t>(data[0]) | (static_cast<std::uint32_t>(data[1]) << 8) |
         (static_cast<std::uint32_t>(data[2]) << 16) |
         (static_cast<std::uint32_t>(data[3]) << 24);
}

void EncodeU32LE(std::uint32_t value, std::uint8_t* out) {
  out[0] = static_cast<std::uint8_t>(value & 0xFFu);
  out[1] = static_cast<std::uint8_t>((value >> 8) & 0xFFu);
  out[2] = static_cast<std::uint8_t>((value >> 16) & 0xFFu);
  out[3] = static_cast<std::uint8_t>((value >> 24) & 0xFFu);
}

}  // namespace

RecordReadStatus ReadNextRecord(std::ifstream* in, std::uint32_t expected_magic,
                                std::vector<std::uint8_t>* payload,
                                std::uint64_t* out_record_bytes) {
  if (!in || !in->is_open()) {
    return RecordReadStatus::kError;
  }
  std::uint8_t header[8] = {0};
  in->read(reinterpret_cast<char*>(header), sizeof(header));
  if (in->gcount() == 0 && in->eof()) {
    return RecordReadStatus::kEndOfFile;
  }
  if (!in->good()) {
    // Crash during append left a partial header.
    return RecordReadStatus::kTruncatedTail;
  }
  const std::uint32_t magic = DecodeU32LE(header);
  const std::uint32_t size = DecodeU32LE(header + 4);
  if (magic != expected_magic || size > kMaxRecordPayload) {
    return RecordReadStatus::kError;
  }
  crypto::Sha3_256Hash expected{};
  if (!ReadAll(in, expected.data(), expected.size())) {
    return RecordReadStatus::kTruncatedTail;
  }
  std::vector<std::uint8_t> buffer(size);
  if (size > 0 && !ReadAll(in, buffer.data(), buffer.size())) {
    return RecordReadStatus::kTruncatedTail;
  }
  if (crypto::Sha3_256(buffer) != expected) {
    return RecordReadStatus::kError;
  }
  if (out_record_bytes) {
    *out_record_bytes = kRecordHeaderSize + static_cast<std::uint64_t>(size);
  }
  if (payload) {
    *payload = std::move(buffer);
  }
  return RecordReadStatus::kOk;
}

bool AppendRecord(const std::filesystem::path& path, std::uint32_t magic,
                  const std::vector<std::uint8_t>& payload, std::uint64_t* out_offset,
                  std::string* error) {
  if (payload.size() > kMaxRecordPayload) {
    if (error) *error = "record exceeds size cap";
    return false;
  }
  std::error_code ec;
  std::uint64_t size_before = 0;
  const bool existed = std::filesystem::exists(path, ec);
  if (existed) {
    size_before = static_cast<std::uint64_t>(std::filesystem::file_size(path, ec));
    if (ec) {
      if (error) *error = "failed to stat " + path.string() + ": " + ec.message();
      return false;
    }
  }
  const auto checksum = crypto::Sha3_256(payload);
  std::uint8_t header[8];
  EncodeU32LE(magic, header);
  EncodeU32LE(static_cast<std::uint32_t>(payload.size()), header + 4);

  bool ok = false;
  {
    std::ofstream out(path, std::ios::binary | std::ios::app);
    ok = out.is_open() && WriteAll(&out, header, sizeof(header)) &&
         WriteAll(&out, checksum.data(), checksum.size()) &&
         (payload.empty() || WriteAll(&out, payload.data(), payload.size()));
    if (ok) {
      out.flush();
      ok = out.good();
    }
  }
  if (ok) {
    ok = util::SyncPath(path, error);
  }
  if (!ok) {
    std::string truncate_error;
    if (!existed) {
      std::filesystem::remove(path, ec);
    }
    if (existed && !TruncateFile(path, size_before, &truncate_error)) {
      if (error) *error = "append failed and rollback failed: " + truncate_error;
    } else if (error && error->empty()) {
      *error = "failed to append record to " + path.string();
    }
    return false;
  }
  if (out_offset) {
    *out_offset = size_before;
  }
  return true;
}

bool TruncateFile(const std::filesystem::path& path, std::uint64_t size, std::string* error) {
  std::error_code ec;
  std::filesystem::resize_file(path, static_cast<std::uintmax_t>(size), ec);
  if (ec) {
    if (error) *error = "failed to truncate " + path.string() + ": " + ec.message();
    return false;
  }
  return util::SyncPath(path, error);
}

}  // namespace sps::storage
