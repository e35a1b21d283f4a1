#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace sps::storage {

// Append-only record framing shared by the on-disk stores:
//   [magic u32 LE][payload size u32 LE][SHA3-256(payload)][payload]
inline constexpr std::uint32_t kMaxRecordPayload = 64 * 1024 * 1024;
inline constexpr std::size_t kRecordHeaderSize = 4 + 4 + 32;

enum class RecordReadStatus {
  kOk,
  kEndOfFile,
  kTruncatedTail,
  kError,
};

RecordReadStatus ReadNextRecord(std::ifstream* in, std::uint32_t expected_magic,
                                std::vector<std::uint8_t>* payload,
                                std::uint64_t* out_record_bytes);

// Appends one record, flushes and fsyncs. On failure the file is truncated
// back to its previous size so no partial record is left behind.
bool AppendRecord(const std::filesystem::path& path, std::uint32_t magic,
                  const std::vector<std::uint8_t>& payload, std::uint64_t* out_offset,
                  std::string* error);

bool TruncateFile(const std::filesystem::path& path, std::uint64_t size, std::string* error);

}  // namespace sps::storage
