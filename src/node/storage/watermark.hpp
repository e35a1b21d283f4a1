#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "primitives/hash.hpp"

namespace sps::storage {

// Highest block whose tweak data and payments are fully committed.
struct Watermark {
  std::uint32_t height{0};
  primitives::Hash256 hash{};

  bool operator==(const Watermark& other) const = default;
};

// watermark.dat: [magic u32][version u32][height u32][hash 32][SHA3-256 of the preceding bytes].
// Rewritten atomically; an absent file means nothing has been committed.
bool LoadWatermark(const std::filesystem::path& path, std::optional<Watermark>* out,
                   std::string* error);
bool SaveWatermark(const std::filesystem::path& path, const Watermark& watermark,
                   std::string* error);
bool ClearWatermark(const std::filesystem::path& path, std::string* error);

}  // namespace sps::storage
