#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sps::util {

std::string HexEncode(std::span<const std::uint8_t> data);
bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out);
// Decodes exactly `out.size()` bytes; fails on any length mismatch.
bool HexDecodeInto(std::string_view hex, std::span<std::uint8_t> out);

}  // namespace sps::util
