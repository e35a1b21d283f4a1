#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace sps::crypto {

using Sha3_256Hash = std::array<std::uint8_t, 32>;
using Sha256Hash = std::array<std::uint8_t, 32>;
using Hash160 = std::array<std::uint8_t, 20>;

// SHA3-256, used for integrity checksums on persisted records.
Sha3_256Hash Sha3_256(std::span<const std::uint8_t> data);

Sha256Hash Sha256(std::span<const std::uint8_t> data);
Sha256Hash DoubleSha256(std::span<const std::uint8_t> data);
// RIPEMD160(SHA256(data)), as committed to by P2PKH and P2WPKH scripts.
Hash160 ComputeHash160(std::span<const std::uint8_t> data);

}  // namespace sps::crypto
