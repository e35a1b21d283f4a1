#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace sps::crypto {

// SEC1 compressed point (0x02/0x03 || x).
using PubKey = std::array<std::uint8_t, 33>;
// BIP-340 x-only key; the implied point has even Y.
using XOnlyKey = std::array<std::uint8_t, 32>;
// Big-endian integer modulo the secp256k1 group order.
using Scalar = std::array<std::uint8_t, 32>;

// All operations are thin wrappers over libsecp256k1 and report failure by
// returning false: unparsable inputs, out-of-range scalars, or a result that
// would be the point at infinity (or the zero scalar).

bool IsValidPubKey(const PubKey& key);
bool IsValidScalar(const Scalar& scalar);

bool PubKeyFromScalar(const Scalar& secret, PubKey* out);
bool NegateScalar(const Scalar& scalar, Scalar* out);
bool AddScalars(const Scalar& a, const Scalar& b, Scalar* out);
bool MultiplyScalars(const Scalar& a, const Scalar& b, Scalar* out);

// `*is_infinity` is set when every key parsed but the sum is the identity.
bool SumPubKeys(std::span<const PubKey> keys, PubKey* out, bool* is_infinity);
bool AddPoints(const PubKey& a, const PubKey& b, PubKey* out);
bool SubtractPoints(const PubKey& a, const PubKey& b, PubKey* out);
bool NegatePoint(const PubKey& point, PubKey* out);
// scalar * point
bool MultiplyPoint(const PubKey& point, const Scalar& scalar, PubKey* out);
// point + tweak * G
bool AddTweakToPoint(const PubKey& point, const Scalar& tweak, PubKey* out);

// BIP-340 tagged hash: SHA256(SHA256(tag) || SHA256(tag) || msg).
Scalar TaggedHash(std::string_view tag, std::span<const std::uint8_t> msg);

XOnlyKey ToXOnly(const PubKey& key);
// 0x02 || x. Does not check that x is on the curve.
PubKey EvenYFromXOnly(const XOnlyKey& x);

}  // namespace sps::crypto
