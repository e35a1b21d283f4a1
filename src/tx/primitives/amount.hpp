#pragma once

#include <cstdint>

namespace sps::primitives {

using Amount = std::uint64_t;  // Satoshis.

inline constexpr Amount kSatoshisPerBitcoin = 100'000'000ULL;
inline constexpr Amount kMaxMoney = 21'000'000ULL * kSatoshisPerBitcoin;

inline constexpr bool MoneyRange(Amount value) noexcept { return value <= kMaxMoney; }

}  // namespace sps::primitives
