#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace sps::script {

inline constexpr std::uint8_t kOp0 = 0x00;
inline constexpr std::uint8_t kOpPushData1 = 0x4c;
inline constexpr std::uint8_t kOpPushData2 = 0x4d;
inline constexpr std::uint8_t kOpPushData4 = 0x4e;
inline constexpr std::uint8_t kOp1 = 0x51;
inline constexpr std::uint8_t kOp16 = 0x60;
inline constexpr std::uint8_t kOpDup = 0x76;
inline constexpr std::uint8_t kOpEqual = 0x87;
inline constexpr std::uint8_t kOpEqualVerify = 0x88;
inline constexpr std::uint8_t kOpHash160 = 0xa9;
inline constexpr std::uint8_t kOpCheckSig = 0xac;
inline constexpr std::uint8_t kTaprootAnnexTag = 0x50;

inline constexpr std::size_t kTaprootProgramSize = 32;
inline constexpr std::size_t kKeyHashSize = 20;

struct WitnessProgram {
  int version{0};
  std::vector<std::uint8_t> program;
};

// OP_n <2..40 bytes>; returns nullopt for anything else.
std::optional<WitnessProgram> ExtractWitnessProgram(std::span<const std::uint8_t> script);

bool IsPayToTaproot(std::span<const std::uint8_t> script);
bool IsPayToWitnessKeyHash(std::span<const std::uint8_t> script);
bool IsPayToScriptHash(std::span<const std::uint8_t> script);
bool IsPayToPubKeyHash(std::span<const std::uint8_t> script);

// Output key of a P2TR script, or nullopt.
std::optional<std::array<std::uint8_t, kTaprootProgramSize>> TaprootOutputKey(
    std::span<const std::uint8_t> script);

// Splits a script into its data pushes. Returns false on a truncated push;
// non-push opcodes are reported as empty entries.
bool ParsePushes(std::span<const std::uint8_t> script,
                 std::vector<std::vector<std::uint8_t>>* pushes);

// OP_1 <32-byte key>
std::vector<std::uint8_t> BuildPayToTaproot(std::span<const std::uint8_t> output_key);
// OP_DUP OP_HASH160 <20> OP_EQUALVERIFY OP_CHECKSIG
std::vector<std::uint8_t> BuildPayToPubKeyHash(std::span<const std::uint8_t> key_hash);
// OP_0 <20>
std::vector<std::uint8_t> BuildPayToWitnessKeyHash(std::span<const std::uint8_t> key_hash);
// OP_HASH160 <20> OP_EQUAL
std::vector<std::uint8_t> BuildPayToScriptHash(std::span<const std::uint8_t> script_hash);

}  // namespace sps::script
