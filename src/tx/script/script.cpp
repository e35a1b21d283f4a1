#include "script/script.hpp"

#include <algorithm>

namespace sps::script {

std::optional<WitnessProgram> ExtractWitnessProgram(std::span<const std::uint8_t> script) {
  if (script.size() < 4 || script.size() > 42) {
    return std::nullopt;
  }
  const std::uint8_t op = script[0];
  if (op != kOp0 && (op < kOp1 || op > kOp16)) {
    return std::nullopt;
  }
  if (static_cast<std::size_t>(script[1]) + 2 != script.size()) {
    return std::nullopt;
  }
  WitnessProgram out;
  out.version = op == kOp0 ? 0 : static_cast<int>(op - kOp1) + 1;
  out.program.assign(script.begin() + 2, script.end());
  return out;
}

bool IsPayToTaproot(std::span<const std::uint8_t> script) {
  return script.size() == 2 + kTaprootProgramSize && script[0] == kOp1 &&
         script[1] == kTaprootProgramSize;
}

bool IsPayToWitnessKeyHash(std::span<const std::uint8_t> script) {
  return script.size() == 2 + kKeyHashSize && script[0] == kOp0 && script[1] == kKeyHashSize;
}

bool IsPayToScriptHash(std::span<const std::uint8_t> script) {
  return script.size() == 23 && script[0] == kOpHash160 && script[1] == kKeyHashSize &&
         script[22] == kOpEqual;
}

bool IsPayToPubKeyHash(std::span<const std::uint8_t> script) {
  return script.size() == 25 && script[0] == kOpDup && script[1] == kOpHash160 &&
         script[2] == kKeyHashSize && script[23] == kOpEqualVerify && script[24] == kOpCheckSig;
}

std::optional<std::array<std::uint8_t, kTaprootProgramSize>> TaprootOutputKey(
    std::span<const std::uint8_t> script) {
  if (!IsPayToTaproot(script)) {
    return std::nullopt;
  }
  std::array<std::uint8_t, kTaprootProgramSize> key{};
  std::copy(script.begin() + 2, script.end(), key.begin());
  return key;
}

bool ParsePushes(std::span<const std::uint8_t> script,
                 std::vector<std::vector<std::uint8_t>>* pushes) {
  pushes->clear();
  std::size_t pos = 0;
  while (pos < script.size()) {
    const std::uint8_t op = script[pos++];
    std::size_t len = 0;
    if (op < kOpPushData1) {
      len = op;
    } else if (op == kOpPushData1) {
      if (pos + 1 > script.size()) return false;
      len = script[pos];
      pos += 1;
    } else if (op == kOpPushData2) {
      if (pos + 2 > script.size()) return false;
      len = static_cast<std::size_t>(script[pos]) |
            (static_cast<std::size_t>(script[pos + 1]) << 8);
      pos += 2;
    } else if (op == kOpPushData4) {
      if (pos + 4 > script.size()) return false;
      len = static_cast<std::size_t>(script[pos]) |
            (static_cast<std::size_t>(script[pos + 1]) << 8) |
            (static_cast<std::size_t>(script[pos + 2]) << 16) |
            (static_cast<std::size_t>(script[pos + 3]) << 24);
      pos += 4;
    } else {
      pushes->emplace_back();
      continue;
    }
    if (len > script.size() - pos) return false;
    pushes->emplace_back(script.begin() + static_cast<std::ptrdiff_t>(pos),
                         script.begin() + static_cast<std::ptrdiff_t>(pos + len));
    pos += len;
  }
  return true;
}

std::vector<std::uint8_t> BuildPayToTaproot(std::span<const std::uint8_t> output_key) {
  std::vector<std::uint8_t> out{kOp1, static_cast<std::uint8_t>(output_key.size())};
  out.insert(out.end(), output_key.begin(), output_key.end());
  return out;
}

std::vector<std::uint8_t> BuildPayToPubKeyHash(std::span<const std::uint8_t> key_hash) {
  std::vector<std::uint8_t> out{kOpDup, kOpHash160, static_cast<std::uint8_t>(key_hash.size())};
  out.insert(out.end(), key_hash.begin(), key_hash.end());
  out.push_back(kOpEqualVerify);
  out.push_back(kOpCheckSig);
  return out;
}

std::vector<std::uint8_t> BuildPayToWitnessKeyHash(std::span<const std::uint8_t> key_hash) {
  std::vector<std::uint8_t> out{kOp0, static_cast<std::uint8_t>(key_hash.size())};
  out.insert(out.end(), key_hash.begin(), key_hash.end());
  return out;
}

std::vector<std::uint8_t> BuildPayToScriptHash(std::span<const std::uint8_t> script_hash) {
  std::vector<std::uint8_t> out{kOpHash160, static_cast<std::uint8_t>(script_hash.size())};
  out.insert(out.end(), script_hash.begin(), script_hash.end());
  out.push_back(kOpEqual);
  return out;
}

}  // namespace sps::script
