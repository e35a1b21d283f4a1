#include "primitives/serialize.hpp"

#include <algorithm>
#include <limits>

namespace sps::primitives::serialize {

namespace {

// Script execution fails above this size, so it bounds scriptSigs. Output
// scripts are never executed when created and carry no size limit.
constexpr std::size_t kMaxScriptSize = 10'000;
constexpr std::size_t kMaxWitnessItemSize = 4'000'000;
constexpr std::uint64_t kMaxWitnessItemsPerInput = 1'000;
constexpr std::uint64_t kMinInputBytes = 32 + 4 + 1 + 4;
constexpr std::uint64_t kMinOutputBytes = 8 + 1;

bool Require(const std::vector<std::uint8_t>& data, std::size_t offset, std::size_t needed) {
  return offset <= data.size() && needed <= data.size() - offset;
}

bool HasWitness(const CTransaction& tx) {
  for (const auto& in : tx.vin) {
    if (!in.witness_stack.empty()) return true;
  }
  return false;
}

void SerializeInputs(const CTransaction& tx, std::vector<std::uint8_t>* out) {
  WriteVarInt(out, tx.vin.size());
  for (const auto& in : tx.vin) {
    out->insert(out->end(), in.prevout.txid.begin(), in.prevout.txid.end());
    WriteUint32(out, in.prevout.index);
    WriteBytes(out, in.script_sig);
    WriteUint32(out, in.sequence);
  }
}

void SerializeOutputs(const CTransaction& tx, std::vector<std::uint8_t>* out) {
  WriteVarInt(out, tx.vout.size());
  for (const auto& out_tx : tx.vout) {
    WriteUint64(out, out_tx.value);
    WriteBytes(out, out_tx.script_pubkey);
  }
}

bool DeserializeInputs(const std::vector<std::uint8_t>& data, std::size_t* offset,
                       CTransaction* tx) {
  std::uint64_t count = 0;
  if (!ReadVarInt(data, offset, &count)) return false;
  const std::size_t remaining = data.size() - *offset;
  if (count > remaining / kMinInputBytes) return false;
  tx->vin.resize(static_cast<std::size_t>(count));
  for (auto& in : tx->vin) {
    if (!Require(data, *offset, in.prevout.txid.size())) return false;
    std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(*offset), in.prevout.txid.size(),
                in.prevout.txid.begin());
    *offset += in.prevout.txid.size();
    if (!ReadUint32(data, offset, &in.prevout.index)) return false;
    if (!ReadBytes(data, offset, &in.script_sig, kMaxScriptSize)) return false;
    if (!ReadUint32(data, offset, &in.sequence)) return false;
  }
  return true;
}

bool DeserializeOutputs(const std::vector<std::uint8_t>& data, std::size_t* offset,
                        CTransaction* tx) {
  std::uint64_t count = 0;
  if (!ReadVarInt(data, offset, &count)) return false;
  const std::size_t remaining = data.size() - *offset;
  if (count > remaining / kMinOutputBytes) return false;
  tx->vout.resize(static_cast<std::size_t>(count));
  for (auto& out_tx : tx->vout) {
    if (!ReadUint64(data, offset, &out_tx.value)) return false;
    if (!ReadBytes(data, offset, &out_tx.script_pubkey, data.size() - *offset)) return false;
  }
  return true;
}

}  // namespace

void WriteUint32(std::vector<std::uint8_t>* out, std::uint32_t value) {
  out->push_back(static_cast<std::uint8_t>(value & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
}

void WriteUint64(std::vector<std::uint8_t>* out, std::uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    out->push_back(static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF));
  }
}

void WriteUint32BE(std::vector<std::uint8_t>* out, std::uint32_t value) {
  out->push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
  out->push_back(static_cast<std::uint8_t>(value & 0xFF));
}

void WriteVarInt(std::vector<std::uint8_t>* out, std::uint64_t value) {
  if (value < 0xFD) {
    out->push_back(static_cast<std::uint8_t>(value));
  } else if (value <= 0xFFFF) {
    out->push_back(0xFD);
    out->push_back(static_cast<std::uint8_t>(value & 0xFFu));
    out->push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
  } else if (value <= 0xFFFFFFFF) {
    out->push_back(0xFE);
    WriteUint32(out, static_cast<std::uint32_t>(value));
  } else {
    out->push_back(0xFF);
    WriteUint64(out, value);
  }
}

void WriteBytes(std::vector<std::uint8_t>* out, const std::vector<std::uint8_t>& bytes) {
  WriteVarInt(out, bytes.size());
  out->insert(out->end(), bytes.begin(), bytes.end());
}

bool ReadUint32(const std::vector<std::uint8_t>& data, std::size_t* offset, std::uint32_t* value) {
  if (!Require(data, *offset, 4)) return false;
  *value = static_cast<std::uint32_t>(data[*offset]) |
           (static_cast<std::uint32_t>(data[*offset + 1]) << 8) |
           (static_cast<std::uint32_t>(data[*offset + 2]) << 16) |
           (static_cast<std::uint32_t>(data[*offset + 3]) << 24);
  *offset += 4;
  return true;
}

bool ReadUint64(const std::vector<std::uint8_t>& data, std::size_t* offset, std::uint64_t* value) {
  if (!Require(data, *offset, 8)) return false;
  std::uint64_t result = 0;
  for (int i = 0; i < 8; ++i) {
    result |= static_cast<std::uint64_t>(data[*offset + i]) << (8 * i);
  }
  *value = result;
  *offset += 8;
  return true;
}

bool ReadVarInt(const std::vector<std::uint8_t>& data, std::size_t* offset, std::uint64_t* value) {
  if (!Require(data, *offset, 1)) return false;
  const std::uint8_t prefix = data[(*offset)++];
  if (prefix < 0xFD) {
    *value = prefix;
    return true;
  }
  if (prefix == 0xFD) {
    if (!Require(data, *offset, 2)) return false;
    const std::uint64_t v16 = static_cast<std::uint64_t>(data[*offset]) |
                              (static_cast<std::uint64_t>(data[*offset + 1]) << 8);
    *offset += 2;
    if (v16 < 0xFD) {
      return false;
    }
    *value = v16;
    return true;
  }
  if (prefix == 0xFE) {
    std::uint32_t tmp = 0;
    if (!ReadUint32(data, offset, &tmp)) return false;
    if (tmp <= 0xFFFFu) {
      return false;
    }
    *value = tmp;
    return true;
  }
  std::uint64_t tmp = 0;
  if (!ReadUint64(data, offset, &tmp)) return false;
  if (tmp <= 0xFFFFFFFFULL) {
    return false;
  }
  *value = tmp;
  return true;
}

bool ReadBytes(const std::vector<std::uint8_t>& data, std::size_t* offset,
               std::vector<std::uint8_t>* bytes, std::size_t max_size) {
  std::uint64_t size = 0;
  if (!ReadVarInt(data, offset, &size) || size > max_size ||
      !Require(data, *offset, static_cast<std::size_t>(size))) {
    return false;
  }
  const auto begin = data.begin() + static_cast<std::ptrdiff_t>(*offset);
  bytes->assign(begin, begin + static_cast<std::ptrdiff_t>(size));
  *offset += static_cast<std::size_t>(size);
  return true;
}

void SerializeTransaction(const CTransaction& tx, std::vector<std::uint8_t>* out,
                          bool include_witness) {
  const bool has_witness = include_witness && HasWitness(tx);
  WriteUint32(out, tx.version);
  if (has_witness) {
    out->push_back(0x00);  // marker
    out->push_back(0x01);  // flag
  }
  SerializeInputs(tx, out);
  SerializeOutputs(tx, out);
  if (has_witness) {
    for (const auto& in : tx.vin) {
      WriteVarInt(out, in.witness_stack.size());
      for (const auto& item : in.witness_stack) {
        WriteBytes(out, item.data);
      }
    }
  }
  WriteUint32(out, tx.lock_time);
}

bool DeserializeTransaction(const std::vector<std::uint8_t>& data, std::size_t* offset,
                            CTransaction* tx) {
  std::size_t cursor = *offset;
  CTransaction out;
  if (!ReadUint32(data, &cursor, &out.version)) return false;
  bool has_witness = false;
  if (Require(data, cursor, 2) && data[cursor] == 0x00) {
    if (data[cursor + 1] != 0x01) {
      return false;
    }
    has_witness = true;
    cursor += 2;
  }
  if (!DeserializeInputs(data, &cursor, &out)) return false;
  if (has_witness && out.vin.empty()) return false;
  if (!DeserializeOutputs(data, &cursor, &out)) return false;
  if (has_witness) {
    bool any_items = false;
    for (auto& in : out.vin) {
      std::uint64_t items = 0;
      if (!ReadVarInt(data, &cursor, &items) || items > kMaxWitnessItemsPerInput) {
        return false;
      }
      in.witness_stack.resize(static_cast<std::size_t>(items));
      for (auto& item : in.witness_stack) {
        if (!ReadBytes(data, &cursor, &item.data, kMaxWitnessItemSize)) return false;
      }
      any_items = any_items || items > 0;
    }
    // BIP-144 forbids the extended encoding for witness-free transactions.
    if (!any_items) return false;
  }
  if (!ReadUint32(data, &cursor, &out.lock_time)) return false;
  *tx = std::move(out);
  *offset = cursor;
  return true;
}

}  // namespace sps::primitives::serialize
