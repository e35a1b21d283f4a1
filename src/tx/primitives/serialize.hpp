#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "primitives/transaction.hpp"

namespace sps::primitives::serialize {

void WriteUint32(std::vector<std::uint8_t>* out, std::uint32_t value);
void WriteUint64(std::vector<std::uint8_t>* out, std::uint64_t value);
// Big-endian, as used by BIP-352's ser32.
void WriteUint32BE(std::vector<std::uint8_t>* out, std::uint32_t value);
void WriteVarInt(std::vector<std::uint8_t>* out, std::uint64_t value);
void WriteBytes(std::vector<std::uint8_t>* out, const std::vector<std::uint8_t>& bytes);
bool ReadUint32(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint32_t* value);
bool ReadUint64(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint64_t* value);
bool ReadVarInt(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint64_t* value);
// Length-prefixed byte string, bounded by `max_size`.
bool ReadBytes(const std::vector<std::uint8_t>& data, std::size_t* offset,
               std::vector<std::uint8_t>* bytes, std::size_t max_size);

// Bitcoin wire encoding (BIP-144 when witness data is present). The
// prevout scriptPubKeys carried on CTxIn are not part of the encoding.
void SerializeTransaction(const CTransaction& tx, std::vector<std::uint8_t>* out,
                          bool include_witness = true);
bool DeserializeTransaction(const std::vector<std::uint8_t>& data, std::size_t* offset,
                            CTransaction* tx);

}  // namespace sps::primitives::serialize
