// STAKELEDGER - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#ifndef STAKELEDGER_CORE_HEX_H
#define STAKELEDGER_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace stakeledger {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to lowercase hex string
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

/// Convert hex string to bytes (throws std::invalid_argument)
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid, non-empty, even-length hex
bool IsValidHex(const std::string& str);

/// Strip an optional "0x"/"0X" prefix
std::string StripHexPrefix(const std::string& str);

} // namespace stakeledger

#endif // STAKELEDGER_CORE_HEX_H
