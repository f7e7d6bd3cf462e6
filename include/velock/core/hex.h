// VELOCK - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 VELOCK Developers
// MIT License

#ifndef VELOCK_CORE_HEX_H
#define VELOCK_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace velock {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to hex string
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

/// Convert hex string to bytes (throws std::invalid_argument on bad input)
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid hex
bool IsValidHex(const std::string& str);

/// Strip an optional "0x"/"0X" prefix
std::string StripHexPrefix(const std::string& str);

} // namespace velock

#endif // VELOCK_CORE_HEX_H
