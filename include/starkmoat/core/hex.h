// STARKMOAT - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 STARKMOAT Developers
// MIT License

#ifndef STARKMOAT_CORE_HEX_H
#define STARKMOAT_CORE_HEX_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace starkmoat {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to hex string (lowercase, no prefix)
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

template<size_t N>
std::string BytesToHex(const std::array<HexByte, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes. Throws std::invalid_argument on odd length
/// or non-hex characters.
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid hex (even length, non-empty)
bool IsValidHex(const std::string& str);

/// Remove a leading "0x" / "0X" if present
std::string StripHexPrefix(const std::string& str);

/// Abbreviate long hex values for display: first 8 chars, "...", last 6
std::string ShortHex(const std::string& value);

} // namespace starkmoat

#endif // STARKMOAT_CORE_HEX_H
