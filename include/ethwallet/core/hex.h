// ETHWALLET - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#ifndef ETHWALLET_CORE_HEX_H
#define ETHWALLET_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <array>
#include <stdexcept>

namespace ethwallet {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to lowercase hex string (no prefix)
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

template<size_t N>
std::string BytesToHex(const std::array<HexByte, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes. An optional "0x" prefix is accepted.
/// @throws std::invalid_argument on odd length or non-hex characters
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid, even-length hex (prefix not allowed)
bool IsValidHex(const std::string& str);

// ============================================================================
// 0x-Prefixed Helpers
// ============================================================================

/// True if the string starts with "0x" or "0X"
bool HasHexPrefix(const std::string& str);

/// Remove a leading "0x"/"0X" if present
std::string StripHexPrefix(const std::string& str);

/// Encode bytes as "0x"-prefixed lowercase hex
std::string ToHexPrefixed(const HexByte* data, size_t len);
std::string ToHexPrefixed(const std::vector<HexByte>& data);

/// Concatenate several "0x"-prefixed hex strings into one
std::string HexConcat(const std::vector<std::string>& parts);

} // namespace ethwallet

#endif // ETHWALLET_CORE_HEX_H
