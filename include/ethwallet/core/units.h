// ETHWALLET - Currency Units and Quantities
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// Conversions between human-readable amounts, decimal wei strings and
// 0x-prefixed hex quantities. Arithmetic is arbitrary precision (OpenSSL
// BIGNUM) so 256-bit values survive unchanged.

#ifndef ETHWALLET_CORE_UNITS_H
#define ETHWALLET_CORE_UNITS_H

#include "ethwallet/core/types.h"

#include <cstdint>
#include <string>

namespace ethwallet {

/// Marker address for the chain's native currency
constexpr const char* NATIVE_TOKEN_ADDRESS = "0xeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeee";

/// The zero address
constexpr const char* ADDRESS_ZERO = "0x0000000000000000000000000000000000000000";

/// Decimals of the native currency
constexpr int ETHER_DECIMALS = 18;

// ============================================================================
// Amount Conversions
// ============================================================================

/**
 * Convert a decimal amount ("1.5") to base units as a decimal string.
 * Exact: at most @p decimals fractional digits are accepted.
 * @throws std::invalid_argument on malformed or over-precise input
 */
std::string ParseUnits(const std::string& amount, int decimals);

/// ParseUnits with 18 decimals ("0.01" -> "10000000000000000")
std::string ToWei(const std::string& ether);

/**
 * Convert base units (decimal or 0x hex) to an exact decimal amount.
 * Trailing fractional zeros are removed ("1500000000000000000" -> "1.5").
 */
std::string FromWei(const std::string& wei, int decimals = ETHER_DECIMALS);

/**
 * Display formatting: round half-up to @p decimalsToDisplay fractional
 * digits, drop trailing zeros, optionally group the integer part with commas.
 */
std::string FormatUnits(const std::string& wei, int decimals,
                        int decimalsToDisplay = 4, bool addCommas = true);

/// FormatUnits with 18 decimals
std::string ToEth(const std::string& wei, int decimalsToDisplay = 4, bool addCommas = true);

// ============================================================================
// Quantity Encoding
// ============================================================================

/// Whether the string is a non-negative decimal or 0x hex integer
bool IsValidQuantity(const std::string& quantity);

/// "0x7b" -> "123"
std::string HexQuantityToDecimal(const std::string& hex);

/// "123" (or "0x7b") -> "0x7b"; zero is "0x0"
std::string DecimalToHexQuantity(const std::string& quantity);

/// Decimal or hex to decimal string
std::string NormalizeQuantity(const std::string& quantity);

/// Minimal big-endian bytes; zero encodes as empty
Bytes QuantityToBytes(const std::string& quantity);

/// @throws std::invalid_argument if the value exceeds 64 bits
uint64_t QuantityToUint64(const std::string& quantity);

/**
 * Encode an integer (decimal, optionally negative, or 0x hex) as a
 * 32-byte big-endian word, two's complement when signed.
 * @throws std::invalid_argument when outside the range of (u)int<bits>
 */
Bytes EncodeIntegerWord(const std::string& value, int bits, bool isSigned);

} // namespace ethwallet

#endif // ETHWALLET_CORE_UNITS_H
