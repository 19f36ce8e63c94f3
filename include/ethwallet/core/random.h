// ETHWALLET - Secure Random Number Generation Header
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// This file provides cryptographically secure random number generation
// using OS entropy sources.

#ifndef ETHWALLET_CORE_RANDOM_H
#define ETHWALLET_CORE_RANDOM_H

#include "ethwallet/core/types.h"
#include <cstdint>
#include <cstddef>
#include <string>

namespace ethwallet {

// ============================================================================
// Core Random Functions
// ============================================================================

/// Fill buffer with cryptographically secure random bytes
/// Uses OS entropy source (getrandom on Linux, arc4random on macOS/BSD)
/// @throws std::runtime_error if the OS source fails
void GetRandBytes(uint8_t* buf, size_t len);

/// Return a fresh buffer of random bytes
Bytes GetRandBytes(size_t len);

/// Generate random 64-bit unsigned integer
uint64_t GetRandUint64();

/// Generate random integer in range [0, max)
/// Uses rejection sampling to avoid modulo bias
uint64_t GetRandInt(uint64_t max);

// ============================================================================
// Identifiers
// ============================================================================

/// Default length of a sign-in nonce (EIP-4361 requires at least 8)
constexpr size_t DEFAULT_NONCE_LENGTH = 17;

/// Generate an alphanumeric nonce of the given length
std::string GenerateNonce(size_t length = DEFAULT_NONCE_LENGTH);

/// Generate a random RFC 4122 version 4 UUID in canonical lowercase form
std::string GenerateUUIDv4();

// ============================================================================
// Internal Entropy Functions (Platform-Specific)
// ============================================================================

namespace detail {

/// Get entropy from OS - implementation is platform-specific
/// Returns true on success, false on failure
bool GetOSEntropy(uint8_t* buf, size_t len);

} // namespace detail

} // namespace ethwallet

#endif // ETHWALLET_CORE_RANDOM_H
