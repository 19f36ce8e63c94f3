// ETHWALLET - Keccak-256 Hash Function
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// Keccak-256 with the original 0x01 domain padding, as used by Ethereum.
// This is NOT FIPS 202 SHA3-256 (which pads with 0x06).

#ifndef ETHWALLET_CRYPTO_KECCAK_H
#define ETHWALLET_CRYPTO_KECCAK_H

#include <cstdint>
#include <cstddef>
#include <string>
#include "ethwallet/core/types.h"

namespace ethwallet {

/// Keccak-256 hasher class
/// Provides incremental hashing in the same shape as the other hashers
class Keccak256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Sponge rate in bytes (1600 - 2*256 bits)
    static constexpr size_t RATE = 136;

    /// Default constructor - initializes to empty state
    Keccak256();

    /// Write data to the hasher
    /// @param data Pointer to input data
    /// @param len Length of input data
    /// @return Reference to this hasher (for chaining)
    Keccak256& Write(const Byte* data, size_t len);

    Keccak256& Write(const Bytes& data) { return Write(data.data(), data.size()); }

    /// Finalize the hash and write to output
    /// @param hash Pointer to output buffer (must be at least OUTPUT_SIZE bytes)
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    /// @return Reference to this hasher (for chaining)
    Keccak256& Reset();

private:
    /// Sponge state (25 x 64-bit lanes)
    uint64_t state_[25];

    /// Buffer for partial block
    Byte buffer_[RATE];

    /// Bytes currently buffered
    size_t bufferLen_;

    /// Absorb one full block into the state and permute
    void AbsorbBlock(const Byte block[RATE]);
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute Keccak-256 of data in a single call
Hash256 Keccak256Hash(const Byte* data, size_t len);

inline Hash256 Keccak256Hash(const Bytes& data) {
    return Keccak256Hash(data.data(), data.size());
}

/// Hash the raw bytes of a string (UTF-8 is hashed as-is)
inline Hash256 Keccak256Hash(const std::string& data) {
    return Keccak256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

} // namespace ethwallet

#endif // ETHWALLET_CRYPTO_KECCAK_H
