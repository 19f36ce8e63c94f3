// ETHWALLET - Core Types Header
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// This file defines fundamental types used throughout ETHWALLET.

#ifndef ETHWALLET_CORE_TYPES_H
#define ETHWALLET_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>

namespace ethwallet {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Owned byte buffer
using Bytes = std::vector<Byte>;

/// Timestamp (Unix epoch milliseconds)
using TimestampMs = int64_t;

/// Chain identifier (EIP-155)
using ChainId = uint64_t;

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size big-endian byte string (hashes, addresses)
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (shorter input is zero-padded on the right)
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }

    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /// Size in bytes
    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Convert to lowercase hex, "0x"-prefixed, in storage order
    std::string ToHex() const;

    /// Parse from hex (optional "0x" prefix), throws std::invalid_argument
    static BaseHash FromHex(const std::string& hex);

    /// Copy out as a byte vector
    Bytes ToBytes() const { return Bytes(begin(), end()); }

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& other) : BaseHash<256>(other) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/// 160-bit value (20 bytes) - account addresses
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    Hash160(const BaseHash<160>& other) : BaseHash<160>(other) {}

    static Hash160 FromHex(const std::string& hex) {
        return Hash160(BaseHash<160>::FromHex(hex));
    }
};

} // namespace ethwallet

#endif // ETHWALLET_CORE_TYPES_H
