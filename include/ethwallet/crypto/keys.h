// ETHWALLET - Keys, Addresses and Signatures
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// Ethereum account primitives built on secp256k1 and Keccak-256:
//   - PrivateKey: 32-byte scalar, wiped on destruction
//   - PublicKey: 65-byte uncompressed point
//   - Address: last 20 bytes of keccak256(pubkey x || y), EIP-55 formatting
//   - RecoverableSignature: r || s || v with v = 27 + recid

#ifndef ETHWALLET_CRYPTO_KEYS_H
#define ETHWALLET_CRYPTO_KEYS_H

#include "ethwallet/core/types.h"
#include "ethwallet/crypto/secp256k1.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ethwallet {

class PublicKey;
class Address;

// ============================================================================
// Recoverable Signature
// ============================================================================

/**
 * 65-byte Ethereum signature.
 */
struct RecoverableSignature {
    static constexpr size_t SIZE = 65;

    std::array<Byte, 32> r{};
    std::array<Byte, 32> s{};
    /// Recovery id in [0, 3]
    int recid{0};

    /// Legacy v value (27 or 28 for the common case)
    Byte V() const { return static_cast<Byte>(27 + recid); }

    /// Serialize as r || s || v
    Bytes ToBytes() const;

    /// 0x-prefixed hex of ToBytes()
    std::string ToHex() const;

    /// Parse r || s || v, accepting v in {0, 1, 27, 28}
    static std::optional<RecoverableSignature> FromBytes(const Byte* data, size_t len);
    static std::optional<RecoverableSignature> FromBytes(const Bytes& data) {
        return FromBytes(data.data(), data.size());
    }

    /// Parse hex (with or without 0x)
    static std::optional<RecoverableSignature> FromHex(const std::string& hex);

    bool operator==(const RecoverableSignature& other) const {
        return r == other.r && s == other.s && recid == other.recid;
    }
};

// ============================================================================
// Address
// ============================================================================

/**
 * 20-byte account address.
 */
class Address {
public:
    static constexpr size_t SIZE = 20;

    /// Default constructor - zero address
    Address() = default;

    /// Construct from 20 raw bytes
    explicit Address(const Byte* data) : hash_(data, SIZE) {}
    explicit Address(const Hash160& hash) : hash_(hash) {}

    /// Derive from a public key
    static Address FromPublicKey(const PublicKey& pubkey);

    /**
     * Parse "0x" + 40 hex digits (prefix optional). All-lowercase and
     * all-uppercase inputs are accepted as-is; mixed case must match the
     * EIP-55 checksum.
     */
    static std::optional<Address> FromString(const std::string& str);

    /// Like FromString, throws std::invalid_argument on failure
    static Address Parse(const std::string& str);

    /// EIP-55 mixed-case form
    std::string ToChecksumString() const;

    /// 0x-prefixed lowercase form
    std::string ToLowerHex() const { return hash_.ToHex(); }

    bool IsZero() const { return hash_.IsNull(); }

    const Byte* data() const { return hash_.data(); }
    Bytes ToBytes() const { return hash_.ToBytes(); }

    bool operator==(const Address& other) const { return hash_ == other.hash_; }
    bool operator!=(const Address& other) const { return hash_ != other.hash_; }
    bool operator<(const Address& other) const { return hash_ < other.hash_; }

private:
    Hash160 hash_;
};

/// Whether the string parses as an address (see Address::FromString)
bool IsValidAddress(const std::string& str);

/// Normalize an address string to EIP-55 form
/// @throws std::invalid_argument if malformed
std::string ToChecksumAddress(const std::string& address);

/// Case-insensitive address comparison; false if either is malformed
bool AddressEquals(const std::string& a, const std::string& b);

/// "0x1234...abcd" display form
/// @throws std::invalid_argument unless the input is 42 characters
std::string ShortenAddress(const std::string& address);

// ============================================================================
// Public Key
// ============================================================================

/**
 * Uncompressed secp256k1 public key.
 */
class PublicKey {
public:
    static constexpr size_t SIZE = secp256k1::PUBLIC_KEY_SIZE;

    /// Default constructor - invalid/empty key
    PublicKey() { data_.fill(0); }

    /// Construct from 65 uncompressed bytes
    explicit PublicKey(const Byte* data, size_t len);

    /// Check that the key is a well-formed uncompressed point encoding
    bool IsValid() const { return valid_; }

    const Byte* data() const { return data_.data(); }
    Bytes ToBytes() const { return Bytes(data_.begin(), data_.end()); }
    std::string ToHex() const;

    /// Derived account address
    Address GetAddress() const { return Address::FromPublicKey(*this); }

    /// Recover the signer's key from a hash and signature
    static std::optional<PublicKey> Recover(const Hash256& hash, const RecoverableSignature& sig);

    bool operator==(const PublicKey& other) const {
        return valid_ == other.valid_ && data_ == other.data_;
    }
    bool operator!=(const PublicKey& other) const { return !(*this == other); }

private:
    std::array<Byte, SIZE> data_;
    bool valid_{false};
};

// ============================================================================
// Private Key
// ============================================================================

/**
 * secp256k1 private key. Key material is cleansed on destruction.
 */
class PrivateKey {
public:
    /// Size in bytes
    static constexpr size_t SIZE = secp256k1::PRIVATE_KEY_SIZE;

    /// Default constructor - invalid key
    PrivateKey() { data_.fill(0); }

    /// Construct from raw 32 bytes
    explicit PrivateKey(const Byte* data);

    /// Construct from vector (must be 32 bytes)
    explicit PrivateKey(const Bytes& data);

    /// Destructor - securely clear memory
    ~PrivateKey();

    PrivateKey(PrivateKey&& other) noexcept;
    PrivateKey& operator=(PrivateKey&& other) noexcept;
    PrivateKey(const PrivateKey& other);
    PrivateKey& operator=(const PrivateKey& other);

    /// Generate a new random private key
    static PrivateKey Generate();

    /// Parse from hex (with or without 0x)
    static std::optional<PrivateKey> FromHex(const std::string& hex);

    /// Check if key is in [1, n-1]
    bool IsValid() const { return valid_; }

    /// Get raw data (const only)
    const Byte* data() const { return data_.data(); }

    static constexpr size_t size() { return SIZE; }

    /// Derive public key (invalid key if this key is invalid)
    PublicKey GetPublicKey() const;

    /// Derived account address
    Address GetAddress() const { return GetPublicKey().GetAddress(); }

    /// Sign a 32-byte hash
    std::optional<RecoverableSignature> Sign(const Hash256& hash) const;

    /// Convert to 0x hex (use with caution!)
    std::string ToHex() const;

    /// Clear and invalidate the key
    void Clear();

private:
    std::array<Byte, SIZE> data_;
    bool valid_{false};
};

// ============================================================================
// Personal Messages
// ============================================================================

/// keccak256("\x19Ethereum Signed Message:\n" + len(message) + message)
/// The length is the UTF-8 byte count.
Hash256 HashPersonalMessage(const std::string& message);
Hash256 HashPersonalMessage(const Bytes& message);

} // namespace ethwallet

#endif // ETHWALLET_CRYPTO_KEYS_H
