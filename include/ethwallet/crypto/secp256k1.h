// ETHWALLET - secp256k1 Elliptic Curve Operations
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// Recoverable ECDSA over secp256k1, backed by OpenSSL libcrypto.
// Public keys are 65-byte uncompressed (04 || x || y). Signatures are
// 64-byte r || s with a separate recovery id.

#ifndef ETHWALLET_CRYPTO_SECP256K1_H
#define ETHWALLET_CRYPTO_SECP256K1_H

#include <array>
#include <cstddef>
#include <cstdint>

namespace ethwallet {
namespace secp256k1 {

// ============================================================================
// Constants
// ============================================================================

/// Private key size
constexpr size_t PRIVATE_KEY_SIZE = 32;

/// Uncompressed public key size
constexpr size_t PUBLIC_KEY_SIZE = 65;

/// r || s signature size
constexpr size_t SIGNATURE_SIZE = 64;

/// Curve order n
extern const std::array<uint8_t, 32> CURVE_ORDER;

/// Half the curve order (n / 2), the low-s bound
extern const std::array<uint8_t, 32> HALF_CURVE_ORDER;

// ============================================================================
// Key Operations
// ============================================================================

/**
 * Verify that a scalar is a valid private key.
 * Must be in range [1, n-1].
 */
bool IsValidPrivateKey(const uint8_t* key);

/**
 * Compute the uncompressed public key d*G.
 *
 * @param privateKey 32-byte private key
 * @param publicKey Output: 65-byte uncompressed key
 * @return false if the key is out of range or OpenSSL fails
 */
bool DerivePublicKey(const uint8_t* privateKey, uint8_t publicKey[PUBLIC_KEY_SIZE]);

// ============================================================================
// Recoverable ECDSA
// ============================================================================

/**
 * Sign a 32-byte hash. The signature is normalized to low-s and the
 * recovery id is found by trial recovery against the signer's key.
 *
 * @param hash 32-byte message hash
 * @param privateKey 32-byte private key
 * @param signature Output: r || s
 * @param recid Output: recovery id in [0, 3]
 * @return true if successful
 */
bool SignRecoverable(const uint8_t* hash, const uint8_t* privateKey,
                     uint8_t signature[SIGNATURE_SIZE], int* recid);

/**
 * Recover the public key from a signature and recovery id.
 *
 * @param hash 32-byte message hash
 * @param signature r || s
 * @param recid Recovery id in [0, 3]
 * @param publicKey Output: 65-byte uncompressed key
 * @return false if r or s is out of range or no point exists
 */
bool RecoverPublicKey(const uint8_t* hash, const uint8_t signature[SIGNATURE_SIZE],
                      int recid, uint8_t publicKey[PUBLIC_KEY_SIZE]);

} // namespace secp256k1
} // namespace ethwallet

#endif // ETHWALLET_CRYPTO_SECP256K1_H
