// ETHWALLET - Encrypted Key Storage
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// Web3 Secret Storage (V3) keystore for the single local account.
// Features:
// - scrypt key derivation (pbkdf2 documents are also accepted on decrypt)
// - AES-128-CTR encryption with a keccak256 MAC
// - One keystore file per profile at <datadir>/account.json
// - Device-identifier password fallback

#ifndef ETHWALLET_WALLET_KEYSTORE_H
#define ETHWALLET_WALLET_KEYSTORE_H

#include "ethwallet/core/json.h"
#include "ethwallet/core/types.h"
#include "ethwallet/crypto/keys.h"
#include "ethwallet/util/fs.h"

#include <cstdint>
#include <optional>
#include <utility>
#include <string>

namespace ethwallet {
namespace wallet {

// ============================================================================
// Constants
// ============================================================================

/// Keystore file name inside the data directory
constexpr const char* ACCOUNT_FILENAME = "account.json";

/// AES-128 key size (first half of the derived key)
constexpr size_t AES_KEY_SIZE = 16;

/// AES-CTR IV size
constexpr size_t AES_IV_SIZE = 16;

/// Salt size for key derivation
constexpr size_t SALT_SIZE = 32;

/// Derived key length
constexpr uint32_t KDF_DKLEN = 32;

/// scrypt work factors
struct ScryptParams {
    uint64_t n{262144};
    uint32_t r{1};
    uint32_t p{8};
};

// ============================================================================
// Local Account
// ============================================================================

/// In-memory credential of the local provider
struct LocalAccount {
    PrivateKey key;
    Address address;
    ChainId chainId{1};

    LocalAccount() = default;
    LocalAccount(PrivateKey k, ChainId chain)
        : key(std::move(k)), address(key.GetAddress()), chainId(chain) {}
};

// ============================================================================
// Keystore Manager
// ============================================================================

/**
 * Owns the keystore file of one profile.
 */
class KeystoreManager {
public:
    struct Options {
        /// Directory holding account.json
        std::string dataDir;

        /// KDF work factors for newly written documents
        ScryptParams scrypt;

        /// Password fallback; empty derives it from the machine
        std::string deviceId;
    };

    explicit KeystoreManager(Options options);

    /**
     * Resolve the local account.
     *
     * 1. A raw key (hex) is wrapped directly, no file I/O.
     * 2. An existing keystore is decrypted with the password, or with the
     *    device identifier when the password is empty.
     * 3. Otherwise a fresh key is generated, encrypted and persisted.
     *
     * @throws WalletError(IncorrectPassword) on MAC mismatch
     * @throws WalletError(InvalidArgument) on a malformed raw key or document
     * @throws WalletError(TransportFailure) if the file cannot be read or written
     */
    LocalAccount UnlockOrCreate(ChainId chainId, const std::string& password = "",
                                const std::optional<std::string>& rawKey = std::nullopt);

    /// Encrypt into a V3 document (embeds the KDF parameters used)
    JSONValue Encrypt(const PrivateKey& key, const std::string& password) const;

    /**
     * Decrypt a V3 document.
     * @throws WalletError(IncorrectPassword) on MAC mismatch
     * @throws WalletError(InvalidArgument) on a malformed document
     */
    PrivateKey Decrypt(const JSONValue& document, const std::string& password) const;
    PrivateKey Decrypt(const std::string& json, const std::string& password) const;

    /**
     * Serialize the account as a keystore for the user. An empty password
     * falls back to the device identifier.
     * @throws WalletError(NoLocalAccount) if account is null
     */
    std::string Export(const LocalAccount* account, const std::string& password) const;

    /// Remove the keystore file. Never throws; false if it could not be removed.
    bool Delete() noexcept;

    /// Whether account.json exists
    bool HasStoredAccount() const;

    /// <datadir>/account.json
    util::fs::Path GetAccountPath() const;

    /// Configured device id, else /etc/machine-id, else the hostname
    std::string GetDeviceIdentifier() const;

    const ScryptParams& GetScryptParams() const { return options_.scrypt; }

private:
    /// Password, or the device identifier when empty
    std::string ResolvePassword(const std::string& password) const;

    void Persist(const JSONValue& document) const;

    Options options_;
};

/// Machine identifier from /etc/machine-id, falling back to the hostname
std::string GetMachineIdentifier();

} // namespace wallet
} // namespace ethwallet

#endif // ETHWALLET_WALLET_KEYSTORE_H
