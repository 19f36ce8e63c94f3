// ETHWALLET - Transactions
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// Transaction requests and results exchanged with providers, plus the
// EIP-155 legacy transaction used by locally held keys.

#ifndef ETHWALLET_WALLET_TRANSACTION_H
#define ETHWALLET_WALLET_TRANSACTION_H

#include "ethwallet/core/json.h"
#include "ethwallet/core/types.h"
#include "ethwallet/crypto/keys.h"

#include <cstdint>
#include <optional>
#include <string>

namespace ethwallet {
namespace wallet {

// ============================================================================
// Transaction Request
// ============================================================================

/**
 * Caller-supplied transaction fields. Quantities are decimal or 0x hex
 * strings; empty means "not specified".
 */
struct TransactionRequest {
    std::string from;
    std::string to;
    std::string data;
    std::string value;
    std::string gasLimit;
    std::string gasPrice;

    /// JSON-RPC transaction object (hex quantities, empty fields omitted)
    /// @throws std::invalid_argument on a malformed quantity
    JSONValue ToRpcJSON() const;
};

// ============================================================================
// Transaction Result
// ============================================================================

/// Sentinels used when no receipt was observed
constexpr int64_t NO_TRANSACTION_INDEX = -1;
constexpr const char* NO_GAS_USED = "-1";
constexpr const char* NO_STATUS = "-1";

struct TransactionReceipt {
    std::string from;
    std::string to;
    int64_t transactionIndex{NO_TRANSACTION_INDEX};
    std::string gasUsed{NO_GAS_USED};
    std::string blockHash;
    std::string transactionHash;
};

/**
 * Outcome of a submitted transaction. `id` carries the receipt status
 * ("1" success, "0" reverted, "-1" unknown).
 */
struct TransactionResult {
    TransactionReceipt receipt;
    std::string id{NO_STATUS};

    bool IsSuccess() const { return id == "1"; }

    /// Map a node receipt object (or null) to a result; quantities become decimal
    static TransactionResult FromReceipt(const JSONValue& receipt);

    JSONValue ToJSON() const;

    /// Inverse of ToJSON; missing members keep their sentinels
    static TransactionResult FromJSON(const JSONValue& json);
};

// ============================================================================
// EIP-155 Legacy Transaction
// ============================================================================

/**
 * Pre-London transaction signed with replay protection.
 */
class LegacyTransaction {
public:
    uint64_t nonce{0};
    std::string gasPrice{"0"};          // decimal or hex
    std::string gasLimit{"21000"};      // decimal or hex
    std::optional<Address> to;          // nullopt for contract creation
    std::string value{"0"};             // decimal or hex wei
    Bytes data;
    ChainId chainId{1};

    /// Build from a request; `to` may be empty, quantities default to zero
    /// @throws std::invalid_argument on malformed fields
    static LegacyTransaction FromRequest(const TransactionRequest& request,
                                         uint64_t nonce, ChainId chainId);

    /// keccak256(rlp([nonce, gasPrice, gasLimit, to, value, data, chainId, 0, 0]))
    Hash256 SigningHash() const;

    /// rlp([..., v, r, s]) with v = recid + chainId * 2 + 35
    Bytes Serialize(const RecoverableSignature& sig) const;

    /// Sign and serialize
    /// @throws WalletError(SigningFailed) if the key cannot sign
    Bytes Sign(const PrivateKey& key) const;

private:
    std::vector<Bytes> EncodeFields() const;
};

} // namespace wallet
} // namespace ethwallet

#endif // ETHWALLET_WALLET_TRANSACTION_H
