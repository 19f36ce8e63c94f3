// ETHWALLET - Message Signing
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// Personal-message and EIP-712 signing through the active provider,
// plus signer recovery.

#ifndef ETHWALLET_SIGNING_SIGNER_H
#define ETHWALLET_SIGNING_SIGNER_H

#include "ethwallet/core/json.h"
#include "ethwallet/crypto/eip712.h"
#include "ethwallet/wallet/session.h"

#include <string>

namespace ethwallet {
namespace signing {

/**
 * Rewrite a typed-data document into the shape remote signers accept:
 * `message.uid` (base64) becomes 0x hex, and every other message field
 * becomes a string. Fields outside `message` are left as they are.
 *
 * @throws WalletError(InvalidArgument) if uid is not valid base64
 */
JSONValue NormalizeTypedDataForRemote(const eip712::TypedData& typedData);

/// String form of one message field for remote signers
std::string TypedValueToString(const JSONValue& value);

/**
 * Recover the checksummed address that personal-signed `message`.
 * @throws WalletError(InvalidArgument) on a malformed signature
 * @throws WalletError(SigningFailed) if no key recovers
 */
std::string RecoverAddress(const std::string& message, const std::string& signature);

class Signer {
public:
    explicit Signer(wallet::WalletSession& session) : session_(session) {}

    /// EIP-191 signature by the active provider's signer address
    std::string Sign(const std::string& message);

    /**
     * eth_signTypedData_v4 of a complete document. Local signers hash and
     * sign in-process; remote signers receive the normalized JSON.
     */
    std::string SignTypedData(const eip712::TypedData& typedData);

    /// Sign `message` under the types, primary type and domain of `typeDefinition`
    std::string SignTypedData(const JSONValue& message, const eip712::TypedData& typeDefinition);

private:
    wallet::WalletSession& session_;
};

} // namespace signing
} // namespace ethwallet

#endif // ETHWALLET_SIGNING_SIGNER_H
