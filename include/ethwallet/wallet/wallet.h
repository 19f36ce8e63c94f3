// ETHWALLET - Wallet Facade
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// Single entry point bundling the session, signer, authenticator and
// dispatcher. When the session is bridged, operations that the host
// implements itself (login, verify, recovery) are forwarded as routes.

#ifndef ETHWALLET_WALLET_WALLET_H
#define ETHWALLET_WALLET_WALLET_H

#include "ethwallet/auth/authenticator.h"
#include "ethwallet/auth/siwe.h"
#include "ethwallet/crypto/eip712.h"
#include "ethwallet/dispatch/dispatcher.h"
#include "ethwallet/signing/signer.h"
#include "ethwallet/wallet/keystore.h"
#include "ethwallet/wallet/provider.h"
#include "ethwallet/wallet/session.h"

#include <memory>
#include <string>
#include <vector>

namespace ethwallet {
namespace wallet {

class Wallet {
public:
    /**
     * @param session Session to operate on
     * @param registry Sign-in registry, null admits everyone
     * @param tokens Token collaborator; defaults to the bridge routes when bridged
     * @param authOptions Sign-in challenge settings
     */
    explicit Wallet(std::shared_ptr<WalletSession> session,
                    auth::UserRegistryPtr registry = nullptr,
                    dispatch::TokenTransferPtr tokens = nullptr,
                    auth::Authenticator::Options authOptions = auth::Authenticator::Options());

    // ========================================================================
    // Connection
    // ========================================================================

    std::string Connect(const WalletConnection& connection);
    void Disconnect();
    bool IsConnected() const noexcept;

    std::string GetAddress() const;
    std::string GetSignerAddress() const;
    ChainId GetChainId();

    // ========================================================================
    // Authentication
    // ========================================================================

    auth::LoginPayload Authenticate(const std::string& domain);
    auth::VerifyResult Verify(const auth::LoginPayload& payload);

    // ========================================================================
    // Signing
    // ========================================================================

    std::string Sign(const std::string& message);
    std::string SignTypedData(const eip712::TypedData& typedData);
    std::string SignTypedData(const JSONValue& message, const eip712::TypedData& typeDefinition);
    std::string RecoverAddress(const std::string& message, const std::string& signature);

    // ========================================================================
    // Value
    // ========================================================================

    /// Balance of the connected account in the given currency
    CurrencyValue GetBalance(const std::string& currencyAddress = NATIVE_TOKEN_ADDRESS);

    TransactionResult Transfer(const std::string& to, const std::string& amount,
                               const std::string& currencyAddress = NATIVE_TOKEN_ADDRESS);
    TransactionResult SendRawTransaction(const TransactionRequest& request);

    void SwitchNetwork(ChainId chainId);
    void FundWallet(const FundWalletOptions& options);

    // ========================================================================
    // Local Account
    // ========================================================================

    /**
     * V3 keystore JSON of the local account. An empty password falls back
     * to the device identifier.
     * @throws WalletError(NoLocalAccount) unless the active signer is local
     */
    std::string Export(const std::string& password);

    /// Remove the stored keystore; false if it could not be removed
    bool DeleteLocalAccount();

    /// Fresh key, not persisted
    static LocalAccount GenerateRandomAccount(ChainId chainId = 1);

    // ========================================================================
    // Components
    // ========================================================================

    WalletSession& GetSession() { return *session_; }
    signing::Signer& GetSigner() { return signer_; }
    auth::Authenticator& GetAuthenticator() { return authenticator_; }
    dispatch::Dispatcher& GetDispatcher() { return dispatcher_; }

private:
    /// Bridge of a bridged session, else nullptr
    IBridge* Bridge() const;

    /// Route call on the bridge; requires a connection
    JSONValue InvokeRoute(const std::string& route, const std::vector<std::string>& args);

    KeystoreManager Keystore() const;

    std::shared_ptr<WalletSession> session_;
    dispatch::TokenTransferPtr tokens_;
    signing::Signer signer_;
    auth::Authenticator authenticator_;
    dispatch::Dispatcher dispatcher_;
};

} // namespace wallet
} // namespace ethwallet

#endif // ETHWALLET_WALLET_WALLET_H
