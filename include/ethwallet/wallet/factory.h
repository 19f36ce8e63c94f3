// ETHWALLET - Provider Factory
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#ifndef ETHWALLET_WALLET_FACTORY_H
#define ETHWALLET_WALLET_FACTORY_H

#include "ethwallet/wallet/bridge_provider.h"
#include "ethwallet/wallet/keystore.h"
#include "ethwallet/wallet/provider.h"
#include "ethwallet/wallet/smart_provider.h"

#include <map>
#include <memory>

namespace ethwallet {
namespace wallet {

/// Collaborators the variants are built from
struct ProviderDependencies {
    /// Keystore location and work factors for LocalWallet
    KeystoreManager::Options keystore;

    rpc::ReceiptPoller::Config receiptPolling;

    /// Signer channel per external provider kind
    std::map<WalletProvider, rpc::RpcTransportPtr> signerChannels;

    /// Account backend for SmartWallet
    SmartAccountBackendPtr smartAccountBackend;

    /// When set, every connection goes through the bridge
    BridgePtr bridge;
};

/**
 * Builds the provider variant for a connection.
 */
class ProviderFactory {
public:
    explicit ProviderFactory(ProviderDependencies deps);
    virtual ~ProviderFactory() = default;

    /**
     * @throws WalletError(UnsupportedOnPlatform) if the kind has no collaborator
     * @throws WalletError(InvalidArgument) for a smart wallet signed by a smart wallet
     */
    virtual WalletProviderPtr Create(const WalletConnection& connection) const;

    bool HasBridge() const { return deps_.bridge != nullptr; }
    const ProviderDependencies& GetDependencies() const { return deps_; }

private:
    WalletProviderPtr CreateDirect(WalletProvider kind) const;

    ProviderDependencies deps_;
};

using ProviderFactoryPtr = std::shared_ptr<ProviderFactory>;

} // namespace wallet
} // namespace ethwallet

#endif // ETHWALLET_WALLET_FACTORY_H
