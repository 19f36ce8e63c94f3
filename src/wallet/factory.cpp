// ETHWALLET - Provider Factory Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/wallet/factory.h"
#include "ethwallet/core/errors.h"
#include "ethwallet/wallet/external_provider.h"
#include "ethwallet/wallet/local_provider.h"

namespace ethwallet {
namespace wallet {

ProviderFactory::ProviderFactory(ProviderDependencies deps) : deps_(std::move(deps)) {}

WalletProviderPtr ProviderFactory::Create(const WalletConnection& connection) const {
    if (deps_.bridge) {
        return std::make_shared<BridgeProvider>(connection.provider, deps_.bridge);
    }

    if (connection.provider != WalletProvider::SmartWallet) {
        return CreateDirect(connection.provider);
    }

    if (connection.personalWallet == WalletProvider::SmartWallet) {
        throw WalletError(ErrorCode::InvalidArgument, "A smart wallet cannot sign for a smart wallet");
    }
    if (!deps_.smartAccountBackend) {
        throw WalletError(ErrorCode::UnsupportedOnPlatform, "No smart account backend configured");
    }
    return std::make_shared<SmartWalletProvider>(CreateDirect(connection.personalWallet),
                                                 deps_.smartAccountBackend, deps_.receiptPolling);
}

WalletProviderPtr ProviderFactory::CreateDirect(WalletProvider kind) const {
    if (kind == WalletProvider::LocalWallet) {
        return std::make_shared<LocalWalletProvider>(deps_.keystore, deps_.receiptPolling);
    }

    auto it = deps_.signerChannels.find(kind);
    if (it == deps_.signerChannels.end() || !it->second) {
        throw WalletError(ErrorCode::UnsupportedOnPlatform,
                          std::string(WalletProviderToString(kind)) +
                              " is not available on your current platform");
    }
    return std::make_shared<ExternalSignerProvider>(kind, it->second, deps_.receiptPolling);
}

} // namespace wallet
} // namespace ethwallet
