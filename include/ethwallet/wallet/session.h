// ETHWALLET - Wallet Session
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#ifndef ETHWALLET_WALLET_SESSION_H
#define ETHWALLET_WALLET_SESSION_H

#include "ethwallet/wallet/factory.h"
#include "ethwallet/wallet/provider.h"

#include <memory>
#include <string>

namespace ethwallet {
namespace wallet {

/**
 * Holds the single active provider together with the node transport and
 * chain id. There is no process-wide session; callers own one and pass
 * it to the components that need it.
 *
 * Concurrent Connect calls on one session are not serialized.
 */
class WalletSession {
public:
    WalletSession(ProviderFactoryPtr factory, rpc::RpcTransportPtr rpc, ChainId chainId);

    /**
     * Disconnect the current provider, then build and connect a new one.
     * On failure the session is left disconnected.
     * @return Connected address
     */
    std::string Connect(const WalletConnection& connection);

    /// Idempotent
    void Disconnect();

    bool IsConnected() const noexcept;

    /// @throws WalletError(NotConnected) when no provider is active
    IWalletProvider& ActiveProvider() const;

    /// Active provider handle, null when disconnected
    WalletProviderPtr GetProvider() const { return provider_; }

    ChainId GetChainId() const { return chainId_; }
    void SetChainId(ChainId chainId) { chainId_ = chainId; }

    const rpc::RpcTransportPtr& GetRpc() const { return rpc_; }
    const ProviderFactory& GetFactory() const { return *factory_; }

    /// Whether connections go through a host bridge
    bool IsBridged() const { return factory_->HasBridge(); }

private:
    ProviderFactoryPtr factory_;
    rpc::RpcTransportPtr rpc_;
    ChainId chainId_;
    WalletProviderPtr provider_;
};

} // namespace wallet
} // namespace ethwallet

#endif // ETHWALLET_WALLET_SESSION_H
