// ETHWALLET - Smart Wallet Provider
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#ifndef ETHWALLET_WALLET_SMART_PROVIDER_H
#define ETHWALLET_WALLET_SMART_PROVIDER_H

#include "ethwallet/wallet/provider.h"

#include <memory>
#include <string>

namespace ethwallet {
namespace wallet {

/**
 * Account-abstraction backend (factory contract plus bundler).
 */
class ISmartAccountBackend {
public:
    virtual ~ISmartAccountBackend() = default;

    /// Counterfactual smart account address owned by the personal signer
    virtual std::string GetAccountAddress(const std::string& signerAddress, ChainId chainId) = 0;

    /**
     * Execute a call from the smart account, authorized by the signer.
     * @return Hash of the transaction that carried the call
     */
    virtual std::string Execute(const std::string& accountAddress, const TransactionRequest& request,
                                IWalletProvider& signer) = 0;
};

using SmartAccountBackendPtr = std::shared_ptr<ISmartAccountBackend>;

/**
 * Smart account fronted by a personal wallet that signs for it.
 *
 * GetAddress() is the smart account; GetSignerAddress() and signatures
 * belong to the personal wallet.
 */
class SmartWalletProvider : public RpcBackedProvider {
public:
    SmartWalletProvider(WalletProviderPtr personal, SmartAccountBackendPtr backend,
                        rpc::ReceiptPoller::Config pollConfig = {});

    /// Connect the personal wallet, then resolve the account address
    std::string Connect(const WalletConnection& connection, rpc::RpcTransportPtr rpc) override;
    void Disconnect() override;

    bool IsConnected() const noexcept override;
    std::string GetAddress() const override;
    std::string GetSignerAddress() const override;
    WalletProvider GetProvider() const override { return WalletProvider::SmartWallet; }
    WalletProvider GetSignerProvider() const override { return personal_->GetProvider(); }
    /// The personal wallet's key when it signs in-process, so typed data for
    /// a smart account over a local wallet is signed locally. Unlike the other
    /// non-local variants this is not always nullptr.
    const LocalAccount* GetLocalAccount() const override { return personal_->GetLocalAccount(); }

    std::string PersonalSign(const std::string& message) override;
    std::string SignTypedDataV4(const std::string& signer, const std::string& json) override;
    TransactionResult SendTransaction(const TransactionRequest& request) override;

    IWalletProvider& GetPersonalWallet() { return *personal_; }

private:
    WalletProviderPtr personal_;
    SmartAccountBackendPtr backend_;
    std::string accountAddress_;
};

} // namespace wallet
} // namespace ethwallet

#endif // ETHWALLET_WALLET_SMART_PROVIDER_H
