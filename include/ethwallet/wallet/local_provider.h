// ETHWALLET - Local Wallet Provider
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#ifndef ETHWALLET_WALLET_LOCAL_PROVIDER_H
#define ETHWALLET_WALLET_LOCAL_PROVIDER_H

#include "ethwallet/wallet/keystore.h"
#include "ethwallet/wallet/provider.h"

#include <memory>
#include <optional>
#include <string>

namespace ethwallet {
namespace wallet {

/**
 * Signs in-process with the key held by the keystore.
 *
 * Transactions are built as EIP-155 legacy transactions and submitted
 * with eth_sendRawTransaction.
 */
class LocalWalletProvider : public RpcBackedProvider {
public:
    explicit LocalWalletProvider(KeystoreManager::Options keystoreOptions,
                                 rpc::ReceiptPoller::Config pollConfig = {});
    ~LocalWalletProvider() override;

    /// Unlock the stored account, or create one on first use
    std::string Connect(const WalletConnection& connection, rpc::RpcTransportPtr rpc) override;

    /// Wrap a raw hex key without touching the keystore file
    std::string ConnectWithKey(const std::string& rawKey, ChainId chainId,
                               rpc::RpcTransportPtr rpc);

    /// Wipes the key
    void Disconnect() override;

    bool IsConnected() const noexcept override;
    std::string GetAddress() const override;
    WalletProvider GetProvider() const override { return WalletProvider::LocalWallet; }
    const LocalAccount* GetLocalAccount() const override { return account_.get(); }

    std::string PersonalSign(const std::string& message) override;

    /// Hashes the document with EIP-712 and signs locally
    std::string SignTypedDataV4(const std::string& signer, const std::string& json) override;

    TransactionResult SendTransaction(const TransactionRequest& request) override;

    KeystoreManager& GetKeystore() { return keystore_; }
    const KeystoreManager& GetKeystore() const { return keystore_; }

private:
    std::string Adopt(LocalAccount account, rpc::RpcTransportPtr rpc);
    const LocalAccount& Account() const;

    KeystoreManager keystore_;
    std::unique_ptr<LocalAccount> account_;
};

} // namespace wallet
} // namespace ethwallet

#endif // ETHWALLET_WALLET_LOCAL_PROVIDER_H
