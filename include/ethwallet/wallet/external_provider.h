// ETHWALLET - External Signer Provider
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#ifndef ETHWALLET_WALLET_EXTERNAL_PROVIDER_H
#define ETHWALLET_WALLET_EXTERNAL_PROVIDER_H

#include "ethwallet/wallet/provider.h"

#include <string>

namespace ethwallet {
namespace wallet {

/**
 * Wallet whose keys live behind a signer channel (browser extension,
 * WalletConnect relay, email wallet). Requests are EIP-1193 methods sent
 * over an IRpcTransport.
 *
 * Without a separate node transport, node calls also go over the signer
 * channel.
 */
class ExternalSignerProvider : public RpcBackedProvider {
public:
    ExternalSignerProvider(WalletProvider kind, rpc::RpcTransportPtr signerChannel,
                           rpc::ReceiptPoller::Config pollConfig = {});

    /// eth_requestAccounts handshake; the first account is used
    std::string Connect(const WalletConnection& connection, rpc::RpcTransportPtr rpc) override;
    void Disconnect() override;

    bool IsConnected() const noexcept override { return !address_.empty(); }
    std::string GetAddress() const override;
    WalletProvider GetProvider() const override { return kind_; }

    /// personal_sign(hex(message), address)
    std::string PersonalSign(const std::string& message) override;
    std::string SignTypedDataV4(const std::string& signer, const std::string& json) override;

    /// eth_sendTransaction, then poll for the receipt
    TransactionResult SendTransaction(const TransactionRequest& request) override;

private:
    /// Call over the signer channel, expecting a string result
    std::string CallForString(const std::string& method, const JSONValue& params);

    WalletProvider kind_;
    rpc::RpcTransportPtr signer_;
    std::string address_;
};

} // namespace wallet
} // namespace ethwallet

#endif // ETHWALLET_WALLET_EXTERNAL_PROVIDER_H
