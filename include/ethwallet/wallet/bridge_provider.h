// ETHWALLET - Bridge Provider
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// Provider backed by a host bridge (e.g. an embedding browser runtime).
// Every capability maps to a named route; arguments are strings, with
// non-primitive values serialized as compact JSON.

#ifndef ETHWALLET_WALLET_BRIDGE_PROVIDER_H
#define ETHWALLET_WALLET_BRIDGE_PROVIDER_H

#include "ethwallet/wallet/provider.h"

#include <memory>
#include <string>
#include <vector>

namespace ethwallet {
namespace wallet {

// ============================================================================
// Bridge Routes
// ============================================================================

namespace routes {
constexpr const char* AUTH_LOGIN = "auth/login";
constexpr const char* AUTH_VERIFY = "auth/verify";
constexpr const char* BALANCE = "wallet/balance";
constexpr const char* GET_ADDRESS = "wallet/getAddress";
constexpr const char* IS_CONNECTED = "wallet/isConnected";
constexpr const char* GET_CHAIN_ID = "wallet/getChainId";
constexpr const char* TRANSFER = "wallet/transfer";
constexpr const char* SIGN = "wallet/sign";
constexpr const char* SIGN_TYPED_DATA = "wallet/signTypedData";
constexpr const char* RECOVER_ADDRESS = "wallet/recoverAddress";
constexpr const char* SEND_RAW_TRANSACTION = "wallet/sendRawTransaction";
} // namespace routes

/**
 * Host bridge.
 */
class IBridge {
public:
    virtual ~IBridge() = default;

    /// @return Connected address
    virtual std::string Connect(const WalletConnection& connection) = 0;
    virtual void Disconnect() = 0;
    virtual void SwitchNetwork(ChainId chainId) = 0;
    virtual void FundWallet(const FundWalletOptions& options) = 0;

    /**
     * Invoke a named route.
     * @throws WalletError(TransportFailure) if the host call fails
     */
    virtual JSONValue InvokeRoute(const std::string& route, const std::vector<std::string>& args) = 0;
};

using BridgePtr = std::shared_ptr<IBridge>;

// ============================================================================
// Bridge Provider
// ============================================================================

class BridgeProvider : public IWalletProvider {
public:
    BridgeProvider(WalletProvider kind, BridgePtr bridge);

    /// rpc is unused; the host owns the node connection
    std::string Connect(const WalletConnection& connection, rpc::RpcTransportPtr rpc) override;
    void Disconnect() override;

    /// wallet/isConnected; false on any bridge failure
    bool IsConnected() const noexcept override;

    std::string GetAddress() const override;
    WalletProvider GetProvider() const override { return kind_; }

    ChainId GetChainId() override;
    std::string PersonalSign(const std::string& message) override;
    std::string SignTypedDataV4(const std::string& signer, const std::string& json) override;
    TransactionResult SendTransaction(const TransactionRequest& request) override;
    TransactionResult TransferNative(const std::string& to, const std::string& amount) override;
    CurrencyValue GetNativeBalance() override;

    void SwitchNetwork(ChainId chainId) override;

    /// Fills options.address with the connected address when absent
    void FundWallet(const FundWalletOptions& options) override;

    /// Route call that fails with NotConnected before Connect
    JSONValue Invoke(const std::string& route, const std::vector<std::string>& args) const;

    IBridge& GetBridge() const { return *bridge_; }

private:
    void RequireConnected() const;
    std::string InvokeForString(const std::string& route, const std::vector<std::string>& args) const;

    WalletProvider kind_;
    BridgePtr bridge_;
    bool connected_{false};
};

} // namespace wallet
} // namespace ethwallet

#endif // ETHWALLET_WALLET_BRIDGE_PROVIDER_H
