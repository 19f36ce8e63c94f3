// ETHWALLET - Wallet Provider Interface
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// One capability interface implemented by every wallet variant:
// - LocalWalletProvider: in-process key from the keystore
// - ExternalSignerProvider: browser extensions, WalletConnect, email wallets
// - SmartWalletProvider: smart account with a personal signer
// - BridgeProvider: host-side bridge routes

#ifndef ETHWALLET_WALLET_PROVIDER_H
#define ETHWALLET_WALLET_PROVIDER_H

#include "ethwallet/core/json.h"
#include "ethwallet/core/types.h"
#include "ethwallet/core/units.h"
#include "ethwallet/rpc/transport.h"
#include "ethwallet/wallet/keystore.h"
#include "ethwallet/wallet/transaction.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ethwallet {
namespace wallet {

// ============================================================================
// Provider Kinds
// ============================================================================

enum class WalletProvider {
    Metamask,
    Coinbase,
    WalletConnect,
    Injected,
    MagicLink,
    LocalWallet,
    SmartWallet,
    Paper,
    Hyperplay,
};

/// Name of a provider kind (e.g. "LocalWallet")
const char* WalletProviderToString(WalletProvider provider);

/// Parse a provider name (case-insensitive)
std::optional<WalletProvider> WalletProviderFromString(const std::string& name);

/// Kinds whose keys live outside the process and are reached over a signer channel
bool IsExternalSigner(WalletProvider provider);

/// Whether a currency address denotes the native token
bool IsNativeToken(const std::string& currencyAddress);

// ============================================================================
// Value Types
// ============================================================================

/// Parameters of a Connect call; not modified once passed in
struct WalletConnection {
    WalletProvider provider{WalletProvider::LocalWallet};
    ChainId chainId{1};
    std::optional<std::string> password;
    std::optional<std::string> email;

    /// Signer behind a smart account
    WalletProvider personalWallet{WalletProvider::LocalWallet};

    JSONValue ToJSON() const;
};

/// A balance with display metadata
struct CurrencyValue {
    std::string name;
    std::string symbol;
    int decimals{18};
    /// Base units, decimal
    std::string value{"0"};
    std::string displayValue{"0"};

    JSONValue ToJSON() const;
    static CurrencyValue FromJSON(const JSONValue& json);

    /// Native currency value from a wei amount
    static CurrencyValue Native(const std::string& wei);
};

/// On-ramp request forwarded to the bridge
struct FundWalletOptions {
    std::string appName;
    /// Filled with the connected address when absent
    std::optional<std::string> address;
    ChainId chainId{1};
    std::vector<std::string> assets;

    JSONValue ToJSON() const;
};

// ============================================================================
// Provider Interface
// ============================================================================

/**
 * Capabilities of one wallet variant.
 *
 * Every capability except Connect, Disconnect and IsConnected throws
 * WalletError(NotConnected) while disconnected.
 */
class IWalletProvider {
public:
    virtual ~IWalletProvider() = default;

    /**
     * Establish the connection.
     * @param connection Connect parameters
     * @param rpc Node transport, may be null for sign-only use
     * @return Connected address (checksummed)
     */
    virtual std::string Connect(const WalletConnection& connection, rpc::RpcTransportPtr rpc) = 0;

    /// Drop the connection. Idempotent.
    virtual void Disconnect() = 0;

    /// Never throws; internal failures read as false
    virtual bool IsConnected() const noexcept = 0;

    /// Account address (the smart account for smart wallets)
    virtual std::string GetAddress() const = 0;

    /// Address that produces signatures
    virtual std::string GetSignerAddress() const { return GetAddress(); }

    virtual WalletProvider GetProvider() const = 0;

    /// Kind of the signing wallet
    virtual WalletProvider GetSignerProvider() const { return GetProvider(); }

    /// In-process key if this variant signs locally, nullptr otherwise
    virtual const LocalAccount* GetLocalAccount() const { return nullptr; }

    virtual ChainId GetChainId() = 0;

    /// EIP-191 personal signature, 0x-prefixed r || s || v
    virtual std::string PersonalSign(const std::string& message) = 0;

    /// eth_signTypedData_v4 over a serialized document
    virtual std::string SignTypedDataV4(const std::string& signer, const std::string& json) = 0;

    /// Submit and block until a receipt is observed
    virtual TransactionResult SendTransaction(const TransactionRequest& request) = 0;

    /// Send `amount` ether to `to` and block for the receipt
    virtual TransactionResult TransferNative(const std::string& to, const std::string& amount) = 0;

    virtual CurrencyValue GetNativeBalance() = 0;

    /// @throws WalletError(UnsupportedOnPlatform) unless overridden
    virtual void SwitchNetwork(ChainId chainId);

    /// @throws WalletError(UnsupportedOnPlatform) unless overridden
    virtual void FundWallet(const FundWalletOptions& options);
};

using WalletProviderPtr = std::shared_ptr<IWalletProvider>;

// ============================================================================
// RPC-Backed Provider Base
// ============================================================================

/**
 * Shared plumbing for variants that talk to a node: chain id, balance,
 * native transfers and receipt polling.
 */
class RpcBackedProvider : public IWalletProvider {
public:
    explicit RpcBackedProvider(rpc::ReceiptPoller::Config pollConfig = {})
        : pollConfig_(pollConfig) {}

    ChainId GetChainId() override;
    CurrencyValue GetNativeBalance() override;
    TransactionResult TransferNative(const std::string& to, const std::string& amount) override;

    const rpc::ReceiptPoller::Config& GetPollConfig() const { return pollConfig_; }

protected:
    /// @throws WalletError(NotConnected) when disconnected
    void RequireConnected() const;

    /// @throws WalletError(TransportFailure) when no node transport was supplied
    rpc::IRpcTransport& Rpc() const;

    /// Block until the node reports a receipt for txHash
    TransactionResult AwaitReceipt(const std::string& txHash) const;

    void AttachRpc(rpc::RpcTransportPtr rpc, ChainId chainId);
    void DetachRpc();

    rpc::RpcTransportPtr rpc_;
    ChainId chainId_{1};

private:
    rpc::ReceiptPoller::Config pollConfig_;
};

} // namespace wallet
} // namespace ethwallet

#endif // ETHWALLET_WALLET_PROVIDER_H
