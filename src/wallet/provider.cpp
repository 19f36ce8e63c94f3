// ETHWALLET - Wallet Provider Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/wallet/provider.h"
#include "ethwallet/core/errors.h"
#include "ethwallet/core/units.h"
#include "ethwallet/crypto/keys.h"
#include "ethwallet/util/logging.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ethwallet {
namespace wallet {

namespace LogCategory = util::LogCategory;

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const WalletProvider ALL_PROVIDERS[] = {
    WalletProvider::Metamask,    WalletProvider::Coinbase,  WalletProvider::WalletConnect,
    WalletProvider::Injected,    WalletProvider::MagicLink, WalletProvider::LocalWallet,
    WalletProvider::SmartWallet, WalletProvider::Paper,     WalletProvider::Hyperplay,
};

} // anonymous namespace

// ============================================================================
// Provider Kinds
// ============================================================================

const char* WalletProviderToString(WalletProvider provider) {
    switch (provider) {
        case WalletProvider::Metamask:      return "Metamask";
        case WalletProvider::Coinbase:      return "Coinbase";
        case WalletProvider::WalletConnect: return "WalletConnect";
        case WalletProvider::Injected:      return "Injected";
        case WalletProvider::MagicLink:     return "MagicLink";
        case WalletProvider::LocalWallet:   return "LocalWallet";
        case WalletProvider::SmartWallet:   return "SmartWallet";
        case WalletProvider::Paper:         return "Paper";
        case WalletProvider::Hyperplay:     return "Hyperplay";
    }
    return "Unknown";
}

std::optional<WalletProvider> WalletProviderFromString(const std::string& name) {
    const std::string lower = ToLower(name);
    for (WalletProvider p : ALL_PROVIDERS) {
        if (ToLower(WalletProviderToString(p)) == lower) {
            return p;
        }
    }
    return std::nullopt;
}

bool IsExternalSigner(WalletProvider provider) {
    return provider != WalletProvider::LocalWallet && provider != WalletProvider::SmartWallet;
}

bool IsNativeToken(const std::string& currencyAddress) {
    return ToLower(currencyAddress) == NATIVE_TOKEN_ADDRESS;
}

// ============================================================================
// Value Types
// ============================================================================

JSONValue WalletConnection::ToJSON() const {
    JSONValue json = JSONValue::MakeObject();
    json["provider"] = WalletProviderToString(provider);
    json["chainId"] = static_cast<int64_t>(chainId);
    if (password) json["password"] = *password;
    if (email) json["email"] = *email;
    json["personalWallet"] = WalletProviderToString(personalWallet);
    return json;
}

JSONValue CurrencyValue::ToJSON() const {
    JSONValue json = JSONValue::MakeObject();
    json["name"] = name;
    json["symbol"] = symbol;
    json["decimals"] = std::to_string(decimals);
    json["value"] = value;
    json["displayValue"] = displayValue;
    return json;
}

CurrencyValue CurrencyValue::FromJSON(const JSONValue& json) {
    if (!json.IsObject()) {
        throw WalletError(ErrorCode::InvalidArgument, "Currency value must be an object");
    }
    CurrencyValue cv;
    cv.name = json["name"].GetString();
    cv.symbol = json["symbol"].GetString();

    // Bridges send decimals either as a number or a string
    const JSONValue& decimals = json["decimals"];
    if (decimals.IsInt()) {
        cv.decimals = static_cast<int>(decimals.GetInt());
    } else if (decimals.IsString() && IsValidQuantity(decimals.GetString())) {
        cv.decimals = static_cast<int>(QuantityToUint64(decimals.GetString()));
    }

    const JSONValue& value = json["value"];
    if (value.IsInt()) {
        cv.value = std::to_string(value.GetInt());
    } else if (value.IsString() && !value.GetString().empty()) {
        cv.value = NormalizeQuantity(value.GetString());
    }
    cv.displayValue = json["displayValue"].GetString(FormatUnits(cv.value, cv.decimals, 4));
    return cv;
}

CurrencyValue CurrencyValue::Native(const std::string& wei) {
    CurrencyValue cv;
    cv.name = "Ether";
    cv.symbol = "ETH";
    cv.decimals = ETHER_DECIMALS;
    cv.value = wei;
    cv.displayValue = ToEth(wei);
    return cv;
}

JSONValue FundWalletOptions::ToJSON() const {
    JSONValue json = JSONValue::MakeObject();
    if (!appName.empty()) json["appName"] = appName;
    if (address) json["address"] = *address;
    json["chainId"] = static_cast<int64_t>(chainId);
    JSONValue list = JSONValue::MakeArray();
    for (const auto& asset : assets) {
        list.Push(JSONValue(asset));
    }
    json["assets"] = std::move(list);
    return json;
}

// ============================================================================
// IWalletProvider defaults
// ============================================================================

void IWalletProvider::SwitchNetwork(ChainId) {
    throw WalletError(ErrorCode::UnsupportedOnPlatform,
                      "This functionality is not yet available on your current platform.");
}

void IWalletProvider::FundWallet(const FundWalletOptions&) {
    throw WalletError(ErrorCode::UnsupportedOnPlatform,
                      "This functionality is not yet available on your current platform.");
}

// ============================================================================
// RpcBackedProvider
// ============================================================================

void RpcBackedProvider::RequireConnected() const {
    if (!IsConnected()) {
        throw WalletError(ErrorCode::NotConnected, "Wallet is not connected");
    }
}

rpc::IRpcTransport& RpcBackedProvider::Rpc() const {
    if (!rpc_) {
        throw WalletError(ErrorCode::TransportFailure, "No RPC endpoint configured");
    }
    return *rpc_;
}

void RpcBackedProvider::AttachRpc(rpc::RpcTransportPtr rpc, ChainId chainId) {
    rpc_ = std::move(rpc);
    chainId_ = chainId;
}

void RpcBackedProvider::DetachRpc() {
    rpc_.reset();
}

ChainId RpcBackedProvider::GetChainId() {
    RequireConnected();
    if (!rpc_) {
        return chainId_;
    }
    return rpc::GetChainId(*rpc_);
}

CurrencyValue RpcBackedProvider::GetNativeBalance() {
    RequireConnected();
    return CurrencyValue::Native(rpc::GetBalance(Rpc(), GetAddress()));
}

TransactionResult RpcBackedProvider::TransferNative(const std::string& to, const std::string& amount) {
    RequireConnected();
    if (!IsValidAddress(to)) {
        throw WalletError(ErrorCode::InvalidArgument, "Invalid recipient address: " + to);
    }

    TransactionRequest request;
    request.from = GetAddress();
    request.to = to;
    try {
        request.value = ToWei(amount);
    } catch (const std::invalid_argument& e) {
        throw WalletError(ErrorCode::InvalidArgument, std::string("Invalid amount: ") + e.what());
    }

    LOG_INFO(LogCategory::WALLET) << "Transferring " << amount << " ETH to "
                                  << util::LogAddress(to);
    return SendTransaction(request);
}

TransactionResult RpcBackedProvider::AwaitReceipt(const std::string& txHash) const {
    rpc::ReceiptPoller poller(Rpc(), pollConfig_);
    return poller.WaitForReceipt(txHash);
}

} // namespace wallet
} // namespace ethwallet
