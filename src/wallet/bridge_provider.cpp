// ETHWALLET - Bridge Provider Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/wallet/bridge_provider.h"
#include "ethwallet/core/errors.h"
#include "ethwallet/util/logging.h"

namespace ethwallet {
namespace wallet {

namespace LogCategory = util::LogCategory;

BridgeProvider::BridgeProvider(WalletProvider kind, BridgePtr bridge)
    : kind_(kind), bridge_(std::move(bridge)) {
    if (!bridge_) {
        throw WalletError(ErrorCode::InvalidArgument, "Bridge provider needs a bridge");
    }
}

std::string BridgeProvider::Connect(const WalletConnection& connection, rpc::RpcTransportPtr) {
    std::string address = bridge_->Connect(connection);
    connected_ = true;
    LOG_INFO(LogCategory::BRIDGE) << "Bridge connected " << WalletProviderToString(kind_)
                                  << ": " << util::LogAddress(address);
    return address;
}

void BridgeProvider::Disconnect() {
    if (!connected_) {
        return;
    }
    connected_ = false;
    bridge_->Disconnect();
    LOG_INFO(LogCategory::BRIDGE) << "Bridge disconnected";
}

bool BridgeProvider::IsConnected() const noexcept {
    if (!connected_) {
        return false;
    }
    try {
        return bridge_->InvokeRoute(routes::IS_CONNECTED, {}).GetBool(false);
    } catch (const std::exception& e) {
        LOG_WARN(LogCategory::BRIDGE) << "isConnected failed: " << e.what();
        return false;
    }
}

void BridgeProvider::RequireConnected() const {
    if (!connected_) {
        throw WalletError(ErrorCode::NotConnected, "Wallet is not connected");
    }
}

JSONValue BridgeProvider::Invoke(const std::string& route, const std::vector<std::string>& args) const {
    RequireConnected();
    LOG_TRACE(LogCategory::BRIDGE) << "-> " << route << " " << ToJsonStringArray(args);
    return bridge_->InvokeRoute(route, args);
}

std::string BridgeProvider::InvokeForString(const std::string& route,
                                            const std::vector<std::string>& args) const {
    JSONValue result = Invoke(route, args);
    if (!result.IsString()) {
        throw WalletError(ErrorCode::TransportFailure, route + " returned a non-string result");
    }
    return result.GetString();
}

std::string BridgeProvider::GetAddress() const {
    return InvokeForString(routes::GET_ADDRESS, {});
}

ChainId BridgeProvider::GetChainId() {
    JSONValue result = Invoke(routes::GET_CHAIN_ID, {});
    if (result.IsInt() && result.GetInt() > 0) {
        return static_cast<ChainId>(result.GetInt());
    }
    throw WalletError(ErrorCode::TransportFailure, "getChainId returned a malformed result");
}

std::string BridgeProvider::PersonalSign(const std::string& message) {
    return InvokeForString(routes::SIGN, {message});
}

std::string BridgeProvider::SignTypedDataV4(const std::string& signer, const std::string& json) {
    return InvokeForString(routes::SIGN_TYPED_DATA, {signer, json});
}

TransactionResult BridgeProvider::SendTransaction(const TransactionRequest& request) {
    JSONValue tx = JSONValue::MakeObject();
    tx["from"] = request.from;
    tx["to"] = request.to;
    tx["data"] = request.data;
    tx["value"] = request.value;
    tx["gasLimit"] = request.gasLimit;
    tx["gasPrice"] = request.gasPrice;
    return TransactionResult::FromJSON(Invoke(routes::SEND_RAW_TRANSACTION, {tx.ToJSON()}));
}

TransactionResult BridgeProvider::TransferNative(const std::string& to, const std::string& amount) {
    return TransactionResult::FromJSON(Invoke(routes::TRANSFER, {to, amount, NATIVE_TOKEN_ADDRESS}));
}

CurrencyValue BridgeProvider::GetNativeBalance() {
    return CurrencyValue::FromJSON(Invoke(routes::BALANCE, {NATIVE_TOKEN_ADDRESS}));
}

void BridgeProvider::SwitchNetwork(ChainId chainId) {
    RequireConnected();
    bridge_->SwitchNetwork(chainId);
    LOG_INFO(LogCategory::BRIDGE) << "Switched network to chain " << chainId;
}

void BridgeProvider::FundWallet(const FundWalletOptions& options) {
    RequireConnected();
    FundWalletOptions filled = options;
    if (!filled.address) {
        filled.address = GetAddress();
    }
    bridge_->FundWallet(filled);
}

} // namespace wallet
} // namespace ethwallet
