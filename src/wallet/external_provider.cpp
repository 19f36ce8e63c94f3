// ETHWALLET - External Signer Provider Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/wallet/external_provider.h"
#include "ethwallet/core/errors.h"
#include "ethwallet/core/hex.h"
#include "ethwallet/crypto/keys.h"
#include "ethwallet/util/logging.h"

namespace ethwallet {
namespace wallet {

namespace LogCategory = util::LogCategory;

ExternalSignerProvider::ExternalSignerProvider(WalletProvider kind,
                                               rpc::RpcTransportPtr signerChannel,
                                               rpc::ReceiptPoller::Config pollConfig)
    : RpcBackedProvider(pollConfig), kind_(kind), signer_(std::move(signerChannel)) {
    if (!signer_) {
        throw WalletError(ErrorCode::InvalidArgument,
                          std::string("No signer channel for ") + WalletProviderToString(kind));
    }
}

std::string ExternalSignerProvider::Connect(const WalletConnection& connection,
                                            rpc::RpcTransportPtr rpc) {
    JSONValue params = JSONValue::MakeArray();
    if (connection.email) {
        JSONValue login = JSONValue::MakeObject();
        login["email"] = *connection.email;
        params.Push(std::move(login));
    }

    JSONValue accounts = signer_->Call("eth_requestAccounts", params);
    if (!accounts.IsArray() || accounts.Size() == 0 || !accounts[size_t{0}].IsString()) {
        throw WalletError(ErrorCode::TransportFailure,
                          std::string(WalletProviderToString(kind_)) + " returned no accounts");
    }

    auto address = Address::FromString(accounts[size_t{0}].GetString());
    if (!address) {
        throw WalletError(ErrorCode::TransportFailure,
                          "Signer returned a malformed address: " + accounts[size_t{0}].GetString());
    }

    AttachRpc(rpc ? std::move(rpc) : signer_, connection.chainId);
    address_ = address->ToChecksumString();
    LOG_INFO(LogCategory::WALLET) << WalletProviderToString(kind_) << " connected: "
                                  << util::LogAddress(address_);
    return address_;
}

void ExternalSignerProvider::Disconnect() {
    if (!address_.empty()) {
        LOG_INFO(LogCategory::WALLET) << WalletProviderToString(kind_) << " disconnected";
    }
    address_.clear();
    DetachRpc();
}

std::string ExternalSignerProvider::GetAddress() const {
    RequireConnected();
    return address_;
}

std::string ExternalSignerProvider::CallForString(const std::string& method, const JSONValue& params) {
    JSONValue result = signer_->Call(method, params);
    if (!result.IsString() || result.GetString().empty()) {
        throw WalletError(ErrorCode::TransportFailure, method + " returned no result");
    }
    return result.GetString();
}

std::string ExternalSignerProvider::PersonalSign(const std::string& message) {
    RequireConnected();
    const std::string payload = "0x" + BytesToHex(reinterpret_cast<const Byte*>(message.data()),
                                                  message.size());
    return CallForString("personal_sign", rpc::Params({payload, address_}));
}

std::string ExternalSignerProvider::SignTypedDataV4(const std::string& signer, const std::string& json) {
    RequireConnected();
    return CallForString("eth_signTypedData_v4", rpc::Params({signer, json}));
}

TransactionResult ExternalSignerProvider::SendTransaction(const TransactionRequest& request) {
    RequireConnected();
    TransactionRequest filled = request;
    if (filled.from.empty()) {
        filled.from = address_;
    }

    JSONValue params = JSONValue::MakeArray();
    params.Push(filled.ToRpcJSON());
    std::string txHash = CallForString("eth_sendTransaction", params);
    LOG_INFO(LogCategory::WALLET) << "Submitted transaction " << txHash << " via "
                                  << WalletProviderToString(kind_);
    return AwaitReceipt(txHash);
}

} // namespace wallet
} // namespace ethwallet
