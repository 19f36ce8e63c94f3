// ETHWALLET - Smart Wallet Provider Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/wallet/smart_provider.h"
#include "ethwallet/core/errors.h"
#include "ethwallet/crypto/keys.h"
#include "ethwallet/util/logging.h"

namespace ethwallet {
namespace wallet {

namespace LogCategory = util::LogCategory;

SmartWalletProvider::SmartWalletProvider(WalletProviderPtr personal, SmartAccountBackendPtr backend,
                                         rpc::ReceiptPoller::Config pollConfig)
    : RpcBackedProvider(pollConfig), personal_(std::move(personal)), backend_(std::move(backend)) {
    if (!personal_ || !backend_) {
        throw WalletError(ErrorCode::InvalidArgument,
                          "Smart wallet needs a personal wallet and an account backend");
    }
}

std::string SmartWalletProvider::Connect(const WalletConnection& connection,
                                         rpc::RpcTransportPtr rpc) {
    WalletConnection personalConnection = connection;
    personalConnection.provider = connection.personalWallet;

    std::string signer = personal_->Connect(personalConnection, rpc);

    auto account = Address::FromString(backend_->GetAccountAddress(signer, connection.chainId));
    if (!account) {
        personal_->Disconnect();
        throw WalletError(ErrorCode::TransportFailure, "Account backend returned a malformed address");
    }

    AttachRpc(std::move(rpc), connection.chainId);
    accountAddress_ = account->ToChecksumString();
    LOG_INFO(LogCategory::WALLET) << "Smart wallet connected: " << util::LogAddress(accountAddress_)
                                  << " (signer " << util::LogAddress(signer) << ")";
    return accountAddress_;
}

void SmartWalletProvider::Disconnect() {
    personal_->Disconnect();
    accountAddress_.clear();
    DetachRpc();
}

bool SmartWalletProvider::IsConnected() const noexcept {
    return !accountAddress_.empty() && personal_->IsConnected();
}

std::string SmartWalletProvider::GetAddress() const {
    RequireConnected();
    return accountAddress_;
}

std::string SmartWalletProvider::GetSignerAddress() const {
    RequireConnected();
    return personal_->GetAddress();
}

std::string SmartWalletProvider::PersonalSign(const std::string& message) {
    RequireConnected();
    return personal_->PersonalSign(message);
}

std::string SmartWalletProvider::SignTypedDataV4(const std::string& signer, const std::string& json) {
    RequireConnected();
    return personal_->SignTypedDataV4(signer, json);
}

TransactionResult SmartWalletProvider::SendTransaction(const TransactionRequest& request) {
    RequireConnected();
    TransactionRequest filled = request;
    filled.from = accountAddress_;

    std::string txHash = backend_->Execute(accountAddress_, filled, *personal_);
    LOG_INFO(LogCategory::WALLET) << "Smart account call submitted in " << txHash;
    return AwaitReceipt(txHash);
}

} // namespace wallet
} // namespace ethwallet
