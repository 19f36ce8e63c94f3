// ETHWALLET - Wallet Session Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/wallet/session.h"
#include "ethwallet/core/errors.h"
#include "ethwallet/util/logging.h"

namespace ethwallet {
namespace wallet {

namespace LogCategory = util::LogCategory;

WalletSession::WalletSession(ProviderFactoryPtr factory, rpc::RpcTransportPtr rpc, ChainId chainId)
    : factory_(std::move(factory)), rpc_(std::move(rpc)), chainId_(chainId) {
    if (!factory_) {
        throw WalletError(ErrorCode::InvalidArgument, "Session needs a provider factory");
    }
}

std::string WalletSession::Connect(const WalletConnection& connection) {
    WalletProviderPtr next = factory_->Create(connection);

    Disconnect();

    std::string address = next->Connect(connection, rpc_);
    provider_ = std::move(next);
    chainId_ = connection.chainId;

    LOG_INFO(LogCategory::WALLET) << "Session active with " << WalletProviderToString(connection.provider)
                                  << " on chain " << chainId_;
    return address;
}

void WalletSession::Disconnect() {
    if (!provider_) {
        return;
    }
    WalletProviderPtr previous = std::move(provider_);
    provider_.reset();
    previous->Disconnect();
}

bool WalletSession::IsConnected() const noexcept {
    return provider_ != nullptr && provider_->IsConnected();
}

IWalletProvider& WalletSession::ActiveProvider() const {
    if (!provider_) {
        throw WalletError(ErrorCode::NotConnected, "No wallet connected");
    }
    return *provider_;
}

} // namespace wallet
} // namespace ethwallet
