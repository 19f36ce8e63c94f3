// ETHWALLET - Transaction Dispatcher Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/dispatch/dispatcher.h"
#include "ethwallet/core/errors.h"
#include "ethwallet/util/logging.h"

namespace ethwallet {
namespace dispatch {

namespace LogCategory = util::LogCategory;
using wallet::TransactionResult;

// ============================================================================
// BridgeTokenTransfer
// ============================================================================

TransactionResult BridgeTokenTransfer::Transfer(const std::string& currencyAddress,
                                                const std::string& to, const std::string& amount) {
    return TransactionResult::FromJSON(
        bridge_->InvokeRoute(wallet::routes::TRANSFER, {to, amount, currencyAddress}));
}

wallet::CurrencyValue BridgeTokenTransfer::BalanceOf(const std::string& currencyAddress,
                                                     const std::string&) {
    return wallet::CurrencyValue::FromJSON(
        bridge_->InvokeRoute(wallet::routes::BALANCE, {currencyAddress}));
}

// ============================================================================
// Dispatcher
// ============================================================================

TransactionResult Dispatcher::Transfer(const std::string& to, const std::string& amount,
                                       const std::string& currencyAddress) {
    wallet::IWalletProvider& provider = session_.ActiveProvider();

    if (wallet::IsNativeToken(currencyAddress)) {
        TransactionResult result = provider.TransferNative(to, amount);
        LOG_INFO(LogCategory::DISPATCH) << "Native transfer " << result.receipt.transactionHash
                                        << " status " << result.id;
        return result;
    }

    if (!tokens_) {
        throw WalletError(ErrorCode::UnsupportedOnPlatform,
                          "Token transfers are not available on your current platform");
    }
    LOG_INFO(LogCategory::DISPATCH) << "Token transfer of " << amount << " "
                                    << util::LogAddress(currencyAddress) << " to "
                                    << util::LogAddress(to);
    return tokens_->Transfer(currencyAddress, to, amount);
}

TransactionResult Dispatcher::SendRawTransaction(const wallet::TransactionRequest& request) {
    wallet::IWalletProvider& provider = session_.ActiveProvider();
    ETHWALLET_LOG_TIMER(LogCategory::DISPATCH, "send and await receipt");
    return provider.SendTransaction(request);
}

} // namespace dispatch
} // namespace ethwallet
