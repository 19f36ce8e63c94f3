// ETHWALLET - Transaction Dispatcher
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#ifndef ETHWALLET_DISPATCH_DISPATCHER_H
#define ETHWALLET_DISPATCH_DISPATCHER_H

#include "ethwallet/wallet/bridge_provider.h"
#include "ethwallet/wallet/provider.h"
#include "ethwallet/wallet/session.h"
#include "ethwallet/wallet/transaction.h"

#include <memory>
#include <string>

namespace ethwallet {
namespace dispatch {

/**
 * Token contract operations (ERC-20 and similar).
 */
class ITokenTransfer {
public:
    virtual ~ITokenTransfer() = default;

    /// Transfer `amount` (display units) of the token at `currencyAddress`
    virtual wallet::TransactionResult Transfer(const std::string& currencyAddress,
                                               const std::string& to,
                                               const std::string& amount) = 0;

    virtual wallet::CurrencyValue BalanceOf(const std::string& currencyAddress,
                                            const std::string& owner) = 0;
};

using TokenTransferPtr = std::shared_ptr<ITokenTransfer>;

/// Token operations carried over the host bridge routes
class BridgeTokenTransfer : public ITokenTransfer {
public:
    explicit BridgeTokenTransfer(wallet::BridgePtr bridge) : bridge_(std::move(bridge)) {}

    wallet::TransactionResult Transfer(const std::string& currencyAddress, const std::string& to,
                                       const std::string& amount) override;

    /// wallet/balance reports the connected account only
    wallet::CurrencyValue BalanceOf(const std::string& currencyAddress,
                                    const std::string& owner) override;

private:
    wallet::BridgePtr bridge_;
};

/**
 * Submits transfers and raw transactions through the active provider and
 * blocks until a receipt is observed.
 */
class Dispatcher {
public:
    Dispatcher(wallet::WalletSession& session, TokenTransferPtr tokens)
        : session_(session), tokens_(std::move(tokens)) {}

    /**
     * Native currency goes to the provider; anything else to the token
     * transfer collaborator, whose result is returned as is.
     * @throws WalletError(UnsupportedOnPlatform) for tokens without a collaborator
     */
    wallet::TransactionResult Transfer(const std::string& to, const std::string& amount,
                                       const std::string& currencyAddress = NATIVE_TOKEN_ADDRESS);

    /// Submit the fields exactly as given, no estimation
    wallet::TransactionResult SendRawTransaction(const wallet::TransactionRequest& request);

private:
    wallet::WalletSession& session_;
    TokenTransferPtr tokens_;
};

} // namespace dispatch
} // namespace ethwallet

#endif // ETHWALLET_DISPATCH_DISPATCHER_H
