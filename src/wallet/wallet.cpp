// ETHWALLET - Wallet Facade Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/wallet/wallet.h"
#include "ethwallet/core/errors.h"
#include "ethwallet/crypto/keys.h"
#include "ethwallet/util/logging.h"
#include "ethwallet/wallet/bridge_provider.h"

#include <stdexcept>

namespace ethwallet {
namespace wallet {

namespace LogCategory = util::LogCategory;

namespace {

WalletSession& Require(const std::shared_ptr<WalletSession>& session) {
    if (!session) {
        throw WalletError(ErrorCode::InvalidArgument, "Wallet needs a session");
    }
    return *session;
}

dispatch::TokenTransferPtr ResolveTokens(WalletSession& session, dispatch::TokenTransferPtr tokens) {
    if (!tokens && session.IsBridged()) {
        return std::make_shared<dispatch::BridgeTokenTransfer>(session.GetFactory().GetDependencies().bridge);
    }
    return tokens;
}

auth::VerifyResult VerifyResultFromString(const std::string& outcome) {
    const auth::VerifyStatus failures[] = {
        auth::VerifyStatus::InvalidUser, auth::VerifyStatus::InvalidSignature,
        auth::VerifyStatus::InvalidSession, auth::VerifyStatus::Expired,
    };
    for (auth::VerifyStatus s : failures) {
        if (outcome == auth::VerifyStatusToString(s)) {
            return auth::VerifyResult::Failure(s);
        }
    }
    if (!IsValidAddress(outcome)) {
        return auth::VerifyResult::Failure(auth::VerifyStatus::InvalidSession);
    }
    return auth::VerifyResult::Success(ToChecksumAddress(outcome));
}

} // anonymous namespace

Wallet::Wallet(std::shared_ptr<WalletSession> session, auth::UserRegistryPtr registry,
               dispatch::TokenTransferPtr tokens, auth::Authenticator::Options authOptions)
    : session_(std::move(session)),
      tokens_(ResolveTokens(Require(session_), std::move(tokens))),
      signer_(*session_),
      authenticator_(*session_, std::move(registry), authOptions),
      dispatcher_(*session_, tokens_) {}

IBridge* Wallet::Bridge() const {
    return session_->GetFactory().GetDependencies().bridge.get();
}

JSONValue Wallet::InvokeRoute(const std::string& route, const std::vector<std::string>& args) {
    session_->ActiveProvider();  // NotConnected before Connect
    return Bridge()->InvokeRoute(route, args);
}

KeystoreManager Wallet::Keystore() const {
    return KeystoreManager(session_->GetFactory().GetDependencies().keystore);
}

// ============================================================================
// Connection
// ============================================================================

std::string Wallet::Connect(const WalletConnection& connection) {
    return session_->Connect(connection);
}

void Wallet::Disconnect() {
    session_->Disconnect();
}

bool Wallet::IsConnected() const noexcept {
    return session_->IsConnected();
}

std::string Wallet::GetAddress() const {
    return session_->ActiveProvider().GetAddress();
}

std::string Wallet::GetSignerAddress() const {
    return session_->ActiveProvider().GetSignerAddress();
}

ChainId Wallet::GetChainId() {
    return session_->ActiveProvider().GetChainId();
}

// ============================================================================
// Authentication
// ============================================================================

auth::LoginPayload Wallet::Authenticate(const std::string& domain) {
    if (Bridge()) {
        return auth::LoginPayload::FromJSON(InvokeRoute(routes::AUTH_LOGIN, {domain}));
    }
    return authenticator_.Authenticate(domain);
}

auth::VerifyResult Wallet::Verify(const auth::LoginPayload& payload) {
    if (Bridge()) {
        JSONValue outcome = InvokeRoute(routes::AUTH_VERIFY, {payload.ToJSON().ToJSON()});
        if (!outcome.IsString()) {
            throw WalletError(ErrorCode::TransportFailure, "verify returned a non-string result");
        }
        return VerifyResultFromString(outcome.GetString());
    }
    return authenticator_.Verify(payload);
}

// ============================================================================
// Signing
// ============================================================================

std::string Wallet::Sign(const std::string& message) {
    return signer_.Sign(message);
}

std::string Wallet::SignTypedData(const eip712::TypedData& typedData) {
    return signer_.SignTypedData(typedData);
}

std::string Wallet::SignTypedData(const JSONValue& message, const eip712::TypedData& typeDefinition) {
    return signer_.SignTypedData(message, typeDefinition);
}

std::string Wallet::RecoverAddress(const std::string& message, const std::string& signature) {
    if (Bridge()) {
        JSONValue result = InvokeRoute(routes::RECOVER_ADDRESS, {message, signature});
        if (!result.IsString()) {
            throw WalletError(ErrorCode::TransportFailure, "recoverAddress returned a non-string result");
        }
        return result.GetString();
    }
    return signing::RecoverAddress(message, signature);
}

// ============================================================================
// Value
// ============================================================================

CurrencyValue Wallet::GetBalance(const std::string& currencyAddress) {
    IWalletProvider& provider = session_->ActiveProvider();
    if (IsNativeToken(currencyAddress)) {
        return provider.GetNativeBalance();
    }
    if (!tokens_) {
        throw WalletError(ErrorCode::UnsupportedOnPlatform,
                          "Token balances are not available on your current platform");
    }
    return tokens_->BalanceOf(currencyAddress, provider.GetAddress());
}

TransactionResult Wallet::Transfer(const std::string& to, const std::string& amount,
                                   const std::string& currencyAddress) {
    return dispatcher_.Transfer(to, amount, currencyAddress);
}

TransactionResult Wallet::SendRawTransaction(const TransactionRequest& request) {
    return dispatcher_.SendRawTransaction(request);
}

void Wallet::SwitchNetwork(ChainId chainId) {
    session_->ActiveProvider().SwitchNetwork(chainId);
    session_->SetChainId(chainId);
}

void Wallet::FundWallet(const FundWalletOptions& options) {
    session_->ActiveProvider().FundWallet(options);
}

// ============================================================================
// Local Account
// ============================================================================

std::string Wallet::Export(const std::string& password) {
    WalletProviderPtr provider = session_->GetProvider();
    const LocalAccount* account = provider ? provider->GetLocalAccount() : nullptr;
    return Keystore().Export(account, password);
}

bool Wallet::DeleteLocalAccount() {
    return Keystore().Delete();
}

LocalAccount Wallet::GenerateRandomAccount(ChainId chainId) {
    LocalAccount account(PrivateKey::Generate(), chainId);
    LOG_DEBUG(LogCategory::WALLET) << "Generated account "
                                   << util::LogAddress(account.address.ToChecksumString());
    return account;
}

} // namespace wallet
} // namespace ethwallet
