// ETHWALLET - Local Wallet Provider Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/wallet/local_provider.h"
#include "ethwallet/core/errors.h"
#include "ethwallet/crypto/eip712.h"
#include "ethwallet/crypto/keys.h"
#include "ethwallet/util/logging.h"

#include <stdexcept>

namespace ethwallet {
namespace wallet {

namespace LogCategory = util::LogCategory;

LocalWalletProvider::LocalWalletProvider(KeystoreManager::Options keystoreOptions,
                                         rpc::ReceiptPoller::Config pollConfig)
    : RpcBackedProvider(pollConfig), keystore_(std::move(keystoreOptions)) {}

LocalWalletProvider::~LocalWalletProvider() = default;

std::string LocalWalletProvider::Connect(const WalletConnection& connection,
                                         rpc::RpcTransportPtr rpc) {
    LocalAccount account = keystore_.UnlockOrCreate(connection.chainId,
                                                    connection.password.value_or(""));
    return Adopt(std::move(account), std::move(rpc));
}

std::string LocalWalletProvider::ConnectWithKey(const std::string& rawKey, ChainId chainId,
                                                rpc::RpcTransportPtr rpc) {
    return Adopt(keystore_.UnlockOrCreate(chainId, "", rawKey), std::move(rpc));
}

std::string LocalWalletProvider::Adopt(LocalAccount account, rpc::RpcTransportPtr rpc) {
    AttachRpc(std::move(rpc), account.chainId);
    account_ = std::make_unique<LocalAccount>(std::move(account));
    std::string address = account_->address.ToChecksumString();
    LOG_INFO(LogCategory::WALLET) << "Local wallet connected: " << util::LogAddress(address);
    return address;
}

void LocalWalletProvider::Disconnect() {
    if (account_) {
        account_->key.Clear();
        account_.reset();
        LOG_INFO(LogCategory::WALLET) << "Local wallet disconnected";
    }
    DetachRpc();
}

bool LocalWalletProvider::IsConnected() const noexcept {
    return account_ != nullptr && account_->key.IsValid();
}

const LocalAccount& LocalWalletProvider::Account() const {
    RequireConnected();
    return *account_;
}

std::string LocalWalletProvider::GetAddress() const {
    return Account().address.ToChecksumString();
}

std::string LocalWalletProvider::PersonalSign(const std::string& message) {
    auto sig = Account().key.Sign(HashPersonalMessage(message));
    if (!sig) {
        throw WalletError(ErrorCode::SigningFailed, "Failed to sign message");
    }
    return sig->ToHex();
}

std::string LocalWalletProvider::SignTypedDataV4(const std::string& signer, const std::string& json) {
    const LocalAccount& account = Account();
    if (!AddressEquals(signer, account.address.ToLowerHex())) {
        throw WalletError(ErrorCode::InvalidArgument, "Signer is not the local account: " + signer);
    }

    Hash256 digest;
    try {
        digest = eip712::TypedData::FromJSON(JSONValue::Parse(json)).SigningHash();
    } catch (const std::invalid_argument& e) {
        throw WalletError(ErrorCode::InvalidArgument, std::string("Invalid typed data: ") + e.what());
    }

    auto sig = account.key.Sign(digest);
    if (!sig) {
        throw WalletError(ErrorCode::SigningFailed, "Failed to sign typed data");
    }
    return sig->ToHex();
}

TransactionResult LocalWalletProvider::SendTransaction(const TransactionRequest& request) {
    const LocalAccount& account = Account();
    rpc::IRpcTransport& node = Rpc();
    const std::string from = account.address.ToChecksumString();

    if (!request.from.empty() && !AddressEquals(request.from, from)) {
        throw WalletError(ErrorCode::InvalidArgument, "Transaction sender is not the local account");
    }

    TransactionRequest filled = request;
    filled.from = from;
    if (filled.gasPrice.empty()) {
        filled.gasPrice = rpc::GetGasPrice(node);
    }

    uint64_t nonce = rpc::GetTransactionCount(node, from);
    ChainId chainId = rpc::GetChainId(node);

    Bytes raw;
    try {
        raw = LegacyTransaction::FromRequest(filled, nonce, chainId).Sign(account.key);
    } catch (const std::invalid_argument& e) {
        throw WalletError(ErrorCode::InvalidArgument, std::string("Invalid transaction: ") + e.what());
    }

    std::string txHash = rpc::SendRawTransaction(node, raw);
    LOG_INFO(LogCategory::WALLET) << "Submitted transaction " << txHash << " (nonce " << nonce << ")";
    return AwaitReceipt(txHash);
}

} // namespace wallet
} // namespace ethwallet
