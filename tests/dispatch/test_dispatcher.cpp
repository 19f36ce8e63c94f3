// ETHWALLET - Transaction Dispatcher Tests
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include <gtest/gtest.h>

#include "ethwallet/dispatch/dispatcher.h"
#include "ethwallet/util/fs.h"
#include "ethwallet/util/time.h"

#include "common/fakes.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ethwallet {
namespace dispatch {
namespace {

using test::FakeBridge;
using test::FakeRpcTransport;
using test::FakeTokenTransfer;

const char* RECIPIENT = "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed";
const char* TOKEN = "0xdac17f958d2ee523a2206206994597c13d831ec7";

const std::string TX_HASH = "0x" + std::string(64, 'd');

ErrorCode CodeOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const WalletError& e) {
        return e.Code();
    }
    ADD_FAILURE() << "expected WalletError";
    return ErrorCode::SigningFailed;
}

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir_.IsValid());
        node_ = std::make_shared<FakeRpcTransport>();
        tokens_ = std::make_shared<FakeTokenTransfer>();
        auto deps = test::FastLocalDependencies((dir_.GetPath() / "wallet").String());
        deps.receiptPolling.intervalMs = 200;
        deps.receiptPolling.maxAttempts = 5;
        session_ = std::make_unique<wallet::WalletSession>(
            std::make_shared<wallet::ProviderFactory>(deps), node_, 1);
    }

    std::string ConnectLocal() {
        wallet::WalletConnection connection;
        connection.password = "dispatch-pass";
        return session_->Connect(connection);
    }

    util::fs::TempDirectory dir_;
    std::shared_ptr<FakeRpcTransport> node_;
    std::shared_ptr<FakeTokenTransfer> tokens_;
    std::unique_ptr<wallet::WalletSession> session_;
};

TEST_F(DispatcherTest, RequiresActiveProvider) {
    Dispatcher dispatcher(*session_, tokens_);
    EXPECT_EQ(CodeOf([&] { dispatcher.Transfer(RECIPIENT, "1"); }), ErrorCode::NotConnected);
    EXPECT_EQ(CodeOf([&] { dispatcher.Transfer(RECIPIENT, "1", TOKEN); }),
              ErrorCode::NotConnected);
    EXPECT_EQ(CodeOf([&] { dispatcher.SendRawTransaction(wallet::TransactionRequest()); }),
              ErrorCode::NotConnected);
    EXPECT_TRUE(tokens_->transfers.empty());
}

TEST_F(DispatcherTest, NativeTransferWaitsForReceipt) {
    std::string from = ConnectLocal();
    ScriptNodeForTransfer(*node_, 1, TX_HASH, from, RECIPIENT);

    util::EnableMockTime();
    util::SetMockTimeMillis(1700000000000);
    node_->Queue("eth_getTransactionReceipt", JSONValue());
    node_->Queue("eth_getTransactionReceipt", JSONValue());

    Dispatcher dispatcher(*session_, tokens_);
    wallet::TransactionResult result = dispatcher.Transfer(RECIPIENT, "0.1");
    const int64_t elapsed = util::GetMockTimeMillis() - 1700000000000;
    util::DisableMockTime();

    EXPECT_TRUE(result.IsSuccess());
    EXPECT_EQ(result.receipt.transactionHash, TX_HASH);
    EXPECT_EQ(result.receipt.from, from);
    EXPECT_EQ(node_->CallCount("eth_getTransactionReceipt"), 3u);
    EXPECT_EQ(elapsed, 400);
    EXPECT_TRUE(tokens_->transfers.empty());
}

TEST_F(DispatcherTest, NativeAddressMatchIsCaseInsensitive) {
    std::string from = ConnectLocal();
    ScriptNodeForTransfer(*node_, 1, TX_HASH, from, RECIPIENT);
    Dispatcher dispatcher(*session_, tokens_);
    dispatcher.Transfer(RECIPIENT, "1", "0xEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEE");
    EXPECT_EQ(node_->CallCount("eth_sendRawTransaction"), 1u);
    EXPECT_TRUE(tokens_->transfers.empty());
}

TEST_F(DispatcherTest, ReceiptTimeoutIsTransportFailure) {
    std::string from = ConnectLocal();
    ScriptNodeForTransfer(*node_, 1, TX_HASH, from, RECIPIENT);
    node_->Respond("eth_getTransactionReceipt", JSONValue());

    util::EnableMockTime();
    util::SetMockTimeMillis(1700000000000);
    Dispatcher dispatcher(*session_, tokens_);
    ErrorCode code = CodeOf([&] { dispatcher.Transfer(RECIPIENT, "1"); });
    const int64_t elapsed = util::GetMockTimeMillis() - 1700000000000;
    util::DisableMockTime();

    EXPECT_EQ(code, ErrorCode::TransportFailure);
    EXPECT_EQ(node_->CallCount("eth_getTransactionReceipt"), 5u);
    EXPECT_EQ(elapsed, 4 * 200);
}

TEST_F(DispatcherTest, TokenTransferDelegates) {
    ConnectLocal();
    Dispatcher dispatcher(*session_, tokens_);
    wallet::TransactionResult result = dispatcher.Transfer(RECIPIENT, "25", TOKEN);

    ASSERT_EQ(tokens_->transfers.size(), 1u);
    EXPECT_EQ(tokens_->transfers[0].currency, TOKEN);
    EXPECT_EQ(tokens_->transfers[0].to, RECIPIENT);
    EXPECT_EQ(tokens_->transfers[0].amount, "25");
    EXPECT_EQ(result.id, "1");
    EXPECT_EQ(node_->CallCount("eth_sendRawTransaction"), 0u);
}

TEST_F(DispatcherTest, TokenTransferWithoutCollaboratorIsUnsupported) {
    ConnectLocal();
    Dispatcher dispatcher(*session_, nullptr);
    EXPECT_EQ(CodeOf([&] { dispatcher.Transfer(RECIPIENT, "25", TOKEN); }),
              ErrorCode::UnsupportedOnPlatform);
}

TEST_F(DispatcherTest, SendRawTransactionSubmitsAsGiven) {
    std::string from = ConnectLocal();
    ScriptNodeForTransfer(*node_, 1, TX_HASH, from, RECIPIENT);
    Dispatcher dispatcher(*session_, tokens_);

    wallet::TransactionRequest request;
    request.to = RECIPIENT;
    request.data = "0xa9059cbb";
    request.value = "0";
    request.gasLimit = "60000";
    request.gasPrice = "3000000000";
    EXPECT_TRUE(dispatcher.SendRawTransaction(request).IsSuccess());
    EXPECT_EQ(node_->CallCount("eth_gasPrice"), 0u);
    EXPECT_EQ(node_->CallCount("eth_sendRawTransaction"), 1u);
}

TEST_F(DispatcherTest, SendRawTransactionRejectsMalformedFields) {
    ConnectLocal();
    ScriptNodeForTransfer(*node_, 1, TX_HASH, RECIPIENT, RECIPIENT);
    Dispatcher dispatcher(*session_, tokens_);

    wallet::TransactionRequest request;
    request.to = "0x12";
    EXPECT_EQ(CodeOf([&] { dispatcher.SendRawTransaction(request); }),
              ErrorCode::InvalidArgument);
    EXPECT_EQ(node_->CallCount("eth_sendRawTransaction"), 0u);
}

TEST_F(DispatcherTest, NodeFailureSurfaces) {
    std::string from = ConnectLocal();
    ScriptNodeForTransfer(*node_, 1, TX_HASH, from, RECIPIENT);
    node_->Fail("eth_sendRawTransaction");
    Dispatcher dispatcher(*session_, tokens_);
    EXPECT_EQ(CodeOf([&] { dispatcher.Transfer(RECIPIENT, "1"); }), ErrorCode::TransportFailure);
}

// ============================================================================
// Bridge Token Transfer
// ============================================================================

TEST(BridgeTokenTransferTest, RoutesCarryCurrency) {
    auto bridge = std::make_shared<FakeBridge>(RECIPIENT);
    bridge->responses[wallet::routes::TRANSFER] = JSONValue::Parse(
        R"({"id":"1","receipt":{"transactionHash":"0x01"}})");
    bridge->responses[wallet::routes::BALANCE] = JSONValue::Parse(
        R"({"name":"Tether","symbol":"USDT","decimals":"6","value":"0x3d0900"})");

    BridgeTokenTransfer tokens(bridge);
    wallet::TransactionResult result = tokens.Transfer(TOKEN, RECIPIENT, "4");
    EXPECT_EQ(result.receipt.transactionHash, "0x01");
    EXPECT_EQ(bridge->LastArgs(wallet::routes::TRANSFER),
              (std::vector<std::string>{RECIPIENT, "4", TOKEN}));

    wallet::CurrencyValue balance = tokens.BalanceOf(TOKEN, RECIPIENT);
    EXPECT_EQ(balance.symbol, "USDT");
    EXPECT_EQ(balance.value, "4000000");
    EXPECT_EQ(balance.displayValue, "4");
    EXPECT_EQ(bridge->LastArgs(wallet::routes::BALANCE), std::vector<std::string>{TOKEN});
}

TEST(BridgeTokenTransferTest, BridgeFailurePropagates) {
    auto bridge = std::make_shared<FakeBridge>(RECIPIENT);
    bridge->failing.insert(wallet::routes::TRANSFER);
    BridgeTokenTransfer tokens(bridge);
    EXPECT_EQ(CodeOf([&] { tokens.Transfer(TOKEN, RECIPIENT, "1"); }),
              ErrorCode::TransportFailure);
}

} // namespace
} // namespace dispatch
} // namespace ethwallet
