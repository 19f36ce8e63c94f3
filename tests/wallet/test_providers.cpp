// ETHWALLET - Wallet Provider Tests
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include <gtest/gtest.h>

#include "ethwallet/wallet/bridge_provider.h"
#include "ethwallet/wallet/external_provider.h"
#include "ethwallet/wallet/factory.h"
#include "ethwallet/wallet/local_provider.h"
#include "ethwallet/wallet/smart_provider.h"
#include "ethwallet/crypto/eip712.h"
#include "ethwallet/crypto/keys.h"
#include "ethwallet/util/fs.h"

#include "common/fakes.h"

#include <functional>
#include <memory>
#include <string>

namespace ethwallet {
namespace wallet {
namespace {

namespace fs = util::fs;
using test::FakeBridge;
using test::FakeRpcTransport;
using test::FakeSmartAccountBackend;
using test::MinedReceipt;

const char* TEST_KEY_HEX = "0x4c0883a69102937d6231471b5dbb6204fe5129617082792ae468d01a3f362318";
const char* TEST_ADDRESS = "0x2c7536E3605D9C16a7a3D7b1898e529396a65c23";
const char* RECIPIENT = "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed";
const char* SMART_ACCOUNT = "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359";

const std::string TX_HASH = "0x" + std::string(64, 'a');

const char* TYPED_DOCUMENT = R"({
    "types": {
        "EIP712Domain": [
            {"name": "name", "type": "string"},
            {"name": "chainId", "type": "uint256"}
        ],
        "Greeting": [
            {"name": "text", "type": "string"}
        ]
    },
    "primaryType": "Greeting",
    "domain": {"name": "Provider Test", "chainId": 1},
    "message": {"text": "gm"}
})";

ErrorCode CodeOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const WalletError& e) {
        return e.Code();
    }
    ADD_FAILURE() << "expected WalletError";
    return ErrorCode::SigningFailed;
}

/// Address that produced a 65-byte signature over digest
std::string Recover(const Hash256& digest, const std::string& signature) {
    auto sig = RecoverableSignature::FromHex(signature);
    if (!sig) return "";
    auto pub = PublicKey::Recover(digest, *sig);
    if (!pub) return "";
    return Address::FromPublicKey(*pub).ToChecksumString();
}

JSONValue Accounts(const std::string& address) {
    JSONValue list = JSONValue::MakeArray();
    list.Push(JSONValue(address));
    return list;
}

// ============================================================================
// Provider Kinds and Value Types
// ============================================================================

TEST(ProviderKindTest, NamesRoundTrip) {
    EXPECT_STREQ(WalletProviderToString(WalletProvider::LocalWallet), "LocalWallet");
    EXPECT_STREQ(WalletProviderToString(WalletProvider::WalletConnect), "WalletConnect");
    EXPECT_EQ(WalletProviderFromString("metamask").value_or(WalletProvider::Paper),
              WalletProvider::Metamask);
    EXPECT_EQ(WalletProviderFromString("SMARTWALLET").value_or(WalletProvider::Paper),
              WalletProvider::SmartWallet);
    EXPECT_FALSE(WalletProviderFromString("ledger").has_value());
}

TEST(ProviderKindTest, ExternalSigners) {
    EXPECT_TRUE(IsExternalSigner(WalletProvider::Metamask));
    EXPECT_TRUE(IsExternalSigner(WalletProvider::MagicLink));
    EXPECT_FALSE(IsExternalSigner(WalletProvider::LocalWallet));
    EXPECT_FALSE(IsExternalSigner(WalletProvider::SmartWallet));
}

TEST(ProviderKindTest, NativeTokenIsCaseInsensitive) {
    EXPECT_TRUE(IsNativeToken(NATIVE_TOKEN_ADDRESS));
    EXPECT_TRUE(IsNativeToken("0xEeeeeEeeeEeEeeEeEeEeeEEEeeeeEeeeeeeeEEeE"));
    EXPECT_FALSE(IsNativeToken(RECIPIENT));
}

TEST(CurrencyValueTest, NativeFormatsEther) {
    CurrencyValue cv = CurrencyValue::Native("1500000000000000000");
    EXPECT_EQ(cv.name, "Ether");
    EXPECT_EQ(cv.symbol, "ETH");
    EXPECT_EQ(cv.decimals, 18);
    EXPECT_EQ(cv.displayValue, "1.5");
}

TEST(CurrencyValueTest, FromJSONAcceptsStringOrNumberFields) {
    JSONValue json = JSONValue::Parse(
        R"({"name":"USD Coin","symbol":"USDC","decimals":"6","value":1234567})");
    CurrencyValue cv = CurrencyValue::FromJSON(json);
    EXPECT_EQ(cv.decimals, 6);
    EXPECT_EQ(cv.value, "1234567");
    EXPECT_EQ(cv.displayValue, "1.2346");

    JSONValue out = cv.ToJSON();
    EXPECT_EQ(out["decimals"].GetString(), "6");
    EXPECT_EQ(out["symbol"].GetString(), "USDC");

    EXPECT_EQ(CodeOf([] { CurrencyValue::FromJSON(JSONValue("1")); }),
              ErrorCode::InvalidArgument);
}

TEST(ConnectionTest, ToJSONOmitsUnsetOptionals) {
    WalletConnection connection;
    connection.provider = WalletProvider::Coinbase;
    connection.chainId = 5;
    JSONValue json = connection.ToJSON();
    EXPECT_EQ(json["provider"].GetString(), "Coinbase");
    EXPECT_EQ(json["chainId"].GetInt(), 5);
    EXPECT_FALSE(json.HasKey("password"));
    EXPECT_FALSE(json.HasKey("email"));

    connection.email = "player@example.com";
    EXPECT_EQ(connection.ToJSON()["email"].GetString(), "player@example.com");
}

// ============================================================================
// Local Wallet
// ============================================================================

class LocalProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir_.IsValid());
        options_.dataDir = (dir_.GetPath() / "profile").String();
        options_.scrypt.n = 1024;
        options_.scrypt.r = 1;
        options_.scrypt.p = 1;
        options_.deviceId = "test-device";
        node_ = std::make_shared<FakeRpcTransport>();
        provider_ = std::make_unique<LocalWalletProvider>(options_);
    }

    std::string ConnectTestKey() {
        return provider_->ConnectWithKey(TEST_KEY_HEX, 1, node_);
    }

    fs::TempDirectory dir_;
    KeystoreManager::Options options_;
    std::shared_ptr<FakeRpcTransport> node_;
    std::unique_ptr<LocalWalletProvider> provider_;
};

TEST_F(LocalProviderTest, ConnectWithKeyReturnsChecksumAddress) {
    EXPECT_FALSE(provider_->IsConnected());
    EXPECT_EQ(ConnectTestKey(), TEST_ADDRESS);
    EXPECT_TRUE(provider_->IsConnected());
    EXPECT_EQ(provider_->GetAddress(), TEST_ADDRESS);
    EXPECT_EQ(provider_->GetSignerAddress(), TEST_ADDRESS);
    ASSERT_NE(provider_->GetLocalAccount(), nullptr);
    EXPECT_EQ(provider_->GetLocalAccount()->chainId, 1u);
}

TEST_F(LocalProviderTest, ConnectCreatesKeystoreAccount) {
    WalletConnection connection;
    connection.password = "hunter2";
    std::string address = provider_->Connect(connection, node_);
    EXPECT_TRUE(IsValidAddress(address));
    EXPECT_TRUE(provider_->GetKeystore().HasStoredAccount());

    provider_->Disconnect();
    LocalWalletProvider again(options_);
    EXPECT_EQ(again.Connect(connection, node_), address);
}

TEST_F(LocalProviderTest, CapabilitiesRequireConnection) {
    EXPECT_EQ(CodeOf([&] { provider_->GetAddress(); }), ErrorCode::NotConnected);
    EXPECT_EQ(CodeOf([&] { provider_->PersonalSign("hi"); }), ErrorCode::NotConnected);
    EXPECT_EQ(CodeOf([&] { provider_->GetChainId(); }), ErrorCode::NotConnected);
    EXPECT_EQ(CodeOf([&] { provider_->TransferNative(RECIPIENT, "1"); }),
              ErrorCode::NotConnected);
}

TEST_F(LocalProviderTest, DisconnectIsIdempotent) {
    ConnectTestKey();
    provider_->Disconnect();
    provider_->Disconnect();
    EXPECT_FALSE(provider_->IsConnected());
    EXPECT_EQ(provider_->GetLocalAccount(), nullptr);
}

TEST_F(LocalProviderTest, PersonalSignRecoversToAccount) {
    ConnectTestKey();
    std::string sig = provider_->PersonalSign("hello");
    EXPECT_EQ(sig.size(), 2u + 130u);
    EXPECT_EQ(Recover(HashPersonalMessage("hello"), sig), TEST_ADDRESS);
}

TEST_F(LocalProviderTest, SignTypedDataRecoversToAccount) {
    ConnectTestKey();
    std::string sig = provider_->SignTypedDataV4(
        "0x2c7536e3605d9c16a7a3d7b1898e529396a65c23", TYPED_DOCUMENT);
    Hash256 digest = eip712::TypedData::FromJSON(JSONValue::Parse(TYPED_DOCUMENT)).SigningHash();
    EXPECT_EQ(Recover(digest, sig), TEST_ADDRESS);
}

TEST_F(LocalProviderTest, SignTypedDataRejectsForeignSignerAndBadDocument) {
    ConnectTestKey();
    EXPECT_EQ(CodeOf([&] { provider_->SignTypedDataV4(RECIPIENT, TYPED_DOCUMENT); }),
              ErrorCode::InvalidArgument);
    EXPECT_EQ(CodeOf([&] { provider_->SignTypedDataV4(TEST_ADDRESS, R"({"types":{}})"); }),
              ErrorCode::InvalidArgument);
}

TEST_F(LocalProviderTest, ChainIdComesFromNodeWhenAttached) {
    node_->Respond("eth_chainId", JSONValue("0x89"));
    ConnectTestKey();
    EXPECT_EQ(provider_->GetChainId(), 137u);

    LocalWalletProvider offline(options_);
    offline.ConnectWithKey(TEST_KEY_HEX, 5, nullptr);
    EXPECT_EQ(offline.GetChainId(), 5u);
}

TEST_F(LocalProviderTest, NativeBalance) {
    node_->Respond("eth_getBalance", JSONValue("0x14d1120d7b160000"));
    ConnectTestKey();
    CurrencyValue balance = provider_->GetNativeBalance();
    EXPECT_EQ(balance.symbol, "ETH");
    EXPECT_EQ(balance.value, "1500000000000000000");
    EXPECT_EQ(balance.displayValue, "1.5");

    JSONValue params = node_->LastParams("eth_getBalance");
    EXPECT_TRUE(AddressEquals(params[size_t{0}].GetString(), TEST_ADDRESS));
    EXPECT_EQ(params[1].GetString(), "latest");
}

TEST_F(LocalProviderTest, TransferSignsSubmitsAndWaits) {
    ScriptNodeForTransfer(*node_, 1, TX_HASH, TEST_ADDRESS, RECIPIENT);
    ConnectTestKey();

    TransactionResult result = provider_->TransferNative(RECIPIENT, "0.5");
    EXPECT_TRUE(result.IsSuccess());
    EXPECT_EQ(result.receipt.transactionHash, TX_HASH);
    EXPECT_EQ(result.receipt.transactionIndex, 3);
    EXPECT_EQ(result.receipt.gasUsed, "21000");

    EXPECT_EQ(node_->CallCount("eth_sendRawTransaction"), 1u);
    std::string raw = node_->LastParams("eth_sendRawTransaction")[size_t{0}].GetString();
    EXPECT_EQ(raw.substr(0, 4), "0xf8");

    JSONValue nonceParams = node_->LastParams("eth_getTransactionCount");
    EXPECT_EQ(nonceParams[1].GetString(), "pending");
}

TEST_F(LocalProviderTest, TransferKeepsCallerGasPrice) {
    ScriptNodeForTransfer(*node_, 1, TX_HASH, TEST_ADDRESS, RECIPIENT);
    ConnectTestKey();

    TransactionRequest request;
    request.to = RECIPIENT;
    request.value = "1";
    request.gasPrice = "1000000000";
    provider_->SendTransaction(request);
    EXPECT_EQ(node_->CallCount("eth_gasPrice"), 0u);
}

TEST_F(LocalProviderTest, TransferRejectsBadInput) {
    ConnectTestKey();
    EXPECT_EQ(CodeOf([&] { provider_->TransferNative("0x1234", "1"); }),
              ErrorCode::InvalidArgument);
    EXPECT_EQ(CodeOf([&] { provider_->TransferNative(RECIPIENT, "one"); }),
              ErrorCode::InvalidArgument);

    TransactionRequest request;
    request.from = RECIPIENT;
    request.to = TEST_ADDRESS;
    EXPECT_EQ(CodeOf([&] { provider_->SendTransaction(request); }),
              ErrorCode::InvalidArgument);
    EXPECT_EQ(node_->CallCount("eth_sendRawTransaction"), 0u);
}

TEST_F(LocalProviderTest, SendWithoutNodeIsTransportFailure) {
    provider_->ConnectWithKey(TEST_KEY_HEX, 1, nullptr);
    EXPECT_EQ(CodeOf([&] { provider_->TransferNative(RECIPIENT, "1"); }),
              ErrorCode::TransportFailure);
}

// ============================================================================
// External Signer
// ============================================================================

class ExternalProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        signer_ = std::make_shared<FakeRpcTransport>();
        signer_->Respond("eth_requestAccounts",
                         Accounts("0x2c7536e3605d9c16a7a3d7b1898e529396a65c23"));
    }

    std::shared_ptr<FakeRpcTransport> signer_;
};

TEST_F(ExternalProviderTest, ConnectRequestsAccounts) {
    ExternalSignerProvider provider(WalletProvider::Metamask, signer_);
    EXPECT_EQ(provider.Connect(WalletConnection(), nullptr), TEST_ADDRESS);
    EXPECT_TRUE(provider.IsConnected());
    EXPECT_EQ(provider.GetProvider(), WalletProvider::Metamask);
    EXPECT_EQ(signer_->LastParams("eth_requestAccounts").Size(), 0u);
}

TEST_F(ExternalProviderTest, EmailIsForwardedForEmailWallets) {
    ExternalSignerProvider provider(WalletProvider::MagicLink, signer_);
    WalletConnection connection;
    connection.provider = WalletProvider::MagicLink;
    connection.email = "player@example.com";
    provider.Connect(connection, nullptr);

    JSONValue params = signer_->LastParams("eth_requestAccounts");
    ASSERT_EQ(params.Size(), 1u);
    EXPECT_EQ(params[size_t{0}]["email"].GetString(), "player@example.com");
}

TEST_F(ExternalProviderTest, NoAccountsIsTransportFailure) {
    signer_->Respond("eth_requestAccounts", JSONValue::MakeArray());
    ExternalSignerProvider provider(WalletProvider::Injected, signer_);
    EXPECT_EQ(CodeOf([&] { provider.Connect(WalletConnection(), nullptr); }),
              ErrorCode::TransportFailure);
    EXPECT_FALSE(provider.IsConnected());

    signer_->Respond("eth_requestAccounts", Accounts("not-an-address"));
    EXPECT_EQ(CodeOf([&] { provider.Connect(WalletConnection(), nullptr); }),
              ErrorCode::TransportFailure);
}

TEST_F(ExternalProviderTest, PersonalSignSendsHexMessage) {
    signer_->Respond("personal_sign", JSONValue("0xsig"));
    ExternalSignerProvider provider(WalletProvider::Coinbase, signer_);
    provider.Connect(WalletConnection(), nullptr);

    EXPECT_EQ(provider.PersonalSign("hello"), "0xsig");
    JSONValue params = signer_->LastParams("personal_sign");
    EXPECT_EQ(params[size_t{0}].GetString(), "0x68656c6c6f");
    EXPECT_EQ(params[1].GetString(), TEST_ADDRESS);
}

TEST_F(ExternalProviderTest, SignTypedDataForwardsDocument) {
    signer_->Respond("eth_signTypedData_v4", JSONValue("0xtyped"));
    ExternalSignerProvider provider(WalletProvider::WalletConnect, signer_);
    provider.Connect(WalletConnection(), nullptr);

    EXPECT_EQ(provider.SignTypedDataV4(TEST_ADDRESS, TYPED_DOCUMENT), "0xtyped");
    JSONValue params = signer_->LastParams("eth_signTypedData_v4");
    EXPECT_EQ(params[size_t{0}].GetString(), TEST_ADDRESS);
    EXPECT_EQ(params[1].GetString(), TYPED_DOCUMENT);
}

TEST_F(ExternalProviderTest, EmptySignatureIsTransportFailure) {
    signer_->Respond("personal_sign", JSONValue(""));
    ExternalSignerProvider provider(WalletProvider::Metamask, signer_);
    provider.Connect(WalletConnection(), nullptr);
    EXPECT_EQ(CodeOf([&] { provider.PersonalSign("x"); }), ErrorCode::TransportFailure);
}

TEST_F(ExternalProviderTest, SendTransactionPollsSignerChannelWithoutNode) {
    signer_->Respond("eth_sendTransaction", JSONValue(TX_HASH));
    signer_->Respond("eth_getTransactionReceipt", MinedReceipt(TX_HASH, TEST_ADDRESS, RECIPIENT));
    ExternalSignerProvider provider(WalletProvider::Metamask, signer_);
    provider.Connect(WalletConnection(), nullptr);

    TransactionResult result = provider.TransferNative(RECIPIENT, "0.01");
    EXPECT_TRUE(result.IsSuccess());

    JSONValue tx = signer_->LastParams("eth_sendTransaction")[size_t{0}];
    EXPECT_EQ(tx["from"].GetString(), TEST_ADDRESS);
    EXPECT_EQ(tx["to"].GetString(), RECIPIENT);
    EXPECT_EQ(tx["value"].GetString(), "0x2386f26fc10000");
}

TEST_F(ExternalProviderTest, SeparateNodeReceivesReceiptPolls) {
    auto node = std::make_shared<FakeRpcTransport>();
    node->Respond("eth_getTransactionReceipt", MinedReceipt(TX_HASH, TEST_ADDRESS, RECIPIENT));
    signer_->Respond("eth_sendTransaction", JSONValue(TX_HASH));
    ExternalSignerProvider provider(WalletProvider::Metamask, signer_);
    provider.Connect(WalletConnection(), node);

    provider.TransferNative(RECIPIENT, "1");
    EXPECT_EQ(node->CallCount("eth_getTransactionReceipt"), 1u);
    EXPECT_EQ(signer_->CallCount("eth_getTransactionReceipt"), 0u);
}

TEST_F(ExternalProviderTest, DisconnectClearsAddress) {
    ExternalSignerProvider provider(WalletProvider::Metamask, signer_);
    provider.Connect(WalletConnection(), nullptr);
    provider.Disconnect();
    EXPECT_FALSE(provider.IsConnected());
    EXPECT_EQ(CodeOf([&] { provider.GetAddress(); }), ErrorCode::NotConnected);
}

// ============================================================================
// Smart Wallet
// ============================================================================

class SmartProviderTest : public LocalProviderTest {
protected:
    void SetUp() override {
        LocalProviderTest::SetUp();
        backend_ = std::make_shared<FakeSmartAccountBackend>(
            "0xfb6916095ca1df60bb79ce92ce3ea74c37c5d359");
        personal_ = std::make_shared<LocalWalletProvider>(options_);
        smart_ = std::make_unique<SmartWalletProvider>(personal_, backend_);
    }

    WalletConnection SmartConnection() const {
        WalletConnection connection;
        connection.provider = WalletProvider::SmartWallet;
        connection.personalWallet = WalletProvider::LocalWallet;
        connection.chainId = 1;
        connection.password = "smart-pass";
        return connection;
    }

    std::shared_ptr<FakeSmartAccountBackend> backend_;
    std::shared_ptr<LocalWalletProvider> personal_;
    std::unique_ptr<SmartWalletProvider> smart_;
};

TEST_F(SmartProviderTest, RejectsMissingCollaborators) {
    EXPECT_EQ(CodeOf([&] { SmartWalletProvider(nullptr, backend_); }),
              ErrorCode::InvalidArgument);
    EXPECT_EQ(CodeOf([&] { SmartWalletProvider(personal_, nullptr); }),
              ErrorCode::InvalidArgument);
}

TEST_F(SmartProviderTest, ConnectResolvesAccountThroughBackend) {
    EXPECT_EQ(smart_->Connect(SmartConnection(), node_), SMART_ACCOUNT);
    EXPECT_TRUE(smart_->IsConnected());
    EXPECT_EQ(smart_->GetAddress(), SMART_ACCOUNT);
    EXPECT_EQ(smart_->GetSignerAddress(), personal_->GetAddress());
    EXPECT_EQ(smart_->GetSignerProvider(), WalletProvider::LocalWallet);
    // Passes through the personal wallet's key
    ASSERT_NE(smart_->GetLocalAccount(), nullptr);
    EXPECT_EQ(smart_->GetLocalAccount(), personal_->GetLocalAccount());
    EXPECT_EQ(backend_->lastSigner, personal_->GetAddress());
    EXPECT_EQ(backend_->lastChainId, 1u);
}

TEST_F(SmartProviderTest, MalformedAccountDisconnectsSigner) {
    auto broken = std::make_shared<FakeSmartAccountBackend>("0xnope");
    SmartWalletProvider smart(personal_, broken);
    EXPECT_EQ(CodeOf([&] { smart.Connect(SmartConnection(), node_); }),
              ErrorCode::TransportFailure);
    EXPECT_FALSE(personal_->IsConnected());
    EXPECT_FALSE(smart.IsConnected());
}

TEST_F(SmartProviderTest, SigningDelegatesToPersonalWallet) {
    smart_->Connect(SmartConnection(), node_);
    std::string sig = smart_->PersonalSign("hello");
    EXPECT_EQ(Recover(HashPersonalMessage("hello"), sig), smart_->GetSignerAddress());
}

TEST_F(SmartProviderTest, TransferExecutesThroughBackend) {
    node_->Respond("eth_getTransactionReceipt",
                   MinedReceipt(backend_->txHash, SMART_ACCOUNT, RECIPIENT));
    smart_->Connect(SmartConnection(), node_);

    TransactionResult result = smart_->TransferNative(RECIPIENT, "2");
    EXPECT_TRUE(result.IsSuccess());
    EXPECT_EQ(result.receipt.transactionHash, backend_->txHash);
    EXPECT_EQ(backend_->executedFrom, SMART_ACCOUNT);
    EXPECT_EQ(backend_->executedTo, RECIPIENT);
    EXPECT_EQ(backend_->executedValue, "2000000000000000000");
    EXPECT_EQ(Recover(HashPersonalMessage(std::string("execute:") + RECIPIENT),
                      backend_->authorization),
              smart_->GetSignerAddress());
    EXPECT_EQ(node_->CallCount("eth_sendRawTransaction"), 0u);
}

TEST_F(SmartProviderTest, DisconnectDropsSigner) {
    smart_->Connect(SmartConnection(), node_);
    smart_->Disconnect();
    EXPECT_FALSE(smart_->IsConnected());
    EXPECT_FALSE(personal_->IsConnected());
}

// ============================================================================
// Bridge
// ============================================================================

class BridgeProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        bridge_ = std::make_shared<FakeBridge>(TEST_ADDRESS);
        bridge_->responses[routes::GET_ADDRESS] = JSONValue(TEST_ADDRESS);
        bridge_->responses[routes::IS_CONNECTED] = JSONValue(true);
        provider_ = std::make_unique<BridgeProvider>(WalletProvider::Metamask, bridge_);
    }

    std::shared_ptr<FakeBridge> bridge_;
    std::unique_ptr<BridgeProvider> provider_;
};

TEST_F(BridgeProviderTest, ConnectForwardsConnection) {
    WalletConnection connection;
    connection.chainId = 137;
    EXPECT_EQ(provider_->Connect(connection, nullptr), TEST_ADDRESS);
    EXPECT_EQ(bridge_->connects, 1);
    EXPECT_EQ(bridge_->lastConnection["chainId"].GetInt(), 137);
    EXPECT_TRUE(provider_->IsConnected());
    EXPECT_EQ(provider_->GetAddress(), TEST_ADDRESS);
}

TEST_F(BridgeProviderTest, RoutesRequireConnection) {
    EXPECT_FALSE(provider_->IsConnected());
    EXPECT_EQ(CodeOf([&] { provider_->GetAddress(); }), ErrorCode::NotConnected);
    EXPECT_EQ(CodeOf([&] { provider_->SwitchNetwork(5); }), ErrorCode::NotConnected);
    EXPECT_TRUE(bridge_->invocations.empty());
}

TEST_F(BridgeProviderTest, IsConnectedReadsFalseOnFailure) {
    provider_->Connect(WalletConnection(), nullptr);
    bridge_->failing.insert(routes::IS_CONNECTED);
    EXPECT_FALSE(provider_->IsConnected());

    bridge_->failing.clear();
    bridge_->responses[routes::IS_CONNECTED] = JSONValue("yes");
    EXPECT_FALSE(provider_->IsConnected());
}

TEST_F(BridgeProviderTest, DisconnectOnce) {
    provider_->Connect(WalletConnection(), nullptr);
    provider_->Disconnect();
    provider_->Disconnect();
    EXPECT_EQ(bridge_->disconnects, 1);
}

TEST_F(BridgeProviderTest, ChainIdMustBePositiveInteger) {
    provider_->Connect(WalletConnection(), nullptr);
    bridge_->responses[routes::GET_CHAIN_ID] = JSONValue(80001);
    EXPECT_EQ(provider_->GetChainId(), 80001u);

    bridge_->responses[routes::GET_CHAIN_ID] = JSONValue("1");
    EXPECT_EQ(CodeOf([&] { provider_->GetChainId(); }), ErrorCode::TransportFailure);
    bridge_->responses[routes::GET_CHAIN_ID] = JSONValue(0);
    EXPECT_EQ(CodeOf([&] { provider_->GetChainId(); }), ErrorCode::TransportFailure);
}

TEST_F(BridgeProviderTest, SigningRoutes) {
    provider_->Connect(WalletConnection(), nullptr);
    bridge_->responses[routes::SIGN] = JSONValue("0xsig");
    bridge_->responses[routes::SIGN_TYPED_DATA] = JSONValue("0xtyped");

    EXPECT_EQ(provider_->PersonalSign("hello"), "0xsig");
    EXPECT_EQ(bridge_->LastArgs(routes::SIGN), std::vector<std::string>{"hello"});

    EXPECT_EQ(provider_->SignTypedDataV4(TEST_ADDRESS, "{}"), "0xtyped");
    EXPECT_EQ(bridge_->LastArgs(routes::SIGN_TYPED_DATA),
              (std::vector<std::string>{TEST_ADDRESS, "{}"}));

    bridge_->responses[routes::SIGN] = JSONValue(42);
    EXPECT_EQ(CodeOf([&] { provider_->PersonalSign("x"); }), ErrorCode::TransportFailure);
}

TEST_F(BridgeProviderTest, TransferAndBalanceUseNativeToken) {
    provider_->Connect(WalletConnection(), nullptr);
    bridge_->responses[routes::TRANSFER] = JSONValue::Parse(
        R"({"id":"1","receipt":{"transactionHash":"0xabc","transactionIndex":2}})");
    bridge_->responses[routes::BALANCE] = JSONValue::Parse(
        R"({"name":"Ether","symbol":"ETH","decimals":18,"value":"2000000000000000000"})");

    TransactionResult result = provider_->TransferNative(RECIPIENT, "0.1");
    EXPECT_TRUE(result.IsSuccess());
    EXPECT_EQ(result.receipt.transactionHash, "0xabc");
    EXPECT_EQ(result.receipt.transactionIndex, 2);
    EXPECT_EQ(bridge_->LastArgs(routes::TRANSFER),
              (std::vector<std::string>{RECIPIENT, "0.1", NATIVE_TOKEN_ADDRESS}));

    CurrencyValue balance = provider_->GetNativeBalance();
    EXPECT_EQ(balance.displayValue, "2");
    EXPECT_EQ(bridge_->LastArgs(routes::BALANCE),
              std::vector<std::string>{NATIVE_TOKEN_ADDRESS});
}

TEST_F(BridgeProviderTest, SendTransactionSerializesRequest) {
    provider_->Connect(WalletConnection(), nullptr);
    bridge_->responses[routes::SEND_RAW_TRANSACTION] = JSONValue::Parse(R"({"id":"0"})");

    TransactionRequest request;
    request.from = TEST_ADDRESS;
    request.to = RECIPIENT;
    request.value = "7";
    TransactionResult result = provider_->SendTransaction(request);
    EXPECT_FALSE(result.IsSuccess());
    EXPECT_EQ(result.id, "0");

    std::vector<std::string> args = bridge_->LastArgs(routes::SEND_RAW_TRANSACTION);
    ASSERT_EQ(args.size(), 1u);
    JSONValue tx = JSONValue::Parse(args[0]);
    EXPECT_EQ(tx["to"].GetString(), RECIPIENT);
    EXPECT_EQ(tx["value"].GetString(), "7");
}

TEST_F(BridgeProviderTest, FundWalletFillsAddress) {
    provider_->Connect(WalletConnection(), nullptr);
    FundWalletOptions options;
    options.appName = "Demo";
    options.chainId = 137;
    options.assets = {"USDC"};
    provider_->FundWallet(options);
    EXPECT_EQ(bridge_->lastFund["address"].GetString(), TEST_ADDRESS);
    EXPECT_EQ(bridge_->lastFund["appName"].GetString(), "Demo");
    EXPECT_EQ(bridge_->lastFund["assets"][size_t{0}].GetString(), "USDC");
}

TEST_F(BridgeProviderTest, SwitchNetworkReachesBridge) {
    provider_->Connect(WalletConnection(), nullptr);
    provider_->SwitchNetwork(10);
    EXPECT_EQ(bridge_->switchedTo, 10u);
}

TEST(BridgeProviderCtorTest, RejectsNullBridge) {
    EXPECT_EQ(CodeOf([] { BridgeProvider(WalletProvider::Metamask, nullptr); }),
              ErrorCode::InvalidArgument);
}

// ============================================================================
// Factory
// ============================================================================

class ProviderFactoryTest : public ::testing::Test {
protected:
    WalletConnection ConnectionFor(WalletProvider kind) const {
        WalletConnection connection;
        connection.provider = kind;
        return connection;
    }

    ProviderDependencies deps_;
};

TEST_F(ProviderFactoryTest, LocalWalletNeedsNothing) {
    ProviderFactory factory(deps_);
    auto provider = factory.Create(ConnectionFor(WalletProvider::LocalWallet));
    EXPECT_NE(std::dynamic_pointer_cast<LocalWalletProvider>(provider), nullptr);
}

TEST_F(ProviderFactoryTest, ExternalSignerNeedsChannel) {
    EXPECT_EQ(CodeOf([&] {
                  ProviderFactory(deps_).Create(ConnectionFor(WalletProvider::Metamask));
              }),
              ErrorCode::UnsupportedOnPlatform);

    deps_.signerChannels[WalletProvider::Metamask] = std::make_shared<FakeRpcTransport>();
    auto provider = ProviderFactory(deps_).Create(ConnectionFor(WalletProvider::Metamask));
    ASSERT_NE(std::dynamic_pointer_cast<ExternalSignerProvider>(provider), nullptr);
    EXPECT_EQ(provider->GetProvider(), WalletProvider::Metamask);
}

TEST_F(ProviderFactoryTest, SmartWalletNeedsBackendAndNonSmartSigner) {
    WalletConnection connection = ConnectionFor(WalletProvider::SmartWallet);
    EXPECT_EQ(CodeOf([&] { ProviderFactory(deps_).Create(connection); }),
              ErrorCode::UnsupportedOnPlatform);

    deps_.smartAccountBackend = std::make_shared<FakeSmartAccountBackend>(SMART_ACCOUNT);
    connection.personalWallet = WalletProvider::SmartWallet;
    EXPECT_EQ(CodeOf([&] { ProviderFactory(deps_).Create(connection); }),
              ErrorCode::InvalidArgument);

    connection.personalWallet = WalletProvider::LocalWallet;
    auto provider = ProviderFactory(deps_).Create(connection);
    EXPECT_NE(std::dynamic_pointer_cast<SmartWalletProvider>(provider), nullptr);
}

TEST_F(ProviderFactoryTest, BridgeWinsForEveryKind) {
    deps_.bridge = std::make_shared<FakeBridge>(TEST_ADDRESS);
    ProviderFactory factory(deps_);
    EXPECT_TRUE(factory.HasBridge());
    for (WalletProvider kind : {WalletProvider::LocalWallet, WalletProvider::SmartWallet,
                                WalletProvider::Paper}) {
        auto provider = factory.Create(ConnectionFor(kind));
        ASSERT_NE(std::dynamic_pointer_cast<BridgeProvider>(provider), nullptr);
        EXPECT_EQ(provider->GetProvider(), kind);
    }
}

} // namespace
} // namespace wallet
} // namespace ethwallet
