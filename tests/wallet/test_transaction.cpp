// ETHWALLET - Transaction Tests
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include <gtest/gtest.h>

#include "ethwallet/wallet/transaction.h"
#include "ethwallet/core/hex.h"
#include "ethwallet/core/rlp.h"

#include <algorithm>
#include <stdexcept>

namespace ethwallet {
namespace wallet {
namespace {

/// The example transaction from EIP-155
LegacyTransaction Eip155Example() {
    TransactionRequest request;
    request.to = "0x3535353535353535353535353535353535353535";
    request.value = "1000000000000000000";
    request.gasPrice = "20000000000";
    request.gasLimit = "21000";
    return LegacyTransaction::FromRequest(request, 9, 1);
}

// ============================================================================
// EIP-155 Signing
// ============================================================================

TEST(LegacyTransactionTest, Eip155SigningHash) {
    EXPECT_EQ(Eip155Example().SigningHash().ToHex(),
              "0xdaf5a779ae972f972197303d7b574746c7ef83eadac0f2791ad23db92e4c8e53");
}

TEST(LegacyTransactionTest, Eip155SerializeKnownSignature) {
    RecoverableSignature sig;
    Bytes r = HexToBytes("28ef61340bd939bc2195fe537567866003e1a15d3c71ff63e1590620aa636276");
    Bytes s = HexToBytes("67cbe9d8997f761aecb703304b3800ccf555c9f3dc64214b297fb1966a3b6d83");
    std::copy(r.begin(), r.end(), sig.r.begin());
    std::copy(s.begin(), s.end(), sig.s.begin());
    sig.recid = 0;

    EXPECT_EQ(ToHexPrefixed(Eip155Example().Serialize(sig)),
              "0xf86c098504a817c800825208943535353535353535353535353535353535353535880de0b6b3a7"
              "6400008025a028ef61340bd939bc2195fe537567866003e1a15d3c71ff63e1590620aa636276a067"
              "cbe9d8997f761aecb703304b3800ccf555c9f3dc64214b297fb1966a3b6d83");
}

TEST(LegacyTransactionTest, SignedTransactionRecoversSender) {
    auto key = PrivateKey::FromHex(
        "0x4646464646464646464646464646464646464646464646464646464646464646");
    ASSERT_TRUE(key.has_value());

    LegacyTransaction tx = Eip155Example();
    Bytes raw = tx.Sign(*key);

    auto decoded = rlp::Decode(raw);
    ASSERT_TRUE(decoded.has_value());
    ASSERT_TRUE(decoded->isList);
    ASSERT_EQ(decoded->items.size(), 9u);

    // v = recid + chainId * 2 + 35
    ASSERT_EQ(decoded->items[6].bytes.size(), 1u);
    int v = decoded->items[6].bytes[0];
    ASSERT_TRUE(v == 37 || v == 38);

    RecoverableSignature sig;
    const Bytes& r = decoded->items[7].bytes;
    const Bytes& s = decoded->items[8].bytes;
    std::copy(r.begin(), r.end(), sig.r.begin() + (32 - r.size()));
    std::copy(s.begin(), s.end(), sig.s.begin() + (32 - s.size()));
    sig.recid = v - 37;

    auto pub = PublicKey::Recover(tx.SigningHash(), sig);
    ASSERT_TRUE(pub.has_value());
    EXPECT_EQ(pub->GetAddress(), key->GetAddress());
}

TEST(LegacyTransactionTest, ChainIdChangesHash) {
    LegacyTransaction a = Eip155Example();
    LegacyTransaction b = a;
    b.chainId = 5;
    EXPECT_NE(a.SigningHash(), b.SigningHash());
}

TEST(LegacyTransactionTest, FromRequestDefaults) {
    TransactionRequest request;
    request.data = "0xa9059cbb";
    request.value = "0x10";
    LegacyTransaction tx = LegacyTransaction::FromRequest(request, 0, 137);

    EXPECT_FALSE(tx.to.has_value());
    EXPECT_EQ(tx.value, "16");
    EXPECT_EQ(tx.gasPrice, "0");
    EXPECT_EQ(tx.gasLimit, "21000");
    EXPECT_EQ(tx.data, (Bytes{0xa9, 0x05, 0x9c, 0xbb}));
    EXPECT_EQ(tx.chainId, 137u);
}

TEST(LegacyTransactionTest, FromRequestRejectsMalformed) {
    TransactionRequest badTo;
    badTo.to = "0x1234";
    EXPECT_THROW(LegacyTransaction::FromRequest(badTo, 0, 1), std::invalid_argument);

    TransactionRequest badValue;
    badValue.value = "1.5";
    EXPECT_THROW(LegacyTransaction::FromRequest(badValue, 0, 1), std::invalid_argument);
}

// ============================================================================
// Requests
// ============================================================================

TEST(TransactionRequestTest, ToRpcJSON) {
    TransactionRequest request;
    request.from = "0xaaaa";
    request.to = "0xbbbb";
    request.value = "1000000000000000000";
    request.gasLimit = "21000";
    request.data = "deadbeef";

    JSONValue json = request.ToRpcJSON();
    EXPECT_EQ(json["value"].GetString(), "0xde0b6b3a7640000");
    EXPECT_EQ(json["gas"].GetString(), "0x5208");
    EXPECT_EQ(json["data"].GetString(), "0xdeadbeef");
    EXPECT_FALSE(json.HasKey("gasPrice"));
}

// ============================================================================
// Results
// ============================================================================

TEST(TransactionResultTest, FromReceipt) {
    JSONValue receipt = JSONValue::Parse(R"({
        "from": "0x1111111111111111111111111111111111111111",
        "to": "0x2222222222222222222222222222222222222222",
        "transactionIndex": "0x1f",
        "gasUsed": "0x5208",
        "blockHash": "0xabc",
        "transactionHash": "0xdef",
        "status": "0x1"
    })");

    TransactionResult result = TransactionResult::FromReceipt(receipt);
    EXPECT_EQ(result.receipt.from, "0x1111111111111111111111111111111111111111");
    EXPECT_EQ(result.receipt.transactionIndex, 31);
    EXPECT_EQ(result.receipt.gasUsed, "21000");
    EXPECT_EQ(result.receipt.blockHash, "0xabc");
    EXPECT_EQ(result.receipt.transactionHash, "0xdef");
    EXPECT_EQ(result.id, "1");
    EXPECT_TRUE(result.IsSuccess());
}

TEST(TransactionResultTest, MissingReceiptKeepsSentinels) {
    TransactionResult result = TransactionResult::FromReceipt(JSONValue());
    EXPECT_EQ(result.receipt.transactionIndex, NO_TRANSACTION_INDEX);
    EXPECT_EQ(result.receipt.gasUsed, NO_GAS_USED);
    EXPECT_EQ(result.id, NO_STATUS);
    EXPECT_FALSE(result.IsSuccess());

    // Pre-Byzantium receipts carry no status
    TransactionResult noStatus = TransactionResult::FromReceipt(
        JSONValue::Parse(R"({"transactionHash":"0x1","gasUsed":"0x1"})"));
    EXPECT_EQ(noStatus.id, "-1");
    EXPECT_EQ(noStatus.receipt.gasUsed, "1");
}

TEST(TransactionResultTest, JSONRoundTrip) {
    TransactionResult result;
    result.receipt.from = "0x1";
    result.receipt.to = "0x2";
    result.receipt.transactionIndex = 4;
    result.receipt.gasUsed = "50000";
    result.receipt.blockHash = "0xb";
    result.receipt.transactionHash = "0xt";
    result.id = "0";

    JSONValue json = result.ToJSON();
    EXPECT_EQ(json["receipt"]["transactionIndex"].GetInt(), 4);
    EXPECT_EQ(json["id"].GetString(), "0");

    TransactionResult back = TransactionResult::FromJSON(json);
    EXPECT_EQ(back.receipt.transactionHash, "0xt");
    EXPECT_EQ(back.receipt.gasUsed, "50000");
    EXPECT_EQ(back.receipt.transactionIndex, 4);
    EXPECT_EQ(back.id, "0");

    TransactionResult empty = TransactionResult::FromJSON(JSONValue::MakeObject());
    EXPECT_EQ(empty.id, NO_STATUS);
    EXPECT_EQ(empty.receipt.transactionIndex, NO_TRANSACTION_INDEX);
}

} // namespace
} // namespace wallet
} // namespace ethwallet
