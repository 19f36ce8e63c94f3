// ETHWALLET - Transactions Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/wallet/transaction.h"
#include "ethwallet/core/errors.h"
#include "ethwallet/core/hex.h"
#include "ethwallet/core/rlp.h"
#include "ethwallet/core/units.h"
#include "ethwallet/crypto/keccak.h"

#include <stdexcept>

namespace ethwallet {
namespace wallet {

namespace {

/// Quantity member of a node object as decimal, or fallback if absent
std::string DecimalMember(const JSONValue& obj, const char* key, const std::string& fallback) {
    const JSONValue& v = obj[key];
    if (v.IsString() && !v.GetString().empty()) {
        return NormalizeQuantity(v.GetString());
    }
    if (v.IsInt()) {
        return std::to_string(v.GetInt());
    }
    return fallback;
}

std::string StringMember(const JSONValue& obj, const char* key) {
    const JSONValue& v = obj[key];
    return v.IsString() ? v.GetString() : std::string();
}

Bytes EncodeQuantity(const std::string& quantity) {
    return rlp::EncodeBytes(QuantityToBytes(quantity.empty() ? "0" : quantity));
}

} // anonymous namespace

// ============================================================================
// TransactionRequest
// ============================================================================

JSONValue TransactionRequest::ToRpcJSON() const {
    JSONValue tx = JSONValue::MakeObject();
    if (!from.empty()) tx["from"] = from;
    if (!to.empty()) tx["to"] = to;
    if (!data.empty()) tx["data"] = HasHexPrefix(data) ? data : "0x" + data;
    if (!value.empty()) tx["value"] = DecimalToHexQuantity(value);
    if (!gasLimit.empty()) tx["gas"] = DecimalToHexQuantity(gasLimit);
    if (!gasPrice.empty()) tx["gasPrice"] = DecimalToHexQuantity(gasPrice);
    return tx;
}

// ============================================================================
// TransactionResult
// ============================================================================

TransactionResult TransactionResult::FromReceipt(const JSONValue& receipt) {
    TransactionResult result;
    if (!receipt.IsObject()) {
        return result;
    }

    result.receipt.from = StringMember(receipt, "from");
    result.receipt.to = StringMember(receipt, "to");
    result.receipt.blockHash = StringMember(receipt, "blockHash");
    result.receipt.transactionHash = StringMember(receipt, "transactionHash");

    std::string index = DecimalMember(receipt, "transactionIndex", "");
    if (!index.empty()) {
        result.receipt.transactionIndex = static_cast<int64_t>(QuantityToUint64(index));
    }
    result.receipt.gasUsed = DecimalMember(receipt, "gasUsed", NO_GAS_USED);
    result.id = DecimalMember(receipt, "status", NO_STATUS);
    return result;
}

JSONValue TransactionResult::ToJSON() const {
    JSONValue r = JSONValue::MakeObject();
    r["from"] = receipt.from;
    r["to"] = receipt.to;
    r["transactionIndex"] = receipt.transactionIndex;
    r["gasUsed"] = receipt.gasUsed;
    r["blockHash"] = receipt.blockHash;
    r["transactionHash"] = receipt.transactionHash;

    JSONValue out = JSONValue::MakeObject();
    out["receipt"] = std::move(r);
    out["id"] = id;
    return out;
}

TransactionResult TransactionResult::FromJSON(const JSONValue& json) {
    TransactionResult result;
    const JSONValue& r = json["receipt"];
    if (r.IsObject()) {
        result.receipt.from = StringMember(r, "from");
        result.receipt.to = StringMember(r, "to");
        if (r["transactionIndex"].IsInt()) {
            result.receipt.transactionIndex = r["transactionIndex"].GetInt();
        }
        if (r["gasUsed"].IsString()) {
            result.receipt.gasUsed = r["gasUsed"].GetString();
        }
        result.receipt.blockHash = StringMember(r, "blockHash");
        result.receipt.transactionHash = StringMember(r, "transactionHash");
    }
    if (json["id"].IsString()) {
        result.id = json["id"].GetString();
    }
    return result;
}

// ============================================================================
// LegacyTransaction
// ============================================================================

LegacyTransaction LegacyTransaction::FromRequest(const TransactionRequest& request,
                                                 uint64_t nonce, ChainId chainId) {
    LegacyTransaction tx;
    tx.nonce = nonce;
    tx.chainId = chainId;
    if (!request.to.empty()) {
        tx.to = Address::Parse(request.to);
    }
    tx.value = request.value.empty() ? "0" : NormalizeQuantity(request.value);
    tx.gasPrice = request.gasPrice.empty() ? "0" : NormalizeQuantity(request.gasPrice);
    if (!request.gasLimit.empty()) {
        tx.gasLimit = NormalizeQuantity(request.gasLimit);
    }
    if (!request.data.empty()) {
        tx.data = HexToBytes(request.data);
    }
    return tx;
}

std::vector<Bytes> LegacyTransaction::EncodeFields() const {
    std::vector<Bytes> fields;
    fields.push_back(rlp::EncodeUint(nonce));
    fields.push_back(EncodeQuantity(gasPrice));
    fields.push_back(EncodeQuantity(gasLimit));
    fields.push_back(rlp::EncodeBytes(to ? to->ToBytes() : Bytes{}));
    fields.push_back(EncodeQuantity(value));
    fields.push_back(rlp::EncodeBytes(data));
    return fields;
}

Hash256 LegacyTransaction::SigningHash() const {
    std::vector<Bytes> fields = EncodeFields();
    fields.push_back(rlp::EncodeUint(chainId));
    fields.push_back(rlp::EncodeUint(0));
    fields.push_back(rlp::EncodeUint(0));
    return Keccak256Hash(rlp::EncodeList(fields));
}

Bytes LegacyTransaction::Serialize(const RecoverableSignature& sig) const {
    auto trim = [](const std::array<Byte, 32>& word) {
        size_t i = 0;
        while (i < word.size() && word[i] == 0) ++i;
        return Bytes(word.begin() + i, word.end());
    };

    std::vector<Bytes> fields = EncodeFields();
    fields.push_back(rlp::EncodeUint(static_cast<uint64_t>(sig.recid) + chainId * 2 + 35));
    fields.push_back(rlp::EncodeBytes(trim(sig.r)));
    fields.push_back(rlp::EncodeBytes(trim(sig.s)));
    return rlp::EncodeList(fields);
}

Bytes LegacyTransaction::Sign(const PrivateKey& key) const {
    auto sig = key.Sign(SigningHash());
    if (!sig) {
        throw WalletError(ErrorCode::SigningFailed, "Failed to sign transaction");
    }
    return Serialize(*sig);
}

} // namespace wallet
} // namespace ethwallet
