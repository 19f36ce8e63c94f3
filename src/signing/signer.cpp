// ETHWALLET - Message Signing Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/signing/signer.h"
#include "ethwallet/core/base64.h"
#include "ethwallet/core/errors.h"
#include "ethwallet/core/hex.h"
#include "ethwallet/crypto/keys.h"
#include "ethwallet/util/logging.h"

#include <stdexcept>

namespace ethwallet {
namespace signing {

namespace LogCategory = util::LogCategory;
using wallet::WalletProvider;

// ============================================================================
// Typed Data Normalization
// ============================================================================

std::string TypedValueToString(const JSONValue& value) {
    if (value.IsString()) return value.GetString();
    if (value.IsInt()) return std::to_string(value.GetInt());
    if (value.IsBigInt()) return value.GetIntegerText();
    if (value.IsBool()) return value.GetBool() ? "true" : "false";
    if (value.IsNull()) return "";
    return value.ToJSON();
}

JSONValue NormalizeTypedDataForRemote(const eip712::TypedData& typedData) {
    JSONValue doc = typedData.ToJSON();
    if (!typedData.message.IsObject()) {
        return doc;
    }

    JSONValue message = JSONValue::MakeObject();
    for (const auto& [name, value] : typedData.message.GetObject()) {
        if (name == "uid" && value.IsString()) {
            try {
                message[name] = ToHexPrefixed(DecodeBase64(value.GetString()));
            } catch (const std::invalid_argument& e) {
                throw WalletError(ErrorCode::InvalidArgument,
                                  std::string("uid is not valid base64: ") + e.what());
            }
        } else {
            message[name] = TypedValueToString(value);
        }
    }
    doc["message"] = std::move(message);
    return doc;
}

// ============================================================================
// Recovery
// ============================================================================

std::string RecoverAddress(const std::string& message, const std::string& signature) {
    auto sig = RecoverableSignature::FromHex(signature);
    if (!sig) {
        throw WalletError(ErrorCode::InvalidArgument, "Malformed signature");
    }
    auto pubkey = PublicKey::Recover(HashPersonalMessage(message), *sig);
    if (!pubkey) {
        throw WalletError(ErrorCode::SigningFailed, "Signature does not recover to a key");
    }
    return pubkey->GetAddress().ToChecksumString();
}

// ============================================================================
// Signer
// ============================================================================

std::string Signer::Sign(const std::string& message) {
    wallet::IWalletProvider& provider = session_.ActiveProvider();
    LOG_DEBUG(LogCategory::SIGNING) << "Personal sign by "
                                    << util::LogAddress(provider.GetSignerAddress());
    return provider.PersonalSign(message);
}

std::string Signer::SignTypedData(const JSONValue& message, const eip712::TypedData& typeDefinition) {
    eip712::TypedData doc = typeDefinition;
    doc.message = message;
    return SignTypedData(doc);
}

std::string Signer::SignTypedData(const eip712::TypedData& typedData) {
    wallet::IWalletProvider& provider = session_.ActiveProvider();

    if (provider.GetSignerProvider() == WalletProvider::LocalWallet) {
        const wallet::LocalAccount* account = provider.GetLocalAccount();
        if (account == nullptr) {
            throw WalletError(ErrorCode::NoLocalAccount, "No local account found");
        }

        Hash256 digest;
        try {
            digest = typedData.SigningHash();
        } catch (const std::invalid_argument& e) {
            throw WalletError(ErrorCode::InvalidArgument, std::string("Invalid typed data: ") + e.what());
        }

        auto sig = account->key.Sign(digest);
        if (!sig) {
            throw WalletError(ErrorCode::SigningFailed, "Failed to sign typed data");
        }
        LOG_DEBUG(LogCategory::SIGNING) << "Signed " << typedData.primaryType << " locally";
        return sig->ToHex();
    }

    const std::string signer = provider.GetSignerAddress();
    std::string json = NormalizeTypedDataForRemote(typedData).ToJSON();
    LOG_DEBUG(LogCategory::SIGNING) << "Requesting " << typedData.primaryType << " signature from "
                                    << wallet::WalletProviderToString(provider.GetSignerProvider());
    return provider.SignTypedDataV4(signer, json);
}

} // namespace signing
} // namespace ethwallet
