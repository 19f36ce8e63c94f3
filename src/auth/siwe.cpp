// ETHWALLET - Sign-In With Ethereum Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/auth/siwe.h"
#include "ethwallet/core/errors.h"
#include "ethwallet/util/time.h"

#include <sstream>

namespace ethwallet {
namespace auth {

namespace {

std::string RequiredString(const JSONValue& obj, const char* key) {
    const JSONValue& v = obj[key];
    if (!v.IsString()) {
        throw WalletError(ErrorCode::InvalidArgument,
                          std::string("Login payload is missing ") + key);
    }
    return v.GetString();
}

/// Optional members may be absent or null
std::string OptionalString(const JSONValue& obj, const char* key) {
    const JSONValue& v = obj[key];
    return v.IsString() ? v.GetString() : std::string();
}

} // anonymous namespace

// ============================================================================
// SiweMessage
// ============================================================================

std::string SiweMessage::Render() const {
    std::ostringstream ss;
    ss << domain << " wants you to sign in with your Ethereum account:\n";
    ss << address << "\n\n";
    if (!statement.empty()) {
        ss << statement << "\n\n";
    }
    ss << "URI: " << uri << "\n";
    ss << "Version: " << version << "\n";
    ss << "Chain ID: " << chainId << "\n";
    ss << "Nonce: " << nonce << "\n";
    ss << "Issued At: " << issuedAt;
    if (!expirationTime.empty()) {
        ss << "\nExpiration Time: " << expirationTime;
    }
    if (!notBefore.empty()) {
        ss << "\nNot Before: " << notBefore;
    }
    if (!resources.empty()) {
        ss << "\nResources:";
        for (const auto& r : resources) {
            ss << "\n- " << r;
        }
    }
    return ss.str();
}

bool SiweMessage::IsWithinValidity(int64_t nowMs) const {
    if (!notBefore.empty()) {
        auto start = util::ParseISO8601(notBefore);
        if (!start || nowMs < *start) {
            return false;
        }
    }
    if (!expirationTime.empty()) {
        auto end = util::ParseISO8601(expirationTime);
        if (!end || nowMs >= *end) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// LoginPayload
// ============================================================================

JSONValue LoginPayload::ToJSON() const {
    JSONValue data = JSONValue::MakeObject();
    data["domain"] = payload.domain;
    data["address"] = payload.address;
    data["statement"] = payload.statement;
    data["uri"] = payload.uri;
    data["version"] = payload.version;
    data["chain_id"] = payload.chainId;
    data["nonce"] = payload.nonce;
    data["issued_at"] = payload.issuedAt;
    data["expiration_time"] = payload.expirationTime;
    data["invalid_before"] = payload.notBefore;

    JSONValue resources = JSONValue::MakeArray();
    for (const auto& r : payload.resources) {
        resources.Push(JSONValue(r));
    }
    data["resources"] = std::move(resources);

    JSONValue json = JSONValue::MakeObject();
    json["signature"] = signature;
    json["payload"] = std::move(data);
    return json;
}

LoginPayload LoginPayload::FromJSON(const JSONValue& json) {
    const JSONValue& data = json["payload"];
    if (!json.IsObject() || !data.IsObject()) {
        throw WalletError(ErrorCode::InvalidArgument, "Login payload must be an object");
    }

    LoginPayload lp;
    lp.signature = RequiredString(json, "signature");
    lp.payload.domain = RequiredString(data, "domain");
    lp.payload.address = RequiredString(data, "address");
    lp.payload.statement = OptionalString(data, "statement");
    lp.payload.uri = RequiredString(data, "uri");
    lp.payload.version = RequiredString(data, "version");
    lp.payload.nonce = RequiredString(data, "nonce");
    lp.payload.issuedAt = RequiredString(data, "issued_at");
    lp.payload.expirationTime = OptionalString(data, "expiration_time");
    lp.payload.notBefore = OptionalString(data, "invalid_before");

    // Some verifiers send the chain id as a number
    const JSONValue& chain = data["chain_id"];
    lp.payload.chainId = chain.IsInt() ? std::to_string(chain.GetInt()) : RequiredString(data, "chain_id");

    for (const auto& r : data["resources"].GetArray()) {
        if (r.IsString()) {
            lp.payload.resources.push_back(r.GetString());
        }
    }
    return lp;
}

// ============================================================================
// SiweSessionStore
// ============================================================================

bool SiweSessionStore::Matches(const SiweMessage& message) const {
    return last_.has_value() && *last_ == message;
}

} // namespace auth
} // namespace ethwallet
