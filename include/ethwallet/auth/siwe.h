// ETHWALLET - Sign-In With Ethereum
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// EIP-4361 challenge messages, login payloads, and the per-session store
// of the last issued challenge.

#ifndef ETHWALLET_AUTH_SIWE_H
#define ETHWALLET_AUTH_SIWE_H

#include "ethwallet/core/json.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ethwallet {
namespace auth {

// ============================================================================
// Constants
// ============================================================================

constexpr const char* SIWE_STATEMENT =
    "Please ensure that the domain above matches the URL of the current website.";

constexpr const char* SIWE_VERSION = "1";

/// Challenge lifetime
constexpr int64_t DEFAULT_SIWE_EXPIRY_SECONDS = 300;

// ============================================================================
// SIWE Message
// ============================================================================

struct SiweMessage {
    std::string domain;
    std::string address;
    std::string statement;
    std::string uri;
    std::string version{SIWE_VERSION};
    std::string chainId;
    std::string nonce;
    std::string issuedAt;
    std::string expirationTime;
    std::string notBefore;
    std::vector<std::string> resources;

    /**
     * EIP-4361 text:
     *
     *   {domain} wants you to sign in with your Ethereum account:
     *   {address}
     *
     *   {statement}
     *
     *   URI: {uri}
     *   ...
     *
     * Optional lines are omitted when empty.
     */
    std::string Render() const;

    /// notBefore <= now < expirationTime; unparseable timestamps are invalid
    bool IsWithinValidity(int64_t nowMs) const;

    bool operator==(const SiweMessage& other) const { return Render() == other.Render(); }
    bool operator!=(const SiweMessage& other) const { return !(*this == other); }
};

// ============================================================================
// Login Payload
// ============================================================================

/**
 * Signed challenge handed to a verifier.
 * JSON: {"signature": ..., "payload": {"domain", "address", "statement",
 * "uri", "version", "chain_id", "nonce", "issued_at", "expiration_time",
 * "invalid_before", "resources"}}
 */
struct LoginPayload {
    std::string signature;
    SiweMessage payload;

    JSONValue ToJSON() const;

    /// @throws WalletError(InvalidArgument) if required members are missing
    static LoginPayload FromJSON(const JSONValue& json);
};

// ============================================================================
// Session Store
// ============================================================================

/**
 * Holds the last challenge issued in this session. Issuing a new one
 * replaces it; a successful verification consumes it.
 */
class SiweSessionStore {
public:
    void Store(const SiweMessage& message) { last_ = message; }

    /// Whether `message` renders identically to the stored challenge
    bool Matches(const SiweMessage& message) const;

    void Consume() { last_.reset(); }

    const std::optional<SiweMessage>& GetLastIssued() const { return last_; }

private:
    std::optional<SiweMessage> last_;
};

// ============================================================================
// User Registry
// ============================================================================

/**
 * Decides whether a claimed address may sign in.
 */
class IUserRegistry {
public:
    virtual ~IUserRegistry() = default;
    virtual bool IsRegistered(const SiweMessage& message) = 0;
};

/// Registry that admits every address
class AllowAllUserRegistry : public IUserRegistry {
public:
    bool IsRegistered(const SiweMessage&) override { return true; }
};

using UserRegistryPtr = std::shared_ptr<IUserRegistry>;

} // namespace auth
} // namespace ethwallet

#endif // ETHWALLET_AUTH_SIWE_H
