// ETHWALLET - SIWE Authenticator
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#ifndef ETHWALLET_AUTH_AUTHENTICATOR_H
#define ETHWALLET_AUTH_AUTHENTICATOR_H

#include "ethwallet/auth/siwe.h"
#include "ethwallet/signing/signer.h"
#include "ethwallet/wallet/session.h"

#include <cstdint>
#include <string>

namespace ethwallet {
namespace auth {

// ============================================================================
// Verification Result
// ============================================================================

enum class VerifyStatus {
    Authenticated,
    InvalidUser,
    InvalidSignature,
    InvalidSession,
    Expired,
};

const char* VerifyStatusToString(VerifyStatus status);

struct VerifyResult {
    VerifyStatus status{VerifyStatus::InvalidSession};

    /// Checksummed address when authenticated
    std::string address;

    bool IsAuthenticated() const { return status == VerifyStatus::Authenticated; }

    /// The address on success, otherwise "Invalid User", "Invalid Signature",
    /// "Invalid Session" or "Expired"
    std::string ToString() const;

    static VerifyResult Success(std::string addr) {
        return VerifyResult{VerifyStatus::Authenticated, std::move(addr)};
    }
    static VerifyResult Failure(VerifyStatus s) { return VerifyResult{s, {}}; }
};

// ============================================================================
// Authenticator
// ============================================================================

/**
 * Issues and verifies SIWE challenges for one wallet session.
 */
class Authenticator {
public:
    struct Options {
        int64_t expirySeconds{DEFAULT_SIWE_EXPIRY_SECONDS};
    };

    Authenticator(wallet::WalletSession& session, UserRegistryPtr registry);
    Authenticator(wallet::WalletSession& session, UserRegistryPtr registry, Options options);

    /**
     * Build, sign and remember a challenge for `domain`.
     * @throws WalletError(NotConnected) without an active provider
     */
    LoginPayload Authenticate(const std::string& domain);

    /**
     * Check, in order: registered user, signature, stored challenge, validity
     * window. The first failing check decides the result; success consumes
     * the stored challenge. Never throws for authentication outcomes.
     */
    VerifyResult Verify(const LoginPayload& payload);

    SiweSessionStore& GetSessionStore() { return store_; }

private:
    wallet::WalletSession& session_;
    signing::Signer signer_;
    UserRegistryPtr registry_;
    Options options_;
    SiweSessionStore store_;
};

} // namespace auth
} // namespace ethwallet

#endif // ETHWALLET_AUTH_AUTHENTICATOR_H
