// ETHWALLET - SIWE Authenticator Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/auth/authenticator.h"
#include "ethwallet/core/errors.h"
#include "ethwallet/core/random.h"
#include "ethwallet/crypto/keys.h"
#include "ethwallet/util/logging.h"
#include "ethwallet/util/time.h"

namespace ethwallet {
namespace auth {

namespace LogCategory = util::LogCategory;

const char* VerifyStatusToString(VerifyStatus status) {
    switch (status) {
        case VerifyStatus::Authenticated:    return "Authenticated";
        case VerifyStatus::InvalidUser:      return "Invalid User";
        case VerifyStatus::InvalidSignature: return "Invalid Signature";
        case VerifyStatus::InvalidSession:   return "Invalid Session";
        case VerifyStatus::Expired:          return "Expired";
    }
    return "Unknown";
}

std::string VerifyResult::ToString() const {
    return IsAuthenticated() ? address : VerifyStatusToString(status);
}

// ============================================================================
// Authenticator
// ============================================================================

Authenticator::Authenticator(wallet::WalletSession& session, UserRegistryPtr registry)
    : Authenticator(session, std::move(registry), Options{}) {}

Authenticator::Authenticator(wallet::WalletSession& session, UserRegistryPtr registry,
                             Options options)
    : session_(session),
      signer_(session),
      registry_(registry ? std::move(registry) : std::make_shared<AllowAllUserRegistry>()),
      options_(options) {}

LoginPayload Authenticator::Authenticate(const std::string& domain) {
    wallet::IWalletProvider& provider = session_.ActiveProvider();

    SiweMessage msg;
    msg.domain = domain;
    msg.address = provider.GetSignerAddress();
    msg.statement = SIWE_STATEMENT;
    msg.uri = "https://" + domain;
    msg.version = SIWE_VERSION;
    msg.chainId = std::to_string(provider.GetChainId());
    msg.nonce = GenerateNonce();

    const int64_t now = util::GetTimeMillis();
    msg.issuedAt = util::FormatISO8601Millis(now);
    msg.expirationTime = util::FormatISO8601Millis(now + options_.expirySeconds * 1000);
    msg.notBefore = msg.issuedAt;

    LoginPayload payload;
    payload.signature = signer_.Sign(msg.Render());
    payload.payload = msg;

    store_.Store(msg);
    LOG_INFO(LogCategory::AUTH) << "Issued sign-in challenge for " << domain << " to "
                                << util::LogAddress(msg.address);
    return payload;
}

VerifyResult Authenticator::Verify(const LoginPayload& payload) {
    const SiweMessage& msg = payload.payload;

    if (!registry_->IsRegistered(msg)) {
        LOG_WARN(LogCategory::AUTH) << "Sign-in rejected: unregistered "
                                    << util::LogAddress(msg.address);
        return VerifyResult::Failure(VerifyStatus::InvalidUser);
    }

    std::string recovered;
    try {
        recovered = signing::RecoverAddress(msg.Render(), payload.signature);
    } catch (const WalletError& e) {
        LOG_DEBUG(LogCategory::AUTH) << "Signature recovery failed: " << e.what();
    }
    if (recovered.empty() || !AddressEquals(recovered, msg.address)) {
        LOG_WARN(LogCategory::AUTH) << "Sign-in rejected: bad signature for "
                                    << util::LogAddress(msg.address);
        return VerifyResult::Failure(VerifyStatus::InvalidSignature);
    }

    if (!store_.Matches(msg)) {
        LOG_WARN(LogCategory::AUTH) << "Sign-in rejected: challenge not issued by this session";
        return VerifyResult::Failure(VerifyStatus::InvalidSession);
    }

    if (!msg.IsWithinValidity(util::GetTimeMillis())) {
        LOG_WARN(LogCategory::AUTH) << "Sign-in rejected: challenge outside its validity window";
        return VerifyResult::Failure(VerifyStatus::Expired);
    }

    store_.Consume();
    std::string address = ToChecksumAddress(recovered);
    LOG_INFO(LogCategory::AUTH) << "Authenticated " << util::LogAddress(address);
    return VerifyResult::Success(address);
}

} // namespace auth
} // namespace ethwallet
