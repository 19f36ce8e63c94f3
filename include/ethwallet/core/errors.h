// ETHWALLET - Error Taxonomy
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// Domain failures are raised as WalletError carrying an ErrorCode.
// Authentication outcomes are not errors; see auth/authenticator.h.

#ifndef ETHWALLET_CORE_ERRORS_H
#define ETHWALLET_CORE_ERRORS_H

#include <stdexcept>
#include <string>

namespace ethwallet {

/// Failure categories surfaced to callers
enum class ErrorCode {
    /// Operation attempted with no active provider
    NotConnected,
    /// Local-only operation on a non-local provider
    NoLocalAccount,
    /// Keystore MAC mismatch
    IncorrectPassword,
    /// Capability not available for the active provider
    UnsupportedOnPlatform,
    /// Network, RPC or file I/O failure
    TransportFailure,
    /// Malformed caller input (address, hex, amount, document)
    InvalidArgument,
    /// A signing or recovery primitive failed
    SigningFailed,
};

/// Convert error code to its stable name
const char* ErrorCodeToString(ErrorCode code);

/**
 * Exception type for all domain failures.
 */
class WalletError : public std::runtime_error {
public:
    WalletError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode Code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace ethwallet

#endif // ETHWALLET_CORE_ERRORS_H
