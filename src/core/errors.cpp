// ETHWALLET - Error Taxonomy Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/core/errors.h"

namespace ethwallet {

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotConnected:          return "NotConnected";
        case ErrorCode::NoLocalAccount:        return "NoLocalAccount";
        case ErrorCode::IncorrectPassword:     return "IncorrectPassword";
        case ErrorCode::UnsupportedOnPlatform: return "UnsupportedOnPlatform";
        case ErrorCode::TransportFailure:      return "TransportFailure";
        case ErrorCode::InvalidArgument:       return "InvalidArgument";
        case ErrorCode::SigningFailed:         return "SigningFailed";
    }
    return "Unknown";
}

} // namespace ethwallet
