// ETHWALLET - Secure Random Number Generation Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/core/random.h"
#include "ethwallet/core/hex.h"
#include <cstring>
#include <stdexcept>

// Platform-specific includes
#if defined(__linux__)
    #include <sys/random.h>
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    #include <stdlib.h>  // arc4random_buf
#else
    #include <fstream>
#endif

namespace ethwallet {

namespace detail {

bool GetOSEntropy(uint8_t* buf, size_t len) {
    if (len == 0) return true;

#if defined(__linux__)
    // getrandom() may return short reads for large requests
    size_t filled = 0;
    while (filled < len) {
        ssize_t ret = getrandom(buf + filled, len - filled, 0);
        if (ret <= 0) return false;
        filled += static_cast<size_t>(ret);
    }
    return true;

#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    arc4random_buf(buf, len);
    return true;

#else
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (!urandom) return false;
    urandom.read(reinterpret_cast<char*>(buf), len);
    return urandom.good();
#endif
}

} // namespace detail

// ============================================================================
// Core Random Functions
// ============================================================================

void GetRandBytes(uint8_t* buf, size_t len) {
    if (!detail::GetOSEntropy(buf, len)) {
        throw std::runtime_error("Failed to get random bytes from OS");
    }
}

Bytes GetRandBytes(size_t len) {
    Bytes out(len);
    GetRandBytes(out.data(), len);
    return out;
}

uint64_t GetRandUint64() {
    uint64_t result;
    GetRandBytes(reinterpret_cast<uint8_t*>(&result), sizeof(result));
    return result;
}

uint64_t GetRandInt(uint64_t max) {
    if (max <= 1) return 0;

    // Largest multiple of max that fits in 64 bits
    uint64_t threshold = (static_cast<uint64_t>(-1) / max) * max;

    uint64_t result;
    do {
        result = GetRandUint64();
    } while (result >= threshold);

    return result % max;
}

// ============================================================================
// Identifiers
// ============================================================================

std::string GenerateNonce(size_t length) {
    static const char ALPHABET[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    constexpr uint64_t ALPHABET_SIZE = sizeof(ALPHABET) - 1;

    std::string nonce;
    nonce.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        nonce.push_back(ALPHABET[GetRandInt(ALPHABET_SIZE)]);
    }
    return nonce;
}

std::string GenerateUUIDv4() {
    uint8_t b[16];
    GetRandBytes(b, sizeof(b));
    b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);  // version 4
    b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);  // RFC 4122 variant

    std::string hex = BytesToHex(b, sizeof(b));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) +
           "-" + hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

} // namespace ethwallet
