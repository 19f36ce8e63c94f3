// ETHWALLET - Base64 Encoding/Decoding Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/core/base64.h"

#include <cctype>
#include <stdexcept>

namespace ethwallet {

namespace {
    constexpr char BASE64_CHARS[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    inline int Base64CharToValue(char c) {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    }
}

std::string EncodeBase64(const uint8_t* data, size_t len) {
    std::string encoded;
    encoded.reserve(((len + 2) / 3) * 4);

    int val = 0, valb = -6;
    for (size_t i = 0; i < len; ++i) {
        val = (val << 8) + data[i];
        valb += 8;
        while (valb >= 0) {
            encoded.push_back(BASE64_CHARS[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) {
        encoded.push_back(BASE64_CHARS[((val << 8) >> (valb + 8)) & 0x3F]);
    }
    while (encoded.size() % 4) {
        encoded.push_back('=');
    }
    return encoded;
}

std::string EncodeBase64(const std::vector<uint8_t>& data) {
    return EncodeBase64(data.data(), data.size());
}

std::string EncodeBase64(const std::string& data) {
    return EncodeBase64(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::vector<uint8_t> DecodeBase64(const std::string& encoded) {
    std::string clean;
    clean.reserve(encoded.size());
    size_t padding = 0;
    for (char c : encoded) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) {
            throw std::invalid_argument("Base64 data after padding");
        }
        if (Base64CharToValue(c) < 0) {
            throw std::invalid_argument("Invalid base64 character");
        }
        clean.push_back(c);
    }

    if (padding > 2 || clean.size() % 4 == 1) {
        throw std::invalid_argument("Invalid base64 length");
    }

    std::vector<uint8_t> out;
    out.reserve(clean.size() * 3 / 4);

    int val = 0, valb = -8;
    for (char c : clean) {
        val = (val << 6) + Base64CharToValue(c);
        valb += 6;
        if (valb >= 0) {
            out.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    return out;
}

} // namespace ethwallet
