// ETHWALLET - Base64 Encoding/Decoding
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// RFC 4648 standard alphabet with '=' padding.

#ifndef ETHWALLET_CORE_BASE64_H
#define ETHWALLET_CORE_BASE64_H

#include <cstdint>
#include <string>
#include <vector>

namespace ethwallet {

/// Encode bytes as padded base64
std::string EncodeBase64(const uint8_t* data, size_t len);
std::string EncodeBase64(const std::vector<uint8_t>& data);
std::string EncodeBase64(const std::string& data);

/// Decode padded base64. Whitespace is ignored; missing padding is tolerated.
/// @throws std::invalid_argument on characters outside the alphabet or bad length
std::vector<uint8_t> DecodeBase64(const std::string& encoded);

} // namespace ethwallet

#endif // ETHWALLET_CORE_BASE64_H
