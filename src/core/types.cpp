// ETHWALLET - Core Types Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/core/types.h"
#include "ethwallet/core/hex.h"

namespace ethwallet {

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return ToHexPrefixed(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    auto bytes = HexToBytes(hex);
    if (bytes.size() != SIZE) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }
    return BaseHash(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseHash<160>;
template class BaseHash<256>;

} // namespace ethwallet
