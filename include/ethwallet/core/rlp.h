// ETHWALLET - Recursive Length Prefix Encoding
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// RLP as used by legacy Ethereum transactions.

#ifndef ETHWALLET_CORE_RLP_H
#define ETHWALLET_CORE_RLP_H

#include "ethwallet/core/types.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace ethwallet {
namespace rlp {

/// Encode a byte string
Bytes EncodeBytes(const Bytes& data);

/// Encode an unsigned integer as its minimal big-endian byte string
Bytes EncodeUint(uint64_t value);

/// Wrap already-encoded items in a list header
Bytes EncodeList(const std::vector<Bytes>& encodedItems);

/**
 * Decoded RLP item: either a byte string or a list of items.
 */
struct Item {
    bool isList{false};
    Bytes bytes;
    std::vector<Item> items;
};

/// Decode exactly one item spanning the whole input
std::optional<Item> Decode(const Bytes& data);

} // namespace rlp
} // namespace ethwallet

#endif // ETHWALLET_CORE_RLP_H
