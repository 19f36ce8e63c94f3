// ETHWALLET - Recursive Length Prefix Encoding Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/core/rlp.h"

namespace ethwallet {
namespace rlp {

namespace {

constexpr Byte OFFSET_SHORT_STRING = 0x80;
constexpr Byte OFFSET_LONG_STRING = 0xb7;
constexpr Byte OFFSET_SHORT_LIST = 0xc0;
constexpr Byte OFFSET_LONG_LIST = 0xf7;

Bytes MinimalBigEndian(uint64_t value) {
    Bytes out;
    while (value > 0) {
        out.insert(out.begin(), static_cast<Byte>(value & 0xff));
        value >>= 8;
    }
    return out;
}

Bytes EncodeLength(size_t len, Byte shortOffset, Byte longOffset) {
    if (len <= 55) {
        return Bytes{static_cast<Byte>(shortOffset + len)};
    }
    Bytes lenBytes = MinimalBigEndian(len);
    Bytes out{static_cast<Byte>(longOffset + lenBytes.size())};
    out.insert(out.end(), lenBytes.begin(), lenBytes.end());
    return out;
}

bool DecodeAt(const Bytes& data, size_t& pos, Item& out, int depth);

bool ReadLength(const Bytes& data, size_t& pos, size_t lenOfLen, size_t& len) {
    if (lenOfLen == 0 || lenOfLen > 8 || pos + lenOfLen > data.size()) return false;
    if (data[pos] == 0) return false;  // non-canonical leading zero
    len = 0;
    for (size_t i = 0; i < lenOfLen; ++i) {
        len = (len << 8) | data[pos + i];
    }
    pos += lenOfLen;
    return len > 55;
}

bool DecodeList(const Bytes& data, size_t pos, size_t end, Item& out, int depth) {
    out.isList = true;
    while (pos < end) {
        Item child;
        if (!DecodeAt(data, pos, child, depth + 1)) return false;
        if (pos > end) return false;
        out.items.push_back(std::move(child));
    }
    return pos == end;
}

bool DecodeAt(const Bytes& data, size_t& pos, Item& out, int depth) {
    if (depth > 64 || pos >= data.size()) return false;
    Byte prefix = data[pos++];

    if (prefix < OFFSET_SHORT_STRING) {
        out.bytes = Bytes{prefix};
        return true;
    }

    size_t len = 0;
    if (prefix <= OFFSET_LONG_STRING) {
        len = prefix - OFFSET_SHORT_STRING;
        if (pos + len > data.size()) return false;
        if (len == 1 && data[pos] < OFFSET_SHORT_STRING) return false;
    } else if (prefix < OFFSET_SHORT_LIST) {
        if (!ReadLength(data, pos, prefix - OFFSET_LONG_STRING, len)) return false;
        if (pos + len > data.size()) return false;
    } else {
        if (prefix <= OFFSET_LONG_LIST) {
            len = prefix - OFFSET_SHORT_LIST;
        } else if (!ReadLength(data, pos, prefix - OFFSET_LONG_LIST, len)) {
            return false;
        }
        if (pos + len > data.size()) return false;
        size_t end = pos + len;
        if (!DecodeList(data, pos, end, out, depth)) return false;
        pos = end;
        return true;
    }

    out.bytes.assign(data.begin() + pos, data.begin() + pos + len);
    pos += len;
    return true;
}

} // namespace

Bytes EncodeBytes(const Bytes& data) {
    if (data.size() == 1 && data[0] < OFFSET_SHORT_STRING) {
        return data;
    }
    Bytes out = EncodeLength(data.size(), OFFSET_SHORT_STRING, OFFSET_LONG_STRING);
    out.insert(out.end(), data.begin(), data.end());
    return out;
}

Bytes EncodeUint(uint64_t value) {
    return EncodeBytes(MinimalBigEndian(value));
}

Bytes EncodeList(const std::vector<Bytes>& encodedItems) {
    size_t total = 0;
    for (const auto& item : encodedItems) total += item.size();

    Bytes out = EncodeLength(total, OFFSET_SHORT_LIST, OFFSET_LONG_LIST);
    out.reserve(out.size() + total);
    for (const auto& item : encodedItems) {
        out.insert(out.end(), item.begin(), item.end());
    }
    return out;
}

std::optional<Item> Decode(const Bytes& data) {
    Item item;
    size_t pos = 0;
    if (!DecodeAt(data, pos, item, 0) || pos != data.size()) {
        return std::nullopt;
    }
    return item;
}

} // namespace rlp
} // namespace ethwallet
