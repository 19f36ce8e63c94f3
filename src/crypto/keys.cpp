// ETHWALLET - Keys, Addresses and Signatures Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/crypto/keys.h"
#include "ethwallet/core/hex.h"
#include "ethwallet/core/random.h"
#include "ethwallet/crypto/keccak.h"

#include <openssl/crypto.h>

#include <cctype>
#include <cstring>
#include <stdexcept>

namespace ethwallet {

// ============================================================================
// RecoverableSignature Implementation
// ============================================================================

Bytes RecoverableSignature::ToBytes() const {
    Bytes out;
    out.reserve(SIZE);
    out.insert(out.end(), r.begin(), r.end());
    out.insert(out.end(), s.begin(), s.end());
    out.push_back(V());
    return out;
}

std::string RecoverableSignature::ToHex() const {
    return ToHexPrefixed(ToBytes());
}

std::optional<RecoverableSignature> RecoverableSignature::FromBytes(const Byte* data, size_t len) {
    if (!data || len != SIZE) return std::nullopt;

    Byte v = data[64];
    int recid;
    if (v == 0 || v == 1) {
        recid = v;
    } else if (v == 27 || v == 28) {
        recid = v - 27;
    } else {
        return std::nullopt;
    }

    RecoverableSignature sig;
    std::memcpy(sig.r.data(), data, 32);
    std::memcpy(sig.s.data(), data + 32, 32);
    sig.recid = recid;
    return sig;
}

std::optional<RecoverableSignature> RecoverableSignature::FromHex(const std::string& hex) {
    std::string body = StripHexPrefix(hex);
    if (!IsValidHex(body)) return std::nullopt;
    Bytes raw = HexToBytes(body);
    return FromBytes(raw);
}

// ============================================================================
// Address Implementation
// ============================================================================

Address Address::FromPublicKey(const PublicKey& pubkey) {
    if (!pubkey.IsValid()) return Address();
    // Hash the 64-byte x || y, skipping the 0x04 tag
    Hash256 hash = Keccak256Hash(pubkey.data() + 1, PublicKey::SIZE - 1);
    return Address(hash.data() + 12);
}

std::optional<Address> Address::FromString(const std::string& str) {
    std::string body = StripHexPrefix(str);
    if (body.size() != SIZE * 2 || !IsValidHex(body)) return std::nullopt;

    bool hasLower = false;
    bool hasUpper = false;
    for (char c : body) {
        if (std::islower(static_cast<unsigned char>(c))) hasLower = true;
        if (std::isupper(static_cast<unsigned char>(c))) hasUpper = true;
    }

    Bytes raw = HexToBytes(body);
    Address addr(raw.data());

    if (hasLower && hasUpper) {
        // Mixed case carries an EIP-55 checksum that must match
        if (addr.ToChecksumString().substr(2) != body) return std::nullopt;
    }
    return addr;
}

Address Address::Parse(const std::string& str) {
    auto addr = FromString(str);
    if (!addr) {
        throw std::invalid_argument("Invalid address: " + str);
    }
    return *addr;
}

std::string Address::ToChecksumString() const {
    std::string lower = BytesToHex(hash_.data(), SIZE);
    Hash256 hash = Keccak256Hash(lower);

    std::string out = "0x";
    out.reserve(2 + lower.size());
    for (size_t i = 0; i < lower.size(); ++i) {
        char c = lower[i];
        Byte nibble = (i % 2 == 0) ? (hash[i / 2] >> 4) : (hash[i / 2] & 0x0f);
        if (c >= 'a' && c <= 'f' && nibble >= 8) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        out += c;
    }
    return out;
}

bool IsValidAddress(const std::string& str) {
    return Address::FromString(str).has_value();
}

std::string ToChecksumAddress(const std::string& address) {
    std::string body = StripHexPrefix(address);
    std::string lower;
    lower.reserve(body.size());
    for (char c : body) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return Address::Parse(lower).ToChecksumString();
}

bool AddressEquals(const std::string& a, const std::string& b) {
    std::string la = StripHexPrefix(a);
    std::string lb = StripHexPrefix(b);
    if (la.size() != Address::SIZE * 2 || la.size() != lb.size()) return false;
    if (!IsValidHex(la) || !IsValidHex(lb)) return false;
    for (size_t i = 0; i < la.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(la[i])) !=
            std::tolower(static_cast<unsigned char>(lb[i]))) {
            return false;
        }
    }
    return true;
}

std::string ShortenAddress(const std::string& address) {
    if (address.size() != 42) {
        throw std::invalid_argument("Invalid address length");
    }
    return address.substr(0, 6) + "..." + address.substr(38);
}

// ============================================================================
// PublicKey Implementation
// ============================================================================

PublicKey::PublicKey(const Byte* data, size_t len) {
    data_.fill(0);
    if (data && len == SIZE && data[0] == 0x04) {
        std::memcpy(data_.data(), data, SIZE);
        valid_ = true;
    }
}

std::string PublicKey::ToHex() const {
    return ToHexPrefixed(data_.data(), SIZE);
}

std::optional<PublicKey> PublicKey::Recover(const Hash256& hash, const RecoverableSignature& sig) {
    Byte compact[secp256k1::SIGNATURE_SIZE];
    std::memcpy(compact, sig.r.data(), 32);
    std::memcpy(compact + 32, sig.s.data(), 32);

    Byte out[SIZE];
    if (!secp256k1::RecoverPublicKey(hash.data(), compact, sig.recid, out)) {
        return std::nullopt;
    }
    return PublicKey(out, SIZE);
}

// ============================================================================
// PrivateKey Implementation
// ============================================================================

PrivateKey::PrivateKey(const Byte* data) {
    data_.fill(0);
    if (data) {
        std::memcpy(data_.data(), data, SIZE);
        valid_ = secp256k1::IsValidPrivateKey(data_.data());
    }
}

PrivateKey::PrivateKey(const Bytes& data) {
    data_.fill(0);
    if (data.size() == SIZE) {
        std::memcpy(data_.data(), data.data(), SIZE);
        valid_ = secp256k1::IsValidPrivateKey(data_.data());
    }
}

PrivateKey::~PrivateKey() {
    Clear();
}

PrivateKey::PrivateKey(PrivateKey&& other) noexcept
    : data_(other.data_), valid_(other.valid_) {
    other.Clear();
}

PrivateKey& PrivateKey::operator=(PrivateKey&& other) noexcept {
    if (this != &other) {
        Clear();
        data_ = other.data_;
        valid_ = other.valid_;
        other.Clear();
    }
    return *this;
}

PrivateKey::PrivateKey(const PrivateKey& other)
    : data_(other.data_), valid_(other.valid_) {
}

PrivateKey& PrivateKey::operator=(const PrivateKey& other) {
    if (this != &other) {
        data_ = other.data_;
        valid_ = other.valid_;
    }
    return *this;
}

PrivateKey PrivateKey::Generate() {
    PrivateKey key;

    // Out-of-range draws are astronomically rare; retry until valid
    for (int attempts = 0; attempts < 100; ++attempts) {
        GetRandBytes(key.data_.data(), SIZE);
        if (secp256k1::IsValidPrivateKey(key.data_.data())) {
            key.valid_ = true;
            return key;
        }
    }
    throw std::runtime_error("Failed to generate a valid private key");
}

std::optional<PrivateKey> PrivateKey::FromHex(const std::string& hex) {
    std::string body = StripHexPrefix(hex);
    if (body.size() != SIZE * 2 || !IsValidHex(body)) return std::nullopt;

    Bytes raw = HexToBytes(body);
    PrivateKey key(raw);
    OPENSSL_cleanse(raw.data(), raw.size());
    if (!key.IsValid()) return std::nullopt;
    return key;
}

PublicKey PrivateKey::GetPublicKey() const {
    if (!valid_) return PublicKey();

    Byte pub[PublicKey::SIZE];
    if (!secp256k1::DerivePublicKey(data_.data(), pub)) {
        return PublicKey();
    }
    return PublicKey(pub, PublicKey::SIZE);
}

std::optional<RecoverableSignature> PrivateKey::Sign(const Hash256& hash) const {
    if (!valid_) return std::nullopt;

    Byte compact[secp256k1::SIGNATURE_SIZE];
    int recid = 0;
    if (!secp256k1::SignRecoverable(hash.data(), data_.data(), compact, &recid)) {
        return std::nullopt;
    }

    RecoverableSignature sig;
    std::memcpy(sig.r.data(), compact, 32);
    std::memcpy(sig.s.data(), compact + 32, 32);
    sig.recid = recid;
    return sig;
}

std::string PrivateKey::ToHex() const {
    return ToHexPrefixed(data_.data(), SIZE);
}

void PrivateKey::Clear() {
    OPENSSL_cleanse(data_.data(), SIZE);
    valid_ = false;
}

// ============================================================================
// Personal Messages
// ============================================================================

Hash256 HashPersonalMessage(const Bytes& message) {
    std::string prefix = "\x19" "Ethereum Signed Message:\n" + std::to_string(message.size());

    Keccak256 hasher;
    hasher.Write(reinterpret_cast<const Byte*>(prefix.data()), prefix.size());
    hasher.Write(message);

    Hash256 result;
    hasher.Finalize(result.data());
    return result;
}

Hash256 HashPersonalMessage(const std::string& message) {
    return HashPersonalMessage(Bytes(message.begin(), message.end()));
}

} // namespace ethwallet
