// ETHWALLET - Currency Units and Quantities Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/core/units.h"
#include "ethwallet/core/hex.h"

#include <openssl/bn.h>
#include <openssl/crypto.h>

#include <cctype>
#include <memory>
#include <stdexcept>

namespace ethwallet {

namespace {

using BNPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

BNPtr NewBN() {
    BNPtr bn(BN_new(), &BN_free);
    if (!bn) throw std::runtime_error("BN_new failed");
    return bn;
}

bool AllDigits(const std::string& s, size_t from) {
    if (from >= s.size()) return false;
    for (size_t i = from; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

bool AllHexDigits(const std::string& s, size_t from) {
    if (from >= s.size()) return false;
    for (size_t i = from; i < s.size(); ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

/// Parse decimal (optionally signed) or 0x hex into a BIGNUM
BNPtr ParseBN(const std::string& quantity, bool allowNegative) {
    BIGNUM* raw = nullptr;
    if (HasHexPrefix(quantity)) {
        if (!AllHexDigits(quantity, 2)) {
            throw std::invalid_argument("Invalid hex quantity: " + quantity);
        }
        if (BN_hex2bn(&raw, quantity.c_str() + 2) == 0) {
            throw std::invalid_argument("Invalid hex quantity: " + quantity);
        }
    } else {
        size_t start = (allowNegative && !quantity.empty() && quantity[0] == '-') ? 1 : 0;
        if (!AllDigits(quantity, start)) {
            throw std::invalid_argument("Invalid decimal quantity: " + quantity);
        }
        if (BN_dec2bn(&raw, quantity.c_str()) == 0) {
            throw std::invalid_argument("Invalid decimal quantity: " + quantity);
        }
    }
    return BNPtr(raw, &BN_free);
}

std::string BNToDecimal(const BIGNUM* bn) {
    char* dec = BN_bn2dec(bn);
    if (!dec) throw std::runtime_error("BN_bn2dec failed");
    std::string out(dec);
    OPENSSL_free(dec);
    return out;
}

std::string StripLeadingZeros(const std::string& digits) {
    size_t nz = digits.find_first_not_of('0');
    if (nz == std::string::npos) return "0";
    return digits.substr(nz);
}

/// Add one to a string of decimal digits
std::string IncrementDigits(std::string digits) {
    for (size_t i = digits.size(); i-- > 0;) {
        if (digits[i] == '9') {
            digits[i] = '0';
        } else {
            ++digits[i];
            return digits;
        }
    }
    return "1" + digits;
}

std::string GroupThousands(const std::string& whole) {
    std::string out;
    size_t n = whole.size();
    for (size_t i = 0; i < n; ++i) {
        out += whole[i];
        size_t remaining = n - i - 1;
        if (remaining > 0 && remaining % 3 == 0) out += ',';
    }
    return out;
}

} // namespace

// ============================================================================
// Amount Conversions
// ============================================================================

std::string ParseUnits(const std::string& amount, int decimals) {
    if (decimals < 0) throw std::invalid_argument("Negative decimals");

    size_t dot = amount.find('.');
    std::string whole = amount.substr(0, dot);
    std::string frac = (dot == std::string::npos) ? "" : amount.substr(dot + 1);

    bool wholeOk = whole.empty() || AllDigits(whole, 0);
    bool fracOk = frac.empty() || AllDigits(frac, 0);
    if (!wholeOk || !fracOk || (whole.empty() && frac.empty())) {
        throw std::invalid_argument("Invalid amount: " + amount);
    }

    // Trailing zeros beyond the precision carry no value
    while (frac.size() > static_cast<size_t>(decimals) && frac.back() == '0') {
        frac.pop_back();
    }
    if (frac.size() > static_cast<size_t>(decimals)) {
        throw std::invalid_argument("Amount has more than " + std::to_string(decimals) +
                                    " fractional digits: " + amount);
    }

    frac.append(static_cast<size_t>(decimals) - frac.size(), '0');
    return StripLeadingZeros(whole + frac);
}

std::string ToWei(const std::string& ether) {
    return ParseUnits(ether, ETHER_DECIMALS);
}

std::string FromWei(const std::string& wei, int decimals) {
    if (decimals < 0) throw std::invalid_argument("Negative decimals");
    std::string digits = NormalizeQuantity(wei);

    size_t d = static_cast<size_t>(decimals);
    if (digits.size() <= d) {
        digits.insert(0, d + 1 - digits.size(), '0');
    }
    std::string whole = digits.substr(0, digits.size() - d);
    std::string frac = digits.substr(digits.size() - d);

    while (!frac.empty() && frac.back() == '0') frac.pop_back();
    return frac.empty() ? whole : whole + "." + frac;
}

std::string FormatUnits(const std::string& wei, int decimals,
                        int decimalsToDisplay, bool addCommas) {
    if (decimalsToDisplay < 0) decimalsToDisplay = 0;
    std::string exact = FromWei(wei, decimals);

    size_t dot = exact.find('.');
    std::string whole = exact.substr(0, dot);
    std::string frac = (dot == std::string::npos) ? "" : exact.substr(dot + 1);

    size_t keep = static_cast<size_t>(decimalsToDisplay);
    if (frac.size() > keep) {
        bool roundUp = frac[keep] >= '5';
        frac.resize(keep);
        if (roundUp) {
            std::string combined = IncrementDigits(whole + frac);
            whole = combined.substr(0, combined.size() - keep);
            frac = combined.substr(combined.size() - keep);
        }
    }
    while (!frac.empty() && frac.back() == '0') frac.pop_back();

    if (addCommas) whole = GroupThousands(whole);
    return frac.empty() ? whole : whole + "." + frac;
}

std::string ToEth(const std::string& wei, int decimalsToDisplay, bool addCommas) {
    return FormatUnits(wei, ETHER_DECIMALS, decimalsToDisplay, addCommas);
}

// ============================================================================
// Quantity Encoding
// ============================================================================

bool IsValidQuantity(const std::string& quantity) {
    if (HasHexPrefix(quantity)) return AllHexDigits(quantity, 2);
    return AllDigits(quantity, 0);
}

std::string HexQuantityToDecimal(const std::string& hex) {
    if (!HasHexPrefix(hex)) {
        throw std::invalid_argument("Hex quantity must start with 0x: " + hex);
    }
    return NormalizeQuantity(hex);
}

std::string DecimalToHexQuantity(const std::string& quantity) {
    BNPtr bn = ParseBN(quantity, false);
    if (BN_is_zero(bn.get())) return "0x0";

    int len = BN_num_bytes(bn.get());
    Bytes buf(static_cast<size_t>(len));
    BN_bn2bin(bn.get(), buf.data());

    std::string hex = BytesToHex(buf);
    size_t nz = hex.find_first_not_of('0');
    return "0x" + hex.substr(nz);
}

std::string NormalizeQuantity(const std::string& quantity) {
    BNPtr bn = ParseBN(quantity, false);
    return BNToDecimal(bn.get());
}

Bytes QuantityToBytes(const std::string& quantity) {
    BNPtr bn = ParseBN(quantity, false);
    Bytes out(static_cast<size_t>(BN_num_bytes(bn.get())));
    if (!out.empty()) {
        BN_bn2bin(bn.get(), out.data());
    }
    return out;
}

uint64_t QuantityToUint64(const std::string& quantity) {
    Bytes be = QuantityToBytes(quantity);
    if (be.size() > 8) {
        throw std::invalid_argument("Quantity exceeds 64 bits: " + quantity);
    }
    uint64_t v = 0;
    for (Byte b : be) v = (v << 8) | b;
    return v;
}

Bytes EncodeIntegerWord(const std::string& value, int bits, bool isSigned) {
    if (bits <= 0 || bits > 256 || bits % 8 != 0) {
        throw std::invalid_argument("Invalid integer width: " + std::to_string(bits));
    }

    BNPtr bn = ParseBN(value, isSigned);
    bool negative = BN_is_negative(bn.get()) != 0;

    // Magnitude limits: unsigned < 2^bits, signed in [-2^(bits-1), 2^(bits-1))
    int limitBits = isSigned ? bits - 1 : bits;
    BNPtr limit = NewBN();
    if (!BN_set_bit(limit.get(), limitBits)) throw std::runtime_error("BN_set_bit failed");

    if (negative) {
        BNPtr mag = NewBN();
        if (!BN_copy(mag.get(), bn.get())) throw std::runtime_error("BN_copy failed");
        BN_set_negative(mag.get(), 0);
        if (BN_cmp(mag.get(), limit.get()) > 0) {
            throw std::invalid_argument("Integer out of range for int" + std::to_string(bits));
        }
        // Two's complement over 256 bits
        BNPtr modulus = NewBN();
        if (!BN_set_bit(modulus.get(), 256)) throw std::runtime_error("BN_set_bit failed");
        if (!BN_add(bn.get(), bn.get(), modulus.get())) throw std::runtime_error("BN_add failed");
    } else if (BN_cmp(bn.get(), limit.get()) >= 0) {
        throw std::invalid_argument("Integer out of range for " +
                                    std::string(isSigned ? "int" : "uint") +
                                    std::to_string(bits));
    }

    Bytes word(32, 0);
    if (BN_bn2binpad(bn.get(), word.data(), 32) != 32) {
        throw std::runtime_error("BN_bn2binpad failed");
    }
    return word;
}

} // namespace ethwallet
