// ETHWALLET - secp256k1 Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/crypto/secp256k1.h"

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>

#include <cstring>
#include <memory>

namespace ethwallet {
namespace secp256k1 {

// ============================================================================
// Constants
// ============================================================================

const std::array<uint8_t, 32> CURVE_ORDER = {{
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE,
    0xBA, 0xAE, 0xDC, 0xE6, 0xAF, 0x48, 0xA0, 0x3B,
    0xBF, 0xD2, 0x5E, 0x8C, 0xD0, 0x36, 0x41, 0x41
}};

const std::array<uint8_t, 32> HALF_CURVE_ORDER = {{
    0x7F, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0x5D, 0x57, 0x6E, 0x73, 0x57, 0xA4, 0x50, 0x1D,
    0xDF, 0xE9, 0x2F, 0x46, 0x68, 0x1B, 0x20, 0xA0
}};

namespace {

using BNPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using BNCtxPtr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using GroupPtr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using PointPtr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using KeyPtr = std::unique_ptr<EC_KEY, decltype(&EC_KEY_free)>;
using SigPtr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;

BNPtr MakeBN(const uint8_t* data, size_t len) {
    return BNPtr(BN_bin2bn(data, static_cast<int>(len), nullptr), &BN_free);
}

BNPtr MakeBN() {
    return BNPtr(BN_new(), &BN_free);
}

GroupPtr MakeGroup() {
    return GroupPtr(EC_GROUP_new_by_curve_name(NID_secp256k1), &EC_GROUP_free);
}

/// Compare two 32-byte big-endian numbers
int Compare32(const uint8_t* a, const uint8_t* b) {
    return std::memcmp(a, b, 32);
}

bool IsZero32(const uint8_t* a) {
    for (size_t i = 0; i < 32; ++i) {
        if (a[i] != 0) return false;
    }
    return true;
}

/// True if 0 < v < n
bool InScalarRange(const uint8_t* v) {
    return !IsZero32(v) && Compare32(v, CURVE_ORDER.data()) < 0;
}

bool WriteUncompressed(const EC_GROUP* group, const EC_POINT* point,
                       uint8_t out[PUBLIC_KEY_SIZE], BN_CTX* ctx) {
    if (EC_POINT_is_at_infinity(group, point)) return false;
    size_t written = EC_POINT_point2oct(group, point, POINT_CONVERSION_UNCOMPRESSED,
                                        out, PUBLIC_KEY_SIZE, ctx);
    return written == PUBLIC_KEY_SIZE;
}

} // anonymous namespace

// ============================================================================
// Key Operations
// ============================================================================

bool IsValidPrivateKey(const uint8_t* key) {
    if (!key) return false;
    return InScalarRange(key);
}

bool DerivePublicKey(const uint8_t* privateKey, uint8_t publicKey[PUBLIC_KEY_SIZE]) {
    if (!IsValidPrivateKey(privateKey)) return false;

    GroupPtr group = MakeGroup();
    BNCtxPtr ctx(BN_CTX_new(), &BN_CTX_free);
    BNPtr priv = MakeBN(privateKey, PRIVATE_KEY_SIZE);
    if (!group || !ctx || !priv) return false;

    PointPtr pub(EC_POINT_new(group.get()), &EC_POINT_free);
    if (!pub) return false;

    bool ok = EC_POINT_mul(group.get(), pub.get(), priv.get(), nullptr, nullptr, ctx.get()) == 1 &&
              WriteUncompressed(group.get(), pub.get(), publicKey, ctx.get());
    BN_clear(priv.get());
    return ok;
}

// ============================================================================
// Recoverable ECDSA
// ============================================================================

bool SignRecoverable(const uint8_t* hash, const uint8_t* privateKey,
                     uint8_t signature[SIGNATURE_SIZE], int* recid) {
    if (!hash || !signature || !recid) return false;

    uint8_t expectedPub[PUBLIC_KEY_SIZE];
    if (!DerivePublicKey(privateKey, expectedPub)) return false;

    KeyPtr key(EC_KEY_new_by_curve_name(NID_secp256k1), &EC_KEY_free);
    BNPtr priv = MakeBN(privateKey, PRIVATE_KEY_SIZE);
    if (!key || !priv) return false;

    const EC_GROUP* group = EC_KEY_get0_group(key.get());
    PointPtr pub(EC_POINT_new(group), &EC_POINT_free);
    if (!pub) return false;

    bool keyOk = EC_KEY_set_private_key(key.get(), priv.get()) == 1 &&
                 EC_POINT_oct2point(group, pub.get(), expectedPub, PUBLIC_KEY_SIZE, nullptr) == 1 &&
                 EC_KEY_set_public_key(key.get(), pub.get()) == 1;
    BN_clear(priv.get());
    if (!keyOk) return false;

    SigPtr sig(ECDSA_do_sign(hash, 32, key.get()), &ECDSA_SIG_free);
    if (!sig) return false;

    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);

    uint8_t candidate[SIGNATURE_SIZE];
    if (BN_bn2binpad(r, candidate, 32) != 32 || BN_bn2binpad(s, candidate + 32, 32) != 32) {
        return false;
    }

    // Normalize to low-s: s' = n - s
    if (Compare32(candidate + 32, HALF_CURVE_ORDER.data()) > 0) {
        BNPtr n = MakeBN(CURVE_ORDER.data(), 32);
        BNPtr lowS = MakeBN();
        if (!n || !lowS || !BN_sub(lowS.get(), n.get(), s) ||
            BN_bn2binpad(lowS.get(), candidate + 32, 32) != 32) {
            return false;
        }
    }

    // Recovery id by trial recovery
    uint8_t recovered[PUBLIC_KEY_SIZE];
    for (int id = 0; id < 4; ++id) {
        if (RecoverPublicKey(hash, candidate, id, recovered) &&
            std::memcmp(recovered, expectedPub, PUBLIC_KEY_SIZE) == 0) {
            std::memcpy(signature, candidate, SIGNATURE_SIZE);
            *recid = id;
            return true;
        }
    }
    return false;
}

bool RecoverPublicKey(const uint8_t* hash, const uint8_t signature[SIGNATURE_SIZE],
                      int recid, uint8_t publicKey[PUBLIC_KEY_SIZE]) {
    if (!hash || !signature || recid < 0 || recid > 3) return false;
    if (!InScalarRange(signature) || !InScalarRange(signature + 32)) return false;

    GroupPtr group = MakeGroup();
    BNCtxPtr ctx(BN_CTX_new(), &BN_CTX_free);
    BNPtr r = MakeBN(signature, 32);
    BNPtr s = MakeBN(signature + 32, 32);
    BNPtr n = MakeBN(CURVE_ORDER.data(), 32);
    BNPtr e = MakeBN(hash, 32);
    BNPtr x = MakeBN();
    if (!group || !ctx || !r || !s || !n || !e || !x) return false;

    // x = r + (recid / 2) * n, which must still be a field element
    if (!BN_copy(x.get(), r.get())) return false;
    if (recid >= 2) {
        BNPtr p = MakeBN();
        if (!p || !EC_GROUP_get_curve(group.get(), p.get(), nullptr, nullptr, ctx.get())) {
            return false;
        }
        if (!BN_add(x.get(), x.get(), n.get()) || BN_cmp(x.get(), p.get()) >= 0) {
            return false;
        }
    }

    PointPtr R(EC_POINT_new(group.get()), &EC_POINT_free);
    PointPtr Q(EC_POINT_new(group.get()), &EC_POINT_free);
    if (!R || !Q) return false;

    if (!EC_POINT_set_compressed_coordinates(group.get(), R.get(), x.get(), recid & 1, ctx.get())) {
        return false;
    }

    // Q = r^-1 * (s*R - e*G)
    BNPtr rInv(BN_mod_inverse(nullptr, r.get(), n.get(), ctx.get()), &BN_free);
    BNPtr sTimesRInv = MakeBN();
    BNPtr eTimesRInv = MakeBN();
    if (!rInv || !sTimesRInv || !eTimesRInv) return false;

    if (!BN_mod_mul(sTimesRInv.get(), s.get(), rInv.get(), n.get(), ctx.get()) ||
        !BN_mod_mul(eTimesRInv.get(), e.get(), rInv.get(), n.get(), ctx.get()) ||
        !BN_mod_sub(eTimesRInv.get(), n.get(), eTimesRInv.get(), n.get(), ctx.get())) {
        return false;
    }

    if (!EC_POINT_mul(group.get(), Q.get(), eTimesRInv.get(), R.get(), sTimesRInv.get(), ctx.get())) {
        return false;
    }

    return WriteUncompressed(group.get(), Q.get(), publicKey, ctx.get());
}

} // namespace secp256k1
} // namespace ethwallet
