// ETHWALLET - Encrypted Key Storage Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/wallet/keystore.h"
#include "ethwallet/core/errors.h"
#include "ethwallet/core/hex.h"
#include "ethwallet/core/random.h"
#include "ethwallet/crypto/keccak.h"
#include "ethwallet/util/logging.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <memory>
#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <unistd.h>

namespace ethwallet {
namespace wallet {

namespace LogCategory = util::LogCategory;

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

/// Derived key, cleansed on destruction
class DerivedKey {
public:
    DerivedKey() : data_(KDF_DKLEN, 0) {}
    explicit DerivedKey(size_t len) : data_(len, 0) {}
    ~DerivedKey() { OPENSSL_cleanse(data_.data(), data_.size()); }

    DerivedKey(const DerivedKey&) = delete;
    DerivedKey& operator=(const DerivedKey&) = delete;

    Byte* data() { return data_.data(); }
    const Byte* data() const { return data_.data(); }
    size_t size() const { return data_.size(); }

private:
    Bytes data_;
};

[[noreturn]] void MalformedKeystore(const std::string& what) {
    throw WalletError(ErrorCode::InvalidArgument, "Malformed keystore: " + what);
}

void DeriveScrypt(const std::string& password, const Bytes& salt,
                  uint64_t n, uint64_t r, uint64_t p, DerivedKey& out) {
    ETHWALLET_LOG_TIMER(LogCategory::KEYSTORE, "scrypt key derivation");

    // V is 128*r*N bytes, B is 128*r*p bytes
    uint64_t maxmem = 128 * r * (n + p + 2) + 1024 * 1024;
    if (EVP_PBE_scrypt(password.data(), password.size(), salt.data(), salt.size(),
                       n, r, p, maxmem, out.data(), out.size()) != 1) {
        throw WalletError(ErrorCode::InvalidArgument, "scrypt rejected the KDF parameters");
    }
}

void DerivePbkdf2(const std::string& password, const Bytes& salt,
                  int iterations, DerivedKey& out) {
    ETHWALLET_LOG_TIMER(LogCategory::KEYSTORE, "pbkdf2 key derivation");

    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          salt.data(), static_cast<int>(salt.size()), iterations,
                          EVP_sha256(), static_cast<int>(out.size()), out.data()) != 1) {
        throw WalletError(ErrorCode::InvalidArgument, "pbkdf2 rejected the KDF parameters");
    }
}

/// AES-128-CTR is symmetric: the same call encrypts and decrypts
Bytes AesCtr(const Byte* key, const Bytes& iv, const Byte* input, size_t len) {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw WalletError(ErrorCode::SigningFailed, "Failed to create cipher context");
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_ctr(), nullptr, key, iv.data()) != 1) {
        throw WalletError(ErrorCode::SigningFailed, "Failed to initialize AES-CTR");
    }

    Bytes output(len + AES_IV_SIZE);
    int outLen = 0;
    if (EVP_EncryptUpdate(ctx.get(), output.data(), &outLen, input, static_cast<int>(len)) != 1) {
        throw WalletError(ErrorCode::SigningFailed, "AES-CTR update failed");
    }
    int finalLen = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + outLen, &finalLen) != 1) {
        throw WalletError(ErrorCode::SigningFailed, "AES-CTR finalization failed");
    }
    output.resize(static_cast<size_t>(outLen + finalLen));
    return output;
}

/// keccak256(dk[16..32] || ciphertext)
Hash256 ComputeMac(const DerivedKey& dk, const Bytes& ciphertext) {
    Keccak256 hasher;
    hasher.Write(dk.data() + AES_KEY_SIZE, dk.size() - AES_KEY_SIZE);
    hasher.Write(ciphertext);
    Hash256 mac;
    hasher.Finalize(mac.data());
    return mac;
}

Bytes HexMember(const JSONValue& obj, const char* key) {
    const JSONValue& v = obj[key];
    if (!v.IsString()) {
        MalformedKeystore(std::string("missing ") + key);
    }
    try {
        return HexToBytes(v.GetString());
    } catch (const std::invalid_argument&) {
        MalformedKeystore(std::string("bad hex in ") + key);
    }
}

uint64_t UIntMember(const JSONValue& obj, const char* key) {
    const JSONValue& v = obj[key];
    if (!v.IsInt() || v.GetInt() <= 0) {
        MalformedKeystore(std::string("missing ") + key);
    }
    return static_cast<uint64_t>(v.GetInt());
}

std::string Trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // anonymous namespace

// ============================================================================
// Device Identifier
// ============================================================================

std::string GetMachineIdentifier() {
    std::string id = Trim(util::fs::ReadFile(util::fs::Path("/etc/machine-id")));
    if (!id.empty()) {
        return id;
    }

    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) == 0 && host[0] != '\0') {
        return host;
    }
    return "ethwallet-device";
}

// ============================================================================
// KeystoreManager Implementation
// ============================================================================

KeystoreManager::KeystoreManager(Options options) : options_(std::move(options)) {}

util::fs::Path KeystoreManager::GetAccountPath() const {
    return util::fs::Path(options_.dataDir) / ACCOUNT_FILENAME;
}

bool KeystoreManager::HasStoredAccount() const {
    return util::fs::IsRegularFile(GetAccountPath());
}

std::string KeystoreManager::GetDeviceIdentifier() const {
    if (!options_.deviceId.empty()) {
        return options_.deviceId;
    }
    return GetMachineIdentifier();
}

std::string KeystoreManager::ResolvePassword(const std::string& password) const {
    return password.empty() ? GetDeviceIdentifier() : password;
}

LocalAccount KeystoreManager::UnlockOrCreate(ChainId chainId, const std::string& password,
                                             const std::optional<std::string>& rawKey) {
    if (rawKey) {
        auto key = PrivateKey::FromHex(*rawKey);
        if (!key || !key->IsValid()) {
            throw WalletError(ErrorCode::InvalidArgument, "Invalid raw private key");
        }
        LocalAccount account(std::move(*key), chainId);
        LOG_INFO(LogCategory::KEYSTORE) << "Using supplied key for "
                                        << util::LogAddress(account.address.ToChecksumString());
        return account;
    }

    const util::fs::Path path = GetAccountPath();
    const std::string secret = ResolvePassword(password);

    if (util::fs::Exists(path)) {
        std::string contents = util::fs::ReadFile(path);
        if (contents.empty()) {
            throw WalletError(ErrorCode::TransportFailure, "Cannot read keystore " + path.String());
        }
        LocalAccount account(Decrypt(contents, secret), chainId);
        LOG_INFO(LogCategory::KEYSTORE) << "Unlocked local account "
                                        << util::LogAddress(account.address.ToChecksumString());
        return account;
    }

    LocalAccount account(PrivateKey::Generate(), chainId);
    Persist(Encrypt(account.key, secret));
    LOG_INFO(LogCategory::KEYSTORE) << "Created local account "
                                    << util::LogAddress(account.address.ToChecksumString())
                                    << " at " << path.String();
    return account;
}

void KeystoreManager::Persist(const JSONValue& document) const {
    util::fs::Path dir(options_.dataDir);
    if (!util::fs::IsDirectory(dir) && !util::fs::CreateDirectories(dir)) {
        throw WalletError(ErrorCode::TransportFailure, "Cannot create directory " + dir.String());
    }
    if (!util::fs::SecureWriteFile(GetAccountPath(), document.ToJSON())) {
        throw WalletError(ErrorCode::TransportFailure,
                          "Cannot write keystore " + GetAccountPath().String());
    }
}

JSONValue KeystoreManager::Encrypt(const PrivateKey& key, const std::string& password) const {
    if (!key.IsValid()) {
        throw WalletError(ErrorCode::InvalidArgument, "Cannot encrypt an invalid key");
    }

    const ScryptParams& sp = options_.scrypt;
    Bytes salt = GetRandBytes(SALT_SIZE);
    Bytes iv = GetRandBytes(AES_IV_SIZE);

    DerivedKey dk;
    DeriveScrypt(password, salt, sp.n, sp.r, sp.p, dk);

    Bytes ciphertext = AesCtr(dk.data(), iv, key.data(), PrivateKey::SIZE);
    Hash256 mac = ComputeMac(dk, ciphertext);

    JSONValue kdfparams = JSONValue::MakeObject();
    kdfparams["dklen"] = static_cast<int64_t>(KDF_DKLEN);
    kdfparams["n"] = static_cast<int64_t>(sp.n);
    kdfparams["p"] = static_cast<int64_t>(sp.p);
    kdfparams["r"] = static_cast<int64_t>(sp.r);
    kdfparams["salt"] = BytesToHex(salt);

    JSONValue cipherparams = JSONValue::MakeObject();
    cipherparams["iv"] = BytesToHex(iv);

    JSONValue crypto = JSONValue::MakeObject();
    crypto["cipher"] = "aes-128-ctr";
    crypto["cipherparams"] = std::move(cipherparams);
    crypto["ciphertext"] = BytesToHex(ciphertext);
    crypto["kdf"] = "scrypt";
    crypto["kdfparams"] = std::move(kdfparams);
    crypto["mac"] = BytesToHex(mac.data(), mac.size());

    JSONValue doc = JSONValue::MakeObject();
    doc["crypto"] = std::move(crypto);
    doc["id"] = GenerateUUIDv4();
    doc["address"] = StripHexPrefix(key.GetAddress().ToLowerHex());
    doc["version"] = 3;
    return doc;
}

PrivateKey KeystoreManager::Decrypt(const std::string& json, const std::string& password) const {
    auto doc = JSONValue::TryParse(json);
    if (!doc) {
        MalformedKeystore("not valid JSON");
    }
    return Decrypt(*doc, password);
}

PrivateKey KeystoreManager::Decrypt(const JSONValue& document, const std::string& password) const {
    if (!document.IsObject() || document["version"].GetInt() != 3) {
        MalformedKeystore("unsupported version");
    }

    // Some writers capitalize the member name
    const JSONValue& crypto = document.HasKey("crypto") ? document["crypto"] : document["Crypto"];
    if (!crypto.IsObject()) {
        MalformedKeystore("missing crypto section");
    }
    if (crypto["cipher"].GetString() != "aes-128-ctr") {
        MalformedKeystore("unsupported cipher " + crypto["cipher"].GetString());
    }

    Bytes ciphertext = HexMember(crypto, "ciphertext");
    Bytes iv = HexMember(crypto["cipherparams"], "iv");
    Bytes expectedMac = HexMember(crypto, "mac");
    if (iv.size() != AES_IV_SIZE || expectedMac.size() != Hash256::SIZE) {
        MalformedKeystore("bad iv or mac length");
    }

    const JSONValue& kdfparams = crypto["kdfparams"];
    Bytes salt = HexMember(kdfparams, "salt");
    uint64_t dklen = UIntMember(kdfparams, "dklen");
    if (dklen < KDF_DKLEN || dklen > 64) {
        MalformedKeystore("unsupported dklen");
    }

    DerivedKey dk(static_cast<size_t>(dklen));
    const std::string& kdf = crypto["kdf"].GetString();
    if (kdf == "scrypt") {
        DeriveScrypt(password, salt, UIntMember(kdfparams, "n"), UIntMember(kdfparams, "r"),
                     UIntMember(kdfparams, "p"), dk);
    } else if (kdf == "pbkdf2") {
        if (kdfparams["prf"].GetString() != "hmac-sha256") {
            MalformedKeystore("unsupported prf");
        }
        uint64_t c = UIntMember(kdfparams, "c");
        if (c > static_cast<uint64_t>(INT32_MAX)) {
            MalformedKeystore("iteration count too large");
        }
        DerivePbkdf2(password, salt, static_cast<int>(c), dk);
    } else {
        MalformedKeystore("unsupported kdf " + kdf);
    }

    Hash256 mac = ComputeMac(dk, ciphertext);
    if (CRYPTO_memcmp(mac.data(), expectedMac.data(), mac.size()) != 0) {
        LOG_WARN(LogCategory::KEYSTORE) << "Keystore MAC mismatch";
        throw WalletError(ErrorCode::IncorrectPassword, "Incorrect password");
    }

    Bytes plain = AesCtr(dk.data(), iv, ciphertext.data(), ciphertext.size());
    if (plain.size() != PrivateKey::SIZE) {
        OPENSSL_cleanse(plain.data(), plain.size());
        MalformedKeystore("bad key length");
    }
    PrivateKey key(plain);
    OPENSSL_cleanse(plain.data(), plain.size());
    if (!key.IsValid()) {
        MalformedKeystore("decrypted key is out of range");
    }

    if (document["address"].IsString() && !document["address"].GetString().empty() &&
        !AddressEquals(document["address"].GetString(), key.GetAddress().ToLowerHex())) {
        MalformedKeystore("address does not match the decrypted key");
    }
    return key;
}

std::string KeystoreManager::Export(const LocalAccount* account, const std::string& password) const {
    if (account == nullptr) {
        throw WalletError(ErrorCode::NoLocalAccount, "No local account found");
    }
    LOG_INFO(LogCategory::KEYSTORE) << "Exporting keystore for "
                                    << util::LogAddress(account->address.ToChecksumString());
    return Encrypt(account->key, ResolvePassword(password)).ToJSON();
}

bool KeystoreManager::Delete() noexcept {
    try {
        util::fs::Path path = GetAccountPath();
        if (!util::fs::Exists(path)) {
            return true;
        }
        if (!util::fs::RemoveFile(path)) {
            LOG_WARN(LogCategory::KEYSTORE) << "Error deleting account: " << path.String();
            return false;
        }
        LOG_INFO(LogCategory::KEYSTORE) << "Deleted local account keystore";
        return true;
    } catch (const std::exception& e) {
        LOG_WARN(LogCategory::KEYSTORE) << "Error deleting account: " << e.what();
        return false;
    }
}

} // namespace wallet
} // namespace ethwallet
