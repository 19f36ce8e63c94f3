// ETHWALLET - EIP-712 Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/crypto/eip712.h"
#include "ethwallet/core/hex.h"
#include "ethwallet/core/units.h"
#include "ethwallet/crypto/keccak.h"
#include "ethwallet/crypto/keys.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>

namespace ethwallet {
namespace eip712 {

namespace {

/// Canonical order of the optional domain members
const std::vector<TypedDataField> DOMAIN_FIELD_ORDER = {
    {"name", "string"},
    {"version", "string"},
    {"chainId", "uint256"},
    {"verifyingContract", "address"},
    {"salt", "bytes32"},
};

bool IsArrayType(const std::string& type) {
    return !type.empty() && type.back() == ']';
}

/// "T[3]" -> "T", "T[][2]" -> "T[]"
std::string ArrayElementType(const std::string& type, std::optional<size_t>& fixedLength) {
    size_t open = type.rfind('[');
    if (open == std::string::npos) {
        throw std::invalid_argument("Malformed array type: " + type);
    }
    std::string len = type.substr(open + 1, type.size() - open - 2);
    if (len.empty()) {
        fixedLength.reset();
    } else {
        for (char c : len) {
            if (c < '0' || c > '9') throw std::invalid_argument("Malformed array type: " + type);
        }
        fixedLength = static_cast<size_t>(std::strtoull(len.c_str(), nullptr, 10));
    }
    return type.substr(0, open);
}

/// Strip every array suffix
std::string BaseType(const std::string& type) {
    size_t open = type.find('[');
    return open == std::string::npos ? type : type.substr(0, open);
}

/// Parse a decimal width suffix; returns 0 if absent or invalid
int ParseWidth(const std::string& digits) {
    if (digits.empty() || digits.size() > 3) return 0;
    for (char c : digits) {
        if (c < '0' || c > '9') return 0;
    }
    return std::atoi(digits.c_str());
}

void CollectDependencies(const TypeMap& types, const std::string& type,
                         std::set<std::string>& found) {
    std::string base = BaseType(type);
    if (found.count(base) || !types.count(base)) return;
    found.insert(base);
    for (const auto& field : types.at(base)) {
        CollectDependencies(types, field.type, found);
    }
}

std::string IntegerLiteral(const JSONValue& value, const std::string& type) {
    if (value.IsInt()) return std::to_string(value.GetInt());
    if (value.IsBigInt()) return value.GetIntegerText();
    if (value.IsDouble()) {
        double d = value.GetDouble();
        if (std::isfinite(d) && std::floor(d) == d) {
            std::ostringstream ss;
            ss << std::fixed << std::setprecision(0) << d;
            return ss.str();
        }
    }
    if (value.IsString()) return value.GetString();
    throw std::invalid_argument("Expected integer value for " + type);
}

Bytes PadWord(const Bytes& data, bool left) {
    Bytes word(32, 0);
    if (left) {
        std::copy(data.begin(), data.end(), word.begin() + (32 - data.size()));
    } else {
        std::copy(data.begin(), data.end(), word.begin());
    }
    return word;
}

Bytes EncodeValue(const TypeMap& types, const std::string& type, const JSONValue& value);

Bytes EncodeAtomic(const std::string& type, const JSONValue& value) {
    if (type == "address") {
        if (!value.IsString()) throw std::invalid_argument("Expected address string");
        return PadWord(Address::Parse(value.GetString()).ToBytes(), true);
    }

    if (type == "bool") {
        bool b;
        if (value.IsBool()) {
            b = value.GetBool();
        } else if (value.IsString() && (value.GetString() == "true" || value.GetString() == "false")) {
            b = value.GetString() == "true";
        } else if (value.IsInt()) {
            b = value.GetInt() != 0;
        } else {
            throw std::invalid_argument("Expected bool value");
        }
        Bytes word(32, 0);
        word[31] = b ? 1 : 0;
        return word;
    }

    if (type == "string") {
        if (!value.IsString()) throw std::invalid_argument("Expected string value");
        return Keccak256Hash(value.GetString()).ToBytes();
    }

    if (type == "bytes") {
        if (!value.IsString()) throw std::invalid_argument("Expected hex bytes value");
        return Keccak256Hash(HexToBytes(value.GetString())).ToBytes();
    }

    if (type.compare(0, 5, "bytes") == 0) {
        int n = ParseWidth(type.substr(5));
        if (n < 1 || n > 32) throw std::invalid_argument("Unknown type: " + type);
        if (!value.IsString()) throw std::invalid_argument("Expected hex value for " + type);
        Bytes raw = HexToBytes(value.GetString());
        if (raw.size() > static_cast<size_t>(n)) {
            throw std::invalid_argument("Value too long for " + type);
        }
        return PadWord(raw, false);
    }

    if (type.compare(0, 4, "uint") == 0) {
        int bits = type.size() == 4 ? 256 : ParseWidth(type.substr(4));
        if (bits < 8 || bits > 256 || bits % 8 != 0) throw std::invalid_argument("Unknown type: " + type);
        return EncodeIntegerWord(IntegerLiteral(value, type), bits, false);
    }

    if (type.compare(0, 3, "int") == 0) {
        int bits = type.size() == 3 ? 256 : ParseWidth(type.substr(3));
        if (bits < 8 || bits > 256 || bits % 8 != 0) throw std::invalid_argument("Unknown type: " + type);
        return EncodeIntegerWord(IntegerLiteral(value, type), bits, true);
    }

    throw std::invalid_argument("Unknown type: " + type);
}

Bytes EncodeValue(const TypeMap& types, const std::string& type, const JSONValue& value) {
    if (IsArrayType(type)) {
        std::optional<size_t> fixedLength;
        std::string element = ArrayElementType(type, fixedLength);
        if (!value.IsArray()) throw std::invalid_argument("Expected array for " + type);
        if (fixedLength && value.Size() != *fixedLength) {
            throw std::invalid_argument("Array length mismatch for " + type);
        }
        Keccak256 hasher;
        for (const auto& item : value.GetArray()) {
            hasher.Write(EncodeValue(types, element, item));
        }
        Hash256 h;
        hasher.Finalize(h.data());
        return h.ToBytes();
    }

    if (types.count(type)) {
        // Absent nested structs encode as a zero word
        if (value.IsNull()) return Bytes(32, 0);
        return HashStruct(types, type, value).ToBytes();
    }

    return EncodeAtomic(type, value);
}

} // anonymous namespace

// ============================================================================
// Encoding Primitives
// ============================================================================

std::string EncodeType(const TypeMap& types, const std::string& primaryType) {
    if (!types.count(primaryType)) {
        throw std::invalid_argument("Unknown struct type: " + primaryType);
    }

    std::set<std::string> deps;
    CollectDependencies(types, primaryType, deps);
    deps.erase(primaryType);

    std::vector<std::string> ordered;
    ordered.push_back(primaryType);
    ordered.insert(ordered.end(), deps.begin(), deps.end());

    std::string out;
    for (const auto& name : ordered) {
        out += name + "(";
        const auto& fields = types.at(name);
        for (size_t i = 0; i < fields.size(); ++i) {
            if (i > 0) out += ",";
            out += fields[i].type + " " + fields[i].name;
        }
        out += ")";
    }
    return out;
}

Hash256 HashType(const TypeMap& types, const std::string& primaryType) {
    return Keccak256Hash(EncodeType(types, primaryType));
}

Bytes EncodeData(const TypeMap& types, const std::string& primaryType, const JSONValue& data) {
    if (!data.IsObject()) {
        throw std::invalid_argument("Expected object for struct " + primaryType);
    }

    Bytes out = HashType(types, primaryType).ToBytes();
    for (const auto& field : types.at(primaryType)) {
        if (!data.HasKey(field.name)) {
            throw std::invalid_argument("Missing value for field " + primaryType + "." + field.name);
        }
        Bytes word = EncodeValue(types, field.type, data[field.name]);
        out.insert(out.end(), word.begin(), word.end());
    }
    return out;
}

Hash256 HashStruct(const TypeMap& types, const std::string& primaryType, const JSONValue& data) {
    return Keccak256Hash(EncodeData(types, primaryType, data));
}

std::vector<TypedDataField> DomainFieldsFor(const JSONValue& domain) {
    std::vector<TypedDataField> fields;
    for (const auto& field : DOMAIN_FIELD_ORDER) {
        if (domain.HasKey(field.name) && !domain[field.name].IsNull()) {
            fields.push_back(field);
        }
    }
    return fields;
}

// ============================================================================
// TypedData Implementation
// ============================================================================

TypeMap TypedData::TypesWithDomain() const {
    TypeMap all = types;
    if (!all.count(DOMAIN_TYPE)) {
        all[DOMAIN_TYPE] = DomainFieldsFor(domain);
    }
    return all;
}

Hash256 TypedData::HashDomain() const {
    return HashStruct(TypesWithDomain(), DOMAIN_TYPE, domain);
}

Hash256 TypedData::HashMessage() const {
    return HashStruct(TypesWithDomain(), primaryType, message);
}

Hash256 TypedData::SigningHash() const {
    Hash256 domainSeparator = HashDomain();
    Hash256 messageHash = HashMessage();

    Keccak256 hasher;
    const Byte prefix[2] = {0x19, 0x01};
    hasher.Write(prefix, sizeof(prefix));
    hasher.Write(domainSeparator.data(), domainSeparator.size());
    hasher.Write(messageHash.data(), messageHash.size());

    Hash256 result;
    hasher.Finalize(result.data());
    return result;
}

JSONValue TypedData::ToJSON() const {
    JSONValue typesJson = JSONValue::MakeObject();
    for (const auto& [name, fields] : TypesWithDomain()) {
        JSONValue arr = JSONValue::MakeArray();
        for (const auto& field : fields) {
            JSONValue entry = JSONValue::MakeObject();
            entry["name"] = field.name;
            entry["type"] = field.type;
            arr.Push(std::move(entry));
        }
        typesJson[name] = std::move(arr);
    }

    JSONValue out = JSONValue::MakeObject();
    out["types"] = std::move(typesJson);
    out["primaryType"] = primaryType;
    out["domain"] = domain;
    out["message"] = message;
    return out;
}

TypedData TypedData::FromJSON(const JSONValue& json) {
    if (!json.IsObject() || !json["types"].IsObject() || !json["primaryType"].IsString()) {
        throw std::invalid_argument("Typed data requires types and primaryType");
    }

    TypedData td;
    for (const auto& [name, fields] : json["types"].GetObject()) {
        if (!fields.IsArray()) {
            throw std::invalid_argument("Type definition must be an array: " + name);
        }
        std::vector<TypedDataField> members;
        for (const auto& f : fields.GetArray()) {
            if (!f["name"].IsString() || !f["type"].IsString()) {
                throw std::invalid_argument("Malformed member in type " + name);
            }
            members.push_back({f["name"].GetString(), f["type"].GetString()});
        }
        td.types[name] = std::move(members);
    }

    td.primaryType = json["primaryType"].GetString();
    if (!td.types.count(td.primaryType)) {
        throw std::invalid_argument("Primary type not defined: " + td.primaryType);
    }

    if (json.HasKey("domain")) td.domain = json["domain"];
    if (json.HasKey("message")) td.message = json["message"];
    return td;
}

} // namespace eip712
} // namespace ethwallet
