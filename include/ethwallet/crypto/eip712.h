// ETHWALLET - EIP-712 Typed Structured Data Hashing
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// Implements encodeType / hashStruct / domain separator as defined by
// EIP-712 (eth_signTypedData_v4 semantics, including arrays).

#ifndef ETHWALLET_CRYPTO_EIP712_H
#define ETHWALLET_CRYPTO_EIP712_H

#include "ethwallet/core/json.h"
#include "ethwallet/core/types.h"

#include <map>
#include <string>
#include <vector>

namespace ethwallet {
namespace eip712 {

/// Name of the domain struct type
constexpr const char* DOMAIN_TYPE = "EIP712Domain";

/// One member of a struct type
struct TypedDataField {
    std::string name;
    std::string type;

    bool operator==(const TypedDataField& other) const {
        return name == other.name && type == other.type;
    }
};

/// Struct type name -> ordered members
using TypeMap = std::map<std::string, std::vector<TypedDataField>>;

// ============================================================================
// Encoding Primitives
// ============================================================================

/**
 * encodeType: the primary type followed by its referenced struct types in
 * alphabetical order, e.g. "Mail(Person from,Person to,string contents)Person(string name,address wallet)".
 * @throws std::invalid_argument if the type is unknown
 */
std::string EncodeType(const TypeMap& types, const std::string& primaryType);

/// keccak256(EncodeType)
Hash256 HashType(const TypeMap& types, const std::string& primaryType);

/**
 * encodeData: typeHash followed by one 32-byte word per member.
 * @throws std::invalid_argument on missing fields, unknown types or bad values
 */
Bytes EncodeData(const TypeMap& types, const std::string& primaryType, const JSONValue& data);

/// keccak256(EncodeData)
Hash256 HashStruct(const TypeMap& types, const std::string& primaryType, const JSONValue& data);

/// Domain members implied by the keys present in a domain object
std::vector<TypedDataField> DomainFieldsFor(const JSONValue& domain);

// ============================================================================
// Typed Data Document
// ============================================================================

/**
 * A complete eth_signTypedData_v4 document.
 */
class TypedData {
public:
    TypeMap types;
    std::string primaryType;
    JSONValue domain = JSONValue::MakeObject();
    JSONValue message = JSONValue::MakeObject();

    /// Domain separator: hashStruct(EIP712Domain, domain)
    Hash256 HashDomain() const;

    /// hashStruct(primaryType, message)
    Hash256 HashMessage() const;

    /// keccak256(0x19 0x01 || domainSeparator || hashStruct(message))
    Hash256 SigningHash() const;

    /// Types including EIP712Domain (derived from the domain if absent)
    TypeMap TypesWithDomain() const;

    /// Serialize as {types, primaryType, domain, message}
    JSONValue ToJSON() const;

    /// @throws std::invalid_argument on a malformed document
    static TypedData FromJSON(const JSONValue& json);
};

} // namespace eip712
} // namespace ethwallet

#endif // ETHWALLET_CRYPTO_EIP712_H
