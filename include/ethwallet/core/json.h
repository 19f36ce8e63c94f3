// ETHWALLET - JSON Value
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// Minimal JSON document model used by the keystore, typed-data signing,
// the JSON-RPC transport and the bridge argument encoding.

#ifndef ETHWALLET_CORE_JSON_H
#define ETHWALLET_CORE_JSON_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ethwallet {

// ============================================================================
// JSON Value
// ============================================================================

/**
 * Represents a JSON value.
 * Supports: null, bool, int64, double, string, array, object.
 *
 * Integer literals outside the int64 range are held as Double with their
 * exact decimal digits kept alongside, and serialize back to those digits.
 *
 * Object keys are kept sorted, so serialization is deterministic.
 */
class JSONValue {
public:
    enum class Type {
        Null,
        Bool,
        Int,
        Double,
        String,
        Array,
        Object
    };

    using Array = std::vector<JSONValue>;
    using Object = std::map<std::string, JSONValue>;

    // Constructors
    JSONValue() : type_(Type::Null) {}
    JSONValue(std::nullptr_t) : type_(Type::Null) {}
    JSONValue(bool value) : type_(Type::Bool), boolValue_(value) {}
    JSONValue(int value) : type_(Type::Int), intValue_(value) {}
    JSONValue(int64_t value) : type_(Type::Int), intValue_(value) {}
    JSONValue(uint64_t value) : type_(Type::Int), intValue_(static_cast<int64_t>(value)) {}
    JSONValue(double value) : type_(Type::Double), doubleValue_(value) {}
    JSONValue(const char* value) : type_(Type::String), stringValue_(value) {}
    JSONValue(const std::string& value) : type_(Type::String), stringValue_(value) {}
    JSONValue(std::string&& value) : type_(Type::String), stringValue_(std::move(value)) {}
    JSONValue(const Array& value) : type_(Type::Array), arrayValue_(value) {}
    JSONValue(Array&& value) : type_(Type::Array), arrayValue_(std::move(value)) {}
    JSONValue(const Object& value) : type_(Type::Object), objectValue_(value) {}
    JSONValue(Object&& value) : type_(Type::Object), objectValue_(std::move(value)) {}

    /// Empty object / array factories
    static JSONValue MakeObject() { return JSONValue(Object{}); }
    static JSONValue MakeArray() { return JSONValue(Array{}); }

    /// Integer too wide for int64, kept as its decimal digits (optional '-')
    /// @throws std::invalid_argument if digits is not a decimal integer
    static JSONValue FromIntegerText(const std::string& digits);

    // Type checking
    Type GetType() const { return type_; }
    bool IsNull() const { return type_ == Type::Null; }
    bool IsBool() const { return type_ == Type::Bool; }
    bool IsInt() const { return type_ == Type::Int; }
    bool IsDouble() const { return type_ == Type::Double; }
    bool IsNumber() const { return type_ == Type::Int || type_ == Type::Double; }
    bool IsString() const { return type_ == Type::String; }
    bool IsArray() const { return type_ == Type::Array; }
    bool IsObject() const { return type_ == Type::Object; }
    bool IsBigInt() const { return type_ == Type::Double && !integerText_.empty(); }

    // Value getters (with defaults)
    bool GetBool(bool defaultValue = false) const;
    int64_t GetInt(int64_t defaultValue = 0) const;
    double GetDouble(double defaultValue = 0.0) const;
    const std::string& GetString(const std::string& defaultValue = emptyString_) const;
    /// Exact digits of an integer literal; empty unless IsBigInt()
    const std::string& GetIntegerText() const { return integerText_; }
    const Array& GetArray() const;
    const Object& GetObject() const;

    // Object access
    bool HasKey(const std::string& key) const;
    const JSONValue& operator[](const std::string& key) const;
    JSONValue& operator[](const std::string& key);
    const JSONValue& operator[](const char* key) const { return (*this)[std::string(key)]; }
    JSONValue& operator[](const char* key) { return (*this)[std::string(key)]; }

    // Array access
    size_t Size() const;
    const JSONValue& operator[](size_t index) const;
    JSONValue& operator[](size_t index);
    void Push(const JSONValue& value);
    void Push(JSONValue&& value);

    bool operator==(const JSONValue& other) const;
    bool operator!=(const JSONValue& other) const { return !(*this == other); }

    // Serialization
    std::string ToJSON(bool pretty = false, int indent = 0) const;

    /// Parse a document.
    /// @throws std::invalid_argument on malformed input
    static JSONValue Parse(const std::string& json);
    static std::optional<JSONValue> TryParse(const std::string& json);

    /// Get a null value reference (for returning from accessors)
    static const JSONValue& Null() { return nullValue_; }

private:
    Type type_;
    bool boolValue_{false};
    int64_t intValue_{0};
    double doubleValue_{0.0};
    std::string stringValue_;
    std::string integerText_;
    Array arrayValue_;
    Object objectValue_;

    static const JSONValue nullValue_;
    static const Array emptyArray_;
    static const Object emptyObject_;
    static const std::string emptyString_;
};

/// Quote and escape a string as a JSON string literal
std::string JSONQuote(const std::string& str);

/// Encode a list of strings as a compact JSON array
std::string ToJsonStringArray(const std::vector<std::string>& items);

} // namespace ethwallet

#endif // ETHWALLET_CORE_JSON_H
