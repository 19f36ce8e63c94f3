// ETHWALLET - JSON Value Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/core/json.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ethwallet {

// ============================================================================
// JSONValue Static Members
// ============================================================================

const JSONValue JSONValue::nullValue_;
const JSONValue::Array JSONValue::emptyArray_;
const JSONValue::Object JSONValue::emptyObject_;
const std::string JSONValue::emptyString_;

// ============================================================================
// Helpers
// ============================================================================

namespace {

void AppendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

bool ParseHex4(const std::string& s, size_t pos, uint32_t& out) {
    if (pos + 4 > s.size()) return false;
    out = 0;
    for (size_t i = pos; i < pos + 4; ++i) {
        char c = s[i];
        out <<= 4;
        if (c >= '0' && c <= '9') out |= static_cast<uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') out |= static_cast<uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') out |= static_cast<uint32_t>(c - 'A' + 10);
        else return false;
    }
    return true;
}

} // namespace

std::string JSONQuote(const std::string& str) {
    std::ostringstream ss;
    ss << '"';
    for (char c : str) {
        switch (c) {
            case '"': ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\b': ss << "\\b"; break;
            case '\f': ss << "\\f"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 32) {
                    ss << "\\u" << std::hex << std::setw(4)
                       << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    ss << c;
                }
        }
    }
    ss << '"';
    return ss.str();
}

std::string ToJsonStringArray(const std::vector<std::string>& items) {
    JSONValue::Array arr;
    arr.reserve(items.size());
    for (const auto& item : items) {
        arr.emplace_back(item);
    }
    return JSONValue(std::move(arr)).ToJSON();
}

// ============================================================================
// JSONValue Implementation
// ============================================================================

JSONValue JSONValue::FromIntegerText(const std::string& digits) {
    size_t start = (!digits.empty() && digits[0] == '-') ? 1 : 0;
    if (digits.size() == start ||
        !std::all_of(digits.begin() + start, digits.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        throw std::invalid_argument("Not an integer literal: " + digits);
    }
    JSONValue value(std::strtod(digits.c_str(), nullptr));
    value.integerText_ = digits;
    return value;
}

bool JSONValue::GetBool(bool defaultValue) const {
    if (type_ == Type::Bool) return boolValue_;
    return defaultValue;
}

int64_t JSONValue::GetInt(int64_t defaultValue) const {
    if (type_ == Type::Int) return intValue_;
    if (type_ == Type::Double) return static_cast<int64_t>(doubleValue_);
    return defaultValue;
}

double JSONValue::GetDouble(double defaultValue) const {
    if (type_ == Type::Double) return doubleValue_;
    if (type_ == Type::Int) return static_cast<double>(intValue_);
    return defaultValue;
}

const std::string& JSONValue::GetString(const std::string& defaultValue) const {
    if (type_ == Type::String) return stringValue_;
    return defaultValue;
}

const JSONValue::Array& JSONValue::GetArray() const {
    if (type_ == Type::Array) return arrayValue_;
    return emptyArray_;
}

const JSONValue::Object& JSONValue::GetObject() const {
    if (type_ == Type::Object) return objectValue_;
    return emptyObject_;
}

bool JSONValue::HasKey(const std::string& key) const {
    if (type_ != Type::Object) return false;
    return objectValue_.count(key) > 0;
}

const JSONValue& JSONValue::operator[](const std::string& key) const {
    if (type_ != Type::Object) return nullValue_;
    auto it = objectValue_.find(key);
    if (it == objectValue_.end()) return nullValue_;
    return it->second;
}

JSONValue& JSONValue::operator[](const std::string& key) {
    if (type_ != Type::Object) {
        type_ = Type::Object;
        objectValue_.clear();
    }
    return objectValue_[key];
}

size_t JSONValue::Size() const {
    if (type_ == Type::Array) return arrayValue_.size();
    if (type_ == Type::Object) return objectValue_.size();
    return 0;
}

const JSONValue& JSONValue::operator[](size_t index) const {
    if (type_ != Type::Array || index >= arrayValue_.size()) return nullValue_;
    return arrayValue_[index];
}

JSONValue& JSONValue::operator[](size_t index) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    if (index >= arrayValue_.size()) {
        arrayValue_.resize(index + 1);
    }
    return arrayValue_[index];
}

void JSONValue::Push(const JSONValue& value) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    arrayValue_.push_back(value);
}

void JSONValue::Push(JSONValue&& value) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    arrayValue_.push_back(std::move(value));
}

bool JSONValue::operator==(const JSONValue& other) const {
    if (type_ != other.type_) return false;
    switch (type_) {
        case Type::Null:   return true;
        case Type::Bool:   return boolValue_ == other.boolValue_;
        case Type::Int:    return intValue_ == other.intValue_;
        case Type::Double:
            if (!integerText_.empty() || !other.integerText_.empty()) {
                return integerText_ == other.integerText_;
            }
            return doubleValue_ == other.doubleValue_;
        case Type::String: return stringValue_ == other.stringValue_;
        case Type::Array:  return arrayValue_ == other.arrayValue_;
        case Type::Object: return objectValue_ == other.objectValue_;
    }
    return false;
}

std::string JSONValue::ToJSON(bool pretty, int indent) const {
    std::ostringstream ss;
    std::string indentStr(indent * 2, ' ');
    std::string childIndent((indent + 1) * 2, ' ');

    switch (type_) {
        case Type::Null:
            ss << "null";
            break;

        case Type::Bool:
            ss << (boolValue_ ? "true" : "false");
            break;

        case Type::Int:
            ss << intValue_;
            break;

        case Type::Double:
            if (!integerText_.empty()) {
                ss << integerText_;
            } else {
                ss << std::setprecision(15) << doubleValue_;
            }
            break;

        case Type::String:
            ss << JSONQuote(stringValue_);
            break;

        case Type::Array: {
            if (arrayValue_.empty()) {
                ss << "[]";
            } else if (pretty) {
                ss << "[\n";
                for (size_t i = 0; i < arrayValue_.size(); ++i) {
                    ss << childIndent << arrayValue_[i].ToJSON(true, indent + 1);
                    if (i + 1 < arrayValue_.size()) ss << ",";
                    ss << "\n";
                }
                ss << indentStr << "]";
            } else {
                ss << "[";
                for (size_t i = 0; i < arrayValue_.size(); ++i) {
                    if (i > 0) ss << ",";
                    ss << arrayValue_[i].ToJSON(false, 0);
                }
                ss << "]";
            }
            break;
        }

        case Type::Object: {
            if (objectValue_.empty()) {
                ss << "{}";
            } else if (pretty) {
                ss << "{\n";
                size_t i = 0;
                for (const auto& [key, value] : objectValue_) {
                    ss << childIndent << JSONQuote(key) << ": "
                       << value.ToJSON(true, indent + 1);
                    if (++i < objectValue_.size()) ss << ",";
                    ss << "\n";
                }
                ss << indentStr << "}";
            } else {
                ss << "{";
                size_t i = 0;
                for (const auto& [key, value] : objectValue_) {
                    if (i++ > 0) ss << ",";
                    ss << JSONQuote(key) << ":" << value.ToJSON(false, 0);
                }
                ss << "}";
            }
            break;
        }
    }

    return ss.str();
}

JSONValue JSONValue::Parse(const std::string& json) {
    auto result = TryParse(json);
    if (!result) {
        throw std::invalid_argument("JSON parse error");
    }
    return std::move(*result);
}

std::optional<JSONValue> JSONValue::TryParse(const std::string& json) {
    size_t pos = 0;

    auto skipWhitespace = [&]() {
        while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) ++pos;
    };

    std::function<std::optional<JSONValue>()> parseValue;

    auto parseString = [&]() -> std::optional<std::string> {
        if (pos >= json.size() || json[pos] != '"') return std::nullopt;
        ++pos;

        std::string result;
        while (pos < json.size() && json[pos] != '"') {
            if (json[pos] == '\\') {
                if (++pos >= json.size()) return std::nullopt;
                switch (json[pos]) {
                    case '"': result += '"'; break;
                    case '\\': result += '\\'; break;
                    case '/': result += '/'; break;
                    case 'b': result += '\b'; break;
                    case 'f': result += '\f'; break;
                    case 'n': result += '\n'; break;
                    case 'r': result += '\r'; break;
                    case 't': result += '\t'; break;
                    case 'u': {
                        uint32_t cp;
                        if (!ParseHex4(json, pos + 1, cp)) return std::nullopt;
                        pos += 4;
                        if (cp >= 0xD800 && cp <= 0xDBFF) {
                            // High surrogate must be followed by \uDC00-\uDFFF
                            uint32_t low;
                            if (pos + 2 >= json.size() || json[pos + 1] != '\\' ||
                                json[pos + 2] != 'u' || !ParseHex4(json, pos + 3, low) ||
                                low < 0xDC00 || low > 0xDFFF) {
                                return std::nullopt;
                            }
                            pos += 6;
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                            return std::nullopt;
                        }
                        AppendUtf8(result, cp);
                        break;
                    }
                    default: return std::nullopt;
                }
            } else if (static_cast<unsigned char>(json[pos]) < 0x20) {
                return std::nullopt;
            } else {
                result += json[pos];
            }
            ++pos;
        }
        if (pos >= json.size()) return std::nullopt;
        ++pos;  // Skip closing quote
        return result;
    };

    auto parseNumber = [&]() -> std::optional<JSONValue> {
        size_t start = pos;
        bool isFloat = false;

        if (json[pos] == '-') ++pos;

        size_t digitsStart = pos;
        while (pos < json.size() && std::isdigit(static_cast<unsigned char>(json[pos]))) ++pos;
        if (pos == digitsStart) return std::nullopt;

        if (pos < json.size() && json[pos] == '.') {
            isFloat = true;
            ++pos;
            size_t fracStart = pos;
            while (pos < json.size() && std::isdigit(static_cast<unsigned char>(json[pos]))) ++pos;
            if (pos == fracStart) return std::nullopt;
        }

        if (pos < json.size() && (json[pos] == 'e' || json[pos] == 'E')) {
            isFloat = true;
            ++pos;
            if (pos < json.size() && (json[pos] == '+' || json[pos] == '-')) ++pos;
            size_t expStart = pos;
            while (pos < json.size() && std::isdigit(static_cast<unsigned char>(json[pos]))) ++pos;
            if (pos == expStart) return std::nullopt;
        }

        std::string numStr = json.substr(start, pos - start);
        if (!isFloat) {
            errno = 0;
            char* end = nullptr;
            long long v = std::strtoll(numStr.c_str(), &end, 10);
            if (errno == 0 && end && *end == '\0') {
                return JSONValue(static_cast<int64_t>(v));
            }
            return FromIntegerText(numStr);
        }
        char* end = nullptr;
        double d = std::strtod(numStr.c_str(), &end);
        if (!end || *end != '\0') return std::nullopt;
        return JSONValue(d);
    };

    auto parseArray = [&]() -> std::optional<JSONValue> {
        if (pos >= json.size() || json[pos] != '[') return std::nullopt;
        ++pos;

        Array arr;
        skipWhitespace();

        if (pos < json.size() && json[pos] == ']') {
            ++pos;
            return JSONValue(std::move(arr));
        }

        while (true) {
            skipWhitespace();
            auto val = parseValue();
            if (!val) return std::nullopt;
            arr.push_back(std::move(*val));

            skipWhitespace();
            if (pos >= json.size()) return std::nullopt;

            if (json[pos] == ']') {
                ++pos;
                return JSONValue(std::move(arr));
            }
            if (json[pos] != ',') return std::nullopt;
            ++pos;
        }
    };

    auto parseObject = [&]() -> std::optional<JSONValue> {
        if (pos >= json.size() || json[pos] != '{') return std::nullopt;
        ++pos;

        Object obj;
        skipWhitespace();

        if (pos < json.size() && json[pos] == '}') {
            ++pos;
            return JSONValue(std::move(obj));
        }

        while (true) {
            skipWhitespace();
            auto key = parseString();
            if (!key) return std::nullopt;

            skipWhitespace();
            if (pos >= json.size() || json[pos] != ':') return std::nullopt;
            ++pos;

            skipWhitespace();
            auto val = parseValue();
            if (!val) return std::nullopt;
            obj[*key] = std::move(*val);

            skipWhitespace();
            if (pos >= json.size()) return std::nullopt;

            if (json[pos] == '}') {
                ++pos;
                return JSONValue(std::move(obj));
            }
            if (json[pos] != ',') return std::nullopt;
            ++pos;
        }
    };

    parseValue = [&]() -> std::optional<JSONValue> {
        skipWhitespace();
        if (pos >= json.size()) return std::nullopt;

        char c = json[pos];

        if (c == 'n' && json.compare(pos, 4, "null") == 0) {
            pos += 4;
            return JSONValue();
        }
        if (c == 't' && json.compare(pos, 4, "true") == 0) {
            pos += 4;
            return JSONValue(true);
        }
        if (c == 'f' && json.compare(pos, 5, "false") == 0) {
            pos += 5;
            return JSONValue(false);
        }
        if (c == '"') {
            auto str = parseString();
            if (!str) return std::nullopt;
            return JSONValue(std::move(*str));
        }
        if (c == '[') return parseArray();
        if (c == '{') return parseObject();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();

        return std::nullopt;
    };

    auto result = parseValue();
    if (!result) return std::nullopt;

    skipWhitespace();
    if (pos != json.size()) return std::nullopt;  // Extra characters

    return result;
}

} // namespace ethwallet
