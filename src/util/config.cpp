// ETHWALLET - Configuration File Parser Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/util/config.h"
#include "ethwallet/util/fs.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace ethwallet {
namespace util {

// ============================================================================
// ConfigEntry Implementation
// ============================================================================

bool ConfigEntry::IsTrue() const {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

bool ConfigEntry::IsFalse() const {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "false" || lower == "no" || lower == "off" || lower == "0";
}

// ============================================================================
// ConfigManager Implementation
// ============================================================================

ConfigManager::ConfigManager() = default;

ConfigManager::~ConfigManager() = default;

// ============================================================================
// Static Helper Functions
// ============================================================================

std::string ConfigManager::Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

std::string ConfigManager::Unquote(const std::string& str) {
    if (str.length() < 2) {
        return str;
    }

    char first = str.front();
    char last = str.back();

    if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
        std::string result = str.substr(1, str.length() - 2);

        // Escape sequences only apply to double-quoted strings
        if (first == '"') {
            std::string unescaped;
            unescaped.reserve(result.length());

            for (size_t i = 0; i < result.length(); ++i) {
                if (result[i] == '\\' && i + 1 < result.length()) {
                    char next = result[i + 1];
                    switch (next) {
                        case 'n': unescaped += '\n'; ++i; break;
                        case 't': unescaped += '\t'; ++i; break;
                        case 'r': unescaped += '\r'; ++i; break;
                        case '\\': unescaped += '\\'; ++i; break;
                        case '"': unescaped += '"'; ++i; break;
                        default: unescaped += result[i]; break;
                    }
                } else {
                    unescaped += result[i];
                }
            }
            return unescaped;
        }

        return result;
    }

    return str;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }

    return std::nullopt;
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());

    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length() && value[i + 1] == '{') {
            size_t end = value.find('}', i + 2);
            if (end != std::string::npos) {
                std::string varName = value.substr(i + 2, end - i - 2);
                const char* envValue = std::getenv(varName.c_str());
                if (envValue) {
                    result += envValue;
                }
                i = end + 1;
                continue;
            }
        }

        result += value[i];
        ++i;
    }

    return result;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    return fs::ExpandUser(fs::Path(path)).String();
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) {
    if (section.empty()) {
        return key;
    }
    return section + "." + key;
}

void ConfigManager::Store(ConfigEntry entry, bool overwrite) {
    std::string fullKey = MakeKey(entry.key, entry.section);
    auto it = entries_.find(fullKey);
    if (it != entries_.end() && !it->second.isDefault && !overwrite) {
        return;
    }
    entries_[fullKey] = std::move(entry);
}

// ============================================================================
// File Parsing
// ============================================================================

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection,
                              bool overwrite, ConfigParseResult& result) {
    std::string trimmed = Trim(line);

    // Empty line or comment
    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return true;
    }

    // Section header [section]
    if (trimmed[0] == '[') {
        size_t end = trimmed.find(']');
        if (end == std::string::npos) {
            result = ConfigParseResult::Error(
                "Missing closing bracket in section header", source, lineNum);
            return false;
        }
        currentSection = Trim(trimmed.substr(1, end - 1));
        return true;
    }

    std::string key;
    std::string value;

    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        // Bare flag, "nokey" negates
        key = trimmed;
        value = "true";
        if (key.length() > 2 && key.compare(0, 2, "no") == 0 && std::islower(key[2])) {
            key = key.substr(2);
            value = "false";
        }
    } else {
        key = Trim(trimmed.substr(0, eqPos));
        value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }

    if (key.empty()) {
        result = ConfigParseResult::Error("Empty key", source, lineNum);
        return false;
    }

    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            result = ConfigParseResult::Error(
                "Invalid character in key: " + std::string(1, c), source, lineNum);
            return false;
        }
    }

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = currentSection;
    entry.source = source;
    entry.lineNumber = lineNum;
    Store(std::move(entry), overwrite);
    return true;
}

ConfigParseResult ConfigManager::ParseLines(std::istream& in, const std::string& source,
                                            bool overwrite) {
    std::string currentSection;
    std::string line;
    std::string continuationLine;
    int lineNum = 0;

    ConfigParseResult result = ConfigParseResult::Success();

    while (std::getline(in, line)) {
        ++lineNum;

        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }

        // Handle line continuation
        if (!line.empty() && line.back() == '\\') {
            continuationLine += line.substr(0, line.length() - 1);
            continue;
        }

        if (!continuationLine.empty()) {
            line = continuationLine + line;
            continuationLine.clear();
        }

        if (!ParseLine(line, source, lineNum, currentSection, overwrite, result)) {
            return result;
        }
    }

    // Handle trailing continuation
    if (!continuationLine.empty()) {
        if (!ParseLine(continuationLine, source, lineNum, currentSection, overwrite, result)) {
            return result;
        }
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath, bool overwrite) {
    std::string expandedPath = ExpandEnvVars(ExpandTilde(filePath));

    std::ifstream file(expandedPath);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + expandedPath);
    }

    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);

    if (fileSize > static_cast<std::streampos>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            expandedPath);
    }

    return ParseLines(file, expandedPath, overwrite);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName,
                                             bool overwrite) {
    std::istringstream stream(content);
    return ParseLines(stream, sourceName, overwrite);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    bool onlyPositional = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i] ? argv[i] : "";

        if (onlyPositional || arg.empty() || arg[0] != '-' || arg == "-") {
            positional_.push_back(arg);
            continue;
        }
        if (arg == "--") {
            onlyPositional = true;
            continue;
        }

        // Remove leading dashes
        size_t start = arg.find_first_not_of('-');
        arg = arg.substr(start);

        std::string key;
        std::string value;

        size_t eqPos = arg.find('=');
        if (eqPos != std::string::npos) {
            key = arg.substr(0, eqPos);
            value = arg.substr(eqPos + 1);
        } else {
            key = arg;
            value = "true";
            if (key.length() > 2 && key.compare(0, 2, "no") == 0 && std::islower(key[2])) {
                key = key.substr(2);
                value = "false";
            }
        }

        if (key.empty()) {
            return ConfigParseResult::Error("Empty option name", "<command-line>");
        }

        ConfigEntry entry;
        entry.key = key;
        entry.value = value;
        entry.source = "<command-line>";
        Store(std::move(entry), true);
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::LoadConfigFile() {
    auto explicitConf = TryGetString(ConfigKeys::CONF);
    std::string path = explicitConf
        ? ExpandEnvVars(ExpandTilde(*explicitConf))
        : (fs::Path(GetDataDir()) / DEFAULT_CONFIG_FILENAME).String();

    if (!fs::Exists(fs::Path(path))) {
        // A missing default file is fine, a missing explicit one is not
        if (explicitConf) {
            return ConfigParseResult::Error("Cannot open file: " + path);
        }
        return ConfigParseResult::Success();
    }
    return ParseFile(path, false);
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return entries_.find(MakeKey(key, section)) != entries_.end();
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it != entries_.end()) {
        return it->second.value;
    }
    return std::nullopt;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    auto strValue = TryGetString(key, section);
    if (!strValue) {
        return std::nullopt;
    }

    try {
        size_t pos;
        int64_t value = std::stoll(*strValue, &pos);

        // Unit suffixes
        std::string suffix = Trim(strValue->substr(pos));
        if (!suffix.empty()) {
            if (suffix.size() != 1) return std::nullopt;
            switch (std::tolower(suffix[0])) {
                case 'k': value *= 1024; break;
                case 'm': value *= 1024 * 1024; break;
                case 'g': value *= 1024LL * 1024 * 1024; break;
                default: return std::nullopt;
            }
        }

        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int64_t ConfigManager::GetInt(const std::string& key,
                              int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key,
                                                  const std::string& section) const {
    auto intValue = TryGetInt(key, section);
    if (!intValue || *intValue < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(*intValue);
}

uint64_t ConfigManager::GetUInt(const std::string& key,
                                uint64_t defaultValue,
                                const std::string& section) const {
    return TryGetUInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto strValue = TryGetString(key, section);
    if (!strValue) {
        return std::nullopt;
    }
    return ParseBool(*strValue);
}

bool ConfigManager::GetBool(const std::string& key,
                            bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue,
                                   const std::string& section) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue, section)));
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<programmatic>";
    Store(std::move(entry), true);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    std::string fullKey = MakeKey(key, section);
    if (entries_.find(fullKey) != entries_.end()) {
        return;
    }

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<default>";
    entry.isDefault = true;
    entries_[fullKey] = std::move(entry);
}

// ============================================================================
// Sections
// ============================================================================

std::vector<std::string> ConfigManager::GetSections() const {
    std::set<std::string> sections;
    for (const auto& [key, entry] : entries_) {
        if (!entry.section.empty()) {
            sections.insert(entry.section);
        }
    }
    return std::vector<std::string>(sections.begin(), sections.end());
}

std::vector<std::string> ConfigManager::GetKeys(const std::string& section) const {
    std::vector<std::string> keys;
    for (const auto& [fullKey, entry] : entries_) {
        if (entry.section == section) {
            keys.push_back(entry.key);
        }
    }
    return keys;
}

// ============================================================================
// Utilities
// ============================================================================

void ConfigManager::Clear() {
    entries_.clear();
    positional_.clear();
}

size_t ConfigManager::Size() const {
    return entries_.size();
}

std::string ConfigManager::GetDataDir() const {
    return GetPath(ConfigKeys::DATADIR, DEFAULT_DATADIR);
}

std::string ConfigManager::Dump() const {
    std::ostringstream oss;

    oss << "# Configuration Dump (" << entries_.size() << " entries)\n";

    for (const auto& [fullKey, entry] : entries_) {
        // Never echo secrets
        std::string value = entry.key == ConfigKeys::PASSWORD ? "****" : entry.value;
        oss << fullKey << "=" << value;
        if (entry.isDefault) {
            oss << "  # (default)";
        } else {
            oss << "  # " << entry.source;
            if (entry.lineNumber > 0) {
                oss << ":" << entry.lineNumber;
            }
        }
        oss << "\n";
    }

    return oss.str();
}

// ============================================================================
// WalletSettings
// ============================================================================

namespace {

template <typename T>
T RequireUInt(const ConfigManager& config, const char* key, T defaultValue,
              uint64_t minValue, uint64_t maxValue) {
    if (!config.HasKey(key)) {
        return defaultValue;
    }
    auto value = config.TryGetUInt(key);
    if (!value || *value < minValue || *value > maxValue) {
        throw std::invalid_argument(std::string("Invalid value for ") + key + ": " +
                                    config.GetString(key, ""));
    }
    return static_cast<T>(*value);
}

} // anonymous namespace

WalletSettings WalletSettings::Load(const ConfigManager& config) {
    WalletSettings s;
    s.dataDir = config.GetDataDir();
    s.rpcUrl = config.GetString(ConfigKeys::RPCURL, s.rpcUrl);
    s.chainId = RequireUInt<ChainId>(config, ConfigKeys::CHAINID, s.chainId, 1, UINT64_MAX);
    s.deviceId = config.GetString(ConfigKeys::DEVICEID, "");

    s.scryptN = RequireUInt<uint64_t>(config, ConfigKeys::SCRYPT_N, s.scryptN, 2, UINT64_MAX);
    if ((s.scryptN & (s.scryptN - 1)) != 0) {
        throw std::invalid_argument("keystore.scryptn must be a power of two");
    }
    s.scryptR = RequireUInt<uint32_t>(config, ConfigKeys::SCRYPT_R, s.scryptR, 1, UINT32_MAX);
    s.scryptP = RequireUInt<uint32_t>(config, ConfigKeys::SCRYPT_P, s.scryptP, 1, UINT32_MAX);

    s.siweExpirySeconds = RequireUInt<int64_t>(config, ConfigKeys::SIWE_EXPIRY,
                                               s.siweExpirySeconds, 1, INT32_MAX);
    s.receiptPollIntervalMs = RequireUInt<int64_t>(config, ConfigKeys::RECEIPT_POLL_INTERVAL,
                                                   s.receiptPollIntervalMs, 0, INT32_MAX);
    s.receiptMaxAttempts = RequireUInt<uint32_t>(config, ConfigKeys::RECEIPT_MAX_ATTEMPTS,
                                                 s.receiptMaxAttempts, 1, UINT32_MAX);

    s.logLevel = config.GetString(ConfigKeys::LOGLEVEL, s.logLevel);
    s.logFile = config.GetPath(ConfigKeys::LOGFILE, "");
    return s;
}

} // namespace util
} // namespace ethwallet
