// ETHWALLET - Configuration File Parser
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// Parses INI-style configuration files for the wallet library and CLI.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]; keys inside are addressed as "section.key"
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, 1/0
// - Environment variable expansion: ${VAR_NAME}

#ifndef ETHWALLET_UTIL_CONFIG_H
#define ETHWALLET_UTIL_CONFIG_H

#include "ethwallet/core/types.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ethwallet {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default data directory
constexpr const char* DEFAULT_DATADIR = "~/.ethwallet";

/// Default config file name (looked up inside the data directory)
constexpr const char* DEFAULT_CONFIG_FILENAME = "ethwallet.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

/**
 * A single configuration entry.
 */
struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path where this was defined
    int lineNumber{0};
    bool isDefault{false}; // True if this is a default value

    /// Check if value is a boolean true
    bool IsTrue() const;

    /// Check if value is a boolean false
    bool IsFalse() const;
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

/**
 * Result of parsing a configuration file.
 */
struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Manages configuration from files and command-line arguments.
 *
 * Priority order (highest to lowest):
 * 1. Command-line arguments
 * 2. Data directory config file (<datadir>/ethwallet.conf)
 * 3. Built-in defaults
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // ========================================================================
    // Parsing
    // ========================================================================

    /**
     * Parse a configuration file.
     *
     * @param filePath Path to the config file
     * @param overwrite If false, keys that are already set keep their value
     * @return Parse result
     */
    ConfigParseResult ParseFile(const std::string& filePath, bool overwrite = false);

    /**
     * Parse configuration from a string.
     *
     * @param content Config file content
     * @param sourceName Name for error messages
     * @param overwrite If false, keys that are already set keep their value
     * @return Parse result
     */
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>",
                                  bool overwrite = false);

    /**
     * Parse command-line arguments of the form -key=value or -flag.
     * Arguments not starting with '-' are collected as positional arguments.
     * Everything after a bare "--" is positional.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    /**
     * Load <datadir>/ethwallet.conf (or the file named by -conf) if present.
     * Values already set from the command line are kept.
     */
    ConfigParseResult LoadConfigFile();

    /// Positional arguments collected by ParseCommandLine
    const std::vector<std::string>& GetPositionalArgs() const { return positional_; }

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    /// Check if a key exists
    bool HasKey(const std::string& key, const std::string& section = "") const;

    /// Get raw string value (returns nullopt if key doesn't exist)
    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    /// Get string value with default
    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Get integer value (returns nullopt if key doesn't exist or is invalid)
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    /// Get integer value with default
    int64_t GetInt(const std::string& key,
                   int64_t defaultValue,
                   const std::string& section = "") const;

    /// Get unsigned integer value (returns nullopt if key doesn't exist or is invalid)
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;

    /// Get unsigned integer value with default
    uint64_t GetUInt(const std::string& key,
                     uint64_t defaultValue,
                     const std::string& section = "") const;

    /// Get boolean value (returns nullopt if key doesn't exist or is invalid)
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    /// Get boolean value with default
    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    /// Get path value (with ~ and environment expansion)
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    /// Set a value programmatically
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a default value (lower priority than config files)
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Sections
    // ========================================================================

    /// Get all section names
    std::vector<std::string> GetSections() const;

    /// Get all keys in a section (empty for global)
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    // ========================================================================
    // Utilities
    // ========================================================================

    /// Clear all configuration
    void Clear();

    /// Get number of entries
    size_t Size() const;

    /// Data directory: the "datadir" key, else DEFAULT_DATADIR (expanded)
    std::string GetDataDir() const;

    /// Expand environment variables in a string
    static std::string ExpandEnvVars(const std::string& value);

    /// Expand ~ to home directory
    static std::string ExpandTilde(const std::string& path);

    /// Dump all configuration to string
    std::string Dump() const;

private:
    /// Internal key for section.key combination
    static std::string MakeKey(const std::string& key, const std::string& section);

    /// Store an entry, honoring the overwrite policy
    void Store(ConfigEntry entry, bool overwrite);

    /// Parse a stream of lines
    ConfigParseResult ParseLines(std::istream& in, const std::string& source, bool overwrite);

    /// Parse a single line
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, bool overwrite, ConfigParseResult& result);

    /// Trim whitespace
    static std::string Trim(const std::string& str);

    /// Unquote a value
    static std::string Unquote(const std::string& str);

    /// Parse boolean string
    static std::optional<bool> ParseBool(const std::string& str);

    std::map<std::string, ConfigEntry> entries_;
    std::vector<std::string> positional_;
};

// ============================================================================
// Common Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* CONF = "conf";
    constexpr const char* DATADIR = "datadir";
    constexpr const char* PASSWORD = "password";
    constexpr const char* RPCURL = "rpcurl";
    constexpr const char* CHAINID = "chainid";
    constexpr const char* DEVICEID = "deviceid";
    constexpr const char* SCRYPT_N = "keystore.scryptn";
    constexpr const char* SCRYPT_R = "keystore.scryptr";
    constexpr const char* SCRYPT_P = "keystore.scryptp";
    constexpr const char* SIWE_EXPIRY = "siwe.expiry";
    constexpr const char* RECEIPT_POLL_INTERVAL = "receipt.pollinterval";
    constexpr const char* RECEIPT_MAX_ATTEMPTS = "receipt.maxattempts";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
}

// ============================================================================
// Typed Wallet Settings
// ============================================================================

/// Typed view of the configuration keys the wallet consumes
struct WalletSettings {
    std::string dataDir;
    std::string rpcUrl{"http://127.0.0.1:8545"};
    ChainId chainId{1};
    std::string deviceId;              // empty: derive from the machine
    uint64_t scryptN{262144};
    uint32_t scryptR{1};
    uint32_t scryptP{8};
    int64_t siweExpirySeconds{300};
    int64_t receiptPollIntervalMs{1000};
    uint32_t receiptMaxAttempts{120};
    std::string logLevel{"info"};
    std::string logFile;               // empty: no file sink

    /// Build settings from a configuration, falling back to the defaults above.
    /// Throws std::invalid_argument when a numeric key is malformed or out of range.
    static WalletSettings Load(const ConfigManager& config);
};

} // namespace util
} // namespace ethwallet

#endif // ETHWALLET_UTIL_CONFIG_H
