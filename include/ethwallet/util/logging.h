// ETHWALLET - Logging System
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// Provides a small logging system with:
// - Log levels (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
// - Per-module categories
// - Console, file and callback sinks
// - Printf-style and stream-style interfaces
//
// Key material, passwords and raw signatures are never passed to the logger.

#ifndef ETHWALLET_UTIL_LOGGING_H
#define ETHWALLET_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace ethwallet {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,   // Very detailed debugging
    Debug = 1,   // Debug information
    Info = 2,    // General information
    Warn = 3,    // Warnings
    Error = 4,   // Errors
    Fatal = 5,   // Fatal errors
    Off = 6      // Disable logging
};

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string (unknown strings map to Info)
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

/// Predefined log categories
namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* WALLET = "wallet";
    constexpr const char* AUTH = "auth";
    constexpr const char* SIGNING = "signing";
    constexpr const char* KEYSTORE = "keystore";
    constexpr const char* RPC = "rpc";
    constexpr const char* BRIDGE = "bridge";
    constexpr const char* DISPATCH = "dispatch";
    constexpr const char* CONFIG = "config";
}

// ============================================================================
// Log Entry
// ============================================================================

/// A single log entry
struct LogEntry {
    LogLevel level;
    std::string category;
    std::string message;
    std::string file;
    int line;
    std::string function;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;

    LogEntry() : level(LogLevel::Info), line(0) {}
};

// ============================================================================
// Log Sink Interface
// ============================================================================

/// Abstract base class for log output destinations
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /// Write a log entry
    virtual void Write(const LogEntry& entry) = 0;

    /// Flush any buffered output
    virtual void Flush() = 0;

    /// Set minimum log level for this sink
    virtual void SetLevel(LogLevel level) = 0;

    /// Get minimum log level for this sink
    virtual LogLevel GetLevel() const = 0;
};

// ============================================================================
// Console Sink
// ============================================================================

/// Log sink that writes to console (stdout/stderr)
class ConsoleSink : public ILogSink {
public:
    /// Configuration
    struct Config {
        bool useColors{true};           // Use ANSI color codes
        bool useStderr{true};           // Write everything to stderr
        bool showTimestamp{true};       // Include timestamp
        bool showLevel{true};           // Include log level
        bool showCategory{true};        // Include category
        bool showLocation{false};       // Include file:line
        LogLevel level{LogLevel::Info}; // Minimum level
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    std::mutex mutex_;

    /// Format entry for output
    std::string Format(const LogEntry& entry) const;

    /// Get ANSI color code for level
    const char* GetColorCode(LogLevel level) const;
};

// ============================================================================
// File Sink
// ============================================================================

/// Log sink that appends to a file
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Debug);
    ~FileSink() override;

    /// Check if file is open
    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

    const std::string& GetPath() const { return path_; }

private:
    std::string path_;
    LogLevel level_;
    std::ofstream file_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Callback Sink
// ============================================================================

/// Log sink that calls a callback function
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    CallbackSink() = default;
    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_{LogLevel::Info};
};

// ============================================================================
// Logger
// ============================================================================

/// Main logger class
class Logger {
public:
    /// Get the singleton instance
    static Logger& Instance();

    /// Add a log sink
    void AddSink(std::shared_ptr<ILogSink> sink);

    /// Remove a log sink
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);

    /// Clear all sinks
    void ClearSinks();

    /// Get number of sinks
    size_t SinkCount() const;

    /// Set global minimum log level
    void SetLevel(LogLevel level);

    /// Get global minimum log level
    LogLevel GetLevel() const { return level_.load(); }

    /// Log a message
    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);

    /// Log with printf-style formatting
    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* function,
              const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 7, 8)))
#endif
        ;

    /// Check if a message would be logged
    bool WillLog(LogLevel level) const;

    /// Flush all sinks
    void Flush();

private:
    Logger();
    ~Logger();

    // Non-copyable
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Stream-style logging helper
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line, const char* function);
    ~LogStream();

    // Non-copyable
    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    /// Stream insertion operators
    template<typename T>
    LogStream& operator<<(const T& value) {
        if (active_) {
            stream_ << value;
        }
        return *this;
    }

    /// Support for manipulators (endl, etc.)
    LogStream& operator<<(std::ostream& (*manip)(std::ostream&)) {
        if (active_) {
            manip(stream_);
        }
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    std::string category_;
    const char* file_;
    int line_;
    const char* function_;
    bool active_;
};

// ============================================================================
// Logging Macros
// ============================================================================

/// Get logger instance
#define ETHWALLET_LOGGER ::ethwallet::util::Logger::Instance()

/// Check if logging is enabled
#define ETHWALLET_LOG_ENABLED(level) \
    ETHWALLET_LOGGER.WillLog(::ethwallet::util::LogLevel::level)

/// Log with level and category
#define ETHWALLET_LOG(level, category) \
    if (ETHWALLET_LOG_ENABLED(level)) \
        ::ethwallet::util::LogStream(::ethwallet::util::LogLevel::level, category, \
                                     __FILE__, __LINE__, __func__)

/// Convenience macros for each level
#define LOG_TRACE(category)   ETHWALLET_LOG(Trace, category)
#define LOG_DEBUG(category)   ETHWALLET_LOG(Debug, category)
#define LOG_INFO(category)    ETHWALLET_LOG(Info, category)
#define LOG_WARN(category)    ETHWALLET_LOG(Warn, category)
#define LOG_ERROR(category)   ETHWALLET_LOG(Error, category)
#define LOG_FATAL(category)   ETHWALLET_LOG(Fatal, category)

/// Printf-style logging
#define ETHWALLET_LOGF(level, category, ...) \
    do { \
        if (ETHWALLET_LOG_ENABLED(level)) { \
            ETHWALLET_LOGGER.LogF(::ethwallet::util::LogLevel::level, category, \
                                  __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
    } while(0)

#define LogTraceF(category, ...)  ETHWALLET_LOGF(Trace, category, __VA_ARGS__)
#define LogDebugF(category, ...)  ETHWALLET_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   ETHWALLET_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   ETHWALLET_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  ETHWALLET_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// RAII timer for logging execution time at Debug level
class ScopedLogTimer {
public:
    ScopedLogTimer(const std::string& category, const std::string& operation);
    ~ScopedLogTimer();

private:
    std::string category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

#define ETHWALLET_CONCAT_INNER(a, b) a##b
#define ETHWALLET_CONCAT(a, b) ETHWALLET_CONCAT_INNER(a, b)

/// Macro for scoped timing
#define ETHWALLET_LOG_TIMER(category, operation) \
    ::ethwallet::util::ScopedLogTimer ETHWALLET_CONCAT(ethwallet_timer_, __LINE__)(category, operation)

// ============================================================================
// Utility Functions
// ============================================================================

/// Format timestamp for logging
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Truncate or pad string to fixed width
std::string FixedWidth(const std::string& str, size_t width, char pad = ' ');

/// Get basename from file path
std::string GetBasename(const std::string& path);

/// Address display form for log lines ("0x1234...abcd"); other input is returned as-is
std::string LogAddress(const std::string& address);

} // namespace util
} // namespace ethwallet

#endif // ETHWALLET_UTIL_LOGGING_H
