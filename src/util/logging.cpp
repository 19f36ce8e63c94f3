// ETHWALLET - Logging Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <unistd.h>

namespace ethwallet {
namespace util {

// ============================================================================
// Log Level Functions
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
        default:              return "UNKNOWN";
    }
}

LogLevel LogLevelFromString(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::Trace;
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO")  return LogLevel::Info;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warn;
    if (upper == "ERROR") return LogLevel::Error;
    if (upper == "FATAL") return LogLevel::Fatal;
    if (upper == "OFF")   return LogLevel::Off;

    return LogLevel::Info; // Default
}

// ============================================================================
// Utility Functions
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string FixedWidth(const std::string& str, size_t width, char pad) {
    if (str.length() >= width) {
        return str.substr(0, width);
    }
    return str + std::string(width - str.length(), pad);
}

std::string GetBasename(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    if (pos != std::string::npos) {
        return path.substr(pos + 1);
    }
    return path;
}

std::string LogAddress(const std::string& address) {
    if (address.size() != 42) {
        return address;
    }
    return address.substr(0, 6) + "..." + address.substr(38);
}

// ============================================================================
// ConsoleSink Implementation
// ============================================================================

ConsoleSink::ConsoleSink() = default;

ConsoleSink::ConsoleSink(const Config& config) : config_(config) {}

void ConsoleSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }

    std::string formatted = Format(entry);

    std::lock_guard<std::mutex> lock(mutex_);

    // Diagnostics go to stderr so command output on stdout stays clean
    FILE* stream = config_.useStderr ? stderr : stdout;

    if (config_.useColors && isatty(fileno(stream))) {
        const char* colorCode = GetColorCode(entry.level);
        const char* resetCode = "\033[0m";
        fprintf(stream, "%s%s%s\n", colorCode, formatted.c_str(), resetCode);
    } else {
        fprintf(stream, "%s\n", formatted.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    fflush(stdout);
    fflush(stderr);
}

std::string ConsoleSink::Format(const LogEntry& entry) const {
    std::ostringstream oss;

    if (config_.showTimestamp) {
        oss << FormatLogTimestamp(entry.timestamp) << " ";
    }

    if (config_.showLevel) {
        oss << "[" << FixedWidth(LogLevelToString(entry.level), 5) << "] ";
    }

    if (config_.showCategory && !entry.category.empty() &&
        entry.category != LogCategory::DEFAULT) {
        oss << "[" << entry.category << "] ";
    }

    if (config_.showLocation && !entry.file.empty()) {
        oss << GetBasename(entry.file) << ":" << entry.line << " ";
    }

    oss << entry.message;

    return oss.str();
}

const char* ConsoleSink::GetColorCode(LogLevel level) const {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";      // Dark gray
        case LogLevel::Debug: return "\033[36m";      // Cyan
        case LogLevel::Info:  return "\033[32m";      // Green
        case LogLevel::Warn:  return "\033[33m";      // Yellow
        case LogLevel::Error: return "\033[31m";      // Red
        case LogLevel::Fatal: return "\033[35;1m";    // Bold magenta
        default:              return "\033[0m";       // Reset
    }
}

// ============================================================================
// FileSink Implementation
// ============================================================================

FileSink::FileSink(const std::string& path, LogLevel level)
    : path_(path), level_(level) {
    file_.open(path, std::ios::out | std::ios::app);
}

FileSink::~FileSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

bool FileSink::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

void FileSink::Write(const LogEntry& entry) {
    if (entry.level < level_) {
        return;
    }

    std::ostringstream oss;
    oss << FormatLogTimestamp(entry.timestamp) << " "
        << "[" << FixedWidth(LogLevelToString(entry.level), 5) << "] ";
    if (!entry.category.empty()) {
        oss << "[" << entry.category << "] ";
    }
    if (!entry.file.empty()) {
        oss << GetBasename(entry.file) << ":" << entry.line << " ";
    }
    oss << entry.message << "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << oss.str();
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// CallbackSink Implementation
// ============================================================================

CallbackSink::CallbackSink(Callback callback, LogLevel level)
    : callback_(std::move(callback)), level_(level) {}

void CallbackSink::Write(const LogEntry& entry) {
    if (entry.level < level_ || !callback_) {
        return;
    }
    callback_(entry);
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() = default;

Logger::~Logger() {
    Flush();
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    return sinks_.size();
}

void Logger::SetLevel(LogLevel level) {
    level_.store(level);
}

void Logger::Log(LogLevel level, const std::string& category,
                 const std::string& message,
                 const char* file, int line, const char* function) {
    if (!WillLog(level)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file ? file : "";
    entry.line = line;
    entry.function = function ? function : "";
    entry.timestamp = std::chrono::system_clock::now();
    entry.threadId = std::this_thread::get_id();

    // Send to all sinks
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Write(entry);
    }
}

void Logger::LogF(LogLevel level, const std::string& category,
                  const char* file, int line, const char* function,
                  const char* format, ...) {
    if (!WillLog(level)) {
        return;
    }

    // Format message
    char buffer[4096];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    Log(level, category, buffer, file, line, function);
}

bool Logger::WillLog(LogLevel level) const {
    LogLevel threshold = level_.load();
    return threshold != LogLevel::Off && level >= threshold;
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

// ============================================================================
// LogStream Implementation
// ============================================================================

LogStream::LogStream(LogLevel level, const std::string& category,
                     const char* file, int line, const char* function)
    : level_(level)
    , category_(category)
    , file_(file)
    , line_(line)
    , function_(function)
    , active_(Logger::Instance().WillLog(level)) {}

LogStream::~LogStream() {
    if (active_) {
        Logger::Instance().Log(level_, category_, stream_.str(),
                               file_, line_, function_);
    }
}

// ============================================================================
// ScopedLogTimer Implementation
// ============================================================================

ScopedLogTimer::ScopedLogTimer(const std::string& category,
                               const std::string& operation)
    : category_(category)
    , operation_(operation)
    , start_(std::chrono::steady_clock::now()) {

    if (Logger::Instance().WillLog(LogLevel::Debug)) {
        Logger::Instance().Log(LogLevel::Debug, category,
                               "Starting: " + operation);
    }
}

ScopedLogTimer::~ScopedLogTimer() {
    auto end = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        end - start_);

    if (Logger::Instance().WillLog(LogLevel::Debug)) {
        std::ostringstream oss;
        oss << "Completed: " << operation_ << " in " << duration.count() << "ms";
        Logger::Instance().Log(LogLevel::Debug, category_, oss.str());
    }
}

} // namespace util
} // namespace ethwallet
