// ETHWALLET - Time Utilities Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/util/time.h"

#include <atomic>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>

namespace ethwallet {
namespace util {

// ============================================================================
// Mock Time State
// ============================================================================

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTimeMs{0};
    std::mutex g_mockTimeMutex;

    int64_t RealTimeMillis() {
        return std::chrono::duration_cast<Milliseconds>(
            SystemClock::now().time_since_epoch()).count();
    }

    /// Floor division so pre-epoch values format correctly
    int64_t FloorDiv(int64_t a, int64_t b) {
        int64_t q = a / b;
        if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
        return q;
    }
}

// ============================================================================
// Unix Timestamps
// ============================================================================

int64_t GetTime() {
    return FloorDiv(GetTimeMillis(), 1000);
}

int64_t GetTimeMillis() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTimeMs.load();
    }
    return RealTimeMillis();
}

SystemTimePoint GetSystemTime() {
    return FromUnixTimeMillis(GetTimeMillis());
}

SystemTimePoint FromUnixTimeMillis(int64_t timestampMs) {
    return SystemTimePoint{Milliseconds{timestampMs}};
}

int64_t ToUnixTimeMillis(SystemTimePoint tp) {
    return std::chrono::duration_cast<Milliseconds>(tp.time_since_epoch()).count();
}

// ============================================================================
// Time Formatting
// ============================================================================

std::string FormatISO8601Millis(int64_t timestampMs) {
    std::time_t time = static_cast<std::time_t>(FloorDiv(timestampMs, 1000));
    int64_t ms = timestampMs - FloorDiv(timestampMs, 1000) * 1000;

    std::tm tm_buf;
    gmtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

std::string FormatISO8601Millis(SystemTimePoint tp) {
    return FormatISO8601Millis(ToUnixTimeMillis(tp));
}

// ============================================================================
// Time Parsing
// ============================================================================

std::optional<int64_t> ParseISO8601(const std::string& str) {
    std::tm tm_buf = {};

    std::istringstream iss(str);
    iss >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }

    // Optional fraction, scaled to milliseconds
    int64_t millis = 0;
    int c = iss.peek();
    if (c == '.') {
        iss.get();
        int digits = 0;
        while (std::isdigit(iss.peek())) {
            int d = iss.get() - '0';
            if (digits < 3) {
                millis = millis * 10 + d;
            }
            ++digits;
        }
        if (digits == 0) return std::nullopt;
        for (int i = digits; i < 3; ++i) millis *= 10;
    }

    // Only UTC designators are accepted
    c = iss.get();
    if (c != 'Z' && c != 'z') {
        return std::nullopt;
    }
    if (iss.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }

    std::time_t time = timegm(&tm_buf);
    if (time == -1) {
        return std::nullopt;
    }

    return static_cast<int64_t>(time) * 1000 + millis;
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    if (g_mockTimeMs.load() == 0) {
        g_mockTimeMs.store(RealTimeMillis());
    }
    g_mockTimeEnabled.store(true);
}

void DisableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    g_mockTimeEnabled.store(false);
    g_mockTimeMs.store(0);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

void SetMockTimeMillis(int64_t timestampMs) {
    g_mockTimeMs.store(timestampMs);
}

void AdvanceMockTime(Milliseconds duration) {
    g_mockTimeMs.fetch_add(duration.count());
}

int64_t GetMockTimeMillis() {
    return g_mockTimeMs.load();
}

// ============================================================================
// Sleep
// ============================================================================

void SleepMillis(int64_t milliseconds) {
    if (milliseconds <= 0) return;
    if (g_mockTimeEnabled.load()) {
        AdvanceMockTime(Milliseconds{milliseconds});
        return;
    }
    std::this_thread::sleep_for(Milliseconds{milliseconds});
}

} // namespace util
} // namespace ethwallet
