// ETHWALLET - Time Utilities
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// Provides time-related utilities:
// - Unix timestamps
// - ISO-8601 formatting and parsing
// - Mock time for testing (millisecond resolution)

#ifndef ETHWALLET_UTIL_TIME_H
#define ETHWALLET_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace ethwallet {
namespace util {

// ============================================================================
// Type Aliases
// ============================================================================

/// Duration types
using Seconds = std::chrono::seconds;
using Milliseconds = std::chrono::milliseconds;

/// Time point types
using SystemClock = std::chrono::system_clock;
using SystemTimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Get current Unix timestamp in seconds
int64_t GetTime();

/// Get current Unix timestamp in milliseconds
int64_t GetTimeMillis();

/// Get current system time point (honors mock time)
SystemTimePoint GetSystemTime();

/// Convert Unix milliseconds to time point
SystemTimePoint FromUnixTimeMillis(int64_t timestampMs);

/// Convert time point to Unix milliseconds
int64_t ToUnixTimeMillis(SystemTimePoint tp);

// ============================================================================
// Time Formatting
// ============================================================================

/// Format as ISO 8601 UTC with milliseconds (2024-01-15T10:30:00.000Z)
std::string FormatISO8601Millis(SystemTimePoint tp);

/// Format Unix milliseconds as ISO 8601 UTC with milliseconds
std::string FormatISO8601Millis(int64_t timestampMs);

// ============================================================================
// Time Parsing
// ============================================================================

/// Parse ISO 8601 UTC ("2024-01-15T10:30:00Z", optional fraction)
/// @return Unix milliseconds, or nullopt on malformed input
std::optional<int64_t> ParseISO8601(const std::string& str);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Enable mock time (starts at the current real time unless already set)
void EnableMockTime();

/// Disable mock time
void DisableMockTime();

/// Check if mock time is enabled
bool IsMockTimeEnabled();

/// Set mock time (Unix milliseconds)
void SetMockTimeMillis(int64_t timestampMs);

/// Advance mock time
void AdvanceMockTime(Milliseconds duration);

/// Get mock time (Unix milliseconds)
int64_t GetMockTimeMillis();

// ============================================================================
// Sleep
// ============================================================================

/// Sleep for milliseconds. Under mock time, advances the mock clock instead.
void SleepMillis(int64_t milliseconds);

} // namespace util
} // namespace ethwallet

#endif // ETHWALLET_UTIL_TIME_H
