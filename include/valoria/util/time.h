// VALORIA - Time Utilities
// Copyright (c) 2024 VALORIA Developers
// MIT License
//
// Wall clock access for the consensus engine. Every timestamp VALORIA
// records comes from GetTime(), which tests replace with a mock clock.

#ifndef VALORIA_UTIL_TIME_H
#define VALORIA_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace valoria {
namespace util {

using Seconds = std::chrono::seconds;
using SystemTimePoint = std::chrono::system_clock::time_point;

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;

/// Current Unix timestamp in seconds, or the mock clock when enabled
int64_t GetTime();

// ============================================================================
// Formatting
// ============================================================================

/**
 * Format Unix seconds as ISO 8601 in UTC (e.g. "2024-01-15T10:30:00Z").
 * Timestamps outside the calendar range of the C library come back as
 * "@<seconds>" so stored records always print.
 */
std::string FormatISO8601(int64_t timestamp);

/// Local time with milliseconds for log lines ("2024-01-15 10:30:00.123")
std::string FormatLog(SystemTimePoint tp);

/// Compact duration such as "1h 23m 45s"
std::string FormatDuration(Seconds duration);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Freeze GetTime(). The clock starts at the wall time unless SetMockTime()
/// chose a value first.
void EnableMockTime();
void DisableMockTime();

void SetMockTime(int64_t timestamp);
void AdvanceMockTime(Seconds duration);

} // namespace util
} // namespace valoria

#endif // VALORIA_UTIL_TIME_H
