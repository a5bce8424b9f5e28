// DIRGATE - Time Utilities
// Copyright (c) 2024 DIRGATE Developers
// MIT License
//
// Provides time-related utilities:
// - Unix timestamps and clock helpers
// - UTC formatting for file names and API payloads
// - Mock time for testing time-dependent components
// - Deadline tracking for bounded operations

#ifndef DIRGATE_UTIL_TIME_H
#define DIRGATE_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace dirgate {
namespace util {

// ============================================================================
// Type Aliases
// ============================================================================

using Seconds = std::chrono::seconds;
using Milliseconds = std::chrono::milliseconds;
using Minutes = std::chrono::minutes;

using SystemClock = std::chrono::system_clock;
using SteadyClock = std::chrono::steady_clock;
using SystemTimePoint = std::chrono::system_clock::time_point;
using SteadyTimePoint = std::chrono::steady_clock::time_point;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Current Unix timestamp in seconds (honours mock time)
int64_t GetTime();

/// Current Unix timestamp in milliseconds (honours mock time)
int64_t GetTimeMillis();

/// Current wall-clock time point (honours mock time)
SystemTimePoint GetSystemTime();

SystemTimePoint FromUnixTime(int64_t timestamp);
int64_t ToUnixTime(SystemTimePoint tp);

// ============================================================================
// Time Formatting
// ============================================================================

/// Format as ISO 8601 in UTC (e.g. "2024-01-15T10:30:00Z")
std::string FormatISO8601(SystemTimePoint tp);

/// Format with a strftime pattern in UTC
std::string FormatUTC(SystemTimePoint tp, const char* format);

/// Format a duration as "1h 23m 45s"
std::string FormatDuration(Seconds duration);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

void EnableMockTime();
void DisableMockTime();
bool IsMockTimeEnabled();

/// Set mock time in Unix seconds
void SetMockTime(int64_t timestamp);

/// Move mock time forward
void AdvanceMockTime(Seconds duration);

// ============================================================================
// Deadline Timer
// ============================================================================

/// Tracks a monotonic deadline
class DeadlineTimer {
public:
    explicit DeadlineTimer(Milliseconds timeout);

    bool IsExpired() const;

    /// Time left before the deadline (zero once expired)
    Milliseconds Remaining() const;

    /// Time since the timer was created
    Milliseconds Elapsed() const;

private:
    SteadyTimePoint start_;
    SteadyTimePoint deadline_;
};

} // namespace util
} // namespace dirgate

#endif // DIRGATE_UTIL_TIME_H
