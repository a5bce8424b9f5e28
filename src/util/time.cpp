// DIRGATE - Time Utilities Implementation
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#include "dirgate/util/time.h"

#include <atomic>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace dirgate {
namespace util {

// ============================================================================
// Mock Time State
// ============================================================================

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};
}

// ============================================================================
// Unix Timestamps
// ============================================================================

int64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return std::chrono::duration_cast<Seconds>(
        SystemClock::now().time_since_epoch()).count();
}

int64_t GetTimeMillis() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load() * 1000;
    }
    return std::chrono::duration_cast<Milliseconds>(
        SystemClock::now().time_since_epoch()).count();
}

SystemTimePoint GetSystemTime() {
    if (g_mockTimeEnabled.load()) {
        return FromUnixTime(g_mockTime.load());
    }
    return SystemClock::now();
}

SystemTimePoint FromUnixTime(int64_t timestamp) {
    return SystemTimePoint{Seconds{timestamp}};
}

int64_t ToUnixTime(SystemTimePoint tp) {
    return std::chrono::duration_cast<Seconds>(tp.time_since_epoch()).count();
}

// ============================================================================
// Time Formatting
// ============================================================================

std::string FormatUTC(SystemTimePoint tp, const char* format) {
    auto time = SystemClock::to_time_t(tp);
    std::tm tmBuf;
    gmtime_r(&time, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, format);
    return oss.str();
}

std::string FormatISO8601(SystemTimePoint tp) {
    return FormatUTC(tp, "%Y-%m-%dT%H:%M:%SZ");
}

std::string FormatDuration(Seconds duration) {
    int64_t total = duration.count();
    bool negative = total < 0;
    if (negative) {
        total = -total;
    }

    int64_t hours = total / 3600;
    int64_t minutes = (total % 3600) / 60;
    int64_t seconds = total % 60;

    std::ostringstream oss;
    if (negative) oss << '-';
    if (hours > 0) oss << hours << "h ";
    if (hours > 0 || minutes > 0) oss << minutes << "m ";
    oss << seconds << 's';
    return oss.str();
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    if (g_mockTime.load() == 0) {
        g_mockTime.store(std::chrono::duration_cast<Seconds>(
            SystemClock::now().time_since_epoch()).count());
    }
    g_mockTimeEnabled.store(true);
}

void DisableMockTime() {
    g_mockTimeEnabled.store(false);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

void SetMockTime(int64_t timestamp) {
    g_mockTime.store(timestamp);
}

void AdvanceMockTime(Seconds duration) {
    g_mockTime.fetch_add(duration.count());
}

// ============================================================================
// DeadlineTimer
// ============================================================================

DeadlineTimer::DeadlineTimer(Milliseconds timeout)
    : start_(SteadyClock::now())
    , deadline_(start_ + timeout) {}

bool DeadlineTimer::IsExpired() const {
    return SteadyClock::now() >= deadline_;
}

Milliseconds DeadlineTimer::Remaining() const {
    auto now = SteadyClock::now();
    if (now >= deadline_) {
        return Milliseconds{0};
    }
    return std::chrono::duration_cast<Milliseconds>(deadline_ - now);
}

Milliseconds DeadlineTimer::Elapsed() const {
    return std::chrono::duration_cast<Milliseconds>(SteadyClock::now() - start_);
}

} // namespace util
} // namespace dirgate
