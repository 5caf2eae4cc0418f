// STAKELEDGER - Time Utilities Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/util/time.h"

#include <atomic>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace stakeledger {
namespace util {

// ============================================================================
// Mock Time State
// ============================================================================

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<uint64_t> g_mockTime{0};
}

// ============================================================================
// Unix Timestamps
// ============================================================================

uint64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return ToUnixTime(SystemClock::now());
}

SystemTimePoint FromUnixTime(uint64_t timestamp) {
    return SystemTimePoint{Seconds{static_cast<int64_t>(timestamp)}};
}

uint64_t ToUnixTime(SystemTimePoint tp) {
    auto secs = std::chrono::duration_cast<Seconds>(tp.time_since_epoch()).count();
    return secs < 0 ? 0 : static_cast<uint64_t>(secs);
}

// ============================================================================
// Time Formatting
// ============================================================================

std::string FormatISO8601(SystemTimePoint tp) {
    auto time = SystemClock::to_time_t(tp);
    std::tm tm_buf;
    gmtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string FormatDuration(uint64_t seconds) {
    if (seconds == 0) {
        return "0s";
    }

    uint64_t total = seconds;
    uint64_t days = total / SECONDS_PER_DAY;
    total %= SECONDS_PER_DAY;
    uint64_t hours = total / SECONDS_PER_HOUR;
    total %= SECONDS_PER_HOUR;
    uint64_t minutes = total / SECONDS_PER_MINUTE;
    uint64_t secs = total % SECONDS_PER_MINUTE;

    std::ostringstream oss;
    if (days > 0) oss << days << "d ";
    if (hours > 0) oss << hours << "h ";
    if (minutes > 0) oss << minutes << "m ";
    if (secs > 0) oss << secs << "s";

    std::string result = oss.str();
    while (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }
    return result;
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    g_mockTimeEnabled.store(true);
}

void DisableMockTime() {
    g_mockTimeEnabled.store(false);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

void SetMockTime(uint64_t timestamp) {
    g_mockTime.store(timestamp);
}

void AdvanceMockTime(uint64_t seconds) {
    g_mockTime.fetch_add(seconds);
}

uint64_t GetMockTime() {
    return g_mockTime.load();
}

} // namespace util
} // namespace stakeledger
