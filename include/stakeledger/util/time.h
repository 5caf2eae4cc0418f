// STAKELEDGER - Time Utilities
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// Provides time-related utilities:
// - Unix timestamps for ledger calls
// - Time and duration formatting
// - Mock time for testing and replaying calls at a fixed time

#ifndef STAKELEDGER_UTIL_TIME_H
#define STAKELEDGER_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace stakeledger {
namespace util {

// ============================================================================
// Type Aliases
// ============================================================================

using Seconds = std::chrono::seconds;
using SystemClock = std::chrono::system_clock;
using SystemTimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Get current Unix timestamp in seconds (mock time if enabled)
uint64_t GetTime();

/// Convert Unix timestamp to system time point
SystemTimePoint FromUnixTime(uint64_t timestamp);

/// Convert system time point to Unix timestamp
uint64_t ToUnixTime(SystemTimePoint tp);

// ============================================================================
// Time Formatting
// ============================================================================

/// Format time point as ISO 8601 string (e.g., "2024-01-15T10:30:00Z")
std::string FormatISO8601(SystemTimePoint tp);

/// Format a span of seconds as human-readable string (e.g., "1d 2h 3m 4s")
std::string FormatDuration(uint64_t seconds);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

void EnableMockTime();
void DisableMockTime();
bool IsMockTimeEnabled();

/// Set mock time (only takes effect while mock time is enabled)
void SetMockTime(uint64_t timestamp);

/// Advance mock time by a number of seconds
void AdvanceMockTime(uint64_t seconds);

/// Get mock time (returns 0 if never set)
uint64_t GetMockTime();

// ============================================================================
// Constants
// ============================================================================

constexpr uint64_t SECONDS_PER_MINUTE = 60;
constexpr uint64_t SECONDS_PER_HOUR = 3600;
constexpr uint64_t SECONDS_PER_DAY = 86400;
constexpr uint64_t SECONDS_PER_WEEK = 604800;

} // namespace util
} // namespace stakeledger

#endif // STAKELEDGER_UTIL_TIME_H
