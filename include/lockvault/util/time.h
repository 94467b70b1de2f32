// LOCKVAULT - Time Utilities
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License
//
// Wall-clock access for the vault's time gates, with a process-wide mock
// clock so tests and scripted CLI runs can move time deterministically.

#ifndef LOCKVAULT_UTIL_TIME_H
#define LOCKVAULT_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace lockvault {
namespace util {

// ============================================================================
// Type Aliases
// ============================================================================

using Seconds = std::chrono::seconds;
using SystemClock = std::chrono::system_clock;

// ============================================================================
// Constants
// ============================================================================

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;
constexpr int64_t SECONDS_PER_WEEK = 604800;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Current Unix timestamp in seconds (mock time when enabled)
int64_t GetTime();

// ============================================================================
// Formatting and Parsing
// ============================================================================

/// Format a Unix timestamp as ISO 8601 UTC ("2024-01-15T10:30:00Z")
std::string FormatTimestamp(int64_t timestamp);

/// Format duration as human-readable string ("30d 4h 5s")
std::string FormatDuration(Seconds duration);

/// Parse "30d", "12h", "45m", "90s", "2w" or a bare number of seconds.
/// Suffixes may be chained ("1d12h"). Returns nullopt on malformed or
/// negative input and on overflow.
std::optional<int64_t> ParseDuration(const std::string& str);

/// Parse ISO 8601 ("2024-01-15T10:30:00Z" or "2024-01-15 10:30:00")
std::optional<int64_t> ParseISO8601(const std::string& str);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Freeze the clock at the current wall time unless a mock time is already set
void EnableMockTime();

void DisableMockTime();

bool IsMockTimeEnabled();

/// Set mock time (takes effect while mock time is enabled)
void SetMockTime(int64_t timestamp);

/// Advance mock time by duration
void AdvanceMockTime(Seconds duration);

/// Get mock time (0 if never set)
int64_t GetMockTime();

} // namespace util
} // namespace lockvault

#endif // LOCKVAULT_UTIL_TIME_H
