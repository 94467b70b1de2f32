// LOCKVAULT - Time Utilities Implementation
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License

#include "lockvault/util/time.h"

#include <atomic>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <limits>
#include <mutex>
#include <sstream>

namespace lockvault {
namespace util {

// ============================================================================
// Mock Time State
// ============================================================================

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};
    std::mutex g_mockTimeMutex;

    int64_t WallClockSeconds() {
        return std::chrono::duration_cast<Seconds>(
            SystemClock::now().time_since_epoch()).count();
    }
}

// ============================================================================
// Unix Timestamps
// ============================================================================

int64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return WallClockSeconds();
}

// ============================================================================
// Formatting
// ============================================================================

std::string FormatTimestamp(int64_t timestamp) {
    std::time_t secs = static_cast<std::time_t>(timestamp);
    std::tm tm_buf;
    gmtime_r(&secs, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string FormatDuration(Seconds duration) {
    int64_t total = duration.count();

    if (total < 0) {
        return "-" + FormatDuration(Seconds{-total});
    }

    if (total == 0) {
        return "0s";
    }

    int64_t days = total / SECONDS_PER_DAY;
    total %= SECONDS_PER_DAY;
    int64_t hours = total / SECONDS_PER_HOUR;
    total %= SECONDS_PER_HOUR;
    int64_t minutes = total / SECONDS_PER_MINUTE;
    int64_t seconds = total % SECONDS_PER_MINUTE;

    std::ostringstream oss;
    if (days > 0) oss << days << "d ";
    if (hours > 0) oss << hours << "h ";
    if (minutes > 0) oss << minutes << "m ";
    if (seconds > 0) oss << seconds << "s";

    std::string result = oss.str();
    while (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }
    return result;
}

// ============================================================================
// Parsing
// ============================================================================

std::optional<int64_t> ParseDuration(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    int64_t total = 0;
    size_t i = 0;

    while (i < str.size()) {
        if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
            return std::nullopt;
        }

        int64_t value = 0;
        while (i < str.size() && std::isdigit(static_cast<unsigned char>(str[i]))) {
            int digit = str[i] - '0';
            if (value > (kMax - digit) / 10) {
                return std::nullopt;
            }
            value = value * 10 + digit;
            ++i;
        }

        int64_t unit = 1;
        if (i < str.size()) {
            switch (std::tolower(static_cast<unsigned char>(str[i]))) {
                case 's': unit = 1; break;
                case 'm': unit = SECONDS_PER_MINUTE; break;
                case 'h': unit = SECONDS_PER_HOUR; break;
                case 'd': unit = SECONDS_PER_DAY; break;
                case 'w': unit = SECONDS_PER_WEEK; break;
                default: return std::nullopt;
            }
            ++i;
        } else if (total != 0) {
            // "1d30" is ambiguous
            return std::nullopt;
        }

        if (value > kMax / unit || total > kMax - value * unit) {
            return std::nullopt;
        }
        total += value * unit;
    }

    return total;
}

std::optional<int64_t> ParseISO8601(const std::string& str) {
    std::tm tm_buf = {};

    std::istringstream iss(str);
    iss >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");

    if (iss.fail()) {
        iss.clear();
        iss.str(str);
        tm_buf = {};
        iss >> std::get_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    }

    if (iss.fail()) {
        return std::nullopt;
    }

    auto time = timegm(&tm_buf);
    if (time == -1) {
        return std::nullopt;
    }

    return static_cast<int64_t>(time);
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    if (g_mockTime.load() == 0) {
        g_mockTime.store(WallClockSeconds());
    }
    g_mockTimeEnabled.store(true);
}

void DisableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
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

int64_t GetMockTime() {
    return g_mockTime.load();
}

} // namespace util
} // namespace lockvault
