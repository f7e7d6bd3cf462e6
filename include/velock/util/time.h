// VELOCK - Time Utilities
// Copyright (c) 2024 VELOCK Developers
// MIT License
//
// Unix time access with a process-wide mock clock. Everything that needs
// "now" (the epoch clock in particular) goes through GetTime() so tests and
// the simulator can drive time deterministically.

#ifndef VELOCK_UTIL_TIME_H
#define VELOCK_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace velock {
namespace util {

// ============================================================================
// Constants
// ============================================================================

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 60 * SECONDS_PER_MINUTE;
constexpr int64_t SECONDS_PER_DAY = 24 * SECONDS_PER_HOUR;
constexpr int64_t SECONDS_PER_WEEK = 7 * SECONDS_PER_DAY;

// ============================================================================
// Current Time
// ============================================================================

/// Unix time in seconds (mock time when enabled)
int64_t GetTime();

// ============================================================================
// Mock Time
// ============================================================================

void DisableMockTime();
bool IsMockTimeEnabled();

/// Set the mock clock; also enables mock time
void SetMockTime(int64_t timestamp);

/// Move the mock clock forward (or backward for negative values)
void AdvanceMockTime(int64_t seconds);

/// Enables mock time at a fixed value and restores the previous mock
/// state on destruction
class ScopedMockTime {
public:
    explicit ScopedMockTime(int64_t timestamp);
    ~ScopedMockTime();

    ScopedMockTime(const ScopedMockTime&) = delete;
    ScopedMockTime& operator=(const ScopedMockTime&) = delete;

private:
    bool wasEnabled_;
    int64_t previous_;
};

// ============================================================================
// Formatting
// ============================================================================

/// "2024-01-15T12:00:00Z"
std::string FormatISO8601(int64_t timestamp);

/// "3d 4h 5m 6s"; "0s" for zero, leading '-' for negative durations
std::string FormatDuration(int64_t seconds);

} // namespace util
} // namespace velock

#endif // VELOCK_UTIL_TIME_H
