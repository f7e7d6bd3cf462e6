// VELOCK - Time Utilities Implementation
// Copyright (c) 2024 VELOCK Developers
// MIT License

#include "velock/util/time.h"

#include <atomic>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace velock {
namespace util {

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};
}

// ============================================================================
// Current Time
// ============================================================================

int64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// ============================================================================
// Mock Time
// ============================================================================

void DisableMockTime() {
    g_mockTimeEnabled.store(false);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

void SetMockTime(int64_t timestamp) {
    g_mockTime.store(timestamp);
    g_mockTimeEnabled.store(true);
}

void AdvanceMockTime(int64_t seconds) {
    g_mockTime.fetch_add(seconds);
}

ScopedMockTime::ScopedMockTime(int64_t timestamp)
    : wasEnabled_(g_mockTimeEnabled.load()), previous_(g_mockTime.load()) {
    SetMockTime(timestamp);
}

ScopedMockTime::~ScopedMockTime() {
    g_mockTime.store(previous_);
    g_mockTimeEnabled.store(wasEnabled_);
}

// ============================================================================
// Formatting
// ============================================================================

std::string FormatISO8601(int64_t timestamp) {
    std::time_t t = static_cast<std::time_t>(timestamp);
    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string FormatDuration(int64_t seconds) {
    if (seconds == 0) {
        return "0s";
    }

    // Magnitude in unsigned arithmetic so the most negative value has one
    uint64_t remaining = seconds < 0 ? uint64_t{0} - static_cast<uint64_t>(seconds)
                                     : static_cast<uint64_t>(seconds);

    const std::pair<uint64_t, const char*> units[] = {
        {SECONDS_PER_DAY, "d"}, {SECONDS_PER_HOUR, "h"},
        {SECONDS_PER_MINUTE, "m"}, {1, "s"}};

    std::string out;
    for (const auto& [size, suffix] : units) {
        uint64_t n = remaining / size;
        remaining %= size;
        if (n > 0) {
            if (!out.empty()) out += ' ';
            out += std::to_string(n) + suffix;
        }
    }
    return seconds < 0 ? "-" + out : out;
}

} // namespace util
} // namespace velock
