#pragma once

/**
 * FUSE Timing
 * Wall-clock stamps for the audit trail and monotonic time for timers
 */

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>
#include "compiler.hpp"
#include "constants.hpp"

namespace fuse {
namespace timing {

using WallClock = std::chrono::system_clock;
using WallTime = WallClock::time_point;
using SteadyClock = std::chrono::steady_clock;

// ============================================================================
// POSIX Clock Functions
// ============================================================================

/**
 * Get monotonic time in nanoseconds
 */
FUSE_ALWAYS_INLINE uint64_t get_monotonic_ns() noexcept {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * NANOS_PER_SEC + ts.tv_nsec;
}

inline WallTime now() noexcept {
    return WallClock::now();
}

// ============================================================================
// Formatting
// ============================================================================

/**
 * UTC timestamp, ISO 8601 with milliseconds
 * UTC only: no DST ambiguity across the audit trail.
 */
inline std::string format_utc(WallTime t) {
    const std::time_t secs = WallClock::to_time_t(t);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()).count() % 1000;

    struct tm tm_info;
    gmtime_r(&secs, &tm_info);

    char buffer[40];
    size_t len = strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm_info);
    snprintf(buffer + len, sizeof(buffer) - len, ".%03dZ", static_cast<int>(ms));
    return buffer;
}

inline int64_t to_millis(std::chrono::nanoseconds d) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

} // namespace timing
} // namespace fuse
