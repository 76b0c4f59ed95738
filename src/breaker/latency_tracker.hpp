#pragma once

/**
 * FUSE Latency Tracker
 * Per-circuit tail latency estimate, O(1) per sample, no buffering
 *
 *   p50 <- p50 * 0.9 + x * 0.1
 *   p95 <- max(p95 * 0.95, x)
 *   p99 <- max(p99 * 0.99, x)
 *
 * This is a decaying-max / EWMA hybrid, not a true percentile: an outlier
 * lifts p95/p99 immediately and bleeds off slowly. It favours fast tail
 * detection over statistical precision. Swapping in a windowed percentile
 * changes every reported latency figure.
 */

#include <algorithm>
#include "../core/compiler.hpp"
#include "../core/constants.hpp"

namespace fuse {
namespace breaker {

class LatencyTracker {
public:
    explicit LatencyTracker(double max_allowed_ms = MAX_LATENCY_MS) noexcept
        : max_allowed_ms_(max_allowed_ms) {}

    /**
     * Record a completed request's latency
     */
    FUSE_HOT
    void record(double latency_ms) noexcept {
        current_ms_ = latency_ms;
        p50_ms_ = (p50_ms_ * P50_DECAY) + (latency_ms * P50_SAMPLE_WEIGHT);
        p95_ms_ = std::max(p95_ms_ * P95_DECAY, latency_ms);
        p99_ms_ = std::max(p99_ms_ * P99_DECAY, latency_ms);
    }

    /**
     * Note a one-off measurement (health probe) without feeding the estimators
     */
    void observe(double latency_ms) noexcept {
        current_ms_ = latency_ms;
    }

    bool exceeds_limit(double latency_ms) const noexcept {
        return latency_ms > max_allowed_ms_;
    }

    bool p95_over_limit() const noexcept {
        return p95_ms_ > max_allowed_ms_;
    }

    bool p95_critical() const noexcept {
        return p95_ms_ > max_allowed_ms_ * CRITICAL_LATENCY_FACTOR;
    }

    double current() const noexcept { return current_ms_; }
    double p50() const noexcept { return p50_ms_; }
    double p95() const noexcept { return p95_ms_; }
    double p99() const noexcept { return p99_ms_; }
    double max_allowed() const noexcept { return max_allowed_ms_; }

private:
    double max_allowed_ms_;
    double current_ms_{0.0};
    double p50_ms_{0.0};
    double p95_ms_{0.0};
    double p99_ms_{0.0};
};

} // namespace breaker
} // namespace fuse
