#pragma once

#include <chrono>
#include <cstdint>
#include <cstddef>

namespace fuse {

// ============================================================================
// TRIP CONSTANTS
// ============================================================================

/// Errors accumulated by a circuit before it trips
constexpr uint32_t TRIP_THRESHOLD = 5;

/// Wait before a tripped circuit is automatically reset
constexpr std::chrono::milliseconds COOLDOWN_DURATION{30'000};

/// Latency ceiling per circuit (milliseconds)
constexpr double MAX_LATENCY_MS = 50.0;

// ============================================================================
// HEALTH CLASSIFICATION
// ============================================================================

/// Error rate (percent) above which a circuit is critical
constexpr double CRITICAL_ERROR_RATE_PCT = 10.0;

/// Error rate (percent) above which a circuit is degraded
constexpr double DEGRADED_ERROR_RATE_PCT = 5.0;

/// p95 multiple of MAX_LATENCY_MS above which a circuit is critical
constexpr double CRITICAL_LATENCY_FACTOR = 2.0;

// ============================================================================
// LATENCY ESTIMATOR WEIGHTS
// ============================================================================

/// p50 is an EWMA: p50 * P50_DECAY + sample * P50_SAMPLE_WEIGHT
constexpr double P50_DECAY = 0.9;
constexpr double P50_SAMPLE_WEIGHT = 0.1;

/// p95/p99 are decaying maxima: max(p * DECAY, sample)
constexpr double P95_DECAY = 0.95;
constexpr double P99_DECAY = 0.99;

// ============================================================================
// CAPACITY LIMITS
// ============================================================================

/// Audit entries retained in memory
constexpr size_t AUDIT_CAPACITY = 10'000;

/// Alerts retained in memory
constexpr size_t ALERT_CAPACITY = 1'000;

/// Circuits per panel unless the descriptor overrides it
constexpr size_t DEFAULT_MAX_CIRCUITS = 50;

/// Upper bound on a single health probe
constexpr std::chrono::milliseconds PROBE_TIMEOUT{2'000};

/// Probe threads allowed to outlive their timeout before new probes fail fast
constexpr size_t MAX_PROBES_IN_FLIGHT = 16;

// ============================================================================
// TIME CONSTANTS
// ============================================================================

/// Nanoseconds per second
constexpr uint64_t NANOS_PER_SEC = 1'000'000'000ULL;

/// Nanoseconds per millisecond
constexpr uint64_t NANOS_PER_MS = 1'000'000ULL;

// ============================================================================
// IDENTITY
// ============================================================================

/// Actor recorded for transitions the control plane makes on its own
constexpr const char* SYSTEM_ACTOR = "system";

} // namespace fuse
