#pragma once

/**
 * FUSE Trip Detector
 * Error/latency accounting and health classification for one circuit
 *
 * Stateless: everything it needs lives on the Circuit. The detector only
 * decides; tripping and alerting belong to the cascade controller.
 */

#include <optional>
#include "../core/compiler.hpp"
#include "../core/constants.hpp"
#include "types.hpp"

namespace fuse {
namespace breaker {

struct ErrorVerdict {
    bool latency_breach;   // Reported latency above the circuit's ceiling
    bool should_trip;      // Error count reached the threshold on a live breaker
};

class TripDetector {
public:
    /**
     * Account one error against a circuit
     *
     * A circuit that is already tripped keeps counting but is not tripped
     * again: its cooldown is already running.
     */
    static ErrorVerdict record_error(Circuit& circuit,
                                     std::optional<double> latency_ms,
                                     WallTime now) noexcept {
        circuit.breaker.error_count++;
        circuit.metrics.error_count++;
        circuit.metrics.last_activity = now;
        refresh_error_rate(circuit.metrics);

        ErrorVerdict verdict{false, false};
        if (latency_ms) {
            circuit.metrics.latency.observe(*latency_ms);
            verdict.latency_breach = circuit.metrics.latency.exceeds_limit(*latency_ms);
        }

        verdict.should_trip = !circuit.is_tripped() &&
                              circuit.breaker.error_count >= circuit.breaker.trip_threshold;

        circuit.health = classify(circuit);
        return verdict;
    }

    /**
     * Account one completed request
     * @return true if the p95 estimate is above the latency ceiling
     */
    FUSE_HOT
    static bool record_request(Circuit& circuit, double latency_ms, WallTime now) noexcept {
        circuit.metrics.request_count++;
        circuit.metrics.last_activity = now;
        circuit.metrics.latency.record(latency_ms);
        refresh_error_rate(circuit.metrics);

        circuit.health = classify(circuit);
        return circuit.metrics.latency.p95_over_limit();
    }

    /**
     * Health from breaker state and live metrics
     */
    static Health classify(const Circuit& circuit) noexcept {
        const CircuitMetrics& m = circuit.metrics;

        switch (circuit.breaker.state) {
            case BreakerState::TRIPPED: return Health::CRITICAL;
            case BreakerState::OFF:     return Health::OFFLINE;
            case BreakerState::ON:      break;
        }

        if (m.error_rate > CRITICAL_ERROR_RATE_PCT || m.latency.p95_critical()) {
            return Health::CRITICAL;
        }
        if (m.error_rate > DEGRADED_ERROR_RATE_PCT || m.latency.p95_over_limit()) {
            return Health::DEGRADED;
        }
        return Health::HEALTHY;
    }

    static void refresh_error_rate(CircuitMetrics& metrics) noexcept {
        if (metrics.request_count > 0) {
            metrics.error_rate = (static_cast<double>(metrics.error_count) /
                                  static_cast<double>(metrics.request_count)) * 100.0;
        }
    }
};

/**
 * Order health by severity: offline < healthy < degraded < critical
 * Offline sorts lowest so a probe verdict never masks an energized circuit.
 */
inline Health worse_of(Health a, Health b) noexcept {
    auto rank = [](Health h) noexcept -> int {
        switch (h) {
            case Health::OFFLINE:  return 0;
            case Health::HEALTHY:  return 1;
            case Health::DEGRADED: return 2;
            case Health::CRITICAL: return 3;
        }
        FUSE_UNREACHABLE();
        return 0;
    };
    return rank(a) >= rank(b) ? a : b;
}

} // namespace breaker
} // namespace fuse
