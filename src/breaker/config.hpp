#pragma once

/**
 * FUSE Registry Configuration
 * Defaults are the production values; tests override cooldown and capacities.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include "../core/constants.hpp"

namespace fuse {
namespace breaker {

struct RegistryConfig {
    uint32_t trip_threshold = TRIP_THRESHOLD;
    std::chrono::milliseconds cooldown = COOLDOWN_DURATION;
    double max_latency_ms = MAX_LATENCY_MS;
    size_t default_max_circuits = DEFAULT_MAX_CIRCUITS;
    size_t audit_capacity = AUDIT_CAPACITY;
    size_t alert_capacity = ALERT_CAPACITY;
    std::chrono::milliseconds probe_timeout = PROBE_TIMEOUT;
    size_t max_probes_in_flight = MAX_PROBES_IN_FLIGHT;

    bool is_valid() const noexcept {
        return trip_threshold > 0 &&
               cooldown.count() >= 0 &&
               max_latency_ms > 0.0 &&
               default_max_circuits > 0 &&
               audit_capacity > 0 &&
               alert_capacity > 0 &&
               probe_timeout.count() > 0 &&
               max_probes_in_flight > 0;
    }
};

} // namespace breaker
} // namespace fuse
