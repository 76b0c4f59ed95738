#pragma once

/**
 * FUSE Breaker Model
 * Master switch -> panels -> circuits, plus the audit and alert records
 *
 * Ownership: a Panel owns its Circuits by value. A Circuit names its panel
 * by id only; there is no pointer from child to parent.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../core/compiler.hpp"
#include "../core/constants.hpp"
#include "../core/timing.hpp"
#include "latency_tracker.hpp"

namespace fuse {
namespace breaker {

using timing::WallTime;

// ============================================================================
// Enumerations
// ============================================================================

enum class BreakerState : uint8_t {
    ON,
    OFF,
    TRIPPED
};

/// Target of a state command (a breaker can only be tripped, never commanded to trip)
enum class Command : uint8_t {
    ON,
    OFF
};

enum class Health : uint8_t {
    HEALTHY,
    DEGRADED,
    CRITICAL,
    OFFLINE
};

enum class SystemStatus : uint8_t {
    OPTIMAL,
    DEGRADED,
    CRITICAL,
    OFFLINE
};

enum class AlertLevel : uint8_t {
    INFO,
    WARNING,
    ALERT,
    CRITICAL
};

enum class CircuitCategory : uint8_t {
    AI_AGENT,
    REPOSITORY,
    INTEGRATION,
    VOICE,
    DEPLOYMENT,
    DATABASE,
    STORAGE,
    AUTH,
    ANALYTICS,
    CUSTOM
};

inline const char* to_string(BreakerState state) noexcept {
    switch (state) {
        case BreakerState::ON:      return "on";
        case BreakerState::OFF:     return "off";
        case BreakerState::TRIPPED: return "tripped";
    }
    FUSE_UNREACHABLE();
    return "";
}

inline const char* to_string(Command command) noexcept {
    switch (command) {
        case Command::ON:  return "on";
        case Command::OFF: return "off";
    }
    FUSE_UNREACHABLE();
    return "";
}

inline const char* to_string(Health health) noexcept {
    switch (health) {
        case Health::HEALTHY:  return "healthy";
        case Health::DEGRADED: return "degraded";
        case Health::CRITICAL: return "critical";
        case Health::OFFLINE:  return "offline";
    }
    FUSE_UNREACHABLE();
    return "";
}

inline const char* to_string(SystemStatus status) noexcept {
    switch (status) {
        case SystemStatus::OPTIMAL:  return "optimal";
        case SystemStatus::DEGRADED: return "degraded";
        case SystemStatus::CRITICAL: return "critical";
        case SystemStatus::OFFLINE:  return "offline";
    }
    FUSE_UNREACHABLE();
    return "";
}

inline const char* to_string(AlertLevel level) noexcept {
    switch (level) {
        case AlertLevel::INFO:     return "info";
        case AlertLevel::WARNING:  return "warning";
        case AlertLevel::ALERT:    return "alert";
        case AlertLevel::CRITICAL: return "critical";
    }
    FUSE_UNREACHABLE();
    return "";
}

inline const char* to_string(CircuitCategory category) noexcept {
    switch (category) {
        case CircuitCategory::AI_AGENT:    return "ai-agent";
        case CircuitCategory::REPOSITORY:  return "repository";
        case CircuitCategory::INTEGRATION: return "integration";
        case CircuitCategory::VOICE:       return "voice";
        case CircuitCategory::DEPLOYMENT:  return "deployment";
        case CircuitCategory::DATABASE:    return "database";
        case CircuitCategory::STORAGE:     return "storage";
        case CircuitCategory::AUTH:        return "auth";
        case CircuitCategory::ANALYTICS:   return "analytics";
        case CircuitCategory::CUSTOM:      return "custom";
    }
    FUSE_UNREACHABLE();
    return "";
}

inline BreakerState to_state(Command command) noexcept {
    return command == Command::ON ? BreakerState::ON : BreakerState::OFF;
}

// ============================================================================
// Descriptors (registration input)
// ============================================================================

struct CircuitDescriptor {
    std::string id;
    std::string name;
    std::string description;
    CircuitCategory category = CircuitCategory::CUSTOM;
    std::string endpoint;       // Empty: nothing to probe
};

struct PanelDescriptor {
    std::string id;
    std::string name;
    std::string description;
    std::string icon;
    uint32_t position = 0;      // Display order, 0 = after the last panel
    size_t max_circuits = 0;    // 0 = registry default
};

// ============================================================================
// Circuit
// ============================================================================

struct CircuitBreaker {
    BreakerState state = BreakerState::OFF;
    uint32_t error_count = 0;          // Since last reset
    uint32_t trip_count = 0;           // Never decreases
    uint32_t trip_threshold = TRIP_THRESHOLD;
    std::chrono::milliseconds cooldown = COOLDOWN_DURATION;
    std::optional<WallTime> last_tripped;
    std::optional<WallTime> last_reset;
    std::optional<WallTime> next_reset_at;  // Set only while an auto-reset is armed
};

struct CircuitMetrics {
    uint64_t request_count = 0;
    uint64_t error_count = 0;          // Lifetime errors, for the error rate
    double error_rate = 0.0;           // Percent
    WallTime last_activity{};
    LatencyTracker latency;
};

struct Circuit {
    CircuitDescriptor descriptor;
    std::string panel_id;
    CircuitBreaker breaker;
    Health health = Health::OFFLINE;
    CircuitMetrics metrics;
    WallTime last_check{};
    WallTime created_at{};

    const std::string& id() const noexcept { return descriptor.id; }
    bool is_on() const noexcept { return breaker.state == BreakerState::ON; }
    bool is_tripped() const noexcept { return breaker.state == BreakerState::TRIPPED; }
};

// ============================================================================
// Panel
// ============================================================================

struct PanelBreaker {
    BreakerState state = BreakerState::OFF;
    bool locked_out = false;
    uint32_t trip_count = 0;
    std::optional<WallTime> last_tripped;
};

struct Panel {
    PanelDescriptor descriptor;
    PanelBreaker breaker;
    std::vector<Circuit> circuits;     // Registration order
    Health health = Health::OFFLINE;
    size_t active_circuits = 0;

    const std::string& id() const noexcept { return descriptor.id; }
    size_t total_circuits() const noexcept { return circuits.size(); }
    bool is_on() const noexcept { return breaker.state == BreakerState::ON; }
};

// ============================================================================
// Master Switch
// ============================================================================

struct MasterSwitch {
    BreakerState state = BreakerState::OFF;   // ON or OFF only
    bool emergency_shutdown = false;
    WallTime last_state_change{};
    WallTime start_time{};
    std::chrono::milliseconds uptime{0};      // Accumulated over closed sessions
    uint32_t power_cycles = 0;
    std::string last_changed_by = SYSTEM_ACTOR;
    SystemStatus system_status = SystemStatus::OFFLINE;

    bool is_on() const noexcept { return state == BreakerState::ON; }
};

// ============================================================================
// Audit & Alerts
// ============================================================================

struct AuditLogEntry {
    uint64_t id = 0;
    WallTime timestamp{};
    std::string actor;
    std::string action;
    std::string target;
    std::string previous_value;
    std::string new_value;
};

struct SystemAlert {
    uint64_t id = 0;
    AlertLevel level = AlertLevel::INFO;
    WallTime timestamp{};
    std::string source;
    std::string message;
    bool acknowledged = false;
    std::string acknowledged_by;
    std::optional<WallTime> acknowledged_at;
};

} // namespace breaker
} // namespace fuse
