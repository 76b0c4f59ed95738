#include "cascade_controller.hpp"

#include <chrono>
#include <cstdio>
#include <utility>

#include "../core/log.hpp"
#include "trip_detector.hpp"

namespace fuse {
namespace breaker {

namespace {

constexpr const char* COMPONENT = "BRK";
constexpr const char* MASTER_TARGET = "master";
constexpr const char* SYSTEM_SOURCE = "system";

std::string format_ms(double ms) {
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%.1fms", ms);
    return buffer;
}

const char* on_off(Command command) noexcept {
    return command == Command::ON ? "ON" : "OFF";
}

} // namespace

CascadeController::CascadeController(BreakerTree& tree,
                                     AuditTrail& audit,
                                     AlertSink& alerts,
                                     AutoResetScheduler& scheduler,
                                     const RegistryConfig& config,
                                     AutoResetScheduler::FireFn on_cooldown_elapsed)
    : tree_(tree),
      audit_(audit),
      alerts_(alerts),
      scheduler_(scheduler),
      config_(config),
      on_cooldown_elapsed_(std::move(on_cooldown_elapsed)),
      runner_(config.probe_timeout, config.max_probes_in_flight) {}

// ============================================================================
// Master Switch
// ============================================================================

bool CascadeController::master_on(Lock& lock, const std::string& actor) {
    MasterSwitch& master = tree_.master();
    if (master.is_on()) {
        log::info(COMPONENT) << "Master switch already ON";
        return false;
    }

    const WallTime now = timing::now();
    master.state = BreakerState::ON;
    master.last_state_change = now;
    master.start_time = now;
    master.power_cycles++;
    master.last_changed_by = actor;
    master.emergency_shutdown = false;

    log::info(COMPONENT) << "Master switch ON by " << actor
                         << ", powering " << tree_.panels().size() << " panels";

    const uint64_t generation = tree_.generation();
    const uint32_t power_cycle = master.power_cycles;
    for (const std::string& panel_id : tree_.panel_ids()) {
        set_panel_state(lock, panel_id, Command::ON, actor);
        if (tree_.generation() != generation) {
            log::warn(COMPONENT) << "Registry reset during master ON cascade";
            return false;
        }
        // Emergency shutdown, master OFF or another master ON ran during a probe
        const MasterSwitch& current = tree_.master();
        if (!current.is_on() || current.power_cycles != power_cycle) {
            reject(MASTER_TARGET, "Master switch changed during power-up cascade, now " +
                                      std::string(to_string(current.state)));
            return false;
        }
    }

    refresh_system_status();
    audit(actor, "MASTER_ON", MASTER_TARGET, "off", "on");
    return true;
}

bool CascadeController::master_off(Lock& lock, const std::string& actor) {
    MasterSwitch& master = tree_.master();
    if (!master.is_on()) {
        log::info(COMPONENT) << "Master switch already OFF";
        return false;
    }

    const WallTime now = timing::now();
    master.uptime += std::chrono::duration_cast<std::chrono::milliseconds>(now - master.start_time);

    for (const std::string& panel_id : tree_.panel_ids()) {
        set_panel_state(lock, panel_id, Command::OFF, actor);
    }

    master.state = BreakerState::OFF;
    master.last_state_change = now;
    master.last_changed_by = actor;
    refresh_system_status();

    log::info(COMPONENT) << "Master switch OFF by " << actor;
    audit(actor, "MASTER_OFF", MASTER_TARGET, "on", "off");
    return true;
}

void CascadeController::emergency_shutdown(const std::string& actor, const std::string& reason) {
    const WallTime now = timing::now();
    MasterSwitch& master = tree_.master();
    const BreakerState previous = master.state;

    for (Panel& panel : tree_.panels()) {
        force_trip(panel, now);
    }

    if (master.is_on()) {
        master.uptime += std::chrono::duration_cast<std::chrono::milliseconds>(now - master.start_time);
    }
    master.state = BreakerState::OFF;
    master.emergency_shutdown = true;
    master.last_state_change = now;
    master.last_changed_by = actor;
    master.system_status = SystemStatus::CRITICAL;

    const std::string why = reason.empty() ? "Manual trigger" : reason;
    alerts_.emit(AlertLevel::CRITICAL, SYSTEM_SOURCE, "EMERGENCY SHUTDOWN: " + why, now);
    audit(actor, "EMERGENCY_SHUTDOWN", SYSTEM_SOURCE, to_string(previous), "tripped: " + why);

    log::error(COMPONENT) << "All circuits tripped, manual reset required";
}

// ============================================================================
// Panels
// ============================================================================

bool CascadeController::set_panel_state(Lock& lock,
                                        const std::string& panel_id,
                                        Command command,
                                        const std::string& actor) {
    Panel* panel = tree_.find_panel(panel_id);
    if (panel == nullptr) {
        log::warn(COMPONENT) << "Panel not found: " << panel_id;
        return false;
    }
    if (panel->breaker.locked_out) {
        reject(panel_id, "Panel is locked out, lockout reset required");
        return false;
    }
    if (command == Command::ON && !tree_.master().is_on()) {
        reject(panel_id, "Cannot power on panel, master switch is OFF");
        return false;
    }

    const BreakerState commanded = to_state(command);
    const BreakerState previous = panel->breaker.state;
    panel->breaker.state = commanded;
    log::info(COMPONENT) << "Panel " << panel->descriptor.name << ": " << on_off(command);

    const uint64_t generation = tree_.generation();
    for (const std::string& circuit_id : tree_.circuit_ids(panel_id)) {
        set_circuit_state(lock, circuit_id, command, actor);
        if (tree_.generation() != generation) return false;

        // Probes may have released the lock; the vector may have moved
        panel = tree_.find_panel(panel_id);
        if (panel == nullptr) return false;
        if (panel->breaker.locked_out || panel->breaker.state != commanded) {
            reject(panel_id, "Panel changed during " + std::string(on_off(command)) +
                                 " cascade, now " + to_string(panel->breaker.state));
            return false;
        }
    }

    panel = tree_.find_panel(panel_id);
    if (panel == nullptr) return false;

    refresh_panel_health(*panel);
    refresh_system_status();
    audit(actor, command == Command::ON ? "PANEL_ON" : "PANEL_OFF",
          panel_id, to_string(previous), to_string(command));
    return true;
}

bool CascadeController::lockout_panel(const std::string& panel_id,
                                      const std::string& actor,
                                      const std::string& reason) {
    Panel* panel = tree_.find_panel(panel_id);
    if (panel == nullptr) {
        log::warn(COMPONENT) << "Panel not found: " << panel_id;
        return false;
    }

    const WallTime now = timing::now();
    const bool was_locked = panel->breaker.locked_out;

    force_trip(*panel, now);
    panel->breaker.locked_out = true;
    refresh_panel_health(*panel);
    refresh_system_status();

    alerts_.emit(AlertLevel::ALERT, panel_id,
                 "Panel LOCKED OUT: " + (reason.empty() ? std::string("No reason provided") : reason),
                 now);
    audit(actor, "PANEL_LOCKOUT", panel_id, was_locked ? "locked" : "unlocked", "locked");
    return true;
}

bool CascadeController::reset_panel_lockout(const std::string& panel_id, const std::string& actor) {
    Panel* panel = tree_.find_panel(panel_id);
    if (panel == nullptr) {
        log::warn(COMPONENT) << "Panel not found: " << panel_id;
        return false;
    }

    const bool was_locked = panel->breaker.locked_out;
    panel->breaker.locked_out = false;
    panel->breaker.state = BreakerState::OFF;

    for (const std::string& circuit_id : tree_.circuit_ids(panel_id)) {
        reset_circuit(circuit_id, actor);
    }

    refresh_panel_health(*panel);
    refresh_system_status();

    log::info(COMPONENT) << "Panel " << panel_id << " lockout reset by " << actor;
    audit(actor, "PANEL_LOCKOUT_RESET", panel_id, was_locked ? "locked" : "unlocked", "unlocked");
    return true;
}

// ============================================================================
// Circuits
// ============================================================================

bool CascadeController::set_circuit_state(Lock& lock,
                                          const std::string& circuit_id,
                                          Command command,
                                          const std::string& actor) {
    Circuit* circuit = tree_.find_circuit(circuit_id);
    if (circuit == nullptr) {
        log::warn(COMPONENT) << "Circuit not found: " << circuit_id;
        return false;
    }

    if (command == Command::OFF) {
        if (circuit->is_tripped()) {
            log::info(COMPONENT) << "Circuit " << circuit_id << " stays TRIPPED until reset";
            return true;
        }
        const BreakerState previous = circuit->breaker.state;
        circuit->breaker.state = BreakerState::OFF;
        circuit->metrics.last_activity = timing::now();
        circuit->health = TripDetector::classify(*circuit);
        refresh_upward(circuit_id);
        audit(actor, "CIRCUIT_OFF", circuit_id, to_string(previous), "off");
        return true;
    }

    std::string why;
    if (!can_energize(*circuit, why)) {
        reject(circuit_id, why);
        return false;
    }
    if (circuit->is_on()) {
        return true;
    }

    std::optional<ProbeOutcome> outcome;
    if (probe_ && !circuit->descriptor.endpoint.empty()) {
        const CircuitDescriptor descriptor = circuit->descriptor;
        const std::shared_ptr<HealthProbe> probe = probe_;
        const uint64_t generation = tree_.generation();

        lock.unlock();
        outcome = runner_.run(probe, descriptor);
        lock.lock();

        if (tree_.generation() != generation) return false;
        circuit = tree_.find_circuit(circuit_id);
        if (circuit == nullptr) return false;
        if (!can_energize(*circuit, why)) {
            reject(circuit_id, "State changed during health probe: " + why);
            return false;
        }
        if (circuit->is_on()) {
            return true;
        }
    }

    const WallTime now = timing::now();
    const BreakerState previous = circuit->breaker.state;
    circuit->breaker.state = BreakerState::ON;
    circuit->metrics.last_activity = now;
    circuit->last_check = now;
    circuit->health = TripDetector::classify(*circuit);
    audit(actor, "CIRCUIT_ON", circuit_id, to_string(previous), "on");

    if (outcome) {
        if (outcome->ok) {
            LatencyTracker& latency = circuit->metrics.latency;
            latency.observe(outcome->latency_ms);
            circuit->health = worse_of(circuit->health,
                latency.exceeds_limit(outcome->latency_ms) ? Health::DEGRADED : Health::HEALTHY);
        } else {
            apply_error(*circuit, "Health probe failed: " + outcome->error, std::nullopt);
            if (circuit->is_on()) {
                circuit->health = Health::CRITICAL;
            }
        }
    }

    refresh_upward(circuit_id);
    return true;
}

bool CascadeController::trip_circuit(const std::string& circuit_id, const std::string& reason) {
    Circuit* circuit = tree_.find_circuit(circuit_id);
    if (circuit == nullptr) {
        log::warn(COMPONENT) << "Circuit not found: " << circuit_id;
        return false;
    }
    trip(*circuit, reason.empty() ? "Unknown" : reason);
    return true;
}

bool CascadeController::reset_circuit(const std::string& circuit_id, const std::string& actor) {
    Circuit* circuit = tree_.find_circuit(circuit_id);
    if (circuit == nullptr) {
        log::warn(COMPONENT) << "Circuit not found: " << circuit_id;
        return false;
    }

    scheduler_.disarm(circuit_id);
    const BreakerState previous = circuit->breaker.state;
    reset_breaker(*circuit, timing::now());
    refresh_upward(circuit_id);

    log::info(COMPONENT) << "Circuit " << circuit_id << " manually reset by " << actor;
    audit(actor, "CIRCUIT_MANUAL_RESET", circuit_id, to_string(previous), "off");
    return true;
}

void CascadeController::auto_reset(Lock& lock, const std::string& circuit_id, TimerId timer_id) {
    if (!scheduler_.consume(circuit_id, timer_id)) {
        log::debug(COMPONENT) << "Stale auto-reset timer " << timer_id << " for " << circuit_id;
        return;
    }

    Circuit* circuit = tree_.find_circuit(circuit_id);
    if (circuit == nullptr || !circuit->is_tripped()) {
        return;
    }

    const WallTime now = timing::now();
    reset_breaker(*circuit, now);
    refresh_upward(circuit_id);

    alerts_.emit(AlertLevel::INFO, circuit_id, "Circuit AUTO-RESET complete", now);
    audit(SYSTEM_ACTOR, "CIRCUIT_AUTO_RESET", circuit_id, "tripped", "off");

    const Panel* panel = tree_.panel_for(circuit_id);
    if (panel != nullptr && panel->is_on() && !panel->breaker.locked_out && tree_.master().is_on()) {
        log::info(COMPONENT) << "Re-energizing " << circuit_id;
        set_circuit_state(lock, circuit_id, Command::ON, SYSTEM_ACTOR);
    }
}

bool CascadeController::report_error(const std::string& circuit_id,
                                     const std::string& message,
                                     std::optional<double> latency_ms) {
    Circuit* circuit = tree_.find_circuit(circuit_id);
    if (circuit == nullptr) {
        log::warn(COMPONENT) << "Circuit not found: " << circuit_id;
        return false;
    }
    apply_error(*circuit, message, latency_ms);
    return true;
}

bool CascadeController::record_request(const std::string& circuit_id, double latency_ms) {
    Circuit* circuit = tree_.find_circuit(circuit_id);
    if (circuit == nullptr) {
        log::warn(COMPONENT) << "Circuit not found: " << circuit_id;
        return false;
    }

    // Alert on the crossing only, not on every slow request after it
    const bool was_over = circuit->metrics.latency.p95_over_limit();
    const bool over = TripDetector::record_request(*circuit, latency_ms, timing::now());
    if (over && !was_over) {
        alerts_.emit(AlertLevel::WARNING, circuit_id,
                     "P95 latency exceeds threshold: " + format_ms(circuit->metrics.latency.p95()),
                     circuit->metrics.last_activity);
    }

    refresh_upward(circuit_id);
    return true;
}

// ============================================================================
// Health Aggregation
// ============================================================================

void CascadeController::refresh_panel_health(Panel& panel) const noexcept {
    size_t on = 0;
    size_t healthy_on = 0;
    bool any_critical = false;

    for (const Circuit& c : panel.circuits) {
        if (c.is_on()) {
            on++;
            if (c.health == Health::HEALTHY) healthy_on++;
        }
        if (c.health == Health::CRITICAL) any_critical = true;
    }
    panel.active_circuits = on;

    if (!panel.is_on() || panel.breaker.locked_out) {
        panel.health = Health::OFFLINE;
    } else if (any_critical) {
        panel.health = Health::CRITICAL;
    } else if (healthy_on < on) {
        panel.health = Health::DEGRADED;
    } else {
        panel.health = Health::HEALTHY;
    }
}

void CascadeController::refresh_system_status() noexcept {
    MasterSwitch& master = tree_.master();
    if (!master.is_on()) {
        // An emergency stays visible until the master is powered on again
        master.system_status = master.emergency_shutdown ? SystemStatus::CRITICAL
                                                         : SystemStatus::OFFLINE;
        return;
    }

    size_t on = 0;
    size_t healthy_on = 0;
    bool any_critical = false;
    for (const Panel& p : tree_.panels()) {
        if (p.is_on()) {
            on++;
            if (p.health == Health::HEALTHY) healthy_on++;
        }
        if (p.health == Health::CRITICAL) any_critical = true;
    }

    if (master.emergency_shutdown || any_critical) {
        master.system_status = SystemStatus::CRITICAL;
    } else if (healthy_on < on) {
        master.system_status = SystemStatus::DEGRADED;
    } else {
        master.system_status = SystemStatus::OPTIMAL;
    }
}

// ============================================================================
// Internals
// ============================================================================

void CascadeController::trip(Circuit& circuit, const std::string& reason) {
    const WallTime now = timing::now();
    const BreakerState previous = circuit.breaker.state;
    const std::string circuit_id = circuit.id();

    circuit.breaker.state = BreakerState::TRIPPED;
    circuit.breaker.trip_count++;
    circuit.breaker.last_tripped = now;
    circuit.health = TripDetector::classify(circuit);

    alerts_.emit(AlertLevel::ALERT, circuit_id, "CIRCUIT TRIPPED: " + reason, now);

    const std::chrono::milliseconds cooldown = circuit.breaker.cooldown;
    if (scheduler_.arm(circuit_id, cooldown, on_cooldown_elapsed_) != 0) {
        circuit.breaker.next_reset_at = now + cooldown;
        log::info(COMPONENT) << "Auto-reset of " << circuit_id << " scheduled in "
                             << cooldown.count() << "ms";
    } else {
        circuit.breaker.next_reset_at.reset();
        log::warn(COMPONENT) << "Timers stopped, " << circuit_id << " needs a manual reset";
    }

    audit(SYSTEM_ACTOR, "CIRCUIT_TRIP", circuit_id, to_string(previous), "tripped");
    refresh_upward(circuit_id);
}

void CascadeController::force_trip(Panel& panel, WallTime now) {
    panel.breaker.state = BreakerState::TRIPPED;
    panel.breaker.trip_count++;
    panel.breaker.last_tripped = now;

    for (Circuit& c : panel.circuits) {
        scheduler_.disarm(c.id());
        c.breaker.state = BreakerState::TRIPPED;
        c.breaker.trip_count++;
        c.breaker.last_tripped = now;
        c.breaker.next_reset_at.reset();
        c.health = TripDetector::classify(c);
    }
    refresh_panel_health(panel);
}

void CascadeController::reset_breaker(Circuit& circuit, WallTime now) noexcept {
    circuit.breaker.state = BreakerState::OFF;
    circuit.breaker.error_count = 0;
    circuit.breaker.last_reset = now;
    circuit.breaker.next_reset_at.reset();
    circuit.health = TripDetector::classify(circuit);
}

void CascadeController::apply_error(Circuit& circuit,
                                    const std::string& message,
                                    std::optional<double> latency_ms) {
    const WallTime now = timing::now();
    const ErrorVerdict verdict = TripDetector::record_error(circuit, latency_ms, now);

    if (verdict.latency_breach) {
        alerts_.emit(AlertLevel::WARNING, circuit.id(),
                     "Latency threshold exceeded: " + format_ms(*latency_ms) + " > " +
                         format_ms(circuit.metrics.latency.max_allowed()),
                     now);
    }

    if (verdict.should_trip) {
        trip(circuit, "Error threshold exceeded (" +
                          std::to_string(circuit.breaker.error_count) + "/" +
                          std::to_string(circuit.breaker.trip_threshold) + ")");
        return;
    }

    log::warn(COMPONENT) << circuit.id() << " error " << circuit.breaker.error_count
                         << "/" << circuit.breaker.trip_threshold << ": " << message;
    refresh_upward(circuit.id());
}

bool CascadeController::can_energize(const Circuit& circuit, std::string& why) const {
    if (!tree_.master().is_on()) {
        why = "Cannot power on, master switch is OFF";
        return false;
    }
    const Panel* panel = tree_.panel_for(circuit.id());
    if (panel == nullptr || !panel->is_on()) {
        why = "Cannot power on, panel is not ON";
        return false;
    }
    if (panel->breaker.locked_out) {
        why = "Cannot power on, panel is locked out";
        return false;
    }
    if (circuit.is_tripped()) {
        why = "Cannot power on, circuit is TRIPPED and must be reset";
        return false;
    }
    return true;
}

void CascadeController::reject(const std::string& source, const std::string& message) {
    log::warn(COMPONENT) << source << ": " << message;
    alerts_.emit(AlertLevel::WARNING, source, message, timing::now());
}

void CascadeController::refresh_upward(const std::string& circuit_id) noexcept {
    if (Panel* panel = tree_.panel_for(circuit_id)) {
        refresh_panel_health(*panel);
    }
    refresh_system_status();
}

void CascadeController::audit(const std::string& actor,
                              const char* action,
                              const std::string& target,
                              std::string previous_value,
                              std::string new_value) {
    audit_.append(actor, action, target, std::move(previous_value), std::move(new_value),
                  timing::now());
}

} // namespace breaker
} // namespace fuse
