#include "registry.hpp"

#include <exception>
#include <utility>

#include "../core/log.hpp"
#include "trip_detector.hpp"

namespace fuse {
namespace breaker {

namespace {
constexpr const char* COMPONENT = "BRK";
}

BreakerRegistry::BreakerRegistry(RegistryConfig config, std::shared_ptr<HealthProbe> probe)
    : config_(validated(config)),
      audit_(config_.audit_capacity),
      alerts_(config_.alert_capacity),
      scheduler_(timers_),
      cascade_(tree_, audit_, alerts_, scheduler_, config_,
               [this](const std::string& circuit_id, TimerId timer_id) {
                   on_cooldown_elapsed(circuit_id, timer_id);
               }) {
    cascade_.set_probe(std::move(probe));
}

BreakerRegistry::~BreakerRegistry() {
    shutdown();
}

RegistryConfig BreakerRegistry::validated(const RegistryConfig& config) {
    if (config.is_valid()) return config;
    log::error(COMPONENT) << "Invalid registry configuration, using defaults";
    return RegistryConfig{};
}

// ============================================================================
// Lifecycle
// ============================================================================

void BreakerRegistry::set_probe(std::shared_ptr<HealthProbe> probe) {
    Lock lock(mutex_);
    cascade_.set_probe(std::move(probe));
}

void BreakerRegistry::set_audit_sink(std::shared_ptr<AuditSink> sink) {
    Lock lock(mutex_);
    audit_sink_ = std::move(sink);
}

void BreakerRegistry::set_notification_channel(std::shared_ptr<NotificationChannel> channel) {
    Lock lock(mutex_);
    channel_ = std::move(channel);
}

void BreakerRegistry::reset() {
    Lock lock(mutex_);
    const size_t cancelled = scheduler_.disarm_all();
    tree_.clear();
    audit_.clear();
    alerts_.clear();
    log::info(COMPONENT) << "Registry reset, " << cancelled << " timers cancelled";
}

void BreakerRegistry::shutdown() {
    {
        Lock lock(mutex_);
        if (!shut_down_) {
            shut_down_ = true;
            scheduler_.disarm_all();
        }
    }
    // Joins the timer thread: must not hold the registry lock, a firing
    // callback may be waiting on it
    timers_.shutdown();
}

// ============================================================================
// Master Switch
// ============================================================================

bool BreakerRegistry::master_on(const std::string& actor) {
    return mutate([&](Lock& lock) { return cascade_.master_on(lock, actor); });
}

bool BreakerRegistry::master_off(const std::string& actor) {
    return mutate([&](Lock& lock) { return cascade_.master_off(lock, actor); });
}

void BreakerRegistry::emergency_shutdown(const std::string& actor, const std::string& reason) {
    mutate([&](Lock&) {
        cascade_.emergency_shutdown(actor, reason);
        return true;
    });
}

// ============================================================================
// Registration
// ============================================================================

std::optional<Panel> BreakerRegistry::add_panel(PanelDescriptor descriptor) {
    Lock lock(mutex_);

    if (descriptor.id.empty()) {
        log::warn(COMPONENT) << "Cannot add panel without an id";
        return std::nullopt;
    }
    if (tree_.find_panel(descriptor.id) != nullptr) {
        log::warn(COMPONENT) << "Duplicate panel id: " << descriptor.id;
        return std::nullopt;
    }
    if (descriptor.max_circuits == 0) {
        descriptor.max_circuits = config_.default_max_circuits;
    }

    Panel panel;
    panel.descriptor = std::move(descriptor);
    const Panel& added = tree_.insert_panel(std::move(panel));

    log::info(COMPONENT) << "Panel added: " << added.id() << " (" << added.descriptor.name << ")";
    audit_.append(SYSTEM_ACTOR, "PANEL_ADD", added.id(), "", to_string(added.breaker.state),
                  timing::now());
    return added;
}

std::optional<Circuit> BreakerRegistry::add_circuit(const std::string& panel_id,
                                                    CircuitDescriptor descriptor) {
    Lock lock(mutex_);

    Panel* panel = tree_.find_panel(panel_id);
    if (panel == nullptr) {
        log::warn(COMPONENT) << "Cannot add circuit, panel not found: " << panel_id;
        return std::nullopt;
    }
    if (descriptor.id.empty()) {
        log::warn(COMPONENT) << "Cannot add circuit without an id to " << panel_id;
        return std::nullopt;
    }
    if (tree_.contains_circuit(descriptor.id)) {
        log::warn(COMPONENT) << "Duplicate circuit id: " << descriptor.id;
        return std::nullopt;
    }
    if (panel->circuits.size() >= panel->descriptor.max_circuits) {
        log::warn(COMPONENT) << "Panel " << panel_id << " at max capacity: "
                             << panel->descriptor.max_circuits;
        return std::nullopt;
    }

    const WallTime now = timing::now();
    Circuit circuit;
    circuit.descriptor = std::move(descriptor);
    circuit.breaker.trip_threshold = config_.trip_threshold;
    circuit.breaker.cooldown = config_.cooldown;
    circuit.metrics.latency = LatencyTracker(config_.max_latency_ms);
    circuit.metrics.last_activity = now;
    circuit.last_check = now;
    circuit.created_at = now;
    circuit.health = TripDetector::classify(circuit);

    const Circuit& added = tree_.insert_circuit(*panel, std::move(circuit));
    cascade_.refresh_panel_health(*panel);

    log::debug(COMPONENT) << "Circuit added: " << added.id() << " -> " << panel_id;
    audit_.append(SYSTEM_ACTOR, "CIRCUIT_ADD", added.id(), "", to_string(added.breaker.state), now);
    return added;
}

// ============================================================================
// Control
// ============================================================================

bool BreakerRegistry::set_panel_state(const std::string& panel_id, Command command,
                                      const std::string& actor) {
    return mutate([&](Lock& lock) {
        return cascade_.set_panel_state(lock, panel_id, command, actor);
    });
}

bool BreakerRegistry::set_circuit_state(const std::string& circuit_id, Command command,
                                        const std::string& actor) {
    return mutate([&](Lock& lock) {
        return cascade_.set_circuit_state(lock, circuit_id, command, actor);
    });
}

bool BreakerRegistry::lockout_panel(const std::string& panel_id, const std::string& actor,
                                    const std::string& reason) {
    return mutate([&](Lock&) { return cascade_.lockout_panel(panel_id, actor, reason); });
}

bool BreakerRegistry::reset_panel_lockout(const std::string& panel_id, const std::string& actor) {
    return mutate([&](Lock&) { return cascade_.reset_panel_lockout(panel_id, actor); });
}

bool BreakerRegistry::trip_circuit(const std::string& circuit_id, const std::string& reason) {
    return mutate([&](Lock&) { return cascade_.trip_circuit(circuit_id, reason); });
}

bool BreakerRegistry::reset_circuit_breaker(const std::string& circuit_id,
                                            const std::string& actor) {
    return mutate([&](Lock&) { return cascade_.reset_circuit(circuit_id, actor); });
}

void BreakerRegistry::on_cooldown_elapsed(const std::string& circuit_id, TimerId timer_id) {
    mutate([&](Lock& lock) {
        if (shut_down_) return false;
        cascade_.auto_reset(lock, circuit_id, timer_id);
        return true;
    });
}

// ============================================================================
// Metrics
// ============================================================================

bool BreakerRegistry::report_error(const std::string& circuit_id, const std::string& message,
                                   std::optional<double> latency_ms) {
    return mutate([&](Lock&) { return cascade_.report_error(circuit_id, message, latency_ms); });
}

bool BreakerRegistry::record_request(const std::string& circuit_id, double latency_ms) {
    return mutate([&](Lock&) { return cascade_.record_request(circuit_id, latency_ms); });
}

// ============================================================================
// Queries
// ============================================================================

RegistrySnapshot BreakerRegistry::get_state() const {
    Lock lock(mutex_);
    RegistrySnapshot snapshot;
    snapshot.taken_at = timing::now();
    snapshot.master = tree_.master();
    snapshot.panels = tree_.panels();
    snapshot.uptime = uptime_locked(snapshot.taken_at);
    snapshot.unacknowledged_critical = alerts_.critical_count();
    snapshot.unacknowledged_warning = alerts_.warning_count();
    snapshot.armed_timers = scheduler_.armed_count();
    return snapshot;
}

std::optional<Panel> BreakerRegistry::get_panel(const std::string& panel_id) const {
    Lock lock(mutex_);
    if (const Panel* panel = tree_.find_panel(panel_id)) return *panel;
    return std::nullopt;
}

std::optional<Circuit> BreakerRegistry::get_circuit(const std::string& circuit_id) const {
    Lock lock(mutex_);
    if (const Circuit* circuit = tree_.find_circuit(circuit_id)) return *circuit;
    return std::nullopt;
}

std::optional<Panel> BreakerRegistry::get_panel_for_circuit(const std::string& circuit_id) const {
    Lock lock(mutex_);
    if (const Panel* panel = tree_.panel_for(circuit_id)) return *panel;
    return std::nullopt;
}

std::vector<Panel> BreakerRegistry::get_panels() const {
    Lock lock(mutex_);
    return tree_.panels();
}

MasterSwitch BreakerRegistry::get_master_switch() const {
    Lock lock(mutex_);
    return tree_.master();
}

std::vector<SystemAlert> BreakerRegistry::get_alerts(size_t limit) const {
    Lock lock(mutex_);
    return alerts_.alerts(limit);
}

std::vector<AuditLogEntry> BreakerRegistry::get_audit_log(size_t limit) const {
    Lock lock(mutex_);
    return audit_.entries(limit);
}

bool BreakerRegistry::acknowledge_alert(uint64_t alert_id, const std::string& actor) {
    Lock lock(mutex_);
    const WallTime now = timing::now();
    if (!alerts_.acknowledge(alert_id, actor, now)) {
        return false;
    }
    audit_.append(actor, "ALERT_ACK", std::to_string(alert_id), "unacknowledged", "acknowledged", now);
    return true;
}

size_t BreakerRegistry::flush() {
    // Serialized so batches reach the sink in order
    std::lock_guard<std::mutex> flush_lock(flush_mutex_);

    std::shared_ptr<AuditSink> sink;
    std::vector<AuditLogEntry> entries;
    std::vector<SystemAlert> alerts;
    {
        Lock lock(mutex_);
        if (!audit_sink_) return 0;
        sink = audit_sink_;
        entries = audit_.drain_unflushed();
        alerts = alerts_.drain_unflushed();
    }
    if (entries.empty() && alerts.empty()) return 0;

    try {
        sink->flush(entries, alerts);
    } catch (const std::exception& e) {
        log::error(COMPONENT) << "Audit sink flush failed, " << entries.size() + alerts.size()
                              << " records dropped: " << e.what();
        return 0;
    }
    return entries.size() + alerts.size();
}

size_t BreakerRegistry::armed_timer_count() const {
    Lock lock(mutex_);
    return scheduler_.armed_count();
}

std::chrono::milliseconds BreakerRegistry::uptime() const {
    Lock lock(mutex_);
    return uptime_locked(timing::now());
}

bool BreakerRegistry::is_powered_on() const {
    Lock lock(mutex_);
    return tree_.master().is_on();
}

std::chrono::milliseconds BreakerRegistry::uptime_locked(WallTime now) const {
    const MasterSwitch& master = tree_.master();
    if (!master.is_on()) return master.uptime;
    return master.uptime + std::chrono::duration_cast<std::chrono::milliseconds>(now - master.start_time);
}

// ============================================================================
// Notifications
// ============================================================================

void BreakerRegistry::publish(const std::shared_ptr<NotificationChannel>& channel,
                              const std::vector<SystemAlert>& alerts) {
    if (!channel) return;
    for (const SystemAlert& alert : alerts) {
        try {
            channel->publish(alert);
        } catch (const std::exception& e) {
            log::error(COMPONENT) << "Notification channel failed for alert "
                                  << alert.id << ": " << e.what();
        }
    }
}

} // namespace breaker
} // namespace fuse
