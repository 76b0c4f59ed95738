#pragma once

/**
 * FUSE Breaker Registry
 * The single authority over one breaker tree
 *
 * Owns the tree, the audit trail, the alert sink and the cooldown timers.
 * Explicitly constructed: tests build isolated instances, the daemon
 * builds one.
 *
 * THREADING:
 * - One mutex serializes every operation, timer firings included
 * - The lock is released only around a health probe; nodes are looked
 *   up again by id afterwards
 * - Reads return deep copies taken under the lock, never live references
 * - Notification channels and audit sinks run with the lock released
 *
 * Domain failures (unknown id, capacity, rejected transition) come back
 * as false / std::nullopt and are logged. Nothing here throws for them.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../core/constants.hpp"
#include "../infra/timer_registry.hpp"
#include "audit_trail.hpp"
#include "auto_reset.hpp"
#include "cascade_controller.hpp"
#include "config.hpp"
#include "probe.hpp"
#include "sinks.hpp"
#include "tree.hpp"
#include "types.hpp"

namespace fuse {
namespace breaker {

/**
 * Point-in-time copy of the whole tree
 */
struct RegistrySnapshot {
    MasterSwitch master;
    std::vector<Panel> panels;
    std::chrono::milliseconds uptime{0};
    size_t unacknowledged_critical = 0;
    size_t unacknowledged_warning = 0;
    size_t armed_timers = 0;
    WallTime taken_at{};
};

class BreakerRegistry {
public:
    explicit BreakerRegistry(RegistryConfig config = {},
                             std::shared_ptr<HealthProbe> probe = nullptr);
    ~BreakerRegistry();

    BreakerRegistry(const BreakerRegistry&) = delete;
    BreakerRegistry& operator=(const BreakerRegistry&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    void set_probe(std::shared_ptr<HealthProbe> probe);
    void set_audit_sink(std::shared_ptr<AuditSink> sink);
    void set_notification_channel(std::shared_ptr<NotificationChannel> channel);

    /**
     * Cancel all timers and drop every panel, circuit and history record
     */
    void reset();

    /**
     * Cancel all timers and stop the timer thread (idempotent)
     * Operations keep working afterwards but trips no longer auto-reset.
     */
    void shutdown();

    // ========================================================================
    // Master Switch
    // ========================================================================

    bool master_on(const std::string& actor = SYSTEM_ACTOR);
    bool master_off(const std::string& actor = SYSTEM_ACTOR);
    void emergency_shutdown(const std::string& actor = SYSTEM_ACTOR,
                            const std::string& reason = "");

    // ========================================================================
    // Registration
    // ========================================================================

    std::optional<Panel> add_panel(PanelDescriptor descriptor);
    std::optional<Circuit> add_circuit(const std::string& panel_id, CircuitDescriptor descriptor);

    // ========================================================================
    // Control
    // ========================================================================

    bool set_panel_state(const std::string& panel_id, Command command,
                         const std::string& actor = SYSTEM_ACTOR);
    bool set_circuit_state(const std::string& circuit_id, Command command,
                           const std::string& actor = SYSTEM_ACTOR);

    bool lockout_panel(const std::string& panel_id, const std::string& actor,
                       const std::string& reason = "");
    bool reset_panel_lockout(const std::string& panel_id, const std::string& actor);

    bool trip_circuit(const std::string& circuit_id, const std::string& reason = "");
    bool reset_circuit_breaker(const std::string& circuit_id,
                               const std::string& actor = SYSTEM_ACTOR);

    // ========================================================================
    // Metrics
    // ========================================================================

    bool report_error(const std::string& circuit_id, const std::string& message,
                      std::optional<double> latency_ms = std::nullopt);
    bool record_request(const std::string& circuit_id, double latency_ms);

    // ========================================================================
    // Queries (deep copies)
    // ========================================================================

    RegistrySnapshot get_state() const;
    std::optional<Panel> get_panel(const std::string& panel_id) const;
    std::optional<Circuit> get_circuit(const std::string& circuit_id) const;
    std::optional<Panel> get_panel_for_circuit(const std::string& circuit_id) const;
    std::vector<Panel> get_panels() const;
    MasterSwitch get_master_switch() const;

    /// Newest first, up to limit (0 = all retained)
    std::vector<SystemAlert> get_alerts(size_t limit = 0) const;
    std::vector<AuditLogEntry> get_audit_log(size_t limit = 0) const;

    bool acknowledge_alert(uint64_t alert_id, const std::string& actor);

    /**
     * Hand everything recorded since the last flush to the audit sink
     * @return number of records delivered (0 without a sink)
     */
    size_t flush();

    size_t armed_timer_count() const;
    std::chrono::milliseconds uptime() const;
    bool is_powered_on() const;
    const RegistryConfig& config() const noexcept { return config_; }

private:
    using Lock = std::unique_lock<std::mutex>;

    /**
     * Run fn under the lock, then publish the alerts it raised
     */
    template<typename Fn>
    bool mutate(Fn&& fn) {
        bool result = false;
        std::vector<SystemAlert> outbox;
        std::shared_ptr<NotificationChannel> channel;
        {
            Lock lock(mutex_);
            result = fn(lock);
            outbox = alerts_.take_outbox();
            channel = channel_;
        }
        publish(channel, outbox);
        return result;
    }

    void on_cooldown_elapsed(const std::string& circuit_id, TimerId timer_id);
    std::chrono::milliseconds uptime_locked(WallTime now) const;

    static void publish(const std::shared_ptr<NotificationChannel>& channel,
                        const std::vector<SystemAlert>& alerts);
    static RegistryConfig validated(const RegistryConfig& config);

    const RegistryConfig config_;
    mutable std::mutex mutex_;
    std::mutex flush_mutex_;
    BreakerTree tree_;
    AuditTrail audit_;
    AlertSink alerts_;
    TimerRegistry timers_;
    AutoResetScheduler scheduler_;
    CascadeController cascade_;
    std::shared_ptr<AuditSink> audit_sink_;
    std::shared_ptr<NotificationChannel> channel_;
    bool shut_down_{false};
};

} // namespace breaker
} // namespace fuse
