#pragma once

/**
 * FUSE Cascade Controller
 * State-machine transitions over the breaker tree
 *
 * Commands propagate top-down (master -> panels -> circuits); health is
 * recomputed bottom-up (circuit -> panel -> system) after every change.
 *
 * ENERGIZE INVARIANT: a circuit is On only while its panel is On (and not
 * locked out) and the master switch is On. Checked on every transition,
 * and again after a probe since the lock was released for it.
 *
 * Two trip paths exist on purpose:
 *   trip()        ordinary trip, arms the cooldown auto-reset
 *   force_trip()  emergency shutdown and lockout, no timer, manual reset only
 *
 * Every method expects the registry lock to be held. Methods taking a
 * Lock& may release it, only around a health probe.
 */

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "audit_trail.hpp"
#include "auto_reset.hpp"
#include "config.hpp"
#include "probe.hpp"
#include "tree.hpp"
#include "types.hpp"

namespace fuse {
namespace breaker {

class CascadeController {
public:
    using Lock = std::unique_lock<std::mutex>;

    CascadeController(BreakerTree& tree,
                      AuditTrail& audit,
                      AlertSink& alerts,
                      AutoResetScheduler& scheduler,
                      const RegistryConfig& config,
                      AutoResetScheduler::FireFn on_cooldown_elapsed);

    void set_probe(std::shared_ptr<HealthProbe> probe) { probe_ = std::move(probe); }
    bool has_probe() const noexcept { return static_cast<bool>(probe_); }

    // ========================================================================
    // Master Switch
    // ========================================================================

    /**
     * Power the system on and cascade On to every panel
     * @return false if the master was already On (no-op, no audit)
     */
    bool master_on(Lock& lock, const std::string& actor);

    /**
     * Cascade Off to every panel, then power the master off
     * @return false if the master was already Off
     */
    bool master_off(Lock& lock, const std::string& actor);

    /**
     * Force every panel and circuit to Tripped in one pass
     * No auto-reset is armed; pending ones are cancelled.
     */
    void emergency_shutdown(const std::string& actor, const std::string& reason);

    // ========================================================================
    // Panels
    // ========================================================================

    bool set_panel_state(Lock& lock, const std::string& panel_id,
                         Command command, const std::string& actor);

    bool lockout_panel(const std::string& panel_id, const std::string& actor,
                       const std::string& reason);

    /**
     * Clear a lockout: every circuit goes through manual reset, panel stays Off
     */
    bool reset_panel_lockout(const std::string& panel_id, const std::string& actor);

    // ========================================================================
    // Circuits
    // ========================================================================

    bool set_circuit_state(Lock& lock, const std::string& circuit_id,
                           Command command, const std::string& actor);

    bool trip_circuit(const std::string& circuit_id, const std::string& reason);

    bool reset_circuit(const std::string& circuit_id, const std::string& actor);

    /**
     * Cooldown elapsed for a circuit
     * Ignored unless timer_id is the circuit's current timer and the
     * circuit is still Tripped.
     */
    void auto_reset(Lock& lock, const std::string& circuit_id, TimerId timer_id);

    bool report_error(const std::string& circuit_id, const std::string& message,
                      std::optional<double> latency_ms);

    bool record_request(const std::string& circuit_id, double latency_ms);

    // ========================================================================
    // Health Aggregation
    // ========================================================================

    void refresh_panel_health(Panel& panel) const noexcept;
    void refresh_system_status() noexcept;

private:
    void trip(Circuit& circuit, const std::string& reason);
    void force_trip(Panel& panel, WallTime now);
    void reset_breaker(Circuit& circuit, WallTime now) noexcept;
    void apply_error(Circuit& circuit, const std::string& message,
                     std::optional<double> latency_ms);

    bool can_energize(const Circuit& circuit, std::string& why) const;
    void reject(const std::string& source, const std::string& message);
    void refresh_upward(const std::string& circuit_id) noexcept;
    void audit(const std::string& actor, const char* action, const std::string& target,
               std::string previous_value, std::string new_value);

    BreakerTree& tree_;
    AuditTrail& audit_;
    AlertSink& alerts_;
    AutoResetScheduler& scheduler_;
    const RegistryConfig& config_;
    AutoResetScheduler::FireFn on_cooldown_elapsed_;
    ProbeRunner runner_;
    std::shared_ptr<HealthProbe> probe_;
};

} // namespace breaker
} // namespace fuse
