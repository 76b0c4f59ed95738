/**
 * FUSE Breaker Daemon
 * Hosts the breaker registry with the stock panels and a durable audit file
 *
 * Usage: fuse_breakerd [audit_file]
 */

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "../core/constants.hpp"
#include "../core/log.hpp"
#include "../core/shutdown.hpp"
#include "../core/timing.hpp"
#include "default_panels.hpp"
#include "file_audit_sink.hpp"
#include "registry.hpp"

using namespace fuse;
using namespace fuse::breaker;

// ============================================================================
// Configuration
// ============================================================================

static const RegistryConfig g_config{
    .trip_threshold = TRIP_THRESHOLD,
    .cooldown = COOLDOWN_DURATION,
    .max_latency_ms = MAX_LATENCY_MS,
    .default_max_circuits = DEFAULT_MAX_CIRCUITS,
    .audit_capacity = AUDIT_CAPACITY,
    .alert_capacity = ALERT_CAPACITY,
    .probe_timeout = PROBE_TIMEOUT,
    .max_probes_in_flight = MAX_PROBES_IN_FLIGHT
};

constexpr const char* DEFAULT_AUDIT_FILE = "fuse_audit.log";

// ============================================================================
// Heartbeat
// ============================================================================

static void print_status(const BreakerRegistry& registry) {
    const RegistrySnapshot state = registry.get_state();

    size_t panels_on = 0;
    size_t circuits_on = 0;
    size_t circuits_tripped = 0;
    size_t circuits_total = 0;
    for (const Panel& panel : state.panels) {
        if (panel.is_on()) panels_on++;
        circuits_on += panel.active_circuits;
        circuits_total += panel.total_circuits();
        for (const Circuit& circuit : panel.circuits) {
            if (circuit.is_tripped()) circuits_tripped++;
        }
    }

    log::info("FUSE") << "Status: master=" << to_string(state.master.state)
                      << " system=" << to_string(state.master.system_status)
                      << " panels=" << panels_on << "/" << state.panels.size()
                      << " circuits=" << circuits_on << "/" << circuits_total
                      << " tripped=" << circuits_tripped
                      << " timers=" << state.armed_timers
                      << " alerts(critical/warning)=" << state.unacknowledged_critical
                      << "/" << state.unacknowledged_warning
                      << " uptime=" << state.uptime.count() << "ms";
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
    const std::string audit_file = argc > 1 ? argv[1] : DEFAULT_AUDIT_FILE;

    log::info("FUSE") << "Starting breaker daemon...";
    log::info("FUSE") << "Limits: trip_threshold=" << g_config.trip_threshold
                      << " cooldown=" << g_config.cooldown.count() << "ms"
                      << " max_latency=" << g_config.max_latency_ms << "ms";

    auto sink = std::make_shared<FileAuditSink>(audit_file);
    if (!sink->is_open()) {
        log::error("FUSE") << "Audit file unavailable, history stays in memory only";
    }

    BreakerRegistry registry(g_config);
    registry.set_audit_sink(sink);

    const size_t circuits = load_default_panels(registry);
    log::info("FUSE") << "Loaded " << registry.get_panels().size() << " panels, "
                      << circuits << " circuits";

    ShutdownManager& shutdown = ShutdownManager::instance();
    shutdown.install_signal_handlers();
    shutdown.register_handler([&registry, &sink]() {
        registry.master_off(SYSTEM_ACTOR);
        registry.shutdown();
        registry.flush();
        sink->sync();
        log::info("FUSE") << "Audit synced: " << sink->entries_logged() << " entries, "
                          << sink->alerts_logged() << " alerts";
    });

    registry.master_on(SYSTEM_ACTOR);

    log::info("FUSE") << "Entering heartbeat loop...";
    while (!shutdown.is_shutdown_requested()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        print_status(registry);
        registry.flush();
    }

    log::info("FUSE") << "Shutting down...";
    shutdown.run_handlers();

    print_status(registry);
    return 0;
}
