/**
 * FUSE Auto-Reset Tests
 * Timer registry semantics and cooldown-driven recovery
 */

#include <iostream>
#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <thread>

#include "../src/core/log.hpp"
#include "../src/infra/timer_registry.hpp"
#include "../src/breaker/auto_reset.hpp"
#include "../src/breaker/registry.hpp"

using namespace fuse;
using namespace fuse::breaker;
using namespace std::chrono_literals;

// ============================================================================
// Helpers
// ============================================================================

static bool wait_for(const std::function<bool()>& condition,
                     std::chrono::milliseconds timeout = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return condition();
}

static size_t count_audit(const BreakerRegistry& registry, const std::string& action) {
    size_t n = 0;
    for (const AuditLogEntry& e : registry.get_audit_log()) {
        if (e.action == action) n++;
    }
    return n;
}

static RegistryConfig fast_cooldown(std::chrono::milliseconds cooldown) {
    RegistryConfig config;
    config.cooldown = cooldown;
    return config;
}

static void add_basic_tree(BreakerRegistry& registry) {
    registry.add_panel({.id = "p1", .name = "Panel 1"});
    registry.add_circuit("p1", {.id = "c1", .name = "Circuit 1"});
}

// ============================================================================
// TimerRegistry Tests
// ============================================================================

void test_timer_fires() {
    std::cout << "  Testing one-shot timer..." << std::endl;

    TimerRegistry timers;
    std::atomic<TimerId> seen{0};

    const TimerId id = timers.schedule("a", 20ms, [&seen](TimerId fired) { seen.store(fired); });
    assert(id != 0);
    assert(timers.is_armed("a"));

    assert(wait_for([&seen] { return seen.load() != 0; }));
    assert(seen.load() == id);
    assert(wait_for([&timers] { return timers.fired_count() == 1; }));
    assert(!timers.is_armed("a"));
    assert(timers.live_count() == 0);

    std::cout << "  One-shot timer: PASSED" << std::endl;
}

void test_timer_cancel_before_reschedule() {
    std::cout << "  Testing cancel-before-reschedule..." << std::endl;

    TimerRegistry timers;
    std::atomic<int> first{0};
    std::atomic<int> second{0};

    const TimerId id1 = timers.schedule("k", 50ms, [&first](TimerId) { first++; });
    const TimerId id2 = timers.schedule("k", 50ms, [&second](TimerId) { second++; });
    assert(id2 > id1);
    assert(timers.live_count() == 1);

    assert(wait_for([&second] { return second.load() == 1; }));
    std::this_thread::sleep_for(100ms);
    assert(first.load() == 0);
    assert(second.load() == 1);

    std::cout << "  Cancel-before-reschedule: PASSED" << std::endl;
}

void test_timer_cancel() {
    std::cout << "  Testing cancel and cancel_all..." << std::endl;

    TimerRegistry timers;
    std::atomic<int> fired{0};
    auto count = [&fired](TimerId) { fired++; };

    timers.schedule("one", 50ms, count);
    assert(timers.cancel("one"));
    assert(!timers.cancel("one"));

    timers.schedule("a", 50ms, count);
    timers.schedule("b", 50ms, count);
    timers.schedule("c", 50ms, count);
    assert(timers.live_count() == 3);
    assert(timers.cancel_all() == 3);
    assert(timers.live_count() == 0);

    std::this_thread::sleep_for(150ms);
    assert(fired.load() == 0);
    assert(timers.fired_count() == 0);

    std::cout << "  Cancel: PASSED" << std::endl;
}

void test_timer_callback_failure_and_shutdown() {
    std::cout << "  Testing callback failure and shutdown..." << std::endl;

    TimerRegistry timers;
    std::atomic<bool> survived{false};

    timers.schedule("bad", 10ms, [](TimerId) { throw std::runtime_error("callback failure"); });
    timers.schedule("good", 30ms, [&survived](TimerId) { survived.store(true); });
    assert(wait_for([&survived] { return survived.load(); }));

    timers.schedule("late", 10s, [](TimerId) {});
    timers.shutdown();
    timers.shutdown();
    assert(timers.live_count() == 0);
    assert(timers.schedule("after", 10ms, [](TimerId) {}) == 0);

    std::cout << "  Callback failure and shutdown: PASSED" << std::endl;
}

// ============================================================================
// AutoResetScheduler Tests
// ============================================================================

void test_scheduler_stale_guard() {
    std::cout << "  Testing stale firing guard..." << std::endl;

    TimerRegistry timers;
    AutoResetScheduler scheduler(timers);
    auto ignore = [](const std::string&, TimerId) {};

    const TimerId id1 = scheduler.arm("c1", 10s, ignore);
    const TimerId id2 = scheduler.arm("c1", 10s, ignore);
    assert(id1 != 0 && id2 != 0 && id1 != id2);
    assert(scheduler.armed_count() == 1);
    assert(timers.live_count() == 1);

    // Superseded timer is stale
    assert(!scheduler.consume("c1", id1));
    assert(scheduler.is_armed("c1"));
    assert(scheduler.consume("c1", id2));
    assert(!scheduler.consume("c1", id2));
    assert(!scheduler.is_armed("c1"));

    scheduler.arm("c1", 10s, ignore);
    scheduler.arm("c2", 10s, ignore);
    assert(scheduler.disarm("c1"));
    assert(!scheduler.disarm("c1"));
    assert(scheduler.disarm_all() == 1);
    assert(timers.live_count() == 0);

    std::cout << "  Stale guard: PASSED" << std::endl;
}

// ============================================================================
// Cooldown Recovery Tests
// ============================================================================

void test_auto_reset_reenergizes() {
    std::cout << "  Testing auto-reset with re-energize..." << std::endl;

    BreakerRegistry registry(fast_cooldown(50ms));
    add_basic_tree(registry);
    registry.master_on();

    for (int i = 0; i < 5; ++i) registry.report_error("c1", "boom");
    Circuit c1 = registry.get_circuit("c1").value();
    assert(c1.is_tripped());
    assert(c1.breaker.next_reset_at.has_value());
    assert(registry.armed_timer_count() == 1);

    assert(wait_for([&registry] { return registry.get_circuit("c1")->is_on(); }));

    c1 = registry.get_circuit("c1").value();
    assert(c1.breaker.error_count == 0);
    assert(c1.breaker.trip_count == 1);
    assert(c1.breaker.last_reset.has_value());
    assert(!c1.breaker.next_reset_at.has_value());
    assert(c1.health == Health::HEALTHY);
    assert(registry.armed_timer_count() == 0);
    assert(count_audit(registry, "CIRCUIT_AUTO_RESET") == 1);

    bool info_alert = false;
    for (const SystemAlert& a : registry.get_alerts()) {
        if (a.level == AlertLevel::INFO && a.source == "c1") info_alert = true;
    }
    assert(info_alert);

    std::cout << "  Auto-reset re-energize: PASSED" << std::endl;
}

void test_auto_reset_stays_off_when_panel_off() {
    std::cout << "  Testing auto-reset without re-energize..." << std::endl;

    BreakerRegistry registry(fast_cooldown(50ms));
    add_basic_tree(registry);
    registry.master_on();
    registry.trip_circuit("c1", "cooldown test");

    // Panel off: tripped breaker keeps its cooldown
    registry.set_panel_state("p1", Command::OFF, "admin");
    assert(registry.get_circuit("c1")->is_tripped());
    assert(registry.armed_timer_count() == 1);

    assert(wait_for([&registry] { return count_audit(registry, "CIRCUIT_AUTO_RESET") == 1; }));
    const Circuit c1 = registry.get_circuit("c1").value();
    assert(c1.breaker.state == BreakerState::OFF);
    assert(c1.health == Health::OFFLINE);
    assert(c1.breaker.error_count == 0);

    std::cout << "  Auto-reset stays off: PASSED" << std::endl;
}

void test_manual_reset_cancels_timer() {
    std::cout << "  Testing manual reset cancels cooldown..." << std::endl;

    BreakerRegistry registry(fast_cooldown(50ms));
    add_basic_tree(registry);
    registry.master_on();
    registry.trip_circuit("c1", "manual test");
    registry.reset_circuit_breaker("c1", "admin");
    assert(registry.armed_timer_count() == 0);

    std::this_thread::sleep_for(150ms);
    assert(count_audit(registry, "CIRCUIT_AUTO_RESET") == 0);
    assert(registry.get_circuit("c1")->breaker.state == BreakerState::OFF);

    std::cout << "  Manual reset cancels: PASSED" << std::endl;
}

void test_retrip_rearms_single_timer() {
    std::cout << "  Testing re-trip keeps one timer..." << std::endl;

    BreakerRegistry registry(fast_cooldown(100ms));
    add_basic_tree(registry);
    registry.master_on();

    registry.trip_circuit("c1", "first");
    registry.trip_circuit("c1", "second");
    assert(registry.armed_timer_count() == 1);
    assert(registry.get_circuit("c1")->breaker.trip_count == 2);

    assert(wait_for([&registry] { return registry.get_circuit("c1")->is_on(); }));
    std::this_thread::sleep_for(150ms);
    assert(count_audit(registry, "CIRCUIT_AUTO_RESET") == 1);

    std::cout << "  Re-trip: PASSED" << std::endl;
}

void test_teardown_cancels_timers() {
    std::cout << "  Testing teardown..." << std::endl;

    BreakerRegistry registry(fast_cooldown(50ms));
    add_basic_tree(registry);
    registry.master_on();
    registry.trip_circuit("c1", "teardown");
    assert(registry.armed_timer_count() == 1);

    registry.shutdown();
    assert(registry.armed_timer_count() == 0);
    std::this_thread::sleep_for(150ms);
    assert(registry.get_circuit("c1")->is_tripped());

    // Trips after shutdown need a manual reset
    registry.reset_circuit_breaker("c1", "admin");
    registry.trip_circuit("c1", "after teardown");
    const Circuit c1 = registry.get_circuit("c1").value();
    assert(c1.is_tripped());
    assert(!c1.breaker.next_reset_at.has_value());
    assert(registry.armed_timer_count() == 0);

    std::cout << "  Teardown: PASSED" << std::endl;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    log::set_level(log::Level::ERROR);

    std::cout << "====================================" << std::endl;
    std::cout << "FUSE Auto-Reset Tests" << std::endl;
    std::cout << "====================================" << std::endl;

    std::cout << "\n[TimerRegistry Tests]" << std::endl;
    test_timer_fires();
    test_timer_cancel_before_reschedule();
    test_timer_cancel();
    test_timer_callback_failure_and_shutdown();

    std::cout << "\n[AutoResetScheduler Tests]" << std::endl;
    test_scheduler_stale_guard();

    std::cout << "\n[Cooldown Recovery Tests]" << std::endl;
    test_auto_reset_reenergizes();
    test_auto_reset_stays_off_when_panel_off();
    test_manual_reset_cancels_timer();
    test_retrip_rearms_single_timer();
    test_teardown_cancels_timers();

    std::cout << "\n====================================" << std::endl;
    std::cout << "All tests PASSED!" << std::endl;
    std::cout << "====================================" << std::endl;

    return 0;
}
