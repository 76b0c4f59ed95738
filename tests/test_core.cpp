/**
 * FUSE Core Tests
 * Unit tests for core and infra components
 */

#include <iostream>
#include <cassert>
#include <chrono>
#include <cmath>
#include <set>
#include <stdexcept>
#include <string>

#include "../src/core/compiler.hpp"
#include "../src/core/constants.hpp"
#include "../src/core/log.hpp"
#include "../src/core/shutdown.hpp"
#include "../src/core/timing.hpp"
#include "../src/infra/sequence.hpp"
#include "../src/infra/ring_buffer.hpp"
#include "../src/breaker/audit_trail.hpp"
#include "../src/breaker/latency_tracker.hpp"

using namespace fuse;

// ============================================================================
// RingBuffer Tests
// ============================================================================

void test_ring_buffer_basic() {
    std::cout << "  Testing RingBuffer basic operations..." << std::endl;

    RingBuffer<int> buffer(4);

    assert(buffer.empty());
    assert(!buffer.full());
    assert(buffer.capacity() == 4);

    assert(!buffer.push(1).has_value());
    assert(!buffer.push(2).has_value());
    assert(!buffer.push(3).has_value());
    assert(buffer.size() == 3);

    // Newest first
    assert(buffer.at_newest(0) == 3);
    assert(buffer.at_newest(2) == 1);

    std::vector<int> all = buffer.snapshot();
    assert(all.size() == 3);
    assert(all[0] == 3 && all[1] == 2 && all[2] == 1);

    std::vector<int> two = buffer.snapshot(2);
    assert(two.size() == 2);
    assert(two[0] == 3 && two[1] == 2);

    std::cout << "  RingBuffer basic: PASSED" << std::endl;
}

void test_ring_buffer_eviction() {
    std::cout << "  Testing RingBuffer FIFO eviction..." << std::endl;

    RingBuffer<int> buffer(3);
    buffer.push(10);
    buffer.push(20);
    buffer.push(30);
    assert(buffer.full());

    // Oldest goes first
    std::optional<int> evicted = buffer.push(40);
    assert(evicted.has_value() && *evicted == 10);
    evicted = buffer.push(50);
    assert(evicted.has_value() && *evicted == 20);

    assert(buffer.size() == 3);
    std::vector<int> all = buffer.snapshot();
    assert(all[0] == 50 && all[1] == 40 && all[2] == 30);

    // Wrap many times
    for (int i = 0; i < 1000; ++i) buffer.push(i);
    assert(buffer.size() == 3);
    assert(buffer.at_newest(0) == 999);
    assert(buffer.at_newest(2) == 997);

    buffer.clear();
    assert(buffer.empty());
    assert(buffer.snapshot().empty());

    std::cout << "  RingBuffer eviction: PASSED" << std::endl;
}

void test_ring_buffer_find() {
    std::cout << "  Testing RingBuffer find_if/for_each..." << std::endl;

    RingBuffer<std::string> buffer(5);
    buffer.push("alpha");
    buffer.push("beta");
    buffer.push("gamma");

    std::string* found = buffer.find_if([](const std::string& s) { return s == "beta"; });
    assert(found != nullptr);
    *found = "BETA";
    assert(buffer.at_newest(1) == "BETA");

    assert(buffer.find_if([](const std::string& s) { return s == "delta"; }) == nullptr);

    std::string order;
    buffer.for_each_newest_first([&order](const std::string& s) { order += s[0]; });
    assert(order == "gBa");

    // Zero capacity is clamped to one slot
    RingBuffer<int> tiny(0);
    assert(tiny.capacity() == 1);
    tiny.push(1);
    assert(tiny.push(2).value() == 1);

    std::cout << "  RingBuffer find: PASSED" << std::endl;
}

// ============================================================================
// Sequence Tests
// ============================================================================

void test_sequence() {
    std::cout << "  Testing record sequence..." << std::endl;

    Sequence seq;
    assert(seq.last() == 0);

    std::set<uint64_t> seen;
    uint64_t previous = 0;
    for (int i = 0; i < 1000; ++i) {
        uint64_t id = seq.next();
        assert(id == previous + 1);
        assert(seen.insert(id).second);
        previous = id;
    }
    assert(seq.last() == 1000);

    std::cout << "  Sequence: PASSED" << std::endl;
}

void test_watermark_survives_clear() {
    std::cout << "  Testing flush watermark across clear()..." << std::endl;

    breaker::AuditTrail trail(4);
    const timing::WallTime now = timing::now();
    trail.append("system", "CIRCUIT_ON", "c1", "off", "on", now);
    trail.append("system", "CIRCUIT_OFF", "c1", "on", "off", now);
    assert(trail.drain_unflushed().size() == 2);

    // Numbering continues after clear, so new records are still unflushed
    trail.clear();
    assert(trail.size() == 0);
    const uint64_t id = trail.append("ops", "CIRCUIT_ON", "c2", "off", "on", now).id;
    assert(id == 3);

    std::vector<breaker::AuditLogEntry> batch = trail.drain_unflushed();
    assert(batch.size() == 1 && batch[0].target == "c2");
    assert(trail.drain_unflushed().empty());

    breaker::AlertSink alerts(4);
    alerts.emit(breaker::AlertLevel::INFO, "c1", "first", now);
    assert(alerts.drain_unflushed().size() == 1);
    alerts.clear();
    alerts.emit(breaker::AlertLevel::WARNING, "c1", "second", now);
    std::vector<breaker::SystemAlert> pending = alerts.drain_unflushed();
    assert(pending.size() == 1 && pending[0].message == "second");

    std::cout << "  Watermark across clear: PASSED" << std::endl;
}

// ============================================================================
// Timing Tests
// ============================================================================

void test_timing() {
    std::cout << "  Testing timing utilities..." << std::endl;

    uint64_t t1 = timing::get_monotonic_ns();
    uint64_t t2 = timing::get_monotonic_ns();
    assert(t2 >= t1);

    // 2021-01-01T00:00:00.123Z
    timing::WallTime t = timing::WallClock::from_time_t(1609459200) + std::chrono::milliseconds(123);
    assert(timing::format_utc(t) == "2021-01-01T00:00:00.123Z");

    timing::WallTime epoch = timing::WallClock::from_time_t(0);
    assert(timing::format_utc(epoch) == "1970-01-01T00:00:00.000Z");

    assert(timing::to_millis(std::chrono::seconds(2)) == 2000);

    std::cout << "  Timing: PASSED" << std::endl;
}

// ============================================================================
// Log Tests
// ============================================================================

void test_log_levels() {
    std::cout << "  Testing log level filtering..." << std::endl;

    const log::Level saved = log::get_level();

    log::set_level(log::Level::WARN);
    assert(!log::is_enabled(log::Level::DEBUG));
    assert(!log::is_enabled(log::Level::INFO));
    assert(log::is_enabled(log::Level::WARN));
    assert(log::is_enabled(log::Level::ERROR));

    log::set_level(log::Level::OFF);
    assert(!log::is_enabled(log::Level::ERROR));
    log::error("TEST") << "never printed";

    assert(std::string(log::to_string(log::Level::WARN)) == "WARN");

    log::set_level(saved);
    std::cout << "  Log levels: PASSED" << std::endl;
}

// ============================================================================
// LatencyTracker Tests
// ============================================================================

void test_latency_estimators() {
    std::cout << "  Testing latency estimators..." << std::endl;

    breaker::LatencyTracker tracker;
    assert(tracker.max_allowed() == MAX_LATENCY_MS);

    tracker.record(20.0);
    assert(std::abs(tracker.p50() - 2.0) < 1e-9);
    assert(tracker.p95() == 20.0);
    assert(tracker.p99() == 20.0);
    assert(tracker.current() == 20.0);

    // Decay on a smaller sample
    tracker.record(10.0);
    assert(std::abs(tracker.p50() - (2.0 * 0.9 + 1.0)) < 1e-9);
    assert(std::abs(tracker.p95() - 19.0) < 1e-9);
    assert(std::abs(tracker.p99() - 19.8) < 1e-9);

    // One outlier lifts the tail immediately
    tracker.record(120.0);
    assert(tracker.p95() == 120.0);
    assert(tracker.p95_over_limit());
    assert(tracker.p95_critical());

    // observe() touches current only
    tracker.observe(5.0);
    assert(tracker.current() == 5.0);
    assert(tracker.p95() == 120.0);

    assert(tracker.exceeds_limit(50.1));
    assert(!tracker.exceeds_limit(50.0));

    std::cout << "  Latency estimators: PASSED" << std::endl;
}

// ============================================================================
// ShutdownManager Tests
// ============================================================================

void test_shutdown_handlers() {
    std::cout << "  Testing shutdown handlers..." << std::endl;

    const log::Level saved = log::get_level();
    log::set_level(log::Level::OFF);

    ShutdownManager& shutdown = ShutdownManager::instance();
    assert(!shutdown.is_shutdown_requested());

    std::string order;
    shutdown.register_handler([&order]() { order += "registry;"; });
    shutdown.register_handler([]() { throw std::runtime_error("sink closed"); });
    shutdown.register_handler([&order]() { order += "sink;"; });

    // Flag alone does not run handlers
    shutdown.request_shutdown();
    assert(shutdown.is_shutdown_requested());
    assert(order.empty());

    // Newest first, a failing handler does not stop the rest, runs once
    shutdown.run_handlers();
    shutdown.run_handlers();
    assert(order == "sink;registry;");

    log::set_level(saved);
    std::cout << "  Shutdown handlers: PASSED" << std::endl;
}

// ============================================================================
// Benchmark
// ============================================================================

void benchmark_ring_buffer() {
    std::cout << "\n  Benchmarking RingBuffer push..." << std::endl;

    constexpr int ITERATIONS = 1000000;
    RingBuffer<uint64_t> buffer(AUDIT_CAPACITY);

    const uint64_t start = timing::get_monotonic_ns();
    for (int i = 0; i < ITERATIONS; ++i) {
        buffer.push(static_cast<uint64_t>(i));
    }
    const uint64_t elapsed = timing::get_monotonic_ns() - start;

    assert(buffer.size() == AUDIT_CAPACITY);
    std::cout << "  Push: ~" << static_cast<double>(elapsed) / ITERATIONS << " ns/op" << std::endl;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "====================================" << std::endl;
    std::cout << "FUSE Core Tests" << std::endl;
    std::cout << "====================================" << std::endl;

    std::cout << "\n[RingBuffer Tests]" << std::endl;
    test_ring_buffer_basic();
    test_ring_buffer_eviction();
    test_ring_buffer_find();

    std::cout << "\n[Sequence Tests]" << std::endl;
    test_sequence();
    test_watermark_survives_clear();

    std::cout << "\n[Timing Tests]" << std::endl;
    test_timing();

    std::cout << "\n[Log Tests]" << std::endl;
    test_log_levels();

    std::cout << "\n[LatencyTracker Tests]" << std::endl;
    test_latency_estimators();

    std::cout << "\n[ShutdownManager Tests]" << std::endl;
    test_shutdown_handlers();

    std::cout << "\n====================================" << std::endl;
    std::cout << "Benchmarks" << std::endl;
    std::cout << "====================================" << std::endl;
    benchmark_ring_buffer();

    std::cout << "\n====================================" << std::endl;
    std::cout << "All tests PASSED!" << std::endl;
    std::cout << "====================================" << std::endl;

    return 0;
}
