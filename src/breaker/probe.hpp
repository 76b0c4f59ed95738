#pragma once

/**
 * FUSE Health Probe
 * Contract for checking a circuit's backing service, plus a bounded runner
 *
 * A probe either returns {reachable, latency_ms} or throws. The runner
 * turns every failure mode (throw, unreachable, timeout) into a
 * ProbeOutcome with ok == false; it never throws itself.
 *
 * A probe that hangs keeps its own thread until it returns. The caller is
 * released after the timeout; the late result is discarded. At most
 * max_in_flight probe threads exist at once: past that, run() fails
 * immediately without starting a thread, so a dead endpoint cannot pile
 * up threads.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

#include "../core/constants.hpp"
#include "types.hpp"

namespace fuse {
namespace breaker {

struct ProbeResult {
    bool reachable = false;
    double latency_ms = 0.0;
};

class HealthProbe {
public:
    virtual ~HealthProbe() = default;

    virtual ProbeResult probe(const CircuitDescriptor& circuit) = 0;
};

struct ProbeOutcome {
    bool ok = false;
    double latency_ms = 0.0;
    std::string error;
};

class ProbeRunner {
public:
    explicit ProbeRunner(std::chrono::milliseconds timeout = PROBE_TIMEOUT,
                         size_t max_in_flight = MAX_PROBES_IN_FLIGHT)
        : timeout_(timeout),
          max_in_flight_(max_in_flight),
          in_flight_(std::make_shared<std::atomic<size_t>>(0)) {}

    ProbeOutcome run(std::shared_ptr<HealthProbe> probe,
                     const CircuitDescriptor& circuit) const {
        // Reserve a slot; the probe thread releases it when the probe returns
        size_t running = in_flight_->load(std::memory_order_relaxed);
        do {
            if (running >= max_in_flight_) {
                return ProbeOutcome{false, 0.0,
                    "probe rejected, " + std::to_string(running) + " probes still running"};
            }
        } while (!in_flight_->compare_exchange_weak(running, running + 1,
                                                    std::memory_order_acq_rel,
                                                    std::memory_order_relaxed));

        auto promise = std::make_shared<std::promise<ProbeResult>>();
        std::future<ProbeResult> result = promise->get_future();

        try {
            std::thread([probe, circuit, promise, in_flight = in_flight_]() {
                try {
                    promise->set_value(probe->probe(circuit));
                } catch (const std::exception&) {
                    promise->set_exception(std::current_exception());
                } catch (...) {
                    promise->set_exception(std::make_exception_ptr(
                        std::runtime_error("non-standard exception")));
                }
                in_flight->fetch_sub(1, std::memory_order_acq_rel);
            }).detach();
        } catch (const std::system_error& e) {
            in_flight_->fetch_sub(1, std::memory_order_acq_rel);
            return ProbeOutcome{false, 0.0, std::string("probe not started: ") + e.what()};
        }

        if (result.wait_for(timeout_) != std::future_status::ready) {
            return ProbeOutcome{false, 0.0,
                "probe timed out after " + std::to_string(timeout_.count()) + "ms"};
        }

        try {
            ProbeResult r = result.get();
            if (!r.reachable) {
                return ProbeOutcome{false, r.latency_ms, "endpoint unreachable"};
            }
            return ProbeOutcome{true, r.latency_ms, {}};
        } catch (const std::exception& e) {
            return ProbeOutcome{false, 0.0, std::string("probe failed: ") + e.what()};
        }
    }

    std::chrono::milliseconds timeout() const noexcept { return timeout_; }
    size_t max_in_flight() const noexcept { return max_in_flight_; }
    size_t in_flight() const noexcept { return in_flight_->load(std::memory_order_acquire); }

private:
    std::chrono::milliseconds timeout_;
    size_t max_in_flight_;
    // Shared with detached probe threads, which may outlive the runner
    std::shared_ptr<std::atomic<size_t>> in_flight_;
};

} // namespace breaker
} // namespace fuse
