#pragma once

/**
 * FUSE Graceful Shutdown Manager
 * Lock-free signal flag plus ordered teardown handlers
 */

#include <atomic>
#include <csignal>
#include <exception>
#include <functional>
#include <vector>

#include "compiler.hpp"
#include "log.hpp"

namespace fuse {

/**
 * Singleton shutdown coordinator
 *
 * The signal handler only raises the flag. Teardown handlers run from
 * run_handlers() on the thread that observed the flag, never inside the
 * signal handler.
 */
class ShutdownManager {
public:
    static ShutdownManager& instance() noexcept {
        static ShutdownManager instance;
        return instance;
    }

    /**
     * Register shutdown handler (called in reverse order)
     * NOT thread-safe - call only during initialization
     */
    void register_handler(std::function<void()> handler) {
        handlers_.push_back(std::move(handler));
    }

    /**
     * Request shutdown (async-signal-safe)
     */
    void request_shutdown() noexcept {
        shutdown_requested_.store(true, std::memory_order_release);
    }

    /**
     * Execute handlers once, newest first
     */
    void run_handlers() {
        bool expected = false;
        if (!handlers_ran_.compare_exchange_strong(
                expected, true,
                std::memory_order_acq_rel,
                std::memory_order_relaxed)) {
            return;
        }
        request_shutdown();

        for (auto it = handlers_.rbegin(); it != handlers_.rend(); ++it) {
            try {
                (*it)();
            } catch (const std::exception& e) {
                log::error("SHUTDOWN") << "Handler failed: " << e.what();
            }
        }
    }

    FUSE_ALWAYS_INLINE bool is_shutdown_requested() const noexcept {
        return shutdown_requested_.load(std::memory_order_acquire);
    }

    /**
     * Install signal handlers for SIGINT/SIGTERM
     */
    void install_signal_handlers() noexcept {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }

private:
    ShutdownManager() = default;
    ~ShutdownManager() = default;

    ShutdownManager(const ShutdownManager&) = delete;
    ShutdownManager& operator=(const ShutdownManager&) = delete;

    static void signal_handler(int) noexcept {
        instance().request_shutdown();
    }

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> handlers_ran_{false};
    std::vector<std::function<void()>> handlers_;
};

} // namespace fuse
