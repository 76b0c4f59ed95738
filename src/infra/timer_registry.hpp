#pragma once

/**
 * FUSE Timer Registry
 * Keyed one-shot timers on a single worker thread
 *
 * Each key owns at most one live timer: schedule() cancels whatever was
 * armed under the same key before arming the new one. cancel_all() and
 * shutdown() are the teardown paths.
 *
 * Callbacks run on the worker thread with no registry lock held, so a
 * callback may call back into schedule()/cancel(). cancel() never waits
 * for a callback that has already started; owners that need to tell a
 * stale firing from a current one compare the TimerId the callback
 * receives against the id schedule() returned.
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace fuse {

using TimerId = uint64_t;

class TimerRegistry {
public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void(TimerId)>;

    TimerRegistry();
    ~TimerRegistry();

    TimerRegistry(const TimerRegistry&) = delete;
    TimerRegistry& operator=(const TimerRegistry&) = delete;

    /**
     * Arm a one-shot timer under key, replacing any live one
     * @return id of the new timer, 0 once the registry is shut down
     */
    TimerId schedule(const std::string& key, std::chrono::milliseconds delay, Callback callback);

    /**
     * Disarm the live timer under key
     * @return true if a timer was pending
     */
    bool cancel(const std::string& key);

    /**
     * Disarm every live timer
     * @return number of timers cancelled
     */
    size_t cancel_all();

    /**
     * Cancel everything and join the worker thread (idempotent)
     */
    void shutdown();

    bool is_armed(const std::string& key) const;
    size_t live_count() const;
    uint64_t fired_count() const;

private:
    struct Entry {
        TimerId id;
        Clock::time_point due;
        Callback callback;
    };

    void worker_loop();

    mutable std::mutex mutex_;
    std::mutex join_mutex_;
    std::condition_variable cv_;
    std::unordered_map<std::string, Entry> timers_;
    TimerId next_id_{1};
    uint64_t fired_{0};
    bool stopping_{false};
    std::thread worker_;
};

} // namespace fuse
