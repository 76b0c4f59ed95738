#include "timer_registry.hpp"

#include <exception>
#include <utility>

#include "../core/log.hpp"

namespace fuse {

TimerRegistry::TimerRegistry()
    : worker_(&TimerRegistry::worker_loop, this) {}

TimerRegistry::~TimerRegistry() {
    shutdown();
}

TimerId TimerRegistry::schedule(const std::string& key,
                                std::chrono::milliseconds delay,
                                Callback callback) {
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) [[unlikely]] {
            log::warn("TIMER") << "Registry stopped, not arming " << key;
            return 0;
        }

        id = next_id_++;
        // insert_or_assign drops the previous timer for this key
        timers_.insert_or_assign(key, Entry{id, Clock::now() + delay, std::move(callback)});
    }
    cv_.notify_one();
    return id;
}

bool TimerRegistry::cancel(const std::string& key) {
    bool erased = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        erased = timers_.erase(key) > 0;
    }
    if (erased) cv_.notify_one();
    return erased;
}

size_t TimerRegistry::cancel_all() {
    size_t cancelled = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled = timers_.size();
        timers_.clear();
    }
    cv_.notify_one();
    return cancelled;
}

void TimerRegistry::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        timers_.clear();
    }
    cv_.notify_all();

    // A callback that shuts the registry down cannot join its own thread;
    // the destructor joins it later from the owning thread.
    std::lock_guard<std::mutex> join_lock(join_mutex_);
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

bool TimerRegistry::is_armed(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.count(key) > 0;
}

size_t TimerRegistry::live_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

uint64_t TimerRegistry::fired_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fired_;
}

void TimerRegistry::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stopping_) {
        if (timers_.empty()) {
            cv_.wait(lock, [this] { return stopping_ || !timers_.empty(); });
            continue;
        }

        // Earliest deadline; the table holds one entry per circuit so a scan is fine
        auto next = timers_.begin();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (it->second.due < next->second.due) next = it;
        }

        const Clock::time_point due = next->second.due;
        if (Clock::now() < due) {
            // Woken early by schedule/cancel/shutdown: re-evaluate
            cv_.wait_until(lock, due);
            continue;
        }

        const TimerId id = next->second.id;
        Callback callback = std::move(next->second.callback);
        timers_.erase(next);
        ++fired_;

        lock.unlock();
        try {
            callback(id);
        } catch (const std::exception& e) {
            log::error("TIMER") << "Timer " << id << " callback failed: " << e.what();
        }
        lock.lock();
    }
}

} // namespace fuse
