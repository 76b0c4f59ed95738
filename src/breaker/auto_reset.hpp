#pragma once

/**
 * FUSE Auto-Reset Scheduler
 * Cooldown timers that bring tripped circuits back automatically
 *
 * At most one live timer per circuit: arm() cancels the previous one
 * before scheduling. A firing is honoured only if consume() confirms it
 * is still the circuit's current timer; anything else is a stale firing
 * that lost a race with a manual reset or a re-trip.
 *
 * Not synchronized: the registry calls every method under its own lock.
 * The timer callback itself runs on the TimerRegistry thread and must
 * take that lock before calling consume().
 */

#include <chrono>
#include <functional>
#include <string>
#include <unordered_map>

#include "../infra/timer_registry.hpp"

namespace fuse {
namespace breaker {

class AutoResetScheduler {
public:
    using FireFn = std::function<void(const std::string& circuit_id, TimerId timer_id)>;

    explicit AutoResetScheduler(TimerRegistry& timers) noexcept
        : timers_(timers) {}

    /**
     * Arm the cooldown timer for a circuit, replacing any pending one
     * @return timer id, 0 if the timer thread is already stopped
     */
    TimerId arm(const std::string& circuit_id,
                std::chrono::milliseconds cooldown,
                FireFn fire) {
        TimerId id = timers_.schedule(
            circuit_id, cooldown,
            [circuit_id, fire = std::move(fire)](TimerId timer_id) {
                fire(circuit_id, timer_id);
            });

        if (id == 0) {
            pending_.erase(circuit_id);
        } else {
            pending_[circuit_id] = id;
        }
        return id;
    }

    bool disarm(const std::string& circuit_id) {
        timers_.cancel(circuit_id);
        return pending_.erase(circuit_id) > 0;
    }

    size_t disarm_all() {
        timers_.cancel_all();
        size_t n = pending_.size();
        pending_.clear();
        return n;
    }

    /**
     * Claim a firing
     * @return true if timer_id is the circuit's current timer (now spent)
     */
    bool consume(const std::string& circuit_id, TimerId timer_id) {
        auto it = pending_.find(circuit_id);
        if (it == pending_.end() || it->second != timer_id) {
            return false;
        }
        pending_.erase(it);
        return true;
    }

    bool is_armed(const std::string& circuit_id) const {
        return pending_.count(circuit_id) > 0;
    }

    size_t armed_count() const noexcept { return pending_.size(); }

private:
    TimerRegistry& timers_;
    std::unordered_map<std::string, TimerId> pending_;
};

} // namespace breaker
} // namespace fuse
