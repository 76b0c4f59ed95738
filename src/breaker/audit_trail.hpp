#pragma once

/**
 * FUSE Audit Trail & Alert Sink
 * Bounded in-memory history of every control action and alert
 *
 * AUDIT INVARIANT: every mutating control operation appends exactly one
 * entry, destructive ones included, so intent can be reconstructed.
 *
 * Both buffers are FIFO-bounded: the oldest record is dropped silently
 * once capacity is reached. A durable AuditSink, when attached, receives
 * everything appended since its previous flush; records evicted before a
 * flush are lost.
 *
 * Not synchronized: the registry serializes access.
 */

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "../core/constants.hpp"
#include "../core/log.hpp"
#include "../infra/sequence.hpp"
#include "../infra/ring_buffer.hpp"
#include "types.hpp"

namespace fuse {
namespace breaker {

// ============================================================================
// Audit Trail
// ============================================================================

class AuditTrail {
public:
    explicit AuditTrail(size_t capacity = AUDIT_CAPACITY)
        : entries_(capacity) {}

    const AuditLogEntry& append(std::string actor,
                                std::string action,
                                std::string target,
                                std::string previous_value,
                                std::string new_value,
                                WallTime now) {
        AuditLogEntry entry;
        entry.id = seq_.next();
        entry.timestamp = now;
        entry.actor = std::move(actor);
        entry.action = std::move(action);
        entry.target = std::move(target);
        entry.previous_value = std::move(previous_value);
        entry.new_value = std::move(new_value);

        if (entries_.push(std::move(entry))) {
            evicted_++;
        }
        appended_++;
        return entries_.at_newest(0);
    }

    /**
     * Newest first, up to limit (0 = all retained)
     */
    std::vector<AuditLogEntry> entries(size_t limit = 0) const {
        return entries_.snapshot(limit);
    }

    /**
     * Entries appended since the previous call, oldest first
     */
    std::vector<AuditLogEntry> drain_unflushed() {
        std::vector<AuditLogEntry> out;
        for (size_t age = 0; age < entries_.size(); ++age) {
            const AuditLogEntry& e = entries_.at_newest(age);
            if (e.id <= flushed_through_) break;
            out.push_back(e);
        }
        std::reverse(out.begin(), out.end());
        if (!out.empty()) flushed_through_ = out.back().id;
        return out;
    }

    void clear() noexcept {
        entries_.clear();
    }

    size_t size() const noexcept { return entries_.size(); }
    size_t capacity() const noexcept { return entries_.capacity(); }
    uint64_t total_appended() const noexcept { return appended_; }
    uint64_t evicted() const noexcept { return evicted_; }

private:
    RingBuffer<AuditLogEntry> entries_;
    Sequence seq_;
    uint64_t flushed_through_{0};
    uint64_t appended_{0};
    uint64_t evicted_{0};
};

// ============================================================================
// Alert Sink
// ============================================================================

/**
 * Alerts plus live unacknowledged counters
 *
 * Counters are maintained in O(1) on insert and eviction; acknowledge()
 * recomputes them from the buffer.
 *   critical_count: unacknowledged "critical" and "alert"
 *   warning_count:  unacknowledged "warning"
 */
class AlertSink {
public:
    explicit AlertSink(size_t capacity = ALERT_CAPACITY)
        : alerts_(capacity) {}

    const SystemAlert& emit(AlertLevel level,
                            std::string source,
                            std::string message,
                            WallTime now) {
        SystemAlert alert;
        alert.id = seq_.next();
        alert.level = level;
        alert.timestamp = now;
        alert.source = std::move(source);
        alert.message = std::move(message);

        write_log(alert);
        count(alert, +1);

        if (auto evicted = alerts_.push(alert)) {
            count(*evicted, -1);
        }
        outbox_.push_back(std::move(alert));
        return alerts_.at_newest(0);
    }

    /**
     * Acknowledge an alert (idempotent)
     * @return true only if the alert existed and was not yet acknowledged
     */
    bool acknowledge(uint64_t alert_id, const std::string& actor, WallTime now) {
        SystemAlert* alert = alerts_.find_if(
            [alert_id](const SystemAlert& a) { return a.id == alert_id; });
        if (alert == nullptr || alert->acknowledged) {
            return false;
        }

        alert->acknowledged = true;
        alert->acknowledged_by = actor;
        alert->acknowledged_at = now;

        recompute_counts();
        return true;
    }

    /**
     * Full recount over the retained alerts
     */
    void recompute_counts() noexcept {
        critical_count_ = 0;
        warning_count_ = 0;
        alerts_.for_each_newest_first([this](const SystemAlert& a) { count(a, +1); });
    }

    std::vector<SystemAlert> alerts(size_t limit = 0) const {
        return alerts_.snapshot(limit);
    }

    /**
     * Alerts emitted since the previous call, oldest first (notification feed)
     */
    std::vector<SystemAlert> take_outbox() {
        std::vector<SystemAlert> out;
        out.swap(outbox_);
        return out;
    }

    /**
     * Alerts emitted since the previous call, oldest first (durable sink feed)
     */
    std::vector<SystemAlert> drain_unflushed() {
        std::vector<SystemAlert> out;
        for (size_t age = 0; age < alerts_.size(); ++age) {
            const SystemAlert& a = alerts_.at_newest(age);
            if (a.id <= flushed_through_) break;
            out.push_back(a);
        }
        std::reverse(out.begin(), out.end());
        if (!out.empty()) flushed_through_ = out.back().id;
        return out;
    }

    void clear() noexcept {
        alerts_.clear();
        outbox_.clear();
        critical_count_ = 0;
        warning_count_ = 0;
    }

    size_t critical_count() const noexcept { return critical_count_; }
    size_t warning_count() const noexcept { return warning_count_; }
    size_t size() const noexcept { return alerts_.size(); }
    size_t capacity() const noexcept { return alerts_.capacity(); }

private:
    void count(const SystemAlert& alert, int delta) noexcept {
        if (alert.acknowledged) return;
        switch (alert.level) {
            case AlertLevel::CRITICAL:
            case AlertLevel::ALERT:
                critical_count_ += delta;
                break;
            case AlertLevel::WARNING:
                warning_count_ += delta;
                break;
            case AlertLevel::INFO:
                break;
        }
    }

    static void write_log(const SystemAlert& alert) {
        log::Level level = log::Level::INFO;
        switch (alert.level) {
            case AlertLevel::INFO:     level = log::Level::INFO; break;
            case AlertLevel::WARNING:  level = log::Level::WARN; break;
            case AlertLevel::ALERT:    level = log::Level::WARN; break;
            case AlertLevel::CRITICAL: level = log::Level::ERROR; break;
        }
        log::Line(level, "ALERT") << to_string(alert.level) << ' '
                                  << alert.source << ": " << alert.message;
    }

    RingBuffer<SystemAlert> alerts_;
    std::vector<SystemAlert> outbox_;
    Sequence seq_;
    uint64_t flushed_through_{0};
    size_t critical_count_{0};
    size_t warning_count_{0};
};

} // namespace breaker
} // namespace fuse
