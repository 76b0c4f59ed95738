#pragma once

/**
 * FUSE File Audit Sink
 * Append-only pipe-delimited record of control actions and alerts
 *
 * COMPLIANCE INVARIANT: destructive actions (emergency shutdown, lockout)
 * reach this file like every other entry, so operator intent survives a
 * restart even though the in-memory trail does not.
 *
 * DURABILITY MODEL:
 * - flush() = data in kernel buffer, NOT on disk
 * - sync()  = pubsync() on the file buffer, data handed to the OS for disk
 * - The daemon flushes every heartbeat and syncs on shutdown
 *
 * Line formats (UTC timestamps, ISO 8601):
 *   TIMESTAMP|AUDIT|id|actor|action|target|previous|new
 *   TIMESTAMP|ALERT|id|level|source|message
 * Pipes and newlines inside fields are replaced with '/' and ' '.
 */

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

#include "../core/log.hpp"
#include "../core/timing.hpp"
#include "sinks.hpp"

namespace fuse {
namespace breaker {

class FileAuditSink final : public AuditSink {
public:
    explicit FileAuditSink(const std::string& filename) {
        file_.open(filename, std::ios::app | std::ios::out);
        if (file_.is_open()) {
            file_ << "# FUSE Audit Log\n";
            file_ << "# Format: TIMESTAMP|AUDIT|ID|ACTOR|ACTION|TARGET|PREVIOUS|NEW\n";
            file_ << "#         TIMESTAMP|ALERT|ID|LEVEL|SOURCE|MESSAGE\n";
            file_.flush();
        } else {
            log::error("AUDIT") << "Cannot open audit file " << filename;
        }
    }

    ~FileAuditSink() override {
        if (file_.is_open()) {
            sync();
            file_.close();
        }
    }

    FileAuditSink(const FileAuditSink&) = delete;
    FileAuditSink& operator=(const FileAuditSink&) = delete;

    void flush(const std::vector<AuditLogEntry>& entries,
               const std::vector<SystemAlert>& alerts) override {
        if (!file_.is_open()) return;

        std::lock_guard<std::mutex> lock(mutex_);
        for (const AuditLogEntry& e : entries) {
            file_ << timing::format_utc(e.timestamp) << "|AUDIT|" << e.id
                  << '|' << clean(e.actor)
                  << '|' << clean(e.action)
                  << '|' << clean(e.target)
                  << '|' << clean(e.previous_value)
                  << '|' << clean(e.new_value) << '\n';
            entries_logged_++;
        }
        for (const SystemAlert& a : alerts) {
            file_ << timing::format_utc(a.timestamp) << "|ALERT|" << a.id
                  << '|' << to_string(a.level)
                  << '|' << clean(a.source)
                  << '|' << clean(a.message) << '\n';
            alerts_logged_++;
        }
        file_.flush();
    }

    /**
     * Push buffered data to the OS
     */
    void sync() {
        if (!file_.is_open()) return;

        std::lock_guard<std::mutex> lock(mutex_);
        file_.flush();
        if (std::filebuf* pbuf = file_.rdbuf()) {
            pbuf->pubsync();
        }
        sync_count_++;
    }

    bool is_open() const noexcept { return file_.is_open(); }
    uint64_t entries_logged() const noexcept { return entries_logged_; }
    uint64_t alerts_logged() const noexcept { return alerts_logged_; }
    uint64_t sync_count() const noexcept { return sync_count_; }

private:
    static std::string clean(const std::string& field) {
        std::string out = field;
        for (char& c : out) {
            if (c == '|') c = '/';
            else if (c == '\n' || c == '\r') c = ' ';
        }
        return out;
    }

    std::ofstream file_;
    std::mutex mutex_;
    uint64_t entries_logged_{0};
    uint64_t alerts_logged_{0};
    uint64_t sync_count_{0};
};

} // namespace breaker
} // namespace fuse
