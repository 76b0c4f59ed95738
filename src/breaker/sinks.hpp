#pragma once

/**
 * FUSE Collaborator Interfaces
 * Optional outlets for history and alerts
 *
 * Both are called without the registry lock held. Implementations may
 * throw; the registry logs the failure and carries on.
 */

#include <vector>
#include "types.hpp"

namespace fuse {
namespace breaker {

/**
 * Durable storage for audit entries and alerts
 * Receives, oldest first, everything appended since its previous flush.
 */
class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual void flush(const std::vector<AuditLogEntry>& entries,
                       const std::vector<SystemAlert>& alerts) = 0;
};

/**
 * Human-facing alert delivery (chat, pager, webhook)
 */
class NotificationChannel {
public:
    virtual ~NotificationChannel() = default;

    virtual void publish(const SystemAlert& alert) = 0;
};

} // namespace breaker
} // namespace fuse
