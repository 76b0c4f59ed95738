#pragma once

/**
 * FUSE Record Sequence
 * Per-history record numbering
 *
 * Numbers start at 1 and only grow, for the lifetime of the owner. clear()
 * on a trail empties the records but never rewinds the sequence, so a
 * flush watermark taken before the clear stays valid after it.
 * 0 is never issued and serves as "nothing seen yet".
 *
 * Not synchronized: the owning trail is.
 */

#include <cstdint>

namespace fuse {

class Sequence {
public:
    uint64_t next() noexcept { return ++last_; }

    // Most recent number issued, 0 before the first
    uint64_t last() const noexcept { return last_; }

private:
    uint64_t last_{0};
};

} // namespace fuse
