#pragma once

/**
 * FUSE Bounded Ring Buffer
 * Fixed-capacity history that evicts its oldest element on overflow
 *
 * - Storage allocated once at construction, never grows
 * - push() is O(1) and hands back the evicted element, if any
 * - Iteration is newest first (the order operators read history in)
 *
 * Not synchronized: the owner serializes access.
 */

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "../core/compiler.hpp"

namespace fuse {

/**
 * @tparam T  Element type (copyable, default-constructible)
 */
template<typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity)
        : buffer_(capacity > 0 ? capacity : 1), head_(0), count_(0) {}

    // ========================================================================
    // Producer Interface
    // ========================================================================

    /**
     * Append an element
     * @return the element that was evicted to make room, if the buffer was full
     */
    FUSE_HOT
    std::optional<T> push(T item) {
        std::optional<T> evicted;
        if (count_ == buffer_.size()) [[unlikely]] {
            evicted = std::move(buffer_[head_]);
        } else {
            ++count_;
        }

        buffer_[head_] = std::move(item);
        head_ = (head_ + 1) % buffer_.size();
        return evicted;
    }

    void clear() noexcept {
        head_ = 0;
        count_ = 0;
    }

    // ========================================================================
    // Consumer Interface
    // ========================================================================

    /**
     * Element by age: 0 is the newest
     */
    const T& at_newest(size_t age) const noexcept {
        return buffer_[index_of(age)];
    }

    T& at_newest(size_t age) noexcept {
        return buffer_[index_of(age)];
    }

    /**
     * Visit every element, newest first
     */
    template<typename Fn>
    void for_each_newest_first(Fn&& fn) const {
        for (size_t age = 0; age < count_; ++age) {
            fn(at_newest(age));
        }
    }

    /**
     * First element (newest first) matching the predicate
     */
    template<typename Pred>
    T* find_if(Pred&& pred) {
        for (size_t age = 0; age < count_; ++age) {
            T& item = at_newest(age);
            if (pred(item)) return &item;
        }
        return nullptr;
    }

    /**
     * Copy out up to limit elements, newest first (0 = all)
     */
    std::vector<T> snapshot(size_t limit = 0) const {
        const size_t n = (limit == 0 || limit > count_) ? count_ : limit;
        std::vector<T> out;
        out.reserve(n);
        for (size_t age = 0; age < n; ++age) {
            out.push_back(at_newest(age));
        }
        return out;
    }

    // ========================================================================
    // Capacity Queries
    // ========================================================================

    size_t size() const noexcept { return count_; }
    bool empty() const noexcept { return count_ == 0; }
    bool full() const noexcept { return count_ == buffer_.size(); }
    size_t capacity() const noexcept { return buffer_.size(); }

private:
    size_t index_of(size_t age) const noexcept {
        // head_ is the next write slot; the newest element sits just behind it
        return (head_ + buffer_.size() - 1 - age) % buffer_.size();
    }

    std::vector<T> buffer_;
    size_t head_;   // Next write slot
    size_t count_;  // Live elements
};

} // namespace fuse
