#pragma once

/**
 * FUSE Console Log
 * One line per event: "[COMPONENT] LEVEL message"
 *
 * Usage:
 *   log::warn("BRK") << "Panel not found: " << panel_id;
 *
 * The line is emitted when the temporary writer is destroyed, under a
 * process-wide mutex so lines from the timer thread never interleave.
 */

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string_view>
#include "compiler.hpp"

namespace fuse {
namespace log {

enum class Level : int {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4
};

inline const char* to_string(Level level) noexcept {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO";
        case Level::WARN:  return "WARN";
        case Level::ERROR: return "ERROR";
        case Level::OFF:   return "OFF";
    }
    FUSE_UNREACHABLE();
    return "";
}

namespace detail {

inline std::atomic<Level>& min_level() noexcept {
    static std::atomic<Level> level{Level::INFO};
    return level;
}

inline std::mutex& output_mutex() noexcept {
    static std::mutex mutex;
    return mutex;
}

} // namespace detail

inline void set_level(Level level) noexcept {
    detail::min_level().store(level, std::memory_order_relaxed);
}

inline Level get_level() noexcept {
    return detail::min_level().load(std::memory_order_relaxed);
}

inline bool is_enabled(Level level) noexcept {
    return static_cast<int>(level) >= static_cast<int>(get_level());
}

/**
 * Line writer, flushed on destruction
 */
class Line {
public:
    Line(Level level, std::string_view component)
        : enabled_(is_enabled(level)) {
        if (enabled_) {
            stream_ << '[' << component << "] " << to_string(level) << ' ';
        }
    }

    ~Line() {
        if (enabled_) {
            std::lock_guard<std::mutex> lock(detail::output_mutex());
            std::cout << stream_.str() << std::endl;
        }
    }

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;

    template<typename T>
    Line& operator<<(const T& value) {
        if (enabled_) stream_ << value;
        return *this;
    }

private:
    bool enabled_;
    std::ostringstream stream_;
};

inline Line debug(std::string_view component) { return Line(Level::DEBUG, component); }
inline Line info(std::string_view component)  { return Line(Level::INFO, component); }
inline Line warn(std::string_view component)  { return Line(Level::WARN, component); }
inline Line error(std::string_view component) { return Line(Level::ERROR, component); }

} // namespace log
} // namespace fuse
