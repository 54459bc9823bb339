#ifndef CHAINLIST_DEBUG_LOG_HPP
#define CHAINLIST_DEBUG_LOG_HPP

#include <atomic>
#include <cstdarg>
#include <cstddef>
#include <cstdio>

namespace chainlist {
namespace debug {

// A sink for trace lines. Lines arrive without a trailing newline.
using DebugCallback = void (*)(const char* message);

// The installed sink. Null means stdout.
inline std::atomic<DebugCallback> g_debug_callback{nullptr};

inline void set_debug_callback(DebugCallback cb) {
    g_debug_callback.store(cb, std::memory_order_release);
}

inline void clear_debug_callback() {
    g_debug_callback.store(nullptr, std::memory_order_release);
}

// Lines look like "[chainlist] LinkedList::pop on empty list"
inline void debug_output(const char* fmt, ...) {
    char line[512];
    int prefix = snprintf(line, sizeof(line), "[chainlist] ");

    va_list args;
    va_start(args, fmt);
    vsnprintf(line + prefix, sizeof(line) - static_cast<std::size_t>(prefix), fmt, args);
    va_end(args);

    DebugCallback cb = g_debug_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(line);
    } else {
        printf("%s\n", line);
        fflush(stdout);
    }
}

} // namespace debug
} // namespace chainlist

// Expands to nothing unless CHAINLIST_ENABLE_DEBUG_OUTPUT is defined.
// List and array failure paths trace through this macro.
#ifdef CHAINLIST_ENABLE_DEBUG_OUTPUT
    #define CHAINLIST_DEBUG_LOG(fmt, ...) ::chainlist::debug::debug_output(fmt, ##__VA_ARGS__)
#else
    #define CHAINLIST_DEBUG_LOG(fmt, ...) ((void)0)
#endif

#endif // CHAINLIST_DEBUG_LOG_HPP
