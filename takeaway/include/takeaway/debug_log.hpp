#ifndef TAKEAWAY_DEBUG_LOG_HPP
#define TAKEAWAY_DEBUG_LOG_HPP

#include <cstdio>
#include <cstdarg>
#include <atomic>

namespace takeaway {
namespace debug {

// Callback function type for debug output routing
// The callback receives a formatted string (no newline at end)
using DebugCallback = void (*)(const char* message);

// Global debug callback - set by an embedding application or a test
// When null, TAKEAWAY_DEBUG_LOG uses printf
inline std::atomic<DebugCallback> g_debug_callback{nullptr};

inline void set_debug_callback(DebugCallback cb) {
    g_debug_callback.store(cb, std::memory_order_release);
}

inline void clear_debug_callback() {
    g_debug_callback.store(nullptr, std::memory_order_release);
}

// Internal: format and output debug message
inline void debug_output(const char* fmt, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    char full_message[1100];
    snprintf(full_message, sizeof(full_message), "[DEBUG] %s", buffer);

    DebugCallback cb = g_debug_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(full_message);
    } else {
        printf("%s\n", full_message);
        fflush(stdout);
    }
}

} // namespace debug
} // namespace takeaway

// Debug logging macro - routes to callback if set, otherwise printf
#ifdef TAKEAWAY_ENABLE_DEBUG_OUTPUT
    #define TAKEAWAY_DEBUG_LOG(fmt, ...) ::takeaway::debug::debug_output(fmt, ##__VA_ARGS__)
#else
    #define TAKEAWAY_DEBUG_LOG(fmt, ...) ((void)0)
#endif

#endif // TAKEAWAY_DEBUG_LOG_HPP
