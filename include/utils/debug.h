#pragma once

// Diagnostics for scans. Compiled in only with LQV_ENABLE_DEBUG and printed
// to stderr only while LQV_DEBUG=1.

#ifdef LQV_ENABLE_DEBUG

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <chrono>

static inline int lqv_debug_enabled(void) {
    const char* value = getenv("LQV_DEBUG");
    return value != NULL && value[0] == '1' && value[1] == '\0';
}

static inline void debug_msg(const char* fmt, ...) {
    if (!lqv_debug_enabled()) {
        return;
    }

    va_list args;
    va_start(args, fmt);
    fputs("[lqvars] ", stderr);
    vfprintf(stderr, fmt, args);
    va_end(args);
    fputc('\n', stderr);
    fflush(stderr);
}

// Logs the lifetime of the enclosing scope under label.
class PerformanceTracker {
   public:
    explicit PerformanceTracker(const char* label)
        : label_(label), start_time_(std::chrono::steady_clock::now()) {
    }

    ~PerformanceTracker() {
        auto elapsed = std::chrono::steady_clock::now() - start_time_;
        double milliseconds =
            std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count() / 1000.0;
        debug_msg("%s took %.3f ms", label_, milliseconds);
    }

   private:
    const char* label_;
    std::chrono::steady_clock::time_point start_time_;
};

#else

static inline void debug_msg(const char* fmt, ...) {
    (void)fmt;
}

class PerformanceTracker {
   public:
    explicit PerformanceTracker(const char* label) {
        (void)label;
    }
};

#endif
