#pragma once

// Custom assert with stack trace
// Usage: REELPLAY_ASSERT(condition, "message with context")
// On failure: prints stack trace, message, file:line, then exits

#include <cstdlib>

#ifdef __cplusplus
extern "C" {
#endif

// Called on assert failure - prints stack trace and exits cleanly
void reelplay_assert_fail(const char* expr, const char* msg, const char* file, int line, const char* func);

// Install SIGABRT handler to catch standard assert() and abort()
// Call this early in main()
void reelplay_install_abort_handler();

#ifdef __cplusplus
}
#endif

// Always enabled: invariant checks on the playback state machine are cheap
#define REELPLAY_ASSERT(expr, msg) \
    do { \
        if (!(expr)) { \
            reelplay_assert_fail(#expr, msg, __FILE__, __LINE__, __func__); \
        } \
    } while (0)
