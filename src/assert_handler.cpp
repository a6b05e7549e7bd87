// Assert handler with stack trace support

#include "assert_handler.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <signal.h>

#if defined(__APPLE__) || defined(__GLIBC__)
#define REELPLAY_HAS_BACKTRACE 1
#include <execinfo.h>
#include <cxxabi.h>
#endif

// Flag to prevent recursive abort handling
static volatile sig_atomic_t g_handling_abort = 0;

#ifdef REELPLAY_HAS_BACKTRACE
// Demangle the mangled name embedded in a backtrace_symbols() line.
// macOS:  "1  libfoo.dylib  0x123  _ZN3Foo3barEv + 42"
// glibc:  "./reelplay(_ZN3Foo3barEv+0x2a) [0x55d0c]"
static const char* demangle(const char* symbol, char* buffer, size_t bufsize) {
    const char* start = strstr(symbol, "_Z");
    if (!start) return symbol;

    const char* end = start;
    while (*end && *end != ' ' && *end != '+' && *end != ')') end++;

    size_t len = end - start;
    char mangled[256];
    if (len >= sizeof(mangled) || len >= bufsize) return symbol;
    memcpy(mangled, start, len);
    mangled[len] = '\0';

    int status = 0;
    size_t outlen = bufsize;
    char* demangled = abi::__cxa_demangle(mangled, buffer, &outlen, &status);
    if (status == 0 && demangled) {
        return demangled;
    }
    return symbol;
}
#endif

// Print stack trace, skipping the handler frames
static void print_stack_trace(bool demangle_names) {
#ifdef REELPLAY_HAS_BACKTRACE
    fprintf(stderr, "Stack trace:\n");
    fprintf(stderr, "─────────────────────────────────────────────────────────────────\n");

    void* callstack[64];
    int frames = backtrace(callstack, 64);
    char** symbols = backtrace_symbols(callstack, frames);

    if (symbols) {
        char demangled_buf[512];
        for (int i = 2; i < frames; i++) {
            const char* name = demangle_names
                ? demangle(symbols[i], demangled_buf, sizeof(demangled_buf))
                : symbols[i];
            fprintf(stderr, "  [%2d] %s\n", i - 2, name);
        }
        free(symbols);
    } else {
        fprintf(stderr, "  (unable to get stack trace)\n");
    }
    fprintf(stderr, "─────────────────────────────────────────────────────────────────\n");
#else
    (void)demangle_names;
    fprintf(stderr, "  (stack trace not available on this platform)\n");
#endif
}

void reelplay_assert_fail(const char* expr, const char* msg, const char* file, int line, const char* func) {
    fprintf(stderr, "\n");
    fprintf(stderr, "╔══════════════════════════════════════════════════════════════╗\n");
    fprintf(stderr, "║                      ASSERTION FAILED                        ║\n");
    fprintf(stderr, "╚══════════════════════════════════════════════════════════════╝\n");
    fprintf(stderr, "\n");
    fprintf(stderr, "  Expression: %s\n", expr);
    fprintf(stderr, "  Message:    %s\n", msg);
    fprintf(stderr, "  Location:   %s:%d\n", file, line);
    fprintf(stderr, "  Function:   %s\n", func);
    fprintf(stderr, "\n");

    print_stack_trace(true);

    fprintf(stderr, "\n");
    fflush(stderr);

    // Clean exit instead of abort() - avoids OS crash dialogs
    _exit(134);  // 134 = 128 + SIGABRT(6), mimics abort exit code
}

// SIGABRT handler - catches abort() from standard assert() and other sources
static void sigabrt_handler(int sig) {
    (void)sig;

    // Prevent recursive handling
    if (g_handling_abort) {
        _exit(134);
    }
    g_handling_abort = 1;

    fprintf(stderr, "\n");
    fprintf(stderr, "╔══════════════════════════════════════════════════════════════╗\n");
    fprintf(stderr, "║                      ABORT CAUGHT                            ║\n");
    fprintf(stderr, "╚══════════════════════════════════════════════════════════════╝\n");
    fprintf(stderr, "\n");
    fprintf(stderr, "  A standard assert() or abort() was triggered.\n");
    fprintf(stderr, "  (Use REELPLAY_ASSERT for better diagnostics)\n");
    fprintf(stderr, "\n");

    print_stack_trace(false);

    fprintf(stderr, "\n");
    fflush(stderr);

    _exit(134);
}

// Install the SIGABRT handler - call early in main()
void reelplay_install_abort_handler() {
    struct sigaction sa;
    sa.sa_handler = sigabrt_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGABRT, &sa, nullptr);
}
