#pragma once

// Simple logging - check RMP_LOG_LEVEL env var at runtime
// 0=none (default), 1=warn, 2=debug

#include <cstdio>
#include <cstdlib>

namespace rmp {
namespace impl {

// Read once; probes log from validation worker threads
inline int rmp_log_level() {
    static const int level = [] {
        const char* env = std::getenv("RMP_LOG_LEVEL");
        return env ? std::atoi(env) : 0;
    }();
    return level;
}

} // namespace impl
} // namespace rmp

#define RMP_LOG_WARN(...) do { if (rmp::impl::rmp_log_level() >= 1) { fprintf(stderr, "[RMP WARN] "); fprintf(stderr, __VA_ARGS__); fprintf(stderr, "\n"); } } while(0)
#define RMP_LOG_DEBUG(...) do { if (rmp::impl::rmp_log_level() >= 2) { fprintf(stderr, "[RMP] "); fprintf(stderr, __VA_ARGS__); fprintf(stderr, "\n"); } } while(0)
