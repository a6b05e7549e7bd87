#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>

namespace rmp {

// Internal canonical time unit: microseconds since stream start
using TimeUS = int64_t;

// Monotonic clock used for every deadline in the pipeline
using Clock = std::chrono::steady_clock;
using Deadline = Clock::time_point;

// Minimum duration a resource must exceed to be considered playable
constexpr double MIN_PLAYABLE_DURATION_SECONDS = 0.01;

// Durations at or above this are corrupt metadata; it also keeps
// seconds_to_us() well inside the TimeUS range (~9.2e12 s)
constexpr double MAX_PLAYABLE_DURATION_SECONDS = 1.0e12;

inline double us_to_seconds(TimeUS us) {
    return static_cast<double>(us) / 1000000.0;
}

// Caller must pass a finite value below MAX_PLAYABLE_DURATION_SECONDS
inline TimeUS seconds_to_us(double seconds) {
    return static_cast<TimeUS>(std::llround(seconds * 1000000.0));
}

inline Deadline deadline_after(std::chrono::milliseconds timeout) {
    return Clock::now() + timeout;
}

inline bool deadline_passed(Deadline deadline) {
    return Clock::now() >= deadline;
}

} // namespace rmp
