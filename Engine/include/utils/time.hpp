/**
 * @file time.hpp
 * @brief Audit timestamps and elapsed-time measurement
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace Meisai {

using WallClock = std::chrono::system_clock;
using Timestamp = WallClock::time_point;

inline Timestamp now() {
    return WallClock::now();
}

// Timestamps are persisted as milliseconds since the Unix epoch.
inline int64_t to_unix_ms(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

inline Timestamp from_unix_ms(int64_t ms) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(ms)));
}

/**
 * @brief Monotonic stopwatch started at construction.
 */
class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
    }

    double elapsed_sec() const { return elapsed_ms() / 1000.0; }

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace Meisai
