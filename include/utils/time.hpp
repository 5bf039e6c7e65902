#pragma once

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <string>

namespace NewsCube {

/**
 * @brief Steady-clock stopwatch used for batch and run timing.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    void reset() {
        start_ = Clock::now();
    }

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

    double elapsed_sec() const {
        return elapsed_ms() / 1000.0;
    }

    /**
     * @brief Items per second since construction (0 when no time has passed).
     */
    double rate(size_t items) const {
        double sec = elapsed_sec();
        return sec > 0.0 ? static_cast<double>(items) / sec : 0.0;
    }

private:
    TimePoint start_;
};

/**
 * @brief "850 ms", "12.40 s" or "3m 07s" for run summaries.
 */
inline std::string format_elapsed(double sec) {
    char buf[32];
    if (sec < 1.0) {
        std::snprintf(buf, sizeof(buf), "%.0f ms", sec * 1000.0);
    } else if (sec < 60.0) {
        std::snprintf(buf, sizeof(buf), "%.2f s", sec);
    } else {
        long total = static_cast<long>(sec);
        std::snprintf(buf, sizeof(buf), "%ldm %02lds", total / 60, total % 60);
    }
    return buf;
}

} // namespace NewsCube
