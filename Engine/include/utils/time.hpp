#pragma once

#include <chrono>
#include <ctime>
#include <string>

namespace Russell {

/**
 * @brief High-resolution timer and wall-clock helpers.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    void reset() {
        start_ = Clock::now();
    }

    /**
     * @brief Elapsed milliseconds (fractional) since last reset or construction.
     */
    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

    double elapsed_sec() const {
        return elapsed_ms() / 1000.0;
    }

    /**
     * @brief Seconds since the Unix epoch, fractional.
     *
     * Used for record timestamps only; never part of a content hash.
     */
    static double unix_seconds() {
        auto now = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration<double>(now).count();
    }

    /**
     * @brief Current UTC time as ISO-8601 ("2026-01-31T12:00:00Z").
     */
    static std::string iso8601_utc() {
        std::time_t t = std::time(nullptr);
        std::tm tm{};
        gmtime_r(&t, &tm);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
        return buf;
    }

private:
    TimePoint start_;
};

} // namespace Russell
