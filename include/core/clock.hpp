#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace gv {

/**
 * @brief Source of time for expiry, timeouts and render timestamps
 *
 * Components take a Clock& so tests can drive time by hand.
 */
class Clock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;

    /**
     * @brief Milliseconds since the clock's epoch
     */
    int64_t now_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now().time_since_epoch()
        ).count();
    }
};

/**
 * @brief Wall-time clock backed by std::chrono::steady_clock
 */
class SteadyClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::steady_clock::now(); }

    /**
     * @brief Process-wide instance for callers that don't inject one
     */
    static SteadyClock& instance() {
        static SteadyClock clock;
        return clock;
    }
};

/**
 * @brief Clock that only moves when told to
 */
class ManualClock : public Clock {
public:
    ManualClock() = default;

    TimePoint now() const override {
        return TimePoint(std::chrono::nanoseconds(nanos_.load()));
    }

    template<typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> d) {
        nanos_ += std::chrono::duration_cast<std::chrono::nanoseconds>(d).count();
    }

private:
    // Starts well past zero so "time_point{}" never looks recent
    std::atomic<int64_t> nanos_{std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::hours(1)).count()};
};

} // namespace gv
