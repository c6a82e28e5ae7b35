// XRFrame Platform
// timer.hpp - Steady-clock stopwatch

#pragma once

#include <chrono>

namespace xrframe::platform {

// Simple stopwatch timer using steady_clock
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::nanoseconds;

    Timer();

    // Reset the timer to zero
    void reset();

    // Get elapsed time since timer creation/reset
    [[nodiscard]] Duration elapsed() const;
    [[nodiscard]] double elapsed_seconds() const;
    [[nodiscard]] double elapsed_milliseconds() const;
    [[nodiscard]] double elapsed_microseconds() const;

private:
    TimePoint start_time_;
};

}  // namespace xrframe::platform
