// XRFrame Platform
// timer.cpp - Timer implementation

#include <xrframe/platform/timer.hpp>

namespace xrframe::platform {

Timer::Timer() : start_time_(Clock::now()) {}

void Timer::reset() {
    start_time_ = Clock::now();
}

Timer::Duration Timer::elapsed() const {
    return std::chrono::duration_cast<Duration>(Clock::now() - start_time_);
}

double Timer::elapsed_seconds() const {
    return std::chrono::duration<double>(elapsed()).count();
}

double Timer::elapsed_milliseconds() const {
    return std::chrono::duration<double, std::milli>(elapsed()).count();
}

double Timer::elapsed_microseconds() const {
    return std::chrono::duration<double, std::micro>(elapsed()).count();
}

}  // namespace xrframe::platform
