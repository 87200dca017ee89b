#pragma once

#include <chrono>
#include <functional>
#include <thread>

namespace runscope::resilience {

using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::steady_clock::duration;

// Injectable time sources so waits can be simulated in tests.
using ClockFn = std::function<TimePoint()>;
using SleepFn = std::function<void(Duration)>;

inline auto SteadyNow() -> TimePoint {
    return std::chrono::steady_clock::now();
}

inline void ThreadSleep(Duration d) {
    std::this_thread::sleep_for(d);
}

inline auto ToMillis(Duration d) -> double {
    return std::chrono::duration<double, std::milli>(d).count();
}

} // namespace runscope::resilience
