/**
 * @file rate_limiter.cpp
 * @brief Throttle implementation.
 */

#include "rate_limiter.hpp"

#include <thread>

namespace commute {

Clock::time_point SteadyClock::now() const {
    return std::chrono::steady_clock::now();
}

void SteadyClock::sleep_for(duration d) {
    std::this_thread::sleep_for(d);
}

Clock::duration RateLimiter::acquire(std::chrono::milliseconds min_interval) {
    std::lock_guard<std::mutex> lock(mutex_);

    Clock::duration waited = Clock::duration::zero();
    if (last_call_) {
        Clock::duration elapsed = clock_.now() - *last_call_;
        if (elapsed < min_interval) {
            waited = min_interval - elapsed;
            clock_.sleep_for(waited);
        }
    }
    last_call_ = clock_.now();
    return waited;
}

std::optional<Clock::time_point> RateLimiter::last_call() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_call_;
}

}  // namespace commute
