/**
 * @file rate_limiter.hpp
 * @brief Injectable clock and the shared call-to-call throttle.
 */

#pragma once

#include <chrono>
#include <mutex>
#include <optional>

namespace commute {

/**
 * @brief Time source used by the throttle. Tests substitute a fake.
 */
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
    virtual void sleep_for(duration d) = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() const override;
    void sleep_for(duration d) override;
};

/**
 * @brief One "time of last outbound call" shared by every gateway operation.
 *
 * acquire() blocks until at least min_interval has passed since the
 * previous acquire() of any kind, then records the new call time. The
 * mutex is held across the sleep so concurrent callers are serialized.
 */
class RateLimiter {
public:
    explicit RateLimiter(Clock& clock) : clock_(clock) {}

    /**
     * @return Time spent sleeping before the call was allowed
     */
    Clock::duration acquire(std::chrono::milliseconds min_interval);

    std::optional<Clock::time_point> last_call() const;

private:
    Clock& clock_;
    mutable std::mutex mutex_;
    std::optional<Clock::time_point> last_call_;
};

}  // namespace commute
