/**
 * @file debouncer.hpp
 * @brief Cancellable delayed tasks and out-of-order response filtering.
 */

#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

namespace commute {

/**
 * @brief Runs only the last task submitted within a quiet period.
 *
 * Each submit() replaces the pending task and restarts the quiet period.
 * Timer work is serialized on a strand of the given io_context; submit()
 * and cancel() may be called from any thread. Pending handlers share the
 * timer state, so destroying the debouncer drops its pending task; the
 * io_context itself must outlive the debouncer.
 */
class Debouncer {
public:
    Debouncer(boost::asio::io_context& io, std::chrono::milliseconds quiet_period);
    ~Debouncer();

    Debouncer(const Debouncer&) = delete;
    Debouncer& operator=(const Debouncer&) = delete;

    void submit(std::function<void()> task);

    /**
     * @brief Drop the pending task, if any.
     */
    void cancel();

    std::chrono::milliseconds quiet_period() const { return state_->quiet_period; }

private:
    struct State {
        State(boost::asio::io_context& io, std::chrono::milliseconds quiet);

        boost::asio::strand<boost::asio::io_context::executor_type> strand;
        boost::asio::steady_timer timer;
        std::chrono::milliseconds quiet_period;
        // Bumped by every submit/cancel and on destruction; a handler whose
        // generation is stale must not run even if its timer already expired.
        std::atomic<uint64_t> generation{0};
    };

    static void arm(const std::shared_ptr<State>& state, uint64_t generation, std::function<void()> task);

    std::shared_ptr<State> state_;
};

/**
 * @brief Accepts gateway responses only in increasing sequence order.
 */
class ResponseOrderGuard {
public:
    /**
     * @return true if sequence is newer than every previously accepted one
     */
    bool accept(uint64_t sequence);

    uint64_t last_accepted() const;

private:
    mutable std::mutex mutex_;
    uint64_t last_accepted_ = 0;
};

}  // namespace commute
