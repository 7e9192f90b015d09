/**
 * @file debouncer.cpp
 * @brief Debouncer implementation on Boost.Asio timers.
 */

#include "debouncer.hpp"

#include <boost/asio/post.hpp>

namespace commute {

Debouncer::State::State(boost::asio::io_context& io, std::chrono::milliseconds quiet)
    : strand(boost::asio::make_strand(io)),
      timer(strand),
      quiet_period(quiet) {}

Debouncer::Debouncer(boost::asio::io_context& io, std::chrono::milliseconds quiet_period)
    : state_(std::make_shared<State>(io, quiet_period)) {}

Debouncer::~Debouncer() {
    // Queued handlers keep the state alive and see a stale generation
    ++state_->generation;
    auto state = state_;
    boost::asio::post(state->strand, [state] { state->timer.cancel(); });
}

void Debouncer::submit(std::function<void()> task) {
    uint64_t generation = ++state_->generation;
    auto state = state_;
    boost::asio::post(state->strand, [state, generation, task = std::move(task)]() mutable {
        arm(state, generation, std::move(task));
    });
}

void Debouncer::cancel() {
    ++state_->generation;
    auto state = state_;
    boost::asio::post(state->strand, [state] { state->timer.cancel(); });
}

void Debouncer::arm(const std::shared_ptr<State>& state, uint64_t generation, std::function<void()> task) {
    if (generation != state->generation.load()) return;

    // expires_after() aborts the previous wait
    state->timer.expires_after(state->quiet_period);
    state->timer.async_wait([state, generation, task = std::move(task)](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        if (generation != state->generation.load()) return;
        task();
    });
}

bool ResponseOrderGuard::accept(uint64_t sequence) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sequence <= last_accepted_) return false;
    last_accepted_ = sequence;
    return true;
}

uint64_t ResponseOrderGuard::last_accepted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_accepted_;
}

}  // namespace commute
