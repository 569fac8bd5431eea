/**
 * @file deadline.cpp
 * @brief DeadlineSignal implementation.
 * @author DeadlineGroup contributors
 */

#include "group/deadline.hpp"

#include <chrono>

namespace deadline_group {

DeadlineSignal::DeadlineSignal(Duration timeout, std::stop_token parent) {
    if (timeout > Duration::zero()) {
        // Saturate instead of overflowing the clock's representation.
        auto now = SteadyClock::now();
        auto headroom = std::chrono::duration_cast<Duration>(SteadyTime::max() - now);
        deadline_ = timeout < headroom ? now + timeout : SteadyTime::max();
    }
    if (parent.stop_possible()) {
        // Runs inline when the parent is already stopped.
        parent_link_.emplace(std::move(parent),
                             std::function<void()>([source = source_]() mutable {
                                 source.request_stop();
                             }));
    }
}

void DeadlineSignal::fire() noexcept {
    source_.request_stop();
}

bool DeadlineSignal::expired() noexcept {
    if (source_.stop_requested()) return true;
    if (deadline_ && SteadyClock::now() >= *deadline_) {
        source_.request_stop();
        return true;
    }
    return false;
}

}  // namespace deadline_group
