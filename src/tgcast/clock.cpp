#include "tgcast/clock.hpp"

#include <algorithm>
#include <thread>

namespace tgcast {

Clock::time_point SteadyClock::now() const { return std::chrono::steady_clock::now(); }

void SteadyClock::sleep_for(duration d) {
    if (d > duration::zero()) {
        std::this_thread::sleep_for(d);
    }
}

WaitResult interruptible_wait(
    Clock& clock,
    Clock::duration wait,
    Clock::time_point deadline,
    Clock::duration granularity
) {
    if (granularity <= Clock::duration::zero()) {
        granularity = kDeadlinePollInterval;
    }

    const auto until = clock.now() + wait;

    while (true) {
        auto now = clock.now();
        if (now >= until) {
            return WaitResult::COMPLETED;
        }
        if (now >= deadline) {
            return WaitResult::DEADLINE_EXPIRED;
        }
        clock.sleep_for(std::min({granularity, until - now, deadline - now}));
    }
}

}  // namespace tgcast
