#pragma once

#include "tgcast/constants.hpp"

#include <chrono>

namespace tgcast {

/// Source of time for the dispatch loops
///
/// The loops only ever suspend through sleep_for(), so a manual clock
/// makes them fully deterministic.
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;

    [[nodiscard]] virtual time_point now() const = 0;
    virtual void sleep_for(duration d) = 0;
};

/// Wall clock on std::chrono::steady_clock
class SteadyClock : public Clock {
public:
    [[nodiscard]] time_point now() const override;
    void sleep_for(duration d) override;
};

enum class WaitResult { COMPLETED, DEADLINE_EXPIRED };

/// Wait for `wait`, polling the deadline every `granularity`
///
/// Returns DEADLINE_EXPIRED as soon as a poll observes `deadline`, so expiry
/// is detected within one granularity step instead of at the end of the wait.
WaitResult interruptible_wait(
    Clock& clock,
    Clock::duration wait,
    Clock::time_point deadline,
    Clock::duration granularity = kDeadlinePollInterval
);

/// Convert fractional seconds to the clock's duration
template <typename Rep, typename Period>
Clock::duration to_clock_duration(std::chrono::duration<Rep, Period> d) {
    return std::chrono::duration_cast<Clock::duration>(d);
}

}  // namespace tgcast
