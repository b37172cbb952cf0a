#include "tgcast/session.hpp"

#include "tgcast/formatters.hpp"

#include <fmt/format.h>
#include <gtest/gtest.h>

#include <utility>

namespace tgcast {
namespace {

using namespace std::chrono_literals;

// Test session-level mutual exclusion
TEST(SessionManagerTest, SecondAcquireFails) {
    SessionManager manager;

    auto lease = manager.try_acquire(SessionMode::CYCLIC);
    ASSERT_TRUE(lease.has_value());
    EXPECT_TRUE(manager.is_active());
    EXPECT_EQ(lease->mode(), SessionMode::CYCLIC);

    EXPECT_FALSE(manager.try_acquire(SessionMode::SINGLE_TARGET).has_value());
}

TEST(SessionManagerTest, LeaseReleasesOnDestruction) {
    SessionManager manager;
    {
        auto lease = manager.try_acquire(SessionMode::SINGLE_TARGET);
        ASSERT_TRUE(lease.has_value());
    }
    EXPECT_FALSE(manager.is_active());
    EXPECT_TRUE(manager.try_acquire(SessionMode::SINGLE_TARGET).has_value());
}

TEST(SessionManagerTest, ExplicitReleaseIsIdempotent) {
    SessionManager manager;
    auto lease = manager.try_acquire(SessionMode::CYCLIC);
    ASSERT_TRUE(lease.has_value());

    lease->release();
    EXPECT_FALSE(manager.is_active());

    auto other = manager.try_acquire(SessionMode::CYCLIC);
    ASSERT_TRUE(other.has_value());

    // A second release of the old lease must not free the new one
    lease->release();
    EXPECT_TRUE(manager.is_active());
}

TEST(SessionManagerTest, MovedLeaseKeepsOwnership) {
    SessionManager manager;
    auto lease = manager.try_acquire(SessionMode::CYCLIC);
    ASSERT_TRUE(lease.has_value());

    auto moved = std::move(*lease);
    lease.reset();
    EXPECT_TRUE(manager.is_active());

    moved.release();
    EXPECT_FALSE(manager.is_active());
}

// Test session accounting
TEST(BroadcastSessionTest, RetrySuccessWithdrawsFailure) {
    BroadcastSession session(SessionMode::SINGLE_TARGET, Clock::time_point{}, 1s);

    session.begin_attempt();
    session.record_failure("rate limited");
    EXPECT_EQ(session.delivered() + session.failed(), session.attempts());

    session.withdraw_failure_after_retry();
    session.record_delivered();
    session.set_last_error({});

    EXPECT_EQ(session.attempts(), 1u);
    EXPECT_EQ(session.delivered(), 1u);
    EXPECT_EQ(session.failed(), 0u);
    EXPECT_TRUE(session.last_error().empty());
}

TEST(BroadcastSessionTest, SummariseDefaultsToCompleted) {
    auto start = Clock::time_point{} + 10s;
    BroadcastSession session(SessionMode::CYCLIC, start, 100ms);
    session.begin_sweep();
    session.begin_attempt();
    session.count_transport_call();
    session.record_delivered();

    auto summary = session.summarise(start + 2s);
    EXPECT_EQ(summary.stop_reason, StopReason::COMPLETED);
    EXPECT_EQ(summary.elapsed, Clock::duration(2s));
    EXPECT_EQ(summary.sweeps, 1u);
    EXPECT_EQ(summary.transport_calls, 1u);
    EXPECT_TRUE(summary.any_delivered());
}

TEST(BroadcastSessionTest, StopReasonIsKept) {
    BroadcastSession session(SessionMode::CYCLIC, Clock::time_point{}, 1s);
    EXPECT_FALSE(session.stopped());

    session.stop(StopReason::DEADLINE_EXPIRED);
    EXPECT_TRUE(session.stopped());
    EXPECT_EQ(session.summarise(Clock::time_point{}).stop_reason, StopReason::DEADLINE_EXPIRED);
}

// Test the final summary line
TEST(SessionSummaryTest, DescribeSingleTarget) {
    SessionSummary summary;
    summary.mode = SessionMode::SINGLE_TARGET;
    summary.elapsed = 2500ms;
    summary.attempts = 3;
    summary.planned = 3;
    summary.delivered = 2;
    summary.failed = 1;
    summary.last_error = "rejected: chat not found";

    EXPECT_EQ(
        summary.describe(), "Sending finished in 2.5s: 2/3 delivered, 1 failed. Last error: rejected: chat not found"
    );
}

TEST(SessionSummaryTest, DescribeCyclic) {
    SessionSummary summary;
    summary.mode = SessionMode::CYCLIC;
    summary.elapsed = 12s;
    summary.sweeps = 4;
    summary.attempts = 12;
    summary.delivered = 12;
    summary.rate_limit_waits = 1;

    EXPECT_EQ(
        summary.describe(),
        "Broadcast finished in 12.0s: 4 sweep(s), 12 attempt(s), 12 delivered, 0 failed, 1 rate-limit wait(s)"
    );
}

TEST(SessionSummaryTest, Formatters) {
    EXPECT_EQ(fmt::format("{}", StopReason::DEADLINE_EXPIRED), "deadline expired");
    EXPECT_EQ(fmt::format("{}", SessionMode::CYCLIC), "cyclic");
    EXPECT_EQ(fmt::format("{}", Severity::SUCCESS), "ok");
}

}  // namespace
}  // namespace tgcast
