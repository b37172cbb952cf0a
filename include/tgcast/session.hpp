#pragma once

#include "tgcast/clock.hpp"

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>

namespace tgcast {

enum class SessionMode {
    SINGLE_TARGET,  // Fixed number of copies to one recipient
    CYCLIC          // Repeated sweeps over all known recipients until a deadline
};

enum class StopReason {
    COMPLETED,           // All iterations ran
    DEADLINE_EXPIRED,    // Cyclic deadline reached
    FATAL_CREDENTIAL,    // Token became invalid
    ABORTED,             // Unexpected internal error
    REJECTED_INPUT,      // Request failed validation, nothing was sent
    BUSY                 // Another session was already running
};

/// Immutable result of one session
struct SessionSummary {
    SessionMode mode{SessionMode::SINGLE_TARGET};
    StopReason stop_reason{StopReason::COMPLETED};
    Clock::duration elapsed{};
    std::size_t attempts{0};
    std::size_t delivered{0};
    std::size_t failed{0};
    std::size_t rate_limit_waits{0};
    std::size_t transport_calls{0};  // Includes retries after a rate limit
    std::size_t sweeps{0};           // Cyclic mode only
    std::size_t planned{0};          // Single-target mode: requested count
    std::string last_error;

    [[nodiscard]] bool any_delivered() const { return delivered > 0; }

    /// Final summary line: elapsed time, counters and the last error
    [[nodiscard]] std::string describe() const;
};

/// Transient state of one run of a dispatch loop
///
/// Owned and mutated only by the running loop. A rate-limited attempt and
/// its single retry count as one attempt: the failure is recorded up front
/// and withdrawn if the retry succeeds, keeping delivered + failed == attempts.
class BroadcastSession {
public:
    BroadcastSession(SessionMode mode, Clock::time_point started_at, Clock::duration delay);

    [[nodiscard]] SessionMode mode() const { return mode_; }
    [[nodiscard]] Clock::time_point started_at() const { return started_at_; }
    [[nodiscard]] Clock::duration delay() const { return delay_; }

    [[nodiscard]] const std::optional<Clock::time_point>& deadline() const { return deadline_; }
    void set_deadline(Clock::time_point deadline) { deadline_ = deadline; }

    void begin_attempt();
    void count_transport_call() { ++transport_calls_; }
    void record_delivered();
    void record_failure(std::string error);
    void withdraw_failure_after_retry();
    void record_rate_limit_wait() { ++rate_limit_waits_; }
    void begin_sweep() { ++sweeps_; }
    void set_last_error(std::string error) { last_error_ = std::move(error); }
    void set_planned(std::size_t planned) { planned_ = planned; }

    void stop(StopReason reason) { stop_reason_ = reason; }
    [[nodiscard]] const std::optional<StopReason>& stop_reason() const { return stop_reason_; }
    [[nodiscard]] bool stopped() const { return stop_reason_.has_value(); }

    [[nodiscard]] std::size_t attempts() const { return attempts_; }
    [[nodiscard]] std::size_t delivered() const { return delivered_; }
    [[nodiscard]] std::size_t failed() const { return failed_; }
    [[nodiscard]] const std::string& last_error() const { return last_error_; }

    /// Freeze the session into a summary; an unset stop reason means COMPLETED
    [[nodiscard]] SessionSummary summarise(Clock::time_point now) const;

private:
    SessionMode mode_;
    Clock::time_point started_at_;
    Clock::duration delay_;
    std::optional<Clock::time_point> deadline_;

    std::size_t attempts_{0};
    std::size_t delivered_{0};
    std::size_t failed_{0};
    std::size_t rate_limit_waits_{0};
    std::size_t transport_calls_{0};
    std::size_t sweeps_{0};
    std::size_t planned_{0};
    std::string last_error_;
    std::optional<StopReason> stop_reason_;
};

class SessionManager;

/// Proof of exclusive access to the transport; released on destruction
class SessionLease {
public:
    SessionLease(SessionLease&& other) noexcept;
    SessionLease& operator=(SessionLease&& other) noexcept;
    ~SessionLease();

    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;

    [[nodiscard]] SessionMode mode() const { return mode_; }

    void release();

private:
    friend class SessionManager;
    SessionLease(SessionManager* manager, SessionMode mode) : manager_(manager), mode_(mode) {}

    SessionManager* manager_;
    SessionMode mode_;
};

/// Guarantees at most one broadcast session at a time
class SessionManager {
public:
    SessionManager() = default;

    // Disable copy
    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /// @return a lease, or nullopt if a session is already active
    [[nodiscard]] std::optional<SessionLease> try_acquire(SessionMode mode);

    [[nodiscard]] bool is_active() const { return active_.load(); }

private:
    friend class SessionLease;
    void release();

    std::atomic<bool> active_{false};
};

}  // namespace tgcast
