#include "tgcast/session.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>

namespace tgcast {

std::string SessionSummary::describe() const {
    auto seconds = std::chrono::duration<double>(elapsed).count();
    std::string line;
    if (mode == SessionMode::CYCLIC) {
        line = fmt::format(
            "Broadcast finished in {:.1f}s: {} sweep(s), {} attempt(s), {} delivered, {} failed",
            seconds,
            sweeps,
            attempts,
            delivered,
            failed
        );
    } else {
        line = fmt::format(
            "Sending finished in {:.1f}s: {}/{} delivered, {} failed", seconds, delivered, planned, failed
        );
    }
    if (rate_limit_waits > 0) {
        line += fmt::format(", {} rate-limit wait(s)", rate_limit_waits);
    }
    if (!last_error.empty()) {
        line += fmt::format(". Last error: {}", last_error);
    }
    return line;
}

BroadcastSession::BroadcastSession(SessionMode mode, Clock::time_point started_at, Clock::duration delay)
    : mode_(mode), started_at_(started_at), delay_(delay) {}

void BroadcastSession::begin_attempt() { ++attempts_; }

void BroadcastSession::record_delivered() { ++delivered_; }

void BroadcastSession::record_failure(std::string error) {
    ++failed_;
    last_error_ = std::move(error);
}

void BroadcastSession::withdraw_failure_after_retry() {
    if (failed_ > 0) {
        --failed_;
    }
}

SessionSummary BroadcastSession::summarise(Clock::time_point now) const {
    return SessionSummary{
        .mode = mode_,
        .stop_reason = stop_reason_.value_or(StopReason::COMPLETED),
        .elapsed = now - started_at_,
        .attempts = attempts_,
        .delivered = delivered_,
        .failed = failed_,
        .rate_limit_waits = rate_limit_waits_,
        .transport_calls = transport_calls_,
        .sweeps = sweeps_,
        .planned = planned_,
        .last_error = last_error_,
    };
}

SessionLease::SessionLease(SessionLease&& other) noexcept : manager_(other.manager_), mode_(other.mode_) {
    other.manager_ = nullptr;
}

SessionLease& SessionLease::operator=(SessionLease&& other) noexcept {
    if (this != &other) {
        release();
        manager_ = other.manager_;
        mode_ = other.mode_;
        other.manager_ = nullptr;
    }
    return *this;
}

SessionLease::~SessionLease() { release(); }

void SessionLease::release() {
    if (manager_) {
        manager_->release();
        manager_ = nullptr;
    }
}

std::optional<SessionLease> SessionManager::try_acquire(SessionMode mode) {
    if (active_.exchange(true)) {
        spdlog::debug("Session requested while another one is active");
        return std::nullopt;
    }
    return SessionLease(this, mode);
}

void SessionManager::release() { active_.store(false); }

}  // namespace tgcast
