#pragma once

#include <chrono>
#include <string>

namespace tg {
class TelegramException;
}

namespace tgcast {

enum class OutcomeKind {
    DELIVERED,           // Accepted by the transport
    RATE_LIMITED,        // Caller must wait retry_after before trying again
    INVALID_CREDENTIAL,  // Token no longer valid, fatal for the session
    REJECTED,            // Bad recipient, malformed content, no permission
    TRANSPORT_FAILURE    // Network or transport-level failure
};

/// Classified result of one delivery attempt
struct DispatchOutcome {
    OutcomeKind kind{OutcomeKind::DELIVERED};
    std::chrono::milliseconds retry_after{0};  // Only meaningful for RATE_LIMITED
    std::string reason;                        // Empty for DELIVERED

    static DispatchOutcome delivered() { return {}; }

    static DispatchOutcome rate_limited(std::chrono::milliseconds retry_after) {
        return {OutcomeKind::RATE_LIMITED, retry_after, "rate limit exceeded"};
    }

    static DispatchOutcome invalid_credential(std::string reason = "bot token is no longer valid") {
        return {OutcomeKind::INVALID_CREDENTIAL, {}, std::move(reason)};
    }

    static DispatchOutcome rejected(std::string reason) { return {OutcomeKind::REJECTED, {}, std::move(reason)}; }

    static DispatchOutcome transport_failure(std::string reason) {
        return {OutcomeKind::TRANSPORT_FAILURE, {}, std::move(reason)};
    }

    [[nodiscard]] bool is_delivered() const { return kind == OutcomeKind::DELIVERED; }
    [[nodiscard]] bool is_rate_limited() const { return kind == OutcomeKind::RATE_LIMITED; }
    [[nodiscard]] bool is_fatal() const { return kind == OutcomeKind::INVALID_CREDENTIAL; }

    /// Human-readable failure text, e.g. "rate limited, retry after 5.0s"
    [[nodiscard]] std::string describe() const;
};

/// Map an exception from the Telegram binding onto exactly one outcome
DispatchOutcome classify_exception(const tg::TelegramException& error);

}  // namespace tgcast
