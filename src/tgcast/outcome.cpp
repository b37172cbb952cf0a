#include "tgcast/outcome.hpp"

#include "tg/exceptions.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace tgcast {

std::string DispatchOutcome::describe() const {
    switch (kind) {
        case OutcomeKind::DELIVERED:
            return "delivered";
        case OutcomeKind::RATE_LIMITED:
            return fmt::format(
                "rate limited, retry after {:.1f}s", std::chrono::duration<double>(retry_after).count()
            );
        case OutcomeKind::INVALID_CREDENTIAL:
            return fmt::format("invalid credential: {}", reason);
        case OutcomeKind::REJECTED:
            return fmt::format("rejected: {}", reason);
        case OutcomeKind::TRANSPORT_FAILURE:
            return fmt::format("transport failure: {}", reason);
    }
    return reason;
}

DispatchOutcome classify_exception(const tg::TelegramException& error) {
    // Most specific first: RateLimitException is also an OperationException
    if (auto* rate_limit = dynamic_cast<const tg::RateLimitException*>(&error)) {
        return DispatchOutcome::rate_limited(rate_limit->retry_after());
    }
    if (dynamic_cast<const tg::AuthenticationException*>(&error)) {
        return DispatchOutcome::invalid_credential(error.message());
    }
    if (dynamic_cast<const tg::EntityException*>(&error) || dynamic_cast<const tg::OperationException*>(&error)) {
        return DispatchOutcome::rejected(error.message());
    }
    if (dynamic_cast<const tg::NetworkException*>(&error)) {
        return DispatchOutcome::transport_failure(error.message());
    }
    if (auto* td_error = dynamic_cast<const tg::TdLibException*>(&error)) {
        if (td_error->code() >= 400 && td_error->code() < 500) {
            return DispatchOutcome::rejected(error.message());
        }
        return DispatchOutcome::transport_failure(error.message());
    }
    return DispatchOutcome::transport_failure(error.message());
}

}  // namespace tgcast
