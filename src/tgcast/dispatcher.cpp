#include "tgcast/dispatcher.hpp"

#include "tg/exceptions.hpp"
#include "tg/formatters.hpp"
#include "tgcast/formatters.hpp"
#include "tgcast/interaction_log.hpp"
#include "tgcast/text.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cmath>

namespace tgcast {

namespace {

double seconds(Clock::duration d) { return std::chrono::duration<double>(d).count(); }

// Longest delay or duration a session accepts; now() + twice this still fits the clock
double longest_wait_seconds(Clock::time_point now) { return seconds((Clock::time_point::max() - now) / 2); }

DispatchReport rejected_before_start(SessionMode mode, StopReason reason, std::string message, ProgressReporter& reporter) {
    report_safely(reporter, message, reason == StopReason::BUSY ? Severity::WARNING : Severity::ERROR);
    spdlog::warn("{} session not started ({}): {}", mode, reason, message);

    SessionSummary summary;
    summary.mode = mode;
    summary.stop_reason = reason;
    summary.last_error = message;
    return DispatchReport{.success = false, .summary = summary, .message = std::move(message)};
}

}  // namespace

Dispatcher::Dispatcher(Transport& transport, SessionManager& sessions, Clock& clock, DispatcherOptions options)
    : transport_(transport), sessions_(sessions), clock_(clock), options_(options) {}

DispatchOutcome Dispatcher::attempt(
    const tg::Recipient& recipient,
    const std::string& text,
    tg::ParseMode parse_mode,
    BroadcastSession* session
) {
    if (session) {
        session->count_transport_call();
    }
    spdlog::debug(
        "Delivering to {} via {}: '{}'", recipient, transport_.name(), truncate_for_log(text, options_.text_log_limit)
    );

    try {
        return transport_.deliver(recipient, text, parse_mode);
    } catch (const tg::TelegramException& e) {
        return classify_exception(e);
    } catch (const std::exception& e) {
        spdlog::error("Transport {} threw while delivering to {}: {}", transport_.name(), recipient, e.what());
        return DispatchOutcome::transport_failure(e.what());
    }
}

SendResult Dispatcher::send_once(std::string_view recipient_text, const std::string& text, tg::ParseMode parse_mode) {
    auto recipient = tg::Recipient::parse(recipient_text);
    if (!recipient) {
        return SendResult{.success = false, .message = "Recipient is not specified.", .outcome = {}};
    }
    if (text.empty()) {
        return SendResult{.success = false, .message = "Message text is empty.", .outcome = {}};
    }
    if (sessions_.is_active()) {
        return SendResult{
            .success = false, .message = "A broadcast is in progress, try again when it finishes.", .outcome = {}
        };
    }

    auto outcome = attempt(*recipient, text, parse_mode, nullptr);
    if (!outcome.is_delivered()) {
        auto message = fmt::format("Failed to send to {}: {}", *recipient, outcome.describe());
        spdlog::error("{}", message);
        return SendResult{.success = false, .message = std::move(message), .outcome = std::move(outcome)};
    }

    auto message = fmt::format("Message sent to {}.", *recipient);
    spdlog::info("{}", message);
    if (options_.interaction_log) {
        options_.interaction_log->append(format_outgoing(*recipient, text, options_.text_log_limit));
    }
    return SendResult{.success = true, .message = std::move(message), .outcome = std::move(outcome)};
}

DispatchReport Dispatcher::run_single_target(const SingleTargetRequest& request, ProgressReporter& reporter) {
    constexpr auto mode = SessionMode::SINGLE_TARGET;

    auto recipient = tg::Recipient::parse(request.recipient);
    if (!recipient) {
        return rejected_before_start(mode, StopReason::REJECTED_INPUT, "Recipient is not specified.", reporter);
    }
    if (request.text.empty()) {
        return rejected_before_start(mode, StopReason::REJECTED_INPUT, "Message text is empty.", reporter);
    }
    if (request.count <= 0) {
        return rejected_before_start(
            mode, StopReason::REJECTED_INPUT, "Message count must be greater than zero.", reporter
        );
    }
    if (!std::isfinite(request.delay.count())) {
        return rejected_before_start(
            mode, StopReason::REJECTED_INPUT, "Delay must be a finite number of seconds.", reporter
        );
    }
    if (request.delay.count() < 0) {
        return rejected_before_start(mode, StopReason::REJECTED_INPUT, "Delay cannot be negative.", reporter);
    }
    if (request.delay.count() >= longest_wait_seconds(clock_.now())) {
        return rejected_before_start(mode, StopReason::REJECTED_INPUT, "Delay is too long.", reporter);
    }

    auto lease = sessions_.try_acquire(mode);
    if (!lease) {
        return rejected_before_start(mode, StopReason::BUSY, "Another broadcast is already running.", reporter);
    }

    BroadcastSession session(mode, clock_.now(), to_clock_duration(request.delay));
    session.set_planned(static_cast<std::size_t>(request.count));

    report_safely(
        reporter,
        fmt::format(
            "Sending {} message(s) to {} with a {:.1f}s delay: '{}'",
            request.count,
            *recipient,
            request.delay.count(),
            truncate_for_log(request.text, options_.text_log_limit)
        ),
        Severity::INFO
    );

    try {
        single_target_loop(session, *recipient, request, reporter);
    } catch (const std::exception& e) {
        spdlog::error("Sending to {} aborted: {}", *recipient, e.what());
        session.set_last_error(fmt::format("internal error: {}", e.what()));
        session.stop(StopReason::ABORTED);
    }

    return finish(session, reporter);
}

void Dispatcher::single_target_loop(
    BroadcastSession& session,
    const tg::Recipient& recipient,
    const SingleTargetRequest& request,
    ProgressReporter& reporter
) {
    const auto count = static_cast<std::size_t>(request.count);

    for (std::size_t i = 0; i < count; ++i) {
        const auto progress = fmt::format("[{}/{}]", i + 1, count);
        auto effective_delay = session.delay();

        session.begin_attempt();
        auto outcome = attempt(recipient, request.text, request.parse_mode, &session);

        if (outcome.is_delivered()) {
            session.record_delivered();
            report_safely(reporter, fmt::format("{} Message sent to {}.", progress, recipient), Severity::SUCCESS);
        } else if (outcome.is_rate_limited()) {
            session.record_failure(outcome.describe());
            session.record_rate_limit_wait();
            report_safely(
                reporter,
                fmt::format(
                    "{} Rate limited by {}, waiting {:.1f}s...",
                    progress,
                    recipient,
                    seconds(to_clock_duration(outcome.retry_after))
                ),
                Severity::WARNING
            );

            clock_.sleep_for(to_clock_duration(outcome.retry_after));
            effective_delay = Clock::duration::zero();

            report_safely(reporter, fmt::format("{} Retrying {} after the rate limit...", progress, recipient), Severity::INFO);
            auto retry = attempt(recipient, request.text, request.parse_mode, &session);
            if (retry.is_delivered()) {
                session.withdraw_failure_after_retry();
                session.record_delivered();
                session.set_last_error({});
                report_safely(
                    reporter, fmt::format("{} Message sent to {} after the rate limit.", progress, recipient), Severity::SUCCESS
                );
            } else {
                session.set_last_error(retry.describe());
                report_safely(
                    reporter, fmt::format("{} Retry to {} failed: {}", progress, recipient, retry.describe()), Severity::ERROR
                );
                if (retry.is_fatal()) {
                    session.stop(StopReason::FATAL_CREDENTIAL);
                }
            }
        } else {
            session.record_failure(outcome.describe());
            report_safely(
                reporter, fmt::format("{} Failed to send to {}: {}", progress, recipient, outcome.describe()), Severity::ERROR
            );
            if (outcome.is_fatal()) {
                session.stop(StopReason::FATAL_CREDENTIAL);
            }
        }

        if (session.stopped()) {
            report_safely(reporter, "Bot token is no longer valid, stopping.", Severity::ERROR);
            return;
        }

        if (i + 1 < count && effective_delay > Clock::duration::zero()) {
            clock_.sleep_for(effective_delay);
        }
    }
}

DispatchReport
Dispatcher::run_cyclic(const CyclicRequest& request, const RecipientSet& recipients, ProgressReporter& reporter) {
    constexpr auto mode = SessionMode::CYCLIC;

    if (recipients.empty()) {
        return rejected_before_start(
            mode,
            StopReason::REJECTED_INPUT,
            "No recipients found in the interaction log. Run 'collect' first to gather them.",
            reporter
        );
    }
    if (request.text.empty()) {
        return rejected_before_start(mode, StopReason::REJECTED_INPUT, "Message text is empty.", reporter);
    }
    if (!std::isfinite(request.delay.count())) {
        return rejected_before_start(
            mode, StopReason::REJECTED_INPUT, "Delay must be a finite number of seconds.", reporter
        );
    }
    if (request.delay.count() <= 0) {
        return rejected_before_start(mode, StopReason::REJECTED_INPUT, "Delay must be greater than zero.", reporter);
    }
    if (!std::isfinite(request.duration.count())) {
        return rejected_before_start(
            mode, StopReason::REJECTED_INPUT, "Duration must be a finite number of minutes.", reporter
        );
    }
    if (request.duration.count() <= 0) {
        return rejected_before_start(mode, StopReason::REJECTED_INPUT, "Duration must be greater than zero.", reporter);
    }

    const auto longest = longest_wait_seconds(clock_.now());
    if (request.delay.count() >= longest) {
        return rejected_before_start(mode, StopReason::REJECTED_INPUT, "Delay is too long.", reporter);
    }
    if (std::chrono::duration<double>(request.duration).count() >= longest) {
        return rejected_before_start(mode, StopReason::REJECTED_INPUT, "Duration is too long.", reporter);
    }

    auto lease = sessions_.try_acquire(mode);
    if (!lease) {
        return rejected_before_start(mode, StopReason::BUSY, "Another broadcast is already running.", reporter);
    }

    const auto started_at = clock_.now();
    BroadcastSession session(mode, started_at, to_clock_duration(request.delay));
    session.set_deadline(started_at + to_clock_duration(request.duration));

    // Captured once; later changes to the log do not affect this session
    const std::vector<tg::Recipient> order(recipients.begin(), recipients.end());

    report_safely(
        reporter,
        fmt::format(
            "Broadcasting to {} recipient(s) for {:.1f} min with a {:.1f}s delay: '{}'",
            order.size(),
            request.duration.count(),
            request.delay.count(),
            truncate_for_log(request.text, options_.text_log_limit)
        ),
        Severity::WARNING
    );

    try {
        cyclic_loop(session, order, request, reporter);
    } catch (const std::exception& e) {
        spdlog::error("Broadcast aborted: {}", e.what());
        session.set_last_error(fmt::format("internal error: {}", e.what()));
        session.stop(StopReason::ABORTED);
    }

    return finish(session, reporter);
}

void Dispatcher::cyclic_loop(
    BroadcastSession& session,
    const std::vector<tg::Recipient>& recipients,
    const CyclicRequest& request,
    ProgressReporter& reporter
) {
    const auto deadline = *session.deadline();
    auto expired = [&] { return clock_.now() >= deadline; };
    auto stop_on_deadline = [&](std::string_view line) {
        session.stop(StopReason::DEADLINE_EXPIRED);
        report_safely(reporter, line, Severity::WARNING);
    };

    while (true) {
        if (expired()) {
            stop_on_deadline("Broadcast time is up.");
            return;
        }

        const auto sweep_started = clock_.now();
        session.begin_sweep();
        report_safely(
            reporter,
            fmt::format(
                "Starting sweep over {} recipient(s), {:.1f} min left...",
                recipients.size(),
                seconds(deadline - sweep_started) / 60.0
            ),
            Severity::INFO
        );

        for (std::size_t i = 0; i < recipients.size(); ++i) {
            const auto& recipient = recipients[i];

            if (expired()) {
                stop_on_deadline("Broadcast time is up, stopping the sweep.");
                return;
            }

            auto effective_delay = session.delay();
            session.begin_attempt();
            auto outcome = attempt(recipient, request.text, request.parse_mode, &session);

            if (outcome.is_delivered()) {
                session.record_delivered();
                report_safely(reporter, fmt::format("Message sent to {}.", recipient), Severity::SUCCESS);
            } else if (outcome.is_rate_limited()) {
                session.record_failure(fmt::format("{}: {}", recipient, outcome.describe()));
                session.record_rate_limit_wait();
                report_safely(
                    reporter,
                    fmt::format(
                        "Rate limited by {}, waiting {:.1f}s...", recipient, seconds(to_clock_duration(outcome.retry_after))
                    ),
                    Severity::WARNING
                );

                auto waited = interruptible_wait(
                    clock_, to_clock_duration(outcome.retry_after), deadline, options_.poll_interval
                );
                if (waited == WaitResult::DEADLINE_EXPIRED) {
                    stop_on_deadline("Broadcast time ran out while waiting for the rate limit.");
                    return;
                }
                effective_delay = Clock::duration::zero();

                report_safely(reporter, fmt::format("Retrying {} after the rate limit...", recipient), Severity::INFO);
                auto retry = attempt(recipient, request.text, request.parse_mode, &session);
                if (retry.is_delivered()) {
                    session.withdraw_failure_after_retry();
                    session.record_delivered();
                    session.set_last_error({});
                    report_safely(
                        reporter, fmt::format("Message sent to {} after the rate limit.", recipient), Severity::SUCCESS
                    );
                } else {
                    session.set_last_error(fmt::format("{}: {} (after waiting)", recipient, retry.describe()));
                    report_safely(
                        reporter, fmt::format("Retry to {} failed: {}", recipient, retry.describe()), Severity::ERROR
                    );
                    if (retry.is_fatal()) {
                        session.stop(StopReason::FATAL_CREDENTIAL);
                    }
                }
            } else {
                session.record_failure(fmt::format("{}: {}", recipient, outcome.describe()));
                report_safely(
                    reporter, fmt::format("Failed to send to {}: {}", recipient, outcome.describe()), Severity::ERROR
                );
                if (outcome.is_fatal()) {
                    session.stop(StopReason::FATAL_CREDENTIAL);
                }
            }

            if (session.stopped()) {
                report_safely(reporter, "Bot token is no longer valid, stopping the broadcast.", Severity::ERROR);
                return;
            }

            if (expired()) {
                stop_on_deadline("Broadcast time is up after the last attempt.");
                return;
            }

            if (i + 1 < recipients.size() && effective_delay > Clock::duration::zero()) {
                if (interruptible_wait(clock_, effective_delay, deadline, options_.poll_interval) ==
                    WaitResult::DEADLINE_EXPIRED) {
                    stop_on_deadline("Broadcast time ran out during the delay between recipients.");
                    return;
                }
            }
        }

        auto sweep_elapsed = clock_.now() - sweep_started;
        if (sweep_elapsed < options_.min_sweep_duration && !expired()) {
            clock_.sleep_for(options_.min_sweep_duration - sweep_elapsed);
        }
    }
}

DispatchReport Dispatcher::finish(const BroadcastSession& session, ProgressReporter& reporter) {
    auto summary = session.summarise(clock_.now());
    auto message = summary.describe();

    report_safely(reporter, message, summary.any_delivered() ? Severity::SUCCESS : Severity::ERROR);
    spdlog::info(
        "{} session ended ({}): attempts={} delivered={} failed={} rate_limit_waits={} transport_calls={}",
        summary.mode,
        summary.stop_reason,
        summary.attempts,
        summary.delivered,
        summary.failed,
        summary.rate_limit_waits,
        summary.transport_calls
    );

    return DispatchReport{.success = summary.any_delivered(), .summary = std::move(summary), .message = std::move(message)};
}

}  // namespace tgcast
