#pragma once

#include "tg/types.hpp"
#include "tgcast/clock.hpp"
#include "tgcast/constants.hpp"
#include "tgcast/discovery.hpp"
#include "tgcast/outcome.hpp"
#include "tgcast/reporter.hpp"
#include "tgcast/session.hpp"
#include "tgcast/transport.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tgcast {

class InteractionLog;

struct DispatcherOptions {
    std::size_t text_log_limit{kLogTextLimit};
    Clock::duration poll_interval{kDeadlinePollInterval};
    Clock::duration min_sweep_duration{kMinSweepDuration};
    InteractionLog* interaction_log{nullptr};  // Receives OUTGOING lines from send_once()
};

/// Fixed number of copies of one message to one recipient
struct SingleTargetRequest {
    std::string recipient;
    std::string text;
    int64_t count{1};
    std::chrono::duration<double> delay{0.0};
    tg::ParseMode parse_mode{tg::ParseMode::NONE};
};

/// Repeated sweeps over a recipient set until the duration runs out
struct CyclicRequest {
    std::string text;
    std::chrono::duration<double> delay{1.0};
    std::chrono::duration<double, std::ratio<60>> duration{1.0};
    tg::ParseMode parse_mode{tg::ParseMode::NONE};
};

/// Result of a dispatch loop; always returned, never thrown
struct DispatchReport {
    bool success{false};  // At least one message was delivered
    SessionSummary summary;
    std::string message;  // Final summary line, or the reason the loop never started
};

struct SendResult {
    bool success{false};
    std::string message;
    DispatchOutcome outcome;
};

/// Runs deliveries through a transport with pacing, retry and accounting
///
/// Deliveries are strictly sequential. Only one loop can run at a time per
/// SessionManager; a second caller gets a BUSY report.
class Dispatcher {
public:
    Dispatcher(Transport& transport, SessionManager& sessions, Clock& clock, DispatcherOptions options = {});

    // Disable copy
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// One delivery, no retry; logged to the interaction log on success
    SendResult send_once(std::string_view recipient, const std::string& text, tg::ParseMode parse_mode = tg::ParseMode::HTML);

    DispatchReport run_single_target(const SingleTargetRequest& request, ProgressReporter& reporter);

    /// @param recipients captured once; the set is not re-read during the session
    DispatchReport run_cyclic(const CyclicRequest& request, const RecipientSet& recipients, ProgressReporter& reporter);

    [[nodiscard]] const DispatcherOptions& options() const { return options_; }

private:
    DispatchOutcome
    attempt(const tg::Recipient& recipient, const std::string& text, tg::ParseMode parse_mode, BroadcastSession* session);

    void single_target_loop(
        BroadcastSession& session,
        const tg::Recipient& recipient,
        const SingleTargetRequest& request,
        ProgressReporter& reporter
    );

    void cyclic_loop(
        BroadcastSession& session,
        const std::vector<tg::Recipient>& recipients,
        const CyclicRequest& request,
        ProgressReporter& reporter
    );

    DispatchReport finish(const BroadcastSession& session, ProgressReporter& reporter);

    Transport& transport_;
    SessionManager& sessions_;
    Clock& clock_;
    DispatcherOptions options_;
};

}  // namespace tgcast
