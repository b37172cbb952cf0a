#pragma once

#include "tgcast/transport.hpp"

#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace tgcast {

/// One recorded call to MockTransport::deliver()
struct MockDelivery {
    tg::Recipient recipient;
    std::string text;
    tg::ParseMode parse_mode{tg::ParseMode::NONE};
};

/// In-process transport for dry runs and tests
///
/// Outcomes are taken, in order, from the per-recipient script, then from
/// the global script, then the default outcome (DELIVERED unless changed).
class MockTransport : public Transport {
public:
    using DeliveryHook = std::function<void(const MockDelivery&)>;

    MockTransport() = default;
    ~MockTransport() override = default;

    [[nodiscard]] DispatchOutcome
    deliver(const tg::Recipient& recipient, const std::string& text, tg::ParseMode parse_mode) override;

    [[nodiscard]] std::string_view name() const override { return "mock"; }

    // Scripting
    void push_outcome(DispatchOutcome outcome);
    void push_outcome_for(const tg::Recipient& recipient, DispatchOutcome outcome);
    void set_default_outcome(DispatchOutcome outcome);

    /// Called for every delivery before the outcome is chosen
    void set_delivery_hook(DeliveryHook hook);

    // Inspection
    [[nodiscard]] std::vector<MockDelivery> deliveries() const;
    [[nodiscard]] std::size_t delivery_count() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::deque<DispatchOutcome> script_;
    std::map<tg::Recipient, std::deque<DispatchOutcome>> recipient_scripts_;
    DispatchOutcome default_outcome_{DispatchOutcome::delivered()};
    DeliveryHook hook_;
    std::vector<MockDelivery> deliveries_;
};

}  // namespace tgcast
