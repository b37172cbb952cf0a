#include "tgcast/mock_transport.hpp"

#include "tg/formatters.hpp"

#include <spdlog/spdlog.h>

namespace tgcast {

DispatchOutcome MockTransport::deliver(const tg::Recipient& recipient, const std::string& text, tg::ParseMode parse_mode) {
    DeliveryHook hook;
    MockDelivery delivery{recipient, text, parse_mode};

    {
        std::lock_guard<std::mutex> lock(mutex_);
        deliveries_.push_back(delivery);
        hook = hook_;
    }

    // Run the hook unlocked so it may script further outcomes
    if (hook) {
        hook(delivery);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    DispatchOutcome outcome = default_outcome_;
    if (auto it = recipient_scripts_.find(recipient); it != recipient_scripts_.end() && !it->second.empty()) {
        outcome = std::move(it->second.front());
        it->second.pop_front();
    } else if (!script_.empty()) {
        outcome = std::move(script_.front());
        script_.pop_front();
    }

    spdlog::debug("MockTransport: {} -> {}", recipient, outcome.describe());
    return outcome;
}

void MockTransport::push_outcome(DispatchOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.push_back(std::move(outcome));
}

void MockTransport::push_outcome_for(const tg::Recipient& recipient, DispatchOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    recipient_scripts_[recipient].push_back(std::move(outcome));
}

void MockTransport::set_default_outcome(DispatchOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    default_outcome_ = std::move(outcome);
}

void MockTransport::set_delivery_hook(DeliveryHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    hook_ = std::move(hook);
}

std::vector<MockDelivery> MockTransport::deliveries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deliveries_;
}

std::size_t MockTransport::delivery_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deliveries_.size();
}

void MockTransport::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.clear();
    recipient_scripts_.clear();
    deliveries_.clear();
    default_outcome_ = DispatchOutcome::delivered();
}

}  // namespace tgcast
