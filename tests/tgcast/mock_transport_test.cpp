#include "tgcast/mock_transport.hpp"

#include <gtest/gtest.h>

namespace tgcast {
namespace {

using namespace std::chrono_literals;

const tg::Recipient kAlice = tg::Recipient::from_handle("alice");
const tg::Recipient kBob = tg::Recipient::from_handle("bob");

TEST(MockTransportTest, DeliversByDefault) {
    MockTransport transport;
    auto outcome = transport.deliver(kAlice, "hi", tg::ParseMode::NONE);

    EXPECT_TRUE(outcome.is_delivered());
    ASSERT_EQ(transport.delivery_count(), 1u);
    EXPECT_EQ(transport.deliveries()[0].recipient, kAlice);
    EXPECT_EQ(transport.deliveries()[0].text, "hi");
}

// Test that scripted outcomes are consumed in order
TEST(MockTransportTest, ScriptedOutcomesInOrder) {
    MockTransport transport;
    transport.push_outcome(DispatchOutcome::rate_limited(3s));
    transport.push_outcome(DispatchOutcome::rejected("nope"));

    EXPECT_TRUE(transport.deliver(kAlice, "1", tg::ParseMode::NONE).is_rate_limited());
    EXPECT_EQ(transport.deliver(kAlice, "2", tg::ParseMode::NONE).kind, OutcomeKind::REJECTED);
    EXPECT_TRUE(transport.deliver(kAlice, "3", tg::ParseMode::NONE).is_delivered());
}

// Test that per-recipient scripts take precedence
TEST(MockTransportTest, RecipientScriptWins) {
    MockTransport transport;
    transport.push_outcome(DispatchOutcome::transport_failure("global"));
    transport.push_outcome_for(kBob, DispatchOutcome::invalid_credential());

    EXPECT_TRUE(transport.deliver(kBob, "x", tg::ParseMode::NONE).is_fatal());
    EXPECT_EQ(transport.deliver(kBob, "x", tg::ParseMode::NONE).kind, OutcomeKind::TRANSPORT_FAILURE);
    EXPECT_TRUE(transport.deliver(kAlice, "x", tg::ParseMode::NONE).is_delivered());
}

TEST(MockTransportTest, DefaultOutcomeCanChange) {
    MockTransport transport;
    transport.set_default_outcome(DispatchOutcome::rejected("blocked"));

    EXPECT_EQ(transport.deliver(kAlice, "x", tg::ParseMode::NONE).kind, OutcomeKind::REJECTED);
}

TEST(MockTransportTest, HookSeesEveryDelivery) {
    MockTransport transport;
    int calls = 0;
    transport.set_delivery_hook([&](const MockDelivery& delivery) {
        ++calls;
        EXPECT_EQ(delivery.parse_mode, tg::ParseMode::HTML);
    });

    (void)transport.deliver(kAlice, "<b>x</b>", tg::ParseMode::HTML);
    (void)transport.deliver(kBob, "<b>y</b>", tg::ParseMode::HTML);
    EXPECT_EQ(calls, 2);
}

TEST(MockTransportTest, ClearResetsEverything) {
    MockTransport transport;
    transport.push_outcome(DispatchOutcome::rejected("a"));
    transport.set_default_outcome(DispatchOutcome::rejected("b"));
    (void)transport.deliver(kAlice, "x", tg::ParseMode::NONE);

    transport.clear();

    EXPECT_EQ(transport.delivery_count(), 0u);
    EXPECT_TRUE(transport.deliver(kAlice, "x", tg::ParseMode::NONE).is_delivered());
}

}  // namespace
}  // namespace tgcast
