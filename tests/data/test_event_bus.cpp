// test_event_bus.cpp
#include <gtest/gtest.h>
#include <algorithm>
#include <stdexcept>
#include "../test_utils.hpp"
#include "finpipe/data/event_bus.hpp"

using namespace finpipe;
using namespace finpipe::testing;

class EventBusTest : public TestBase {
protected:
    static PipelineEvent event(PipelineEventType type, const std::string& symbol) {
        PipelineEvent e;
        e.type = type;
        e.symbol = symbol;
        e.timestamp = day("2024-01-02");
        return e;
    }
};

TEST_F(EventBusTest, DeliversByTypeAndSymbol) {
    auto& bus = PipelineEventBus::instance();
    std::vector<std::string> seen;

    SubscriberInfo aapl_only{"aapl", {PipelineEventType::ALERT_TRIGGERED}, {"AAPL"},
                             [&seen](const PipelineEvent& e) { seen.push_back("aapl:" + e.symbol); }};
    SubscriberInfo all{"all",
                       {PipelineEventType::ALERT_TRIGGERED, PipelineEventType::PRICES_UPSERTED},
                       {},
                       [&seen](const PipelineEvent& e) { seen.push_back("all:" + e.symbol); }};
    ASSERT_TRUE(bus.subscribe(aapl_only).is_ok());
    ASSERT_TRUE(bus.subscribe(all).is_ok());
    EXPECT_EQ(bus.subscriber_count(), 2u);

    bus.publish(event(PipelineEventType::ALERT_TRIGGERED, "AAPL"));
    bus.publish(event(PipelineEventType::ALERT_TRIGGERED, "MSFT"));
    bus.publish(event(PipelineEventType::QUOTA_EXCEEDED, "AAPL"));

    std::sort(seen.begin(), seen.end());
    EXPECT_EQ(seen, std::vector<std::string>({"aapl:AAPL", "all:AAPL", "all:MSFT"}));
}

TEST_F(EventBusTest, ThrowingSubscriberDoesNotStopOthers) {
    auto& bus = PipelineEventBus::instance();
    int delivered = 0;
    ASSERT_TRUE(bus.subscribe({"bad", {PipelineEventType::REFRESH_COMPLETED}, {},
                               [](const PipelineEvent&) { throw std::runtime_error("boom"); }})
                    .is_ok());
    ASSERT_TRUE(bus.subscribe({"good", {PipelineEventType::REFRESH_COMPLETED}, {},
                               [&delivered](const PipelineEvent&) { ++delivered; }})
                    .is_ok());

    bus.publish(event(PipelineEventType::REFRESH_COMPLETED, ""));
    EXPECT_EQ(delivered, 1);
}

TEST_F(EventBusTest, SubscribeValidationAndUnsubscribe) {
    auto& bus = PipelineEventBus::instance();
    EXPECT_TRUE(bus.subscribe({"", {PipelineEventType::PRICES_UPSERTED}, {},
                               [](const PipelineEvent&) {}})
                    .is_error());
    EXPECT_TRUE(bus.subscribe({"x", {}, {}, [](const PipelineEvent&) {}}).is_error());
    EXPECT_TRUE(bus.subscribe({"x", {PipelineEventType::PRICES_UPSERTED}, {}, nullptr}).is_error());

    int count = 0;
    ASSERT_TRUE(bus.subscribe({"x", {PipelineEventType::PRICES_UPSERTED}, {},
                               [&count](const PipelineEvent&) { ++count; }})
                    .is_ok());
    ASSERT_TRUE(bus.unsubscribe("x").is_ok());
    bus.publish(event(PipelineEventType::PRICES_UPSERTED, "AAPL"));
    EXPECT_EQ(count, 0);

    auto missing = bus.unsubscribe("x");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error()->code(), ErrorCode::DATA_NOT_FOUND);
}
