#include <gtest/gtest.h>
#include <stdexcept>
#include "../core/test_base.hpp"
#include "paper_ngin/events/portfolio_event_bus.hpp"

using namespace paper_ngin;
using namespace paper_ngin::testing;

class PortfolioEventBusTest : public TestBase {
protected:
    PortfolioEvent create_event(const std::string& symbol,
                                PortfolioEventType type = PortfolioEventType::POSITION_ENTERED) {
        PortfolioEvent event;
        event.type = type;
        event.portfolio_id = "swing";
        event.symbol = symbol;
        event.timestamp = std::chrono::system_clock::now();
        event.numeric_fields = {{"shares", 40.0}, {"entry_price", 100.0}};
        return event;
    }

    PortfolioEventBus bus_;
};

TEST_F(PortfolioEventBusTest, FiltersBySymbolAndType) {
    int count = 0;
    PortfolioSubscriberInfo info{"alerts",
                                 {PortfolioEventType::POSITION_ENTERED},
                                 {"INFY"},
                                 [&count](const PortfolioEvent&) { ++count; }};
    ASSERT_TRUE(bus_.subscribe(info).is_ok());

    bus_.publish(create_event("INFY"));
    bus_.publish(create_event("TCS"));
    bus_.publish(create_event("INFY", PortfolioEventType::POSITION_EXITED));

    EXPECT_EQ(count, 1);
}

TEST_F(PortfolioEventBusTest, EmptySymbolListReceivesAll) {
    std::vector<std::string> seen;
    PortfolioSubscriberInfo info{"journal",
                                 {PortfolioEventType::POSITION_ENTERED},
                                 {},
                                 [&seen](const PortfolioEvent& e) { seen.push_back(e.symbol); }};
    ASSERT_TRUE(bus_.subscribe(info).is_ok());

    bus_.publish(create_event("INFY"));
    bus_.publish(create_event("TCS"));
    EXPECT_EQ(seen, (std::vector<std::string>{"INFY", "TCS"}));
}

TEST_F(PortfolioEventBusTest, InvalidSubscriptions) {
    auto noop = [](const PortfolioEvent&) {};
    EXPECT_TRUE(bus_.subscribe({"", {PortfolioEventType::STOP_RAISED}, {}, noop}).is_error());
    EXPECT_TRUE(bus_.subscribe({"a", {}, {}, noop}).is_error());
    EXPECT_TRUE(bus_.subscribe({"b", {PortfolioEventType::STOP_RAISED}, {}, nullptr}).is_error());
}

TEST_F(PortfolioEventBusTest, UnsubscribeStopsDelivery) {
    int count = 0;
    ASSERT_TRUE(bus_.subscribe({"alerts",
                                {PortfolioEventType::POSITION_ENTERED},
                                {},
                                [&count](const PortfolioEvent&) { ++count; }})
                    .is_ok());
    EXPECT_EQ(bus_.subscriber_count(), 1u);

    ASSERT_TRUE(bus_.unsubscribe("alerts").is_ok());
    bus_.publish(create_event("INFY"));
    EXPECT_EQ(count, 0);
    EXPECT_EQ(bus_.subscriber_count(), 0u);
    EXPECT_TRUE(bus_.unsubscribe("missing").is_error());
}

TEST_F(PortfolioEventBusTest, ThrowingSubscriberIsIsolated) {
    int delivered = 0;
    ASSERT_TRUE(bus_.subscribe({"broken",
                                {PortfolioEventType::POSITION_ENTERED},
                                {},
                                [](const PortfolioEvent&) {
                                    throw std::runtime_error("webhook down");
                                }})
                    .is_ok());
    ASSERT_TRUE(bus_.subscribe({"healthy",
                                {PortfolioEventType::POSITION_ENTERED},
                                {},
                                [&delivered](const PortfolioEvent&) { ++delivered; }})
                    .is_ok());

    EXPECT_NO_THROW(bus_.publish(create_event("INFY")));
    EXPECT_EQ(delivered, 1);
}
