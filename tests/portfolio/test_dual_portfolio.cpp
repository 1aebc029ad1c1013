#include <gtest/gtest.h>
#include <memory>
#include "../core/test_base.hpp"
#include "paper_ngin/portfolio/dual_portfolio.hpp"
#include "test_helpers.hpp"

using namespace paper_ngin;
using namespace paper_ngin::testing;

class DualPortfolioTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        swing_store_ = std::make_shared<InMemoryStateStore>();
        positional_store_ = std::make_shared<InMemoryStateStore>();
        bus_ = std::make_shared<PortfolioEventBus>();
        ASSERT_TRUE(bus_->subscribe(capture_.subscriber("capture")).is_ok());

        dual_ = std::make_unique<DualPortfolio>(DualPortfolioConfig(), swing_store_,
                                                positional_store_, bus_);
        auto init = dual_->initialize();
        ASSERT_TRUE(init.is_ok()) << init.error()->what();
    }

    static Signal positional_signal(const std::string& symbol, double quality = 8.0) {
        return make_signal(symbol, quality, 100.0, 98.0, 103.0, 108.0, 112.0,
                           StrategyClass::POSITIONAL);
    }

    std::shared_ptr<InMemoryStateStore> swing_store_;
    std::shared_ptr<InMemoryStateStore> positional_store_;
    std::shared_ptr<PortfolioEventBus> bus_;
    EventCapture capture_;
    std::unique_ptr<DualPortfolio> dual_;
};

TEST_F(DualPortfolioTest, SplitsCapitalBetweenBooks) {
    EXPECT_EQ(dual_->swing().id(), "dual_swing");
    EXPECT_EQ(dual_->positional().id(), "dual_positional");
    EXPECT_DOUBLE_EQ(dual_->swing().snapshot().ledger.available(), 30000.0);
    EXPECT_DOUBLE_EQ(dual_->positional().snapshot().ledger.available(), 70000.0);

    auto& manager = StateManager::instance();
    EXPECT_EQ(manager.get_state("dual").value().state, ComponentState::RUNNING);
    EXPECT_EQ(manager.get_state("dual_swing").value().state, ComponentState::RUNNING);
    EXPECT_EQ(manager.get_state("dual_positional").value().state, ComponentState::RUNNING);
}

TEST_F(DualPortfolioTest, RoutesByStrategyClass) {
    auto swing = dual_->on_signal(make_signal("INFY"));
    ASSERT_TRUE(swing.is_ok());
    EXPECT_EQ(swing.value().shares, 75);
    EXPECT_TRUE(dual_->swing().holds("INFY"));

    auto positional = dual_->on_signal(positional_signal("TCS"));
    ASSERT_TRUE(positional.is_ok());
    EXPECT_EQ(positional.value().shares, 175);
    EXPECT_TRUE(dual_->positional().holds("TCS"));
    EXPECT_EQ(dual_->positional().snapshot().positions.find("TCS")->max_hold_periods, 90);

    EXPECT_TRUE(swing_store_->stored->positions.contains("INFY"));
    EXPECT_TRUE(positional_store_->stored->positions.contains("TCS"));
}

TEST_F(DualPortfolioTest, SymbolHeldInOneBookIsRejectedByTheOther) {
    ASSERT_TRUE(dual_->on_signal(make_signal("INFY")).is_ok());

    auto blocked = dual_->on_signal(positional_signal("INFY", 9.5));
    ASSERT_TRUE(blocked.is_ok());
    EXPECT_EQ(blocked.value().status, SignalStatus::REJECTED);
    EXPECT_EQ(blocked.value().reason, RejectionReason::HELD_BY_SIBLING);
    EXPECT_FALSE(dual_->positional().holds("INFY"));

    // once the swing book exits, the positional book may take the symbol
    auto exits = dual_->on_price_ticks({{"INFY", 97.0, trading_days_later(1)}});
    ASSERT_TRUE(exits.is_ok());
    ASSERT_EQ(exits.value().size(), 1u);
    EXPECT_EQ(exits.value()[0].portfolio_id, "dual_swing");

    auto entered = dual_->on_signal(positional_signal("INFY", 9.5));
    ASSERT_TRUE(entered.is_ok());
    EXPECT_TRUE(entered.value().is_entered());
}

TEST_F(DualPortfolioTest, TicksReachBothBooks) {
    ASSERT_TRUE(dual_->on_signal(make_signal("INFY")).is_ok());
    ASSERT_TRUE(dual_->on_signal(positional_signal("TCS")).is_ok());

    auto exits = dual_->on_price_ticks(
        {{"TCS", 97.0, trading_days_later(1)}, {"INFY", 103.0, trading_days_later(1)}});
    ASSERT_TRUE(exits.is_ok());
    ASSERT_EQ(exits.value().size(), 2u);
    EXPECT_EQ(exits.value()[0].portfolio_id, "dual_swing");
    EXPECT_EQ(exits.value()[0].trade.reason, ExitReason::TARGET_1);
    EXPECT_EQ(exits.value()[1].portfolio_id, "dual_positional");
    EXPECT_EQ(exits.value()[1].trade.reason, ExitReason::STOP_LOSS);
}

TEST_F(DualPortfolioTest, BatchSortedAcrossBooks) {
    auto outcomes = dual_->on_signals({make_signal("INFY", 7.5), positional_signal("INFY", 9.0)});
    ASSERT_TRUE(outcomes.is_ok());
    ASSERT_EQ(outcomes.value().size(), 2u);
    EXPECT_EQ(outcomes.value()[0].status, SignalStatus::ENTERED);
    EXPECT_EQ(outcomes.value()[1].reason, RejectionReason::HELD_BY_SIBLING);
    EXPECT_TRUE(dual_->positional().holds("INFY"));
}

TEST_F(DualPortfolioTest, CombinedSummaryAddsBooks) {
    ASSERT_TRUE(dual_->on_signal(make_signal("INFY")).is_ok());
    ASSERT_TRUE(dual_->on_signal(positional_signal("TCS")).is_ok());
    ASSERT_TRUE(dual_->on_price_ticks({{"TCS", 97.0, trading_days_later(1)}}).is_ok());

    auto summary = dual_->combined_summary({{"INFY", 102.0}});
    EXPECT_EQ(summary.portfolio_id, "dual");
    EXPECT_DOUBLE_EQ(summary.initial_capital, 100000.0);
    EXPECT_EQ(summary.open_positions, 1);
    EXPECT_NEAR(summary.unrealized_pnl, 150.0, 1e-9);
    EXPECT_NEAR(summary.realized_pnl, -350.0, 1e-9);
    EXPECT_EQ(summary.overall.trades, 1);
    EXPECT_EQ(summary.by_strategy_class.at("POSITIONAL").losses, 1);
    EXPECT_NEAR(summary.portfolio_value, 100000.0 + 150.0 - 350.0, 1e-9);
}

TEST_F(DualPortfolioTest, ResetRestoresBothBooks) {
    ASSERT_TRUE(dual_->on_signal(make_signal("INFY")).is_ok());
    ASSERT_TRUE(dual_->on_signal(positional_signal("TCS")).is_ok());

    ASSERT_TRUE(dual_->reset().is_ok());
    EXPECT_EQ(dual_->swing().snapshot().positions.open_count(), 0u);
    EXPECT_EQ(dual_->positional().snapshot().positions.open_count(), 0u);
    EXPECT_DOUBLE_EQ(dual_->positional().snapshot().ledger.available(), 70000.0);
}

TEST_F(DualPortfolioTest, ConfigValidation) {
    DualPortfolioConfig config;
    config.from_json({{"id", "books"}, {"swing_fraction", 0.4}, {"total_capital", 50000.0}});
    EXPECT_TRUE(config.validate().is_ok());
    EXPECT_DOUBLE_EQ(config.resolved_swing().initial_capital, 20000.0);
    EXPECT_DOUBLE_EQ(config.resolved_positional().initial_capital, 30000.0);
    EXPECT_EQ(config.resolved_positional().portfolio_id, "books_positional");

    config.swing_fraction = 1.0;
    EXPECT_TRUE(config.validate().is_error());

    DualPortfolio invalid(config);
    EXPECT_TRUE(invalid.initialize().is_error());
}
