#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "paper_ngin/portfolio/portfolio_statistics.hpp"
#include "test_helpers.hpp"

using namespace paper_ngin;
using namespace paper_ngin::testing;

class PortfolioStatisticsTest : public TestBase {
protected:
    TradeRecord create_trade(const std::string& symbol, double pnl, int holding_periods,
                             StrategyClass cls = StrategyClass::SWING,
                             SignalType type = SignalType::MOMENTUM) {
        TradeRecord trade;
        trade.symbol = symbol;
        trade.strategy_class = cls;
        trade.signal_type = type;
        trade.entry_price = 100.0;
        trade.shares = 100;
        trade.exit_price = 100.0 + pnl / 100.0;
        trade.pnl = pnl;
        trade.pnl_pct = pnl / 100.0;
        trade.holding_periods = holding_periods;
        return trade;
    }
};

TEST_F(PortfolioStatisticsTest, TradeStatsCountsBreakEvenAsLoss) {
    auto stats = compute_trade_stats({create_trade("A", 300.0, 2), create_trade("B", -500.0, 4),
                                      create_trade("C", 0.0, 6)});

    EXPECT_EQ(stats.trades, 3);
    EXPECT_EQ(stats.wins, 1);
    EXPECT_EQ(stats.losses, 2);
    EXPECT_NEAR(stats.win_rate(), 100.0 / 3.0, 1e-9);
    EXPECT_DOUBLE_EQ(stats.total_pnl, -200.0);
    EXPECT_DOUBLE_EQ(stats.best_trade, 300.0);
    EXPECT_DOUBLE_EQ(stats.worst_trade, -500.0);
    EXPECT_DOUBLE_EQ(stats.avg_holding_periods, 4.0);
}

TEST_F(PortfolioStatisticsTest, EmptyHistory) {
    auto stats = compute_trade_stats({});
    EXPECT_EQ(stats.trades, 0);
    EXPECT_DOUBLE_EQ(stats.win_rate(), 0.0);
    EXPECT_EQ(stats.to_json()["win_rate"].get<double>(), 0.0);
}

TEST_F(PortfolioStatisticsTest, SummaryMarksOpenPositions) {
    PortfolioState state;
    state.portfolio_id = "swing";
    state.initial_capital = 100000.0;
    state.ledger = CapitalLedger(100000.0);
    for (const char* symbol : {"INFY", "TCS"}) {
        Position p = make_position(symbol, 100);
        ASSERT_TRUE(state.ledger.reserve(p.entry_cost()).is_ok());
        state.positions.open(p);
    }
    state.last_prices["TCS"] = 95.0;

    auto summary = summarize(state, {{"INFY", 110.0}});
    EXPECT_EQ(summary.open_positions, 2);
    EXPECT_DOUBLE_EQ(summary.available_capital, 80000.0);
    EXPECT_DOUBLE_EQ(summary.invested, 20000.0);
    EXPECT_DOUBLE_EQ(summary.market_value, 11000.0 + 9500.0);
    EXPECT_DOUBLE_EQ(summary.unrealized_pnl, 1000.0 - 500.0);
    EXPECT_DOUBLE_EQ(summary.portfolio_value, 100500.0);
    EXPECT_NEAR(summary.total_return_pct, 0.5, 1e-9);

    auto j = summary.to_json();
    EXPECT_EQ(j["open_positions"].get<int>(), 2);
    EXPECT_EQ(j["portfolio_id"].get<std::string>(), "swing");
}

TEST_F(PortfolioStatisticsTest, SummaryBreaksDownClosedTrades) {
    PortfolioState state;
    state.portfolio_id = "swing";
    state.initial_capital = 100000.0;
    state.ledger = CapitalLedger(100000.0);
    state.positions.restore_history(
        {create_trade("A", 300.0, 2, StrategyClass::SWING, SignalType::BREAKOUT),
         create_trade("B", -100.0, 3, StrategyClass::SWING, SignalType::MOMENTUM),
         create_trade("C", 250.0, 5, StrategyClass::SWING, SignalType::BREAKOUT)});

    auto summary = summarize(state);
    EXPECT_EQ(summary.overall.trades, 3);
    EXPECT_EQ(summary.by_signal_type.at("BREAKOUT").trades, 2);
    EXPECT_DOUBLE_EQ(summary.by_signal_type.at("BREAKOUT").total_pnl, 550.0);
    EXPECT_EQ(summary.by_signal_type.at("MOMENTUM").losses, 1);
    EXPECT_EQ(summary.by_strategy_class.count("POSITIONAL"), 0u);
}

TEST_F(PortfolioStatisticsTest, CombineRecomputesRatios) {
    PortfolioSummary a;
    a.initial_capital = 30000.0;
    a.portfolio_value = 33000.0;
    a.overall = compute_trade_stats({create_trade("A", 3000.0, 4)});
    a.by_strategy_class["SWING"] = a.overall;

    PortfolioSummary b;
    b.initial_capital = 70000.0;
    b.portfolio_value = 69000.0;
    b.overall = compute_trade_stats({create_trade("B", -1000.0, 10, StrategyClass::POSITIONAL)});
    b.by_strategy_class["POSITIONAL"] = b.overall;

    auto combined = combine(a, b, "dual");
    EXPECT_EQ(combined.portfolio_id, "dual");
    EXPECT_DOUBLE_EQ(combined.portfolio_value, 102000.0);
    EXPECT_NEAR(combined.total_return_pct, 2.0, 1e-9);
    EXPECT_EQ(combined.overall.trades, 2);
    EXPECT_DOUBLE_EQ(combined.overall.best_trade, 3000.0);
    EXPECT_DOUBLE_EQ(combined.overall.worst_trade, -1000.0);
    EXPECT_DOUBLE_EQ(combined.overall.avg_holding_periods, 7.0);
    EXPECT_NEAR(combined.overall.win_rate(), 50.0, 1e-9);
    EXPECT_EQ(combined.by_strategy_class.size(), 2u);
}
