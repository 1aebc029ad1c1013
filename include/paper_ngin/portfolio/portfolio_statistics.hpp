// include/paper_ngin/portfolio/portfolio_statistics.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "paper_ngin/portfolio/portfolio_state.hpp"

namespace paper_ngin {

/**
 * @brief Realized performance over a set of exit fills
 */
struct TradeStats {
    int trades{0};
    int wins{0};    // pnl > 0
    int losses{0};  // pnl <= 0
    double total_pnl{0.0};
    double best_trade{0.0};
    double worst_trade{0.0};
    double avg_holding_periods{0.0};

    double win_rate() const {
        return trades > 0 ? static_cast<double>(wins) / trades * 100.0 : 0.0;
    }

    void add(const TradeRecord& trade);
    nlohmann::json to_json() const;
};

/**
 * @brief Point-in-time view of a portfolio for reporting
 */
struct PortfolioSummary {
    std::string portfolio_id;
    double initial_capital{0.0};
    double available_capital{0.0};
    double invested{0.0};         // open cost basis
    double market_value{0.0};     // open positions at mark price
    double portfolio_value{0.0};  // available + market_value
    double unrealized_pnl{0.0};
    double realized_pnl{0.0};
    double total_return_pct{0.0};
    int open_positions{0};

    TradeStats overall;
    std::map<std::string, TradeStats> by_strategy_class;
    std::map<std::string, TradeStats> by_signal_type;

    nlohmann::json to_json() const;
};

TradeStats compute_trade_stats(const std::vector<TradeRecord>& trades);

/**
 * @brief Summarize a portfolio, marking open positions at prices
 *
 * Symbols missing from prices fall back to the state's last seen price and
 * then to the entry price.
 */
PortfolioSummary summarize(const PortfolioState& state,
                           const std::map<std::string, Price>& prices = {});

/**
 * @brief Sum two summaries; ratios are recomputed on the combined capital
 */
PortfolioSummary combine(const PortfolioSummary& a, const PortfolioSummary& b,
                         const std::string& combined_id);

}  // namespace paper_ngin
