// src/portfolio/portfolio_statistics.cpp
#include "paper_ngin/portfolio/portfolio_statistics.hpp"
#include <algorithm>

namespace paper_ngin {

namespace {

void merge(TradeStats& into, const TradeStats& from) {
    if (from.trades == 0) {
        return;
    }
    const double holding_total = into.avg_holding_periods * into.trades +
                                 from.avg_holding_periods * from.trades;
    if (into.trades == 0) {
        into.best_trade = from.best_trade;
        into.worst_trade = from.worst_trade;
    } else {
        into.best_trade = std::max(into.best_trade, from.best_trade);
        into.worst_trade = std::min(into.worst_trade, from.worst_trade);
    }
    into.trades += from.trades;
    into.wins += from.wins;
    into.losses += from.losses;
    into.total_pnl += from.total_pnl;
    into.avg_holding_periods = holding_total / into.trades;
}

}  // namespace

void TradeStats::add(const TradeRecord& trade) {
    const double holding_total = avg_holding_periods * trades + trade.holding_periods;
    if (trades == 0) {
        best_trade = trade.pnl;
        worst_trade = trade.pnl;
    } else {
        best_trade = std::max(best_trade, trade.pnl);
        worst_trade = std::min(worst_trade, trade.pnl);
    }
    ++trades;
    if (trade.pnl > 0.0) {
        ++wins;
    } else {
        ++losses;
    }
    total_pnl += trade.pnl;
    avg_holding_periods = holding_total / trades;
}

nlohmann::json TradeStats::to_json() const {
    return {{"trades", trades},
            {"wins", wins},
            {"losses", losses},
            {"win_rate", win_rate()},
            {"total_pnl", total_pnl},
            {"best_trade", best_trade},
            {"worst_trade", worst_trade},
            {"avg_holding_periods", avg_holding_periods}};
}

nlohmann::json PortfolioSummary::to_json() const {
    nlohmann::json j;
    j["portfolio_id"] = portfolio_id;
    j["initial_capital"] = initial_capital;
    j["available_capital"] = available_capital;
    j["invested"] = invested;
    j["market_value"] = market_value;
    j["portfolio_value"] = portfolio_value;
    j["unrealized_pnl"] = unrealized_pnl;
    j["realized_pnl"] = realized_pnl;
    j["total_return_pct"] = total_return_pct;
    j["open_positions"] = open_positions;
    j["overall"] = overall.to_json();

    nlohmann::json by_class;
    for (const auto& [name, stats] : by_strategy_class) {
        by_class[name] = stats.to_json();
    }
    j["by_strategy_class"] = by_class;

    nlohmann::json by_type;
    for (const auto& [name, stats] : by_signal_type) {
        by_type[name] = stats.to_json();
    }
    j["by_signal_type"] = by_type;
    return j;
}

TradeStats compute_trade_stats(const std::vector<TradeRecord>& trades) {
    TradeStats stats;
    for (const auto& trade : trades) {
        stats.add(trade);
    }
    return stats;
}

PortfolioSummary summarize(const PortfolioState& state,
                           const std::map<std::string, Price>& prices) {
    PortfolioSummary summary;
    summary.portfolio_id = state.portfolio_id;
    summary.initial_capital = state.initial_capital;
    summary.available_capital = state.ledger.available();
    summary.realized_pnl = state.ledger.realized_pnl();
    summary.open_positions = static_cast<int>(state.positions.open_count());

    for (const auto& [symbol, position] : state.positions.positions()) {
        auto it = prices.find(symbol);
        const Price mark = it != prices.end() ? it->second : state.mark_price(symbol);
        summary.invested += position.cost_basis_remaining();
        summary.market_value += mark * static_cast<double>(position.shares_remaining);
        summary.unrealized_pnl += position.unrealized_pnl(mark);
    }

    summary.portfolio_value = summary.available_capital + summary.market_value;
    if (summary.initial_capital > 0.0) {
        summary.total_return_pct =
            (summary.portfolio_value - summary.initial_capital) / summary.initial_capital * 100.0;
    }

    for (const auto& trade : state.positions.trade_history()) {
        summary.overall.add(trade);
        summary.by_strategy_class[strategy_class_to_string(trade.strategy_class)].add(trade);
        summary.by_signal_type[signal_type_to_string(trade.signal_type)].add(trade);
    }
    return summary;
}

PortfolioSummary combine(const PortfolioSummary& a, const PortfolioSummary& b,
                         const std::string& combined_id) {
    PortfolioSummary out;
    out.portfolio_id = combined_id;
    out.initial_capital = a.initial_capital + b.initial_capital;
    out.available_capital = a.available_capital + b.available_capital;
    out.invested = a.invested + b.invested;
    out.market_value = a.market_value + b.market_value;
    out.portfolio_value = a.portfolio_value + b.portfolio_value;
    out.unrealized_pnl = a.unrealized_pnl + b.unrealized_pnl;
    out.realized_pnl = a.realized_pnl + b.realized_pnl;
    out.open_positions = a.open_positions + b.open_positions;
    if (out.initial_capital > 0.0) {
        out.total_return_pct =
            (out.portfolio_value - out.initial_capital) / out.initial_capital * 100.0;
    }

    merge(out.overall, a.overall);
    merge(out.overall, b.overall);
    for (const auto* part : {&a, &b}) {
        for (const auto& [name, stats] : part->by_strategy_class) {
            merge(out.by_strategy_class[name], stats);
        }
        for (const auto& [name, stats] : part->by_signal_type) {
            merge(out.by_signal_type[name], stats);
        }
    }
    return out;
}

}  // namespace paper_ngin
