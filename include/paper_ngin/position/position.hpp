// include/paper_ngin/position/position.hpp
#pragma once

#include <array>
#include <nlohmann/json.hpp>
#include <string>
#include "paper_ngin/core/error.hpp"
#include "paper_ngin/core/types.hpp"

namespace paper_ngin {

/**
 * @brief Profit target with the fraction of the original shares it exits
 */
struct TargetLevel {
    Price price{0.0};
    double exit_fraction{0.0};
};

/**
 * @brief Open trade held by a portfolio
 */
struct Position {
    std::string symbol;
    StrategyClass strategy_class{StrategyClass::SWING};
    SignalType signal_type{SignalType::MOMENTUM};
    Price entry_price{0.0};
    ShareCount shares_original{0};
    ShareCount shares_remaining{0};
    Price stop_loss{0.0};     // only ever raised
    Price initial_stop{0.0};  // stop at entry
    std::array<TargetLevel, 3> targets{};
    std::array<bool, 3> targets_hit{{false, false, false}};
    Timestamp entry_time{};
    double quality_score{0.0};
    int max_hold_periods{0};

    double entry_cost() const {
        return entry_price * static_cast<double>(shares_original);
    }

    double cost_basis_remaining() const {
        return entry_price * static_cast<double>(shares_remaining);
    }

    double unrealized_pnl(Price price) const {
        return (price - entry_price) * static_cast<double>(shares_remaining);
    }

    /**
     * @brief Unrealized return as a fraction of entry (0.05 = +5%)
     */
    double unrealized_return(Price price) const {
        return entry_price > 0.0 ? (price - entry_price) / entry_price : 0.0;
    }

    bool stop_raised() const {
        return stop_loss > initial_stop;
    }

    nlohmann::json to_json() const;
    static Result<Position> from_json(const nlohmann::json& j);
};

/**
 * @brief Immutable record of one exit fill
 *
 * A position closed in several partial fills produces one record per fill.
 */
struct TradeRecord {
    std::string symbol;
    StrategyClass strategy_class{StrategyClass::SWING};
    SignalType signal_type{SignalType::MOMENTUM};
    Price entry_price{0.0};
    Price exit_price{0.0};
    ShareCount shares{0};
    double pnl{0.0};
    double pnl_pct{0.0};  // percent, 5.0 = +5%
    ExitReason reason{ExitReason::STOP_LOSS};
    Timestamp entry_time{};
    Timestamp exit_time{};
    int holding_periods{0};
    double quality_score{0.0};
    bool closed_position{false};  // this fill brought shares_remaining to zero

    nlohmann::json to_json() const;
    static Result<TradeRecord> from_json(const nlohmann::json& j);
};

}  // namespace paper_ngin
