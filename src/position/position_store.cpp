// src/position/position_store.cpp
#include "paper_ngin/position/position_store.hpp"

namespace paper_ngin {

namespace {
const std::string kComponent = "PositionStore";
}

void PositionStore::open(Position position) {
    if (positions_.count(position.symbol) > 0) {
        throw_invariant_violation("Position already open: " + position.symbol, kComponent);
    }
    if (position.shares_original <= 0 || position.shares_remaining != position.shares_original) {
        throw_invariant_violation("New position must start with a positive full share count: " +
                                      position.symbol,
                                  kComponent);
    }
    std::string symbol = position.symbol;
    positions_.emplace(std::move(symbol), std::move(position));
}

void PositionStore::restore(Position position) {
    if (positions_.count(position.symbol) > 0) {
        throw_invariant_violation("Position already open: " + position.symbol, kComponent);
    }
    if (position.shares_remaining <= 0 || position.shares_remaining > position.shares_original) {
        throw_invariant_violation("Restored position has an invalid share count: " +
                                      position.symbol,
                                  kComponent);
    }
    std::string symbol = position.symbol;
    positions_.emplace(std::move(symbol), std::move(position));
}

const Position* PositionStore::find(const std::string& symbol) const {
    auto it = positions_.find(symbol);
    return it == positions_.end() ? nullptr : &it->second;
}

double PositionStore::committed_cost() const {
    double total = 0.0;
    for (const auto& [symbol, position] : positions_) {
        total += position.cost_basis_remaining();
    }
    return total;
}

std::optional<TradeRecord> PositionStore::apply(const std::string& symbol,
                                                const ExitDecision& decision,
                                                const Timestamp& exit_time) {
    auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        throw_invariant_violation("Exit decision for a symbol with no open position: " + symbol,
                                  kComponent);
    }
    Position& position = it->second;

    for (size_t i = 0; i < decision.targets_to_mark.size(); ++i) {
        if (!decision.targets_to_mark[i]) {
            continue;
        }
        if (position.targets_hit[i]) {
            throw_invariant_violation(
                symbol + ": target " + std::to_string(i + 1) + " fired a second time", kComponent);
        }
        position.targets_hit[i] = true;
    }

    if (decision.new_stop) {
        if (*decision.new_stop < position.stop_loss) {
            throw_invariant_violation(symbol + ": stop lowered from " +
                                          std::to_string(position.stop_loss) + " to " +
                                          std::to_string(*decision.new_stop),
                                      kComponent);
        }
        position.stop_loss = *decision.new_stop;
    }

    if (!decision.is_exit()) {
        return std::nullopt;
    }

    if (!decision.reason) {
        throw_invariant_violation(symbol + ": exit decision carries no reason", kComponent);
    }
    if (decision.shares <= 0 || decision.shares > position.shares_remaining) {
        throw_invariant_violation(symbol + ": exit of " + std::to_string(decision.shares) +
                                      " shares with " +
                                      std::to_string(position.shares_remaining) + " remaining",
                                  kComponent);
    }
    if (decision.action == ExitAction::FULL_EXIT &&
        decision.shares != position.shares_remaining) {
        throw_invariant_violation(symbol + ": full exit does not close all remaining shares",
                                  kComponent);
    }

    TradeRecord record;
    record.symbol = symbol;
    record.strategy_class = position.strategy_class;
    record.signal_type = position.signal_type;
    record.entry_price = position.entry_price;
    record.exit_price = decision.fill_price;
    record.shares = decision.shares;
    record.pnl = (decision.fill_price - position.entry_price) * static_cast<double>(decision.shares);
    record.pnl_pct = (decision.fill_price - position.entry_price) / position.entry_price * 100.0;
    record.reason = *decision.reason;
    record.entry_time = position.entry_time;
    record.exit_time = exit_time;
    record.holding_periods = decision.holding_periods;
    record.quality_score = position.quality_score;

    position.shares_remaining -= decision.shares;
    record.closed_position = position.shares_remaining == 0;
    if (record.closed_position) {
        positions_.erase(it);
    }

    history_.push_back(record);
    return record;
}

}  // namespace paper_ngin
