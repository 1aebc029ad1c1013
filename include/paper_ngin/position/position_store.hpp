// include/paper_ngin/position/position_store.hpp
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "paper_ngin/position/exit_decision.hpp"
#include "paper_ngin/position/position.hpp"

namespace paper_ngin {

/**
 * @brief Open positions of one portfolio plus its closed-trade history
 *
 * Positions are keyed by symbol and iterate in symbol order. All mutation goes
 * through open() and apply(), which enforce the share, stop and target
 * invariants and throw INVARIANT_VIOLATION on breach.
 */
class PositionStore {
public:
    void open(Position position);

    /**
     * @brief Re-insert a persisted position, which may already be partially exited
     */
    void restore(Position position);

    /**
     * @brief Apply an exit decision to the position for symbol
     * @param exit_time Timestamp stamped on the resulting trade record
     * @return The trade record for the fill, or nullopt for a stop-only update
     */
    std::optional<TradeRecord> apply(const std::string& symbol, const ExitDecision& decision,
                                     const Timestamp& exit_time);

    bool contains(const std::string& symbol) const {
        return positions_.count(symbol) > 0;
    }

    const Position* find(const std::string& symbol) const;

    size_t open_count() const {
        return positions_.size();
    }

    /**
     * @brief Sum of entry_price * shares_remaining across open positions
     */
    double committed_cost() const;

    const std::map<std::string, Position>& positions() const {
        return positions_;
    }

    const std::vector<TradeRecord>& trade_history() const {
        return history_;
    }

    void restore_history(std::vector<TradeRecord> history) {
        history_ = std::move(history);
    }

private:
    std::map<std::string, Position> positions_;
    std::vector<TradeRecord> history_;
};

}  // namespace paper_ngin
