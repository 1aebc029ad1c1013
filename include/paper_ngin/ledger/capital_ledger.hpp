// include/paper_ngin/ledger/capital_ledger.hpp
#pragma once

#include <nlohmann/json.hpp>
#include "paper_ngin/core/error.hpp"

namespace paper_ngin {

/**
 * @brief Cash bookkeeping for one portfolio
 *
 * Tracks cash available for new entries and the cost basis committed to open
 * positions. available + committed moves only by realized P&L. Every mutation
 * checks the non-negativity invariants and throws an INVARIANT_VIOLATION
 * TradeError on breach.
 */
class CapitalLedger {
public:
    CapitalLedger() = default;
    explicit CapitalLedger(double initial_capital);

    /**
     * @brief Move cash from available to committed
     * @return INSUFFICIENT_FUNDS if amount exceeds available capital; the
     *         ledger is left untouched
     */
    Result<void> reserve(double amount);

    /**
     * @brief Credit exit proceeds and remove the exited cost basis
     * @param proceeds Cash received for the exited shares
     * @param cost_basis Entry cost of the exited shares
     */
    void release(double proceeds, double cost_basis);

    double available() const {
        return available_;
    }
    double committed() const {
        return committed_;
    }
    double realized_pnl() const {
        return realized_pnl_;
    }

    // Mark-to-cost equity
    double equity() const {
        return available_ + committed_;
    }
    double peak_equity() const {
        return peak_equity_;
    }

    /**
     * @brief Fractional drawdown of equity from its peak, 0 when at the peak
     */
    double drawdown() const;

    nlohmann::json to_json() const;

    /**
     * @brief Restore a persisted ledger
     * @return INVALID_DATA when the stored balances are negative or non-finite
     */
    static Result<CapitalLedger> from_json(const nlohmann::json& j);

private:
    void check_invariants(const char* operation) const;

    double available_{0.0};
    double committed_{0.0};
    double realized_pnl_{0.0};
    double peak_equity_{0.0};
};

}  // namespace paper_ngin
