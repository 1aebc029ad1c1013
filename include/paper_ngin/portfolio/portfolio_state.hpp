// include/paper_ngin/portfolio/portfolio_state.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include "paper_ngin/ledger/capital_ledger.hpp"
#include "paper_ngin/position/position_store.hpp"

namespace paper_ngin {

/**
 * @brief Everything a portfolio persists: cash, open positions, trade
 * history and the last price seen per symbol
 *
 * Value type. The orchestrator mutates a copy and swaps it in on commit.
 */
struct PortfolioState {
    std::string portfolio_id;
    double initial_capital{0.0};
    CapitalLedger ledger;
    PositionStore positions;
    std::map<std::string, Price> last_prices;  // open positions only

    static constexpr const char* kSchemaVersion = "1.0";

    /**
     * @brief Last traded price of symbol, falling back to the entry price
     */
    Price mark_price(const std::string& symbol) const;

    /**
     * @brief Ledger committed capital must equal the open cost basis
     */
    Result<void> check_consistency() const;

    nlohmann::json to_json() const;
    static Result<PortfolioState> from_json(const nlohmann::json& j);
};

}  // namespace paper_ngin
